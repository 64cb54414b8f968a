#pragma once
#include <string>
#include <optional>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace skillgate {

enum class ErrorKind {
    signature_invalid,
    skill_not_found,
    parameter_invalid,
    approval_denied,
    approval_timed_out,
    execution_not_found,
    already_decided,
    command_timed_out,
    spawn_failed,
    path_not_found,
    permission_denied,
    io_error,
    cyclic_graph,
    type_mismatch,
    workflow_not_found,
    workflow_invalid,
    workflow_node_failed,
};

// "SignatureInvalid", "SkillNotFound", ...
const char* error_kind_name(ErrorKind kind);
std::optional<ErrorKind> parse_error_kind(const std::string& name);

struct ErrorInfo {
    ErrorKind kind = ErrorKind::io_error;
    std::string message;
    std::string ref;    // offending field, edge id or node id

    nlohmann::json to_json() const;
    static ErrorInfo from_json(const nlohmann::json& j);
};

class SkillError : public std::runtime_error {
public:
    SkillError(ErrorKind kind, const std::string& message, std::string ref = "")
        : std::runtime_error(message), kind_(kind), ref_(std::move(ref)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& ref() const { return ref_; }

    ErrorInfo info() const { return ErrorInfo{kind_, what(), ref_}; }

private:
    ErrorKind kind_;
    std::string ref_;
};

} // namespace skillgate
