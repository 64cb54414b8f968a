#include "errors.hpp"

namespace skillgate {

namespace {

struct KindName {
    ErrorKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    {ErrorKind::signature_invalid,    "SignatureInvalid"},
    {ErrorKind::skill_not_found,      "SkillNotFound"},
    {ErrorKind::parameter_invalid,    "ParameterInvalid"},
    {ErrorKind::approval_denied,      "ApprovalDenied"},
    {ErrorKind::approval_timed_out,   "ApprovalTimedOut"},
    {ErrorKind::execution_not_found,  "ExecutionNotFound"},
    {ErrorKind::already_decided,      "AlreadyDecided"},
    {ErrorKind::command_timed_out,    "CommandTimedOut"},
    {ErrorKind::spawn_failed,         "SpawnFailed"},
    {ErrorKind::path_not_found,       "PathNotFound"},
    {ErrorKind::permission_denied,    "PermissionDenied"},
    {ErrorKind::io_error,             "IoError"},
    {ErrorKind::cyclic_graph,         "CyclicGraph"},
    {ErrorKind::type_mismatch,        "TypeMismatch"},
    {ErrorKind::workflow_not_found,   "WorkflowNotFound"},
    {ErrorKind::workflow_invalid,     "WorkflowInvalid"},
    {ErrorKind::workflow_node_failed, "WorkflowNodeFailed"},
};

} // namespace

const char* error_kind_name(ErrorKind kind) {
    for (auto& kn : kKindNames) {
        if (kn.kind == kind) return kn.name;
    }
    return "IoError";
}

std::optional<ErrorKind> parse_error_kind(const std::string& name) {
    for (auto& kn : kKindNames) {
        if (name == kn.name) return kn.kind;
    }
    return std::nullopt;
}

nlohmann::json ErrorInfo::to_json() const {
    nlohmann::json j = {{"kind", error_kind_name(kind)}, {"message", message}};
    if (!ref.empty()) j["ref"] = ref;
    return j;
}

ErrorInfo ErrorInfo::from_json(const nlohmann::json& j) {
    ErrorInfo e;
    e.kind = parse_error_kind(j.value("kind", "")).value_or(ErrorKind::io_error);
    e.message = j.value("message", "");
    e.ref = j.value("ref", "");
    return e;
}

} // namespace skillgate
