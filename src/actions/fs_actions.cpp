#include "fs_actions.hpp"
#include "../errors.hpp"
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <iostream>

namespace skillgate {

std::string resolve_workspace_path(const std::string& workspace, const std::string& path) {
    fs::path p(expand_path(path));
    if (p.is_absolute()) return p.string();
    return (fs::path(workspace) / p).lexically_normal().string();
}

static ErrorKind kind_for(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorKind::path_not_found;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ErrorKind::permission_denied;
    }
    return ErrorKind::io_error;
}

static void throw_fs_error(const std::error_code& ec, const std::string& what, const std::string& path) {
    throw SkillError(kind_for(ec), what + " " + path + ": " + ec.message(), "path");
}

// Checks that precede opening a stream, since std::fstream drops the errno.
static void require_readable(const std::string& path) {
    std::error_code ec;
    auto st = fs::status(path, ec);
    if (ec || !fs::exists(st)) {
        throw SkillError(ErrorKind::path_not_found, "No such file: " + path, "path");
    }
    if (fs::is_directory(st)) {
        throw SkillError(ErrorKind::io_error, "Is a directory: " + path, "path");
    }
}

void register_fs_actions(LocalActionExecutor& exec, const Config& cfg) {
    auto workspace = std::make_shared<std::string>(cfg.workspace_path());

    exec.register_action("read_file", [workspace](const nlohmann::json& args) -> nlohmann::json {
        std::string resolved = resolve_workspace_path(*workspace, args.value("path", ""));
        require_readable(resolved);

        std::ifstream f(resolved, std::ios::binary);
        if (!f) {
            throw SkillError(ErrorKind::permission_denied, "Cannot read file: " + resolved, "path");
        }
        std::ostringstream ss;
        ss << f.rdbuf();
        if (f.bad()) {
            throw SkillError(ErrorKind::io_error, "Read failed: " + resolved, "path");
        }
        std::string content = ss.str();
        return {
            {"output", content},
            {"path", resolved},
            {"bytes", content.size()}
        };
    });

    exec.register_action("write_file", [workspace](const nlohmann::json& args) -> nlohmann::json {
        std::string resolved = resolve_workspace_path(*workspace, args.value("path", ""));
        std::string content = args.value("content", "");

        auto parent = fs::path(resolved).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) throw_fs_error(ec, "Cannot create directory for", resolved);
        }

        std::error_code ec;
        if (fs::is_directory(resolved, ec)) {
            throw SkillError(ErrorKind::io_error, "Is a directory: " + resolved, "path");
        }

        std::ofstream f(resolved, std::ios::binary | std::ios::trunc);
        if (!f) {
            throw SkillError(ErrorKind::permission_denied, "Cannot write file: " + resolved, "path");
        }
        f << content;
        f.close();
        if (f.fail()) {
            throw SkillError(ErrorKind::io_error, "Write failed: " + resolved, "path");
        }
        std::cerr << "[fs] Wrote " << content.size() << " bytes to " << resolved << "\n";
        return {
            {"output", resolved},
            {"path", resolved},
            {"bytes", content.size()}
        };
    });

    exec.register_action("delete_file", [workspace](const nlohmann::json& args) -> nlohmann::json {
        std::string resolved = resolve_workspace_path(*workspace, args.value("path", ""));

        std::error_code ec;
        auto st = fs::symlink_status(resolved, ec);
        if (ec || !fs::exists(st)) {
            throw SkillError(ErrorKind::path_not_found, "No such file: " + resolved, "path");
        }
        if (fs::is_directory(st)) {
            throw SkillError(ErrorKind::io_error, "Refusing to delete directory: " + resolved, "path");
        }
        if (!fs::remove(resolved, ec) || ec) {
            if (!ec) ec = std::make_error_code(std::errc::no_such_file_or_directory);
            throw_fs_error(ec, "Cannot delete", resolved);
        }
        std::cerr << "[fs] Deleted " << resolved << "\n";
        return {
            {"output", resolved},
            {"path", resolved},
            {"deleted", true}
        };
    });
}

} // namespace skillgate
