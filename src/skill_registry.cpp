#include "skill_registry.hpp"
#include "sensitivity.hpp"
#include "utils.hpp"
#include <iostream>
#include <set>

namespace skillgate {

SkillRegistry::SkillRegistry()
    : skills_(std::make_shared<const SkillMap>()) {}

std::shared_ptr<const SkillRegistry::SkillMap> SkillRegistry::snapshot() const {
    return std::atomic_load(&skills_);
}

void SkillRegistry::publish(std::shared_ptr<const SkillMap> next) {
    std::atomic_store(&skills_, std::move(next));
}

void SkillRegistry::validate_signature(SkillDefinition& def) {
    if (def.id.empty()) {
        throw SkillError(ErrorKind::signature_invalid, "Skill id must not be empty", "id");
    }

    std::set<std::string> seen;
    for (size_t i = 0; i < def.parameters.size(); i++) {
        auto& p = def.parameters[i];
        std::string field = "parameters[" + std::to_string(i) + "]";
        if (p.name.empty()) {
            throw SkillError(ErrorKind::signature_invalid,
                             "Parameter " + std::to_string(i) + " of '" + def.id + "' has no name",
                             field + ".name");
        }
        if (!p.type) {
            throw SkillError(ErrorKind::signature_invalid,
                             "Parameter '" + p.name + "' of '" + def.id + "' has no type",
                             field + ".type");
        }
        if (*p.type == ValueType::any) {
            throw SkillError(ErrorKind::signature_invalid,
                             "Parameter '" + p.name + "' must be string, number, boolean or path",
                             field + ".type");
        }
        if (!seen.insert(p.name).second) {
            throw SkillError(ErrorKind::signature_invalid,
                             "Duplicate parameter '" + p.name + "' in '" + def.id + "'",
                             field + ".name");
        }
    }

    if (is_reserved_sensitive(def.id)) {
        if (!def.is_sensitive) {
            throw SkillError(ErrorKind::signature_invalid,
                             "Skill '" + def.id + "' is reserved and must declare isSensitive",
                             "isSensitive");
        }
        if (!*def.is_sensitive) {
            std::cerr << "[registry] '" << def.id << "' is always sensitive, ignoring isSensitive=false\n";
        }
        def.is_sensitive = true;
    }

    if (def.name.empty()) def.name = def.id;
}

void SkillRegistry::register_skill(SkillDefinition def) {
    validate_signature(def);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot();
    if (current->count(def.id)) {
        throw SkillError(ErrorKind::signature_invalid,
                         "Skill '" + def.id + "' is already registered", "id");
    }
    auto next = std::make_shared<SkillMap>(*current);
    std::string id = def.id;
    (*next)[id] = std::move(def);
    publish(std::move(next));
    std::cerr << "[registry] Registered skill '" << id << "'\n";
}

void SkillRegistry::update_skill(SkillDefinition def) {
    validate_signature(def);

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot();
    if (!current->count(def.id)) {
        throw SkillError(ErrorKind::skill_not_found, "Unknown skill: " + def.id, def.id);
    }
    auto next = std::make_shared<SkillMap>(*current);
    std::string id = def.id;
    (*next)[id] = std::move(def);
    publish(std::move(next));
    std::cerr << "[registry] Updated skill '" << id << "'\n";
}

void SkillRegistry::unregister_skill(const std::string& id) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto current = snapshot();
    if (!current->count(id)) {
        throw SkillError(ErrorKind::skill_not_found, "Unknown skill: " + id, id);
    }
    auto next = std::make_shared<SkillMap>(*current);
    next->erase(id);
    publish(std::move(next));
    std::cerr << "[registry] Unregistered skill '" << id << "'\n";
}

SkillDefinition SkillRegistry::lookup(const std::string& id) const {
    auto current = snapshot();
    auto it = current->find(id);
    if (it == current->end()) {
        throw SkillError(ErrorKind::skill_not_found, "Unknown skill: " + id, id);
    }
    return it->second;
}

bool SkillRegistry::has(const std::string& id) const {
    return snapshot()->count(id) > 0;
}

std::vector<SkillDefinition> SkillRegistry::list() const {
    auto current = snapshot();
    std::vector<SkillDefinition> out;
    out.reserve(current->size());
    for (auto& [_, def] : *current) out.push_back(def);
    return out;
}

size_t SkillRegistry::size() const {
    return snapshot()->size();
}

nlohmann::json SkillRegistry::to_json() const {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& def : list()) arr.push_back(def.to_json());
    return arr;
}

size_t SkillRegistry::load_file(const std::string& path) {
    std::string content = read_file(path);
    if (content.empty()) return 0;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const std::exception& e) {
        std::cerr << "[registry] Failed to parse " << path << ": " << e.what() << "\n";
        return 0;
    }
    if (!j.is_array()) {
        std::cerr << "[registry] " << path << " must contain an array of skills\n";
        return 0;
    }

    size_t loaded = 0;
    for (auto& item : j) {
        if (!item.is_object()) {
            std::cerr << "[registry] Skipping non-object entry in " << path << "\n";
            continue;
        }
        try {
            register_skill(SkillDefinition::from_json(item));
            loaded++;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[registry] Skipping skill '" << item.value("id", "?") << "': " << e.what() << "\n";
        } catch (const SkillError& e) {
            std::cerr << "[registry] Skipping skill '" << item.value("id", "?") << "': "
                      << e.what() << (e.ref().empty() ? "" : " (" + e.ref() + ")") << "\n";
        }
    }
    return loaded;
}

// ── Built-in skills ─────────────────────────────────────────────────

std::vector<SkillDefinition> builtin_skill_definitions() {
    auto param = [](const std::string& name, ValueType type, bool required,
                    const std::string& description) {
        SkillParameter p;
        p.name = name;
        p.type = type;
        p.required = required;
        p.description = description;
        return p;
    };

    std::vector<SkillDefinition> defs;

    SkillDefinition term;
    term.id = "run_terminal_command";
    term.name = "Run terminal command";
    term.description = "Run a shell command and capture stdout, stderr and the exit code.";
    term.category = "terminal";
    term.parameters = {
        param("command", ValueType::string, true, "Command line passed to the shell"),
        param("workingDir", ValueType::path, false, "Directory to run in"),
        param("timeoutSeconds", ValueType::number, false, "Overrides the configured timeout"),
    };
    term.is_sensitive = true;
    term.output_type = ValueType::string;
    defs.push_back(term);

    SkillDefinition read;
    read.id = "read_file";
    read.name = "Read file";
    read.description = "Read a text file.";
    read.category = "filesystem";
    read.parameters = {param("path", ValueType::path, true, "File to read")};
    read.is_sensitive = false;
    read.output_type = ValueType::string;
    defs.push_back(read);

    SkillDefinition write;
    write.id = "write_file";
    write.name = "Write file";
    write.description = "Create or overwrite a file.";
    write.category = "filesystem";
    write.parameters = {
        param("path", ValueType::path, true, "File to write"),
        param("content", ValueType::string, true, "New file content"),
    };
    write.is_sensitive = true;
    write.output_type = ValueType::path;
    defs.push_back(write);

    SkillDefinition del;
    del.id = "delete_file";
    del.name = "Delete file";
    del.description = "Delete a file.";
    del.category = "filesystem";
    del.parameters = {param("path", ValueType::path, true, "File to delete")};
    del.is_sensitive = true;
    del.output_type = ValueType::path;
    defs.push_back(del);

    return defs;
}

void register_builtin_skills(SkillRegistry& reg) {
    for (auto& def : builtin_skill_definitions()) {
        reg.register_skill(std::move(def));
    }
}

} // namespace skillgate
