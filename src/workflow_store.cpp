#include "workflow_store.hpp"
#include "utils.hpp"
#include <iostream>

namespace skillgate {

WorkflowStore::WorkflowStore(std::string dir) : dir_(std::move(dir)) {
    if (!dir_.empty()) load_dir();
}

std::string WorkflowStore::file_path(const std::string& id) const {
    return (fs::path(dir_) / (id + ".json")).string();
}

void WorkflowStore::load_dir() {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return;
    for (auto& e : fs::directory_iterator(dir_, ec)) {
        if (!e.is_regular_file() || e.path().extension() != ".json") continue;
        std::string content = read_file(e.path().string());
        try {
            Workflow wf = Workflow::from_json(nlohmann::json::parse(content));
            check_structure(wf);
            workflows_[wf.id] = std::move(wf);
        } catch (const nlohmann::json::exception& ex) {
            std::cerr << "[workflow] Skipping " << e.path().string() << ": " << ex.what() << "\n";
        } catch (const SkillError& ex) {
            std::cerr << "[workflow] Skipping " << e.path().string() << ": " << ex.what() << "\n";
        }
    }
    if (ec) {
        std::cerr << "[workflow] Cannot list " << dir_ << ": " << ec.message() << "\n";
    }
}

void WorkflowStore::save(const Workflow& wf) {
    check_structure(wf);
    if (wf.id.find_first_of("/\\") != std::string::npos || wf.id == "." || wf.id == "..") {
        throw SkillError(ErrorKind::workflow_invalid, "Workflow id '" + wf.id + "' is not a valid name", "id");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!dir_.empty()) {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec) {
            throw SkillError(ErrorKind::io_error, "Cannot create " + dir_ + ": " + ec.message(), "workflows_dir");
        }
        std::string path = file_path(wf.id);
        std::ofstream f(path);
        if (!f) {
            throw SkillError(ErrorKind::io_error, "Cannot write " + path, wf.id);
        }
        f << wf.to_json().dump(2) << "\n";
    }
    workflows_[wf.id] = wf;
}

Workflow WorkflowStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(id);
    if (it == workflows_.end()) {
        throw SkillError(ErrorKind::workflow_not_found, "Unknown workflow: " + id, id);
    }
    return it->second;
}

bool WorkflowStore::has(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.count(id) > 0;
}

std::vector<Workflow> WorkflowStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Workflow> out;
    for (auto& [_, wf] : workflows_) out.push_back(wf);
    return out;
}

bool WorkflowStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!workflows_.erase(id)) return false;
    if (!dir_.empty()) {
        std::error_code ec;
        fs::remove(file_path(id), ec);
        if (ec) std::cerr << "[workflow] Cannot delete " << file_path(id) << ": " << ec.message() << "\n";
    }
    return true;
}

} // namespace skillgate
