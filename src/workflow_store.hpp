#pragma once
#include "workflow.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace skillgate {

// Saved workflows, one <id>.json per workflow under `dir` (empty = memory only).
class WorkflowStore {
public:
    explicit WorkflowStore(std::string dir = "");

    // Structural checks only; a cyclic workflow can be saved.
    void save(const Workflow& wf);

    // Throws SkillError(workflow_not_found).
    Workflow get(const std::string& id) const;

    bool has(const std::string& id) const;
    std::vector<Workflow> list() const;
    bool remove(const std::string& id);

private:
    std::string dir_;
    mutable std::mutex mutex_;
    std::map<std::string, Workflow> workflows_;

    std::string file_path(const std::string& id) const;
    void load_dir();
};

} // namespace skillgate
