#pragma once
#include "skill.hpp"
#include "file_lock.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <sqlite3.h>
#include <nlohmann/json.hpp>

namespace skillgate {

struct AuditEntry {
    int64_t seq = 0;
    std::string execution_id;
    std::string skill_id;
    nlohmann::json parameters = nlohmann::json::object();
    ExecutionStatus status = ExecutionStatus::failed;
    ApprovalState approval = ApprovalState::not_required;
    std::optional<nlohmann::json> result;
    std::optional<ErrorInfo> error;
    int64_t submitted_at = 0;
    int64_t completed_at = 0;

    static AuditEntry from_execution(const SkillExecution& exec);
    SkillExecution to_execution() const;
    nlohmann::json to_json() const;
};

// Append-only record of terminated executions, persisted in SQLite.
// Appends are serialized; history() reads an immutable snapshot.
//
// An owner holds an exclusive lock on the database file for its lifetime, so
// only one process appends and recovers at a time. A reader takes no lock,
// opens the file read-only and refuses every write.
class AuditLog {
public:
    enum class Access { owner, reader };

    explicit AuditLog(const std::string& db_path, Access access = Access::owner);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    // Throws std::invalid_argument for non-terminal or already-recorded
    // executions, std::runtime_error when the entry cannot be made durable.
    // Nothing is published in memory unless the insert committed.
    AuditEntry append(const SkillExecution& exec);

    std::vector<AuditEntry> history(const std::optional<std::string>& skill_id = std::nullopt) const;
    size_t size() const;
    bool contains(const std::string& execution_id) const;
    std::optional<AuditEntry> find(const std::string& execution_id) const;

    // Restart bookkeeping for executions waiting on the approval gate.
    void mark_pending(const SkillExecution& exec);

    // Terminates executions left pending by a previous process as
    // Failed/ApprovalDenied. Returns the appended entries.
    std::vector<AuditEntry> recover_interrupted();

private:
    Access access_;
    std::unique_ptr<FileLock> owner_lock_;
    sqlite3* db_ = nullptr;
    mutable std::mutex write_mutex_;
    std::shared_ptr<const std::vector<AuditEntry>> entries_;
    std::set<std::string> recorded_ids_;

    void init_db();
    void load_entries();
    void require_owner() const;
    int64_t persist(const AuditEntry& entry);
    void exec_sql(const char* sql);
    sqlite3_stmt* prepare(const char* sql);
};

} // namespace skillgate
