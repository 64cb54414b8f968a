#include "audit_log.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace skillgate {

namespace {

// Finalizes on scope exit so early throws do not leak statements.
class Statement {
public:
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Statement() { if (stmt_) sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    sqlite3_stmt* get() const { return stmt_; }
private:
    sqlite3_stmt* stmt_;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

} // namespace

// ── AuditEntry ──────────────────────────────────────────────────────

AuditEntry AuditEntry::from_execution(const SkillExecution& exec) {
    AuditEntry e;
    e.execution_id = exec.id;
    e.skill_id = exec.skill_id;
    e.parameters = exec.parameters;
    e.status = exec.status;
    e.approval = exec.approval;
    e.result = exec.result;
    e.error = exec.error;
    e.submitted_at = exec.submitted_at;
    e.completed_at = exec.completed_at;
    return e;
}

SkillExecution AuditEntry::to_execution() const {
    SkillExecution exec;
    exec.id = execution_id;
    exec.skill_id = skill_id;
    exec.parameters = parameters;
    exec.status = status;
    exec.approval = approval;
    exec.result = result;
    exec.error = error;
    exec.submitted_at = submitted_at;
    exec.completed_at = completed_at;
    return exec;
}

nlohmann::json AuditEntry::to_json() const {
    nlohmann::json j;
    j["seq"] = seq;
    j["executionId"] = execution_id;
    j["skillId"] = skill_id;
    j["parameters"] = parameters;
    j["status"] = status_name(status);
    j["approval"] = approval_state_name(approval);
    if (result) j["result"] = *result;
    if (error) j["error"] = error->to_json();
    j["submittedAt"] = iso8601_from_ms(submitted_at);
    j["completedAt"] = iso8601_from_ms(completed_at);
    return j;
}

// ── AuditLog ────────────────────────────────────────────────────────

AuditLog::AuditLog(const std::string& db_path, Access access)
    : access_(access), entries_(std::make_shared<const std::vector<AuditEntry>>()) {
    bool in_memory = db_path == ":memory:";
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (access_ == Access::reader) {
        // nothing has been recorded yet
        if (in_memory || !fs::exists(db_path)) return;
        flags = SQLITE_OPEN_READONLY;
    } else if (!in_memory) {
        auto parent = fs::path(db_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
        owner_lock_ = std::make_unique<FileLock>(db_path);
    }

    int rc = sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open audit DB: " + msg);
    }
    sqlite3_busy_timeout(db_, 2000);
    try {
        if (access_ == Access::owner) init_db();
        load_entries();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

AuditLog::~AuditLog() {
    if (db_) sqlite3_close(db_);
}

void AuditLog::exec_sql(const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Audit DB error: " + msg);
    }
}

sqlite3_stmt* AuditLog::prepare(const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Audit DB prepare failed: " + std::string(sqlite3_errmsg(db_)));
    }
    return stmt;
}

void AuditLog::init_db() {
    exec_sql(R"(
        CREATE TABLE IF NOT EXISTS audit_entries (
            seq INTEGER PRIMARY KEY,
            execution_id TEXT NOT NULL UNIQUE,
            skill_id TEXT NOT NULL,
            parameters TEXT NOT NULL,
            status TEXT NOT NULL,
            approval TEXT NOT NULL,
            result TEXT,
            error TEXT,
            submitted_at INTEGER DEFAULT 0,
            completed_at INTEGER DEFAULT 0
        );
        CREATE TABLE IF NOT EXISTS pending_executions (
            execution_id TEXT PRIMARY KEY,
            skill_id TEXT NOT NULL,
            parameters TEXT NOT NULL,
            submitted_at INTEGER DEFAULT 0
        );
    )");
}

void AuditLog::load_entries() {
    Statement stmt(prepare(
        "SELECT seq, execution_id, skill_id, parameters, status, approval, result, error, "
        "submitted_at, completed_at FROM audit_entries ORDER BY seq"));

    auto loaded = std::make_shared<std::vector<AuditEntry>>();
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        AuditEntry e;
        e.seq = sqlite3_column_int64(stmt.get(), 0);
        e.execution_id = column_text(stmt.get(), 1);
        e.skill_id = column_text(stmt.get(), 2);
        e.parameters = nlohmann::json::parse(column_text(stmt.get(), 3), nullptr, false);
        if (e.parameters.is_discarded()) e.parameters = nlohmann::json::object();
        e.status = parse_status(column_text(stmt.get(), 4));
        e.approval = parse_approval_state(column_text(stmt.get(), 5));
        std::string result = column_text(stmt.get(), 6);
        if (!result.empty()) {
            auto rj = nlohmann::json::parse(result, nullptr, false);
            if (!rj.is_discarded()) e.result = rj;
        }
        std::string error = column_text(stmt.get(), 7);
        if (!error.empty()) {
            auto ej = nlohmann::json::parse(error, nullptr, false);
            if (!ej.is_discarded()) e.error = ErrorInfo::from_json(ej);
        }
        e.submitted_at = sqlite3_column_int64(stmt.get(), 8);
        e.completed_at = sqlite3_column_int64(stmt.get(), 9);

        recorded_ids_.insert(e.execution_id);
        loaded->push_back(std::move(e));
    }
    std::atomic_store(&entries_, std::shared_ptr<const std::vector<AuditEntry>>(std::move(loaded)));
}

void AuditLog::require_owner() const {
    if (access_ != Access::owner) {
        throw std::runtime_error("Audit log is open read-only");
    }
}

// seq is the rowid SQLite assigns inside the transaction
int64_t AuditLog::persist(const AuditEntry& entry) {
    exec_sql("BEGIN IMMEDIATE");
    try {
        Statement insert(prepare(
            "INSERT INTO audit_entries (execution_id, skill_id, parameters, status, approval, "
            "result, error, submitted_at, completed_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)"));
        bind_text(insert.get(), 1, entry.execution_id);
        bind_text(insert.get(), 2, entry.skill_id);
        bind_text(insert.get(), 3, entry.parameters.dump());
        bind_text(insert.get(), 4, status_name(entry.status));
        bind_text(insert.get(), 5, approval_state_name(entry.approval));
        if (entry.result) bind_text(insert.get(), 6, entry.result->dump());
        else sqlite3_bind_null(insert.get(), 6);
        if (entry.error) bind_text(insert.get(), 7, entry.error->to_json().dump());
        else sqlite3_bind_null(insert.get(), 7);
        sqlite3_bind_int64(insert.get(), 8, entry.submitted_at);
        sqlite3_bind_int64(insert.get(), 9, entry.completed_at);
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            throw std::runtime_error("Failed to insert audit entry: " + std::string(sqlite3_errmsg(db_)));
        }
        int64_t seq = sqlite3_last_insert_rowid(db_);

        Statement clear(prepare("DELETE FROM pending_executions WHERE execution_id = ?"));
        bind_text(clear.get(), 1, entry.execution_id);
        if (sqlite3_step(clear.get()) != SQLITE_DONE) {
            throw std::runtime_error("Failed to clear pending marker: " + std::string(sqlite3_errmsg(db_)));
        }
        exec_sql("COMMIT");
        return seq;
    } catch (const std::exception&) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

AuditEntry AuditLog::append(const SkillExecution& exec) {
    if (!exec.terminal()) {
        throw std::invalid_argument("Execution " + exec.id + " is not terminal");
    }

    require_owner();

    std::lock_guard<std::mutex> lock(write_mutex_);
    if (recorded_ids_.count(exec.id)) {
        throw std::invalid_argument("Execution " + exec.id + " is already audited");
    }

    AuditEntry entry = AuditEntry::from_execution(exec);
    try {
        entry.seq = persist(entry);
    } catch (const std::runtime_error& e) {
        std::cerr << "[audit] Failed to persist " << entry.execution_id << ": " << e.what() << "\n";
        throw std::runtime_error("Audit entry for " + entry.execution_id + " not recorded: " + e.what());
    }

    auto next = std::make_shared<std::vector<AuditEntry>>(*std::atomic_load(&entries_));
    next->push_back(entry);
    std::atomic_store(&entries_, std::shared_ptr<const std::vector<AuditEntry>>(std::move(next)));
    recorded_ids_.insert(entry.execution_id);
    return entry;
}

std::vector<AuditEntry> AuditLog::history(const std::optional<std::string>& skill_id) const {
    auto snapshot = std::atomic_load(&entries_);
    if (!skill_id) return *snapshot;

    std::vector<AuditEntry> out;
    for (auto& e : *snapshot) {
        if (e.skill_id == *skill_id) out.push_back(e);
    }
    return out;
}

size_t AuditLog::size() const {
    return std::atomic_load(&entries_)->size();
}

bool AuditLog::contains(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return recorded_ids_.count(execution_id) > 0;
}

std::optional<AuditEntry> AuditLog::find(const std::string& execution_id) const {
    auto snapshot = std::atomic_load(&entries_);
    for (auto& e : *snapshot) {
        if (e.execution_id == execution_id) return e;
    }
    return std::nullopt;
}

void AuditLog::mark_pending(const SkillExecution& exec) {
    require_owner();
    std::lock_guard<std::mutex> lock(write_mutex_);
    Statement stmt(prepare(
        "INSERT OR REPLACE INTO pending_executions (execution_id, skill_id, parameters, submitted_at) "
        "VALUES (?, ?, ?, ?)"));
    bind_text(stmt.get(), 1, exec.id);
    bind_text(stmt.get(), 2, exec.skill_id);
    bind_text(stmt.get(), 3, exec.parameters.dump());
    sqlite3_bind_int64(stmt.get(), 4, exec.submitted_at);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error("Failed to record pending execution: " + std::string(sqlite3_errmsg(db_)));
    }
}

std::vector<AuditEntry> AuditLog::recover_interrupted() {
    require_owner();
    std::vector<SkillExecution> interrupted;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        Statement stmt(prepare(
            "SELECT execution_id, skill_id, parameters, submitted_at FROM pending_executions "
            "ORDER BY submitted_at"));
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            SkillExecution exec;
            exec.id = column_text(stmt.get(), 0);
            exec.skill_id = column_text(stmt.get(), 1);
            exec.parameters = nlohmann::json::parse(column_text(stmt.get(), 2), nullptr, false);
            if (exec.parameters.is_discarded()) exec.parameters = nlohmann::json::object();
            exec.submitted_at = sqlite3_column_int64(stmt.get(), 3);
            interrupted.push_back(std::move(exec));
        }
    }

    std::vector<AuditEntry> appended;
    for (auto& exec : interrupted) {
        if (contains(exec.id)) {
            std::lock_guard<std::mutex> lock(write_mutex_);
            Statement clear(prepare("DELETE FROM pending_executions WHERE execution_id = ?"));
            bind_text(clear.get(), 1, exec.id);
            if (sqlite3_step(clear.get()) != SQLITE_DONE) {
                std::cerr << "[audit] Failed to clear stale marker for " << exec.id << "\n";
            }
            continue;
        }
        exec.status = ExecutionStatus::failed;
        exec.approval = ApprovalState::denied;
        exec.error = ErrorInfo{ErrorKind::approval_denied,
                               "Interrupted before an approval decision", exec.id};
        exec.completed_at = epoch_ms_now();
        appended.push_back(append(exec));
    }
    if (!appended.empty()) {
        std::cerr << "[audit] Rejected " << appended.size()
                  << " execution(s) left pending by a previous run\n";
    }
    return appended;
}

} // namespace skillgate
