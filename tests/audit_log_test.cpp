#include "test_helpers.hpp"

#include "audit_log.hpp"

#include <stdexcept>

using namespace skillgate;
using skillgate::test::TempDir;

namespace {

SkillExecution finished(const std::string& id, const std::string& skill,
                        ExecutionStatus status = ExecutionStatus::completed) {
    SkillExecution e;
    e.id = id;
    e.skill_id = skill;
    e.parameters = {{"path", "/tmp/a"}};
    e.status = status;
    e.approval = ApprovalState::not_required;
    if (status == ExecutionStatus::completed) e.result = nlohmann::json{{"output", "ok"}};
    else e.error = ErrorInfo{ErrorKind::path_not_found, "missing", "path"};
    e.submitted_at = epoch_ms_now();
    e.completed_at = e.submitted_at + 5;
    return e;
}

} // namespace

TEST_CASE("append records terminal executions in order", "[audit]") {
    AuditLog log(":memory:");
    log.append(finished("e1", "read_file"));
    log.append(finished("e2", "write_file", ExecutionStatus::failed));
    log.append(finished("e3", "read_file"));

    auto all = log.history();
    REQUIRE(all.size() == 3);
    CHECK(all[0].seq < all[1].seq);
    CHECK(all[1].seq < all[2].seq);
    CHECK(all[1].error->kind == ErrorKind::path_not_found);

    auto reads = log.history(std::string("read_file"));
    REQUIRE(reads.size() == 2);
    CHECK(reads[0].execution_id == "e1");
    CHECK(reads[1].execution_id == "e3");
}

TEST_CASE("append refuses non-terminal and repeated executions", "[audit]") {
    AuditLog log(":memory:");
    auto pending = finished("p", "delete_file");
    pending.status = ExecutionStatus::pending;
    CHECK_THROWS_AS(log.append(pending), std::invalid_argument);

    log.append(finished("once", "read_file"));
    CHECK_THROWS_AS(log.append(finished("once", "read_file")), std::invalid_argument);
    CHECK(log.size() == 1);
}

TEST_CASE("entries survive reopening the database", "[audit][sqlite]") {
    TempDir dir;
    std::string db = dir.file("audit/audit.db");
    {
        AuditLog log(db);
        log.append(finished("e1", "read_file"));
        log.append(finished("e2", "delete_file", ExecutionStatus::failed));
    }
    AuditLog reopened(db);
    auto all = reopened.history();
    REQUIRE(all.size() == 2);
    CHECK(all[0].execution_id == "e1");
    CHECK(all[0].result->at("output") == "ok");
    CHECK(all[1].status == ExecutionStatus::failed);
    CHECK(all[1].error->ref == "path");

    auto next = reopened.append(finished("e3", "read_file"));
    CHECK(next.seq > all[1].seq);
}

TEST_CASE("executions left pending are rejected on restart", "[audit][sqlite][restart]") {
    TempDir dir;
    std::string db = dir.file("audit.db");
    {
        AuditLog log(db);
        auto waiting = finished("w1", "delete_file");
        waiting.status = ExecutionStatus::pending;
        waiting.approval = ApprovalState::pending;
        log.mark_pending(waiting);

        auto done = finished("d1", "write_file");
        done.status = ExecutionStatus::pending;
        log.mark_pending(done);
        log.append(finished("d1", "write_file"));
    }

    AuditLog log(db);
    auto recovered = log.recover_interrupted();
    REQUIRE(recovered.size() == 1);
    CHECK(recovered[0].execution_id == "w1");
    CHECK(recovered[0].status == ExecutionStatus::failed);
    CHECK(recovered[0].approval == ApprovalState::denied);
    CHECK(recovered[0].error->kind == ErrorKind::approval_denied);

    CHECK(log.recover_interrupted().empty());
    CHECK(log.size() == 2);
}

TEST_CASE("only one owner may hold the database", "[audit][sqlite][owner]") {
    TempDir dir;
    std::string db = dir.file("audit.db");
    {
        AuditLog owner(db);
        CHECK_THROWS_AS(AuditLog(db), std::runtime_error);
        owner.append(finished("e1", "read_file"));
    }
    AuditLog next(db);
    CHECK(next.size() == 1);
}

TEST_CASE("readers see the log without owning it", "[audit][sqlite][owner]") {
    TempDir dir;
    std::string db = dir.file("audit.db");

    AuditLog absent(db, AuditLog::Access::reader);
    CHECK(absent.history().empty());

    AuditLog owner(db);
    owner.append(finished("e1", "read_file"));
    owner.append(finished("e2", "read_file"));

    AuditLog reader(db, AuditLog::Access::reader);
    auto all = reader.history();
    REQUIRE(all.size() == 2);
    CHECK(all[0].seq < all[1].seq);
    CHECK_THROWS_AS(reader.append(finished("e3", "read_file")), std::runtime_error);
    CHECK_THROWS_AS(reader.recover_interrupted(), std::runtime_error);

    auto pending = finished("p1", "delete_file");
    pending.status = ExecutionStatus::pending;
    CHECK_THROWS_AS(reader.mark_pending(pending), std::runtime_error);
}

TEST_CASE("an append that cannot be stored is reported and not published", "[audit][sqlite]") {
    TempDir dir;
    std::string db = dir.file("audit.db");
    AuditLog log(db);
    log.append(finished("kept", "read_file"));

    sqlite3* raw = nullptr;
    REQUIRE(sqlite3_open(db.c_str(), &raw) == SQLITE_OK);
    REQUIRE(sqlite3_exec(raw, "DROP TABLE audit_entries", nullptr, nullptr, nullptr) == SQLITE_OK);
    sqlite3_close(raw);

    CHECK_THROWS_AS(log.append(finished("lost", "read_file")), std::runtime_error);
    CHECK(log.size() == 1);
    CHECK_FALSE(log.contains("lost"));
    CHECK_FALSE(log.find("lost"));
}

TEST_CASE("find turns an entry back into its execution", "[audit]") {
    AuditLog log(":memory:");
    log.append(finished("e1", "write_file", ExecutionStatus::failed));

    auto entry = log.find("e1");
    REQUIRE(entry);
    auto exec = entry->to_execution();
    CHECK(exec.id == "e1");
    CHECK(exec.status == ExecutionStatus::failed);
    CHECK(exec.error->kind == ErrorKind::path_not_found);
    CHECK_FALSE(log.find("e2"));
}

TEST_CASE("execution ids carry the process id", "[audit]") {
    std::string id = generate_execution_id();
    CHECK(id.find("_" + std::to_string(process_id()) + "_") != std::string::npos);
    CHECK(generate_execution_id() != id);
}
