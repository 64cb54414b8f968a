#pragma once
#include "hooks.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace skillgate {

enum class ApprovalDecision { pending, approved, denied, timed_out };

const char* approval_decision_name(ApprovalDecision d);

struct ApprovalRequest {
    std::string execution_id;
    std::string skill_id;
    std::string title;          // skill name
    nlohmann::json parameters;  // shown as the notification body
    int64_t requested_at = 0;

    nlohmann::json to_json() const;
};

// Holds sensitive executions until an operator decides. Each request has
// its own condition variable; waiting never blocks other requests.
class ApprovalGate {
public:
    explicit ApprovalGate(const HookRunner* hooks = nullptr) : hooks_(hooks) {}

    void open(const ApprovalRequest& request);

    // Blocks until a decision. timeout == 0 waits indefinitely; otherwise the
    // request is decided timed_out when it expires.
    ApprovalDecision wait(const std::string& execution_id, std::chrono::seconds timeout);

    // Throw SkillError(execution_not_found | already_decided).
    void approve(const std::string& execution_id);
    void deny(const std::string& execution_id);

    void deny_all(const std::string& reason);

    // Drops the remembered decision once the execution is finished.
    void forget(const std::string& execution_id);

    std::vector<ApprovalRequest> pending() const;
    bool is_pending(const std::string& execution_id) const;

private:
    struct Slot {
        ApprovalRequest request;
        ApprovalDecision decision = ApprovalDecision::pending;
        uint64_t order = 0;
        std::condition_variable cv;
    };

    const HookRunner* hooks_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Slot>> slots_;
    std::map<std::string, ApprovalDecision> decided_;
    uint64_t next_order_ = 0;

    void decide(const std::string& execution_id, ApprovalDecision decision);
    void notify_decided(const ApprovalRequest& request, ApprovalDecision decision) const;
};

} // namespace skillgate
