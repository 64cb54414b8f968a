#include "approval_gate.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <algorithm>
#include <iostream>

namespace skillgate {

const char* approval_decision_name(ApprovalDecision d) {
    switch (d) {
        case ApprovalDecision::pending:   return "pending";
        case ApprovalDecision::approved:  return "approved";
        case ApprovalDecision::denied:    return "denied";
        case ApprovalDecision::timed_out: return "timed_out";
    }
    return "pending";
}

nlohmann::json ApprovalRequest::to_json() const {
    return {
        {"executionId", execution_id},
        {"skillId", skill_id},
        {"title", title},
        {"body", parameters},
        {"actions", nlohmann::json::array({"approve", "deny"})},
        {"requestedAt", iso8601_from_ms(requested_at)}
    };
}

void ApprovalGate::open(const ApprovalRequest& request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto slot = std::make_shared<Slot>();
        slot->request = request;
        slot->order = next_order_++;
        slots_[request.execution_id] = std::move(slot);
    }
    std::cerr << "[gate] Awaiting approval for " << request.skill_id
              << " (" << request.execution_id << ")\n";
    if (hooks_) hooks_->fire(HookType::approval_requested, request.to_json());
}

ApprovalDecision ApprovalGate::wait(const std::string& execution_id, std::chrono::seconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = slots_.find(execution_id);
    if (it == slots_.end()) {
        auto d = decided_.find(execution_id);
        if (d != decided_.end()) return d->second;
        throw SkillError(ErrorKind::execution_not_found,
                         "No approval request for " + execution_id, execution_id);
    }

    std::shared_ptr<Slot> slot = it->second;
    auto ready = [&slot] { return slot->decision != ApprovalDecision::pending; };
    if (timeout.count() > 0) {
        if (!slot->cv.wait_for(lock, timeout, ready)) {
            slot->decision = ApprovalDecision::timed_out;
        }
    } else {
        slot->cv.wait(lock, ready);
    }

    ApprovalDecision decision = slot->decision;
    decided_[execution_id] = decision;
    slots_.erase(execution_id);
    lock.unlock();

    if (decision == ApprovalDecision::timed_out) {
        std::cerr << "[gate] Approval timed out for " << execution_id << "\n";
        notify_decided(slot->request, decision);
    }
    return decision;
}

void ApprovalGate::decide(const std::string& execution_id, ApprovalDecision decision) {
    ApprovalRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = slots_.find(execution_id);
        if (it == slots_.end() || it->second->decision != ApprovalDecision::pending) {
            if (decided_.count(execution_id) || it != slots_.end()) {
                throw SkillError(ErrorKind::already_decided,
                                 "Execution " + execution_id + " is not pending", execution_id);
            }
            throw SkillError(ErrorKind::execution_not_found,
                             "Unknown execution: " + execution_id, execution_id);
        }
        it->second->decision = decision;
        request = it->second->request;
        it->second->cv.notify_all();
    }
    std::cerr << "[gate] " << execution_id << " " << approval_decision_name(decision) << "\n";
    notify_decided(request, decision);
}

void ApprovalGate::approve(const std::string& execution_id) {
    decide(execution_id, ApprovalDecision::approved);
}

void ApprovalGate::deny(const std::string& execution_id) {
    decide(execution_id, ApprovalDecision::denied);
}

void ApprovalGate::deny_all(const std::string& reason) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, slot] : slots_) {
            if (slot->decision == ApprovalDecision::pending) ids.push_back(id);
        }
    }
    for (auto& id : ids) {
        try {
            deny(id);
        } catch (const SkillError& e) {
            // decided concurrently
            std::cerr << "[gate] " << e.what() << "\n";
        }
    }
    if (!ids.empty()) {
        std::cerr << "[gate] Denied " << ids.size() << " pending request(s): " << reason << "\n";
    }
}

void ApprovalGate::forget(const std::string& execution_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    decided_.erase(execution_id);
}

std::vector<ApprovalRequest> ApprovalGate::pending() const {
    std::vector<std::pair<uint64_t, ApprovalRequest>> ordered;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [_, slot] : slots_) {
            if (slot->decision == ApprovalDecision::pending) {
                ordered.emplace_back(slot->order, slot->request);
            }
        }
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    std::vector<ApprovalRequest> out;
    out.reserve(ordered.size());
    for (auto& [_, req] : ordered) out.push_back(std::move(req));
    return out;
}

bool ApprovalGate::is_pending(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(execution_id);
    return it != slots_.end() && it->second->decision == ApprovalDecision::pending;
}

void ApprovalGate::notify_decided(const ApprovalRequest& request, ApprovalDecision decision) const {
    if (!hooks_) return;
    hooks_->fire(HookType::approval_decided, {
        {"executionId", request.execution_id},
        {"skillId", request.skill_id},
        {"decision", approval_decision_name(decision)}
    });
}

} // namespace skillgate
