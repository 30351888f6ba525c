// POLITY - Governance Transition Engine Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/transition/engine.h"
#include "polity/util/logging.h"

#include <sstream>
#include <vector>

namespace polity {
namespace transition {

namespace {

std::string TransitionKey(const TransitionId& id) {
    return db::MakeKey(db::prefix::TRANSITION, id);
}

std::string ShortId(const TransitionId& id) {
    return id.ToHex().substr(0, 16);
}

} // namespace

const char* TransitionStateToString(TransitionState state) {
    switch (state) {
        case TransitionState::AwaitingApproval: return "AwaitingApproval";
        case TransitionState::Staged: return "Staged";
        case TransitionState::Committed: return "Committed";
        case TransitionState::Aborted: return "Aborted";
        case TransitionState::Rejected: return "Rejected";
        default: return "Unknown";
    }
}

std::string TransitionRecord::ToString() const {
    std::ostringstream oss;
    oss << "Transition(id=" << ShortId(id)
        << ", org=" << orgId
        << ", " << org::GovernanceTypeToString(fromConfig.GetType())
        << " -> " << org::GovernanceTypeToString(newConfig.GetType())
        << ", base=" << baseVersion
        << ", state=" << TransitionStateToString(state);
    if (!reason.empty()) {
        oss << ", reason=" << reason;
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// TransitionEngine
// ============================================================================

TransitionEngine::TransitionEngine(db::RecordStore& store, registry::Registry& registry,
                                   authz::ActionTracker& tracker, ClockFn clock)
    : store_(store), registry_(registry), tracker_(tracker), clock_(std::move(clock)) {
    tracker_.SetResolutionCallback([this](const authz::ActionRecord& record) {
        OnActionResolved(record);
    });
}

TransitionEngine::~TransitionEngine() {
    tracker_.SetResolutionCallback(nullptr);
}

Action TransitionEngine::MakeMigrationAction(OrganizationId id,
                                             const GovernanceConfig& newConfig,
                                             uint64_t baseVersion, uint64_t nonce) {
    return Action::Migrate(id, newConfig, baseVersion, nonce);
}

Status TransitionEngine::Persist(const TransitionRecord& record) {
    db::Status s = store_.Write(TransitionKey(record.id), record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::TRANSITION) << "Failed to persist transition "
            << ShortId(record.id) << ": " << s.ToString();
    }
    return registry::FromStorage(s);
}

Status TransitionEngine::Load() {
    util::ScopedLogTimer timer(util::LogCategory::TRANSITION, "Transition load");
    std::lock_guard<std::mutex> lock(mutex_);
    transitions_.clear();
    open_.clear();

    db::Status ds = store_.ForEach<TransitionRecord>(db::prefix::TRANSITION,
        [this](TransitionRecord&& record) {
            if (record.IsOpen()) {
                open_[record.orgId] = record.id;
            }
            TransitionId id = record.id;
            transitions_[id] = std::move(record);
        });
    if (!ds.ok()) {
        return registry::FromStorage(ds);
    }

    // An approval may have resolved after its transition was last written
    std::vector<TransitionId> awaiting;
    for (const auto& [id, record] : transitions_) {
        if (record.state == TransitionState::AwaitingApproval) {
            awaiting.push_back(id);
        }
    }
    for (const TransitionId& id : awaiting) {
        authz::ActionRecord action;
        Status s = tracker_.Get(id, &action);
        if (s.IsNotFound()) {
            s = CloseLocked(transitions_[id], TransitionState::Rejected, "approval action lost");
        } else if (s.ok() && authz::IsTerminal(action.state)) {
            s = ApplyDecisionLocked(id, action.state, action.reason);
        }
        if (!s.ok() && !s.IsTransitionInProgress() && !s.IsInvalidState()) {
            return s;
        }
    }

    LOG_INFO(util::LogCategory::TRANSITION) << "Loaded " << transitions_.size()
        << " transitions, " << open_.size() << " open";
    return Status::Ok();
}

Status TransitionEngine::CloseLocked(TransitionRecord& record, TransitionState state,
                                     const std::string& reason) {
    TransitionRecord updated = record;
    updated.state = state;
    updated.reason = reason;
    updated.updatedAt = clock_();
    Status s = Persist(updated);
    if (!s.ok()) {
        return s;
    }
    record = std::move(updated);
    auto it = open_.find(record.orgId);
    if (it != open_.end() && it->second == record.id) {
        open_.erase(it);
    }
    LOG_INFO(util::LogCategory::TRANSITION) << "Transition " << ShortId(record.id)
        << " on organization " << record.orgId << " " << TransitionStateToString(state)
        << (reason.empty() ? "" : ": ") << reason;
    return Status::Ok();
}

Status TransitionEngine::ApplyDecisionLocked(const TransitionId& id, authz::ActionState state,
                                             const std::string& reason) {
    auto it = transitions_.find(id);
    if (it == transitions_.end()) {
        return Status::NotFound("transition " + ShortId(id));
    }
    TransitionRecord& record = it->second;
    if (record.state != TransitionState::AwaitingApproval) {
        return Status::Ok();
    }

    if (state == authz::ActionState::Rejected) {
        return CloseLocked(record, TransitionState::Rejected, reason);
    }
    if (state != authz::ActionState::Approved) {
        return Status::Ok();
    }

    TransitionRecord staged = record;
    staged.state = TransitionState::Staged;
    staged.reason.clear();
    staged.updatedAt = clock_();

    db::WriteBatch batch;
    db::RecordStore::Put(batch, TransitionKey(staged.id), staged);
    Status s = registry_.BeginMigration(record.orgId, record.baseVersion, &batch);
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::TRANSITION) << "Staging transition " << ShortId(id)
            << " failed: " << s.ToString();
        Status closed = CloseLocked(record, TransitionState::Rejected,
                                    "staging failed: " + s.ToString());
        return closed.ok() ? s : closed;
    }
    record = std::move(staged);
    LOG_INFO(util::LogCategory::TRANSITION) << "Transition " << ShortId(id)
        << " staged on organization " << record.orgId;
    return Status::Ok();
}

void TransitionEngine::OnActionResolved(const authz::ActionRecord& action) {
    if (action.action.kind != governance::ActionKind::Migrate) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!transitions_.count(action.id)) {
        return;
    }
    Status s = ApplyDecisionLocked(action.id, action.state, action.reason);
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::TRANSITION) << "Transition " << ShortId(action.id)
            << " could not follow its approval: " << s.ToString();
    }
}

// ============================================================================
// Operations
// ============================================================================

Status TransitionEngine::BeginTransition(OrganizationId id, const GovernanceConfig& newConfig,
                                         const Proof& proof, TransitionHandle* out,
                                         uint64_t nonce) {
    org::OrganizationRecord current;
    Status s = registry_.Lookup(id, &current);
    if (!s.ok()) {
        return s;
    }
    if (current.status == org::OrgStatus::Migrating) {
        return Status::TransitionInProgress("organization " + std::to_string(id) +
                                            " is migrating");
    }
    if (current.status == org::OrgStatus::Frozen) {
        return Status::InvalidState("organization " + std::to_string(id) + " is frozen");
    }
    std::string error;
    if (!newConfig.ValidateFor(current.kind, &error)) {
        return Status::InvalidArgument(error);
    }
    if (newConfig == current.governance) {
        return Status::InvalidArgument("new governance equals the current binding");
    }

    const Action action = MakeMigrationAction(id, newConfig, current.version, nonce);
    const TransitionId tid = action.GetHash();
    const Timestamp now = clock_();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto slot = open_.find(id);
        if (slot != open_.end()) {
            return Status::TransitionInProgress("organization " + std::to_string(id) +
                                                " has open transition " + ShortId(slot->second));
        }
        auto existing = transitions_.find(tid);
        if (existing != transitions_.end()) {
            if (existing->second.state != TransitionState::Rejected) {
                return Status::DuplicateId("transition " + ShortId(tid) + " already " +
                                           TransitionStateToString(existing->second.state));
            }
            // Retry of a declined request; its approval must be evaluated afresh
            s = tracker_.Reopen(tid);
            if (s.IsInvalidState()) {
                return Status::DuplicateId("transition " + ShortId(tid) +
                                           " was approved once; use a new nonce");
            }
            if (!s.ok() && !s.IsNotFound()) {
                return s;
            }
            LOG_INFO(util::LogCategory::TRANSITION) << "Retrying rejected transition "
                << ShortId(tid) << " on organization " << id;
        }

        TransitionRecord record;
        record.id = tid;
        record.orgId = id;
        record.fromConfig = current.governance;
        record.newConfig = newConfig;
        record.baseVersion = current.version;
        record.state = TransitionState::AwaitingApproval;
        record.createdAt = now;
        record.updatedAt = now;
        s = Persist(record);
        if (!s.ok()) {
            return s;
        }
        transitions_[tid] = std::move(record);
        open_[id] = tid;
    }

    LOG_INFO(util::LogCategory::TRANSITION) << "Transition " << ShortId(tid)
        << " requested on organization " << id << " to "
        << org::GovernanceTypeToString(newConfig.GetType());

    s = tracker_.Submit(id, action, proof, nullptr);
    if (!s.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        db::Status erased = store_.Erase(TransitionKey(tid));
        if (!erased.ok()) {
            LOG_ERROR(util::LogCategory::TRANSITION) << "Failed to discard transition "
                << ShortId(tid) << ": " << erased.ToString();
        }
        transitions_.erase(tid);
        auto slot = open_.find(id);
        if (slot != open_.end() && slot->second == tid) {
            open_.erase(slot);
        }
        return s;
    }

    authz::ActionRecord approval;
    s = tracker_.Get(tid, &approval);
    if (!s.ok()) {
        return s;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (authz::IsTerminal(approval.state)) {
        s = ApplyDecisionLocked(tid, approval.state, approval.reason);
        if (!s.ok()) {
            return s;
        }
    }

    const TransitionRecord& record = transitions_[tid];
    if (record.state == TransitionState::Rejected) {
        return Status::Rejected(record.reason.empty() ? "governance declined the transition"
                                                      : record.reason);
    }
    if (out) {
        out->id = tid;
        out->orgId = id;
        out->state = record.state;
    }
    return Status::Ok();
}

Status TransitionEngine::CommitTransition(const TransitionHandle& handle) {
    uint64_t newVersion = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transitions_.find(handle.id);
        if (it == transitions_.end()) {
            return Status::NotFound("transition " + ShortId(handle.id));
        }
        TransitionRecord& record = it->second;
        if (record.state != TransitionState::Staged) {
            return Status::InvalidState("transition " + ShortId(handle.id) + " is " +
                                        TransitionStateToString(record.state));
        }

        TransitionRecord committed = record;
        committed.state = TransitionState::Committed;
        committed.updatedAt = clock_();

        db::WriteBatch batch;
        db::RecordStore::Put(batch, TransitionKey(committed.id), committed);
        Status s = registry_.CompleteMigration(record.orgId, record.newConfig, &newVersion, &batch);
        if (!s.ok()) {
            return s;
        }
        record = std::move(committed);
        open_.erase(record.orgId);
    }

    LOG_INFO(util::LogCategory::TRANSITION) << "Transition " << ShortId(handle.id)
        << " committed; organization " << handle.orgId << " at version " << newVersion;

    size_t invalidated = tracker_.InvalidatePending(handle.orgId, "governance changed");
    if (invalidated > 0) {
        LOG_INFO(util::LogCategory::TRANSITION) << "Rejected " << invalidated
            << " pending actions evaluated under the previous binding";
    }
    return Status::Ok();
}

Status TransitionEngine::AbortTransition(const TransitionHandle& handle,
                                         const std::string& reason) {
    bool withdrawApproval = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transitions_.find(handle.id);
        if (it == transitions_.end()) {
            return Status::NotFound("transition " + ShortId(handle.id));
        }
        TransitionRecord& record = it->second;

        if (record.state == TransitionState::Staged) {
            TransitionRecord aborted = record;
            aborted.state = TransitionState::Aborted;
            aborted.reason = reason;
            aborted.updatedAt = clock_();

            db::WriteBatch batch;
            db::RecordStore::Put(batch, TransitionKey(aborted.id), aborted);
            Status s = registry_.CancelMigration(record.orgId, &batch);
            if (!s.ok()) {
                return s;
            }
            record = std::move(aborted);
            open_.erase(record.orgId);
            LOG_INFO(util::LogCategory::TRANSITION) << "Transition " << ShortId(handle.id)
                << " aborted: " << reason;
        } else if (record.state == TransitionState::AwaitingApproval) {
            Status s = CloseLocked(record, TransitionState::Aborted, reason);
            if (!s.ok()) {
                return s;
            }
            withdrawApproval = true;
        } else {
            return Status::InvalidState("transition " + ShortId(handle.id) + " is " +
                                        TransitionStateToString(record.state));
        }
    }

    if (withdrawApproval) {
        Status s = tracker_.Abandon(handle.id, "transition aborted: " + reason);
        if (s.IsInvalidState()) {
            LOG_DEBUG(util::LogCategory::TRANSITION) << "Approval for " << ShortId(handle.id)
                << " already resolved";
        } else if (!s.ok()) {
            return s;
        }
    }
    return Status::Ok();
}

Status TransitionEngine::GetTransition(const TransitionId& id, TransitionRecord* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = transitions_.find(id);
    if (it == transitions_.end()) {
        return Status::NotFound("transition " + ShortId(id));
    }
    if (out) {
        *out = it->second;
    }
    return Status::Ok();
}

std::optional<TransitionId> TransitionEngine::GetOpenTransition(OrganizationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = open_.find(id);
    if (it == open_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace transition
} // namespace polity
