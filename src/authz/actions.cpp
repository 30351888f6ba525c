// POLITY - Action Authorization Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/authz/actions.h"
#include "polity/util/logging.h"

#include <sstream>

namespace polity {
namespace authz {

namespace {

std::string ActionKey(const ActionId& id) {
    return db::MakeKey(db::prefix::ACTION, id);
}

std::string ShortId(const ActionId& id) {
    return id.ToHex().substr(0, 16);
}

ActionState StateFor(governance::Decision decision) {
    switch (decision) {
        case governance::Decision::Approved: return ActionState::Approved;
        case governance::Decision::Rejected: return ActionState::Rejected;
        default: return ActionState::Pending;
    }
}

} // namespace

const char* ActionStateToString(ActionState state) {
    switch (state) {
        case ActionState::Submitted: return "Submitted";
        case ActionState::Evaluating: return "Evaluating";
        case ActionState::Approved: return "Approved";
        case ActionState::Rejected: return "Rejected";
        case ActionState::Pending: return "Pending";
        default: return "Unknown";
    }
}

std::string ActionRecord::ToString() const {
    std::ostringstream oss;
    oss << "ActionRecord(id=" << ShortId(id)
        << ", org=" << action.orgId
        << ", evaluator=" << evaluatorId
        << ", state=" << ActionStateToString(state);
    if (!reason.empty()) {
        oss << ", reason=" << reason;
    }
    oss << ")";
    return oss.str();
}

// ============================================================================
// ActionTracker
// ============================================================================

ActionTracker::ActionTracker(db::RecordStore& store, const registry::Registry& registry,
                             const DependencyResolver& resolver, ClockFn clock)
    : store_(store), registry_(registry), resolver_(resolver), clock_(std::move(clock)) {}

Status ActionTracker::Load() {
    util::ScopedLogTimer timer(util::LogCategory::AUTHZ, "Action load");
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    db::Status s = store_.ForEach<ActionRecord>(db::prefix::ACTION,
        [this](ActionRecord&& record) {
            auto entry = std::make_shared<Entry>();
            ActionId id = record.id;
            entry->record = std::move(record);
            entries_[id] = std::move(entry);
        });
    if (!s.ok()) {
        return registry::FromStorage(s);
    }
    LOG_INFO(util::LogCategory::AUTHZ) << "Loaded " << entries_.size() << " action records";
    return Status::Ok();
}

void ActionTracker::SetResolutionCallback(ResolutionCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

void ActionTracker::NotifyResolved(const ActionRecord& record) {
    ResolutionCallback callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        callback = callback_;
    }
    if (callback) {
        callback(record);
    }
}

std::shared_ptr<ActionTracker::Entry> ActionTracker::FindEntry(const ActionId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

Status ActionTracker::Persist(const ActionRecord& record) {
    db::Status s = store_.Write(ActionKey(record.id), record);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::AUTHZ) << "Failed to persist action "
            << ShortId(record.id) << ": " << s.ToString();
    }
    return registry::FromStorage(s);
}

Status ActionTracker::Resolve(Entry& entry, ActionState state, const std::string& reason) {
    ActionRecord updated = entry.record;
    updated.state = state;
    updated.reason = reason;
    updated.resolvedAt = clock_();
    Status s = Persist(updated);
    if (s.ok()) {
        entry.record = std::move(updated);
        LOG_INFO(util::LogCategory::AUTHZ) << "Action " << ShortId(entry.record.id)
            << " resolved " << ActionStateToString(state)
            << (reason.empty() ? "" : ": ") << reason;
    }
    return s;
}

// ============================================================================
// Submission
// ============================================================================

Status ActionTracker::Submit(OrganizationId orgId, const Action& action, const Proof& proof,
                             ActionId* outId) {
    if (action.orgId != orgId) {
        return Status::InvalidArgument("action targets organization " +
                                       std::to_string(action.orgId) + ", not " +
                                       std::to_string(orgId));
    }
    if (action.name.empty() || action.name.size() > governance::MAX_ACTION_NAME_LENGTH) {
        return Status::InvalidArgument("invalid action name length");
    }
    if (action.payload.size() > governance::MAX_ACTION_PAYLOAD_SIZE) {
        return Status::InvalidArgument("action payload too large");
    }

    const ActionId id = action.GetHash();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entries_.count(id) || !inflight_.insert(id).second) {
            return Status::DuplicateId("action " + ShortId(id) + " already submitted");
        }
    }

    // Release the reservation on every path out
    struct Reservation {
        ActionTracker& tracker;
        ActionId id;
        ~Reservation() {
            std::lock_guard<std::mutex> lock(tracker.mutex_);
            tracker.inflight_.erase(id);
        }
    } reservation{*this, id};

    OrganizationRecord target;
    Status s = registry_.Lookup(orgId, &target);
    if (!s.ok()) {
        return s;
    }
    if (target.status == org::OrgStatus::Migrating) {
        return Status::TransitionInProgress("organization " + std::to_string(orgId) +
                                            " is migrating");
    }
    if (target.status == org::OrgStatus::Frozen) {
        return Status::InvalidState("organization " + std::to_string(orgId) + " is frozen");
    }

    const Timestamp now = clock_();

    auto record = std::make_shared<Entry>();
    ActionRecord& rec = record->record;
    rec.id = id;
    rec.action = action;
    rec.targetVersion = target.version;
    rec.submittedAt = now;
    rec.state = ActionState::Submitted;

    std::vector<PublicKey> signers = proof.ValidSigners(id);
    if (!signers.empty()) {
        rec.proposer = signers.front();
    }

    AuthorityChain chain;
    s = resolver_.ResolveAuthority(orgId, &chain);
    if (s.IsDepthExceeded() || s.IsRejected()) {
        rec.evaluatorId = orgId;
        rec.state = ActionState::Rejected;
        rec.reason = s.IsDepthExceeded() ? "depth exceeded" : s.message();
        rec.resolvedAt = now;
    } else if (!s.ok()) {
        return s;
    } else {
        const OrganizationRecord& evaluator = chain.evaluator;
        if (evaluator.status == org::OrgStatus::Migrating) {
            return Status::TransitionInProgress("evaluating organization " +
                                                std::to_string(evaluator.id) + " is migrating");
        }
        if (evaluator.status == org::OrgStatus::Frozen) {
            return Status::InvalidState("evaluating organization " +
                                        std::to_string(evaluator.id) + " is frozen");
        }

        rec.evaluatorId = evaluator.id;
        rec.evaluatorVersion = evaluator.version;
        rec.state = ActionState::Evaluating;

        const governance::GovernanceModule& module =
            governance::GetModule(evaluator.governance.GetType());
        governance::EvaluationContext ctx{evaluator.governance, evaluator.id, id, now, now};
        governance::Outcome outcome = module.Evaluate(ctx, action, proof, rec.tally);

        if (outcome.decision == governance::Decision::Defer) {
            rec.state = ActionState::Rejected;
            rec.reason = "evaluator deferred without a parent";
        } else {
            rec.state = StateFor(outcome.decision);
            rec.reason = outcome.reason;
        }
        if (IsTerminal(rec.state)) {
            rec.resolvedAt = now;
        }
    }

    s = Persist(rec);
    if (!s.ok()) {
        return s;
    }

    LOG_INFO(util::LogCategory::AUTHZ) << "Action " << ShortId(id) << " '" << action.name
        << "' on organization " << orgId << " evaluated by " << rec.evaluatorId
        << ": " << ActionStateToString(rec.state);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[id] = std::move(record);
    }

    if (outId) {
        *outId = id;
    }
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

Status ActionTracker::GetState(const ActionId& id, ActionState* out) const {
    auto entry = FindEntry(id);
    if (!entry) {
        return Status::NotFound("action " + ShortId(id));
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (out) {
        *out = entry->record.state;
    }
    return Status::Ok();
}

Status ActionTracker::Get(const ActionId& id, ActionRecord* out) const {
    auto entry = FindEntry(id);
    if (!entry) {
        return Status::NotFound("action " + ShortId(id));
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (out) {
        *out = entry->record;
    }
    return Status::Ok();
}

size_t ActionTracker::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ActionTracker::PendingCount() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }
    size_t count = 0;
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (entry->record.IsPending()) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Resolution
// ============================================================================

Status ActionTracker::CheckEvaluator(const ActionRecord& record, OrganizationRecord* evaluator,
                                     bool* stale) const {
    *stale = false;
    Status s = registry_.Lookup(record.evaluatorId, evaluator);
    if (s.IsNotFound() || (s.ok() && evaluator->version != record.evaluatorVersion)) {
        *stale = true;
        return Status::Ok();
    }
    if (!s.ok()) {
        return s;
    }
    if (evaluator->status == org::OrgStatus::Migrating) {
        return Status::TransitionInProgress("evaluating organization " +
                                            std::to_string(evaluator->id) + " is migrating");
    }
    if (evaluator->status == org::OrgStatus::Frozen) {
        return Status::InvalidState("evaluating organization " +
                                    std::to_string(evaluator->id) + " is frozen");
    }
    return Status::Ok();
}

Status ActionTracker::CastVote(const Vote& vote, ActionState* outState) {
    auto entry = FindEntry(vote.actionId);
    if (!entry) {
        return Status::NotFound("action " + ShortId(vote.actionId));
    }

    ActionRecord resolved;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ActionRecord& rec = entry->record;
        if (!rec.IsPending()) {
            return Status::InvalidState("action " + ShortId(rec.id) + " is " +
                                        ActionStateToString(rec.state));
        }

        OrganizationRecord evaluator;
        bool stale = false;
        Status s = CheckEvaluator(rec, &evaluator, &stale);
        if (!s.ok()) {
            return s;
        }
        if (stale) {
            s = Resolve(*entry, ActionState::Rejected, "governance changed");
            if (!s.ok()) {
                return s;
            }
            if (outState) {
                *outState = rec.state;
            }
            resolved = rec;
        } else {
            const governance::GovernanceModule& module =
                governance::GetModule(evaluator.governance.GetType());
            governance::EvaluationContext ctx{evaluator.governance, evaluator.id, rec.id,
                                              rec.submittedAt, clock_()};
            std::vector<uint8_t> tally = rec.tally;
            governance::Outcome outcome;
            s = module.ApplyVote(ctx, vote, tally, &outcome);
            if (!s.ok()) {
                return s;
            }

            if (outcome.IsFinal()) {
                ActionRecord updated = rec;
                updated.tally = std::move(tally);
                updated.state = StateFor(outcome.decision);
                updated.reason = outcome.reason;
                updated.resolvedAt = ctx.now;
                s = Persist(updated);
                if (!s.ok()) {
                    return s;
                }
                rec = std::move(updated);
                resolved = rec;
                LOG_INFO(util::LogCategory::AUTHZ) << "Action " << ShortId(rec.id)
                    << " resolved " << ActionStateToString(rec.state) << " by vote";
            } else {
                ActionRecord updated = rec;
                updated.tally = std::move(tally);
                updated.reason = outcome.reason;
                s = Persist(updated);
                if (!s.ok()) {
                    return s;
                }
                rec = std::move(updated);
                LOG_DEBUG(util::LogCategory::AUTHZ) << "Vote "
                    << governance::VoteChoiceToString(vote.choice) << " recorded on "
                    << ShortId(rec.id) << ": " << outcome.reason;
            }
            if (outState) {
                *outState = rec.state;
            }
        }
    }

    if (IsTerminal(resolved.state)) {
        NotifyResolved(resolved);
    }
    return Status::Ok();
}

Status ActionTracker::Finalize(const ActionId& id, ActionState* outState) {
    auto entry = FindEntry(id);
    if (!entry) {
        return Status::NotFound("action " + ShortId(id));
    }

    ActionRecord resolved;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ActionRecord& rec = entry->record;
        if (!rec.IsPending()) {
            if (outState) {
                *outState = rec.state;
            }
            return Status::Ok();
        }

        OrganizationRecord evaluator;
        bool stale = false;
        Status s = CheckEvaluator(rec, &evaluator, &stale);
        if (!s.ok()) {
            return s;
        }
        if (stale) {
            s = Resolve(*entry, ActionState::Rejected, "governance changed");
        } else {
            const governance::GovernanceModule& module =
                governance::GetModule(evaluator.governance.GetType());
            governance::EvaluationContext ctx{evaluator.governance, evaluator.id, rec.id,
                                              rec.submittedAt, clock_()};
            governance::Outcome outcome = module.Finalize(ctx, rec.tally);
            if (outcome.IsFinal()) {
                s = Resolve(*entry, StateFor(outcome.decision), outcome.reason);
            }
        }
        if (!s.ok()) {
            return s;
        }
        if (outState) {
            *outState = rec.state;
        }
        if (IsTerminal(rec.state)) {
            resolved = rec;
        }
    }

    if (IsTerminal(resolved.state)) {
        NotifyResolved(resolved);
    }
    return Status::Ok();
}

Status ActionTracker::Cancel(const ActionId& id, const Proof& proof) {
    auto entry = FindEntry(id);
    if (!entry) {
        return Status::NotFound("action " + ShortId(id));
    }

    ActionRecord resolved;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        ActionRecord& rec = entry->record;
        if (!rec.IsPending()) {
            return Status::InvalidState("action " + ShortId(rec.id) + " is " +
                                        ActionStateToString(rec.state));
        }

        OrganizationRecord evaluator;
        bool haveEvaluator = registry_.Lookup(rec.evaluatorId, &evaluator).ok();
        const governance::GovernanceModule* module = haveEvaluator
            ? &governance::GetModule(evaluator.governance.GetType()) : nullptr;

        bool authorized = false;
        for (const PublicKey& signer : proof.ValidSigners(governance::GetCancelHash(id))) {
            if (rec.proposer && signer == *rec.proposer) {
                authorized = true;
                break;
            }
            if (module && module->CanCancel(evaluator.governance, signer)) {
                authorized = true;
                break;
            }
        }
        if (!authorized) {
            return Status::InvalidArgument("no authorized signature over the cancel digest");
        }

        Status s = Resolve(*entry, ActionState::Rejected, "cancelled");
        if (!s.ok()) {
            return s;
        }
        resolved = rec;
    }

    NotifyResolved(resolved);
    return Status::Ok();
}

Status ActionTracker::Abandon(const ActionId& id, const std::string& reason) {
    auto entry = FindEntry(id);
    if (!entry) {
        return Status::NotFound("action " + ShortId(id));
    }

    ActionRecord resolved;
    {
        std::lock_guard<std::mutex> lock(entry->mutex);
        if (!entry->record.IsPending()) {
            return Status::InvalidState("action " + ShortId(id) + " is " +
                                        ActionStateToString(entry->record.state));
        }
        Status s = Resolve(*entry, ActionState::Rejected, reason);
        if (!s.ok()) {
            return s;
        }
        resolved = entry->record;
    }

    NotifyResolved(resolved);
    return Status::Ok();
}

Status ActionTracker::Reopen(const ActionId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Status::NotFound("action " + ShortId(id));
    }
    std::shared_ptr<Entry> entry = it->second;
    std::lock_guard<std::mutex> entryLock(entry->mutex);
    const ActionRecord& rec = entry->record;
    if (rec.state != ActionState::Rejected) {
        return Status::InvalidState("action " + ShortId(id) + " is " +
                                    ActionStateToString(rec.state));
    }
    db::Status s = store_.Erase(ActionKey(id));
    if (!s.ok()) {
        return registry::FromStorage(s);
    }
    LOG_DEBUG(util::LogCategory::AUTHZ) << "Action " << ShortId(id) << " reopened after: "
        << rec.reason;
    entries_.erase(it);
    return Status::Ok();
}

size_t ActionTracker::InvalidatePending(OrganizationId orgId, const std::string& reason) {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }

    std::vector<ActionRecord> resolved;
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        const ActionRecord& rec = entry->record;
        if (!rec.IsPending() || (rec.evaluatorId != orgId && rec.action.orgId != orgId)) {
            continue;
        }
        Status s = Resolve(*entry, ActionState::Rejected, reason);
        if (!s.ok()) {
            LOG_WARN(util::LogCategory::AUTHZ) << "Could not invalidate action "
                << ShortId(rec.id) << ": " << s.ToString();
            continue;
        }
        resolved.push_back(rec);
    }

    for (const auto& rec : resolved) {
        NotifyResolved(rec);
    }
    return resolved.size();
}

} // namespace authz
} // namespace polity
