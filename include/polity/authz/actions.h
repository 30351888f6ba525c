// POLITY - Action Authorization
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Tracks actions from submission to a terminal decision. An action is
// evaluated once at submission by the governance of the organization the
// dependency resolver selects; Pending actions are later resolved by
// ballots, finalization, cancellation or a governance change.

#ifndef POLITY_AUTHZ_ACTIONS_H
#define POLITY_AUTHZ_ACTIONS_H

#include "polity/authz/dependency.h"
#include "polity/core/status.h"
#include "polity/core/types.h"
#include "polity/db/recordstore.h"
#include "polity/governance/module.h"
#include "polity/registry/registry.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace polity {
namespace authz {

using governance::Action;
using governance::ActionId;
using governance::Proof;
using governance::Vote;

// ============================================================================
// Action State
// ============================================================================

enum class ActionState : uint8_t {
    Submitted = 0,
    Evaluating = 1,
    Approved = 2,
    Rejected = 3,
    Pending = 4,
};

const char* ActionStateToString(ActionState state);

inline bool IsTerminal(ActionState state) {
    return state == ActionState::Approved || state == ActionState::Rejected;
}

/// Durable record of one action evaluation
struct ActionRecord {
    ActionId id;
    Action action;
    /// First valid signer of the submission proof
    std::optional<PublicKey> proposer;
    /// Organization whose governance evaluates
    OrganizationId evaluatorId{org::NULL_ORG_ID};
    /// Evaluator version at submission; a different version voids the tally
    uint64_t evaluatorVersion{0};
    uint64_t targetVersion{0};
    ActionState state{ActionState::Submitted};
    std::string reason;
    /// Opaque in-flight state owned by the evaluating module
    std::vector<uint8_t> tally;
    Timestamp submittedAt{0};
    Timestamp resolvedAt{0};

    bool IsPending() const { return state == ActionState::Pending; }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, action);
        ::polity::Serialize(s, proposer);
        ::polity::Serialize(s, evaluatorId);
        ::polity::Serialize(s, evaluatorVersion);
        ::polity::Serialize(s, targetVersion);
        ::polity::Serialize(s, static_cast<uint8_t>(state));
        ::polity::Serialize(s, reason);
        ::polity::Serialize(s, tally);
        ::polity::Serialize(s, submittedAt);
        ::polity::Serialize(s, resolvedAt);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t stateByte = 0;
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, action);
        ::polity::Unserialize(s, proposer);
        ::polity::Unserialize(s, evaluatorId);
        ::polity::Unserialize(s, evaluatorVersion);
        ::polity::Unserialize(s, targetVersion);
        ::polity::Unserialize(s, stateByte);
        ::polity::Unserialize(s, reason);
        ::polity::Unserialize(s, tally);
        ::polity::Unserialize(s, submittedAt);
        ::polity::Unserialize(s, resolvedAt);
        if (stateByte > static_cast<uint8_t>(ActionState::Pending)) {
            throw std::ios_base::failure("invalid action state");
        }
        state = static_cast<ActionState>(stateByte);
    }
};

// ============================================================================
// Action Tracker
// ============================================================================

class ActionTracker {
public:
    /// Invoked, without tracker locks held, when a Pending action resolves
    using ResolutionCallback = std::function<void(const ActionRecord& record)>;

    ActionTracker(db::RecordStore& store, const registry::Registry& registry,
                  const DependencyResolver& resolver, ClockFn clock = GetTime);

    ActionTracker(const ActionTracker&) = delete;
    ActionTracker& operator=(const ActionTracker&) = delete;

    Status Load();

    /**
     * Evaluate an action on behalf of orgId.
     *
     * A chain deeper than the resolver's bound is recorded as Rejected and
     * still returns Ok. Failures before evaluation (unknown, migrating or
     * frozen organization, duplicate action) leave nothing recorded.
     */
    Status Submit(OrganizationId orgId, const Action& action, const Proof& proof,
                  ActionId* outId);

    Status GetState(const ActionId& id, ActionState* out) const;

    /// Snapshot of the full record
    Status Get(const ActionId& id, ActionRecord* out) const;

    /// Apply a signed ballot to a Pending action
    Status CastVote(const Vote& vote, ActionState* outState = nullptr);

    /// Re-examine a Pending action, resolving expired voting windows
    Status Finalize(const ActionId& id, ActionState* outState = nullptr);

    /**
     * Withdraw a Pending action. proof must carry a signature over the
     * cancel digest by the proposer or by a key the evaluating module
     * allows to cancel.
     */
    Status Cancel(const ActionId& id, const Proof& proof);

    /// Reject a Pending action without a signed request
    Status Abandon(const ActionId& id, const std::string& reason);

    /**
     * Forget a Rejected action so the identical action can be submitted
     * again. InvalidState for any other state.
     */
    Status Reopen(const ActionId& id);

    /**
     * Reject every Pending action evaluated by, or submitted to, orgId.
     * @return Number of actions rejected
     */
    size_t InvalidatePending(OrganizationId orgId, const std::string& reason);

    void SetResolutionCallback(ResolutionCallback callback);

    size_t Count() const;
    size_t PendingCount() const;

private:
    struct Entry {
        mutable std::mutex mutex;
        ActionRecord record;
    };

    std::shared_ptr<Entry> FindEntry(const ActionId& id) const;

    /// Stale-binding and status checks for a Pending action's evaluator
    Status CheckEvaluator(const ActionRecord& record, OrganizationRecord* evaluator,
                          bool* stale) const;

    /// Move a locked Pending entry to a terminal state and persist it
    Status Resolve(Entry& entry, ActionState state, const std::string& reason);

    Status Persist(const ActionRecord& record);

    void NotifyResolved(const ActionRecord& record);

    db::RecordStore& store_;
    const registry::Registry& registry_;
    const DependencyResolver& resolver_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<ActionId, std::shared_ptr<Entry>> entries_;
    /// Ids currently being evaluated by Submit
    std::set<ActionId> inflight_;

    std::mutex callbackMutex_;
    ResolutionCallback callback_;
};

} // namespace authz
} // namespace polity

#endif // POLITY_AUTHZ_ACTIONS_H
