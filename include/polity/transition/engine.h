// POLITY - Governance Transition Engine
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Replaces an organization's governance binding without touching its
// data. A transition is itself a Migrate action that the organization's
// current governance must approve before the new binding is staged.
//
//   AwaitingApproval --approved--> Staged --commit--> Committed
//          |                         |
//          +--rejected/cancel--> Rejected
//          +------abort------> Aborted <--abort--+

#ifndef POLITY_TRANSITION_ENGINE_H
#define POLITY_TRANSITION_ENGINE_H

#include "polity/authz/actions.h"
#include "polity/core/status.h"
#include "polity/core/types.h"
#include "polity/db/recordstore.h"
#include "polity/governance/module.h"
#include "polity/org/organization.h"
#include "polity/registry/registry.h"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace polity {
namespace transition {

using governance::Action;
using governance::Proof;
using org::GovernanceConfig;
using org::OrganizationId;

/// A transition shares its id with the Migrate action that approves it
using TransitionId = governance::ActionId;

enum class TransitionState : uint8_t {
    AwaitingApproval = 0,
    Staged = 1,
    Committed = 2,
    Aborted = 3,
    Rejected = 4,
};

const char* TransitionStateToString(TransitionState state);

/// Durable record of one transition
struct TransitionRecord {
    TransitionId id;
    OrganizationId orgId{org::NULL_ORG_ID};
    GovernanceConfig fromConfig;
    GovernanceConfig newConfig;
    /// Organization version when the transition began
    uint64_t baseVersion{0};
    TransitionState state{TransitionState::AwaitingApproval};
    std::string reason;
    Timestamp createdAt{0};
    Timestamp updatedAt{0};

    /// Still holds the organization's transition slot
    bool IsOpen() const {
        return state == TransitionState::AwaitingApproval || state == TransitionState::Staged;
    }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, orgId);
        ::polity::Serialize(s, fromConfig);
        ::polity::Serialize(s, newConfig);
        ::polity::Serialize(s, baseVersion);
        ::polity::Serialize(s, static_cast<uint8_t>(state));
        ::polity::Serialize(s, reason);
        ::polity::Serialize(s, createdAt);
        ::polity::Serialize(s, updatedAt);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t stateByte = 0;
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, orgId);
        ::polity::Unserialize(s, fromConfig);
        ::polity::Unserialize(s, newConfig);
        ::polity::Unserialize(s, baseVersion);
        ::polity::Unserialize(s, stateByte);
        ::polity::Unserialize(s, reason);
        ::polity::Unserialize(s, createdAt);
        ::polity::Unserialize(s, updatedAt);
        if (stateByte > static_cast<uint8_t>(TransitionState::Rejected)) {
            throw std::ios_base::failure("invalid transition state");
        }
        state = static_cast<TransitionState>(stateByte);
    }
};

/// Caller-held reference to a transition
struct TransitionHandle {
    TransitionId id;
    OrganizationId orgId{org::NULL_ORG_ID};
    TransitionState state{TransitionState::AwaitingApproval};
};

class TransitionEngine {
public:
    /// Registers itself as the tracker's resolution callback
    TransitionEngine(db::RecordStore& store, registry::Registry& registry,
                     authz::ActionTracker& tracker, ClockFn clock = GetTime);
    ~TransitionEngine();

    TransitionEngine(const TransitionEngine&) = delete;
    TransitionEngine& operator=(const TransitionEngine&) = delete;

    /// Restore transitions; the tracker must already be loaded
    Status Load();

    /**
     * Ask the organization's current governance to approve newConfig.
     *
     * proof signs the id of MakeMigrationAction(id, newConfig, version,
     * nonce) where version is the record's current version. On approval
     * the organization moves to Migrating and the handle is Staged; on a
     * Pending vote the handle is AwaitingApproval and the organization
     * stays Active until the vote concludes.
     *
     * A transition that ended Rejected may be requested again with the
     * same nonce. An aborted or committed one needs a fresh nonce.
     *
     * @return NotFound, TransitionInProgress, InvalidState,
     *         InvalidArgument, Rejected or DuplicateId on failure
     */
    Status BeginTransition(OrganizationId id, const GovernanceConfig& newConfig,
                           const Proof& proof, TransitionHandle* out, uint64_t nonce = 0);

    /// Bind the staged config and bump the version in one atomic write
    Status CommitTransition(const TransitionHandle& handle);

    /// Discard a staged config, or withdraw one still awaiting approval
    Status AbortTransition(const TransitionHandle& handle, const std::string& reason);

    Status GetTransition(const TransitionId& id, TransitionRecord* out) const;

    /// The transition currently holding id's slot, if any
    std::optional<TransitionId> GetOpenTransition(OrganizationId id) const;

    /// The action a transition from baseVersion to newConfig must have approved
    static Action MakeMigrationAction(OrganizationId id, const GovernanceConfig& newConfig,
                                      uint64_t baseVersion, uint64_t nonce = 0);

private:
    void OnActionResolved(const authz::ActionRecord& record);

    /// Apply an approval decision to a transition still awaiting it.
    /// Caller holds mutex_.
    Status ApplyDecisionLocked(const TransitionId& id, authz::ActionState state,
                               const std::string& reason);

    /// Close a transition and release its slot. Caller holds mutex_.
    Status CloseLocked(TransitionRecord& record, TransitionState state,
                       const std::string& reason);

    Status Persist(const TransitionRecord& record);

    db::RecordStore& store_;
    registry::Registry& registry_;
    authz::ActionTracker& tracker_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<TransitionId, TransitionRecord> transitions_;
    /// One open transition per organization
    std::map<OrganizationId, TransitionId> open_;
};

} // namespace transition
} // namespace polity

#endif // POLITY_TRANSITION_ENGINE_H
