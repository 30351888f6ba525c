// POLITY - Governance Service Interface
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Transport-neutral entry point to the governance core. A transport (CLI,
// RPC, ledger hook) binds to GovernanceService; LocalGovernanceService
// serves it in-process from a NodeContext.

#ifndef POLITY_SERVICE_SERVICE_H
#define POLITY_SERVICE_SERVICE_H

#include "polity/authz/actions.h"
#include "polity/core/status.h"
#include "polity/governance/module.h"
#include "polity/membership/membership.h"
#include "polity/node/context.h"
#include "polity/org/organization.h"
#include "polity/transition/engine.h"

#include <optional>
#include <set>
#include <string>

namespace polity {
namespace service {

using authz::ActionState;
using governance::Action;
using governance::ActionId;
using governance::Proof;
using governance::Vote;
using org::GovernanceConfig;
using org::OrganizationId;
using org::OrganizationRecord;
using org::OrgKind;
using transition::TransitionHandle;

class GovernanceService {
public:
    virtual ~GovernanceService() = default;

    // ========================================================================
    // Registry
    // ========================================================================

    virtual Status Register(OrgKind kind, std::optional<OrganizationId> parent,
                            const GovernanceConfig& config, OrganizationId* outId,
                            const std::string& label = "") = 0;

    virtual Status Lookup(OrganizationId id, OrganizationRecord* out) const = 0;

    virtual Status ListDependents(OrganizationId id, std::set<OrganizationId>* out) const = 0;

    // ========================================================================
    // Transitions
    // ========================================================================

    virtual Status BeginTransition(OrganizationId id, const GovernanceConfig& newConfig,
                                   const Proof& proof, TransitionHandle* out,
                                   uint64_t nonce = 0) = 0;

    virtual Status CommitTransition(const TransitionHandle& handle) = 0;

    virtual Status AbortTransition(const TransitionHandle& handle, const std::string& reason) = 0;

    // ========================================================================
    // Actions
    // ========================================================================

    /// Migrate actions are only accepted through BeginTransition
    virtual Status SubmitAction(OrganizationId orgId, const Action& action, const Proof& proof,
                                ActionId* outId) = 0;

    virtual Status ActionStatus(const ActionId& id, ActionState* out) const = 0;

    virtual Status CastVote(const Vote& vote, ActionState* out = nullptr) = 0;

    virtual Status FinalizeAction(const ActionId& id, ActionState* out = nullptr) = 0;

    virtual Status CancelAction(const ActionId& id, const Proof& proof) = 0;
};

/// In-process binding over a NodeContext; the node must outlive the service
class LocalGovernanceService : public GovernanceService {
public:
    explicit LocalGovernanceService(NodeContext& node) : node_(node) {}

    Status Register(OrgKind kind, std::optional<OrganizationId> parent,
                    const GovernanceConfig& config, OrganizationId* outId,
                    const std::string& label = "") override;
    Status Lookup(OrganizationId id, OrganizationRecord* out) const override;
    Status ListDependents(OrganizationId id, std::set<OrganizationId>* out) const override;

    Status BeginTransition(OrganizationId id, const GovernanceConfig& newConfig,
                           const Proof& proof, TransitionHandle* out,
                           uint64_t nonce = 0) override;
    Status CommitTransition(const TransitionHandle& handle) override;
    Status AbortTransition(const TransitionHandle& handle, const std::string& reason) override;

    Status SubmitAction(OrganizationId orgId, const Action& action, const Proof& proof,
                        ActionId* outId) override;
    Status ActionStatus(const ActionId& id, ActionState* out) const override;
    Status CastVote(const Vote& vote, ActionState* out = nullptr) override;
    Status FinalizeAction(const ActionId& id, ActionState* out = nullptr) override;
    Status CancelAction(const ActionId& id, const Proof& proof) override;

    NodeContext& GetNode() { return node_; }

private:
    NodeContext& node_;
};

} // namespace service
} // namespace polity

#endif // POLITY_SERVICE_SERVICE_H
