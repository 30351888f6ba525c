// POLITY - Local Governance Service
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/service/service.h"

namespace polity {
namespace service {

Status LocalGovernanceService::Register(OrgKind kind, std::optional<OrganizationId> parent,
                                        const GovernanceConfig& config, OrganizationId* outId,
                                        const std::string& label) {
    registry::RegisterOptions options;
    options.label = label;
    return node_.registry->Register(kind, parent, config, outId, options);
}

Status LocalGovernanceService::Lookup(OrganizationId id, OrganizationRecord* out) const {
    return node_.registry->Lookup(id, out);
}

Status LocalGovernanceService::ListDependents(OrganizationId id,
                                              std::set<OrganizationId>* out) const {
    return node_.registry->ListDependents(id, out);
}

Status LocalGovernanceService::BeginTransition(OrganizationId id,
                                               const GovernanceConfig& newConfig,
                                               const Proof& proof, TransitionHandle* out,
                                               uint64_t nonce) {
    return node_.engine->BeginTransition(id, newConfig, proof, out, nonce);
}

Status LocalGovernanceService::CommitTransition(const TransitionHandle& handle) {
    return node_.engine->CommitTransition(handle);
}

Status LocalGovernanceService::AbortTransition(const TransitionHandle& handle,
                                               const std::string& reason) {
    return node_.engine->AbortTransition(handle, reason);
}

Status LocalGovernanceService::SubmitAction(OrganizationId orgId, const Action& action,
                                            const Proof& proof, ActionId* outId) {
    if (action.kind == governance::ActionKind::Migrate) {
        return Status::InvalidArgument("governance migrations go through BeginTransition");
    }
    return node_.tracker->Submit(orgId, action, proof, outId);
}

Status LocalGovernanceService::ActionStatus(const ActionId& id, ActionState* out) const {
    return node_.tracker->GetState(id, out);
}

Status LocalGovernanceService::CastVote(const Vote& vote, ActionState* out) {
    return node_.tracker->CastVote(vote, out);
}

Status LocalGovernanceService::FinalizeAction(const ActionId& id, ActionState* out) {
    return node_.tracker->Finalize(id, out);
}

Status LocalGovernanceService::CancelAction(const ActionId& id, const Proof& proof) {
    return node_.tracker->Cancel(id, proof);
}

} // namespace service
} // namespace polity
