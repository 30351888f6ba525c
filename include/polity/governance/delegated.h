// POLITY - Delegated Governance
// Copyright (c) 2024 POLITY Developers
// MIT License

#ifndef POLITY_GOVERNANCE_DELEGATED_H
#define POLITY_GOVERNANCE_DELEGATED_H

#include "polity/governance/module.h"

namespace polity {
namespace governance {

/// Always defers to the parent organization's governance
class DelegatedModule : public GovernanceModule {
public:
    GovernanceType GetType() const override { return GovernanceType::Delegated; }
    const char* GetName() const override { return "delegated"; }

    Outcome Evaluate(const EvaluationContext& ctx, const Action& action,
                     const Proof& proof, std::vector<uint8_t>& tally) const override;
};

} // namespace governance
} // namespace polity

#endif // POLITY_GOVERNANCE_DELEGATED_H
