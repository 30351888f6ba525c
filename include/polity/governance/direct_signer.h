// POLITY - Direct-Signer Governance
// Copyright (c) 2024 POLITY Developers
// MIT License

#ifndef POLITY_GOVERNANCE_DIRECT_SIGNER_H
#define POLITY_GOVERNANCE_DIRECT_SIGNER_H

#include "polity/governance/module.h"

namespace polity {
namespace governance {

/**
 * A single authority decides. An action is Approved iff the proof carries
 * a valid signature by the authority over the ActionId; otherwise it is
 * Rejected. Never Pending.
 */
class DirectSignerModule : public GovernanceModule {
public:
    GovernanceType GetType() const override { return GovernanceType::DirectSigner; }
    const char* GetName() const override { return "direct-signer"; }

    Outcome Evaluate(const EvaluationContext& ctx, const Action& action,
                     const Proof& proof, std::vector<uint8_t>& tally) const override;
};

} // namespace governance
} // namespace polity

#endif // POLITY_GOVERNANCE_DIRECT_SIGNER_H
