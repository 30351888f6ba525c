// POLITY - Direct-Signer Governance Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/governance/direct_signer.h"
#include "polity/util/logging.h"

namespace polity {
namespace governance {

Outcome DirectSignerModule::Evaluate(const EvaluationContext& ctx, const Action& action,
                                     const Proof& proof, std::vector<uint8_t>& tally) const {
    tally.clear();

    const org::DirectSignerParams* params = ctx.config.AsDirectSigner();
    if (!params) {
        return Outcome::Rejected("configuration is not direct-signer");
    }

    for (const auto& entry : proof.signatures) {
        if (entry.signer != params->authority) {
            continue;
        }
        if (entry.signer.Verify(ctx.actionId, entry.signature)) {
            LOG_DEBUG(util::LogCategory::GOVERNANCE)
                << "Authority of org " << ctx.evaluatorId << " approved " << action.ToString();
            return Outcome::Approved("signed by authority");
        }
    }

    return Outcome::Rejected("missing or invalid authority signature");
}

} // namespace governance
} // namespace polity
