// POLITY - Delegated Governance Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/governance/delegated.h"

namespace polity {
namespace governance {

Outcome DelegatedModule::Evaluate(const EvaluationContext&, const Action&,
                                  const Proof&, std::vector<uint8_t>& tally) const {
    tally.clear();
    return Outcome::Defer();
}

} // namespace governance
} // namespace polity
