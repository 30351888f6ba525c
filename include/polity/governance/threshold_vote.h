// POLITY - Threshold-Vote Governance
// Copyright (c) 2024 POLITY Developers
// MIT License

#ifndef POLITY_GOVERNANCE_THRESHOLD_VOTE_H
#define POLITY_GOVERNANCE_THRESHOLD_VOTE_H

#include "polity/governance/module.h"

#include <vector>

namespace polity {
namespace governance {

/// One recorded ballot
struct Ballot {
    PublicKey voter;
    VoteChoice choice{VoteChoice::Yes};

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, voter);
        ::polity::Serialize(s, static_cast<uint8_t>(choice));
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t choiceByte = 0;
        ::polity::Unserialize(s, voter);
        ::polity::Unserialize(s, choiceByte);
        if (choiceByte > static_cast<uint8_t>(VoteChoice::No)) {
            throw std::ios_base::failure("invalid ballot choice");
        }
        choice = static_cast<VoteChoice>(choiceByte);
    }
};

/// In-flight state of a threshold vote, stored as the action's tally blob
struct ThresholdTally {
    std::vector<Ballot> ballots;

    bool HasVoted(const PublicKey& voter) const;

    /// Sum of voter weights for ballots with the given choice
    uint64_t WeightFor(const org::ThresholdVoteParams& params, VoteChoice choice) const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, ballots);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, ballots);
    }
};

/**
 * Weighted quorum. Signatures in the submission proof count as Yes
 * ballots; further ballots arrive through ApplyVote.
 *
 * - Approved once Yes weight reaches the threshold
 * - Rejected once No weight makes the threshold unreachable
 * - Rejected at finalize time once the voting window (if any) has passed
 * - Pending otherwise
 */
class ThresholdVoteModule : public GovernanceModule {
public:
    GovernanceType GetType() const override { return GovernanceType::ThresholdVote; }
    const char* GetName() const override { return "threshold-vote"; }

    Outcome Evaluate(const EvaluationContext& ctx, const Action& action,
                     const Proof& proof, std::vector<uint8_t>& tally) const override;

    Status ApplyVote(const EvaluationContext& ctx, const Vote& vote,
                     std::vector<uint8_t>& tally, Outcome* outcome) const override;

    Outcome Finalize(const EvaluationContext& ctx,
                     const std::vector<uint8_t>& tally) const override;

    /// Any voter may withdraw a pending action
    bool CanCancel(const GovernanceConfig& config, const PublicKey& signer) const override;

    /// Decode a tally blob; false if malformed
    static bool DecodeTally(const std::vector<uint8_t>& blob, ThresholdTally& tally);

private:
    static Outcome Decide(const org::ThresholdVoteParams& params, const ThresholdTally& tally);
    static bool WindowExpired(const org::ThresholdVoteParams& params, const EvaluationContext& ctx);
};

} // namespace governance
} // namespace polity

#endif // POLITY_GOVERNANCE_THRESHOLD_VOTE_H
