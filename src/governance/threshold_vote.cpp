// POLITY - Threshold-Vote Governance Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/governance/threshold_vote.h"
#include "polity/util/logging.h"

#include <sstream>

namespace polity {
namespace governance {

// ============================================================================
// ThresholdTally
// ============================================================================

bool ThresholdTally::HasVoted(const PublicKey& voter) const {
    for (const auto& ballot : ballots) {
        if (ballot.voter == voter) {
            return true;
        }
    }
    return false;
}

uint64_t ThresholdTally::WeightFor(const org::ThresholdVoteParams& params,
                                   VoteChoice choice) const {
    uint64_t weight = 0;
    for (const auto& ballot : ballots) {
        if (ballot.choice == choice) {
            weight += params.WeightOf(ballot.voter);
        }
    }
    return weight;
}

// ============================================================================
// ThresholdVoteModule
// ============================================================================

bool ThresholdVoteModule::DecodeTally(const std::vector<uint8_t>& blob, ThresholdTally& tally) {
    if (blob.empty()) {
        tally.ballots.clear();
        return true;
    }
    return DeserializeFromBytes(blob.data(), blob.size(), tally);
}

Outcome ThresholdVoteModule::Decide(const org::ThresholdVoteParams& params,
                                    const ThresholdTally& tally) {
    uint64_t total = params.TotalWeight();
    uint64_t yes = tally.WeightFor(params, VoteChoice::Yes);
    uint64_t no = tally.WeightFor(params, VoteChoice::No);

    if (yes >= params.threshold) {
        return Outcome::Approved("threshold reached");
    }
    if (total - no < params.threshold) {
        return Outcome::Rejected("threshold unreachable");
    }

    std::ostringstream oss;
    oss << "yes weight " << yes << " of " << params.threshold << " required";
    return Outcome::Pending(oss.str());
}

bool ThresholdVoteModule::WindowExpired(const org::ThresholdVoteParams& params,
                                        const EvaluationContext& ctx) {
    return params.votingWindow > 0 && ctx.now >= ctx.submittedAt + params.votingWindow;
}

Outcome ThresholdVoteModule::Evaluate(const EvaluationContext& ctx, const Action&,
                                      const Proof& proof, std::vector<uint8_t>& tally) const {
    const org::ThresholdVoteParams* params = ctx.config.AsThresholdVote();
    if (!params) {
        return Outcome::Rejected("configuration is not threshold-vote");
    }

    ThresholdTally state;
    for (const PublicKey& signer : proof.ValidSigners(ctx.actionId)) {
        if (params->IsVoter(signer)) {
            state.ballots.push_back({signer, VoteChoice::Yes});
        } else {
            LOG_DEBUG(util::LogCategory::GOVERNANCE)
                << "Ignoring signature from non-voter " << signer.ToHex();
        }
    }
    tally = SerializeToBytes(state);

    return Decide(*params, state);
}

Status ThresholdVoteModule::ApplyVote(const EvaluationContext& ctx, const Vote& vote,
                                      std::vector<uint8_t>& tally, Outcome* outcome) const {
    const org::ThresholdVoteParams* params = ctx.config.AsThresholdVote();
    if (!params) {
        return Status::InvalidState("configuration is not threshold-vote");
    }
    if (vote.actionId != ctx.actionId) {
        return Status::InvalidArgument("vote is for a different action");
    }
    if (!params->IsVoter(vote.voter)) {
        return Status::InvalidArgument("signer is not a voter");
    }
    if (!vote.VerifySignature()) {
        return Status::InvalidArgument("invalid vote signature");
    }
    if (WindowExpired(*params, ctx)) {
        return Status::InvalidState("voting window has closed");
    }

    ThresholdTally state;
    if (!DecodeTally(tally, state)) {
        return Status::StorageError("undecodable tally");
    }
    if (state.HasVoted(vote.voter)) {
        return Status::DuplicateId("voter has already voted");
    }

    state.ballots.push_back({vote.voter, vote.choice});
    tally = SerializeToBytes(state);
    *outcome = Decide(*params, state);
    return Status::Ok();
}

Outcome ThresholdVoteModule::Finalize(const EvaluationContext& ctx,
                                      const std::vector<uint8_t>& tally) const {
    const org::ThresholdVoteParams* params = ctx.config.AsThresholdVote();
    if (!params) {
        return Outcome::Rejected("configuration is not threshold-vote");
    }

    ThresholdTally state;
    if (!DecodeTally(tally, state)) {
        return Outcome::Rejected("undecodable tally");
    }

    Outcome outcome = Decide(*params, state);
    if (outcome.IsPending() && WindowExpired(*params, ctx)) {
        return Outcome::Rejected("voting window expired");
    }
    return outcome;
}

bool ThresholdVoteModule::CanCancel(const GovernanceConfig& config,
                                    const PublicKey& signer) const {
    const org::ThresholdVoteParams* params = config.AsThresholdVote();
    return params && params->IsVoter(signer);
}

} // namespace governance
} // namespace polity
