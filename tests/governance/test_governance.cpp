// POLITY - Governance Module Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>

#include "polity/governance/module.h"
#include "polity/governance/threshold_vote.h"

#include "test_helpers.h"

namespace polity {
namespace governance {
namespace test {

using ::polity::test::TestKey;
using ::polity::test::TestPubKey;
using org::WeightedVoter;

// ============================================================================
// Test Fixtures
// ============================================================================

class GovernanceTest : public ::testing::Test {
protected:
    void SetUp() override {
        action_ = Action::Custom(1, "spend", {0xAA}, 0);
        actionId_ = action_.GetHash();
    }

    EvaluationContext Context(const GovernanceConfig& config, Timestamp now = 1000) const {
        return EvaluationContext{config, 1, actionId_, 1000, now};
    }

    static GovernanceConfig Weighted(uint64_t threshold, int64_t window = 0) {
        // voters 0..3 with weights 1, 1, 2, 3
        std::vector<WeightedVoter> voters = {
            {TestPubKey(0), 1}, {TestPubKey(1), 1}, {TestPubKey(2), 2}, {TestPubKey(3), 3}};
        return GovernanceConfig::ThresholdVote(voters, threshold, window);
    }

    Action action_;
    ActionId actionId_;
};

// ============================================================================
// Action
// ============================================================================

TEST_F(GovernanceTest, ActionHashCoversEveryField) {
    Action other = action_;
    other.nonce = 1;
    EXPECT_NE(other.GetHash(), actionId_);

    other = action_;
    other.payload.push_back(0x00);
    EXPECT_NE(other.GetHash(), actionId_);

    other = action_;
    other.orgId = 2;
    EXPECT_NE(other.GetHash(), actionId_);

    EXPECT_EQ(Action::Custom(1, "spend", {0xAA}, 0).GetHash(), actionId_);
}

TEST_F(GovernanceTest, MigrationRequestDecodes) {
    GovernanceConfig target = GovernanceConfig::DirectSigner(TestPubKey(9));
    Action migrate = Action::Migrate(4, target, 5, 3);
    EXPECT_EQ(migrate.kind, ActionKind::Migrate);
    EXPECT_EQ(migrate.nonce, 3u);

    auto decoded = migrate.GetMigrationRequest();
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->newConfig, target);
    EXPECT_EQ(decoded->baseVersion, 5u);
    EXPECT_FALSE(action_.GetMigrationRequest().has_value());
}

TEST_F(GovernanceTest, MigrationIdDependsOnBaseVersion) {
    GovernanceConfig target = GovernanceConfig::DirectSigner(TestPubKey(9));
    EXPECT_EQ(Action::Migrate(4, target, 0).GetHash(), Action::Migrate(4, target, 0).GetHash());
    EXPECT_NE(Action::Migrate(4, target, 0).GetHash(), Action::Migrate(4, target, 2).GetHash());
}

TEST_F(GovernanceTest, CancelHashIsDomainSeparated) {
    EXPECT_NE(GetCancelHash(actionId_), actionId_);
}

// ============================================================================
// Proof
// ============================================================================

TEST_F(GovernanceTest, ValidSignersDeduplicatesAndVerifies) {
    Proof proof = Proof::Sign(actionId_, {TestKey(1), TestKey(1), TestKey(2)});
    proof.signatures.push_back({TestPubKey(3), {0x30, 0x00}});

    auto signers = proof.ValidSigners(actionId_);
    ASSERT_EQ(signers.size(), 2u);
    EXPECT_EQ(signers[0], TestPubKey(1));
    EXPECT_EQ(signers[1], TestPubKey(2));

    EXPECT_TRUE(proof.ValidSigners(GetCancelHash(actionId_)).empty());
}

// ============================================================================
// Direct Signer
// ============================================================================

TEST_F(GovernanceTest, DirectSignerApprovesAuthoritySignature) {
    GovernanceConfig config = GovernanceConfig::DirectSigner(TestPubKey(5));
    const GovernanceModule& module = GetModule(GovernanceType::DirectSigner);
    std::vector<uint8_t> tally;

    Outcome ok = module.Evaluate(Context(config), action_,
                                 Proof::Sign(actionId_, {TestKey(5)}), tally);
    EXPECT_TRUE(ok.IsApproved()) << ok.reason;

    Outcome wrongKey = module.Evaluate(Context(config), action_,
                                       Proof::Sign(actionId_, {TestKey(6)}), tally);
    EXPECT_TRUE(wrongKey.IsRejected());

    Outcome empty = module.Evaluate(Context(config), action_, Proof(), tally);
    EXPECT_TRUE(empty.IsRejected());
}

TEST_F(GovernanceTest, DirectSignerRejectsSignatureOverOtherAction) {
    GovernanceConfig config = GovernanceConfig::DirectSigner(TestPubKey(5));
    std::vector<uint8_t> tally;
    Proof proof = Proof::Sign(Action::Custom(1, "other").GetHash(), {TestKey(5)});
    EXPECT_TRUE(GetModule(GovernanceType::DirectSigner)
                    .Evaluate(Context(config), action_, proof, tally).IsRejected());
}

TEST_F(GovernanceTest, DirectSignerTakesNoVotes) {
    GovernanceConfig config = GovernanceConfig::DirectSigner(TestPubKey(5));
    std::vector<uint8_t> tally;
    Outcome outcome;
    Status s = GetModule(GovernanceType::DirectSigner)
                   .ApplyVote(Context(config), Vote::Create(actionId_, TestKey(5), VoteChoice::Yes),
                              tally, &outcome);
    EXPECT_TRUE(s.IsInvalidState());
}

// ============================================================================
// Delegated
// ============================================================================

TEST_F(GovernanceTest, DelegatedDefers) {
    GovernanceConfig config = GovernanceConfig::Delegated();
    std::vector<uint8_t> tally;
    Outcome outcome = GetModule(GovernanceType::Delegated)
                          .Evaluate(Context(config), action_, Proof(), tally);
    EXPECT_EQ(outcome.decision, Decision::Defer);
    EXPECT_FALSE(outcome.IsFinal());
}

// ============================================================================
// Threshold Vote
// ============================================================================

TEST_F(GovernanceTest, ThresholdCountsProofSignaturesAsYes) {
    GovernanceConfig config = Weighted(3);
    const GovernanceModule& module = GetModule(GovernanceType::ThresholdVote);
    std::vector<uint8_t> tally;

    Outcome outcome = module.Evaluate(Context(config), action_,
                                      Proof::Sign(actionId_, {TestKey(0), TestKey(2)}), tally);
    EXPECT_TRUE(outcome.IsApproved()) << outcome.reason;

    outcome = module.Evaluate(Context(config), action_,
                              Proof::Sign(actionId_, {TestKey(0), TestKey(9)}), tally);
    EXPECT_TRUE(outcome.IsPending());

    ThresholdTally decoded;
    ASSERT_TRUE(ThresholdVoteModule::DecodeTally(tally, decoded));
    ASSERT_EQ(decoded.ballots.size(), 1u);
    EXPECT_EQ(decoded.ballots[0].voter, TestPubKey(0));
}

TEST_F(GovernanceTest, ThresholdVotesAccumulate) {
    GovernanceConfig config = Weighted(4);
    const GovernanceModule& module = GetModule(GovernanceType::ThresholdVote);
    std::vector<uint8_t> tally;
    ASSERT_TRUE(module.Evaluate(Context(config), action_, Proof(), tally).IsPending());

    Outcome outcome;
    ASSERT_TRUE(module.ApplyVote(Context(config),
                                 Vote::Create(actionId_, TestKey(3), VoteChoice::Yes),
                                 tally, &outcome).ok());
    EXPECT_TRUE(outcome.IsPending());

    ASSERT_TRUE(module.ApplyVote(Context(config),
                                 Vote::Create(actionId_, TestKey(1), VoteChoice::Yes),
                                 tally, &outcome).ok());
    EXPECT_TRUE(outcome.IsApproved());
}

TEST_F(GovernanceTest, ThresholdRejectsOnceUnreachable) {
    // total 7, threshold 5: No from weight 3 leaves 4
    GovernanceConfig config = Weighted(5);
    const GovernanceModule& module = GetModule(GovernanceType::ThresholdVote);
    std::vector<uint8_t> tally;
    module.Evaluate(Context(config), action_, Proof(), tally);

    Outcome outcome;
    ASSERT_TRUE(module.ApplyVote(Context(config),
                                 Vote::Create(actionId_, TestKey(3), VoteChoice::No),
                                 tally, &outcome).ok());
    EXPECT_TRUE(outcome.IsRejected());
}

TEST_F(GovernanceTest, ThresholdVoteValidation) {
    GovernanceConfig config = Weighted(7);
    const GovernanceModule& module = GetModule(GovernanceType::ThresholdVote);
    std::vector<uint8_t> tally;
    module.Evaluate(Context(config), action_, Proof(), tally);
    Outcome outcome;

    EXPECT_TRUE(module.ApplyVote(Context(config),
                                 Vote::Create(actionId_, TestKey(8), VoteChoice::Yes),
                                 tally, &outcome).IsInvalidArgument());

    Vote forged = Vote::Create(actionId_, TestKey(1), VoteChoice::Yes);
    forged.choice = VoteChoice::No;
    EXPECT_TRUE(module.ApplyVote(Context(config), forged, tally, &outcome).IsInvalidArgument());

    Vote elsewhere = Vote::Create(GetCancelHash(actionId_), TestKey(1), VoteChoice::Yes);
    EXPECT_TRUE(module.ApplyVote(Context(config), elsewhere, tally, &outcome).IsInvalidArgument());

    ASSERT_TRUE(module.ApplyVote(Context(config),
                                 Vote::Create(actionId_, TestKey(1), VoteChoice::Yes),
                                 tally, &outcome).ok());
    EXPECT_TRUE(module.ApplyVote(Context(config),
                                 Vote::Create(actionId_, TestKey(1), VoteChoice::No),
                                 tally, &outcome).IsDuplicateId());
}

TEST_F(GovernanceTest, ThresholdWindowCloses) {
    GovernanceConfig config = Weighted(3, 60);
    const GovernanceModule& module = GetModule(GovernanceType::ThresholdVote);
    std::vector<uint8_t> tally;
    module.Evaluate(Context(config), action_, Proof(), tally);

    EXPECT_TRUE(module.Finalize(Context(config, 1059), tally).IsPending());
    EXPECT_TRUE(module.Finalize(Context(config, 1060), tally).IsRejected());

    Outcome outcome;
    EXPECT_TRUE(module.ApplyVote(Context(config, 1060),
                                 Vote::Create(actionId_, TestKey(3), VoteChoice::Yes),
                                 tally, &outcome).IsInvalidState());
}

TEST_F(GovernanceTest, CancelRights) {
    EXPECT_TRUE(GetModule(GovernanceType::ThresholdVote).CanCancel(Weighted(3), TestPubKey(0)));
    EXPECT_FALSE(GetModule(GovernanceType::ThresholdVote).CanCancel(Weighted(3), TestPubKey(8)));
    EXPECT_FALSE(GetModule(GovernanceType::DirectSigner)
                     .CanCancel(GovernanceConfig::DirectSigner(TestPubKey(5)), TestPubKey(5)));
}

} // namespace test
} // namespace governance
} // namespace polity
