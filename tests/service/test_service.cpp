// POLITY - Governance Service Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>

#include "polity/service/service.h"

#include "test_helpers.h"

#include <filesystem>
#include <unistd.h>

namespace polity {
namespace service {
namespace test {

using ::polity::test::ManualClock;
using ::polity::test::TestKey;
using ::polity::test::TestPubKey;
using governance::VoteChoice;
using org::OrgStatus;
using org::WeightedVoter;

// ============================================================================
// Test Fixtures
// ============================================================================

class ServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        NodeInitOptions options;
        options.inMemory = true;
        options.logConsole = false;
        options.logLevel = util::LogLevel::Warn;
        options.clock = clock_.Fn();
        ASSERT_TRUE(InitializeNode(node_, options));
        service_ = std::make_unique<LocalGovernanceService>(node_);
    }

    void TearDown() override {
        service_.reset();
        ShutdownNode(node_);
        POLITY_LOGGER.SetLevel(util::LogLevel::Info);
    }

    OrganizationId Register(OrgKind kind, std::optional<OrganizationId> parent,
                            const GovernanceConfig& config) {
        OrganizationId id = 0;
        Status s = service_->Register(kind, parent, config, &id);
        EXPECT_TRUE(s.ok()) << s.ToString();
        return id;
    }

    ManualClock clock_;
    NodeContext node_;
    std::unique_ptr<LocalGovernanceService> service_;
};

// ============================================================================
// Node Lifecycle
// ============================================================================

TEST_F(ServiceTest, NodeIsReady) {
    EXPECT_TRUE(node_.IsReady());
    EXPECT_TRUE(FlushNodeState(node_));
    EXPECT_EQ(node_.registry->Count(), 0u);
}

TEST_F(ServiceTest, ShutdownReleasesComponents) {
    ShutdownNode(node_);
    EXPECT_FALSE(node_.IsReady());
    EXPECT_EQ(node_.registry, nullptr);
    EXPECT_EQ(node_.database, nullptr);
    EXPECT_FALSE(FlushNodeState(node_));
}

TEST(NodeOptionsTest, FromConfig) {
    util::ConfigManager config;
    config.Set(util::ConfigKeys::DATADIR, "/tmp/polity-node");
    config.Set(util::ConfigKeys::INMEMORY, "1");
    config.Set(util::ConfigKeys::DEPENDENCY_MAXDEPTH, "3");
    config.Set(util::ConfigKeys::LOG_LEVEL, "debug");
    config.Set(util::ConfigKeys::LOG_CONSOLE, "0");
    config.Set(util::ConfigKeys::DB_CACHE, "32");

    NodeInitOptions options = NodeInitOptions::FromConfig(config);
    EXPECT_EQ(options.dataDir, std::filesystem::path("/tmp/polity-node"));
    EXPECT_TRUE(options.inMemory);
    EXPECT_EQ(options.maxDependencyDepth, 3u);
    EXPECT_EQ(options.logLevel, util::LogLevel::Debug);
    EXPECT_FALSE(options.logConsole);
    EXPECT_EQ(options.dbCacheMB, 32);
    EXPECT_FALSE(options.dbSync);
}

TEST(NodeOptionsTest, NonPositiveDepthFallsBack) {
    util::ConfigManager config;
    config.Set(util::ConfigKeys::DEPENDENCY_MAXDEPTH, "0");
    EXPECT_EQ(NodeInitOptions::FromConfig(config).maxDependencyDepth, authz::DEFAULT_MAX_DEPTH);
}

// ============================================================================
// Registry Operations
// ============================================================================

TEST_F(ServiceTest, RegisterLookupAndDependents) {
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::DirectSigner(TestPubKey(1)));
    OrganizationId s1 = Register(OrgKind::SAO, p, GovernanceConfig::Delegated());
    OrganizationId s2 = Register(OrgKind::SAO, s1, GovernanceConfig::Delegated());

    OrganizationRecord record;
    ASSERT_TRUE(service_->Lookup(s2, &record).ok());
    EXPECT_EQ(record.kind, OrgKind::SAO);
    ASSERT_TRUE(record.parent.has_value());
    EXPECT_EQ(*record.parent, s1);

    std::set<OrganizationId> dependents;
    ASSERT_TRUE(service_->ListDependents(p, &dependents).ok());
    EXPECT_EQ(dependents, (std::set<OrganizationId>{s1, s2}));

    EXPECT_TRUE(service_->Lookup(9999, &record).IsNotFound());
}

TEST_F(ServiceTest, RegisterWithLabel) {
    OrganizationId id = 0;
    ASSERT_TRUE(service_->Register(OrgKind::PAO, std::nullopt,
                                   GovernanceConfig::DirectSigner(TestPubKey(1)), &id,
                                   "assembly").ok());
    OrganizationRecord record;
    ASSERT_TRUE(service_->Lookup(id, &record).ok());
    EXPECT_EQ(record.label, "assembly");
}

// ============================================================================
// Actions
// ============================================================================

TEST_F(ServiceTest, SubmitDirectAction) {
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::DirectSigner(TestPubKey(1)));
    Action action = Action::Custom(p, "charter", {0x01});
    ActionId id;
    ASSERT_TRUE(service_->SubmitAction(p, action, Proof::Sign(action.GetHash(), {TestKey(1)}),
                                       &id).ok());
    EXPECT_TRUE(id == action.GetHash());

    ActionState state;
    ASSERT_TRUE(service_->ActionStatus(id, &state).ok());
    EXPECT_EQ(state, ActionState::Approved);
}

TEST_F(ServiceTest, MigrateActionsRejected) {
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::DirectSigner(TestPubKey(1)));
    Action action = Action::Migrate(p, GovernanceConfig::DirectSigner(TestPubKey(2)), 0);
    ActionId id;
    EXPECT_TRUE(service_->SubmitAction(p, action, Proof::Sign(action.GetHash(), {TestKey(1)}),
                                       &id).IsInvalidArgument());
    EXPECT_EQ(node_.tracker->Count(), 0u);
}

TEST_F(ServiceTest, VoteThroughService) {
    std::vector<WeightedVoter> voters = {{TestPubKey(10), 1}, {TestPubKey(11), 1},
                                         {TestPubKey(12), 1}};
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::ThresholdVote(voters, 2));
    Action action = Action::Custom(p, "budget");
    ActionId id;
    ASSERT_TRUE(service_->SubmitAction(p, action, Proof(), &id).ok());

    ActionState state;
    ASSERT_TRUE(service_->CastVote(Vote::Create(id, TestKey(10), VoteChoice::Yes), &state).ok());
    EXPECT_EQ(state, ActionState::Pending);
    ASSERT_TRUE(service_->FinalizeAction(id, &state).ok());
    EXPECT_EQ(state, ActionState::Pending);
    ASSERT_TRUE(service_->CastVote(Vote::Create(id, TestKey(11), VoteChoice::Yes), &state).ok());
    EXPECT_EQ(state, ActionState::Approved);
}

TEST_F(ServiceTest, CancelThroughService) {
    std::vector<WeightedVoter> voters = {{TestPubKey(10), 1}, {TestPubKey(11), 1}};
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::ThresholdVote(voters, 2));
    ActionId id;
    ASSERT_TRUE(service_->SubmitAction(p, Action::Custom(p, "budget"), Proof(), &id).ok());
    ASSERT_TRUE(service_->CancelAction(id, Proof::Sign(governance::GetCancelHash(id),
                                                       {TestKey(11)})).ok());

    ActionState state;
    ASSERT_TRUE(service_->ActionStatus(id, &state).ok());
    EXPECT_EQ(state, ActionState::Rejected);
}

// ============================================================================
// Transitions
// ============================================================================

TEST_F(ServiceTest, TransitionLifecycle) {
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::DirectSigner(TestPubKey(1)));
    GovernanceConfig next = GovernanceConfig::DirectSigner(TestPubKey(2));
    Proof proof = Proof::Sign(
        transition::TransitionEngine::MakeMigrationAction(p, next, 0).GetHash(), {TestKey(1)});

    TransitionHandle handle;
    ASSERT_TRUE(service_->BeginTransition(p, next, proof, &handle).ok());
    EXPECT_EQ(handle.state, transition::TransitionState::Staged);

    OrganizationRecord record;
    ASSERT_TRUE(service_->Lookup(p, &record).ok());
    EXPECT_EQ(record.status, OrgStatus::Migrating);

    ASSERT_TRUE(service_->CommitTransition(handle).ok());
    ASSERT_TRUE(service_->Lookup(p, &record).ok());
    EXPECT_EQ(record.status, OrgStatus::Active);
    EXPECT_EQ(record.version, 1u);
    EXPECT_EQ(record.governance, next);
}

TEST_F(ServiceTest, AbortTransition) {
    OrganizationId p = Register(OrgKind::PAO, std::nullopt,
                                GovernanceConfig::DirectSigner(TestPubKey(1)));
    GovernanceConfig next = GovernanceConfig::DirectSigner(TestPubKey(2));
    Proof proof = Proof::Sign(
        transition::TransitionEngine::MakeMigrationAction(p, next, 0, 7).GetHash(), {TestKey(1)});

    TransitionHandle handle;
    ASSERT_TRUE(service_->BeginTransition(p, next, proof, &handle, 7).ok());
    ASSERT_TRUE(service_->AbortTransition(handle, "operator abort").ok());

    OrganizationRecord record;
    ASSERT_TRUE(service_->Lookup(p, &record).ok());
    EXPECT_EQ(record.status, OrgStatus::Active);
    EXPECT_EQ(record.governance, GovernanceConfig::DirectSigner(TestPubKey(1)));
    EXPECT_TRUE(service_->CommitTransition(handle).IsInvalidState());
}

// ============================================================================
// Persistent Node
// ============================================================================

class PersistentNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("polity_node_test_" + std::to_string(::getpid()));
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
        POLITY_LOGGER.SetLevel(util::LogLevel::Info);
    }

    NodeInitOptions Options() {
        NodeInitOptions options;
        options.dataDir = dir_;
        options.logConsole = false;
        options.logLevel = util::LogLevel::Warn;
        options.clock = clock_.Fn();
        return options;
    }

    ManualClock clock_;
    std::filesystem::path dir_;
};

TEST_F(PersistentNodeTest, StateSurvivesRestart) {
    OrganizationId p = 0;
    OrganizationId s = 0;
    {
        NodeContext node;
        ASSERT_TRUE(InitializeNode(node, Options()));
        LocalGovernanceService svc(node);
        ASSERT_TRUE(svc.Register(OrgKind::PAO, std::nullopt,
                                 GovernanceConfig::DirectSigner(TestPubKey(1)), &p).ok());
        ASSERT_TRUE(svc.Register(OrgKind::SAO, p, GovernanceConfig::Delegated(), &s).ok());
        ShutdownNode(node);
    }
    EXPECT_TRUE(std::filesystem::exists(dir_ / "state"));

    NodeContext node;
    ASSERT_TRUE(InitializeNode(node, Options()));
    LocalGovernanceService svc(node);
    OrganizationRecord record;
    ASSERT_TRUE(svc.Lookup(s, &record).ok());
    ASSERT_TRUE(record.parent.has_value());
    EXPECT_EQ(*record.parent, p);

    // Fresh ids continue past the persisted ones
    OrganizationId next = 0;
    ASSERT_TRUE(svc.Register(OrgKind::PAO, std::nullopt,
                             GovernanceConfig::DirectSigner(TestPubKey(2)), &next).ok());
    EXPECT_NE(next, p);
    EXPECT_NE(next, s);
}

} // namespace test
} // namespace service
} // namespace polity
