// POLITY - Membership Tests
// Copyright (c) 2024 POLITY Developers
// MIT License

#include <gtest/gtest.h>

#include "polity/membership/membership.h"

#include "test_helpers.h"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace polity {
namespace membership {
namespace test {

using ::polity::test::ManualClock;
using ::polity::test::MemoryStore;
using ::polity::test::TestPubKey;
using org::GovernanceConfig;
using org::OrgKind;

// ============================================================================
// Test Fixtures
// ============================================================================

class MembershipTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<registry::Registry>(mem_.store, clock_.Fn());
        ASSERT_TRUE(registry_->Load().ok());
        members_ = std::make_unique<MembershipManager>(mem_.store, *registry_, clock_.Fn());
        ASSERT_TRUE(members_->Load().ok());

        Status s = registry_->Register(OrgKind::PAO, std::nullopt,
                                       GovernanceConfig::DirectSigner(TestPubKey(200)), &org_);
        ASSERT_TRUE(s.ok()) << s.ToString();
    }

    InviteId NewInvite(int64_t ttl = 3600) {
        InviteId id;
        Status s = members_->CreateInvite(org_, clock_.Now() + ttl, &id);
        EXPECT_TRUE(s.ok()) << s.ToString();
        return id;
    }

    static CitizenApplication Applicant(uint8_t seed, const std::string& name = "alice") {
        CitizenApplication app;
        app.member = TestPubKey(seed);
        app.name = name;
        app.region = 3;
        app.ageGroup = 2;
        app.otherDemographic = 1;
        return app;
    }

    ManualClock clock_;
    MemoryStore mem_;
    std::unique_ptr<registry::Registry> registry_;
    std::unique_ptr<MembershipManager> members_;
    OrganizationId org_{org::NULL_ORG_ID};
};

// ============================================================================
// Invites
// ============================================================================

TEST_F(MembershipTest, CreateInvite) {
    InviteId id = NewInvite(60);

    Invite invite;
    ASSERT_TRUE(members_->GetInvite(id, &invite).ok());
    EXPECT_EQ(invite.orgId, org_);
    EXPECT_EQ(invite.createdAt, clock_.Now());
    EXPECT_EQ(invite.expiresAt, clock_.Now() + 60);
    EXPECT_FALSE(invite.IsUsed());
}

TEST_F(MembershipTest, InvitesAreDistinct) {
    EXPECT_NE(NewInvite(), NewInvite());
}

TEST_F(MembershipTest, CreateInviteErrors) {
    InviteId id;
    EXPECT_TRUE(members_->CreateInvite(9999, clock_.Now() + 10, &id).IsNotFound());
    EXPECT_TRUE(members_->CreateInvite(org_, clock_.Now(), &id).IsInvalidArgument());

    ASSERT_TRUE(registry_->Freeze(org_).ok());
    EXPECT_TRUE(members_->CreateInvite(org_, clock_.Now() + 10, &id).IsInvalidState());
}

TEST_F(MembershipTest, GetUnknownInvite) {
    EXPECT_TRUE(members_->GetInvite(Hash256(), nullptr).IsNotFound());
}

// ============================================================================
// UseInvite
// ============================================================================

TEST_F(MembershipTest, UseInviteAdmitsCitizen) {
    InviteId id = NewInvite();
    clock_.Advance(5);

    Citizen citizen;
    Status s = members_->UseInvite(org_, id, Applicant(1), &citizen);
    ASSERT_TRUE(s.ok()) << s.ToString();
    EXPECT_EQ(citizen.member, TestPubKey(1));
    EXPECT_EQ(citizen.joinedAt, clock_.Now());
    EXPECT_EQ(citizen.indexPage, 0u);

    Citizen stored;
    ASSERT_TRUE(members_->GetCitizen(org_, TestPubKey(1), &stored).ok());
    EXPECT_EQ(stored.name, "alice");
    EXPECT_EQ(stored.region, 3);
    EXPECT_EQ(stored.ageGroup, 2);
    EXPECT_EQ(stored.otherDemographic, 1);

    Invite invite;
    ASSERT_TRUE(members_->GetInvite(id, &invite).ok());
    ASSERT_TRUE(invite.IsUsed());
    EXPECT_EQ(*invite.usedBy, TestPubKey(1));
    EXPECT_EQ(invite.usedAt, clock_.Now());

    uint64_t count = 0;
    ASSERT_TRUE(members_->CitizenCount(org_, &count).ok());
    EXPECT_EQ(count, 1u);
}

TEST_F(MembershipTest, InviteFromOtherOrganization) {
    OrganizationId other = 0;
    ASSERT_TRUE(registry_->Register(OrgKind::PAO, std::nullopt,
                                    GovernanceConfig::DirectSigner(TestPubKey(201)), &other)
                    .ok());
    InviteId id = NewInvite();

    EXPECT_EQ(members_->UseInvite(other, id, Applicant(1)).code(), Status::INVALID_INVITE);
    EXPECT_EQ(members_->UseInvite(org_, Hash256(), Applicant(1)).code(),
              Status::INVALID_INVITE);
}

TEST_F(MembershipTest, InviteSingleUse) {
    InviteId id = NewInvite();
    ASSERT_TRUE(members_->UseInvite(org_, id, Applicant(1)).ok());
    EXPECT_EQ(members_->UseInvite(org_, id, Applicant(2)).code(),
              Status::INVITE_ALREADY_USED);

    Status s = members_->GetCitizen(org_, TestPubKey(2), nullptr);
    EXPECT_TRUE(s.IsNotFound());
}

TEST_F(MembershipTest, InviteExpiry) {
    InviteId id = NewInvite(100);

    // Usable up to and including the expiry second
    clock_.Advance(100);
    ASSERT_TRUE(members_->UseInvite(org_, id, Applicant(1)).ok());

    InviteId late = NewInvite(100);
    clock_.Advance(101);
    EXPECT_EQ(members_->UseInvite(org_, late, Applicant(2)).code(), Status::INVITE_EXPIRED);

    Invite invite;
    ASSERT_TRUE(members_->GetInvite(late, &invite).ok());
    EXPECT_FALSE(invite.IsUsed());
}

TEST_F(MembershipTest, NameLength) {
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), Applicant(1, "")).code(),
              Status::INVALID_INPUT);
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), Applicant(1, std::string(33, 'x'))).code(),
              Status::INVALID_INPUT);
    EXPECT_TRUE(members_->UseInvite(org_, NewInvite(), Applicant(1, std::string(32, 'x'))).ok());
}

TEST_F(MembershipTest, DemographicRanges) {
    CitizenApplication app = Applicant(1);
    app.region = NUM_REGIONS;
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), app).code(), Status::INVALID_DEMOGRAPHIC);

    app = Applicant(1);
    app.ageGroup = NUM_AGE_GROUPS;
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), app).code(), Status::INVALID_DEMOGRAPHIC);

    app = Applicant(1);
    app.otherDemographic = NUM_OTHER_DEMOGRAPHICS;
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), app).code(), Status::INVALID_DEMOGRAPHIC);

    app = Applicant(1);
    app.region = NUM_REGIONS - 1;
    app.ageGroup = NUM_AGE_GROUPS - 1;
    app.otherDemographic = NUM_OTHER_DEMOGRAPHICS - 1;
    EXPECT_TRUE(members_->UseInvite(org_, NewInvite(), app).ok());
}

TEST_F(MembershipTest, InvalidMemberKey) {
    CitizenApplication app = Applicant(1);
    app.member = PublicKey();
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), app).code(), Status::INVALID_INPUT);
}

TEST_F(MembershipTest, ChecksRunInOrder) {
    // An expired invite with a bad name reports the expiry first
    InviteId id = NewInvite(10);
    clock_.Advance(11);
    CitizenApplication app = Applicant(1, "");
    app.region = 200;
    EXPECT_EQ(members_->UseInvite(org_, id, app).code(), Status::INVITE_EXPIRED);

    // A bad name is reported before a bad demographic
    EXPECT_EQ(members_->UseInvite(org_, NewInvite(), app).code(), Status::INVALID_INPUT);
}

TEST_F(MembershipTest, AlreadyMember) {
    ASSERT_TRUE(members_->UseInvite(org_, NewInvite(), Applicant(1)).ok());

    InviteId second = NewInvite();
    EXPECT_EQ(members_->UseInvite(org_, second, Applicant(1, "again")).code(),
              Status::ALREADY_MEMBER);

    // The failed attempt leaves the invite unspent
    Invite invite;
    ASSERT_TRUE(members_->GetInvite(second, &invite).ok());
    EXPECT_FALSE(invite.IsUsed());

    uint64_t count = 0;
    ASSERT_TRUE(members_->CitizenCount(org_, &count).ok());
    EXPECT_EQ(count, 1u);
}

TEST_F(MembershipTest, SameKeyInTwoOrganizations) {
    OrganizationId other = 0;
    ASSERT_TRUE(registry_->Register(OrgKind::SAO, org_, GovernanceConfig::Delegated(), &other)
                    .ok());
    ASSERT_TRUE(members_->UseInvite(org_, NewInvite(), Applicant(1)).ok());

    InviteId id;
    ASSERT_TRUE(members_->CreateInvite(other, clock_.Now() + 60, &id).ok());
    EXPECT_TRUE(members_->UseInvite(other, id, Applicant(1)).ok());
}

TEST_F(MembershipTest, MigratingOrganization) {
    InviteId id = NewInvite();
    ASSERT_TRUE(registry_->BeginMigration(org_, 0).ok());

    EXPECT_TRUE(members_->UseInvite(org_, id, Applicant(1)).IsTransitionInProgress());
    InviteId other;
    EXPECT_TRUE(members_->CreateInvite(org_, clock_.Now() + 60, &other)
                    .IsTransitionInProgress());

    ASSERT_TRUE(registry_->CancelMigration(org_).ok());
    EXPECT_TRUE(members_->UseInvite(org_, id, Applicant(1)).ok());
}

TEST_F(MembershipTest, BlockedRedemptionDoesNotStallOtherOrganizations) {
    OrganizationId other = 0;
    ASSERT_TRUE(registry_->Register(OrgKind::PAO, std::nullopt,
                                    GovernanceConfig::DirectSigner(TestPubKey(201)), &other)
                    .ok());
    InviteId blocked = NewInvite();
    InviteId elsewhere;
    ASSERT_TRUE(members_->CreateInvite(other, clock_.Now() + 60, &elsewhere).ok());

    // holder keeps org_'s record locked so the first redemption waits in the registry
    std::promise<void> locked;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::thread holder([&]() {
        Status s = registry_->UpdateData(org_, [&](org::DataMap&) {
            locked.set_value();
            released.wait();
            return Status::Ok();
        });
        EXPECT_TRUE(s.ok()) << s.ToString();
    });
    locked.get_future().wait();

    std::future<Status> first = std::async(std::launch::async, [&]() {
        return members_->UseInvite(org_, blocked, Applicant(1));
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));

    EXPECT_TRUE(members_->UseInvite(other, elsewhere, Applicant(2)).ok());
    EXPECT_EQ(members_->UseInvite(org_, blocked, Applicant(3)).code(),
              Status::INVITE_ALREADY_USED);
    EXPECT_EQ(first.wait_for(std::chrono::milliseconds(0)), std::future_status::timeout);

    release.set_value();
    holder.join();
    Status s = first.get();
    EXPECT_TRUE(s.ok()) << s.ToString();

    Invite invite;
    ASSERT_TRUE(members_->GetInvite(blocked, &invite).ok());
    EXPECT_TRUE(invite.IsUsed());
    EXPECT_TRUE(invite.usedBy == TestPubKey(1));
}

TEST_F(MembershipTest, ConcurrentRedemptionsOfOneInvite) {
    InviteId id = NewInvite();

    std::atomic<int> admitted{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (uint8_t i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            Status s = members_->UseInvite(org_, id, Applicant(static_cast<uint8_t>(10 + i)));
            if (s.ok()) {
                ++admitted;
            } else if (s.code() == Status::INVITE_ALREADY_USED) {
                ++refused;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(admitted.load(), 1);
    EXPECT_EQ(refused.load(), 7);
    uint64_t count = 0;
    ASSERT_TRUE(members_->CitizenCount(org_, &count).ok());
    EXPECT_EQ(count, 1u);
}

TEST_F(MembershipTest, FailedRedemptionReleasesInvite) {
    InviteId first = NewInvite();
    ASSERT_TRUE(members_->UseInvite(org_, first, Applicant(1)).ok());

    InviteId second = NewInvite();
    EXPECT_EQ(members_->UseInvite(org_, second, Applicant(1)).code(), Status::ALREADY_MEMBER);
    EXPECT_TRUE(members_->UseInvite(org_, second, Applicant(2)).ok());
}

// ============================================================================
// Index Pages
// ============================================================================

TEST_F(MembershipTest, IndexPageRollover) {
    for (size_t i = 0; i <= MAX_CITIZENS_PER_INDEX; ++i) {
        Status s = members_->UseInvite(org_, NewInvite(),
                                       Applicant(static_cast<uint8_t>(i), "m" + std::to_string(i)));
        ASSERT_TRUE(s.ok()) << i << ": " << s.ToString();
    }

    std::vector<PublicKey> page0;
    std::vector<PublicKey> page1;
    ASSERT_TRUE(members_->GetIndexPage(org_, 0, &page0).ok());
    ASSERT_TRUE(members_->GetIndexPage(org_, 1, &page1).ok());
    EXPECT_EQ(page0.size(), MAX_CITIZENS_PER_INDEX);
    ASSERT_EQ(page1.size(), 1u);
    EXPECT_EQ(page0.front(), TestPubKey(0));
    EXPECT_EQ(page1.front(), TestPubKey(static_cast<uint8_t>(MAX_CITIZENS_PER_INDEX)));
    EXPECT_TRUE(members_->GetIndexPage(org_, 2, nullptr).IsNotFound());

    Citizen last;
    ASSERT_TRUE(members_->GetCitizen(org_, page1.front(), &last).ok());
    EXPECT_EQ(last.indexPage, 1u);

    uint64_t count = 0;
    ASSERT_TRUE(members_->CitizenCount(org_, &count).ok());
    EXPECT_EQ(count, MAX_CITIZENS_PER_INDEX + 1);
}

TEST_F(MembershipTest, IndexFull) {
    // Seed the counters as if every page were already filled
    std::vector<PublicKey> full(MAX_CITIZENS_PER_INDEX, TestPubKey(150));
    ASSERT_TRUE(registry_->PutData(org_, MembershipManager::IndexPageKey(MAX_INDEX_PAGES - 1),
                                   SerializeToBytes(full)).ok());
    ASSERT_TRUE(registry_->PutData(org_, datakey::CITIZEN_PAGES,
                                   SerializeToBytes(MAX_INDEX_PAGES)).ok());

    InviteId id = NewInvite();
    EXPECT_EQ(members_->UseInvite(org_, id, Applicant(1)).code(), Status::INDEX_FULL);

    Invite invite;
    ASSERT_TRUE(members_->GetInvite(id, &invite).ok());
    EXPECT_FALSE(invite.IsUsed());
    EXPECT_TRUE(members_->GetCitizen(org_, TestPubKey(1), nullptr).IsNotFound());
}

TEST_F(MembershipTest, CountForEmptyAndUnknownOrganization) {
    uint64_t count = 42;
    ASSERT_TRUE(members_->CitizenCount(org_, &count).ok());
    EXPECT_EQ(count, 0u);
    EXPECT_TRUE(members_->CitizenCount(9999, &count).IsNotFound());
}

// ============================================================================
// Callbacks and Persistence
// ============================================================================

TEST_F(MembershipTest, CitizenAddedCallback) {
    std::vector<std::pair<OrganizationId, std::string>> seen;
    members_->SetCitizenAddedCallback([&](OrganizationId orgId, const Citizen& citizen) {
        seen.emplace_back(orgId, citizen.name);
    });

    ASSERT_TRUE(members_->UseInvite(org_, NewInvite(), Applicant(1, "bob")).ok());
    EXPECT_NE(members_->UseInvite(org_, NewInvite(), Applicant(1, "bob")).code(), Status::OK);

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].first, org_);
    EXPECT_EQ(seen[0].second, "bob");
}

TEST_F(MembershipTest, ReloadRestoresInvitesAndCitizens) {
    InviteId used = NewInvite();
    InviteId open = NewInvite();
    ASSERT_TRUE(members_->UseInvite(org_, used, Applicant(1)).ok());

    registry::Registry registry(mem_.store, clock_.Fn());
    ASSERT_TRUE(registry.Load().ok());
    MembershipManager reloaded(mem_.store, registry, clock_.Fn());
    ASSERT_TRUE(reloaded.Load().ok());

    Invite invite;
    ASSERT_TRUE(reloaded.GetInvite(used, &invite).ok());
    EXPECT_TRUE(invite.IsUsed());
    ASSERT_TRUE(reloaded.GetInvite(open, &invite).ok());
    EXPECT_FALSE(invite.IsUsed());

    Citizen citizen;
    ASSERT_TRUE(reloaded.GetCitizen(org_, TestPubKey(1), &citizen).ok());
    EXPECT_EQ(citizen.name, "alice");

    EXPECT_EQ(reloaded.UseInvite(org_, used, Applicant(2)).code(), Status::INVITE_ALREADY_USED);
    EXPECT_TRUE(reloaded.UseInvite(org_, open, Applicant(2)).ok());
}

} // namespace test
} // namespace membership
} // namespace polity
