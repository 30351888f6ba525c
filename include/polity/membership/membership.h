// POLITY - Citizenship and Invites
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Single-use invites admit citizens into an organization. Citizens are
// stored in the organization's data map, so they survive governance
// transitions unchanged:
//
//   citizen/<pubkey-hex>   encoded Citizen
//   citizen_index/<page>   encoded list of member keys (up to 100 per page)
//   citizen_count          total citizens
//   citizen_pages          number of index pages opened

#ifndef POLITY_MEMBERSHIP_MEMBERSHIP_H
#define POLITY_MEMBERSHIP_MEMBERSHIP_H

#include "polity/core/status.h"
#include "polity/core/types.h"
#include "polity/crypto/keys.h"
#include "polity/db/recordstore.h"
#include "polity/org/organization.h"
#include "polity/registry/registry.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace polity {
namespace membership {

using org::OrganizationId;

/// Random invite identifier
using InviteId = Hash256;

// ============================================================================
// Constants
// ============================================================================

/// Maximum citizen name length
constexpr size_t MAX_NAME_LENGTH = 32;

/// Citizens per index page
constexpr size_t MAX_CITIZENS_PER_INDEX = 100;

/// Maximum index pages per organization
constexpr uint64_t MAX_INDEX_PAGES = 1000;

/// Demographic bucket counts; valid values are [0, count)
constexpr uint8_t NUM_REGIONS = 8;
constexpr uint8_t NUM_AGE_GROUPS = 5;
constexpr uint8_t NUM_OTHER_DEMOGRAPHICS = 4;

namespace datakey {
    constexpr const char* CITIZEN = "citizen/";
    constexpr const char* CITIZEN_INDEX = "citizen_index/";
    constexpr const char* CITIZEN_COUNT = "citizen_count";
    constexpr const char* CITIZEN_PAGES = "citizen_pages";
}

// ============================================================================
// Records
// ============================================================================

struct Invite {
    InviteId id;
    OrganizationId orgId{org::NULL_ORG_ID};
    Timestamp createdAt{0};
    Timestamp expiresAt{0};
    std::optional<PublicKey> usedBy;
    Timestamp usedAt{0};

    bool IsUsed() const { return usedBy.has_value(); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, orgId);
        ::polity::Serialize(s, createdAt);
        ::polity::Serialize(s, expiresAt);
        ::polity::Serialize(s, usedBy);
        ::polity::Serialize(s, usedAt);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, orgId);
        ::polity::Unserialize(s, createdAt);
        ::polity::Unserialize(s, expiresAt);
        ::polity::Unserialize(s, usedBy);
        ::polity::Unserialize(s, usedAt);
    }
};

struct Citizen {
    PublicKey member;
    std::string name;
    uint8_t region{0};
    uint8_t ageGroup{0};
    uint8_t otherDemographic{0};
    Timestamp joinedAt{0};
    /// Index page the member was appended to
    uint64_t indexPage{0};

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, member);
        ::polity::Serialize(s, name);
        ::polity::Serialize(s, region);
        ::polity::Serialize(s, ageGroup);
        ::polity::Serialize(s, otherDemographic);
        ::polity::Serialize(s, joinedAt);
        ::polity::Serialize(s, indexPage);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, member);
        ::polity::Unserialize(s, name);
        ::polity::Unserialize(s, region);
        ::polity::Unserialize(s, ageGroup);
        ::polity::Unserialize(s, otherDemographic);
        ::polity::Unserialize(s, joinedAt);
        ::polity::Unserialize(s, indexPage);
    }
};

/// Applicant details presented with an invite
struct CitizenApplication {
    PublicKey member;
    std::string name;
    uint8_t region{0};
    uint8_t ageGroup{0};
    uint8_t otherDemographic{0};
};

// ============================================================================
// Membership Manager
// ============================================================================

class MembershipManager {
public:
    using CitizenAddedCallback = std::function<void(OrganizationId orgId, const Citizen& citizen)>;

    MembershipManager(db::RecordStore& store, registry::Registry& registry,
                      ClockFn clock = GetTime);

    MembershipManager(const MembershipManager&) = delete;
    MembershipManager& operator=(const MembershipManager&) = delete;

    Status Load();

    /// Issue an invite for an Active organization
    Status CreateInvite(OrganizationId orgId, Timestamp expiresAt, InviteId* outId);

    /**
     * Redeem an invite. Checks run in order: InvalidInvite, InviteAlreadyUsed,
     * InviteExpired, InvalidInput, InvalidDemographic, AlreadyMember,
     * IndexFull. The citizen entry, index page, count and spent invite are
     * written atomically.
     */
    Status UseInvite(OrganizationId orgId, const InviteId& inviteId,
                     const CitizenApplication& application, Citizen* out = nullptr);

    Status GetInvite(const InviteId& id, Invite* out) const;

    Status GetCitizen(OrganizationId orgId, const PublicKey& member, Citizen* out) const;

    Status CitizenCount(OrganizationId orgId, uint64_t* out) const;

    /// Member keys on one index page
    Status GetIndexPage(OrganizationId orgId, uint64_t page, std::vector<PublicKey>* out) const;

    void SetCitizenAddedCallback(CitizenAddedCallback callback);

    static std::string CitizenKey(const PublicKey& member);
    static std::string IndexPageKey(uint64_t page);

private:
    db::RecordStore& store_;
    registry::Registry& registry_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<InviteId, Invite> invites_;
    std::set<InviteId> redeeming_;   // invites with a registry write in flight
    CitizenAddedCallback callback_;
};

} // namespace membership
} // namespace polity

#endif // POLITY_MEMBERSHIP_MEMBERSHIP_H
