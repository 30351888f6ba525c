// POLITY - Citizenship and Invites Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/membership/membership.h"
#include "polity/core/random.h"
#include "polity/util/logging.h"

#include <sstream>

namespace polity {
namespace membership {

namespace {

std::string InviteKey(const InviteId& id) {
    return db::MakeKey(db::prefix::INVITE, id);
}

/// Decode a counter stored in the data map; absent means zero
bool ReadCounter(const org::DataMap& data, const std::string& key, uint64_t& out) {
    auto it = data.find(key);
    if (it == data.end()) {
        out = 0;
        return true;
    }
    return DeserializeFromBytes(it->second.data(), it->second.size(), out);
}

} // namespace

std::string Citizen::ToString() const {
    std::ostringstream oss;
    oss << "Citizen(" << name
        << ", key=" << member.ToHex().substr(0, 16)
        << ", region=" << static_cast<int>(region)
        << ", age=" << static_cast<int>(ageGroup)
        << ", other=" << static_cast<int>(otherDemographic)
        << ", page=" << indexPage << ")";
    return oss.str();
}

std::string MembershipManager::CitizenKey(const PublicKey& member) {
    return std::string(datakey::CITIZEN) + member.ToHex();
}

std::string MembershipManager::IndexPageKey(uint64_t page) {
    return std::string(datakey::CITIZEN_INDEX) + std::to_string(page);
}

MembershipManager::MembershipManager(db::RecordStore& store, registry::Registry& registry,
                                     ClockFn clock)
    : store_(store), registry_(registry), clock_(std::move(clock)) {}

Status MembershipManager::Load() {
    util::ScopedLogTimer timer(util::LogCategory::MEMBERSHIP, "Invite load");
    std::lock_guard<std::mutex> lock(mutex_);
    invites_.clear();
    db::Status s = store_.ForEach<Invite>(db::prefix::INVITE, [this](Invite&& invite) {
        InviteId id = invite.id;
        invites_[id] = std::move(invite);
    });
    if (!s.ok()) {
        return registry::FromStorage(s);
    }
    LOG_INFO(util::LogCategory::MEMBERSHIP) << "Loaded " << invites_.size() << " invites";
    return Status::Ok();
}

void MembershipManager::SetCitizenAddedCallback(CitizenAddedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    callback_ = std::move(callback);
}

// ============================================================================
// Invites
// ============================================================================

Status MembershipManager::CreateInvite(OrganizationId orgId, Timestamp expiresAt,
                                       InviteId* outId) {
    org::OrganizationRecord record;
    Status s = registry_.Lookup(orgId, &record);
    if (!s.ok()) {
        return s;
    }
    if (record.status == org::OrgStatus::Migrating) {
        return Status::TransitionInProgress("organization " + std::to_string(orgId) +
                                            " is migrating");
    }
    if (!record.IsActive()) {
        return Status::InvalidState("organization " + std::to_string(orgId) + " is " +
                                    org::OrgStatusToString(record.status));
    }

    const Timestamp now = clock_();
    if (expiresAt <= now) {
        return Status::InvalidArgument("invite expiry must be in the future");
    }

    Invite invite;
    invite.id = GetRandHash256();
    invite.orgId = orgId;
    invite.createdAt = now;
    invite.expiresAt = expiresAt;

    std::lock_guard<std::mutex> lock(mutex_);
    db::Status ds = store_.Write(InviteKey(invite.id), invite);
    if (!ds.ok()) {
        return registry::FromStorage(ds);
    }
    invites_[invite.id] = invite;

    LOG_INFO(util::LogCategory::MEMBERSHIP) << "Created invite "
        << invite.id.ToHex().substr(0, 16) << " for organization " << orgId;
    if (outId) {
        *outId = invite.id;
    }
    return Status::Ok();
}

Status MembershipManager::GetInvite(const InviteId& id, Invite* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = invites_.find(id);
    if (it == invites_.end()) {
        return Status::NotFound("invite " + id.ToHex().substr(0, 16));
    }
    if (out) {
        *out = it->second;
    }
    return Status::Ok();
}

Status MembershipManager::UseInvite(OrganizationId orgId, const InviteId& inviteId,
                                    const CitizenApplication& application, Citizen* out) {
    Citizen citizen;
    Invite spent;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = invites_.find(inviteId);
        if (it == invites_.end() || it->second.orgId != orgId) {
            return Status(Status::INVALID_INVITE, "invite not issued by organization " +
                                                  std::to_string(orgId));
        }
        const Invite& invite = it->second;
        if (invite.IsUsed() || redeeming_.count(inviteId)) {
            return Status(Status::INVITE_ALREADY_USED, "invite already redeemed");
        }
        const Timestamp now = clock_();
        if (now > invite.expiresAt) {
            return Status(Status::INVITE_EXPIRED, "invite expired");
        }
        if (application.name.empty() || application.name.size() > MAX_NAME_LENGTH) {
            return Status(Status::INVALID_INPUT, "name must be 1 to " +
                                                 std::to_string(MAX_NAME_LENGTH) + " bytes");
        }
        if (application.region >= NUM_REGIONS || application.ageGroup >= NUM_AGE_GROUPS ||
            application.otherDemographic >= NUM_OTHER_DEMOGRAPHICS) {
            return Status(Status::INVALID_DEMOGRAPHIC, "demographic value out of range");
        }
        if (!application.member.IsValid()) {
            return Status(Status::INVALID_INPUT, "member key is not a valid public key");
        }

        citizen.member = application.member;
        citizen.name = application.name;
        citizen.region = application.region;
        citizen.ageGroup = application.ageGroup;
        citizen.otherDemographic = application.otherDemographic;
        citizen.joinedAt = now;

        spent = invite;
        spent.usedBy = application.member;
        spent.usedAt = now;

        // Reserved while the registry write runs without the manager lock
        redeeming_.insert(inviteId);
    }

    db::WriteBatch extra;
    db::RecordStore::Put(extra, InviteKey(spent.id), spent);

    Status s = registry_.UpdateData(orgId, [&](org::DataMap& data) {
        const std::string citizenKey = CitizenKey(citizen.member);
        if (data.count(citizenKey)) {
            return Status(Status::ALREADY_MEMBER, "already a citizen");
        }

        uint64_t count = 0;
        uint64_t pages = 0;
        if (!ReadCounter(data, datakey::CITIZEN_COUNT, count) ||
            !ReadCounter(data, datakey::CITIZEN_PAGES, pages)) {
            return Status::StorageError("undecodable citizen counters");
        }

        std::vector<PublicKey> members;
        uint64_t page = pages == 0 ? 0 : pages - 1;
        if (pages > 0) {
            const auto& raw = data[IndexPageKey(page)];
            if (!DeserializeFromBytes(raw.data(), raw.size(), members)) {
                return Status::StorageError("undecodable citizen index page");
            }
        }
        if (pages == 0 || members.size() >= MAX_CITIZENS_PER_INDEX) {
            if (pages >= MAX_INDEX_PAGES) {
                return Status(Status::INDEX_FULL, "citizen index is full");
            }
            page = pages;
            pages += 1;
            members.clear();
        }

        members.push_back(citizen.member);
        citizen.indexPage = page;
        count += 1;

        data[citizenKey] = SerializeToBytes(citizen);
        data[IndexPageKey(page)] = SerializeToBytes(members);
        data[datakey::CITIZEN_COUNT] = SerializeToBytes(count);
        data[datakey::CITIZEN_PAGES] = SerializeToBytes(pages);
        return Status::Ok();
    }, &extra);

    CitizenAddedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        redeeming_.erase(inviteId);
        if (!s.ok()) {
            return s;
        }
        invites_[inviteId] = std::move(spent);
        callback = callback_;
    }

    LOG_INFO(util::LogCategory::MEMBERSHIP) << "Organization " << orgId << " admitted "
        << citizen.ToString();

    if (callback) {
        callback(orgId, citizen);
    }
    if (out) {
        *out = citizen;
    }
    return Status::Ok();
}

// ============================================================================
// Citizens
// ============================================================================

Status MembershipManager::GetCitizen(OrganizationId orgId, const PublicKey& member,
                                     Citizen* out) const {
    std::vector<uint8_t> raw;
    Status s = registry_.GetData(orgId, CitizenKey(member), &raw);
    if (!s.ok()) {
        return s;
    }
    Citizen citizen;
    if (!DeserializeFromBytes(raw.data(), raw.size(), citizen)) {
        return Status::StorageError("undecodable citizen entry");
    }
    if (out) {
        *out = std::move(citizen);
    }
    return Status::Ok();
}

Status MembershipManager::CitizenCount(OrganizationId orgId, uint64_t* out) const {
    std::vector<uint8_t> raw;
    Status s = registry_.GetData(orgId, datakey::CITIZEN_COUNT, &raw);
    uint64_t count = 0;
    if (s.ok()) {
        if (!DeserializeFromBytes(raw.data(), raw.size(), count)) {
            return Status::StorageError("undecodable citizen count");
        }
    } else if (!s.IsNotFound() || !registry_.Exists(orgId)) {
        return s;
    }
    if (out) {
        *out = count;
    }
    return Status::Ok();
}

Status MembershipManager::GetIndexPage(OrganizationId orgId, uint64_t page,
                                       std::vector<PublicKey>* out) const {
    std::vector<uint8_t> raw;
    Status s = registry_.GetData(orgId, IndexPageKey(page), &raw);
    if (!s.ok()) {
        return s;
    }
    std::vector<PublicKey> members;
    if (!DeserializeFromBytes(raw.data(), raw.size(), members)) {
        return Status::StorageError("undecodable citizen index page");
    }
    if (out) {
        *out = std::move(members);
    }
    return Status::Ok();
}

} // namespace membership
} // namespace polity
