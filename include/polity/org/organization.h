// POLITY - Organization Records
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Identity and state container for autonomous organizations (PAOs) and
// their sub-organizations (SAOs), together with the tagged governance
// configuration bound to each record.

#ifndef POLITY_ORG_ORGANIZATION_H
#define POLITY_ORG_ORGANIZATION_H

#include "polity/core/serialize.h"
#include "polity/core/types.h"
#include "polity/crypto/keys.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace polity {
namespace org {

// ============================================================================
// Constants
// ============================================================================

/// Organization identifier. Assigned at creation, never reused.
using OrganizationId = uint64_t;

/// The null organization id
constexpr OrganizationId NULL_ORG_ID = 0;

/// Maximum voters in a threshold-vote configuration
constexpr size_t MAX_VOTERS = 256;

/// Maximum label length
constexpr size_t MAX_LABEL_LENGTH = 64;

/// Maximum voting window (one year)
constexpr int64_t MAX_VOTING_WINDOW = 365 * 24 * 60 * 60;

// ============================================================================
// Enumerations
// ============================================================================

enum class OrgKind : uint8_t {
    /// Para Autonomous Organization: self-governing, no parent
    PAO = 0,
    /// Sub-Autonomous Organization: has a parent it may defer to
    SAO = 1,
};

enum class OrgStatus : uint8_t {
    Active = 0,
    /// A transition is staged; no other write is admitted
    Migrating = 1,
    Frozen = 2,
};

enum class GovernanceType : uint8_t {
    DirectSigner = 0,
    ThresholdVote = 1,
    Delegated = 2,
};

const char* OrgKindToString(OrgKind kind);
const char* OrgStatusToString(OrgStatus status);
const char* GovernanceTypeToString(GovernanceType type);

/// Parse "pao" or "sao" (case-insensitive)
std::optional<OrgKind> ParseOrgKind(const std::string& str);

// ============================================================================
// Governance Parameters
// ============================================================================

/// A single authority key approves every action
struct DirectSignerParams {
    PublicKey authority;

    bool operator==(const DirectSignerParams& other) const {
        return authority == other.authority;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, authority);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, authority);
    }
};

struct WeightedVoter {
    PublicKey key;
    uint64_t weight{0};

    bool operator==(const WeightedVoter& other) const {
        return key == other.key && weight == other.weight;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, key);
        ::polity::Serialize(s, weight);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, key);
        ::polity::Unserialize(s, weight);
    }
};

/// Weighted quorum over an optional voting window
struct ThresholdVoteParams {
    std::vector<WeightedVoter> voters;
    uint64_t threshold{0};
    /// Seconds from submission until the vote expires; 0 means no window
    int64_t votingWindow{0};

    uint64_t TotalWeight() const;

    /// Weight of key, or 0 if it is not a voter
    uint64_t WeightOf(const PublicKey& key) const;

    bool IsVoter(const PublicKey& key) const { return WeightOf(key) > 0; }

    bool operator==(const ThresholdVoteParams& other) const {
        return voters == other.voters && threshold == other.threshold &&
               votingWindow == other.votingWindow;
    }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, voters);
        ::polity::Serialize(s, threshold);
        ::polity::Serialize(s, votingWindow);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, voters);
        ::polity::Unserialize(s, threshold);
        ::polity::Unserialize(s, votingWindow);
    }
};

/// Defers every decision to the parent organization
struct DelegatedParams {
    bool operator==(const DelegatedParams&) const { return true; }
};

// ============================================================================
// Governance Config
// ============================================================================

/**
 * Tagged configuration of an organization's active governance strategy.
 *
 * The binding is owned by exactly one OrganizationRecord and is replaced
 * wholesale by a committed transition. Its content hash is the record's
 * governance module reference.
 */
class GovernanceConfig {
public:
    /// Default is a delegated binding
    GovernanceConfig() : params_(DelegatedParams{}) {}

    static GovernanceConfig DirectSigner(const PublicKey& authority);
    static GovernanceConfig ThresholdVote(std::vector<WeightedVoter> voters,
                                          uint64_t threshold,
                                          int64_t votingWindow = 0);
    static GovernanceConfig Delegated();

    GovernanceType GetType() const {
        return static_cast<GovernanceType>(params_.index());
    }

    bool IsDelegated() const { return GetType() == GovernanceType::Delegated; }

    const DirectSignerParams* AsDirectSigner() const {
        return std::get_if<DirectSignerParams>(&params_);
    }

    const ThresholdVoteParams* AsThresholdVote() const {
        return std::get_if<ThresholdVoteParams>(&params_);
    }

    /// Content hash identifying this binding
    Hash256 GetModuleRef() const;

    /**
     * Check the configuration is usable by an organization of this kind.
     * Delegated bindings require a parent, so they are invalid on a PAO.
     */
    bool ValidateFor(OrgKind kind, std::string* error = nullptr) const;

    /// Compact textual form, accepted back by ParseGovernanceConfig
    std::string ToString() const;

    bool operator==(const GovernanceConfig& other) const { return params_ == other.params_; }
    bool operator!=(const GovernanceConfig& other) const { return !(*this == other); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, static_cast<uint8_t>(GetType()));
        switch (GetType()) {
            case GovernanceType::DirectSigner:
                ::polity::Serialize(s, std::get<DirectSignerParams>(params_));
                break;
            case GovernanceType::ThresholdVote:
                ::polity::Serialize(s, std::get<ThresholdVoteParams>(params_));
                break;
            case GovernanceType::Delegated:
                break;
        }
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t tag = 0;
        ::polity::Unserialize(s, tag);
        switch (static_cast<GovernanceType>(tag)) {
            case GovernanceType::DirectSigner: {
                DirectSignerParams params;
                ::polity::Unserialize(s, params);
                params_ = std::move(params);
                break;
            }
            case GovernanceType::ThresholdVote: {
                ThresholdVoteParams params;
                ::polity::Unserialize(s, params);
                params_ = std::move(params);
                break;
            }
            case GovernanceType::Delegated:
                params_ = DelegatedParams{};
                break;
            default:
                throw std::ios_base::failure("unknown governance type");
        }
    }

private:
    // Alternative order matches GovernanceType
    std::variant<DirectSignerParams, ThresholdVoteParams, DelegatedParams> params_;
};

/**
 * Parse the textual configuration form:
 *   direct:<pubkey-hex>
 *   threshold:<threshold>:<window-secs>:<pubkey-hex>=<weight>[,<pubkey-hex>=<weight>...]
 *   delegated
 */
std::optional<GovernanceConfig> ParseGovernanceConfig(const std::string& str,
                                                      std::string* error = nullptr);

// ============================================================================
// Organization Record
// ============================================================================

/// Organization-owned key-value payload
using DataMap = std::map<std::string, std::vector<uint8_t>>;

/**
 * Persistent identity and state of one organization.
 *
 * `data` is never touched by a governance transition; only `governance`,
 * `version` and `status` change when a transition commits.
 */
struct OrganizationRecord {
    OrganizationId id{NULL_ORG_ID};
    OrgKind kind{OrgKind::PAO};
    std::optional<OrganizationId> parent;
    GovernanceConfig governance;
    DataMap data;
    /// Incremented on every committed transition
    uint64_t version{0};
    OrgStatus status{OrgStatus::Active};
    Timestamp createdAt{0};
    std::string label;

    Hash256 GetGovernanceModuleRef() const { return governance.GetModuleRef(); }

    bool IsActive() const { return status == OrgStatus::Active; }
    bool IsPAO() const { return kind == OrgKind::PAO; }

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, static_cast<uint8_t>(kind));
        ::polity::Serialize(s, parent);
        ::polity::Serialize(s, governance);
        ::polity::Serialize(s, data);
        ::polity::Serialize(s, version);
        ::polity::Serialize(s, static_cast<uint8_t>(status));
        ::polity::Serialize(s, createdAt);
        ::polity::Serialize(s, label);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t kindByte = 0;
        uint8_t statusByte = 0;
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, kindByte);
        ::polity::Unserialize(s, parent);
        ::polity::Unserialize(s, governance);
        ::polity::Unserialize(s, data);
        ::polity::Unserialize(s, version);
        ::polity::Unserialize(s, statusByte);
        ::polity::Unserialize(s, createdAt);
        ::polity::Unserialize(s, label);
        if (kindByte > static_cast<uint8_t>(OrgKind::SAO) ||
            statusByte > static_cast<uint8_t>(OrgStatus::Frozen)) {
            throw std::ios_base::failure("invalid organization record");
        }
        kind = static_cast<OrgKind>(kindByte);
        status = static_cast<OrgStatus>(statusByte);
    }
};

} // namespace org
} // namespace polity

#endif // POLITY_ORG_ORGANIZATION_H
