// POLITY - Organization Records Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/org/organization.h"
#include "polity/crypto/sha256.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace polity {
namespace org {

namespace {

void SetError(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
}

std::vector<std::string> Split(const std::string& str, char sep) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream stream(str);
    while (std::getline(stream, current, sep)) {
        parts.push_back(current);
    }
    if (!str.empty() && str.back() == sep) {
        parts.emplace_back();
    }
    return parts;
}

bool ParseUInt(const std::string& str, uint64_t& out) {
    if (str.empty() || str.size() > 20) {
        return false;
    }
    uint64_t value = 0;
    for (char c : str) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (UINT64_MAX - digit) / 10) {
            return false;
        }
        value = value * 10 + digit;
    }
    out = value;
    return true;
}

} // namespace

// ============================================================================
// Enumerations
// ============================================================================

const char* OrgKindToString(OrgKind kind) {
    switch (kind) {
        case OrgKind::PAO: return "PAO";
        case OrgKind::SAO: return "SAO";
        default: return "Unknown";
    }
}

const char* OrgStatusToString(OrgStatus status) {
    switch (status) {
        case OrgStatus::Active: return "Active";
        case OrgStatus::Migrating: return "Migrating";
        case OrgStatus::Frozen: return "Frozen";
        default: return "Unknown";
    }
}

const char* GovernanceTypeToString(GovernanceType type) {
    switch (type) {
        case GovernanceType::DirectSigner: return "DirectSigner";
        case GovernanceType::ThresholdVote: return "ThresholdVote";
        case GovernanceType::Delegated: return "Delegated";
        default: return "Unknown";
    }
}

std::optional<OrgKind> ParseOrgKind(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "pao") return OrgKind::PAO;
    if (lower == "sao") return OrgKind::SAO;
    return std::nullopt;
}

// ============================================================================
// ThresholdVoteParams
// ============================================================================

uint64_t ThresholdVoteParams::TotalWeight() const {
    uint64_t total = 0;
    for (const auto& voter : voters) {
        total += voter.weight;
    }
    return total;
}

uint64_t ThresholdVoteParams::WeightOf(const PublicKey& key) const {
    for (const auto& voter : voters) {
        if (voter.key == key) {
            return voter.weight;
        }
    }
    return 0;
}

// ============================================================================
// GovernanceConfig
// ============================================================================

GovernanceConfig GovernanceConfig::DirectSigner(const PublicKey& authority) {
    GovernanceConfig config;
    config.params_ = DirectSignerParams{authority};
    return config;
}

GovernanceConfig GovernanceConfig::ThresholdVote(std::vector<WeightedVoter> voters,
                                                 uint64_t threshold,
                                                 int64_t votingWindow) {
    GovernanceConfig config;
    ThresholdVoteParams params;
    params.voters = std::move(voters);
    params.threshold = threshold;
    params.votingWindow = votingWindow;
    config.params_ = std::move(params);
    return config;
}

GovernanceConfig GovernanceConfig::Delegated() {
    return GovernanceConfig();
}

Hash256 GovernanceConfig::GetModuleRef() const {
    return SHA256Hash(SerializeToBytes(*this));
}

bool GovernanceConfig::ValidateFor(OrgKind kind, std::string* error) const {
    switch (GetType()) {
        case GovernanceType::DirectSigner: {
            if (!AsDirectSigner()->authority.IsValid()) {
                SetError(error, "direct-signer authority is not a valid public key");
                return false;
            }
            return true;
        }
        case GovernanceType::ThresholdVote: {
            const ThresholdVoteParams& params = *AsThresholdVote();
            if (params.voters.empty()) {
                SetError(error, "threshold-vote requires at least one voter");
                return false;
            }
            if (params.voters.size() > MAX_VOTERS) {
                SetError(error, "too many voters");
                return false;
            }
            std::set<PublicKey> seen;
            uint64_t total = 0;
            for (const auto& voter : params.voters) {
                if (!voter.key.IsValid()) {
                    SetError(error, "voter key is not a valid public key");
                    return false;
                }
                if (voter.weight == 0) {
                    SetError(error, "voter weight must be positive");
                    return false;
                }
                if (!seen.insert(voter.key).second) {
                    SetError(error, "duplicate voter " + voter.key.ToHex());
                    return false;
                }
                if (total > UINT64_MAX - voter.weight) {
                    SetError(error, "total voter weight overflows");
                    return false;
                }
                total += voter.weight;
            }
            if (params.threshold == 0 || params.threshold > total) {
                SetError(error, "threshold must be between 1 and the total voter weight");
                return false;
            }
            if (params.votingWindow < 0 || params.votingWindow > MAX_VOTING_WINDOW) {
                SetError(error, "voting window out of range");
                return false;
            }
            return true;
        }
        case GovernanceType::Delegated:
            if (kind == OrgKind::PAO) {
                SetError(error, "a PAO has no parent to delegate to");
                return false;
            }
            return true;
    }
    SetError(error, "unknown governance type");
    return false;
}

std::string GovernanceConfig::ToString() const {
    std::ostringstream oss;
    switch (GetType()) {
        case GovernanceType::DirectSigner:
            oss << "direct:" << AsDirectSigner()->authority.ToHex();
            break;
        case GovernanceType::ThresholdVote: {
            const ThresholdVoteParams& params = *AsThresholdVote();
            oss << "threshold:" << params.threshold << ":" << params.votingWindow << ":";
            for (size_t i = 0; i < params.voters.size(); ++i) {
                if (i > 0) oss << ",";
                oss << params.voters[i].key.ToHex() << "=" << params.voters[i].weight;
            }
            break;
        }
        case GovernanceType::Delegated:
            oss << "delegated";
            break;
    }
    return oss.str();
}

std::optional<GovernanceConfig> ParseGovernanceConfig(const std::string& str,
                                                      std::string* error) {
    if (str == "delegated") {
        return GovernanceConfig::Delegated();
    }

    if (str.compare(0, 7, "direct:") == 0) {
        auto key = PublicKey::FromHex(str.substr(7));
        if (!key) {
            SetError(error, "invalid authority public key");
            return std::nullopt;
        }
        return GovernanceConfig::DirectSigner(*key);
    }

    if (str.compare(0, 10, "threshold:") == 0) {
        std::vector<std::string> fields = Split(str.substr(10), ':');
        if (fields.size() != 3) {
            SetError(error, "expected threshold:<threshold>:<window>:<voters>");
            return std::nullopt;
        }
        uint64_t threshold = 0;
        uint64_t window = 0;
        if (!ParseUInt(fields[0], threshold) || !ParseUInt(fields[1], window) ||
            window > static_cast<uint64_t>(MAX_VOTING_WINDOW)) {
            SetError(error, "invalid threshold or voting window");
            return std::nullopt;
        }
        std::vector<WeightedVoter> voters;
        for (const std::string& item : Split(fields[2], ',')) {
            size_t eq = item.find('=');
            if (eq == std::string::npos) {
                SetError(error, "voter must be <pubkey>=<weight>");
                return std::nullopt;
            }
            WeightedVoter voter;
            auto key = PublicKey::FromHex(item.substr(0, eq));
            if (!key || !ParseUInt(item.substr(eq + 1), voter.weight)) {
                SetError(error, "invalid voter '" + item + "'");
                return std::nullopt;
            }
            voter.key = *key;
            voters.push_back(voter);
        }
        return GovernanceConfig::ThresholdVote(std::move(voters), threshold,
                                               static_cast<int64_t>(window));
    }

    SetError(error, "unknown governance configuration '" + str + "'");
    return std::nullopt;
}

// ============================================================================
// OrganizationRecord
// ============================================================================

std::string OrganizationRecord::ToString() const {
    std::ostringstream oss;
    oss << "Organization(id=" << id
        << ", kind=" << OrgKindToString(kind);
    if (parent) {
        oss << ", parent=" << *parent;
    }
    oss << ", governance=" << GovernanceTypeToString(governance.GetType())
        << ", ref=" << GetGovernanceModuleRef().ToHex().substr(0, 16)
        << ", version=" << version
        << ", status=" << OrgStatusToString(status)
        << ", entries=" << data.size();
    if (!label.empty()) {
        oss << ", label=" << label;
    }
    oss << ")";
    return oss.str();
}

} // namespace org
} // namespace polity
