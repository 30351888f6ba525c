// POLITY - Governance Module Interface Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/governance/module.h"
#include "polity/governance/delegated.h"
#include "polity/governance/direct_signer.h"
#include "polity/governance/threshold_vote.h"
#include "polity/crypto/sha256.h"

#include <algorithm>
#include <sstream>

namespace polity {
namespace governance {

namespace {

/// SHA256 over a domain tag followed by the encoded fields
template<typename T>
Hash256 TaggedHash(const char* tag, const T& obj) {
    DataStream ss;
    Serialize(ss, std::string(tag));
    Serialize(ss, obj);
    return SHA256Hash(ss.Data());
}

} // namespace

// ============================================================================
// Action
// ============================================================================

const char* ActionKindToString(ActionKind kind) {
    switch (kind) {
        case ActionKind::Custom: return "Custom";
        case ActionKind::Migrate: return "Migrate";
        default: return "Unknown";
    }
}

Action Action::Custom(OrganizationId orgId, const std::string& name,
                      std::vector<uint8_t> payload, uint64_t nonce) {
    Action action;
    action.orgId = orgId;
    action.kind = ActionKind::Custom;
    action.name = name;
    action.payload = std::move(payload);
    action.nonce = nonce;
    return action;
}

Action Action::Migrate(OrganizationId orgId, const GovernanceConfig& newConfig,
                       uint64_t baseVersion, uint64_t nonce) {
    MigrationRequest request;
    request.baseVersion = baseVersion;
    request.newConfig = newConfig;

    Action action;
    action.orgId = orgId;
    action.kind = ActionKind::Migrate;
    action.name = "migrate";
    action.payload = SerializeToBytes(request);
    action.nonce = nonce;
    return action;
}

ActionId Action::GetHash() const {
    return TaggedHash("polity/action", *this);
}

std::optional<MigrationRequest> Action::GetMigrationRequest() const {
    if (kind != ActionKind::Migrate) {
        return std::nullopt;
    }
    MigrationRequest request;
    if (!DeserializeFromBytes(payload.data(), payload.size(), request)) {
        return std::nullopt;
    }
    return request;
}

std::string Action::ToString() const {
    std::ostringstream oss;
    oss << "Action(org=" << orgId
        << ", kind=" << ActionKindToString(kind)
        << ", name=" << name
        << ", payload=" << payload.size() << " bytes"
        << ", nonce=" << nonce << ")";
    return oss.str();
}

// ============================================================================
// Proof
// ============================================================================

bool Proof::AddSignature(const PrivateKey& key, const Hash256& digest) {
    std::vector<uint8_t> sig = key.Sign(digest);
    if (sig.empty()) {
        return false;
    }
    signatures.push_back({key.GetPublicKey(), std::move(sig)});
    return true;
}

Proof Proof::Sign(const Hash256& digest, const std::vector<PrivateKey>& keys) {
    Proof proof;
    for (const auto& key : keys) {
        proof.AddSignature(key, digest);
    }
    return proof;
}

std::vector<PublicKey> Proof::ValidSigners(const Hash256& digest) const {
    std::vector<PublicKey> result;
    for (const auto& entry : signatures) {
        if (std::find(result.begin(), result.end(), entry.signer) != result.end()) {
            continue;
        }
        if (entry.signer.Verify(digest, entry.signature)) {
            result.push_back(entry.signer);
        }
    }
    return result;
}

Hash256 GetCancelHash(const ActionId& actionId) {
    return TaggedHash("polity/cancel", actionId);
}

// ============================================================================
// Vote
// ============================================================================

const char* VoteChoiceToString(VoteChoice choice) {
    switch (choice) {
        case VoteChoice::Yes: return "Yes";
        case VoteChoice::No: return "No";
        default: return "Unknown";
    }
}

Vote Vote::Create(const ActionId& actionId, const PrivateKey& key, VoteChoice choice) {
    Vote vote;
    vote.actionId = actionId;
    vote.voter = key.GetPublicKey();
    vote.choice = choice;
    vote.Sign(key);
    return vote;
}

Hash256 Vote::GetSigningHash() const {
    DataStream ss;
    Serialize(ss, std::string("polity/vote"));
    Serialize(ss, actionId);
    Serialize(ss, static_cast<uint8_t>(choice));
    return SHA256Hash(ss.Data());
}

bool Vote::Sign(const PrivateKey& key) {
    signature = key.Sign(GetSigningHash());
    return !signature.empty();
}

bool Vote::VerifySignature() const {
    return voter.Verify(GetSigningHash(), signature);
}

// ============================================================================
// Outcome
// ============================================================================

const char* DecisionToString(Decision decision) {
    switch (decision) {
        case Decision::Approved: return "Approved";
        case Decision::Rejected: return "Rejected";
        case Decision::Pending: return "Pending";
        case Decision::Defer: return "Defer";
        default: return "Unknown";
    }
}

// ============================================================================
// GovernanceModule defaults
// ============================================================================

Status GovernanceModule::ApplyVote(const EvaluationContext&, const Vote&,
                                   std::vector<uint8_t>&, Outcome*) const {
    return Status::InvalidState(std::string(GetName()) + " does not accept votes");
}

Outcome GovernanceModule::Finalize(const EvaluationContext&,
                                   const std::vector<uint8_t>&) const {
    return Outcome::Pending("awaiting decision");
}

bool GovernanceModule::CanCancel(const GovernanceConfig&, const PublicKey&) const {
    return false;
}

const GovernanceModule& GetModule(GovernanceType type) {
    static const DirectSignerModule directSigner{};
    static const ThresholdVoteModule thresholdVote{};
    static const DelegatedModule delegated{};

    switch (type) {
        case GovernanceType::DirectSigner: return directSigner;
        case GovernanceType::ThresholdVote: return thresholdVote;
        case GovernanceType::Delegated: return delegated;
    }
    return delegated;
}

} // namespace governance
} // namespace polity
