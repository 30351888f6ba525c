// POLITY - Governance Module Interface
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Governance strategies decide whether a proposed action is approved under
// an organization's governance configuration. Strategies are stateless:
// any in-flight tally lives in an opaque blob carried by the action record.

#ifndef POLITY_GOVERNANCE_MODULE_H
#define POLITY_GOVERNANCE_MODULE_H

#include "polity/core/serialize.h"
#include "polity/core/status.h"
#include "polity/core/types.h"
#include "polity/crypto/keys.h"
#include "polity/org/organization.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace polity {
namespace governance {

using org::GovernanceConfig;
using org::GovernanceType;
using org::OrganizationId;

/// Action identifier: digest of the action's canonical encoding
using ActionId = Hash256;

// ============================================================================
// Action
// ============================================================================

enum class ActionKind : uint8_t {
    /// Organization-defined action, opaque to the engine
    Custom = 0,
    /// Governance migration; payload is an encoded MigrationRequest
    Migrate = 1,
};

const char* ActionKindToString(ActionKind kind);

/// Maximum action name length
constexpr size_t MAX_ACTION_NAME_LENGTH = 128;

/// Maximum action payload size (64 KB)
constexpr size_t MAX_ACTION_PAYLOAD_SIZE = 64 * 1024;

/// Payload of a Migrate action. baseVersion ties the request to the
/// record version it was approved against.
struct MigrationRequest {
    uint64_t baseVersion{0};
    GovernanceConfig newConfig;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, baseVersion);
        ::polity::Serialize(s, newConfig);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, baseVersion);
        ::polity::Unserialize(s, newConfig);
    }
};

/**
 * An action proposed on behalf of an organization.
 *
 * Two actions with the same fields share an ActionId; the nonce lets a
 * caller submit otherwise identical actions more than once.
 */
struct Action {
    OrganizationId orgId{org::NULL_ORG_ID};
    ActionKind kind{ActionKind::Custom};
    std::string name;
    std::vector<uint8_t> payload;
    uint64_t nonce{0};

    static Action Custom(OrganizationId orgId, const std::string& name,
                         std::vector<uint8_t> payload = {}, uint64_t nonce = 0);

    static Action Migrate(OrganizationId orgId, const GovernanceConfig& newConfig,
                          uint64_t baseVersion, uint64_t nonce = 0);

    /// Domain-separated digest; this is both the ActionId and what signers sign
    ActionId GetHash() const;

    /// Decoded payload of a Migrate action
    std::optional<MigrationRequest> GetMigrationRequest() const;

    std::string ToString() const;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, orgId);
        ::polity::Serialize(s, static_cast<uint8_t>(kind));
        ::polity::Serialize(s, name);
        ::polity::Serialize(s, payload);
        ::polity::Serialize(s, nonce);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        uint8_t kindByte = 0;
        ::polity::Unserialize(s, orgId);
        ::polity::Unserialize(s, kindByte);
        ::polity::Unserialize(s, name);
        ::polity::Unserialize(s, payload);
        ::polity::Unserialize(s, nonce);
        if (kindByte > static_cast<uint8_t>(ActionKind::Migrate)) {
            throw std::ios_base::failure("invalid action kind");
        }
        kind = static_cast<ActionKind>(kindByte);
    }
};

// ============================================================================
// Proof
// ============================================================================

struct SignatureEntry {
    PublicKey signer;
    std::vector<uint8_t> signature;

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, signer);
        ::polity::Serialize(s, signature);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, signer);
        ::polity::Unserialize(s, signature);
    }
};

/// Caller-supplied signatures over a digest (an ActionId or a cancel digest)
struct Proof {
    std::vector<SignatureEntry> signatures;

    /// Sign digest with key and append the signature
    bool AddSignature(const PrivateKey& key, const Hash256& digest);

    /// Proof over digest carrying one signature per key
    static Proof Sign(const Hash256& digest, const std::vector<PrivateKey>& keys);

    /// Signers whose signature over digest verifies, in proof order, deduplicated
    std::vector<PublicKey> ValidSigners(const Hash256& digest) const;

    bool Empty() const { return signatures.empty(); }

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, signatures);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, signatures);
    }
};

/// Digest a canceller signs to withdraw a pending action
Hash256 GetCancelHash(const ActionId& actionId);

// ============================================================================
// Vote
// ============================================================================

enum class VoteChoice : uint8_t {
    Yes = 0,
    No = 1,
};

const char* VoteChoiceToString(VoteChoice choice);

/// A signed ballot on a pending action
struct Vote {
    ActionId actionId;
    PublicKey voter;
    VoteChoice choice{VoteChoice::Yes};
    std::vector<uint8_t> signature;

    static Vote Create(const ActionId& actionId, const PrivateKey& key, VoteChoice choice);

    /// Digest over (actionId, choice)
    Hash256 GetSigningHash() const;

    bool Sign(const PrivateKey& key);
    bool VerifySignature() const;
};

// ============================================================================
// Outcome
// ============================================================================

enum class Decision : uint8_t {
    Approved = 0,
    Rejected = 1,
    Pending = 2,
    /// Not decided at this level; ask the parent organization
    Defer = 3,
};

const char* DecisionToString(Decision decision);

struct Outcome {
    Decision decision{Decision::Pending};
    std::string reason;

    static Outcome Approved(const std::string& reason = "") { return {Decision::Approved, reason}; }
    static Outcome Rejected(const std::string& reason) { return {Decision::Rejected, reason}; }
    static Outcome Pending(const std::string& reason) { return {Decision::Pending, reason}; }
    static Outcome Defer() { return {Decision::Defer, "delegated to parent"}; }

    bool IsApproved() const { return decision == Decision::Approved; }
    bool IsRejected() const { return decision == Decision::Rejected; }
    bool IsPending() const { return decision == Decision::Pending; }
    bool IsFinal() const { return IsApproved() || IsRejected(); }
};

// ============================================================================
// Governance Module
// ============================================================================

/// Inputs shared by every evaluation step
struct EvaluationContext {
    /// Configuration of the organization that evaluates
    const GovernanceConfig& config;
    OrganizationId evaluatorId;
    ActionId actionId;
    Timestamp submittedAt;
    Timestamp now;
};

/**
 * A governance strategy. New strategies implement this interface and are
 * selected by the GovernanceType of a binding.
 */
class GovernanceModule {
public:
    virtual ~GovernanceModule() = default;

    virtual GovernanceType GetType() const = 0;
    virtual const char* GetName() const = 0;

    /**
     * Decide a freshly submitted action.
     * @param tally In-flight state; empty on entry, kept with the action
     */
    virtual Outcome Evaluate(const EvaluationContext& ctx, const Action& action,
                             const Proof& proof, std::vector<uint8_t>& tally) const = 0;

    /**
     * Apply a ballot to a pending action. Strategies without ballots
     * return InvalidState.
     */
    virtual Status ApplyVote(const EvaluationContext& ctx, const Vote& vote,
                             std::vector<uint8_t>& tally, Outcome* outcome) const;

    /// Re-examine a pending action, e.g. for an expired window
    virtual Outcome Finalize(const EvaluationContext& ctx,
                             const std::vector<uint8_t>& tally) const;

    /// Whether signer may withdraw a pending action besides its proposer
    virtual bool CanCancel(const GovernanceConfig& config, const PublicKey& signer) const;
};

/// Built-in module for a governance type
const GovernanceModule& GetModule(GovernanceType type);

} // namespace governance
} // namespace polity

#endif // POLITY_GOVERNANCE_MODULE_H
