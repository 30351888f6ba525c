// POLITY - Organization Registry
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Process-wide mapping from OrganizationId to OrganizationRecord. The
// registry is the only writer of records: it creates, freezes and removes
// organizations, and performs the status compare-and-swap that the
// transition engine relies on.

#ifndef POLITY_REGISTRY_REGISTRY_H
#define POLITY_REGISTRY_REGISTRY_H

#include "polity/core/status.h"
#include "polity/core/types.h"
#include "polity/db/recordstore.h"
#include "polity/org/organization.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace polity {
namespace registry {

using org::DataMap;
using org::GovernanceConfig;
using org::OrganizationId;
using org::OrganizationRecord;
using org::OrgKind;
using org::OrgStatus;

/// Maximum key length in an organization's data map
constexpr size_t MAX_DATA_KEY_LENGTH = 256;

/// Maximum value size in an organization's data map (1 MB)
constexpr size_t MAX_DATA_VALUE_SIZE = 1024 * 1024;

/// Options for Register
struct RegisterOptions {
    /// Claim a specific id instead of allocating one
    std::optional<OrganizationId> explicitId;
    std::string label;
};

/**
 * Central registry of organizations.
 *
 * Each record sits behind its own mutex; operations on different ids never
 * contend except for the short critical section guarding the id index.
 * Lock order is always index mutex before record mutex.
 */
class Registry {
public:
    /// Mutates a copy of an organization's data; a non-ok status discards it
    using DataMutator = std::function<Status(DataMap& data)>;

    Registry(db::RecordStore& store, ClockFn clock = GetTime);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    /// Rebuild in-memory state from storage
    Status Load();

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * Create an organization with status Active and version 0.
     *
     * Fails with InvalidParent if kind and parent disagree or the parent
     * is missing or not Active, DuplicateId if an explicit id was ever
     * used, and InvalidArgument if the config is unusable for the kind.
     */
    Status Register(OrgKind kind, std::optional<OrganizationId> parent,
                    const GovernanceConfig& config, OrganizationId* outId,
                    const RegisterOptions& options = RegisterOptions());

    /// Delete an organization with no dependents; its id is never reissued
    Status Remove(OrganizationId id);

    /// Active -> Frozen
    Status Freeze(OrganizationId id);

    /// Frozen -> Active
    Status Unfreeze(OrganizationId id);

    // ========================================================================
    // Queries
    // ========================================================================

    /// Snapshot copy of a record
    Status Lookup(OrganizationId id, OrganizationRecord* out) const;

    bool Exists(OrganizationId id) const;

    /// All SAOs whose parent chain contains id
    Status ListDependents(OrganizationId id, std::set<OrganizationId>* out) const;

    /// Ids of direct children
    std::vector<OrganizationId> GetChildren(OrganizationId id) const;

    std::vector<OrganizationId> ListIds() const;

    size_t Count() const;

    // ========================================================================
    // Data
    // ========================================================================

    Status PutData(OrganizationId id, const std::string& key,
                   const std::vector<uint8_t>& value);

    Status EraseData(OrganizationId id, const std::string& key);

    Status GetData(OrganizationId id, const std::string& key,
                   std::vector<uint8_t>* out) const;

    /**
     * Apply several data changes as one write. extra is committed in the
     * same atomic batch as the updated record.
     */
    Status UpdateData(OrganizationId id, const DataMutator& mutator,
                      db::WriteBatch* extra = nullptr);

    // ========================================================================
    // Transition Support
    // ========================================================================

    /**
     * Compare-and-swap Active -> Migrating, provided the record is still
     * at expectedVersion.
     */
    Status BeginMigration(OrganizationId id, uint64_t expectedVersion,
                          db::WriteBatch* extra = nullptr);

    /**
     * Migrating -> Active with newConfig bound and version incremented.
     * The record and extra are written in one atomic batch.
     */
    Status CompleteMigration(OrganizationId id, const GovernanceConfig& newConfig,
                             uint64_t* newVersion, db::WriteBatch* extra = nullptr);

    /// Migrating -> Active with binding and version unchanged
    Status CancelMigration(OrganizationId id, db::WriteBatch* extra = nullptr);

private:
    struct Entry {
        mutable std::mutex mutex;
        OrganizationRecord record;
        /// Set by Remove under mutex; holders of a stale pointer must not write
        bool removed{false};
    };

    std::shared_ptr<Entry> FindEntry(OrganizationId id) const;

    /// FindEntry plus the entry lock; nullptr if absent or removed meanwhile
    std::shared_ptr<Entry> LockEntry(OrganizationId id, std::unique_lock<std::mutex>& lock) const;

    /// Write record plus extra atomically
    Status Persist(const OrganizationRecord& record, db::WriteBatch* extra);

    /// Status check shared by every data and lifecycle write
    static Status CheckWritable(const OrganizationRecord& record);

    db::RecordStore& store_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::map<OrganizationId, std::shared_ptr<Entry>> entries_;
    std::map<OrganizationId, std::set<OrganizationId>> children_;
    std::set<OrganizationId> tombstones_;
    OrganizationId nextId_{1};
};

/// Translate a storage failure into a caller-visible status
Status FromStorage(const db::Status& s);

} // namespace registry
} // namespace polity

#endif // POLITY_REGISTRY_REGISTRY_H
