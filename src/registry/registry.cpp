// POLITY - Organization Registry Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/registry/registry.h"
#include "polity/util/logging.h"

#include <deque>

namespace polity {
namespace registry {

namespace {

const char* const NEXT_ORG_ID_COUNTER = "next_org_id";

std::string OrgKey(OrganizationId id) {
    return db::MakeKey(db::prefix::ORGANIZATION, id);
}

std::string TombstoneKey(OrganizationId id) {
    return db::MakeKey(db::prefix::TOMBSTONE, id);
}

/// Tombstones only record when the id was retired
struct Tombstone {
    OrganizationId id{org::NULL_ORG_ID};
    Timestamp removedAt{0};

    template<typename Stream>
    void Serialize(Stream& s) const {
        ::polity::Serialize(s, id);
        ::polity::Serialize(s, removedAt);
    }

    template<typename Stream>
    void Unserialize(Stream& s) {
        ::polity::Unserialize(s, id);
        ::polity::Unserialize(s, removedAt);
    }
};

} // namespace

Status FromStorage(const db::Status& s) {
    if (s.ok()) {
        return Status::Ok();
    }
    if (s.IsNotFound()) {
        return Status::NotFound(s.message());
    }
    return Status::StorageError(s.ToString());
}

// ============================================================================
// Construction
// ============================================================================

Registry::Registry(db::RecordStore& store, ClockFn clock)
    : store_(store), clock_(std::move(clock)) {}

Registry::~Registry() = default;

Status Registry::Load() {
    util::ScopedLogTimer timer(util::LogCategory::REGISTRY, "Registry load");
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.clear();
    children_.clear();
    tombstones_.clear();

    db::Status s = store_.ForEach<OrganizationRecord>(db::prefix::ORGANIZATION,
        [this](OrganizationRecord&& record) {
            auto entry = std::make_shared<Entry>();
            OrganizationId id = record.id;
            if (record.parent) {
                children_[*record.parent].insert(id);
            }
            entry->record = std::move(record);
            entries_[id] = std::move(entry);
        });
    if (!s.ok()) {
        return FromStorage(s);
    }

    s = store_.ForEach<Tombstone>(db::prefix::TOMBSTONE, [this](Tombstone&& tomb) {
        tombstones_.insert(tomb.id);
    });
    if (!s.ok()) {
        return FromStorage(s);
    }

    uint64_t next = 1;
    s = store_.ReadCounter(NEXT_ORG_ID_COUNTER, 1, &next);
    if (!s.ok()) {
        return FromStorage(s);
    }
    nextId_ = next == 0 ? 1 : next;

    LOG_INFO(util::LogCategory::REGISTRY) << "Loaded " << entries_.size()
        << " organizations, " << tombstones_.size() << " retired ids";
    return Status::Ok();
}

std::shared_ptr<Registry::Entry> Registry::FindEntry(OrganizationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Registry::Entry> Registry::LockEntry(OrganizationId id,
                                                    std::unique_lock<std::mutex>& lock) const {
    auto entry = FindEntry(id);
    if (!entry) {
        return nullptr;
    }
    lock = std::unique_lock<std::mutex>(entry->mutex);
    // Remove may have won the entry lock after FindEntry returned
    if (entry->removed) {
        lock.unlock();
        return nullptr;
    }
    return entry;
}

Status Registry::Persist(const OrganizationRecord& record, db::WriteBatch* extra) {
    db::WriteBatch batch;
    db::RecordStore::Put(batch, OrgKey(record.id), record);
    if (extra) {
        batch.Append(*extra);
    }
    db::Status s = store_.Commit(batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Failed to persist organization "
            << record.id << ": " << s.ToString();
    }
    return FromStorage(s);
}

Status Registry::CheckWritable(const OrganizationRecord& record) {
    switch (record.status) {
        case OrgStatus::Active:
            return Status::Ok();
        case OrgStatus::Migrating:
            return Status::TransitionInProgress("organization " +
                                                std::to_string(record.id) + " is migrating");
        case OrgStatus::Frozen:
            return Status::InvalidState("organization " +
                                        std::to_string(record.id) + " is frozen");
    }
    return Status::InvalidState("unknown organization status");
}

// ============================================================================
// Lifecycle
// ============================================================================

Status Registry::Register(OrgKind kind, std::optional<OrganizationId> parent,
                          const GovernanceConfig& config, OrganizationId* outId,
                          const RegisterOptions& options) {
    std::string error;
    if (!config.ValidateFor(kind, &error)) {
        return Status::InvalidArgument(error);
    }
    if (options.label.size() > org::MAX_LABEL_LENGTH) {
        return Status::InvalidArgument("label too long");
    }
    if (options.explicitId && *options.explicitId == org::NULL_ORG_ID) {
        return Status::InvalidArgument("organization id 0 is reserved");
    }
    if (kind == OrgKind::PAO && parent) {
        return Status::InvalidParent("a PAO cannot have a parent");
    }
    if (kind == OrgKind::SAO && !parent) {
        return Status::InvalidParent("an SAO requires a parent");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (parent) {
        auto it = entries_.find(*parent);
        if (it == entries_.end()) {
            return Status::InvalidParent("parent " + std::to_string(*parent) + " does not exist");
        }
        std::lock_guard<std::mutex> parentLock(it->second->mutex);
        if (!it->second->record.IsActive()) {
            return Status::InvalidParent("parent " + std::to_string(*parent) + " is " +
                                         org::OrgStatusToString(it->second->record.status));
        }
    }

    // A new record has no descendants, so linking it under an existing
    // parent can never close a cycle.
    OrganizationId id = org::NULL_ORG_ID;
    uint64_t next = nextId_;
    if (options.explicitId) {
        id = *options.explicitId;
        if (entries_.count(id) || tombstones_.count(id)) {
            return Status::DuplicateId("organization id " + std::to_string(id) + " already used");
        }
    } else {
        while (entries_.count(next) || tombstones_.count(next)) {
            ++next;
        }
        id = next++;
    }

    OrganizationRecord record;
    record.id = id;
    record.kind = kind;
    record.parent = parent;
    record.governance = config;
    record.version = 0;
    record.status = OrgStatus::Active;
    record.createdAt = clock_();
    record.label = options.label;

    db::WriteBatch extra;
    db::RecordStore::PutCounter(extra, NEXT_ORG_ID_COUNTER, next);
    Status s = Persist(record, &extra);
    if (!s.ok()) {
        return s;
    }

    nextId_ = next;
    if (parent) {
        children_[*parent].insert(id);
    }
    auto entry = std::make_shared<Entry>();
    entry->record = std::move(record);
    entries_[id] = std::move(entry);

    LOG_INFO(util::LogCategory::REGISTRY) << "Registered " << org::OrgKindToString(kind)
        << " " << id << " governance=" << org::GovernanceTypeToString(config.GetType());

    if (outId) {
        *outId = id;
    }
    return Status::Ok();
}

Status Registry::Remove(OrganizationId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    auto childIt = children_.find(id);
    if (childIt != children_.end() && !childIt->second.empty()) {
        return Status::InvalidState("organization " + std::to_string(id) + " has " +
                                    std::to_string(childIt->second.size()) + " dependents");
    }

    std::shared_ptr<Entry> entry = it->second;
    std::lock_guard<std::mutex> entryLock(entry->mutex);
    if (entry->record.status == OrgStatus::Migrating) {
        return Status::TransitionInProgress("organization " + std::to_string(id) + " is migrating");
    }

    Tombstone tomb;
    tomb.id = id;
    tomb.removedAt = clock_();

    db::WriteBatch batch;
    batch.Delete(OrgKey(id));
    db::RecordStore::Put(batch, TombstoneKey(id), tomb);
    db::Status ds = store_.Commit(batch);
    if (!ds.ok()) {
        return FromStorage(ds);
    }

    if (entry->record.parent) {
        auto parentIt = children_.find(*entry->record.parent);
        if (parentIt != children_.end()) {
            parentIt->second.erase(id);
        }
    }
    children_.erase(id);
    tombstones_.insert(id);
    entry->removed = true;
    entries_.erase(it);

    LOG_INFO(util::LogCategory::REGISTRY) << "Removed organization " << id;
    return Status::Ok();
}

Status Registry::Freeze(OrganizationId id) {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    Status s = CheckWritable(entry->record);
    if (!s.ok()) {
        return s;
    }
    OrganizationRecord updated = entry->record;
    updated.status = OrgStatus::Frozen;
    s = Persist(updated, nullptr);
    if (s.ok()) {
        entry->record = std::move(updated);
        LOG_INFO(util::LogCategory::REGISTRY) << "Froze organization " << id;
    }
    return s;
}

Status Registry::Unfreeze(OrganizationId id) {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    if (entry->record.status != OrgStatus::Frozen) {
        return Status::InvalidState("organization " + std::to_string(id) + " is not frozen");
    }
    OrganizationRecord updated = entry->record;
    updated.status = OrgStatus::Active;
    Status s = Persist(updated, nullptr);
    if (s.ok()) {
        entry->record = std::move(updated);
        LOG_INFO(util::LogCategory::REGISTRY) << "Unfroze organization " << id;
    }
    return s;
}

// ============================================================================
// Queries
// ============================================================================

Status Registry::Lookup(OrganizationId id, OrganizationRecord* out) const {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    if (out) {
        *out = entry->record;
    }
    return Status::Ok();
}

bool Registry::Exists(OrganizationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

Status Registry::ListDependents(OrganizationId id, std::set<OrganizationId>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!entries_.count(id)) {
        return Status::NotFound("organization " + std::to_string(id));
    }

    std::set<OrganizationId> result;
    std::deque<OrganizationId> queue{id};
    while (!queue.empty()) {
        OrganizationId current = queue.front();
        queue.pop_front();
        auto it = children_.find(current);
        if (it == children_.end()) {
            continue;
        }
        for (OrganizationId child : it->second) {
            if (result.insert(child).second) {
                queue.push_back(child);
            }
        }
    }

    if (out) {
        *out = std::move(result);
    }
    return Status::Ok();
}

std::vector<OrganizationId> Registry::GetChildren(OrganizationId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = children_.find(id);
    if (it == children_.end()) {
        return {};
    }
    return std::vector<OrganizationId>(it->second.begin(), it->second.end());
}

std::vector<OrganizationId> Registry::ListIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OrganizationId> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        ids.push_back(id);
    }
    return ids;
}

size_t Registry::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ============================================================================
// Data
// ============================================================================

Status Registry::PutData(OrganizationId id, const std::string& key,
                         const std::vector<uint8_t>& value) {
    if (key.empty() || key.size() > MAX_DATA_KEY_LENGTH) {
        return Status::InvalidArgument("invalid data key length");
    }
    if (value.size() > MAX_DATA_VALUE_SIZE) {
        return Status::InvalidArgument("data value too large");
    }
    return UpdateData(id, [&](DataMap& data) {
        data[key] = value;
        return Status::Ok();
    });
}

Status Registry::EraseData(OrganizationId id, const std::string& key) {
    return UpdateData(id, [&](DataMap& data) {
        if (data.erase(key) == 0) {
            return Status::NotFound("data key '" + key + "'");
        }
        return Status::Ok();
    });
}

Status Registry::GetData(OrganizationId id, const std::string& key,
                         std::vector<uint8_t>* out) const {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    auto it = entry->record.data.find(key);
    if (it == entry->record.data.end()) {
        return Status::NotFound("data key '" + key + "'");
    }
    if (out) {
        *out = it->second;
    }
    return Status::Ok();
}

Status Registry::UpdateData(OrganizationId id, const DataMutator& mutator,
                            db::WriteBatch* extra) {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    Status s = CheckWritable(entry->record);
    if (!s.ok()) {
        return s;
    }

    OrganizationRecord updated = entry->record;
    s = mutator(updated.data);
    if (!s.ok()) {
        return s;
    }
    s = Persist(updated, extra);
    if (s.ok()) {
        entry->record = std::move(updated);
    }
    return s;
}

// ============================================================================
// Transition Support
// ============================================================================

Status Registry::BeginMigration(OrganizationId id, uint64_t expectedVersion,
                                db::WriteBatch* extra) {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    Status s = CheckWritable(entry->record);
    if (!s.ok()) {
        return s;
    }
    if (entry->record.version != expectedVersion) {
        return Status::InvalidState("organization " + std::to_string(id) +
                                    " moved from version " + std::to_string(expectedVersion) +
                                    " to " + std::to_string(entry->record.version));
    }

    OrganizationRecord updated = entry->record;
    updated.status = OrgStatus::Migrating;
    s = Persist(updated, extra);
    if (s.ok()) {
        entry->record = std::move(updated);
        LOG_DEBUG(util::LogCategory::REGISTRY) << "Organization " << id
            << " migrating from version " << expectedVersion;
    }
    return s;
}

Status Registry::CompleteMigration(OrganizationId id, const GovernanceConfig& newConfig,
                                   uint64_t* newVersion, db::WriteBatch* extra) {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    if (entry->record.status != OrgStatus::Migrating) {
        return Status::InvalidState("organization " + std::to_string(id) + " is not migrating");
    }

    OrganizationRecord updated = entry->record;
    updated.governance = newConfig;
    updated.version += 1;
    updated.status = OrgStatus::Active;
    Status s = Persist(updated, extra);
    if (!s.ok()) {
        return s;
    }
    entry->record = std::move(updated);
    if (newVersion) {
        *newVersion = entry->record.version;
    }
    LOG_INFO(util::LogCategory::REGISTRY) << "Organization " << id << " now at version "
        << entry->record.version << " governance="
        << org::GovernanceTypeToString(newConfig.GetType());
    return Status::Ok();
}

Status Registry::CancelMigration(OrganizationId id, db::WriteBatch* extra) {
    std::unique_lock<std::mutex> lock;
    auto entry = LockEntry(id, lock);
    if (!entry) {
        return Status::NotFound("organization " + std::to_string(id));
    }
    if (entry->record.status != OrgStatus::Migrating) {
        return Status::InvalidState("organization " + std::to_string(id) + " is not migrating");
    }

    OrganizationRecord updated = entry->record;
    updated.status = OrgStatus::Active;
    Status s = Persist(updated, extra);
    if (s.ok()) {
        entry->record = std::move(updated);
        LOG_DEBUG(util::LogCategory::REGISTRY) << "Organization " << id << " migration cancelled";
    }
    return s;
}

} // namespace registry
} // namespace polity
