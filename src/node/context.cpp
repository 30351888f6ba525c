// POLITY - Node Context Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/node/context.h"
#include "polity/db/leveldb.h"

namespace polity {

// ============================================================================
// Directory Creation Helper
// ============================================================================

static bool CreateDirectoryIfNeeded(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::is_directory(path, ec);
    }
    return std::filesystem::create_directories(path, ec);
}

// ============================================================================
// NodeInitOptions
// ============================================================================

NodeInitOptions NodeInitOptions::FromConfig(const util::ConfigManager& config) {
    NodeInitOptions options;
    options.dataDir = config.GetPath(util::ConfigKeys::DATADIR,
                                     util::ConfigManager::GetDefaultDataDir());
    options.inMemory = config.GetBool(util::ConfigKeys::INMEMORY, false);

    int64_t depth = config.GetInt(util::ConfigKeys::DEPENDENCY_MAXDEPTH,
                                  static_cast<int64_t>(authz::DEFAULT_MAX_DEPTH));
    options.maxDependencyDepth = depth > 0 ? static_cast<size_t>(depth) : authz::DEFAULT_MAX_DEPTH;

    options.dbCacheMB = static_cast<int>(config.GetInt(util::ConfigKeys::DB_CACHE, 8));
    options.dbSync = config.GetBool(util::ConfigKeys::DB_SYNC, false);

    options.logLevel = util::LogLevelFromString(config.GetString(util::ConfigKeys::LOG_LEVEL, "info"));
    options.logFile = config.GetPath(util::ConfigKeys::LOG_FILE, "");
    options.logConsole = config.GetBool(util::ConfigKeys::LOG_CONSOLE, true);
    return options;
}

NodeContext::~NodeContext() {
    if (registry || database) {
        ShutdownNode(*this);
    }
}

// ============================================================================
// InitializeNode - Main initialization function
// ============================================================================

bool InitializeNode(NodeContext& node, const NodeInitOptions& options) {
    // ========================================================================
    // Step 1: Logging
    // ========================================================================

    POLITY_LOGGER.SetLevel(options.logLevel);
    if (options.logConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = options.logLevel;
        node.consoleSink = std::make_shared<util::ConsoleSink>(consoleConfig);
        POLITY_LOGGER.AddSink(node.consoleSink);
    }
    if (!options.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = options.logFile;
        fileConfig.level = options.logLevel;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (!sink->IsOpen()) {
            LOG_ERROR(util::LogCategory::DEFAULT) << "Cannot open log file " << options.logFile;
            return false;
        }
        node.fileSink = sink;
        POLITY_LOGGER.AddSink(node.fileSink);
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Initializing node...";

    // ========================================================================
    // Step 2: Open database
    // ========================================================================

    node.dataDir = options.dataDir;
    if (options.inMemory) {
        LOG_INFO(util::LogCategory::DB) << "Using in-memory database";
        node.database = std::make_unique<db::MemoryDatabase>();
    } else {
        if (!CreateDirectoryIfNeeded(node.dataDir)) {
            LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to create data directory: "
                                                  << node.dataDir.string();
            return false;
        }

        db::Options dbOptions;
        dbOptions.create_if_missing = true;
        dbOptions.block_cache_size = static_cast<size_t>(options.dbCacheMB) * 1024 * 1024;

        auto [status, database] = db::OpenDatabase(node.dataDir / "state", dbOptions);
        if (!status.ok()) {
            LOG_ERROR(util::LogCategory::DB) << "Failed to open database: " << status.ToString();
            return false;
        }
        node.database = std::move(database);
    }
    node.store = std::make_unique<db::RecordStore>(node.database.get(), options.dbSync);

    // ========================================================================
    // Step 3: Governance components
    // ========================================================================

    node.registry = std::make_unique<registry::Registry>(*node.store, options.clock);
    node.resolver = std::make_unique<authz::DependencyResolver>(*node.registry,
                                                                options.maxDependencyDepth);
    node.tracker = std::make_unique<authz::ActionTracker>(*node.store, *node.registry,
                                                          *node.resolver, options.clock);
    node.engine = std::make_unique<transition::TransitionEngine>(*node.store, *node.registry,
                                                                 *node.tracker, options.clock);
    node.membership = std::make_unique<membership::MembershipManager>(*node.store,
                                                                      *node.registry,
                                                                      options.clock);

    // ========================================================================
    // Step 4: Load state
    // ========================================================================

    Status s = node.registry->Load();
    if (s.ok()) s = node.tracker->Load();
    if (s.ok()) s = node.engine->Load();
    if (s.ok()) s = node.membership->Load();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DEFAULT) << "Failed to load state: " << s.ToString();
        return false;
    }

    node.initialized.store(true);
    LOG_INFO(util::LogCategory::DEFAULT) << "Node ready: " << node.registry->Count()
        << " organizations, " << node.tracker->PendingCount() << " pending actions";
    return true;
}

// ============================================================================
// ShutdownNode - Clean shutdown
// ============================================================================

void ShutdownNode(NodeContext& node) {
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down node...";

    node.initialized.store(false);

    node.membership.reset();
    node.engine.reset();
    node.tracker.reset();
    node.resolver.reset();
    node.registry.reset();
    node.store.reset();

    if (node.database) {
        LOG_INFO(util::LogCategory::DB) << "Closing database...";
        db::Status s = node.database->Sync();
        if (!s.ok()) {
            LOG_WARN(util::LogCategory::DB) << "Final sync failed: " << s.ToString();
        }
        node.database.reset();
    }

    LOG_INFO(util::LogCategory::DEFAULT) << "Node shutdown complete";

    if (node.fileSink) {
        node.fileSink->Flush();
        POLITY_LOGGER.RemoveSink(node.fileSink);
        node.fileSink.reset();
    }
    if (node.consoleSink) {
        POLITY_LOGGER.RemoveSink(node.consoleSink);
        node.consoleSink.reset();
    }
}

// ============================================================================
// FlushNodeState - Flush without shutdown
// ============================================================================

bool FlushNodeState(NodeContext& node) {
    if (!node.IsReady() || !node.database) {
        return false;
    }

    LOG_DEBUG(util::LogCategory::DB) << "Flushing node state...";
    db::Status s = node.database->Sync();
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to flush database: " << s.message();
        return false;
    }
    return true;
}

} // namespace polity
