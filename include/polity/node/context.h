// POLITY - Node Context
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// This file defines the NodeContext structure that owns every component
// of a running governance node: storage, registry, authorization,
// transitions and membership.

#ifndef POLITY_NODE_CONTEXT_H
#define POLITY_NODE_CONTEXT_H

#include "polity/authz/actions.h"
#include "polity/authz/dependency.h"
#include "polity/core/types.h"
#include "polity/db/database.h"
#include "polity/db/recordstore.h"
#include "polity/membership/membership.h"
#include "polity/registry/registry.h"
#include "polity/transition/engine.h"
#include "polity/util/config.h"
#include "polity/util/logging.h"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace polity {

// ============================================================================
// Node Initialization Options
// ============================================================================

/**
 * Options for node initialization.
 * Populated from command-line and config file.
 */
struct NodeInitOptions {
    /// Data directory path
    std::filesystem::path dataDir;

    /// Keep all state in memory instead of LevelDB
    bool inMemory{false};

    /// Maximum parent hops when resolving authority
    size_t maxDependencyDepth{authz::DEFAULT_MAX_DEPTH};

    /// Database cache size in MB
    int dbCacheMB{8};

    /// Sync every write to disk
    bool dbSync{false};

    /// Logging
    util::LogLevel logLevel{util::LogLevel::Info};
    std::string logFile;
    bool logConsole{true};

    /// Time source shared by every component
    ClockFn clock{GetTime};

    /// Build options from parsed configuration
    static NodeInitOptions FromConfig(const util::ConfigManager& config);
};

// ============================================================================
// Node Context - Holds all node state
// ============================================================================

/**
 * NodeContext owns the components of a running node. Members are
 * declared in construction order and torn down in reverse.
 */
struct NodeContext {
    std::filesystem::path dataDir;

    // ========================================================================
    // Storage
    // ========================================================================

    std::unique_ptr<db::Database> database;
    std::unique_ptr<db::RecordStore> store;

    // ========================================================================
    // Governance
    // ========================================================================

    std::unique_ptr<registry::Registry> registry;
    std::unique_ptr<authz::DependencyResolver> resolver;
    std::unique_ptr<authz::ActionTracker> tracker;
    std::unique_ptr<transition::TransitionEngine> engine;
    std::unique_ptr<membership::MembershipManager> membership;

    /// Sinks installed by InitializeNode
    std::shared_ptr<util::ILogSink> consoleSink;
    std::shared_ptr<util::ILogSink> fileSink;

    std::atomic<bool> initialized{false};

    NodeContext() = default;
    ~NodeContext();

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;

    /// Check if node is ready for operations
    bool IsReady() const {
        return initialized.load() && registry != nullptr;
    }
};

// ============================================================================
// Node Initialization Functions
// ============================================================================

/**
 * Initialize the node with all subsystems.
 *
 * This function:
 * 1. Installs log sinks
 * 2. Opens the database (LevelDB under dataDir, or in-memory)
 * 3. Creates registry, resolver, tracker, engine and membership
 * 4. Loads persisted state in dependency order
 *
 * @return true if initialization succeeded
 */
bool InitializeNode(NodeContext& node, const NodeInitOptions& options);

/**
 * Shutdown the node: flush storage, release components in reverse order
 * and remove the sinks InitializeNode installed.
 */
void ShutdownNode(NodeContext& node);

/**
 * Flush database writes to disk without shutting down.
 * @return true if flush succeeded
 */
bool FlushNodeState(NodeContext& node);

} // namespace polity

#endif // POLITY_NODE_CONTEXT_H
