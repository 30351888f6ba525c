// POLITY - Configuration File Parser
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// INI-style configuration for the governance engine.
//
// Format:
// - Lines starting with # or ; are comments
// - key=value pairs; a bare key is a boolean true, "nokey" is false
// - Section headers: [section]; "[log] level=debug" is the key "log.level"
// - Values can be quoted: key="value with spaces"
// - Boolean values: true/false, yes/no, on/off, 1/0

#ifndef POLITY_UTIL_CONFIG_H
#define POLITY_UTIL_CONFIG_H

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace polity {
namespace util {

// ============================================================================
// Configuration Constants
// ============================================================================

/// Default data directory name under $HOME
constexpr const char* DEFAULT_DATADIR_NAME = ".polity";

/// Default config file name inside the data directory
constexpr const char* DEFAULT_CONFIG_FILENAME = "polity.conf";

/// Maximum config file size (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Maximum line length
constexpr size_t MAX_LINE_LENGTH = 4096;

// ============================================================================
// Configuration Entry
// ============================================================================

struct ConfigEntry {
    std::string key;       // Fully qualified, e.g. "log.level"
    std::string value;
    std::string source;    // File path, "<string>" or "<command-line>"
    int lineNumber{0};
    bool isDefault{false};
};

// ============================================================================
// Configuration Parse Result
// ============================================================================

struct ConfigParseResult {
    bool success{false};
    std::string errorMessage;
    std::string errorFile;
    int errorLine{0};
    
    static ConfigParseResult Success() {
        return {true, "", "", 0};
    }
    
    static ConfigParseResult Error(const std::string& msg,
                                   const std::string& file = "",
                                   int line = 0) {
        return {false, msg, file, line};
    }
    
    std::string ToString() const;
};

// ============================================================================
// Configuration Manager
// ============================================================================

/**
 * Holds configuration from defaults, files and the command line.
 *
 * Priority (highest first): command line, config file, defaults. A later
 * file entry for the same key replaces an earlier one.
 */
class ConfigManager {
public:
    ConfigManager() = default;
    
    ConfigParseResult ParseFile(const std::string& filePath);
    
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& sourceName = "<string>");
    
    /**
     * Parse "-key=value", "--key=value", "-flag" and "-noflag" options.
     * Parsing stops at the first argument that does not start with '-';
     * that argument and everything after it are appended to positional.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[],
                                       std::vector<std::string>* positional = nullptr);
    
    // ========================================================================
    // Value Retrieval
    // ========================================================================
    
    bool HasKey(const std::string& key) const;
    
    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& defaultValue) const;
    
    /// Integers accept k/m/g suffixes (powers of 1024)
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t defaultValue) const;
    
    std::optional<uint64_t> TryGetUInt(const std::string& key) const;
    uint64_t GetUInt(const std::string& key, uint64_t defaultValue) const;
    
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool defaultValue) const;
    
    /// String value with a leading ~ expanded to $HOME
    std::string GetPath(const std::string& key, const std::string& defaultValue = "") const;
    
    // ========================================================================
    // Value Setting
    // ========================================================================
    
    void Set(const std::string& key, const std::string& value);
    
    /// Only applies if the key has no value yet
    void SetDefault(const std::string& key, const std::string& value);
    
    // ========================================================================
    // Validation
    // ========================================================================
    
    void AllowKey(const std::string& key);
    
    /// Keys present in the configuration that were never allowed
    std::vector<std::string> UnknownKeys() const;
    
    // ========================================================================
    // Utilities
    // ========================================================================
    
    std::vector<std::string> GetKeys() const;
    void Clear();
    size_t Size() const { return entries_.size(); }
    
    /// key=value lines for every non-default entry
    std::string Dump() const;
    
    static std::string GetDefaultDataDir();
    static std::string ExpandTilde(const std::string& path);
    static std::optional<bool> ParseBool(const std::string& str);

private:
    bool ParseLine(const std::string& line, const std::string& source, int lineNum,
                   std::string& currentSection, ConfigParseResult& result);
    
    static std::string Trim(const std::string& str);
    static std::string Unquote(const std::string& str);
    static bool IsValidKey(const std::string& key);
    
    std::map<std::string, ConfigEntry> entries_;
    std::set<std::string> allowedKeys_;
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    constexpr const char* CONF = "conf";
    constexpr const char* DATADIR = "datadir";
    constexpr const char* INMEMORY = "inmemory";
    
    constexpr const char* DEPENDENCY_MAXDEPTH = "dependency.maxdepth";
    
    constexpr const char* LOG_LEVEL = "log.level";
    constexpr const char* LOG_FILE = "log.file";
    constexpr const char* LOG_CONSOLE = "log.console";
    
    constexpr const char* DB_CACHE = "db.cache";
    constexpr const char* DB_SYNC = "db.sync";
}

} // namespace util
} // namespace polity

#endif // POLITY_UTIL_CONFIG_H
