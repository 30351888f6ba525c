// POLITY - Configuration Implementation
// Copyright (c) 2024 POLITY Developers
// MIT License

#include "polity/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace polity {
namespace util {

namespace {

std::string ToLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

} // namespace

std::string ConfigParseResult::ToString() const {
    if (success) {
        return "OK";
    }
    std::ostringstream oss;
    if (!errorFile.empty()) {
        oss << errorFile;
        if (errorLine > 0) {
            oss << ":" << errorLine;
        }
        oss << ": ";
    }
    oss << errorMessage;
    return oss.str();
}

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

std::string ConfigManager::Unquote(const std::string& str) {
    if (str.length() < 2) {
        return str;
    }
    
    char first = str.front();
    char last = str.back();
    if (first == '\'' && last == '\'') {
        return str.substr(1, str.length() - 2);
    }
    if (first != '"' || last != '"') {
        return str;
    }
    
    std::string inner = str.substr(1, str.length() - 2);
    std::string result;
    result.reserve(inner.length());
    for (size_t i = 0; i < inner.length(); ++i) {
        if (inner[i] == '\\' && i + 1 < inner.length()) {
            char next = inner[++i];
            switch (next) {
                case 'n': result += '\n'; break;
                case 't': result += '\t'; break;
                case '\\': result += '\\'; break;
                case '"': result += '"'; break;
                default: result += '\\'; result += next; break;
            }
        } else {
            result += inner[i];
        }
    }
    return result;
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower = ToLower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

bool ConfigManager::IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-' && c != '.') {
            return false;
        }
    }
    return true;
}

std::string ConfigManager::ExpandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

std::string ConfigManager::GetDefaultDataDir() {
    const char* home = std::getenv("HOME");
    std::string base = home ? home : ".";
    return base + "/" + DEFAULT_DATADIR_NAME;
}

// ============================================================================
// Parsing
// ============================================================================

bool ConfigManager::ParseLine(const std::string& line, const std::string& source,
                              int lineNum, std::string& currentSection,
                              ConfigParseResult& result) {
    std::string trimmed = Trim(line);
    if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';') {
        return true;
    }
    
    if (trimmed[0] == '[') {
        size_t end = trimmed.find(']');
        if (end == std::string::npos) {
            result = ConfigParseResult::Error(
                "Missing closing bracket in section header", source, lineNum);
            return false;
        }
        currentSection = Trim(trimmed.substr(1, end - 1));
        if (!currentSection.empty() && !IsValidKey(currentSection)) {
            result = ConfigParseResult::Error(
                "Invalid section name: " + currentSection, source, lineNum);
            return false;
        }
        return true;
    }
    
    std::string key;
    std::string value;
    size_t eqPos = trimmed.find('=');
    if (eqPos == std::string::npos) {
        key = trimmed;
        value = "true";
        if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
            std::islower(static_cast<unsigned char>(key[2]))) {
            key = key.substr(2);
            value = "false";
        }
    } else {
        key = Trim(trimmed.substr(0, eqPos));
        value = Unquote(Trim(trimmed.substr(eqPos + 1)));
    }
    
    if (!IsValidKey(key)) {
        result = ConfigParseResult::Error("Invalid key: '" + key + "'", source, lineNum);
        return false;
    }
    
    std::string fullKey = currentSection.empty() ? key : currentSection + "." + key;
    auto it = entries_.find(fullKey);
    if (it != entries_.end() && !it->second.isDefault && it->second.source == "<command-line>") {
        return true;
    }
    
    ConfigEntry entry;
    entry.key = fullKey;
    entry.value = value;
    entry.source = source;
    entry.lineNumber = lineNum;
    entries_[fullKey] = entry;
    return true;
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& sourceName) {
    std::istringstream stream(content);
    std::string currentSection;
    std::string line;
    int lineNum = 0;
    ConfigParseResult result = ConfigParseResult::Success();
    
    while (std::getline(stream, line)) {
        ++lineNum;
        if (line.length() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Error(
                "Line too long (max " + std::to_string(MAX_LINE_LENGTH) + " characters)",
                sourceName, lineNum);
        }
        if (!ParseLine(line, sourceName, lineNum, currentSection, result)) {
            return result;
        }
    }
    return result;
}

ConfigParseResult ConfigManager::ParseFile(const std::string& filePath) {
    std::string path = ExpandTilde(filePath);
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return ConfigParseResult::Error("Cannot open file: " + path);
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    if (content.str().size() > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Error(
            "Config file too large (max " + std::to_string(MAX_CONFIG_SIZE) + " bytes)", path);
    }
    return ParseString(content.str(), path);
}

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[],
                                                  std::vector<std::string>* positional) {
    int i = 1;
    for (; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }
        
        size_t start = arg.find_first_not_of('-');
        std::string body = arg.substr(start);
        std::string key;
        std::string value = "true";
        
        size_t eqPos = body.find('=');
        if (eqPos != std::string::npos) {
            key = body.substr(0, eqPos);
            value = body.substr(eqPos + 1);
        } else {
            key = body;
            if (key.length() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key = key.substr(2);
                value = "false";
            }
        }
        
        if (!IsValidKey(key)) {
            return ConfigParseResult::Error("Invalid option: " + arg, "<command-line>");
        }
        
        ConfigEntry entry;
        entry.key = key;
        entry.value = value;
        entry.source = "<command-line>";
        entries_[key] = entry;
    }
    
    if (positional) {
        for (; i < argc; ++i) {
            positional->emplace_back(argv[i]);
        }
    }
    return ConfigParseResult::Success();
}

// ============================================================================
// Value Retrieval
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return entries_.find(key) != entries_.end();
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

std::string ConfigManager::GetString(const std::string& key,
                                     const std::string& defaultValue) const {
    return TryGetString(key).value_or(defaultValue);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    
    try {
        size_t pos = 0;
        int64_t value = std::stoll(*str, &pos);
        std::string suffix = ToLower(Trim(str->substr(pos)));
        if (suffix.empty()) {
            return value;
        }
        if (suffix == "k") return value * 1024;
        if (suffix == "m") return value * 1024 * 1024;
        if (suffix == "g") return value * 1024LL * 1024 * 1024;
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t defaultValue) const {
    return TryGetInt(key).value_or(defaultValue);
}

std::optional<uint64_t> ConfigManager::TryGetUInt(const std::string& key) const {
    auto value = TryGetInt(key);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(*value);
}

uint64_t ConfigManager::GetUInt(const std::string& key, uint64_t defaultValue) const {
    return TryGetUInt(key).value_or(defaultValue);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool defaultValue) const {
    return TryGetBool(key).value_or(defaultValue);
}

std::string ConfigManager::GetPath(const std::string& key,
                                   const std::string& defaultValue) const {
    return ExpandTilde(GetString(key, defaultValue));
}

// ============================================================================
// Value Setting
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value) {
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.source = "<set>";
    entries_[key] = entry;
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    if (entries_.count(key)) {
        return;
    }
    ConfigEntry entry;
    entry.key = key;
    entry.value = value;
    entry.source = "<default>";
    entry.isDefault = true;
    entries_[key] = entry;
}

void ConfigManager::AllowKey(const std::string& key) {
    allowedKeys_.insert(key);
}

std::vector<std::string> ConfigManager::UnknownKeys() const {
    std::vector<std::string> unknown;
    for (const auto& [key, entry] : entries_) {
        if (!allowedKeys_.count(key)) {
            unknown.push_back(key);
        }
    }
    return unknown;
}

// ============================================================================
// Utilities
// ============================================================================

std::vector<std::string> ConfigManager::GetKeys() const {
    std::vector<std::string> keys;
    keys.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        keys.push_back(key);
    }
    return keys;
}

void ConfigManager::Clear() {
    entries_.clear();
}

std::string ConfigManager::Dump() const {
    std::ostringstream oss;
    for (const auto& [key, entry] : entries_) {
        if (!entry.isDefault) {
            oss << key << "=" << entry.value << "\n";
        }
    }
    return oss.str();
}

} // namespace util
} // namespace polity
