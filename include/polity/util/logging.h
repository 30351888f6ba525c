// POLITY - Logging System
// Copyright (c) 2024 POLITY Developers
// MIT License
//
// Leveled logging, tagged by category, with pluggable sinks:
// - Console, file and callback sinks
// - Stream-style LOG_* macros that skip formatting when disabled

#ifndef POLITY_UTIL_LOGGING_H
#define POLITY_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace polity {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Parse a level name (case-insensitive); unknown names yield Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* TRANSITION = "transition";
    constexpr const char* AUTHZ = "authz";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* MEMBERSHIP = "membership";
    constexpr const char* DB = "db";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
    
    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Output destination for log entries
class ILogSink {
public:
    virtual ~ILogSink() = default;
    
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stderr, optionally colored when attached to a terminal
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        LogLevel level{LogLevel::Info};
    };
    
    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    std::string Format(const LogEntry& entry) const;
    
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rolling it over to <path>.1 once it exceeds maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        bool autoFlush{false};
        size_t maxSize{10 * 1024 * 1024};
        LogLevel level{LogLevel::Debug};
    };
    
    explicit FileSink(const Config& config);
    ~FileSink() override;
    
    bool IsOpen() const;
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    void Open();
    void Rotate();
    
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};
};

/// Forwards entries to a function; used by tests and embedding hosts
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;
    
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);
    
    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * Process-wide logger. Entries that pass the global level are delivered to
 * every sink, each of which applies its own level.
 */
class Logger {
public:
    static Logger& Instance();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);
    
    bool WillLog(LogLevel level) const;
    
    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    
    std::atomic<LogLevel> level_{LogLevel::Info};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Accumulates one message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line);
    ~LogStream();
    
    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;
    
    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs the duration of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace polity

// ============================================================================
// Logging Macros
// ============================================================================

#define POLITY_LOGGER ::polity::util::Logger::Instance()

#define POLITY_LOG_ENABLED(level) \
    POLITY_LOGGER.WillLog(::polity::util::LogLevel::level)

#define POLITY_LOG(level, category) \
    if (!POLITY_LOG_ENABLED(level)) {} else \
        ::polity::util::LogStream(::polity::util::LogLevel::level, category, \
                                  __FILE__, __LINE__)

#define LOG_TRACE(category)   POLITY_LOG(Trace, category)
#define LOG_DEBUG(category)   POLITY_LOG(Debug, category)
#define LOG_INFO(category)    POLITY_LOG(Info, category)
#define LOG_WARN(category)    POLITY_LOG(Warn, category)
#define LOG_ERROR(category)   POLITY_LOG(Error, category)

#endif // POLITY_UTIL_LOGGING_H
