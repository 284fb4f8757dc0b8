// CURATOR - Logging System
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Provides the logging system used by every engine component:
// - Log levels (TRACE, DEBUG, INFO, WARN, ERROR, FATAL)
// - Log categories for filtering
// - Pluggable sinks (console, callback)
// - Stream-style macros

#ifndef CURATOR_UTIL_LOGGING_H
#define CURATOR_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace curator {
namespace util {

class ConfigManager;

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Very detailed debugging
    Debug = 1,   // Debug information
    Info = 2,    // General information
    Warn = 3,    // Warnings
    Error = 4,   // Errors
    Fatal = 5,   // Fatal errors
    Off = 6      // Disable logging
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (defaults to Info)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* VOTING = "voting";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* PARAMS = "params";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

/// A single log entry
struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /// Write a log entry
    virtual void Write(const LogEntry& entry) = 0;

    /// Flush any buffered output
    virtual void Flush() = 0;

    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stdout/stderr
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // Use ANSI color codes on a tty
        bool useStderr{false};          // Write errors to stderr
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showLocation{false};       // Include file:line
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

    /// Format entry for output
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger
class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    /// Log a message
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;

    /// Flush all sinks
    void Flush();

private:
    Logger() = default;
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> disabledCategories_;
    mutable std::mutex categoriesMutex_;
};

/**
 * Apply the [log] section of a configuration.
 *
 * Keys: level (trace..off), console (bool, default true),
 *       categories (comma separated; when present only these are enabled).
 */
void ConfigureLogging(const ConfigManager& config);

// ============================================================================
// Log Stream
// ============================================================================

/// Stream-style logging helper, emits on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
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
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define CURATOR_LOGGER ::curator::util::Logger::Instance()

#define CURATOR_LOG_ENABLED(level, category) \
    CURATOR_LOGGER.WillLog(::curator::util::LogLevel::level, category)

#define CURATOR_LOG(level, category) \
    if (CURATOR_LOG_ENABLED(level, category)) \
        ::curator::util::LogStream(::curator::util::LogLevel::level, category, \
                                   __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   CURATOR_LOG(Trace, category)
#define LOG_DEBUG(category)   CURATOR_LOG(Debug, category)
#define LOG_INFO(category)    CURATOR_LOG(Info, category)
#define LOG_WARN(category)    CURATOR_LOG(Warn, category)
#define LOG_ERROR(category)   CURATOR_LOG(Error, category)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace curator

#endif // CURATOR_UTIL_LOGGING_H
