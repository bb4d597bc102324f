// STAKELEDGER - Logging System
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks. The contract and the
// CLI log through the stream macros (LOG_INFO(category) << ...); tests
// capture entries with a CallbackSink.

#ifndef STAKELEDGER_UTIL_LOGGING_H
#define STAKELEDGER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace stakeledger {
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
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse log level name (case-insensitive), unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* STAKING = "staking";
    constexpr const char* ADMIN = "admin";
    constexpr const char* EVENTS = "events";
    constexpr const char* DB = "db";
    constexpr const char* AUTH = "auth";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Sinks
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

/// Writes formatted entries to a stdio stream (stderr by default, so that
/// command output on stdout stays clean)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        FILE* stream{stderr};
        bool useColors{true};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };
    
    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends formatted entries to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;
    
    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

/// Hands each entry to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;
    
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace)
        : callback_(std::move(callback)), level_(level) {}
    
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

/// Process-wide logger. With no sinks attached every message is dropped.
class Logger {
public:
    static Logger& Instance();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    
    /// Restrict output to the named categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);
    
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);
    
    bool WillLog(LogLevel level, const std::string& category) const;
    
    void Flush();

private:
    Logger() = default;
    ~Logger() = default;
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    bool allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message via operator<< and logs it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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
// Setup
// ============================================================================

/// Install the standard sinks: console (when printToConsole) and a file
/// sink (when logFile is non-empty). Replaces any existing sinks.
/// Returns false if the log file could not be opened.
bool InitLogging(LogLevel level, bool printToConsole, const std::string& logFile);

/// Format timestamp as "YYYY-MM-DD HH:MM:SS.mmm" local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Strip directories from a source path
std::string GetBasename(const std::string& path);

// ============================================================================
// Logging Macros
// ============================================================================

#define STAKELEDGER_LOGGER ::stakeledger::util::Logger::Instance()

#define STAKELEDGER_LOG_ENABLED(level, category) \
    STAKELEDGER_LOGGER.WillLog(::stakeledger::util::LogLevel::level, category)

#define STAKELEDGER_LOG(level, category) \
    if (STAKELEDGER_LOG_ENABLED(level, category)) \
        ::stakeledger::util::LogStream(::stakeledger::util::LogLevel::level, \
                                       category, __FILE__, __LINE__)

#define LOG_TRACE(category)   STAKELEDGER_LOG(Trace, category)
#define LOG_DEBUG(category)   STAKELEDGER_LOG(Debug, category)
#define LOG_INFO(category)    STAKELEDGER_LOG(Info, category)
#define LOG_WARN(category)    STAKELEDGER_LOG(Warn, category)
#define LOG_ERROR(category)   STAKELEDGER_LOG(Error, category)

#define STAKELEDGER_LOGF(level, category, ...) \
    do { \
        if (STAKELEDGER_LOG_ENABLED(level, category)) { \
            STAKELEDGER_LOGGER.LogF(::stakeledger::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  STAKELEDGER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   STAKELEDGER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   STAKELEDGER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  STAKELEDGER_LOGF(Error, category, __VA_ARGS__)

} // namespace util
} // namespace stakeledger

#endif // STAKELEDGER_UTIL_LOGGING_H
