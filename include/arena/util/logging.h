// ARENA - Logging System
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
// - Console, rotating file and callback sinks
// - Category filters (stage, ledger, battle, reward, ...)
// - Stream-style and printf-style macros

#ifndef ARENA_UTIL_LOGGING_H
#define ARENA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace arena {
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

/// Unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* STAGE = "stage";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* BATTLE = "battle";
    constexpr const char* REWARD = "reward";
    constexpr const char* INCENTIVE = "incentive";
    constexpr const char* VAULT = "vault";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* CONFIG = "config";
    constexpr const char* SIM = "sim";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
};

/// Writes to stdout
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file; path is moved to path.1 (and so on up to
/// maxFiles) once it grows past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    void Rotate();

    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
    size_t currentSize_{0};
};

/// Forwards entries to a callback; tests capture output with it
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override;
    void Flush() override {}

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category, const char* file, int line,
              const char* format, ...);

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

/// Collects a message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category, const char* file, int line)
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
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ARENA_LOGGER ::arena::util::Logger::Instance()

#define ARENA_LOG(level, category) \
    if (ARENA_LOGGER.WillLog(::arena::util::LogLevel::level, category)) \
        ::arena::util::LogStream(::arena::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   ARENA_LOG(Trace, category)
#define LOG_DEBUG(category)   ARENA_LOG(Debug, category)
#define LOG_INFO(category)    ARENA_LOG(Info, category)
#define LOG_WARN(category)    ARENA_LOG(Warn, category)
#define LOG_ERROR(category)   ARENA_LOG(Error, category)

#define ARENA_LOGF(level, category, ...) \
    do { \
        if (ARENA_LOGGER.WillLog(::arena::util::LogLevel::level, category)) { \
            ARENA_LOGGER.LogF(::arena::util::LogLevel::level, category, \
                              __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  ARENA_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ARENA_LOGF(Info, category, __VA_ARGS__)

/// Logs the wall time spent in a scope at debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation)
        : category_(category), operation_(operation),
          start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define ARENA_LOG_TIMER_CONCAT2(a, b) a##b
#define ARENA_LOG_TIMER_CONCAT(a, b) ARENA_LOG_TIMER_CONCAT2(a, b)
#define ARENA_LOG_TIMER(category, operation) \
    ::arena::util::ScopedLogTimer ARENA_LOG_TIMER_CONCAT(arenaLogTimer_, __LINE__)(category, operation)

} // namespace util
} // namespace arena

#endif // ARENA_UTIL_LOGGING_H
