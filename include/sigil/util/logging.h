// SIGIL - Logging System
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Diagnostics for sigil-sign. Everything goes to stderr; stdout is left to
// the Data/Signer/Signature result lines.
//
// Messages are filtered twice: first by the logger's level and category mask,
// then by each sink's own level. Key material, seeds and mnemonics must never
// be passed to the logger.

#ifndef SIGIL_UTIL_LOGGING_H
#define SIGIL_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace sigil {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

/// Upper-case level name ("WARN")
const char* LogLevelToString(LogLevel level);

/// Case-insensitive; "warning" and "none" are accepted as aliases
std::optional<LogLevel> ParseLogLevel(const std::string& str);

/// Subsystem a message comes from. Values are bit positions in the
/// logger's category mask.
enum class LogCategory : uint8_t {
    Default,
    Signer,
    Derive,
    Device,
    Config
};

constexpr uint32_t ALL_LOG_CATEGORIES = 0xFFFFFFFFu;

/// Lower-case category name ("derive")
const char* LogCategoryToString(LogCategory category);

/// Parse a category name, case-insensitive
std::optional<LogCategory> ParseLogCategory(const std::string& str);

constexpr uint32_t LogCategoryBit(LogCategory category) {
    return 1u << static_cast<uint32_t>(category);
}

// ============================================================================
// Entries and Sinks
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    LogCategory category{LogCategory::Default};
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point time;
};

/// Output destination. The logger serializes calls to Write.
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_ = level; }
    LogLevel GetLevel() const { return level_; }

    bool Accepts(LogLevel level) const { return level >= level_; }

private:
    LogLevel level_{LogLevel::Trace};
};

/// Writes one line per entry to stderr, colored when stderr is a terminal
class StderrSink : public ILogSink {
public:
    struct Options {
        bool colors{true};
        bool timestamps{false};
        bool categories{true};
        bool locations{false};
    };

    StderrSink() = default;
    explicit StderrSink(const Options& options) : options_(options) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;

    /// Line without color codes or trailing newline
    std::string Format(const LogEntry& entry) const;

    const Options& GetOptions() const { return options_; }

private:
    Options options_;
};

/// Hands every accepted entry to a function (used by tests)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override {
        if (callback_) callback_(entry);
    }

private:
    Callback callback_;
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

    /// Replace the category mask (see LogCategoryBit)
    void SetCategoryMask(uint32_t mask) { categories_.store(mask); }
    uint32_t GetCategoryMask() const { return categories_.load(); }

    void EnableCategory(LogCategory category);
    void DisableCategory(LogCategory category);
    bool IsCategoryEnabled(LogCategory category) const {
        return (categories_.load() & LogCategoryBit(category)) != 0;
    }

    bool WillLog(LogLevel level, LogCategory category) const;

    void Log(LogLevel level, LogCategory category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

    /// Drop all sinks and restore the default level and mask
    void Reset();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> SnapshotSinks() const;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::atomic<LogLevel> level_{LogLevel::Warn};
    std::atomic<uint32_t> categories_{ALL_LOG_CATEGORIES};
};

// ============================================================================
// Stream Interface
// ============================================================================

/// Collects a message and logs it when destroyed
class LogStream {
public:
    LogStream(LogLevel level, LogCategory category, const char* file, int line)
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
    LogCategory category_;
    const char* file_;
    int line_;
};

#define SIGIL_LOGGER ::sigil::util::Logger::Instance()

// The stream operands are not evaluated when the message is filtered out.
#define SIGIL_LOG(level, category) \
    if (!SIGIL_LOGGER.WillLog(::sigil::util::LogLevel::level, category)) {} \
    else ::sigil::util::LogStream(::sigil::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) SIGIL_LOG(Trace, category)
#define LOG_DEBUG(category) SIGIL_LOG(Debug, category)
#define LOG_INFO(category)  SIGIL_LOG(Info, category)
#define LOG_WARN(category)  SIGIL_LOG(Warn, category)
#define LOG_ERROR(category) SIGIL_LOG(Error, category)
#define LOG_FATAL(category) SIGIL_LOG(Fatal, category)

// ============================================================================
// Scoped Timer
// ============================================================================

/// Logs "<operation> took N ms" at DEBUG when it goes out of scope
class ScopedLogTimer {
public:
    ScopedLogTimer(LogCategory category, std::string operation)
        : category_(category)
        , operation_(std::move(operation))
        , start_(std::chrono::steady_clock::now()) {}
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

private:
    LogCategory category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define SIGIL_LOG_TIMER_CONCAT_(a, b) a##b
#define SIGIL_LOG_TIMER_NAME_(line) SIGIL_LOG_TIMER_CONCAT_(sigil_log_timer_, line)
#define SIGIL_LOG_TIMER(category, operation) \
    ::sigil::util::ScopedLogTimer SIGIL_LOG_TIMER_NAME_(__LINE__)(category, operation)

// ============================================================================
// Helpers
// ============================================================================

/// UTC "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Last path component of a source file name
const char* GetBasename(const char* path);

} // namespace util
} // namespace sigil

#endif // SIGIL_UTIL_LOGGING_H
