// SIGIL - Logging Implementation
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace sigil {
namespace util {

namespace {

std::string Lower(std::string str) {
    for (char& c : str) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "";
    }
}

constexpr LogCategory ALL_CATEGORIES[] = {
    LogCategory::Default, LogCategory::Signer, LogCategory::Derive,
    LogCategory::Device, LogCategory::Config,
};

} // anonymous namespace

// ============================================================================
// Names
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    const std::string name = Lower(str);
    if (name == "warning") return LogLevel::Warn;
    if (name == "none") return LogLevel::Off;
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        LogLevel level = static_cast<LogLevel>(i);
        if (name == Lower(LogLevelToString(level))) {
            return level;
        }
    }
    return std::nullopt;
}

const char* LogCategoryToString(LogCategory category) {
    switch (category) {
        case LogCategory::Default: return "default";
        case LogCategory::Signer:  return "signer";
        case LogCategory::Derive:  return "derive";
        case LogCategory::Device:  return "device";
        case LogCategory::Config:  return "config";
    }
    return "unknown";
}

std::optional<LogCategory> ParseLogCategory(const std::string& str) {
    const std::string name = Lower(str);
    for (LogCategory category : ALL_CATEGORIES) {
        if (name == LogCategoryToString(category)) {
            return category;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Helpers
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    const std::time_t seconds = system_clock::to_time_t(tp);
    const auto millis = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buf[32];
    size_t len = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
    std::snprintf(buf + len, sizeof(buf) - len, ".%03dZ", static_cast<int>(millis));
    return buf;
}

const char* GetBasename(const char* path) {
    if (!path) {
        return "";
    }
    const char* base = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

// ============================================================================
// StderrSink
// ============================================================================

std::string StderrSink::Format(const LogEntry& entry) const {
    std::ostringstream line;
    if (options_.timestamps) {
        line << FormatLogTimestamp(entry.time) << ' ';
    }
    line << std::left << std::setw(5) << LogLevelToString(entry.level) << ' ';
    if (options_.categories && entry.category != LogCategory::Default) {
        line << LogCategoryToString(entry.category) << ": ";
    }
    if (options_.locations && entry.file) {
        line << '(' << GetBasename(entry.file) << ':' << entry.line << ") ";
    }
    line << entry.message;
    return line.str();
}

void StderrSink::Write(const LogEntry& entry) {
    const std::string text = Format(entry);
    if (options_.colors && isatty(STDERR_FILENO)) {
        std::fprintf(stderr, "%s%s\033[0m\n", ColorFor(entry.level), text.c_str());
    } else {
        std::fprintf(stderr, "%s\n", text.c_str());
    }
}

void StderrSink::Flush() {
    std::fflush(stderr);
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger logger;
    return logger;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

std::vector<std::shared_ptr<ILogSink>> Logger::SnapshotSinks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_;
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.size();
}

void Logger::EnableCategory(LogCategory category) {
    categories_.fetch_or(LogCategoryBit(category));
}

void Logger::DisableCategory(LogCategory category) {
    categories_.fetch_and(~LogCategoryBit(category));
}

bool Logger::WillLog(LogLevel level, LogCategory category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, LogCategory category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file;
    entry.line = line;
    entry.time = std::chrono::system_clock::now();

    // Sinks run unlocked so a sink may itself log
    for (const auto& sink : SnapshotSinks()) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::Flush() {
    for (const auto& sink : SnapshotSinks()) {
        sink->Flush();
    }
}

void Logger::Reset() {
    Flush();
    ClearSinks();
    level_.store(LogLevel::Warn);
    categories_.store(ALL_LOG_CATEGORIES);
}

// ============================================================================
// LogStream / ScopedLogTimer
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

ScopedLogTimer::~ScopedLogTimer() {
    Logger& logger = Logger::Instance();
    if (!logger.WillLog(LogLevel::Debug, category_)) {
        return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
    logger.Log(LogLevel::Debug, category_,
               operation_ + " took " + std::to_string(elapsed.count()) + " ms");
}

} // namespace util
} // namespace sigil
