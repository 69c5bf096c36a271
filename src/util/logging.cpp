// NEBULA - Logging Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace nebula {
namespace util {

namespace {

const char* BaseName(const char* path) {
    const char* base = path;
    for (const char* p = path; *p != '\0'; ++p) {
        if (*p == '/' || *p == '\\') {
            base = p + 1;
        }
    }
    return base;
}

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "";
    }
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, LogLevel> names = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"off", LogLevel::Off},
    };
    auto it = names.find(lower);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utc;
    gmtime_r(&seconds, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return ss.str();
}

std::string FormatLogLine(const LogEntry& entry) {
    std::ostringstream ss;
    ss << FormatLogTimestamp(entry.timestamp) << ' '
       << std::left << std::setw(5) << LogLevelToString(entry.level) << ' ';
    if (!entry.category.empty()) {
        ss << '[' << entry.category << "] ";
    }
    ss << entry.message;
    if (entry.file != nullptr) {
        ss << " (" << BaseName(entry.file) << ':' << entry.line << ')';
    }
    return ss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(LogLevel level, bool useColors)
    : LogSink(level), useColors_(useColors) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatLogLine(entry);
    const char* color = useColors_ ? ColorFor(entry.level) : "";
    FILE* out = entry.level >= LogLevel::Warn ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (*color != '\0') {
        std::fprintf(out, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : LogSink(level), path_(path), file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatLogLine(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : LogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(levelsMutex_);
    level_ = level;
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(levelsMutex_);
    return level_;
}

void Logger::SetCategoryLevel(const std::string& category, LogLevel level) {
    std::lock_guard<std::mutex> lock(levelsMutex_);
    categoryLevels_[category] = level;
}

void Logger::ClearCategoryLevels() {
    std::lock_guard<std::mutex> lock(levelsMutex_);
    categoryLevels_.clear();
}

LogLevel Logger::LevelFor(const std::string& category) const {
    std::lock_guard<std::mutex> lock(levelsMutex_);
    auto it = categoryLevels_.find(category);
    return it != categoryLevels_.end() ? it->second : level_;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    return level != LogLevel::Off && level >= LevelFor(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
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
    entry.timestamp = std::chrono::system_clock::now();

    // Sinks run outside the lock so a callback sink may log or edit sinks
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::Flush() {
    std::vector<std::shared_ptr<LogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace nebula
