// NEBULA - Logging
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Process-wide logger for the oracle and registry. Messages carry a level and
// a category (oracle, registry, feed, ...). A message is emitted when its
// level reaches the threshold of its category, which defaults to the global
// level and can be raised or lowered per category from the [log] section.
//
//   LOG_WARN(LogCategory::ORACLE) << "register: " << lp.ToHex() << " rejected";

#ifndef NEBULA_UTIL_LOGGING_H
#define NEBULA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace nebula {
namespace util {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; accepts "warning" for Warn. Nullopt if unrecognized.
std::optional<LogLevel> ParseLogLevel(const std::string& str);

namespace LogCategory {
    constexpr const char* MATH = "math";
    constexpr const char* FEED = "feed";
    constexpr const char* ORACLE = "oracle";
    constexpr const char* REGISTRY = "registry";
    constexpr const char* CONFIG = "config";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// "2024-01-01T00:00:00.000Z" (UTC, millisecond precision)
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// "<timestamp> WARN  [oracle] message (nebula_oracle.cpp:42)"
std::string FormatLogLine(const LogEntry& entry);

// ============================================================================
// Sinks
// ============================================================================

/// Output destination. Entries below the sink's own level are skipped.
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

private:
    std::atomic<LogLevel> level_;
};

/// Info and below to stdout, Warn and above to stderr
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(LogLevel level = LogLevel::Trace, bool useColors = true);

    void Write(const LogEntry& entry) override;
    void Flush() override;

    bool UsesColors() const { return useColors_; }

private:
    bool useColors_;
    std::mutex mutex_;
};

/// Appends one line per entry to a file, flushing each line
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Trace);

    bool IsOpen() const { return file_.is_open(); }
    const std::string& Path() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
};

/// Hands each entry to a function; used to observe or forward log output
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    /// Threshold for categories without their own level
    void SetLevel(LogLevel level);
    LogLevel GetLevel() const;

    /// Override the threshold of one category
    void SetCategoryLevel(const std::string& category, LogLevel level);
    void ClearCategoryLevels();

    /// Effective threshold of `category`
    LogLevel LevelFor(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    LogLevel level_{LogLevel::Info};
    std::map<std::string, LogLevel> categoryLevels_;
    mutable std::mutex levelsMutex_;
};

// ============================================================================
// Stream Logging
// ============================================================================

/// Collects one message and hands it to the logger when destroyed
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

#define NEBULA_LOG(level, category) \
    if (!::nebula::util::Logger::Instance().WillLog(::nebula::util::LogLevel::level, category)) { \
    } else \
        ::nebula::util::LogStream(::nebula::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) NEBULA_LOG(Trace, category)
#define LOG_DEBUG(category) NEBULA_LOG(Debug, category)
#define LOG_INFO(category)  NEBULA_LOG(Info, category)
#define LOG_WARN(category)  NEBULA_LOG(Warn, category)
#define LOG_ERROR(category) NEBULA_LOG(Error, category)

} // namespace util
} // namespace nebula

#endif // NEBULA_UTIL_LOGGING_H
