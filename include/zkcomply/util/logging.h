// ZKCOMPLY - Logging System
// Copyright (c) 2024 ZKCOMPLY Developers
// MIT License
//
// Process-wide logger with levels, categories and pluggable sinks
// (console, file, callback). Stream-style macros skip message formatting
// entirely when the level or category is filtered out.
//
// Compliance code logs roots, counts, circuit names and timings. It never
// logs identities, salts, scores or any other witness value.

#ifndef ZKCOMPLY_UTIL_LOGGING_H
#define ZKCOMPLY_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace zkcomply {
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

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, Info when unknown)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* HASH = "hash";
    constexpr const char* MERKLE = "merkle";
    constexpr const char* NULLIFIER = "nullifier";
    constexpr const char* ASSEMBLER = "assembler";
    constexpr const char* PROVER = "prover";
    constexpr const char* FORMATTER = "formatter";
    constexpr const char* VERIFIER = "verifier";
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
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;
    
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Log sink that writes to stdout, or stderr for errors when configured
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showCategory{true};
        bool showThread{false};
        LogLevel level{LogLevel::Info};
    };
    
    ConsoleSink();
    explicit ConsoleSink(const Config& config);
    
    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
    
    std::string Format(const LogEntry& entry) const;
    static const char* ColorCode(LogLevel level);
};

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Debug);
    ~FileSink() override;
    
    bool IsOpen() const { return file_.is_open(); }
    const std::string& Path() const { return path_; }
    
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

/// Log sink that calls a callback function
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;
    
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);
    
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

class Logger {
public:
    /// Get the singleton instance
    static Logger& Instance();
    
    /// Install the default console sink once
    void Initialize();
    
    /// Flush and drop all sinks
    void Shutdown();
    
    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;
    
    /// Global minimum level
    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }
    
    /// Restrict output to explicitly enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();
    
    /// Dispatch a message to every sink
    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);
    
    /// Check if a message would be logged
    bool WillLog(LogLevel level, const std::string& category) const;
    
    void Flush();

private:
    Logger() = default;
    ~Logger();
    
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
    
    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message and hands it to the logger on destruction
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

#define ZKCOMPLY_LOGGER ::zkcomply::util::Logger::Instance()

#define ZKCOMPLY_LOG_ENABLED(level, category) \
    ZKCOMPLY_LOGGER.WillLog(::zkcomply::util::LogLevel::level, category)

#define ZKCOMPLY_LOG(level, category) \
    if (ZKCOMPLY_LOG_ENABLED(level, category)) \
        ::zkcomply::util::LogStream(::zkcomply::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   ZKCOMPLY_LOG(Trace, category)
#define LOG_DEBUG(category)   ZKCOMPLY_LOG(Debug, category)
#define LOG_INFO(category)    ZKCOMPLY_LOG(Info, category)
#define LOG_WARN(category)    ZKCOMPLY_LOG(Warn, category)
#define LOG_ERROR(category)   ZKCOMPLY_LOG(Error, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer that logs the duration of an operation at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();
    
    /// Milliseconds since construction
    int64_t ElapsedMs() const;

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

#define ZKCOMPLY_LOG_TIMER_CONCAT_(a, b) a##b
#define ZKCOMPLY_LOG_TIMER_NAME_(line) ZKCOMPLY_LOG_TIMER_CONCAT_(zkcomplyTimer_, line)
#define ZKCOMPLY_LOG_TIMER(category, operation) \
    ::zkcomply::util::ScopedLogTimer ZKCOMPLY_LOG_TIMER_NAME_(__LINE__)(category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

/// Format timestamp for logging
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace zkcomply

#endif // ZKCOMPLY_UTIL_LOGGING_H
