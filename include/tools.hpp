#pragma once

#include <cstdint>
#include <vector>
#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <condition_variable>
#include <string>
#include <functional>
#include <sstream>


//------------------------------------------------------------------------------
// Logger

class Logger {
public:
    enum LogLevel { DEBUG, INFO, WARN, ERROR };

    static Logger& getInstance();

    Logger();
    ~Logger();

    void SetLogLevel(LogLevel level);
    LogLevel GetLogLevel() const { return CurrentLogLevel; }
    void SetCallback(std::function<void(LogLevel, const std::string&)> callback);

    // Accepts "debug", "info", "warn" or "error"
    static bool ParseLogLevel(const std::string& name, LogLevel& level_out);

    class LogStream {
    public:
        LogStream(Logger& logger, LogLevel level, bool log_enabled = true)
            : logger_(logger)
            , level_(level)
            , log_enabled_(log_enabled)
        {
        }
        LogStream(LogStream&& other)
            : logger_(other.logger_)
            , level_(other.level_)
            , log_enabled_(other.log_enabled_)
        {
            other.log_enabled_ = false;
        }
        ~LogStream() {
            if (log_enabled_) {
                logger_.Log(level_, std::move(ss_));
            }
        }

        template<typename T>
        LogStream& operator<<(const T& value) {
            if (log_enabled_) {
                ss_ << value;
            }
            return *this;
        }

    private:
        Logger& logger_;
        LogLevel level_;
        bool log_enabled_ = false;

        std::ostringstream ss_;
    };

    LogStream Debug() { return LogStream(*this, LogLevel::DEBUG, CurrentLogLevel <= LogLevel::DEBUG); }
    LogStream Info() { return LogStream(*this, LogLevel::INFO, CurrentLogLevel <= LogLevel::INFO); }
    LogStream Warn() { return LogStream(*this, LogLevel::WARN, CurrentLogLevel <= LogLevel::WARN); }
    LogStream Error() { return LogStream(*this, LogLevel::ERROR, CurrentLogLevel <= LogLevel::ERROR); }

    // Blocks until everything queued so far has been written
    void Flush();

    void Terminate();

private:
    static std::unique_ptr<Logger> Instance;
    static std::once_flag InitInstanceFlag;

    struct LogEntry {
        LogLevel Level;
        std::string Message;
    };

    std::vector<LogEntry> LogQueue;
    std::mutex LogQueueMutex;
    std::condition_variable LogQueueCV;

    // Signalled by the logger thread after each pass over the queue
    std::condition_variable FlushedCV;
    uint64_t QueuedCount = 0;
    uint64_t WrittenCount = 0;

    std::thread LoggerThread;
    std::atomic<LogLevel> CurrentLogLevel = ATOMIC_VAR_INIT(LogLevel::INFO);
    std::function<void(LogLevel, const std::string&)> Callback;

    std::atomic<bool> Terminated = ATOMIC_VAR_INIT(false);

    std::vector<LogEntry> LogsToProcess;

    void Log(LogLevel level, std::ostringstream&& message);
    void RunLogger();
    void ProcessLogQueue();
};

// Macros for logging
#define LOG_DEBUG() Logger::getInstance().Debug()
#define LOG_INFO() Logger::getInstance().Info()
#define LOG_WARN() Logger::getInstance().Warn()
#define LOG_ERROR() Logger::getInstance().Error()
#define LOG_TERMINATE() Logger::getInstance().Terminate();


//------------------------------------------------------------------------------
// BatchError

/*
    Failures are data or contract violations: nothing is retried.
    Components return false, log the cause and keep the code for
    GetLastError().
*/
enum class BatchError {
    None,

    // Tokenization hit a symbol that is not in the alphabet
    UnknownSymbol,

    // Unpadded stacking of unequal rows, or structure maps of the wrong size
    LengthMismatch,

    // A single sequence is longer than the token budget
    BudgetViolation,

    // No usable sequences reached a collator
    EmptyBatch,

    // Bad construction or configuration value
    InvalidArgument,
};

const char* BatchErrorString(BatchError error);
