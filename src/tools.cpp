#include "tools.hpp"

#include <iostream>


//------------------------------------------------------------------------------
// Logger

// Initialize static members
std::unique_ptr<Logger> Logger::Instance;
std::once_flag Logger::InitInstanceFlag;

Logger& Logger::getInstance() {
    std::call_once(InitInstanceFlag, []() {
        Instance.reset(new Logger);
    });
    return *Instance;
}

Logger::Logger() {
    LoggerThread = std::thread(&Logger::RunLogger, this);
}

Logger::~Logger() {
    Terminate();
    if (LoggerThread.joinable()) {
        LoggerThread.join();
    }

    // Process any remaining logs
    LogsToProcess.swap(LogQueue);
    ProcessLogQueue();
}

void Logger::SetLogLevel(LogLevel level) {
    CurrentLogLevel = level;
}

void Logger::SetCallback(std::function<void(LogLevel, const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(LogQueueMutex);
    Callback = callback;
}

bool Logger::ParseLogLevel(const std::string& name, LogLevel& level_out) {
    if (name == "debug") {
        level_out = LogLevel::DEBUG;
    } else if (name == "info") {
        level_out = LogLevel::INFO;
    } else if (name == "warn") {
        level_out = LogLevel::WARN;
    } else if (name == "error") {
        level_out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

void Logger::Log(LogLevel level, std::ostringstream&& message) {
    std::lock_guard<std::mutex> lock(LogQueueMutex);
    LogQueue.push_back({level, message.str()});
    QueuedCount++;
    LogQueueCV.notify_one();
}

void Logger::Flush() {
    std::unique_lock<std::mutex> lock(LogQueueMutex);
    const uint64_t target = QueuedCount;
    FlushedCV.wait(lock, [this, target] { return WrittenCount >= target || Terminated; });
}

void Logger::Terminate() {
    Terminated = true;
    LogQueueCV.notify_one();
    FlushedCV.notify_all();
}

void Logger::RunLogger() {
    while (!Terminated) {
        uint64_t batch_count = 0;
        {
            std::unique_lock<std::mutex> lock(LogQueueMutex);
            LogQueueCV.wait(lock, [this] { return !LogQueue.empty() || Terminated; });
            LogsToProcess.swap(LogQueue);
            batch_count = LogsToProcess.size();
        }

        ProcessLogQueue();

        {
            std::lock_guard<std::mutex> lock(LogQueueMutex);
            WrittenCount += batch_count;
        }
        FlushedCV.notify_all();

        if (Terminated) {
            break;
        }
    }
}

void Logger::ProcessLogQueue() {
    if (LogsToProcess.empty()) {
        return;
    }

    std::function<void(LogLevel, const std::string&)> callback;
    {
        std::lock_guard<std::mutex> lock(LogQueueMutex);
        callback = Callback;
    }

    for (const auto& entry : LogsToProcess) {
        if (entry.Level < CurrentLogLevel) {
            continue;
        }
        if (callback) {
            callback(entry.Level, entry.Message);
            continue;
        }
        switch (entry.Level) {
            case LogLevel::DEBUG:
                std::cout << "[DEBUG] " << entry.Message << std::endl;
                break;
            case LogLevel::INFO:
                std::cout << "[INFO] " << entry.Message << std::endl;
                break;
            case LogLevel::WARN:
                std::cerr << "[WARN] " << entry.Message << std::endl;
                break;
            case LogLevel::ERROR:
                std::cerr << "[ERROR] " << entry.Message << std::endl;
                break;
        }
    }

    LogsToProcess.clear();
}


//------------------------------------------------------------------------------
// BatchError

const char* BatchErrorString(BatchError error)
{
    switch (error) {
        case BatchError::None: return "None";
        case BatchError::UnknownSymbol: return "UnknownSymbol";
        case BatchError::LengthMismatch: return "LengthMismatch";
        case BatchError::BudgetViolation: return "BudgetViolation";
        case BatchError::EmptyBatch: return "EmptyBatch";
        case BatchError::InvalidArgument: return "InvalidArgument";
    }
    return "Unknown";
}

