#include "steamlink/logger.hpp"
#include "steamlink/version.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace steamlink {

namespace {

std::string fileTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return ss.str();
}

} // namespace

const char* logLevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "?";
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::~Logger() {
    shutdown();
}

bool Logger::init(const std::filesystem::path& logPath, bool verbose) {
    std::lock_guard<std::mutex> lock(mutex_);
    verbose_ = verbose;
    if (logFile_.is_open()) logFile_.close();

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
    }
    logFile_.open(logPath, std::ios::out | std::ios::app);
    if (!logFile_.is_open()) {
        std::cerr << "[WARN] cannot write log file " << logPath.string() << ", logging to console only\n";
        logPath_.clear();
        return false;
    }
    logPath_ = logPath;
    writeBanner();
    return true;
}

void Logger::writeBanner() {
    logFile_ << "\n--- steamlink v" << STEAMLINK_VERSION_STRING
             << " | pid " << ::getpid()
             << " | " << fileTimestamp()
             << (verbose_ ? " | verbose" : "") << " ---\n";
    logFile_.flush();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (logFile_.is_open()) {
        logFile_ << "--- session end ---\n";
        logFile_.close();
    }
    logPath_.clear();
}

bool Logger::hasFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    return logFile_.is_open();
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    const char* tag = logLevelTag(level);

    if (logFile_.is_open()) {
        logFile_ << fileTimestamp() << " [" << tag << "] " << message << '\n';
        // Errors are often the last thing written before exit
        if (level == LogLevel::ERROR) logFile_.flush();
    }

    bool loud = level == LogLevel::WARNING || level == LogLevel::ERROR;
    if (loud) {
        std::cerr << '[' << tag << "] " << message << std::endl;
    } else if (verbose_) {
        std::cout << '[' << tag << "] " << message << '\n';
    }
}

} // namespace steamlink
