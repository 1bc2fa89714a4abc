#ifndef STEAMLINK_LOGGER_HPP
#define STEAMLINK_LOGGER_HPP

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace steamlink {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Process-wide log. Every line lands in the session file with a timestamp;
// the console gets a short "[LEVEL] message" form. Warnings and errors go to
// stderr unconditionally, debug and info to stdout only when verbose.
class Logger {
public:
    static Logger& instance();

    // Opens (appends to) the session log and writes the session banner.
    // Returns false if the file could not be opened; logging then stays
    // console-only.
    bool init(const std::filesystem::path& logPath, bool verbose);
    void shutdown();

    void log(LogLevel level, const std::string& message);
    bool hasFile();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger() = default;
    ~Logger();

    void writeBanner();

    std::ofstream logFile_;
    std::filesystem::path logPath_;
    bool verbose_ = false;
    std::mutex mutex_;
};

const char* logLevelTag(LogLevel level);

#define LOG_DEBUG(msg) steamlink::Logger::instance().log(steamlink::LogLevel::DEBUG, msg)
#define LOG_INFO(msg) steamlink::Logger::instance().log(steamlink::LogLevel::INFO, msg)
#define LOG_WARN(msg) steamlink::Logger::instance().log(steamlink::LogLevel::WARNING, msg)
#define LOG_ERROR(msg) steamlink::Logger::instance().log(steamlink::LogLevel::ERROR, msg)

} // namespace steamlink

#endif // STEAMLINK_LOGGER_HPP
