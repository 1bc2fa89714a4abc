#ifndef STEAMLINK_PATH_MANAGER_HPP
#define STEAMLINK_PATH_MANAGER_HPP

#include <filesystem>
#include <string>

namespace steamlink {

class PathManager {
public:
    static PathManager& instance();

    // Initializes paths based on optional root override.
    // If rootOverride is empty, it checks STEAMLINK_PATH env, then XDG defaults.
    void init(const std::string& rootOverride = "");

    std::filesystem::path root() const { return rootDir_; }
    std::filesystem::path logs() const { return logsDir_; }
    std::filesystem::path configFile() const { return rootDir_ / "config.json"; }

    // Returns the path to the current session's log file
    std::filesystem::path currentLog() const { return currentLogPath_; }

    // $HOME, or an empty path when unset
    static std::filesystem::path home();

    // Expands a leading "~" and $VAR / ${VAR} references. Unknown variables
    // are left untouched.
    static std::filesystem::path expand(const std::string& raw);

private:
    PathManager() = default;

    std::filesystem::path rootDir_;
    std::filesystem::path logsDir_;
    std::filesystem::path currentLogPath_;

    std::filesystem::path resolveRoot(const std::string& override);
};

} // namespace steamlink

#endif // STEAMLINK_PATH_MANAGER_HPP
