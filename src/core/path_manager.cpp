#include "steamlink/path_manager.hpp"
#include "steamlink/logger.hpp"
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace steamlink {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

void PathManager::init(const std::string& rootOverride) {
    rootDir_ = resolveRoot(rootOverride);
    logsDir_ = rootDir_ / "logs";

    std::error_code ec;
    std::filesystem::create_directories(logsDir_, ec);
    if (ec) {
        std::cerr << "[steamlink] Could not create " << logsDir_ << ": " << ec.message() << "\n";
    }

    // Generate path for current session log
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;
    ss << "steamlink_" << std::put_time(std::localtime(&in_time_t), "%Y%m%d_%H%M%S") << ".log";
    currentLogPath_ = logsDir_ / ss.str();
}

std::filesystem::path PathManager::resolveRoot(const std::string& override) {
    if (!override.empty()) return std::filesystem::absolute(override);

    const char* envPath = std::getenv("STEAMLINK_PATH");
    if (envPath && strlen(envPath) > 0) return std::filesystem::absolute(envPath);

    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && strlen(xdgDataHome) > 0) {
        return std::filesystem::absolute(xdgDataHome) / "steamlink";
    }

    std::filesystem::path homeDir = home();
    if (homeDir.empty()) homeDir = "/tmp";
    return homeDir / ".local" / "share" / "steamlink";
}

std::filesystem::path PathManager::home() {
    const char* home = std::getenv("HOME");
    if (!home || strlen(home) == 0) return {};
    return std::filesystem::path(home);
}

std::filesystem::path PathManager::expand(const std::string& raw) {
    std::string path = raw;

    // "~" and "~/..." only; "~user" is left as is
    if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
        std::filesystem::path homeDir = home();
        if (!homeDir.empty()) {
            path = homeDir.string() + path.substr(1);
        }
    }

    std::string out;
    out.reserve(path.size());
    size_t i = 0;
    while (i < path.size()) {
        if (path[i] != '$' || i + 1 >= path.size()) {
            out += path[i++];
            continue;
        }

        size_t nameStart = i + 1;
        size_t nameEnd;
        size_t next;
        if (path[nameStart] == '{') {
            size_t close = path.find('}', nameStart + 1);
            if (close == std::string::npos) {
                out += path[i++];
                continue;
            }
            nameStart += 1;
            nameEnd = close;
            next = close + 1;
        } else {
            nameEnd = nameStart;
            while (nameEnd < path.size() &&
                   (std::isalnum(static_cast<unsigned char>(path[nameEnd])) || path[nameEnd] == '_')) {
                ++nameEnd;
            }
            next = nameEnd;
        }

        std::string name = path.substr(nameStart, nameEnd - nameStart);
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        if (value) {
            out += value;
        } else {
            out += path.substr(i, next - i);
        }
        i = next;
    }

    return std::filesystem::path(out);
}

} // namespace steamlink
