#include "steamlink/library_discovery.hpp"
#include "steamlink/config.hpp"
#include "steamlink/library_folders.hpp"
#include "steamlink/logger.hpp"
#include "steamlink/path_manager.hpp"
#include <set>
#include <string>
#include <utility>

namespace steamlink {

namespace {

bool isDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

bool isRegularFile(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

} // namespace

LibraryDiscovery::Locations LibraryDiscovery::defaultLocations() {
    Locations locations;

    const std::filesystem::path home = PathManager::home();
    if (!home.empty()) {
        const std::vector<std::filesystem::path> steamRoots = {
            home / ".local" / "share" / "Steam",
            home / ".steam" / "steam",
            home / ".var" / "app" / "com.valvesoftware.Steam" / ".local" / "share" / "Steam",
        };
        for (const auto& steamRoot : steamRoots) {
            locations.defaultSteamapps.push_back(steamRoot / "steamapps");
            locations.libraryFolderFiles.push_back(steamRoot / "steamapps" / "libraryfolders.vdf");
        }
    }

    auto& cfg = Config::instance();
    std::lock_guard<std::recursive_mutex> lock(cfg.getMutex());
    for (const auto& root : cfg.getGeneral().extraLibraryRoots) {
        locations.extraLibraryRoots.push_back(PathManager::expand(root));
    }

    return locations;
}

LibraryDiscovery::LibraryDiscovery() : locations_(defaultLocations()) {}

LibraryDiscovery::LibraryDiscovery(Locations locations) : locations_(std::move(locations)) {}

std::vector<std::filesystem::path> LibraryDiscovery::discover() const {
    // Ordered by the plain string so the listing is stable for display
    std::set<std::string> steamapps;

    for (const auto& dir : locations_.defaultSteamapps) {
        if (isDirectory(dir)) {
            steamapps.insert(dir.string());
        }
    }

    for (const auto& vdf : locations_.libraryFolderFiles) {
        if (!isRegularFile(vdf)) continue;
        for (const auto& libRoot : LibraryFolders::parseFile(vdf)) {
            auto dir = libRoot / "steamapps";
            if (isDirectory(dir)) {
                steamapps.insert(dir.string());
            }
        }
    }

    for (const auto& libRoot : locations_.extraLibraryRoots) {
        auto dir = libRoot / "steamapps";
        if (isDirectory(dir)) {
            steamapps.insert(dir.string());
        } else {
            LOG_WARN("Configured library root has no steamapps directory: " + libRoot.string());
        }
    }

    LOG_DEBUG("Discovered " + std::to_string(steamapps.size()) + " steamapps director(ies)");
    return std::vector<std::filesystem::path>(steamapps.begin(), steamapps.end());
}

} // namespace steamlink
