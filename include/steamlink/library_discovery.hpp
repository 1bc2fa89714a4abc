#ifndef STEAMLINK_LIBRARY_DISCOVERY_HPP
#define STEAMLINK_LIBRARY_DISCOVERY_HPP

#include <filesystem>
#include <vector>

namespace steamlink {

class LibraryDiscovery {
public:
    struct Locations {
        // steamapps directories of the usual Steam installs
        std::vector<std::filesystem::path> defaultSteamapps;
        // libraryfolders.vdf files to read additional library roots from
        std::vector<std::filesystem::path> libraryFolderFiles;
        // Library roots configured by the user
        std::vector<std::filesystem::path> extraLibraryRoots;
    };

    // Native, ~/.steam and Flatpak installs under $HOME, plus the extra
    // roots from Config.
    static Locations defaultLocations();

    LibraryDiscovery();
    explicit LibraryDiscovery(Locations locations);

    // Existing steamapps directories, deduplicated and sorted. Never throws;
    // anything unreadable is skipped.
    std::vector<std::filesystem::path> discover() const;

    const Locations& locations() const { return locations_; }

private:
    Locations locations_;
};

} // namespace steamlink

#endif // STEAMLINK_LIBRARY_DISCOVERY_HPP
