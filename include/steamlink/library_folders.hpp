#ifndef STEAMLINK_LIBRARY_FOLDERS_HPP
#define STEAMLINK_LIBRARY_FOLDERS_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace steamlink {

// Reads library roots out of Steam's libraryfolders.vdf. Only the
// "path" "<value>" pairs matter, so the nested KeyValues structure is not
// parsed; both the old flat layout and the newer per-library blocks work.
class LibraryFolders {
public:
    // Raw "path" values in order of appearance, nothing expanded or checked
    static std::vector<std::string> extractPathValues(const std::string& text);

    // Expanded values that currently exist on disk, in order of appearance
    static std::vector<std::filesystem::path> parse(const std::string& text);

    // Same as parse() on the file's contents. An unreadable file yields an
    // empty list.
    static std::vector<std::filesystem::path> parseFile(const std::filesystem::path& vdfPath);
};

} // namespace steamlink

#endif // STEAMLINK_LIBRARY_FOLDERS_HPP
