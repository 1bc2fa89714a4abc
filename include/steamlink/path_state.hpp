#ifndef STEAMLINK_PATH_STATE_HPP
#define STEAMLINK_PATH_STATE_HPP

#include <filesystem>
#include <string>

namespace steamlink {

// What currently sits at a link path. Exactly one applies to any path.
enum class PathState {
    MISSING,
    SYMLINK_CORRECT,     // symlink pointing at the intended target, present or not
    SYMLINK_WRONG,       // symlink pointing elsewhere, or not readable
    EMPTY_DIRECTORY,
    NON_EMPTY_DIRECTORY,
    NON_DIRECTORY_FILE
};

std::string pathStateString(PathState state);

// Never throws. A dangling symlink is SYMLINK_WRONG unless it points at
// targetPath itself.
PathState classifyPath(const std::filesystem::path& linkPath,
                       const std::filesystem::path& targetPath);

} // namespace steamlink

#endif // STEAMLINK_PATH_STATE_HPP
