#include "steamlink/path_state.hpp"
#include "steamlink/logger.hpp"

namespace steamlink {

std::string pathStateString(PathState state) {
    switch (state) {
        case PathState::MISSING:             return "missing";
        case PathState::SYMLINK_CORRECT:     return "linked";
        case PathState::SYMLINK_WRONG:       return "linked elsewhere";
        case PathState::EMPTY_DIRECTORY:     return "empty directory";
        case PathState::NON_EMPTY_DIRECTORY: return "directory with contents";
        case PathState::NON_DIRECTORY_FILE:  return "not a directory";
    }
    return "unknown";
}

PathState classifyPath(const std::filesystem::path& linkPath,
                       const std::filesystem::path& targetPath) {
    std::error_code ec;
    auto status = std::filesystem::symlink_status(linkPath, ec);
    if (ec || !std::filesystem::exists(status)) {
        return PathState::MISSING;
    }

    if (std::filesystem::is_symlink(status)) {
        // Follow one hop by hand so a link to a not yet (or no longer)
        // existing target directory still compares by where it points
        std::error_code linkEc;
        std::error_code targetEc;
        auto pointee = std::filesystem::read_symlink(linkPath, linkEc);
        std::filesystem::path resolvedLink;
        if (!linkEc) {
            if (pointee.is_relative()) pointee = linkPath.parent_path() / pointee;
            resolvedLink = std::filesystem::weakly_canonical(pointee, linkEc);
        }
        auto resolvedTarget = std::filesystem::weakly_canonical(targetPath, targetEc);
        if (linkEc || targetEc) {
            LOG_DEBUG("Could not resolve " + linkPath.string() + " against " + targetPath.string());
            return PathState::SYMLINK_WRONG;
        }
        return resolvedLink == resolvedTarget ? PathState::SYMLINK_CORRECT : PathState::SYMLINK_WRONG;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator it(linkPath, ec);
        if (ec) {
            // Unreadable: assume there is something worth keeping in it
            return PathState::NON_EMPTY_DIRECTORY;
        }
        return it == std::filesystem::directory_iterator() ? PathState::EMPTY_DIRECTORY
                                                            : PathState::NON_EMPTY_DIRECTORY;
    }

    return PathState::NON_DIRECTORY_FILE;
}

} // namespace steamlink
