#ifndef STEAMLINK_LINK_UTIL_HPP
#define STEAMLINK_LINK_UTIL_HPP

#include "steamlink/errors.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>

namespace steamlink {

struct LinkResult {
    bool ok = false;
    ErrorKind error = ErrorKind::NONE;
    std::string message;
};

// Signature of the link primitive, so callers can substitute it
using LinkFunction = std::function<LinkResult(const std::filesystem::path& linkPath,
                                              const std::filesystem::path& targetPath)>;

// Creates linkPath -> targetPath as a directory symlink. Refusals by the OS
// map to INSUFFICIENT_PRIVILEGE with remediation text, anything else to
// LINK_CREATION_FAILED.
LinkResult createDirectorySymlink(const std::filesystem::path& linkPath,
                                  const std::filesystem::path& targetPath);

// Guidance shown when the host refuses to create symlinks
std::string privilegeRemediation();

namespace fsutil {

// rename(), or copyThenRemove() when src and dst are on different volumes.
// Throws std::filesystem::filesystem_error.
void moveEntry(const std::filesystem::path& src, const std::filesystem::path& dst);

// Recursive copy keeping symlinks as symlinks, then removal of src
void copyThenRemove(const std::filesystem::path& src, const std::filesystem::path& dst);

// Removes a directory that was just emptied by moveDirContents(), including
// anything written into it since. Throws RelocationError(MOVE_FAILURE).
void removeMovedSource(const std::filesystem::path& dir);

// Moves every entry of src into dst (created if needed). Existing entries
// in dst are never overwritten. Returns the number of entries moved; throws
// RelocationError(MOVE_FAILURE) on the first failure.
size_t moveDirContents(const std::filesystem::path& src, const std::filesystem::path& dst);

} // namespace fsutil

} // namespace steamlink

#endif // STEAMLINK_LINK_UTIL_HPP
