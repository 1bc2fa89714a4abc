#include "steamlink/link_util.hpp"
#include "steamlink/logger.hpp"
#include <vector>

namespace steamlink {

namespace {

bool isPrivilegeError(const std::error_code& ec) {
#ifdef _WIN32
    return ec.value() == 1314; // ERROR_PRIVILEGE_NOT_HELD
#else
    return ec == std::errc::operation_not_permitted || ec == std::errc::permission_denied;
#endif
}

} // namespace

std::string privilegeRemediation() {
#ifdef _WIN32
    return "Failed to create symlink due to insufficient privileges.\n"
           "To fix this, either:\n"
           "1. Run this application as Administrator, OR\n"
           "2. Enable Developer Mode in Windows Settings:\n"
           "   Settings > Update & Security > For developers > Developer Mode";
#else
    return "Failed to create symlink: the system refused permission.\n"
           "To fix this, either:\n"
           "1. Make sure you own the steamapps directory and can write to it, OR\n"
           "2. Check that the filesystem holding steamapps supports symbolic links\n"
           "   (FAT32/exFAT and some network shares do not)";
#endif
}

LinkResult createDirectorySymlink(const std::filesystem::path& linkPath,
                                  const std::filesystem::path& targetPath) {
    LinkResult result;
    const std::string where = "Target: " + linkPath.string() + " -> " + targetPath.string();

    std::error_code ec;
    std::filesystem::create_directory_symlink(targetPath, linkPath, ec);
    if (!ec) {
        result.ok = true;
        result.message = "Successfully created symlink: " + linkPath.string() + " -> " + targetPath.string();
        return result;
    }

    if (isPrivilegeError(ec)) {
        result.error = ErrorKind::INSUFFICIENT_PRIVILEGE;
        result.message = privilegeRemediation() + "\n\n" + where;
    } else {
        result.error = ErrorKind::LINK_CREATION_FAILED;
        result.message = "Failed to create symlink: " + ec.message() + "\n" + where;
    }
    LOG_DEBUG(errorKindString(result.error) + ": " + ec.message() + " (" + linkPath.string() + ")");
    return result;
}

namespace fsutil {

void moveEntry(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::error_code ec;
    std::filesystem::rename(src, dst, ec);
    if (!ec) return;

    if (ec != std::errc::cross_device_link) {
        throw std::filesystem::filesystem_error("rename", src, dst, ec);
    }

    LOG_DEBUG("Cross-volume move, copying " + src.string());
    copyThenRemove(src, dst);
}

void copyThenRemove(const std::filesystem::path& src, const std::filesystem::path& dst) {
    std::filesystem::copy(src, dst,
                          std::filesystem::copy_options::recursive |
                              std::filesystem::copy_options::copy_symlinks);
    std::filesystem::remove_all(src);
}

void removeMovedSource(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::remove(dir, ec);
    if (!ec) return;

    // Something was written into it meanwhile
    LOG_WARN("Removing leftover entries in " + dir.string() + ": " + ec.message());
    std::error_code removeEc;
    std::filesystem::remove_all(dir, removeEc);
    if (removeEc) {
        throw RelocationError(ErrorKind::MOVE_FAILURE,
                              "Could not remove " + dir.string() + " after moving its contents: " +
                                  removeEc.message());
    }
}

size_t moveDirContents(const std::filesystem::path& src, const std::filesystem::path& dst) {
    size_t moved = 0;
    try {
        std::filesystem::create_directories(dst);

        // Snapshot first; moving entries while iterating is unspecified
        std::vector<std::filesystem::path> entries;
        for (const auto& entry : std::filesystem::directory_iterator(src)) {
            entries.push_back(entry.path());
        }

        for (const auto& entry : entries) {
            std::filesystem::path destination = dst / entry.filename();
            std::error_code ec;
            if (std::filesystem::exists(std::filesystem::symlink_status(destination, ec))) {
                throw RelocationError(ErrorKind::MOVE_FAILURE,
                                      "Destination already exists: " + destination.string());
            }
            moveEntry(entry, destination);
            ++moved;
        }
    } catch (const RelocationError& e) {
        throw RelocationError(ErrorKind::MOVE_FAILURE,
                              std::string(e.what()) + " (" + std::to_string(moved) + " entries moved before the failure)");
    } catch (const std::exception& e) {
        throw RelocationError(ErrorKind::MOVE_FAILURE,
                              "Failed to move contents of " + src.string() + ": " + e.what() + " (" +
                                  std::to_string(moved) + " entries moved before the failure)");
    }
    return moved;
}

} // namespace fsutil

} // namespace steamlink
