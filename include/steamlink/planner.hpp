#ifndef STEAMLINK_PLANNER_HPP
#define STEAMLINK_PLANNER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace steamlink {

// Subdirectories of steamapps that can be moved out
enum class RelocationTarget {
    DOWNLOADING, // in-progress downloads, always relocated
    TEMP         // update staging area, opt-in
};

std::string targetDirName(RelocationTarget target);

struct PlanOptions {
    bool linkTemp = true;
};

struct RelocationOperation {
    RelocationTarget target;
    std::filesystem::path linkPath;   // <steamapps>/<name>
    std::filesystem::path targetPath; // <targetRoot>/<name>
};

struct RelocationPlan {
    std::filesystem::path steamapps;
    std::filesystem::path targetRoot; // <destinationBase>/<library>_symlink
    std::vector<RelocationOperation> operations;

    // Human readable lines describing the plan, for the confirmation prompt
    std::vector<std::string> summary() const;
};

class Planner {
public:
    // Fallback folder name when steamapps has no named parent (e.g. "/steamapps")
    static const std::string FALLBACK_LIBRARY_NAME;

    // Derives <destinationBase>/<steamapps.parent.name>_symlink. Pure.
    static std::filesystem::path targetRootFor(const std::filesystem::path& steamapps,
                                               const std::filesystem::path& destinationBase);

    // Validates the source and creates destinationBase and the target root.
    // Throws RelocationError(INVALID_SOURCE) if steamapps is not a directory,
    // and std::filesystem::filesystem_error if the scaffold cannot be created.
    static RelocationPlan plan(const std::filesystem::path& steamapps,
                               const std::filesystem::path& destinationBase,
                               const PlanOptions& options);
};

} // namespace steamlink

#endif // STEAMLINK_PLANNER_HPP
