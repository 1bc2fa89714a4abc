#include "steamlink/planner.hpp"
#include "steamlink/errors.hpp"
#include "steamlink/logger.hpp"

namespace steamlink {

const std::string Planner::FALLBACK_LIBRARY_NAME = "steam_library";

std::string targetDirName(RelocationTarget target) {
    switch (target) {
        case RelocationTarget::DOWNLOADING: return "downloading";
        case RelocationTarget::TEMP:        return "temp";
    }
    return "";
}

std::vector<std::string> RelocationPlan::summary() const {
    std::vector<std::string> lines;
    lines.push_back("Library steamapps: " + steamapps.string());
    lines.push_back("Target root: " + targetRoot.string());
    for (const auto& op : operations) {
        lines.push_back("  - " + targetDirName(op.target) + ": " + op.linkPath.string() +
                        " -> " + op.targetPath.string());
    }
    return lines;
}

std::filesystem::path Planner::targetRootFor(const std::filesystem::path& steamapps,
                                             const std::filesystem::path& destinationBase) {
    // "/games/lib/steamapps/" has an empty filename; strip it first
    std::filesystem::path source = steamapps;
    if (!source.has_filename() && source.has_parent_path()) {
        source = source.parent_path();
    }

    std::string libName = source.parent_path().filename().string();
    if (libName.empty() || libName == "/" || libName == "." || libName == "..") {
        libName = FALLBACK_LIBRARY_NAME;
    }
    return destinationBase / (libName + "_symlink");
}

RelocationPlan Planner::plan(const std::filesystem::path& steamapps,
                             const std::filesystem::path& destinationBase,
                             const PlanOptions& options) {
    std::error_code ec;
    if (!std::filesystem::is_directory(steamapps, ec)) {
        throw RelocationError(ErrorKind::INVALID_SOURCE, "Not a directory: " + steamapps.string());
    }

    RelocationPlan plan;
    plan.steamapps = steamapps;
    plan.targetRoot = targetRootFor(steamapps, destinationBase);

    std::filesystem::create_directories(destinationBase);
    std::filesystem::create_directories(plan.targetRoot);
    LOG_DEBUG("Target root ready: " + plan.targetRoot.string());

    std::vector<RelocationTarget> targets = {RelocationTarget::DOWNLOADING};
    if (options.linkTemp) {
        targets.push_back(RelocationTarget::TEMP);
    }

    for (auto target : targets) {
        const std::string name = targetDirName(target);
        plan.operations.push_back({target, steamapps / name, plan.targetRoot / name});
    }
    return plan;
}

} // namespace steamlink
