#include "steamlink/diagnostics.hpp"
#include "steamlink/logger.hpp"
#include "steamlink/planner.hpp"

namespace steamlink {

int Diagnostics::failureCount() const {
    int count = 0;
    for (const auto& check : results_) {
        if (!check.second.ok)
            count++;
    }
    return count;
}

bool Diagnostics::runChecks(const std::vector<std::filesystem::path>& steamappsDirs,
                            const std::filesystem::path& destinationBase, bool linkTemp) {
    results_.clear();

    for (const auto& steamapps : steamappsDirs) {
        checkTarget(steamapps, targetDirName(RelocationTarget::DOWNLOADING), destinationBase);
        if (linkTemp) {
            checkTarget(steamapps, targetDirName(RelocationTarget::TEMP), destinationBase);
        }
    }

    LOG_DEBUG("Diagnostics: " + std::to_string(results_.size()) + " checks, " +
              std::to_string(failureCount()) + " not linked");
    return failureCount() == 0;
}

void Diagnostics::checkTarget(const std::filesystem::path& steamapps, const std::string& name,
                              const std::filesystem::path& destinationBase) {
    const std::filesystem::path linkPath = steamapps / name;

    std::filesystem::path targetPath;
    if (!destinationBase.empty()) {
        targetPath = Planner::targetRootFor(steamapps, destinationBase) / name;
    } else {
        // No destination chosen: judge a link only by whether it resolves
        std::error_code ec;
        targetPath = std::filesystem::read_symlink(linkPath, ec);
        if (!ec && targetPath.is_relative()) {
            targetPath = linkPath.parent_path() / targetPath;
        }
    }

    PathState state = classifyPath(linkPath, targetPath);
    bool ok = state == PathState::SYMLINK_CORRECT;

    std::string message = pathStateString(state);
    if (ok) {
        std::error_code ec;
        if (!std::filesystem::is_directory(linkPath, ec)) {
            ok = false;
            message = destinationBase.empty() ? "broken link" : "linked, target folder missing";
        }
    } else if (state == PathState::SYMLINK_WRONG && destinationBase.empty()) {
        message = "broken link";
    }

    std::string detail = linkPath.string();
    if (!targetPath.empty()) {
        detail += " -> " + targetPath.string();
    }

    results_.push_back({linkPath.string(), {ok, state, message, detail, steamapps.string()}});
}

} // namespace steamlink
