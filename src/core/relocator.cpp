#include "steamlink/relocator.hpp"
#include "steamlink/errors.hpp"
#include "steamlink/logger.hpp"
#include "steamlink/planner.hpp"
#include <utility>

namespace steamlink {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

// "/x/steamapps/" -> "/x/steamapps", keeps a bare "/"
std::string stripTrailingSeparators(std::string s) {
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

} // namespace

bool RunReport::ok() const {
    if (status != RunStatus::COMPLETED) return false;
    for (const auto& result : results) {
        if (result.failed()) return false;
    }
    return true;
}

Relocator::Relocator(Prompter& prompter, LinkFunction link)
    : prompter_(prompter), link_(std::move(link)) {}

RunReport Relocator::run(const RelocationRequest& request, const LogSink& sink) {
    RunReport report;
    auto append = [&](const std::string& line) {
        report.log.push_back(line);
        if (sink) sink(line);
    };

    const std::string steamappsStr = stripTrailingSeparators(trim(request.steamapps));
    const std::string destinationStr = trim(request.destinationBase);

    if (steamappsStr.empty()) {
        prompter_.alert("Missing input", "Please select a steamapps directory to modify.");
        return report;
    }
    if (destinationStr.empty()) {
        prompter_.alert("Missing input", "Please select a destination base folder.");
        return report;
    }

    std::filesystem::path steamapps(steamappsStr);
    if (steamapps.filename() != "steamapps") {
        if (!prompter_.confirm("Confirm steamapps",
                               "Selected directory does not end with 'steamapps':\n" + steamapps.string() +
                                   "\n\nProceed anyway?")) {
            LOG_INFO("Run cancelled, source is not named steamapps: " + steamapps.string());
            report.status = RunStatus::CANCELLED;
            return report;
        }
    }

    try {
        report.plan = Planner::plan(steamapps, std::filesystem::path(destinationStr),
                                    PlanOptions{request.linkTemp});
    } catch (const RelocationError& e) {
        report.status = RunStatus::INVALID_SOURCE;
        append("ERROR: " + std::string(e.what()));
        prompter_.alert("Invalid path", e.what());
        return report;
    } catch (const std::filesystem::filesystem_error& e) {
        report.status = RunStatus::SETUP_FAILED;
        append("ERROR: Could not prepare destination: " + std::string(e.what()));
        prompter_.alert("Destination Error", e.what());
        return report;
    }

    std::string summary;
    for (const auto& line : report.plan.summary()) {
        summary += "\n" + line;
    }
    if (!prompter_.confirm("Proceed?", "This will create/replace symlinks as follows:\n" + summary)) {
        LOG_INFO("Run cancelled at plan confirmation");
        report.status = RunStatus::CANCELLED;
        return report;
    }

    LOG_INFO("Relocating " + std::to_string(report.plan.operations.size()) + " target(s) of " +
             report.plan.steamapps.string());
    Executor executor(prompter_, link_);
    report.results = executor.run(report.plan, append);
    report.status = RunStatus::COMPLETED;

    prompter_.notify("Done", "Requested symlinks processed. Check the log for details.");
    return report;
}

std::filesystem::path Relocator::suggestDestinationBase(const std::vector<std::filesystem::path>& hints) {
    for (const auto& hint : hints) {
        std::error_code ec;
        if (std::filesystem::exists(hint, ec)) {
            return hint;
        }
    }
    return {};
}

} // namespace steamlink
