#ifndef STEAMLINK_RELOCATOR_HPP
#define STEAMLINK_RELOCATOR_HPP

#include "steamlink/executor.hpp"
#include "steamlink/link_util.hpp"
#include "steamlink/prompter.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace steamlink {

// What the front-end collects from the user
struct RelocationRequest {
    std::string steamapps;
    std::string destinationBase;
    bool linkTemp = true;
};

enum class RunStatus {
    COMPLETED,     // every operation was attempted
    CANCELLED,     // user declined before anything was touched
    INVALID_INPUT, // a path was left empty
    INVALID_SOURCE,
    SETUP_FAILED   // destination scaffold could not be created
};

struct RunReport {
    RunStatus status = RunStatus::INVALID_INPUT;
    RelocationPlan plan;
    std::vector<OperationResult> results;
    std::vector<std::string> log;

    // COMPLETED with no failed operation
    bool ok() const;
};

// One relocation run across the presentation boundary: input checks, the
// plan confirmation, execution and the closing notice.
class Relocator {
public:
    explicit Relocator(Prompter& prompter, LinkFunction link = createDirectorySymlink);

    RunReport run(const RelocationRequest& request, const LogSink& sink = nullptr);

    // First existing mount area, or an empty path
    static std::filesystem::path suggestDestinationBase(
        const std::vector<std::filesystem::path>& hints = {"/mnt", "/media", "/run/media"});

private:
    Prompter& prompter_;
    LinkFunction link_;
};

} // namespace steamlink

#endif // STEAMLINK_RELOCATOR_HPP
