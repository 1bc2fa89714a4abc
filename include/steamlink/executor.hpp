#ifndef STEAMLINK_EXECUTOR_HPP
#define STEAMLINK_EXECUTOR_HPP

#include "steamlink/errors.hpp"
#include "steamlink/link_util.hpp"
#include "steamlink/path_state.hpp"
#include "steamlink/planner.hpp"
#include "steamlink/prompter.hpp"
#include <functional>
#include <string>
#include <vector>

namespace steamlink {

enum class Outcome {
    LINKED,         // a new symlink is in place
    ALREADY_LINKED, // nothing to do
    SKIPPED,        // user declined, nothing touched
    FAILED
};

std::string outcomeString(Outcome outcome);

struct OperationResult {
    RelocationOperation operation;
    PathState state = PathState::MISSING;
    Outcome outcome = Outcome::FAILED;
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    bool failed() const { return outcome == Outcome::FAILED; }

    // The line appended to the run log; failures carry an "ERROR: " prefix
    std::string logLine() const;
};

using LogSink = std::function<void(const std::string&)>;

class Executor {
public:
    explicit Executor(Prompter& prompter, LinkFunction link = createDirectorySymlink);

    // Classifies op.linkPath and performs the matching transition. Never
    // throws; every failure ends up in the result and is raised as an alert.
    OperationResult execute(const RelocationOperation& op);

    // Executes every operation of the plan in order, one log line each.
    // A failing operation does not stop the ones after it.
    std::vector<OperationResult> run(const RelocationPlan& plan, const LogSink& sink);

private:
    OperationResult dispatch(const RelocationOperation& op, PathState state);

    OperationResult replaceSymlink(const RelocationOperation& op);
    OperationResult replaceEmptyDirectory(const RelocationOperation& op);
    OperationResult moveContentsAndLink(const RelocationOperation& op);
    OperationResult linkMissing(const RelocationOperation& op);

    // Runs the link primitive and shapes the result
    OperationResult link(const RelocationOperation& op, PathState state,
                         const std::string& successPrefix);

    Prompter& prompter_;
    LinkFunction link_;
};

} // namespace steamlink

#endif // STEAMLINK_EXECUTOR_HPP
