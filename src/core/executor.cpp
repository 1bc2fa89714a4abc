#include "steamlink/executor.hpp"
#include "steamlink/logger.hpp"
#include <utility>

namespace steamlink {

namespace {

std::string arrow(const RelocationOperation& op) {
    return op.linkPath.string() + " -> " + op.targetPath.string();
}

OperationResult makeResult(const RelocationOperation& op, PathState state, Outcome outcome,
                           ErrorKind error, const std::string& message) {
    OperationResult result;
    result.operation = op;
    result.state = state;
    result.outcome = outcome;
    result.error = error;
    result.message = message;
    return result;
}

std::string alertTitle(const OperationResult& result) {
    if (result.error == ErrorKind::NOT_A_DIRECTORY) return "Path exists and is not a directory";
    if (result.error == ErrorKind::MOVE_FAILURE) return "Move Error";
    return "Symlink Error";
}

} // namespace

std::string outcomeString(Outcome outcome) {
    switch (outcome) {
        case Outcome::LINKED:         return "linked";
        case Outcome::ALREADY_LINKED: return "already linked";
        case Outcome::SKIPPED:        return "skipped";
        case Outcome::FAILED:         return "failed";
    }
    return "unknown";
}

std::string OperationResult::logLine() const {
    return failed() ? "ERROR: " + message : message;
}

Executor::Executor(Prompter& prompter, LinkFunction link)
    : prompter_(prompter), link_(std::move(link)) {}

OperationResult Executor::execute(const RelocationOperation& op) {
    PathState state = classifyPath(op.linkPath, op.targetPath);
    LOG_DEBUG(op.linkPath.string() + " is " + pathStateString(state));

    OperationResult result;
    try {
        result = dispatch(op, state);
    } catch (const RelocationError& e) {
        result = makeResult(op, state, Outcome::FAILED, e.kind(), e.what());
    } catch (const std::exception& e) {
        result = makeResult(op, state, Outcome::FAILED, ErrorKind::LINK_CREATION_FAILED,
                            "Failed to prepare " + arrow(op) + ": " + e.what());
    }

    if (result.failed()) {
        LOG_ERROR(result.message);
        prompter_.alert(alertTitle(result), result.message);
    } else {
        LOG_INFO(result.message);
    }
    return result;
}

std::vector<OperationResult> Executor::run(const RelocationPlan& plan, const LogSink& sink) {
    std::vector<OperationResult> results;
    results.reserve(plan.operations.size());
    for (const auto& op : plan.operations) {
        results.push_back(execute(op));
        LOG_DEBUG(targetDirName(op.target) + ": " + outcomeString(results.back().outcome));
        if (sink) sink(results.back().logLine());
    }
    return results;
}

OperationResult Executor::dispatch(const RelocationOperation& op, PathState state) {
    switch (state) {
        case PathState::SYMLINK_CORRECT:
            // The link is right; a wiped target folder just gets recreated
            std::filesystem::create_directories(op.targetPath);
            return makeResult(op, state, Outcome::ALREADY_LINKED, ErrorKind::NONE,
                              "OK: " + op.linkPath.string() + " is already linked to " +
                                  op.targetPath.string());
        case PathState::SYMLINK_WRONG:
            return replaceSymlink(op);
        case PathState::EMPTY_DIRECTORY:
            return replaceEmptyDirectory(op);
        case PathState::NON_EMPTY_DIRECTORY:
            return moveContentsAndLink(op);
        case PathState::NON_DIRECTORY_FILE:
            return makeResult(op, state, Outcome::FAILED, ErrorKind::NOT_A_DIRECTORY,
                              "Path exists and is not a directory: " + op.linkPath.string());
        case PathState::MISSING:
            return linkMissing(op);
    }
    throw std::logic_error("unhandled path state");
}

OperationResult Executor::replaceSymlink(const RelocationOperation& op) {
    const PathState state = PathState::SYMLINK_WRONG;

    std::error_code ec;
    std::filesystem::path previous = std::filesystem::read_symlink(op.linkPath, ec);
    std::string current = ec ? std::string("an unreadable target") : previous.string();

    if (!prompter_.confirm("Replace symlink",
                           op.linkPath.string() + " is a symlink to a different target (" + current +
                               "). Replace it?")) {
        return makeResult(op, state, Outcome::SKIPPED, ErrorKind::NONE,
                          "Skipped replacing symlink: " + op.linkPath.string());
    }

    std::filesystem::create_directories(op.targetPath);
    std::filesystem::remove(op.linkPath);

    OperationResult result = link(op, state, "Replaced symlink");
    if (result.failed() && !previous.empty()) {
        // Put the old link back so steamapps is left as it was
        std::error_code restoreEc;
        std::filesystem::create_directory_symlink(previous, op.linkPath, restoreEc);
        if (restoreEc) {
            result.message += "\nThe previous link to " + previous.string() + " could not be restored: " +
                              restoreEc.message();
        }
    }
    return result;
}

OperationResult Executor::replaceEmptyDirectory(const RelocationOperation& op) {
    const PathState state = PathState::EMPTY_DIRECTORY;

    std::filesystem::create_directories(op.targetPath);
    std::filesystem::remove(op.linkPath);

    OperationResult result = link(op, state, "Linked (empty replaced)");
    if (result.failed()) {
        std::error_code restoreEc;
        std::filesystem::create_directory(op.linkPath, restoreEc);
    }
    return result;
}

OperationResult Executor::moveContentsAndLink(const RelocationOperation& op) {
    const PathState state = PathState::NON_EMPTY_DIRECTORY;

    if (!prompter_.confirm("Move contents?",
                           op.linkPath.string() + " is a non-empty directory. Move its contents to " +
                               op.targetPath.string() + " and replace with a symlink?")) {
        return makeResult(op, state, Outcome::SKIPPED, ErrorKind::NONE,
                          "Skipped: left existing directory: " + op.linkPath.string());
    }

    size_t moved = fsutil::moveDirContents(op.linkPath, op.targetPath);
    LOG_INFO("Moved " + std::to_string(moved) + " entries from " + op.linkPath.string());

    fsutil::removeMovedSource(op.linkPath);

    OperationResult result = link(op, state, "Moved contents and linked");
    if (result.failed()) {
        result.message += "\nThe moved contents are now in " + op.targetPath.string();
    }
    return result;
}

OperationResult Executor::linkMissing(const RelocationOperation& op) {
    std::filesystem::create_directories(op.targetPath);
    return link(op, PathState::MISSING, "Linked");
}

OperationResult Executor::link(const RelocationOperation& op, PathState state,
                               const std::string& successPrefix) {
    LinkResult linked = link_(op.linkPath, op.targetPath);
    if (linked.ok) {
        return makeResult(op, state, Outcome::LINKED, ErrorKind::NONE, successPrefix + ": " + arrow(op));
    }
    ErrorKind error = linked.error == ErrorKind::NONE ? ErrorKind::LINK_CREATION_FAILED : linked.error;
    return makeResult(op, state, Outcome::FAILED, error, linked.message);
}

} // namespace steamlink
