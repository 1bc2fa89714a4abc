#ifndef STEAMLINK_ERRORS_HPP
#define STEAMLINK_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace steamlink {

enum class ErrorKind {
    NONE,
    DISCOVERY_READ_FAILURE, // absorbed during discovery, only logged
    INVALID_SOURCE,         // aborts a run before any mutation
    INSUFFICIENT_PRIVILEGE, // host refused the symlink, needs remediation
    LINK_CREATION_FAILED,
    MOVE_FAILURE,
    NOT_A_DIRECTORY         // link path is occupied by a file, left alone
};

std::string errorKindString(ErrorKind kind);

class RelocationError : public std::runtime_error {
public:
    RelocationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace steamlink

#endif // STEAMLINK_ERRORS_HPP
