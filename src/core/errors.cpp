#include "steamlink/errors.hpp"

namespace steamlink {

std::string errorKindString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                   return "None";
        case ErrorKind::DISCOVERY_READ_FAILURE: return "DiscoveryReadFailure";
        case ErrorKind::INVALID_SOURCE:         return "InvalidSource";
        case ErrorKind::INSUFFICIENT_PRIVILEGE: return "InsufficientPrivilege";
        case ErrorKind::LINK_CREATION_FAILED:   return "LinkCreationFailed";
        case ErrorKind::MOVE_FAILURE:           return "MoveFailure";
        case ErrorKind::NOT_A_DIRECTORY:        return "NotADirectory";
    }
    return "Unknown";
}

} // namespace steamlink
