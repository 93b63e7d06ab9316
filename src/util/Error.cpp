#include "util/Error.hpp"

#include <cerrno>

namespace nx {

std::string_view to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::NotADirectory: return "NotADirectory";
        case ErrorCode::RestoreCollision: return "RestoreCollision";
        case ErrorCode::TraversalFault: return "TraversalFault";
        case ErrorCode::ManifestCorrupt: return "ManifestCorrupt";
        case ErrorCode::InvalidId: return "InvalidId";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoFailure: return "IoFailure";
    }
    return "Unknown";
}

ErrorCode errorFromCode(const std::error_code& ec, const bool collisionContext) {
    switch (ec.value()) {
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        case ENOENT:
            return ErrorCode::NotFound;
        case ENOTDIR:
            return ErrorCode::NotADirectory;
        case EEXIST:
        case ENOTEMPTY:
            return collisionContext ? ErrorCode::RestoreCollision : ErrorCode::IoFailure;
        default:
            return ErrorCode::IoFailure;
    }
}

void throwFromCode(const std::error_code& ec, const std::string& what, const bool collisionContext) {
    throw Error(errorFromCode(ec, collisionContext), what + ": " + ec.message());
}

}
