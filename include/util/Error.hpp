#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace nx {

enum class ErrorCode {
    PermissionDenied,
    NotFound,
    NotADirectory,
    RestoreCollision,   // destination already occupied
    TraversalFault,
    ManifestCorrupt,
    InvalidId,
    InvalidArgument,
    IoFailure
};

[[nodiscard]] std::string_view to_string(ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what) : std::runtime_error(what), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Maps an errno-backed std::error_code onto the taxonomy. EEXIST/ENOTEMPTY only
// count as a collision when the caller was moving something into place.
[[nodiscard]] ErrorCode errorFromCode(const std::error_code& ec, bool collisionContext = false);

[[noreturn]] void throwFromCode(const std::error_code& ec, const std::string& what, bool collisionContext = false);

}
