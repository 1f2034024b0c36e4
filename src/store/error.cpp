#include "llvmsel/error.hpp"
#include "llvmsel/platform.hpp"

namespace llvmsel {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_INSTALLED: return "not_installed";
        case ErrorCode::ALREADY_INSTALLED: return "already_installed";
        case ErrorCode::FETCH_FAILURE: return "fetch_failure";
        case ErrorCode::BUILD_FAILURE: return "build_failure";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::IO_ERROR: return "io_error";
    }
    return "io_error";
}

Error filesystem_error(const std::error_code& ec, const std::string& message) {
    if (is_permission_error(ec)) {
        return Error(ErrorCode::PERMISSION_DENIED, message);
    }
    return Error(ErrorCode::IO_ERROR, message);
}

} // namespace llvmsel
