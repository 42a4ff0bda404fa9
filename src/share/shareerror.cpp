#include "share/shareerror.hpp"

namespace capshare::share {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:
            return "validation";
        case ErrorKind::Identity:
            return "identity";
        case ErrorKind::Signing:
            return "signing";
        case ErrorKind::Upload:
            return "upload";
        case ErrorKind::PrefixResolution:
            return "prefix-resolution";
        case ErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

void rethrowWithContext(const ShareError& error, const std::string& context) {
    std::string message = context + ": " + error.what();
    switch (error.kind()) {
        case ErrorKind::Validation:
            throw ValidationError(message);
        case ErrorKind::Identity:
            throw IdentityError(message);
        case ErrorKind::Signing:
            throw SigningError(message);
        case ErrorKind::Upload:
            throw UploadError(message);
        case ErrorKind::PrefixResolution:
            throw PrefixResolutionError(message);
        case ErrorKind::Internal:
            break;
    }
    throw ShareError(error.kind(), message);
}

} // namespace capshare::share
