#pragma once

#include "core/core_export.hpp"
#include <stdexcept>
#include <string>

namespace capshare::share {

/**
 * @brief Failure classes of a share operation
 */
enum class ErrorKind {
    Validation,        // Malformed or missing selection fields
    Identity,          // Signer identity or share root lookup failed
    Signing,           // Claim could not be built or signed
    Upload,            // A blob could not be stored
    PrefixResolution,  // Share succeeded but the absolute URL cannot be derived
    Internal           // Unexpected failure of a collaborator or the runtime
};

CAPSHARE_CORE_EXPORT const char* errorKindName(ErrorKind kind);

class CAPSHARE_CORE_EXPORT ShareError : public std::runtime_error {
public:
    ShareError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class CAPSHARE_CORE_EXPORT ValidationError : public ShareError {
public:
    explicit ValidationError(const std::string& what)
        : ShareError(ErrorKind::Validation, what) {}
};

class CAPSHARE_CORE_EXPORT IdentityError : public ShareError {
public:
    explicit IdentityError(const std::string& what)
        : ShareError(ErrorKind::Identity, what) {}
};

class CAPSHARE_CORE_EXPORT SigningError : public ShareError {
public:
    explicit SigningError(const std::string& what)
        : ShareError(ErrorKind::Signing, what) {}
};

class CAPSHARE_CORE_EXPORT UploadError : public ShareError {
public:
    explicit UploadError(const std::string& what)
        : ShareError(ErrorKind::Upload, what) {}
};

class CAPSHARE_CORE_EXPORT PrefixResolutionError : public ShareError {
public:
    explicit PrefixResolutionError(const std::string& what)
        : ShareError(ErrorKind::PrefixResolution, what) {}
};

/**
 * @brief Rethrow error as the same kind with context prepended to its message
 */
[[noreturn]] CAPSHARE_CORE_EXPORT void rethrowWithContext(const ShareError& error,
                                                         const std::string& context);

} // namespace capshare::share
