#pragma once

#include "core/core_export.hpp"
#include "core/blob.hpp"
#include "core/blobref.hpp"
#include <stdexcept>
#include <string>

namespace capshare::store {

/**
 * @brief Failure reported by a storage backend
 */
class CAPSHARE_CORE_EXPORT StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Client view of a content-addressed storage backend
 *
 * Uploading an object that is already present is not an error and yields
 * the same reference. All methods throw StoreError on failure.
 */
class CAPSHARE_CORE_EXPORT StorageClient {
public:
    virtual ~StorageClient() = default;

    /**
     * @brief Durably store a blob
     * @param blob Blob to store
     * @return Reference under which the blob is stored
     */
    virtual core::BlobRef upload(const core::Blob& blob) = 0;

    /**
     * @brief Reference of the server's public-key blob (the claim signer)
     */
    virtual core::BlobRef serverIdentityRef() = 0;

    /**
     * @brief URL path prefix of the server's share handler, e.g. "/share/"
     */
    virtual std::string shareRoot() = 0;
};

} // namespace capshare::store
