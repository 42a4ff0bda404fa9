#pragma once

#include "core/core_export.hpp"
#include "store/storageclient.hpp"
#include <memory>
#include <optional>
#include <string>

namespace capshare::store {

/**
 * @brief Content-addressed blob store backed by a SQLite database
 *
 * Blobs are keyed by their ref and written with INSERT OR IGNORE, so
 * concurrent or repeated uploads of the same content are harmless.
 */
class CAPSHARE_CORE_EXPORT SqliteBlobStore : public StorageClient {
public:
    /**
     * @brief Open (or create) a store
     * @param dbPath Path to the SQLite database file, or ":memory:"
     * @param shareRoot Share handler path; empty if sharing is disabled
     * @throws StoreError if the database cannot be opened
     */
    SqliteBlobStore(const std::string& dbPath, std::string shareRoot);
    ~SqliteBlobStore() override;

    // Prevent copying
    SqliteBlobStore(const SqliteBlobStore&) = delete;
    SqliteBlobStore& operator=(const SqliteBlobStore&) = delete;

    core::BlobRef upload(const core::Blob& blob) override;
    core::BlobRef serverIdentityRef() override;
    std::string shareRoot() override;

    /**
     * @brief Store the signer's public-key blob and make it the server identity
     * @param publicKeyBlob Public key blob of the signer
     * @return Reference of the identity blob
     */
    core::BlobRef setServerIdentity(const core::Blob& publicKeyBlob);

    /**
     * @brief Fetch a stored blob
     * @param ref Reference to look up
     * @return Blob if present
     */
    std::optional<core::Blob> fetch(const core::BlobRef& ref) const;

    bool contains(const core::BlobRef& ref) const;

    /**
     * @brief Number of stored blobs
     */
    size_t count() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace capshare::store
