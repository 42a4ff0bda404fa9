#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capshare::share {

namespace fs = std::filesystem;

struct BlobDescription {
    std::string ref;                        // Blob reference
    size_t size = 0;                        // Stored byte count
    std::string camliType;                  // Schema type, empty for raw bytes
    std::string content;                    // Stored bytes as text
    std::vector<std::string> members;       // Flattened static-set members, in order
    std::optional<bool> signatureValid;     // Set for claims signed by this server
};

/**
 * @brief Share front end over the local blob store and signing key
 *
 * Opens the blob database and signing key named by the configuration and
 * registers the key's public half as the server identity.
 */
class ShareProtocol {
public:
    using Selection = std::vector<std::map<std::string, std::string>>;
    using SharedHandler = std::function<void(const std::string& url,
                                             const std::string& anchorText)>;
    using FailureHandler = std::function<void(const std::string& message)>;

    /**
     * @throws config::ConfigError if the configuration is invalid
     * @throws std::runtime_error if the store or key cannot be opened
     */
    explicit ShareProtocol(const std::string& configPath);
    ~ShareProtocol();

    /**
     * @brief Whether a share root is configured
     */
    bool sharingEnabled() const;

    /**
     * @brief Store the contents of a file
     * @param path File to read
     * @return Ref of the stored blob
     * @throws std::runtime_error if the file cannot be read or stored
     */
    std::string putFile(const fs::path& path);

    /**
     * @brief Store raw bytes
     * @return Ref of the stored blob
     */
    std::string putBytes(const std::vector<uint8_t>& data);

    /**
     * @brief Share the given selection in the background
     * @param selection Items with "blobRef" and "isDir" keys
     * @param location Current location the URL prefix is recovered from
     * @param onShared Receives the absolute URL and its display text
     * @param onFailure Receives the user-facing error message
     * @return Future that becomes ready after the handler has run
     * @throws std::runtime_error if sharing is not enabled
     */
    std::future<void> share(Selection selection,
                            std::string location,
                            SharedHandler onShared,
                            FailureHandler onFailure);

    /**
     * @brief Describe a stored blob
     * @param ref Blob reference
     * @return Description, or nullopt if ref is invalid or not stored
     */
    std::optional<BlobDescription> describe(const std::string& ref) const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;

    // Prevent copying
    ShareProtocol(const ShareProtocol&) = delete;
    ShareProtocol& operator=(const ShareProtocol&) = delete;
};

} // namespace capshare::share
