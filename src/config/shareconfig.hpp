#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include <nlohmann/json_fwd.hpp>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace capshare::config {

/**
 * @brief Invalid or unreadable configuration
 */
class CAPSHARE_CORE_EXPORT ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Settings for the sharing core and its local backend
 */
struct CAPSHARE_CORE_EXPORT ShareConfig {
    static constexpr size_t DEFAULT_MAX_STATIC_SET_MEMBERS = 10000;

    std::string shareRoot;          // Share handler path; empty disables sharing
    std::string uiRoot;             // Web UI root path, used to recover the URL prefix
    std::string authToken;          // Credential for the transport layer
    size_t maxStaticSetMembers = DEFAULT_MAX_STATIC_SET_MEMBERS;
    bool parallelUploads = true;    // Upload sibling subsets concurrently
    core::HashAlgorithm hashAlgorithm = core::HashAlgorithm::SHA224;
    std::string databasePath = "capshare.db";
    std::string signingKeyPath = "signing_key.pem";

    /**
     * @brief Whether the server advertises a share handler
     */
    bool sharingEnabled() const { return !shareRoot.empty(); }

    /**
     * @brief Build a configuration from a JSON object
     * @throws ConfigError naming the offending key
     */
    static ShareConfig fromJson(const nlohmann::json& doc);

    /**
     * @brief Read and parse a JSON configuration file
     * @throws ConfigError if the file cannot be read or is invalid
     */
    static ShareConfig load(const std::string& path);

    nlohmann::json toJson() const;
};

} // namespace capshare::config
