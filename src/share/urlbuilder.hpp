#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include <cstddef>
#include <string>

namespace capshare::share {

/**
 * @brief Share URL construction and display helpers
 */
class CAPSHARE_CORE_EXPORT UrlBuilder {
public:
    static constexpr size_t ANCHOR_EDGE = 20;

    /**
     * @brief Relative share URL for a stored claim
     *
     * A directory is fetched through the claim itself. A file is fetched by
     * its own ref, with the claim as the "via" authorization and assembly
     * of its chunks requested.
     */
    static std::string shareUrl(const std::string& shareRoot,
                                const core::BlobRef& claim,
                                const core::BlobRef& target,
                                bool isDir);

    /**
     * @brief Recover the server URL prefix from the current location
     *
     * If location ends with uiRoot the suffix is trimmed. Otherwise the part
     * before the first occurrence of uiRoot is the prefix.
     *
     * @throws PrefixResolutionError if uiRoot is empty or not in location
     */
    static std::string urlPrefix(const std::string& location, const std::string& uiRoot);

    /**
     * @brief Prefix resolved from location followed by the relative URL
     * @throws PrefixResolutionError
     */
    static std::string absoluteUrl(const std::string& relative,
                                   const std::string& location,
                                   const std::string& uiRoot);

    /**
     * @brief Shortened display text: first and last 20 characters around "..."
     */
    static std::string anchorText(const std::string& url);
};

} // namespace capshare::share
