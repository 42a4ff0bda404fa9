#pragma once

#include "core/core_export.hpp"
#include "core/blob.hpp"
#include "core/blobref.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace capshare::schema {

/**
 * @brief Fields of an unsigned share claim
 */
struct ShareClaimFields {
    core::BlobRef signer;
    core::BlobRef target;
    std::string authType = "haveref";
    bool transitive = true;
    std::chrono::system_clock::time_point claimDate;
};

/**
 * @brief JSON schema blobs (static sets, directories, claims)
 *
 * Serialization is deterministic: "camliVersion" first, remaining keys
 * sorted, two-space indent, trailing newline. Identical inputs therefore
 * always yield identical refs.
 */
class CAPSHARE_CORE_EXPORT SchemaBlob {
public:
    static constexpr int CAMLI_VERSION = 1;

    static constexpr const char* TYPE_STATIC_SET = "static-set";
    static constexpr const char* TYPE_DIRECTORY = "directory";
    static constexpr const char* TYPE_CLAIM = "claim";

    /**
     * @brief Leaf static set listing members directly
     */
    static core::Blob staticSet(const std::vector<core::BlobRef>& members,
                                core::HashAlgorithm algo = core::HashAlgorithm::SHA224);

    /**
     * @brief Static set whose content is the union of linked subsets
     */
    static core::Blob mergedStaticSet(const std::vector<core::BlobRef>& subsets,
                                      core::HashAlgorithm algo = core::HashAlgorithm::SHA224);

    /**
     * @brief Directory named fileName whose entries are a static set
     */
    static core::Blob directory(const std::string& fileName,
                                const core::BlobRef& entries,
                                core::HashAlgorithm algo = core::HashAlgorithm::SHA224);

    /**
     * @brief Unsigned share claim body, ready for the signing service
     * @throws std::invalid_argument if signer or target is not set
     */
    static std::string shareClaim(const ShareClaimFields& fields);

    /**
     * @brief Format a time point as RFC 3339 UTC with a "Z" suffix
     */
    static std::string formatClaimDate(std::chrono::system_clock::time_point tp);

    /**
     * @brief Parse a stored blob as a schema blob
     * @return Schema view, or nullopt if blob is not a JSON schema object
     */
    static std::optional<SchemaBlob> parse(const core::Blob& blob);

    const core::BlobRef& ref() const { return ref_; }
    const nlohmann::json& json() const { return json_; }
    std::string type() const;

    /**
     * @brief Parse the array of refs stored under key
     * @throws std::runtime_error if an element is not a valid ref
     */
    std::vector<core::BlobRef> refsAt(const std::string& key) const;

private:
    SchemaBlob(core::BlobRef ref, nlohmann::json json)
        : ref_(std::move(ref)), json_(std::move(json)) {}

    static std::string serialize(const nlohmann::json& fields);
    static std::vector<std::string> toStrings(const std::vector<core::BlobRef>& refs);

    core::BlobRef ref_;
    nlohmann::json json_;
};

/**
 * @brief Walks a static-set tree back into its ordered member list
 */
class CAPSHARE_CORE_EXPORT StaticSetReader {
public:
    using Fetcher = std::function<std::optional<core::Blob>(const core::BlobRef&)>;

    explicit StaticSetReader(Fetcher fetch);

    /**
     * @brief Flatten the set rooted at root, following "mergeSets" in link order
     * @throws std::runtime_error on a missing blob or a non static-set node
     */
    std::vector<core::BlobRef> flatten(const core::BlobRef& root) const;

private:
    void collect(const core::BlobRef& ref,
                 std::vector<core::BlobRef>& out,
                 size_t depth) const;

    Fetcher fetch_;
};

} // namespace capshare::schema
