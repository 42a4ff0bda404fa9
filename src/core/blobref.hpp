#pragma once

#include "core/core_export.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace capshare::core {

/**
 * @brief Digest algorithms usable for content references
 */
enum class HashAlgorithm {
    SHA1,      // sha1-<40 hex>
    SHA224,    // sha224-<56 hex> (default)
    SHA256     // sha256-<64 hex>
};

/**
 * @brief Content-hash identifier of a stored, immutable object
 *
 * The textual form is "<hashname>-<lowercase hex digest>". Two references
 * are equal exactly when their digests are equal.
 */
class CAPSHARE_CORE_EXPORT BlobRef {
public:
    BlobRef() = default;

    /**
     * @brief Parse the textual form of a reference
     * @param text Candidate reference, e.g. "sha224-..."
     * @return Reference if text is syntactically valid
     */
    static std::optional<BlobRef> parse(std::string_view text);

    /**
     * @brief Compute the reference of a payload
     * @param data Payload bytes
     * @param algo Digest to use
     * @return Reference of data
     * @throws std::runtime_error if the digest cannot be computed
     */
    static BlobRef fromContent(const std::vector<uint8_t>& data,
                               HashAlgorithm algo = HashAlgorithm::SHA224);

    static BlobRef fromContent(std::string_view data,
                               HashAlgorithm algo = HashAlgorithm::SHA224);

    bool valid() const { return !text_.empty(); }
    HashAlgorithm algorithm() const { return algo_; }
    const std::string& str() const { return text_; }

    /**
     * @brief Hex digest without the hash name prefix
     */
    std::string digest() const;

    /**
     * @brief Recompute the digest of data and compare
     */
    bool matches(const std::vector<uint8_t>& data) const;

    bool operator==(const BlobRef& other) const { return text_ == other.text_; }
    bool operator!=(const BlobRef& other) const { return text_ != other.text_; }
    bool operator<(const BlobRef& other) const { return text_ < other.text_; }

    static std::string algorithmName(HashAlgorithm algo);
    static std::optional<HashAlgorithm> algorithmFromName(std::string_view name);

private:
    BlobRef(HashAlgorithm algo, std::string text)
        : algo_(algo), text_(std::move(text)) {}

    HashAlgorithm algo_{HashAlgorithm::SHA224};
    std::string text_;
};

} // namespace capshare::core

namespace std {
template<>
struct hash<capshare::core::BlobRef> {
    size_t operator()(const capshare::core::BlobRef& ref) const noexcept {
        return std::hash<std::string>()(ref.str());
    }
};
} // namespace std
