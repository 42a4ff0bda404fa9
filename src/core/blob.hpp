#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace capshare::core {

/**
 * @brief Immutable payload paired with its content reference
 */
class CAPSHARE_CORE_EXPORT Blob {
public:
    Blob() = default;

    /**
     * @brief Wrap bytes and compute their reference
     */
    Blob(std::vector<uint8_t> data, HashAlgorithm algo = HashAlgorithm::SHA224);

    /**
     * @brief Pair bytes with an already known reference
     *
     * The pairing is not checked here; use verify() before trusting it.
     */
    Blob(BlobRef ref, std::vector<uint8_t> data);

    static Blob fromString(const std::string& text,
                           HashAlgorithm algo = HashAlgorithm::SHA224);

    const BlobRef& ref() const { return ref_; }
    const std::vector<uint8_t>& data() const { return data_; }
    size_t size() const { return data_.size(); }
    std::string str() const { return std::string(data_.begin(), data_.end()); }

    bool verify() const { return ref_.matches(data_); }

private:
    BlobRef ref_;
    std::vector<uint8_t> data_;
};

} // namespace capshare::core
