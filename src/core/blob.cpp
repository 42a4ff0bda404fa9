#include "core/blob.hpp"

namespace capshare::core {

Blob::Blob(std::vector<uint8_t> data, HashAlgorithm algo)
    : ref_(BlobRef::fromContent(data, algo)), data_(std::move(data)) {}

Blob::Blob(BlobRef ref, std::vector<uint8_t> data)
    : ref_(std::move(ref)), data_(std::move(data)) {}

Blob Blob::fromString(const std::string& text, HashAlgorithm algo) {
    return Blob(std::vector<uint8_t>(text.begin(), text.end()), algo);
}

} // namespace capshare::core
