#include "core/blobref.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace capshare::core {

namespace {

struct AlgorithmInfo {
    HashAlgorithm algo;
    const char* name;
    size_t hexLength;
};

constexpr AlgorithmInfo ALGORITHMS[] = {
    {HashAlgorithm::SHA1, "sha1", 40},
    {HashAlgorithm::SHA224, "sha224", 56},
    {HashAlgorithm::SHA256, "sha256", 64},
};

const AlgorithmInfo& infoFor(HashAlgorithm algo) {
    for (const auto& info : ALGORITHMS) {
        if (info.algo == algo) {
            return info;
        }
    }
    throw std::invalid_argument("Unknown hash algorithm");
}

const EVP_MD* digestFor(HashAlgorithm algo) {
    switch (algo) {
        case HashAlgorithm::SHA1:
            return EVP_sha1();
        case HashAlgorithm::SHA224:
            return EVP_sha224();
        case HashAlgorithm::SHA256:
            return EVP_sha256();
    }
    return nullptr;
}

std::string getOpenSSLError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
}

std::string hexDigest(HashAlgorithm algo, const void* data, size_t size) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to create digest context: " + getOpenSSLError());
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (!EVP_DigestInit_ex(ctx.get(), digestFor(algo), nullptr) ||
        !EVP_DigestUpdate(ctx.get(), data, size) ||
        !EVP_DigestFinal_ex(ctx.get(), hash, &hashLen)) {
        throw std::runtime_error("Failed to compute digest: " + getOpenSSLError());
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    }
    return ss.str();
}

bool isLowerHex(std::string_view s) {
    for (char c : s) {
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

std::optional<BlobRef> BlobRef::parse(std::string_view text) {
    auto dash = text.find('-');
    if (dash == std::string_view::npos || dash == 0) {
        return std::nullopt;
    }

    auto algo = algorithmFromName(text.substr(0, dash));
    if (!algo) {
        return std::nullopt;
    }

    auto hex = text.substr(dash + 1);
    if (hex.size() != infoFor(*algo).hexLength || !isLowerHex(hex)) {
        return std::nullopt;
    }

    return BlobRef(*algo, std::string(text));
}

BlobRef BlobRef::fromContent(const std::vector<uint8_t>& data, HashAlgorithm algo) {
    return BlobRef(algo, algorithmName(algo) + "-" +
                   hexDigest(algo, data.data(), data.size()));
}

BlobRef BlobRef::fromContent(std::string_view data, HashAlgorithm algo) {
    return BlobRef(algo, algorithmName(algo) + "-" +
                   hexDigest(algo, data.data(), data.size()));
}

std::string BlobRef::digest() const {
    auto dash = text_.find('-');
    return dash == std::string::npos ? std::string() : text_.substr(dash + 1);
}

bool BlobRef::matches(const std::vector<uint8_t>& data) const {
    return valid() && fromContent(data, algo_) == *this;
}

std::string BlobRef::algorithmName(HashAlgorithm algo) {
    return infoFor(algo).name;
}

std::optional<HashAlgorithm> BlobRef::algorithmFromName(std::string_view name) {
    for (const auto& info : ALGORITHMS) {
        if (name == info.name) {
            return info.algo;
        }
    }
    return std::nullopt;
}

} // namespace capshare::core
