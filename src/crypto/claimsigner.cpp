#include "crypto/claimsigner.hpp"
#include "core/log.hpp"
#include <nlohmann/json.hpp>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace capshare::crypto {

namespace {

constexpr size_t ED25519_SIGNATURE_SIZE = 64;
constexpr const char SIG_FIELD[] = ",\"camliSig\":\"";

std::string getOpenSSLError() {
    char buf[256];
    ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
    return buf;
}

std::string base64Encode(const std::vector<uint8_t>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(len));
    return out;
}

std::vector<uint8_t> base64Decode(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        return {};
    }
    std::vector<uint8_t> out(3 * text.size() / 4);
    int len = EVP_DecodeBlock(out.data(),
                              reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) {
        return {};
    }
    // EVP_DecodeBlock keeps the padding bytes.
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

std::string rtrim(const std::string& s) {
    size_t end = s.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        end--;
    }
    return s.substr(0, end);
}

std::string signerOf(const nlohmann::json& body) {
    auto it = body.find("camliSigner");
    if (it == body.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

std::string bioToString(BIO* mem) {
    char* data = nullptr;
    long len = BIO_get_mem_data(mem, &data);
    if (len <= 0 || !data) {
        return "";
    }
    return std::string(data, static_cast<size_t>(len));
}

} // anonymous namespace

Ed25519ClaimSigner::Ed25519ClaimSigner(core::HashAlgorithm algo)
    : key_(nullptr, EVP_PKEY_free), algo_(algo) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>
        ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free);
    if (!ctx) {
        throw SigningFailure("Failed to create EdDSA context: " + getOpenSSLError());
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_keygen(ctx.get(), &pkey) <= 0) {
        throw SigningFailure("Failed to generate key pair: " + getOpenSSLError());
    }
    key_.reset(pkey);
}

Ed25519ClaimSigner::Ed25519ClaimSigner(KeyPtr key, core::HashAlgorithm algo)
    : key_(std::move(key)), algo_(algo) {}

Ed25519ClaimSigner::~Ed25519ClaimSigner() = default;

std::unique_ptr<Ed25519ClaimSigner> Ed25519ClaimSigner::fromPEM(
    const std::string& pem,
    core::HashAlgorithm algo) {

    BIO* mem = BIO_new_mem_buf(static_cast<const void*>(pem.c_str()),
                               static_cast<int>(pem.length()));
    if (!mem) {
        throw SigningFailure("Failed to allocate PEM buffer");
    }
    std::unique_ptr<BIO, decltype(&BIO_free)> memGuard(mem, BIO_free);

    KeyPtr pkey(PEM_read_bio_PrivateKey(mem, nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!pkey) {
        throw SigningFailure("Failed to read private key: " + getOpenSSLError());
    }
    if (EVP_PKEY_id(pkey.get()) != EVP_PKEY_ED25519) {
        throw SigningFailure("Private key is not an Ed25519 key");
    }

    return std::unique_ptr<Ed25519ClaimSigner>(new Ed25519ClaimSigner(std::move(pkey), algo));
}

std::unique_ptr<Ed25519ClaimSigner> Ed25519ClaimSigner::loadOrCreate(
    const std::string& path,
    core::HashAlgorithm algo) {

    auto logger = log::get("crypto");
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw SigningFailure("Failed to open signing key " + path);
        }
        std::stringstream ss;
        ss << in.rdbuf();
        logger->debug("loaded signing key from {}", path);
        return fromPEM(ss.str(), algo);
    }

    auto signer = std::make_unique<Ed25519ClaimSigner>(algo);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw SigningFailure("Failed to create signing key " + path);
        }
        out << signer->exportPrivateKeyPEM();
        if (!out) {
            throw SigningFailure("Failed to write signing key " + path);
        }
    }
    std::filesystem::permissions(path,
                                 std::filesystem::perms::owner_read |
                                 std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        logger->warn("could not restrict permissions on {}: {}", path, ec.message());
    }
    logger->info("generated new signing key {}", path);
    return signer;
}

std::string Ed25519ClaimSigner::exportPrivateKeyPEM() const {
    BIO* mem = BIO_new(BIO_s_mem());
    if (!mem) {
        throw SigningFailure("Failed to allocate PEM buffer");
    }
    std::unique_ptr<BIO, decltype(&BIO_free)> memGuard(mem, BIO_free);

    if (!PEM_write_bio_PrivateKey(mem, key_.get(), nullptr, nullptr, 0, nullptr, nullptr)) {
        throw SigningFailure("Failed to export private key: " + getOpenSSLError());
    }
    return bioToString(mem);
}

std::string Ed25519ClaimSigner::publicKeyPEM() const {
    BIO* mem = BIO_new(BIO_s_mem());
    if (!mem) {
        throw SigningFailure("Failed to allocate PEM buffer");
    }
    std::unique_ptr<BIO, decltype(&BIO_free)> memGuard(mem, BIO_free);

    if (!PEM_write_bio_PUBKEY(mem, key_.get())) {
        throw SigningFailure("Failed to export public key: " + getOpenSSLError());
    }
    return bioToString(mem);
}

core::Blob Ed25519ClaimSigner::publicKeyBlob() const {
    return core::Blob::fromString(publicKeyPEM(), algo_);
}

core::BlobRef Ed25519ClaimSigner::identityRef() const {
    return publicKeyBlob().ref();
}

std::string Ed25519ClaimSigner::sign(const std::string& unsignedJson) {
    auto body = nlohmann::json::parse(unsignedJson, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw SigningFailure("claim to sign is not a JSON object");
    }
    if (body.contains("camliSig")) {
        throw SigningFailure("claim is already signed");
    }
    auto signer = signerOf(body);
    if (signer != identityRef().str()) {
        throw SigningFailure("camliSigner \"" + signer + "\" does not match signing key");
    }

    std::string trimmed = rtrim(unsignedJson);
    if (trimmed.empty() || trimmed.back() != '}') {
        throw SigningFailure("claim does not end with a closing brace");
    }
    std::string payload = trimmed.substr(0, trimmed.size() - 1);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestSignInit(mdctx.get(), nullptr, nullptr, nullptr, key_.get()) <= 0) {
        throw SigningFailure("Failed to initialize signing: " + getOpenSSLError());
    }

    size_t sigLen = ED25519_SIGNATURE_SIZE;
    std::vector<uint8_t> signature(sigLen);
    if (EVP_DigestSign(mdctx.get(), signature.data(), &sigLen,
                       reinterpret_cast<const unsigned char*>(payload.data()),
                       payload.size()) <= 0) {
        throw SigningFailure("Failed to sign claim: " + getOpenSSLError());
    }
    signature.resize(sigLen);

    return payload + SIG_FIELD + base64Encode(signature) + "\"}\n";
}

bool Ed25519ClaimSigner::verify(const std::string& signedJson) const {
    std::string trimmed = rtrim(signedJson);
    auto sigPos = trimmed.rfind(SIG_FIELD);
    if (sigPos == std::string::npos || trimmed.size() < 2 ||
        trimmed.compare(trimmed.size() - 2, 2, "\"}") != 0) {
        return false;
    }

    std::string payload = trimmed.substr(0, sigPos);
    size_t sigStart = sigPos + sizeof(SIG_FIELD) - 1;
    if (sigStart > trimmed.size() - 2) {
        return false;
    }
    auto signature = base64Decode(trimmed.substr(sigStart, trimmed.size() - 2 - sigStart));
    if (signature.size() != ED25519_SIGNATURE_SIZE) {
        return false;
    }

    auto body = nlohmann::json::parse(payload + "}", nullptr, false);
    if (body.is_discarded() || !body.is_object() ||
        signerOf(body) != identityRef().str()) {
        return false;
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>
        mdctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestVerifyInit(mdctx.get(), nullptr, nullptr, nullptr, key_.get()) <= 0) {
        return false;
    }

    return EVP_DigestVerify(mdctx.get(),
                            signature.data(), signature.size(),
                            reinterpret_cast<const unsigned char*>(payload.data()),
                            payload.size()) == 1;
}

} // namespace capshare::crypto
