#pragma once

#include "core/core_export.hpp"
#include "core/blob.hpp"
#include "core/blobref.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace capshare::crypto {

/**
 * @brief Failure reported by a signing service
 */
class CAPSHARE_CORE_EXPORT SigningFailure : public std::runtime_error {
public:
    explicit SigningFailure(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Signing service for JSON claims
 */
class CAPSHARE_CORE_EXPORT ClaimSigner {
public:
    virtual ~ClaimSigner() = default;

    /**
     * @brief Sign an unsigned JSON claim body
     * @param unsignedJson Claim body; must name this signer in "camliSigner"
     * @return Signed claim bytes
     * @throws SigningFailure
     */
    virtual std::string sign(const std::string& unsignedJson) = 0;
};

/**
 * @brief Ed25519 claim signer
 *
 * The signature covers the claim body up to (excluding) its closing brace
 * and is appended as a "camliSig" field holding the base64 signature.
 * The signer's identity is the ref of its public-key PEM blob.
 */
class CAPSHARE_CORE_EXPORT Ed25519ClaimSigner : public ClaimSigner {
public:
    /**
     * @brief Create a signer with a freshly generated key pair
     * @param algo Digest used for the identity blob ref
     */
    explicit Ed25519ClaimSigner(core::HashAlgorithm algo = core::HashAlgorithm::SHA224);
    ~Ed25519ClaimSigner() override;

    // Prevent copying
    Ed25519ClaimSigner(const Ed25519ClaimSigner&) = delete;
    Ed25519ClaimSigner& operator=(const Ed25519ClaimSigner&) = delete;

    /**
     * @brief Import a signer from a PKCS#8 PEM private key
     * @throws SigningFailure if the PEM is not an Ed25519 private key
     */
    static std::unique_ptr<Ed25519ClaimSigner> fromPEM(
        const std::string& pem,
        core::HashAlgorithm algo = core::HashAlgorithm::SHA224);

    /**
     * @brief Load the key at path, generating and saving one if absent
     * @throws SigningFailure on unreadable, unwritable or invalid key files
     */
    static std::unique_ptr<Ed25519ClaimSigner> loadOrCreate(
        const std::string& path,
        core::HashAlgorithm algo = core::HashAlgorithm::SHA224);

    std::string exportPrivateKeyPEM() const;
    std::string publicKeyPEM() const;

    /**
     * @brief Public-key blob; its ref is the signer identity
     */
    core::Blob publicKeyBlob() const;
    core::BlobRef identityRef() const;

    std::string sign(const std::string& unsignedJson) override;

    /**
     * @brief Check a signed claim produced by this signer
     * @return true if the signature and the camliSigner field are valid
     */
    bool verify(const std::string& signedJson) const;

private:
    using KeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

    Ed25519ClaimSigner(KeyPtr key, core::HashAlgorithm algo);

    KeyPtr key_;
    core::HashAlgorithm algo_;
};

} // namespace capshare::crypto
