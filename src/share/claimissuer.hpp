#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include "crypto/claimsigner.hpp"
#include "share/directoryassembler.hpp"
#include "store/storageclient.hpp"

namespace capshare::share {

/**
 * @brief Creates, signs and uploads a share claim for a target
 */
class CAPSHARE_CORE_EXPORT ClaimIssuer {
public:
    /**
     * @param clock Time source for claimDate; system clock when empty
     */
    ClaimIssuer(store::StorageClient& client,
                crypto::ClaimSigner& signer,
                core::HashAlgorithm algo = core::HashAlgorithm::SHA224,
                Clock clock = {});

    /**
     * @brief Issue a transitive "haveref" share claim on target
     * @param target Ref of the shared file or directory
     * @return Ref of the stored signed claim
     * @throws IdentityError if the signer identity is unavailable
     * @throws SigningError if the claim cannot be built or signed
     * @throws UploadError if the signed claim cannot be stored
     */
    core::BlobRef issue(const core::BlobRef& target);

private:
    store::StorageClient& client_;
    crypto::ClaimSigner& signer_;
    core::HashAlgorithm algo_;
    Clock clock_;
};

} // namespace capshare::share
