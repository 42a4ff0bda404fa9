#include "share/claimissuer.hpp"
#include "share/shareerror.hpp"
#include "schema/schemablob.hpp"
#include "core/blob.hpp"
#include "core/log.hpp"
#include <utility>

namespace capshare::share {

ClaimIssuer::ClaimIssuer(store::StorageClient& client,
                         crypto::ClaimSigner& signer,
                         core::HashAlgorithm algo,
                         Clock clock)
    : client_(client), signer_(signer), algo_(algo), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

core::BlobRef ClaimIssuer::issue(const core::BlobRef& target) {
    auto logger = log::get("share");

    schema::ShareClaimFields fields;
    try {
        fields.signer = client_.serverIdentityRef();
    } catch (const std::exception& e) {
        throw IdentityError(std::string("could not get signer: ") + e.what());
    }
    fields.target = target;
    fields.claimDate = clock_();

    std::string unsignedClaim;
    try {
        unsignedClaim = schema::SchemaBlob::shareClaim(fields);
    } catch (const std::exception& e) {
        throw SigningError(std::string("could not create unsigned share claim: ") + e.what());
    }

    std::string signedClaim;
    try {
        signedClaim = signer_.sign(unsignedClaim);
    } catch (const std::exception& e) {
        throw SigningError(std::string("could not get signed share claim: ") + e.what());
    }

    auto blob = core::Blob::fromString(signedClaim, algo_);
    core::BlobRef stored;
    try {
        stored = client_.upload(blob);
    } catch (const std::exception& e) {
        throw UploadError(std::string("could not upload share claim: ") + e.what());
    }
    if (stored != blob.ref()) {
        throw UploadError("could not upload share claim: server stored "
                          + blob.ref().str() + " as " + stored.str());
    }

    logger->info("share claim {} issued by {} for {}",
                 stored.str(), fields.signer.str(), target.str());
    return stored;
}

} // namespace capshare::share
