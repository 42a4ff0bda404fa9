#pragma once

#include "core/core_export.hpp"
#include "core/blob.hpp"
#include "core/blobref.hpp"
#include "store/storageclient.hpp"
#include <cstddef>
#include <vector>

namespace capshare::share {

/**
 * @brief Builds a (possibly split) static set over a list of members
 *
 * Up to maxMembers refs go into a single "members" static set. Larger lists
 * are cut into consecutive subsets of at most maxMembers; the subsets are
 * uploaded first and linked, in order, from a "mergeSets" static set. When
 * there are more subsets than maxMembers the same split is applied to the
 * subset refs, so no static set ever lists more than maxMembers refs.
 */
class CAPSHARE_CORE_EXPORT StaticSetAssembler {
public:
    struct Options {
        size_t maxMembers = 10000;
        bool parallelUploads = true;
        core::HashAlgorithm hashAlgorithm = core::HashAlgorithm::SHA224;
    };

    /**
     * @throws std::invalid_argument if options.maxMembers is below 2
     */
    StaticSetAssembler(store::StorageClient& client, Options options);

    /**
     * @brief Assemble and upload the static set
     * @param members Member refs, in order
     * @return Ref of the top-level static set
     * @throws UploadError if any static set cannot be stored
     * @throws std::invalid_argument if members is empty
     */
    core::BlobRef assemble(const std::vector<core::BlobRef>& members);

    /**
     * @brief Number of static sets uploaded by the last assemble() call
     */
    size_t uploadedCount() const { return uploaded_; }

private:
    // Upload one level of sibling blobs and return their refs in order
    std::vector<core::BlobRef> uploadLevel(const std::vector<core::Blob>& blobs);
    core::BlobRef uploadOne(const core::Blob& blob);

    std::vector<core::Blob> splitLevel(const std::vector<core::BlobRef>& refs,
                                       bool leaf) const;

    store::StorageClient& client_;
    Options options_;
    size_t uploaded_ = 0;
};

} // namespace capshare::share
