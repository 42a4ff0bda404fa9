#pragma once

#include "core/core_export.hpp"
#include "core/blobref.hpp"
#include "store/storageclient.hpp"
#include <chrono>
#include <functional>
#include <string>

namespace capshare::share {

using Clock = std::function<std::chrono::system_clock::time_point()>;

/**
 * @brief Wraps a static set in a timestamp-named directory
 */
class CAPSHARE_CORE_EXPORT DirectoryAssembler {
public:
    static constexpr const char* NAME_PREFIX = "shared-";

    /**
     * @param clock Time source for the directory name; system clock when empty
     */
    DirectoryAssembler(store::StorageClient& client,
                       core::HashAlgorithm algo = core::HashAlgorithm::SHA224,
                       Clock clock = {});

    /**
     * @brief Upload a directory whose entries are the given static set
     * @param entries Ref of an already stored static set
     * @return Ref of the directory
     * @throws UploadError if the directory cannot be stored
     */
    core::BlobRef assemble(const core::BlobRef& entries);

    /**
     * @brief "shared-" followed by the UTC time as YYYYMMDDHHMMSS
     */
    static std::string directoryName(std::chrono::system_clock::time_point tp);

private:
    store::StorageClient& client_;
    core::HashAlgorithm algo_;
    Clock clock_;
};

} // namespace capshare::share
