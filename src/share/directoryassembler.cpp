#include "share/directoryassembler.hpp"
#include "share/shareerror.hpp"
#include "schema/schemablob.hpp"
#include "core/log.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace capshare::share {

DirectoryAssembler::DirectoryAssembler(store::StorageClient& client,
                                       core::HashAlgorithm algo,
                                       Clock clock)
    : client_(client), algo_(algo), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

core::BlobRef DirectoryAssembler::assemble(const core::BlobRef& entries) {
    auto name = directoryName(clock_());
    auto blob = schema::SchemaBlob::directory(name, entries, algo_);

    core::BlobRef stored;
    try {
        stored = client_.upload(blob);
    } catch (const std::exception& e) {
        throw UploadError(std::string("could not upload directory: ") + e.what());
    }
    if (stored != blob.ref()) {
        throw UploadError("could not upload directory: server stored "
                          + blob.ref().str() + " as " + stored.str());
    }

    log::get("share")->debug("directory {} ({}) holds static set {}",
                             name, stored.str(), entries.str());
    return stored;
}

std::string DirectoryAssembler::directoryName(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream ss;
    ss << NAME_PREFIX << std::put_time(&utc, "%Y%m%d%H%M%S");
    return ss.str();
}

} // namespace capshare::share
