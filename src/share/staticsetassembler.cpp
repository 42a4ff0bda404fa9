#include "share/staticsetassembler.hpp"
#include "share/shareerror.hpp"
#include "schema/schemablob.hpp"
#include "core/log.hpp"
#include <algorithm>
#include <future>
#include <stdexcept>
#include <string>

namespace capshare::share {

namespace {

// Upper bound on concurrent sibling uploads
constexpr size_t MAX_IN_FLIGHT = 8;

} // anonymous namespace

StaticSetAssembler::StaticSetAssembler(store::StorageClient& client, Options options)
    : client_(client), options_(options) {
    if (options_.maxMembers < 2) {
        throw std::invalid_argument("static set member limit must be at least 2");
    }
}

core::BlobRef StaticSetAssembler::assemble(const std::vector<core::BlobRef>& members) {
    if (members.empty()) {
        throw std::invalid_argument("cannot assemble an empty static set");
    }

    uploaded_ = 0;
    auto logger = log::get("share");

    if (members.size() <= options_.maxMembers) {
        return uploadOne(schema::SchemaBlob::staticSet(members, options_.hashAlgorithm));
    }

    logger->debug("splitting {} members into subsets of at most {}",
                  members.size(), options_.maxMembers);

    std::vector<core::BlobRef> level = uploadLevel(splitLevel(members, true));
    while (level.size() > options_.maxMembers) {
        level = uploadLevel(splitLevel(level, false));
    }

    auto top = uploadOne(schema::SchemaBlob::mergedStaticSet(level, options_.hashAlgorithm));
    logger->debug("static set {} links {} subsets ({} blobs uploaded)",
                  top.str(), level.size(), uploaded_);
    return top;
}

std::vector<core::Blob> StaticSetAssembler::splitLevel(
    const std::vector<core::BlobRef>& refs, bool leaf) const {

    std::vector<core::Blob> blobs;
    blobs.reserve((refs.size() + options_.maxMembers - 1) / options_.maxMembers);

    for (size_t start = 0; start < refs.size(); start += options_.maxMembers) {
        size_t end = std::min(start + options_.maxMembers, refs.size());
        std::vector<core::BlobRef> chunk(refs.begin() + start, refs.begin() + end);
        blobs.push_back(leaf
            ? schema::SchemaBlob::staticSet(chunk, options_.hashAlgorithm)
            : schema::SchemaBlob::mergedStaticSet(chunk, options_.hashAlgorithm));
    }
    return blobs;
}

std::vector<core::BlobRef> StaticSetAssembler::uploadLevel(
    const std::vector<core::Blob>& blobs) {

    std::vector<core::BlobRef> refs;
    refs.reserve(blobs.size());

    if (!options_.parallelUploads) {
        for (const auto& blob : blobs) {
            refs.push_back(uploadOne(blob));
        }
        return refs;
    }

    for (size_t start = 0; start < blobs.size(); start += MAX_IN_FLIGHT) {
        size_t end = std::min(start + MAX_IN_FLIGHT, blobs.size());

        std::vector<std::future<core::BlobRef>> pending;
        pending.reserve(end - start);
        for (size_t i = start; i < end; ++i) {
            const core::Blob* blob = &blobs[i];
            pending.push_back(std::async(std::launch::async, [this, blob] {
                return client_.upload(*blob);
            }));
        }

        // Every sibling settles before the first failure is reported
        for (auto& f : pending) {
            f.wait();
        }

        std::string failure;
        for (size_t i = start; i < end; ++i) {
            core::BlobRef stored;
            try {
                stored = pending[i - start].get();
            } catch (const std::exception& e) {
                if (failure.empty()) {
                    failure = std::string("could not upload static set: ") + e.what();
                }
                continue;
            }
            ++uploaded_;
            if (stored != blobs[i].ref() && failure.empty()) {
                failure = "could not upload static set: server stored "
                    + blobs[i].ref().str() + " as " + stored.str();
            }
            refs.push_back(stored);
        }
        if (!failure.empty()) {
            throw UploadError(failure);
        }
    }
    return refs;
}

core::BlobRef StaticSetAssembler::uploadOne(const core::Blob& blob) {
    core::BlobRef stored;
    try {
        stored = client_.upload(blob);
    } catch (const std::exception& e) {
        throw UploadError(std::string("could not upload static set: ") + e.what());
    }
    ++uploaded_;
    if (stored != blob.ref()) {
        throw UploadError("could not upload static set: server stored "
                          + blob.ref().str() + " as " + stored.str());
    }
    return stored;
}

} // namespace capshare::share
