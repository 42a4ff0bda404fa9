#include "schema/schemablob.hpp"
#include <ctime>
#include <stdexcept>

namespace capshare::schema {

namespace {

// Deeper trees than this cannot come from a sane member limit.
constexpr size_t MAX_SET_DEPTH = 32;

} // anonymous namespace

core::Blob SchemaBlob::staticSet(const std::vector<core::BlobRef>& members,
                                 core::HashAlgorithm algo) {
    nlohmann::json fields;
    fields["camliType"] = TYPE_STATIC_SET;
    fields["members"] = toStrings(members);
    return core::Blob::fromString(serialize(fields), algo);
}

core::Blob SchemaBlob::mergedStaticSet(const std::vector<core::BlobRef>& subsets,
                                       core::HashAlgorithm algo) {
    nlohmann::json fields;
    fields["camliType"] = TYPE_STATIC_SET;
    fields["mergeSets"] = toStrings(subsets);
    return core::Blob::fromString(serialize(fields), algo);
}

core::Blob SchemaBlob::directory(const std::string& fileName,
                                 const core::BlobRef& entries,
                                 core::HashAlgorithm algo) {
    nlohmann::json fields;
    fields["camliType"] = TYPE_DIRECTORY;
    fields["fileName"] = fileName;
    fields["entries"] = entries.str();
    return core::Blob::fromString(serialize(fields), algo);
}

std::string SchemaBlob::shareClaim(const ShareClaimFields& claim) {
    if (!claim.signer.valid()) {
        throw std::invalid_argument("share claim has no signer");
    }
    if (!claim.target.valid()) {
        throw std::invalid_argument("share claim has no target");
    }

    nlohmann::json fields;
    fields["camliSigner"] = claim.signer.str();
    fields["camliType"] = TYPE_CLAIM;
    fields["claimType"] = "share";
    fields["claimDate"] = formatClaimDate(claim.claimDate);
    fields["authType"] = claim.authType;
    fields["transitive"] = claim.transitive;
    fields["target"] = claim.target.str();
    return serialize(fields);
}

std::string SchemaBlob::formatClaimDate(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

std::optional<SchemaBlob> SchemaBlob::parse(const core::Blob& blob) {
    auto json = nlohmann::json::parse(blob.data().begin(), blob.data().end(),
                                      nullptr, false);
    if (json.is_discarded() || !json.is_object() ||
        !json.contains("camliVersion") || !json.contains("camliType") ||
        !json["camliType"].is_string()) {
        return std::nullopt;
    }
    return SchemaBlob(blob.ref(), std::move(json));
}

std::string SchemaBlob::type() const {
    return json_.value("camliType", "");
}

std::vector<core::BlobRef> SchemaBlob::refsAt(const std::string& key) const {
    std::vector<core::BlobRef> refs;
    if (!json_.contains(key)) {
        return refs;
    }

    const auto& values = json_.at(key);
    if (!values.is_array()) {
        throw std::runtime_error("schema blob " + ref_.str() + ": \"" + key +
                                 "\" is not an array");
    }
    refs.reserve(values.size());
    for (const auto& value : values) {
        auto ref = value.is_string() ? core::BlobRef::parse(value.get<std::string>())
                                     : std::nullopt;
        if (!ref) {
            throw std::runtime_error("schema blob " + ref_.str() +
                                     ": invalid ref in \"" + key + "\"");
        }
        refs.push_back(*ref);
    }
    return refs;
}

std::string SchemaBlob::serialize(const nlohmann::json& fields) {
    nlohmann::ordered_json out;
    out["camliVersion"] = CAMLI_VERSION;
    for (const auto& item : fields.items()) {
        out[item.key()] = item.value();
    }
    return out.dump(2) + "\n";
}

std::vector<std::string> SchemaBlob::toStrings(const std::vector<core::BlobRef>& refs) {
    std::vector<std::string> out;
    out.reserve(refs.size());
    for (const auto& ref : refs) {
        out.push_back(ref.str());
    }
    return out;
}

StaticSetReader::StaticSetReader(Fetcher fetch)
    : fetch_(std::move(fetch)) {
    if (!fetch_) {
        throw std::invalid_argument("StaticSetReader requires a fetcher");
    }
}

std::vector<core::BlobRef> StaticSetReader::flatten(const core::BlobRef& root) const {
    std::vector<core::BlobRef> members;
    collect(root, members, 0);
    return members;
}

void StaticSetReader::collect(const core::BlobRef& ref,
                              std::vector<core::BlobRef>& out,
                              size_t depth) const {
    if (depth > MAX_SET_DEPTH) {
        throw std::runtime_error("static set nesting too deep at " + ref.str());
    }

    auto blob = fetch_(ref);
    if (!blob) {
        throw std::runtime_error("static set blob not found: " + ref.str());
    }

    auto schema = SchemaBlob::parse(*blob);
    if (!schema || schema->type() != SchemaBlob::TYPE_STATIC_SET) {
        throw std::runtime_error(ref.str() + " is not a static set");
    }

    auto members = schema->refsAt("members");
    out.insert(out.end(), members.begin(), members.end());

    for (const auto& subset : schema->refsAt("mergeSets")) {
        collect(subset, out, depth + 1);
    }
}

} // namespace capshare::schema
