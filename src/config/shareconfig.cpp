#include "config/shareconfig.hpp"
#include "core/log.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

namespace capshare::config {

namespace {

std::string requireString(const nlohmann::json& doc, const char* key) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        throw ConfigError(std::string("missing \"") + key + "\" in configuration");
    }
    if (!it->is_string()) {
        throw ConfigError(std::string("\"") + key + "\" must be a string");
    }
    return it->get<std::string>();
}

std::string optionalString(const nlohmann::json& doc, const char* key,
                           const std::string& fallback) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ConfigError(std::string("\"") + key + "\" must be a string");
    }
    return it->get<std::string>();
}

} // anonymous namespace

ShareConfig ShareConfig::fromJson(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }

    ShareConfig config;
    config.shareRoot = optionalString(doc, "shareRoot", "");
    config.uiRoot = requireString(doc, "uiRoot");
    config.authToken = requireString(doc, "authToken");
    config.databasePath = optionalString(doc, "databasePath", config.databasePath);
    config.signingKeyPath = optionalString(doc, "signingKeyPath", config.signingKeyPath);

    if (config.uiRoot.empty()) {
        throw ConfigError("\"uiRoot\" must not be empty");
    }

    if (auto it = doc.find("maxStaticSetMembers"); it != doc.end()) {
        // A limit of one could never shrink the next level of subsets
        if (!it->is_number_integer() || it->get<long long>() < 2) {
            throw ConfigError("\"maxStaticSetMembers\" must be an integer of at least 2");
        }
        config.maxStaticSetMembers = it->get<size_t>();
    }

    if (auto it = doc.find("parallelUploads"); it != doc.end()) {
        if (!it->is_boolean()) {
            throw ConfigError("\"parallelUploads\" must be a boolean");
        }
        config.parallelUploads = it->get<bool>();
    }

    if (auto it = doc.find("hashAlgorithm"); it != doc.end()) {
        auto algo = it->is_string()
            ? core::BlobRef::algorithmFromName(it->get<std::string>())
            : std::nullopt;
        if (!algo) {
            throw ConfigError("\"hashAlgorithm\" must be one of sha1, sha224, sha256");
        }
        config.hashAlgorithm = *algo;
    }

    return config;
}

ShareConfig ShareConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("cannot open configuration file " + path);
    }

    auto doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded()) {
        throw ConfigError("configuration file " + path + " is not valid JSON");
    }

    auto config = fromJson(doc);
    auto logger = log::get("config");
    logger->debug("loaded configuration from {}", path);
    if (!config.sharingEnabled()) {
        logger->warn("no shareRoot configured, sharing is disabled");
    }
    return config;
}

nlohmann::json ShareConfig::toJson() const {
    return {
        {"shareRoot", shareRoot},
        {"uiRoot", uiRoot},
        {"authToken", authToken},
        {"maxStaticSetMembers", maxStaticSetMembers},
        {"parallelUploads", parallelUploads},
        {"hashAlgorithm", core::BlobRef::algorithmName(hashAlgorithm)},
        {"databasePath", databasePath},
        {"signingKeyPath", signingKeyPath}
    };
}

} // namespace capshare::config
