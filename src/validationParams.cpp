#include "validationParams.h"

#include <stdexcept>
#include <string>

#include "errors.h"

static const json& requireKey(const json& config, const std::string& key) {
    if (!config.is_object() || !config.contains(key)) {
        throw MissingConfigurationKeyError(key);
    }
    return config.at(key);
}

static bool requireBool(const json& config, const std::string& key) {
    const json& value = requireKey(config, key);
    if (!value.is_boolean()) {
        throw std::invalid_argument("Hash engine could not be configured: " + key +
                                    " must be a boolean");
    }
    return value.get<bool>();
}

static std::string requireString(const json& config, const std::string& key) {
    const json& value = requireKey(config, key);
    if (!value.is_string()) {
        throw std::invalid_argument("Hash engine could not be configured: " + key +
                                    " must be a string");
    }
    return value.get<std::string>();
}

ValidationParams ValidationParams::FromJson(const json& config) {
    ValidationParams params;
    params.algorithm = ParseAlgorithm(requireString(config, "algorithm"));
    params.encoding = ParseEncoding(requireString(config, "encoding"));
    params.rawBytes = requireBool(config, "raw_bytes");
    params.security = requireBool(config, "security");
    return params;
}

json ValidationParams::ToJson() const {
    return json{{"algorithm", AlgorithmName(algorithm)},
                {"encoding", EncodingName(encoding)},
                {"raw_bytes", rawBytes},
                {"security", security}};
}

bool operator==(const ValidationParams& lhs, const ValidationParams& rhs) {
    return lhs.algorithm == rhs.algorithm && lhs.encoding == rhs.encoding &&
           lhs.rawBytes == rhs.rawBytes && lhs.security == rhs.security;
}
