#ifndef VALIDATION_PARAMS_H
#define VALIDATION_PARAMS_H

#include <nlohmann/json.hpp>

#include "crypto.h"
#include "encoding.h"

using json = nlohmann::json;

// hashing regime a proof was generated under, as declared in its header
struct ValidationParams {
        Algorithm algorithm{Algorithm::SHA256};
        Encoding encoding{Encoding::UTF_8};
        bool rawBytes{true};  // whether the generating tree took raw bytes rather than text
        bool security{true};  // domain separation of leaf and pair inputs

        // requires the keys algorithm, encoding, raw_bytes and security;
        // throws MissingConfigurationKeyError naming the first one absent
        static ValidationParams FromJson(const json& config);

        json ToJson() const;
};

bool operator==(const ValidationParams& lhs, const ValidationParams& rhs);

#endif
