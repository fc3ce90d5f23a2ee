#include "merkleProof.h"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "utils.h"

MerkleProof::MerkleProof(const std::string& provider, const ValidationParams& params,
                         bool generation, int64_t proofIndex,
                         const std::vector<SignedHash>& proofPath) {
    std::time_t now = std::time(nullptr);

    header.uuid = GenerateUUID();
    header.timestamp = static_cast<int64_t>(now);
    header.creationMoment = FormatMoment(now);
    header.generation = generation;
    header.provider = provider;
    header.params = params;

    body.proofIndex = proofIndex;
    body.proofPath = proofPath;
}

json MerkleProof::Serialize() const {
    json path = json::array();
    for (const SignedHash& entry : body.proofPath) {
        path.push_back(json::array({entry.sign, DecodeText(entry.hash, header.params.encoding)}));
    }

    json headerJson = header.params.ToJson();
    headerJson["uuid"] = header.uuid;
    headerJson["timestamp"] = header.timestamp;
    headerJson["creation_moment"] = header.creationMoment;
    headerJson["generation"] = header.generation;
    headerJson["provider"] = header.provider;
    headerJson["status"] = header.status ? json(*header.status) : json(nullptr);

    return json{{"header", headerJson},
                {"body", {{"proof_index", body.proofIndex}, {"proof_path", path}}}};
}

std::string MerkleProof::ToJsonText() const { return Serialize().dump(4); }

MerkleProof MerkleProof::FromJson(const json& serialized) {
    if (!serialized.is_object() || !serialized.contains("header") ||
        !serialized.contains("body")) {
        throw std::runtime_error("Proof requires header and body sections");
    }

    const json& headerJson = serialized.at("header");
    const json& bodyJson = serialized.at("body");

    MerkleProof proof;

    try {
        proof.header.params = ValidationParams::FromJson(headerJson);
        proof.header.uuid = headerJson.at("uuid").get<std::string>();
        proof.header.timestamp = headerJson.at("timestamp").get<int64_t>();
        proof.header.creationMoment = headerJson.at("creation_moment").get<std::string>();
        proof.header.generation = headerJson.at("generation").get<bool>();
        proof.header.provider = headerJson.at("provider").get<std::string>();

        const json& status = headerJson.value("status", json(nullptr));
        if (!status.is_null()) {
            proof.header.status = status.get<bool>();
        }

        proof.body.proofIndex = bodyJson.at("proof_index").get<int64_t>();

        const json& pathJson = bodyJson.at("proof_path");
        if (!pathJson.is_array()) {
            throw std::runtime_error("Proof path must be an array");
        }

        for (const json& entry : pathJson) {
            if (!entry.is_array() || entry.size() != 2) {
                throw std::runtime_error("Proof path entries must be [sign, hash] pairs");
            }
            if (!entry.at(0).is_number_integer()) {
                throw std::runtime_error("Proof path signs must be integers");
            }
            // out of range signs stay invalid for the fold instead of wrapping into +-1
            int64_t sign = entry.at(0).get<int64_t>();
            SignedHash signedHash;
            signedHash.sign =
                (sign == SIGN_LEFT || sign == SIGN_RIGHT) ? static_cast<int>(sign) : 0;
            signedHash.hash =
                EncodeText(entry.at(1).get<std::string>(), proof.header.params.encoding);
            proof.body.proofPath.push_back(signedHash);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed proof: ") + e.what());
    }

    return proof;
}

MerkleProof MerkleProof::FromJsonText(const std::string& text) {
    json parsed;
    try {
        parsed = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error(std::string("Proof is not valid JSON: ") + e.what());
    }
    return FromJson(parsed);
}

std::string MerkleProof::ToString() const {
    std::string status = "UNVALIDATED";
    if (header.status) {
        status = *header.status ? "VALID" : "NON VALID";
    }

    std::stringstream ss;
    ss << "\n    ----------------------------------- PROOF ------------------------------------\n"
       << "\n    uuid        : " << header.uuid << "\n"
       << "\n    generation  : " << (header.generation ? "SUCCESS" : "FAILURE")
       << "\n    timestamp   : " << header.timestamp << " (" << header.creationMoment << ")"
       << "\n    provider    : " << header.provider << "\n"
       << "\n    algorithm   : " << AlgorithmName(header.params.algorithm)
       << "\n    encoding    : " << EncodingName(header.params.encoding)
       << "\n    raw_bytes   : " << (header.params.rawBytes ? "TRUE" : "FALSE")
       << "\n    security    : " << (header.params.security ? "ACTIVATED" : "DEACTIVATED")
       << "\n"
       << "\n    proof-index : " << body.proofIndex
       << "\n    proof-path  :\n";

    for (size_t i = 0; i < body.proofPath.size(); i++) {
        const SignedHash& entry = body.proofPath[i];
        ss << "\n       [" << std::setw(2) << i << "]   " << (entry.sign > 0 ? "+" : "")
           << entry.sign << "  " << DecodeText(entry.hash, header.params.encoding);
    }

    ss << "\n\n    status      : " << status << "\n"
       << "\n    -------------------------------- END OF PROOF --------------------------------\n";
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const MerkleProof& proof) {
    return os << proof.ToString();
}
