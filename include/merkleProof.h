#ifndef MERKLE_PROOF_H
#define MERKLE_PROOF_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "validationParams.h"

using json = nlohmann::json;

// sign values of a path entry
inline constexpr int SIGN_LEFT = +1;   // entry is the left operand, pairs with its right neighbour
inline constexpr int SIGN_RIGHT = -1;  // entry is the right operand, pairs with its left neighbour

struct SignedHash {
        int sign{SIGN_LEFT};
        std::vector<uint8_t> hash;
};

struct ProofHeader {
        std::string uuid;
        int64_t timestamp{0};
        std::string creationMoment;
        bool generation{false};  // false when the provider could not produce a path
        std::string provider;    // uuid of the tree that produced the proof
        ValidationParams params;
        std::optional<bool> status;  // outcome of the last validation, unset before any
};

struct ProofBody {
        int64_t proofIndex{-1};  // position of the leaf entry in the path, -1 when not generated
        std::vector<SignedHash> proofPath;
};

// Audit path as handed over by a tree provider. Only the status slot is
// written on the verifying side.
struct MerkleProof {
        ProofHeader header;
        ProofBody body;

        MerkleProof() = default;

        // fresh proof, mints uuid and timestamp
        MerkleProof(const std::string& provider, const ValidationParams& params, bool generation,
                    int64_t proofIndex, const std::vector<SignedHash>& proofPath);

        ValidationParams GetValidationParams() const { return header.params; }

        // hashes appear as text, decoded with the declared encoding
        json Serialize() const;
        std::string ToJsonText() const;

        static MerkleProof FromJson(const json& serialized);
        static MerkleProof FromJsonText(const std::string& text);

        std::string ToString() const;
};

std::ostream& operator<<(std::ostream& os, const MerkleProof& proof);

#endif
