#ifndef PROOF_VALIDATOR_H
#define PROOF_VALIDATOR_H

#include <nlohmann/json.hpp>

#include <cstdint>
#include <vector>

#include "hashEngine.h"
#include "merkleProof.h"
#include "validationParams.h"

using json = nlohmann::json;

// Checks audit paths against a claimed root. Must be configured with the
// parameters the proof declares, never with local defaults, otherwise a
// correct path folds to a different digest.
class ProofValidator {
    private:
        ValidationParams params;
        HashEngine engine;

    public:
        explicit ProofValidator(const ValidationParams& params);

        // requires algorithm, encoding, raw_bytes and security
        explicit ProofValidator(const json& config);

        // Reduces a signed path to a single digest starting at index start.
        // An entry signed +1 is combined with its right neighbour as the left
        // operand, one signed -1 with its left neighbour as the right operand.
        // The combined digest inherits the neighbour's sign. Throws
        // InvalidProofError when the path cannot be reduced.
        std::vector<uint8_t> FoldPath(const std::vector<SignedHash>& path, int64_t start) const;

        // returns normally on success, throws InvalidProofError otherwise
        void Run(const std::vector<uint8_t>& target, const MerkleProof& proof) const;
};

#endif
