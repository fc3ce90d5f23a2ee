#include "proofValidator.h"

#include <cstddef>
#include <string>
#include <utility>

#include "errors.h"

ProofValidator::ProofValidator(const ValidationParams& params)
    : params(params), engine(params.algorithm, params.encoding, params.security) {}

ProofValidator::ProofValidator(const json& config)
    : ProofValidator(ValidationParams::FromJson(config)) {}

std::vector<uint8_t> ProofValidator::FoldPath(const std::vector<SignedHash>& path,
                                              int64_t start) const {
    if (path.empty()) {
        throw InvalidProofError("empty proof path");
    }

    if (start < 0 || static_cast<uint64_t>(start) >= path.size()) {
        throw InvalidProofError("proof index " + std::to_string(start) +
                                " out of range (path has " + std::to_string(path.size()) +
                                " entries)");
    }

    std::vector<SignedHash> work = path;
    size_t i = static_cast<size_t>(start);

    while (work.size() > 1) {
        const SignedHash& current = work[i];

        if (current.sign == SIGN_LEFT) {
            if (i + 1 >= work.size()) {
                throw InvalidProofError("entry " + std::to_string(i) + " has no right neighbour");
            }

            // current | right neighbour
            SignedHash combined{work[i + 1].sign, engine.HashPair(current.hash, work[i + 1].hash)};
            work[i] = std::move(combined);
            work.erase(work.begin() + static_cast<std::ptrdiff_t>(i) + 1);
        } else if (current.sign == SIGN_RIGHT) {
            if (i == 0) {
                throw InvalidProofError("entry 0 has no left neighbour");
            }

            // left neighbour | current
            SignedHash combined{work[i - 1].sign, engine.HashPair(work[i - 1].hash, current.hash)};
            work[i] = std::move(combined);
            work.erase(work.begin() + static_cast<std::ptrdiff_t>(i) - 1);
            i--;
        } else {
            throw InvalidProofError("entry " + std::to_string(i) + " has invalid sign " +
                                    std::to_string(current.sign));
        }
    }

    return work[0].hash;
}

void ProofValidator::Run(const std::vector<uint8_t>& target, const MerkleProof& proof) const {
    // a proof that failed at generation is never valid, whatever its path says
    if (!proof.header.generation) {
        throw InvalidProofError("proof was not generated");
    }

    if (target != FoldPath(proof.body.proofPath, proof.body.proofIndex)) {
        throw InvalidProofError("path does not lead to the target hash");
    }
}
