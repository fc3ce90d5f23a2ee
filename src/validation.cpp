#include "validation.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "errors.h"
#include "proofValidator.h"

bool ValidateProof(const std::vector<uint8_t>& target, MerkleProof& proof) {
    ProofValidator validator(proof.GetValidationParams());

    bool result = true;
    try {
        validator.Run(target, proof);
    } catch (const InvalidProofError&) {
        result = false;
    }

    proof.header.status = result;
    return result;
}

Receipt ValidationReceipt(const std::vector<uint8_t>& target, MerkleProof& proof,
                          const std::optional<std::string>& dirpath) {
    bool result = ValidateProof(target, proof);

    Receipt receipt(proof.header.uuid, proof.header.provider, result);

    if (dirpath) {
        StoreReceipt(receipt, *dirpath);
    }

    return receipt;
}

std::string StoreReceipt(const Receipt& receipt, const std::string& dirpath) {
    std::filesystem::path receiptPath =
        std::filesystem::path(dirpath) / (receipt.GetHeader().uuid + ".json");

    std::ofstream file(receiptPath, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open receipt file " + receiptPath.string());
    }

    file << receipt.ToJsonText();

    if (!file) {
        throw std::runtime_error("Failed to write receipt file " + receiptPath.string());
    }

    return receiptPath.string();
}
