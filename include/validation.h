#ifndef VALIDATION_H
#define VALIDATION_H

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "merkleProof.h"
#include "receipt.h"

// Validates proof against target with the proof's own hashing parameters and
// records the outcome in proof.header.status. An invalid proof yields false,
// any other failure propagates. Not safe to call concurrently on one proof.
bool ValidateProof(const std::vector<uint8_t>& target, MerkleProof& proof);

// ValidateProof wrapped into a receipt; when dirpath is given the receipt is
// also written there as <uuid>.json
Receipt ValidationReceipt(const std::vector<uint8_t>& target, MerkleProof& proof,
                          const std::optional<std::string>& dirpath = std::nullopt);

// writes <dirpath>/<uuid>.json and returns its path, throws on I/O failure
std::string StoreReceipt(const Receipt& receipt, const std::string& dirpath);

#endif
