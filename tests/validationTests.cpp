#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "errors.h"
#include "testTree.h"
#include "utils.h"
#include "validation.h"

namespace fs = std::filesystem;

static const ValidationParams DEFAULT_PARAMS{Algorithm::SHA256, Encoding::UTF_8, true, true};

class ValidationTest : public ::testing::Test {
    protected:
        fs::path dir;
        TestTree tree{DEFAULT_PARAMS, {"alpha", "beta", "gamma", "delta", "epsilon"}};

        void SetUp() override {
            dir = fs::temp_directory_path() / ("auditproof-" + GenerateUUID());
            fs::create_directories(dir);
        }

        void TearDown() override { fs::remove_all(dir); }

        static size_t countFiles(const fs::path& path) {
            size_t count = 0;
            for (const auto& entry : fs::directory_iterator(path)) {
                (void)entry;
                count++;
            }
            return count;
        }
};

TEST_F(ValidationTest, ValidProofSetsStatus) {
    MerkleProof proof = tree.ProofFor(2);
    EXPECT_FALSE(proof.header.status.has_value());

    EXPECT_TRUE(ValidateProof(tree.GetRoot(), proof));
    ASSERT_TRUE(proof.header.status.has_value());
    EXPECT_TRUE(*proof.header.status);
}

TEST_F(ValidationTest, InvalidProofMapsToFalse) {
    MerkleProof proof = tree.ProofFor(2);
    std::vector<uint8_t> target = tree.GetRoot();
    target[0] ^= 0x01;

    EXPECT_FALSE(ValidateProof(target, proof));
    ASSERT_TRUE(proof.header.status.has_value());
    EXPECT_FALSE(*proof.header.status);

    // the status follows the latest outcome
    EXPECT_TRUE(ValidateProof(tree.GetRoot(), proof));
    EXPECT_TRUE(*proof.header.status);
}

TEST_F(ValidationTest, UngeneratedProofIsFalse) {
    MerkleProof proof = tree.ProofFor(0);
    proof.header.generation = false;
    EXPECT_FALSE(ValidateProof(tree.GetRoot(), proof));
}

TEST_F(ValidationTest, UsesParametersDeclaredByProof) {
    ValidationParams declared{Algorithm::SHA512, Encoding::UTF_16_BE, true, false};
    TestTree other(declared, {"one", "two", "three"});
    MerkleProof proof = other.ProofFor(1);

    EXPECT_TRUE(ValidateProof(other.GetRoot(), proof));
}

TEST_F(ValidationTest, ReceiptWithoutDirectoryWritesNothing) {
    MerkleProof proof = tree.ProofFor(4);
    Receipt receipt = ValidationReceipt(tree.GetRoot(), proof);

    EXPECT_TRUE(receipt.GetBody().result);
    EXPECT_EQ(receipt.GetBody().proofUUID, proof.header.uuid);
    EXPECT_EQ(receipt.GetBody().proofProvider, proof.header.provider);
    EXPECT_EQ(countFiles(dir), 0u);
}

TEST_F(ValidationTest, ReceiptIsStoredUnderItsUUID) {
    MerkleProof proof = tree.ProofFor(1);
    Receipt receipt = ValidationReceipt(tree.GetRoot(), proof, dir.string());

    ASSERT_EQ(countFiles(dir), 1u);
    fs::path stored = dir / (receipt.GetHeader().uuid + ".json");
    ASSERT_TRUE(fs::exists(stored));

    std::ifstream file(stored);
    std::stringstream ss;
    ss << file.rdbuf();

    EXPECT_EQ(ss.str(), receipt.ToJsonText());
    EXPECT_EQ(Receipt::FromJsonText(ss.str()), receipt);
}

TEST_F(ValidationTest, FailedValidationStillProducesReceipt) {
    MerkleProof proof = tree.ProofFor(3);
    proof.body.proofPath[0].sign = 0;

    Receipt receipt = ValidationReceipt(tree.GetRoot(), proof, dir.string());
    EXPECT_FALSE(receipt.GetBody().result);
    EXPECT_TRUE(fs::exists(dir / (receipt.GetHeader().uuid + ".json")));
}

TEST_F(ValidationTest, WriteFailurePropagates) {
    MerkleProof proof = tree.ProofFor(1);
    fs::path missing = dir / "missing" / "nested";

    EXPECT_THROW(ValidationReceipt(tree.GetRoot(), proof, missing.string()), std::runtime_error);

    // validation itself still ran
    ASSERT_TRUE(proof.header.status.has_value());
    EXPECT_TRUE(*proof.header.status);
}
