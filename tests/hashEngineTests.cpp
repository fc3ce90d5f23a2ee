#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "errors.h"
#include "hashEngine.h"
#include "utils.h"

TEST(HashEngine, DefaultsToSha256Utf8WithSecurity) {
    HashEngine engine;
    EXPECT_EQ(engine.GetAlgorithm(), Algorithm::SHA256);
    EXPECT_EQ(engine.GetEncoding(), Encoding::UTF_8);
    EXPECT_TRUE(engine.GetSecurity());
}

TEST(HashEngine, RejectsUnsupportedParameters) {
    EXPECT_THROW(HashEngine("sha1", "utf_8", true), UnsupportedParameterError);
    EXPECT_THROW(HashEngine("sha-256", "utf_8", true), UnsupportedParameterError);
    EXPECT_THROW(HashEngine("sha256", "utf8", true), UnsupportedParameterError);
    EXPECT_NO_THROW(HashEngine("SHA3-256", "UTF-16", false));
}

TEST(HashEngine, LeafDigestPrependsZeroByte) {
    HashEngine engine("sha256", "utf_8", true);
    EXPECT_EQ(BytesToString(engine.HashEntry("a")),
              "022a6979e6dab7aa5ae4c3e5e45f7e977112a7e63593820dbec1ec738a24f93c");
}

TEST(HashEngine, LeafDigestWithoutSecurityIsPlainDigest) {
    HashEngine engine("sha256", "utf_8", false);
    EXPECT_EQ(BytesToString(engine.HashEntry("a")),
              "ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb");
}

TEST(HashEngine, TextAndBytesHashAlike) {
    HashEngine engine;
    EXPECT_EQ(engine.HashEntry("payload"), engine.HashEntry(StringToBytes("payload")));
}

TEST(HashEngine, PairDigestPrefixesEachOperand) {
    HashEngine engine("sha256", "utf_8", true);
    std::vector<uint8_t> a = engine.HashEntry("a");
    std::vector<uint8_t> b = engine.HashEntry("b");

    EXPECT_EQ(BytesToString(b),
              "57eb35615d47f34ec714cacdf5fd74608a5e8e102724e80b24b287c0c27b6a31");
    EXPECT_EQ(BytesToString(engine.HashPair(a, b)),
              "9d53c5e93a2a48ed466424beba7933f8009aa0c758a8b4833b62ee6bebcfdf20");

    // same as digesting 0x01 | a | 0x01 | b by hand
    std::vector<uint8_t> buffer;
    buffer.push_back(0x01);
    buffer.insert(buffer.end(), a.begin(), a.end());
    buffer.push_back(0x01);
    buffer.insert(buffer.end(), b.begin(), b.end());
    EXPECT_EQ(BytesToString(engine.HashPair(a, b)), HexDigest(Algorithm::SHA256, buffer, 1024));
}

TEST(HashEngine, PairOrderMatters) {
    HashEngine engine;
    std::vector<uint8_t> a = engine.HashEntry("a");
    std::vector<uint8_t> b = engine.HashEntry("b");
    EXPECT_NE(engine.HashPair(a, b), engine.HashPair(b, a));
}

TEST(HashEngine, SupportsEveryAlgorithm) {
    struct Vector {
            const char* algorithm;
            const char* digest;
    };

    const Vector vectors[] = {
        {"md5", "760f753576f2955b0074758acb4d5fa6"},
        {"sha224", "d95baf2bf68a013f316b01dc606dce2c7c2b5647e7c436fb41e4a886"},
        {"sha384",
         "f5077c4b6e328b21e2f21192776daf9660ceaeaf40a1796b58bd9500b36aff2cb5acd79d2789f891541818315"
         "233ff6c"},
        {"sha512",
         "031ab9ff5962e81139a6900216945fc584ab186aeb1bf3498c661b976a7393af94b6bcc9784f7e8cb75b071de"
         "60f9fda06d44ddd561e53e3343857eea2089217"},
        {"sha3_256", "d4a31b6bbfc0f8229bcb66ba85fd3cf1fe50c5da2f4cc69edbdf1e313258aaba"},
    };

    for (const Vector& v : vectors) {
        HashEngine engine(v.algorithm, "utf_8", true);
        EXPECT_EQ(BytesToString(engine.HashEntry("a")), v.digest) << v.algorithm;
    }
}

TEST(HashEngine, Utf16PrefixesAndOutputAreEncoded) {
    HashEngine engine("sha256", "utf_16", true);

    // digest of ff fe 00 00 ff fe 61 00, returned as BOM + UTF-16LE hex text
    std::vector<uint8_t> expected =
        EncodeText("8456a65b87b2509a5c4fcca08d92a6df313e78a3a599a302bfc746b53b36da4a",
                   Encoding::UTF_16);
    EXPECT_EQ(engine.HashEntry("a"), expected);
    EXPECT_EQ(expected.size(), 2u + 2u * 64u);
}

TEST(HashEngine, ChunkSizeDoesNotChangeDigest) {
    std::vector<uint8_t> data(5000, 'x');

    HashEngine small(Algorithm::SHA256, Encoding::UTF_8, true, 7);
    HashEngine standard(Algorithm::SHA256, Encoding::UTF_8, true);
    HashEngine whole(Algorithm::SHA256, Encoding::UTF_8, true, 1 << 20);

    EXPECT_EQ(BytesToString(standard.HashEntry(data)),
              "b509c573962cd061685e5b982933e02fcf58c581d566d4c5474f50e5844a5641");
    EXPECT_EQ(small.HashEntry(data), standard.HashEntry(data));
    EXPECT_EQ(whole.HashEntry(data), standard.HashEntry(data));
}

TEST(HashEngine, IsDeterministic) {
    for (const char* algorithm : {"md5", "sha256", "sha3_512"}) {
        for (const char* encoding : {"ascii", "utf_8", "utf_16_be", "utf_32"}) {
            for (bool security : {true, false}) {
                HashEngine first(algorithm, encoding, security);
                HashEngine second(algorithm, encoding, security);
                EXPECT_EQ(first.HashEntry("entry"), second.HashEntry("entry"));

                std::vector<uint8_t> left = first.HashEntry("left");
                std::vector<uint8_t> right = first.HashEntry("right");
                EXPECT_EQ(first.HashPair(left, right), second.HashPair(left, right));
            }
        }
    }
}

TEST(HashEngine, LeafAndPairDomainsAreSeparated) {
    HashEngine engine("sha256", "utf_8", true);
    std::vector<uint8_t> value = engine.HashEntry("x");

    // the same bytes as a leaf and as either half of a pair never agree
    for (const char* partner : {"", "x", "y"}) {
        std::vector<uint8_t> other = StringToBytes(partner);
        std::vector<uint8_t> joined = value;
        joined.insert(joined.end(), other.begin(), other.end());

        EXPECT_NE(engine.HashEntry(joined), engine.HashPair(value, other));
        EXPECT_NE(engine.HashEntry(value), engine.HashPair(value, other));
        EXPECT_NE(engine.HashEntry(value), engine.HashPair(other, value));
    }
}

TEST(HashEngine, WithoutSecurityLeafAndPairCollide) {
    HashEngine engine("sha256", "utf_8", false);
    std::vector<uint8_t> left = StringToBytes("ab");
    std::vector<uint8_t> right = StringToBytes("cd");
    EXPECT_EQ(engine.HashPair(left, right), engine.HashEntry("abcd"));
}

TEST(HashEngine, OverlongTextDoesNotAliasCanonicalText) {
    for (const char* encoding : {"ascii", "latin_1", "utf_8", "utf_16_le", "utf_32_be"}) {
        HashEngine engine("sha256", encoding, true);
        EXPECT_NO_THROW(engine.HashEntry("!"));
        EXPECT_THROW(engine.HashEntry("\xC0\xA1"), std::invalid_argument) << encoding;
    }
}
