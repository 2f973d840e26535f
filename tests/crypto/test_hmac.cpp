// SIGIL - HMAC / PBKDF2 Tests
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include <gtest/gtest.h>

#include "sigil/core/hex.h"
#include "sigil/crypto/hmac.h"
#include "sigil/crypto/sha256.h"

#include <algorithm>
#include <string>
#include <vector>

namespace sigil {
namespace {

std::vector<Byte> Bytes(const std::string& s) {
    return std::vector<Byte>(s.begin(), s.end());
}

// ============================================================================
// SHA-256
// ============================================================================

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(Bytes("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, Hash160OfCompressedGenerator) {
    // Compressed public key of private key 1
    auto pub = HexToBytes("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    auto h = Hash160(pub.data(), pub.size());
    EXPECT_EQ(BytesToHex(h), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

// ============================================================================
// HMAC (RFC 4231 test case 2)
// ============================================================================

TEST(HMACTest, SHA256Rfc4231Case2) {
    auto key = Bytes("Jefe");
    auto data = Bytes("what do ya want for nothing?");
    Hash256 mac = ComputeHMAC_SHA256(key.data(), key.size(), data.data(), data.size());
    EXPECT_EQ(mac.ToHex(),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HMACTest, SHA512Rfc4231Case2) {
    Hash512 mac = ComputeHMAC_SHA512(Bytes("Jefe"), Bytes("what do ya want for nothing?"));
    EXPECT_EQ(mac.ToHex(),
              "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
              "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST(HMACTest, StreamingMatchesOneShot) {
    auto key = Bytes("Jefe");
    auto data = Bytes("what do ya want for nothing?");

    HMAC_SHA256 hmac(key.data(), key.size());
    hmac.Write(data.data(), 4).Write(data.data() + 4, data.size() - 4);

    Byte out[HMAC_SHA256::OUTPUT_SIZE];
    hmac.Finalize(out);

    EXPECT_EQ(BytesToHex(out, sizeof(out)),
              ComputeHMAC_SHA256(key.data(), key.size(), data.data(), data.size()).ToHex());
}

TEST(HMACTest, ResetStartsOver) {
    auto key = Bytes("Jefe");
    auto data = Bytes("what do ya want for nothing?");

    HMAC_SHA512 hmac(key.data(), key.size());
    hmac.Write(reinterpret_cast<const Byte*>("noise"), 5);
    hmac.Reset();
    hmac.Write(data.data(), data.size());

    Byte out[HMAC_SHA512::OUTPUT_SIZE];
    hmac.Finalize(out);

    EXPECT_EQ(BytesToHex(out, sizeof(out)), ComputeHMAC_SHA512(key, data).ToHex());
}

// ============================================================================
// PBKDF2-HMAC-SHA512
// ============================================================================

TEST(PBKDF2Test, OneIteration) {
    auto key = PBKDF2_SHA512("password", Bytes("salt"), 1, 64);
    EXPECT_EQ(BytesToHex(key),
              "867f70cf1ade02cff3752599a3a53dc4af34c7a669815ae5d513554e1c8cf252"
              "c02d470a285a0501bad999bfe943c08f050235d7d68b1da55e63f73b60a57fce");
}

TEST(PBKDF2Test, TwoIterations) {
    auto key = PBKDF2_SHA512("password", Bytes("salt"), 2, 64);
    EXPECT_EQ(BytesToHex(key),
              "e1d9c16aa681708a45f5c7c4e215ceb66e011a2e9f0040713f18aefdb866d53c"
              "f76cab2868a39b9f7840edce4fef5a82be67335c77a6068e04112754f27ccf4e");
}

TEST(PBKDF2Test, ShortOutput) {
    auto full = PBKDF2_SHA512("password", Bytes("salt"), 1, 64);
    auto part = PBKDF2_SHA512("password", Bytes("salt"), 1, 16);
    ASSERT_EQ(part.size(), 16u);
    EXPECT_TRUE(std::equal(part.begin(), part.end(), full.begin()));
}

} // namespace
} // namespace sigil
