// SIGIL - Keccak-256 Tests
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include <gtest/gtest.h>

#include "sigil/crypto/keccak.h"

#include <string>
#include <vector>

namespace sigil {
namespace {

// ============================================================================
// Known Answer Tests
// ============================================================================

TEST(Keccak256Test, EmptyInput) {
    EXPECT_EQ(Keccak256Hash(std::string()).ToHex(),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(Keccak256Test, Abc) {
    EXPECT_EQ(Keccak256Hash(std::string("abc")).ToHex(),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(Keccak256Test, Hello) {
    EXPECT_EQ(Keccak256Hash(std::string("hello")).ToHex(),
              "1c8aff950685c2ed4bc3174f3472287b56d9517b9c948127319a09a7a36deac8");
}

// Lengths around the 136-byte rate exercise the padding edge cases
TEST(Keccak256Test, OneByteShortOfRate) {
    EXPECT_EQ(Keccak256Hash(std::string(135, 'a')).ToHex(),
              "34367dc248bbd832f4e3e69dfaac2f92638bd0bbd18f2912ba4ef454919cf446");
}

TEST(Keccak256Test, ExactlyOneRate) {
    EXPECT_EQ(Keccak256Hash(std::string(136, 'a')).ToHex(),
              "a6c4d403279fe3e0af03729caada8374b5ca54d8065329a3ebcaeb4b60aa386e");
}

TEST(Keccak256Test, MultiBlock) {
    EXPECT_EQ(Keccak256Hash(std::string(200, 'a')).ToHex(),
              "96ea54061def936c4be90b518992fdc6f12f535068a256229aca54267b4d084d");
}

// ============================================================================
// Overloads
// ============================================================================

TEST(Keccak256Test, OverloadsAgree) {
    std::string text(200, 'a');
    std::vector<Byte> bytes(text.begin(), text.end());
    EXPECT_EQ(Keccak256Hash(text), Keccak256Hash(bytes));
    EXPECT_EQ(Keccak256Hash(bytes.data(), bytes.size()), Keccak256Hash(bytes));
    EXPECT_EQ(Keccak256Hash(std::vector<Byte>()).ToHex(), Keccak256Hash(std::string()).ToHex());
}

} // namespace
} // namespace sigil
