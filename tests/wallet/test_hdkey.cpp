// SIGIL - HD Key Derivation Tests
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include <gtest/gtest.h>

#include "sigil/core/hex.h"
#include "sigil/wallet/hdkey.h"

#include <string>
#include <vector>

namespace sigil {
namespace wallet {
namespace test {

// ============================================================================
// Path Parsing
// ============================================================================

TEST(DerivationPathTest, ParseDefaultAccountPath) {
    auto path = DerivationPath::FromString("m/44'/60'/0'/0/0");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->Depth(), 5u);
    EXPECT_EQ(path->GetIndices(),
              (std::vector<uint32_t>{44 | HARDENED_FLAG, 60 | HARDENED_FLAG,
                                     HARDENED_FLAG, 0, 0}));
    EXPECT_EQ(*path, DerivationPath({PathComponent(44, true), PathComponent(60, true),
                                     PathComponent(0, true), PathComponent(0),
                                     PathComponent(0)}));
}

TEST(DerivationPathTest, HardenedMarkers) {
    auto apostrophe = DerivationPath::FromString("m/44'/60'/0'");
    auto lowerH = DerivationPath::FromString("m/44h/60h/0h");
    auto upperH = DerivationPath::FromString("m/44H/60H/0H");
    ASSERT_TRUE(apostrophe && lowerH && upperH);
    EXPECT_EQ(*apostrophe, *lowerH);
    EXPECT_EQ(*apostrophe, *upperH);
    EXPECT_EQ(lowerH->ToString(), "m/44'/60'/0'");
}

TEST(DerivationPathTest, RenderRoundTrip) {
    for (const char* text : {"m/0", "m/44'/60'/0'/0/0", "m/1/2'/3/2147483647'"}) {
        auto path = DerivationPath::FromString(text);
        ASSERT_TRUE(path.has_value()) << text;
        EXPECT_EQ(path->ToString(), text);
    }
}

TEST(DerivationPathTest, UnmarkedHighIndexIsHardened) {
    auto path = DerivationPath::FromString("m/2147483648");
    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->Depth(), 1u);
    EXPECT_TRUE(path->GetComponents()[0].hardened);
    EXPECT_EQ(path->GetComponents()[0].index, 0u);
    EXPECT_EQ(path->ToString(), "m/0'");

    auto max = DerivationPath::FromString("m/4294967295");
    ASSERT_TRUE(max.has_value());
    EXPECT_EQ(max->GetIndices()[0], 0xFFFFFFFFu);
}

TEST(DerivationPathTest, RejectsMalformed) {
    const char* bad[] = {
        "",
        "m",
        "m/",
        "44'/60'/0'/0/0",
        "M/44'/60'",
        "m//0",
        "m/0/",
        "m/-1",
        "m/+1",
        "m/1a",
        "m/ 1",
        "m/0x10",
        "m/''",
        "m/2147483648'",
        "m/4294967296",
        "m/99999999999",
    };
    for (const char* text : bad) {
        EXPECT_FALSE(DerivationPath::FromString(text).has_value()) << text;
    }
}

TEST(DerivationPathTest, ErrorMessages) {
    std::string error;
    EXPECT_FALSE(DerivationPath::FromString("", &error));
    EXPECT_EQ(error, "empty derivation path");

    EXPECT_FALSE(DerivationPath::FromString("44'/0", &error));
    EXPECT_EQ(error, "derivation path must start with \"m/\"");

    EXPECT_FALSE(DerivationPath::FromString("m/44'//0", &error));
    EXPECT_EQ(error, "empty component in derivation path");

    EXPECT_FALSE(DerivationPath::FromString("m/44'/abc", &error));
    EXPECT_EQ(error, "invalid component \"abc\" in derivation path");
}

TEST(DerivationPathTest, MasterPath) {
    DerivationPath master;
    EXPECT_TRUE(master.IsEmpty());
    EXPECT_EQ(master.ToString(), "m");
    EXPECT_TRUE(master.GetIndices().empty());
}

// ============================================================================
// BIP32 Test Vector 1
// ============================================================================

class ExtendedKeyTest : public ::testing::Test {
protected:
    void SetUp() override {
        seed_ = HexToBytes("000102030405060708090a0b0c0d0e0f");
        master_ = ExtendedKey::FromSeed(seed_.data(), seed_.size());
    }

    std::string KeyHex(const ExtendedKey& key) {
        auto priv = key.GetPrivateKey();
        return priv ? priv->ToHex() : std::string();
    }

    std::vector<Byte> seed_;
    ExtendedKey master_;
};

TEST_F(ExtendedKeyTest, Master) {
    ASSERT_TRUE(master_.IsValid());
    EXPECT_EQ(KeyHex(master_),
              "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");
    EXPECT_EQ(BytesToHex(master_.GetChainCode()),
              "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508");
    EXPECT_EQ(master_.GetDepth(), 0);
    EXPECT_EQ(master_.GetFingerprint(), 0x3442193eu);
}

TEST_F(ExtendedKeyTest, HardenedChild) {
    auto child = master_.DeriveChild(0 | HARDENED_FLAG);
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(KeyHex(*child),
              "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea");
    EXPECT_EQ(BytesToHex(child->GetChainCode()),
              "47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141");
    EXPECT_EQ(child->GetDepth(), 1);
    EXPECT_EQ(child->GetParentFingerprint(), 0x3442193eu);
    EXPECT_EQ(child->GetChildIndex(), HARDENED_FLAG);
}

TEST_F(ExtendedKeyTest, NormalChildOfHardened) {
    auto path = DerivationPath::FromString("m/0'/1");
    ASSERT_TRUE(path.has_value());
    auto key = master_.DerivePath(*path);
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(KeyHex(*key),
              "3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368");
    EXPECT_EQ(BytesToHex(key->GetChainCode()),
              "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19");
    EXPECT_EQ(key->GetDepth(), 2);
    EXPECT_EQ(key->GetParentFingerprint(), 0x5c1bd648u);
}

TEST_F(ExtendedKeyTest, EmptyPathIsMaster) {
    auto key = master_.DerivePath(DerivationPath());
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(KeyHex(*key), KeyHex(master_));
}

TEST_F(ExtendedKeyTest, RejectsBadSeedLength) {
    std::vector<Byte> shortSeed(15, 0x01);
    std::vector<Byte> longSeed(65, 0x01);
    EXPECT_FALSE(ExtendedKey::FromSeed(shortSeed.data(), shortSeed.size()).IsValid());
    EXPECT_FALSE(ExtendedKey::FromSeed(longSeed.data(), longSeed.size()).IsValid());
}

TEST_F(ExtendedKeyTest, DepthLimit) {
    auto key = master_.GetPrivateKey();
    ASSERT_TRUE(key.has_value());
    ExtendedKey deep(*key, master_.GetChainCode(), ExtendedKey::MAX_DEPTH - 1);
    auto last = deep.DeriveChild(0);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->GetDepth(), ExtendedKey::MAX_DEPTH);
    EXPECT_FALSE(last->DeriveChild(0).has_value());
    EXPECT_FALSE(last->DeriveChild(HARDENED_FLAG).has_value());
}

TEST_F(ExtendedKeyTest, InvalidKeyCannotDerive) {
    ExtendedKey invalid;
    EXPECT_FALSE(invalid.IsValid());
    EXPECT_FALSE(invalid.DeriveChild(0).has_value());
    EXPECT_FALSE(invalid.GetPrivateKey().has_value());
}

// ============================================================================
// BIP39 Mnemonics
// ============================================================================

const char* ABANDON_ABOUT =
    "abandon abandon abandon abandon abandon abandon "
    "abandon abandon abandon abandon abandon about";

TEST(MnemonicTest, Wordlist) {
    EXPECT_EQ(Mnemonic::WordCount(), 2048u);
    EXPECT_EQ(Mnemonic::GetWord(0), "abandon");
    EXPECT_EQ(Mnemonic::GetWord(2047), "zoo");
    EXPECT_EQ(Mnemonic::GetWordIndex("about"), 3);
    EXPECT_EQ(Mnemonic::GetWordIndex("junk"), 970);
    EXPECT_EQ(Mnemonic::GetWordIndex("TEST"), 1788);
    EXPECT_EQ(Mnemonic::GetWordIndex("notaword"), -1);
}

TEST(MnemonicTest, FromEntropyVectors) {
    std::vector<Byte> zeros(16, 0x00);
    std::vector<Byte> sevens(16, 0x7f);
    std::vector<Byte> ones(16, 0xff);
    std::vector<Byte> eighties(32, 0x80);

    EXPECT_EQ(Mnemonic::FromEntropy(zeros.data(), zeros.size()), ABANDON_ABOUT);
    EXPECT_EQ(Mnemonic::FromEntropy(sevens.data(), sevens.size()),
              "legal winner thank year wave sausage worth useful legal winner thank yellow");
    EXPECT_EQ(Mnemonic::FromEntropy(ones.data(), ones.size()),
              "zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo zoo wrong");
    EXPECT_EQ(Mnemonic::FromEntropy(eighties.data(), eighties.size()),
              "letter advice cage absurd amount doctor acoustic avoid letter advice cage absurd "
              "amount doctor acoustic avoid letter advice cage absurd amount doctor acoustic bless");
}

TEST(MnemonicTest, FromEntropyRejectsBadLength) {
    std::vector<Byte> entropy(17, 0x00);
    EXPECT_EQ(Mnemonic::FromEntropy(entropy.data(), entropy.size()), "");
}

TEST(MnemonicTest, ToEntropyInvertsFromEntropy) {
    std::vector<Byte> entropy(32, 0x80);
    std::string words = Mnemonic::FromEntropy(entropy.data(), entropy.size());
    EXPECT_EQ(Mnemonic::ToEntropy(words), entropy);
}

TEST(MnemonicTest, CheckStatuses) {
    EXPECT_EQ(Mnemonic::Check(ABANDON_ABOUT), MnemonicStatus::OK);
    EXPECT_EQ(Mnemonic::Check("test test test test test test test test test test test junk"),
              MnemonicStatus::OK);

    EXPECT_EQ(Mnemonic::Check(""), MnemonicStatus::BAD_WORD_COUNT);
    EXPECT_EQ(Mnemonic::Check("abandon abandon abandon abandon abandon abandon "
                              "abandon abandon abandon abandon about"),
              MnemonicStatus::BAD_WORD_COUNT);

    std::string badWord;
    EXPECT_EQ(Mnemonic::Check("abandon abandon abandon abandon abandon abandon "
                              "abandon abandon abandon abandon abandon abcdef", &badWord),
              MnemonicStatus::UNKNOWN_WORD);
    EXPECT_EQ(badWord, "abcdef");

    EXPECT_EQ(Mnemonic::Check("abandon abandon abandon abandon abandon abandon "
                              "abandon abandon abandon abandon abandon abandon"),
              MnemonicStatus::BAD_CHECKSUM);
}

TEST(MnemonicTest, CaseAndWhitespaceTolerant) {
    std::string messy = "  Abandon ABANDON abandon abandon abandon abandon\t"
                        "abandon abandon abandon abandon abandon   About \n";
    EXPECT_TRUE(Mnemonic::Validate(messy));
    EXPECT_EQ(Mnemonic::Normalize(messy), ABANDON_ABOUT);
    EXPECT_EQ(Mnemonic::ToSeed(messy), Mnemonic::ToSeed(ABANDON_ABOUT));
}

TEST(MnemonicTest, SeedVectors) {
    EXPECT_EQ(BytesToHex(Mnemonic::ToSeed(ABANDON_ABOUT)),
              "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
              "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4");
    EXPECT_EQ(BytesToHex(Mnemonic::ToSeed(ABANDON_ABOUT, "TREZOR")),
              "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
              "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");
    EXPECT_EQ(BytesToHex(Mnemonic::ToSeed(
                  "legal winner thank year wave sausage worth useful legal winner thank yellow",
                  "TREZOR")),
              "2e8905819b8723fe2c1d161860e5ee1830318dbf49a83bd451cfb8440c28bd6f"
              "a457fe1296106559a3c80937a1c1069be3a3a5bd381ee6260e8d9739fce1f607");
}

TEST(MnemonicTest, EthereumAccountFromSeed) {
    auto master = ExtendedKey::FromBIP39Seed(Mnemonic::ToSeed(ABANDON_ABOUT));
    auto account = master.DerivePath(*DerivationPath::FromString("m/44'/60'/0'/0/0"));
    ASSERT_TRUE(account.has_value());
    auto key = account->GetPrivateKey();
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->ToHex(), "1ab42cc412b618bdea3a599e3c9bae199ebf030895b039e9db1e30dafb12b727");
    EXPECT_EQ(account->GetPublicKey().GetAddress().ToHex(),
              "9858effd232b4033e47d90003d41ec34ecaeda94");
}

} // namespace test
} // namespace wallet
} // namespace sigil
