// SIGIL - Configuration Tests
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include <gtest/gtest.h>

#include "sigil/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace sigil {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
    }

    std::string WriteTempFile(const std::string& content) {
        char filename[] = "/tmp/sigil_conf_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("mkstemp failed");
        }
        close(fd);

        std::ofstream out(filename);
        out << content;
        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigParseResult Parse(std::vector<const char*> args) {
        args.insert(args.begin(), "sigil-sign");
        return config_.ParseCommandLine(static_cast<int>(args.size()), args.data());
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Command Line
// ============================================================================

TEST_F(ConfigTest, CommandLineForms) {
    auto result = Parse({"-loglevel=debug", "--hd-paths=m/44'/60'/0'/0/1",
                         "--passphrase", "hidden wallet", "--ledger"});
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "debug");
    EXPECT_EQ(config_.GetString(ConfigKeys::HD_PATHS, ""), "m/44'/60'/0'/0/1");
    EXPECT_EQ(config_.GetString(ConfigKeys::PASSPHRASE, ""), "hidden wallet");
    EXPECT_TRUE(config_.GetBool(ConfigKeys::LEDGER, false));
    EXPECT_EQ(config_.GetSource(ConfigKeys::LEDGER), COMMAND_LINE_SOURCE);
}

TEST_F(ConfigTest, FlagFollowedByOption) {
    ASSERT_TRUE(Parse({"--ledger", "--hd-paths=m/0"}).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LEDGER, ""), "true");
    EXPECT_EQ(config_.GetString(ConfigKeys::HD_PATHS, ""), "m/0");
}

TEST_F(ConfigTest, NegatedOption) {
    ASSERT_TRUE(Parse({"-noprinttoconsole"}).success);
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, true));
}

TEST_F(ConfigTest, EmptyValueKept) {
    ASSERT_TRUE(Parse({"--private-key="}).success);
    EXPECT_TRUE(config_.HasKey(ConfigKeys::PRIVATE_KEY));
    EXPECT_EQ(config_.GetString(ConfigKeys::PRIVATE_KEY, "unset"), "");
}

TEST_F(ConfigTest, Positionals) {
    ASSERT_TRUE(Parse({"first", "-ledger=1", "second"}).success);
    ASSERT_EQ(config_.GetPositional().size(), 2u);
    EXPECT_EQ(config_.GetPositional()[0], "first");
    EXPECT_EQ(config_.GetPositional()[1], "second");
}

TEST_F(ConfigTest, BareOptionTakesNextArgument) {
    ASSERT_TRUE(Parse({"-ledger", "second"}).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LEDGER, ""), "second");
    EXPECT_TRUE(config_.GetPositional().empty());
}

TEST_F(ConfigTest, InvalidOption) {
    auto result = Parse({"--bad key=1"});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Invalid option: --bad key=1");
    EXPECT_EQ(result.errorSource, COMMAND_LINE_SOURCE);

    EXPECT_FALSE(Parse({"--"}).success);
}

TEST_F(ConfigTest, RepeatedOptionBuildsList) {
    ASSERT_TRUE(Parse({"-debug=derive", "-debug=device"}).success);
    auto list = config_.GetList(ConfigKeys::DEBUG);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0], "derive");
    EXPECT_EQ(list[1], "device");
    EXPECT_EQ(config_.GetString(ConfigKeys::DEBUG, ""), "derive");
}

// ============================================================================
// Config Text
// ============================================================================

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("\n# mnemonic=abandon\n; ledger\n   \n");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, KeyValueWithWhitespace) {
    ASSERT_TRUE(config_.ParseString("  hd-paths  =  m/44'/60'/0'/0/1  \nloglevel=info").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::HD_PATHS, ""), "m/44'/60'/0'/0/1");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "info");
}

TEST_F(ConfigTest, QuotedValues) {
    std::string content =
        "mnemonic=\"test test test test test test test test test test test junk\"\n"
        "passphrase='no \\n escapes'\n"
        "label=\"say \\\"hi\\\"\\tnow\"\n";
    ASSERT_TRUE(config_.ParseString(content).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::MNEMONIC, ""),
              "test test test test test test test test test test test junk");
    EXPECT_EQ(config_.GetString(ConfigKeys::PASSPHRASE, ""), "no \\n escapes");
    EXPECT_EQ(config_.GetString("label", ""), "say \"hi\"\tnow");
}

TEST_F(ConfigTest, FlagsInText) {
    ASSERT_TRUE(config_.ParseString("ledger\nnoprinttoconsole\n").success);
    EXPECT_TRUE(config_.GetBool(ConfigKeys::LEDGER, false));
    EXPECT_FALSE(config_.GetBool(ConfigKeys::PRINTTOCONSOLE, true));
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("SIGIL_TEST_ACCOUNT", "3", 1);
    ASSERT_TRUE(config_.ParseString("hd-paths=m/44'/60'/${SIGIL_TEST_ACCOUNT}'/0/0\n"
                                    "other=${SIGIL_TEST_UNSET_VARIABLE}x\n"
                                    "open=${UNTERMINATED").success);
    unsetenv("SIGIL_TEST_ACCOUNT");
    EXPECT_EQ(config_.GetString(ConfigKeys::HD_PATHS, ""), "m/44'/60'/3'/0/0");
    EXPECT_EQ(config_.GetString("other", ""), "x");
    EXPECT_EQ(config_.GetString("open", ""), "${UNTERMINATED");
}

TEST_F(ConfigTest, ErrorsCarryLocation) {
    auto empty = config_.ParseString("loglevel=warn\n=value\n", "test.conf");
    EXPECT_FALSE(empty.success);
    EXPECT_EQ(empty.errorMessage, "Empty key");
    EXPECT_EQ(empty.errorSource, "test.conf");
    EXPECT_EQ(empty.errorLine, 2);

    auto invalid = config_.ParseString("bad key=1", "test.conf");
    EXPECT_FALSE(invalid.success);
    EXPECT_EQ(invalid.errorMessage, "Invalid key 'bad key'");
    EXPECT_EQ(invalid.errorLine, 1);
}

TEST_F(ConfigTest, LongLineRejected) {
    auto result = config_.ParseString("key=" + std::string(MAX_LINE_LENGTH, 'a'));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Line too long");
}

// ============================================================================
// Source Priority
// ============================================================================

TEST_F(ConfigTest, CommandLineOverridesFile) {
    ASSERT_TRUE(Parse({"-loglevel=error"}).success);
    ASSERT_TRUE(config_.ParseString("loglevel=trace\nhd-paths=m/0", "a.conf").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "error");
    EXPECT_EQ(config_.GetString(ConfigKeys::HD_PATHS, ""), "m/0");
    EXPECT_EQ(config_.GetSource(ConfigKeys::HD_PATHS), "a.conf");
}

TEST_F(ConfigTest, CommandLineReplacesEarlierFile) {
    ASSERT_TRUE(config_.ParseString("loglevel=trace\nloglevel=info", "a.conf").success);
    ASSERT_TRUE(Parse({"-loglevel=error"}).success);
    auto list = config_.GetList(ConfigKeys::LOGLEVEL);
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], "error");
}

TEST_F(ConfigTest, FirstSourceWins) {
    ASSERT_TRUE(config_.ParseString("loglevel=info", "a.conf").success);
    ASSERT_TRUE(config_.ParseString("loglevel=trace", "b.conf").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "info");
    EXPECT_EQ(config_.GetSource(ConfigKeys::LOGLEVEL), "a.conf");
}

TEST_F(ConfigTest, DefaultsAndSet) {
    config_.SetDefault(ConfigKeys::LOGLEVEL, "warn");
    EXPECT_EQ(config_.GetSource(ConfigKeys::LOGLEVEL), "<default>");
    config_.SetDefault(ConfigKeys::LOGLEVEL, "trace");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "warn");

    ASSERT_TRUE(config_.ParseString("loglevel=info", "a.conf").success);
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "info");

    config_.Set(ConfigKeys::LOGLEVEL, "error");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "error");
    EXPECT_EQ(config_.GetSource(ConfigKeys::LOGLEVEL), "<programmatic>");
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, Integers) {
    ASSERT_TRUE(config_.ParseString("a=42\nb=-7\nc=12abc\nd=").success);
    EXPECT_EQ(config_.TryGetInt("a"), 42);
    EXPECT_EQ(config_.GetInt("b", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("c").has_value());
    EXPECT_FALSE(config_.TryGetInt("d").has_value());
    EXPECT_EQ(config_.GetInt("missing", 5), 5);
}

TEST_F(ConfigTest, Booleans) {
    EXPECT_EQ(ConfigManager::ParseBool("YES"), true);
    EXPECT_EQ(ConfigManager::ParseBool("on"), true);
    EXPECT_EQ(ConfigManager::ParseBool("0"), false);
    EXPECT_EQ(ConfigManager::ParseBool("Off"), false);
    EXPECT_FALSE(ConfigManager::ParseBool("maybe").has_value());

    ASSERT_TRUE(config_.ParseString("ledger=maybe").success);
    EXPECT_FALSE(config_.TryGetBool(ConfigKeys::LEDGER).has_value());
    EXPECT_TRUE(config_.GetBool(ConfigKeys::LEDGER, true));
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, UnknownKeysReported) {
    config_.AllowKey(ConfigKeys::LEDGER);
    config_.SetDefault("unused-default", "1");
    ASSERT_TRUE(config_.ParseString("ledger\n\nleger=1", "a.conf").success);
    ASSERT_TRUE(Parse({"-mnemnic=abc"}).success);

    auto warnings = config_.Validate();
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_EQ(warnings[0], "Unknown option 'leger' (a.conf:3)");
    EXPECT_EQ(warnings[1], "Unknown option 'mnemnic' (<command-line>)");
}

TEST_F(ConfigTest, ClearDropsEverything) {
    ASSERT_TRUE(Parse({"-ledger=1", "extra"}).success);
    config_.Clear();
    EXPECT_EQ(config_.Size(), 0u);
    EXPECT_TRUE(config_.GetPositional().empty());
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = WriteTempFile("ledger\nhd-paths=m/44'/60'/2'/0/0\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.errorMessage;
    EXPECT_TRUE(config_.GetBool(ConfigKeys::LEDGER, false));
    EXPECT_EQ(config_.GetSource(ConfigKeys::HD_PATHS), path);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/sigil.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Cannot open file: /nonexistent/sigil.conf");
}

TEST_F(ConfigTest, OversizedFile) {
    std::string path = WriteTempFile(std::string(MAX_CONFIG_SIZE + 1, '#'));
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Config file too large");
}

TEST_F(ConfigTest, ErrorLineInFile) {
    std::string path = WriteTempFile("ledger\n\n=oops\n");
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorSource, path);
    EXPECT_EQ(result.errorLine, 3);
}

TEST_F(ConfigTest, IncludeFile) {
    std::string inner = WriteTempFile("passphrase=from include\nloglevel=trace\n");
    std::string outer = WriteTempFile("loglevel=info\ninclude \"" + inner + "\"\n");
    ASSERT_TRUE(config_.ParseFile(outer).success);
    EXPECT_EQ(config_.GetString(ConfigKeys::PASSPHRASE, ""), "from include");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOGLEVEL, ""), "info");
}

TEST_F(ConfigTest, IncludeErrorsPropagate) {
    std::string outer = WriteTempFile("include /nonexistent/inner.conf\n");
    auto result = config_.ParseFile(outer);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Cannot open file: /nonexistent/inner.conf");
}

TEST_F(ConfigTest, IncludeCycleStops) {
    std::string path = WriteTempFile("");
    {
        std::ofstream out(path);
        out << "include " << path << "\n";
    }
    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorMessage, "Maximum include depth exceeded");
}

TEST_F(ConfigTest, ExpandPath) {
    setenv("SIGIL_TEST_DIR", "/opt/sigil", 1);
    EXPECT_EQ(ConfigManager::ExpandPath("${SIGIL_TEST_DIR}/sigil.conf"), "/opt/sigil/sigil.conf");
    unsetenv("SIGIL_TEST_DIR");

    const char* home = std::getenv("HOME");
    if (home) {
        EXPECT_EQ(ConfigManager::ExpandPath("~/sigil.conf"), std::string(home) + "/sigil.conf");
    }
    EXPECT_EQ(ConfigManager::ExpandPath("~user/x"), "~user/x");
    EXPECT_EQ(ConfigManager::ExpandPath("/etc/sigil.conf"), "/etc/sigil.conf");
}

} // namespace test
} // namespace util
} // namespace sigil
