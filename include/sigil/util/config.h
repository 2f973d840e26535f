// SIGIL - Configuration
// Copyright (c) 2024 SIGIL Developers
// MIT License
//
// Options for sigil-sign come from the command line and, optionally, a
// config file named with -conf. Both use the same keys.
//
// File format:
//   # comment            ; comment
//   key=value            key="quoted value"      key=${ENV_VAR}/suffix
//   flag                 noflag                  include other.conf
//
// Priority: the command line always wins. Otherwise the first source to set a
// key keeps it. A key repeated within one source accumulates into a list whose
// first entry is the value GetString() returns.

#ifndef SIGIL_UTIL_CONFIG_H
#define SIGIL_UTIL_CONFIG_H

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sigil {
namespace util {

constexpr size_t MAX_CONFIG_SIZE = 64 * 1024;
constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr int MAX_INCLUDE_DEPTH = 8;
constexpr const char* COMMAND_LINE_SOURCE = "<command-line>";

/// Outcome of a parse call. On failure, errorSource/errorLine locate the problem.
struct ConfigParseResult {
    bool success{true};
    std::string errorMessage;
    std::string errorSource;
    int errorLine{0};

    static ConfigParseResult Ok() { return ConfigParseResult(); }
    static ConfigParseResult Fail(std::string message, std::string source = "", int line = 0) {
        ConfigParseResult result;
        result.success = false;
        result.errorMessage = std::move(message);
        result.errorSource = std::move(source);
        result.errorLine = line;
        return result;
    }
};

/// One value and where it came from
struct ConfigValue {
    std::string value;
    std::string source;
    int line{0};
};

class ConfigManager {
public:
    /**
     * Parse argv. Accepts -key=value, --key=value, --key value (when the next
     * argument does not start with '-'), -flag and -noflag. Arguments without
     * a leading '-' are collected as positionals.
     */
    ConfigParseResult ParseCommandLine(int argc, const char* const argv[]);

    /// Parse a config file; ~ and ${VAR} in the path are expanded
    ConfigParseResult ParseFile(const std::string& path);

    /// Parse config text; source names it in errors and GetSource()
    ConfigParseResult ParseString(const std::string& content,
                                  const std::string& source = "<string>");

    bool HasKey(const std::string& key) const;

    std::optional<std::string> TryGetString(const std::string& key) const;
    std::string GetString(const std::string& key, const std::string& fallback) const;

    /// Decimal integer; nullopt if missing or not a whole number
    std::optional<int64_t> TryGetInt(const std::string& key) const;
    int64_t GetInt(const std::string& key, int64_t fallback) const;

    /// nullopt if missing or not a recognised boolean
    std::optional<bool> TryGetBool(const std::string& key) const;
    bool GetBool(const std::string& key, bool fallback) const;

    /// Every value given for key in its winning source, in order
    std::vector<std::string> GetList(const std::string& key) const;

    /// Source of the winning value ("" if unset)
    std::string GetSource(const std::string& key) const;

    const std::vector<std::string>& GetPositional() const { return positional_; }

    /// Set a value that replaces any earlier one
    void Set(const std::string& key, const std::string& value);

    /// Set a value that any parsed source replaces
    void SetDefault(const std::string& key, const std::string& value);

    /// Mark key as recognised for Validate()
    void AllowKey(const std::string& key);

    /// One warning per key that was set but never allowed
    std::vector<std::string> Validate() const;

    void Clear();
    size_t Size() const { return slots_.size(); }

    /// Expand a leading ~ and ${VAR} references
    static std::string ExpandPath(const std::string& path);

    /// true/yes/on/1 and false/no/off/0, case-insensitive
    static std::optional<bool> ParseBool(const std::string& str);

private:
    struct Slot {
        std::vector<ConfigValue> values;
        bool isDefault{false};
    };

    void Store(const std::string& key, ConfigValue value);
    ConfigParseResult ParseStream(std::istream& in, const std::string& source);
    ConfigParseResult ParseLine(const std::string& line, const std::string& source, int lineNum);

    std::map<std::string, Slot> slots_;
    std::set<std::string> allowed_;
    std::vector<std::string> positional_;
    int includeDepth_{0};
};

// ============================================================================
// Configuration Keys
// ============================================================================

namespace ConfigKeys {
    // Credential selection
    constexpr const char* PRIVATE_KEY = "private-key";
    constexpr const char* MNEMONIC = "mnemonic";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* HD_PATHS = "hd-paths";
    constexpr const char* PASSPHRASE = "passphrase";
    constexpr const char* DEBUG_DEVICE = "debugdevice";

    // General
    constexpr const char* CONF = "conf";
    constexpr const char* LOGLEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* PRINTTOCONSOLE = "printtoconsole";
    constexpr const char* HELP = "help";
    constexpr const char* VERSION = "version";
}

} // namespace util
} // namespace sigil

#endif // SIGIL_UTIL_CONFIG_H
