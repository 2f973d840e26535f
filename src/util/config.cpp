// SIGIL - Configuration
// Copyright (c) 2024 SIGIL Developers
// MIT License

#include "sigil/util/config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include <pwd.h>
#include <unistd.h>

namespace sigil {
namespace util {

namespace {

const char* const WHITESPACE = " \t\r\n";

std::string Trim(const std::string& str) {
    size_t begin = str.find_first_not_of(WHITESPACE);
    if (begin == std::string::npos) {
        return "";
    }
    return str.substr(begin, str.find_last_not_of(WHITESPACE) - begin + 1);
}

bool IsKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
}

bool IsValidKey(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        if (!IsKeyChar(c)) return false;
    }
    return true;
}

/// "noledger" -> "ledger"; empty if key is not a negation
std::string NegatedKey(const std::string& key) {
    if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
        std::islower(static_cast<unsigned char>(key[2]))) {
        return key.substr(2);
    }
    return "";
}

/// Strip matching quotes; double quotes also honour \" \\ \n \t
std::string Unquote(const std::string& str) {
    if (str.size() < 2 || str.front() != str.back() ||
        (str.front() != '"' && str.front() != '\'')) {
        return str;
    }
    std::string inner = str.substr(1, str.size() - 2);
    if (str.front() == '\'') {
        return inner;
    }
    std::string out;
    out.reserve(inner.size());
    for (size_t i = 0; i < inner.size(); ++i) {
        if (inner[i] != '\\' || i + 1 == inner.size()) {
            out += inner[i];
            continue;
        }
        switch (inner[++i]) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            default: out += '\\'; out += inner[i]; break;
        }
    }
    return out;
}

/// Replace ${VAR} with the environment value (empty if unset)
std::string ExpandEnv(const std::string& str) {
    std::string out;
    size_t pos = 0;
    while (pos < str.size()) {
        size_t open = str.find("${", pos);
        size_t close = open == std::string::npos ? open : str.find('}', open + 2);
        if (close == std::string::npos) {
            out += str.substr(pos);
            break;
        }
        out += str.substr(pos, open - pos);
        std::string name = str.substr(open + 2, close - open - 2);
        if (const char* value = std::getenv(name.c_str())) {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

std::string HomeDirectory() {
    if (const char* home = std::getenv("HOME")) {
        return home;
    }
    if (const struct passwd* pw = getpwuid(getuid())) {
        return pw->pw_dir;
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

ConfigParseResult ConfigManager::ParseCommandLine(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.empty() || arg[0] != '-') {
            positional_.push_back(arg);
            continue;
        }

        size_t start = arg.find_first_not_of('-');
        const std::string body = start == std::string::npos ? std::string() : arg.substr(start);
        std::string key;
        ConfigValue value;
        value.source = COMMAND_LINE_SOURCE;

        size_t eq = body.find('=');
        if (eq != std::string::npos) {
            key = body.substr(0, eq);
            value.value = body.substr(eq + 1);
        } else if (!NegatedKey(body).empty()) {
            key = NegatedKey(body);
            value.value = "false";
        } else {
            key = body;
            if (i + 1 < argc && argv[i + 1][0] != '-') {
                value.value = argv[++i];
            } else {
                value.value = "true";
            }
        }

        if (!IsValidKey(key)) {
            return ConfigParseResult::Fail("Invalid option: " + arg, COMMAND_LINE_SOURCE);
        }
        Store(key, std::move(value));
    }
    return ConfigParseResult::Ok();
}

ConfigParseResult ConfigManager::ParseFile(const std::string& path) {
    const std::string expanded = ExpandPath(path);
    std::ifstream file(expanded, std::ios::binary | std::ios::ate);
    if (!file) {
        return ConfigParseResult::Fail("Cannot open file: " + expanded, expanded);
    }
    if (static_cast<size_t>(file.tellg()) > MAX_CONFIG_SIZE) {
        return ConfigParseResult::Fail("Config file too large", expanded);
    }
    file.seekg(0);
    return ParseStream(file, expanded);
}

ConfigParseResult ConfigManager::ParseString(const std::string& content,
                                             const std::string& source) {
    std::istringstream in(content);
    return ParseStream(in, source);
}

ConfigParseResult ConfigManager::ParseStream(std::istream& in, const std::string& source) {
    std::string line;
    int lineNum = 0;
    while (std::getline(in, line)) {
        ++lineNum;
        if (line.size() > MAX_LINE_LENGTH) {
            return ConfigParseResult::Fail("Line too long", source, lineNum);
        }
        ConfigParseResult result = ParseLine(line, source, lineNum);
        if (!result.success) {
            return result;
        }
    }
    return ConfigParseResult::Ok();
}

ConfigParseResult ConfigManager::ParseLine(const std::string& raw, const std::string& source,
                                           int lineNum) {
    const std::string line = Trim(raw);
    if (line.empty() || line[0] == '#' || line[0] == ';') {
        return ConfigParseResult::Ok();
    }

    if (line.compare(0, 8, "include ") == 0) {
        if (includeDepth_ >= MAX_INCLUDE_DEPTH) {
            return ConfigParseResult::Fail("Maximum include depth exceeded", source, lineNum);
        }
        ++includeDepth_;
        ConfigParseResult result = ParseFile(Unquote(Trim(line.substr(8))));
        --includeDepth_;
        return result;
    }

    std::string key;
    ConfigValue value;
    value.source = source;
    value.line = lineNum;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
        std::string negated = NegatedKey(line);
        key = negated.empty() ? line : negated;
        value.value = negated.empty() ? "true" : "false";
    } else {
        key = Trim(line.substr(0, eq));
        value.value = ExpandEnv(Unquote(Trim(line.substr(eq + 1))));
    }

    if (key.empty()) {
        return ConfigParseResult::Fail("Empty key", source, lineNum);
    }
    if (!IsValidKey(key)) {
        return ConfigParseResult::Fail("Invalid key '" + key + "'", source, lineNum);
    }
    Store(key, std::move(value));
    return ConfigParseResult::Ok();
}

void ConfigManager::Store(const std::string& key, ConfigValue value) {
    auto it = slots_.find(key);
    if (it == slots_.end() || it->second.isDefault) {
        Slot slot;
        slot.values.push_back(std::move(value));
        slots_[key] = std::move(slot);
        return;
    }

    std::vector<ConfigValue>& values = it->second.values;
    if (values.front().source == value.source) {
        values.push_back(std::move(value));
    } else if (value.source == COMMAND_LINE_SOURCE) {
        values.assign(1, std::move(value));
    }
}

// ============================================================================
// Lookup
// ============================================================================

bool ConfigManager::HasKey(const std::string& key) const {
    return slots_.count(key) != 0;
}

std::optional<std::string> ConfigManager::TryGetString(const std::string& key) const {
    auto it = slots_.find(key);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return it->second.values.front().value;
}

std::string ConfigManager::GetString(const std::string& key, const std::string& fallback) const {
    return TryGetString(key).value_or(fallback);
}

std::optional<int64_t> ConfigManager::TryGetInt(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str || str->empty()) {
        return std::nullopt;
    }
    const char* begin = str->c_str();
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(begin, &end, 10);
    if (errno != 0 || end == begin || *end != '\0') {
        return std::nullopt;
    }
    return static_cast<int64_t>(value);
}

int64_t ConfigManager::GetInt(const std::string& key, int64_t fallback) const {
    return TryGetInt(key).value_or(fallback);
}

std::optional<bool> ConfigManager::TryGetBool(const std::string& key) const {
    auto str = TryGetString(key);
    if (!str) {
        return std::nullopt;
    }
    return ParseBool(*str);
}

bool ConfigManager::GetBool(const std::string& key, bool fallback) const {
    return TryGetBool(key).value_or(fallback);
}

std::vector<std::string> ConfigManager::GetList(const std::string& key) const {
    std::vector<std::string> out;
    auto it = slots_.find(key);
    if (it != slots_.end()) {
        for (const auto& v : it->second.values) {
            out.push_back(v.value);
        }
    }
    return out;
}

std::string ConfigManager::GetSource(const std::string& key) const {
    auto it = slots_.find(key);
    return it == slots_.end() ? std::string() : it->second.values.front().source;
}

// ============================================================================
// Programmatic Values and Validation
// ============================================================================

void ConfigManager::Set(const std::string& key, const std::string& value) {
    Slot slot;
    slot.values.push_back(ConfigValue{value, "<programmatic>", 0});
    slots_[key] = std::move(slot);
}

void ConfigManager::SetDefault(const std::string& key, const std::string& value) {
    if (HasKey(key)) {
        return;
    }
    Slot slot;
    slot.values.push_back(ConfigValue{value, "<default>", 0});
    slot.isDefault = true;
    slots_[key] = std::move(slot);
}

void ConfigManager::AllowKey(const std::string& key) {
    allowed_.insert(key);
}

std::vector<std::string> ConfigManager::Validate() const {
    std::vector<std::string> warnings;
    for (const auto& [key, slot] : slots_) {
        if (slot.isDefault || allowed_.count(key)) {
            continue;
        }
        const ConfigValue& first = slot.values.front();
        std::string where = first.source;
        if (first.line > 0) {
            where += ":" + std::to_string(first.line);
        }
        warnings.push_back("Unknown option '" + key + "' (" + where + ")");
    }
    return warnings;
}

void ConfigManager::Clear() {
    slots_.clear();
    positional_.clear();
    includeDepth_ = 0;
}

// ============================================================================
// Static Helpers
// ============================================================================

std::string ConfigManager::ExpandPath(const std::string& path) {
    std::string out = path;
    if (!out.empty() && out[0] == '~' && (out.size() == 1 || out[1] == '/')) {
        std::string home = HomeDirectory();
        if (!home.empty()) {
            out = home + out.substr(1);
        }
    }
    return ExpandEnv(out);
}

std::optional<bool> ConfigManager::ParseBool(const std::string& str) {
    std::string lower;
    for (char c : str) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") return true;
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

} // namespace util
} // namespace sigil
