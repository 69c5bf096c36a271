// NEBULA - Configuration File Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/util/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace nebula {
namespace util {

namespace {

std::string Trim(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

bool IsNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
}

/// First character of `name` that may not appear in a key or section, or '\0'
char BadNameChar(const std::string& name) {
    auto it = std::find_if_not(name.begin(), name.end(), IsNameChar);
    return it == name.end() ? '\0' : *it;
}

/// Strip matching quotes. Double quotes honour \n \t \\ \"; single quotes are literal.
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
        switch (inner[i + 1]) {
            case 'n':  out += '\n'; ++i; break;
            case 't':  out += '\t'; ++i; break;
            case '\\': out += '\\'; ++i; break;
            case '"':  out += '"';  ++i; break;
            default:   out += '\\'; break;
        }
    }
    return out;
}

std::optional<bool> ParseBool(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::map<std::string, bool> spellings = {
        {"true", true}, {"yes", true}, {"on", true}, {"1", true},
        {"false", false}, {"no", false}, {"off", false}, {"0", false},
    };
    auto it = spellings.find(str);
    if (it == spellings.end()) {
        return std::nullopt;
    }
    return it->second;
}

ConfigError MakeError(const std::string& message, const std::string& source, int line) {
    ConfigError error;
    error.message = message;
    error.source = source;
    error.line = line;
    return error;
}

} // namespace

std::string ConfigError::ToString() const {
    std::ostringstream ss;
    if (!source.empty()) {
        ss << source << ':';
        if (line > 0) {
            ss << line << ':';
        }
        ss << ' ';
    }
    ss << message;
    return ss.str();
}

// ============================================================================
// Parsing
// ============================================================================

std::string ConfigFile::ExpandEnvVars(const std::string& value) {
    std::string out;
    out.reserve(value.size());

    size_t i = 0;
    while (i < value.size()) {
        size_t close = std::string::npos;
        if (value.compare(i, 2, "${") == 0) {
            close = value.find('}', i + 2);
        }
        if (close == std::string::npos) {
            out += value[i++];
            continue;
        }

        std::string name = value.substr(i + 2, close - i - 2);
        std::string fallback;
        size_t sep = name.find(":-");
        if (sep != std::string::npos) {
            fallback = name.substr(sep + 2);
            name.resize(sep);
        }

        const char* env = std::getenv(name.c_str());
        if (env != nullptr && *env != '\0') {
            out += env;
        } else {
            out += fallback;
        }
        i = close + 1;
    }
    return out;
}

std::optional<ConfigError> ConfigFile::Parse(std::istream& in, const std::string& source) {
    std::string section;
    std::string raw;
    int lineNum = 0;

    while (std::getline(in, raw)) {
        ++lineNum;
        if (raw.size() > MAX_CONFIG_LINE) {
            return MakeError("line longer than " + std::to_string(MAX_CONFIG_LINE) +
                             " characters", source, lineNum);
        }

        std::string line = Trim(raw);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        if (line[0] == '[') {
            size_t close = line.find(']');
            if (close == std::string::npos) {
                return MakeError("section header missing ']'", source, lineNum);
            }
            std::string rest = Trim(line.substr(close + 1));
            if (!rest.empty() && rest[0] != '#' && rest[0] != ';') {
                return MakeError("unexpected text after section header", source, lineNum);
            }
            std::string name = Trim(line.substr(1, close - 1));
            if (name.empty()) {
                return MakeError("empty section name", source, lineNum);
            }
            if (char bad = BadNameChar(name)) {
                return MakeError(std::string("invalid character '") + bad +
                                 "' in section name", source, lineNum);
            }
            section = name;
            sections_[section];
            continue;
        }

        std::string key;
        std::string value;
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            key = line;
            value = "true";
            if (key.size() > 2 && key.compare(0, 2, "no") == 0 &&
                std::islower(static_cast<unsigned char>(key[2]))) {
                key.erase(0, 2);
                value = "false";
            }
        } else {
            key = Trim(line.substr(0, eq));
            value = ExpandEnvVars(Unquote(Trim(line.substr(eq + 1))));
        }

        if (key.empty()) {
            return MakeError("empty key", source, lineNum);
        }
        if (char bad = BadNameChar(key)) {
            return MakeError(std::string("invalid character '") + bad + "' in key",
                             source, lineNum);
        }
        sections_[section][key] = value;
    }
    return std::nullopt;
}

std::optional<ConfigError> ConfigFile::ParseFile(const std::string& path) {
    std::string expanded = ExpandEnvVars(path);

    std::ifstream file(expanded, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return MakeError("cannot open file", expanded, 0);
    }
    if (file.tellg() > static_cast<std::streamoff>(MAX_CONFIG_SIZE)) {
        return MakeError("file larger than " + std::to_string(MAX_CONFIG_SIZE) + " bytes",
                         expanded, 0);
    }
    file.seekg(0);
    return Parse(file, expanded);
}

std::optional<ConfigError> ConfigFile::ParseString(const std::string& content,
                                                   const std::string& source) {
    std::istringstream in(content);
    return Parse(in, source);
}

// ============================================================================
// Lookup
// ============================================================================

const ConfigFile::Section* ConfigFile::Find(const std::string& section) const {
    auto it = sections_.find(section);
    return it == sections_.end() ? nullptr : &it->second;
}

bool ConfigFile::HasSection(const std::string& section) const {
    return Find(section) != nullptr;
}

bool ConfigFile::HasKey(const std::string& key, const std::string& section) const {
    const Section* entries = Find(section);
    return entries != nullptr && entries->count(key) != 0;
}

std::optional<std::string> ConfigFile::TryGetString(const std::string& key,
                                                    const std::string& section) const {
    const Section* entries = Find(section);
    if (entries == nullptr) {
        return std::nullopt;
    }
    auto it = entries->find(key);
    if (it == entries->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ConfigFile::GetString(const std::string& key, const std::string& defaultValue,
                                  const std::string& section) const {
    return TryGetString(key, section).value_or(defaultValue);
}

std::optional<bool> ConfigFile::TryGetBool(const std::string& key,
                                           const std::string& section) const {
    auto value = TryGetString(key, section);
    if (!value) {
        return std::nullopt;
    }
    return ParseBool(*value);
}

void ConfigFile::Set(const std::string& key, const std::string& value,
                     const std::string& section) {
    sections_[section][key] = value;
}

std::vector<std::string> ConfigFile::GetSections() const {
    std::vector<std::string> names;
    for (const auto& entry : sections_) {
        if (!entry.first.empty()) {
            names.push_back(entry.first);
        }
    }
    return names;
}

std::vector<std::string> ConfigFile::GetKeys(const std::string& section) const {
    std::vector<std::string> keys;
    if (const Section* entries = Find(section)) {
        for (const auto& entry : *entries) {
            keys.push_back(entry.first);
        }
    }
    return keys;
}

} // namespace util
} // namespace nebula
