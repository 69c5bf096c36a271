// NEBULA - Configuration File
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// INI-style deployment file read by the oracle settings loaders:
//
//   # comment            ; also a comment
//   [oracle]
//   name = "Nebula Oracle"
//   denomination_token = ${NEBULA_DENOMINATION_TOKEN}
//   nocontext_guard       (bare key is true, "no" prefix makes it false)
//
// Keys before the first [section] belong to the unnamed section "".
// A key set twice keeps the last value.

#ifndef NEBULA_UTIL_CONFIG_H
#define NEBULA_UTIL_CONFIG_H

#include <cstddef>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace nebula {
namespace util {

/// Largest file ParseFile accepts (1 MB)
constexpr size_t MAX_CONFIG_SIZE = 1024 * 1024;

/// Longest line accepted
constexpr size_t MAX_CONFIG_LINE = 4096;

/// Where and why parsing stopped
struct ConfigError {
    std::string message;
    std::string source;     // File path or caller-supplied name
    int line{0};            // 1-based; 0 if not tied to a line

    /// "source:line: message"
    std::string ToString() const;
};

class ConfigFile {
public:
    using Section = std::map<std::string, std::string>;

    /**
     * Merge a file into this configuration. The path may contain ${VAR}.
     * Entries parsed before an error are kept.
     *
     * @return The error, or nullopt on success
     */
    std::optional<ConfigError> ParseFile(const std::string& path);

    /// Merge configuration text; `source` names it in errors
    std::optional<ConfigError> ParseString(const std::string& content,
                                           const std::string& source = "<string>");

    bool HasSection(const std::string& section) const;
    bool HasKey(const std::string& key, const std::string& section = "") const;

    std::optional<std::string> TryGetString(const std::string& key,
                                            const std::string& section = "") const;

    std::string GetString(const std::string& key, const std::string& defaultValue,
                          const std::string& section = "") const;

    /// true/false, yes/no, on/off, 1/0 (any case); nullopt if absent or not one of these
    std::optional<bool> TryGetBool(const std::string& key,
                                   const std::string& section = "") const;

    void Set(const std::string& key, const std::string& value,
             const std::string& section = "");

    /// Named sections in sorted order; the unnamed section is not listed
    std::vector<std::string> GetSections() const;

    /// Keys of `section` in sorted order
    std::vector<std::string> GetKeys(const std::string& section = "") const;

    /// Replace each ${VAR} with its environment value (empty if unset).
    /// ${VAR:-fallback} uses `fallback` when VAR is unset or empty.
    static std::string ExpandEnvVars(const std::string& value);

private:
    std::optional<ConfigError> Parse(std::istream& in, const std::string& source);

    const Section* Find(const std::string& section) const;

    std::map<std::string, Section> sections_;
};

} // namespace util
} // namespace nebula

#endif // NEBULA_UTIL_CONFIG_H
