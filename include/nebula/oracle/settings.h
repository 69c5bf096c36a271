// NEBULA - Oracle Settings
// Copyright (c) 2024 NEBULA Developers
// MIT License
//
// Typed views over the [oracle] and [log] sections of a configuration file:
//
//   [oracle]
//   name = "Nebula Oracle"
//   denomination_token = 0x...
//   denomination_feed = 0x...
//   context_guard = true
//
//   [log]
//   level = info
//   level.registry = debug
//   file = ${HOME}/nebula.log
//   console = true

#ifndef NEBULA_ORACLE_SETTINGS_H
#define NEBULA_ORACLE_SETTINGS_H

#include <nebula/core/types.h>
#include <nebula/util/config.h>
#include <nebula/util/logging.h>

#include <map>
#include <string>

namespace nebula {
namespace oracle {

/// Default oracle display name
constexpr const char* DEFAULT_ORACLE_NAME = "Nebula Oracle";

struct OracleSettings {
    std::string name{DEFAULT_ORACLE_NAME};

    /// Asset prices are expressed in; its decimals are the output decimals
    Address denominationToken;

    /// Price feed of the denomination asset
    Address denominationFeed;

    /// Reject price reads while the pool holds its reentrancy lock
    bool contextGuard{true};
};

struct LoggingSettings {
    util::LogLevel level{util::LogLevel::Info};

    /// Per-category thresholds from "level.<category>" keys
    std::map<std::string, util::LogLevel> categoryLevels;

    std::string file;   // Empty for no file sink
    bool console{true};
};

/**
 * Read the [oracle] section.
 *
 * @throws std::invalid_argument if a denomination address is missing or
 *         malformed, or context_guard is not a boolean
 */
OracleSettings LoadOracleSettings(const util::ConfigFile& config);

/**
 * Read the [log] section. Every key is optional.
 *
 * @throws std::invalid_argument on an unknown level name or console flag
 */
LoggingSettings LoadLoggingSettings(const util::ConfigFile& config);

/**
 * Replace the global logger's sinks and levels with `settings`.
 *
 * @throws std::invalid_argument if the log file cannot be opened
 */
void ApplyLoggingSettings(const LoggingSettings& settings);

} // namespace oracle
} // namespace nebula

#endif // NEBULA_ORACLE_SETTINGS_H
