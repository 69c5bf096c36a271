// NEBULA - Oracle Settings Implementation
// Copyright (c) 2024 NEBULA Developers
// MIT License

#include "nebula/oracle/settings.h"

#include <memory>
#include <stdexcept>

namespace nebula {
namespace oracle {

namespace {

constexpr const char* ORACLE_SECTION = "oracle";
constexpr const char* LOG_SECTION = "log";

Address RequireAddress(const util::ConfigFile& config, const std::string& key) {
    auto value = config.TryGetString(key, ORACLE_SECTION);
    if (!value || value->empty()) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Missing required key "
                                             << ORACLE_SECTION << ":" << key;
        throw std::invalid_argument("missing " + std::string(ORACLE_SECTION) + ":" + key);
    }

    try {
        return Address::FromHex(*value);
    } catch (const std::invalid_argument& e) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Bad address for " << key
                                             << ": " << *value;
        throw std::invalid_argument(key + ": " + e.what());
    }
}

util::LogLevel RequireLevel(const std::string& key, const std::string& value) {
    auto level = util::ParseLogLevel(value);
    if (!level) {
        LOG_ERROR(util::LogCategory::CONFIG) << "Unknown log level for "
                                             << LOG_SECTION << ":" << key << ": " << value;
        throw std::invalid_argument(key + ": unknown log level '" + value + "'");
    }
    return *level;
}

} // namespace

OracleSettings LoadOracleSettings(const util::ConfigFile& config) {
    OracleSettings settings;
    settings.name = config.GetString("name", DEFAULT_ORACLE_NAME, ORACLE_SECTION);
    settings.denominationToken = RequireAddress(config, "denomination_token");
    settings.denominationFeed = RequireAddress(config, "denomination_feed");

    if (config.HasKey("context_guard", ORACLE_SECTION)) {
        auto guard = config.TryGetBool("context_guard", ORACLE_SECTION);
        if (!guard) {
            throw std::invalid_argument("context_guard is not a boolean");
        }
        settings.contextGuard = *guard;
    }

    if (!settings.contextGuard) {
        LOG_WARN(util::LogCategory::CONFIG) << "Context guard disabled for "
                                            << settings.name;
    }
    return settings;
}

LoggingSettings LoadLoggingSettings(const util::ConfigFile& config) {
    static const std::string CATEGORY_PREFIX = "level.";

    LoggingSettings settings;
    settings.level = RequireLevel("level", config.GetString("level", "info", LOG_SECTION));

    for (const auto& key : config.GetKeys(LOG_SECTION)) {
        if (key.size() <= CATEGORY_PREFIX.size() ||
            key.compare(0, CATEGORY_PREFIX.size(), CATEGORY_PREFIX) != 0) {
            continue;
        }
        settings.categoryLevels[key.substr(CATEGORY_PREFIX.size())] =
            RequireLevel(key, config.GetString(key, "", LOG_SECTION));
    }

    settings.file = config.GetString("file", "", LOG_SECTION);

    if (config.HasKey("console", LOG_SECTION)) {
        auto console = config.TryGetBool("console", LOG_SECTION);
        if (!console) {
            throw std::invalid_argument("console is not a boolean");
        }
        settings.console = *console;
    }
    return settings;
}

void ApplyLoggingSettings(const LoggingSettings& settings) {
    std::shared_ptr<util::FileSink> fileSink;
    if (!settings.file.empty()) {
        fileSink = std::make_shared<util::FileSink>(settings.file);
        if (!fileSink->IsOpen()) {
            throw std::invalid_argument("cannot open log file " + settings.file);
        }
    }

    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.SetLevel(settings.level);
    logger.ClearCategoryLevels();
    for (const auto& entry : settings.categoryLevels) {
        logger.SetCategoryLevel(entry.first, entry.second);
    }

    if (settings.console) {
        logger.AddSink(std::make_shared<util::ConsoleSink>());
    }
    if (fileSink) {
        logger.AddSink(fileSink);
    }
}

} // namespace oracle
} // namespace nebula
