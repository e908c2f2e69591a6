#pragma once

#include <chrono>
#include <string>

#include <QString>

#include <nlohmann/json.hpp>

namespace engage {

struct EngageConfig {
    std::string apiUrl = "https://device-api.engage.invalid";
    std::string mutationPath = "/api/audience/mutations";
    std::string authToken;
    std::string databasePath;

    int workerCount = 2;
    std::chrono::milliseconds minBackoff{30000};
    std::chrono::milliseconds maxBackoff{std::chrono::minutes(10)};
    std::chrono::milliseconds maxPollInterval{std::chrono::minutes(5)};
    std::chrono::milliseconds requestTimeout{60000};
    int maxAttempts = 0;
};

// $HOME/.config/engage/config.json
QString defaultConfigPath();

// $HOME/.local/share/engage/engage.db
std::string defaultDatabasePath();

// Applies the keys present in json on top of config. Invalid values are
// logged and leave the previous value in place.
void applyConfigJson(EngageConfig &config, const nlohmann::json &json);

// Applies ENGAGE_API_URL, ENGAGE_AUTH_TOKEN, ENGAGE_DB_PATH and ENGAGE_WORKERS.
void applyEnvironmentOverrides(EngageConfig &config);

// Defaults, then the JSON file at path (missing file is not an error),
// then the environment.
EngageConfig loadConfig(const QString &path);

nlohmann::json configToJson(const EngageConfig &config);

} // namespace engage
