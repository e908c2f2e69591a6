#include "common/config.hpp"

#include <QFile>

#include <cstdlib>

#include "common/logging.hpp"

namespace engage {

namespace {

void warnInvalid(const std::string &key, const nlohmann::json &value)
{
    ELOG_WARN(QStringLiteral("Config"),
              QStringLiteral("applyConfigJson"),
              QStringLiteral("config_value_ignored"),
              QStringLiteral("invalid_value"),
              QStringLiteral("keep_default"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"key", key}, {"value", value}}));
}

void readString(const nlohmann::json &json, const char *key, std::string &out)
{
    const auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (!it->is_string()) {
        warnInvalid(key, *it);
        return;
    }
    out = it->get<std::string>();
}

void readPositiveInt(const nlohmann::json &json, const char *key, int &out, bool allowZero)
{
    const auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (!it->is_number_integer()) {
        warnInvalid(key, *it);
        return;
    }
    const auto value = it->get<int64_t>();
    if (value < 0 || (value == 0 && !allowZero) || value > 1024) {
        warnInvalid(key, *it);
        return;
    }
    out = static_cast<int>(value);
}

void readMillis(const nlohmann::json &json, const char *key, std::chrono::milliseconds &out)
{
    const auto it = json.find(key);
    if (it == json.end()) {
        return;
    }
    if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
        warnInvalid(key, *it);
        return;
    }
    out = std::chrono::milliseconds(it->get<int64_t>());
}

} // namespace

QString defaultConfigPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".config/engage/config.json");
    }
    return home + QStringLiteral("/.config/engage/config.json");
}

std::string defaultDatabasePath()
{
    const char *home = std::getenv("HOME");
    std::string base = home ? home : ".";
    return base + "/.local/share/engage/engage.db";
}

void applyConfigJson(EngageConfig &config, const nlohmann::json &json)
{
    if (!json.is_object()) {
        warnInvalid("<root>", json);
        return;
    }

    readString(json, "apiUrl", config.apiUrl);
    readString(json, "mutationPath", config.mutationPath);
    readString(json, "authToken", config.authToken);
    readString(json, "databasePath", config.databasePath);
    readPositiveInt(json, "workerCount", config.workerCount, false);
    readPositiveInt(json, "maxAttempts", config.maxAttempts, true);
    readMillis(json, "minBackoffMs", config.minBackoff);
    readMillis(json, "maxBackoffMs", config.maxBackoff);
    readMillis(json, "maxPollIntervalMs", config.maxPollInterval);
    readMillis(json, "requestTimeoutMs", config.requestTimeout);

    if (config.maxBackoff < config.minBackoff) {
        warnInvalid("maxBackoffMs", config.maxBackoff.count());
        config.maxBackoff = config.minBackoff;
    }
}

void applyEnvironmentOverrides(EngageConfig &config)
{
    const QString apiUrl = qEnvironmentVariable("ENGAGE_API_URL");
    if (!apiUrl.isEmpty()) {
        config.apiUrl = apiUrl.toStdString();
    }
    const QString token = qEnvironmentVariable("ENGAGE_AUTH_TOKEN");
    if (!token.isEmpty()) {
        config.authToken = token.toStdString();
    }
    const QString dbPath = qEnvironmentVariable("ENGAGE_DB_PATH");
    if (!dbPath.isEmpty()) {
        config.databasePath = dbPath.toStdString();
    }
    if (qEnvironmentVariableIsSet("ENGAGE_WORKERS")) {
        bool ok = false;
        const int workers = qEnvironmentVariableIntValue("ENGAGE_WORKERS", &ok);
        if (ok && workers > 0) {
            config.workerCount = workers;
        } else {
            warnInvalid("ENGAGE_WORKERS",
                        qEnvironmentVariable("ENGAGE_WORKERS").toStdString());
        }
    }
}

EngageConfig loadConfig(const QString &path)
{
    EngageConfig config;
    config.databasePath = defaultDatabasePath();

    QFile file(path);
    if (file.exists()) {
        if (file.open(QIODevice::ReadOnly)) {
            const auto parsed = nlohmann::json::parse(file.readAll().toStdString(),
                                                      nullptr, false);
            if (parsed.is_discarded()) {
                ELOG_WARN(QStringLiteral("Config"),
                          QStringLiteral("loadConfig"),
                          QStringLiteral("config_parse_failed"),
                          QStringLiteral("invalid_json"),
                          QStringLiteral("use_defaults"),
                          logging::defaultWho(),
                          QString(),
                          (nlohmann::json{{"path", path.toStdString()}}));
            } else {
                applyConfigJson(config, parsed);
            }
        } else {
            ELOG_WARN(QStringLiteral("Config"),
                      QStringLiteral("loadConfig"),
                      QStringLiteral("config_open_failed"),
                      QStringLiteral("file_unreadable"),
                      QStringLiteral("use_defaults"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"path", path.toStdString()}}));
        }
    }

    applyEnvironmentOverrides(config);
    return config;
}

nlohmann::json configToJson(const EngageConfig &config)
{
    return nlohmann::json{
        {"apiUrl", config.apiUrl},
        {"mutationPath", config.mutationPath},
        {"databasePath", config.databasePath},
        {"workerCount", config.workerCount},
        {"minBackoffMs", config.minBackoff.count()},
        {"maxBackoffMs", config.maxBackoff.count()},
        {"maxPollIntervalMs", config.maxPollInterval.count()},
        {"requestTimeoutMs", config.requestTimeout.count()},
        {"maxAttempts", config.maxAttempts}
    };
}

} // namespace engage
