#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/engage_daemon.hpp"
#include "storage/persistence_layer.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("engage-syncd"));
    qInfo() << "Engage sync daemon starting...";

    bool trace = qEnvironmentVariableIntValue("ENGAGE_TRACE") == 1;
    QString configPath = engage::defaultConfigPath();
    for (int i = 1; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
        } else if (arg == QStringLiteral("--config") && i + 1 < argc) {
            configPath = QString::fromLocal8Bit(argv[++i]);
        }
    }
    engage::logging::initLogging(QStringLiteral("engage-syncd"), trace);

    const engage::EngageConfig config = engage::loadConfig(configPath);
    ELOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("load_config"),
              engage::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"configPath", configPath.toStdString()},
                              {"config", engage::configToJson(config)}}));

    try {
        // The daemon lives for the lifetime of the process.
        engage::EngageDaemon daemon(config);
        daemon.start();
        return app.exec();
    } catch (const engage::StorageError &ex) {
        qCritical() << "Engage: cannot open the mutation store:" << ex.what();
        return 1;
    }
}
