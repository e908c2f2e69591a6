#include "daemon/engage_daemon.hpp"

#include <QTimer>
#include <QDebug>

#include "daemon/engage_api_server.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

namespace engage {

namespace {

constexpr int kResumeIntervalMs = 300000;

bool isReachable(QNetworkInformation::Reachability reachability)
{
    // Unknown is treated as online; a failed request is retried anyway.
    return reachability == QNetworkInformation::Reachability::Online
        || reachability == QNetworkInformation::Reachability::Unknown;
}

} // namespace

EngageDaemon::EngageDaemon(const EngageConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_engine(std::make_unique<SyncEngine>(m_config, m_transport))
{
    std::string integrityMessage;
    if (!m_engine->integrityCheck(&integrityMessage)) {
        qWarning() << "Engage: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
        m_storageHealthy = false;
    }

    m_engine->setSyncErrorListener([](const std::string &identifier, const std::string &reason) {
        ELOG_ERROR(QStringLiteral("EngageDaemon"),
                   QStringLiteral("syncErrorListener"),
                   QStringLiteral("sync_error_surfaced"),
                   QString::fromStdString(reason),
                   QStringLiteral("mutation_discarded"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"identifier", identifier}}));
    });
}

EngageDaemon::~EngageDaemon()
{
    m_apiServer.reset();
    if (m_engine) {
        m_engine->shutdown();
    }
}

void EngageDaemon::start()
{
    qInfo() << "Engage: sync daemon starting (version" << ENGAGE_VERSION << ")";

    setupReachability();

    if (!m_apiServer) {
        m_apiServer = std::make_unique<EngageApiServer>(*m_engine);
        m_apiServer->start();
    }

    auto *timer = new QTimer(this);
    timer->setInterval(kResumeIntervalMs);
    connect(timer, &QTimer::timeout, this, &EngageDaemon::resumePending);
    timer->start();

    resumePending();
}

void EngageDaemon::resumePending()
{
    if (!m_storageHealthy) {
        return;
    }

    try {
        m_engine->start();
    } catch (const StorageError &ex) {
        qWarning() << "Engage: failed to resume pending mutations:" << ex.what();
    }
}

void EngageDaemon::setupReachability()
{
    if (!QNetworkInformation::load(QNetworkInformation::Feature::Reachability)) {
        ELOG_WARN(QStringLiteral("EngageDaemon"),
                  QStringLiteral("setupReachability"),
                  QStringLiteral("reachability_unavailable"),
                  QStringLiteral("no_backend"),
                  QStringLiteral("assume_online"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        return;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    connect(info, &QNetworkInformation::reachabilityChanged,
            this, &EngageDaemon::handleReachabilityChanged);
    handleReachabilityChanged(info->reachability());
}

void EngageDaemon::handleReachabilityChanged(QNetworkInformation::Reachability reachability)
{
    const bool available = isReachable(reachability);
    ELOG_INFO(QStringLiteral("EngageDaemon"),
              QStringLiteral("handleReachabilityChanged"),
              QStringLiteral("reachability_changed"),
              QStringLiteral("network_information"),
              QStringLiteral("scheduler_precondition"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"reachability", static_cast<int>(reachability)},
                              {"available", available}}));
    m_engine->setNetworkAvailable(available);
}

} // namespace engage
