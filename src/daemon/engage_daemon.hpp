#pragma once

#include <memory>

#include <QNetworkInformation>
#include <QObject>

#include "common/config.hpp"
#include "sync/qt_http_transport.hpp"
#include "sync/sync_engine.hpp"

namespace engage {

class EngageApiServer;

/**
 * EngageDaemon coordinates:
 * - the SyncEngine and its durable mutation queue
 * - network reachability, fed into the scheduler's preconditions
 * - a periodic resume of pending mutations
 * - the local control socket
 *
 * It is designed to be owned from main() and driven by Qt's event loop.
 */
class EngageDaemon : public QObject
{
    Q_OBJECT
public:
    explicit EngageDaemon(const EngageConfig &config, QObject *parent = nullptr);
    ~EngageDaemon() override;

    // Call this after constructing the daemon to resume work and open the socket.
    void start();

    SyncEngine &engine()
    {
        return *m_engine;
    }

private slots:
    void resumePending();
    void handleReachabilityChanged(QNetworkInformation::Reachability reachability);

private:
    void setupReachability();

    EngageConfig m_config;
    QtHttpTransport m_transport;
    std::unique_ptr<SyncEngine> m_engine;
    std::unique_ptr<EngageApiServer> m_apiServer;
    bool m_storageHealthy = true;
};

} // namespace engage
