#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "sync/sync_engine.hpp"

namespace engage {

/**
 * EngageApiServer exposes the SyncEngine over a local UNIX socket using a
 * minimal JSON-RPC-like protocol: one request per connection, one response.
 */
class EngageApiServer : public QObject
{
    Q_OBJECT
public:
    explicit EngageApiServer(SyncEngine &engine, QObject *parent = nullptr);
    ~EngageApiServer() override;

    // Start listening on $XDG_RUNTIME_DIR/engage.sock
    bool start();
    // Process a single JSON-RPC payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    void handleRequest(QLocalSocket *socket, const QByteArray &payload);
    nlohmann::json dispatch(const std::string &method, const nlohmann::json &params);
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    SyncEngine &m_engine;
    QLocalServer m_server;
};

} // namespace engage
