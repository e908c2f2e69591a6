#include "daemon/engage_api_server.hpp"

#include <chrono>
#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QDebug>
#include <QUuid>

#include <unistd.h>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace engage {

namespace {

QString runtimeSocketPath()
{
    const QString socketName = qEnvironmentVariable("ENGAGE_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/engage.sock");
}

std::string requireIdentifier(const nlohmann::json &params)
{
    const std::string identifier = params.value("identifier", "");
    if (identifier.empty()) {
        throw std::invalid_argument("Missing identifier");
    }
    return identifier;
}

} // namespace

EngageApiServer::EngageApiServer(SyncEngine &engine, QObject *parent)
    : QObject(parent)
    , m_engine(engine)
{
}

EngageApiServer::~EngageApiServer() = default;

bool EngageApiServer::start()
{
    const QString socketPath = runtimeSocketPath();
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing Engage socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on Engage socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &EngageApiServer::handleNewConnection);

    qInfo() << "Engage API server listening on" << socketPath;
    return true;
}

void EngageApiServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &EngageApiServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void EngageApiServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    handleRequest(socket, payload);
}

void EngageApiServer::handleRequest(QLocalSocket *socket, const QByteArray &payload)
{
    if (!socket) {
        return;
    }
    const QByteArray response = handleRequestPayload(payload);
    socket->write(response);
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray EngageApiServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);
    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        ELOG_WARN(QStringLiteral("EngageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("parse_payload"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Invalid JSON payload");
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        ELOG_WARN(QStringLiteral("EngageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_error"),
                  QStringLiteral("missing_method"),
                  QStringLiteral("json_parse"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json::object());
        return makeErrorResponse("Missing method", id);
    }

    const std::string method = parsed["method"].get<std::string>();
    nlohmann::json params = nlohmann::json::object();
    if (parsed.contains("params")) {
        if (!parsed["params"].is_object()) {
            return makeErrorResponse("Invalid params", id);
        }
        params = parsed["params"];
    }

    ELOG_INFO(QStringLiteral("EngageApiServer"),
              QStringLiteral("handleRequest"),
              QStringLiteral("api_request_received"),
              QStringLiteral("client_call"),
              QStringLiteral("json_rpc"),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"method", method}}));

    const auto start = std::chrono::steady_clock::now();
    try {
        const nlohmann::json result = dispatch(method, params);
        if (result.is_discarded()) {
            ELOG_WARN(QStringLiteral("EngageApiServer"),
                      QStringLiteral("handleRequest"),
                      QStringLiteral("api_request_error"),
                      QStringLiteral("unknown_method"),
                      QStringLiteral("json_rpc"),
                      logging::defaultWho(),
                      corrId,
                      (nlohmann::json{{"method", method}}));
            return makeErrorResponse("Unknown method", id);
        }

        ELOG_INFO(QStringLiteral("EngageApiServer"),
                  QStringLiteral("handleRequest"),
                  QStringLiteral("api_request_completed"),
                  QStringLiteral("client_call"),
                  QStringLiteral("json_rpc"),
                  logging::defaultWho(),
                  corrId,
                  (nlohmann::json{{"method", method},
                                  {"durationMs",
                                   std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::steady_clock::now() - start).count()}}));
        return makeResultResponse(result, id);
    } catch (const std::exception &ex) {
        ELOG_ERROR(QStringLiteral("EngageApiServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("exception"),
                   QStringLiteral("json_rpc"),
                   logging::defaultWho(),
                   corrId,
                   (nlohmann::json{{"method", method}, {"what", ex.what()}}));
        return makeErrorResponse(QString::fromUtf8(ex.what()), id);
    }
}

// Returns a discarded value for unknown methods; throws on invalid params.
nlohmann::json EngageApiServer::dispatch(const std::string &method, const nlohmann::json &params)
{
    if (method == "evaluate") {
        if (!params.contains("predicate")) {
            throw std::invalid_argument("Missing predicate");
        }
        const nlohmann::json event = params.value("event", nlohmann::json());
        nlohmann::json result;
        result["matched"] = m_engine.evaluate(params["predicate"], event);
        return result;
    }

    if (method == "record_mutation") {
        const std::string identifier = requireIdentifier(params);
        const auto operations = operationsFromJson(params.value("operations", nlohmann::json()));
        if (!operations || operations->empty()) {
            throw std::invalid_argument("Invalid operations");
        }
        Mutation mutation;
        mutation.operations = *operations;
        mutation.createdAt = std::chrono::system_clock::now();
        if (params.contains("created_at")) {
            const auto &createdValue = params.at("created_at");
            const auto createdAt = createdValue.is_string()
                ? fromIso8601Utc(createdValue.get<std::string>())
                : std::chrono::system_clock::time_point{};
            if (createdAt == std::chrono::system_clock::time_point{}) {
                throw std::invalid_argument("Invalid created_at");
            }
            mutation.createdAt = createdAt;
        }

        const CollapsedMutation collapsed = m_engine.recordMutation(identifier, mutation);
        nlohmann::json result;
        result["pending"] = collapsed.empty() ? nlohmann::json() : collapsedMutationToJson(collapsed);
        return result;
    }

    if (method == "get_pending") {
        const std::string identifier = requireIdentifier(params);
        const auto pending = m_engine.pending(identifier);
        nlohmann::json result;
        result["pending"] = pending ? collapsedMutationToJson(*pending) : nlohmann::json();
        return result;
    }

    if (method == "list_pending") {
        nlohmann::json pending = nlohmann::json::array();
        for (const auto &mutation : m_engine.listPending()) {
            pending.push_back(collapsedMutationToJson(mutation));
        }
        nlohmann::json result;
        result["pending"] = pending;
        return result;
    }

    if (method == "set_network_available") {
        const auto it = params.find("available");
        if (it == params.end() || !it->is_boolean()) {
            throw std::invalid_argument("Missing available flag");
        }
        m_engine.setNetworkAvailable(it->get<bool>());
        nlohmann::json result;
        result["available"] = m_engine.isNetworkAvailable();
        return result;
    }

    if (method == "task_state") {
        const std::string identifier = requireIdentifier(params);
        nlohmann::json result;
        result["identifier"] = identifier;
        result["state"] = toTaskStateString(m_engine.syncState(identifier));
        return result;
    }

    return nlohmann::json(nlohmann::json::value_t::discarded);
}

QByteArray EngageApiServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray EngageApiServer::makeResultResponse(const nlohmann::json &result,
                                               int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

} // namespace engage
