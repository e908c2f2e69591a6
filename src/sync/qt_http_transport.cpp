#include "sync/qt_http_transport.hpp"

#include <QByteArray>
#include <QEventLoop>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <QVariant>

#include "common/logging.hpp"

namespace engage {

namespace {

constexpr int kCancelPollIntervalMs = 100;

QByteArray toBytes(const std::string &value)
{
    return QByteArray(value.data(), static_cast<int>(value.size()));
}

} // namespace

HttpResult QtHttpTransport::execute(const HttpRequest &request, const CancellationToken &token)
{
    HttpResult result;
    if (token.isCancelled()) {
        result.kind = HttpResult::Kind::Cancelled;
        result.errorMessage = "cancelled before send";
        return result;
    }

    QNetworkAccessManager manager;
    QNetworkRequest networkRequest(QUrl(QString::fromStdString(request.url)));
    for (const auto &[name, value] : request.headers) {
        networkRequest.setRawHeader(toBytes(name), toBytes(value));
    }

    QNetworkReply *reply = manager.sendCustomRequest(networkRequest,
                                                     toBytes(request.method),
                                                     toBytes(request.body));

    QEventLoop loop;
    QTimer timeoutTimer;
    QTimer cancelPoll;
    bool timedOut = false;
    bool cancelled = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeoutTimer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&]() {
        if (token.isCancelled()) {
            cancelled = true;
            reply->abort();
        }
    });

    timeoutTimer.setSingleShot(true);
    timeoutTimer.start(static_cast<int>(request.timeout.count()));
    cancelPoll.start(kCancelPollIntervalMs);

    if (!reply->isFinished()) {
        loop.exec();
    }
    timeoutTimer.stop();
    cancelPoll.stop();

    if (timedOut) {
        result.kind = HttpResult::Kind::TimedOut;
        result.errorMessage = "request timed out";
    } else if (cancelled) {
        result.kind = HttpResult::Kind::Cancelled;
        result.errorMessage = "request cancelled";
    } else {
        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        if (!status.isValid()) {
            result.kind = HttpResult::Kind::NetworkError;
            result.errorMessage = reply->errorString().toStdString();
        } else {
            result.kind = HttpResult::Kind::Completed;
            result.statusCode = status.toInt();
            result.body = reply->readAll().toStdString();
            for (const auto &pair : reply->rawHeaderPairs()) {
                result.headers[pair.first.toLower().toStdString()] = pair.second.toStdString();
            }
        }
    }

    if (result.kind != HttpResult::Kind::Completed) {
        ELOG_DEBUG(QStringLiteral("QtHttpTransport"),
                   QStringLiteral("execute"),
                   QStringLiteral("http_exchange_incomplete"),
                   QString::fromStdString(result.errorMessage),
                   QStringLiteral("qnetworkaccessmanager"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"url", request.url},
                                   {"timedOut", timedOut},
                                   {"cancelled", cancelled}}));
    }

    return result;
}

} // namespace engage
