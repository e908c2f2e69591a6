#include "sync/sync_api_client.hpp"

#include <algorithm>
#include <limits>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace engage {

namespace {

constexpr const char *kIdempotencyHeader = "X-Idempotency-Key";
constexpr const char *kRetryAfterHeader = "retry-after";
// Largest seconds value whose millisecond form still fits the duration.
constexpr qlonglong kMaxRetryAfterSeconds =
    std::numeric_limits<std::chrono::milliseconds::rep>::max() / 1000;

std::string joinUrl(std::string base, const std::string &path)
{
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (path.empty()) {
        return base;
    }
    if (path.front() != '/') {
        return base + "/" + path;
    }
    return base + path;
}

std::string transportReason(const HttpResult &result)
{
    switch (result.kind) {
    case HttpResult::Kind::NetworkError:
        return "network error: " + result.errorMessage;
    case HttpResult::Kind::TimedOut:
        return "request timed out";
    case HttpResult::Kind::Cancelled:
        return "request cancelled";
    case HttpResult::Kind::Completed:
        break;
    }
    return "status " + std::to_string(result.statusCode);
}

} // namespace

std::string idempotencyToken(const CollapsedMutation &mutation)
{
    return mutation.identifier + ":" + std::to_string(mutation.sequence);
}

std::optional<std::chrono::milliseconds> parseRetryAfter(const std::string &value,
                                                         const QDateTime &now)
{
    const QString text = QString::fromStdString(value).trimmed();
    if (text.isEmpty()) {
        return std::nullopt;
    }

    bool isNumber = false;
    const qlonglong seconds = text.toLongLong(&isNumber);
    if (isNumber) {
        if (seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::milliseconds(std::min(seconds, kMaxRetryAfterSeconds) * 1000);
    }

    // HTTP dates name the zone "GMT"; Qt's RFC 2822 parser wants an offset.
    QString dateText = text;
    if (dateText.endsWith(QStringLiteral(" GMT"))) {
        dateText.chop(4);
        dateText += QStringLiteral(" +0000");
    }
    const QDateTime date = QDateTime::fromString(dateText, Qt::RFC2822Date);
    if (!date.isValid()) {
        return std::nullopt;
    }
    const qint64 delta = now.msecsTo(date);
    return std::chrono::milliseconds(std::max<qint64>(delta, 0));
}

SyncOutcome classifyResult(const HttpResult &result, const QDateTime &now)
{
    SyncOutcome outcome;
    outcome.statusCode = result.statusCode;

    if (result.kind != HttpResult::Kind::Completed) {
        outcome.kind = SyncOutcomeKind::RetryableFailure;
        outcome.reason = transportReason(result);
        return outcome;
    }

    const int status = result.statusCode;
    if (status >= 200 && status < 300) {
        outcome.kind = SyncOutcomeKind::Success;
        return outcome;
    }

    if (status >= 400 && status < 500 && status != 429) {
        outcome.kind = SyncOutcomeKind::UnrecoverableFailure;
        outcome.reason = "rejected with status " + std::to_string(status);
        return outcome;
    }

    outcome.kind = SyncOutcomeKind::RetryableFailure;
    outcome.reason = "status " + std::to_string(status);
    const auto header = result.headers.find(kRetryAfterHeader);
    if (header != result.headers.end()) {
        outcome.retryAfter = parseRetryAfter(header->second, now);
    }
    return outcome;
}

SyncApiClient::SyncApiClient(HttpTransport &transport, const EngageConfig &config)
    : m_transport(transport)
    , m_url(joinUrl(config.apiUrl, config.mutationPath))
    , m_authToken(config.authToken)
    , m_timeout(config.requestTimeout)
{
}

HttpRequest SyncApiClient::buildRequest(const CollapsedMutation &mutation) const
{
    const std::string token = idempotencyToken(mutation);

    HttpRequest request;
    request.method = "POST";
    request.url = m_url;
    request.timeout = m_timeout;
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    request.headers[kIdempotencyHeader] = token;
    if (!m_authToken.empty()) {
        request.headers["Authorization"] = "Bearer " + m_authToken;
    }

    const nlohmann::json body = {
        {"identifier", mutation.identifier},
        {"idempotency_token", token},
        {"timestamp", toIso8601Utc(mutation.createdAt)},
        {"operations", operationsToJson(mutation.operations)}
    };
    request.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return request;
}

SyncOutcome SyncApiClient::send(const CollapsedMutation &mutation,
                                const CancellationToken &token) const
{
    const HttpRequest request = buildRequest(mutation);
    const auto start = std::chrono::steady_clock::now();
    const HttpResult result = m_transport.execute(request, token);
    const SyncOutcome outcome = classifyResult(result, QDateTime::currentDateTimeUtc());

    const auto durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::steady_clock::now() - start)
                                .count();
    nlohmann::json context = {
        {"identifier", mutation.identifier},
        {"sequence", mutation.sequence},
        {"operations", mutation.operations.size()},
        {"status", result.statusCode},
        {"outcome", toOutcomeString(outcome.kind)},
        {"durationMs", durationMs}
    };
    if (outcome.retryAfter) {
        context["retryAfterMs"] = outcome.retryAfter->count();
    }

    if (outcome.kind == SyncOutcomeKind::Success) {
        ELOG_INFO(QStringLiteral("SyncApiClient"),
                  QStringLiteral("send"),
                  QStringLiteral("mutation_delivered"),
                  QStringLiteral("apply_mutation"),
                  QStringLiteral("http_post"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  context);
    } else {
        ELOG_WARN(QStringLiteral("SyncApiClient"),
                  QStringLiteral("send"),
                  QStringLiteral("mutation_not_delivered"),
                  QString::fromStdString(outcome.reason),
                  QStringLiteral("http_post"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  context);
    }
    return outcome;
}

} // namespace engage
