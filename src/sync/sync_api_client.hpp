#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDateTime>

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "common/models.hpp"
#include "sync/http_transport.hpp"

namespace engage {

// SyncApiClient delivers one collapsed mutation to the audience endpoint and
// classifies the response. It keeps no state between calls.
class SyncApiClient {
public:
    SyncApiClient(HttpTransport &transport, const EngageConfig &config);

    SyncOutcome send(const CollapsedMutation &mutation, const CancellationToken &token) const;

    HttpRequest buildRequest(const CollapsedMutation &mutation) const;

private:
    HttpTransport &m_transport;
    std::string m_url;
    std::string m_authToken;
    std::chrono::milliseconds m_timeout;
};

// "<identifier>:<sequence>". Identical for every retry of the same pending row.
std::string idempotencyToken(const CollapsedMutation &mutation);

// 2xx success; 429, 5xx and transport problems retryable; other 4xx
// unrecoverable.
SyncOutcome classifyResult(const HttpResult &result, const QDateTime &now);

// Retry-After as delta-seconds or an HTTP date relative to now.
std::optional<std::chrono::milliseconds> parseRetryAfter(const std::string &value,
                                                         const QDateTime &now);

} // namespace engage
