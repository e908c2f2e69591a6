#pragma once

#include "sync/http_transport.hpp"

namespace engage {

// HttpTransport on QNetworkAccessManager. Each call runs its own manager and
// QEventLoop on the calling thread, so it may be used from pool workers.
class QtHttpTransport : public HttpTransport {
public:
    HttpResult execute(const HttpRequest &request, const CancellationToken &token) override;
};

} // namespace engage
