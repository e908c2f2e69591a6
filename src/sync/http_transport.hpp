#pragma once

#include <chrono>
#include <map>
#include <string>

#include "common/cancellation.hpp"

namespace engage {

struct HttpRequest {
    std::string method = "POST";
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::chrono::milliseconds timeout{60000};
};

struct HttpResult {
    enum class Kind {
        Completed,
        NetworkError,
        TimedOut,
        Cancelled
    };

    Kind kind = Kind::Completed;
    int statusCode = 0;
    std::string body;
    // Header names are lower-cased.
    std::map<std::string, std::string> headers;
    std::string errorMessage;
};

// Blocking HTTP exchange used by SyncApiClient. Implementations must return
// promptly once token is cancelled and must not throw for transport failures.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual HttpResult execute(const HttpRequest &request, const CancellationToken &token) = 0;
};

} // namespace engage
