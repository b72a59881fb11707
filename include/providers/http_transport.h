#pragma once

/**
 * @file http_transport.h
 * @brief Blocking HTTP client used by the provider adapters
 *
 * Adapters talk to providers only through HttpTransport so tests can script
 * responses without a network.
 */

#include "cancel_token.h"
#include <memory>
#include <string>
#include <vector>

namespace voicegate {

/// Why a request produced no HTTP status
enum class TransportFailure {
    None,
    Timeout,        ///< Connect or total transfer timeout
    ConnectFailed,  ///< DNS, refused, reset
    Cancelled,      ///< CancelToken fired mid-transfer
    Other
};

struct HttpRequest {
    std::string url;
    std::string method = "POST";
    std::vector<std::string> headers;   ///< "Name: value"
    std::string body;
    int timeout_ms = 10000;
    int connect_timeout_ms = 1000;
    CancelToken* cancel = nullptr;      ///< Optional; not owned
};

struct HttpResponse {
    long status = 0;                    ///< 0 when failure != None
    std::string body;
    std::string content_type;
    int64_t retry_after_ms = -1;        ///< Parsed Retry-After header, -1 if absent
    TransportFailure failure = TransportFailure::None;
    std::string failure_message;

    bool is_success() const { return failure == TransportFailure::None && status >= 200 && status < 300; }
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

/**
 * @brief libcurl implementation (one easy handle per request)
 */
class CurlHttpTransport : public HttpTransport {
public:
    CurlHttpTransport();
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override;
};

/// Retry-After as delay-seconds ("3") to milliseconds; -1 for HTTP-date or garbage
int64_t parse_retry_after(const std::string& value);

const char* transport_failure_to_string(TransportFailure failure);

} // namespace voicegate
