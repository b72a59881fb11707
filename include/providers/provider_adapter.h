#pragma once

#include "common.h"
#include "config.h"
#include "errors.h"
#include "providers/http_transport.h"
#include "providers/provider_health.h"
#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace voicegate {

/**
 * @brief Shared call path of every pipeline stage adapter
 *
 * One invocation = one or more HTTP attempts:
 * - Timeout / Unavailable: up to retry.max_attempts with exponential backoff
 * - RateLimited: exactly one extra attempt after Retry-After (capped) or the backoff
 * - InvalidResponse: returned immediately
 *
 * Every attempt except a cancelled one updates the provider's health record.
 * Adapters hold no session state; the correlation id is only logged.
 */
class ProviderAdapter {
public:
    using ResponseHandler = std::function<Result<void>(const HttpResponse&)>;

    ProviderAdapter(const std::string& name,
                    const ProviderConfig& config,
                    std::shared_ptr<HttpTransport> transport,
                    ProviderHealth* health);
    virtual ~ProviderAdapter() = default;

    ProviderAdapter(const ProviderAdapter&) = delete;
    ProviderAdapter& operator=(const ProviderAdapter&) = delete;

    const std::string& name() const { return name_; }

    /// Attempts made by the most recent invocation (for logs and tests)
    int last_attempts() const { return last_attempts_.load(); }

protected:
    /**
     * @brief Perform request under the retry policy
     * @param handle Called with each 2xx response; an error it returns is treated as InvalidResponse
     */
    Result<void> invoke(HttpRequest request,
                        const SessionId& correlation_id,
                        CancelToken* cancel,
                        const ResponseHandler& handle);

    /// Request with URL, bearer token and timeouts filled in from config
    HttpRequest make_request(const std::string& body, const std::string& content_type) const;

    const ProviderConfig& provider_config() const { return config_; }

private:
    Result<void> attempt(const HttpRequest& request, const ResponseHandler& handle);

    std::string name_;
    ProviderConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    ProviderHealth* health_;
    std::string api_key_;
    std::atomic<int> last_attempts_{0};
};

/**
 * @brief Map a non-2xx response or transport failure to the provider error taxonomy
 *
 * 429 -> RateLimited, 408/504/timeout -> Timeout, 5xx/connect failure -> Unavailable,
 * other statuses -> InvalidResponse, cancellation -> Cancelled.
 */
Error classify_http_failure(const std::string& provider_name, const HttpResponse& response);

} // namespace voicegate
