#include "providers/provider_adapter.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>

namespace voicegate {

ProviderAdapter::ProviderAdapter(const std::string& name,
                                 const ProviderConfig& config,
                                 std::shared_ptr<HttpTransport> transport,
                                 ProviderHealth* health)
    : name_(name),
      config_(config),
      transport_(std::move(transport)),
      health_(health),
      api_key_(config.resolve_api_key()) {}

HttpRequest ProviderAdapter::make_request(const std::string& body, const std::string& content_type) const {
    HttpRequest request;
    request.url = config_.endpoint;
    request.method = "POST";
    request.body = body;
    request.timeout_ms = config_.timeout_ms;
    request.connect_timeout_ms = config_.connect_timeout_ms;
    request.headers.push_back("Content-Type: " + content_type);
    if (!api_key_.empty()) {
        request.headers.push_back("Authorization: Bearer " + api_key_);
    }
    return request;
}

Result<void> ProviderAdapter::invoke(HttpRequest request,
                                     const SessionId& correlation_id,
                                     CancelToken* cancel,
                                     const ResponseHandler& handle) {
    request.cancel = cancel;
    const RetryConfig& retry = config_.retry;
    int64_t backoff_ms = std::max(0, retry.initial_backoff_ms);
    bool rate_limit_retry_used = false;
    int attempts = 0;

    while (true) {
        if (cancel && cancel->is_cancelled()) {
            last_attempts_ = attempts;
            return make_cancelled_error(name_ + " call cancelled");
        }

        attempts++;
        auto start = Clock::now();
        Result<void> result = attempt(request, handle);
        int64_t elapsed = ms_since(start);

        if (result) {
            if (health_) health_->record_success();
            last_attempts_ = attempts;
            LOG_TRACE(correlation_id, name_, "ok attempt=" + std::to_string(attempts) +
                      " latency_ms=" + std::to_string(elapsed));
            return result;
        }

        Error error = result.error();
        if (error.type == ErrorType::Cancelled) {
            last_attempts_ = attempts;
            LOG_TRACE(correlation_id, name_, "cancelled attempt=" + std::to_string(attempts));
            return error;
        }

        if (health_) health_->record_failure();

        std::ostringstream oss;
        oss << "[" << name_ << "] attempt " << attempts << " failed after " << elapsed
            << "ms: " << describe(error) << " (session " << correlation_id << ")";
        Logger::warn(oss.str());

        int64_t wait_ms = -1;
        if (error.is_provider(ProviderErrorKind::RateLimited)) {
            if (!rate_limit_retry_used) {
                rate_limit_retry_used = true;
                wait_ms = error.retry_after_ms >= 0
                    ? std::min<int64_t>(error.retry_after_ms, retry.max_rate_limit_wait_ms)
                    : backoff_ms;
            }
        } else if (error.is_provider(ProviderErrorKind::Timeout) ||
                   error.is_provider(ProviderErrorKind::Unavailable)) {
            if (attempts < retry.max_attempts) {
                wait_ms = backoff_ms;
                backoff_ms = std::min<int64_t>(backoff_ms * 2, retry.max_backoff_ms);
            }
        }

        if (wait_ms < 0) {
            last_attempts_ = attempts;
            LOG_TRACE(correlation_id, name_, "failed attempts=" + std::to_string(attempts) +
                      " error=" + provider_error_kind_to_string(error.provider_kind));
            return error;
        }

        LOG_TRACE(correlation_id, name_, "retry in " + std::to_string(wait_ms) + "ms");
        if (cancel) {
            if (cancel->wait_for(wait_ms)) {
                last_attempts_ = attempts;
                return make_cancelled_error(name_ + " call cancelled during backoff");
            }
        } else if (wait_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
        }
    }
}

Result<void> ProviderAdapter::attempt(const HttpRequest& request, const ResponseHandler& handle) {
    if (request.url.empty()) {
        return make_provider_error(ProviderErrorKind::Unavailable, name_ + " endpoint is not configured");
    }

    HttpResponse response = transport_->perform(request);
    if (!response.is_success()) {
        return classify_http_failure(name_, response);
    }

    Result<void> handled = handle(response);
    if (!handled && handled.error().type != ErrorType::ProviderError) {
        return make_provider_error(ProviderErrorKind::InvalidResponse, handled.error().message);
    }
    return handled;
}

Error classify_http_failure(const std::string& provider_name, const HttpResponse& response) {
    switch (response.failure) {
        case TransportFailure::Timeout:
            return make_provider_error(ProviderErrorKind::Timeout,
                                       provider_name + " timed out: " + response.failure_message);
        case TransportFailure::ConnectFailed:
        case TransportFailure::Other:
            return make_provider_error(ProviderErrorKind::Unavailable,
                                       provider_name + " unreachable: " + response.failure_message);
        case TransportFailure::Cancelled:
            return make_cancelled_error(provider_name + " call cancelled");
        case TransportFailure::None:
            break;
    }

    std::string detail = provider_name + " returned HTTP " + std::to_string(response.status);
    if (!response.body.empty()) {
        detail += ": " + utils::truncate_for_log(response.body, 120);
    }

    if (response.status == 429) {
        return make_provider_error(ProviderErrorKind::RateLimited, detail, response.retry_after_ms);
    }
    if (response.status == 408 || response.status == 504) {
        return make_provider_error(ProviderErrorKind::Timeout, detail);
    }
    if (response.status >= 500) {
        return make_provider_error(ProviderErrorKind::Unavailable, detail);
    }
    return make_provider_error(ProviderErrorKind::InvalidResponse, detail);
}

} // namespace voicegate
