#include "providers/http_transport.h"
#include "logger.h"
#include "utils.h"
#include <curl/curl.h>
#include <cctype>
#include <sstream>

namespace voicegate {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total = size * nitems;
    auto* response = static_cast<HttpResponse*>(userdata);
    std::string line(buffer, total);

    size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return total;
    }
    std::string name = utils::normalize_copy(line.substr(0, colon));
    std::string value = utils::trim_copy(line.substr(colon + 1));
    if (name == "retry-after") {
        response->retry_after_ms = parse_retry_after(value);
    }
    return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel = static_cast<CancelToken*>(clientp);
    return (cancel && cancel->is_cancelled()) ? 1 : 0;
}

TransportFailure classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return TransportFailure::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return TransportFailure::ConnectFailed;
        case CURLE_ABORTED_BY_CALLBACK:
            return TransportFailure::Cancelled;
        default:
            return TransportFailure::Other;
    }
}

} // anonymous namespace

CurlHttpTransport::CurlHttpTransport() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlHttpTransport::~CurlHttpTransport() {
    curl_global_cleanup();
}

HttpResponse CurlHttpTransport::perform(const HttpRequest& request) {
    HttpResponse response;

    if (request.cancel && request.cancel->is_cancelled()) {
        response.failure = TransportFailure::Cancelled;
        response.failure_message = "cancelled before start";
        return response;
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.failure = TransportFailure::Other;
        response.failure_message = "Failed to initialize CURL";
        return response;
    }

    struct curl_slist* headers = nullptr;
    for (const auto& header : request.headers) {
        headers = curl_slist_append(headers, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.connect_timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, request.cancel);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

    LOG_HTTP(request.method + " " + request.url + " (" + std::to_string(request.body.size()) + " bytes)");
    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        response.failure = classify_curl_error(res);
        response.failure_message = curl_easy_strerror(res);
        response.status = 0;
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
        char* content_type = nullptr;
        if (curl_easy_getinfo(curl, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
            response.content_type = content_type;
        }
    }

    std::ostringstream oss;
    oss << request.url << " -> status=" << response.status
        << " failure=" << transport_failure_to_string(response.failure)
        << " body=" << response.body.size() << " bytes";
    LOG_HTTP(oss.str());

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return response;
}

int64_t parse_retry_after(const std::string& value) {
    std::string trimmed = utils::trim_copy(value);
    if (trimmed.empty() || trimmed.size() > 9) {
        return -1;
    }
    for (char c : trimmed) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return -1;
        }
    }
    return std::stoll(trimmed) * 1000;
}

const char* transport_failure_to_string(TransportFailure failure) {
    switch (failure) {
        case TransportFailure::None: return "none";
        case TransportFailure::Timeout: return "timeout";
        case TransportFailure::ConnectFailed: return "connect-failed";
        case TransportFailure::Cancelled: return "cancelled";
        case TransportFailure::Other: return "other";
    }
    return "unknown";
}

} // namespace voicegate
