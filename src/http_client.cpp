#include "mediavault/http.hpp"
#include "mediavault/encoding.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace mediavault {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_server_error_status(int status) {
    return status >= 500 && status < 600;
}

std::string build_url(const std::string& base, const QueryParams& params) {
    if (params.empty()) return base;

    std::string url = base;
    char sep = (base.find('?') == std::string::npos) ? '?' : '&';
    for (const auto& [name, value] : params) {
        url += sep;
        url += url_encode(name);
        url += '=';
        url += url_encode(value);
        sep = '&';
    }
    return url;
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<std::string> HttpHeaders::content_type() const {
    return get("Content-Type");
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

// Context for bounded response accumulation or streaming
struct WriteCallbackContext {
    CURL* curl;
    std::vector<uint8_t>* response;
    const HttpHeaders* headers;
    const HttpBodySink* sink;
    size_t max_size;
    size_t current_size = 0;
    bool size_exceeded = false;
    bool started = false;
    bool streaming = false;
    bool aborted = false;
};

// Called once per response, before any 2xx body byte reaches the sink.
bool start_stream(WriteCallbackContext* ctx) {
    ctx->started = true;
    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (!is_success_status(static_cast<int>(status))) return true;

    ctx->streaming = true;
    if (ctx->sink->on_start && !ctx->sink->on_start(static_cast<int>(status), *ctx->headers)) {
        ctx->aborted = true;
        return false;
    }
    return true;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    if (ctx->sink && !ctx->started && !start_stream(ctx)) {
        return 0;
    }

    if (ctx->streaming) {
        if (ctx->sink->on_data &&
            !ctx->sink->on_data(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
            ctx->aborted = true;
            return 0;
        }
        return bytes;
    }

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->insert(ctx->response->end(), ptr, ptr + bytes);
    ctx->current_size += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) return bytes;

    // A new status line starts a new response (redirects): keep only the last
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        // Trim leading whitespace from value
        size_t start = value.find_first_not_of(" \t");
        value = (start != std::string::npos) ? value.substr(start) : std::string();

        headers->add(name, value);
    }

    return bytes;
}

int progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* callback = static_cast<HttpProgressCallback*>(clientp);
    if (*callback) {
        // Return non-zero to abort
        if (!(*callback)(static_cast<uint64_t>(dltotal), static_cast<uint64_t>(dlnow))) {
            return 1;
        }
    }
    return 0;
}

void share_lock(CURL* /*handle*/, curl_lock_data /*data*/, curl_lock_access /*access*/,
                void* userptr) {
    static_cast<std::mutex*>(userptr)->lock();
}

void share_unlock(CURL* /*handle*/, curl_lock_data /*data*/, void* userptr) {
    static_cast<std::mutex*>(userptr)->unlock();
}

NetworkError classify_curl_error(CURLcode res) {
    switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
            return NetworkError::Timeout;
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return NetworkError::Connection;
        case CURLE_ABORTED_BY_CALLBACK:
            return NetworkError::Aborted;
        default:
            return NetworkError::Other;
    }
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });

        // Cookie and DNS state shared by every request of this session
        share_ = curl_share_init();
        if (share_) {
            curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, share_lock);
            curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, share_unlock);
            curl_share_setopt(share_, CURLSHOPT_USERDATA, &share_mutex_);
            curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_COOKIE);
            curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        }
    }

    ~Impl() {
        if (share_) {
            curl_share_cleanup(share_);
            share_ = nullptr;
        }
    }

    HttpResponse execute(const HttpRequest& request) {
        HttpResponse response;

        CURL* curl = curl_easy_init();
        if (!curl) {
            response.error = "Failed to create CURL handle";
            response.network_error = NetworkError::Other;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        // Session state: empty cookie file enables the cookie engine
        if (share_) {
            curl_easy_setopt(curl, CURLOPT_SHARE, share_);
        }
        curl_easy_setopt(curl, CURLOPT_COOKIEFILE, "");

        std::vector<uint8_t> response_body;
        WriteCallbackContext write_ctx{curl, &response_body, &response.headers,
                                       request.body_sink, config_.max_response_size};
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &write_ctx);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        HttpProgressCallback progress_cb = request.progress_callback;
        if (progress_cb) {
            curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
            curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &progress_cb);
            curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
        }

        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(request.total_timeout.count()));

        if (config_.verify_ssl) {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        } else {
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
            curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
        }

        if (!config_.proxy_url.empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, config_.proxy_url.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        auto start_time = std::chrono::steady_clock::now();
        CURLcode res = curl_easy_perform(curl);
        auto end_time = std::chrono::steady_clock::now();

        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

        if (res == CURLE_OK) {
            response.status_code = static_cast<int>(status);
            response.body = std::move(response_body);

            // 2xx with an empty body never reached write_callback
            if (request.body_sink && !write_ctx.started && !start_stream(&write_ctx)) {
                response.error = "Transfer aborted by receiver";
                response.network_error = NetworkError::Aborted;
            }
        } else if (res == CURLE_WRITE_ERROR && write_ctx.size_exceeded) {
            response.error = "Response body exceeded maximum size limit of " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.status_code = 413;  // Payload Too Large
        } else if (res == CURLE_WRITE_ERROR && write_ctx.aborted) {
            response.status_code = static_cast<int>(status);
            response.error = "Transfer aborted by receiver";
            response.network_error = NetworkError::Aborted;
        } else {
            response.error = curl_easy_strerror(res);
            response.network_error = classify_curl_error(res);
        }

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }
        curl_easy_cleanup(curl);

        return response;
    }

    const HttpClientConfig& config() const { return config_; }

private:
    HttpClientConfig config_;

    CURLSH* share_ = nullptr;
    std::mutex share_mutex_;
};

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace mediavault
