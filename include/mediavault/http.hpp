#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mediavault {

bool is_success_status(int status);
bool is_server_error_status(int status);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    std::optional<std::string> content_type() const;
    std::optional<uint64_t> content_length() const;

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

using QueryParams = std::vector<std::pair<std::string, std::string>>;

/// Append url-encoded query parameters to a URL.
std::string build_url(const std::string& base, const QueryParams& params);

/// Streaming receiver for a 2xx response body.
///
/// on_start runs once, after headers arrive and before the first body byte;
/// on_data runs for every received block. Returning false from either aborts
/// the transfer. Non-2xx bodies are buffered into HttpResponse::body instead.
struct HttpBodySink {
    std::function<bool(int status, const HttpHeaders& headers)> on_start;
    std::function<bool(const uint8_t* data, size_t len)> on_data;
};

// Progress callback, return false to cancel
using HttpProgressCallback = std::function<bool(uint64_t download_total, uint64_t download_now)>;

/// A GET request. Remote acquisition never sends a request body.
struct HttpRequest {
    std::string url;
    HttpHeaders headers;

    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{60000};

    HttpProgressCallback progress_callback;

    /// When set, 2xx bodies are streamed here instead of accumulated.
    const HttpBodySink* body_sink = nullptr;

    static HttpRequest get(const std::string& url);
};

/// Transport-level failure, when no usable HTTP status was received.
enum class NetworkError {
    None,
    Timeout,
    Connection,
    Aborted,  // progress callback or body sink asked to stop
    Other
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    std::chrono::milliseconds total_time{0};

    bool ok() const { return network_error == NetworkError::None && is_success_status(status_code); }
    std::string body_string() const;

    std::string error;
    NetworkError network_error = NetworkError::None;
};

/// One HTTP session. A session owns its cookie state; discarding it and
/// creating a new one sheds any server-side challenge bound to that state.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

struct HttpClientConfig {
    std::string user_agent = "mediavault/1.0";
    size_t max_response_size = 256ULL * 1024 * 1024;  // buffered bodies only
    std::string proxy_url;                             // empty = direct
    bool verify_ssl = true;
    bool verbose = false;
};

/// libcurl-backed session. Each execute() runs on a fresh easy handle; the
/// handles of one session share its cookie and DNS cache.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace mediavault
