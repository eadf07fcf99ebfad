#pragma once

#include "mediavault/errors.hpp"
#include "mediavault/http.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediavault {

class MetricsExporter;

/// Retry and pacing knobs for remote acquisition.
struct FetchPolicy {
    int max_retries = 5;                                // total attempts per fetch
    std::chrono::milliseconds base_delay{5000};         // backoff = base * 2^(n-1)
    std::chrono::milliseconds page_delay{1000};         // between successive pages
    std::chrono::milliseconds request_timeout{60000};
    std::chrono::milliseconds connect_timeout{10000};

    std::chrono::milliseconds backoff_for(int failed_attempts) const;
};

using TransportFactory = std::function<std::unique_ptr<HttpTransport>()>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Lazily created HTTP session that can be discarded on demand.
///
/// Callers hold a shared_ptr to the session they used, so invalidating while
/// another request is in flight is safe.
class SessionProvider {
public:
    explicit SessionProvider(TransportFactory factory);

    std::shared_ptr<HttpTransport> get();
    void invalidate();

    /// Number of sessions created so far.
    uint64_t sessions_created() const;

private:
    TransportFactory factory_;
    mutable std::mutex mutex_;
    std::shared_ptr<HttpTransport> current_;
    uint64_t created_ = 0;
};

enum class FailureClass {
    None,
    Timeout,
    Connection,
    ServerError,    // 5xx
    ClientError,    // 4xx other than 403
    AuthChallenge,  // 403
    DecodeError,    // malformed payload
    Cancelled
};

const char* failure_class_name(FailureClass failure);
ErrorKind to_error_kind(FailureClass failure);
bool is_retryable(FailureClass failure);

struct FetchResult {
    bool success = false;
    int status_code = 0;
    std::vector<uint8_t> body;
    HttpHeaders headers;
    int attempts = 0;
    FailureClass failure = FailureClass::None;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;

    std::string body_string() const { return std::string(body.begin(), body.end()); }
};

struct JsonFetchResult {
    FetchResult fetch;
    nlohmann::json document;

    bool success() const { return fetch.success; }
};

/// One paginated harvest: pages [start_page, end_page] of `url`.
struct HarvestRequest {
    std::string url;
    int start_page = 1;
    int end_page = 1;
    int limit = 1;
    HttpHeaders headers;
    QueryParams extra_params;
    std::string page_param = "page";
    std::string limit_param = "limit";
};

/// Receives each decoded page. Throwing marks the page failed.
using PageHandler = std::function<void(int page, const nlohmann::json& document)>;

/// HTTP acquisition with failure-class-specific retry and session recovery.
///
/// Transient failures (timeout, connection, 5xx) back off exponentially;
/// 403 discards the session before retrying; other 4xx and undecodable
/// payloads fail at once. Backoff sleeps never hold a lock.
class RetryingFetcher {
public:
    RetryingFetcher(FetchPolicy policy, TransportFactory factory, Sleeper sleeper = {});

    FetchResult fetch(const std::string& url, const QueryParams& params = {},
                      const HttpHeaders& headers = {},
                      const CancellationToken* cancel = nullptr);

    /// Fetch and parse a JSON document. Parse failures are not retried.
    JsonFetchResult fetch_json(const std::string& url, const QueryParams& params = {},
                               const HttpHeaders& headers = {},
                               const CancellationToken* cancel = nullptr);

    /// Stream a 2xx body into `sink`. The whole request is retried under the
    /// same policy; `on_retry` runs before each new attempt so the receiver
    /// can discard what it got from the failed one.
    FetchResult fetch_stream(const std::string& url, const HttpHeaders& headers,
                             const HttpBodySink& sink,
                             const std::function<void()>& on_retry,
                             const CancellationToken* cancel = nullptr);

    /// Fetch every page in range, isolating per-page failures.
    /// Invalid ranges (any bound < 1, start > end) return an all-zero result.
    BatchResult harvest_pages(const HarvestRequest& request, const PageHandler& handler,
                              const CancellationToken* cancel = nullptr);

    const FetchPolicy& policy() const { return policy_; }
    SessionProvider& sessions() { return sessions_; }

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

private:
    FetchResult run(const HttpRequest& request, const CancellationToken* cancel,
                    const std::function<void()>& on_retry);
    void pause(std::chrono::milliseconds delay);

    FetchPolicy policy_;
    SessionProvider sessions_;
    Sleeper sleeper_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace mediavault
