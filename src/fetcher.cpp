#include "mediavault/fetcher.hpp"
#include "mediavault/log.hpp"
#include "mediavault/metrics.hpp"

#include <algorithm>
#include <optional>
#include <thread>

namespace mediavault {

namespace {

// Query strings may carry API keys; keep them out of the logs.
std::string redact_url(const std::string& url) {
    auto q = url.find('?');
    return q == std::string::npos ? url : url.substr(0, q);
}

FailureClass classify(const HttpResponse& response) {
    switch (response.network_error) {
        case NetworkError::Timeout: return FailureClass::Timeout;
        case NetworkError::Connection:
        case NetworkError::Other: return FailureClass::Connection;
        case NetworkError::Aborted: return FailureClass::Cancelled;
        case NetworkError::None: break;
    }
    int status = response.status_code;
    if (is_success_status(status)) return FailureClass::None;
    if (status == 403) return FailureClass::AuthChallenge;
    if (is_server_error_status(status)) return FailureClass::ServerError;
    return FailureClass::ClientError;
}

std::string describe(FailureClass failure, const HttpResponse& response) {
    switch (failure) {
        case FailureClass::Timeout: return "request timed out";
        case FailureClass::Connection: return "connection failed";
        case FailureClass::Cancelled: return "transfer aborted";
        case FailureClass::AuthChallenge: return "HTTP 403 (access challenge)";
        case FailureClass::ServerError:
        case FailureClass::ClientError:
            return "HTTP " + std::to_string(response.status_code);
        default: return failure_class_name(failure);
    }
}

}  // namespace

// --- FetchPolicy ---

std::chrono::milliseconds FetchPolicy::backoff_for(int failed_attempts) const {
    int shift = std::clamp(failed_attempts - 1, 0, 30);
    return base_delay * (int64_t{1} << shift);
}

// --- SessionProvider ---

SessionProvider::SessionProvider(TransportFactory factory)
    : factory_(std::move(factory)) {}

std::shared_ptr<HttpTransport> SessionProvider::get() {
    std::lock_guard lock(mutex_);
    if (!current_ && factory_) {
        current_ = factory_();
        if (current_) ++created_;
    }
    return current_;
}

void SessionProvider::invalidate() {
    std::lock_guard lock(mutex_);
    current_.reset();
}

uint64_t SessionProvider::sessions_created() const {
    std::lock_guard lock(mutex_);
    return created_;
}

// --- Failure classes ---

const char* failure_class_name(FailureClass failure) {
    switch (failure) {
        case FailureClass::None: return "none";
        case FailureClass::Timeout: return "timeout";
        case FailureClass::Connection: return "connection";
        case FailureClass::ServerError: return "server_error";
        case FailureClass::ClientError: return "client_error";
        case FailureClass::AuthChallenge: return "auth_challenge";
        case FailureClass::DecodeError: return "decode_error";
        case FailureClass::Cancelled: return "cancelled";
    }
    return "unknown";
}

ErrorKind to_error_kind(FailureClass failure) {
    switch (failure) {
        case FailureClass::None: return ErrorKind::None;
        case FailureClass::Timeout:
        case FailureClass::Connection: return ErrorKind::NetworkTransient;
        case FailureClass::ServerError: return ErrorKind::ServerTransient;
        case FailureClass::ClientError: return ErrorKind::ClientRejected;
        case FailureClass::AuthChallenge: return ErrorKind::AuthChallenge;
        case FailureClass::DecodeError: return ErrorKind::PayloadInvalid;
        case FailureClass::Cancelled: return ErrorKind::Cancelled;
    }
    return ErrorKind::NetworkTransient;
}

bool is_retryable(FailureClass failure) {
    return failure == FailureClass::Timeout || failure == FailureClass::Connection ||
           failure == FailureClass::ServerError || failure == FailureClass::AuthChallenge;
}

// --- RetryingFetcher ---

RetryingFetcher::RetryingFetcher(FetchPolicy policy, TransportFactory factory, Sleeper sleeper)
    : policy_(policy)
    , sessions_(std::move(factory))
    , sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

void RetryingFetcher::pause(std::chrono::milliseconds delay) {
    if (delay.count() > 0) sleeper_(delay);
}

FetchResult RetryingFetcher::run(const HttpRequest& request, const CancellationToken* cancel,
                                 const std::function<void()>& on_retry) {
    FetchResult result;
    const std::string where = redact_url(request.url);
    const int max_attempts = std::max(1, policy_.max_retries);
    int retry_count = 0;

    while (retry_count < max_attempts) {
        if (is_cancelled(cancel)) {
            result.failure = FailureClass::Cancelled;
            result.error_kind = ErrorKind::Cancelled;
            result.error_message = "fetch cancelled";
            return result;
        }
        if (result.attempts > 0 && on_retry) on_retry();

        auto session = sessions_.get();
        ++result.attempts;

        HttpResponse response;
        if (session) {
            std::optional<ScopedTimer> timer;
            if (metrics_) timer.emplace(metrics_->fetch_duration());
            response = session->execute(request);
        } else {
            response.network_error = NetworkError::Other;
            response.error = "no HTTP session available";
        }

        FailureClass failure = classify(response);
        if (metrics_) metrics_->record_fetch_attempt(failure);

        if (failure == FailureClass::None) {
            result.success = true;
            result.status_code = response.status_code;
            result.body = std::move(response.body);
            result.headers = std::move(response.headers);
            result.failure = FailureClass::None;
            result.error_kind = ErrorKind::None;
            result.error_message.clear();
            if (result.attempts > 1) {
                log_info("Fetched %s after %d attempts", where.c_str(), result.attempts);
            }
            return result;
        }

        result.failure = failure;
        result.status_code = response.status_code;
        result.error_kind = to_error_kind(failure);
        result.error_message = describe(failure, response);

        if (failure == FailureClass::Cancelled) {
            return result;
        }

        if (!is_retryable(failure)) {
            log_warn("Fetch %s failed: %s, not retrying", where.c_str(),
                     result.error_message.c_str());
            result.body = std::move(response.body);
            result.headers = std::move(response.headers);
            return result;
        }

        if (failure == FailureClass::AuthChallenge) {
            log_warn("Fetch %s got 403, resetting session", where.c_str());
            sessions_.invalidate();
            if (metrics_) metrics_->session_resets().Increment();
        }

        ++retry_count;
        log_warn("Fetch %s failed: %s (attempt %d/%d)%s%s", where.c_str(),
                 result.error_message.c_str(), retry_count, max_attempts,
                 response.error.empty() ? "" : ": ", response.error.c_str());

        if (retry_count < max_attempts) {
            auto delay = policy_.backoff_for(retry_count);
            log_info("Retrying %s in %lld ms", where.c_str(),
                     static_cast<long long>(delay.count()));
            if (metrics_) metrics_->fetch_retries().Increment();
            pause(delay);
        }
    }

    log_error("Fetch %s gave up after %d attempts: %s", where.c_str(), result.attempts,
              result.error_message.c_str());
    return result;
}

FetchResult RetryingFetcher::fetch(const std::string& url, const QueryParams& params,
                                   const HttpHeaders& headers, const CancellationToken* cancel) {
    HttpRequest request = HttpRequest::get(build_url(url, params));
    request.headers = headers;
    request.total_timeout = policy_.request_timeout;
    request.connect_timeout = policy_.connect_timeout;
    return run(request, cancel, {});
}

JsonFetchResult RetryingFetcher::fetch_json(const std::string& url, const QueryParams& params,
                                            const HttpHeaders& headers,
                                            const CancellationToken* cancel) {
    JsonFetchResult out;
    out.fetch = fetch(url, params, headers, cancel);
    if (!out.fetch.success) return out;

    const std::string where = redact_url(url);
    auto content_type = out.fetch.headers.content_type();
    if (!content_type || content_type->find("json") == std::string::npos) {
        log_warn("Response from %s is not declared as JSON (content-type: %s)", where.c_str(),
                 content_type ? content_type->c_str() : "none");
    }
    if (out.fetch.body.empty()) {
        log_warn("Empty response body from %s", where.c_str());
    }

    try {
        out.document = nlohmann::json::parse(out.fetch.body.begin(), out.fetch.body.end());
    } catch (const nlohmann::json::parse_error& e) {
        log_error("Cannot decode JSON from %s: %s", where.c_str(), e.what());
        out.fetch.success = false;
        out.fetch.failure = FailureClass::DecodeError;
        out.fetch.error_kind = ErrorKind::PayloadInvalid;
        out.fetch.error_message = out.fetch.body.empty() ? "empty response body"
                                                         : "response is not valid JSON";
        if (metrics_) metrics_->record_fetch_attempt(FailureClass::DecodeError);
    }
    return out;
}

FetchResult RetryingFetcher::fetch_stream(const std::string& url, const HttpHeaders& headers,
                                          const HttpBodySink& sink,
                                          const std::function<void()>& on_retry,
                                          const CancellationToken* cancel) {
    HttpRequest request = HttpRequest::get(url);
    request.headers = headers;
    request.total_timeout = policy_.request_timeout;
    request.connect_timeout = policy_.connect_timeout;
    request.body_sink = &sink;
    if (cancel) {
        request.progress_callback = [cancel](uint64_t, uint64_t) { return !cancel->cancelled(); };
    }
    return run(request, cancel, on_retry);
}

BatchResult RetryingFetcher::harvest_pages(const HarvestRequest& request,
                                           const PageHandler& handler,
                                           const CancellationToken* cancel) {
    BatchResult batch;
    if (request.start_page < 1 || request.end_page < 1 || request.limit < 1 ||
        request.start_page > request.end_page) {
        log_error("Invalid page range: start=%d end=%d limit=%d", request.start_page,
                  request.end_page, request.limit);
        return batch;
    }

    const std::string where = redact_url(request.url);
    log_info("Harvesting %s pages %d-%d (limit %d)", where.c_str(), request.start_page,
             request.end_page, request.limit);

    for (int page = request.start_page; page <= request.end_page; ++page) {
        std::string subject = "page " + std::to_string(page);

        if (is_cancelled(cancel)) {
            batch.record_failure(ErrorKind::Cancelled, subject, "harvest cancelled");
            break;
        }

        QueryParams params = request.extra_params;
        params.emplace_back(request.page_param, std::to_string(page));
        params.emplace_back(request.limit_param, std::to_string(request.limit));

        auto result = fetch_json(request.url, params, request.headers, cancel);
        bool ok = false;
        if (!result.success()) {
            batch.record_failure(result.fetch.error_kind, subject, result.fetch.error_message);
        } else if (result.document.is_null()) {
            batch.record_failure(ErrorKind::PayloadInvalid, subject, "page returned no data");
        } else {
            try {
                if (handler) handler(page, result.document);
                batch.record_success();
                ok = true;
            } catch (const std::exception& e) {
                log_error("Handler failed for %s %s: %s", where.c_str(), subject.c_str(), e.what());
                batch.record_failure(ErrorKind::PayloadInvalid, subject, "page could not be processed");
            }
        }

        if (metrics_) {
            (ok ? metrics_->pages_success() : metrics_->pages_failure()).Increment();
        }

        if (page < request.end_page) pause(policy_.page_delay);
    }

    log_info("Harvest of %s finished: %zu succeeded, %zu failed, %zu total", where.c_str(),
             batch.success_count, batch.failed_count, batch.total);
    return batch;
}

}  // namespace mediavault
