#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace mediavault {

/// Failure classes reported by fetch, storage and derivation operations.
enum class ErrorKind {
    None,
    NetworkTransient,         // timeout, connection reset (retried)
    AuthChallenge,            // HTTP 403 (retried with a fresh session)
    ClientRejected,           // other 4xx (fatal per item)
    ServerTransient,          // 5xx (retried)
    PayloadInvalid,           // empty or undecodable payload (not retried)
    ChunkMissing,             // expected chunk absent during assembly or merge
    HashMismatch,             // merged content hash disagrees with the declared one
    ExternalToolUnavailable,  // transcoder / frame extractor not installed
    ExternalToolFailed,       // non-zero exit or timeout
    StorageFailure,           // local disk read/write failure
    NotFound,                 // unknown record
    InvalidArgument,
    Cancelled,
};

const char* error_kind_name(ErrorKind kind);

/// Outcome of an operation that produces no value.
/// Messages are user-facing: they carry identifiers, never filesystem paths.
struct Status {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool ok() const { return kind == ErrorKind::None; }

    static Status success() { return {}; }
    static Status failure(ErrorKind kind, std::string message) {
        return Status{kind, std::move(message)};
    }
};

/// One failed item inside a batch.
struct ItemError {
    ErrorKind kind = ErrorKind::None;
    std::string subject;  // page number, file id, variant name
    std::string message;
};

/// Per-item results of a batch job. A failed item never aborts the batch.
struct BatchResult {
    size_t success_count = 0;
    size_t failed_count = 0;
    size_t total = 0;
    std::vector<ItemError> errors;

    void record_success();
    void record_failure(ErrorKind kind, std::string subject, std::string message);

    bool any_succeeded() const { return success_count > 0; }
    bool all_succeeded() const { return failed_count == 0 && total > 0; }
};

/// External cancellation signal polled between chunk writes and fetch attempts.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token) {
    return token != nullptr && token->cancelled();
}

}  // namespace mediavault
