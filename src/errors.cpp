#include "mediavault/errors.hpp"

namespace mediavault {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::NetworkTransient: return "network_transient";
        case ErrorKind::AuthChallenge: return "auth_challenge";
        case ErrorKind::ClientRejected: return "client_rejected";
        case ErrorKind::ServerTransient: return "server_transient";
        case ErrorKind::PayloadInvalid: return "payload_invalid";
        case ErrorKind::ChunkMissing: return "chunk_missing";
        case ErrorKind::HashMismatch: return "hash_mismatch";
        case ErrorKind::ExternalToolUnavailable: return "external_tool_unavailable";
        case ErrorKind::ExternalToolFailed: return "external_tool_failed";
        case ErrorKind::StorageFailure: return "storage_failure";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::InvalidArgument: return "invalid_argument";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

void BatchResult::record_success() {
    ++success_count;
    ++total;
}

void BatchResult::record_failure(ErrorKind kind, std::string subject, std::string message) {
    ++failed_count;
    ++total;
    errors.push_back(ItemError{kind, std::move(subject), std::move(message)});
}

}  // namespace mediavault
