#include "mediavault/dedup_index.hpp"
#include "mediavault/log.hpp"
#include "mediavault/metrics.hpp"

#include <algorithm>
#include <cctype>

namespace mediavault {

std::string normalize_hash(const std::string& hash) {
    auto first = hash.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    auto last = hash.find_last_not_of(" \t\r\n");
    std::string out = hash.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<MediaRecord> DedupIndex::exists_by_hash(const std::string& content_hash) {
    auto hash = normalize_hash(content_hash);
    if (hash.empty()) return std::nullopt;
    return records_.find_by_hash(hash);
}

Registration DedupIndex::register_record(MediaRecord record) {
    Registration reg;
    record.content_hash = normalize_hash(record.content_hash);
    if (record.content_hash.empty()) {
        reg.error_kind = ErrorKind::InvalidArgument;
        reg.error_message = "content hash is required";
        return reg;
    }

    // Serializes check-then-insert within this process; the UNIQUE
    // constraint covers other writers of the same database.
    std::lock_guard<std::mutex> lock(mutex_);

    if (auto existing = records_.find_by_hash(record.content_hash)) {
        log_info("Content %s already registered as record %lld", record.content_hash.c_str(),
                 static_cast<long long>(existing->id));
        if (metrics_) metrics_->dedup_hits().Increment();
        reg.success = true;
        reg.record = std::move(*existing);
        return reg;
    }

    auto ins = records_.insert(record);
    if (ins.inserted) {
        reg.success = true;
        reg.created = true;
        reg.record = std::move(record);
        return reg;
    }
    if (ins.hash_conflict) {
        if (auto existing = records_.get(ins.id)) {
            if (metrics_) metrics_->dedup_hits().Increment();
            reg.success = true;
            reg.record = std::move(*existing);
            return reg;
        }
    }

    reg.error_kind = ErrorKind::StorageFailure;
    reg.error_message = ins.error_message.empty() ? "record registration failed" : ins.error_message;
    return reg;
}

}  // namespace mediavault
