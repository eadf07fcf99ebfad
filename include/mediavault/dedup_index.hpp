#pragma once

#include "mediavault/errors.hpp"
#include "mediavault/record_store.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace mediavault {

class MetricsExporter;

struct Registration {
    bool success = false;
    bool created = false;  // false: an existing record was returned
    MediaRecord record;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

/// Content-hash existence check guarding every registration.
///
/// Hashes of deleted records still count: re-ingesting deleted content
/// returns the deleted record rather than creating a second one.
class DedupIndex {
public:
    explicit DedupIndex(RecordStore& records) : records_(records) {}

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    std::optional<MediaRecord> exists_by_hash(const std::string& content_hash);

    /// Insert `record` unless its hash is already known, in which case the
    /// existing record is returned with created == false.
    Registration register_record(MediaRecord record);

    RecordStore& records() { return records_; }

private:
    RecordStore& records_;
    MetricsExporter* metrics_ = nullptr;
    std::mutex mutex_;
};

/// Lowercase, surrounding whitespace removed.
std::string normalize_hash(const std::string& hash);

}  // namespace mediavault
