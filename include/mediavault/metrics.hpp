#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace mediavault {

class RecordStore;
enum class FailureClass;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports mediavault metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Record store snapshotted into the records gauge (not owned).
    void set_record_store(RecordStore* records) { records_ = records; }

    void start();

    /// Stop the writer thread (writes one final snapshot).
    void stop();

    void record_fetch_attempt(FailureClass failure);

    // --- Counter accessors ---
    prometheus::Counter& fetch_retries() { return *fetch_retries_; }
    prometheus::Counter& session_resets() { return *session_resets_; }
    prometheus::Counter& pages_success() { return *pages_success_; }
    prometheus::Counter& pages_failure() { return *pages_failure_; }
    prometheus::Counter& chunks_written() { return *chunks_written_; }
    prometheus::Counter& ingest_bytes_total() { return *ingest_bytes_total_; }
    prometheus::Counter& acquisitions_skipped() { return *acquisitions_skipped_; }
    prometheus::Counter& dedup_hits() { return *dedup_hits_; }
    prometheus::Counter& merges_registered() { return *merges_registered_; }
    prometheus::Counter& merges_rejected() { return *merges_rejected_; }
    prometheus::Counter& hook_failures() { return *hook_failures_; }
    prometheus::Counter& hls_success() { return *hls_success_; }
    prometheus::Counter& hls_failure() { return *hls_failure_; }

    // --- Histogram accessors ---
    prometheus::Histogram& fetch_duration() { return *fetch_duration_; }
    prometheus::Histogram& merge_duration() { return *merge_duration_; }
    prometheus::Histogram& transcode_duration() { return *transcode_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    RecordStore* records_ = nullptr;

    // --- Counters ---
    prometheus::Counter* fetch_ok_;
    prometheus::Counter* fetch_timeout_;
    prometheus::Counter* fetch_connection_;
    prometheus::Counter* fetch_server_error_;
    prometheus::Counter* fetch_client_error_;
    prometheus::Counter* fetch_auth_challenge_;
    prometheus::Counter* fetch_decode_error_;
    prometheus::Counter* fetch_cancelled_;
    prometheus::Counter* fetch_retries_;
    prometheus::Counter* session_resets_;
    prometheus::Counter* pages_success_;
    prometheus::Counter* pages_failure_;
    prometheus::Counter* chunks_written_;
    prometheus::Counter* ingest_bytes_total_;
    prometheus::Counter* acquisitions_skipped_;
    prometheus::Counter* dedup_hits_;
    prometheus::Counter* merges_registered_;
    prometheus::Counter* merges_rejected_;
    prometheus::Counter* hook_failures_;
    prometheus::Counter* hls_success_;
    prometheus::Counter* hls_failure_;

    // --- Gauges ---
    prometheus::Gauge* records_total_;

    // --- Histograms ---
    prometheus::Histogram* fetch_duration_;
    prometheus::Histogram* merge_duration_;
    prometheus::Histogram* transcode_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace mediavault
