#include "mediavault/metrics.hpp"
#include "mediavault/fetcher.hpp"
#include "mediavault/record_store.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace mediavault {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& fetch_family = prometheus::BuildCounter()
        .Name("mediavault_fetch_attempts_total")
        .Help("HTTP fetch attempts by outcome")
        .Labels(labels)
        .Register(*registry_);
    fetch_ok_ = &fetch_family.Add({{"outcome", "ok"}});
    fetch_timeout_ = &fetch_family.Add({{"outcome", "timeout"}});
    fetch_connection_ = &fetch_family.Add({{"outcome", "connection"}});
    fetch_server_error_ = &fetch_family.Add({{"outcome", "server_error"}});
    fetch_client_error_ = &fetch_family.Add({{"outcome", "client_error"}});
    fetch_auth_challenge_ = &fetch_family.Add({{"outcome", "auth_challenge"}});
    fetch_decode_error_ = &fetch_family.Add({{"outcome", "decode_error"}});
    fetch_cancelled_ = &fetch_family.Add({{"outcome", "cancelled"}});

    fetch_retries_ = &prometheus::BuildCounter()
        .Name("mediavault_fetch_retries_total")
        .Help("Backoff retries scheduled")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    session_resets_ = &prometheus::BuildCounter()
        .Name("mediavault_session_resets_total")
        .Help("HTTP sessions discarded after a 403 challenge")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& pages_family = prometheus::BuildCounter()
        .Name("mediavault_pages_total")
        .Help("Harvested pages by result")
        .Labels(labels)
        .Register(*registry_);
    pages_success_ = &pages_family.Add({{"result", "success"}});
    pages_failure_ = &pages_family.Add({{"result", "failure"}});

    chunks_written_ = &prometheus::BuildCounter()
        .Name("mediavault_chunks_written_total")
        .Help("Chunk files written")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    ingest_bytes_total_ = &prometheus::BuildCounter()
        .Name("mediavault_ingest_bytes_total")
        .Help("Payload bytes stored as chunks")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    acquisitions_skipped_ = &prometheus::BuildCounter()
        .Name("mediavault_acquisitions_skipped_total")
        .Help("Acquisitions skipped because the chunk set already existed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    dedup_hits_ = &prometheus::BuildCounter()
        .Name("mediavault_dedup_hits_total")
        .Help("Ingestions short-circuited by content hash")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& merges_family = prometheus::BuildCounter()
        .Name("mediavault_merges_total")
        .Help("Upload merges by terminal state")
        .Labels(labels)
        .Register(*registry_);
    merges_registered_ = &merges_family.Add({{"result", "registered"}});
    merges_rejected_ = &merges_family.Add({{"result", "rejected"}});

    hook_failures_ = &prometheus::BuildCounter()
        .Name("mediavault_hook_failures_total")
        .Help("Post-registration hooks that failed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& hls_family = prometheus::BuildCounter()
        .Name("mediavault_hls_conversions_total")
        .Help("HLS conversions by result")
        .Labels(labels)
        .Register(*registry_);
    hls_success_ = &hls_family.Add({{"result", "success"}});
    hls_failure_ = &hls_family.Add({{"result", "failure"}});

    // --- Gauges ---

    records_total_ = &prometheus::BuildGauge()
        .Name("mediavault_records")
        .Help("Media records in the record store")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    fetch_duration_ = &prometheus::BuildHistogram()
        .Name("mediavault_fetch_duration_seconds")
        .Help("Single fetch attempt duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});

    merge_duration_ = &prometheus::BuildHistogram()
        .Name("mediavault_merge_duration_seconds")
        .Help("Upload merge duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30, 60});

    transcode_duration_ = &prometheus::BuildHistogram()
        .Name("mediavault_transcode_duration_seconds")
        .Help("HLS transcode duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            1, 5, 10, 30, 60, 120, 300, 600, 1800, 3600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::record_fetch_attempt(FailureClass failure) {
    switch (failure) {
        case FailureClass::None: fetch_ok_->Increment(); break;
        case FailureClass::Timeout: fetch_timeout_->Increment(); break;
        case FailureClass::Connection: fetch_connection_->Increment(); break;
        case FailureClass::ServerError: fetch_server_error_->Increment(); break;
        case FailureClass::ClientError: fetch_client_error_->Increment(); break;
        case FailureClass::AuthChallenge: fetch_auth_challenge_->Increment(); break;
        case FailureClass::DecodeError: fetch_decode_error_->Increment(); break;
        case FailureClass::Cancelled: fetch_cancelled_->Increment(); break;
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (records_) {
        records_total_->Set(static_cast<double>(records_->count()));
    }
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;

    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace mediavault
