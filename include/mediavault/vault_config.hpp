#pragma once

#include "mediavault/chunk_store.hpp"
#include "mediavault/fetcher.hpp"
#include "mediavault/http.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace mediavault {

/// Configuration for the media vault.
struct VaultConfig {
    // Root that relative record references (source_ref, hls_ref) resolve against
    std::filesystem::path base_dir;

    // Date-partitioned roots
    std::filesystem::path media_root;   // Remote acquisitions. Default: <base_dir>/Media
    std::filesystem::path upload_root;  // Direct uploads. Default: <base_dir>/media

    // Record store
    std::filesystem::path state_dir;      // Default: <base_dir>/.mediavault
    std::filesystem::path database_path;  // Default: <state_dir>/records.db

    // Process-wide secret the artifact key is stretched from
    std::string secret;

    // Remote acquisition
    size_t request_timeout_secs = 60;
    size_t connect_timeout_secs = 10;
    int max_retries = 5;
    size_t base_delay_secs = 5;
    size_t page_delay_ms = 1000;
    std::string proxy_host;
    std::string proxy_port;
    std::string user_agent = "mediavault/1.0";
    std::string api_key;
    std::string cookie;

    // Chunking
    uint64_t chunk_size_threshold = 1024 * 1024;
    uint64_t chunk_size_large = 1024 * 1024;
    uint32_t chunk_count_small = 3;
    size_t read_chunk_size = 8192;
    size_t md5_block_size = 4096;

    // External tools and derived artifacts
    std::string transcoder = "ffmpeg";
    size_t transcoder_timeout_secs = 3600;
    size_t thumbnail_timeout_secs = 30;
    size_t hls_segment_seconds = 10;
    std::string content_endpoint = "/api/files/hls-content/";
    bool generate_thumbnails = true;
    bool auto_hls = false;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// MEDIAVAULT_* environment variables override individual options.
    void apply_env_overrides();

    /// Fill in derived paths from base_dir.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;

    /// One line per option, secrets masked.
    std::string describe() const;

    /// "http://host:port" or empty.
    std::string proxy_url() const;

    FetchPolicy fetch_policy() const;
    ChunkSizePolicy chunk_policy() const;

    HttpClientConfig http_client_config() const;

    /// Creates libcurl sessions from http_client_config().
    TransportFactory transport_factory() const;

    /// Cookie header for remote requests, when configured.
    HttpHeaders request_headers() const;

    /// Query parameters every API page request carries ("apikey").
    QueryParams api_params() const;

    /// Apply verbose and log_file. False if the log file cannot be opened.
    bool apply_logging() const;
};

}  // namespace mediavault
