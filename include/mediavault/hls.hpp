#pragma once

#include "mediavault/assembler.hpp"
#include "mediavault/cipher.hpp"
#include "mediavault/errors.hpp"
#include "mediavault/process.hpp"
#include "mediavault/record_store.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mediavault {

class MetricsExporter;

/// Indirection endpoint that playlist references are routed through.
struct HlsEndpoint {
    std::string base = "/api/files/hls-content/";

    std::string segment_url(int64_t record_id, std::string_view file_name) const;
    std::string key_url(int64_t record_id, std::string_view key_name) const;

    /// True if `uri` already points at this endpoint.
    bool is_endpoint_url(std::string_view uri) const;
};

// --- Manifest rewriting ---

/// Append ".enc" to every "hls_seg_{run_id}_NNN.ts" reference. Collects the
/// referenced segment names (in manifest order) into `segments` when given.
std::string mark_encrypted_segments(const std::string& manifest, const std::string& run_id,
                                    std::vector<std::string>* segments = nullptr);

/// Route local or relative key URIs (URI="...") through the endpoint.
/// Absolute http(s) URIs and URIs already on the endpoint are unchanged.
std::string rewrite_key_uris(const std::string& manifest, const HlsEndpoint& endpoint,
                             int64_t record_id);

/// Route every "name.ts[.enc]" segment reference through the endpoint.
std::string rewrite_segment_refs(const std::string& manifest, const HlsEndpoint& endpoint,
                                 int64_t record_id);

enum class HlsStage {
    Pending,
    SourceAssembled,
    Transcoded,
    SegmentsEncrypted,
    ManifestRewritten,
    Published
};

const char* hls_stage_name(HlsStage stage);

struct HlsOptions {
    std::string transcoder = "ffmpeg";
    std::chrono::seconds timeout{3600};
    size_t segment_seconds = 10;
    std::filesystem::path temp_dir;  // empty: system temp directory
};

struct HlsResult {
    bool success = false;
    bool reused = false;     // record already had a manifest
    HlsStage stage = HlsStage::Pending;  // last stage reached
    std::string hls_ref;     // manifest path relative to base_dir
    size_t segments = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

/// Transcodes a record into encrypted HLS artifacts:
///   {storage}/HLS/hls_{uuid}.m3u8.enc  base64 of the XORed, rewritten manifest
///   {storage}/HLS/hls_seg_{uuid}_NNN.ts  XORed in place, names unchanged
///
/// The assembled source goes to a temp file that is removed on every exit
/// path. A failed run also removes whatever the transcoder produced.
class HlsSegmenter {
public:
    HlsSegmenter(const CipherStream& cipher, ProcessRunner& runner, HlsOptions options,
                 HlsEndpoint endpoint, std::filesystem::path base_dir);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Run the pipeline for `record`, whose chunks live at `location`.
    /// Does not touch the record store.
    HlsResult convert(const MediaRecord& record, const ChunkLocation& location);

    /// Guards (unknown id, non-video, existing manifest), conversion, and
    /// storing the manifest reference on the record.
    HlsResult convert_record(RecordStore& records, int64_t record_id);

    /// Delete a record's manifest and its run's segments. Returns files removed.
    static size_t remove_artifacts(const std::filesystem::path& manifest_path);

private:
    void remove_run_outputs(const std::filesystem::path& hls_dir, const std::string& run_id);
    std::string relative_ref(const std::filesystem::path& path) const;

    const CipherStream& cipher_;
    ProcessRunner& runner_;
    HlsOptions options_;
    HlsEndpoint endpoint_;
    std::filesystem::path base_dir_;
    Assembler assembler_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace mediavault
