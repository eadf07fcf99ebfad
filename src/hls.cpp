#include "mediavault/hls.hpp"
#include "mediavault/encoding.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"
#include "mediavault/metrics.hpp"

#include <fstream>
#include <optional>
#include <regex>
#include <sstream>

namespace mediavault {

namespace {

/// Replace each match of `re` in `text` with fn(match).
template <typename Fn>
std::string replace_matches(const std::string& text, const std::regex& re, Fn fn) {
    std::string out;
    out.reserve(text.size());
    auto last = text.cbegin();
    for (std::sregex_iterator it(text.begin(), text.end(), re), end; it != end; ++it) {
        const auto& m = *it;
        out.append(last, m[0].first);
        out += fn(m);
        last = m[0].second;
    }
    out.append(last, text.cend());
    return out;
}

std::string regex_escape(const std::string& s) {
    static const std::regex special(R"([.^$|()\[\]{}*+?\\-])");
    return std::regex_replace(s, special, R"(\$&)");
}

std::optional<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

HlsResult fail(HlsResult result, ErrorKind kind, std::string message) {
    result.success = false;
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

}  // namespace

// ============================================================================
// Endpoint and manifest rewriting
// ============================================================================

std::string HlsEndpoint::segment_url(int64_t record_id, std::string_view file_name) const {
    return base + "?id=" + std::to_string(record_id) + "&type=ts&file=" + url_encode(file_name);
}

std::string HlsEndpoint::key_url(int64_t record_id, std::string_view key_name) const {
    return base + "?id=" + std::to_string(record_id) + "&type=key&key=" + url_encode(key_name);
}

bool HlsEndpoint::is_endpoint_url(std::string_view uri) const {
    return uri.starts_with(base + "?");
}

std::string mark_encrypted_segments(const std::string& manifest, const std::string& run_id,
                                    std::vector<std::string>* segments) {
    std::regex seg_re("hls_seg_" + regex_escape(run_id) + R"(_(\d+)\.ts)");
    return replace_matches(manifest, seg_re, [&](const std::smatch& m) {
        if (segments) segments->push_back(m.str(0));
        return m.str(0) + ".enc";
    });
}

std::string rewrite_key_uris(const std::string& manifest, const HlsEndpoint& endpoint,
                             int64_t record_id) {
    static const std::regex key_re(R"re(URI="([^"]+)")re", std::regex::icase);
    return replace_matches(manifest, key_re, [&](const std::smatch& m) {
        std::string uri = m.str(1);
        if (endpoint.is_endpoint_url(uri)) return m.str(0);
        if (!uri.starts_with("http://") && !uri.starts_with("https://")) {
            auto key_name = std::filesystem::path(uri).filename().string();
            return "URI=\"" + endpoint.key_url(record_id, key_name) + "\"";
        }
        return m.str(0);
    });
}

std::string rewrite_segment_refs(const std::string& manifest, const HlsEndpoint& endpoint,
                                 int64_t record_id) {
    static const std::regex ts_re(R"(([a-zA-Z0-9_\-]+\.ts)(\.enc)?)", std::regex::icase);
    return replace_matches(manifest, ts_re, [&](const std::smatch& m) {
        return endpoint.segment_url(record_id, m.str(1));
    });
}

const char* hls_stage_name(HlsStage stage) {
    switch (stage) {
        case HlsStage::Pending: return "pending";
        case HlsStage::SourceAssembled: return "source_assembled";
        case HlsStage::Transcoded: return "transcoded";
        case HlsStage::SegmentsEncrypted: return "segments_encrypted";
        case HlsStage::ManifestRewritten: return "manifest_rewritten";
        case HlsStage::Published: return "published";
    }
    return "pending";
}

// ============================================================================
// HlsSegmenter
// ============================================================================

HlsSegmenter::HlsSegmenter(const CipherStream& cipher, ProcessRunner& runner,
                           HlsOptions options, HlsEndpoint endpoint,
                           std::filesystem::path base_dir)
    : cipher_(cipher)
    , runner_(runner)
    , options_(std::move(options))
    , endpoint_(std::move(endpoint))
    , base_dir_(std::move(base_dir)) {}

HlsResult HlsSegmenter::convert(const MediaRecord& record, const ChunkLocation& location) {
    HlsResult result;
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->transcode_duration());

    auto run_id = make_uuid();
    auto temp_dir = options_.temp_dir.empty() ? std::filesystem::temp_directory_path()
                                              : options_.temp_dir;
    std::string ext = record.type.empty() || record.type == "unknown" ? "" : "." + record.type;
    TempFileGuard source(temp_dir / ("mediavault_hls_" + run_id + ext));

    // --- SourceAssembled ---
    Status st = assembler_.concat_to_file(location.chunk_paths(), source.path());
    if (!st.ok()) {
        if (metrics_) metrics_->hls_failure().Increment();
        return fail(result, st.kind, "cannot assemble source of record " +
                                         std::to_string(record.id) + ": " + st.message);
    }
    result.stage = HlsStage::SourceAssembled;

    auto hls_dir = location.storage_dir / "HLS";
    std::error_code ec;
    std::filesystem::create_directories(hls_dir, ec);
    if (ec) {
        log_error("Cannot create %s: %s", hls_dir.c_str(), ec.message().c_str());
        if (metrics_) metrics_->hls_failure().Increment();
        return fail(result, ErrorKind::StorageFailure, "cannot create HLS directory");
    }

    auto manifest_path = hls_dir / ("hls_" + run_id + ".m3u8");
    auto segment_pattern = hls_dir / ("hls_seg_" + run_id + "_%03d.ts");

    // --- Transcoded ---
    std::vector<std::string> argv = {
        options_.transcoder,
        "-i", source.path().string(),
        "-c:v", "libx264",
        "-c:a", "aac",
        "-hls_time", std::to_string(options_.segment_seconds),
        "-hls_list_size", "0",
        "-hls_segment_filename", segment_pattern.string(),
        "-f", "hls",
        manifest_path.string(),
    };
    log_info("Transcoding record %lld to HLS (run %s)", static_cast<long long>(record.id),
             run_id.c_str());
    auto proc = runner_.run(argv, options_.timeout);

    auto abandon = [&](ErrorKind kind, std::string message) {
        remove_run_outputs(hls_dir, run_id);
        if (metrics_) metrics_->hls_failure().Increment();
        return fail(result, kind, std::move(message));
    };

    if (!proc.launched) {
        return abandon(ErrorKind::ExternalToolUnavailable, "transcoder is not available");
    }
    if (proc.timed_out) {
        return abandon(ErrorKind::ExternalToolFailed, "transcoding timed out");
    }
    if (proc.exit_code != 0) {
        log_error("Transcoder exited with %d: %s", proc.exit_code, proc.stderr_output.c_str());
        return abandon(ErrorKind::ExternalToolFailed,
                       "transcoder exited with status " + std::to_string(proc.exit_code));
    }

    auto manifest = read_text(manifest_path);
    if (!manifest) {
        return abandon(ErrorKind::ExternalToolFailed, "transcoder produced no playlist");
    }
    result.stage = HlsStage::Transcoded;

    // --- SegmentsEncrypted ---
    std::vector<std::string> segments;
    std::string rewritten = mark_encrypted_segments(*manifest, run_id, &segments);
    for (const auto& name : segments) {
        auto seg_path = hls_dir / name;
        if (!std::filesystem::exists(seg_path, ec)) {
            log_warn("Playlist references missing segment %s", name.c_str());
            continue;
        }
        st = cipher_.transform_file(seg_path);
        if (!st.ok()) {
            return abandon(ErrorKind::StorageFailure, "cannot encrypt segment " + name);
        }
        ++result.segments;
    }
    result.stage = HlsStage::SegmentsEncrypted;

    // --- ManifestRewritten ---
    rewritten = rewrite_key_uris(rewritten, endpoint_, record.id);
    auto encrypted_path = manifest_path;
    encrypted_path += ".enc";
    st = cipher_.write_token_file(encrypted_path,
                                  {reinterpret_cast<const uint8_t*>(rewritten.data()),
                                   rewritten.size()});
    if (!st.ok()) {
        return abandon(ErrorKind::StorageFailure, "cannot write encrypted playlist");
    }
    std::filesystem::remove(manifest_path, ec);
    result.stage = HlsStage::ManifestRewritten;

    // --- Published ---
    result.hls_ref = relative_ref(encrypted_path);
    result.stage = HlsStage::Published;
    result.success = true;
    if (metrics_) metrics_->hls_success().Increment();
    log_info("HLS ready for record %lld: %zu segments", static_cast<long long>(record.id),
             result.segments);
    return result;
}

HlsResult HlsSegmenter::convert_record(RecordStore& records, int64_t record_id) {
    HlsResult result;
    auto record = records.get(record_id);
    if (!record || record->status == RecordStatus::Deleted) {
        return fail(result, ErrorKind::NotFound, "record " + std::to_string(record_id) + " not found");
    }
    if (!is_video_media(record->mime, record->type)) {
        return fail(result, ErrorKind::InvalidArgument,
                    "record " + std::to_string(record_id) + " is not a video");
    }
    if (!record->hls_ref.empty()) {
        result.success = true;
        result.reused = true;
        result.stage = HlsStage::Published;
        result.hls_ref = record->hls_ref;
        return result;
    }

    auto location = resolve_location(*record, base_dir_);
    if (!location || location->chunks.empty()) {
        return fail(result, ErrorKind::ChunkMissing,
                    "no stored chunks for record " + std::to_string(record_id));
    }

    result = convert(*record, *location);
    if (!result.success) return result;

    record->hls_ref = result.hls_ref;
    record->updated_time = format_timestamp();
    if (!records.update(*record)) {
        return fail(result, ErrorKind::StorageFailure, "cannot store playlist reference");
    }
    return result;
}

size_t HlsSegmenter::remove_artifacts(const std::filesystem::path& manifest_path) {
    size_t removed = 0;
    std::error_code ec;
    if (std::filesystem::remove(manifest_path, ec)) ++removed;

    static const std::regex name_re(R"(hls_([A-Fa-f0-9-]+)\.m3u8\.enc)");
    std::smatch m;
    std::string name = manifest_path.filename().string();
    if (!std::regex_match(name, m, name_re)) return removed;
    std::string prefix = "hls_seg_" + m.str(1) + "_";

    // Segments sit beside the manifest; older runs wrote them to the parent
    for (const auto& dir : {manifest_path.parent_path(), manifest_path.parent_path().parent_path()}) {
        std::vector<std::filesystem::path> doomed;
        for (auto it = std::filesystem::directory_iterator(dir, ec);
             !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
            auto entry_name = it->path().filename().string();
            if (entry_name.starts_with(prefix) && entry_name.ends_with(".ts")) {
                doomed.push_back(it->path());
            }
        }
        ec.clear();
        for (const auto& path : doomed) {
            if (std::filesystem::remove(path, ec)) ++removed;
        }
    }
    return removed;
}

void HlsSegmenter::remove_run_outputs(const std::filesystem::path& hls_dir,
                                      const std::string& run_id) {
    std::error_code ec;
    auto manifest = hls_dir / ("hls_" + run_id + ".m3u8");
    std::filesystem::remove(manifest, ec);
    auto encrypted = manifest;
    encrypted += ".enc";
    remove_artifacts(encrypted);
}

std::string HlsSegmenter::relative_ref(const std::filesystem::path& path) const {
    auto rel = path.lexically_relative(base_dir_);
    if (rel.empty() || rel.begin()->string() == "..") return path.generic_string();
    return rel.generic_string();
}

}  // namespace mediavault
