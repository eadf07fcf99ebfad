#include "mediavault/ingest.hpp"
#include "mediavault/assembler.hpp"
#include "mediavault/encoding.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"
#include "mediavault/metrics.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace mediavault {

namespace {

std::string json_string(const nlohmann::json& body, const char* key,
                        const std::string& fallback = {}) {
    if (!body.contains(key) || body[key].is_null()) return fallback;
    const auto& v = body[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    return fallback;
}

bool parse_flag(const nlohmann::json& value, bool fallback) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number()) return value.get<double>() != 0;
    if (value.is_string()) {
        auto s = value.get<std::string>();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "true" || s == "1" || s == "yes";
    }
    return fallback;
}

/// Strip a "data:image/...;base64," prefix if the client sent a data URL.
std::string_view strip_data_url(std::string_view text) {
    if (text.starts_with("data:")) {
        auto comma = text.find(',');
        if (comma != std::string_view::npos) return text.substr(comma + 1);
    }
    return text;
}

std::optional<std::vector<uint8_t>> read_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

MergeResult reject(MergeResult result, ErrorKind kind, std::string message) {
    result.success = false;
    result.state = MergeState::Rejected;
    result.trail.push_back(MergeState::Rejected);
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

}  // namespace

// --- MergeRequest ---

MergeRequest MergeRequest::from_json(const nlohmann::json& body) {
    MergeRequest req;
    if (!body.is_object()) return req;
    req.content_hash = json_string(body, "file_md5");
    req.name = json_string(body, "file_name");
    if (body.contains("file_size") && body["file_size"].is_number_unsigned()) {
        req.declared_size = body["file_size"].get<uint64_t>();
    } else if (body.contains("file_size") && body["file_size"].is_number_integer()) {
        req.declared_size = static_cast<uint64_t>(std::max<int64_t>(0, body["file_size"].get<int64_t>()));
    }
    if (body.contains("chunks") && body["chunks"].is_array()) {
        for (const auto& c : body["chunks"]) {
            if (!c.is_object()) continue;
            DeclaredChunk chunk;
            if (c.contains("chunk_index") && c["chunk_index"].is_number_integer()) {
                chunk.index = static_cast<uint32_t>(std::max<int64_t>(0, c["chunk_index"].get<int64_t>()));
            }
            chunk.chunk_uuid = json_string(c, "chunk_uuid");
            req.chunks.push_back(std::move(chunk));
        }
    }
    req.album = json_string(body, "album");
    req.subject = json_string(body, "subject");
    req.author = json_string(body, "author");
    req.level = json_string(body, "level", "General");
    req.remark = json_string(body, "remark");
    if (body.contains("generate_thumbnail")) {
        req.generate_thumbnail = parse_flag(body["generate_thumbnail"], true);
    }
    req.thumbnail_base64 = json_string(body, "thumbnail_base64");
    return req;
}

const char* merge_state_name(MergeState state) {
    switch (state) {
        case MergeState::Received: return "received";
        case MergeState::Merged: return "merged";
        case MergeState::Verified: return "verified";
        case MergeState::Registered: return "registered";
        case MergeState::Rejected: return "rejected";
    }
    return "received";
}

// ============================================================================
// Hooks
// ============================================================================

ThumbnailHook::ThumbnailHook(const CipherStream& cipher, ProcessRunner& runner,
                             std::string extractor, std::chrono::seconds timeout)
    : cipher_(cipher)
    , runner_(runner)
    , extractor_(std::move(extractor))
    , timeout_(timeout) {}

Status ThumbnailHook::run(HookContext& ctx) {
    if (!ctx.request.generate_thumbnail) return Status::success();

    if (!ctx.request.thumbnail_base64.empty()) {
        auto image = base64_decode(strip_data_url(ctx.request.thumbnail_base64));
        if (image && !image->empty()) {
            Status st = store(ctx, *image);
            if (st.ok()) return st;
            log_warn("Client thumbnail for record %lld not stored: %s",
                     static_cast<long long>(ctx.record.id), st.message.c_str());
        } else {
            log_warn("Client thumbnail for record %lld is not valid base64",
                     static_cast<long long>(ctx.record.id));
        }
    }

    bool image = is_image_media(ctx.record.mime, ctx.record.type);
    bool video = is_video_media(ctx.record.mime, ctx.record.type);
    if (!image && !video) {
        log_debug("Record %lld is neither image nor video, no thumbnail",
                  static_cast<long long>(ctx.record.id));
        return Status::success();
    }
    return extract(ctx, video && !image);
}

Status ThumbnailHook::store(HookContext& ctx, std::span<const uint8_t> image) {
    std::string file_name = "thumb_" + make_uuid() + ".enc";
    Status st = cipher_.write_token_file(ctx.location.storage_dir / file_name, image);
    if (!st.ok()) return st;
    ctx.record.thumbnail_ref = file_name;
    log_info("Stored thumbnail for record %lld (%zu bytes)",
             static_cast<long long>(ctx.record.id), image.size());
    return Status::success();
}

Status ThumbnailHook::extract(HookContext& ctx, bool video) {
    TempFileGuard frame(std::filesystem::temp_directory_path() /
                        ("mediavault_thumb_" + make_uuid() + ".jpg"));

    std::vector<std::string> argv = {extractor_, "-i", ctx.merged_file.string()};
    if (video) {
        argv.insert(argv.end(), {"-ss", "00:00:01"});
    }
    argv.insert(argv.end(), {"-vframes", "1", "-vf", "scale=300:-1", "-y", frame.path().string()});

    auto proc = runner_.run(argv, timeout_);
    if (!proc.launched) {
        return Status::failure(ErrorKind::ExternalToolUnavailable, "frame extractor is not available");
    }
    if (proc.timed_out) {
        return Status::failure(ErrorKind::ExternalToolFailed, "thumbnail extraction timed out");
    }
    if (proc.exit_code != 0) {
        log_error("Frame extractor exited with %d: %s", proc.exit_code, proc.stderr_output.c_str());
        return Status::failure(ErrorKind::ExternalToolFailed,
                               "frame extractor exited with status " + std::to_string(proc.exit_code));
    }

    auto image = read_binary(frame.path());
    if (!image || image->empty()) {
        return Status::failure(ErrorKind::ExternalToolFailed, "frame extractor produced no image");
    }
    return store(ctx, *image);
}

Status HlsHook::run(HookContext& ctx) {
    if (!is_video_media(ctx.record.mime, ctx.record.type)) return Status::success();
    auto result = segmenter_.convert(ctx.record, ctx.location);
    if (!result.success) return Status::failure(result.error_kind, result.error_message);
    ctx.record.hls_ref = result.hls_ref;
    return Status::success();
}

// ============================================================================
// IngestionPipeline
// ============================================================================

IngestionPipeline::IngestionPipeline(VaultConfig config, RetryingFetcher& fetcher,
                                     ChunkStore& store, DedupIndex& dedup)
    : config_(std::move(config))
    , fetcher_(fetcher)
    , store_(store)
    , dedup_(dedup) {}

void IngestionPipeline::add_hook(std::unique_ptr<PostRegistrationHook> hook) {
    hooks_.push_back(std::move(hook));
}

// --- Remote acquisition ---

AcquireResult IngestionPipeline::acquire(const AcquireRequest& request,
                                         const CancellationToken* cancel) {
    AcquireResult result;
    if (!is_safe_component(request.file_id)) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error_message = "invalid file id";
        return result;
    }
    if (request.url.empty()) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error_message = "no URL for " + request.file_id;
        return result;
    }

    std::string ext = request.extension.empty() ? extension_from_url(request.url)
                                                : request.extension;

    if (store_.exists(request.base_dir, request.file_id)) {
        result.success = true;
        result.skipped = true;
        result.chunk_count = store_.count_existing(request.base_dir, request.file_id);
        log_info("Chunk set %s already exists, skipping download", request.file_id.c_str());
        if (metrics_) metrics_->acquisitions_skipped().Increment();
        if (request.register_record) register_acquired(request, result);
        return result;
    }

    auto writer = store_.open_writer(request.base_dir, request.file_id, cancel);
    Md5Hasher hasher;
    Status sink_status;

    HttpBodySink sink;
    sink.on_start = [&](int, const HttpHeaders& headers) {
        hasher.finish();  // discard anything from an earlier attempt
        sink_status = writer->begin(headers.content_length());
        return sink_status.ok();
    };
    sink.on_data = [&](const uint8_t* data, size_t len) {
        hasher.update(data, len);
        sink_status = writer->append(data, len);
        return sink_status.ok();
    };
    auto on_retry = [&]() {
        writer->abort();
        sink_status = Status::success();
    };

    log_info("Downloading chunk set %s", request.file_id.c_str());
    auto fetched = fetcher_.fetch_stream(request.url, request.headers, sink, on_retry, cancel);
    result.attempts = fetched.attempts;

    if (!fetched.success) {
        writer->abort();
        if (!sink_status.ok()) {
            result.error_kind = sink_status.kind;
            result.error_message = sink_status.message;
        } else {
            result.error_kind = fetched.error_kind;
            result.error_message = "download of " + request.file_id + " failed: " +
                                   fetched.error_message;
        }
        return result;
    }

    auto written = writer->commit(ext);
    if (!written.success) {
        result.error_kind = written.error_kind;
        result.error_message = written.error_message;
        return result;
    }
    result.content_hash = hasher.finish();
    result.chunk_count = written.chunk_count;
    result.bytes = written.bytes_written;

    if (!request.expected_hash.empty() &&
        normalize_hash(request.expected_hash) != result.content_hash) {
        store_.remove_set(request.base_dir, request.file_id);
        result.error_kind = ErrorKind::HashMismatch;
        result.error_message = "content hash mismatch for " + request.file_id;
        return result;
    }

    result.success = true;
    if (request.register_record) register_acquired(request, result);
    return result;
}

void IngestionPipeline::register_acquired(const AcquireRequest& request, AcquireResult& result) {
    if (result.content_hash.empty()) {
        auto hash = hash_existing_set(request.base_dir, request.file_id, &result.bytes);
        if (!hash) {
            result.success = false;
            result.error_kind = ErrorKind::ChunkMissing;
            result.error_message = "cannot hash stored set " + request.file_id;
            return;
        }
        result.content_hash = *hash;
    }

    MediaRecord record;
    record.name = request.name.empty() ? request.file_id : request.name;
    record.content_hash = result.content_hash;
    record.size = result.bytes;
    std::string ext = Assembler::resolve_extension(request.base_dir, request.file_id);
    record.type = file_type_for_name(ext);
    record.mime = mime_for_extension(ext);
    record.status = RecordStatus::Enabled;

    ChunkListRef ref;
    uint32_t count = store_.count_existing(request.base_dir, request.file_id);
    for (uint32_t i = 0; i < count; ++i) {
        ref.chunks.push_back(chunk_path({}, request.file_id, i).string());
    }
    ref.storage_dir = request.base_dir.string();
    ref.time_str = date_partition();
    record.storage = std::move(ref);
    record.source_ref = relative_ref(request.base_dir);

    auto reg = dedup_.register_record(std::move(record));
    if (!reg.success) {
        result.success = false;
        result.error_kind = reg.error_kind;
        result.error_message = reg.error_message;
        return;
    }
    if (!reg.created) {
        result.duplicate = true;
        // Same content is already stored elsewhere; drop the copy just written
        if (!result.skipped) {
            auto existing = resolve_location(reg.record, config_.base_dir);
            if (!existing || existing->storage_dir != request.base_dir) {
                store_.remove_set(request.base_dir, request.file_id);
            }
        }
    }
    result.record = std::move(reg.record);
}

std::optional<std::string> IngestionPipeline::hash_existing_set(
    const std::filesystem::path& base, const std::string& file_id, uint64_t* size) const {
    Assembler assembler(config_.md5_block_size);
    Md5Hasher hasher;
    uint64_t total = 0;
    Status st = assembler.stream(base, file_id, [&](const uint8_t* data, size_t len) {
        hasher.update(data, len);
        total += len;
        return true;
    });
    if (size) *size = total;
    if (!st.ok()) return std::nullopt;
    return hasher.finish();
}

BatchResult IngestionPipeline::acquire_variants(const std::string& file_id,
                                                const std::vector<VariantSpec>& variants,
                                                const HttpHeaders& headers,
                                                const CancellationToken* cancel) {
    BatchResult batch;
    for (const auto& variant : variants) {
        if (is_cancelled(cancel)) {
            batch.record_failure(ErrorKind::Cancelled, variant.name, "acquisition cancelled");
            continue;
        }
        if (variant.url.empty()) {
            batch.record_failure(ErrorKind::InvalidArgument, variant.name, "no URL for variant");
            continue;
        }
        if (!is_safe_component(variant.name)) {
            batch.record_failure(ErrorKind::InvalidArgument, variant.name, "invalid variant name");
            continue;
        }

        auto dir = find_in_date_dirs(config_.media_root, file_id, variant.name)
                       .value_or(partition_dir(config_.media_root, file_id, variant.name));

        AcquireRequest req;
        req.url = variant.url;
        req.base_dir = dir;
        req.file_id = file_id;
        req.extension = variant.extension;
        req.headers = headers;
        auto acquired = acquire(req, cancel);
        if (acquired.success) {
            batch.record_success();
        } else {
            batch.record_failure(acquired.error_kind, variant.name, acquired.error_message);
        }
    }
    log_info("Variants of %s: %zu stored, %zu failed", file_id.c_str(), batch.success_count,
             batch.failed_count);
    return batch;
}

// --- Direct upload ---

ChunkReceipt IngestionPipeline::receive_chunk(const std::string& content_hash,
                                              std::string chunk_uuid,
                                              std::span<const uint8_t> data) {
    ChunkReceipt receipt;
    auto hash = normalize_hash(content_hash);
    if (hash.empty()) {
        receipt.error_kind = ErrorKind::InvalidArgument;
        receipt.error_message = "content hash is required";
        return receipt;
    }
    if (!is_safe_component(hash)) {
        receipt.error_kind = ErrorKind::InvalidArgument;
        receipt.error_message = "invalid content hash";
        return receipt;
    }
    if (chunk_uuid.empty()) chunk_uuid = make_uuid();

    auto dir = partition_dir(config_.upload_root, hash);
    Status st = store_.write_direct(dir, chunk_uuid, data);
    if (!st.ok()) {
        receipt.error_kind = st.kind;
        receipt.error_message = st.message;
        return receipt;
    }
    receipt.success = true;
    receipt.chunk_uuid = std::move(chunk_uuid);
    log_debug("Received chunk %s of %s (%zu bytes)", receipt.chunk_uuid.c_str(), hash.c_str(),
              data.size());
    return receipt;
}

MergeResult IngestionPipeline::merge(const MergeRequest& request) {
    MergeResult result;
    result.trail.push_back(MergeState::Received);

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->merge_duration());
    auto rejected = [&](ErrorKind kind, std::string message) {
        if (metrics_) metrics_->merges_rejected().Increment();
        log_warn("Merge of %s rejected: %s", request.content_hash.c_str(), message.c_str());
        return reject(result, kind, std::move(message));
    };

    auto hash = normalize_hash(request.content_hash);
    if (hash.empty() || request.name.empty() || request.chunks.empty()) {
        return rejected(ErrorKind::InvalidArgument, "content hash, name and chunks are required");
    }
    if (!is_safe_component(hash)) {
        return rejected(ErrorKind::InvalidArgument, "invalid content hash");
    }

    if (auto existing = dedup_.exists_by_hash(hash)) {
        result.success = true;
        result.exists = true;
        result.state = MergeState::Registered;
        result.trail.push_back(MergeState::Registered);
        result.record = std::move(*existing);
        if (metrics_) metrics_->dedup_hits().Increment();
        log_info("Content %s already registered as record %lld", hash.c_str(),
                 static_cast<long long>(result.record.id));
        return result;
    }

    auto storage_dir = find_in_date_dirs(config_.upload_root, hash);
    if (!storage_dir) {
        return rejected(ErrorKind::ChunkMissing, "no uploaded chunks for " + hash);
    }

    // --- Merged ---
    auto declared = request.chunks;
    std::stable_sort(declared.begin(), declared.end(),
                     [](const DeclaredChunk& a, const DeclaredChunk& b) { return a.index < b.index; });

    ChunkLocation location;
    location.storage_dir = *storage_dir;
    std::error_code ec;
    for (const auto& chunk : declared) {
        if (!is_safe_component(chunk.chunk_uuid) ||
            !std::filesystem::is_regular_file(*storage_dir / chunk.chunk_uuid, ec)) {
            return rejected(ErrorKind::ChunkMissing,
                            "chunk " + std::to_string(chunk.index) + " is missing");
        }
        location.chunks.push_back(chunk.chunk_uuid);
    }

    TempFileGuard merged(*storage_dir / (".merge_" + make_uuid()));
    Assembler assembler(config_.read_chunk_size);
    Status st = assembler.concat_to_file(location.chunk_paths(), merged.path());
    if (!st.ok()) return rejected(st.kind, st.message);
    result.state = MergeState::Merged;
    result.trail.push_back(MergeState::Merged);

    // --- Verified ---
    auto actual = md5_file(merged.path(), config_.md5_block_size);
    if (!actual) {
        return rejected(ErrorKind::StorageFailure, "cannot read merged payload");
    }
    if (*actual != hash) {
        // The merged file goes with the guard; uploaded pieces stay for a retry
        return rejected(ErrorKind::HashMismatch, "content hash mismatch for " + hash);
    }
    result.state = MergeState::Verified;
    result.trail.push_back(MergeState::Verified);

    // --- Registered ---
    MediaRecord record;
    record.name = request.name;
    record.content_hash = hash;
    auto merged_size = std::filesystem::file_size(merged.path(), ec);
    record.size = request.declared_size > 0 ? request.declared_size : (ec ? 0 : merged_size);
    record.type = file_type_for_name(request.name);
    record.mime = record.type == "unknown" ? "unknown" : mime_for_extension(record.type);
    record.album = request.album;
    record.subject = request.subject;
    record.author = request.author;
    record.level = request.level.empty() ? "General" : request.level;
    record.remark = request.remark;
    record.status = RecordStatus::Processing;
    record.storage = ChunkListRef{location.chunks, storage_dir->string(),
                                  storage_dir->parent_path().filename().string()};
    record.source_ref = relative_ref(*storage_dir);

    auto reg = dedup_.register_record(std::move(record));
    if (!reg.success) return rejected(reg.error_kind, reg.error_message);
    result.record = std::move(reg.record);
    result.state = MergeState::Registered;
    result.trail.push_back(MergeState::Registered);
    result.success = true;
    if (!reg.created) {
        result.exists = true;
        return result;
    }
    if (metrics_) metrics_->merges_registered().Increment();
    log_info("Registered %s as record %lld (%zu chunks)", hash.c_str(),
             static_cast<long long>(result.record.id), location.chunks.size());

    // Derived artifacts: best effort, never roll back the registration
    HookContext ctx{result.record, location, merged.path(), request};
    for (auto& hook : hooks_) {
        Status hook_status = hook->run(ctx);
        if (!hook_status.ok()) {
            if (metrics_) metrics_->hook_failures().Increment();
            log_warn("%s hook failed for record %lld: %s", hook->name(),
                     static_cast<long long>(result.record.id), hook_status.message.c_str());
            result.artifact_errors.push_back(std::string(hook->name()) + ": " +
                                             hook_status.message);
        }
    }

    result.record.status = RecordStatus::Enabled;
    result.record.updated_time = format_timestamp();
    if (!dedup_.records().update(result.record)) {
        log_error("Cannot enable record %lld", static_cast<long long>(result.record.id));
        result.artifact_errors.push_back("record status update failed");
    }
    return result;
}

std::optional<MediaRecord> IngestionPipeline::check_exists(const std::string& content_hash) {
    return dedup_.exists_by_hash(content_hash);
}

Status IngestionPipeline::remove(int64_t record_id) {
    auto& records = dedup_.records();
    auto record = records.get(record_id);
    if (!record) {
        return Status::failure(ErrorKind::NotFound, "record " + std::to_string(record_id) + " not found");
    }
    if (record->status == RecordStatus::Deleted) return Status::success();

    size_t removed_chunks = 0;
    if (auto location = resolve_location(*record, config_.base_dir)) {
        std::error_code ec;
        for (const auto& path : location->chunk_paths()) {
            if (std::filesystem::remove(path, ec)) ++removed_chunks;
        }
    }

    size_t removed_hls = 0;
    if (!record->hls_ref.empty()) {
        std::filesystem::path manifest(record->hls_ref);
        if (manifest.is_relative()) manifest = config_.base_dir / manifest;
        removed_hls = HlsSegmenter::remove_artifacts(manifest);
    }

    record->storage = std::monostate{};
    record->hls_ref.clear();
    record->status = RecordStatus::Deleted;
    record->deleted_time = format_timestamp();
    record->updated_time = record->deleted_time;
    if (!records.update(*record)) {
        return Status::failure(ErrorKind::StorageFailure, "cannot update record " + std::to_string(record_id));
    }
    log_info("Deleted record %lld: %zu chunks, %zu HLS files removed, thumbnail kept",
             static_cast<long long>(record_id), removed_chunks, removed_hls);
    return Status::success();
}

std::string IngestionPipeline::relative_ref(const std::filesystem::path& path) const {
    auto rel = path.lexically_relative(config_.base_dir);
    if (rel.empty() || rel.begin()->string() == "..") return path.generic_string();
    return rel.generic_string();
}

}  // namespace mediavault
