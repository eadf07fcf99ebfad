#include "mediavault/content.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"

#include <fstream>
#include <iterator>

namespace mediavault {

namespace {

constexpr uint8_t kTsSyncByte = 0x47;

std::optional<std::vector<uint8_t>> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in),
                                std::istreambuf_iterator<char>());
}

ContentResult fail(ContentResult result, ErrorKind kind, std::string message) {
    result.success = false;
    result.data.clear();
    result.error_kind = kind;
    result.error_message = std::move(message);
    return result;
}

ContentResult ok(std::vector<uint8_t> data, std::string content_type) {
    ContentResult result;
    result.success = true;
    result.data = std::move(data);
    result.content_type = std::move(content_type);
    return result;
}

}  // namespace

ContentService::ContentService(const VaultConfig& config, const CipherStream& cipher,
                               RecordStore& records)
    : base_dir_(config.base_dir)
    , media_root_(config.media_root)
    , upload_root_(config.upload_root)
    , cipher_(cipher)
    , records_(records)
    , endpoint_{config.content_endpoint}
    , assembler_(config.read_chunk_size) {}

std::optional<MediaRecord> ContentService::live_record(int64_t record_id, ContentResult& result) {
    auto record = records_.get(record_id);
    if (!record || record->status == RecordStatus::Deleted) {
        result = fail(std::move(result), ErrorKind::NotFound,
                      "record " + std::to_string(record_id) + " not found");
        return std::nullopt;
    }
    return record;
}

std::optional<std::filesystem::path> ContentService::manifest_path(const MediaRecord& record) const {
    if (record.hls_ref.empty()) return std::nullopt;
    std::filesystem::path manifest(record.hls_ref);
    if (manifest.is_relative()) manifest = base_dir_ / manifest;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(manifest, ec)) return std::nullopt;
    return manifest;
}

// --- Original payload ---

Status ContentService::stream_content(int64_t record_id, const ByteSink& sink) {
    auto record = records_.get(record_id);
    if (!record || record->status == RecordStatus::Deleted) {
        return Status::failure(ErrorKind::NotFound, "record " + std::to_string(record_id) + " not found");
    }
    auto location = resolve_location(*record, base_dir_);
    if (!location || location->chunks.empty()) {
        return Status::failure(ErrorKind::ChunkMissing,
                               "content of record " + std::to_string(record_id) + " is unavailable");
    }
    return assembler_.stream_files(location->chunk_paths(), sink);
}

ContentResult ContentService::content(int64_t record_id) {
    ContentResult result;
    auto record = live_record(record_id, result);
    if (!record) return result;

    std::vector<uint8_t> data;
    Status st = stream_content(record_id, [&](const uint8_t* bytes, size_t len) {
        data.insert(data.end(), bytes, bytes + len);
        return true;
    });
    if (!st.ok()) return fail(std::move(result), st.kind, st.message);

    std::string type = record->mime;
    if (type.empty() || type == "unknown") type = mime_for_extension(record->type);
    return ok(std::move(data), type);
}

// --- Thumbnails ---

ContentResult ContentService::thumbnail(int64_t record_id) {
    ContentResult result;
    auto record = live_record(record_id, result);
    if (!record) return result;
    if (record->thumbnail_ref.empty() || !is_safe_component(record->thumbnail_ref)) {
        return fail(std::move(result), ErrorKind::NotFound, "record has no thumbnail");
    }

    auto location = resolve_location(*record, base_dir_);
    std::optional<std::vector<uint8_t>> image;
    if (location) image = cipher_.read_token_file(location->storage_dir / record->thumbnail_ref);
    if (!image) return fail(std::move(result), ErrorKind::NotFound, "thumbnail not found");
    return ok(std::move(*image), "image/jpeg");
}

// --- HLS ---

ContentResult ContentService::playlist(int64_t record_id) {
    ContentResult result;
    auto record = live_record(record_id, result);
    if (!record) return result;

    auto manifest = manifest_path(*record);
    if (!manifest) return fail(std::move(result), ErrorKind::NotFound, "no playlist for record");

    std::string text;
    if (auto decrypted = cipher_.read_token_file(*manifest)) {
        text.assign(decrypted->begin(), decrypted->end());
    } else if (auto plain = read_file(*manifest)) {
        log_debug("Manifest of record %lld is not encrypted", static_cast<long long>(record_id));
        text.assign(plain->begin(), plain->end());
    } else {
        return fail(std::move(result), ErrorKind::StorageFailure, "playlist is unreadable");
    }

    text = rewrite_segment_refs(text, endpoint_, record_id);
    text = rewrite_key_uris(text, endpoint_, record_id);
    return ok(std::vector<uint8_t>(text.begin(), text.end()), "application/vnd.apple.mpegurl");
}

ContentResult ContentService::segment(int64_t record_id, const std::string& file_name) {
    ContentResult result;
    if (!is_safe_component(file_name)) {
        return fail(std::move(result), ErrorKind::InvalidArgument, "invalid segment name");
    }
    auto record = live_record(record_id, result);
    if (!record) return result;

    std::string name = file_name;
    if (name.size() > 4 && name.ends_with(".enc")) name.resize(name.size() - 4);

    std::vector<std::filesystem::path> candidates;
    if (auto manifest = manifest_path(*record)) candidates.push_back(manifest->parent_path() / name);
    if (auto location = resolve_location(*record, base_dir_)) {
        candidates.push_back(location->storage_dir / "HLS" / name);
        candidates.push_back(location->storage_dir / name);
    }

    for (const auto& path : candidates) {
        auto data = read_file(path);
        if (!data) continue;
        if (!data->empty() && (*data)[0] != kTsSyncByte) {
            auto plain = cipher_.transform(*data);
            if (plain[0] == kTsSyncByte) data = std::move(plain);
        }
        return ok(std::move(*data), "video/mp2t");
    }
    return fail(std::move(result), ErrorKind::NotFound, "segment " + name + " not found");
}

ContentResult ContentService::key(int64_t record_id, const std::string& key_name) {
    ContentResult result;
    if (!is_safe_component(key_name)) {
        return fail(std::move(result), ErrorKind::InvalidArgument, "invalid key name");
    }
    auto record = live_record(record_id, result);
    if (!record) return result;

    std::vector<std::filesystem::path> candidates;
    if (auto location = resolve_location(*record, base_dir_)) {
        const auto& dir = location->storage_dir;
        candidates.push_back(dir / key_name);
        candidates.push_back(dir / "VKey" / "ALL" / key_name);
        candidates.push_back(dir.parent_path() / "VKey" / "ALL" / key_name);
    }
    candidates.push_back(upload_root_ / "VKey" / "ALL" / key_name);

    for (const auto& path : candidates) {
        if (auto data = read_file(path)) return ok(std::move(*data), "application/octet-stream");
    }
    return fail(std::move(result), ErrorKind::NotFound, "key " + key_name + " not found");
}

// --- Remote acquisitions ---

ContentResult ContentService::local_variant(const std::string& file_id, const std::string& subdir) {
    ContentResult result;
    if (!is_safe_component(file_id) || (!subdir.empty() && !is_safe_component(subdir))) {
        return fail(std::move(result), ErrorKind::InvalidArgument, "invalid item id");
    }
    auto dir = find_in_date_dirs(media_root_, file_id, subdir);
    if (!dir) return fail(std::move(result), ErrorKind::NotFound, "item " + file_id + " not stored");

    auto assembled = assembler_.assemble(*dir, file_id);
    if (!assembled.success) {
        return fail(std::move(result), assembled.error_kind, "item " + file_id + " is incomplete");
    }
    return ok(std::move(assembled.data), mime_for_extension(assembled.extension));
}

}  // namespace mediavault
