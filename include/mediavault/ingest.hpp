#pragma once

#include "mediavault/chunk_store.hpp"
#include "mediavault/cipher.hpp"
#include "mediavault/dedup_index.hpp"
#include "mediavault/errors.hpp"
#include "mediavault/fetcher.hpp"
#include "mediavault/hls.hpp"
#include "mediavault/process.hpp"
#include "mediavault/record_store.hpp"
#include "mediavault/vault_config.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mediavault {

class MetricsExporter;

// ============================================================================
// Remote acquisition
// ============================================================================

struct AcquireRequest {
    std::string url;
    std::filesystem::path base_dir;  // set directory
    std::string file_id;
    std::string extension;           // empty: taken from the URL
    HttpHeaders headers;
    std::string expected_hash;       // optional MD5 the payload must match

    // Register the stored set in the dedup index under `name`
    bool register_record = false;
    std::string name;
};

struct AcquireResult {
    bool success = false;
    bool skipped = false;    // set already on disk, no network I/O
    bool duplicate = false;  // content already registered under another set
    uint32_t chunk_count = 0;
    uint64_t bytes = 0;
    std::string content_hash;
    int attempts = 0;
    std::optional<MediaRecord> record;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

/// One named rendition of a remote item (preview, sample, full).
struct VariantSpec {
    std::string name;  // subdirectory under the item's partition
    std::string url;
    std::string extension;
};

// ============================================================================
// Direct upload
// ============================================================================

struct ChunkReceipt {
    bool success = false;
    std::string chunk_uuid;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

struct DeclaredChunk {
    uint32_t index = 0;
    std::string chunk_uuid;
};

struct MergeRequest {
    std::string content_hash;  // declared MD5 of the whole file
    std::string name;
    uint64_t declared_size = 0;
    std::vector<DeclaredChunk> chunks;
    std::string album;
    std::string subject;
    std::string author;
    std::string level = "General";
    std::string remark;
    bool generate_thumbnail = true;
    std::string thumbnail_base64;  // client-rendered thumbnail, optional

    /// Accepts the upload client's JSON body. generate_thumbnail may be a
    /// bool or one of "true", "1", "yes".
    static MergeRequest from_json(const nlohmann::json& body);
};

enum class MergeState { Received, Merged, Verified, Registered, Rejected };

const char* merge_state_name(MergeState state);

struct MergeResult {
    bool success = false;
    bool exists = false;  // hash already registered; `record` is the existing one
    MergeState state = MergeState::Received;
    std::vector<MergeState> trail;
    MediaRecord record;
    std::vector<std::string> artifact_errors;  // failed post-registration hooks
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

// ============================================================================
// Post-registration hooks
// ============================================================================

struct HookContext {
    MediaRecord& record;
    const ChunkLocation& location;
    const std::filesystem::path& merged_file;  // verified payload, removed after hooks
    const MergeRequest& request;
};

/// Best-effort derived-artifact step. A failure is logged and leaves the
/// artifact reference empty; it never rolls back registration.
class PostRegistrationHook {
public:
    virtual ~PostRegistrationHook() = default;
    virtual const char* name() const = 0;
    virtual Status run(HookContext& ctx) = 0;
};

/// Stores thumb_{uuid}.enc beside the chunks: the client thumbnail when it
/// decodes, else a frame extracted by the external tool for images and videos.
class ThumbnailHook : public PostRegistrationHook {
public:
    ThumbnailHook(const CipherStream& cipher, ProcessRunner& runner,
                  std::string extractor = "ffmpeg",
                  std::chrono::seconds timeout = std::chrono::seconds(30));

    const char* name() const override { return "thumbnail"; }
    Status run(HookContext& ctx) override;

private:
    Status store(HookContext& ctx, std::span<const uint8_t> image);
    Status extract(HookContext& ctx, bool video);

    const CipherStream& cipher_;
    ProcessRunner& runner_;
    std::string extractor_;
    std::chrono::seconds timeout_;
};

/// Transcodes video records to encrypted HLS right after registration.
class HlsHook : public PostRegistrationHook {
public:
    explicit HlsHook(HlsSegmenter& segmenter) : segmenter_(segmenter) {}

    const char* name() const override { return "hls"; }
    Status run(HookContext& ctx) override;

private:
    HlsSegmenter& segmenter_;
};

// ============================================================================
// IngestionPipeline
// ============================================================================

/// Orchestrates fetch -> chunk -> store -> register for remote items and
/// receive -> merge -> verify -> register for uploads.
class IngestionPipeline {
public:
    IngestionPipeline(VaultConfig config, RetryingFetcher& fetcher, ChunkStore& store,
                      DedupIndex& dedup);

    /// Hooks run in the order added.
    void add_hook(std::unique_ptr<PostRegistrationHook> hook);
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Stream one URL into a chunk set. Skips the network entirely when the
    /// set already exists.
    AcquireResult acquire(const AcquireRequest& request,
                          const CancellationToken* cancel = nullptr);

    /// Each variant goes to media_root/YYYYMMDD/{file_id}/{variant.name}.
    /// Empty URLs count as failures.
    BatchResult acquire_variants(const std::string& file_id,
                                 const std::vector<VariantSpec>& variants,
                                 const HttpHeaders& headers = {},
                                 const CancellationToken* cancel = nullptr);

    /// Store one uploaded piece under upload_root/YYYYMMDD/{hash}/{chunk_uuid}.
    /// An empty chunk_uuid gets a generated one.
    ChunkReceipt receive_chunk(const std::string& content_hash, std::string chunk_uuid,
                               std::span<const uint8_t> data);

    MergeResult merge(const MergeRequest& request);

    std::optional<MediaRecord> check_exists(const std::string& content_hash);

    /// Soft delete: chunks and HLS artifacts go, the thumbnail and the
    /// record stay with status "deleted".
    Status remove(int64_t record_id);

    const VaultConfig& config() const { return config_; }

private:
    std::string relative_ref(const std::filesystem::path& path) const;
    std::optional<std::string> hash_existing_set(const std::filesystem::path& base,
                                                 const std::string& file_id,
                                                 uint64_t* size) const;
    void register_acquired(const AcquireRequest& request, AcquireResult& result);

    VaultConfig config_;
    RetryingFetcher& fetcher_;
    ChunkStore& store_;
    DedupIndex& dedup_;
    std::vector<std::unique_ptr<PostRegistrationHook>> hooks_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace mediavault
