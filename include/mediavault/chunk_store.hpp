#pragma once

#include "mediavault/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediavault {

class MetricsExporter;

/// Adaptive chunk sizing.
///
/// A payload whose size is known and below `threshold` is split into
/// `small_count` pieces of ceil(size / small_count) bytes. Anything else,
/// including an unknown size and a size of exactly `threshold`, uses
/// `large_chunk_size`.
struct ChunkSizePolicy {
    uint64_t threshold = 1024 * 1024;
    uint32_t small_count = 3;
    uint64_t large_chunk_size = 1024 * 1024;
    size_t read_increment = 8192;

    /// A size of 0 is treated as unknown.
    uint64_t chunk_size_for(std::optional<uint64_t> total_size) const;

    /// Empty string if valid.
    std::string validate() const;
};

// --- File naming: {base}/{file_id}.part{N}, {base}/{file_id}.ext ---

std::filesystem::path chunk_path(const std::filesystem::path& base,
                                 std::string_view file_id, uint32_t index);
std::filesystem::path extension_sidecar_path(const std::filesystem::path& base,
                                             std::string_view file_id);

/// Write `data` to `path` through a sibling temp file and rename.
Status write_file_atomic(const std::filesystem::path& path, std::span<const uint8_t> data);

struct ChunkWriteResult {
    bool success = false;
    bool skipped = false;      // set already existed, nothing written
    uint32_t chunk_count = 0;
    uint64_t bytes_written = 0;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

/// Pull-style byte source consumed in read_increment blocks.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// Total size when known up front.
    virtual std::optional<uint64_t> size_hint() const = 0;

    /// Read up to `capacity` bytes. Sets `*read` to 0 at end of stream.
    virtual Status read(uint8_t* buffer, size_t capacity, size_t* read) = 0;
};

class MemorySource : public ByteSource {
public:
    explicit MemorySource(std::span<const uint8_t> data) : data_(data) {}

    std::optional<uint64_t> size_hint() const override { return data_.size(); }
    Status read(uint8_t* buffer, size_t capacity, size_t* read) override;

private:
    std::span<const uint8_t> data_;
    size_t offset_ = 0;
};

/// Push-style sequential writer for one chunk set.
///
/// Chunks 1..N are published with temp+rename as soon as they fill.
/// Chunk 0 is held back as "{id}.part0.tmp" and renamed last in commit(),
/// after the final partial chunk and the extension sidecar, so the set only
/// becomes visible to exists() once it is complete. A cancelled or aborted
/// writer removes whatever it wrote.
class ChunkWriter {
public:
    ChunkWriter(std::filesystem::path base, std::string file_id, ChunkSizePolicy policy,
                const CancellationToken* cancel = nullptr);
    ~ChunkWriter();

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;

    /// Start (or restart) the set. Discards anything written before.
    Status begin(std::optional<uint64_t> size_hint);

    Status append(const uint8_t* data, size_t len);

    /// Flush the remainder, write the sidecar (if `extension` is non-empty)
    /// and publish chunk 0. An empty payload commits a single empty chunk.
    ChunkWriteResult commit(const std::string& extension);

    /// Remove all files written by this writer.
    void abort();

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    uint32_t chunks_written() const { return next_index_; }
    uint64_t bytes_received() const { return bytes_received_; }
    uint64_t chunk_size() const { return chunk_size_; }

private:
    Status flush_chunk(const uint8_t* data, size_t len);

    std::filesystem::path base_;
    std::string file_id_;
    ChunkSizePolicy policy_;
    const CancellationToken* cancel_;
    MetricsExporter* metrics_ = nullptr;

    uint64_t chunk_size_ = 0;
    std::vector<uint8_t> buffer_;
    uint32_t next_index_ = 0;
    uint64_t bytes_received_ = 0;
    bool started_ = false;
    bool committed_ = false;
};

/// Filesystem primitives for numbered chunk sets.
///
/// Concurrent writers to the same file id are not supported: exists() and
/// the subsequent write are not atomic, so two first-time ingestions of the
/// same id can both write the set.
class ChunkStore {
public:
    explicit ChunkStore(ChunkSizePolicy policy = {});

    const ChunkSizePolicy& policy() const { return policy_; }
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// True iff chunk 0 exists.
    bool exists(const std::filesystem::path& base, std::string_view file_id) const;

    /// Number of contiguous chunks starting at index 0.
    uint32_t count_existing(const std::filesystem::path& base, std::string_view file_id) const;

    /// Consume `source` into a chunk set. Skips (returning the existing
    /// count) if chunk 0 is already present.
    ChunkWriteResult write_sequential(const std::filesystem::path& base,
                                      const std::string& file_id,
                                      ByteSource& source,
                                      const std::string& extension,
                                      const CancellationToken* cancel = nullptr);

    ChunkWriteResult write_bytes(const std::filesystem::path& base,
                                 const std::string& file_id,
                                 std::span<const uint8_t> data,
                                 const std::string& extension);

    /// Writer for callers that receive bytes by push (HTTP streaming).
    /// Removes stale leftovers of an interrupted earlier write first.
    std::unique_ptr<ChunkWriter> open_writer(const std::filesystem::path& base,
                                             const std::string& file_id,
                                             const CancellationToken* cancel = nullptr);

    /// Single-shot write of a client-uploaded piece named by `key`.
    Status write_direct(const std::filesystem::path& base, const std::string& key,
                        std::span<const uint8_t> data);

    /// Delete chunks, sidecars and interrupted leftovers. Returns files removed.
    size_t remove_set(const std::filesystem::path& base, std::string_view file_id);

private:
    void remove_leftovers(const std::filesystem::path& base, std::string_view file_id);

    ChunkSizePolicy policy_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace mediavault
