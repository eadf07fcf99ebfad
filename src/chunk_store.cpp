#include "mediavault/chunk_store.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"
#include "mediavault/metrics.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>

namespace mediavault {

namespace {

std::filesystem::path pending_first_chunk(const std::filesystem::path& base,
                                          std::string_view file_id) {
    return base / (std::string(file_id) + ".part0.tmp");
}

Status storage_error(const std::string& what, std::string_view file_id) {
    return Status::failure(ErrorKind::StorageFailure,
                           what + " for " + std::string(file_id));
}

}  // namespace

// --- ChunkSizePolicy ---

uint64_t ChunkSizePolicy::chunk_size_for(std::optional<uint64_t> total_size) const {
    if (total_size && *total_size > 0 && *total_size < threshold) {
        return (*total_size + small_count - 1) / small_count;
    }
    return large_chunk_size;
}

std::string ChunkSizePolicy::validate() const {
    if (threshold == 0) return "chunk_size_threshold must be positive";
    if (small_count == 0) return "chunk_count_small must be positive";
    if (large_chunk_size == 0) return "chunk_size_large must be positive";
    if (read_increment == 0) return "read_chunk_size must be positive";
    return {};
}

// --- Naming ---

std::filesystem::path chunk_path(const std::filesystem::path& base,
                                 std::string_view file_id, uint32_t index) {
    return base / (std::string(file_id) + ".part" + std::to_string(index));
}

std::filesystem::path extension_sidecar_path(const std::filesystem::path& base,
                                             std::string_view file_id) {
    return base / (std::string(file_id) + ".ext");
}

Status write_file_atomic(const std::filesystem::path& path, std::span<const uint8_t> data) {
    auto temp_path = path.string() + ".tmp." +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

    {
        std::ofstream file(temp_path, std::ios::binary);
        if (!file) {
            return Status::failure(ErrorKind::StorageFailure, "failed to create file");
        }
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
        if (!file) {
            file.close();
            std::error_code rm_ec;
            std::filesystem::remove(temp_path, rm_ec);
            return Status::failure(ErrorKind::StorageFailure, "failed to write data");
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(temp_path, rm_ec);
        log_error("rename %s -> %s failed: %s", temp_path.c_str(), path.c_str(),
                  ec.message().c_str());
        return Status::failure(ErrorKind::StorageFailure, "failed to rename file");
    }
    return Status::success();
}

// --- Sources ---

Status MemorySource::read(uint8_t* buffer, size_t capacity, size_t* read) {
    size_t n = std::min(capacity, data_.size() - offset_);
    std::copy_n(data_.data() + offset_, n, buffer);
    offset_ += n;
    *read = n;
    return Status::success();
}

// ============================================================================
// ChunkWriter
// ============================================================================

ChunkWriter::ChunkWriter(std::filesystem::path base, std::string file_id,
                         ChunkSizePolicy policy, const CancellationToken* cancel)
    : base_(std::move(base))
    , file_id_(std::move(file_id))
    , policy_(policy)
    , cancel_(cancel) {}

ChunkWriter::~ChunkWriter() {
    if (started_ && !committed_) abort();
}

Status ChunkWriter::begin(std::optional<uint64_t> size_hint) {
    if (started_ && !committed_) abort();

    std::error_code ec;
    std::filesystem::create_directories(base_, ec);
    if (ec) {
        log_error("Cannot create %s: %s", base_.c_str(), ec.message().c_str());
        return storage_error("cannot create storage directory", file_id_);
    }

    chunk_size_ = policy_.chunk_size_for(size_hint);
    buffer_.clear();
    buffer_.reserve(static_cast<size_t>(chunk_size_));
    next_index_ = 0;
    bytes_received_ = 0;
    started_ = true;
    committed_ = false;

    if (size_hint && *size_hint > 0 && *size_hint < policy_.threshold) {
        log_debug("%s: %llu bytes, splitting into %u chunks of %llu bytes", file_id_.c_str(),
                  static_cast<unsigned long long>(*size_hint), policy_.small_count,
                  static_cast<unsigned long long>(chunk_size_));
    } else {
        log_debug("%s: size %s, fixed chunks of %llu bytes", file_id_.c_str(),
                  size_hint ? std::to_string(*size_hint).c_str() : "unknown",
                  static_cast<unsigned long long>(chunk_size_));
    }
    return Status::success();
}

Status ChunkWriter::append(const uint8_t* data, size_t len) {
    if (!started_) {
        Status st = begin(std::nullopt);
        if (!st.ok()) return st;
    }
    if (is_cancelled(cancel_)) {
        return Status::failure(ErrorKind::Cancelled, "download of " + file_id_ + " cancelled");
    }

    bytes_received_ += len;
    buffer_.insert(buffer_.end(), data, data + len);

    size_t consumed = 0;
    while (buffer_.size() - consumed >= chunk_size_) {
        if (is_cancelled(cancel_)) {
            return Status::failure(ErrorKind::Cancelled, "download of " + file_id_ + " cancelled");
        }
        Status st = flush_chunk(buffer_.data() + consumed, static_cast<size_t>(chunk_size_));
        if (!st.ok()) return st;
        consumed += static_cast<size_t>(chunk_size_);
    }
    if (consumed > 0) {
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(consumed));
    }
    return Status::success();
}

Status ChunkWriter::flush_chunk(const uint8_t* data, size_t len) {
    if (next_index_ == 0) {
        auto pending = pending_first_chunk(base_, file_id_);
        std::ofstream file(pending, std::ios::binary | std::ios::trunc);
        if (!file) {
            log_error("Cannot create %s", pending.c_str());
            return storage_error("cannot write chunk 0", file_id_);
        }
        file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        if (!file) return storage_error("cannot write chunk 0", file_id_);
    } else {
        Status st = write_file_atomic(chunk_path(base_, file_id_, next_index_), {data, len});
        if (!st.ok()) {
            return storage_error("cannot write chunk " + std::to_string(next_index_), file_id_);
        }
    }
    log_debug("%s: saved chunk %u (%zu bytes)", file_id_.c_str(), next_index_, len);
    ++next_index_;
    if (metrics_) {
        metrics_->chunks_written().Increment();
        metrics_->ingest_bytes_total().Increment(static_cast<double>(len));
    }
    return Status::success();
}

ChunkWriteResult ChunkWriter::commit(const std::string& extension) {
    ChunkWriteResult result;
    if (!started_) {
        Status st = begin(std::nullopt);
        if (!st.ok()) {
            result.error_kind = st.kind;
            result.error_message = st.message;
            return result;
        }
    }

    auto fail = [&](const Status& st) {
        abort();
        result.success = false;
        result.error_kind = st.kind;
        result.error_message = st.message;
        return result;
    };

    if (is_cancelled(cancel_)) {
        return fail(Status::failure(ErrorKind::Cancelled, "download of " + file_id_ + " cancelled"));
    }

    if (!buffer_.empty() || next_index_ == 0) {
        Status st = flush_chunk(buffer_.data(), buffer_.size());
        if (!st.ok()) return fail(st);
        buffer_.clear();
    }

    if (!extension.empty()) {
        Status st = write_file_atomic(extension_sidecar_path(base_, file_id_),
                                      {reinterpret_cast<const uint8_t*>(extension.data()),
                                       extension.size()});
        if (!st.ok()) return fail(storage_error("cannot write extension sidecar", file_id_));
    }

    // Publishing chunk 0 makes the set visible
    std::error_code ec;
    std::filesystem::rename(pending_first_chunk(base_, file_id_),
                            chunk_path(base_, file_id_, 0), ec);
    if (ec) {
        log_error("Cannot publish chunk 0 of %s: %s", file_id_.c_str(), ec.message().c_str());
        return fail(storage_error("cannot publish chunk 0", file_id_));
    }

    committed_ = true;
    result.success = true;
    result.chunk_count = next_index_;
    result.bytes_written = bytes_received_;
    log_info("Stored %s as %u chunks (%llu bytes)", file_id_.c_str(), next_index_,
             static_cast<unsigned long long>(bytes_received_));
    return result;
}

void ChunkWriter::abort() {
    std::error_code ec;
    std::filesystem::remove(pending_first_chunk(base_, file_id_), ec);
    for (uint32_t i = 1; i < next_index_; ++i) {
        std::filesystem::remove(chunk_path(base_, file_id_, i), ec);
    }
    if (next_index_ > 0) {
        log_warn("Discarded partial chunk set %s (%u chunks)", file_id_.c_str(), next_index_);
    }
    buffer_.clear();
    next_index_ = 0;
    bytes_received_ = 0;
    started_ = false;
}

// ============================================================================
// ChunkStore
// ============================================================================

ChunkStore::ChunkStore(ChunkSizePolicy policy) : policy_(policy) {}

bool ChunkStore::exists(const std::filesystem::path& base, std::string_view file_id) const {
    std::error_code ec;
    return std::filesystem::exists(chunk_path(base, file_id, 0), ec);
}

uint32_t ChunkStore::count_existing(const std::filesystem::path& base,
                                    std::string_view file_id) const {
    std::error_code ec;
    uint32_t count = 0;
    while (std::filesystem::exists(chunk_path(base, file_id, count), ec)) {
        ++count;
    }
    return count;
}

ChunkWriteResult ChunkStore::write_sequential(const std::filesystem::path& base,
                                              const std::string& file_id,
                                              ByteSource& source,
                                              const std::string& extension,
                                              const CancellationToken* cancel) {
    ChunkWriteResult result;
    if (!is_safe_component(file_id)) {
        result.error_kind = ErrorKind::InvalidArgument;
        result.error_message = "invalid file id";
        return result;
    }

    if (exists(base, file_id)) {
        result.success = true;
        result.skipped = true;
        result.chunk_count = count_existing(base, file_id);
        log_info("Chunk set %s already exists, skipping", file_id.c_str());
        if (metrics_) metrics_->acquisitions_skipped().Increment();
        return result;
    }

    auto writer = open_writer(base, file_id, cancel);
    Status st = writer->begin(source.size_hint());
    if (!st.ok()) {
        result.error_kind = st.kind;
        result.error_message = st.message;
        return result;
    }

    std::vector<uint8_t> block(policy_.read_increment);
    while (true) {
        size_t n = 0;
        st = source.read(block.data(), block.size(), &n);
        if (st.ok() && n > 0) st = writer->append(block.data(), n);
        if (!st.ok()) {
            writer->abort();
            result.error_kind = st.kind;
            result.error_message = st.message;
            return result;
        }
        if (n == 0) break;
    }
    return writer->commit(extension);
}

ChunkWriteResult ChunkStore::write_bytes(const std::filesystem::path& base,
                                         const std::string& file_id,
                                         std::span<const uint8_t> data,
                                         const std::string& extension) {
    MemorySource source(data);
    return write_sequential(base, file_id, source, extension);
}

std::unique_ptr<ChunkWriter> ChunkStore::open_writer(const std::filesystem::path& base,
                                                     const std::string& file_id,
                                                     const CancellationToken* cancel) {
    remove_leftovers(base, file_id);
    auto writer = std::make_unique<ChunkWriter>(base, file_id, policy_, cancel);
    writer->set_metrics(metrics_);
    return writer;
}

Status ChunkStore::write_direct(const std::filesystem::path& base, const std::string& key,
                                std::span<const uint8_t> data) {
    if (!is_safe_component(key)) {
        return Status::failure(ErrorKind::InvalidArgument, "invalid chunk key");
    }
    std::error_code ec;
    std::filesystem::create_directories(base, ec);
    if (ec) {
        log_error("Cannot create %s: %s", base.c_str(), ec.message().c_str());
        return Status::failure(ErrorKind::StorageFailure, "cannot create upload directory");
    }
    Status st = write_file_atomic(base / key, data);
    if (!st.ok()) {
        return Status::failure(ErrorKind::StorageFailure, "cannot store chunk " + key);
    }
    if (metrics_) {
        metrics_->chunks_written().Increment();
        metrics_->ingest_bytes_total().Increment(static_cast<double>(data.size()));
    }
    return Status::success();
}

size_t ChunkStore::remove_set(const std::filesystem::path& base, std::string_view file_id) {
    size_t removed = 0;
    std::error_code ec;
    uint32_t count = count_existing(base, file_id);
    for (uint32_t i = 0; i < count; ++i) {
        if (std::filesystem::remove(chunk_path(base, file_id, i), ec)) ++removed;
    }
    if (std::filesystem::remove(extension_sidecar_path(base, file_id), ec)) ++removed;
    remove_leftovers(base, file_id);
    return removed;
}

void ChunkStore::remove_leftovers(const std::filesystem::path& base,
                                  std::string_view file_id) {
    // Interrupted writes leave a pending chunk 0, numbered chunks without a
    // chunk 0, and temp files from unfinished renames.
    std::error_code ec;
    if (std::filesystem::exists(chunk_path(base, file_id, 0), ec)) return;

    std::string prefix = std::string(file_id) + ".part";
    std::vector<std::filesystem::path> stale;
    for (auto it = std::filesystem::directory_iterator(base, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.starts_with(prefix)) stale.push_back(it->path());
    }
    for (const auto& path : stale) {
        std::filesystem::remove(path, ec);
    }
    if (!stale.empty()) {
        log_info("Removed %zu leftover files of interrupted write %s", stale.size(),
                 std::string(file_id).c_str());
    }
}

}  // namespace mediavault
