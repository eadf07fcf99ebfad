#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace mediavault {

// ============================================================================
// Storage reference: the record field pointing at a chunk set.
//
// Three historical shapes are accepted and resolved once at read time:
//   {"chunks": [...], "storage_dir": "...", "time_str": "..."}
//   "[\"media/.../a.part0\", ...]"   (JSON string holding an array of paths)
//   empty
// ============================================================================

struct ChunkListRef {
    std::vector<std::string> chunks;  // file names inside storage_dir, in order
    std::string storage_dir;
    std::string time_str;
};

struct LegacyPathsRef {
    std::vector<std::string> paths;
};

using StorageRef = std::variant<std::monostate, ChunkListRef, LegacyPathsRef>;

StorageRef parse_storage_ref(std::string_view text);
std::string serialize_storage_ref(const StorageRef& ref);

/// Canonical on-disk location of a record's chunks.
struct ChunkLocation {
    std::filesystem::path storage_dir;
    std::vector<std::string> chunks;

    std::vector<std::filesystem::path> chunk_paths() const;
};

enum class RecordStatus { Processing, Enabled, Disabled, Deleted, Failed };

const char* record_status_name(RecordStatus status);
RecordStatus parse_record_status(std::string_view name);

/// Metadata of one logical file.
struct MediaRecord {
    int64_t id = 0;
    std::string code;          // random UUID
    std::string name;
    std::string content_hash;  // lowercase hex MD5
    uint64_t size = 0;
    std::string type = "unknown";
    std::string mime = "unknown";
    std::string album;
    std::string subject;
    std::string author;
    std::string level = "General";
    std::string remark;
    RecordStatus status = RecordStatus::Processing;
    StorageRef storage;
    std::string source_ref;     // media/YYYYMMDD/{hash}, relative to base_dir
    std::string thumbnail_ref;  // thumb_{uuid}.enc inside the storage dir
    std::string hls_ref;        // manifest path relative to base_dir
    std::string created_time;
    std::string updated_time;
    std::string deleted_time;
};

/// Resolve where a record's chunks live. Order: the storage reference, the
/// manifest's directory (its parent when the manifest sits in HLS/), then
/// source_ref. Relative and "media/" paths are taken against `base_dir`.
std::optional<ChunkLocation> resolve_location(const MediaRecord& record,
                                              const std::filesystem::path& base_dir);

struct InsertResult {
    bool inserted = false;
    bool hash_conflict = false;  // a record with this content hash exists
    int64_t id = 0;              // new id, or the existing record's id on conflict
    std::string error_message;
};

/// Narrow interface to the metadata store.
class RecordStore {
public:
    virtual ~RecordStore() = default;

    virtual std::optional<MediaRecord> get(int64_t id) = 0;

    /// Any status, deleted records included.
    virtual std::optional<MediaRecord> find_by_hash(const std::string& content_hash) = 0;

    /// Assigns record.id on success. Content hashes are unique.
    virtual InsertResult insert(MediaRecord& record) = 0;

    virtual bool update(const MediaRecord& record) = 0;

    virtual uint64_t count() = 0;
};

/// SQLite-backed record store (WAL, prepared statements, busy retry).
class SqliteRecordStore : public RecordStore {
public:
    /// Opens or creates the database; ":memory:" for a private store.
    /// Throws std::runtime_error if it cannot be opened.
    explicit SqliteRecordStore(const std::string& db_path);
    ~SqliteRecordStore() override;

    SqliteRecordStore(const SqliteRecordStore&) = delete;
    SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

    std::optional<MediaRecord> get(int64_t id) override;
    std::optional<MediaRecord> find_by_hash(const std::string& content_hash) override;
    InsertResult insert(MediaRecord& record) override;
    bool update(const MediaRecord& record) override;
    uint64_t count() override;

private:
    MediaRecord read_row(sqlite3_stmt* stmt) const;
    void close();

    sqlite3* db_ = nullptr;
    std::mutex db_mutex_;

    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_update_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_get_by_hash_ = nullptr;
    sqlite3_stmt* stmt_count_ = nullptr;
};

}  // namespace mediavault
