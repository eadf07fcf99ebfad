#include "mediavault/record_store.hpp"
#include "mediavault/encoding.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace mediavault {

namespace {

constexpr const char* RECORD_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS media_records (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    code TEXT NOT NULL UNIQUE,
    name TEXT NOT NULL,
    content_hash TEXT NOT NULL UNIQUE,
    size INTEGER NOT NULL DEFAULT 0,
    type TEXT NOT NULL DEFAULT 'unknown',
    mime TEXT NOT NULL DEFAULT 'unknown',
    album TEXT NOT NULL DEFAULT '',
    subject TEXT NOT NULL DEFAULT '',
    author TEXT NOT NULL DEFAULT '',
    level TEXT NOT NULL DEFAULT 'General',
    remark TEXT NOT NULL DEFAULT '',
    status TEXT NOT NULL DEFAULT 'processing',
    storage_data TEXT NOT NULL DEFAULT '',
    source_ref TEXT NOT NULL DEFAULT '',
    thumbnail_ref TEXT NOT NULL DEFAULT '',
    hls_ref TEXT NOT NULL DEFAULT '',
    created_time TEXT NOT NULL,
    updated_time TEXT NOT NULL,
    deleted_time TEXT NOT NULL DEFAULT ''
);

CREATE INDEX IF NOT EXISTS idx_status ON media_records(status);
)";

constexpr const char* RECORD_COLUMNS =
    "id, code, name, content_hash, size, type, mime, album, subject, author, level, remark, "
    "status, storage_data, source_ref, thumbnail_ref, hls_ref, created_time, updated_time, "
    "deleted_time";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

void prepare(sqlite3* db, const std::string& sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Cannot prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// Binds parameters 1..19 in RECORD_COLUMNS order (id excluded).
void bind_record(sqlite3_stmt* stmt, const MediaRecord& r) {
    bind_text(stmt, 1, r.code);
    bind_text(stmt, 2, r.name);
    bind_text(stmt, 3, r.content_hash);
    sqlite3_bind_int64(stmt, 4, static_cast<int64_t>(r.size));
    bind_text(stmt, 5, r.type);
    bind_text(stmt, 6, r.mime);
    bind_text(stmt, 7, r.album);
    bind_text(stmt, 8, r.subject);
    bind_text(stmt, 9, r.author);
    bind_text(stmt, 10, r.level);
    bind_text(stmt, 11, r.remark);
    sqlite3_bind_text(stmt, 12, record_status_name(r.status), -1, SQLITE_STATIC);
    bind_text(stmt, 13, serialize_storage_ref(r.storage));
    bind_text(stmt, 14, r.source_ref);
    bind_text(stmt, 15, r.thumbnail_ref);
    bind_text(stmt, 16, r.hls_ref);
    bind_text(stmt, 17, r.created_time);
    bind_text(stmt, 18, r.updated_time);
    bind_text(stmt, 19, r.deleted_time);
}

std::vector<std::string> string_array(const nlohmann::json& value) {
    std::vector<std::string> out;
    if (!value.is_array()) return out;
    for (const auto& item : value) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

std::string normalize_separators(std::string path) {
    std::replace(path.begin(), path.end(), '\\', '/');
    return path;
}

std::filesystem::path against_base(const std::string& stored,
                                   const std::filesystem::path& base_dir) {
    std::filesystem::path p(normalize_separators(stored));
    if (p.is_absolute()) return p;
    return base_dir / p;
}

bool is_dir(const std::filesystem::path& p) {
    std::error_code ec;
    return std::filesystem::is_directory(p, ec);
}

}  // namespace

// ============================================================================
// Storage reference
// ============================================================================

StorageRef parse_storage_ref(std::string_view text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return std::monostate{};

    auto doc = nlohmann::json::parse(text.substr(first), nullptr, false);
    if (doc.is_discarded()) {
        log_warn("Unparseable storage reference (%zu bytes)", text.size());
        return std::monostate{};
    }

    // A JSON string wrapping the real document (legacy double-encoding)
    if (doc.is_string()) {
        auto inner = nlohmann::json::parse(doc.get<std::string>(), nullptr, false);
        if (inner.is_discarded()) return std::monostate{};
        doc = std::move(inner);
    }

    if (doc.is_array()) {
        LegacyPathsRef legacy;
        legacy.paths = string_array(doc);
        if (legacy.paths.empty()) return std::monostate{};
        return legacy;
    }

    if (doc.is_object()) {
        if (doc.contains("chunks") && doc["chunks"].is_array()) {
            ChunkListRef ref;
            ref.chunks = string_array(doc["chunks"]);
            ref.storage_dir = doc.value("storage_dir", "");
            ref.time_str = doc.value("time_str", "");
            // Object form written after migrating a path list
            if (ref.storage_dir.empty() && doc.contains("paths")) {
                auto paths = string_array(doc["paths"]);
                if (!paths.empty()) return LegacyPathsRef{std::move(paths)};
            }
            return ref;
        }
        if (doc.contains("paths")) {
            auto paths = string_array(doc["paths"]);
            if (!paths.empty()) return LegacyPathsRef{std::move(paths)};
        }
    }
    return std::monostate{};
}

std::string serialize_storage_ref(const StorageRef& ref) {
    if (const auto* list = std::get_if<ChunkListRef>(&ref)) {
        nlohmann::json doc;
        doc["chunks"] = list->chunks;
        doc["storage_dir"] = list->storage_dir;
        doc["time_str"] = list->time_str;
        return doc.dump();
    }
    if (const auto* legacy = std::get_if<LegacyPathsRef>(&ref)) {
        return nlohmann::json(legacy->paths).dump();
    }
    return "";
}

std::vector<std::filesystem::path> ChunkLocation::chunk_paths() const {
    std::vector<std::filesystem::path> paths;
    paths.reserve(chunks.size());
    for (const auto& chunk : chunks) paths.push_back(storage_dir / chunk);
    return paths;
}

std::optional<ChunkLocation> resolve_location(const MediaRecord& record,
                                              const std::filesystem::path& base_dir) {
    ChunkLocation loc;

    if (const auto* list = std::get_if<ChunkListRef>(&record.storage)) {
        loc.chunks = list->chunks;
        if (!list->storage_dir.empty()) {
            auto dir = against_base(list->storage_dir, base_dir);
            if (is_dir(dir)) {
                loc.storage_dir = dir;
                return loc;
            }
        }
    } else if (const auto* legacy = std::get_if<LegacyPathsRef>(&record.storage);
               legacy && !legacy->paths.empty()) {
        for (const auto& path : legacy->paths) {
            auto name = std::filesystem::path(normalize_separators(path)).filename().string();
            if (!name.empty()) loc.chunks.push_back(name);
        }
        auto dir = against_base(legacy->paths.front(), base_dir).parent_path();
        if (is_dir(dir)) {
            loc.storage_dir = dir;
            return loc;
        }
    }

    if (!record.hls_ref.empty()) {
        auto manifest = against_base(record.hls_ref, base_dir);
        std::error_code ec;
        if (std::filesystem::exists(manifest, ec)) {
            auto dir = manifest.parent_path();
            std::string leaf = dir.filename().string();
            std::transform(leaf.begin(), leaf.end(), leaf.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            if (leaf == "HLS") dir = dir.parent_path();
            if (is_dir(dir)) {
                loc.storage_dir = dir;
                return loc;
            }
        }
    }

    if (!record.source_ref.empty()) {
        auto source = against_base(record.source_ref, base_dir);
        std::error_code ec;
        if (std::filesystem::exists(source, ec)) {
            loc.storage_dir = is_dir(source) ? source : source.parent_path();
            return loc;
        }
    }

    return std::nullopt;
}

const char* record_status_name(RecordStatus status) {
    switch (status) {
        case RecordStatus::Processing: return "processing";
        case RecordStatus::Enabled: return "enable";
        case RecordStatus::Disabled: return "disabled";
        case RecordStatus::Deleted: return "deleted";
        case RecordStatus::Failed: return "failed";
    }
    return "processing";
}

RecordStatus parse_record_status(std::string_view name) {
    if (name == "enable") return RecordStatus::Enabled;
    if (name == "disabled") return RecordStatus::Disabled;
    if (name == "deleted") return RecordStatus::Deleted;
    if (name == "failed") return RecordStatus::Failed;
    return RecordStatus::Processing;
}

// ============================================================================
// SqliteRecordStore
// ============================================================================

SqliteRecordStore::SqliteRecordStore(const std::string& db_path) {
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open record store: " + err);
    }

    // WAL mode for concurrent readers
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, RECORD_SCHEMA)) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot create record store schema");
    }

    std::string cols = RECORD_COLUMNS;
    try {
        prepare(db_,
            "INSERT INTO media_records (code, name, content_hash, size, type, mime, album, subject, "
            "author, level, remark, status, storage_data, source_ref, thumbnail_ref, hls_ref, "
            "created_time, updated_time, deleted_time) "
            "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17, ?18, ?19) "
            "ON CONFLICT(content_hash) DO NOTHING",
            &stmt_insert_);

        prepare(db_,
            "UPDATE media_records SET code = ?1, name = ?2, content_hash = ?3, size = ?4, type = ?5, "
            "mime = ?6, album = ?7, subject = ?8, author = ?9, level = ?10, remark = ?11, "
            "status = ?12, storage_data = ?13, source_ref = ?14, thumbnail_ref = ?15, hls_ref = ?16, "
            "created_time = ?17, updated_time = ?18, deleted_time = ?19 WHERE id = ?20",
            &stmt_update_);

        prepare(db_, "SELECT " + cols + " FROM media_records WHERE id = ?1", &stmt_get_);
        prepare(db_, "SELECT " + cols + " FROM media_records WHERE content_hash = ?1",
                &stmt_get_by_hash_);
        prepare(db_, "SELECT COUNT(*) FROM media_records", &stmt_count_);
    } catch (const std::runtime_error&) {
        close();
        throw;
    }
}

SqliteRecordStore::~SqliteRecordStore() {
    close();
}

void SqliteRecordStore::close() {
    // Finalize prepared statements
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    if (stmt_update_) sqlite3_finalize(stmt_update_);
    if (stmt_get_) sqlite3_finalize(stmt_get_);
    if (stmt_get_by_hash_) sqlite3_finalize(stmt_get_by_hash_);
    if (stmt_count_) sqlite3_finalize(stmt_count_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
        db_ = nullptr;
    }
    stmt_insert_ = stmt_update_ = stmt_get_ = stmt_get_by_hash_ = stmt_count_ = nullptr;
}

MediaRecord SqliteRecordStore::read_row(sqlite3_stmt* stmt) const {
    MediaRecord r;
    r.id = sqlite3_column_int64(stmt, 0);
    r.code = column_text(stmt, 1);
    r.name = column_text(stmt, 2);
    r.content_hash = column_text(stmt, 3);
    r.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    r.type = column_text(stmt, 5);
    r.mime = column_text(stmt, 6);
    r.album = column_text(stmt, 7);
    r.subject = column_text(stmt, 8);
    r.author = column_text(stmt, 9);
    r.level = column_text(stmt, 10);
    r.remark = column_text(stmt, 11);
    r.status = parse_record_status(column_text(stmt, 12));
    r.storage = parse_storage_ref(column_text(stmt, 13));
    r.source_ref = column_text(stmt, 14);
    r.thumbnail_ref = column_text(stmt, 15);
    r.hls_ref = column_text(stmt, 16);
    r.created_time = column_text(stmt, 17);
    r.updated_time = column_text(stmt, 18);
    r.deleted_time = column_text(stmt, 19);
    return r;
}

std::optional<MediaRecord> SqliteRecordStore::get(int64_t id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3_reset(stmt_get_);
    sqlite3_bind_int64(stmt_get_, 1, id);
    if (sql_step_retry(stmt_get_) != SQLITE_ROW) return std::nullopt;
    return read_row(stmt_get_);
}

std::optional<MediaRecord> SqliteRecordStore::find_by_hash(const std::string& content_hash) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3_reset(stmt_get_by_hash_);
    bind_text(stmt_get_by_hash_, 1, content_hash);
    if (sql_step_retry(stmt_get_by_hash_) != SQLITE_ROW) return std::nullopt;
    return read_row(stmt_get_by_hash_);
}

InsertResult SqliteRecordStore::insert(MediaRecord& record) {
    InsertResult result;
    if (record.code.empty()) record.code = make_uuid();
    if (record.created_time.empty()) record.created_time = format_timestamp();
    if (record.updated_time.empty()) record.updated_time = record.created_time;

    {
        std::lock_guard<std::mutex> lock(db_mutex_);
        sqlite3_reset(stmt_insert_);
        sqlite3_clear_bindings(stmt_insert_);
        bind_record(stmt_insert_, record);
        int rc = sql_step_retry(stmt_insert_);
        if (rc != SQLITE_DONE) {
            log_error("Record insert failed: %s (rc=%d)", sqlite3_errmsg(db_), rc);
            result.error_message = "record store write failed";
            return result;
        }
        if (sqlite3_changes(db_) > 0) {
            record.id = sqlite3_last_insert_rowid(db_);
            result.inserted = true;
            result.id = record.id;
            return result;
        }
    }

    result.hash_conflict = true;
    if (auto existing = find_by_hash(record.content_hash)) {
        result.id = existing->id;
    }
    return result;
}

bool SqliteRecordStore::update(const MediaRecord& record) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3_reset(stmt_update_);
    sqlite3_clear_bindings(stmt_update_);
    bind_record(stmt_update_, record);
    sqlite3_bind_int64(stmt_update_, 20, record.id);
    int rc = sql_step_retry(stmt_update_);
    if (rc != SQLITE_DONE) {
        log_error("Record update failed for id %lld: %s (rc=%d)",
                  static_cast<long long>(record.id), sqlite3_errmsg(db_), rc);
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

uint64_t SqliteRecordStore::count() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    sqlite3_reset(stmt_count_);
    if (sql_step_retry(stmt_count_) != SQLITE_ROW) return 0;
    return static_cast<uint64_t>(sqlite3_column_int64(stmt_count_, 0));
}

}  // namespace mediavault
