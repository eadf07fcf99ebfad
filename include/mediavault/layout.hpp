#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace mediavault {

// ============================================================================
// Date-partitioned storage layout: {root}/{YYYYMMDD}/{file_id}/[subdir]
// ============================================================================

/// Local-time YYYYMMDD for `when`.
std::string date_partition(std::chrono::system_clock::time_point when =
                               std::chrono::system_clock::now());

/// Local-time "YYYY-MM-DD HH:MM:SS" for record timestamps.
std::string format_timestamp(std::chrono::system_clock::time_point when =
                                 std::chrono::system_clock::now());

/// Directory for a set written today (or on `date` when given).
std::filesystem::path partition_dir(const std::filesystem::path& root,
                                    std::string_view file_id,
                                    std::string_view subdir = {},
                                    std::string_view date = {});

/// Locate an existing set directory: today's partition first, then every
/// partition under `root` in descending name order. nullopt if none exists.
std::optional<std::filesystem::path> find_in_date_dirs(const std::filesystem::path& root,
                                                       std::string_view file_id,
                                                       std::string_view subdir = {});

/// Removes a scratch file on every exit path.
class TempFileGuard {
public:
    explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// True if `id` can be used as a single path component.
bool is_safe_component(std::string_view id);

// --- Extensions and media types ---

/// Sidecar-compatible extension: leading dot, shorter than 10 characters.
bool is_valid_extension(std::string_view ext);

/// Extension of the last path segment of a URL (query and fragment
/// stripped), or ".jpg" if it has none.
std::string extension_from_url(std::string_view url);

/// Lowercase extension of a file name without the dot, "unknown" if none.
std::string file_type_for_name(std::string_view name);

/// MIME type for ".ext" or "ext"; application/octet-stream if unknown.
std::string mime_for_extension(std::string_view ext);

/// Image or video by MIME prefix, falling back to the file type list.
bool is_image_media(std::string_view mime, std::string_view file_type);
bool is_video_media(std::string_view mime, std::string_view file_type);

}  // namespace mediavault
