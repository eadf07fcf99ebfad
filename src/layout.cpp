#include "mediavault/layout.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <vector>

namespace mediavault {

namespace {

std::tm local_tm(std::chrono::system_clock::time_point when) {
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool in_list(std::string_view value, const std::vector<std::string_view>& list) {
    return std::find(list.begin(), list.end(), value) != list.end();
}

const std::vector<std::string_view> kImageTypes = {
    "jpg", "jpeg", "png", "gif", "webp", "bmp", "svg", "ico", "tiff", "tif"};

const std::vector<std::string_view> kVideoTypes = {
    "mp4", "avi", "mov", "wmv", "flv", "mkv", "webm", "m4v", "3gp", "rmvb", "rm"};

}  // namespace

std::string date_partition(std::chrono::system_clock::time_point when) {
    auto tm = local_tm(when);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%Y%m%d", &tm);
    return buf;
}

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    auto tm = local_tm(when);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

std::filesystem::path partition_dir(const std::filesystem::path& root,
                                    std::string_view file_id,
                                    std::string_view subdir,
                                    std::string_view date) {
    auto dir = root / (date.empty() ? date_partition() : std::string(date)) / std::string(file_id);
    if (!subdir.empty()) dir /= std::string(subdir);
    return dir;
}

std::optional<std::filesystem::path> find_in_date_dirs(const std::filesystem::path& root,
                                                       std::string_view file_id,
                                                       std::string_view subdir) {
    std::error_code ec;
    auto today = partition_dir(root, file_id, subdir);
    if (std::filesystem::exists(today, ec)) return today;

    std::vector<std::filesystem::path> partitions;
    for (auto it = std::filesystem::directory_iterator(root, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (it->is_directory(ec)) partitions.push_back(it->path());
    }
    // Deterministic: newest partition wins when a set exists on several days
    std::sort(partitions.begin(), partitions.end(),
              [](const auto& a, const auto& b) { return a.filename() > b.filename(); });

    for (const auto& date_dir : partitions) {
        auto candidate = date_dir / std::string(file_id);
        if (!subdir.empty()) candidate /= std::string(subdir);
        if (std::filesystem::exists(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

bool is_safe_component(std::string_view id) {
    if (id.empty() || id == "." || id == "..") return false;
    return id.find('/') == std::string_view::npos && id.find('\0') == std::string_view::npos;
}

bool is_valid_extension(std::string_view ext) {
    return !ext.empty() && ext.front() == '.' && ext.size() < 10;
}

std::string extension_from_url(std::string_view url) {
    auto end = url.find_first_of("?#");
    std::string_view path = url.substr(0, end);
    auto slash = path.rfind('/');
    std::string_view name = slash == std::string_view::npos ? path : path.substr(slash + 1);
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) return ".jpg";
    return std::string(name.substr(dot));
}

std::string file_type_for_name(std::string_view name) {
    auto dot = name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == name.size()) return "unknown";
    return to_lower(name.substr(dot + 1));
}

std::string mime_for_extension(std::string_view ext) {
    if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);
    static const std::array<std::pair<std::string_view, std::string_view>, 22> kTypes = {{
        {"jpg", "image/jpeg"},   {"jpeg", "image/jpeg"},
        {"png", "image/png"},    {"gif", "image/gif"},
        {"webp", "image/webp"},  {"bmp", "image/bmp"},
        {"svg", "image/svg+xml"}, {"ico", "image/x-icon"},
        {"tiff", "image/tiff"},  {"tif", "image/tiff"},
        {"mp4", "video/mp4"},    {"m4v", "video/x-m4v"},
        {"mov", "video/quicktime"}, {"avi", "video/x-msvideo"},
        {"wmv", "video/x-ms-wmv"}, {"flv", "video/x-flv"},
        {"mkv", "video/x-matroska"}, {"webm", "video/webm"},
        {"3gp", "video/3gpp"},   {"ts", "video/mp2t"},
        {"m3u8", "application/vnd.apple.mpegurl"},
        {"txt", "text/plain"},
    }};
    auto lower = to_lower(ext);
    for (const auto& [key, mime] : kTypes) {
        if (key == lower) return std::string(mime);
    }
    return "application/octet-stream";
}

bool is_image_media(std::string_view mime, std::string_view file_type) {
    if (mime.starts_with("image/")) return true;
    return in_list(to_lower(file_type), kImageTypes);
}

bool is_video_media(std::string_view mime, std::string_view file_type) {
    if (mime.starts_with("video/")) return true;
    return in_list(to_lower(file_type), kVideoTypes);
}

}  // namespace mediavault
