#include "mediavault/assembler.hpp"
#include "mediavault/chunk_store.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <utility>

namespace mediavault {

namespace {

std::optional<uint32_t> parse_chunk_index(std::string_view name, std::string_view prefix) {
    if (!name.starts_with(prefix)) return std::nullopt;
    auto digits = name.substr(prefix.size());
    if (digits.empty()) return std::nullopt;
    uint32_t index = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), index);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;
    return index;
}

std::optional<std::string> read_sidecar(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    char buf[64];
    in.read(buf, sizeof(buf));
    std::string content(buf, static_cast<size_t>(in.gcount()));
    auto first = content.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return std::nullopt;
    auto last = content.find_last_not_of(" \t\r\n");
    content = content.substr(first, last - first + 1);
    if (!is_valid_extension(content)) return std::nullopt;
    return content;
}

}  // namespace

std::vector<std::filesystem::path> Assembler::list_chunks(const std::filesystem::path& base,
                                                          std::string_view file_id) {
    std::string prefix = std::string(file_id) + ".part";
    std::vector<std::pair<uint32_t, std::filesystem::path>> found;

    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(base, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (auto index = parse_chunk_index(name, prefix)) {
            found.emplace_back(*index, it->path());
        }
    }
    std::sort(found.begin(), found.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::filesystem::path> chunks;
    for (auto& [index, path] : found) {
        if (index != chunks.size()) break;  // gap (or duplicate) ends the set
        chunks.push_back(std::move(path));
    }
    return chunks;
}

std::string Assembler::resolve_extension(const std::filesystem::path& base,
                                         std::string_view file_id) {
    if (auto ext = read_sidecar(extension_sidecar_path(base, file_id))) return *ext;
    // Older acquisitions wrote the extension into a file named after the id
    std::error_code ec;
    auto legacy = base / std::string(file_id);
    if (std::filesystem::is_regular_file(legacy, ec)) {
        if (auto ext = read_sidecar(legacy)) return *ext;
    }
    return ".jpg";
}

std::optional<ChunkSet> Assembler::open(const std::filesystem::path& base,
                                        std::string_view file_id) {
    auto chunks = list_chunks(base, file_id);
    if (chunks.empty()) return std::nullopt;
    ChunkSet set;
    set.dir = base;
    set.file_id = std::string(file_id);
    set.chunks = std::move(chunks);
    set.extension = resolve_extension(base, file_id);
    return set;
}

std::optional<std::filesystem::path> Assembler::locate(
    const std::vector<std::filesystem::path>& date_dirs, std::string_view file_id) {
    std::error_code ec;
    for (const auto& date_dir : date_dirs) {
        auto candidate = date_dir / std::string(file_id);
        if (std::filesystem::exists(candidate, ec)) return candidate;
    }
    return std::nullopt;
}

AssembleResult Assembler::assemble(const std::filesystem::path& base,
                                   std::string_view file_id) const {
    AssembleResult result;
    auto set = open(base, file_id);
    if (!set) {
        result.error_kind = ErrorKind::ChunkMissing;
        result.error_message = "no chunks found for " + std::string(file_id);
        return result;
    }

    Status st = stream_files(set->chunks, [&](const uint8_t* data, size_t len) {
        result.data.insert(result.data.end(), data, data + len);
        return true;
    });
    if (!st.ok()) {
        result.data.clear();
        result.error_kind = st.kind;
        result.error_message = st.message;
        return result;
    }

    result.success = true;
    result.extension = set->extension;
    result.dir = set->dir;
    log_info("Assembled %s from %zu chunks (%zu bytes)", set->file_id.c_str(),
             set->chunks.size(), result.data.size());
    return result;
}

AssembleResult Assembler::assemble_from(const std::vector<std::filesystem::path>& date_dirs,
                                        std::string_view file_id) const {
    auto dir = locate(date_dirs, file_id);
    if (!dir) {
        AssembleResult result;
        result.error_kind = ErrorKind::ChunkMissing;
        result.error_message = "no chunk directory found for " + std::string(file_id);
        return result;
    }
    return assemble(*dir, file_id);
}

Status Assembler::stream(const std::filesystem::path& base, std::string_view file_id,
                         const ByteSink& sink) const {
    auto chunks = list_chunks(base, file_id);
    if (chunks.empty()) {
        return Status::failure(ErrorKind::ChunkMissing,
                               "no chunks found for " + std::string(file_id));
    }
    return stream_files(chunks, sink);
}

Status Assembler::stream_files(const std::vector<std::filesystem::path>& files,
                               const ByteSink& sink) const {
    std::vector<uint8_t> block(read_increment_);
    for (size_t i = 0; i < files.size(); ++i) {
        std::ifstream in(files[i], std::ios::binary);
        if (!in) {
            log_error("Chunk missing: %s", files[i].c_str());
            return Status::failure(ErrorKind::ChunkMissing,
                                   "chunk " + std::to_string(i) + " is missing");
        }
        while (in) {
            in.read(reinterpret_cast<char*>(block.data()),
                    static_cast<std::streamsize>(block.size()));
            auto n = static_cast<size_t>(in.gcount());
            if (n == 0) break;
            if (!sink(block.data(), n)) {
                return Status::failure(ErrorKind::Cancelled, "stream stopped by receiver");
            }
        }
        if (in.bad()) {
            return Status::failure(ErrorKind::StorageFailure,
                                   "chunk " + std::to_string(i) + " is unreadable");
        }
    }
    return Status::success();
}

Status Assembler::concat_to_file(const std::vector<std::filesystem::path>& files,
                                 const std::filesystem::path& dest) const {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) {
        log_error("Cannot create %s", dest.c_str());
        return Status::failure(ErrorKind::StorageFailure, "cannot create assembled file");
    }
    Status st = stream_files(files, [&](const uint8_t* data, size_t len) {
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
        return static_cast<bool>(out);
    });
    out.close();
    if (!out) {
        st = Status::failure(ErrorKind::StorageFailure, "cannot write assembled file");
    }
    if (!st.ok()) {
        std::error_code ec;
        std::filesystem::remove(dest, ec);
    }
    return st;
}

}  // namespace mediavault
