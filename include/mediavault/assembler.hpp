#pragma once

#include "mediavault/errors.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediavault {

/// An enumerated, contiguous chunk set on disk.
struct ChunkSet {
    std::filesystem::path dir;
    std::string file_id;
    std::vector<std::filesystem::path> chunks;  // index order
    std::string extension;
};

struct AssembleResult {
    bool success = false;
    std::vector<uint8_t> data;
    std::string extension;
    std::filesystem::path dir;  // directory the set was found in
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
};

/// Receives assembled bytes in order. Returning false stops the stream.
using ByteSink = std::function<bool(const uint8_t* data, size_t len)>;

/// Reconstructs payloads from chunk sets.
///
/// Chunks are ordered by the numeric suffix parsed from each file name,
/// never by directory listing order, and enumeration stops at the first
/// missing index.
class Assembler {
public:
    explicit Assembler(size_t read_increment = 8192) : read_increment_(read_increment) {}

    /// Chunk paths of `file_id` in `base`; empty if chunk 0 is absent.
    static std::vector<std::filesystem::path> list_chunks(const std::filesystem::path& base,
                                                          std::string_view file_id);

    /// `{id}.ext`, then the legacy `{id}` sidecar, then ".jpg". Unreadable
    /// or malformed sidecars fall through to the next candidate.
    static std::string resolve_extension(const std::filesystem::path& base,
                                         std::string_view file_id);

    /// nullopt if the set has no chunk 0.
    static std::optional<ChunkSet> open(const std::filesystem::path& base,
                                        std::string_view file_id);

    /// First `{dir}/{file_id}` directory that exists among `date_dirs`.
    static std::optional<std::filesystem::path> locate(
        const std::vector<std::filesystem::path>& date_dirs, std::string_view file_id);

    AssembleResult assemble(const std::filesystem::path& base, std::string_view file_id) const;

    /// Search prioritized date directories for `{dir}/{file_id}`; fails with
    /// ChunkMissing if none holds the set.
    AssembleResult assemble_from(const std::vector<std::filesystem::path>& date_dirs,
                                 std::string_view file_id) const;

    /// Stream the set without materializing it.
    Status stream(const std::filesystem::path& base, std::string_view file_id,
                  const ByteSink& sink) const;

    /// Stream an explicit list of files in order. Fails with ChunkMissing on
    /// the first absent file.
    Status stream_files(const std::vector<std::filesystem::path>& files,
                        const ByteSink& sink) const;

    /// Concatenate an explicit list of files into `dest`.
    Status concat_to_file(const std::vector<std::filesystem::path>& files,
                          const std::filesystem::path& dest) const;

private:
    size_t read_increment_;
};

}  // namespace mediavault
