#pragma once

#include "mediavault/assembler.hpp"
#include "mediavault/cipher.hpp"
#include "mediavault/errors.hpp"
#include "mediavault/hls.hpp"
#include "mediavault/record_store.hpp"
#include "mediavault/vault_config.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediavault {

struct ContentResult {
    bool success = false;
    std::vector<uint8_t> data;
    std::string content_type = "application/octet-stream";
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;  // never carries a filesystem path
};

/// Read side of the vault: reassembles stored items and serves the
/// derived artifacts. Deleted records are reported as not found.
class ContentService {
public:
    ContentService(const VaultConfig& config, const CipherStream& cipher, RecordStore& records);

    /// Stream a record's chunks in order without materializing them.
    Status stream_content(int64_t record_id, const ByteSink& sink);

    /// Whole payload, typed from the record's mime.
    ContentResult content(int64_t record_id);

    /// Decrypted thumb_{uuid}.enc.
    ContentResult thumbnail(int64_t record_id);

    /// Decrypted manifest with segment and key references routed through
    /// the content endpoint. A manifest that does not decrypt is served as
    /// plain text.
    ContentResult playlist(int64_t record_id);

    /// One segment from HLS/ (falling back to the storage directory).
    /// XORed segments are decrypted when the result starts with the
    /// transport-stream sync byte.
    ContentResult segment(int64_t record_id, const std::string& file_name);

    /// Key file from the storage directory or a VKey/ALL directory.
    ContentResult key(int64_t record_id, const std::string& key_name);

    /// Reassemble a remote acquisition stored under
    /// media_root/YYYYMMDD/{file_id}/{subdir}, newest date first.
    ContentResult local_variant(const std::string& file_id, const std::string& subdir);

    const HlsEndpoint& endpoint() const { return endpoint_; }

private:
    std::optional<MediaRecord> live_record(int64_t record_id, ContentResult& result);
    std::optional<std::filesystem::path> manifest_path(const MediaRecord& record) const;

    std::filesystem::path base_dir_;
    std::filesystem::path media_root_;
    std::filesystem::path upload_root_;
    const CipherStream& cipher_;
    RecordStore& records_;
    HlsEndpoint endpoint_;
    Assembler assembler_;
};

}  // namespace mediavault
