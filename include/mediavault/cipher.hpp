#pragma once

#include "mediavault/errors.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediavault {

/// Fixed-length key stretched from an arbitrary secret by self-concatenation.
///
/// The key carries no version: rotating the secret makes every previously
/// written thumbnail, segment and playlist unreadable.
class EncryptionKey {
public:
    static constexpr size_t kLength = 32;

    /// Throws std::invalid_argument for an empty secret.
    static EncryptionKey derive(std::string_view secret);

    const std::array<uint8_t, kLength>& bytes() const { return bytes_; }

private:
    EncryptionKey() = default;
    std::array<uint8_t, kLength> bytes_{};
};

/// Byte-wise XOR keystream used to obscure derived artifacts at rest.
///
/// Obfuscation only, not confidentiality. Every unit (thumbnail, segment,
/// playlist) is transformed independently with the keystream starting at
/// position 0, so decrypt(encrypt(x)) == x and identical inputs always
/// produce identical outputs.
class CipherStream {
public:
    explicit CipherStream(const EncryptionKey& key) : key_(key) {}

    /// XOR data in place, keystream aligned to `offset` within the unit.
    void apply(uint8_t* data, size_t len, uint64_t offset = 0) const;

    std::vector<uint8_t> transform(std::span<const uint8_t> data) const;

    /// XOR then base64: the text form embedded in playlists and .enc files.
    std::string encrypt(std::span<const uint8_t> data) const;
    std::string encrypt(std::string_view text) const;

    /// nullopt if the token is not valid base64.
    std::optional<std::vector<uint8_t>> decrypt(std::string_view token) const;

    /// XOR a binary file in place (HLS segments). Streams in fixed blocks.
    Status transform_file(const std::filesystem::path& path) const;

    /// Write encrypt(data) as text via temp file + rename.
    Status write_token_file(const std::filesystem::path& path,
                            std::span<const uint8_t> data) const;

    /// Read and decrypt a token file. nullopt if missing or undecodable.
    std::optional<std::vector<uint8_t>> read_token_file(const std::filesystem::path& path) const;

private:
    EncryptionKey key_;
};

}  // namespace mediavault
