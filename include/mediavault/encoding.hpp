#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mediavault {

// --- Base64 (standard alphabet, padded) ---

std::string base64_encode(std::span<const uint8_t> data);
std::string base64_encode(std::string_view str);

/// Strict decode. Whitespace is skipped; any other character outside the
/// alphabet, misplaced padding or a truncated final group yields nullopt.
std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded);

// --- URL encoding ---

/// Percent-encode everything except unreserved characters (RFC 3986).
std::string url_encode(std::string_view str);
std::string url_decode(std::string_view str);

// --- MD5 content hashing (OpenSSL EVP) ---

/// Incremental MD5, producing a lowercase hex digest.
class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();

    Md5Hasher(const Md5Hasher&) = delete;
    Md5Hasher& operator=(const Md5Hasher&) = delete;

    void update(const void* data, size_t len);
    std::string finish();

private:
    struct Ctx;
    std::unique_ptr<Ctx> ctx_;
};

std::string md5_hex(std::span<const uint8_t> data);
std::string md5_hex(std::string_view str);

/// Hash a file in block_size reads. nullopt if the file cannot be read.
std::optional<std::string> md5_file(const std::filesystem::path& path, size_t block_size = 4096);

// --- Identifiers ---

/// Random RFC 4122 version 4 UUID, lowercase with dashes.
std::string make_uuid();

}  // namespace mediavault
