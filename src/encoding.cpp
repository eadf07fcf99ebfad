#include "mediavault/encoding.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace mediavault {

// ============================================================================
// Base64
// ============================================================================

namespace {

const char* base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table{};
    table.fill(-1);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(base64_chars[i])] = static_cast<int8_t>(i);
    }
    return table;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[data[i] >> 4];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

}  // namespace

std::string base64_encode(std::span<const uint8_t> data) {
    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);

    size_t i = 0;
    while (i < data.size()) {
        uint32_t octet_a = i < data.size() ? data[i++] : 0;
        uint32_t octet_b = i < data.size() ? data[i++] : 0;
        uint32_t octet_c = i < data.size() ? data[i++] : 0;

        uint32_t triple = (octet_a << 16) + (octet_b << 8) + octet_c;

        result += base64_chars[(triple >> 18) & 0x3F];
        result += base64_chars[(triple >> 12) & 0x3F];
        result += (i > data.size() + 1) ? '=' : base64_chars[(triple >> 6) & 0x3F];
        result += (i > data.size()) ? '=' : base64_chars[triple & 0x3F];
    }

    return result;
}

std::string base64_encode(std::string_view str) {
    return base64_encode(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

std::optional<std::vector<uint8_t>> base64_decode(std::string_view encoded) {
    static const std::array<int8_t, 256> decode_table = make_decode_table();

    std::vector<uint8_t> result;
    result.reserve(encoded.size() * 3 / 4);

    uint32_t val = 0;
    int bits = 0;
    size_t sextets = 0;
    size_t padding = 0;

    for (char c : encoded) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0) return std::nullopt;  // data after padding

        int8_t v = decode_table[static_cast<unsigned char>(c)];
        if (v < 0) return std::nullopt;

        val = (val << 6) | static_cast<uint32_t>(v);
        bits += 6;
        ++sextets;

        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
        }
    }

    size_t remainder = sextets % 4;
    if (remainder == 1) return std::nullopt;
    if (padding > 2) return std::nullopt;
    if (remainder != 0 && (sextets + padding) % 4 != 0) return std::nullopt;
    if (remainder == 0 && padding != 0) return std::nullopt;

    return result;
}

// ============================================================================
// URL encoding
// ============================================================================

std::string url_encode(std::string_view str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

std::string url_decode(std::string_view str) {
    std::string decoded;
    decoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '%' && i + 2 < str.size()) {
            int hi = hex_digit(str[i + 1]);
            int lo = hex_digit(str[i + 2]);
            if (hi >= 0 && lo >= 0) {
                decoded += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        decoded += str[i];
    }

    return decoded;
}

// ============================================================================
// MD5
// ============================================================================

struct Md5Hasher::Ctx {
    EVP_MD_CTX* md = nullptr;
    ~Ctx() {
        if (md) EVP_MD_CTX_free(md);
    }
};

Md5Hasher::Md5Hasher() : ctx_(std::make_unique<Ctx>()) {
    ctx_->md = EVP_MD_CTX_new();
    if (!ctx_->md || EVP_DigestInit_ex(ctx_->md, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("Cannot initialize MD5 digest");
    }
}

Md5Hasher::~Md5Hasher() = default;

void Md5Hasher::update(const void* data, size_t len) {
    if (len == 0) return;
    EVP_DigestUpdate(ctx_->md, data, len);
}

std::string Md5Hasher::finish() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    EVP_DigestFinal_ex(ctx_->md, digest, &digest_len);
    // Ready for reuse
    EVP_DigestInit_ex(ctx_->md, EVP_md5(), nullptr);
    return to_hex(digest, digest_len);
}

std::string md5_hex(std::span<const uint8_t> data) {
    Md5Hasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish();
}

std::string md5_hex(std::string_view str) {
    Md5Hasher hasher;
    hasher.update(str.data(), str.size());
    return hasher.finish();
}

std::optional<std::string> md5_file(const std::filesystem::path& path, size_t block_size) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) return std::nullopt;

    Md5Hasher hasher;
    std::vector<char> buf(block_size > 0 ? block_size : 4096);
    while (ifs) {
        ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = ifs.gcount();
        if (n > 0) hasher.update(buf.data(), static_cast<size_t>(n));
    }
    if (ifs.bad()) return std::nullopt;
    return hasher.finish();
}

// ============================================================================
// Identifiers
// ============================================================================

std::string make_uuid() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::string hex = to_hex(bytes, sizeof(bytes));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

}  // namespace mediavault
