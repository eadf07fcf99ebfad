#include "mediavault/cipher.hpp"
#include "mediavault/encoding.hpp"
#include "mediavault/log.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace mediavault {

namespace {

constexpr size_t kFileBlock = 64 * 1024;

}  // namespace

// --- EncryptionKey ---

EncryptionKey EncryptionKey::derive(std::string_view secret) {
    if (secret.empty()) {
        throw std::invalid_argument("encryption secret must not be empty");
    }
    std::string stretched(secret);
    while (stretched.size() < kLength) {
        stretched += stretched;
    }

    EncryptionKey key;
    for (size_t i = 0; i < kLength; ++i) {
        key.bytes_[i] = static_cast<uint8_t>(stretched[i]);
    }
    return key;
}

// --- CipherStream ---

void CipherStream::apply(uint8_t* data, size_t len, uint64_t offset) const {
    const auto& key = key_.bytes();
    size_t k = static_cast<size_t>(offset % EncryptionKey::kLength);
    for (size_t i = 0; i < len; ++i) {
        data[i] ^= key[k];
        if (++k == EncryptionKey::kLength) k = 0;
    }
}

std::vector<uint8_t> CipherStream::transform(std::span<const uint8_t> data) const {
    std::vector<uint8_t> out(data.begin(), data.end());
    apply(out.data(), out.size());
    return out;
}

std::string CipherStream::encrypt(std::span<const uint8_t> data) const {
    return base64_encode(transform(data));
}

std::string CipherStream::encrypt(std::string_view text) const {
    return encrypt(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

std::optional<std::vector<uint8_t>> CipherStream::decrypt(std::string_view token) const {
    auto raw = base64_decode(token);
    if (!raw) return std::nullopt;
    apply(raw->data(), raw->size());
    return raw;
}

Status CipherStream::transform_file(const std::filesystem::path& path) const {
    std::fstream fs(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!fs) {
        log_error("Cannot open %s for in-place transform", path.c_str());
        return Status::failure(ErrorKind::StorageFailure, "cannot open artifact for encryption");
    }

    std::vector<char> buf(kFileBlock);
    uint64_t offset = 0;
    while (true) {
        fs.seekg(static_cast<std::streamoff>(offset));
        fs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = fs.gcount();
        if (n <= 0) break;
        fs.clear();

        apply(reinterpret_cast<uint8_t*>(buf.data()), static_cast<size_t>(n), offset);
        fs.seekp(static_cast<std::streamoff>(offset));
        fs.write(buf.data(), n);
        if (!fs) {
            log_error("Write failed while transforming %s", path.c_str());
            return Status::failure(ErrorKind::StorageFailure, "artifact encryption write failed");
        }
        offset += static_cast<uint64_t>(n);
        if (static_cast<size_t>(n) < buf.size()) break;
    }
    fs.flush();
    if (!fs) {
        return Status::failure(ErrorKind::StorageFailure, "artifact encryption flush failed");
    }
    return Status::success();
}

Status CipherStream::write_token_file(const std::filesystem::path& path,
                                      std::span<const uint8_t> data) const {
    auto token = encrypt(data);

    auto tmp_path = path;
    tmp_path += ".tmp." + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count());
    {
        std::ofstream ofs(tmp_path, std::ios::trunc);
        if (!ofs) {
            log_error("Cannot create %s", tmp_path.c_str());
            return Status::failure(ErrorKind::StorageFailure, "cannot create encrypted artifact");
        }
        ofs << token;
        ofs.close();
        if (!ofs.good()) {
            std::error_code ec;
            std::filesystem::remove(tmp_path, ec);
            return Status::failure(ErrorKind::StorageFailure, "encrypted artifact write failed");
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        log_error("Rename %s failed: %s", tmp_path.c_str(), ec.message().c_str());
        std::filesystem::remove(tmp_path, ec);
        return Status::failure(ErrorKind::StorageFailure, "encrypted artifact rename failed");
    }
    return Status::success();
}

std::optional<std::vector<uint8_t>> CipherStream::read_token_file(
    const std::filesystem::path& path) const {
    std::ifstream ifs(path);
    if (!ifs) return std::nullopt;
    std::string token((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return decrypt(token);
}

}  // namespace mediavault
