// Test suite for mediavault.
//
// Tests:
//   1. Chunk sizing policy and chunk set round trips
//   2. Assembler lookup, extension resolution and gaps
//   3. CipherStream and encoding helpers
//   4. RetryingFetcher: backoff, session reset, fatal classes, harvesting
//   5. Remote acquisition: streaming, idempotence, retries, dedup, variants
//   6. Upload merge: verification, resubmission, rejections
//   7. Post-registration hooks, HLS conversion and content serving
//   8. Soft delete
//   9. Record store, storage references and configuration
//  10. External process runner
//  11. Metrics

#include "mediavault/assembler.hpp"
#include "mediavault/chunk_store.hpp"
#include "mediavault/cipher.hpp"
#include "mediavault/content.hpp"
#include "mediavault/dedup_index.hpp"
#include "mediavault/encoding.hpp"
#include "mediavault/fetcher.hpp"
#include "mediavault/hls.hpp"
#include "mediavault/ingest.hpp"
#include "mediavault/layout.hpp"
#include "mediavault/log.hpp"
#include "mediavault/metrics.hpp"
#include "mediavault/process.hpp"
#include "mediavault/record_store.hpp"
#include "mediavault/vault_config.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace mediavault;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return cond();
}

static std::vector<uint8_t> bytes_of(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::string string_of(const std::vector<uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

/// Deterministic non-repeating payload.
static std::string pattern(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i) s[i] = static_cast<char>((i * 31 + 7) % 251);
    return s;
}

/// Files in `dir` whose names start with `prefix`.
static size_t count_prefixed(const fs::path& dir, const std::string& prefix) {
    size_t n = 0;
    std::error_code ec;
    for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (it->path().filename().string().starts_with(prefix)) ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// Fakes
// ---------------------------------------------------------------------------

struct ScriptedResponse {
    int status = 200;
    NetworkError error = NetworkError::None;
    std::string body;
    size_t cut_after = std::string::npos;  // stream this many bytes then time out
};

/// Shared by every session the fetcher creates.
struct FakeServer {
    std::deque<ScriptedResponse> script;
    ScriptedResponse fallback;
    std::vector<std::string> urls;
    int requests = 0;
    size_t block = 7;
    std::function<void(size_t delivered)> on_block;  // after each accepted block

    HttpResponse respond(const HttpRequest& request) {
        ++requests;
        urls.push_back(request.url);
        ScriptedResponse next = fallback;
        if (!script.empty()) {
            next = script.front();
            script.pop_front();
        }

        HttpResponse response;
        if (next.error != NetworkError::None) {
            response.network_error = next.error;
            response.error = "scripted failure";
            return response;
        }
        response.status_code = next.status;
        response.headers.set("Content-Type", "application/json");

        if (!is_success_status(next.status) || !request.body_sink) {
            response.body = bytes_of(next.body);
            return response;
        }

        response.headers.set("Content-Length", std::to_string(next.body.size()));
        const HttpBodySink& sink = *request.body_sink;
        if (sink.on_start && !sink.on_start(next.status, response.headers)) {
            response.network_error = NetworkError::Aborted;
            return response;
        }
        size_t limit = std::min(next.cut_after, next.body.size());
        for (size_t off = 0; off < limit; off += block) {
            size_t n = std::min(block, limit - off);
            if (sink.on_data &&
                !sink.on_data(reinterpret_cast<const uint8_t*>(next.body.data()) + off, n)) {
                response.network_error = NetworkError::Aborted;
                return response;
            }
            if (on_block) on_block(off + n);
        }
        if (limit < next.body.size()) {
            response.network_error = NetworkError::Timeout;
            response.error = "scripted timeout mid-body";
        }
        return response;
    }
};

/// Hands out fixed-size blocks and cancels `token` once `cancel_after` bytes
/// have been read.
class CancellingSource : public ByteSource {
public:
    CancellingSource(std::string data, size_t block, size_t cancel_after,
                     CancellationToken& token)
        : data_(std::move(data)), block_(block), cancel_after_(cancel_after), token_(token) {}

    std::optional<uint64_t> size_hint() const override { return data_.size(); }

    Status read(uint8_t* buffer, size_t capacity, size_t* read) override {
        size_t n = std::min({block_, capacity, data_.size() - offset_});
        std::memcpy(buffer, data_.data() + offset_, n);
        offset_ += n;
        *read = n;
        if (offset_ >= cancel_after_) token_.cancel();
        return Status::success();
    }

private:
    std::string data_;
    size_t block_;
    size_t cancel_after_;
    CancellationToken& token_;
    size_t offset_ = 0;
};

class FakeTransport : public HttpTransport {
public:
    explicit FakeTransport(FakeServer& server) : server_(server) {}
    HttpResponse execute(const HttpRequest& request) override { return server_.respond(request); }

private:
    FakeServer& server_;
};

/// Stands in for the transcoder and frame extractor. Writes plausible
/// outputs where the real tool would.
class FakeProcessRunner : public ProcessRunner {
public:
    bool installed = true;
    int exit_code = 0;
    std::vector<std::vector<std::string>> calls;

    ProcessResult run(const std::vector<std::string>& argv, std::chrono::seconds) override {
        calls.push_back(argv);
        ProcessResult result;
        if (!installed) return result;
        result.launched = true;
        result.exit_code = exit_code;
        if (exit_code != 0) {
            result.stderr_output = "scripted failure";
            return result;
        }

        auto flag = std::find(argv.begin(), argv.end(), "-hls_segment_filename");
        if (flag != argv.end() && flag + 1 != argv.end()) {
            write_hls(*(flag + 1), argv.back());
        } else if (std::find(argv.begin(), argv.end(), "-vframes") != argv.end()) {
            write_file(argv.back(), "\xFF\xD8 fake jpeg");
        }
        return result;
    }

    static std::string segment_payload(int i) {
        return std::string(1, '\x47') + "segment payload " + std::to_string(i);
    }

private:
    static void write_hls(const std::string& segment_pattern, const fs::path& manifest) {
        std::string manifest_text =
            "#EXTM3U\n#EXT-X-VERSION:3\n#EXT-X-TARGETDURATION:10\n"
            "#EXT-X-KEY:METHOD=AES-128,URI=\"enc.key\"\n";
        for (int i = 0; i < 2; ++i) {
            std::string path = segment_pattern;
            auto pos = path.find("%03d");
            char num[8];
            std::snprintf(num, sizeof(num), "%03d", i);
            path.replace(pos, 4, num);
            write_file(path, segment_payload(i));
            manifest_text += "#EXTINF:10.0,\n" + fs::path(path).filename().string() + "\n";
        }
        manifest_text += "#EXT-X-ENDLIST\n";
        write_file(manifest, manifest_text);
    }
};

static VaultConfig make_config(const fs::path& root) {
    VaultConfig config;
    config.base_dir = root;
    config.secret = "unit-test-secret";
    config.max_retries = 4;
    config.base_delay_secs = 1;
    config.page_delay_ms = 0;
    config.chunk_size_threshold = 64;
    config.chunk_size_large = 16;
    config.chunk_count_small = 3;
    config.read_chunk_size = 5;
    config.md5_block_size = 7;
    config.apply_defaults();
    return config;
}

/// One vault on a temp directory with fake network and tools.
struct Vault {
    fs::path root;
    VaultConfig config;
    FakeServer server;
    std::vector<std::chrono::milliseconds> sleeps;
    SqliteRecordStore records;
    DedupIndex dedup;
    ChunkStore store;
    RetryingFetcher fetcher;
    CipherStream cipher;
    FakeProcessRunner runner;
    HlsSegmenter segmenter;
    IngestionPipeline pipeline;

    explicit Vault(const std::string& prefix)
        : root(make_temp_dir(prefix))
        , config(make_config(root))
        , records(":memory:")
        , dedup(records)
        , store(config.chunk_policy())
        , fetcher(config.fetch_policy(),
                  [this] { return std::make_unique<FakeTransport>(server); },
                  [this](std::chrono::milliseconds d) { sleeps.push_back(d); })
        , cipher(EncryptionKey::derive(config.secret))
        , segmenter(cipher, runner, HlsOptions{}, HlsEndpoint{config.content_endpoint},
                    config.base_dir)
        , pipeline(config, fetcher, store, dedup) {}

    ~Vault() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void enable_hooks() {
        pipeline.add_hook(std::make_unique<ThumbnailHook>(cipher, runner));
        pipeline.add_hook(std::make_unique<HlsHook>(segmenter));
    }

    /// Upload pieces and return the merge request that names them.
    MergeRequest upload(const std::string& name,
                        const std::vector<std::pair<std::string, std::string>>& pieces) {
        std::string whole;
        for (const auto& [uuid, data] : pieces) whole += data;
        MergeRequest req;
        req.content_hash = md5_hex(whole);
        req.name = name;
        uint32_t index = 0;
        for (const auto& [uuid, data] : pieces) {
            auto bytes = bytes_of(data);
            pipeline.receive_chunk(req.content_hash, uuid, bytes);
            req.chunks.push_back({index++, uuid});
        }
        return req;
    }

    ContentService content() { return ContentService(config, cipher, records); }
};

// ---------------------------------------------------------------------------
// 1. Chunk sizing and round trips
// ---------------------------------------------------------------------------

static void test_chunk_store() {
    std::cout << "\n=== ChunkStore ===" << std::endl;

    ChunkSizePolicy policy;
    policy.threshold = 64;
    policy.small_count = 3;
    policy.large_chunk_size = 16;

    {
        TEST(unknown_size_uses_fixed_chunks);
        ASSERT_EQ(policy.chunk_size_for(std::nullopt), 16u, "unknown size");
        ASSERT_EQ(policy.chunk_size_for(0), 16u, "zero is treated as unknown");
        PASS();
    }
    {
        TEST(threshold_boundary);
        ASSERT_EQ(policy.chunk_size_for(63), 21u, "just below threshold splits in three");
        ASSERT_EQ(policy.chunk_size_for(64), 16u, "threshold itself uses fixed chunks");
        ASSERT_EQ(policy.chunk_size_for(10), 4u, "ceil(10/3)");
        PASS();
    }
    {
        TEST(policy_validation);
        ChunkSizePolicy bad = policy;
        bad.small_count = 0;
        ASSERT_NOT_EMPTY(bad.validate(), "zero chunk count should fail");
        ASSERT_EMPTY(policy.validate(), "valid policy");
        PASS();
    }

    auto tmpdir = make_temp_dir("mediavault-chunks");
    ChunkStore store(policy);
    Assembler assembler(5);

    {
        TEST(round_trip_sizes);
        for (size_t size : {0, 1, 15, 16, 17, 63, 64, 640}) {
            std::string id = "item" + std::to_string(size);
            auto payload = pattern(size);
            auto bytes = bytes_of(payload);
            auto written = store.write_bytes(tmpdir, id, bytes, ".bin");
            ASSERT_TRUE(written.success, "write " + id + ": " + written.error_message);
            ASSERT_EQ(written.bytes_written, size, "bytes written for " + id);

            auto assembled = assembler.assemble(tmpdir, id);
            ASSERT_TRUE(assembled.success, "assemble " + id);
            ASSERT_TRUE(string_of(assembled.data) == payload, "round trip mismatch for " + id);
            ASSERT_EQ(assembled.extension, std::string(".bin"), "extension for " + id);
            ASSERT_EQ(count_prefixed(tmpdir, id + ".part0.tmp"), 0u, "no pending chunk 0");
        }
        ASSERT_EQ(store.count_existing(tmpdir, "item0"), 1u, "empty payload is one chunk");
        ASSERT_EQ(store.count_existing(tmpdir, "item63"), 3u, "small file splits in three");
        ASSERT_EQ(store.count_existing(tmpdir, "item64"), 4u, "threshold uses fixed chunks");
        ASSERT_EQ(store.count_existing(tmpdir, "item640"), 40u, "large file");
        PASS();
    }
    {
        TEST(second_write_is_skipped);
        auto bytes = bytes_of("different content");
        auto again = store.write_bytes(tmpdir, "item17", bytes, ".bin");
        ASSERT_TRUE(again.success && again.skipped, "existing set should be skipped");
        ASSERT_EQ(again.chunk_count, 3u, "reports existing chunk count");
        auto assembled = assembler.assemble(tmpdir, "item17");
        ASSERT_TRUE(string_of(assembled.data) == pattern(17), "content unchanged");
        PASS();
    }
    {
        TEST(leftovers_of_interrupted_write_removed);
        write_file(tmpdir / "ghost.part0.tmp", "half");
        write_file(tmpdir / "ghost.part1", "stale");
        auto writer = store.open_writer(tmpdir, "ghost");
        ASSERT_TRUE(!fs::exists(tmpdir / "ghost.part0.tmp"), "pending chunk removed");
        ASSERT_TRUE(!fs::exists(tmpdir / "ghost.part1"), "orphan chunk removed");
        PASS();
    }
    {
        TEST(cancelled_write_leaves_nothing);
        CancellationToken token;
        token.cancel();
        auto payload = bytes_of(pattern(100));
        MemorySource source(payload);
        auto result = store.write_sequential(tmpdir, "cancelled", source, ".bin", &token);
        ASSERT_TRUE(!result.success, "cancelled write should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::Cancelled, "error kind cancelled");
        ASSERT_EQ(count_prefixed(tmpdir, "cancelled.part"), 0u, "no chunk files left");
        PASS();
    }
    {
        TEST(cancel_midway_removes_written_chunks);
        CancellationToken token;
        CancellingSource source(pattern(100), 7, 40, token);
        auto result = store.write_sequential(tmpdir, "midway", source, ".bin", &token);
        ASSERT_TRUE(!result.success, "cancelled write should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::Cancelled, "error kind cancelled");
        ASSERT_EQ(count_prefixed(tmpdir, "midway.part"), 0u, "chunks and pending chunk 0 removed");
        ASSERT_EQ(count_prefixed(tmpdir, "midway"), 0u, "nothing else for the id");
        ASSERT_TRUE(!store.exists(tmpdir, "midway"), "set does not exist");
        PASS();
    }
    {
        TEST(invalid_file_id_rejected);
        auto payload = bytes_of("x");
        auto result = store.write_bytes(tmpdir, "../escape", payload, ".bin");
        ASSERT_TRUE(result.error_kind == ErrorKind::InvalidArgument, "path traversal rejected");
        PASS();
    }
    {
        TEST(remove_set);
        size_t removed = store.remove_set(tmpdir, "item63");
        ASSERT_EQ(removed, 4u, "three chunks and the sidecar");
        ASSERT_TRUE(!store.exists(tmpdir, "item63"), "set is gone");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 2. Assembler
// ---------------------------------------------------------------------------

static void test_assembler() {
    std::cout << "\n=== Assembler ===" << std::endl;

    auto tmpdir = make_temp_dir("mediavault-assembler");
    auto d1 = tmpdir / "20240102";
    auto d2 = tmpdir / "20240101";
    write_file(d2 / "77" / "77.part0", "AB");
    write_file(d2 / "77" / "77.part1", "CD");
    write_file(d2 / "77" / "77.ext", ".png\n");
    Assembler assembler;

    {
        TEST(falls_back_through_date_dirs);
        auto result = assembler.assemble_from({d1, d2}, "77");
        ASSERT_TRUE(result.success, "should find the set in the second directory");
        ASSERT_EQ(string_of(result.data), std::string("ABCD"), "assembled content");
        ASSERT_EQ(result.extension, std::string(".png"), "sidecar extension");
        ASSERT_TRUE(result.dir == d2 / "77", "reports the directory used");
        PASS();
    }
    {
        TEST(missing_everywhere_is_chunk_missing);
        auto result = assembler.assemble_from({d1, d2}, "78");
        ASSERT_TRUE(!result.success, "should fail");
        ASSERT_TRUE(result.error_kind == ErrorKind::ChunkMissing, "ChunkMissing");
        ASSERT_TRUE(result.error_message.find(tmpdir.string()) == std::string::npos,
                    "message must not carry a path");
        PASS();
    }
    {
        TEST(legacy_extension_file);
        write_file(tmpdir / "legacy" / "9.part0", "x");
        write_file(tmpdir / "legacy" / "9", ".gif");
        ASSERT_EQ(Assembler::resolve_extension(tmpdir / "legacy", "9"), std::string(".gif"),
                  "legacy id-named file");
        PASS();
    }
    {
        TEST(invalid_extension_defaults_to_jpg);
        write_file(tmpdir / "bad" / "5.ext", "png");
        ASSERT_EQ(Assembler::resolve_extension(tmpdir / "bad", "5"), std::string(".jpg"),
                  "no leading dot");
        write_file(tmpdir / "bad" / "6.ext", ".verylongext");
        ASSERT_EQ(Assembler::resolve_extension(tmpdir / "bad", "6"), std::string(".jpg"),
                  "too long");
        ASSERT_EQ(Assembler::resolve_extension(tmpdir / "bad", "none"), std::string(".jpg"),
                  "absent");
        PASS();
    }
    {
        TEST(gap_ends_the_set);
        write_file(tmpdir / "gap" / "g.part0", "a");
        write_file(tmpdir / "gap" / "g.part2", "c");
        write_file(tmpdir / "gap" / "g.part10", "k");
        auto chunks = Assembler::list_chunks(tmpdir / "gap", "g");
        ASSERT_EQ(chunks.size(), 1u, "only chunk 0 before the gap");
        PASS();
    }
    {
        TEST(stream_files_reports_missing_index);
        std::vector<fs::path> files = {d2 / "77" / "77.part0", d2 / "77" / "nope"};
        std::string out;
        Status st = assembler.stream_files(files, [&](const uint8_t* data, size_t len) {
            out.append(reinterpret_cast<const char*>(data), len);
            return true;
        });
        ASSERT_TRUE(st.kind == ErrorKind::ChunkMissing, "missing file");
        ASSERT_EQ(st.message, std::string("chunk 1 is missing"), "names the index");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 3. Cipher and encoding
// ---------------------------------------------------------------------------

static void test_cipher() {
    std::cout << "\n=== CipherStream ===" << std::endl;

    CipherStream cipher(EncryptionKey::derive("secret-one"));
    CipherStream other(EncryptionKey::derive("secret-two"));
    auto plain = bytes_of(pattern(300));

    {
        TEST(transform_is_an_involution);
        auto once = cipher.transform(plain);
        ASSERT_TRUE(once != plain, "ciphertext should differ");
        ASSERT_TRUE(cipher.transform(once) == plain, "applying twice restores input");
        std::vector<uint8_t> empty;
        ASSERT_TRUE(cipher.transform(empty).empty(), "empty input");
        auto empty_back = cipher.decrypt(cipher.encrypt(empty));
        ASSERT_TRUE(empty_back && empty_back->empty(), "empty token round trip");
        PASS();
    }
    {
        TEST(encryption_is_deterministic);
        ASSERT_EQ(cipher.encrypt(plain), cipher.encrypt(plain), "same input, same output");
        ASSERT_TRUE(cipher.encrypt(plain) != other.encrypt(plain), "key matters");
        PASS();
    }
    {
        TEST(decrypt_inverts_encrypt);
        auto token = cipher.encrypt(std::string_view("#EXTM3U\nplaylist"));
        auto back = cipher.decrypt(token);
        ASSERT_TRUE(back.has_value(), "token should decode");
        ASSERT_EQ(string_of(*back), std::string("#EXTM3U\nplaylist"), "round trip");
        ASSERT_TRUE(!cipher.decrypt("#EXTM3U not base64").has_value(), "plaintext is rejected");
        PASS();
    }
    {
        TEST(offset_aligned_keystream);
        auto whole = plain;
        cipher.apply(whole.data(), whole.size());
        auto split = plain;
        cipher.apply(split.data(), 100, 0);
        cipher.apply(split.data() + 100, split.size() - 100, 100);
        ASSERT_TRUE(whole == split, "piecewise application matches whole");
        PASS();
    }
    {
        TEST(files_transform_in_place);
        auto tmpdir = make_temp_dir("mediavault-cipher");
        auto path = tmpdir / "seg.ts";
        write_file(path, "\x47segment");
        ASSERT_TRUE(cipher.transform_file(path).ok(), "first pass");
        ASSERT_TRUE(read_file(path) != "\x47segment", "content changed");
        ASSERT_TRUE(cipher.transform_file(path).ok(), "second pass");
        ASSERT_EQ(read_file(path), std::string("\x47segment"), "restored");

        auto token_path = tmpdir / "thumb.enc";
        auto image = bytes_of("image bytes");
        ASSERT_TRUE(cipher.write_token_file(token_path, image).ok(), "token write");
        auto read_back = cipher.read_token_file(token_path);
        ASSERT_TRUE(read_back && *read_back == image, "token read");
        ASSERT_TRUE(!cipher.read_token_file(tmpdir / "absent.enc"), "missing file");
        fs::remove_all(tmpdir);
        PASS();
    }

    std::cout << "\n=== Encoding ===" << std::endl;

    {
        TEST(base64_known_vectors);
        ASSERT_EQ(base64_encode(std::string_view("hello")), std::string("aGVsbG8="), "encode");
        auto decoded = base64_decode("aGVsbG8=");
        ASSERT_TRUE(decoded && string_of(*decoded) == "hello", "decode");
        ASSERT_TRUE(!base64_decode("a$b").has_value(), "invalid input");
        PASS();
    }
    {
        TEST(md5_known_vectors);
        ASSERT_EQ(md5_hex(std::string_view("")), std::string("d41d8cd98f00b204e9800998ecf8427e"),
                  "empty");
        ASSERT_EQ(md5_hex(std::string_view("abc")), std::string("900150983cd24fb0d6963f7d28e17f72"),
                  "abc");
        Md5Hasher hasher;
        hasher.update("a", 1);
        hasher.update("bc", 2);
        ASSERT_EQ(hasher.finish(), md5_hex(std::string_view("abc")), "incremental");
        PASS();
    }
    {
        TEST(md5_file_block_independent);
        auto tmpdir = make_temp_dir("mediavault-md5");
        write_file(tmpdir / "f", pattern(1000));
        auto a = md5_file(tmpdir / "f", 7);
        auto b = md5_file(tmpdir / "f", 4096);
        ASSERT_TRUE(a && b && *a == *b, "block size must not change the digest");
        ASSERT_EQ(*a, md5_hex(std::string_view(pattern(1000))), "matches in-memory digest");
        ASSERT_TRUE(!md5_file(tmpdir / "none"), "missing file");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(url_encoding);
        ASSERT_EQ(url_encode("a b/c"), std::string("a%20b%2Fc"), "reserved characters");
        ASSERT_EQ(url_decode("a%20b%2Fc"), std::string("a b/c"), "decode");
        PASS();
    }
    {
        TEST(uuid_format);
        auto id = make_uuid();
        ASSERT_EQ(id.size(), 36u, "canonical length");
        ASSERT_TRUE(id != make_uuid(), "unique");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 4. RetryingFetcher
// ---------------------------------------------------------------------------

static void test_fetcher() {
    std::cout << "\n=== RetryingFetcher ===" << std::endl;

    using std::chrono::milliseconds;

    {
        TEST(exponential_backoff);
        FetchPolicy policy;
        policy.base_delay = milliseconds(1000);
        ASSERT_EQ(policy.backoff_for(1).count(), 1000, "first retry");
        ASSERT_EQ(policy.backoff_for(2).count(), 2000, "second retry");
        ASSERT_EQ(policy.backoff_for(3).count(), 4000, "third retry");
        PASS();
    }
    {
        TEST(timeouts_then_success);
        Vault v("mediavault-fetch");
        v.server.script = {{0, NetworkError::Timeout}, {0, NetworkError::Timeout},
                           {0, NetworkError::Timeout}, {200, NetworkError::None, "ok"}};
        auto result = v.fetcher.fetch("http://remote/item");
        ASSERT_TRUE(result.success, "fourth attempt succeeds");
        ASSERT_EQ(result.attempts, 4, "attempts");
        ASSERT_EQ(result.body_string(), std::string("ok"), "body");
        ASSERT_EQ(v.sleeps.size(), 3u, "three backoff sleeps");
        ASSERT_EQ(v.sleeps[0].count(), 1000, "base");
        ASSERT_EQ(v.sleeps[1].count(), 2000, "2 * base");
        ASSERT_EQ(v.sleeps[2].count(), 4000, "4 * base");
        PASS();
    }
    {
        TEST(retries_exhausted);
        Vault v("mediavault-fetch");
        v.server.fallback = {503};
        auto result = v.fetcher.fetch("http://remote/item");
        ASSERT_TRUE(!result.success, "should give up");
        ASSERT_EQ(result.attempts, 4, "max_retries is the total attempt count");
        ASSERT_TRUE(result.error_kind == ErrorKind::ServerTransient, "server error kind");
        ASSERT_EQ(v.sleeps.size(), 3u, "no sleep after the last attempt");
        PASS();
    }
    {
        TEST(forbidden_recreates_session);
        Vault v("mediavault-fetch");
        v.server.fallback = {403};
        auto result = v.fetcher.fetch("http://remote/item");
        ASSERT_TRUE(result.error_kind == ErrorKind::AuthChallenge, "auth challenge");
        ASSERT_EQ(result.attempts, 4, "403 is retried");
        ASSERT_EQ(v.fetcher.sessions().sessions_created(), 4u, "fresh session per attempt");
        PASS();
    }
    {
        TEST(forbidden_then_success);
        Vault v("mediavault-fetch");
        v.server.script = {{403}, {200, NetworkError::None, "fine"}};
        auto result = v.fetcher.fetch("http://remote/item");
        ASSERT_TRUE(result.success, "recovered");
        ASSERT_EQ(v.fetcher.sessions().sessions_created(), 2u, "one reset");
        PASS();
    }
    {
        TEST(not_found_fails_at_once);
        Vault v("mediavault-fetch");
        v.server.fallback = {404};
        auto result = v.fetcher.fetch("http://remote/item");
        ASSERT_EQ(result.attempts, 1, "no retry for 404");
        ASSERT_TRUE(result.error_kind == ErrorKind::ClientRejected, "client rejected");
        ASSERT_TRUE(v.sleeps.empty(), "no backoff");
        PASS();
    }
    {
        TEST(undecodable_json_not_retried);
        Vault v("mediavault-fetch");
        v.server.fallback = {200, NetworkError::None, "<html>"};
        auto result = v.fetcher.fetch_json("http://remote/api");
        ASSERT_TRUE(!result.success(), "decode failure");
        ASSERT_TRUE(result.fetch.error_kind == ErrorKind::PayloadInvalid, "payload invalid");
        ASSERT_EQ(v.server.requests, 1, "single request");
        PASS();
    }
    {
        TEST(cancelled_before_start);
        Vault v("mediavault-fetch");
        CancellationToken token;
        token.cancel();
        auto result = v.fetcher.fetch("http://remote/item", {}, {}, &token);
        ASSERT_TRUE(result.error_kind == ErrorKind::Cancelled, "cancelled");
        ASSERT_EQ(v.server.requests, 0, "no request sent");
        PASS();
    }
    {
        TEST(api_key_not_logged_in_error);
        Vault v("mediavault-fetch");
        v.server.fallback = {500};
        auto result = v.fetcher.fetch("http://remote/api", {{"api_key", "topsecret"}});
        ASSERT_TRUE(result.error_message.find("topsecret") == std::string::npos,
                    "error text must not carry query secrets");
        PASS();
    }

    std::cout << "\n=== Page harvesting ===" << std::endl;

    {
        TEST(failed_page_is_isolated);
        Vault v("mediavault-harvest");
        v.server.script = {{200, NetworkError::None, R"({"items":[1]})"},
                           {404, NetworkError::None, "gone"},
                           {200, NetworkError::None, R"({"items":[3]})"}};
        HarvestRequest req;
        req.url = "http://remote/list";
        req.start_page = 1;
        req.end_page = 3;
        req.limit = 10;
        std::vector<int> seen;
        auto batch = v.fetcher.harvest_pages(req, [&](int page, const nlohmann::json& doc) {
            if (doc.contains("items")) seen.push_back(page);
        });
        ASSERT_EQ(batch.success_count, 2u, "two pages");
        ASSERT_EQ(batch.failed_count, 1u, "one failure");
        ASSERT_EQ(batch.total, 3u, "total");
        ASSERT_EQ(batch.errors[0].subject, std::string("page 2"), "failed page named");
        ASSERT_TRUE(seen == std::vector<int>({1, 3}), "handler saw pages 1 and 3");
        ASSERT_TRUE(v.server.urls[0].find("page=1&limit=10") != std::string::npos,
                    "pagination parameters");
        PASS();
    }
    {
        TEST(handler_exception_marks_page_failed);
        Vault v("mediavault-harvest");
        v.server.fallback = {200, NetworkError::None, R"({"items":[]})"};
        HarvestRequest req;
        req.url = "http://remote/list";
        req.end_page = 2;
        auto batch = v.fetcher.harvest_pages(req, [](int page, const nlohmann::json&) {
            if (page == 1) throw std::runtime_error("bad page");
        });
        ASSERT_EQ(batch.success_count, 1u, "page 2 ok");
        ASSERT_EQ(batch.failed_count, 1u, "page 1 failed");
        PASS();
    }
    {
        TEST(invalid_range_is_empty);
        Vault v("mediavault-harvest");
        HarvestRequest req;
        req.url = "http://remote/list";
        req.start_page = 3;
        req.end_page = 1;
        auto batch = v.fetcher.harvest_pages(req, {});
        ASSERT_EQ(batch.total, 0u, "nothing attempted");
        ASSERT_EQ(v.server.requests, 0, "no requests");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 5. Remote acquisition
// ---------------------------------------------------------------------------

static void test_acquire() {
    std::cout << "\n=== Remote acquisition ===" << std::endl;

    const std::string body = pattern(100);

    {
        TEST(streams_into_chunks);
        Vault v("mediavault-acquire");
        v.server.fallback = {200, NetworkError::None, body};
        AcquireRequest req;
        req.url = "http://remote/files/photo.png?sig=1";
        req.base_dir = v.root / "sets";
        req.file_id = "1001";
        auto result = v.pipeline.acquire(req);
        ASSERT_TRUE(result.success, "acquire: " + result.error_message);
        ASSERT_EQ(result.chunk_count, 7u, "100 bytes in 16-byte chunks");
        ASSERT_EQ(result.bytes, 100u, "bytes");
        ASSERT_EQ(result.content_hash, md5_hex(std::string_view(body)), "streamed hash");

        auto assembled = Assembler().assemble(req.base_dir, "1001");
        ASSERT_TRUE(string_of(assembled.data) == body, "content");
        ASSERT_EQ(assembled.extension, std::string(".png"), "extension from URL");
        PASS();
    }
    {
        TEST(existing_set_skips_network);
        Vault v("mediavault-acquire");
        v.server.fallback = {200, NetworkError::None, body};
        AcquireRequest req;
        req.url = "http://remote/files/a.jpg";
        req.base_dir = v.root / "sets";
        req.file_id = "1002";
        ASSERT_TRUE(v.pipeline.acquire(req).success, "first acquire");
        auto again = v.pipeline.acquire(req);
        ASSERT_TRUE(again.success && again.skipped, "second acquire skipped");
        ASSERT_EQ(again.chunk_count, 7u, "existing count reported");
        ASSERT_EQ(v.server.requests, 1, "one network call in total");
        PASS();
    }
    {
        TEST(retry_discards_partial_body);
        Vault v("mediavault-acquire");
        ScriptedResponse cut{200, NetworkError::None, body};
        cut.cut_after = 40;
        v.server.script = {cut, {200, NetworkError::None, body}};
        AcquireRequest req;
        req.url = "http://remote/files/b.jpg";
        req.base_dir = v.root / "sets";
        req.file_id = "1003";
        auto result = v.pipeline.acquire(req);
        ASSERT_TRUE(result.success, "second attempt succeeds");
        ASSERT_EQ(result.attempts, 2, "two attempts");
        ASSERT_EQ(result.content_hash, md5_hex(std::string_view(body)), "hash of one copy");
        ASSERT_EQ(count_prefixed(req.base_dir, "1003.part"), 7u, "no stale chunk files");
        auto assembled = Assembler().assemble(req.base_dir, "1003");
        ASSERT_TRUE(string_of(assembled.data) == body, "content not duplicated");
        PASS();
    }
    {
        TEST(cancel_during_download_removes_chunks);
        Vault v("mediavault-acquire");
        v.server.fallback = {200, NetworkError::None, body};
        AcquireRequest req;
        req.url = "http://remote/files/c.jpg";
        req.base_dir = v.root / "sets";
        req.file_id = "1010";

        CancellationToken token;
        size_t seen = 0;
        v.server.on_block = [&](size_t delivered) {
            seen = delivered;
            // Two full 16-byte chunks are on disk by now
            if (delivered >= 40) token.cancel();
        };
        auto result = v.pipeline.acquire(req, &token);
        ASSERT_TRUE(!result.success, "cancelled acquire fails");
        ASSERT_TRUE(result.error_kind == ErrorKind::Cancelled, "error kind cancelled");
        ASSERT_TRUE(seen >= 40 && seen < body.size(), "cancelled mid-body");
        ASSERT_EQ(v.server.requests, 1, "not retried");
        ASSERT_TRUE(v.sleeps.empty(), "no backoff");
        ASSERT_EQ(count_prefixed(req.base_dir, "1010.part"), 0u, "no chunk files left");
        ASSERT_TRUE(!v.store.exists(req.base_dir, "1010"), "set does not exist");
        PASS();
    }
    {
        TEST(failed_download_leaves_no_set);
        Vault v("mediavault-acquire");
        v.server.fallback = {404, NetworkError::None, "missing"};
        AcquireRequest req;
        req.url = "http://remote/files/c.jpg";
        req.base_dir = v.root / "sets";
        req.file_id = "1004";
        auto result = v.pipeline.acquire(req);
        ASSERT_TRUE(!result.success, "404 fails");
        ASSERT_TRUE(result.error_kind == ErrorKind::ClientRejected, "client rejected");
        ASSERT_TRUE(!v.store.exists(req.base_dir, "1004"), "no chunk 0");
        ASSERT_EQ(count_prefixed(req.base_dir, "1004"), 0u, "no files at all");
        PASS();
    }
    {
        TEST(expected_hash_mismatch_removes_set);
        Vault v("mediavault-acquire");
        v.server.fallback = {200, NetworkError::None, body};
        AcquireRequest req;
        req.url = "http://remote/files/d.jpg";
        req.base_dir = v.root / "sets";
        req.file_id = "1005";
        req.expected_hash = md5_hex(std::string_view("something else"));
        auto result = v.pipeline.acquire(req);
        ASSERT_TRUE(result.error_kind == ErrorKind::HashMismatch, "hash mismatch");
        ASSERT_TRUE(!v.store.exists(req.base_dir, "1005"), "set removed");
        PASS();
    }
    {
        TEST(same_content_registers_once);
        Vault v("mediavault-acquire");
        v.server.fallback = {200, NetworkError::None, body};
        AcquireRequest first;
        first.url = "http://remote/files/e.jpg";
        first.base_dir = v.root / "sets" / "a";
        first.file_id = "2001";
        first.register_record = true;
        first.name = "e.jpg";
        auto r1 = v.pipeline.acquire(first);
        ASSERT_TRUE(r1.success && r1.record, "first registered");
        ASSERT_TRUE(!r1.duplicate, "first is new");

        AcquireRequest second = first;
        second.base_dir = v.root / "sets" / "b";
        second.file_id = "2002";
        auto r2 = v.pipeline.acquire(second);
        ASSERT_TRUE(r2.success && r2.duplicate, "second is a duplicate");
        ASSERT_EQ(r2.record->id, r1.record->id, "same record");
        ASSERT_TRUE(!v.store.exists(second.base_dir, "2002"), "duplicate copy removed");
        ASSERT_EQ(v.records.count(), 1u, "one record");

        auto again = v.pipeline.acquire(first);
        ASSERT_TRUE(again.skipped && again.duplicate, "skipped set is hashed from disk");
        ASSERT_EQ(again.record->id, r1.record->id, "same record");
        PASS();
    }
    {
        TEST(variants_isolate_failures);
        Vault v("mediavault-acquire");
        v.server.fallback = {200, NetworkError::None, body};
        std::vector<VariantSpec> variants = {
            {"preview", "http://remote/p/3001.jpg", ".jpg"},
            {"full", "", ""},
        };
        auto batch = v.pipeline.acquire_variants("3001", variants);
        ASSERT_EQ(batch.success_count, 1u, "preview stored");
        ASSERT_EQ(batch.failed_count, 1u, "empty URL fails");
        ASSERT_EQ(batch.errors[0].subject, std::string("full"), "failed variant named");
        ASSERT_TRUE(fs::exists(partition_dir(v.config.media_root, "3001", "preview")),
                    "date-partitioned variant directory");

        auto content = v.content().local_variant("3001", "preview");
        ASSERT_TRUE(content.success, "variant served");
        ASSERT_TRUE(string_of(content.data) == body, "variant content");
        ASSERT_EQ(content.content_type, std::string("image/jpeg"), "type from sidecar");

        auto missing = v.content().local_variant("3001", "full");
        ASSERT_TRUE(missing.error_kind == ErrorKind::NotFound, "missing variant");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 6. Upload merge
// ---------------------------------------------------------------------------

static void test_merge() {
    std::cout << "\n=== Upload merge ===" << std::endl;

    {
        TEST(merge_verifies_and_registers);
        Vault v("mediavault-merge");
        auto req = v.upload("notes.txt", {{"u-a", "AAA"}, {"u-b", "BBB"}, {"u-c", "CCC"}});
        std::swap(req.chunks[0], req.chunks[2]);  // declared order does not matter

        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.success, "merge: " + result.error_message);
        ASSERT_TRUE(!result.exists, "new content");
        ASSERT_TRUE(result.state == MergeState::Registered, "registered");
        ASSERT_EQ(result.trail.size(), 4u, "received, merged, verified, registered");
        ASSERT_TRUE(result.trail[1] == MergeState::Merged, "merged second");
        ASSERT_TRUE(result.trail[2] == MergeState::Verified, "verified third");

        auto stored = v.records.get(result.record.id);
        ASSERT_TRUE(stored.has_value(), "record persisted");
        ASSERT_TRUE(stored->status == RecordStatus::Enabled, "enabled after hooks");
        ASSERT_EQ(stored->type, std::string("txt"), "type from name");
        ASSERT_EQ(stored->size, 9u, "size of merged payload");
        ASSERT_TRUE(stored->source_ref.starts_with("media/"), "source ref relative to base");

        auto storage_dir = find_in_date_dirs(v.config.upload_root, req.content_hash);
        ASSERT_TRUE(storage_dir.has_value(), "upload directory");
        ASSERT_EQ(count_prefixed(*storage_dir, ".merge_"), 0u, "merged temp file removed");
        ASSERT_TRUE(fs::exists(*storage_dir / "u-a"), "chunks kept");

        auto content = v.content().content(result.record.id);
        ASSERT_EQ(string_of(content.data), std::string("AAABBBCCC"), "served in index order");
        PASS();
    }
    {
        TEST(resubmission_returns_existing);
        Vault v("mediavault-merge");
        auto req = v.upload("notes.txt", {{"u-a", "AAA"}, {"u-b", "BBB"}, {"u-c", "CCC"}});
        auto first = v.pipeline.merge(req);
        auto second = v.pipeline.merge(req);
        ASSERT_TRUE(second.success && second.exists, "exists on resubmit");
        ASSERT_EQ(second.record.id, first.record.id, "same record");
        ASSERT_EQ(v.records.count(), 1u, "no second record");
        ASSERT_TRUE(v.pipeline.check_exists(req.content_hash).has_value(), "check_exists");
        PASS();
    }
    {
        TEST(hash_mismatch_rejected);
        Vault v("mediavault-merge");
        auto req = v.upload("x.bin", {{"p0", "hello"}, {"p1", "world"}});
        auto declared = md5_hex(std::string_view("something else"));
        // Re-upload the same pieces under the wrong hash
        for (const auto& c : req.chunks) {
            auto data = bytes_of(c.chunk_uuid == "p0" ? "hello" : "world");
            v.pipeline.receive_chunk(declared, c.chunk_uuid, data);
        }
        req.content_hash = declared;
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(!result.success, "mismatch rejected");
        ASSERT_TRUE(result.error_kind == ErrorKind::HashMismatch, "HashMismatch");
        ASSERT_TRUE(result.state == MergeState::Rejected, "rejected state");
        ASSERT_EQ(v.records.count(), 0u, "nothing registered");
        auto dir = find_in_date_dirs(v.config.upload_root, declared);
        ASSERT_TRUE(dir && fs::exists(*dir / "p0"), "uploaded pieces kept for retry");
        ASSERT_EQ(count_prefixed(*dir, ".merge_"), 0u, "merged file removed");
        PASS();
    }
    {
        TEST(missing_chunk_rejected);
        Vault v("mediavault-merge");
        auto req = v.upload("x.bin", {{"p0", "hello"}});
        req.chunks.push_back({1, "never-sent"});
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.error_kind == ErrorKind::ChunkMissing, "ChunkMissing");
        ASSERT_EQ(result.error_message, std::string("chunk 1 is missing"), "names the index");
        PASS();
    }
    {
        TEST(unknown_hash_rejected);
        Vault v("mediavault-merge");
        MergeRequest req;
        req.content_hash = md5_hex(std::string_view("never uploaded"));
        req.name = "a.txt";
        req.chunks = {{0, "x"}};
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.error_kind == ErrorKind::ChunkMissing, "no upload directory");
        PASS();
    }
    {
        TEST(incomplete_request_rejected);
        Vault v("mediavault-merge");
        MergeRequest req;
        req.content_hash = md5_hex(std::string_view("x"));
        req.chunks = {{0, "x"}};
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.error_kind == ErrorKind::InvalidArgument, "name required");
        PASS();
    }
    {
        TEST(receive_chunk_validation);
        Vault v("mediavault-merge");
        auto data = bytes_of("x");
        auto r1 = v.pipeline.receive_chunk("", "id", data);
        ASSERT_TRUE(r1.error_kind == ErrorKind::InvalidArgument, "hash required");
        auto r2 = v.pipeline.receive_chunk("abc", "../../etc", data);
        ASSERT_TRUE(r2.error_kind == ErrorKind::InvalidArgument, "unsafe key");
        auto r3 = v.pipeline.receive_chunk("ABC", "", data);
        ASSERT_TRUE(r3.success && !r3.chunk_uuid.empty(), "generated key");
        ASSERT_TRUE(fs::exists(partition_dir(v.config.upload_root, "abc") / r3.chunk_uuid),
                    "stored under normalized hash");
        PASS();
    }
    {
        TEST(merge_request_from_json);
        auto body = nlohmann::json::parse(R"({
            "file_md5": "ABC", "file_name": "v.mp4", "file_size": 12,
            "chunks": [{"chunk_index": 1, "chunk_uuid": "b"}, {"chunk_index": 0, "chunk_uuid": "a"}],
            "generate_thumbnail": "false", "author": "someone"
        })");
        auto req = MergeRequest::from_json(body);
        ASSERT_EQ(req.content_hash, std::string("ABC"), "hash");
        ASSERT_EQ(req.declared_size, 12u, "size");
        ASSERT_EQ(req.chunks.size(), 2u, "chunks");
        ASSERT_EQ(req.chunks[0].chunk_uuid, std::string("b"), "declared order kept");
        ASSERT_TRUE(!req.generate_thumbnail, "string flag");
        ASSERT_EQ(req.level, std::string("General"), "default level");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 7. Hooks, HLS and content serving
// ---------------------------------------------------------------------------

static void test_hooks_and_hls() {
    std::cout << "\n=== Post-registration hooks and HLS ===" << std::endl;

    {
        TEST(video_gets_thumbnail_and_playlist);
        Vault v("mediavault-hls");
        v.enable_hooks();
        auto req = v.upload("clip.mp4", {{"c0", pattern(50)}, {"c1", pattern(30)}});
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.success, "merge: " + result.error_message);
        ASSERT_TRUE(result.artifact_errors.empty(), "hooks succeeded");

        auto stored = v.records.get(result.record.id);
        ASSERT_TRUE(stored->thumbnail_ref.starts_with("thumb_"), "thumbnail ref");
        ASSERT_TRUE(stored->thumbnail_ref.ends_with(".enc"), "thumbnail encrypted");
        ASSERT_TRUE(stored->hls_ref.ends_with(".m3u8.enc"), "playlist ref");
        ASSERT_TRUE(!fs::path(stored->hls_ref).is_absolute(), "playlist ref is relative");

        ASSERT_EQ(v.runner.calls.size(), 2u, "extractor and transcoder");
        const auto& thumb_call = v.runner.calls[0];
        ASSERT_TRUE(std::find(thumb_call.begin(), thumb_call.end(), "00:00:01") != thumb_call.end(),
                    "video frame taken at one second");
        ASSERT_TRUE(std::find(thumb_call.begin(), thumb_call.end(), "scale=300:-1") != thumb_call.end(),
                    "thumbnail width");

        auto manifest = v.root / stored->hls_ref;
        ASSERT_TRUE(fs::exists(manifest), "encrypted playlist on disk");
        auto plain_manifest = manifest;
        plain_manifest.replace_extension();
        ASSERT_TRUE(!fs::exists(plain_manifest), "plaintext playlist removed");
        ASSERT_EQ(count_prefixed(fs::temp_directory_path(), "mediavault_hls_"), 0u,
                  "assembled source removed");

        auto service = v.content();
        auto thumb = service.thumbnail(result.record.id);
        ASSERT_TRUE(thumb.success, "thumbnail served");
        ASSERT_EQ(string_of(thumb.data), std::string("\xFF\xD8 fake jpeg"), "decrypted thumbnail");

        auto playlist = service.playlist(result.record.id);
        ASSERT_TRUE(playlist.success, "playlist served");
        auto text = string_of(playlist.data);
        std::string id = std::to_string(result.record.id);
        ASSERT_TRUE(text.find("/api/files/hls-content/?id=" + id + "&type=ts&file=hls_seg_") !=
                        std::string::npos, "segments routed through endpoint");
        ASSERT_TRUE(text.find("&type=key&key=enc.key") != std::string::npos, "key routed");
        ASSERT_TRUE(text.find(".ts.enc") == std::string::npos, "no raw encrypted names");

        auto name_start = text.find("file=") + 5;
        auto name = text.substr(name_start, text.find('\n', name_start) - name_start);
        bool zero_keystream = v.cipher.transform(bytes_of("\x47"))[0] == 0x47;
        auto segment = service.segment(result.record.id, name);
        ASSERT_TRUE(segment.success, "segment served");
        ASSERT_EQ(segment.content_type, std::string("video/mp2t"), "segment type");
        if (!zero_keystream) {
            ASSERT_EQ(string_of(segment.data), FakeProcessRunner::segment_payload(0),
                      "segment decrypted");
            auto on_disk = read_file(manifest.parent_path() / name);
            ASSERT_TRUE(on_disk != FakeProcessRunner::segment_payload(0), "segment encrypted at rest");
        }
        PASS();
    }
    {
        TEST(tool_failure_does_not_undo_registration);
        Vault v("mediavault-hls");
        v.enable_hooks();
        v.runner.installed = false;
        auto req = v.upload("clip.mp4", {{"c0", pattern(40)}});
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.success, "still registered");
        ASSERT_EQ(result.artifact_errors.size(), 2u, "both hooks failed");
        auto stored = v.records.get(result.record.id);
        ASSERT_TRUE(stored->status == RecordStatus::Enabled, "enabled anyway");
        ASSERT_EMPTY(stored->thumbnail_ref, "no thumbnail");
        ASSERT_EMPTY(stored->hls_ref, "no playlist");
        PASS();
    }
    {
        TEST(client_thumbnail_preferred);
        Vault v("mediavault-hls");
        v.pipeline.add_hook(std::make_unique<ThumbnailHook>(v.cipher, v.runner));
        auto req = v.upload("pic.png", {{"c0", pattern(40)}});
        req.thumbnail_base64 = "data:image/jpeg;base64," + base64_encode(std::string_view("client"));
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.success, "merged");
        ASSERT_TRUE(v.runner.calls.empty(), "extractor not needed");
        auto thumb = v.content().thumbnail(result.record.id);
        ASSERT_EQ(string_of(thumb.data), std::string("client"), "client image stored");
        PASS();
    }
    {
        TEST(thumbnail_can_be_disabled);
        Vault v("mediavault-hls");
        v.pipeline.add_hook(std::make_unique<ThumbnailHook>(v.cipher, v.runner));
        auto req = v.upload("pic.png", {{"c0", pattern(40)}});
        req.generate_thumbnail = false;
        auto result = v.pipeline.merge(req);
        ASSERT_TRUE(result.success, "merged");
        ASSERT_TRUE(v.runner.calls.empty(), "no extraction");
        ASSERT_EMPTY(v.records.get(result.record.id)->thumbnail_ref, "no thumbnail");
        PASS();
    }
    {
        TEST(convert_record_guards);
        Vault v("mediavault-hls");
        auto doc = v.upload("doc.pdf", {{"c0", "pdf bytes"}});
        auto merged = v.pipeline.merge(doc);
        auto not_video = v.segmenter.convert_record(v.records, merged.record.id);
        ASSERT_TRUE(not_video.error_kind == ErrorKind::InvalidArgument, "non-video rejected");
        auto unknown = v.segmenter.convert_record(v.records, 4242);
        ASSERT_TRUE(unknown.error_kind == ErrorKind::NotFound, "unknown id");

        auto clip = v.upload("clip.mov", {{"c0", pattern(20)}});
        auto video = v.pipeline.merge(clip);
        auto converted = v.segmenter.convert_record(v.records, video.record.id);
        ASSERT_TRUE(converted.success && !converted.reused, "converted");
        ASSERT_TRUE(converted.stage == HlsStage::Published, "published");
        ASSERT_EQ(converted.segments, 2u, "two segments encrypted");
        auto again = v.segmenter.convert_record(v.records, video.record.id);
        ASSERT_TRUE(again.success && again.reused, "existing playlist reused");
        ASSERT_EQ(v.runner.calls.size(), 1u, "transcoder ran once");
        PASS();
    }
    {
        TEST(transcoder_failure_cleans_up);
        Vault v("mediavault-hls");
        auto clip = v.upload("clip.mkv", {{"c0", pattern(20)}});
        auto video = v.pipeline.merge(clip);
        v.runner.exit_code = 1;
        auto result = v.segmenter.convert_record(v.records, video.record.id);
        ASSERT_TRUE(result.error_kind == ErrorKind::ExternalToolFailed, "tool failed");
        ASSERT_TRUE(result.stage == HlsStage::SourceAssembled, "stopped after assembly");
        auto dir = find_in_date_dirs(v.config.upload_root, clip.content_hash);
        ASSERT_EQ(count_prefixed(*dir / "HLS", "hls_"), 0u, "no partial outputs");
        ASSERT_EMPTY(v.records.get(video.record.id)->hls_ref, "no playlist ref");
        PASS();
    }

    std::cout << "\n=== Manifest rewriting ===" << std::endl;

    HlsEndpoint endpoint;
    {
        TEST(mark_encrypted_segments);
        std::vector<std::string> names;
        auto out = mark_encrypted_segments("a\nhls_seg_r1_000.ts\nhls_seg_other_001.ts\n", "r1",
                                           &names);
        ASSERT_EQ(out, std::string("a\nhls_seg_r1_000.ts.enc\nhls_seg_other_001.ts\n"),
                  "only this run's segments");
        ASSERT_EQ(names.size(), 1u, "one segment collected");
        PASS();
    }
    {
        TEST(key_uri_rewriting);
        auto rel = rewrite_key_uris("#EXT-X-KEY:METHOD=AES-128,URI=\"keys/enc.key\"", endpoint, 7);
        ASSERT_TRUE(rel.find("URI=\"/api/files/hls-content/?id=7&type=key&key=enc.key\"") !=
                        std::string::npos, "relative key routed");
        auto abs = rewrite_key_uris("URI=\"/srv/keys/k1\"", endpoint, 7);
        ASSERT_TRUE(abs.find("key=k1") != std::string::npos, "absolute local key routed");
        std::string remote = "URI=\"https://cdn.example/k\"";
        ASSERT_EQ(rewrite_key_uris(remote, endpoint, 7), remote, "remote key untouched");
        std::string plain = "URI=\"http://cdn.example/k\"";
        ASSERT_EQ(rewrite_key_uris(plain, endpoint, 7), plain, "plain http key untouched");
        auto lookalike = rewrite_key_uris("URI=\"httpkey.key\"", endpoint, 7);
        ASSERT_TRUE(lookalike.find("type=key&key=httpkey.key") != std::string::npos,
                    "local key named like a scheme routed");
        auto twice = rewrite_key_uris(rel, endpoint, 7);
        ASSERT_EQ(twice, rel, "endpoint URIs are not rewritten again");
        PASS();
    }
    {
        TEST(segment_refs_case_insensitive);
        auto out = rewrite_segment_refs("A_1.TS.enc\nb-2.ts\n", endpoint, 3);
        ASSERT_TRUE(out.find("file=A_1.TS\n") != std::string::npos, "upper-case extension");
        ASSERT_TRUE(out.find("file=b-2.ts\n") != std::string::npos, "plain reference");
        PASS();
    }

    std::cout << "\n=== Content serving ===" << std::endl;

    {
        TEST(key_lookup_and_name_validation);
        Vault v("mediavault-content");
        auto req = v.upload("clip.mp4", {{"c0", pattern(20)}});
        auto merged = v.pipeline.merge(req);
        write_file(v.config.upload_root / "VKey" / "ALL" / "enc.key", "0123456789abcdef");
        auto service = v.content();
        auto key = service.key(merged.record.id, "enc.key");
        ASSERT_TRUE(key.success, "shared key directory");
        ASSERT_EQ(string_of(key.data), std::string("0123456789abcdef"), "key bytes");
        auto bad = service.segment(merged.record.id, "../../secret.ts");
        ASSERT_TRUE(bad.error_kind == ErrorKind::InvalidArgument, "traversal rejected");
        auto missing = service.key(merged.record.id, "nope.key");
        ASSERT_TRUE(missing.error_kind == ErrorKind::NotFound, "missing key");
        ASSERT_TRUE(missing.error_message.find(v.root.string()) == std::string::npos,
                    "no paths in errors");
        PASS();
    }
    {
        TEST(plaintext_manifest_served);
        Vault v("mediavault-content");
        auto req = v.upload("clip.mp4", {{"c0", pattern(20)}});
        auto merged = v.pipeline.merge(req);
        auto record = *v.records.get(merged.record.id);
        auto dir = find_in_date_dirs(v.config.upload_root, req.content_hash);
        write_file(*dir / "HLS" / "legacy.m3u8", "#EXTM3U\nseg_0.ts\n");
        record.hls_ref = (*dir / "HLS" / "legacy.m3u8").string();
        v.records.update(record);
        auto playlist = v.content().playlist(record.id);
        ASSERT_TRUE(playlist.success, "served");
        ASSERT_TRUE(string_of(playlist.data).find("file=seg_0.ts") != std::string::npos,
                    "rewritten plaintext");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 8. Soft delete
// ---------------------------------------------------------------------------

static void test_soft_delete() {
    std::cout << "\n=== Soft delete ===" << std::endl;

    {
        TEST(delete_keeps_record_and_thumbnail);
        Vault v("mediavault-delete");
        v.enable_hooks();
        auto req = v.upload("clip.mp4", {{"c0", pattern(30)}, {"c1", pattern(30)}});
        auto merged = v.pipeline.merge(req);
        ASSERT_TRUE(merged.success, "merged");
        auto before = *v.records.get(merged.record.id);
        auto dir = *find_in_date_dirs(v.config.upload_root, req.content_hash);
        ASSERT_EQ(count_prefixed(dir / "HLS", "hls_seg_"), 2u, "segments present");

        Status st = v.pipeline.remove(merged.record.id);
        ASSERT_TRUE(st.ok(), "remove: " + st.message);

        auto after = v.records.get(merged.record.id);
        ASSERT_TRUE(after.has_value(), "record kept");
        ASSERT_TRUE(after->status == RecordStatus::Deleted, "status deleted");
        ASSERT_EMPTY(after->hls_ref, "playlist ref cleared");
        ASSERT_NOT_EMPTY(after->deleted_time, "delete time set");
        ASSERT_TRUE(!fs::exists(dir / "c0") && !fs::exists(dir / "c1"), "chunks removed");
        ASSERT_EQ(count_prefixed(dir / "HLS", "hls_"), 0u, "HLS artifacts removed");
        ASSERT_TRUE(fs::exists(dir / before.thumbnail_ref), "thumbnail kept");

        auto content = v.content().content(merged.record.id);
        ASSERT_TRUE(content.error_kind == ErrorKind::NotFound, "deleted content not served");
        ASSERT_TRUE(v.pipeline.remove(merged.record.id).ok(), "second delete is a no-op");
        ASSERT_TRUE(v.pipeline.check_exists(req.content_hash).has_value(),
                    "deleted content still deduplicated");
        PASS();
    }
    {
        TEST(delete_unknown_record);
        Vault v("mediavault-delete");
        Status st = v.pipeline.remove(9999);
        ASSERT_TRUE(st.kind == ErrorKind::NotFound, "NotFound");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 9. Record store, storage references, configuration
// ---------------------------------------------------------------------------

static void test_record_store() {
    std::cout << "\n=== Record store ===" << std::endl;

    {
        TEST(storage_ref_forms);
        auto list = parse_storage_ref(
            R"({"chunks":["a","b"],"storage_dir":"media/20240101/h","time_str":"20240101"})");
        auto* chunks = std::get_if<ChunkListRef>(&list);
        ASSERT_TRUE(chunks && chunks->chunks.size() == 2, "chunk list object");

        auto wrapped = parse_storage_ref(
            R"("{\"chunks\":[\"a\"],\"storage_dir\":\"x\",\"time_str\":\"t\"}")");
        ASSERT_TRUE(std::holds_alternative<ChunkListRef>(wrapped), "JSON inside a JSON string");

        auto legacy = parse_storage_ref(R"(["media/20240101/h/p0","media/20240101/h/p1"])");
        auto* paths = std::get_if<LegacyPathsRef>(&legacy);
        ASSERT_TRUE(paths && paths->paths.size() == 2, "legacy path list");

        ASSERT_TRUE(std::holds_alternative<std::monostate>(parse_storage_ref("")), "empty");
        ASSERT_TRUE(std::holds_alternative<std::monostate>(parse_storage_ref("{not json")),
                    "garbage");

        auto again = parse_storage_ref(serialize_storage_ref(list));
        ASSERT_TRUE(std::get<ChunkListRef>(again).storage_dir == "media/20240101/h",
                    "serialized form parses back");
        PASS();
    }
    {
        TEST(resolve_location_legacy_paths);
        auto tmpdir = make_temp_dir("mediavault-location");
        write_file(tmpdir / "media" / "20240101" / "h" / "p0", "x");
        MediaRecord record;
        record.storage = LegacyPathsRef{{"media/20240101/h/p0", "media\\20240101\\h\\p1"}};
        auto loc = resolve_location(record, tmpdir);
        ASSERT_TRUE(loc.has_value(), "resolved");
        ASSERT_TRUE(loc->storage_dir == tmpdir / "media" / "20240101" / "h", "directory");
        ASSERT_EQ(loc->chunks.size(), 2u, "both names");
        ASSERT_EQ(loc->chunks[1], std::string("p1"), "separators normalized");

        MediaRecord by_source;
        by_source.source_ref = "media/20240101/h";
        ASSERT_TRUE(resolve_location(by_source, tmpdir).has_value(), "source_ref fallback");
        ASSERT_TRUE(!resolve_location(MediaRecord{}, tmpdir).has_value(), "nothing to go on");
        fs::remove_all(tmpdir);
        PASS();
    }
    {
        TEST(sqlite_round_trip_and_unique_hash);
        SqliteRecordStore store(":memory:");
        MediaRecord record;
        record.name = "a.jpg";
        record.content_hash = "0123456789abcdef0123456789abcdef";
        record.status = RecordStatus::Enabled;
        record.storage = ChunkListRef{{"x"}, "media/20240101/h", "20240101"};
        auto ins = store.insert(record);
        ASSERT_TRUE(ins.inserted && record.id > 0, "inserted");
        ASSERT_NOT_EMPTY(record.code, "code assigned");

        auto got = store.get(record.id);
        ASSERT_TRUE(got && got->status == RecordStatus::Enabled, "status round trip");
        ASSERT_TRUE(std::holds_alternative<ChunkListRef>(got->storage), "storage round trip");

        MediaRecord dup;
        dup.name = "b.jpg";
        dup.content_hash = record.content_hash;
        auto conflict = store.insert(dup);
        ASSERT_TRUE(!conflict.inserted && conflict.hash_conflict, "hash conflict");
        ASSERT_EQ(conflict.id, record.id, "existing id reported");
        ASSERT_EQ(store.count(), 1u, "count");
        ASSERT_EQ(std::string(record_status_name(RecordStatus::Enabled)), std::string("enable"),
                  "status wire name");
        PASS();
    }

    std::cout << "\n=== VaultConfig ===" << std::endl;

    auto tmpdir = make_temp_dir("mediavault-config");
    {
        TEST(json_sections);
        nlohmann::json j;
        j["base_dir"] = tmpdir.string();
        j["secret"] = "s3cret-value";
        j["download"] = {{"max_retries", 7}, {"base_delay", 2}, {"chunk_size_small", 4096}};
        j["proxy"] = {{"host", "127.0.0.1"}, {"port", 8080}};
        j["hls"] = {{"segment_seconds", 6}, {"md5_chunk_size", 1024}};
        write_file(tmpdir / "config.json", j.dump());

        VaultConfig config;
        ASSERT_TRUE(config.load_json(tmpdir / "config.json"), "loads");
        config.apply_defaults();
        ASSERT_EQ(config.max_retries, 7, "max_retries");
        ASSERT_EQ(config.chunk_size_large, 4096u, "older chunk size key");
        ASSERT_EQ(config.proxy_url(), std::string("http://127.0.0.1:8080"), "proxy");
        ASSERT_EQ(config.hls_segment_seconds, 6u, "segment seconds");
        ASSERT_TRUE(config.upload_root == tmpdir / "media", "upload root default");
        ASSERT_TRUE(config.media_root == tmpdir / "Media", "media root default");
        ASSERT_EQ(config.fetch_policy().base_delay.count(), 2000, "base delay");
        ASSERT_EMPTY(config.validate(), "valid");
        ASSERT_TRUE(config.describe().find("s3cret-value") == std::string::npos,
                    "secret masked");
        PASS();
    }
    {
        TEST(env_overrides);
        VaultConfig config = make_config(tmpdir);
        setenv("MEDIAVAULT_MAX_RETRIES", "2", 1);
        setenv("MEDIAVAULT_AUTO_HLS", "true", 1);
        config.apply_env_overrides();
        unsetenv("MEDIAVAULT_MAX_RETRIES");
        unsetenv("MEDIAVAULT_AUTO_HLS");
        ASSERT_EQ(config.max_retries, 2, "env max_retries");
        ASSERT_TRUE(config.auto_hls, "env flag");
        PASS();
    }
    {
        TEST(validation_errors);
        VaultConfig config = make_config(tmpdir);
        config.secret.clear();
        ASSERT_TRUE(config.validate().find("secret") != std::string::npos, "secret required");
        config = make_config(tmpdir);
        config.proxy_host = "h";
        ASSERT_TRUE(config.validate().find("proxy") != std::string::npos, "proxy needs port");
        config = make_config(tmpdir / "missing");
        ASSERT_TRUE(config.validate().find(tmpdir.string()) == std::string::npos,
                    "no path in the message");
        ASSERT_TRUE(!config.load_json(tmpdir / "absent.json"), "missing file");
        PASS();
    }
    {
        TEST(transport_from_config);
        VaultConfig config = make_config(tmpdir);
        config.proxy_host = "127.0.0.1";
        config.proxy_port = "3128";
        config.user_agent = "vault-tests/2";
        auto transport = config.transport_factory()();
        auto* client = dynamic_cast<HttpClient*>(transport.get());
        ASSERT_TRUE(client != nullptr, "libcurl session");
        ASSERT_EQ(client->config().proxy_url, std::string("http://127.0.0.1:3128"), "proxy");
        ASSERT_EQ(client->config().user_agent, std::string("vault-tests/2"), "user agent");

        HttpClient direct(make_config(tmpdir).http_client_config());
        auto request = HttpRequest::get("http://127.0.0.1:1/");
        request.connect_timeout = std::chrono::milliseconds(2000);
        request.total_timeout = std::chrono::milliseconds(4000);
        auto response = direct.execute(request);
        ASSERT_TRUE(!response.ok(), "nothing listens on port 1");
        ASSERT_TRUE(response.network_error != NetworkError::None, "transport failure");
        PASS();
    }
    {
        TEST(request_context_from_config);
        VaultConfig config = make_config(tmpdir);
        ASSERT_TRUE(config.request_headers().empty(), "no cookie");
        ASSERT_TRUE(config.api_params().empty(), "no api key");
        config.cookie = "session=abc";
        config.api_key = "k-123";
        ASSERT_EQ(config.request_headers().get("Cookie").value_or(""), std::string("session=abc"),
                  "cookie header");
        auto params = config.api_params();
        ASSERT_EQ(params.size(), 1u, "one param");
        ASSERT_EQ(params[0].first, std::string("apikey"), "param name");
        ASSERT_EQ(params[0].second, std::string("k-123"), "param value");
        PASS();
    }
    {
        TEST(apply_logging);
        VaultConfig config = make_config(tmpdir);
        config.verbose = true;
        ASSERT_TRUE(config.apply_logging(), "no log file");
        ASSERT_TRUE(verbose_enabled(), "verbose on");
        config.verbose = false;
        ASSERT_TRUE(config.apply_logging(), "no log file");
        ASSERT_TRUE(!verbose_enabled(), "verbose off");

        write_file(tmpdir / "blocker", "x");
        config.log_file = tmpdir / "blocker" / "vault.log";
        ASSERT_TRUE(!config.apply_logging(), "unopenable log file");
        PASS();
    }
    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// 10. Process runner
// ---------------------------------------------------------------------------

static void test_process_runner() {
    std::cout << "\n=== PosixProcessRunner ===" << std::endl;

    PosixProcessRunner runner;
    {
        TEST(exit_status);
        ASSERT_TRUE(runner.run({"true"}, std::chrono::seconds(5)).succeeded(), "true succeeds");
        auto failed = runner.run({"false"}, std::chrono::seconds(5));
        ASSERT_TRUE(failed.launched && failed.exit_code == 1, "false exits 1");
        PASS();
    }
    {
        TEST(missing_executable);
        auto result = runner.run({"mediavault-no-such-tool"}, std::chrono::seconds(5));
        ASSERT_TRUE(!result.launched, "not launched");
        PASS();
    }
    {
        TEST(stderr_captured);
        auto result = runner.run({"sh", "-c", "echo oops >&2; exit 3"}, std::chrono::seconds(5));
        ASSERT_EQ(result.exit_code, 3, "exit code");
        ASSERT_TRUE(result.stderr_output.find("oops") != std::string::npos, "stderr tail");
        PASS();
    }
    {
        TEST(deadline_kills_child);
        auto start = std::chrono::steady_clock::now();
        auto result = runner.run({"sleep", "10"}, std::chrono::seconds(1));
        auto elapsed = std::chrono::steady_clock::now() - start;
        ASSERT_TRUE(result.timed_out, "timed out");
        ASSERT_TRUE(elapsed < std::chrono::seconds(5), "killed promptly");
        PASS();
    }
    {
        TEST(unreaped_child_has_no_exit_code);
        // Ignoring SIGCHLD makes the kernel reap the child, so waitpid fails
        // with ECHILD
        auto previous = std::signal(SIGCHLD, SIG_IGN);
        auto result = runner.run({"sh", "-c", "exit 4"}, std::chrono::seconds(5));
        std::signal(SIGCHLD, previous);
        ASSERT_TRUE(result.launched, "launched");
        ASSERT_TRUE(!result.timed_out, "not timed out");
        ASSERT_EQ(result.exit_code, -1, "exit status unknown");
        ASSERT_TRUE(!result.succeeded(), "not a success");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// 11. Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== Metrics ===" << std::endl;

    auto tmpdir = make_temp_dir("mediavault-metrics");
    auto prom_path = tmpdir / "test.prom";

    {
        TEST(creates_prom_file);
        std::map<std::string, std::string> labels = {{"instance", "unit"}};
        MetricsExporter exporter(prom_path, std::chrono::seconds(1), labels);
        exporter.start();
        bool created = wait_for([&] { return fs::exists(prom_path); }, 5000);
        exporter.stop();

        ASSERT_TRUE(created, ".prom file should be created");
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("mediavault_fetch_attempts_total") != std::string::npos,
                    "fetch attempts family");
        ASSERT_TRUE(content.find("mediavault_merge_duration_seconds") != std::string::npos,
                    "merge histogram");
        ASSERT_TRUE(content.find("instance=\"unit\"") != std::string::npos, "constant label");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(pipeline_counters);
        Vault v("mediavault-metrics-vault");
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        exporter.set_record_store(&v.records);
        v.fetcher.set_metrics(&exporter);
        v.store.set_metrics(&exporter);
        v.dedup.set_metrics(&exporter);
        v.pipeline.set_metrics(&exporter);

        v.server.script = {{0, NetworkError::Timeout}, {200, NetworkError::None, pattern(40)}};
        AcquireRequest req;
        req.url = "http://remote/m.jpg";
        req.base_dir = v.root / "sets";
        req.file_id = "m1";
        v.pipeline.acquire(req);
        v.pipeline.acquire(req);

        auto merge = v.upload("n.txt", {{"u", "payload"}});
        v.pipeline.merge(merge);
        v.pipeline.merge(merge);
        exporter.stop();

        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("mediavault_fetch_retries_total 1") != std::string::npos,
                    "one retry");
        ASSERT_TRUE(content.find("mediavault_acquisitions_skipped_total 1") != std::string::npos,
                    "one skipped acquisition");
        ASSERT_TRUE(content.find("mediavault_dedup_hits_total 1") != std::string::npos,
                    "one dedup hit");
        ASSERT_TRUE(content.find("mediavault_merges_total{result=\"registered\"} 1") !=
                        std::string::npos, "one registered merge");
        ASSERT_TRUE(content.find("mediavault_records 1") != std::string::npos, "records gauge");
        PASS();
    }

    fs::remove(prom_path);

    {
        TEST(scoped_timer_records_duration);
        MetricsExporter exporter(prom_path, std::chrono::seconds(60), {});
        {
            ScopedTimer timer(exporter.transcode_duration());
        }
        exporter.stop();
        auto content = read_file(prom_path);
        ASSERT_TRUE(content.find("mediavault_transcode_duration_seconds_count 1") !=
                        std::string::npos, "histogram count should be 1");
        PASS();
    }

    fs::remove_all(tmpdir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "mediavault test suite" << std::endl;
    std::cout << "=====================" << std::endl;

    test_chunk_store();
    test_assembler();
    test_cipher();
    test_fetcher();
    test_acquire();
    test_merge();
    test_hooks_and_hls();
    test_soft_delete();
    test_record_store();
    test_process_runner();
    test_metrics();

    std::cout << "\n=====================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
