#include "mediavault/vault_config.hpp"
#include "mediavault/log.hpp"

#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>
#include <nlohmann/json.hpp>

namespace mediavault {

namespace {

const char* env(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

template <typename T>
void env_number(const char* name, T& target) {
    const char* v = env(name);
    if (!v) return;
    try {
        auto parsed = std::stoull(v);
        target = static_cast<T>(parsed);
    } catch (const std::exception&) {
        log_warn("Ignoring %s: not a number", name);
    }
}

bool parse_bool(const std::string& v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

void env_bool(const char* name, bool& target) {
    if (const char* v = env(name)) target = parse_bool(v);
}

void env_string(const char* name, std::string& target) {
    if (const char* v = env(name)) target = v;
}

void env_path(const char* name, std::filesystem::path& target) {
    if (const char* v = env(name)) target = v;
}

std::string mask(const std::string& secret) {
    return secret.empty() ? "(unset)" : "***";
}

}  // namespace

bool VaultConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            log_error("Cannot open config file: %s", path.c_str());
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("base_dir")) base_dir = j["base_dir"].get<std::string>();
        if (j.contains("media_root")) media_root = j["media_root"].get<std::string>();
        if (j.contains("upload_root")) upload_root = j["upload_root"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("database_path")) database_path = j["database_path"].get<std::string>();
        if (j.contains("secret")) secret = j["secret"].get<std::string>();

        if (j.contains("download") && j["download"].is_object()) {
            auto& jd = j["download"];
            if (jd.contains("request_timeout")) request_timeout_secs = jd["request_timeout"].get<size_t>();
            if (jd.contains("connect_timeout")) connect_timeout_secs = jd["connect_timeout"].get<size_t>();
            if (jd.contains("max_retries")) max_retries = jd["max_retries"].get<int>();
            if (jd.contains("base_delay")) base_delay_secs = jd["base_delay"].get<size_t>();
            if (jd.contains("page_delay_ms")) page_delay_ms = jd["page_delay_ms"].get<size_t>();
            if (jd.contains("chunk_size_threshold"))
                chunk_size_threshold = jd["chunk_size_threshold"].get<uint64_t>();
            // Older configs name the fixed chunk size "chunk_size_small"
            if (jd.contains("chunk_size_small")) chunk_size_large = jd["chunk_size_small"].get<uint64_t>();
            if (jd.contains("chunk_size_large")) chunk_size_large = jd["chunk_size_large"].get<uint64_t>();
            if (jd.contains("chunk_count_small")) chunk_count_small = jd["chunk_count_small"].get<uint32_t>();
            if (jd.contains("read_chunk_size")) read_chunk_size = jd["read_chunk_size"].get<size_t>();
        }

        if (j.contains("proxy") && j["proxy"].is_object()) {
            auto& jp = j["proxy"];
            if (jp.contains("host")) proxy_host = jp["host"].get<std::string>();
            if (jp.contains("port")) {
                proxy_port = jp["port"].is_number() ? std::to_string(jp["port"].get<int>())
                                                    : jp["port"].get<std::string>();
            }
        }

        if (j.contains("headers") && j["headers"].is_object()) {
            auto& jh = j["headers"];
            if (jh.contains("user_agent")) user_agent = jh["user_agent"].get<std::string>();
            if (jh.contains("cookie")) cookie = jh["cookie"].get<std::string>();
        }
        if (j.contains("api_key")) api_key = j["api_key"].get<std::string>();

        if (j.contains("hls") && j["hls"].is_object()) {
            auto& jh = j["hls"];
            if (jh.contains("md5_chunk_size")) md5_block_size = jh["md5_chunk_size"].get<size_t>();
            if (jh.contains("segment_seconds")) hls_segment_seconds = jh["segment_seconds"].get<size_t>();
            if (jh.contains("transcoder")) transcoder = jh["transcoder"].get<std::string>();
            if (jh.contains("transcoder_timeout"))
                transcoder_timeout_secs = jh["transcoder_timeout"].get<size_t>();
            if (jh.contains("content_endpoint"))
                content_endpoint = jh["content_endpoint"].get<std::string>();
            if (jh.contains("auto")) auto_hls = jh["auto"].get<bool>();
        }

        if (j.contains("thumbnail_timeout")) thumbnail_timeout_secs = j["thumbnail_timeout"].get<size_t>();
        if (j.contains("generate_thumbnails")) generate_thumbnails = j["generate_thumbnails"].get<bool>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        log_error("Error parsing config: %s", e.what());
        return false;
    }
}

void VaultConfig::apply_env_overrides() {
    env_path("MEDIAVAULT_BASE_DIR", base_dir);
    env_path("MEDIAVAULT_MEDIA_ROOT", media_root);
    env_path("MEDIAVAULT_UPLOAD_ROOT", upload_root);
    env_path("MEDIAVAULT_STATE_DIR", state_dir);
    env_path("MEDIAVAULT_DATABASE", database_path);
    env_string("MEDIAVAULT_SECRET", secret);

    env_number("MEDIAVAULT_REQUEST_TIMEOUT", request_timeout_secs);
    env_number("MEDIAVAULT_CONNECT_TIMEOUT", connect_timeout_secs);
    env_number("MEDIAVAULT_MAX_RETRIES", max_retries);
    env_number("MEDIAVAULT_BASE_DELAY", base_delay_secs);
    env_number("MEDIAVAULT_PAGE_DELAY_MS", page_delay_ms);
    env_string("MEDIAVAULT_PROXY_HOST", proxy_host);
    env_string("MEDIAVAULT_PROXY_PORT", proxy_port);
    env_string("MEDIAVAULT_USER_AGENT", user_agent);
    env_string("MEDIAVAULT_API_KEY", api_key);
    env_string("MEDIAVAULT_COOKIE", cookie);

    env_number("MEDIAVAULT_CHUNK_SIZE_THRESHOLD", chunk_size_threshold);
    env_number("MEDIAVAULT_CHUNK_SIZE_LARGE", chunk_size_large);
    env_number("MEDIAVAULT_CHUNK_COUNT_SMALL", chunk_count_small);
    env_number("MEDIAVAULT_READ_CHUNK_SIZE", read_chunk_size);
    env_number("MEDIAVAULT_MD5_BLOCK_SIZE", md5_block_size);

    env_string("MEDIAVAULT_TRANSCODER", transcoder);
    env_number("MEDIAVAULT_TRANSCODER_TIMEOUT", transcoder_timeout_secs);
    env_number("MEDIAVAULT_THUMBNAIL_TIMEOUT", thumbnail_timeout_secs);
    env_number("MEDIAVAULT_HLS_SEGMENT_SECONDS", hls_segment_seconds);
    env_string("MEDIAVAULT_CONTENT_ENDPOINT", content_endpoint);
    env_bool("MEDIAVAULT_GENERATE_THUMBNAILS", generate_thumbnails);
    env_bool("MEDIAVAULT_AUTO_HLS", auto_hls);

    env_bool("MEDIAVAULT_VERBOSE", verbose);
    env_path("MEDIAVAULT_LOG_FILE", log_file);
    env_path("MEDIAVAULT_METRICS_FILE", metrics_file);
    env_number("MEDIAVAULT_METRICS_INTERVAL", metrics_interval_secs);
}

void VaultConfig::apply_defaults() {
    if (base_dir.empty()) return;
    if (media_root.empty()) media_root = base_dir / "Media";
    if (upload_root.empty()) upload_root = base_dir / "media";
    if (state_dir.empty()) state_dir = base_dir / ".mediavault";
    if (database_path.empty()) database_path = state_dir / "records.db";
}

std::string VaultConfig::validate() const {
    if (base_dir.empty()) return "base_dir is required";
    if (!std::filesystem::is_directory(base_dir)) return "base_dir is not a directory";
    if (secret.empty()) return "secret is required";
    if (max_retries < 1) return "max_retries must be >= 1";
    if (request_timeout_secs == 0) return "request_timeout must be > 0";
    auto err = chunk_policy().validate();
    if (!err.empty()) return err;
    if (md5_block_size == 0) return "md5_chunk_size must be > 0";
    if (hls_segment_seconds == 0) return "hls segment_seconds must be > 0";
    if (transcoder.empty()) return "transcoder is required";
    if (content_endpoint.empty()) return "content_endpoint is required";
    if (proxy_host.empty() != proxy_port.empty()) return "proxy needs both host and port";
    return {};
}

std::string VaultConfig::describe() const {
    std::ostringstream out;
    out << "base_dir: " << base_dir.string() << "\n"
        << "media_root: " << media_root.string() << "\n"
        << "upload_root: " << upload_root.string() << "\n"
        << "database: " << database_path.string() << "\n"
        << "secret: " << mask(secret) << "\n"
        << "api_key: " << mask(api_key) << "\n"
        << "cookie: " << mask(cookie) << "\n"
        << "proxy: " << (proxy_url().empty() ? "(none)" : proxy_url()) << "\n"
        << "request_timeout: " << request_timeout_secs << "s\n"
        << "max_retries: " << max_retries << "\n"
        << "base_delay: " << base_delay_secs << "s\n"
        << "page_delay: " << page_delay_ms << "ms\n"
        << "chunking: threshold=" << chunk_size_threshold << " large=" << chunk_size_large
        << " small_count=" << chunk_count_small << " read=" << read_chunk_size << "\n"
        << "transcoder: " << transcoder << " (timeout " << transcoder_timeout_secs
        << "s, segment " << hls_segment_seconds << "s)\n"
        << "auto_hls: " << (auto_hls ? "yes" : "no") << "\n"
        << "generate_thumbnails: " << (generate_thumbnails ? "yes" : "no") << "\n";
    return out.str();
}

std::string VaultConfig::proxy_url() const {
    if (proxy_host.empty() || proxy_port.empty()) return {};
    return "http://" + proxy_host + ":" + proxy_port;
}

FetchPolicy VaultConfig::fetch_policy() const {
    FetchPolicy policy;
    policy.max_retries = max_retries;
    policy.base_delay = std::chrono::seconds(base_delay_secs);
    policy.page_delay = std::chrono::milliseconds(page_delay_ms);
    policy.request_timeout = std::chrono::seconds(request_timeout_secs);
    policy.connect_timeout = std::chrono::seconds(connect_timeout_secs);
    return policy;
}

ChunkSizePolicy VaultConfig::chunk_policy() const {
    ChunkSizePolicy policy;
    policy.threshold = chunk_size_threshold;
    policy.large_chunk_size = chunk_size_large;
    policy.small_count = chunk_count_small;
    policy.read_increment = read_chunk_size;
    return policy;
}

HttpClientConfig VaultConfig::http_client_config() const {
    HttpClientConfig cfg;
    cfg.user_agent = user_agent;
    cfg.proxy_url = proxy_url();
    cfg.verbose = verbose;
    return cfg;
}

TransportFactory VaultConfig::transport_factory() const {
    HttpClientConfig cfg = http_client_config();
    return [cfg]() -> std::unique_ptr<HttpTransport> {
        return std::make_unique<HttpClient>(cfg);
    };
}

HttpHeaders VaultConfig::request_headers() const {
    HttpHeaders headers;
    if (!cookie.empty()) {
        headers.set("Cookie", cookie);
    }
    return headers;
}

QueryParams VaultConfig::api_params() const {
    QueryParams params;
    if (!api_key.empty()) {
        params.emplace_back("apikey", api_key);
    }
    return params;
}

bool VaultConfig::apply_logging() const {
    set_verbose(verbose);
    if (log_file.empty()) return true;
    if (!redirect_logs(log_file)) {
        log_error("Cannot open log file");
        return false;
    }
    return true;
}

}  // namespace mediavault
