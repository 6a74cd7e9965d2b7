#include "chunkup/core/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace chunkup {
namespace {

Result<std::int64_t> parse_integer(const std::string& name, const std::string& text) {
    try {
        std::size_t consumed = 0;
        const long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return Err<std::int64_t>(Error::validation(name + ": trailing characters in '" + text + "'"));
        }
        return Ok(static_cast<std::int64_t>(value));
    } catch (const std::exception&) {
        return Err<std::int64_t>(Error::validation(name + ": not an integer: '" + text + "'"));
    }
}

Result<bool> parse_bool(const std::string& name, std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "1" || text == "true" || text == "yes" || text == "on") {
        return Ok(true);
    }
    if (text == "0" || text == "false" || text == "no" || text == "off") {
        return Ok(false);
    }
    return Err<bool>(Error::validation(name + ": not a boolean: '" + text + "'"));
}

Result<std::uint16_t> parse_port(const std::string& name, const std::string& text) {
    auto value = parse_integer(name, text);
    if (value.is_error()) {
        return Err<std::uint16_t>(value.error());
    }
    if (value.value() < 0 || value.value() > std::numeric_limits<std::uint16_t>::max()) {
        return Err<std::uint16_t>(Error::validation(name + ": port out of range"));
    }
    return Ok(static_cast<std::uint16_t>(value.value()));
}

} // namespace

Result<Config> Config::from_environment(const EnvLookup& lookup) {
    const EnvLookup env = lookup ? lookup : EnvLookup([](const char* key) { return std::getenv(key); });
    auto get = [&env](const char* key) -> std::string {
        const char* value = env(key);
        return value ? std::string(value) : std::string();
    };

    Config config;

    if (auto v = get("CHUNKUP_PORT"); !v.empty()) {
        auto port = parse_port("CHUNKUP_PORT", v);
        if (port.is_error()) return Err<Config>(port.error());
        config.port = port.value();
    }
    if (auto v = get("CHUNKUP_DB_PATH"); !v.empty()) {
        config.db_path = v;
    }
    config.storage_endpoint = get("CHUNKUP_STORAGE_ENDPOINT");
    config.storage_api_key = get("CHUNKUP_STORAGE_API_KEY");
    config.tokens_file = get("CHUNKUP_TOKENS_FILE");

    if (auto v = get("CHUNKUP_CHUNK_SIZE"); !v.empty()) {
        auto size = parse_integer("CHUNKUP_CHUNK_SIZE", v);
        if (size.is_error()) return Err<Config>(size.error());
        config.chunk_size_bytes = size.value();
    }
    if (auto v = get("CHUNKUP_SESSION_TTL_SECONDS"); !v.empty()) {
        auto ttl = parse_integer("CHUNKUP_SESSION_TTL_SECONDS", v);
        if (ttl.is_error()) return Err<Config>(ttl.error());
        config.session_ttl = std::chrono::seconds(ttl.value());
    }
    if (auto v = get("CHUNKUP_WORKER_THREADS"); !v.empty()) {
        auto threads = parse_integer("CHUNKUP_WORKER_THREADS", v);
        if (threads.is_error()) return Err<Config>(threads.error());
        config.worker_threads = static_cast<std::size_t>(std::max<std::int64_t>(0, threads.value()));
    }
    if (auto v = get("CHUNKUP_STORAGE_TIMEOUT_SECONDS"); !v.empty()) {
        auto timeout = parse_integer("CHUNKUP_STORAGE_TIMEOUT_SECONDS", v);
        if (timeout.is_error()) return Err<Config>(timeout.error());
        config.storage_timeout = std::chrono::seconds(timeout.value());
    }
    if (auto v = get("CHUNKUP_CLEANUP_MAX_ATTEMPTS"); !v.empty()) {
        auto attempts = parse_integer("CHUNKUP_CLEANUP_MAX_ATTEMPTS", v);
        if (attempts.is_error()) return Err<Config>(attempts.error());
        config.cleanup_max_attempts = static_cast<int>(attempts.value());
    }
    if (auto v = get("CHUNKUP_EXPIRY_SWEEP_SECONDS"); !v.empty()) {
        auto interval = parse_integer("CHUNKUP_EXPIRY_SWEEP_SECONDS", v);
        if (interval.is_error()) return Err<Config>(interval.error());
        config.expiry_sweep_interval = std::chrono::seconds(interval.value());
    }
    if (auto v = get("CHUNKUP_STRICT_CHUNK_COUNT"); !v.empty()) {
        auto strict = parse_bool("CHUNKUP_STRICT_CHUNK_COUNT", v);
        if (strict.is_error()) return Err<Config>(strict.error());
        config.strict_chunk_count = strict.value();
    }
    if (auto v = get("CHUNKUP_LOG_LEVEL"); !v.empty()) {
        config.log_level = v;
    }

    return Ok(std::move(config));
}

Result<void> Config::apply_arguments(int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if ((arg == "-p" || arg == "--port") && has_value) {
            auto parsed = parse_port(arg, argv[++i]);
            if (parsed.is_error()) return Err<void>(parsed.error());
            port = parsed.value();
        } else if ((arg == "-d" || arg == "--db") && has_value) {
            db_path = argv[++i];
        } else if (arg == "--storage-endpoint" && has_value) {
            storage_endpoint = argv[++i];
        } else if (arg == "--tokens" && has_value) {
            tokens_file = argv[++i];
        } else if (arg == "--chunk-size" && has_value) {
            auto parsed = parse_integer(arg, argv[++i]);
            if (parsed.is_error()) return Err<void>(parsed.error());
            chunk_size_bytes = parsed.value();
        } else if ((arg == "-t" || arg == "--threads") && has_value) {
            auto parsed = parse_integer(arg, argv[++i]);
            if (parsed.is_error()) return Err<void>(parsed.error());
            worker_threads = static_cast<std::size_t>(std::max<std::int64_t>(0, parsed.value()));
        } else if ((arg == "-v" || arg == "--log-level") && has_value) {
            log_level = argv[++i];
        } else {
            return Err<void>(Error::validation("Unknown or incomplete argument: " + arg));
        }
    }
    return Ok();
}

Result<void> Config::validate() const {
    if (storage_endpoint.empty()) {
        return Err<void>(Error::validation("CHUNKUP_STORAGE_ENDPOINT is required"));
    }
    if (storage_endpoint.rfind("http://", 0) != 0) {
        return Err<void>(Error::validation("storage endpoint must start with http://"));
    }
    if (storage_api_key.empty()) {
        return Err<void>(Error::validation("CHUNKUP_STORAGE_API_KEY is required"));
    }
    if (tokens_file.empty()) {
        return Err<void>(Error::validation("CHUNKUP_TOKENS_FILE is required"));
    }
    if (chunk_size_bytes <= 0) {
        return Err<void>(Error::validation("chunk size must be positive"));
    }
    if (session_ttl.count() <= 0) {
        return Err<void>(Error::validation("session TTL must be positive"));
    }
    if (worker_threads == 0) {
        return Err<void>(Error::validation("worker thread count must be positive"));
    }
    if (cleanup_max_attempts <= 0) {
        return Err<void>(Error::validation("cleanup attempts must be positive"));
    }
    if (expiry_sweep_interval.count() <= 0) {
        return Err<void>(Error::validation("expiry sweep interval must be positive"));
    }
    return Ok();
}

} // namespace chunkup
