#pragma once

#include "chunkup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace chunkup {

/**
 * @brief Process-wide settings resolved once at startup
 *
 * Values come from CHUNKUP_* environment variables first, then from
 * command-line flags. Endpoint, API key and token file have no defaults:
 * credentials never live in source.
 */
struct Config {
    static constexpr std::int64_t kDefaultChunkSize = 5 * 1024 * 1024;

    std::uint16_t port = 8080;
    std::string db_path = "chunkup.db";
    std::string storage_endpoint;      ///< e.g. "http://10.0.0.5:4000"
    std::string storage_api_key;       ///< Environment only
    std::string tokens_file;           ///< JSON object: bearer token -> owner id
    std::int64_t chunk_size_bytes = kDefaultChunkSize;
    std::chrono::seconds session_ttl{24 * 60 * 60};
    std::size_t worker_threads = 4;
    std::chrono::seconds storage_timeout{30};
    int cleanup_max_attempts = 5;
    std::chrono::seconds expiry_sweep_interval{10 * 60};
    bool strict_chunk_count = false;
    std::string log_level = "info";

    using EnvLookup = std::function<const char*(const char*)>;

    /**
     * @brief Build a config from the environment
     * @param lookup Environment accessor (std::getenv by default, injectable for tests)
     */
    static Result<Config> from_environment(const EnvLookup& lookup = nullptr);

    /**
     * @brief Apply command-line overrides on top of the current values
     *
     * Recognised: -p/--port, -d/--db, --storage-endpoint, --tokens,
     * --chunk-size, -t/--threads, -v/--log-level.
     */
    Result<void> apply_arguments(int argc, const char* const argv[]);

    /// Checks required settings and value ranges; reports the first problem found
    Result<void> validate() const;
};

} // namespace chunkup
