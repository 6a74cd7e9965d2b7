#pragma once

#include "chunkup/core/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace chunkup::remote {

/**
 * @brief One positional append to a file on the storage node
 *
 * The node writes the bytes at exactly @c offset and treats a repeat of the
 * same (storage_file_name, chunk_index, chunk_hash) as a no-op.
 */
struct AppendRequest {
    std::string storage_file_name;
    std::string owner_id;
    std::int32_t chunk_index = 0;
    std::int32_t total_chunks = 0;
    std::int64_t offset = 0;
    bool is_first_chunk = false;
    bool is_last_chunk = false;
    std::string chunk_hash;   // fnv1a_hex of the bytes
};

struct AppendResult {
    std::int64_t current_size = 0;   // File size on the node after the write
};

struct VerifyResult {
    bool exists = false;
    std::int64_t size = 0;
};

/**
 * @brief Remote storage node holding the assembled files
 *
 * Files are addressed by (owner_id, storage_file_name). Implementations
 * report transport failures and non-2xx replies as
 * ErrorCode::RemoteUnavailable and must be callable from several threads.
 */
class StorageNode {
public:
    virtual ~StorageNode() = default;

    virtual Result<AppendResult> append(const AppendRequest& request,
                                        const std::vector<std::uint8_t>& bytes) = 0;

    virtual Result<VerifyResult> verify(const std::string& storage_file_name,
                                        const std::string& owner_id,
                                        std::int64_t expected_size) = 0;
};

} // namespace chunkup::remote
