#pragma once

#include "chunkup/remote/storage_node.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkup::remote {

/**
 * @brief Pushes chunk bytes into the session's file on the storage node
 *
 * Derives the positional offset and chunk hash for each append and checks
 * the node's reported size against them. Never touches the chunk ledger;
 * the caller records a chunk only after append_chunk() succeeded.
 */
class StorageAppendClient {
public:
    StorageAppendClient(std::shared_ptr<StorageNode> node, std::int64_t chunk_size_bytes);

    /**
     * @brief Append one chunk at offset chunk_index * chunk_size
     *
     * @return Remote file size after the write
     * @retval ErrorCode::Validation empty payload or payload larger than the chunk size
     * @retval ErrorCode::RemoteUnavailable transport failure, non-2xx reply, or a
     *         reported size smaller than offset + payload length
     */
    Result<AppendResult> append_chunk(const std::string& storage_file_name,
                                      const std::string& owner_id,
                                      const std::vector<std::uint8_t>& bytes,
                                      std::int32_t chunk_index,
                                      std::int32_t total_chunks,
                                      bool is_first_chunk,
                                      bool is_last_chunk);

    Result<VerifyResult> verify(const std::string& storage_file_name,
                                const std::string& owner_id,
                                std::int64_t expected_size);

    std::int64_t chunk_size_bytes() const { return chunk_size_bytes_; }

private:
    std::shared_ptr<StorageNode> node_;
    std::int64_t chunk_size_bytes_;
};

} // namespace chunkup::remote
