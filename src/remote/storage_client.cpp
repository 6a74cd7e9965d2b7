#include "chunkup/remote/storage_client.hpp"

#include "chunkup/core/encoding.hpp"

#include <spdlog/spdlog.h>

namespace chunkup::remote {

StorageAppendClient::StorageAppendClient(std::shared_ptr<StorageNode> node, std::int64_t chunk_size_bytes)
    : node_(std::move(node))
    , chunk_size_bytes_(chunk_size_bytes) {
}

Result<AppendResult> StorageAppendClient::append_chunk(const std::string& storage_file_name,
                                                       const std::string& owner_id,
                                                       const std::vector<std::uint8_t>& bytes,
                                                       std::int32_t chunk_index,
                                                       std::int32_t total_chunks,
                                                       bool is_first_chunk,
                                                       bool is_last_chunk) {
    if (bytes.empty()) {
        return Err<AppendResult>(Error::validation("Chunk payload is empty"));
    }
    if (static_cast<std::int64_t>(bytes.size()) > chunk_size_bytes_) {
        return Err<AppendResult>(Error::validation(
            "Chunk payload of " + std::to_string(bytes.size()) +
            " bytes exceeds chunk size " + std::to_string(chunk_size_bytes_)));
    }

    AppendRequest request;
    request.storage_file_name = storage_file_name;
    request.owner_id = owner_id;
    request.chunk_index = chunk_index;
    request.total_chunks = total_chunks;
    request.offset = static_cast<std::int64_t>(chunk_index) * chunk_size_bytes_;
    request.is_first_chunk = is_first_chunk;
    request.is_last_chunk = is_last_chunk;
    request.chunk_hash = fnv1a_hex(bytes);

    auto result = node_->append(request, bytes);
    if (result.is_error()) {
        spdlog::warn("Append of chunk {} to {} failed: {}", chunk_index, storage_file_name, result.error().message);
        return result;
    }

    const std::int64_t end = request.offset + static_cast<std::int64_t>(bytes.size());
    if (result.value().current_size < end) {
        return Err<AppendResult>(Error::remote_unavailable(
            "Storage node reports size " + std::to_string(result.value().current_size) +
            " after writing chunk " + std::to_string(chunk_index) + " ending at " + std::to_string(end)));
    }

    spdlog::debug("Appended chunk {}/{} of {} at offset {} ({} bytes, remote size {})",
                  chunk_index + 1, total_chunks, storage_file_name, request.offset,
                  bytes.size(), result.value().current_size);
    return result;
}

Result<VerifyResult> StorageAppendClient::verify(const std::string& storage_file_name,
                                                 const std::string& owner_id,
                                                 std::int64_t expected_size) {
    return node_->verify(storage_file_name, owner_id, expected_size);
}

} // namespace chunkup::remote
