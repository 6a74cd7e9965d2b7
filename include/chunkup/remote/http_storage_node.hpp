#pragma once

#include "chunkup/network/http_client.hpp"
#include "chunkup/remote/storage_node.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace chunkup::remote {

/**
 * @brief StorageNode speaking the node's JSON-over-HTTP protocol
 *
 * POST {endpoint}/chunk-append
 *   {fileName, userId, data (base64), chunkIndex, totalChunks,
 *    isFirstChunk, isLastChunk, offset, chunkHash}
 *   -> {success, currentSize}
 *
 * POST {endpoint}/verify-file
 *   {fileName, userId, expectedSize} -> {exists, size}
 *
 * Every request carries "Authorization: Bearer <api key>".
 */
class HttpStorageNode : public StorageNode {
public:
    HttpStorageNode(network::HttpEndpoint endpoint, std::string api_key, std::chrono::milliseconds timeout);

    /// Parse the endpoint URL; fails with ErrorCode::Validation on a bad URL
    static Result<std::unique_ptr<HttpStorageNode>> create(const std::string& endpoint_url,
                                                           std::string api_key,
                                                           std::chrono::milliseconds timeout);

    Result<AppendResult> append(const AppendRequest& request,
                                const std::vector<std::uint8_t>& bytes) override;

    Result<VerifyResult> verify(const std::string& storage_file_name,
                                const std::string& owner_id,
                                std::int64_t expected_size) override;

private:
    Result<network::HttpResponse> post_json(const std::string& path, const std::string& body);

    network::HttpClient client_;
    std::string api_key_;
};

} // namespace chunkup::remote
