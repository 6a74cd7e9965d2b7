#include "chunkup/remote/http_storage_node.hpp"

#include "chunkup/core/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace chunkup::remote {

using json = nlohmann::json;

namespace {

std::string reply_excerpt(const network::HttpResponse& response) {
    std::string text = response.body_as_string();
    if (text.size() > 200) {
        text.resize(200);
        text += "...";
    }
    return text;
}

Result<json> parse_reply(const network::HttpResponse& response, const char* operation) {
    if (!response.is_success()) {
        return Err<json>(Error::remote_unavailable(
            std::string(operation) + " rejected by storage node: HTTP " +
            std::to_string(response.status_code) + " " + reply_excerpt(response)));
    }

    auto payload = json::parse(response.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<json>(Error::remote_unavailable(
            std::string(operation) + " reply is not a JSON object: " + reply_excerpt(response)));
    }
    return Ok(std::move(payload));
}

} // namespace

HttpStorageNode::HttpStorageNode(network::HttpEndpoint endpoint,
                                 std::string api_key,
                                 std::chrono::milliseconds timeout)
    : client_(std::move(endpoint), timeout)
    , api_key_(std::move(api_key)) {
}

Result<std::unique_ptr<HttpStorageNode>> HttpStorageNode::create(const std::string& endpoint_url,
                                                                 std::string api_key,
                                                                 std::chrono::milliseconds timeout) {
    auto endpoint = network::HttpEndpoint::parse(endpoint_url);
    if (endpoint.is_error()) {
        return Err<std::unique_ptr<HttpStorageNode>>(endpoint.error());
    }
    return Ok(std::make_unique<HttpStorageNode>(std::move(endpoint.value()), std::move(api_key), timeout));
}

Result<network::HttpResponse> HttpStorageNode::post_json(const std::string& path, const std::string& body) {
    return client_.post(path,
                        {{"Authorization", "Bearer " + api_key_},
                         {"Content-Type", "application/json"}},
                        body);
}

Result<AppendResult> HttpStorageNode::append(const AppendRequest& request,
                                             const std::vector<std::uint8_t>& bytes) {
    json body{
        {"fileName", request.storage_file_name},
        {"userId", request.owner_id},
        {"data", base64_encode(bytes)},
        {"chunkIndex", request.chunk_index},
        {"totalChunks", request.total_chunks},
        {"isFirstChunk", request.is_first_chunk},
        {"isLastChunk", request.is_last_chunk},
        {"offset", request.offset},
        {"chunkHash", request.chunk_hash},
    };

    auto response = post_json("/chunk-append", body.dump());
    if (response.is_error()) {
        return Err<AppendResult>(response.error());
    }

    auto payload = parse_reply(response.value(), "chunk-append");
    if (payload.is_error()) {
        return Err<AppendResult>(payload.error());
    }

    const auto& reply = payload.value();
    if (reply.contains("success") && reply["success"].is_boolean() && !reply["success"].get<bool>()) {
        const bool has_message = reply.contains("error") && reply["error"].is_string();
        return Err<AppendResult>(Error::remote_unavailable(
            "chunk-append reported failure: " +
            (has_message ? reply["error"].get<std::string>() : std::string("unknown error"))));
    }
    if (!reply.contains("currentSize") || !reply["currentSize"].is_number_integer()) {
        return Err<AppendResult>(Error::remote_unavailable("chunk-append reply lacks currentSize"));
    }

    AppendResult result;
    result.current_size = reply["currentSize"].get<std::int64_t>();
    return Ok(result);
}

Result<VerifyResult> HttpStorageNode::verify(const std::string& storage_file_name,
                                             const std::string& owner_id,
                                             std::int64_t expected_size) {
    json body{
        {"fileName", storage_file_name},
        {"userId", owner_id},
        {"expectedSize", expected_size},
    };

    auto response = post_json("/verify-file", body.dump());
    if (response.is_error()) {
        return Err<VerifyResult>(response.error());
    }

    auto payload = parse_reply(response.value(), "verify-file");
    if (payload.is_error()) {
        return Err<VerifyResult>(payload.error());
    }

    const auto& reply = payload.value();
    if (!reply.contains("exists") || !reply["exists"].is_boolean()) {
        return Err<VerifyResult>(Error::remote_unavailable("verify-file reply lacks exists"));
    }

    VerifyResult result;
    result.exists = reply["exists"].get<bool>();
    if (result.exists) {
        if (!reply.contains("size") || !reply["size"].is_number_integer()) {
            return Err<VerifyResult>(Error::remote_unavailable("verify-file reply lacks size"));
        }
        result.size = reply["size"].get<std::int64_t>();
    }

    spdlog::debug("verify-file {}/{}: exists={} size={} expected={}",
                  owner_id, storage_file_name, result.exists, result.size, expected_size);
    return Ok(result);
}

} // namespace chunkup::remote
