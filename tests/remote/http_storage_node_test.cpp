#include "chunkup/core/encoding.hpp"
#include "chunkup/network/http_server_asio.hpp"
#include "chunkup/remote/http_storage_node.hpp"

#include <boost/asio.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <thread>

using namespace chunkup;
using namespace chunkup::network;
using chunkup::remote::AppendRequest;
using chunkup::remote::HttpStorageNode;
using json = nlohmann::json;

namespace {

/// Storage node double speaking the JSON protocol on an ephemeral port
class MockNodeServer {
public:
    using Reply = std::function<HttpResponse(const HttpRequest&)>;

    MockNodeServer()
        : server_(io_, 0, "127.0.0.1") {
        server_.set_handler([this](const HttpRequest& req) {
            std::lock_guard<std::mutex> lock(mutex_);
            last_request_ = req;
            return reply_(req);
        });
        thread_ = std::thread([this] { io_.run(); });
    }

    ~MockNodeServer() {
        server_.stop();
        io_.stop();
        thread_.join();
    }

    void reply_with(Reply reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        reply_ = std::move(reply);
    }

    HttpRequest last_request() {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_request_;
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(server_.get_port());
    }

private:
    boost::asio::io_context io_;
    HttpServerAsio server_;
    std::mutex mutex_;
    Reply reply_ = [](const HttpRequest&) { return HttpResponse(HttpStatus::OK); };
    HttpRequest last_request_;
    std::thread thread_;
};

HttpResponse json_reply(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

AppendRequest make_append(std::int32_t index) {
    AppendRequest request;
    request.storage_file_name = "file_0001.mp4";
    request.owner_id = "alice";
    request.chunk_index = index;
    request.total_chunks = 3;
    request.offset = index * 4;
    request.is_first_chunk = index == 0;
    request.is_last_chunk = index == 2;
    request.chunk_hash = "abc";
    return request;
}

std::unique_ptr<HttpStorageNode> make_node(const MockNodeServer& server) {
    auto node = HttpStorageNode::create(server.url(), "node-key", std::chrono::seconds(5));
    EXPECT_TRUE(node.is_ok());
    return std::move(node.value());
}

} // namespace

TEST(HttpStorageNodeTest, AppendSendsProtocolFields) {
    MockNodeServer server;
    server.reply_with([](const HttpRequest&) {
        return json_reply(HttpStatus::OK, {{"success", true}, {"currentSize", 8}});
    });
    auto node = make_node(server);

    const std::vector<std::uint8_t> bytes{1, 2, 3, 4};
    auto result = node->append(make_append(1), bytes);
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().current_size, 8);

    auto req = server.last_request();
    EXPECT_EQ(req.path, "/chunk-append");
    EXPECT_EQ(req.bearer_token(), "node-key");

    auto sent = json::parse(req.body_as_string());
    EXPECT_EQ(sent["fileName"], "file_0001.mp4");
    EXPECT_EQ(sent["userId"], "alice");
    EXPECT_EQ(sent["chunkIndex"], 1);
    EXPECT_EQ(sent["totalChunks"], 3);
    EXPECT_EQ(sent["offset"], 4);
    EXPECT_EQ(sent["isFirstChunk"], false);
    EXPECT_EQ(sent["chunkHash"], "abc");
    EXPECT_EQ(sent["data"], base64_encode(bytes));
}

TEST(HttpStorageNodeTest, AppendFailureReplies) {
    MockNodeServer server;
    auto node = make_node(server);
    const std::vector<std::uint8_t> bytes{1};

    server.reply_with([](const HttpRequest&) {
        return json_reply(HttpStatus::INTERNAL_SERVER_ERROR, {{"error", "disk"}});
    });
    auto rejected = node->append(make_append(0), bytes);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().code, ErrorCode::RemoteUnavailable);

    server.reply_with([](const HttpRequest&) {
        return json_reply(HttpStatus::OK, {{"success", false}, {"error", "offset gap"}});
    });
    auto refused = node->append(make_append(0), bytes);
    ASSERT_TRUE(refused.is_error());
    EXPECT_NE(refused.error().message.find("offset gap"), std::string::npos);

    server.reply_with([](const HttpRequest&) {
        HttpResponse response(HttpStatus::OK);
        response.set_body("not json");
        return response;
    });
    EXPECT_TRUE(node->append(make_append(0), bytes).is_error());

    server.reply_with([](const HttpRequest&) {
        return json_reply(HttpStatus::OK, {{"success", true}});
    });
    EXPECT_TRUE(node->append(make_append(0), bytes).is_error());
}

TEST(HttpStorageNodeTest, VerifyParsesExistsAndSize) {
    MockNodeServer server;
    server.reply_with([](const HttpRequest& req) {
        auto body = json::parse(req.body_as_string());
        return json_reply(HttpStatus::OK, {{"exists", true}, {"size", body["expectedSize"]}});
    });
    auto node = make_node(server);

    auto result = node->verify("file_0001.mp4", "alice", 12345);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value().exists);
    EXPECT_EQ(result.value().size, 12345);
    EXPECT_EQ(server.last_request().path, "/verify-file");
}

TEST(HttpStorageNodeTest, VerifyMissingFile) {
    MockNodeServer server;
    server.reply_with([](const HttpRequest&) {
        return json_reply(HttpStatus::OK, {{"exists", false}});
    });
    auto node = make_node(server);

    auto result = node->verify("gone.bin", "alice", 10);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().exists);
}

TEST(HttpStorageNodeTest, CreateRejectsBadEndpoint) {
    auto node = HttpStorageNode::create("ftp://nowhere", "k", std::chrono::seconds(1));
    ASSERT_TRUE(node.is_error());
    EXPECT_EQ(node.error().code, ErrorCode::Validation);
}
