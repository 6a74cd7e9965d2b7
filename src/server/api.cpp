#include "chunkup/server/api.hpp"

#include "chunkup/core/encoding.hpp"
#include "chunkup/upload/state.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <limits>

namespace chunkup::server {

using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;

namespace {

// Headers, field names and the other JSON members around the chunk data
constexpr std::size_t kRequestEnvelopeBytes = 64 * 1024;

HttpResponse bad_request(const std::string& message) {
    return make_error_response(Error::validation(message));
}

// ────────────────────────────────────────────────────────────
// JSON field readers: absent optional fields keep their default,
// present fields of the wrong type are a validation error
// ────────────────────────────────────────────────────────────

Result<void> read_string(const json& payload, const char* key, std::string& out, bool required) {
    if (!payload.contains(key) || payload[key].is_null()) {
        if (required) {
            return Err<void>(Error::validation(std::string(key) + " is required"));
        }
        return Ok();
    }
    if (!payload[key].is_string()) {
        return Err<void>(Error::validation(std::string(key) + " must be a string"));
    }
    out = payload[key].get<std::string>();
    return Ok();
}

Result<void> read_int64(const json& payload, const char* key, std::int64_t& out) {
    if (!payload.contains(key) || payload[key].is_null()) {
        return Err<void>(Error::validation(std::string(key) + " is required"));
    }
    if (!payload[key].is_number_integer()) {
        return Err<void>(Error::validation(std::string(key) + " must be an integer"));
    }
    out = payload[key].get<std::int64_t>();
    return Ok();
}

Result<std::int32_t> to_int32(std::int64_t value, const char* key) {
    if (value < std::numeric_limits<std::int32_t>::min() || value > std::numeric_limits<std::int32_t>::max()) {
        return Err<std::int32_t>(Error::validation(std::string(key) + " out of range"));
    }
    return Ok(static_cast<std::int32_t>(value));
}

Result<std::int32_t> parse_index(const std::string& text) {
    if (text.empty()) {
        return Err<std::int32_t>(Error::validation("chunkIndex is required"));
    }
    std::size_t start = text[0] == '-' ? 1 : 0;
    if (start == text.size() || text.size() > 11) {
        return Err<std::int32_t>(Error::validation("chunkIndex must be an integer"));
    }
    for (std::size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return Err<std::int32_t>(Error::validation("chunkIndex must be an integer"));
        }
    }
    return to_int32(std::stoll(text), "chunkIndex");
}

bool is_json_body(const network::HttpRequest& request) {
    const std::string type = request.get_header("Content-Type");
    return type.compare(0, 16, "application/json") == 0;
}

/**
 * Chunk requests come either as raw bytes with query parameters, or as a
 * JSON body {uploadId, chunkIndex, storageFileName?, data: base64}.
 */
Result<upload::ChunkUpload> read_chunk_upload(const network::HttpRequest& request) {
    upload::ChunkUpload chunk;

    if (!is_json_body(request)) {
        chunk.upload_id = request.get_query("uploadId");
        chunk.storage_file_name = request.get_query("storageFileName");
        auto index = parse_index(request.get_query("chunkIndex"));
        if (index.is_error()) {
            return Err<upload::ChunkUpload>(index.error());
        }
        chunk.chunk_index = index.value();
        chunk.data = request.body;
        return Ok(std::move(chunk));
    }

    auto payload = json::parse(request.body_as_string(), nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return Err<upload::ChunkUpload>(Error::validation("Invalid JSON"));
    }

    std::string data;
    std::int64_t index = -1;
    for (auto read : {read_string(payload, "uploadId", chunk.upload_id, true),
                      read_string(payload, "storageFileName", chunk.storage_file_name, false),
                      read_string(payload, "data", data, true),
                      read_int64(payload, "chunkIndex", index)}) {
        if (read.is_error()) {
            return Err<upload::ChunkUpload>(read.error());
        }
    }

    auto narrowed = to_int32(index, "chunkIndex");
    if (narrowed.is_error()) {
        return Err<upload::ChunkUpload>(narrowed.error());
    }
    chunk.chunk_index = narrowed.value();

    auto bytes = base64_decode(data);
    if (bytes.is_error()) {
        return Err<upload::ChunkUpload>(bytes.error());
    }
    chunk.data = std::move(bytes.value());
    return Ok(std::move(chunk));
}

} // namespace

// ────────────────────────────────────────────────────────────
// Response helpers
// ────────────────────────────────────────────────────────────

std::size_t max_request_body_bytes(std::int64_t chunk_size_bytes) {
    const auto raw = static_cast<std::size_t>(chunk_size_bytes > 0 ? chunk_size_bytes : 0);
    const std::size_t base64 = 4 * ((raw + 2) / 3);
    return base64 + kRequestEnvelopeBytes;
}

HttpStatus http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::Validation: return HttpStatus::BAD_REQUEST;
        case ErrorCode::Unauthorized: return HttpStatus::UNAUTHORIZED;
        case ErrorCode::Forbidden: return HttpStatus::FORBIDDEN;
        case ErrorCode::NotFound: return HttpStatus::NOT_FOUND;
        case ErrorCode::Incomplete: return HttpStatus::BAD_REQUEST;
        case ErrorCode::RemoteFileMissing: return HttpStatus::GONE;
        case ErrorCode::IntegrityMismatch: return HttpStatus::CONFLICT;
        case ErrorCode::RemoteUnavailable: return HttpStatus::BAD_GATEWAY;
        case ErrorCode::Storage: return HttpStatus::INTERNAL_SERVER_ERROR;
        case ErrorCode::Internal: return HttpStatus::INTERNAL_SERVER_ERROR;
    }
    return HttpStatus::INTERNAL_SERVER_ERROR;
}

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_error_response(const Error& error) {
    json body{{"error", error.message}, {"code", error_code_name(error.code)}};
    if (error.code == ErrorCode::Incomplete) {
        body["missingChunks"] = error.missing_chunks;
    }
    if (error.is_retryable()) {
        body["retryable"] = true;
    }
    return make_json_response(http_status_for(error.code), body);
}

json file_record_to_json(const upload::FileRecord& record) {
    json j{
        {"id", record.id},
        {"name", record.name},
        {"originalName", record.original_name},
        {"mimeType", record.mime_type},
        {"sizeBytes", record.size_bytes},
        {"storagePath", record.storage_path},
        {"uploadId", record.upload_id},
        {"createdAt", to_iso8601(record.created_at)},
    };
    j["folderId"] = record.folder_id ? json(*record.folder_id) : json(nullptr);
    return j;
}

// ────────────────────────────────────────────────────────────
// Routes
// ────────────────────────────────────────────────────────────

void register_upload_routes(network::HttpRouter& router,
                            upload::UploadService& service,
                            const auth::IdentityProvider& identity) {
    router.use([](HttpContext& ctx, HttpResponse&) {
        spdlog::debug("{} {}", network::HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
        return true;
    });

    router.use([&identity](HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.path == "/health") {
            return true;
        }
        auto owner = identity.authenticate(ctx.request.bearer_token());
        if (owner.is_error()) {
            response = make_error_response(owner.error());
            response.set_header("WWW-Authenticate", "Bearer");
            return false;
        }
        ctx.set_attribute(kOwnerAttribute, owner.value());
        return true;
    });

    router.set_not_found_handler([](const HttpContext& ctx) {
        return make_error_response(Error::not_found("No route for " + ctx.request.path));
    });

    router.get("/health", [](const HttpContext&) {
        return make_json_response(HttpStatus::OK, json{{"status", "ok"}});
    });

    router.post("/api/uploads/init", [&service](const HttpContext& ctx) {
        auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            return bad_request("Invalid JSON");
        }

        upload::InitRequest request;
        std::int64_t total_chunks = 0;
        std::string folder_id;
        for (auto read : {read_string(payload, "fileName", request.file_name, true),
                          read_string(payload, "mimeType", request.mime_type, false),
                          read_string(payload, "folderId", folder_id, false),
                          read_int64(payload, "totalSize", request.total_size_bytes),
                          read_int64(payload, "totalChunks", total_chunks)}) {
            if (read.is_error()) {
                return make_error_response(read.error());
            }
        }
        auto chunks = to_int32(total_chunks, "totalChunks");
        if (chunks.is_error()) {
            return make_error_response(chunks.error());
        }
        request.total_chunks = chunks.value();
        if (!folder_id.empty()) {
            request.folder_id = folder_id;
        }

        auto created = service.init(ctx.get_attribute(kOwnerAttribute), request);
        if (created.is_error()) {
            return make_error_response(created.error());
        }

        const auto& init = created.value();
        return make_json_response(HttpStatus::OK, json{
            {"uploadId", init.upload_id},
            {"storageFileName", init.storage_file_name},
            {"chunkSize", init.chunk_size_bytes},
            {"totalChunks", init.total_chunks},
            {"expiresAt", to_iso8601(init.expires_at)},
        });
    });

    router.post("/api/uploads/chunk", [&service](const HttpContext& ctx) {
        auto chunk = read_chunk_upload(ctx.request);
        if (chunk.is_error()) {
            return make_error_response(chunk.error());
        }

        auto receipt = service.upload_chunk(ctx.get_attribute(kOwnerAttribute), chunk.value());
        if (receipt.is_error()) {
            return make_error_response(receipt.error());
        }

        const auto& r = receipt.value();
        json body{
            {"success", true},
            {"chunkIndex", r.chunk_index},
            {"uploadedCount", r.progress.uploaded_count},
            {"totalChunks", r.progress.total_chunks},
            {"progress", r.progress.progress_pct},
            {"isComplete", r.progress.is_complete},
        };
        if (r.skipped) {
            body["skipped"] = true;
        }
        if (r.current_remote_size) {
            body["currentFileSize"] = *r.current_remote_size;
        }
        return make_json_response(HttpStatus::OK, body);
    });

    router.get("/api/uploads/status", [&service](const HttpContext& ctx) {
        const std::string upload_id = ctx.request.get_query("uploadId");
        if (upload_id.empty()) {
            return bad_request("uploadId is required");
        }

        auto status = service.status(ctx.get_attribute(kOwnerAttribute), upload_id);
        if (status.is_error()) {
            return make_error_response(status.error());
        }

        const auto& s = status.value();
        return make_json_response(HttpStatus::OK, json{
            {"uploadId", s.session.upload_id},
            {"fileName", s.session.file_name},
            {"storageFileName", s.session.storage_file_name},
            {"uploadedCount", s.progress.uploaded_count},
            {"totalChunks", s.progress.total_chunks},
            {"progress", s.progress.progress_pct},
            {"isComplete", s.progress.is_complete},
            {"uploadedChunks", s.progress.uploaded_indices},
            {"state", upload::upload_state_name(s.state)},
            {"expiresAt", to_iso8601(s.session.expires_at)},
        });
    });

    router.post("/api/uploads/finalize", [&service](const HttpContext& ctx) {
        auto payload = json::parse(ctx.request.body_as_string(), nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            return bad_request("Invalid JSON");
        }

        std::string upload_id;
        std::string storage_file_name;
        for (auto read : {read_string(payload, "uploadId", upload_id, true),
                          read_string(payload, "storageFileName", storage_file_name, false)}) {
            if (read.is_error()) {
                return make_error_response(read.error());
            }
        }

        const std::string owner = ctx.get_attribute(kOwnerAttribute);
        auto record = service.finalize(owner, upload_id, storage_file_name);
        if (record.is_error()) {
            const Error& error = record.error();
            HttpResponse response = make_error_response(error);
            if (error.code == ErrorCode::Incomplete) {
                json body = json::parse(response.body_as_string());
                auto status = service.status(owner, upload_id);
                if (status.is_ok()) {
                    body["uploadedCount"] = status.value().progress.uploaded_count;
                    body["totalChunks"] = status.value().progress.total_chunks;
                }
                response.set_body(body.dump());
            }
            return response;
        }

        return make_json_response(HttpStatus::OK, json{
            {"success", true},
            {"file", file_record_to_json(record.value())},
        });
    });

    router.delete_("/api/uploads/:uploadId", [&service](const HttpContext& ctx) {
        auto cancelled = service.cancel(ctx.get_attribute(kOwnerAttribute), ctx.get_param("uploadId"));
        if (cancelled.is_error()) {
            return make_error_response(cancelled.error());
        }
        return make_json_response(HttpStatus::OK, json{{"success", true}});
    });
}

} // namespace chunkup::server
