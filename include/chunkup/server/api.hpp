#pragma once

#include "chunkup/auth/identity_provider.hpp"
#include "chunkup/core/error.hpp"
#include "chunkup/network/http_router.hpp"
#include "chunkup/upload/service.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>

namespace chunkup::server {

using json = nlohmann::json;

/// Router attribute carrying the authenticated owner id
inline constexpr const char* kOwnerAttribute = "owner_id";

/**
 * @brief Install the upload API on @p router
 *
 *   POST   /api/uploads/init
 *   POST   /api/uploads/chunk?uploadId=&chunkIndex=&storageFileName=
 *   GET    /api/uploads/status?uploadId=
 *   POST   /api/uploads/finalize
 *   DELETE /api/uploads/:uploadId
 *   GET    /health                 (no authentication)
 *
 * Everything except /health requires "Authorization: Bearer <token>".
 * The referenced objects must outlive the router.
 */
void register_upload_routes(network::HttpRouter& router,
                            upload::UploadService& service,
                            const auth::IdentityProvider& identity);

/**
 * @brief Request body limit for a server with the given chunk size
 *
 * Large enough for one full chunk sent as base64 inside the JSON envelope,
 * which is the bigger of the two chunk forms.
 */
std::size_t max_request_body_bytes(std::int64_t chunk_size_bytes);

network::HttpStatus http_status_for(ErrorCode code);

network::HttpResponse make_json_response(network::HttpStatus status, const json& body);

/// {"error": message, "code": snake_case_name} with the mapped status
network::HttpResponse make_error_response(const Error& error);

json file_record_to_json(const upload::FileRecord& record);

} // namespace chunkup::server
