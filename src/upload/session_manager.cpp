#include "chunkup/upload/session_manager.hpp"

#include "chunkup/core/encoding.hpp"
#include "chunkup/upload/state.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>

namespace chunkup::upload {

namespace {

constexpr const char* kDefaultMimeType = "application/octet-stream";

std::string extension_of(const std::string& file_name) {
    const auto dot = file_name.rfind('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return "";
    }
    return file_name.substr(dot + 1);
}

} // namespace

SessionManager::SessionManager(store::UploadStore& store,
                               ChunkRecorder& recorder,
                               SessionSettings settings,
                               ClockFn clock)
    : store_(store)
    , recorder_(recorder)
    , settings_(settings)
    , clock_(clock ? std::move(clock) : ClockFn([]() { return std::chrono::system_clock::now(); })) {
}

std::string SessionManager::make_storage_file_name(const std::string& file_name, TimePoint now) {
    char millis_hex[17];
    std::snprintf(millis_hex, sizeof(millis_hex), "%016llx",
                  static_cast<unsigned long long>(to_epoch_millis(now)));

    std::string name = "file_";
    name += millis_hex;
    name += random_hex(8);

    const std::string extension = extension_of(file_name);
    if (!extension.empty()) {
        name += "." + extension;
    }
    return name;
}

Result<InitResponse> SessionManager::init(const std::string& owner_id, const InitRequest& request) {
    if (owner_id.empty()) {
        return Err<InitResponse>(Error::validation("Owner id is required"));
    }
    if (request.file_name.empty()) {
        return Err<InitResponse>(Error::validation("fileName is required"));
    }
    if (request.total_size_bytes <= 0) {
        return Err<InitResponse>(Error::validation("totalSize must be positive"));
    }
    if (request.total_chunks <= 0) {
        return Err<InitResponse>(Error::validation("totalChunks must be positive"));
    }
    if (settings_.strict_chunk_count) {
        const std::int64_t expected =
            (request.total_size_bytes + settings_.chunk_size_bytes - 1) / settings_.chunk_size_bytes;
        if (request.total_chunks != expected) {
            return Err<InitResponse>(Error::validation(
                "totalChunks must be " + std::to_string(expected) + " for " +
                std::to_string(request.total_size_bytes) + " bytes"));
        }
    }

    const TimePoint now = clock_();

    UploadSession session;
    session.upload_id = generate_uuid();
    session.owner_id = owner_id;
    session.file_name = request.file_name;
    session.mime_type = request.mime_type.empty() ? kDefaultMimeType : request.mime_type;
    session.total_size_bytes = request.total_size_bytes;
    session.total_chunks = request.total_chunks;
    session.storage_file_name = make_storage_file_name(request.file_name, now);
    session.folder_id = request.folder_id;
    session.created_at = now;
    session.expires_at = now + settings_.session_ttl;

    auto inserted = store_.insert_session(session);
    if (inserted.is_error()) {
        return Err<InitResponse>(inserted.error());
    }

    spdlog::debug("Created upload session {} for {} ({} bytes in {} chunks)",
                  session.upload_id, session.file_name, session.total_size_bytes, session.total_chunks);

    InitResponse response;
    response.upload_id = session.upload_id;
    response.storage_file_name = session.storage_file_name;
    response.chunk_size_bytes = settings_.chunk_size_bytes;
    response.total_chunks = session.total_chunks;
    response.expires_at = session.expires_at;
    return Ok(std::move(response));
}

Result<UploadSession> SessionManager::require_active(const std::string& upload_id, const std::string& caller_id) {
    if (upload_id.empty()) {
        return Err<UploadSession>(Error::validation("uploadId is required"));
    }

    auto found = store_.find_session(upload_id);
    if (found.is_error()) {
        return Err<UploadSession>(found.error());
    }
    if (!found.value()) {
        return Err<UploadSession>(Error::not_found("Upload session not found; restart with init"));
    }

    UploadSession& session = *found.value();
    if (session.is_expired(clock_())) {
        return Err<UploadSession>(Error::not_found("Upload session expired; restart with init"));
    }
    if (session.owner_id != caller_id) {
        return Err<UploadSession>(Error::forbidden("Upload session belongs to another user"));
    }
    return Ok(std::move(session));
}

Result<SessionStatus> SessionManager::status(const std::string& upload_id, const std::string& caller_id) {
    auto session = require_active(upload_id, caller_id);
    if (session.is_error()) {
        return Err<SessionStatus>(session.error());
    }

    auto progress = recorder_.get_progress(upload_id);
    if (progress.is_error()) {
        return Err<SessionStatus>(progress.error());
    }

    auto record = store_.find_file_by_upload(upload_id);
    if (record.is_error()) {
        return Err<SessionStatus>(record.error());
    }

    SessionStatus status;
    status.session = std::move(session.value());
    status.progress = std::move(progress.value());
    status.state = derive_state(status.session, status.progress, clock_(), record.value().has_value());
    return Ok(std::move(status));
}

Result<void> SessionManager::cancel(const std::string& upload_id, const std::string& caller_id) {
    auto session = require_active(upload_id, caller_id);
    if (session.is_error()) {
        return Err<void>(session.error());
    }

    auto removed = store_.delete_session(upload_id);
    if (removed.is_error()) {
        return Err<void>(removed.error());
    }
    if (!removed.value()) {
        // Lost a race with another cancel, cleanup or the expiry sweep
        return Err<void>(Error::not_found("Upload session not found; restart with init"));
    }
    return Ok();
}

Result<std::vector<std::string>> SessionManager::purge_expired() {
    auto removed = store_.delete_expired_sessions(clock_());
    if (removed.is_error()) {
        return removed;
    }
    if (!removed.value().empty()) {
        spdlog::debug("Expiry sweep removed {} session(s)", removed.value().size());
    }
    return removed;
}

} // namespace chunkup::upload
