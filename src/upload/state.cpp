#include "chunkup/upload/state.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace chunkup::upload {
namespace {

bool is_progressive(UploadState current, UploadState target) {
    static const std::unordered_map<UploadState, std::vector<UploadState>> transitions {
        {UploadState::Created, {UploadState::Uploading, UploadState::Complete, UploadState::Expired}},
        {UploadState::Uploading, {UploadState::Complete, UploadState::Expired}},
        {UploadState::Complete, {UploadState::Finalized, UploadState::Expired}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadState derive_state(const UploadSession& session,
                         const ChunkProgress& progress,
                         TimePoint now,
                         bool finalized) noexcept {
    if (finalized) {
        return UploadState::Finalized;
    }
    if (session.is_expired(now)) {
        return UploadState::Expired;
    }
    if (progress.total_chunks > 0 && progress.uploaded_count >= progress.total_chunks) {
        return UploadState::Complete;
    }
    if (progress.uploaded_count > 0) {
        return UploadState::Uploading;
    }
    return UploadState::Created;
}

bool can_transition(UploadState from, UploadState to) noexcept {
    if (from == to) {
        return true;
    }
    // Finalized and Expired are terminal
    if (from == UploadState::Finalized || from == UploadState::Expired) {
        return false;
    }
    return is_progressive(from, to);
}

bool accepts_uploads(UploadState state) noexcept {
    return state == UploadState::Created
        || state == UploadState::Uploading
        || state == UploadState::Complete;
}

} // namespace chunkup::upload
