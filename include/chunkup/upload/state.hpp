#pragma once

#include "chunkup/upload/types.hpp"

namespace chunkup::upload {

/**
 * @brief Compute the lifecycle state of a session
 *
 * Created -> Uploading -> Complete is driven purely by ledger contents.
 * Finalized wins over everything once a FileRecord exists; otherwise an
 * elapsed expires_at yields Expired regardless of recorded progress.
 */
[[nodiscard]] UploadState derive_state(const UploadSession& session,
                                       const ChunkProgress& progress,
                                       TimePoint now,
                                       bool finalized) noexcept;

/// Legal edges of the session state machine (identity counts as legal)
[[nodiscard]] bool can_transition(UploadState from, UploadState to) noexcept;

/// Chunk and finalize calls are accepted only in these states
[[nodiscard]] bool accepts_uploads(UploadState state) noexcept;

} // namespace chunkup::upload
