#pragma once

#include "chunkup/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkup {

/// Standard (RFC 4648) base64 with '=' padding
std::string base64_encode(const std::uint8_t* data, std::size_t size);
std::string base64_encode(const std::vector<std::uint8_t>& data);

/// Rejects input whose length is not a multiple of 4 or that contains non-alphabet characters
Result<std::vector<std::uint8_t>> base64_decode(const std::string& text);

/// 64-bit FNV-1a digest rendered as 16 lowercase hex digits
std::string fnv1a_hex(const std::uint8_t* data, std::size_t size);
std::string fnv1a_hex(const std::vector<std::uint8_t>& data);

/// `count` cryptographically unimportant random bytes as 2*count hex digits
std::string random_hex(std::size_t count);

/// Random (version 4) UUID in canonical 8-4-4-4-12 form
std::string generate_uuid();

// ────────────────────────────────────────────────────────────
// Time helpers (timestamps are persisted as epoch milliseconds)
// ────────────────────────────────────────────────────────────

using TimePoint = std::chrono::system_clock::time_point;

std::int64_t to_epoch_millis(TimePoint tp);
TimePoint from_epoch_millis(std::int64_t millis);

/// "2026-01-22T03:35:37.123Z"
std::string to_iso8601(TimePoint tp);

} // namespace chunkup
