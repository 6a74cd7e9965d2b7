#include "chunkup/core/encoding.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace chunkup {
namespace {

namespace it = boost::archive::iterators;

using Base64Encoder = it::base64_from_binary<it::transform_width<const std::uint8_t*, 6, 8>>;
using Base64Decoder = it::transform_width<it::binary_from_base64<std::string::const_iterator>, 8, 6>;

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

} // namespace

std::string base64_encode(const std::uint8_t* data, std::size_t size) {
    if (size == 0) {
        return {};
    }
    std::string encoded(Base64Encoder(data), Base64Encoder(data + size));
    encoded.append((3 - size % 3) % 3, '=');
    return encoded;
}

std::string base64_encode(const std::vector<std::uint8_t>& data) {
    return base64_encode(data.data(), data.size());
}

Result<std::vector<std::uint8_t>> base64_decode(const std::string& text) {
    if (text.empty()) {
        return Ok(std::vector<std::uint8_t>{});
    }
    if (text.size() % 4 != 0) {
        return Err<std::vector<std::uint8_t>>(Error::validation("base64 length must be a multiple of 4"));
    }

    const std::size_t padding = static_cast<std::size_t>(
        std::distance(text.rbegin(), std::find_if(text.rbegin(), text.rend(),
                                                  [](char c) { return c != '='; })));
    if (padding > 2) {
        return Err<std::vector<std::uint8_t>>(Error::validation("invalid base64 padding"));
    }

    std::string input = text;
    const auto body_end = input.end() - static_cast<std::ptrdiff_t>(padding);
    if (!std::all_of(input.begin(), body_end, is_base64_char)) {
        return Err<std::vector<std::uint8_t>>(Error::validation("invalid base64 character"));
    }
    std::replace(body_end, input.end(), '=', 'A');

    std::vector<std::uint8_t> decoded;
    try {
        const std::string& source = input;
        decoded.assign(Base64Decoder(source.begin()), Base64Decoder(source.end()));
    } catch (const std::exception& e) {
        return Err<std::vector<std::uint8_t>>(Error::validation(std::string("invalid base64: ") + e.what()));
    }
    decoded.resize(decoded.size() - padding);
    return Ok(std::move(decoded));
}

std::string fnv1a_hex(const std::uint8_t* data, std::size_t size) {
    const std::uint64_t offset = 0xcbf29ce484222325ULL;
    const std::uint64_t prime  = 0x100000001b3ULL;
    std::uint64_t hash = offset;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= static_cast<std::uint64_t>(data[i]);
        hash *= prime;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(sizeof(hash) * 2) << std::setfill('0') << hash;
    return oss.str();
}

std::string fnv1a_hex(const std::vector<std::uint8_t>& data) {
    return fnv1a_hex(data.data(), data.size());
}

std::string random_hex(std::size_t count) {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    std::uniform_int_distribution<int> byte(0, 255);

    std::ostringstream oss;
    for (std::size_t i = 0; i < count; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << byte(generator);
    }
    return oss.str();
}

std::string generate_uuid() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

std::int64_t to_epoch_millis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint from_epoch_millis(std::int64_t millis) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(millis)));
}

std::string to_iso8601(TimePoint tp) {
    const auto millis = to_epoch_millis(tp);
    const std::time_t seconds = static_cast<std::time_t>(millis / 1000);
    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << (millis % 1000) << 'Z';
    return oss.str();
}

} // namespace chunkup
