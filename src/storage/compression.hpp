#pragma once

// zlib framing for persisted snapshot payloads.
//
// A frame is: 4-byte magic "DSNP", 1-byte format version, 8-byte
// little-endian uncompressed length, then a zlib stream (with header and
// adler32 trailer). The stored length lets the reader size its buffer
// exactly and reject truncated or inflated payloads.
//
// Internal header, not installed.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace docsnap_cpp::storage {

inline constexpr std::array<std::byte, 4> frame_magic{
    std::byte{'D'}, std::byte{'S'}, std::byte{'N'}, std::byte{'P'}};
inline constexpr std::byte frame_version{1};
inline constexpr std::size_t frame_header_size = frame_magic.size() + 1 + 8;

// Frames claiming more than this are rejected without allocating.
inline constexpr std::uint64_t max_payload_size = std::uint64_t{1} << 30;

// Compress `payload` into a frame, or nullopt if zlib fails.
inline auto compress_frame(std::string_view payload) -> std::optional<std::vector<std::byte>> {
    auto bound = ::compressBound(static_cast<uLong>(payload.size()));
    auto frame = std::vector<std::byte>(frame_header_size + bound);

    auto* out = frame.data();
    for (auto b : frame_magic) *out++ = b;
    *out++ = frame_version;
    auto size = static_cast<std::uint64_t>(payload.size());
    for (int i = 0; i < 8; ++i) {
        *out++ = static_cast<std::byte>((size >> (8 * i)) & 0xFF);
    }

    auto dest_len = bound;
    auto ret = ::compress2(reinterpret_cast<Bytef*>(out), &dest_len,
                           reinterpret_cast<const Bytef*>(payload.data()),
                           static_cast<uLong>(payload.size()), Z_BEST_SPEED);
    if (ret != Z_OK) return std::nullopt;

    frame.resize(frame_header_size + dest_len);
    return frame;
}

// Decompress a frame, or nullopt if it is not a valid frame.
inline auto decompress_frame(const std::vector<std::byte>& frame) -> std::optional<std::string> {
    if (frame.size() < frame_header_size) return std::nullopt;
    for (std::size_t i = 0; i < frame_magic.size(); ++i) {
        if (frame[i] != frame_magic[i]) return std::nullopt;
    }
    if (frame[frame_magic.size()] != frame_version) return std::nullopt;

    auto size = std::uint64_t{0};
    for (int i = 0; i < 8; ++i) {
        size |= static_cast<std::uint64_t>(frame[frame_magic.size() + 1 + i]) << (8 * i);
    }
    if (size > max_payload_size) return std::nullopt;

    auto payload = std::string(static_cast<std::size_t>(size), '\0');
    auto dest_len = static_cast<uLongf>(size);
    auto ret = ::uncompress(reinterpret_cast<Bytef*>(payload.data()), &dest_len,
                            reinterpret_cast<const Bytef*>(frame.data() + frame_header_size),
                            static_cast<uLong>(frame.size() - frame_header_size));
    if (ret != Z_OK || dest_len != size) return std::nullopt;
    return payload;
}

}  // namespace docsnap_cpp::storage
