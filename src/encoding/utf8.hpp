#pragma once

// UTF-8 well-formedness check for document text.
// Snapshot payloads are JSON, which only carries valid UTF-8.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace docsnap_cpp::encoding {

// True if `text` is well-formed UTF-8: no stray continuation bytes, no
// truncated sequences, no overlong forms, no surrogates, nothing above U+10FFFF.
inline auto is_valid_utf8(std::string_view text) -> bool {
    auto i = std::size_t{0};
    while (i < text.size()) {
        auto lead = static_cast<std::uint8_t>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        auto length = std::size_t{0};
        auto low = std::uint8_t{0x80};   // bounds of the second byte
        auto high = std::uint8_t{0xBF};
        if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) low = 0xA0;    // overlong
            if (lead == 0xED) high = 0x9F;   // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) low = 0x90;    // overlong
            if (lead == 0xF4) high = 0x8F;   // above U+10FFFF
        } else {
            return false;
        }
        if (text.size() - i < length) return false;

        auto second = static_cast<std::uint8_t>(text[i + 1]);
        if (second < low || second > high) return false;
        for (auto k = std::size_t{2}; k < length; ++k) {
            auto next = static_cast<std::uint8_t>(text[i + k]);
            if ((next & 0xC0) != 0x80) return false;
        }
        i += length;
    }
    return true;
}

}  // namespace docsnap_cpp::encoding
