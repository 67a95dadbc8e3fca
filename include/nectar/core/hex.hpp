#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "nectar/core/types.hpp"

namespace nectar::core {

    // Lowercase, no prefix.
    [[nodiscard]] std::string hex_encode(const u8* data, std::size_t len);

    template <typename Tag, std::size_t N>
    [[nodiscard]] std::string to_hex(const FixedBytes<Tag, N>& v) {
        return hex_encode(v.b.data(), N);
    }

    // Accepts an optional 0x prefix and either case. Fails unless the input
    // decodes to exactly out_len bytes.
    [[nodiscard]] bool hex_decode(std::string_view in, u8* out, std::size_t out_len) noexcept;

    template <typename Tag, std::size_t N>
    [[nodiscard]] bool from_hex(std::string_view in, FixedBytes<Tag, N>* out) noexcept {
        return out != nullptr && hex_decode(in, out->b.data(), N);
    }

    // Variable length decode; fails on odd length or a non-hex digit.
    [[nodiscard]] bool hex_decode_any(std::string_view in, std::string* out);

} // namespace nectar::core
