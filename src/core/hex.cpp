#include "nectar/core/hex.hpp"

#include <utility>

namespace nectar::core {
    namespace {
        [[nodiscard]] int nibble(char c) noexcept {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] std::string_view strip_prefix(std::string_view in) noexcept {
            if (in.size() >= 2 && in[0] == '0' && (in[1] == 'x' || in[1] == 'X')) {
                in.remove_prefix(2);
            }
            return in;
        }
    } // namespace

    std::string hex_encode(const u8* data, std::size_t len) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.resize(len * 2);
        for (std::size_t i = 0; i < len; ++i) {
            out[2 * i] = hex[(data[i] >> 4) & 0xF];
            out[2 * i + 1] = hex[data[i] & 0xF];
        }
        return out;
    }

    bool hex_decode(std::string_view in, u8* out, std::size_t out_len) noexcept {
        in = strip_prefix(in);
        if (out == nullptr || in.size() != out_len * 2) {
            return false;
        }
        for (std::size_t i = 0; i < out_len; ++i) {
            const int hi = nibble(in[2 * i]);
            const int lo = nibble(in[2 * i + 1]);
            if (hi < 0 || lo < 0) {
                return false;
            }
            out[i] = static_cast<u8>((hi << 4) | lo);
        }
        return true;
    }

    bool hex_decode_any(std::string_view in, std::string* out) {
        in = strip_prefix(in);
        if (out == nullptr || (in.size() % 2) != 0) {
            return false;
        }
        std::string bytes;
        bytes.resize(in.size() / 2);
        if (!hex_decode(in, reinterpret_cast<u8*>(bytes.data()), bytes.size())) {
            return false;
        }
        *out = std::move(bytes);
        return true;
    }
} // namespace nectar::core
