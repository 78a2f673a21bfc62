#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace lcr {
namespace base64 {

namespace detail {

// Returns 0..63 for a symbol of the standard alphabet, -1 otherwise
inline constexpr int decode_symbol(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // namespace detail

// Canonical decoder (RFC 4648 standard alphabet, padded): the input length
// is a multiple of 4, padding is one or two trailing '=', and unused bits
// are zero. Each byte sequence therefore has exactly one accepted encoding.
// On failure `out` is cleared.
[[nodiscard]]
inline bool decode(std::string_view in, std::vector<std::uint8_t>& out) {
    out.clear();
    if (in.empty() || (in.size() % 4) != 0) {
        return false;
    }
    std::size_t len = in.size();
    std::size_t pad = 0;
    while (len > 0 && in[len - 1] == '=' && pad < 2) {
        --len;
        ++pad;
    }
    out.reserve((len * 3) / 4);
    std::uint32_t acc = 0;
    int bits = 0;
    for (std::size_t i = 0; i < len; ++i) {
        const int v = detail::decode_symbol(in[i]);
        if (v < 0) {
            out.clear();
            return false;
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
        }
    }
    if (bits > 0 && (acc & ((1u << bits) - 1)) != 0) {
        out.clear();
        return false;
    }
    return true;
}

} // namespace base64
} // namespace lcr
