#pragma once

#include "common.h"

namespace dcvt {

const constexpr std::uint8_t ascii_zero = '0';

// Decimal digit value of `ch`: bytes below '0' wrap around, so any result greater than 9 means "not a digit"
DCVT_FORCE_INLINE constexpr unsigned dec_digit(char ch) noexcept {
    return static_cast<std::uint8_t>(static_cast<std::uint8_t>(ch) - ascii_zero);
}

DCVT_FORCE_INLINE constexpr bool is_dec_digit(char ch) noexcept { return dec_digit(ch) < 10; }

DCVT_FORCE_INLINE constexpr bool is_printable(char ch) noexcept {
    return static_cast<std::uint8_t>(ch) >= 0x20 && static_cast<std::uint8_t>(ch) < 0x7f;
}

template<typename OutputIt>
void to_hex(unsigned val, OutputIt out, unsigned n_digs, bool upper = false) noexcept {
    const char* digs = upper ? "0123456789ABCDEF" : "0123456789abcdef";
    unsigned shift = n_digs << 2;
    while (shift) {
        shift -= 4;
        *out++ = digs[(val >> shift) & 0xf];
    }
}

}  // namespace dcvt
