#pragma once

#include "chars.h"
#include "decimal.h"

namespace dcvt {
namespace detail {

// ---- from string to value

struct scalar_engine {
    // Accumulates `len` digits from `p` multiplied by place values `pow10[0]`, ..., `pow10[len - 1]`.
    // Returns `p + len` or the position of the first non-digit byte
    template<typename Ty>
    static const char* accumulate(const char* p, std::size_t len, const Ty* pow10, reduced_uint_t<Ty>& acc) noexcept {
        using RTy = reduced_uint_t<Ty>;
        const char* p4 = p + (len & ~static_cast<std::size_t>(3));
        for (; p != p4; p += 4, pow10 += 4) {
            const unsigned d0 = dec_digit(p[0]), d1 = dec_digit(p[1]);
            const unsigned d2 = dec_digit(p[2]), d3 = dec_digit(p[3]);
            if (d0 > 9) { return p; }
            if (d1 > 9) { return p + 1; }
            if (d2 > 9) { return p + 2; }
            if (d3 > 9) { return p + 3; }
            acc += d0 * static_cast<RTy>(pow10[0]) + d1 * static_cast<RTy>(pow10[1]) +
                   d2 * static_cast<RTy>(pow10[2]) + d3 * static_cast<RTy>(pow10[3]);
        }
        return accumulate_tail(p, len & 3, pow10, acc);
    }

    template<typename Ty>
    static const char* accumulate_tail(const char* p, std::size_t len, const Ty* pow10,
                                       reduced_uint_t<Ty>& acc) noexcept {
        for (const char* end = p + len; p != end; ++p, ++pow10) {
            const unsigned dig = dec_digit(*p);
            if (dig > 9) { return p; }
            acc += dig * static_cast<reduced_uint_t<Ty>>(*pow10);
        }
        return p;
    }
};

template<typename Engine, typename Ty>
parse_result<Ty> parse_magnitude(std::string_view s, overflow_policy policy) noexcept {
    using RTy = reduced_uint_t<Ty>;
    const auto& tbl = pow10_table<Ty>;
    const char* p = s.data();
    const char* end = p + s.size();
    const std::size_t len = s.size();
    RTy acc = 0;

    if (len <= tbl.size) {
        p = Engine::accumulate(p, len, tbl.tail(len), acc);
    } else if (policy == overflow_policy::check) {
        return parse_error::overflow();
    } else {
        // Leading digits are accumulated first, then each next group of `tbl.size` digits is appended as
        // acc * 10^size + group, everything modulo 2^width
        const RTy scale = static_cast<RTy>(static_cast<RTy>(tbl.values[0]) * 10u);
        std::size_t n = len % tbl.size;
        if (n == 0) { n = tbl.size; }
        p = Engine::accumulate(p, n, tbl.tail(n), acc);
        for (const char* next = s.data() + n; p == next && p != end; next += tbl.size) {
            acc *= scale;
            p = Engine::accumulate(p, tbl.size, tbl.values.data(), acc);
        }
    }

    if (p != end) { return parse_error::invalid_digit(*p); }
    return static_cast<Ty>(acc);
}

template<typename Ty>
parse_result<Ty> parse_unsigned_common(std::string_view s, overflow_policy policy) noexcept {
    return parse_magnitude<scalar_engine, Ty>(s, policy);
}

// ---- from value to string

template<typename Ty>
char* gen_digits(char* last, Ty val) noexcept {
    while (val >= 10000u) {
        const Ty q = val / 10u, q1 = val / 100u, q2 = val / 1000u;
        last[-1] = static_cast<char>(ascii_zero + static_cast<unsigned>(val % 10u));
        last[-2] = static_cast<char>(ascii_zero + static_cast<unsigned>(q % 10u));
        last[-3] = static_cast<char>(ascii_zero + static_cast<unsigned>(q1 % 10u));
        last[-4] = static_cast<char>(ascii_zero + static_cast<unsigned>(q2 % 10u));
        last -= 4, val /= 10000u;
    }
    // fixup loop: stops as soon as the quotient becomes zero
    do { *--last = static_cast<char>(ascii_zero + static_cast<unsigned>(val % 10u)); } while ((val /= 10u) != 0);
    return last;
}

}  // namespace detail
}  // namespace dcvt
