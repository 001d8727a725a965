#pragma once

#include "membuffer.h"
#include "parse_error.h"
#include "pow10.h"

#include <cassert>
#include <string>
#include <string_view>

namespace dcvt {

enum class overflow_policy {
    wrap = 0,  // any digit string is accepted, the value is taken modulo 2^width
    check,     // strings longer than the power table of the type are rejected with `parse_errc::overflow`
};

namespace detail {

template<typename Ty>
using enable_if_unsigned_t = std::enable_if_t<is_convertible_integer<Ty>::value && std::is_unsigned<Ty>::value>;

template<typename Ty>
using enable_if_signed_t = std::enable_if_t<is_convertible_integer<Ty>::value && std::is_signed<Ty>::value>;

template<typename Ty>
using enable_if_integer_t = std::enable_if_t<is_convertible_integer<Ty>::value>;

template<typename Ty>
using magnitude_parser = parse_result<Ty> (*)(std::string_view, overflow_policy) noexcept;

template<typename Ty>
DCVT_EXPORT parse_result<Ty> parse_unsigned_common(std::string_view s, overflow_policy policy) noexcept;

#if DCVT_HAS_VECTOR_PARSE
template<typename Ty>
DCVT_EXPORT parse_result<Ty> parse_unsigned_vector_common(std::string_view s, overflow_policy policy) noexcept;
#endif  // DCVT_HAS_VECTOR_PARSE

// Writes decimal digits of `val` backward, the last digit goes to `*(last - 1)`; returns the first written position
template<typename Ty>
DCVT_EXPORT char* gen_digits(char* last, Ty val) noexcept;

template<typename Ty>
constexpr bool is_negative(Ty val, std::true_type) noexcept {
    return val < 0;
}
template<typename Ty>
constexpr bool is_negative(Ty, std::false_type) noexcept {
    return false;
}
template<typename Ty>
constexpr bool is_negative(Ty val) noexcept {
    return is_negative(val, std::is_signed<Ty>{});
}

// Wrapping negation keeps the minimal signed value representable
template<typename Ty>
constexpr canonical_uint_t<Ty> magnitude(Ty val) noexcept {
    using UTy = canonical_uint_t<Ty>;
    return is_negative(val) ? static_cast<UTy>(0u - static_cast<UTy>(val)) : static_cast<UTy>(val);
}

template<typename Ty>
parse_result<Ty> parse_signed_common(std::string_view s, overflow_policy policy,
                                     magnitude_parser<canonical_uint_t<Ty>> parse_magnitude) noexcept {
    using UTy = canonical_uint_t<Ty>;
    const bool neg = !s.empty() && s.front() == '-';
    if (neg) { s.remove_prefix(1); }
    const parse_result<UTy> result = parse_magnitude(s, policy);
    if (!result) { return result.error(); }
    const UTy val = result.value_or(0);
    return static_cast<Ty>(neg ? static_cast<UTy>(0u - val) : val);
}

template<typename Ty>
parse_result<Ty> parse_integer(std::string_view s, overflow_policy policy,
                               magnitude_parser<canonical_uint_t<Ty>> parse_magnitude, std::false_type) noexcept {
    return parse_result<Ty>(parse_magnitude(s, policy));
}

template<typename Ty>
parse_result<Ty> parse_integer(std::string_view s, overflow_policy policy,
                               magnitude_parser<canonical_uint_t<Ty>> parse_magnitude, std::true_type) noexcept {
    return parse_signed_common<Ty>(s, policy, parse_magnitude);
}

template<typename Ty>
char* gen_signed_digits(char* last, Ty val) noexcept {
    char* p = gen_digits<reduced_uint_t<Ty>>(last, magnitude(val));
    if (is_negative(val)) { *--p = '-'; }
    return p;
}

}  // namespace detail

// ---- from string to value

// Parses decimal digits of `s` into an integer of type `Ty`. A leading '-' is accepted for signed types only: the
// magnitude is parsed as the unsigned counterpart and negated with wraparound, while unsigned magnitudes above the
// signed limit are reinterpreted in two's complement. An empty string (or sole '-') yields 0.
template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
parse_result<Ty> parse(std::string_view s, overflow_policy policy = overflow_policy::check) noexcept {
    return detail::parse_integer<Ty>(s, policy, detail::parse_unsigned_common<detail::canonical_uint_t<Ty>>,
                                     std::is_signed<Ty>{});
}

template<typename Ty, typename = detail::enable_if_unsigned_t<Ty>>
parse_result<Ty> parse_unsigned(std::string_view s) noexcept {
    return parse<Ty>(s, overflow_policy::check);
}

template<typename Ty, typename = detail::enable_if_unsigned_t<Ty>>
parse_result<Ty> parse_unsigned_wrapping(std::string_view s) noexcept {
    return parse<Ty>(s, overflow_policy::wrap);
}

template<typename Ty, typename = detail::enable_if_signed_t<Ty>>
parse_result<Ty> parse_signed(std::string_view s) noexcept {
    return parse<Ty>(s, overflow_policy::check);
}

template<typename Ty, typename = detail::enable_if_signed_t<Ty>>
parse_result<Ty> parse_signed_wrapping(std::string_view s) noexcept {
    return parse<Ty>(s, overflow_policy::wrap);
}

// Returns `true` if the library is built with vectorized parsing
DCVT_EXPORT bool vector_parse_enabled() noexcept;

#if DCVT_HAS_VECTOR_PARSE
template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
parse_result<Ty> parse_vector(std::string_view s, overflow_policy policy = overflow_policy::check) noexcept {
    return detail::parse_integer<Ty>(s, policy, detail::parse_unsigned_vector_common<detail::canonical_uint_t<Ty>>,
                                     std::is_signed<Ty>{});
}

template<typename Ty, typename = detail::enable_if_unsigned_t<Ty>>
parse_result<Ty> parse_unsigned_vector(std::string_view s) noexcept {
    return parse_vector<Ty>(s, overflow_policy::check);
}

template<typename Ty, typename = detail::enable_if_unsigned_t<Ty>>
parse_result<Ty> parse_unsigned_vector_wrapping(std::string_view s) noexcept {
    return parse_vector<Ty>(s, overflow_policy::wrap);
}

template<typename Ty, typename = detail::enable_if_signed_t<Ty>>
parse_result<Ty> parse_signed_vector(std::string_view s) noexcept {
    return parse_vector<Ty>(s, overflow_policy::check);
}
#endif  // DCVT_HAS_VECTOR_PARSE

template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
Ty from_decimal(std::string_view s) {
    return parse<Ty>(s, overflow_policy::check).value();
}

// ---- from value to string

template<typename Ty, typename = detail::enable_if_unsigned_t<Ty>>
constexpr unsigned digits10(Ty val) noexcept {
    detail::reduced_uint_t<Ty> v = val;
    unsigned n = 1;
    for (;; v /= 10000u, n += 4) {
        if (v < 10u) { return n; }
        if (v < 100u) { return n + 1; }
        if (v < 1000u) { return n + 2; }
        if (v < 10000u) { return n + 3; }
    }
}

// Length of the decimal representation including minus sign
template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
constexpr unsigned digit_count(Ty val) noexcept {
    return detail::is_negative(val) ? 1 + digits10(detail::magnitude(val)) : digits10(detail::magnitude(val));
}

// Writes the decimal representation of `val` right-aligned into [first, last). Bytes of the range preceding the
// representation are left untouched. Returns the pointer to the first written byte, or `nullptr` if the range is
// shorter than `digit_count(val)`; nothing is written in this case.
template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
char* format_into(Ty val, char* first, char* last) noexcept {
    assert(first <= last);
    if (static_cast<std::size_t>(last - first) < digit_count(val)) { return nullptr; }
    return detail::gen_signed_digits(last, val);
}

// Writes exactly `digit_count(val)` bytes starting from `p`; returns the end of written representation
template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
char* to_chars(char* p, Ty val) noexcept {
    char* last = p + digit_count(val);
    detail::gen_signed_digits(last, val);
    return last;
}

template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
std::string format(Ty val) {
    std::string s(digit_count(val), '\0');
    detail::gen_signed_digits(&s[0] + s.size(), val);
    return s;
}

// Appends the decimal representation to the sink; returns `false` if the sink is exhausted
template<typename Ty, typename = detail::enable_if_integer_t<Ty>>
bool fmt_decimal(membuffer& s, Ty val) noexcept {
    char buf[pow10_table<Ty>.size + 1];
    char* last = buf + sizeof(buf);
    return s.append(detail::gen_signed_digits(last, val), last);
}

}  // namespace dcvt
