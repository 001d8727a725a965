#pragma once

#include "common.h"

#include <array>
#include <cassert>
#include <limits>
#include <type_traits>

namespace dcvt {

namespace detail {

template<std::size_t Size>
struct sized_uint;
template<>
struct sized_uint<1> {
    using type = std::uint8_t;
};
template<>
struct sized_uint<2> {
    using type = std::uint16_t;
};
template<>
struct sized_uint<4> {
    using type = std::uint32_t;
};
template<>
struct sized_uint<8> {
    using type = std::uint64_t;
};

// One of `std::uint8_t`, ..., `std::uint64_t` having the same width as integral `Ty`
template<typename Ty>
using canonical_uint_t = typename sized_uint<sizeof(Ty)>::type;

// Narrow types are accumulated in 32 bits: truncation at the end gives the same value modulo 2^width
template<typename Ty>
using reduced_uint_t = std::conditional_t<(sizeof(Ty) <= sizeof(std::uint32_t)), std::uint32_t, std::uint64_t>;

template<typename Ty>
struct is_convertible_integer
    : std::integral_constant<bool, std::is_integral<Ty>::value && !std::is_same<std::remove_cv_t<Ty>, bool>::value &&
                                       (sizeof(Ty) == 1 || sizeof(Ty) == 2 || sizeof(Ty) == 4 || sizeof(Ty) == 8)> {};

}  // namespace detail

// Place values 10^(N-1), ..., 10, 1, where N is the maximal decimal digit count of `Ty`
template<typename Ty>
struct pow10_table_t {
    static_assert(std::is_unsigned<Ty>::value, "power table must be built for unsigned type");
    enum : unsigned { size = std::numeric_limits<Ty>::digits10 + 1 };
    std::array<Ty, size> values{};
    constexpr pow10_table_t() {
        Ty v = 1;
        for (unsigned n = size; n > 0; --n) {
            values[n - 1] = v;
            v = static_cast<Ty>(v * 10u);
        }
    }
    constexpr const Ty* tail(std::size_t len) const noexcept { return values.data() + size - len; }
};

template<typename Ty>
inline constexpr pow10_table_t<detail::canonical_uint_t<Ty>> pow10_table{};

template<typename Ty>
constexpr detail::canonical_uint_t<Ty> get_pow10(unsigned pow) noexcept {
    assert(pow < pow10_table<Ty>.size);
    return pow10_table<Ty>.values[pow10_table<Ty>.size - 1 - pow];
}

static_assert(pow10_table<std::uint8_t>.size == 3, "bad 8-bit table size");
static_assert(pow10_table<std::uint16_t>.size == 5, "bad 16-bit table size");
static_assert(pow10_table<std::uint32_t>.size == 10, "bad 32-bit table size");
static_assert(pow10_table<std::uint64_t>.size == 20, "bad 64-bit table size");

}  // namespace dcvt
