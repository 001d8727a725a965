#include "dcvt/decimal_impl.h"

#include <cstring>

namespace dcvt {

bool vector_parse_enabled() noexcept { return DCVT_HAS_VECTOR_PARSE != 0; }

#if DCVT_HAS_VECTOR_PARSE

namespace detail {

typedef std::uint8_t u8x4_t __attribute__((vector_size(4)));
typedef std::uint32_t u32x4_t __attribute__((vector_size(16)));
typedef std::uint64_t u64x4_t __attribute__((vector_size(32)));

template<typename Ty>
struct lanes4;
template<>
struct lanes4<std::uint32_t> {
    using type = u32x4_t;
};
template<>
struct lanes4<std::uint64_t> {
    using type = u64x4_t;
};

struct vector_engine {
    // Same contract as `scalar_engine::accumulate`: groups of 4 bytes are checked and multiplied in 4 lanes,
    // the remainder is handled by the scalar loop
    template<typename Ty>
    static const char* accumulate(const char* p, std::size_t len, const Ty* pow10, reduced_uint_t<Ty>& acc) noexcept {
        using RTy = reduced_uint_t<Ty>;
        using vec_t = typename lanes4<RTy>::type;
        const u8x4_t zeroes = {ascii_zero, ascii_zero, ascii_zero, ascii_zero};
        const u8x4_t nines = {9, 9, 9, 9};
        vec_t sum = {0, 0, 0, 0};
        const char* p4 = p + (len & ~static_cast<std::size_t>(3));
        for (; p != p4; p += 4, pow10 += 4) {
            u8x4_t digs;
            std::memcpy(&digs, p, sizeof(digs));
            digs -= zeroes;
            const auto invalid = digs > nines;
            std::uint32_t any_invalid;
            static_assert(sizeof(invalid) == sizeof(any_invalid), "unexpected comparison result size");
            std::memcpy(&any_invalid, &invalid, sizeof(any_invalid));
            if (any_invalid) {
                while (is_dec_digit(*p)) { ++p; }
                return p;
            }
            const vec_t mul = {static_cast<RTy>(pow10[0]), static_cast<RTy>(pow10[1]), static_cast<RTy>(pow10[2]),
                               static_cast<RTy>(pow10[3])};
            sum += __builtin_convertvector(digs, vec_t) * mul;
        }
        acc += sum[0] + sum[1] + sum[2] + sum[3];
        return scalar_engine::accumulate_tail(p, len & 3, pow10, acc);
    }
};

template<typename Ty>
parse_result<Ty> parse_unsigned_vector_common(std::string_view s, overflow_policy policy) noexcept {
    return parse_magnitude<vector_engine, Ty>(s, policy);
}

template DCVT_EXPORT parse_result<std::uint8_t> parse_unsigned_vector_common(std::string_view,
                                                                              overflow_policy) noexcept;
template DCVT_EXPORT parse_result<std::uint16_t> parse_unsigned_vector_common(std::string_view,
                                                                               overflow_policy) noexcept;
template DCVT_EXPORT parse_result<std::uint32_t> parse_unsigned_vector_common(std::string_view,
                                                                               overflow_policy) noexcept;
template DCVT_EXPORT parse_result<std::uint64_t> parse_unsigned_vector_common(std::string_view,
                                                                               overflow_policy) noexcept;

}  // namespace detail

#endif  // DCVT_HAS_VECTOR_PARSE

}  // namespace dcvt
