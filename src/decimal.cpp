#include "dcvt/decimal_impl.h"

namespace dcvt {
namespace detail {

template DCVT_EXPORT parse_result<std::uint8_t> parse_unsigned_common(std::string_view, overflow_policy) noexcept;
template DCVT_EXPORT parse_result<std::uint16_t> parse_unsigned_common(std::string_view, overflow_policy) noexcept;
template DCVT_EXPORT parse_result<std::uint32_t> parse_unsigned_common(std::string_view, overflow_policy) noexcept;
template DCVT_EXPORT parse_result<std::uint64_t> parse_unsigned_common(std::string_view, overflow_policy) noexcept;

template DCVT_EXPORT char* gen_digits(char*, std::uint32_t) noexcept;
template DCVT_EXPORT char* gen_digits(char*, std::uint64_t) noexcept;

}  // namespace detail
}  // namespace dcvt
