#pragma once

#include "common.h"

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace dcvt {

enum class parse_errc : std::uint8_t { ok = 0, invalid_digit, overflow };

class parse_error {
 public:
    constexpr parse_error() noexcept = default;

    static constexpr parse_error invalid_digit(char ch) noexcept {
        return parse_error(parse_errc::invalid_digit, static_cast<std::uint8_t>(ch));
    }
    static constexpr parse_error overflow() noexcept { return parse_error(parse_errc::overflow, 0); }

    constexpr parse_errc code() const noexcept { return code_; }

    // The offending byte for `parse_errc::invalid_digit`, zero otherwise
    constexpr std::uint8_t byte() const noexcept { return byte_; }

    constexpr explicit operator bool() const noexcept { return code_ != parse_errc::ok; }

    DCVT_EXPORT std::string message() const;

    friend constexpr bool operator==(const parse_error& lhs, const parse_error& rhs) noexcept {
        return lhs.code_ == rhs.code_ && lhs.byte_ == rhs.byte_;
    }
    friend constexpr bool operator!=(const parse_error& lhs, const parse_error& rhs) noexcept {
        return !(lhs == rhs);
    }

 private:
    parse_errc code_ = parse_errc::ok;
    std::uint8_t byte_ = 0;

    constexpr parse_error(parse_errc code, std::uint8_t byte) noexcept : code_(code), byte_(byte) {}
};

class DCVT_EXPORT_ALL_STUFF_FOR_GNUC decimal_error : public std::runtime_error {
 public:
    DCVT_EXPORT explicit decimal_error(const parse_error& err);
    DCVT_EXPORT const char* what() const noexcept override;

    const parse_error& error() const noexcept { return err_; }

 private:
    parse_error err_;
};

template<typename Ty>
class parse_result {
 public:
    using value_type = Ty;

    constexpr parse_result(Ty val) noexcept : val_(val) {}
    constexpr parse_result(const parse_error& err) noexcept : err_(err) {}

    template<typename Ty2, typename = std::enable_if_t<!std::is_same<Ty, Ty2>::value>>
    constexpr explicit parse_result(const parse_result<Ty2>& other) noexcept
        : val_(static_cast<Ty>(other.value_or(0))), err_(other.error()) {}

    constexpr bool ok() const noexcept { return !err_; }
    constexpr explicit operator bool() const noexcept { return !err_; }

    constexpr const parse_error& error() const noexcept { return err_; }

    Ty value() const {
        if (err_) { throw decimal_error(err_); }
        return val_;
    }

    constexpr Ty value_or(Ty def) const noexcept { return err_ ? def : val_; }

    friend constexpr bool operator==(const parse_result& lhs, const parse_result& rhs) noexcept {
        return lhs.err_ == rhs.err_ && (lhs.err_ || lhs.val_ == rhs.val_);
    }
    friend constexpr bool operator!=(const parse_result& lhs, const parse_result& rhs) noexcept {
        return !(lhs == rhs);
    }

 private:
    Ty val_{};
    parse_error err_;
};

}  // namespace dcvt
