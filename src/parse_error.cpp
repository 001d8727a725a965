#include "dcvt/chars.h"
#include "dcvt/parse_error.h"

#include <iterator>

namespace dcvt {

std::string parse_error::message() const {
    switch (code_) {
        case parse_errc::ok: return "no error";
        case parse_errc::invalid_digit: {
            std::string msg("invalid decimal digit ");
            if (is_printable(static_cast<char>(byte_))) {
                msg += '\'';
                msg += static_cast<char>(byte_);
                msg += '\'';
            } else {
                msg += "0x";
                to_hex(byte_, std::back_inserter(msg), 2);
            }
            return msg;
        } break;
        case parse_errc::overflow: return "number too long for the target type";
        default: DCVT_UNREACHABLE_CODE;
    }
}

decimal_error::decimal_error(const parse_error& err) : std::runtime_error(err.message()), err_(err) {}
const char* decimal_error::what() const noexcept { return std::runtime_error::what(); }

}  // namespace dcvt
