#pragma once

#include "common.h"

#include <algorithm>
#include <cassert>
#include <string_view>
#include <type_traits>

namespace dcvt {

// Append-only sink over a caller-owned region [first, last)
template<typename Ty>
class basic_membuffer {
 private:
    static_assert(std::is_trivially_copyable<Ty>::value && std::is_trivially_destructible<Ty>::value,
                  "dcvt::basic_membuffer<> must have trivially copyable and destructible value type");

 public:
    using value_type = Ty;
    using pointer = Ty*;
    using const_pointer = const Ty*;
    using size_type = std::size_t;

    basic_membuffer(Ty* first, Ty* last) noexcept : curr_(first), last_(last) {}
    basic_membuffer(const basic_membuffer&) = delete;
    basic_membuffer& operator=(const basic_membuffer&) = delete;

    size_type avail() const noexcept { return last_ - curr_; }
    const_pointer curr() const noexcept { return curr_; }
    pointer curr() noexcept { return curr_; }
    const_pointer last() const noexcept { return last_; }

    // Returns `false` if the region cannot hold all elements, the fitting part is appended anyway
    bool append(const Ty* first, const Ty* last) noexcept {
        assert(first <= last);
        const size_type count = static_cast<size_type>(last - first);
        if (count > avail()) {
            curr_ = std::copy_n(first, avail(), curr_);
            return false;
        }
        curr_ = std::copy(first, last, curr_);
        return true;
    }

    bool push_back(value_type val) noexcept {
        if (curr_ == last_) { return false; }
        *curr_++ = val;
        return true;
    }

    basic_membuffer& operator+=(std::basic_string_view<value_type> s) noexcept {
        append(s.data(), s.data() + s.size());
        return *this;
    }

 private:
    Ty* curr_;
    Ty* last_;
};

using membuffer = basic_membuffer<char>;

}  // namespace dcvt
