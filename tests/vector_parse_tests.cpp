#include "test_support.h"

#include "dcvt/chars.h"
#include "dcvt/decimal.h"

#include <gtest/gtest.h>

#include <limits>
#include <random>
#include <string>
#include <type_traits>

using namespace dcvt;

namespace {

// Result expected from any parse engine: length is checked first, then the first non-digit is reported
template<typename Ty>
parse_result<Ty> reference_result(std::string_view s, overflow_policy policy) {
    using UTy = detail::canonical_uint_t<Ty>;
    const bool neg = std::is_signed<Ty>::value && !s.empty() && s.front() == '-';
    if (neg) { s.remove_prefix(1); }
    if (policy == overflow_policy::check && s.size() > pow10_table<Ty>.size) { return parse_error::overflow(); }
    for (char ch : s) {
        if (!is_dec_digit(ch)) { return parse_error::invalid_digit(ch); }
    }
    const UTy val = dcvt_test::horner<UTy>(s);
    return static_cast<Ty>(neg ? static_cast<UTy>(0u - val) : val);
}

template<typename Ty>
void expect_engines_match_reference(const std::string& s) {
    for (const auto policy : {overflow_policy::check, overflow_policy::wrap}) {
        const auto expected = reference_result<Ty>(s, policy);
        EXPECT_EQ(parse<Ty>(s, policy), expected) << '"' << s << '"';
#if DCVT_HAS_VECTOR_PARSE
        EXPECT_EQ(parse_vector<Ty>(s, policy), expected) << '"' << s << '"';
#endif  // DCVT_HAS_VECTOR_PARSE
    }
}

void expect_engines_match_reference_all_types(const std::string& s) {
    expect_engines_match_reference<std::uint8_t>(s);
    expect_engines_match_reference<std::uint16_t>(s);
    expect_engines_match_reference<std::uint32_t>(s);
    expect_engines_match_reference<std::uint64_t>(s);
    expect_engines_match_reference<std::int8_t>(s);
    expect_engines_match_reference<std::int16_t>(s);
    expect_engines_match_reference<std::int32_t>(s);
    expect_engines_match_reference<std::int64_t>(s);
}

}  // namespace

TEST(ParseEngineTest, GroupBoundaryLengths) {
    std::mt19937_64 rng(0xb0da);
    for (std::size_t len : {0, 1, 3, 4, 5, 7, 8, 9, 16, 19, 20, 21, 40}) {
        for (unsigned i = 0; i < 50; ++i) {
            expect_engines_match_reference_all_types(dcvt_test::random_digits(rng, len));
            expect_engines_match_reference_all_types(dcvt_test::random_digits(rng, len, 0.1));
            expect_engines_match_reference_all_types("-" + dcvt_test::random_digits(rng, len));
        }
    }
}

TEST(ParseEngineTest, RandomInput) {
    std::mt19937_64 rng(0x51d);
    std::uniform_int_distribution<std::size_t> len_dist(0, 48);
    std::uniform_int_distribution<int> ratio_dist(0, 3);
    const double ratios[] = {0.0, 0.01, 0.05, 0.3};
    for (unsigned i = 0; i < 5000; ++i) {
        expect_engines_match_reference_all_types(
            dcvt_test::random_digits(rng, len_dist(rng), ratios[ratio_dist(rng)]));
    }
}

TEST(ParseEngineTest, CapabilityReportMatchesBuild) {
    EXPECT_EQ(vector_parse_enabled(), DCVT_HAS_VECTOR_PARSE != 0);
}

#if DCVT_HAS_VECTOR_PARSE

TEST(VectorParseTest, ParsesKnownValues) {
    EXPECT_EQ(parse_unsigned_vector<std::uint8_t>("255").value(), 255u);
    EXPECT_EQ(parse_unsigned_vector<std::uint16_t>("9874").value(), 9874u);
    EXPECT_EQ(parse_unsigned_vector<std::uint32_t>("4294967295").value(), 4294967295u);
    EXPECT_EQ(parse_unsigned_vector<std::uint64_t>("18446744073709551615").value(), 18446744073709551615ull);
    EXPECT_EQ(parse_unsigned_vector<std::uint64_t>("").value(), 0u);
    EXPECT_EQ(parse_signed_vector<std::int64_t>("-9223372036854775808").value(),
              std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(parse_signed_vector<std::int32_t>("-").value(), 0);
}

TEST(VectorParseTest, ReportsErrorsLikeScalar) {
    EXPECT_EQ(parse_unsigned_vector<std::uint8_t>("1000").error(), parse_error::overflow());
    EXPECT_EQ(parse_unsigned_vector<std::uint32_t>("1234x678").error(), parse_error::invalid_digit('x'));
    EXPECT_EQ(parse_unsigned_vector<std::uint32_t>("12:4").error(), parse_error::invalid_digit(':'));
    EXPECT_EQ(parse_unsigned_vector<std::uint32_t>("ab").error(), parse_error::invalid_digit('a'));
    EXPECT_EQ(parse_unsigned_vector<std::uint64_t>("1/2y4").error(), parse_error::invalid_digit('/'));
    EXPECT_EQ(parse_unsigned_vector_wrapping<std::uint16_t>("12345678x").error(), parse_error::invalid_digit('x'));
}

TEST(VectorParseTest, WrappingPolicy) {
    EXPECT_EQ(parse_unsigned_vector_wrapping<std::uint16_t>("1234567").value(), 54919u);
    EXPECT_EQ(parse_unsigned_vector_wrapping<std::uint64_t>("123456789012345678901234567890").value(),
              dcvt_test::horner<std::uint64_t>("123456789012345678901234567890"));
}

#endif  // DCVT_HAS_VECTOR_PARSE
