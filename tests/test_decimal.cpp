// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

#include "misc.h" // Internal header from src/.

#include <gtest/gtest.h>

#include <cfloat>
#include <cstring>
#include <string>
#include <string_view>

namespace
{
	std::string digits(const misc::decimal_t &dec)
	{	return { dec.digits_.data(), dec.size_ };
	}

	misc::decimal_t make_decimal(std::string_view digits, int exp10)
	{	misc::decimal_t result;
		std::memcpy(result.digits_.data(), digits.data(), digits.size());
		result.size_ = digits.size();
		result.exp10_ = exp10;
		return result;
	}
} // namespace

TEST(decimal, to_decimal)
{	struct
	{	int line_; double value_; std::string_view digits_; int exp10_;
	} static const tests_set[] =
	{	{__LINE__, 0.0, "0", 0},				{__LINE__, -0.0, "0", 0},
		{__LINE__, 1.0, "1", 0},				{__LINE__, -1.0, "1", 0},
		{__LINE__, 42.0, "42", 1},				{__LINE__, 100.0, "1", 2},
		{__LINE__, 0.5, "5", -1},				{__LINE__, 0.125, "125", -1},
		{__LINE__, 1e-3, "1000000000000000020816681711721685132943093776702880859375", -3},
		{__LINE__, 0.1, "1000000000000000055511151231257827021181583404541015625", -1},
		{__LINE__, 0x1p70, "1180591620717411303424", 21},
		{__LINE__, 9007199254740993.0, "9007199254740992", 15}, // 2^53 + 1 is not representable.
	};

	for (auto &test : tests_set)
	{	const auto dec = misc::to_decimal(test.value_);
		EXPECT_EQ(digits(dec), test.digits_) << "Line of sample: " << test.line_;
		EXPECT_EQ(dec.exp10_, test.exp10_) << "Line of sample: " << test.line_;
	}
}

TEST(decimal, to_decimal_extremes)
{	{	const auto dec = misc::to_decimal(DBL_MAX);
		EXPECT_EQ(dec.size_, 309U);
		EXPECT_EQ(dec.exp10_, 308);
		EXPECT_EQ(digits(dec).substr(0, 17), "17976931348623157");
		EXPECT_EQ(digits(dec).substr(299), "4124858368");
	}
	{	const auto dec = misc::to_decimal(DBL_TRUE_MIN);
		EXPECT_EQ(dec.size_, 751U);
		EXPECT_EQ(dec.exp10_, -324);
		EXPECT_EQ(digits(dec).substr(0, 16), "4940656458412465");
		EXPECT_EQ(digits(dec).substr(741), "3447265625");
	}
	{	// The largest subnormal has the longest exact expansion of all doubles.
		const auto dec = misc::to_decimal(DBL_MIN - DBL_TRUE_MIN);
		EXPECT_EQ(dec.size_, 767U);
		EXPECT_LE(dec.size_, misc::MAX_DIGITS);
		EXPECT_EQ(dec.exp10_, -308);
		EXPECT_EQ(digits(dec).substr(0, 16), "2225073858507200");
		EXPECT_EQ(digits(dec).substr(757), "6552734375");
	}
	{	const auto dec = misc::to_decimal(DBL_MIN);
		EXPECT_EQ(dec.size_, 715U);
		EXPECT_EQ(dec.exp10_, -308);
		EXPECT_EQ(digits(dec).substr(705), "6728515625");
	}
}

TEST(decimal, round_to)
{	struct
	{	int line_; std::string_view digits_; int exp10_; std::size_t precision_; std::string_view expected_; int expected_exp10_;
	} static const tests_set[] =
	{	{__LINE__, "12345", 0, 10, "12345", 0},		// Nothing to round.
		{__LINE__, "12345", 0, 5, "12345", 0},
		{__LINE__, "12344", 0, 4, "1234", 0},			// Down.
		{__LINE__, "12346", 0, 4, "1235", 0},			// Up.
		{__LINE__, "123451", 0, 4, "1235", 0},		// Above the half.
		{__LINE__, "25", 0, 1, "2", 0},				// Tie to even: down.
		{__LINE__, "35", 0, 1, "4", 0},				// Tie to even: up.
		{__LINE__, "251", 0, 1, "3", 0},
		{__LINE__, "1201", 3, 3, "12", 3},			// Trailing zeros are dropped.
		{__LINE__, "1996", 3, 3, "2", 3},				// Carry with trailing zeros.
		{__LINE__, "99996", 0, 3, "1", 1},			// Carry into a new decade.
		{__LINE__, "95", -2, 1, "1", -1},
		{__LINE__, "9", -5, 1, "9", -5},
		{__LINE__, "0", 0, 1, "0", 0},
	};

	for (auto &test : tests_set)
	{	auto dec = make_decimal(test.digits_, test.exp10_);
		misc::round_to(dec, test.precision_);
		EXPECT_EQ(digits(dec), test.expected_) << "Line of sample: " << test.line_;
		EXPECT_EQ(dec.exp10_, test.expected_exp10_) << "Line of sample: " << test.line_;
	}
}

TEST(decimal, buffer)
{	misc::buffer_t<8> buff;
	EXPECT_EQ(buff.capacity(), 7U);
	buff.put("abc");
	buff.put('-', 2U);
	EXPECT_EQ(buff.view(), "abc--");
	EXPECT_FALSE(buff.overflow());

	buff.put("xyz");
	EXPECT_TRUE(buff.overflow());
	EXPECT_STREQ(buff.c_str(), "abc--") << "Overflow must leave the content untouched";

	misc::buffer_t<8> huge;
	huge.put(' ', static_cast<std::size_t>(-1));
	EXPECT_TRUE(huge.overflow());
	EXPECT_EQ(huge.size(), 0U);
}
