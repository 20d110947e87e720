// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

#include <gpoint/gpoint.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using gpoint::g;

namespace
{
	template<typename... Args>
	std::string print(const Args &...args)
	{	std::ostringstream os;
		(os << ... << args);
		return os.str();
	}
} // namespace

TEST(cpp, directives_t)
{	{	const gpoint::directives_t dirs;
		const auto c = dirs.c_directives();
		EXPECT_EQ(c.flags_, 0U);
		EXPECT_EQ(c.width_, 0U);
		EXPECT_EQ(c.precision_, 0U);
	}
	{	gpoint::directives_t dirs;
		dirs.alternate_ = true;
		dirs.left_justify_ = true;
		dirs.precision_ = 0U;
		const auto c = dirs.c_directives();
		EXPECT_EQ(c.flags_, static_cast<GP_FLAGS>(gp_Alternate | gp_LeftJustify | gp_Precision));
		EXPECT_EQ(c.precision_, 0U);
	}
	{	gpoint::directives_t dirs;
		dirs.zero_pad_ = true;
		dirs.force_sign_ = true;
		dirs.width_ = 12U;
		const auto c = dirs.c_directives();
		EXPECT_EQ(c.flags_, static_cast<GP_FLAGS>(gp_ZeroPad | gp_ForceSign | gp_Width));
		EXPECT_EQ(c.width_, 12U);
	}
}

TEST(cpp, to_string)
{	EXPECT_EQ(gpoint::to_string(42.8952), "42.8952");
	EXPECT_EQ(gpoint::to_string(1e-5), "1e-05");

	gpoint::directives_t dirs;
	dirs.precision_ = 3U;
	dirs.width_ = 10U;
	dirs.left_justify_ = true;
	EXPECT_EQ(gpoint::to_string(4321.0, dirs), "4.32e+03  ");

	dirs.width_ = 1'000U;
	EXPECT_EQ(gpoint::to_string(4321.0, dirs), std::nullopt);
}

TEST(cpp, format_to)
{	{	std::string str = "x=";
		EXPECT_EQ(gpoint::format_to(str, 0.5), 3);
		EXPECT_EQ(str, "x=0.5");
	}
	{	std::vector<std::string> tokens;
		auto sink = [&tokens](std::string_view token) { tokens.emplace_back(token); };
		EXPECT_EQ(gpoint::format_to(sink, -0.0), 2);
		EXPECT_EQ(gpoint::format_to(sink, 100000.0), 6);
		EXPECT_EQ(gpoint::format_to(sink, 1000000.0), 5);
		EXPECT_EQ(tokens, (std::vector<std::string>{ "-0", "100000", "1e+06" }));
	}
	{	std::ostringstream os;
		os << std::setw(20) << std::showpos; // The stream state is not consulted.
		EXPECT_EQ(gpoint::format_to(os, 2.5), 3);
		EXPECT_EQ(os.str(), "2.5");
	}
	{	std::string str = "unchanged";
		gpoint::directives_t dirs;
		dirs.width_ = 500U;
		EXPECT_EQ(gpoint::format_to(str, 1.0, dirs), gp_ErrOverflow);
		EXPECT_EQ(str, "unchanged");
	}
}

TEST(cpp, stream_insertion)
{	struct
	{	int line_; std::string expected_; std::string actual_;
	} const tests_set[] =
	{	{__LINE__, "42", print(g(42.0))},
		{__LINE__, "00000042", print(std::setw(8), std::setfill('0'), g(42.0))},
		{__LINE__, "42      ", print(std::left, std::setw(8), g(42.0))},
		{__LINE__, "42      ", print(std::left, std::setfill('0'), std::setw(8), g(42.0))},
		{__LINE__, "+42", print(std::showpos, g(42.0))},
		{__LINE__, "42.0000", print(std::showpoint, g(42.0))},
		{__LINE__, "4.32e+03", print(std::setprecision(3), g(4321.0))},
		{__LINE__, "1", print(std::setprecision(0), g(1.25))},
		{__LINE__, "1.5", print(g(1.5F))},
		{__LINE__, "0.1", print(g(0.1F))},
		{__LINE__, "0.100000001", print(std::setprecision(9), g(0.1F))},
		{__LINE__, "answer=42!", print("answer=", g(42.0), '!')},
		{__LINE__, "   12", print(std::setw(4), g(1.0), g(2.0))},
	};

	for (auto &test : tests_set)
	{	EXPECT_EQ(test.actual_, test.expected_) << "Line of sample: " << test.line_;
	}
}

TEST(cpp, stream_insertion_failure)
{	std::ostringstream os;
	os << "a" << std::setw(500) << g(1.0);
	EXPECT_TRUE(os.fail());
	EXPECT_EQ(os.str(), "a") << "Nothing is written on failure";
	EXPECT_EQ(os.width(), 0) << "The width is consumed even on failure";
}

TEST(cpp, stream_insertion_saturates_huge_state)
{	if constexpr (sizeof(std::streamsize) > sizeof(std::uint32_t))
	{	const auto huge = static_cast<std::streamsize>(UINT32_MAX) + 1;
		{	std::ostringstream os;
			os.width(huge); // Would wrap to 0 without saturation.
			os << g(1.0);
			EXPECT_TRUE(os.fail());
			EXPECT_EQ(os.str(), "");
		}
		{	std::ostringstream os;
			os.precision(huge); // Would wrap to 0 ("1.") without saturation.
			os << std::showpoint << g(1.0);
			EXPECT_TRUE(os.fail());
			EXPECT_EQ(os.str(), "");
		}
		{	std::ostringstream os;
			os.precision(huge);
			os << g(1.0);
			EXPECT_EQ(os.str(), "1") << "Without '#' a huge precision is harmless";
		}
	}
}
