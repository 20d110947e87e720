// This is an independent project of an individual developer. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++, C#, and Java: http://www.viva64.com

/*****************************************************************************\
* This file is part of the gpoint library.
*
* gpoint - a compact C/C++ library that renders floating-point values exactly
* as the C runtime's printf("%g") does, without calling the C runtime.
* It was developed for experimental and educational purposes, so please keep
* expectations reasonable.
*
* Report bugs or suggest improvements to author: <programmer.amateur@proton.me>
*
* LICENSE & DISCLAIMER:
* - No warranties. Use at your own risk.
* - Licensed under Business Source License 1.1 (BSL-1.1):
*   - Free for non-commercial use.
*   - For commercial licensing, contact the author.
*   - Change Date: 2029-09-01 - after which the library will be licensed
*     under GNU GPLv3.
*   - Attribution required: "gpoint Library (c) A.Prograamar".
*   - See LICENSE in the project root for full terms.
\*****************************************************************************/

#include "misc.h"
#include <gpoint/gpoint.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string_view>

using namespace std::literals;

namespace
{
	constexpr std::size_t DEFAULT_PRECISION = 6U;
	constexpr int MIN_FIXED_EXP10 = -4; // Smaller exponents switch to scientific notation.
	constexpr std::size_t MIN_EXP10_DIGITS = 2U;
	constexpr auto NAN_BODY = "nan"sv;
	constexpr auto INF_BODY = "inf"sv;

	// The directives after validation and precision normalization.
	struct directives_t
	{	std::size_t precision_;
		std::size_t width_;
		bool zero_pad_;
		bool left_justify_;
		bool force_sign_;
		bool alternate_;
	};

	GP_RESULT normalize(const gp_Directives_t &src, directives_t &dst) noexcept
	{	if (0U != (src.flags_ & ~static_cast<GP_FLAGS>(gp_DirectivesMask)))
		{	return gp_ErrDirectiveEncoding;
		}

		dst.precision_ = (src.flags_ & gp_Precision) ? src.precision_ : DEFAULT_PRECISION;
		if (0U == dst.precision_)
		{	dst.precision_ = 1U; // "%.0g" behaves as "%.1g".
		}
		dst.width_ = (src.flags_ & gp_Width) ? src.width_ : 0U;
		dst.left_justify_ = 0 != (src.flags_ & gp_LeftJustify);
		dst.zero_pad_ = 0 != (src.flags_ & gp_ZeroPad) && !dst.left_justify_;
		dst.force_sign_ = 0 != (src.flags_ & gp_ForceSign);
		dst.alternate_ = 0 != (src.flags_ & gp_Alternate);
		return 0;
	}

	template<std::size_t N>
	void put_number(misc::buffer_t<N> &out, std::uint32_t v, std::size_t min_digits = 1U) noexcept
	{	std::array<char, 10> buff;
		[[maybe_unused]] const auto [ptr, ec] = std::to_chars(buff.data(), buff.data() + buff.size(), v);
		assert(std::errc{} == ec);
		const auto len = static_cast<std::size_t>(ptr - buff.data());
		if (len < min_digits)
		{	out.put('0', min_digits - len);
		}
		out.put(std::string_view{ buff.data(), len });
	}

	// Significant digits [first, last); positions past the stored digits are zeros.
	void put_digits(misc::output_t &out, const misc::decimal_t &dec, std::size_t first, std::size_t last) noexcept
	{	if (first < dec.size_)
		{	const auto end = std::min(last, dec.size_);
			out.put(std::string_view{ dec.digits_.data() + first, end - first });
			first = end;
		}
		if (first < last)
		{	out.put('0', last - first);
		}
	}

	// [-]d.ddde±dd
	void put_scientific(misc::output_t &out, const misc::decimal_t &dec, const directives_t &dirs) noexcept
	{	const auto digits = dirs.alternate_ ? dirs.precision_ : dec.size_;
		put_digits(out, dec, 0U, 1U);
		if (dirs.alternate_ || digits > 1U)
		{	out.put('.');
			put_digits(out, dec, 1U, digits);
		}
		out.put('e');
		out.put(dec.exp10_ < 0 ? '-' : '+');
		put_number(out, static_cast<std::uint32_t>(std::abs(dec.exp10_)), MIN_EXP10_DIGITS);
	}

	// [-]ddd.ddd with precision_ - 1 - exp10_ fractional digits before trimming.
	void put_fixed(misc::output_t &out, const misc::decimal_t &dec, const directives_t &dirs) noexcept
	{	const auto digits = dirs.alternate_ ? dirs.precision_ : dec.size_;
		if (dec.exp10_ >= 0)
		{	const auto int_digits = static_cast<std::size_t>(dec.exp10_) + 1U;
			put_digits(out, dec, 0U, int_digits);
			if (dirs.alternate_ || digits > int_digits)
			{	out.put('.');
				put_digits(out, dec, int_digits, std::max(digits, int_digits));
			}
		}
		else
		{	out.put("0."sv);
			out.put('0', static_cast<std::size_t>(-dec.exp10_) - 1U);
			put_digits(out, dec, 0U, digits);
		}
	}

	// Pads the token "sign + body" to the requested width.
	void compose(misc::output_t &out, char sign, std::string_view body, const directives_t &dirs, bool finite) noexcept
	{	const auto len = body.size() + (sign ? 1U : 0U);
		const auto pad = dirs.width_ > len ? dirs.width_ - len : 0U;

		if (dirs.left_justify_)
		{	if (sign)
			{	out.put(sign);
			}
			out.put(body);
			out.put(' ', pad);
		}
		else if (dirs.zero_pad_ && finite)
		{	if (sign)
			{	out.put(sign);
			}
			out.put('0', pad);
			out.put(body);
		}
		else
		{	out.put(' ', pad);
			if (sign)
			{	out.put(sign);
			}
			out.put(body);
		}
	}
} // namespace

GP_RESULT misc::format_g(output_t &out, double val, const gp_Directives_t &src) noexcept
{	directives_t dirs;
	if (const auto ret = normalize(src, dirs); GP_FAILED(ret))
	{	return ret;
	}

	if (std::isnan(val))
	{	// The sign bit of a NaN is not rendered.
		compose(out, dirs.force_sign_ ? '+' : '\0', NAN_BODY, dirs, false);
	}
	else
	{	const char sign = std::signbit(val) ? '-' : (dirs.force_sign_ ? '+' : '\0');
		if (std::isinf(val))
		{	compose(out, sign, INF_BODY, dirs, false);
		}
		else
		{	auto dec = to_decimal(val);
			round_to(dec, dirs.precision_); // The notation depends on the exponent after rounding.

			output_t body;
			if (dec.exp10_ < MIN_FIXED_EXP10 || static_cast<std::size_t>(std::max(dec.exp10_, 0)) >= dirs.precision_)
			{	put_scientific(body, dec, dirs);
			}
			else
			{	put_fixed(body, dec, dirs);
			}

			if (body.overflow())
			{	return gp_ErrOverflow;
			}
			compose(out, sign, body.view(), dirs, true);
		}
	}

	return out.overflow() ? static_cast<GP_RESULT>(gp_ErrOverflow) : 0;
}

GP_RESULT GP_CALL gp_FormatG(char *buff, GP_SIZE sz, double val, const gp_Directives_t *dirs) noexcept
{	misc::output_t out;
	const auto ret = misc::format_g(out, val, dirs ? *dirs : gp_Directives_t{});
	if (nullptr != buff && 0U != sz)
	{	if (GP_SUCCEEDED(ret) && out.size() < sz)
		{	std::memcpy(buff, out.c_str(), out.size() + 1U);
		}
		else
		{	*buff = '\0';
		}
	}
	return GP_FAILED(ret) ? ret : static_cast<GP_RESULT>(out.size());
}

GP_RESULT GP_CALL gp_FormatGCb(double val, const gp_Directives_t *dirs, gp_SinkCb_t cb, void *ctx)
{	if (nullptr == cb)
	{	return gp_ErrInvalidArg;
	}

	misc::output_t out;
	if (const auto ret = misc::format_g(out, val, dirs ? *dirs : gp_Directives_t{}); GP_FAILED(ret))
	{	return ret;
	}
	return cb(out.c_str(), ctx);
}

GP_RESULT GP_CALL gp_DirectivesToFormat(char *buff, GP_SIZE sz, const gp_Directives_t *dirs) noexcept
{	const auto src = dirs ? *dirs : gp_Directives_t{};
	if (nullptr == buff || 0U != (src.flags_ & ~static_cast<GP_FLAGS>(gp_DirectivesMask)))
	{	return gp_ErrDirectiveEncoding;
	}

	misc::buffer_t<sizeof("%#-+04294967295.4294967295g")> ctl;
	ctl.put('%');
	if (src.flags_ & gp_Alternate)
	{	ctl.put('#');
	}
	if (src.flags_ & gp_LeftJustify)
	{	ctl.put('-');
	}
	if (src.flags_ & gp_ForceSign)
	{	ctl.put('+');
	}
	if (src.flags_ & gp_ZeroPad)
	{	ctl.put('0');
	}
	if (src.flags_ & gp_Width)
	{	put_number(ctl, src.width_);
	}
	if (src.flags_ & gp_Precision)
	{	ctl.put('.');
		put_number(ctl, src.precision_);
	}
	ctl.put('g');

	if (!verify(!ctl.overflow()) || ctl.size() >= sz)
	{	if (0U != sz)
		{	*buff = '\0';
		}
		return gp_ErrDirectiveEncoding;
	}
	std::memcpy(buff, ctl.c_str(), ctl.size() + 1U);
	return static_cast<GP_RESULT>(ctl.size());
}
