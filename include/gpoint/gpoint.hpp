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

/*****************************************************************************\
* This header defines the C++ wrappers for gpoint.
* Everything here is header-only and forwards to the C API; the rendered
* token is assembled in a local buffer and handed to the sink in one piece,
* so a sink never sees partial output.
\*****************************************************************************/

#ifndef GPOINT_GPOINT_HPP
#	define GPOINT_GPOINT_HPP
#	pragma once

#	include "gpoint.h"

#	if __cplusplus < 201703L && (!defined(_MSVC_LANG) || _MSVC_LANG < 201703L)
#		error "gpoint requires C++17 or later."
#	endif

#	include <algorithm>
#	include <array>
#	include <cstdint>
#	include <limits>
#	include <ios>
#	include <optional>
#	include <ostream>
#	include <string>
#	include <string_view>
#	include <type_traits>

namespace gpoint
{
	// The formatting request of one call, spelled the way printf flags read: "%#-+0<width>.<precision>g".
	struct directives_t
	{	bool zero_pad_ = false;
		bool left_justify_ = false; // Wins over zero_pad_.
		bool force_sign_ = false;
		bool alternate_ = false;
		std::optional<unsigned> width_;
		std::optional<unsigned> precision_; // Absent means 6.

		[[nodiscard]] gp_Directives_t c_directives() const noexcept
		{	gp_Directives_t result{};
			result.flags_ =
				(zero_pad_ ? static_cast<GP_FLAGS>(gp_ZeroPad) : 0U) |
				(left_justify_ ? static_cast<GP_FLAGS>(gp_LeftJustify) : 0U) |
				(force_sign_ ? static_cast<GP_FLAGS>(gp_ForceSign) : 0U) |
				(alternate_ ? static_cast<GP_FLAGS>(gp_Alternate) : 0U) |
				(width_ ? static_cast<GP_FLAGS>(gp_Width) : 0U) |
				(precision_ ? static_cast<GP_FLAGS>(gp_Precision) : 0U);
			result.width_ = width_.value_or(0U);
			result.precision_ = precision_.value_or(0U);
			return result;
		}
	};

	namespace detail
	{	template<typename, typename = void>
		struct has_append: std::false_type {};
		template<typename T>
		struct has_append<T, std::void_t<decltype(std::declval<T &>().append(std::declval<const char *>(), std::size_t{}))>>: std::true_type {};
	}

	// Renders val and writes it to a text sink. The sink is one of:
	// - a callable accepting std::string_view;
	// - a container with append(const char*, size_t), e.g. std::string;
	// - an std::ostream (the stream's own formatting state is not consulted).
	// Returns the length of the token, or a negative gp_Error_e; the sink is untouched on failure.
	template<typename Sink>
	GP_RESULT format_to(Sink &sink, double val, const directives_t &dirs = {})
	{	std::array<char, GP_BUFFER_SIZE> buff;
		const auto c_dirs = dirs.c_directives();
		const auto len = gp_FormatG(buff.data(), buff.size(), val, &c_dirs);
		if (GP_FAILED(len))
		{	return len;
		}

		const std::string_view token{ buff.data(), static_cast<std::size_t>(len) };
		if constexpr (std::is_invocable_v<Sink &, std::string_view>)
		{	sink(token);
		}
		else if constexpr (detail::has_append<Sink>::value)
		{	sink.append(token.data(), token.size());
		}
		else
		{	static_assert(std::is_base_of_v<std::ostream, Sink>, "Unsupported text sink type.");
			sink.write(token.data(), static_cast<std::streamsize>(token.size()));
		}
		return len;
	}

	[[nodiscard]] inline std::optional<std::string> to_string(double val, const directives_t &dirs = {})
	{	std::string result;
		if (GP_FAILED(format_to(result, val, dirs)))
		{	return std::nullopt;
		}
		return result;
	}

	// A floating-point value printed by operator<< as printf("%g") prints it.
	// float is widened to double, as for a printf argument.
	template<typename F>
	struct gpoint_t
	{	static_assert(std::is_same_v<F, float> || std::is_same_v<F, double>, "gpoint_t expects float or double.");
		F value_;
	};

	template<typename F>
	[[nodiscard]] constexpr gpoint_t<F> g(F v) noexcept { return { v }; }

	// Stream state -> directives: width() -> width (consumed), precision() -> precision,
	// std::left -> left-justify, fill '0' -> zero padding, std::showpos -> '+', std::showpoint -> '#'.
	template<typename F>
	std::ostream &operator<<(std::ostream &os, const gpoint_t<F> &v)
	{	const auto flags = os.flags();
		directives_t dirs;
		dirs.left_justify_ = (flags & std::ios_base::adjustfield) == std::ios_base::left;
		dirs.zero_pad_ = os.fill() == os.widen('0');
		dirs.force_sign_ = 0 != (flags & std::ios_base::showpos);
		dirs.alternate_ = 0 != (flags & std::ios_base::showpoint);
		// Values beyond the C range saturate, so the request fails instead of shrinking.
		constexpr auto max_value = static_cast<std::streamsize>(std::min<std::uintmax_t>(
			std::numeric_limits<std::uint32_t>::max(), std::numeric_limits<std::streamsize>::max()));
		if (os.width() > 0)
		{	dirs.width_ = static_cast<unsigned>(std::min(os.width(), max_value));
		}
		if (os.precision() >= 0)
		{	dirs.precision_ = static_cast<unsigned>(std::min(os.precision(), max_value));
		}
		os.width(0);

		if (GP_FAILED(format_to(os, static_cast<double>(v.value_), dirs)))
		{	os.setstate(std::ios_base::failbit);
		}
		return os;
	}
} // namespace gpoint

#endif // #ifndef GPOINT_GPOINT_HPP
