#ifndef GPOINT_SOURCE_INTERNAL_H
#	define GPOINT_SOURCE_INTERNAL_H
#	pragma once

#include <gpoint/gpoint.h>

#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <string_view>

#define verify(v) [](bool b) constexpr noexcept { assert(b); return b; }(v) // Define for displaying the __FILE__ and __LINE__ during debugging.

namespace misc
{
	// Exact decimal digits of a double: 2^52 * 5^1074 has 767 digits.
	constexpr std::size_t MAX_DIGITS = 768U;

	// The significant digits of a finite value and the decimal exponent of the first one.
	// Invariant: 0 < size_ <= MAX_DIGITS, digits_[0] != '0' unless the value is zero, no trailing zeros.
	struct decimal_t
	{	std::array<char, MAX_DIGITS> digits_;
		std::size_t size_ = 0U;
		int exp10_ = 0;

		[[nodiscard]] char digit(std::size_t pos) const noexcept { return pos < size_ ? digits_[pos] : '0'; }
		[[nodiscard]] bool is_zero() const noexcept { return 1U == size_ && '0' == digits_[0]; }
	};

	// Exact decimal expansion of the absolute value of a finite double.
	[[nodiscard]] decimal_t to_decimal(double val) noexcept;
	// Rounds to 'precision' significant digits, ties to even. May increment exp10_.
	void round_to(decimal_t &dec, std::size_t precision) noexcept;

	// Fixed-capacity text buffer. Appending past the capacity sets the overflow state
	// and leaves the content as it was; the content is always zero-terminated.
	template<std::size_t N>
	class buffer_t
	{	static_assert(N > 1U);
		std::array<char, N> data_{};
		std::size_t size_ = 0U;
		bool overflow_ = false;
	public:
		static constexpr std::size_t capacity() noexcept { return N - 1U; }
		[[nodiscard]] bool overflow() const noexcept { return overflow_; }
		[[nodiscard]] std::size_t size() const noexcept { return size_; }
		[[nodiscard]] const char *c_str() const noexcept { return data_.data(); }
		[[nodiscard]] std::string_view view() const noexcept { return { data_.data(), size_ }; }

		void put(char c, std::size_t cnt = 1U) noexcept
		{	if (overflow_ || cnt > capacity() - size_)
			{	overflow_ = true;
				return;
			}
			std::memset(data_.data() + size_, c, cnt);
			size_ += cnt;
			data_[size_] = '\0';
		}

		void put(std::string_view s) noexcept
		{	if (overflow_ || s.size() > capacity() - size_)
			{	overflow_ = true;
				return;
			}
			std::memcpy(data_.data() + size_, s.data(), s.size());
			size_ += s.size();
			data_[size_] = '\0';
		}
	};

	using output_t = buffer_t<GP_BUFFER_SIZE>;

	// Renders val according to dirs into out. Returns 0 or a negative gp_Error_e.
	[[nodiscard]] GP_RESULT format_g(output_t &out, double val, const gp_Directives_t &dirs) noexcept;
}

#endif // #ifndef GPOINT_SOURCE_INTERNAL_H
