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

#include <array>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>

namespace
{
	static_assert(std::numeric_limits<double>::is_iec559 && std::numeric_limits<double>::digits == 53);

	constexpr auto MANTISSA_BITS = 52;
	constexpr auto EXP_MASK = 0x7FFU;
	constexpr auto EXP_BIAS = 1075; // 1023 + MANTISSA_BITS
	constexpr auto EXP_SUBNORMAL = 1 - EXP_BIAS;

	constexpr std::uint32_t LIMB_BASE = 1'000'000'000U;
	constexpr std::size_t LIMB_DIGITS = 9U;
	constexpr std::size_t MAX_LIMBS = (misc::MAX_DIGITS + LIMB_DIGITS - 1U) / LIMB_DIGITS + 1U;

	// Largest powers that keep limb * factor + carry inside 64 bits.
	constexpr unsigned POW2_STEP = 29U;
	constexpr unsigned POW5_STEP = 13U;
	constexpr std::uint32_t POW5[POW5_STEP + 1U]
	{	1U, 5U, 25U, 125U, 625U, 3'125U, 15'625U, 78'125U, 390'625U, 1'953'125U,
		9'765'625U, 48'828'125U, 244'140'625U, 1'220'703'125U,
	};
	static_assert(POW5[POW5_STEP] == 1'220'703'125U);

	// Non-negative integer in base 10^9, least significant limb first.
	// Exact binary fractions need only multiplications: m * 2^e for e >= 0 and m * 5^-e otherwise.
	class big_decimal_t
	{	std::array<std::uint32_t, MAX_LIMBS> limbs_{};
		std::size_t size_ = 0U;

		void mul(std::uint32_t factor) noexcept
		{	std::uint64_t carry = 0U;
			for (std::size_t n = 0U; n < size_; ++n)
			{	const auto t = static_cast<std::uint64_t>(limbs_[n]) * factor + carry;
				limbs_[n] = static_cast<std::uint32_t>(t % LIMB_BASE);
				carry = t / LIMB_BASE;
			}
			for (; carry && verify(size_ < limbs_.size()); carry /= LIMB_BASE)
			{	limbs_[size_++] = static_cast<std::uint32_t>(carry % LIMB_BASE);
			}
		}
	public:
		explicit big_decimal_t(std::uint64_t v) noexcept
		{	do
			{	limbs_[size_++] = static_cast<std::uint32_t>(v % LIMB_BASE);
				v /= LIMB_BASE;
			} while (v);
		}

		void mul_pow2(unsigned exp) noexcept
		{	for (; exp >= POW2_STEP; exp -= POW2_STEP)
			{	mul(1U << POW2_STEP);
			}
			if (exp)
			{	mul(1U << exp);
			}
		}

		void mul_pow5(unsigned exp) noexcept
		{	for (; exp >= POW5_STEP; exp -= POW5_STEP)
			{	mul(POW5[POW5_STEP]);
			}
			if (exp)
			{	mul(POW5[exp]);
			}
		}

		// Writes the decimal digits without leading zeros. Returns the number of digits.
		std::size_t to_chars(char *dst, std::size_t sz) const noexcept
		{	std::array<char, LIMB_DIGITS> top;
			std::size_t top_len = 0U;
			for (auto v = limbs_[size_ - 1U]; v; v /= 10U)
			{	top[top_len++] = static_cast<char>('0' + v % 10U);
			}

			const auto total = top_len + LIMB_DIGITS * (size_ - 1U);
			if (!verify(total <= sz))
			{	return 0U;
			}

			for (auto n = top_len; n; )
			{	*dst++ = top[--n];
			}
			for (auto n = size_ - 1U; n--; )
			{	auto v = limbs_[n];
				for (auto pos = LIMB_DIGITS; pos--; v /= 10U)
				{	dst[pos] = static_cast<char>('0' + v % 10U);
				}
				dst += LIMB_DIGITS;
			}
			return total;
		}
	};
} // namespace

misc::decimal_t misc::to_decimal(double val) noexcept
{	assert(std::isfinite(val));

	std::uint64_t bits;
	static_assert(sizeof(bits) == sizeof(val));
	std::memcpy(&bits, &val, sizeof(bits));

	auto mant = bits & ((std::uint64_t{ 1 } << MANTISSA_BITS) - 1U);
	auto exp2 = EXP_SUBNORMAL;
	if (const auto biased = static_cast<int>((bits >> MANTISSA_BITS) & EXP_MASK); 0 != biased)
	{	mant |= std::uint64_t{ 1 } << MANTISSA_BITS;
		exp2 = biased - EXP_BIAS;
	}

	decimal_t result;
	if (0U == mant)
	{	result.digits_[0] = '0';
		result.size_ = 1U;
		result.exp10_ = 0;
		return result;
	}

	for (; 0U == (mant & 1U); mant >>= 1)
	{	++exp2;
	}

	big_decimal_t big{ mant };
	int frac_digits = 0;
	if (exp2 >= 0)
	{	big.mul_pow2(static_cast<unsigned>(exp2));
	}
	else
	{	big.mul_pow5(static_cast<unsigned>(-exp2));
		frac_digits = -exp2; // m * 2^-k == m * 5^k / 10^k
	}

	result.size_ = big.to_chars(result.digits_.data(), result.digits_.size());
	result.exp10_ = static_cast<int>(result.size_) - 1 - frac_digits;
	while (result.size_ > 1U && '0' == result.digits_[result.size_ - 1U])
	{	--result.size_;
	}
	return result;
}

void misc::round_to(decimal_t &dec, std::size_t precision) noexcept
{	assert(precision > 0U && dec.size_ > 0U);
	if (dec.size_ <= precision)
	{	return;
	}

	const auto next = dec.digits_[precision];
	const auto exact_half = '5' == next && dec.size_ == precision + 1U; // Trailing zeros were stripped, so nothing follows.
	const auto odd = 0 != (dec.digits_[precision - 1U] - '0') % 2;
	dec.size_ = precision;

	if (next > '5' || ('5' == next && (!exact_half || odd)))
	{	auto pos = precision;
		while (pos > 0U && '9' == dec.digits_[pos - 1U])
		{	--pos;
		}

		if (0U == pos)
		{	// 9.99 -> 10.0: the leading digit moves one decade up.
			dec.digits_[0] = '1';
			dec.size_ = 1U;
			++dec.exp10_;
		}
		else
		{	++dec.digits_[pos - 1U];
			dec.size_ = pos;
		}
	}
	else
	{	while (dec.size_ > 1U && '0' == dec.digits_[dec.size_ - 1U])
		{	--dec.size_;
		}
	}
}
