// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Uint256Format.hxx"
#include "Uint256.hxx"

#include <cassert>

static constexpr char hex_digits[] = "0123456789abcdef";

template<uint32_t base>
static std::string_view
FormatUint256(std::span<char> buffer, Uint256 value) noexcept
{
	static_assert(base >= 2 && base <= 16);

	char *const end = buffer.data() + buffer.size();
	char *p = end;

	do {
		const auto digit = value.DivMod(base);
		assert(digit < base);
		assert(p > buffer.data());

		*--p = hex_digits[digit];
	} while (!value.IsZero());

	return {p, end};
}

std::string_view
FormatUint256Decimal(std::span<char, UINT256_DECIMAL_DIGITS> buffer,
		     const Uint256 &value) noexcept
{
	return FormatUint256<10>(buffer, value);
}

std::string_view
FormatUint256Hex(std::span<char, UINT256_HEX_DIGITS> buffer,
		 const Uint256 &value) noexcept
{
	return FormatUint256<0x10>(buffer, value);
}

std::string
ToDecimalString(const Uint256 &value)
{
	char buffer[UINT256_DECIMAL_DIGITS];
	return std::string{FormatUint256Decimal(buffer, value)};
}

std::string
ToHexString(const Uint256 &value)
{
	char buffer[UINT256_HEX_DIGITS];
	const auto digits = FormatUint256Hex(buffer, value);

	std::string result;
	result.reserve(2 + digits.size());
	result.append("0x");
	result.append(digits);
	return result;
}

std::string
ToHexStringFixed(const Uint256 &value, std::size_t min_digits)
{
	std::string result{"0x"};

	if (value.IsZero()) {
		result.append(min_digits, '0');
		return result;
	}

	char buffer[UINT256_HEX_DIGITS];
	const auto digits = FormatUint256Hex(buffer, value);

	if (digits.size() < min_digits)
		result.append(min_digits - digits.size(), '0');

	result.append(digits);
	return result;
}
