// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Uint256Parse.hxx"
#include "Uint256.hxx"

#include <stdexcept>

static constexpr int
ParseDigit(char ch, uint32_t base) noexcept
{
	int digit;
	if (ch >= '0' && ch <= '9')
		digit = ch - '0';
	else if (ch >= 'a' && ch <= 'f')
		digit = ch - 'a' + 0xa;
	else if (ch >= 'A' && ch <= 'F')
		digit = ch - 'A' + 0xa;
	else
		return -1;

	return static_cast<uint32_t>(digit) < base ? digit : -1;
}

static bool
ParseUint256Base(std::string_view s, uint32_t base, Uint256 &output) noexcept
{
	if (s.empty())
		return false;

	Uint256 value;

	for (const char ch : s) {
		const int digit = ParseDigit(ch, base);
		if (digit < 0)
			return false;

		if (!value.MultiplyAdd(base, static_cast<uint32_t>(digit)))
			return false;
	}

	output = value;
	return true;
}

bool
ParseUint256Decimal(std::string_view s, Uint256 &value) noexcept
{
	return ParseUint256Base(s, 10, value);
}

bool
ParseUint256Hex(std::string_view s, Uint256 &value) noexcept
{
	return ParseUint256Base(s, 0x10, value);
}

Uint256
ParseUint256(const char *s)
{
	const std::string_view sv{s};

	Uint256 value;

	if (sv.size() >= 2 && sv[0] == '0' && (sv[1] == 'x' || sv[1] == 'X')) {
		if (!ParseUint256Hex(sv.substr(2), value))
			throw std::runtime_error("Failed to parse hex integer");
	} else {
		if (!ParseUint256Decimal(sv, value))
			throw std::runtime_error("Failed to parse integer");
	}

	return value;
}
