// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/Uint256.hxx"
#include "util/Uint256Format.hxx"
#include "util/Uint256Parse.hxx"

#include <cstdint>
#include <cstdlib>
#include <span>
#include <string_view>

extern "C" {
int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);
}

static void
CheckRoundTrip(const Uint256 &value, std::string_view s, bool hex)
{
	Uint256 parsed;
	if (!(hex ? ParseUint256Hex(s, parsed) : ParseUint256Decimal(s, parsed)) ||
	    parsed != value)
		abort();
}

int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size)
{
	if (size < Uint256::SIZE)
		return 0;

	const auto input = std::as_bytes(std::span{data, size})
		.first<Uint256::SIZE>();
	const auto value = Uint256::FromBE(input);

	const auto decimal = ToDecimalString(value);
	CheckRoundTrip(value, decimal, false);

	const auto hex = ToHexString(value);
	CheckRoundTrip(value, std::string_view{hex}.substr(2), true);

	/* use the rest of the input to choose the width */
	const std::size_t min_digits = size > Uint256::SIZE
		? data[Uint256::SIZE] % 80
		: 0;
	const auto fixed = ToHexStringFixed(value, min_digits);
	if (fixed.size() < 2 + min_digits)
		abort();

	/* zero with zero digits is just "0x" */
	if ((!value.IsZero() || min_digits > 0) &&
	    !std::string_view{fixed}.ends_with(std::string_view{hex}.substr(2)))
		abort();

	return 0;
}
