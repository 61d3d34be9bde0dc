// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TokenUri.hxx"
#include "lib/fmt/Uint256Formatter.hxx"
#include "util/Uint256.hxx"
#include "util/Uint256Format.hxx"

#include <fmt/format.h>

std::string
MakeTokenUri(const Uint256 &token_id, std::string_view base)
{
	return fmt::format("{}/token/{}/metadata?hex={}",
			   base, token_id,
			   ToHexStringFixed(token_id, TOKEN_URI_HEX_DIGITS));
}

std::string
FormatValueRepresentations(const Uint256 &value)
{
	return fmt::format("Value representations:\n"
			   "Decimal: {}\n"
			   "Hex: {:#x}\n"
			   "Hex (8 chars): {}\n"
			   "Hex (16 chars): {}",
			   value, value,
			   ToHexStringFixed(value, 8),
			   ToHexStringFixed(value, 16));
}
