// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

struct Uint256;

static constexpr std::string_view DEFAULT_TOKEN_URI_BASE = "https://api.example.com";

/**
 * The number of hex digits of the token id in the "hex" query
 * parameter of token URIs.
 */
static constexpr std::size_t TOKEN_URI_HEX_DIGITS = 8;

/**
 * Build a token metadata URI of the form
 * "BASE/token/DECIMAL_ID/metadata?hex=0xHEX_ID".
 *
 * @param base the URI prefix without trailing slash
 */
std::string
MakeTokenUri(const Uint256 &token_id,
	     std::string_view base=DEFAULT_TOKEN_URI_BASE);

/**
 * Describe the value in all supported notations (multi-line, no
 * trailing newline).
 */
std::string
FormatValueRepresentations(const Uint256 &value);
