// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

struct Uint256;

/**
 * The number of decimal digits of the largest #Uint256 value
 * (2^256-1).
 */
static constexpr std::size_t UINT256_DECIMAL_DIGITS = 78;

/**
 * The number of hexadecimal digits of the largest #Uint256 value.
 */
static constexpr std::size_t UINT256_HEX_DIGITS = 64;

/**
 * Format a 256 bit unsigned integer into a decimal string (without
 * leading zeroes).  The digits are written to the end of the given
 * buffer; no null terminator is appended.
 *
 * @return the digits (pointing into the buffer)
 */
std::string_view
FormatUint256Decimal(std::span<char, UINT256_DECIMAL_DIGITS> buffer,
		     const Uint256 &value) noexcept;

/**
 * Format a 256 bit unsigned integer into a lower-case hex string
 * (without prefix and without leading zeroes).  Zero is formatted as
 * a single "0".
 *
 * @return the digits (pointing into the buffer)
 */
std::string_view
FormatUint256Hex(std::span<char, UINT256_HEX_DIGITS> buffer,
		 const Uint256 &value) noexcept;

/**
 * Convert to a decimal string, e.g. "12345".
 */
std::string
ToDecimalString(const Uint256 &value);

/**
 * Convert to the shortest "0x"-prefixed hex string, e.g. "0xff".
 */
std::string
ToHexString(const Uint256 &value);

/**
 * Convert to a "0x"-prefixed hex string with at least #min_digits
 * digits, padded with zeroes.  Longer values are never truncated.
 *
 * Zero is special: it is formatted as exactly #min_digits zeroes,
 * therefore zero with #min_digits=0 results in just "0x".
 */
std::string
ToHexStringFixed(const Uint256 &value, std::size_t min_digits);
