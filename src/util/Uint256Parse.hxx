// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string_view>

struct Uint256;

/**
 * Parse a non-empty string of decimal digits.
 *
 * @return false if the string is malformed or if the number does not
 * fit into 256 bits
 */
bool
ParseUint256Decimal(std::string_view s, Uint256 &value) noexcept;

/**
 * Parse a non-empty string of hex digits (upper or lower case,
 * without "0x" prefix).
 *
 * @return false if the string is malformed or if the number does not
 * fit into 256 bits
 */
bool
ParseUint256Hex(std::string_view s, Uint256 &value) noexcept;

/**
 * Parse a decimal number or a "0x"-prefixed hex number; throws
 * std::runtime_error on error.
 */
Uint256
ParseUint256(const char *s);
