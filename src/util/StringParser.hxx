// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

/**
 * Parse a non-negative decimal integer (digits only, no sign and no
 * whitespace) which must not be larger than #max_value; throws
 * std::runtime_error on error.
 */
unsigned long
ParseUnsignedLong(const char *s, unsigned long max_value);
