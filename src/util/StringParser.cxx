// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "StringParser.hxx"

#include <cerrno>
#include <cstdlib>
#include <stdexcept>

unsigned long
ParseUnsignedLong(const char *s, unsigned long max_value)
{
	/* strtoul() would skip whitespace and accept a sign */
	if (*s < '0' || *s > '9')
		throw std::runtime_error("Failed to parse integer");

	char *endptr;
	errno = 0;
	const auto value = std::strtoul(s, &endptr, 10);
	if (*endptr != 0)
		throw std::runtime_error("Failed to parse integer");

	if (errno == ERANGE || value > max_value)
		throw std::runtime_error("Value is too large");

	return value;
}
