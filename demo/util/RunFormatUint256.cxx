// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "uri/TokenUri.hxx"
#include "util/Uint256.hxx"
#include "util/Uint256Format.hxx"
#include "util/Uint256Parse.hxx"
#include "util/StringParser.hxx"

#include <fmt/core.h>

#include <cstdlib>
#include <exception>

/**
 * The largest accepted MIN_DIGITS value.
 */
static constexpr unsigned long MAX_MIN_DIGITS = 4096;

int
main(int argc, char **argv) noexcept
try {
	if (argc < 2 || argc > 3) {
		fmt::print(stderr, "usage: format-uint256 VALUE [MIN_DIGITS]\n");
		return EXIT_FAILURE;
	}

	const auto value = ParseUint256(argv[1]);
	const std::size_t min_digits = argc > 2
		? ParseUnsignedLong(argv[2], MAX_MIN_DIGITS)
		: 0;

	fmt::print("{}\n", FormatValueRepresentations(value));

	if (argc > 2)
		fmt::print("Hex ({} chars): {}\n",
			   min_digits, ToHexStringFixed(value, min_digits));

	fmt::print("Token URI: {}\n", MakeTokenUri(value));

	return EXIT_SUCCESS;
} catch (const std::exception &e) {
	fmt::print(stderr, "{}\n", e.what());
	return EXIT_FAILURE;
}
