// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "util/Uint256.hxx"
#include "util/Uint256Format.hxx"

#include <fmt/format.h>

#include <cstddef>
#include <string_view>

/**
 * Supported types: "d" (the default), "x" (hex digits only) and "#x"
 * (hex with "0x" prefix).  Fill, alignment and width work like with
 * integers (right-aligned unless specified otherwise), but the "0"
 * flag, sign and nested replacement fields (dynamic width) are not
 * supported.
 */
template<>
struct fmt::formatter<Uint256> : formatter<string_view>
{
	bool alternate = false;
	char presentation = 'd';

	static constexpr bool IsAlign(char ch) noexcept {
		return ch == '<' || ch == '>' || ch == '^';
	}

	constexpr auto parse(format_parse_context &ctx) {
		const auto begin = ctx.begin();
		auto spec_end = begin;
		while (spec_end != ctx.end() && *spec_end != '}')
			++spec_end;

		std::string_view s{begin, static_cast<std::size_t>(spec_end - begin)};

		if (s.find('{') != s.npos)
			throw format_error("dynamic width not supported for Uint256");

		if (!s.empty() && (s.back() == 'd' || s.back() == 'x')) {
			presentation = s.back();
			s.remove_suffix(1);
		}

		/* fill and alignment */
		std::size_t align_length = 0;
		if (s.size() >= 2 && IsAlign(s[1]))
			align_length = 2;
		else if (!s.empty() && IsAlign(s[0]))
			align_length = 1;

		/* copy the rest without the '#' flag; the string
		   formatter parses fill, alignment and width */
		char spec[32]{};
		std::size_t length = 0;

		if (align_length == 0 && align_length < s.size())
			/* right-align by default, like integers */
			spec[length++] = '>';

		for (std::size_t i = 0; i < s.size(); ++i) {
			if (i == align_length && s[i] == '#') {
				alternate = true;
				continue;
			}

			if (length >= sizeof(spec))
				throw format_error("format spec too long for Uint256");

			spec[length++] = s[i];
		}

		if (alternate && presentation != 'x')
			throw format_error("invalid format for Uint256");

		if (length > 0 && !(length == 1 && spec[0] == '>')) {
			format_parse_context sub{string_view{spec, length}};
			if (formatter<string_view>::parse(sub) != sub.end())
				throw format_error("invalid format for Uint256");
		}

		return spec_end;
	}

	template<typename FormatContext>
	auto format(const Uint256 &value, FormatContext &ctx) const {
		char buffer[2 + UINT256_DECIMAL_DIGITS];
		std::string_view s;

		if (presentation == 'x') {
			s = FormatUint256Hex(std::span{buffer}.subspan<2, UINT256_HEX_DIGITS>(),
					     value);
			if (alternate) {
				/* the digits were written to the end
				   of the span, so the prefix fits
				   right before them */
				char *p = buffer + (s.data() - buffer) - 2;
				p[0] = '0';
				p[1] = 'x';
				s = {p, s.size() + 2};
			}
		} else
			s = FormatUint256Decimal(std::span{buffer}.subspan<2, UINT256_DECIMAL_DIGITS>(),
						 value);

		return formatter<string_view>::format(s, ctx);
	}
};
