// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>

/**
 * A 256 bit unsigned integer, stored as four 64 bit limbs (least
 * significant first).
 *
 * This is not a general purpose big integer: it implements only what
 * is needed to convert it to and from text, i.e. division with
 * remainder by a small divisor and multiply-add with small operands.
 * Small operands are limited to 32 bits so each step fits into a
 * native 64 bit integer.
 */
struct Uint256 {
	static constexpr std::size_t N_LIMBS = 4;
	static constexpr std::size_t SIZE = N_LIMBS * sizeof(uint64_t);

	std::array<uint64_t, N_LIMBS> limbs{};

	constexpr Uint256() noexcept = default;

	constexpr Uint256(uint64_t value) noexcept
		:limbs{value, 0, 0, 0} {}

	/**
	 * Construct from limbs, most significant first (i.e. in the
	 * order they appear when written down).
	 */
	static constexpr Uint256 FromLimbs(uint64_t l3, uint64_t l2,
					   uint64_t l1, uint64_t l0) noexcept {
		Uint256 result;
		result.limbs = {l0, l1, l2, l3};
		return result;
	}

	static constexpr Uint256 Max() noexcept {
		return FromLimbs(~uint64_t{}, ~uint64_t{},
				 ~uint64_t{}, ~uint64_t{});
	}

	/**
	 * Decode a big-endian 32 byte word (the layout of an ABI
	 * encoded "uint256").
	 */
	static constexpr Uint256 FromBE(std::span<const std::byte, SIZE> src) noexcept {
		Uint256 result;
		for (std::size_t i = 0; i < SIZE; ++i) {
			auto &limb = result.limbs[N_LIMBS - 1 - i / sizeof(uint64_t)];
			limb = (limb << 8) | static_cast<uint64_t>(src[i]);
		}
		return result;
	}

	constexpr bool IsZero() const noexcept {
		return (limbs[0] | limbs[1] | limbs[2] | limbs[3]) == 0;
	}

	constexpr bool operator==(const Uint256 &) const noexcept = default;

	/**
	 * Divide this number by the given divisor (in place).
	 *
	 * @return the remainder
	 */
	constexpr uint32_t DivMod(uint32_t divisor) noexcept {
		assert(divisor > 0);

		uint64_t remainder = 0;
		for (std::size_t i = N_LIMBS; i-- > 0;) {
			auto &limb = limbs[i];

			/* the remainder is always smaller than the
			   divisor, so shifting it by 32 bits cannot
			   overflow */
			uint64_t high = (remainder << 32) | (limb >> 32);
			remainder = high % divisor;
			high /= divisor;

			uint64_t low = (remainder << 32) | (limb & 0xffffffff);
			remainder = low % divisor;
			low /= divisor;

			limb = (high << 32) | low;
		}

		return static_cast<uint32_t>(remainder);
	}

	/**
	 * Calculate "this * factor + addend" (in place).
	 *
	 * @return false on overflow; the value is then truncated to
	 * 256 bits
	 */
	constexpr bool MultiplyAdd(uint32_t factor, uint32_t addend) noexcept {
		uint64_t carry = addend;
		for (auto &limb : limbs) {
			const uint64_t low = (limb & 0xffffffff) * factor + carry;
			const uint64_t high = (limb >> 32) * factor + (low >> 32);
			limb = (high << 32) | (low & 0xffffffff);
			carry = high >> 32;
		}

		return carry == 0;
	}

	constexpr Uint256 operator/(uint32_t divisor) const noexcept {
		Uint256 quotient = *this;
		quotient.DivMod(divisor);
		return quotient;
	}

	constexpr uint32_t operator%(uint32_t divisor) const noexcept {
		Uint256 quotient = *this;
		return quotient.DivMod(divisor);
	}
};
