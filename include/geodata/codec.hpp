/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <bit>
#include <cmath>
#include <cstdint>
#include <limits>
#include <span>

namespace geodata::detail {

[[nodiscard]] constexpr std::uint16_t load_be16(std::span<const std::byte, 2> bytes) noexcept {
    return static_cast<std::uint16_t>((std::to_integer<std::uint16_t>(bytes[0]) << 8) |
                                      std::to_integer<std::uint16_t>(bytes[1]));
}

[[nodiscard]] constexpr std::uint32_t load_be32(std::span<const std::byte, 4> bytes) noexcept {
    return (std::to_integer<std::uint32_t>(bytes[0]) << 24) |
           (std::to_integer<std::uint32_t>(bytes[1]) << 16) |
           (std::to_integer<std::uint32_t>(bytes[2]) << 8) |
           std::to_integer<std::uint32_t>(bytes[3]);
}

// Big-endian two's complement
[[nodiscard]] constexpr std::int16_t read_be16(std::span<const std::byte, 2> bytes) noexcept {
    return static_cast<std::int16_t>(load_be16(bytes));
}

[[nodiscard]] constexpr std::int32_t read_be32(std::span<const std::byte, 4> bytes) noexcept {
    return static_cast<std::int32_t>(load_be32(bytes));
}

// IBM System/370 single precision: 1 sign bit, 7-bit excess-64 base-16
// exponent, 24-bit fraction. value = sign * fraction * 16^(exponent - 70).
// Every bit pattern maps to a finite value; a zero fraction is 0.0.
[[nodiscard]] inline double ibm32_to_double(const std::uint32_t bits) noexcept {
    const std::uint32_t fraction = bits & 0x00FFFFFFu;
    if (fraction == 0) {
        return 0.0;
    }
    const int exponent = static_cast<int>((bits >> 24) & 0x7Fu) - 64;
    const double magnitude = std::ldexp(static_cast<double>(fraction), 4 * (exponent - 6));
    return (bits & 0x80000000u) ? -magnitude : magnitude;
}

// Sample precision. Magnitudes beyond float range decode to 0.0f.
[[nodiscard]] inline float ibm32_to_float(const std::uint32_t bits) noexcept {
    const double value = ibm32_to_double(bits);
    if (std::fabs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        return 0.0f;
    }
    return static_cast<float>(value);
}

[[nodiscard]] inline float ieee32_to_float(const std::uint32_t bits) noexcept {
    return std::bit_cast<float>(bits);
}

} // namespace geodata::detail
