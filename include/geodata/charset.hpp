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

#include <geodata/error.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace geodata {

// Single-byte character set backed by a bundled lookup table
class charset {
private:
    std::string_view name_;
    const std::array<char32_t, 256>* table_;

public:
    constexpr charset(std::string_view name, const std::array<char32_t, 256>& table) noexcept
        : name_(name), table_(&table) {}

    [[nodiscard]] std::string_view name() const noexcept { return name_; }

    [[nodiscard]] char32_t code_point(const std::uint8_t byte) const noexcept {
        return (*table_)[byte];
    }

    // Decode to UTF-8, one code point per input byte. Nothing is trimmed.
    [[nodiscard]] std::string decode(std::span<const std::byte> bytes) const;
};

// Case-insensitive lookup of a bundled charset by name or alias
[[nodiscard]] std::expected<const charset*, error> find_charset(std::string_view name);

// Built-in charsets
[[nodiscard]] const charset& ibm1047();
[[nodiscard]] const charset& us_ascii();
[[nodiscard]] const charset& iso_8859_1();

namespace detail {

void append_utf8(std::string& out, char32_t code_point);

} // namespace detail

} // namespace geodata
