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

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace geodata {

// Integers (int16/int32), reals (IBM/IEEE float) or text
using field_value = std::variant<std::int64_t, double, std::string>;

// Decoded fields of one block, in schema order
class decoded_header {
public:
    using entry = std::pair<std::string, field_value>;

private:
    std::vector<entry> entries_;

public:
    decoded_header() = default;
    explicit decoded_header(std::vector<entry> entries)
        : entries_(std::move(entries)) {}

    [[nodiscard]] std::span<const entry> entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const field_value* get(std::string_view name) const noexcept {
        const auto it = std::ranges::find(entries_, name, &entry::first);
        return it != entries_.end() ? &it->second : nullptr;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept { return get(name) != nullptr; }

    [[nodiscard]] std::optional<std::int64_t> integer(std::string_view name) const noexcept {
        if (const auto* value = get(name)) {
            if (const auto* i = std::get_if<std::int64_t>(value)) return *i;
        }
        return std::nullopt;
    }

    // Integers widen to double so callers need not know the field's type
    [[nodiscard]] std::optional<double> real(std::string_view name) const noexcept {
        if (const auto* value = get(name)) {
            if (const auto* d = std::get_if<double>(value)) return *d;
            if (const auto* i = std::get_if<std::int64_t>(value)) return static_cast<double>(*i);
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::string_view> text(std::string_view name) const noexcept {
        if (const auto* value = get(name)) {
            if (const auto* s = std::get_if<std::string>(value)) return std::string_view{*s};
        }
        return std::nullopt;
    }
};

} // namespace geodata
