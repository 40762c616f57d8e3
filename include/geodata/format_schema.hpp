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
#include <geodata/field_range.hpp>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace geodata {

enum class decode_type {
    int16_be,
    int32_be,
    ibm_float32,
    ieee_float32,
    fixed_string
};

// Byte width of a numeric type; strings take their width from the range
[[nodiscard]] constexpr std::optional<std::size_t> type_width(const decode_type type) noexcept {
    switch (type) {
        case decode_type::int16_be: return 2;
        case decode_type::int32_be:
        case decode_type::ibm_float32:
        case decode_type::ieee_float32: return 4;
        case decode_type::fixed_string: return std::nullopt;
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::string_view to_string(const decode_type type) noexcept {
    switch (type) {
        case decode_type::int16_be: return "int16_be";
        case decode_type::int32_be: return "int32_be";
        case decode_type::ibm_float32: return "ibm_float32";
        case decode_type::ieee_float32: return "ieee_float32";
        case decode_type::fixed_string: return "fixed_string";
    }
    return "unknown";
}

struct field_spec {
    std::string name;
    field_range range;
    decode_type type = decode_type::int16_be;
};

// Immutable, ordered set of named fields describing one fixed-size block
// layout. Instances are built once per format revision and shared read-only.
class format_schema {
private:
    std::string name_;
    std::vector<field_spec> fields_;
    std::size_t required_size_ = 0;

    format_schema(std::string name, std::vector<field_spec> fields, std::size_t required_size)
        : name_(std::move(name)), fields_(std::move(fields)), required_size_(required_size) {}

public:
    // Validates ranges, numeric widths and name uniqueness
    [[nodiscard]] static std::expected<format_schema, error>
    create(std::string name, std::vector<field_spec> fields);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::span<const field_spec> fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t size() const noexcept { return fields_.size(); }

    // Smallest block that holds every declared field
    [[nodiscard]] std::size_t required_size() const noexcept { return required_size_; }

    [[nodiscard]] const field_spec* find(std::string_view field_name) const noexcept;
    [[nodiscard]] bool contains(std::string_view field_name) const noexcept {
        return find(field_name) != nullptr;
    }
};

// Collects field declarations; validation happens in build()
class schema_builder {
private:
    std::string name_;
    std::vector<field_spec> fields_;

public:
    explicit schema_builder(std::string name) : name_(std::move(name)) {}

    schema_builder& add_field(std::string field_name, std::size_t start, std::size_t end, decode_type type);

    [[nodiscard]] std::expected<format_schema, error> build() const;
};

} // namespace geodata
