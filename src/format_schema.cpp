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

#include <geodata/format_schema.hpp>
#include <algorithm>
#include <format>
#include <set>

namespace geodata {

auto format_schema::create(std::string name, std::vector<field_spec> fields) -> std::expected<format_schema, error> {
    if (fields.empty()) {
        return std::unexpected(error{error_code::schema_error,
            std::format("Schema '{}' declares no fields", name)});
    }

    std::set<std::string_view> seen;
    std::size_t required_size = 0;

    for (const auto& field : fields) {
        if (field.name.empty()) {
            return std::unexpected(error{error_code::schema_error,
                std::format("Schema '{}' has a field without a name", name)});
        }

        if (!field.range.valid()) {
            return std::unexpected(error{error_code::schema_error,
                std::format("Field '{}' has an empty or inverted range [{}, {})",
                            field.name, field.range.start, field.range.end)});
        }

        if (const auto width = type_width(field.type); width && *width != field.range.length()) {
            return std::unexpected(error{error_code::schema_error,
                std::format("Field '{}' spans {} bytes but {} needs {}",
                            field.name, field.range.length(), to_string(field.type), *width)});
        }

        if (!seen.insert(field.name).second) {
            return std::unexpected(error{error_code::schema_error,
                std::format("Duplicate field name '{}' in schema '{}'", field.name, name)});
        }

        required_size = std::max(required_size, field.range.end);
    }

    return format_schema{std::move(name), std::move(fields), required_size};
}

const field_spec* format_schema::find(std::string_view field_name) const noexcept {
    const auto it = std::ranges::find(fields_, field_name, &field_spec::name);
    return it != fields_.end() ? &*it : nullptr;
}

schema_builder& schema_builder::add_field(std::string field_name, const std::size_t start,
                                          const std::size_t end, const decode_type type) {
    fields_.push_back(field_spec{std::move(field_name), field_range{start, end}, type});
    return *this;
}

auto schema_builder::build() const -> std::expected<format_schema, error> {
    return format_schema::create(name_, fields_);
}

} // namespace geodata
