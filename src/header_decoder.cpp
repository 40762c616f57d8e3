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

#include <geodata/header_decoder.hpp>
#include <geodata/codec.hpp>
#include <format>
#include <vector>

namespace geodata {

namespace detail {

field_value decode_field(const field_spec& field, std::span<const std::byte> slice, const charset& text_charset) {
    switch (field.type) {
        case decode_type::int16_be:
            return static_cast<std::int64_t>(read_be16(slice.first<2>()));
        case decode_type::int32_be:
            return static_cast<std::int64_t>(read_be32(slice.first<4>()));
        case decode_type::ibm_float32:
            return ibm32_to_double(load_be32(slice.first<4>()));
        case decode_type::ieee_float32:
            return static_cast<double>(ieee32_to_float(load_be32(slice.first<4>())));
        case decode_type::fixed_string:
            return text_charset.decode(slice);
    }
    return std::int64_t{0};
}

} // namespace detail

auto decode_header(const format_schema &schema, std::span<const std::byte> block,
                   const charset &text_charset) -> std::expected<decoded_header, error> {
    if (block.size() < schema.required_size()) {
        return std::unexpected(error{error_code::truncated_header,
            std::format("Header '{}' needs {} bytes, got {}", schema.name(), schema.required_size(), block.size())});
    }

    std::vector<decoded_header::entry> entries;
    entries.reserve(schema.size());

    for (const auto& field : schema.fields()) {
        const auto slice = block.subspan(field.range.start, field.range.length());
        entries.emplace_back(field.name, detail::decode_field(field, slice, text_charset));
    }

    return decoded_header{std::move(entries)};
}

auto read_header(input_stream &stream, const format_schema &schema, const charset &text_charset,
                 const std::size_t block_size) -> std::expected<decoded_header, error> {
    std::vector<std::byte> block(block_size);
    auto result = read_fully(stream, block);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (*result != block_size) {
        return std::unexpected(error{error_code::truncated_header,
            std::format("Stream ended after {} of {} header bytes", *result, block_size)});
    }

    return decode_header(schema, block, text_charset);
}

} // namespace geodata
