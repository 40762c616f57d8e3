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
#include <geodata/charset.hpp>
#include <geodata/decoded_header.hpp>
#include <geodata/format_schema.hpp>
#include <geodata/stream.hpp>
#include <expected>
#include <span>

namespace geodata {

// Decode every field of schema from block. The block must hold at least
// schema.required_size() bytes; otherwise nothing is decoded.
[[nodiscard]] std::expected<decoded_header, error>
decode_header(const format_schema& schema, std::span<const std::byte> block, const charset& text_charset);

// Read a block_size header from stream and decode it
[[nodiscard]] std::expected<decoded_header, error>
read_header(input_stream& stream, const format_schema& schema, const charset& text_charset, std::size_t block_size);

namespace detail {

// Decode a single field; the slice length equals the field's range length
[[nodiscard]] field_value decode_field(const field_spec& field, std::span<const std::byte> slice,
                                       const charset& text_charset);

} // namespace detail

} // namespace geodata
