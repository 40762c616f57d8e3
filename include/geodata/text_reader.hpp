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
#include <geodata/stream.hpp>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace geodata {

// Decode the rest of stream as text. The charset is resolved before the
// first read, so an unknown name leaves the stream untouched.
[[nodiscard]] std::expected<std::string, error>
read_text(input_stream& stream, std::string_view charset_name);

// Decode exactly length bytes as text; a shorter stream is truncated_header
[[nodiscard]] std::expected<std::string, error>
read_text_block(input_stream& stream, std::size_t length, std::string_view charset_name);

// Split text into fixed-width card images (80 columns for SEG-Y). Widths are
// counted in code points so multi-byte UTF-8 output is never cut mid-sequence.
[[nodiscard]] std::vector<std::string> split_card_lines(std::string_view text, std::size_t width = 80);

} // namespace geodata
