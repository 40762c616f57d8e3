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

#include <geodata/text_reader.hpp>
#include <geodata/charset.hpp>
#include <array>
#include <format>

namespace geodata {

namespace {

constexpr std::size_t read_chunk_size = 64 * 1024;

auto read_to_end(input_stream &stream) -> std::expected<std::vector<std::byte>, error> {
    std::vector<std::byte> data;
    std::array<std::byte, 4096> chunk{};

    while (true) {
        auto result = stream.read(chunk);
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        if (data.capacity() - data.size() < *result) {
            data.reserve(data.size() + read_chunk_size);
        }
        data.insert(data.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*result));
    }

    return data;
}

} // anonymous namespace

auto read_text(input_stream &stream, std::string_view charset_name) -> std::expected<std::string, error> {
    const auto text_charset = find_charset(charset_name);
    if (!text_charset) {
        return std::unexpected(text_charset.error());
    }

    auto data = read_to_end(stream);
    if (!data) {
        return std::unexpected(data.error());
    }

    return (*text_charset)->decode(*data);
}

auto read_text_block(input_stream &stream, const std::size_t length,
                     std::string_view charset_name) -> std::expected<std::string, error> {
    const auto text_charset = find_charset(charset_name);
    if (!text_charset) {
        return std::unexpected(text_charset.error());
    }

    std::vector<std::byte> block(length);
    limited_stream bounded{stream, length};
    auto result = read_fully(bounded, block);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (*result != length) {
        return std::unexpected(error{error_code::truncated_header,
            std::format("Text block needs {} bytes, stream held {}", length, *result)});
    }

    return (*text_charset)->decode(block);
}

std::vector<std::string> split_card_lines(std::string_view text, const std::size_t width) {
    std::vector<std::string> lines;
    if (width == 0) {
        return lines;
    }

    std::string current;
    std::size_t columns = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        // A UTF-8 continuation byte belongs to the previous column
        if ((c & 0xC0) != 0x80) {
            if (columns == width) {
                lines.push_back(std::move(current));
                current.clear();
                columns = 0;
            }
            ++columns;
        }
        current.push_back(static_cast<char>(c));
    }

    if (!current.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

} // namespace geodata
