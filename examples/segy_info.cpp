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

/**
 * segy_info - Prints the textual and binary headers of a SEG-Y file and,
 * optionally, a min/max summary over every trace.
 *
 * Usage: ./segy_info <segy_file> [--summary] [--charset NAME] [--rev0]
 *
 * Features demonstrated:
 * - Reading the 3200-byte text header under an EBCDIC charset
 * - Decoding the binary header through a prebuilt schema
 * - Walking traces with a cursor and polling its progress
 */

#include <geodata/geodata.hpp>
#include <format>
#include <print>
#include <string_view>
#include <variant>

namespace {

std::string format_value(const geodata::field_value& value) {
    return std::visit([](const auto& v) { return std::format("{}", v); }, value);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::println(stderr, "Usage: {} <segy_file> [--summary] [--charset NAME] [--rev0]", argv[0]);
        return 1;
    }

    geodata::segy::extraction_options options;
    bool summary = false;
    for (int i = 2; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--summary") {
            summary = true;
        } else if (arg == "--charset" && i + 1 < argc) {
            options.charset = argv[++i];
        } else if (arg == "--rev0") {
            options.binary_schema = &geodata::segy::binary_header_rev0();
        } else {
            std::println(stderr, "Unknown argument: {}", arg);
            return 1;
        }
    }

    auto stream = geodata::open_file(argv[1]);
    if (!stream) {
        std::println(stderr, "Failed to open file: {}", stream.error().message());
        return 1;
    }

    auto header = geodata::segy::read_file_header(**stream, options);
    if (!header) {
        std::println(stderr, "Failed to read header: {} ({})",
                     header.error().message(), geodata::to_string(header.error().code()));
        return 1;
    }

    std::println("Text header:");
    std::println("============");
    for (const auto& line : header->text_header_lines()) {
        std::println("{}", line);
    }

    std::println("");
    std::println("Binary header:");
    std::println("==============");
    for (const auto& [name, value] : header->binary_header.entries()) {
        std::println("{:<24} {}", name, format_value(value));
    }
    if (const auto format = geodata::segy::to_sample_format(header->data_sample_code())) {
        std::println("{:<24} {}", "sample_format", geodata::segy::sample_format_name(*format));
    }
    if (!header->extended_text.empty()) {
        std::println("{:<24} {}", "extended_text_read", header->extended_text.size());
    }

    if (!summary) {
        return 0;
    }

    auto layout = geodata::segy::make_trace_layout(*header);
    if (!layout) {
        std::println(stderr, "Cannot walk traces: {}", layout.error().message());
        return 1;
    }

    auto charset = geodata::find_charset(options.charset);
    if (!charset) {
        std::println(stderr, "{}", charset.error().message());
        return 1;
    }

    auto cursor = geodata::trace_cursor::create(**stream, std::move(*layout), **charset);
    if (!cursor) {
        std::println(stderr, "Cannot walk traces: {}", cursor.error().message());
        return 1;
    }

    geodata::trace_summary totals;
    for (const auto& trace : *cursor) {
        totals.fold(trace);
        if (totals.count % 10000 == 0) {
            std::println(stderr, "Processed {} traces ({} bytes)...",
                         totals.count, cursor->progress().bytes_consumed);
        }
    }

    std::println("");
    std::println("Traces: {}", totals.count);
    if (totals.has_samples()) {
        std::println("Min: {} Max: {} Diff: {}", totals.min, totals.max, totals.max - totals.min);
    }

    if (cursor->state() == geodata::cursor_state::failed && cursor->last_error()) {
        std::println(stderr, "Trace walk stopped early: {}", cursor->last_error()->message());
        return 2;
    }
    return 0;
}
