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

#include <geodata/segy.hpp>
#include <geodata/charset.hpp>
#include <geodata/header_decoder.hpp>
#include <geodata/text_reader.hpp>
#include <cctype>
#include <format>

namespace geodata::segy {

namespace {

constexpr std::string_view END_TEXT_STANZA = "seg:endtext";
constexpr std::size_t MAX_VARIABLE_EXTENDED_HEADERS = 1024;

// True for a header opening with the ((SEG: EndText)) stanza. Names compare
// without blanks and case-insensitively.
bool is_end_text(std::string_view block) {
    if (!block.starts_with("((")) {
        return false;
    }
    const auto close = block.find("))", 2);
    if (close == std::string_view::npos) {
        return false;
    }

    std::string name;
    for (const char c : block.substr(2, close - 2)) {
        if (c != ' ') {
            name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return name == END_TEXT_STANZA;
}

} // anonymous namespace

const format_schema& binary_header_rev0() {
    static const format_schema schema = schema_builder{"segy_binary_header_rev0"}
        .add_field(std::string{field::line_number}, 4, 8, decode_type::int32_be)
        .add_field(std::string{field::sample_interval}, 16, 18, decode_type::int16_be)
        .add_field(std::string{field::samples_per_trace}, 20, 22, decode_type::int16_be)
        .add_field(std::string{field::data_sample_code}, 24, 26, decode_type::int16_be)
        .build()
        .value();
    return schema;
}

const format_schema& binary_header_rev1() {
    static const format_schema schema = schema_builder{"segy_binary_header_rev1"}
        .add_field(std::string{field::line_number}, 4, 8, decode_type::int32_be)
        .add_field(std::string{field::sample_interval}, 16, 18, decode_type::int16_be)
        .add_field(std::string{field::samples_per_trace}, 20, 22, decode_type::int16_be)
        .add_field(std::string{field::data_sample_code}, 24, 26, decode_type::int16_be)
        .add_field(std::string{field::revision}, 300, 302, decode_type::int16_be)
        .add_field(std::string{field::fixed_length_flag}, 302, 304, decode_type::int16_be)
        .add_field(std::string{field::extended_text_headers}, 304, 306, decode_type::int16_be)
        .build()
        .value();
    return schema;
}

const format_schema& trace_header_rev1() {
    static const format_schema schema = schema_builder{"segy_trace_header_rev1"}
        .add_field(std::string{field::ensemble_number}, 20, 24, decode_type::int32_be)
        .add_field(std::string{field::source_x}, 72, 76, decode_type::int32_be)
        .add_field(std::string{field::source_y}, 76, 80, decode_type::int32_be)
        .add_field(std::string{field::number_of_samples}, 114, 116, decode_type::int16_be)
        .add_field(std::string{field::cdp_x}, 180, 184, decode_type::int32_be)
        .add_field(std::string{field::cdp_y}, 184, 188, decode_type::int32_be)
        .build()
        .value();
    return schema;
}

std::optional<sample_format> to_sample_format(const std::int64_t code) noexcept {
    if (code < 1 || code > 8) {
        return std::nullopt;
    }
    return static_cast<sample_format>(code);
}

std::string_view sample_format_name(const sample_format format) noexcept {
    switch (format) {
        case sample_format::ibm_float_4_bytes: return "IBM_FLOAT_4_BYTES";
        case sample_format::integer_4_bytes: return "INTEGER_4_BYTES";
        case sample_format::integer_2_bytes: return "INTEGER_2_BYTES";
        case sample_format::fixed_point_with_gain_4_bytes: return "FIXED_POINT_WITH_GAIN_4_BYTES";
        case sample_format::ieee_float_4_bytes: return "IEEE_FLOAT_4_BYTES";
        case sample_format::not_in_use_1: return "NOT_IN_USE_1";
        case sample_format::not_in_use_2: return "NOT_IN_USE_2";
        case sample_format::integer_1_byte: return "INTEGER_1_BYTE";
    }
    return "UNKNOWN";
}

auto sample_decode_type(const std::int64_t code) -> std::expected<decode_type, error> {
    switch (to_sample_format(code).value_or(sample_format::not_in_use_1)) {
        case sample_format::ibm_float_4_bytes: return decode_type::ibm_float32;
        case sample_format::integer_4_bytes: return decode_type::int32_be;
        case sample_format::integer_2_bytes: return decode_type::int16_be;
        case sample_format::ieee_float_4_bytes: return decode_type::ieee_float32;
        default:
            return std::unexpected(error{error_code::unsupported_format,
                std::format("Data sample code {} is not supported for trace decoding", code)});
    }
}

std::int64_t file_header::data_sample_code() const noexcept {
    return binary_header.integer(field::data_sample_code).value_or(0);
}

std::int64_t file_header::samples_per_trace() const noexcept {
    const auto count = binary_header.integer(field::samples_per_trace).value_or(0);
    // Stored as an unsigned two-byte count
    return count < 0 ? count + 0x10000 : count;
}

std::int64_t file_header::extended_text_header_count() const noexcept {
    return binary_header.integer(field::extended_text_headers).value_or(0);
}

std::vector<std::string> file_header::text_header_lines() const {
    return split_card_lines(text_header, TEXT_HEADER_LINE_WIDTH);
}

auto read_file_header(input_stream &stream, const extraction_options &options) -> std::expected<file_header, error> {
    if (options.binary_schema == nullptr) {
        return std::unexpected(error{error_code::invalid_operation, "No binary header schema given"});
    }

    // Resolve the charset before consuming anything
    const auto text_charset = find_charset(options.charset);
    if (!text_charset) {
        return std::unexpected(text_charset.error());
    }

    file_header header;

    auto text = read_text_block(stream, TEXT_HEADER_SIZE, options.charset);
    if (!text) {
        return std::unexpected(text.error());
    }
    header.text_header = std::move(*text);

    auto binary = read_header(stream, *options.binary_schema, **text_charset, BINARY_HEADER_SIZE);
    if (!binary) {
        return std::unexpected(binary.error());
    }
    header.binary_header = std::move(*binary);

    const auto declared = header.extended_text_header_count();
    if (declared > 0 && !options.read_extended_text_headers) {
        const auto bytes = static_cast<std::size_t>(declared) * TEXT_HEADER_SIZE;
        if (const auto left = remaining_bytes(stream); left && *left < bytes) {
            return std::unexpected(error{error_code::truncated_header,
                std::format("{} extended text headers declared but only {} bytes remain", declared, *left)});
        }
        if (auto skipped = stream.skip(bytes); !skipped) {
            return std::unexpected(skipped.error());
        }
        return header;
    }

    if (declared >= 0) {
        for (std::int64_t i = 0; i < declared; ++i) {
            auto extended = read_text_block(stream, TEXT_HEADER_SIZE, options.charset);
            if (!extended) {
                return std::unexpected(extended.error());
            }
            header.extended_text.push_back(std::move(*extended));
        }
        return header;
    }

    // -1: a variable number of headers, the last one a ((SEG: EndText)) stanza.
    // Each one has to be decoded to find the end, kept or not.
    for (std::size_t i = 0; i < MAX_VARIABLE_EXTENDED_HEADERS; ++i) {
        auto extended = read_text_block(stream, TEXT_HEADER_SIZE, options.charset);
        if (!extended) {
            return std::unexpected(extended.error());
        }
        const bool last = is_end_text(*extended);
        if (options.read_extended_text_headers) {
            header.extended_text.push_back(std::move(*extended));
        }
        if (last) {
            return header;
        }
    }

    return std::unexpected(error{error_code::unsupported_format,
        std::format("No ((SEG: EndText)) stanza within {} extended text headers", MAX_VARIABLE_EXTENDED_HEADERS)});
}

auto make_trace_layout(const file_header &header) -> std::expected<trace_layout, error> {
    auto sample_type = sample_decode_type(header.data_sample_code());
    if (!sample_type) {
        return std::unexpected(sample_type.error());
    }

    trace_layout layout;
    layout.schema = &trace_header_rev1();
    layout.header_size = TRACE_HEADER_SIZE;
    layout.sample_count_field = std::string{field::number_of_samples};
    layout.sample_type = *sample_type;
    layout.default_sample_count = static_cast<std::size_t>(header.samples_per_trace());
    return layout;
}

auto extract(input_stream &stream, const extraction_options &options) -> std::expected<extracted_record, error> {
    auto header = read_file_header(stream, options);
    if (!header) {
        return std::unexpected(header.error());
    }

    const auto format = to_sample_format(header->data_sample_code());
    const std::string format_name = format
        ? std::string{sample_format_name(*format)}
        : std::format("UNKNOWN_{}", header->data_sample_code());

    extracted_record record;
    record.mime_override = std::string{MIME_TYPE};
    record.dcmi_type = std::string{DCMI_TYPE};
    record.content = std::format("{} {} ", format_name, header->text_header);

    if (!options.include_trace_summary) {
        return record;
    }

    auto layout = make_trace_layout(*header);
    if (!layout) {
        return std::unexpected(layout.error());
    }

    const auto text_charset = find_charset(options.charset);
    if (!text_charset) {
        return std::unexpected(text_charset.error());
    }

    auto cursor = trace_cursor::create(stream, std::move(*layout), **text_charset);
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    std::optional<error> incomplete;
    auto summary = summarize_traces(*cursor, incomplete, options.max_traces);
    if (!summary) {
        return std::unexpected(summary.error());
    }

    record.content += std::format("Traces: {}", summary->count);
    if (summary->has_samples()) {
        record.content += std::format(" Min: {} Max: {}", summary->min, summary->max);
    }
    if (incomplete) {
        record.content += " (incomplete)";
    }

    return record;
}

} // namespace geodata::segy
