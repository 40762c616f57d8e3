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
#include <geodata/decoded_header.hpp>
#include <geodata/extraction.hpp>
#include <geodata/format_schema.hpp>
#include <geodata/stream.hpp>
#include <geodata/trace_cursor.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geodata::segy {

constexpr std::size_t TEXT_HEADER_SIZE = 3200;
constexpr std::size_t TEXT_HEADER_LINE_WIDTH = 80;
constexpr std::size_t BINARY_HEADER_SIZE = 400;
constexpr std::size_t TRACE_HEADER_SIZE = 240;

constexpr std::string_view MIME_TYPE = "application/segy";
constexpr std::string_view DCMI_TYPE = "Dataset";
constexpr std::string_view DEFAULT_CHARSET = "IBM1047";

// Binary header field names
namespace field {
constexpr std::string_view line_number = "line_number";
constexpr std::string_view sample_interval = "sample_interval";
constexpr std::string_view samples_per_trace = "samples_per_trace";
constexpr std::string_view data_sample_code = "data_sample_code";
constexpr std::string_view revision = "revision";
constexpr std::string_view fixed_length_flag = "fixed_length_flag";
constexpr std::string_view extended_text_headers = "extended_text_headers";

// Trace header field names
constexpr std::string_view ensemble_number = "ensemble_number";
constexpr std::string_view source_x = "source_x";
constexpr std::string_view source_y = "source_y";
constexpr std::string_view number_of_samples = "number_of_samples";
constexpr std::string_view cdp_x = "cdp_x";
constexpr std::string_view cdp_y = "cdp_y";
} // namespace field

// Prebuilt layouts, one per revision. Offsets are relative to the block.
[[nodiscard]] const format_schema& binary_header_rev0();
[[nodiscard]] const format_schema& binary_header_rev1();
[[nodiscard]] const format_schema& trace_header_rev1();

// Data sample format code, binary header bytes 3225-3226
enum class sample_format : std::int16_t {
    ibm_float_4_bytes = 1,
    integer_4_bytes = 2,
    integer_2_bytes = 3,
    fixed_point_with_gain_4_bytes = 4,
    ieee_float_4_bytes = 5,
    not_in_use_1 = 6,
    not_in_use_2 = 7,
    integer_1_byte = 8
};

[[nodiscard]] std::optional<sample_format> to_sample_format(std::int64_t code) noexcept;

// Upper-case name used in extracted content, e.g. "IBM_FLOAT_4_BYTES"
[[nodiscard]] std::string_view sample_format_name(sample_format format) noexcept;

// Decode type for samples; unsupported codes give unsupported_format
[[nodiscard]] std::expected<decode_type, error> sample_decode_type(std::int64_t code);

struct extraction_options {
    std::string charset{DEFAULT_CHARSET};
    // Layout of the 400-byte binary header; rev 0 files ignore bytes 300-305
    const format_schema* binary_schema = &binary_header_rev1();
    bool include_trace_summary = false;
    // Decode and keep extended text headers; otherwise they are skipped
    bool read_extended_text_headers = true;
    std::optional<std::size_t> max_traces;
};

struct file_header {
    std::string text_header;
    decoded_header binary_header;
    std::vector<std::string> extended_text;

    [[nodiscard]] std::int64_t data_sample_code() const noexcept;
    [[nodiscard]] std::int64_t samples_per_trace() const noexcept;
    // Binary header count; -1 means a variable number ending in ((SEG: EndText))
    [[nodiscard]] std::int64_t extended_text_header_count() const noexcept;
    [[nodiscard]] std::vector<std::string> text_header_lines() const;
};

// Text header, binary header and, if requested, the extended text headers.
// Leaves the stream at the first trace either way.
[[nodiscard]] std::expected<file_header, error>
read_file_header(input_stream& stream, const extraction_options& options = {});

// Trace layout for the revision 1 trace header and this file's sample code
[[nodiscard]] std::expected<trace_layout, error> make_trace_layout(const file_header& header);

[[nodiscard]] std::expected<extracted_record, error>
extract(input_stream& stream, const extraction_options& options = {});

} // namespace geodata::segy
