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
#include <geodata/format_schema.hpp>
#include <geodata/stream.hpp>
#include <geodata/trace_cursor.hpp>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace geodata {

// Min/max over every sample of every trace folded so far. NaN samples are
// counted with their trace but never reach min or max.
struct trace_summary {
    std::size_t count = 0;
    float min = 0.0f;
    float max = 0.0f;

    void fold(const seismic_trace& trace) noexcept;

    [[nodiscard]] bool empty() const noexcept { return count == 0; }
    // False until a trace with at least one non-NaN sample was folded
    [[nodiscard]] bool has_samples() const noexcept { return has_samples_; }

private:
    bool has_samples_ = false;
};

struct trace_extraction {
    decoded_header header;
    trace_summary summary;
    // Set when the walk stopped on a truncated or malformed record
    std::optional<error> incomplete;
};

// The record handed to the host's metadata container
struct extracted_record {
    std::string mime_override;
    std::string dcmi_type;
    std::string content;

    // stream_content_type, format, type, content
    [[nodiscard]] std::map<std::string, std::string> to_properties() const;
};

// The header block is block_size bytes, or just what the schema covers
[[nodiscard]] std::expected<decoded_header, error>
extract_header_only(input_stream& stream, const format_schema& schema, std::string_view charset_name,
                    std::optional<std::size_t> block_size = std::nullopt);

// Header block, then a streaming fold over the trace region that follows it
[[nodiscard]] std::expected<trace_extraction, error>
extract_with_trace_summary(input_stream& stream, const format_schema& header_schema,
                           trace_layout layout, std::string_view charset_name,
                           std::optional<std::size_t> header_block_size = std::nullopt);

// Fold up to limit traces from cursor. A truncated_trace or unsupported_format
// record stops the walk: it is reported through `incomplete` and the partial
// summary is kept. Any other error fails the call.
[[nodiscard]] std::expected<trace_summary, error>
summarize_traces(trace_cursor& cursor, std::optional<error>& incomplete,
                 std::optional<std::size_t> limit = std::nullopt);

} // namespace geodata
