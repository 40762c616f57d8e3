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

#include <geodata/extraction.hpp>
#include <geodata/charset.hpp>
#include <geodata/header_decoder.hpp>
#include <algorithm>
#include <cmath>

namespace geodata {

void trace_summary::fold(const seismic_trace &trace) noexcept {
    ++count;
    for (const float sample : trace.samples) {
        if (std::isnan(sample)) {
            continue;
        }
        if (!has_samples_) {
            min = sample;
            max = sample;
            has_samples_ = true;
            continue;
        }
        min = std::min(min, sample);
        max = std::max(max, sample);
    }
}

std::map<std::string, std::string> extracted_record::to_properties() const {
    return {
        {"stream_content_type", mime_override},
        {"format", mime_override},
        {"type", dcmi_type},
        {"content", content},
    };
}

auto extract_header_only(input_stream &stream, const format_schema &schema, std::string_view charset_name,
                         const std::optional<std::size_t> block_size) -> std::expected<decoded_header, error> {
    const auto text_charset = find_charset(charset_name);
    if (!text_charset) {
        return std::unexpected(text_charset.error());
    }

    return read_header(stream, schema, **text_charset, block_size.value_or(schema.required_size()));
}

auto summarize_traces(trace_cursor &cursor, std::optional<error> &incomplete,
                      const std::optional<std::size_t> limit) -> std::expected<trace_summary, error> {
    trace_summary summary;

    while (!limit || summary.count < *limit) {
        auto trace = cursor.next();
        if (!trace) {
            // A cut-short or malformed record ends the walk; earlier traces stand
            const auto code = trace.error().code();
            if (code == error_code::truncated_trace || code == error_code::unsupported_format) {
                incomplete = trace.error();
                break;
            }
            return std::unexpected(trace.error());
        }
        if (!*trace) {
            break;
        }
        summary.fold(**trace);
    }

    return summary;
}

auto extract_with_trace_summary(input_stream &stream, const format_schema &header_schema, trace_layout layout,
                                std::string_view charset_name,
                                const std::optional<std::size_t> header_block_size)
    -> std::expected<trace_extraction, error> {
    const auto text_charset = find_charset(charset_name);
    if (!text_charset) {
        return std::unexpected(text_charset.error());
    }

    auto header = read_header(stream, header_schema, **text_charset,
                              header_block_size.value_or(header_schema.required_size()));
    if (!header) {
        return std::unexpected(header.error());
    }

    auto cursor = trace_cursor::create(stream, std::move(layout), **text_charset);
    if (!cursor) {
        return std::unexpected(cursor.error());
    }

    trace_extraction result;
    result.header = std::move(*header);

    auto summary = summarize_traces(*cursor, result.incomplete);
    if (!summary) {
        return std::unexpected(summary.error());
    }
    result.summary = *summary;

    return result;
}

} // namespace geodata
