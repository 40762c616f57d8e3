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

#include <geodata/trace_cursor.hpp>
#include <geodata/codec.hpp>
#include <geodata/header_decoder.hpp>
#include <algorithm>
#include <format>
#include <limits>

namespace geodata {

namespace {

constexpr std::size_t SAMPLE_CHUNK_SIZE = 64 * 1024;

float decode_sample(const decode_type type, std::span<const std::byte> bytes) {
    switch (type) {
        case decode_type::int16_be:
            return static_cast<float>(detail::read_be16(bytes.first<2>()));
        case decode_type::int32_be:
            return static_cast<float>(detail::read_be32(bytes.first<4>()));
        case decode_type::ibm_float32:
            return detail::ibm32_to_float(detail::load_be32(bytes.first<4>()));
        case decode_type::ieee_float32:
            return detail::ieee32_to_float(detail::load_be32(bytes.first<4>()));
        case decode_type::fixed_string:
            break;
    }
    return 0.0f;
}

} // anonymous namespace

std::optional<float> seismic_trace::min() const noexcept {
    if (samples.empty()) return std::nullopt;
    return *std::ranges::min_element(samples);
}

std::optional<float> seismic_trace::max() const noexcept {
    if (samples.empty()) return std::nullopt;
    return *std::ranges::max_element(samples);
}

std::optional<float> seismic_trace::range() const noexcept {
    const auto lo = min();
    const auto hi = max();
    if (!lo || !hi) return std::nullopt;
    return *hi - *lo;
}

trace_cursor::trace_cursor(input_stream& stream, trace_layout layout, const charset& text_charset,
                           const std::size_t sample_width)
    : stream_(&stream)
    , layout_(std::move(layout))
    , charset_(&text_charset)
    , sample_width_(sample_width)
    , header_buffer_(layout_.header_size) {}

auto trace_cursor::create(input_stream &stream, trace_layout layout,
                          const charset &text_charset) -> std::expected<trace_cursor, error> {
    if (layout.schema == nullptr) {
        return std::unexpected(error{error_code::invalid_operation, "Trace layout has no schema"});
    }

    if (layout.header_size < layout.schema->required_size()) {
        return std::unexpected(error{error_code::schema_error,
            std::format("Trace header of {} bytes cannot hold schema '{}' ({} bytes)",
                        layout.header_size, layout.schema->name(), layout.schema->required_size())});
    }

    const auto* count_field = layout.schema->find(layout.sample_count_field);
    if (count_field == nullptr) {
        return std::unexpected(error{error_code::schema_error,
            std::format("Schema '{}' has no sample count field '{}'",
                        layout.schema->name(), layout.sample_count_field)});
    }

    if (count_field->type != decode_type::int16_be && count_field->type != decode_type::int32_be) {
        return std::unexpected(error{error_code::schema_error,
            std::format("Sample count field '{}' must be an integer", layout.sample_count_field)});
    }

    const auto width = type_width(layout.sample_type);
    if (!width) {
        return std::unexpected(error{error_code::schema_error, "Trace samples must have a numeric type"});
    }

    return trace_cursor{stream, std::move(layout), text_charset, *width};
}

std::unexpected<error> trace_cursor::fail(error err) {
    state_ = cursor_state::failed;
    last_error_ = err;
    return std::unexpected(std::move(err));
}

auto trace_cursor::sample_count(const decoded_header &header) const -> std::expected<std::size_t, error> {
    const auto* count_field = layout_.schema->find(layout_.sample_count_field);
    auto count = header.integer(layout_.sample_count_field).value_or(0);

    // Two-byte sample counts are unsigned on disk
    if (count < 0 && count_field->type == decode_type::int16_be) {
        count += 0x10000;
    }
    if (count < 0) {
        return std::unexpected(error{error_code::unsupported_format,
            std::format("Trace {} declares a negative sample count ({})", progress_.traces_read + 1, count)});
    }

    if (count == 0) {
        return layout_.default_sample_count;
    }
    return static_cast<std::size_t>(count);
}

auto trace_cursor::next() -> std::expected<std::optional<seismic_trace>, error> {
    if (state_ == cursor_state::exhausted || state_ == cursor_state::failed) {
        return std::nullopt;
    }

    const std::size_t trace_number = progress_.traces_read + 1;

    // Sub-header
    auto header_read = read_fully(*stream_, header_buffer_);
    if (!header_read) {
        return fail(header_read.error());
    }
    progress_.bytes_consumed += *header_read;

    if (*header_read == 0) {
        state_ = cursor_state::exhausted;
        return std::nullopt;
    }

    if (*header_read != header_buffer_.size()) {
        return fail(error{error_code::truncated_trace,
            std::format("Trace {} header cut short: {} of {} bytes",
                        trace_number, *header_read, header_buffer_.size())});
    }

    auto header = decode_header(*layout_.schema, header_buffer_, *charset_);
    if (!header) {
        return fail(header.error());
    }

    auto count = sample_count(*header);
    if (!count) {
        return fail(count.error());
    }

    if (*count > std::numeric_limits<std::size_t>::max() / sample_width_) {
        return fail(error{error_code::unsupported_format,
            std::format("Trace {} sample count {} is too large", trace_number, *count)});
    }

    const std::size_t block_size = *count * sample_width_;
    if (const auto left = remaining_bytes(*stream_); left && *left < block_size) {
        return fail(error{error_code::truncated_trace,
            std::format("Trace {} declares {} sample bytes but only {} remain",
                        trace_number, block_size, *left)});
    }

    seismic_trace trace;
    trace.header = std::move(*header);

    // Sample block, decoded one bounded chunk at a time. Memory grows with the
    // bytes that arrive, never with the declared count alone.
    const std::size_t chunk_size = (SAMPLE_CHUNK_SIZE / sample_width_) * sample_width_;
    std::size_t block_read = 0;
    while (block_read < block_size) {
        sample_buffer_.resize(std::min(block_size - block_read, chunk_size));
        auto chunk_read = read_fully(*stream_, sample_buffer_);
        if (!chunk_read) {
            return fail(chunk_read.error());
        }
        progress_.bytes_consumed += *chunk_read;
        block_read += *chunk_read;

        if (*chunk_read != sample_buffer_.size()) {
            return fail(error{error_code::truncated_trace,
                std::format("Trace {} samples cut short: {} of {} bytes",
                            trace_number, block_read, block_size)});
        }

        const std::span<const std::byte> chunk{sample_buffer_};
        for (std::size_t offset = 0; offset < chunk.size(); offset += sample_width_) {
            trace.samples.push_back(decode_sample(layout_.sample_type, chunk.subspan(offset, sample_width_)));
        }
    }

    state_ = cursor_state::active;
    ++progress_.traces_read;
    return trace;
}

} // namespace geodata
