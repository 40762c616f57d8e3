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
#include <cstdint>
#include <expected>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace geodata {

// One recording unit: a decoded sub-header followed by its samples
struct seismic_trace {
    decoded_header header;
    std::vector<float> samples;

    [[nodiscard]] std::optional<float> min() const noexcept;
    [[nodiscard]] std::optional<float> max() const noexcept;

    // max - min, or nothing for a trace without samples
    [[nodiscard]] std::optional<float> range() const noexcept;
};

// How one trace record is sized and decoded
struct trace_layout {
    const format_schema* schema = nullptr;
    std::size_t header_size = 0;
    std::string sample_count_field;
    decode_type sample_type = decode_type::ibm_float32;
    // Used when the sub-header declares zero samples
    std::size_t default_sample_count = 0;
};

enum class cursor_state {
    ready,
    active,
    exhausted,
    failed
};

struct cursor_progress {
    std::uint64_t bytes_consumed = 0;
    std::size_t traces_read = 0;
};

// Forward-only reader over the trace region of a stream. The stream is
// borrowed and must outlive the cursor; a new walk needs a new cursor.
class trace_cursor {
private:
    input_stream* stream_;
    trace_layout layout_;
    const charset* charset_;
    std::size_t sample_width_;
    cursor_state state_ = cursor_state::ready;
    cursor_progress progress_;
    std::optional<error> last_error_;
    std::vector<std::byte> header_buffer_;
    std::vector<std::byte> sample_buffer_;

    trace_cursor(input_stream& stream, trace_layout layout, const charset& text_charset, std::size_t sample_width);

    // Move to failed and hand the error back to the caller
    [[nodiscard]] std::unexpected<error> fail(error err);

    [[nodiscard]] std::expected<std::size_t, error> sample_count(const decoded_header& header) const;

public:
    // Checks the layout against its schema before any byte is read
    [[nodiscard]] static std::expected<trace_cursor, error>
    create(input_stream& stream, trace_layout layout, const charset& text_charset);

    // Next trace, nullopt at a clean end of stream. A record cut short
    // yields truncated_trace once; traces returned earlier stay valid.
    [[nodiscard]] std::expected<std::optional<seismic_trace>, error> next();

    [[nodiscard]] cursor_state state() const noexcept { return state_; }
    [[nodiscard]] const cursor_progress& progress() const noexcept { return progress_; }
    [[nodiscard]] const std::optional<error>& last_error() const noexcept { return last_error_; }
    [[nodiscard]] const trace_layout& layout() const noexcept { return layout_; }

    // Iterator support
    class iterator {
    private:
        trace_cursor* cursor_ = nullptr;
        std::optional<seismic_trace> current_;
        bool error_occurred_ = false;

    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = seismic_trace;
        using difference_type = std::ptrdiff_t;
        using pointer = const seismic_trace*;
        using reference = const seismic_trace&;

        iterator() = default;
        explicit iterator(trace_cursor* cursor) : cursor_(cursor) {
            ++(*this);  // Load the first trace
        }

        [[nodiscard]] const seismic_trace& operator*() const { return *current_; }
        [[nodiscard]] const seismic_trace* operator->() const { return &*current_; }

        iterator& operator++() {
            if (cursor_ && !error_occurred_) {
                if (auto result = cursor_->next(); result && *result) {
                    current_ = std::move(**result);
                } else {
                    if (!result) {
                        error_occurred_ = true;
                    }
                    cursor_ = nullptr;
                    current_.reset();
                }
            }
            return *this;
        }

        iterator operator++(int) {
            auto tmp = *this;
            ++(*this);
            return tmp;
        }

        [[nodiscard]] bool operator==(const iterator& other) const {
            return cursor_ == other.cursor_;
        }

        [[nodiscard]] bool has_error() const noexcept { return error_occurred_; }
    };

    [[nodiscard]] iterator begin() { return iterator{this}; }
    [[nodiscard]] iterator end() const { return {}; }
};

[[nodiscard]] constexpr std::string_view to_string(const cursor_state state) noexcept {
    switch (state) {
        case cursor_state::ready: return "ready";
        case cursor_state::active: return "active";
        case cursor_state::exhausted: return "exhausted";
        case cursor_state::failed: return "failed";
    }
    return "unknown";
}

} // namespace geodata
