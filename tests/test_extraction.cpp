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

#include <catch2/catch_test_macros.hpp>
#include <geodata/extraction.hpp>
#include <geodata/segy.hpp>
#include "test_support.hpp"
#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>

using namespace geodata;

namespace {

// The binary header followed directly by the trace region
std::vector<std::byte> binary_and_traces(const test::segy_builder& builder) {
    const auto file = builder.build();
    return std::vector<std::byte>(file.begin() + static_cast<std::ptrdiff_t>(segy::TEXT_HEADER_SIZE), file.end());
}

trace_layout ibm_layout() {
    trace_layout layout;
    layout.schema = &segy::trace_header_rev1();
    layout.header_size = segy::TRACE_HEADER_SIZE;
    layout.sample_count_field = std::string{segy::field::number_of_samples};
    layout.sample_type = decode_type::ibm_float32;
    return layout;
}

// Eight byte sub-header with a four-byte sample count, IEEE samples
const format_schema& wide_count_schema() {
    static const format_schema schema = schema_builder{"wide_count_trace"}
        .add_field("count", 0, 4, decode_type::int32_be)
        .build()
        .value();
    return schema;
}

trace_layout wide_count_layout() {
    trace_layout layout;
    layout.schema = &wide_count_schema();
    layout.header_size = 8;
    layout.sample_count_field = "count";
    layout.sample_type = decode_type::ieee_float32;
    return layout;
}

void append_wide_trace(std::vector<std::byte>& out, std::uint32_t declared_count, const std::vector<float>& samples) {
    std::vector<std::byte> record(8 + samples.size() * 4);
    test::put_be32(record, 0, declared_count);
    for (size_t i = 0; i < samples.size(); ++i) {
        test::put_be32(record, 8 + i * 4, std::bit_cast<std::uint32_t>(samples[i]));
    }
    out.insert(out.end(), record.begin(), record.end());
}

} // anonymous namespace

TEST_CASE("Trace summary matches a manual fold", "[extraction]") {
    test::segy_builder builder;
    builder.traces = {
        {0.5f, -3.25f, 12.0f},
        {7.0f},
        {-0.125f, 100.0f, 2.0f, 2.0f},
    };

    test::mock_stream stream{binary_and_traces(builder), 64};
    auto result = extract_with_trace_summary(stream, segy::binary_header_rev1(), ibm_layout(), "IBM1047",
                                             segy::BINARY_HEADER_SIZE);
    REQUIRE(result.has_value());

    float expected_min = std::numeric_limits<float>::max();
    float expected_max = std::numeric_limits<float>::lowest();
    for (const auto& samples : builder.traces) {
        expected_min = std::min(expected_min, std::ranges::min(samples));
        expected_max = std::max(expected_max, std::ranges::max(samples));
    }

    CHECK(result->summary.count == 3);
    CHECK(result->summary.has_samples());
    CHECK(result->summary.min == expected_min);
    CHECK(result->summary.max == expected_max);
    CHECK_FALSE(result->incomplete.has_value());
    CHECK(result->header.integer(segy::field::line_number) == 42);
    CHECK(result->header.integer(segy::field::sample_interval) == 4000);
}

TEST_CASE("Truncated trace region gives a partial summary", "[extraction]") {
    test::segy_builder builder;
    builder.traces = {{1.0f, 9.0f}, {-4.0f}, {50.0f, 60.0f}};
    auto data = binary_and_traces(builder);
    data.resize(data.size() - 2);

    test::mock_stream stream{data};
    auto result = extract_with_trace_summary(stream, segy::binary_header_rev1(), ibm_layout(), "IBM1047",
                                             segy::BINARY_HEADER_SIZE);
    REQUIRE(result.has_value());

    CHECK(result->summary.count == 2);
    CHECK(result->summary.min == -4.0f);
    CHECK(result->summary.max == 9.0f);
    REQUIRE(result->incomplete.has_value());
    CHECK(result->incomplete->code() == error_code::truncated_trace);
}

TEST_CASE("Empty trace region", "[extraction]") {
    test::segy_builder builder;

    test::mock_stream stream{binary_and_traces(builder)};
    auto result = extract_with_trace_summary(stream, segy::binary_header_rev1(), ibm_layout(), "IBM1047",
                                             segy::BINARY_HEADER_SIZE);
    REQUIRE(result.has_value());
    CHECK(result->summary.empty());
    CHECK_FALSE(result->summary.has_samples());
    CHECK_FALSE(result->incomplete.has_value());
}

TEST_CASE("Summary fails on non-truncation errors", "[extraction]") {
    test::segy_builder builder;
    builder.traces = {{1.0f}};
    auto data = binary_and_traces(builder);

    auto layout = ibm_layout();
    layout.header_size = 100;  // smaller than the trace schema

    test::mock_stream stream{data};
    auto result = extract_with_trace_summary(stream, segy::binary_header_rev1(), layout, "IBM1047",
                                             segy::BINARY_HEADER_SIZE);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == error_code::schema_error);
}

TEST_CASE("summarize_traces honours a limit", "[extraction]") {
    test::segy_builder builder;
    builder.traces = {{1.0f}, {2.0f}, {3.0f}, {4.0f}};
    const auto file = builder.build();

    memory_stream stream{std::span{file}.subspan(builder.trace_region_offset())};
    auto cursor = trace_cursor::create(stream, ibm_layout(), ibm1047());
    REQUIRE(cursor.has_value());

    std::optional<error> incomplete;
    auto summary = summarize_traces(*cursor, incomplete, 2);
    REQUIRE(summary.has_value());
    CHECK(summary->count == 2);
    CHECK(summary->max == 2.0f);
    CHECK_FALSE(incomplete.has_value());
    CHECK(cursor->state() == cursor_state::active);
}

TEST_CASE("Malformed record keeps the traces before it", "[extraction]") {
    std::vector<std::byte> data;
    append_wide_trace(data, 2, {1.5f, -6.0f});
    append_wide_trace(data, 1, {9.0f});

    SECTION("Negative sample count") {
        append_wide_trace(data, 0xFFFFFFFF, {});

        test::mock_stream stream{data};
        auto cursor = trace_cursor::create(stream, wide_count_layout(), ibm1047());
        REQUIRE(cursor.has_value());

        std::optional<error> incomplete;
        auto summary = summarize_traces(*cursor, incomplete);
        REQUIRE(summary.has_value());
        CHECK(summary->count == 2);
        CHECK(summary->min == -6.0f);
        CHECK(summary->max == 9.0f);
        REQUIRE(incomplete.has_value());
        CHECK(incomplete->code() == error_code::unsupported_format);
    }

    SECTION("Sample count far beyond the data") {
        append_wide_trace(data, 0x7FFFFFFF, {});
        data.insert(data.end(), 3, std::byte{0});

        test::mock_stream stream{data};
        auto cursor = trace_cursor::create(stream, wide_count_layout(), ibm1047());
        REQUIRE(cursor.has_value());

        std::optional<error> incomplete;
        auto summary = summarize_traces(*cursor, incomplete);
        REQUIRE(summary.has_value());
        CHECK(summary->count == 2);
        CHECK(summary->max == 9.0f);
        REQUIRE(incomplete.has_value());
        CHECK(incomplete->code() == error_code::truncated_trace);
    }
}

TEST_CASE("Read errors still fail the summary", "[extraction]") {
    test::failing_stream stream;
    auto cursor = trace_cursor::create(stream, wide_count_layout(), ibm1047());
    REQUIRE(cursor.has_value());

    std::optional<error> incomplete;
    auto summary = summarize_traces(*cursor, incomplete);
    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == error_code::io_error);
    CHECK_FALSE(incomplete.has_value());
}

TEST_CASE("Header only extraction", "[extraction]") {
    test::segy_builder builder;
    builder.traces = {{1.0f}};

    test::mock_stream stream{binary_and_traces(builder)};
    auto header = extract_header_only(stream, segy::binary_header_rev1(), "IBM1047");
    REQUIRE(header.has_value());
    CHECK(header->integer(segy::field::data_sample_code) == 1);
    CHECK(header->integer(segy::field::revision) == 0x0100);
    // Only the bytes the schema covers are consumed
    CHECK(stream.position() == segy::binary_header_rev1().required_size());

    SECTION("Unknown charset") {
        test::mock_stream other{binary_and_traces(builder)};
        auto failed = extract_header_only(other, segy::binary_header_rev1(), "NOPE");
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code() == error_code::charset_unavailable);
        CHECK(other.position() == 0);
    }
}

TEST_CASE("Summary folds traces with and without samples", "[extraction]") {
    trace_summary summary;
    seismic_trace empty;
    seismic_trace full;
    full.samples = {-1.0f, 3.0f};

    summary.fold(empty);
    CHECK(summary.count == 1);
    CHECK_FALSE(summary.has_samples());

    summary.fold(full);
    CHECK(summary.count == 2);
    CHECK(summary.has_samples());
    CHECK(summary.min == -1.0f);
    CHECK(summary.max == 3.0f);
}

TEST_CASE("NaN samples do not reach min or max", "[extraction]") {
    const float nan = std::numeric_limits<float>::quiet_NaN();

    trace_summary summary;
    seismic_trace only_nan;
    only_nan.samples = {nan, nan};
    summary.fold(only_nan);
    CHECK(summary.count == 1);
    CHECK_FALSE(summary.has_samples());

    seismic_trace leading_nan;
    leading_nan.samples = {nan, 2.0f, -1.0f};
    seismic_trace trailing_nan;
    trailing_nan.samples = {3.0f, nan};
    summary.fold(leading_nan);
    summary.fold(trailing_nan);

    CHECK(summary.count == 3);
    REQUIRE(summary.has_samples());
    CHECK(summary.min == -1.0f);
    CHECK(summary.max == 3.0f);
    CHECK_FALSE(std::isnan(summary.min));
}

TEST_CASE("Record properties", "[extraction]") {
    extracted_record record{"application/segy", "Dataset", "IBM_FLOAT_4_BYTES C 1 "};
    const auto properties = record.to_properties();

    REQUIRE(properties.size() == 4);
    CHECK(properties.at("stream_content_type") == "application/segy");
    CHECK(properties.at("format") == "application/segy");
    CHECK(properties.at("type") == "Dataset");
    CHECK(properties.at("content") == "IBM_FLOAT_4_BYTES C 1 ");
}
