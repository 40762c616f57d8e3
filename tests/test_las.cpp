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
#include <geodata/geodata.hpp>
#include "test_support.hpp"

using namespace geodata;

namespace {

constexpr std::string_view sample_las =
    "~VERSION INFORMATION\n"
    " VERS.                  2.0 :   CWLS LOG ASCII STANDARD - VERSION 2.0\n"
    " WRAP.                  NO  :   ONE LINE PER DEPTH STEP\n"
    "~WELL INFORMATION\n"
    " STRT.M              1670.0 :\n"
    " STOP.M              1660.0 :\n"
    " WELL.       ANY ET AL 12-34 :   WELL\n"
    "~CURVE INFORMATION\n"
    " DEPT.M                     :   DEPTH\n"
    " GR  .GAPI                  :   GAMMA RAY\n"
    "~A\n"
    " 1670.000   123.450\n";

} // anonymous namespace

TEST_CASE("LAS content is the whole file", "[las]") {
    test::mock_stream stream{test::to_bytes(sample_las), 17};

    auto record = las::extract(stream);
    REQUIRE(record.has_value());
    CHECK(record->mime_override == "text/las");
    CHECK(record->dcmi_type == "Dataset");
    CHECK(record->content == sample_las);
    CHECK(stream.at_end());

    const auto properties = record->to_properties();
    CHECK(properties.at("stream_content_type") == "text/las");
    CHECK(properties.at("type") == "Dataset");
}

TEST_CASE("LAS bytes outside US-ASCII", "[las]") {
    auto data = test::to_bytes(" COMP. SOCIÉTÉ");
    data.push_back(std::byte{0xB0});

    SECTION("Default charset replaces them") {
        test::mock_stream stream{data};
        auto record = las::extract(stream);
        REQUIRE(record.has_value());
        CHECK(record->content.starts_with(" COMP. SOCI�"));
        CHECK(record->content.ends_with("�"));
    }

    SECTION("Latin-1 keeps them") {
        test::mock_stream stream{test::to_bytes("T=25\xB0")};
        las::extraction_options options;
        options.charset = "ISO-8859-1";
        auto record = las::extract(stream, options);
        REQUIRE(record.has_value());
        CHECK(record->content == "T=25°");
    }
}

TEST_CASE("Empty LAS file", "[las]") {
    test::mock_stream stream{std::vector<std::byte>{}};
    auto record = las::extract(stream);
    REQUIRE(record.has_value());
    CHECK(record->content.empty());
}

TEST_CASE("LAS errors", "[las]") {
    SECTION("Unknown charset") {
        test::mock_stream stream{test::to_bytes(sample_las)};
        las::extraction_options options;
        options.charset = "UTF-7";
        auto record = las::extract(stream, options);
        REQUIRE_FALSE(record.has_value());
        CHECK(record.error().code() == error_code::charset_unavailable);
        CHECK(stream.position() == 0);
    }

    SECTION("Read failure") {
        test::failing_stream stream;
        auto record = las::extract(stream);
        REQUIRE_FALSE(record.has_value());
        CHECK(record.error().code() == error_code::io_error);
    }
}

TEST_CASE("Extract a LAS file from disk", "[las][integration]") {
    test::TempFile temp_file{".las"};
    temp_file.write(std::string{sample_las});

    auto record = extract_las_file(temp_file.path());
    REQUIRE(record.has_value());
    CHECK(record->content == sample_las);
}
