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
#include <geodata/extraction.hpp>
#include <geodata/stream.hpp>
#include <expected>
#include <string>
#include <string_view>

// CWLS Log ASCII Standard well-log files
namespace geodata::las {

constexpr std::string_view MIME_TYPE = "text/las";
constexpr std::string_view DCMI_TYPE = "Dataset";
constexpr std::string_view DEFAULT_CHARSET = "US-ASCII";

struct extraction_options {
    std::string charset{DEFAULT_CHARSET};
};

// The whole file, decoded as text, becomes the record content
[[nodiscard]] std::expected<extracted_record, error>
extract(input_stream& stream, const extraction_options& options = {});

} // namespace geodata::las
