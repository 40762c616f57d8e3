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
#include <geodata/stream.hpp>
#include <geodata/charset.hpp>
#include <geodata/format_schema.hpp>
#include <geodata/header_decoder.hpp>
#include <geodata/text_reader.hpp>
#include <geodata/trace_cursor.hpp>
#include <geodata/extraction.hpp>
#include <geodata/segy.hpp>
#include <geodata/las.hpp>

namespace geodata {

// Main convenience API
[[nodiscard]] std::expected<extracted_record, error>
extract_segy_file(const std::filesystem::path& path, const segy::extraction_options& options = {});

[[nodiscard]] std::expected<extracted_record, error>
extract_las_file(const std::filesystem::path& path, const las::extraction_options& options = {});

} // namespace geodata
