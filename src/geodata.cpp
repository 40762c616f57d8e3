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

#include <geodata/geodata.hpp>

namespace geodata {

auto extract_segy_file(const std::filesystem::path &path,
                       const segy::extraction_options &options) -> std::expected<extracted_record, error> {
    auto stream = open_file(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    return segy::extract(**stream, options);
}

auto extract_las_file(const std::filesystem::path &path,
                      const las::extraction_options &options) -> std::expected<extracted_record, error> {
    auto stream = open_file(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    return las::extract(**stream, options);
}

} // namespace geodata
