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

#include <geodata/las.hpp>
#include <geodata/text_reader.hpp>

namespace geodata::las {

auto extract(input_stream &stream, const extraction_options &options) -> std::expected<extracted_record, error> {
    auto text = read_text(stream, options.charset);
    if (!text) {
        return std::unexpected(text.error());
    }

    extracted_record record;
    record.mime_override = std::string{MIME_TYPE};
    record.dcmi_type = std::string{DCMI_TYPE};
    record.content = std::move(*text);
    return record;
}

} // namespace geodata::las
