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

/**
 * las_dump - Extracts a LAS well-log file into the record a metadata
 * container would receive and prints its properties.
 *
 * Usage: ./las_dump <las_file>
 */

#include <geodata/geodata.hpp>
#include <print>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::println(stderr, "Usage: {} <las_file>", argv[0]);
        return 1;
    }

    auto record = geodata::extract_las_file(argv[1]);
    if (!record) {
        std::println(stderr, "Failed to extract: {}", record.error().message());
        return 1;
    }

    for (const auto& [key, value] : record->to_properties()) {
        if (key == "content") {
            std::println("{}: {} bytes", key, value.size());
        } else {
            std::println("{}: {}", key, value);
        }
    }
    std::println("");
    std::println("{}", record->content);
    return 0;
}
