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

#include <cstddef>

namespace geodata {

// Half-open byte range [start, end) inside a fixed-size header block
struct field_range {
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] constexpr std::size_t length() const noexcept {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] constexpr bool valid() const noexcept { return start < end; }

    [[nodiscard]] constexpr bool operator==(const field_range&) const = default;
};

} // namespace geodata
