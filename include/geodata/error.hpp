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

#include <expected>
#include <string>
#include <string_view>

namespace geodata {

enum class error_code {
    schema_error,
    charset_unavailable,
    truncated_header,
    truncated_trace,
    unsupported_format,
    io_error,
    invalid_operation
};

[[nodiscard]] constexpr std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::schema_error: return "schema_error";
        case error_code::charset_unavailable: return "charset_unavailable";
        case error_code::truncated_header: return "truncated_header";
        case error_code::truncated_trace: return "truncated_trace";
        case error_code::unsupported_format: return "unsupported_format";
        case error_code::io_error: return "io_error";
        case error_code::invalid_operation: return "invalid_operation";
    }
    return "unknown";
}

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    error_code code_;
    std::string message_;
};

} // namespace geodata
