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

#include <geodata/stream.hpp>
#include <cstdio>
#include <cerrno>
#include <cstring>

#ifdef __linux__
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace geodata {

// limited_stream implementation
auto limited_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t to_read = std::min(buffer.size(), remaining_);
    if (to_read == 0) {
        return 0;
    }

    auto result = inner_.read(buffer.first(to_read));
    if (!result) {
        return std::unexpected(result.error());
    }

    remaining_ -= *result;
    return *result;
}

auto limited_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (bytes > remaining_) {
        return std::unexpected(error{error_code::io_error, "Skip past end of limited stream"});
    }
    if (auto result = inner_.skip(bytes); !result) {
        return std::unexpected(result.error());
    }
    remaining_ -= bytes;
    return {};
}

bool limited_stream::at_end() const {
    return remaining_ == 0 || inner_.at_end();
}

// file_stream implementation
file_stream::file_stream(std::FILE* file, const std::optional<size_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }

    // Try to get file size
    std::optional<size_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<size_t>(pos);
        }
        if (std::fseek(file, 0, SEEK_SET) != 0) {
            std::fclose(file);
            return std::unexpected(error{error_code::io_error,
                "File seek error: " + std::string{std::strerror(errno)}});
        }
    }

    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());

    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error,
            "File read error: " + std::string{std::strerror(errno)}});
    }

    return bytes_read;
}

auto file_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (file_size_.has_value() && position() + bytes > *file_size_) {
        return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
    }
    if (std::fseek(file_.get(), static_cast<long>(bytes), SEEK_CUR) != 0) {
        return std::unexpected(error{error_code::io_error,
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

bool file_stream::at_end() const {
    // If we know the file size, check if position equals size
    if (file_size_.has_value()) {
        if (const long pos = std::ftell(file_.get()); pos >= 0) {
            return static_cast<size_t>(pos) >= file_size_.value();
        }
    }

    // Fall back to checking EOF flag
    return std::feof(file_.get()) != 0;
}

size_t file_stream::position() const {
    const long pos = std::ftell(file_.get());
    return pos >= 0 ? static_cast<size_t>(pos) : 0;
}

auto file_stream::size() const -> std::optional<size_t> {
    return file_size_;
}

#ifdef __linux__
// mmap_stream implementation
mmap_stream::mmap_stream(void* ptr, const size_t size)
    : mapping_{ptr, mapping_deleter{size}}
    , data_{static_cast<const std::byte*>(ptr), size} {}

auto mmap_stream::create(const std::filesystem::path &path) -> std::expected<mmap_stream, error> {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd == -1) {
        return std::unexpected(error{error_code::io_error,
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }

    struct stat st{};
    if (::fstat(fd, &st) == -1) {
        ::close(fd);
        return std::unexpected(error{error_code::io_error,
            "Failed to stat file: " + std::string{std::strerror(errno)}});
    }

    const size_t file_size = static_cast<size_t>(st.st_size);

    void* ptr = nullptr;
    if (file_size > 0) {
        ptr = ::mmap(nullptr, file_size, PROT_READ, MAP_PRIVATE, fd, 0);
        if (ptr == MAP_FAILED) {
            ::close(fd);
            return std::unexpected(error{error_code::io_error,
                "Memory mapping failed: " + std::string{std::strerror(errno)}});
        }

        // Traces are walked front to back exactly once
        ::madvise(ptr, file_size, MADV_SEQUENTIAL);
    }

    ::close(fd);

    return mmap_stream{ptr, file_size};
}

auto mmap_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    const size_t available = data_.size() - position_;
    const size_t to_read = std::min(buffer.size(), available);

    std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                       static_cast<std::ptrdiff_t>(to_read), buffer.begin());
    position_ += to_read;

    return to_read;
}

auto mmap_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (position_ + bytes > data_.size()) {
        return std::unexpected(error{error_code::io_error, "Skip past end of stream"});
    }
    position_ += bytes;
    return {};
}

bool mmap_stream::at_end() const {
    return position_ >= data_.size();
}

size_t mmap_stream::position() const {
    return position_;
}

auto mmap_stream::size() const -> std::optional<size_t> {
    return data_.size();
}
#endif

auto open_file(const std::filesystem::path &path) -> std::expected<std::unique_ptr<random_access_stream>, error> {
#ifdef __linux__
    if (auto mapped = mmap_stream::create(path); mapped) {
        return std::make_unique<mmap_stream>(std::move(*mapped));
    }
#endif
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    return std::make_unique<file_stream>(std::move(*stream));
}

auto remaining_bytes(const input_stream &stream) -> std::optional<size_t> {
    const auto* sized = dynamic_cast<const random_access_stream*>(&stream);
    if (sized == nullptr) {
        return std::nullopt;
    }
    const auto total = sized->size();
    if (!total) {
        return std::nullopt;
    }
    const size_t position = sized->position();
    return position < *total ? *total - position : 0;
}

auto read_fully(input_stream &stream, std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t total = 0;
    while (total < buffer.size()) {
        auto result = stream.read(buffer.subspan(total));
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            break;
        }
        total += *result;
    }
    return total;
}

} // namespace geodata
