// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace splitfetch::disk {

// "<destination>.part<index>"
[[nodiscard]] std::string part_path(std::string_view destination, std::uint32_t index);

// Remove a part file; a file that is already gone is not an error
[[nodiscard]] std::error_code remove_part(const std::string& path) noexcept;

// Sequential writer for one segment's temporary storage
class PartFile {
public:
    PartFile() = default;

    PartFile(const PartFile&) = delete;
    PartFile& operator=(const PartFile&) = delete;
    PartFile(PartFile&&) noexcept = default;
    PartFile& operator=(PartFile&&) noexcept = default;

    // Open for appending after the first `offset` bytes; anything past
    // `offset` is discarded. offset == 0 truncates.
    [[nodiscard]] std::error_code open(const std::string& path, std::uint64_t offset) noexcept;

    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    // Flush and close; reports buffered write failures
    [[nodiscard]] std::error_code close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    struct FileCloser {
        void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
    };

    std::unique_ptr<std::FILE, FileCloser> file_;
    std::string path_;
};

} // namespace splitfetch::disk
