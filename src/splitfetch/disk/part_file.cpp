// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/disk/part_file.hpp>
#include <cerrno>
#include <filesystem>

namespace splitfetch::disk {

namespace fs = std::filesystem;

std::string part_path(std::string_view destination, std::uint32_t index) {
    std::string path(destination);
    path += ".part";
    path += std::to_string(index);
    return path;
}

std::error_code remove_part(const std::string& path) noexcept {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return from_errno(ec.value(), DiskErrc::write_error);
    }
    return {};
}

//=============================================================================
// PartFile
//=============================================================================

std::error_code PartFile::open(const std::string& path, std::uint64_t offset) noexcept {
    file_.reset();
    path_ = path;

    if (offset > 0) {
        // Drop bytes written after the last persisted offset
        std::error_code ec;
        auto current = fs::file_size(path, ec);
        if (ec) {
            return from_errno(ec.value(), DiskErrc::file_not_found);
        }
        if (current < offset) {
            return make_error_code(DiskErrc::size_mismatch);
        }
        if (current > offset) {
            fs::resize_file(path, offset, ec);
            if (ec) {
                return from_errno(ec.value(), DiskErrc::write_error);
            }
        }
    }

    errno = 0;
    file_.reset(std::fopen(path.c_str(), offset > 0 ? "ab" : "wb"));
    if (!file_) {
        return from_errno(errno, DiskErrc::invalid_path);
    }
    return {};
}

std::error_code PartFile::write(std::span<const std::byte> data) noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (data.empty()) {
        return {};
    }

    errno = 0;
    auto written = std::fwrite(data.data(), 1, data.size(), file_.get());
    if (written != data.size()) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code PartFile::flush() noexcept {
    if (!file_) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    errno = 0;
    if (std::fflush(file_.get()) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code PartFile::close() noexcept {
    if (!file_) {
        return {};
    }

    auto flush_ec = flush();
    errno = 0;
    int rc = std::fclose(file_.release());
    if (flush_ec) {
        return flush_ec;
    }
    if (rc != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

} // namespace splitfetch::disk
