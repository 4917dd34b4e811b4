// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/disk/assembler.hpp>
#include <splitfetch/disk/part_file.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <memory>

namespace splitfetch::disk {

namespace fs = std::filesystem;

namespace {

struct FileCloser {
    void operator()(std::FILE* f) const noexcept { if (f) std::fclose(f); }
};
using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

} // namespace

std::error_code Assembler::prepare(const std::string& destination) noexcept {
    std::error_code ec;
    fs::path parent = fs::path(destination).parent_path();
    if (parent.empty()) return {};

    fs::create_directories(parent, ec);
    if (ec) {
        spdlog::error("Cannot create directory {}: {}", parent.string(), ec.message());
        return from_errno(ec.value(), DiskErrc::invalid_path);
    }
    return {};
}

std::error_code Assembler::write_destination(const std::vector<AssemblyPart>& parts,
                                             const std::string& destination,
                                             std::uint64_t& written,
                                             bool& opened) noexcept {
    if (auto ec = prepare(destination)) {
        return ec;
    }

    errno = 0;
    FilePtr out(std::fopen(destination.c_str(), "wb"));
    if (!out) {
        return from_errno(errno, DiskErrc::access_denied);
    }
    opened = true;

    std::vector<char> buffer;
    try {
        buffer.resize(COPY_BUFFER_SIZE);
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::write_error);
    }

    for (const auto& part : parts) {
        errno = 0;
        FilePtr in(std::fopen(part.path.c_str(), "rb"));
        if (!in) {
            spdlog::error("Part file {} is missing", part.path);
            return from_errno(errno, DiskErrc::file_not_found);
        }

        while (true) {
            auto n = std::fread(buffer.data(), 1, buffer.size(), in.get());
            if (n > 0) {
                errno = 0;
                if (std::fwrite(buffer.data(), 1, n, out.get()) != n) {
                    return from_errno(errno, DiskErrc::write_error);
                }
                written += n;
            }
            if (n < buffer.size()) {
                if (std::ferror(in.get())) {
                    return make_error_code(DiskErrc::read_error);
                }
                break;
            }
        }
    }

    errno = 0;
    if (std::fflush(out.get()) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    errno = 0;
    if (std::fclose(out.release()) != 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    return {};
}

std::error_code Assembler::assemble(std::vector<AssemblyPart> parts,
                                    const std::string& destination,
                                    std::optional<std::uint64_t> expected_size) noexcept {
    // Byte order is index order, whatever order the parts finished in
    std::sort(parts.begin(), parts.end(),
              [](const AssemblyPart& a, const AssemblyPart& b) { return a.index < b.index; });

    std::uint64_t written = 0;
    bool opened = false;
    auto ec = write_destination(parts, destination, written, opened);

    if (!ec) {
        std::error_code size_ec;
        auto on_disk = fs::file_size(destination, size_ec);
        std::uint64_t expected = expected_size.value_or(written);
        if (size_ec) {
            ec = from_errno(size_ec.value(), DiskErrc::read_error);
        } else if (on_disk != expected || written != expected) {
            spdlog::error("Assembled {} bytes into {}, expected {}", on_disk, destination, expected);
            ec = make_error_code(DiskErrc::size_mismatch);
        }
    }

    if (ec && opened) {
        // Never leave a partial destination behind
        std::error_code rm_ec;
        fs::remove(destination, rm_ec);
        if (rm_ec) {
            spdlog::error("Cannot remove partial output {}: {}", destination, rm_ec.message());
        }
    }

    if (ec) {
        spdlog::error("Assembly of {} failed: {}", destination, ec.message());
    } else {
        spdlog::info("Assembled {} part(s) into {} ({} bytes)", parts.size(), destination, written);
    }

    purge(parts);
    return ec;
}

void Assembler::purge(const std::vector<AssemblyPart>& parts) noexcept {
    for (const auto& part : parts) {
        if (auto ec = remove_part(part.path)) {
            spdlog::warn("Cannot remove part file {}: {}", part.path, ec.message());
        }
    }
}

} // namespace splitfetch::disk
