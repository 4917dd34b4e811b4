// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <splitfetch/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace splitfetch::disk {

constexpr std::size_t COPY_BUFFER_SIZE = 256 * 1024; // 256 KB

// One completed segment's part file
struct AssemblyPart {
    std::uint32_t index{0};
    std::string path;
};

class Assembler {
public:
    // Concatenate parts into `destination` in index order, verify the
    // result against `expected_size` (or the sum of the part sizes when
    // unknown), then delete every part file. On failure the destination
    // is removed before the parts are. Part files are always deleted.
    [[nodiscard]] static std::error_code assemble(std::vector<AssemblyPart> parts,
                                                  const std::string& destination,
                                                  std::optional<std::uint64_t> expected_size) noexcept;

    // Create any missing parent directories of `destination`
    [[nodiscard]] static std::error_code prepare(const std::string& destination) noexcept;

    // Delete part files, logging failures
    static void purge(const std::vector<AssemblyPart>& parts) noexcept;

private:
    [[nodiscard]] static std::error_code write_destination(const std::vector<AssemblyPart>& parts,
                                                           const std::string& destination,
                                                           std::uint64_t& written,
                                                           bool& opened) noexcept;
};

} // namespace splitfetch::disk
