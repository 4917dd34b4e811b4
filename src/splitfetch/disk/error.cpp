// Copyright (c) 2026 changcheng967. All rights reserved.

#include <splitfetch/disk/error.hpp>
#include <cerrno>

namespace splitfetch::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:        return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:        return make_error_code(DiskErrc::invalid_path);
        default:            return make_error_code(fallback);
    }
}

} // namespace splitfetch::disk
