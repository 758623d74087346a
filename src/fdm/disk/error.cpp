// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/disk/error.hpp>
#include <cerrno>

namespace fdm::disk {

std::error_code from_errno(int err, DiskErrc fallback) noexcept {
    switch (err) {
        case ENOSPC:
#ifdef EDQUOT
        case EDQUOT:
#endif
            return make_error_code(DiskErrc::disk_full);
        case EACCES:
        case EPERM:
        case EROFS:
            return make_error_code(DiskErrc::access_denied);
        case ENOENT:
            return make_error_code(DiskErrc::file_not_found);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
            return make_error_code(DiskErrc::invalid_path);
        case EBADF:
            return make_error_code(DiskErrc::handle_invalid);
        default:
            return make_error_code(fallback);
    }
}

} // namespace fdm::disk
