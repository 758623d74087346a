// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/disk/file_writer.hpp>
#include <cerrno>
#include <new>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace fdm::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , size_(std::exchange(other.size_, 0))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        size_ = std::exchange(other.size_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& path, std::uint64_t keep_bytes) noexcept {
    close();

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno, DiskErrc::write_error);
    }

    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        return from_errno(err, DiskErrc::read_error);
    }

    // A store shorter than the persisted count has lost data
    if (static_cast<std::uint64_t>(st.st_size) < keep_bytes) {
        ::close(fd);
        return make_error_code(DiskErrc::read_error);
    }

    if (::ftruncate(fd, static_cast<off_t>(keep_bytes)) != 0 ||
        ::lseek(fd, static_cast<off_t>(keep_bytes), SEEK_SET) < 0) {
        int err = errno;
        ::close(fd);
        return from_errno(err, DiskErrc::write_error);
    }

    fd_ = fd;
    size_ = keep_bytes;
    try {
        path_ = path;
    } catch (const std::bad_alloc&) {
        close();
        return make_error_code(DiskErrc::write_error);
    }
    return {};
}

std::error_code FileWriter::write(std::span<const std::byte> data) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const std::byte* ptr = data.data();
    std::size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_, ptr, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            // Drop whatever part of this chunk made it to the file
            (void)::ftruncate(fd_, static_cast<off_t>(size_));
            (void)::lseek(fd_, static_cast<off_t>(size_), SEEK_SET);
            return from_errno(err, DiskErrc::write_error);
        }
        ptr += n;
        left -= static_cast<std::size_t>(n);
    }

    size_ += data.size();
    return {};
}

std::error_code FileWriter::truncate(std::uint64_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::ftruncate(fd_, static_cast<off_t>(size)) != 0 ||
        ::lseek(fd_, static_cast<off_t>(size), SEEK_SET) < 0) {
        return from_errno(errno, DiskErrc::write_error);
    }
    size_ = size;
    return {};
}

std::error_code FileWriter::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return from_errno(errno, DiskErrc::sync_error);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace fdm::disk
