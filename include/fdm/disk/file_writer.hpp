// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <fdm/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>

namespace fdm::disk {

// Append-only writer for one fragment's temporary store. Move-only, one owner.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create or open `path`, keep its first `keep_bytes` bytes and position at the end.
    // Bytes past keep_bytes are a partially written chunk and are discarded.
    [[nodiscard]] std::error_code open(const std::filesystem::path& path, std::uint64_t keep_bytes) noexcept;

    // Write all of `data` at the end
    [[nodiscard]] std::error_code write(std::span<const std::byte> data) noexcept;

    // Shrink (or extend with zeros) to `size` and reposition at the end
    [[nodiscard]] std::error_code truncate(std::uint64_t size) noexcept;

    // fdatasync
    [[nodiscard]] std::error_code sync() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t size() const noexcept { return size_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::uint64_t size_{0};
    std::filesystem::path path_;
};

} // namespace fdm::disk
