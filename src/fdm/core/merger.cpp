// Copyright (c) 2026 changcheng967. All rights reserved.

#include <fdm/core/merger.hpp>
#include <fdm/core/config.hpp>
#include <fdm/disk/error.hpp>
#include <fdm/disk/file_writer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cerrno>
#include <fstream>

namespace fdm::core {

namespace {

std::filesystem::path partial_path(const std::filesystem::path& destination) {
    auto path = destination;
    path += ".partial";
    return path;
}

// Append one store to the output, returning the bytes copied
std::expected<std::uint64_t, std::error_code>
append_store(const Fragment& fragment, disk::FileWriter& out, std::vector<std::byte>& buffer,
             std::stop_token stop) {
    std::ifstream in(fragment.store_path, std::ios::binary);
    if (!in) {
        return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
    }

    std::uint64_t copied = 0;
    while (in) {
        if (stop.stop_requested()) {
            return std::unexpected(make_error_code(DownloadErrc::cancelled));
        }
        in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) break;
        if (auto ec = out.write(std::span<const std::byte>(buffer.data(), got))) {
            return std::unexpected(ec);
        }
        copied += got;
    }
    if (in.bad()) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
    return copied;
}

} // namespace

void remove_stores(const std::vector<Fragment>& fragments) noexcept {
    for (const auto& fragment : fragments) {
        std::error_code ec;
        std::filesystem::remove(fragment.store_path, ec);
        if (ec) {
            spdlog::warn("Could not remove {}: {}", fragment.store_path.string(), ec.message());
        }
    }
}

std::expected<std::uint64_t, std::error_code>
merge_fragments(const std::vector<Fragment>& fragments,
                const std::filesystem::path& destination,
                std::optional<std::uint64_t> expected_total,
                std::stop_token stop) noexcept {
    try {
        std::vector<const Fragment*> ordered;
        ordered.reserve(fragments.size());
        for (const auto& fragment : fragments) {
            if (fragment.state != FragmentState::completed) {
                spdlog::error("Merge: fragment {} is {}", fragment.index, to_string(fragment.state));
                return std::unexpected(make_error_code(DownloadErrc::merge_integrity));
            }
            ordered.push_back(&fragment);
        }
        std::sort(ordered.begin(), ordered.end(),
                  [](const Fragment* a, const Fragment* b) { return a->index < b->index; });

        // Every store must hold exactly what its worker persisted
        std::uint64_t persisted = 0;
        for (const auto* fragment : ordered) {
            std::error_code ec;
            auto on_disk = std::filesystem::file_size(fragment->store_path, ec);
            if (ec) {
                spdlog::error("Merge: cannot stat {}: {}", fragment->store_path.string(), ec.message());
                return std::unexpected(make_error_code(DownloadErrc::merge_integrity));
            }
            if (on_disk != fragment->bytes_persisted) {
                spdlog::error("Merge: fragment {} store holds {} bytes, expected {}",
                              fragment->index, on_disk, fragment->bytes_persisted);
                return std::unexpected(make_error_code(DownloadErrc::merge_integrity));
            }
            persisted += fragment->bytes_persisted;
        }

        const auto expected = expected_total.value_or(persisted);
        if (persisted != expected) {
            spdlog::error("Merge: fragments hold {} bytes, resource is {} bytes", persisted, expected);
            return std::unexpected(make_error_code(DownloadErrc::merge_integrity));
        }

        const auto staging = partial_path(destination);
        auto discard_staging = [&staging] {
            std::error_code ignored;
            std::filesystem::remove(staging, ignored);
        };

        disk::FileWriter out;
        if (auto ec = out.open(staging, 0)) {
            return std::unexpected(ec);
        }

        std::vector<std::byte> buffer(MERGE_BUFFER_SIZE);
        std::uint64_t written = 0;
        for (const auto* fragment : ordered) {
            auto copied = append_store(*fragment, out, buffer, stop);
            if (!copied) {
                out.close();
                discard_staging();
                return std::unexpected(copied.error());
            }
            written += *copied;
        }

        if (auto ec = out.sync()) {
            out.close();
            discard_staging();
            return std::unexpected(ec);
        }
        out.close();

        if (written != expected) {
            spdlog::error("Merge wrote {} bytes, expected {}", written, expected);
            discard_staging();
            return std::unexpected(make_error_code(DownloadErrc::merge_integrity));
        }

        std::error_code ec;
        std::filesystem::rename(staging, destination, ec);
        if (ec) {
            discard_staging();
            return std::unexpected(disk::from_errno(ec.value(), disk::DiskErrc::write_error));
        }

        remove_stores(fragments);
        spdlog::info("Merged {} fragment(s) into {} ({} bytes)",
                     fragments.size(), destination.string(), written);
        return written;
    } catch (const std::exception& e) {
        spdlog::error("Merge into {} failed: {}", destination.string(), e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::write_error));
    }
}

} // namespace fdm::core
