// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/part_downloader.hpp>
#include <tessera/disk/digest.hpp>
#include <tessera/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <fstream>

namespace tessera::core {

std::expected<std::string, std::error_code>
PartDownloader::download(const Part& part, std::stop_token stop) noexcept {
    if (stop.stop_requested()) {
        return std::unexpected(make_error_code(TransferErrc::cancelled));
    }

    try {
        const std::string path = part_file_path(destination_, part.number);
        spdlog::debug("Begin download part {} [{}, {}) -> {}", part.number, part.start, part.end, path);

        {
            std::ofstream out(path, std::ios::binary | std::ios::trunc);
            if (!out) {
                return std::unexpected(make_error_code(disk::DiskErrc::write_error));
            }

            // Empty parts only need their (empty) file
            if (part.length() > 0) {
                std::uint64_t received = 0;
                storage::ByteSink sink = [&out, &received, &part](std::span<const std::byte> chunk) -> std::error_code {
                    if (received + chunk.size() > part.length()) {
                        return make_error_code(TransferErrc::invalid_range);
                    }
                    out.write(reinterpret_cast<const char*>(chunk.data()),
                              static_cast<std::streamsize>(chunk.size()));
                    if (!out) {
                        return make_error_code(disk::DiskErrc::write_error);
                    }
                    received += chunk.size();
                    return {};
                };

                if (auto ec = client_.get_object(bucket_, key_, part.start, part.end, sink, stop)) {
                    spdlog::warn("Part {} failed: {}", part.number, ec.message());
                    return std::unexpected(ec);
                }
                if (received != part.length()) {
                    spdlog::warn("Part {} got {} of {} bytes", part.number, received, part.length());
                    return std::unexpected(make_error_code(TransferErrc::short_read));
                }
            }

            out.flush();
            if (!out) {
                return std::unexpected(make_error_code(disk::DiskErrc::write_error));
            }
        }

        auto md5 = disk::file_md5_hex(path);
        if (!md5) {
            return std::unexpected(md5.error());
        }
        spdlog::debug("Done download part {}, md5 {}", part.number, *md5);
        return md5;
    } catch (const std::exception& e) {
        spdlog::error("Part {} failed: {}", part.number, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::write_error));
    }
}

} // namespace tessera::core
