// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/committer.hpp>
#include <tessera/core/config.hpp>
#include <tessera/disk/atomic_file.hpp>
#include <tessera/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <fstream>

namespace tessera::core {

namespace {

std::error_code append_file(std::ofstream& out, const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error_code(TransferErrc::part_missing);
    }

    std::array<char, READ_BUFFER_SIZE> buffer{};
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = in.gcount();
        if (got > 0) {
            out.write(buffer.data(), got);
            if (!out) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }
    }
    if (in.bad()) {
        return make_error_code(disk::DiskErrc::read_error);
    }
    return {};
}

} // namespace

std::error_code Committer::commit(const CheckpointRecord& record,
                                  std::string_view checkpoint_path) noexcept {
    if (record.parts.empty() ||
        !std::all_of(record.parts.begin(), record.parts.end(), [](const Part& p) { return p.done; })) {
        return make_error_code(TransferErrc::parts_incomplete);
    }

    try {
        spdlog::info("Begin commit transaction, id: {}", record.id);

        std::vector<const Part*> sorted;
        sorted.reserve(record.parts.size());
        for (const auto& p : record.parts) {
            sorted.push_back(&p);
        }
        std::sort(sorted.begin(), sorted.end(),
                  [](const Part* a, const Part* b) { return a->number < b->number; });

        const std::string staged = disk::staging_path(record.file, COMMIT_SUFFIX);
        {
            std::ofstream out(staged, std::ios::binary | std::ios::trunc);
            if (!out) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            for (const Part* p : sorted) {
                if (auto ec = append_file(out, part_file_path(record.file, p->number))) {
                    spdlog::error("Commit failed at part {}: {}", p->number, ec.message());
                    (void)disk::remove_file(staged);
                    return ec;
                }
            }
            out.flush();
            if (!out) {
                (void)disk::remove_file(staged);
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        if (auto ec = disk::sync_file(staged)) {
            return ec;
        }
        if (auto ec = disk::replace_file(staged, record.file)) {
            return ec;
        }

        // The destination is in place; the bookkeeping can go
        if (auto ec = disk::remove_file(checkpoint_path)) {
            spdlog::error("Cannot remove checkpoint {}: {}", checkpoint_path, ec.message());
            return ec;
        }
        for (const Part* p : sorted) {
            const std::string path = part_file_path(record.file, p->number);
            if (auto ec = disk::remove_file(path)) {
                spdlog::warn("Cannot remove part file {}: {}", path, ec.message());
            }
        }

        spdlog::info("Done commit transaction, id: {}", record.id);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Commit of {} failed: {}", record.id, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

} // namespace tessera::core
