// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/checkpoint.hpp>
#include <tessera/disk/atomic_file.hpp>
#include <tessera/disk/digest.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace tessera::core {

namespace {

constexpr const char* CHECKSUM_KEY = "checksum";

nlohmann::json to_json(const CheckpointRecord& record) {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& p : record.parts) {
        nlohmann::json part{
            {"number", p.number},
            {"range", nlohmann::json::array({p.start, p.end})},
            {"done", p.done},
        };
        if (p.done) {
            part["md5"] = p.md5;
        }
        parts.push_back(std::move(part));
    }

    return nlohmann::json{
        {"version", record.version},
        {"id", record.id},
        {"file", record.file},
        {"object_meta", {{"etag", record.object_meta.etag}, {"size", record.object_meta.size}}},
        {"parts", std::move(parts)},
    };
}

// Throws nlohmann::json::exception on missing or mistyped fields
std::expected<CheckpointRecord, std::error_code> from_json(const nlohmann::json& j) {
    CheckpointRecord record;
    record.version = j.at("version").get<std::uint32_t>();
    record.id = j.at("id").get<std::string>();
    record.file = j.at("file").get<std::string>();

    const auto& meta = j.at("object_meta");
    record.object_meta.etag = meta.at("etag").get<std::string>();
    record.object_meta.size = meta.at("size").get<std::uint64_t>();

    for (const auto& jp : j.at("parts")) {
        Part p;
        p.number = jp.at("number").get<std::uint32_t>();
        const auto range = jp.at("range").get<std::vector<std::uint64_t>>();
        if (range.size() != 2) {
            return std::unexpected(make_error_code(TransferErrc::token_inconsistent));
        }
        p.start = range[0];
        p.end = range[1];
        p.done = jp.at("done").get<bool>();
        if (p.done) {
            p.md5 = jp.at("md5").get<std::string>();
        }
        record.parts.push_back(std::move(p));
    }
    return record;
}

std::error_code verify_part_files(const CheckpointRecord& record) noexcept {
    for (const auto& p : record.parts) {
        if (!p.done) {
            continue;
        }

        const std::string path = part_file_path(record.file, p.number);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec) || ec) {
            spdlog::error("Part file missing: {}", path);
            return make_error_code(TransferErrc::part_missing);
        }

        auto md5 = disk::file_md5_hex(path);
        if (!md5) {
            return md5.error();
        }
        if (*md5 != p.md5) {
            spdlog::error("Part file changed: {} (recorded {}, found {})", path, p.md5, *md5);
            return make_error_code(TransferErrc::file_inconsistent);
        }
    }
    return {};
}

} // namespace

std::string CheckpointRecord::canonical() const {
    return to_json(*this).dump();
}

std::string CheckpointStore::default_path(std::string_view destination) {
    return std::string(destination) + CHECKPOINT_SUFFIX;
}

std::error_code CheckpointStore::save(const CheckpointRecord& record,
                                      std::string_view path) noexcept {
    try {
        nlohmann::json j = to_json(record);
        auto checksum = disk::md5_hex(j.dump());
        if (!checksum) {
            return checksum.error();
        }
        j[CHECKSUM_KEY] = *checksum;

        return disk::write_file_atomic(path, j.dump());
    } catch (const nlohmann::json::exception& e) {
        // Invalid UTF-8 in a path or etag
        spdlog::error("Cannot serialize checkpoint {}: {}", path, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    } catch (const std::exception& e) {
        spdlog::error("Cannot write checkpoint {}: {}", path, e.what());
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::expected<CheckpointRecord, std::error_code>
CheckpointStore::load(std::string_view path) noexcept {
    CheckpointRecord record;
    try {
        std::ifstream file{std::string(path), std::ios::binary};
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        std::ostringstream content;
        content << file.rdbuf();

        nlohmann::json j = nlohmann::json::parse(content.str());
        if (!j.is_object()) {
            return std::unexpected(make_error_code(TransferErrc::token_inconsistent));
        }

        const std::string stored = j.at(CHECKSUM_KEY).get<std::string>();
        j.erase(std::string(CHECKSUM_KEY));

        auto actual = disk::md5_hex(j.dump());
        if (!actual) {
            return std::unexpected(actual.error());
        }
        if (*actual != stored) {
            spdlog::error("Checkpoint checksum mismatch: {}", path);
            return std::unexpected(make_error_code(TransferErrc::token_inconsistent));
        }

        if (j.at("version").get<std::uint32_t>() > CHECKPOINT_VERSION) {
            return std::unexpected(make_error_code(TransferErrc::checkpoint_version_unsupported));
        }

        auto parsed = from_json(j);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        record = std::move(*parsed);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Malformed checkpoint {}: {}", path, e.what());
        return std::unexpected(make_error_code(TransferErrc::token_inconsistent));
    } catch (const std::exception& e) {
        spdlog::error("Cannot read checkpoint {}: {}", path, e.what());
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }

    if (!record.parts.empty() && !is_exact_partition(record.parts, record.object_meta.size)) {
        spdlog::error("Checkpoint parts do not cover the object: {}", path);
        return std::unexpected(make_error_code(TransferErrc::token_inconsistent));
    }

    if (auto ec = verify_part_files(record)) {
        return std::unexpected(ec);
    }
    return record;
}

bool CheckpointStore::exists(std::string_view path) noexcept {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(path), ec) && !ec;
}

std::error_code CheckpointStore::remove(std::string_view path) noexcept {
    return disk::remove_file(path);
}

} // namespace tessera::core
