// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/part.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::core {

// Persisted transaction state
struct CheckpointRecord {
    std::uint32_t version{CHECKPOINT_VERSION};
    std::string id;
    std::string file;           // Destination path
    ObjectMeta object_meta;
    std::vector<Part> parts;

    // Compact JSON of every field, keys sorted; the checksum covers exactly this
    [[nodiscard]] std::string canonical() const;

    bool operator==(const CheckpointRecord&) const = default;
};

// Durable, tamper-evident storage of a CheckpointRecord.
//
// The file holds the canonical JSON plus a "checksum" member (MD5 of the
// canonical form). Writes go to a staging file which is synced and renamed
// over the checkpoint, so a crash never leaves a half-written record.
class CheckpointStore {
public:
    // Default checkpoint path for a destination file
    [[nodiscard]] static std::string default_path(std::string_view destination);

    [[nodiscard]] static std::error_code save(const CheckpointRecord& record,
                                              std::string_view path) noexcept;

    // Parse, verify the embedded checksum, then verify every done part's
    // file against its recorded MD5.
    //
    // token_inconsistent: unreadable, malformed or checksum mismatch
    // checkpoint_version_unsupported: written by a newer schema
    // part_missing / file_inconsistent: done part file absent / changed
    [[nodiscard]] static std::expected<CheckpointRecord, std::error_code>
    load(std::string_view path) noexcept;

    [[nodiscard]] static bool exists(std::string_view path) noexcept;

    [[nodiscard]] static std::error_code remove(std::string_view path) noexcept;
};

} // namespace tessera::core
