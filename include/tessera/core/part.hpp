// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/config.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::core {

// Identity of the remote object captured at initiation
struct ObjectMeta {
    std::string etag;
    std::uint64_t size{0};

    bool operator==(const ObjectMeta&) const = default;
};

// One byte range of the object, downloaded and verified as a unit
struct Part {
    std::uint32_t number{0};    // 1-based
    std::uint64_t start{0};     // Inclusive
    std::uint64_t end{0};       // Exclusive
    bool done{false};
    std::string md5;            // Set only when done

    [[nodiscard]] std::uint64_t length() const noexcept { return end - start; }

    bool operator==(const Part&) const = default;
};

// Split [0, object_size) into parts of part_size bytes, numbered from 1.
// A zero-size object yields a single empty part [0, 0).
[[nodiscard]] std::expected<std::vector<Part>, std::error_code>
plan_parts(std::uint64_t object_size, std::uint64_t part_size = DEFAULT_PART_SIZE);

// "<destination>.part.<number>"
[[nodiscard]] std::string part_file_path(std::string_view destination, std::uint32_t number);

// Check that parts sorted by number cover [0, object_size) without gaps or overlap
[[nodiscard]] bool is_exact_partition(const std::vector<Part>& parts, std::uint64_t object_size);

} // namespace tessera::core
