// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/part.hpp>
#include <algorithm>

namespace tessera::core {

std::expected<std::vector<Part>, std::error_code>
plan_parts(std::uint64_t object_size, std::uint64_t part_size) {
    if (part_size == 0) {
        return std::unexpected(make_error_code(TransferErrc::invalid_part_size));
    }

    // Always at least one part, even for an empty object
    const std::uint64_t count = object_size == 0 ? 1 : (object_size - 1) / part_size + 1;

    std::vector<Part> parts;
    parts.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t i = 0; i < count; ++i) {
        Part p;
        p.number = static_cast<std::uint32_t>(i + 1);
        p.start = i * part_size;
        p.end = std::min(p.start + part_size, object_size);
        parts.push_back(std::move(p));
    }
    return parts;
}

std::string part_file_path(std::string_view destination, std::uint32_t number) {
    std::string path(destination);
    path += ".part.";
    path += std::to_string(number);
    return path;
}

bool is_exact_partition(const std::vector<Part>& parts, std::uint64_t object_size) {
    if (parts.empty()) {
        return false;
    }

    std::vector<const Part*> sorted;
    sorted.reserve(parts.size());
    for (const auto& p : parts) {
        sorted.push_back(&p);
    }
    std::sort(sorted.begin(), sorted.end(),
              [](const Part* a, const Part* b) { return a->number < b->number; });

    std::uint64_t expected_start = 0;
    std::uint32_t expected_number = 1;
    for (const Part* p : sorted) {
        if (p->number != expected_number++ || p->start != expected_start || p->end < p->start) {
            return false;
        }
        expected_start = p->end;
    }
    return expected_start == object_size;
}

} // namespace tessera::core
