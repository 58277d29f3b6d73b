// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>

namespace tessera::disk {

enum class DiskErrc {
    success = 0,
    file_not_found,
    access_denied,
    write_error,
    read_error,
    sync_error,
    rename_error,
    remove_error,
    digest_error,
};

namespace detail {

struct DiskErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tessera::disk";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DiskErrc>(ev)) {
            case DiskErrc::success:         return "Success";
            case DiskErrc::file_not_found:  return "File not found";
            case DiskErrc::access_denied:   return "Access denied";
            case DiskErrc::write_error:     return "Write error";
            case DiskErrc::read_error:      return "Read error";
            case DiskErrc::sync_error:      return "Flush to disk failed";
            case DiskErrc::rename_error:    return "Rename failed";
            case DiskErrc::remove_error:    return "Remove failed";
            case DiskErrc::digest_error:    return "Digest computation failed";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DiskErrcCategory& disk_errc_category() noexcept {
    static detail::DiskErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DiskErrc e) noexcept {
    return {static_cast<int>(e), disk_errc_category()};
}

} // namespace tessera::disk

namespace std {

template<>
struct is_error_code_enum<tessera::disk::DiskErrc> : true_type {};

} // namespace std
