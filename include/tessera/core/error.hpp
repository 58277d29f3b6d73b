// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace tessera::core {

enum class TransferErrc {
    success = 0,
    // Checkpoint validation
    token_inconsistent,
    part_missing,
    file_inconsistent,
    checkpoint_version_unsupported,
    // Remote object identity
    object_inconsistent,
    // Transport
    network_error,
    timeout,
    not_found,
    permission_denied,
    server_error,
    invalid_range,
    short_read,
    cancelled,
    // Caller errors
    invalid_part_size,
    invalid_options,
    parts_incomplete,
};

namespace detail {

struct TransferErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "tessera::transfer";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<TransferErrc>(ev)) {
            case TransferErrc::success:                        return "Success";
            case TransferErrc::token_inconsistent:             return "The resume token is changed";
            case TransferErrc::part_missing:                   return "The part file is missing";
            case TransferErrc::file_inconsistent:              return "The part file is changed";
            case TransferErrc::checkpoint_version_unsupported: return "Checkpoint written by a newer version";
            case TransferErrc::object_inconsistent:            return "The object to download is changed";
            case TransferErrc::network_error:                  return "Network error";
            case TransferErrc::timeout:                        return "Operation timed out";
            case TransferErrc::not_found:                      return "Object not found (404)";
            case TransferErrc::permission_denied:              return "Permission denied";
            case TransferErrc::server_error:                   return "Server error (5xx)";
            case TransferErrc::invalid_range:                  return "Invalid byte range";
            case TransferErrc::short_read:                     return "Response body shorter than requested range";
            case TransferErrc::cancelled:                      return "Transfer cancelled";
            case TransferErrc::invalid_part_size:              return "Part size must be positive";
            case TransferErrc::invalid_options:                return "Invalid transfer options";
            case TransferErrc::parts_incomplete:               return "Not all parts are downloaded";
            default:                                           return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::TransferErrcCategory& transfer_errc_category() noexcept {
    static detail::TransferErrcCategory category;
    return category;
}

inline std::error_code make_error_code(TransferErrc e) noexcept {
    return {static_cast<int>(e), transfer_errc_category()};
}

// True for errors meaning the checkpoint cannot be trusted for a resume
[[nodiscard]] inline bool is_checkpoint_error(std::error_code ec) noexcept {
    return ec == make_error_code(TransferErrc::token_inconsistent)
        || ec == make_error_code(TransferErrc::part_missing)
        || ec == make_error_code(TransferErrc::file_inconsistent)
        || ec == make_error_code(TransferErrc::checkpoint_version_unsupported);
}

} // namespace tessera::core

namespace std {

template<>
struct is_error_code_enum<tessera::core::TransferErrc> : true_type {};

} // namespace std
