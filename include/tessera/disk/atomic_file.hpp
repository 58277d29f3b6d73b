// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/disk/error.hpp>
#include <string>
#include <string_view>

namespace tessera::disk {

// Sibling path used while a file is being replaced
[[nodiscard]] std::string staging_path(std::string_view final_path,
                                       std::string_view suffix = ".tmp");

// Flush a file's data to stable storage
[[nodiscard]] std::error_code sync_file(std::string_view path) noexcept;

// Rename staged onto final, replacing it if present
[[nodiscard]] std::error_code replace_file(std::string_view staged,
                                           std::string_view final_path) noexcept;

// Write content to a staging file, sync it, then rename it over path.
// A crash leaves either the old file or the new one, never a mix.
[[nodiscard]] std::error_code write_file_atomic(std::string_view path,
                                                std::string_view content) noexcept;

// Remove a file if present; a missing file is not an error
[[nodiscard]] std::error_code remove_file(std::string_view path) noexcept;

} // namespace tessera::disk
