// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/disk/error.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace tessera::disk {

// Lowercase hex MD5 of an in-memory buffer
[[nodiscard]] std::expected<std::string, std::error_code>
md5_hex(std::string_view data) noexcept;

// Lowercase hex MD5 of a file's content, streamed in READ_BUFFER_SIZE chunks
[[nodiscard]] std::expected<std::string, std::error_code>
file_md5_hex(std::string_view path) noexcept;

} // namespace tessera::disk
