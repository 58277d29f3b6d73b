// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <cstddef>

namespace tessera::core {

constexpr std::uint64_t DEFAULT_PART_SIZE = 1024 * 1024;            // 1 MiB
constexpr std::size_t READ_BUFFER_SIZE = 16 * 1024;                 // 16 KiB

constexpr std::uint32_t CHECKPOINT_VERSION = 1;
constexpr const char* CHECKPOINT_SUFFIX = ".tsckpt";
constexpr const char* COMMIT_SUFFIX = ".tessera-commit";

constexpr std::uint32_t DEFAULT_THREADS = 1;
constexpr std::uint32_t MAX_THREADS = 64;

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 30;
constexpr std::uint32_t MAX_REDIRECTS = 10;

} // namespace tessera::core
