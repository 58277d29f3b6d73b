// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/transaction.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tessera::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string endpoint;
    std::string bucket;
    std::string key;
    std::string output_file;
    std::string checkpoint_file;
    std::uint64_t part_size{core::DEFAULT_PART_SIZE};
    std::uint32_t threads{core::DEFAULT_THREADS};
    bool discard_invalid{false};
    bool info_only{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;      // First parse error, empty if none
};

// Parse command line arguments
[[nodiscard]] CliArgs parse_args(int argc, char* argv[]) noexcept;

// Destination used when no output file was given: the last path segment of the key
[[nodiscard]] std::string default_output(std::string_view key);

// Download one object, resuming from its checkpoint when present
[[nodiscard]] CliResult download(const CliArgs& args) noexcept;

// Print the remote object's metadata without downloading
[[nodiscard]] CliResult info(const CliArgs& args) noexcept;

// Show help message
void print_help(std::string_view program_name) noexcept;

// Show version information
void print_version() noexcept;

} // namespace tessera::cli
