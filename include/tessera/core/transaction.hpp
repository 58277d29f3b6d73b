// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/config.hpp>
#include <cstdint>
#include <functional>
#include <string>

namespace tessera::core {

// Transaction lifecycle
enum class TransactionState : std::uint8_t {
    fresh,        // Nothing loaded or fetched yet
    initiated,    // Object metadata captured, no parts yet
    planned,      // Parts computed and checkpointed
    in_progress,  // Downloading parts
    all_done,     // Every part downloaded
    committed,    // Destination written, artifacts removed
    failed        // Last run aborted with an error
};

// Progress after each checkpoint
struct TransferProgress {
    std::uint32_t parts_done{0};
    std::uint32_t parts_total{0};
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};
};

// May be invoked from worker threads
using ProgressCallback = std::function<void(const TransferProgress&)>;

// Everything a transaction needs to know about the transfer
struct TransferOptions {
    std::string bucket;
    std::string key;
    std::string file;               // Destination path
    std::string checkpoint_path;    // Empty: "<file>.tsckpt"
    std::uint64_t part_size{DEFAULT_PART_SIZE};
    std::uint32_t threads{DEFAULT_THREADS};
    ProgressCallback on_progress;

    [[nodiscard]] std::error_code validate() const noexcept;
    [[nodiscard]] std::string resolved_checkpoint_path() const;
};

// A resumable multipart transfer
class Transaction {
public:
    virtual ~Transaction() = default;

    // Rebuild or initiate, transfer every outstanding part, commit
    [[nodiscard]] virtual std::error_code run() noexcept = 0;

    // Persist the current state
    [[nodiscard]] virtual std::error_code checkpoint() noexcept = 0;
};

[[nodiscard]] const char* to_string(TransactionState state) noexcept;

} // namespace tessera::core
