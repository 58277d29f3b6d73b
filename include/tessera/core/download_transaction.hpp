// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/transaction.hpp>
#include <tessera/core/checkpoint.hpp>
#include <tessera/core/identity_guard.hpp>
#include <tessera/core/part_downloader.hpp>
#include <tessera/storage/object_client.hpp>
#include <atomic>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

namespace tessera::core {

// Multipart download of one remote object.
//
// run() loads the checkpoint when one exists (validating it and every
// completed part file), otherwise fetches the object metadata and starts
// fresh. Parts are planned once, downloaded in ascending order (or by a pool
// of `threads` workers) and the checkpoint is rewritten after each one.
// When every part is done the parts are committed into the destination.
//
// Only one transaction may use a checkpoint path at a time.
class DownloadTransaction final : public Transaction {
public:
    DownloadTransaction(storage::ObjectClient& client, TransferOptions options);

    // Non-copyable, non-movable (mutex and atomics)
    DownloadTransaction(const DownloadTransaction&) = delete;
    DownloadTransaction& operator=(const DownloadTransaction&) = delete;

    [[nodiscard]] std::error_code run() noexcept override;

    // Verify the object identity, then save the current record
    [[nodiscard]] std::error_code checkpoint() noexcept override;

    // Abort the run in progress; unfinished parts stay undone
    void cancel() noexcept;

    [[nodiscard]] TransactionState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] const TransferOptions& options() const noexcept { return options_; }
    [[nodiscard]] const std::string& checkpoint_path() const noexcept { return checkpoint_path_; }

    // Snapshot of the in-memory record
    [[nodiscard]] CheckpointRecord record() const;
    [[nodiscard]] TransferProgress progress() const;

private:
    [[nodiscard]] std::error_code rebuild() noexcept;
    [[nodiscard]] std::error_code initiate() noexcept;
    [[nodiscard]] std::error_code divide_parts() noexcept;
    [[nodiscard]] std::error_code download_parts(std::stop_token stop) noexcept;
    [[nodiscard]] std::error_code download_part(std::size_t index, std::stop_token stop) noexcept;

    // Caller holds mutex_
    [[nodiscard]] std::error_code checkpoint_locked() noexcept;
    [[nodiscard]] TransferProgress progress_locked() const noexcept;

    [[nodiscard]] std::error_code fail(std::error_code ec) noexcept;
    // "download_<bucket>_<key>_<unix seconds>"
    [[nodiscard]] std::string download_id_prefix() const;
    [[nodiscard]] std::string generate_download_id() const;
    [[nodiscard]] bool owns_download_id(std::string_view id) const;

    storage::ObjectClient& client_;
    TransferOptions options_;
    std::string checkpoint_path_;
    ObjectIdentityGuard guard_;
    PartDownloader downloader_;

    CheckpointRecord record_;
    std::atomic<TransactionState> state_{TransactionState::fresh};
    std::stop_source stop_source_;
    std::mutex stop_mutex_;     // Guards stop_source_ only; never held across I/O
    mutable std::mutex mutex_;  // Guards record_ and every checkpoint write
};

} // namespace tessera::core
