// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/download_transaction.hpp>
#include <tessera/core/committer.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <thread>
#include <vector>

namespace tessera::core {

//=============================================================================
// DownloadTransaction
//=============================================================================

DownloadTransaction::DownloadTransaction(storage::ObjectClient& client, TransferOptions options)
    : client_(client)
    , options_(std::move(options))
    , checkpoint_path_(options_.resolved_checkpoint_path())
    , guard_(client, options_.bucket, options_.key)
    , downloader_(client, options_.bucket, options_.key, options_.file) {}

std::error_code DownloadTransaction::run() noexcept {
    spdlog::info("Begin download, file: {}, checkpoint file: {}", options_.file, checkpoint_path_);

    if (auto ec = options_.validate()) {
        return fail(ec);
    }

    std::stop_token stop;
    {
        std::lock_guard lock(stop_mutex_);
        stop_source_ = std::stop_source{};
        stop = stop_source_.get_token();
    }
    state_.store(TransactionState::fresh, std::memory_order_release);

    if (auto ec = rebuild()) {
        return fail(ec);
    }

    bool unplanned = false;
    {
        std::lock_guard lock(mutex_);
        unplanned = record_.parts.empty();
    }
    if (unplanned) {
        if (auto ec = divide_parts()) {
            return fail(ec);
        }
    }

    if (auto ec = download_parts(stop)) {
        return fail(ec);
    }
    state_.store(TransactionState::all_done, std::memory_order_release);

    CheckpointRecord snapshot = record();
    if (auto ec = Committer::commit(snapshot, checkpoint_path_)) {
        return fail(ec);
    }
    state_.store(TransactionState::committed, std::memory_order_release);

    spdlog::info("Done download, file: {}", options_.file);
    return {};
}

std::error_code DownloadTransaction::checkpoint() noexcept {
    std::lock_guard lock(mutex_);
    return checkpoint_locked();
}

void DownloadTransaction::cancel() noexcept {
    std::stop_source source;
    {
        std::lock_guard lock(stop_mutex_);
        source = stop_source_;
    }
    source.request_stop();
}

CheckpointRecord DownloadTransaction::record() const {
    std::lock_guard lock(mutex_);
    return record_;
}

TransferProgress DownloadTransaction::progress() const {
    std::lock_guard lock(mutex_);
    return progress_locked();
}

//=============================================================================
// Lifecycle steps
//=============================================================================

std::error_code DownloadTransaction::rebuild() noexcept {
    spdlog::info("Begin rebuild transaction, checkpoint: {}", checkpoint_path_);

    if (!CheckpointStore::exists(checkpoint_path_)) {
        return initiate();
    }

    auto loaded = CheckpointStore::load(checkpoint_path_);
    if (!loaded) {
        return loaded.error();
    }
    if (loaded->file != options_.file) {
        spdlog::error("Checkpoint {} belongs to {}, not {}", checkpoint_path_, loaded->file, options_.file);
        return make_error_code(TransferErrc::token_inconsistent);
    }
    if (!owns_download_id(loaded->id)) {
        spdlog::error("Checkpoint {} belongs to transaction {}, not {}/{}",
                      checkpoint_path_, loaded->id, options_.bucket, options_.key);
        return make_error_code(TransferErrc::token_inconsistent);
    }

    std::lock_guard lock(mutex_);
    record_ = std::move(*loaded);

    const auto done = std::count_if(record_.parts.begin(), record_.parts.end(),
                                    [](const Part& p) { return p.done; });
    if (record_.parts.empty()) {
        state_.store(TransactionState::initiated, std::memory_order_release);
    } else if (done == 0) {
        state_.store(TransactionState::planned, std::memory_order_release);
    } else {
        state_.store(TransactionState::in_progress, std::memory_order_release);
    }

    spdlog::info("Done rebuild transaction, id: {}, parts done: {}/{}", record_.id, done, record_.parts.size());
    return {};
}

std::error_code DownloadTransaction::initiate() noexcept {
    spdlog::info("Begin initiate transaction");

    auto meta = client_.object_meta(options_.bucket, options_.key);
    if (!meta) {
        return meta.error();
    }

    try {
        std::lock_guard lock(mutex_);
        record_ = CheckpointRecord{};
        record_.id = generate_download_id();
        record_.file = options_.file;
        record_.object_meta = std::move(*meta);

        if (auto ec = checkpoint_locked()) {
            return ec;
        }
        state_.store(TransactionState::initiated, std::memory_order_release);

        spdlog::info("Done initiate transaction, id: {}", record_.id);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("Cannot initiate transaction: {}", e.what());
        return make_error_code(TransferErrc::invalid_options);
    }
}

std::error_code DownloadTransaction::divide_parts() noexcept {
    std::lock_guard lock(mutex_);
    spdlog::info("Begin divide parts, object: {}, size: {}", options_.key, record_.object_meta.size);

    try {
        auto parts = plan_parts(record_.object_meta.size, options_.part_size);
        if (!parts) {
            return parts.error();
        }
        record_.parts = std::move(*parts);
    } catch (const std::exception& e) {
        spdlog::error("Cannot plan parts: {}", e.what());
        return make_error_code(TransferErrc::invalid_part_size);
    }

    if (auto ec = checkpoint_locked()) {
        record_.parts.clear();
        return ec;
    }
    state_.store(TransactionState::planned, std::memory_order_release);

    spdlog::info("Done divide parts, parts: {}", record_.parts.size());
    return {};
}

std::error_code DownloadTransaction::download_parts(std::stop_token stop) noexcept {
    std::vector<std::size_t> pending;
    try {
        std::lock_guard lock(mutex_);
        for (std::size_t i = 0; i < record_.parts.size(); ++i) {
            if (!record_.parts[i].done) {
                pending.push_back(i);
            }
        }
        std::sort(pending.begin(), pending.end(), [this](std::size_t a, std::size_t b) {
            return record_.parts[a].number < record_.parts[b].number;
        });
    } catch (const std::exception&) {
        return make_error_code(TransferErrc::invalid_options);
    }

    if (pending.empty()) {
        return {};
    }
    state_.store(TransactionState::in_progress, std::memory_order_release);

    const std::size_t workers = std::min<std::size_t>(options_.threads, pending.size());
    if (workers <= 1) {
        for (std::size_t index : pending) {
            if (stop.stop_requested()) {
                return make_error_code(TransferErrc::cancelled);
            }
            if (auto ec = download_part(index, stop)) {
                return ec;
            }
        }
        return {};
    }

    // Worker pool: parts are handed out in ascending order; after the first
    // failure nobody starts a new part
    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::error_code first_error;

    auto record_error = [&](std::error_code ec) {
        std::lock_guard lock(error_mutex);
        if (!first_error) {
            first_error = ec;
        }
        failed.store(true, std::memory_order_release);
    };

    try {
        std::vector<std::jthread> pool;
        pool.reserve(workers);
        for (std::size_t w = 0; w < workers; ++w) {
            pool.emplace_back([&, stop] {
                while (!failed.load(std::memory_order_acquire)) {
                    const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
                    if (i >= pending.size()) {
                        return;
                    }
                    if (stop.stop_requested()) {
                        record_error(make_error_code(TransferErrc::cancelled));
                        return;
                    }
                    if (auto ec = download_part(pending[i], stop)) {
                        record_error(ec);
                        return;
                    }
                }
            });
        }
    } catch (const std::system_error& e) {
        // Threads already started are joined when pool goes out of scope
        spdlog::error("Cannot start download workers: {}", e.what());
        record_error(e.code());
    }

    return first_error;
}

std::error_code DownloadTransaction::download_part(std::size_t index, std::stop_token stop) noexcept {
    Part part;
    try {
        std::lock_guard lock(mutex_);
        part = record_.parts[index];
    } catch (const std::exception&) {
        return make_error_code(TransferErrc::invalid_options);
    }

    spdlog::info("Begin download part: {} [{}, {})", part.number, part.start, part.end);

    auto md5 = downloader_.download(part, stop);
    if (!md5) {
        return md5.error();
    }

    TransferProgress snapshot;
    {
        std::lock_guard lock(mutex_);
        Part& target = record_.parts[index];
        target.done = true;
        target.md5 = *md5;

        if (auto ec = checkpoint_locked()) {
            // Keep memory in line with what is persisted
            target.done = false;
            target.md5.clear();
            return ec;
        }
        snapshot = progress_locked();
    }

    spdlog::info("Done download part: {}, md5: {}", part.number, *md5);

    if (options_.on_progress) {
        options_.on_progress(snapshot);
    }
    return {};
}

//=============================================================================
// Helpers
//=============================================================================

std::error_code DownloadTransaction::checkpoint_locked() noexcept {
    spdlog::debug("Begin make checkpoint");

    if (auto ec = guard_.verify(record_.object_meta)) {
        return ec;
    }
    if (auto ec = CheckpointStore::save(record_, checkpoint_path_)) {
        spdlog::error("Cannot save checkpoint {}: {}", checkpoint_path_, ec.message());
        return ec;
    }

    spdlog::debug("Done make checkpoint, id: {}, parts: {}", record_.id, record_.parts.size());
    return {};
}

TransferProgress DownloadTransaction::progress_locked() const noexcept {
    TransferProgress p;
    p.parts_total = static_cast<std::uint32_t>(record_.parts.size());
    p.bytes_total = record_.object_meta.size;
    for (const auto& part : record_.parts) {
        if (part.done) {
            ++p.parts_done;
            p.bytes_done += part.length();
        }
    }
    return p;
}

std::error_code DownloadTransaction::fail(std::error_code ec) noexcept {
    const auto reached = state_.exchange(TransactionState::failed, std::memory_order_acq_rel);
    spdlog::error("Download of {} failed in state {}: {}", options_.file, to_string(reached), ec.message());
    return ec;
}

std::string DownloadTransaction::download_id_prefix() const {
    return "download_" + options_.bucket + "_" + options_.key + "_";
}

std::string DownloadTransaction::generate_download_id() const {
    const auto now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return download_id_prefix() + std::to_string(now);
}

bool DownloadTransaction::owns_download_id(std::string_view id) const {
    const std::string prefix = download_id_prefix();
    if (!id.starts_with(prefix) || id.size() == prefix.size()) {
        return false;
    }
    id.remove_prefix(prefix.size());
    return std::all_of(id.begin(), id.end(), [](char c) { return c >= '0' && c <= '9'; });
}

} // namespace tessera::core
