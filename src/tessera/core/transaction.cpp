// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/transaction.hpp>

namespace tessera::core {

std::error_code TransferOptions::validate() const noexcept {
    if (bucket.empty() || key.empty() || file.empty()) {
        return make_error_code(TransferErrc::invalid_options);
    }
    if (part_size == 0) {
        return make_error_code(TransferErrc::invalid_part_size);
    }
    if (threads == 0 || threads > MAX_THREADS) {
        return make_error_code(TransferErrc::invalid_options);
    }
    return {};
}

std::string TransferOptions::resolved_checkpoint_path() const {
    return checkpoint_path.empty() ? file + CHECKPOINT_SUFFIX : checkpoint_path;
}

const char* to_string(TransactionState state) noexcept {
    switch (state) {
        case TransactionState::fresh:        return "fresh";
        case TransactionState::initiated:    return "initiated";
        case TransactionState::planned:      return "planned";
        case TransactionState::in_progress:  return "in_progress";
        case TransactionState::all_done:     return "all_done";
        case TransactionState::committed:    return "committed";
        case TransactionState::failed:       return "failed";
        default:                             return "unknown";
    }
}

} // namespace tessera::core
