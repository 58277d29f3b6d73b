// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/checkpoint.hpp>
#include <string_view>

namespace tessera::core {

// Reassembles part files into the destination and removes all
// transaction artifacts.
//
// The output is assembled in "<destination>.tessera-commit", synced and
// renamed into place before the checkpoint and part files are deleted, so an
// interrupted commit leaves everything needed to commit again.
class Committer {
public:
    // parts_incomplete (nothing touched) if any part is not done
    [[nodiscard]] static std::error_code commit(const CheckpointRecord& record,
                                                std::string_view checkpoint_path) noexcept;
};

} // namespace tessera::core
