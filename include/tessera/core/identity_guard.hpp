// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/part.hpp>
#include <tessera/storage/object_client.hpp>
#include <string>

namespace tessera::core {

// Refuses progress once the remote object's entity tag has drifted
class ObjectIdentityGuard {
public:
    ObjectIdentityGuard(storage::ObjectClient& client, std::string bucket, std::string key)
        : client_(client), bucket_(std::move(bucket)), key_(std::move(key)) {}

    // Re-fetch remote metadata and compare with what was recorded at initiation
    [[nodiscard]] std::error_code verify(const ObjectMeta& recorded) noexcept;

    // object_inconsistent when the entity tags differ
    [[nodiscard]] static std::error_code compare(const ObjectMeta& current,
                                                 const ObjectMeta& recorded) noexcept;

private:
    storage::ObjectClient& client_;
    std::string bucket_;
    std::string key_;
};

} // namespace tessera::core
