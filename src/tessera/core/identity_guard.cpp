// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/core/identity_guard.hpp>
#include <spdlog/spdlog.h>

namespace tessera::core {

std::error_code ObjectIdentityGuard::verify(const ObjectMeta& recorded) noexcept {
    auto current = client_.object_meta(bucket_, key_);
    if (!current) {
        return current.error();
    }
    return compare(*current, recorded);
}

std::error_code ObjectIdentityGuard::compare(const ObjectMeta& current,
                                             const ObjectMeta& recorded) noexcept {
    if (current.etag != recorded.etag) {
        spdlog::error("The object to download is changed: etag {} -> {}", recorded.etag, current.etag);
        return make_error_code(TransferErrc::object_inconsistent);
    }
    return {};
}

} // namespace tessera::core
