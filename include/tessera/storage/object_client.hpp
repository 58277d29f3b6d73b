// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/part.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <stop_token>
#include <string_view>

namespace tessera::storage {

// Receives response body chunks in order; a non-empty error aborts the transfer
using ByteSink = std::function<std::error_code(std::span<const std::byte>)>;

// Remote object-storage collaborator.
// Implementations must allow concurrent calls from several threads.
class ObjectClient {
public:
    virtual ~ObjectClient() = default;

    // Entity tag and size of bucket/key
    [[nodiscard]] virtual std::expected<core::ObjectMeta, std::error_code>
    object_meta(std::string_view bucket, std::string_view key) noexcept = 0;

    // Stream bytes [start, end) of bucket/key into sink.
    // Returns cancelled if stop is requested mid-transfer.
    [[nodiscard]] virtual std::error_code
    get_object(std::string_view bucket, std::string_view key,
               std::uint64_t start, std::uint64_t end,
               const ByteSink& sink, std::stop_token stop) noexcept = 0;
};

} // namespace tessera::storage
