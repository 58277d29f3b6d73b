// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/storage/object_client.hpp>
#include <map>
#include <string>
#include <string_view>

namespace tessera::storage {

// ObjectClient over plain HTTP(S) with libcurl.
// Objects live at <endpoint>/<bucket>/<key>; metadata comes from HEAD,
// data from ranged GET. Each call uses its own easy handle.
class HttpObjectClient final : public ObjectClient {
public:
    explicit HttpObjectClient(std::string endpoint);

    [[nodiscard]] std::expected<core::ObjectMeta, std::error_code>
    object_meta(std::string_view bucket, std::string_view key) noexcept override;

    [[nodiscard]] std::error_code
    get_object(std::string_view bucket, std::string_view key,
               std::uint64_t start, std::uint64_t end,
               const ByteSink& sink, std::stop_token stop) noexcept override;

    [[nodiscard]] const std::string& endpoint() const noexcept { return endpoint_; }

    // Build the object URL; the key is percent-encoded except for '/'
    [[nodiscard]] static std::string object_url(std::string_view endpoint,
                                                std::string_view bucket,
                                                std::string_view key);

    // Record one raw header line as lowercased name -> trimmed value.
    // A status line ("HTTP/...") drops everything recorded so far.
    static void collect_header(std::map<std::string, std::string>& headers,
                               std::string_view line);

    // Strip weak-validator prefix and surrounding quotes from an ETag header
    [[nodiscard]] static std::string normalize_etag(std::string_view etag);

    // Map an HTTP status code to a transfer error (empty for 2xx/3xx)
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;

    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    std::string endpoint_;
};

} // namespace tessera::storage
