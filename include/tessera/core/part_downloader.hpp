// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <tessera/core/part.hpp>
#include <tessera/storage/object_client.hpp>
#include <expected>
#include <stop_token>
#include <string>

namespace tessera::core {

// Fetches one part's byte range into "<destination>.part.<number>".
// Parts are all-or-nothing: every attempt truncates the part file and
// downloads the whole range again.
class PartDownloader {
public:
    PartDownloader(storage::ObjectClient& client, std::string bucket, std::string key,
                   std::string destination)
        : client_(client)
        , bucket_(std::move(bucket))
        , key_(std::move(key))
        , destination_(std::move(destination)) {}

    // Download the range and return the MD5 of the written part file.
    // The part itself is not modified; marking it done is the caller's job.
    [[nodiscard]] std::expected<std::string, std::error_code>
    download(const Part& part, std::stop_token stop = {}) noexcept;

    [[nodiscard]] const std::string& destination() const noexcept { return destination_; }

private:
    storage::ObjectClient& client_;
    std::string bucket_;
    std::string key_;
    std::string destination_;
};

} // namespace tessera::core
