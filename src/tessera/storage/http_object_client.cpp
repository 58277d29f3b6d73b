// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/storage/http_object_client.hpp>
#include <tessera/core/config.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <cctype>
#include <cstdlib>
#include <map>
#include <string>

namespace tessera::storage {

using core::TransferErrc;

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (headers) {
        try {
            HttpObjectClient::collect_header(*headers, std::string_view(buffer, total));
        } catch (const std::exception&) {
            return 0;
        }
    }
    return total;
}

// State shared with the GET callbacks
struct Transfer {
    CURL* curl{nullptr};
    const ByteSink* sink{nullptr};
    std::stop_token stop;
    std::uint64_t expected{0};
    std::uint64_t received{0};
    std::error_code error;
};

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nitems, void* userdata) {
    auto* t = static_cast<Transfer*>(userdata);
    const std::size_t total = size * nitems;

    // Error bodies are not object data
    long http_code = 0;
    curl_easy_getinfo(t->curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code >= 300) {
        return total;
    }

    // A server ignoring the Range header sends more than asked for
    if (t->received + total > t->expected) {
        t->error = make_error_code(TransferErrc::invalid_range);
        return 0;
    }

    auto ec = (*t->sink)(std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total));
    if (ec) {
        t->error = ec;
        return 0;
    }
    t->received += total;
    return total;
}

int progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* t = static_cast<Transfer*>(userdata);
    return t->stop.stop_requested() ? 1 : 0;
}

void apply_common_options(CURL* curl, const std::string& url) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(core::MAX_REDIRECTS));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(core::CONNECTION_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(core::STALL_TIMEOUT_SEC));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

std::error_code curl_error(CURLcode result) noexcept {
    switch (result) {
        case CURLE_OK:                   return {};
        case CURLE_OPERATION_TIMEDOUT:   return make_error_code(TransferErrc::timeout);
        case CURLE_ABORTED_BY_CALLBACK:  return make_error_code(TransferErrc::cancelled);
        case CURLE_RANGE_ERROR:          return make_error_code(TransferErrc::invalid_range);
        default:                         return make_error_code(TransferErrc::network_error);
    }
}

} // namespace

HttpObjectClient::HttpObjectClient(std::string endpoint)
    : endpoint_(std::move(endpoint)) {
    while (!endpoint_.empty() && endpoint_.back() == '/') {
        endpoint_.pop_back();
    }
}

std::string HttpObjectClient::object_url(std::string_view endpoint,
                                         std::string_view bucket,
                                         std::string_view key) {
    static constexpr char HEX[] = "0123456789ABCDEF";

    std::string url(endpoint);
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += '/';
    url += bucket;
    url += '/';

    for (unsigned char c : key) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            url += static_cast<char>(c);
        } else {
            url += '%';
            url += HEX[c >> 4];
            url += HEX[c & 0x0f];
        }
    }
    return url;
}

void HttpObjectClient::collect_header(std::map<std::string, std::string>& headers,
                                      std::string_view line) {
    // Each response of a redirect chain starts over
    if (line.starts_with("HTTP/")) {
        headers.clear();
        return;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) return;

    auto name = line.substr(0, colon);
    auto value = line.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    headers[lower_name] = std::string(value);
}

std::string HttpObjectClient::normalize_etag(std::string_view etag) {
    if (etag.starts_with("W/")) {
        etag.remove_prefix(2);
    }
    if (etag.size() >= 2 && etag.front() == '"' && etag.back() == '"') {
        etag = etag.substr(1, etag.size() - 2);
    }
    return std::string(etag);
}

std::error_code HttpObjectClient::status_error(long http_code) noexcept {
    if (http_code < 400) return {};
    if (http_code == 404) return make_error_code(TransferErrc::not_found);
    if (http_code == 401 || http_code == 403) return make_error_code(TransferErrc::permission_denied);
    if (http_code == 416) return make_error_code(TransferErrc::invalid_range);
    if (http_code >= 500) return make_error_code(TransferErrc::server_error);
    return make_error_code(TransferErrc::network_error);
}

std::expected<core::ObjectMeta, std::error_code>
HttpObjectClient::object_meta(std::string_view bucket, std::string_view key) noexcept {
    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return std::unexpected(make_error_code(TransferErrc::network_error));
        }

        const std::string url = object_url(endpoint_, bucket, key);
        std::map<std::string, std::string> headers;

        apply_common_options(curl.ptr, url);
        curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &headers);

        CURLcode result = curl_easy_perform(curl.ptr);
        if (result != CURLE_OK) {
            spdlog::error("HEAD {} failed: {}", url, curl_easy_strerror(result));
            return std::unexpected(curl_error(result));
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        if (auto ec = status_error(http_code)) {
            spdlog::error("HEAD {} returned HTTP {}", url, http_code);
            return std::unexpected(ec);
        }

        core::ObjectMeta meta;
        if (auto it = headers.find("etag"); it != headers.end()) {
            meta.etag = normalize_etag(it->second);
        }

        // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not reliable for HEAD
        auto cl_it = headers.find("content-length");
        if (cl_it == headers.end() || cl_it->second.empty()) {
            spdlog::error("HEAD {} has no Content-Length", url);
            return std::unexpected(make_error_code(TransferErrc::invalid_range));
        }
        char* end = nullptr;
        unsigned long long size = std::strtoull(cl_it->second.c_str(), &end, 10);
        if (end != cl_it->second.c_str() + cl_it->second.size()) {
            return std::unexpected(make_error_code(TransferErrc::invalid_range));
        }
        meta.size = static_cast<std::uint64_t>(size);

        return meta;
    } catch (const std::exception& e) {
        spdlog::error("HEAD {}/{} failed: {}", bucket, key, e.what());
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

std::error_code
HttpObjectClient::get_object(std::string_view bucket, std::string_view key,
                             std::uint64_t start, std::uint64_t end,
                             const ByteSink& sink, std::stop_token stop) noexcept {
    if (end < start) {
        return make_error_code(TransferErrc::invalid_range);
    }
    if (end == start) {
        return {};
    }

    try {
        CurlHandle curl(curl_easy_init());
        if (!curl.ptr) {
            return make_error_code(TransferErrc::network_error);
        }

        const std::string url = object_url(endpoint_, bucket, key);
        const std::string range = std::to_string(start) + "-" + std::to_string(end - 1);

        Transfer transfer;
        transfer.curl = curl.ptr;
        transfer.sink = &sink;
        transfer.stop = std::move(stop);
        transfer.expected = end - start;

        apply_common_options(curl.ptr, url);
        curl_easy_setopt(curl.ptr, CURLOPT_RANGE, range.c_str());
        curl_easy_setopt(curl.ptr, CURLOPT_BUFFERSIZE, static_cast<long>(core::READ_BUFFER_SIZE));
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_WRITEDATA, &transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl.ptr, CURLOPT_XFERINFODATA, &transfer);
        curl_easy_setopt(curl.ptr, CURLOPT_NOPROGRESS, 0L);

        CURLcode result = curl_easy_perform(curl.ptr);

        if (transfer.error) {
            return transfer.error;
        }
        if (result != CURLE_OK) {
            spdlog::error("GET {} [{}] failed: {}", url, range, curl_easy_strerror(result));
            return curl_error(result);
        }

        long http_code = 0;
        curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        if (auto ec = status_error(http_code)) {
            spdlog::error("GET {} [{}] returned HTTP {}", url, range, http_code);
            return ec;
        }

        if (transfer.received != transfer.expected) {
            spdlog::error("GET {} [{}] returned {} of {} bytes", url, range,
                          transfer.received, transfer.expected);
            return make_error_code(TransferErrc::short_read);
        }
        return {};
    } catch (const std::exception& e) {
        spdlog::error("GET {}/{} failed: {}", bucket, key, e.what());
        return make_error_code(TransferErrc::network_error);
    }
}

void HttpObjectClient::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void HttpObjectClient::global_cleanup() noexcept {
    curl_global_cleanup();
}

} // namespace tessera::storage
