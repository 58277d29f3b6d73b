// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/disk/digest.hpp>
#include <tessera/core/config.hpp>
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <memory>

namespace tessera::disk {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx new_md5_context() noexcept {
    MdCtx ctx(EVP_MD_CTX_new());
    if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        ctx.reset();
    }
    return ctx;
}

std::expected<std::string, std::error_code> finish_hex(EVP_MD_CTX* ctx) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx, digest, &len) != 1) {
        return std::unexpected(make_error_code(DiskErrc::digest_error));
    }

    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out += HEX[digest[i] >> 4];
        out += HEX[digest[i] & 0x0f];
    }
    return out;
}

} // namespace

std::expected<std::string, std::error_code> md5_hex(std::string_view data) noexcept {
    try {
        MdCtx ctx = new_md5_context();
        if (!ctx || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            return std::unexpected(make_error_code(DiskErrc::digest_error));
        }
        return finish_hex(ctx.get());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(DiskErrc::digest_error));
    }
}

std::expected<std::string, std::error_code> file_md5_hex(std::string_view path) noexcept {
    try {
        std::ifstream in(std::string(path), std::ios::binary);
        if (!in) {
            return std::unexpected(make_error_code(DiskErrc::file_not_found));
        }

        MdCtx ctx = new_md5_context();
        if (!ctx) {
            return std::unexpected(make_error_code(DiskErrc::digest_error));
        }

        std::array<char, core::READ_BUFFER_SIZE> buffer{};
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto got = in.gcount();
            if (got > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<std::size_t>(got)) != 1) {
                return std::unexpected(make_error_code(DiskErrc::digest_error));
            }
        }
        if (in.bad()) {
            return std::unexpected(make_error_code(DiskErrc::read_error));
        }

        return finish_hex(ctx.get());
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::read_error));
    }
}

} // namespace tessera::disk
