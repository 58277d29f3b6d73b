// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/disk/atomic_file.hpp>
#include <filesystem>
#include <fstream>
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace tessera::disk {

namespace fs = std::filesystem;

namespace {

// RAII POSIX descriptor
struct FileDescriptor {
    int fd = -1;

    explicit FileDescriptor(int f) : fd(f) {}
    ~FileDescriptor() { if (fd >= 0) ::close(fd); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;
};

std::error_code sync_directory(const fs::path& file) noexcept {
    auto dir = file.has_parent_path() ? file.parent_path() : fs::path(".");
    FileDescriptor d(::open(dir.c_str(), O_RDONLY | O_DIRECTORY));
    if (d.fd < 0) {
        return make_error_code(DiskErrc::sync_error);
    }
    if (::fsync(d.fd) != 0) {
        return make_error_code(DiskErrc::sync_error);
    }
    return {};
}

} // namespace

std::string staging_path(std::string_view final_path, std::string_view suffix) {
    std::string out(final_path);
    out += suffix;
    return out;
}

std::error_code sync_file(std::string_view path) noexcept {
    try {
        FileDescriptor f(::open(std::string(path).c_str(), O_RDONLY));
        if (f.fd < 0) {
            return errno == ENOENT ? make_error_code(DiskErrc::file_not_found)
                                   : make_error_code(DiskErrc::access_denied);
        }
        if (::fsync(f.fd) != 0) {
            return make_error_code(DiskErrc::sync_error);
        }
        return {};
    } catch (const std::bad_alloc&) {
        return make_error_code(DiskErrc::sync_error);
    }
}

std::error_code replace_file(std::string_view staged, std::string_view final_path) noexcept {
    try {
        std::error_code ec;
        fs::rename(fs::path(staged), fs::path(final_path), ec);
        if (ec) {
            return make_error_code(DiskErrc::rename_error);
        }
        // Directory entry durability is best effort
        (void)sync_directory(fs::path(final_path));
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::rename_error);
    }
}

std::error_code write_file_atomic(std::string_view path, std::string_view content) noexcept {
    try {
        fs::path p(path);
        if (p.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(p.parent_path(), ec);
            if (ec) {
                return make_error_code(DiskErrc::access_denied);
            }
        }

        const std::string staged = staging_path(path);
        {
            std::ofstream file(staged, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(DiskErrc::write_error);
            }
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            file.flush();
            if (!file) {
                return make_error_code(DiskErrc::write_error);
            }
        }

        if (auto ec = sync_file(staged)) {
            return ec;
        }
        return replace_file(staged, path);
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code remove_file(std::string_view path) noexcept {
    try {
        std::error_code ec;
        fs::remove(fs::path(path), ec);
        return ec ? make_error_code(DiskErrc::remove_error) : std::error_code{};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::remove_error);
    }
}

} // namespace tessera::disk
