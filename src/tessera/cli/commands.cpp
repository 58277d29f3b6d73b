// Copyright (c) 2026 changcheng967. All rights reserved.

#include <tessera/cli/commands.hpp>
#include <tessera/core/checkpoint.hpp>
#include <tessera/core/download_transaction.hpp>
#include <tessera/storage/http_object_client.hpp>
#include <tessera/version.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <vector>

using namespace tessera::core;

namespace tessera::cli {

namespace {

// "1048576", "512K", "4M", "1G"
bool parse_size(std::string_view text, std::uint64_t& out) noexcept {
    if (text.empty()) return false;

    std::uint64_t multiplier = 1;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024ULL; break;
        case 'm': case 'M': multiplier = 1024ULL * 1024; break;
        case 'g': case 'G': multiplier = 1024ULL * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        text.remove_suffix(1);
    }
    if (text.empty()) return false;

    constexpr std::uint64_t MAX = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
        if (value > (MAX - 9) / 10) return false;
        value = value * 10 + static_cast<std::uint64_t>(c - '0');
    }
    if (value > MAX / multiplier) return false;
    out = value * multiplier;
    return out > 0;
}

// RAII curl global init/cleanup
struct CurlGlobal {
    CurlGlobal() { storage::HttpObjectClient::global_init(); }
    ~CurlGlobal() { storage::HttpObjectClient::global_cleanup(); }
};

void configure_logging(const CliArgs& args) {
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) noexcept {
    CliArgs args;
    std::vector<std::string> positional;

    auto set_error = [&args](std::string message) {
        if (args.error.empty()) {
            args.error = std::move(message);
        }
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-i" || arg == "--info") {
            args.info_only = true;
        } else if (arg == "--discard-invalid") {
            args.discard_invalid = true;
        } else if (arg == "-o" || arg == "--output" ||
                   arg == "-c" || arg == "--checkpoint" ||
                   arg == "-p" || arg == "--part-size" ||
                   arg == "-j" || arg == "--threads") {
            if (i + 1 >= argc) {
                set_error("Missing value for " + arg);
                break;
            }
            std::string value = argv[++i];
            if (arg == "-o" || arg == "--output") {
                args.output_file = value;
            } else if (arg == "-c" || arg == "--checkpoint") {
                args.checkpoint_file = value;
            } else if (arg == "-p" || arg == "--part-size") {
                if (!parse_size(value, args.part_size)) {
                    set_error("Invalid part size: " + value);
                }
            } else {
                char* end = nullptr;
                unsigned long threads = std::strtoul(value.c_str(), &end, 10);
                if (end == value.c_str() || *end != '\0' || threads == 0 || threads > MAX_THREADS) {
                    set_error("Invalid thread count: " + value);
                } else {
                    args.threads = static_cast<std::uint32_t>(threads);
                }
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            set_error("Unknown option: " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() == 3) {
        args.endpoint = positional[0];
        args.bucket = positional[1];
        args.key = positional[2];
    } else if (!args.help && !args.version) {
        set_error("Expected <endpoint> <bucket> <key>");
    }

    return args;
}

std::string default_output(std::string_view key) {
    auto slash = key.find_last_of('/');
    auto name = slash == std::string_view::npos ? key : key.substr(slash + 1);
    return name.empty() ? std::string("download.bin") : std::string(name);
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args) noexcept {
    try {
        configure_logging(args);
        CurlGlobal curl;

        storage::HttpObjectClient client(args.endpoint);

        TransferOptions options;
        options.bucket = args.bucket;
        options.key = args.key;
        options.file = args.output_file.empty() ? default_output(args.key) : args.output_file;
        options.checkpoint_path = args.checkpoint_file;
        options.part_size = args.part_size;
        options.threads = args.threads;
        if (!args.quiet) {
            options.on_progress = [](const TransferProgress& p) {
                std::cout << "\rParts " << p.parts_done << "/" << p.parts_total
                          << "  " << p.bytes_done << "/" << p.bytes_total << " bytes" << std::flush;
            };
        }

        DownloadTransaction transaction(client, options);
        auto ec = transaction.run();

        if (ec && is_checkpoint_error(ec) && args.discard_invalid) {
            spdlog::warn("Discarding untrusted checkpoint {}: {}", transaction.checkpoint_path(), ec.message());
            if (auto rm = CheckpointStore::remove(transaction.checkpoint_path())) {
                return std::unexpected(rm);
            }
            ec = transaction.run();
        }

        if (!args.quiet) {
            std::cout << std::endl;
        }
        if (ec) {
            std::cerr << "Error: " << ec.message() << std::endl;
            if (is_checkpoint_error(ec)) {
                std::cerr << "The checkpoint " << transaction.checkpoint_path()
                          << " cannot be trusted; rerun with --discard-invalid to start over" << std::endl;
            }
            return std::unexpected(ec);
        }

        if (!args.quiet) {
            std::cout << "Saved " << options.file << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(TransferErrc::invalid_options));
    }
}

CliResult info(const CliArgs& args) noexcept {
    try {
        configure_logging(args);
        CurlGlobal curl;

        storage::HttpObjectClient client(args.endpoint);
        auto meta = client.object_meta(args.bucket, args.key);
        if (!meta) {
            std::cerr << "Error: " << meta.error().message() << std::endl;
            return std::unexpected(meta.error());
        }

        std::cout << "URL: " << storage::HttpObjectClient::object_url(args.endpoint, args.bucket, args.key) << std::endl;
        std::cout << "ETag: " << meta->etag << std::endl;
        std::cout << "Size: " << meta->size << std::endl;

        auto parts = plan_parts(meta->size, args.part_size);
        if (parts) {
            std::cout << "Parts: " << parts->size() << " x " << args.part_size << " bytes" << std::endl;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return std::unexpected(make_error_code(TransferErrc::network_error));
    }
}

void print_help(std::string_view program_name) noexcept {
    std::cout << "tessera - resumable multipart object downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <ENDPOINT> <BUCKET> <KEY>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  -v, --version            Show version information\n";
    std::cout << "  -V, --verbose            Enable debug logging\n";
    std::cout << "  -q, --quiet              Only log warnings and errors\n";
    std::cout << "  -o, --output <FILE>      Destination file (default: last segment of KEY)\n";
    std::cout << "  -c, --checkpoint <FILE>  Checkpoint file (default: <FILE>.tsckpt)\n";
    std::cout << "  -p, --part-size <SIZE>   Part size, e.g. 1048576, 512K, 4M (default: 1M)\n";
    std::cout << "  -j, --threads <N>        Parallel part downloads (default: 1)\n";
    std::cout << "      --discard-invalid    Start over when the checkpoint cannot be trusted\n";
    std::cout << "  -i, --info               Show object metadata without downloading\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://storage.example.com media videos/talk.mp4\n";
    std::cout << "  " << program_name << " -j 4 -p 8M -o talk.mp4 https://storage.example.com media videos/talk.mp4\n";
    std::cout << "\n";
    std::cout << "Rerunning the same command resumes an interrupted download.\n";
}

void print_version() noexcept {
    std::cout << "tessera " << tessera::version.to_string() << std::endl;
    std::cout << "Built with C++23, libcurl, OpenSSL\n";
}

} // namespace tessera::cli
