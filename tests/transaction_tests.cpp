// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <tessera/core/download_transaction.hpp>
#include <tessera/core/committer.hpp>
#include <tessera/disk/digest.hpp>
#include <tessera/disk/error.hpp>
#include "test_support.hpp"

using namespace tessera::core;
using namespace tessera::test;

namespace {

TransferOptions make_options(const TempDir& dir, std::uint64_t part_size, std::uint32_t threads = 1) {
    TransferOptions options;
    options.bucket = "media";
    options.key = "videos/talk.mp4";
    options.file = dir.file("talk.mp4");
    options.part_size = part_size;
    options.threads = threads;
    return options;
}

bool no_part_files(const std::string& destination, std::size_t count) {
    for (std::uint32_t n = 1; n <= count; ++n) {
        if (fs::exists(part_file_path(destination, n))) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("DownloadTransaction downloads and commits", "[transaction]") {
    TempDir dir("txn_complete");
    const std::string payload = make_payload(2'500'000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1'048'576);

    DownloadTransaction txn(client, options);
    REQUIRE_FALSE(txn.run());

    CHECK(txn.state() == TransactionState::committed);
    CHECK(read_file(options.file) == payload);
    CHECK(client.get_calls() == 3);
    CHECK(client.requested() == std::vector<std::uint64_t>{0, 1'048'576, 2'097'152});

    CHECK_FALSE(fs::exists(txn.checkpoint_path()));
    CHECK(no_part_files(options.file, 3));
    CHECK_FALSE(fs::exists(options.file + COMMIT_SUFFIX));
}

TEST_CASE("DownloadTransaction reports progress and id", "[transaction]") {
    TempDir dir("txn_progress");
    const std::string payload = make_payload(5000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    std::vector<TransferProgress> seen;
    options.on_progress = [&seen](const TransferProgress& p) { seen.push_back(p); };

    DownloadTransaction txn(client, options);
    REQUIRE_FALSE(txn.run());

    REQUIRE(seen.size() == 5);
    CHECK(seen.front().parts_done == 1);
    CHECK(seen.back().parts_done == 5);
    CHECK(seen.back().parts_total == 5);
    CHECK(seen.back().bytes_done == 5000);
    CHECK(seen.back().bytes_total == 5000);

    CHECK(txn.record().id.starts_with("download_media_videos/talk.mp4_"));

    const auto final_progress = txn.progress();
    CHECK(final_progress.parts_done == 5);
    CHECK(final_progress.bytes_done == 5000);
}

TEST_CASE("TransactionState names", "[transaction]") {
    CHECK(std::string(to_string(TransactionState::fresh)) == "fresh");
    CHECK(std::string(to_string(TransactionState::in_progress)) == "in_progress");
    CHECK(std::string(to_string(TransactionState::committed)) == "committed");
    CHECK(std::string(to_string(TransactionState::failed)) == "failed");
}

TEST_CASE("DownloadTransaction resumes only undone parts", "[transaction]") {
    TempDir dir("txn_resume");
    const std::string payload = make_payload(2'500'000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1'048'576);

    // First run dies on the second part
    client.fail_on_get(2);
    {
        DownloadTransaction txn(client, options);
        auto ec = txn.run();
        REQUIRE(ec == TransferErrc::network_error);
        CHECK(txn.state() == TransactionState::failed);
    }

    auto persisted = CheckpointStore::load(options.resolved_checkpoint_path());
    REQUIRE(persisted.has_value());
    REQUIRE(persisted->parts.size() == 3);
    CHECK(persisted->parts[0].done);
    CHECK_FALSE(persisted->parts[1].done);
    CHECK_FALSE(persisted->parts[2].done);
    const std::string first_id = persisted->id;

    client.reset_counters();
    DownloadTransaction resumed(client, options);
    REQUIRE_FALSE(resumed.run());

    CHECK(client.requested() == std::vector<std::uint64_t>{1'048'576, 2'097'152});
    CHECK(resumed.record().id == first_id);
    CHECK(read_file(options.file) == payload);
    CHECK_FALSE(fs::exists(options.resolved_checkpoint_path()));
}

TEST_CASE("DownloadTransaction overwrites a partially written part", "[transaction]") {
    TempDir dir("txn_partial_part");
    const std::string payload = make_payload(3000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    client.fail_on_get(2);
    {
        DownloadTransaction txn(client, options);
        REQUIRE(txn.run());
    }

    // Leftover garbage from an interrupted attempt, longer than the part
    write_file(part_file_path(options.file, 2), std::string(4096, 'x'));

    DownloadTransaction resumed(client, options);
    REQUIRE_FALSE(resumed.run());
    CHECK(read_file(options.file) == payload);
}

TEST_CASE("DownloadTransaction refuses an untrusted checkpoint", "[transaction]") {
    TempDir dir("txn_untrusted");
    const std::string payload = make_payload(3000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    client.fail_on_get(3);
    {
        DownloadTransaction txn(client, options);
        REQUIRE(txn.run() == TransferErrc::network_error);
    }
    client.reset_counters();

    SECTION("Edited checkpoint") {
        std::string text = read_file(options.resolved_checkpoint_path());
        auto pos = text.find("etag-1");
        REQUIRE(pos != std::string::npos);
        text[pos + 5] = '9';
        write_file(options.resolved_checkpoint_path(), text);

        DownloadTransaction txn(client, options);
        CHECK(txn.run() == TransferErrc::token_inconsistent);
        CHECK(client.get_calls() == 0);
    }

    SECTION("Deleted part file") {
        fs::remove(part_file_path(options.file, 1));

        DownloadTransaction txn(client, options);
        CHECK(txn.run() == TransferErrc::part_missing);
        CHECK(client.get_calls() == 0);
    }

    SECTION("Altered part file") {
        write_file(part_file_path(options.file, 2), std::string(1000, 'z'));

        DownloadTransaction txn(client, options);
        CHECK(txn.run() == TransferErrc::file_inconsistent);
        CHECK(client.get_calls() == 0);
    }

    SECTION("Checkpoint of another destination") {
        auto other = options;
        other.file = dir.file("other.mp4");
        other.checkpoint_path = options.resolved_checkpoint_path();

        DownloadTransaction txn(client, other);
        CHECK(txn.run() == TransferErrc::token_inconsistent);
    }

    SECTION("Checkpoint of another object") {
        auto other = options;
        other.key = "videos/keynote.mp4";

        DownloadTransaction txn(client, other);
        CHECK(txn.run() == TransferErrc::token_inconsistent);
        CHECK(client.get_calls() == 0);
        CHECK_FALSE(fs::exists(options.file));
    }

    SECTION("Checkpoint of another bucket") {
        auto other = options;
        other.bucket = "archive";

        DownloadTransaction txn(client, other);
        CHECK(txn.run() == TransferErrc::token_inconsistent);
    }

    SECTION("Discarding the checkpoint starts over") {
        fs::remove(part_file_path(options.file, 1));
        DownloadTransaction txn(client, options);
        auto ec = txn.run();
        REQUIRE(is_checkpoint_error(ec));

        REQUIRE_FALSE(CheckpointStore::remove(txn.checkpoint_path()));
        REQUIRE_FALSE(txn.run());
        CHECK(read_file(options.file) == payload);
        CHECK(client.get_calls() == 3);
    }
}

TEST_CASE("DownloadTransaction stops when the object changes", "[transaction]") {
    TempDir dir("txn_object_changed");
    const std::string payload = make_payload(5000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    SECTION("Change during the transfer") {
        client.change_etag_after_get(2);

        DownloadTransaction txn(client, options);
        CHECK(txn.run() == TransferErrc::object_inconsistent);

        // Part 2 was fetched but never recorded, nothing after it was fetched
        CHECK(client.get_calls() == 2);
        auto persisted = CheckpointStore::load(options.resolved_checkpoint_path());
        REQUIRE(persisted.has_value());
        CHECK(persisted->parts[0].done);
        CHECK_FALSE(persisted->parts[1].done);
        CHECK_FALSE(fs::exists(options.file));
    }

    SECTION("Change between runs") {
        client.fail_on_get(3);
        {
            DownloadTransaction txn(client, options);
            REQUIRE(txn.run() == TransferErrc::network_error);
        }
        client.set_etag("etag-2");
        client.reset_counters();

        DownloadTransaction txn(client, options);
        CHECK(txn.run() == TransferErrc::object_inconsistent);
        CHECK(client.get_calls() == 1);
        CHECK_FALSE(is_checkpoint_error(TransferErrc::object_inconsistent));
    }

    SECTION("Explicit checkpoint verifies identity") {
        client.fail_on_get(1);
        DownloadTransaction txn(client, options);
        REQUIRE(txn.run() == TransferErrc::network_error);

        CHECK_FALSE(txn.checkpoint());
        client.set_etag("etag-2");
        CHECK(txn.checkpoint() == TransferErrc::object_inconsistent);
    }
}

TEST_CASE("DownloadTransaction rejects a truncated part", "[transaction]") {
    TempDir dir("txn_truncated");
    const std::string payload = make_payload(3000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    client.body_size_on_get(2, 500);
    {
        DownloadTransaction txn(client, options);
        REQUIRE(txn.run() == TransferErrc::short_read);
    }

    auto persisted = CheckpointStore::load(options.resolved_checkpoint_path());
    REQUIRE(persisted.has_value());
    CHECK(persisted->parts[0].done);
    CHECK_FALSE(persisted->parts[1].done);
    CHECK(persisted->parts[1].md5.empty());
    CHECK_FALSE(persisted->parts[2].done);
    CHECK(client.get_calls() == 2);
    CHECK_FALSE(fs::exists(options.file));

    client.reset_counters();
    DownloadTransaction resumed(client, options);
    REQUIRE_FALSE(resumed.run());
    CHECK(client.requested() == std::vector<std::uint64_t>{1000, 2000});
    CHECK(read_file(options.file) == payload);
}

TEST_CASE("DownloadTransaction after commit starts fresh", "[transaction]") {
    TempDir dir("txn_rerun");
    const std::string payload = make_payload(3000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    DownloadTransaction txn(client, options);
    REQUIRE_FALSE(txn.run());
    REQUIRE(txn.state() == TransactionState::committed);

    const std::string updated = make_payload(1500, 99);
    client.set_data(updated);
    client.set_etag("etag-2");
    client.reset_counters();

    REQUIRE_FALSE(txn.run());
    CHECK(client.get_calls() == 2);
    CHECK(txn.record().object_meta.etag == "etag-2");
    CHECK(read_file(options.file) == updated);
}

TEST_CASE("DownloadTransaction handles an empty object", "[transaction]") {
    TempDir dir("txn_empty");
    FakeObjectClient client("");
    auto options = make_options(dir, 1000);

    DownloadTransaction txn(client, options);
    REQUIRE_FALSE(txn.run());

    CHECK(client.get_calls() == 0);
    REQUIRE(fs::exists(options.file));
    CHECK(fs::file_size(options.file) == 0);
    CHECK(no_part_files(options.file, 1));
}

TEST_CASE("DownloadTransaction resumes an interrupted commit", "[transaction]") {
    TempDir dir("txn_commit_resume");
    const std::string payload = make_payload(3000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    // Every part downloaded, then the process died before commit
    client.change_etag_after_get(3);
    {
        DownloadTransaction txn(client, options);
        REQUIRE(txn.run() == TransferErrc::object_inconsistent);
    }
    client.set_etag("etag-1");
    client.reset_counters();

    auto record = *CheckpointStore::load(options.resolved_checkpoint_path());
    record.parts[2].done = true;
    write_file(part_file_path(options.file, 3), payload.substr(2000));
    record.parts[2].md5 = *tessera::disk::file_md5_hex(part_file_path(options.file, 3));
    REQUIRE_FALSE(CheckpointStore::save(record, options.resolved_checkpoint_path()));

    // Leftover of a crashed assembly
    write_file(options.file + COMMIT_SUFFIX, "partial");

    DownloadTransaction txn(client, options);
    REQUIRE_FALSE(txn.run());
    CHECK(client.get_calls() == 0);
    CHECK(read_file(options.file) == payload);
}

TEST_CASE("DownloadTransaction with parallel workers", "[transaction][concurrency]") {
    TempDir dir("txn_parallel");
    const std::string payload = make_payload(200'000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 7'000, 4);

    SECTION("Produces the same file") {
        DownloadTransaction txn(client, options);
        REQUIRE_FALSE(txn.run());

        CHECK(client.get_calls() == 29);
        CHECK(read_file(options.file) == payload);
        CHECK_FALSE(fs::exists(txn.checkpoint_path()));
    }

    SECTION("Failure leaves a consistent checkpoint") {
        client.fail_on_get(10);
        {
            DownloadTransaction txn(client, options);
            REQUIRE(txn.run() == TransferErrc::network_error);
        }

        auto persisted = CheckpointStore::load(options.resolved_checkpoint_path());
        REQUIRE(persisted.has_value());
        const auto done = std::count_if(persisted->parts.begin(), persisted->parts.end(),
                                        [](const Part& p) { return p.done; });
        CHECK(done >= 9);
        CHECK(done < 29);

        client.reset_counters();
        DownloadTransaction resumed(client, options);
        REQUIRE_FALSE(resumed.run());
        CHECK(client.get_calls() == 29 - done);
        CHECK(read_file(options.file) == payload);
    }
}

TEST_CASE("DownloadTransaction cancel", "[transaction]") {
    TempDir dir("txn_cancel");
    const std::string payload = make_payload(5000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    DownloadTransaction txn(client, options);
    client.on_get([&txn](std::uint64_t start) {
        if (start == 2000) {
            txn.cancel();
        }
    });

    CHECK(txn.run() == TransferErrc::cancelled);
    auto persisted = CheckpointStore::load(options.resolved_checkpoint_path());
    REQUIRE(persisted.has_value());
    CHECK(persisted->parts[1].done);
    CHECK_FALSE(persisted->parts[2].done);

    client.on_get({});
    client.reset_counters();
    REQUIRE_FALSE(txn.run());
    CHECK(client.get_calls() == 3);
    CHECK(read_file(options.file) == payload);
}

TEST_CASE("DownloadTransaction cancel during a checkpoint", "[transaction]") {
    TempDir dir("txn_cancel_checkpoint");
    const std::string payload = make_payload(3000);
    FakeObjectClient client(payload);
    auto options = make_options(dir, 1000);

    DownloadTransaction txn(client, options);

    // Lookups: initiate, initiate checkpoint, plan checkpoint, part 1 checkpoint.
    // The last one runs while the record is locked for saving.
    client.on_meta([&txn](int call) {
        if (call == 4) {
            txn.cancel();
        }
    });

    CHECK(txn.run() == TransferErrc::cancelled);
    CHECK(client.get_calls() == 1);

    auto persisted = CheckpointStore::load(options.resolved_checkpoint_path());
    REQUIRE(persisted.has_value());
    CHECK(persisted->parts[0].done);
    CHECK_FALSE(persisted->parts[1].done);
}

TEST_CASE("DownloadTransaction validates options", "[transaction]") {
    TempDir dir("txn_options");
    FakeObjectClient client("data");

    auto options = make_options(dir, 0);
    DownloadTransaction zero_part(client, options);
    CHECK(zero_part.run() == TransferErrc::invalid_part_size);

    options = make_options(dir, 1000, 0);
    DownloadTransaction zero_threads(client, options);
    CHECK(zero_threads.run() == TransferErrc::invalid_options);

    options = make_options(dir, 1000);
    options.bucket.clear();
    DownloadTransaction no_bucket(client, options);
    CHECK(no_bucket.run() == TransferErrc::invalid_options);

    CHECK(client.meta_calls() == 0);
}

TEST_CASE("DownloadTransaction surfaces metadata errors", "[transaction]") {
    TempDir dir("txn_meta_error");
    FakeObjectClient client("data");
    client.set_meta_error(make_error_code(TransferErrc::not_found));

    DownloadTransaction txn(client, make_options(dir, 1000));
    CHECK(txn.run() == TransferErrc::not_found);
    CHECK_FALSE(fs::exists(txn.checkpoint_path()));
}

TEST_CASE("Committer requires every part", "[transaction][commit]") {
    TempDir dir("commit_incomplete");
    CheckpointRecord record;
    record.file = dir.file("out.bin");
    record.object_meta = {"etag-1", 2000};
    record.parts = *plan_parts(2000, 1000);
    record.parts[0].done = true;

    const std::string checkpoint = dir.file("out.bin.tsckpt");
    write_file(checkpoint, "{}");

    CHECK(Committer::commit(record, checkpoint) == TransferErrc::parts_incomplete);
    CHECK(fs::exists(checkpoint));
    CHECK_FALSE(fs::exists(record.file));
}
