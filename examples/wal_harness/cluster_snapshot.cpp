/**
 * Example: Freezing and Restoring a Simulated Cluster
 *
 * This example demonstrates:
 * 1. Node tasks writing consensus state into their mock WALs
 * 2. Tracking commits and per-node heights
 * 3. Saving the record to a JSON fixture and loading it back
 * 4. Rejection of a WAL that does not decode
 */

#include <wal_harness/wal_harness.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>
#include <folly/init/Init.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {
    constexpr std::size_t cluster_size = 4;
    constexpr std::uint64_t interval_ms = 3000;
    constexpr std::uint64_t rounds = 5;
    constexpr std::size_t worker_threads = 4;

    auto example_path(const std::string& stem) -> std::string {
        return (std::filesystem::temp_directory_path() / (stem + ".json")).string();
    }

    auto make_state(std::uint64_t height, const wal_harness::node& leader) -> wal_harness::wal_info {
        wal_harness::aggregated_vote vote;
        vote._vote_type = wal_harness::vote_type::precommit;
        vote._height = height;
        vote._round = 0;
        vote._block_hash = wal_harness::generate_random_bytes(32);
        vote._leader = leader._address;

        wal_harness::wal_info info;
        info._height = height + 1;
        info._round = 0;
        info._step = wal_harness::step::propose;
        info._from = wal_harness::precommit_qc{vote};
        return info;
    }

    // One consensus round per iteration: persist state, commit, advance height
    auto run_cluster(wal_harness::record& record) -> void {
        folly::CPUThreadPoolExecutor executor(worker_threads);
        const auto& roster = record.nodes();

        for (std::uint64_t height = 1; height <= rounds; ++height) {
            auto alive = record.update_alive();
            const auto& leader = alive.front();

            std::vector<folly::Future<folly::Unit>> node_tasks;
            for (const auto& n : alive) {
                node_tasks.push_back(folly::makeFuture().via(&executor).thenValue(
                    [&record, &leader, addr = n._address, height](folly::Unit) {
                        wal_harness::wal_codec codec;
                        record.wal(addr)->save(codec.encode(make_state(height, leader))).get();
                        record.set_height(addr, height);
                    }));
            }
            folly::collectAll(std::move(node_tasks)).get();

            record.insert_commit(height, wal_harness::generate_random_bytes(32));
            std::cout << "    Height " << height << " committed by " << alive.size()
                      << " of " << roster.size() << " nodes\n";
        }
    }
}

auto test_run_and_save() -> bool {
    std::cout << "Test 1: Run cluster and save record\n";

    try {
        wal_harness::record record(cluster_size, interval_ms,
                                   wal_harness::console_logger(wal_harness::log_level::info));
        run_cluster(record);

        auto path = example_path("wal_harness_cluster_snapshot");
        record.save(path);

        std::cout << "  Saved record:\n";
        std::cout << "    Nodes: " << record.nodes().size() << "\n";
        std::cout << "    Alive: " << record.alive_nodes().size() << "\n";
        std::cout << "    Commits retained: " << record.commit_count() << "\n";
        std::cout << "    File: " << path << "\n";

        std::cout << "  ✓ Scenario passed\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto test_reload_matches() -> bool {
    std::cout << "\nTest 2: Reload record and compare\n";

    try {
        wal_harness::record record(cluster_size, interval_ms,
                                   wal_harness::console_logger(wal_harness::log_level::warning));
        run_cluster(record);

        auto path = example_path("wal_harness_cluster_reload");
        record.save(path);
        auto restored = wal_harness::record::load(path, wal_harness::console_logger(wal_harness::log_level::warning));

        if (!(restored->to_snapshot() == record.to_snapshot())) {
            std::cerr << "  ✗ Failed: Restored record differs from the original\n";
            return false;
        }

        if (restored->interval_duration() != wal_harness::interval_duration(interval_ms)) {
            std::cerr << "  ✗ Failed: Interval was not preserved\n";
            return false;
        }

        for (const auto& [addr, height] : restored->height_entries()) {
            std::cout << "    " << wal_harness::to_hex(addr) << " at height " << height << "\n";
        }

        std::filesystem::remove(path);
        std::cout << "  ✓ Scenario passed\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto test_corrupt_wal_rejected() -> bool {
    std::cout << "\nTest 3: Corrupt WAL is rejected on save\n";

    try {
        wal_harness::quiet_record record(cluster_size, interval_ms);
        record.wal_at(0)->save(wal_harness::bytes{std::byte{0xDE}, std::byte{0xAD}}).get();

        try {
            record.save(example_path("wal_harness_cluster_corrupt"));
            std::cerr << "  ✗ Failed: Save accepted an undecodable WAL\n";
            return false;
        } catch (const wal_harness::wal_decode_exception& e) {
            std::cout << "  Rejected: " << e.what() << "\n";
        }

        std::cout << "  ✓ Scenario passed\n";
        return true;

    } catch (const std::exception& e) {
        std::cerr << "  ✗ Scenario failed: " << e.what() << "\n";
        return false;
    }
}

auto main(int argc, char* argv[]) -> int {
    folly::Init init(&argc, &argv);

    std::cout << "========================================\n";
    std::cout << "  WAL Harness Cluster Snapshot Example\n";
    std::cout << "========================================\n\n";

    int failed_scenarios = 0;

    if (!test_run_and_save()) failed_scenarios++;
    if (!test_reload_matches()) failed_scenarios++;
    if (!test_corrupt_wal_rejected()) failed_scenarios++;

    std::cout << "\n========================================\n";
    if (failed_scenarios > 0) {
        std::cout << "  " << failed_scenarios << " scenario(s) failed\n";
        std::cout << "========================================\n";
        return 1;
    }

    std::cout << "  All scenarios passed!\n";
    std::cout << "========================================\n";
    return 0;
}
