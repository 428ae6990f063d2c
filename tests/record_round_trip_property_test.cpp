#define BOOST_TEST_MODULE RecordRoundTripPropertyTest
#include <boost/test/unit_test.hpp>

#include <wal_harness/wal_harness.hpp>

#include "wal_test_utilities.hpp"

#include <fstream>
#include <iterator>
#include <random>
#include <string>

namespace {
    constexpr std::size_t property_test_iterations = 40;
    constexpr std::size_t max_cluster_size = 8;
    constexpr std::size_t max_mutations = 60;

    auto read_file(const std::string& path) -> std::string {
        std::ifstream in(path);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    // Applies an arbitrary sequence of node-task style mutations
    auto mutate(wal_harness::quiet_record& record, std::mt19937& rng) -> void {
        wal_harness::wal_codec codec;
        std::uniform_int_distribution<std::size_t> node_dist(0, record.nodes().size() - 1);
        std::uniform_int_distribution<std::size_t> count_dist(0, max_mutations);
        std::uniform_int_distribution<int> op_dist(0, 4);
        std::uniform_int_distribution<std::uint64_t> height_dist(0, 30);

        auto mutations = count_dist(rng);
        for (std::size_t i = 0; i < mutations; ++i) {
            auto index = node_dist(rng);
            switch (op_dist(rng)) {
                case 0:
                    record.wal_at(index)->save(codec.encode(test_utilities::random_wal_info(rng))).get();
                    break;
                case 1:
                    record.insert_commit(height_dist(rng), test_utilities::random_bytes(rng, 32, 32));
                    break;
                case 2:
                    (void)record.commit_fingerprint(height_dist(rng));
                    break;
                case 3:
                    record.set_height(record.nodes()[index]._address, height_dist(rng));
                    break;
                default:
                    (void)record.update_alive();
                    break;
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(property_file_round_trip_preserves_snapshot, * boost::unit_test::timeout(120)) {
    std::mt19937 rng(8675309);
    std::uniform_int_distribution<std::size_t> size_dist(1, max_cluster_size);
    std::uniform_int_distribution<std::uint64_t> interval_dist(0, 10000);

    for (std::size_t iteration = 0; iteration < property_test_iterations; ++iteration) {
        test_utilities::temp_snapshot_path path("record_round_trip");
        wal_harness::quiet_record record(size_dist(rng), interval_dist(rng));
        mutate(record, rng);

        auto before = record.to_snapshot();
        record.save(path.str());
        auto restored = wal_harness::quiet_record::load(path.str());

        BOOST_REQUIRE((restored->to_snapshot() == before));
    }
}

BOOST_AUTO_TEST_CASE(property_in_memory_round_trip_preserves_snapshot, * boost::unit_test::timeout(120)) {
    std::mt19937 rng(5551212);
    std::uniform_int_distribution<std::size_t> size_dist(1, max_cluster_size);

    for (std::size_t iteration = 0; iteration < property_test_iterations; ++iteration) {
        wal_harness::quiet_record record(size_dist(rng), 3000);
        mutate(record, rng);

        auto snap = record.to_snapshot();
        auto rebuilt = wal_harness::quiet_record::from_snapshot(snap);

        BOOST_REQUIRE((rebuilt->to_snapshot() == snap));
        for (std::size_t i = 0; i < record.nodes().size(); ++i) {
            BOOST_REQUIRE((rebuilt->wal_at(i)->peek() == record.wal_at(i)->peek()));
        }
    }
}

BOOST_AUTO_TEST_CASE(property_resaving_a_loaded_record_is_byte_identical, * boost::unit_test::timeout(120)) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<std::size_t> size_dist(1, max_cluster_size);

    for (std::size_t iteration = 0; iteration < property_test_iterations; ++iteration) {
        test_utilities::temp_snapshot_path first("record_resave_a");
        test_utilities::temp_snapshot_path second("record_resave_b");
        wal_harness::quiet_record record(size_dist(rng), 3000);
        mutate(record, rng);

        record.save(first.str());
        wal_harness::quiet_record::load(first.str())->save(second.str());

        BOOST_REQUIRE_EQUAL(read_file(first.str()), read_file(second.str()));
    }
}
