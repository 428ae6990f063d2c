#define BOOST_TEST_MODULE JsonCodecTest
#include <boost/test/unit_test.hpp>

#include <wal_harness/exceptions.hpp>
#include <wal_harness/hex.hpp>
#include <wal_harness/json_codec.hpp>
#include <wal_harness/snapshot.hpp>

#include "wal_test_utilities.hpp"

#include <boost/json.hpp>

#include <random>
#include <sstream>
#include <string>

namespace {
    auto sample_snapshot() -> wal_harness::record_snapshot {
        std::mt19937 rng(7);
        wal_harness::node first(wal_harness::address(20, std::byte{0x01}));
        wal_harness::node second(wal_harness::address(20, std::byte{0x02}), 2, 3);

        wal_harness::record_snapshot snap;
        snap._node_record = {first, second};
        snap._alive_record = {second};
        snap._wal_record = {{first._address, test_utilities::random_wal_info(rng)},
                            {second._address, std::nullopt}};
        snap._commit_record = {{0, wal_harness::bytes(32, std::byte{0xAA})},
                               {4, wal_harness::bytes(32, std::byte{0xBB})}};
        snap._height_record = {{first._address, 4}, {second._address, 0}};
        snap._interval = 3000;
        return snap;
    }
}

BOOST_AUTO_TEST_SUITE(hex_text)

BOOST_AUTO_TEST_CASE(encodes_lowercase_with_prefix) {
    wal_harness::bytes data{std::byte{0x00}, std::byte{0xAB}, std::byte{0x7F}};
    BOOST_TEST(wal_harness::to_hex(data) == "0x00ab7f");
    BOOST_TEST(wal_harness::to_hex({}) == "0x");
}

BOOST_AUTO_TEST_CASE(decodes_either_case_with_or_without_prefix) {
    wal_harness::bytes expected{std::byte{0xDE}, std::byte{0xAD}};
    BOOST_TEST((wal_harness::from_hex("0xdead") == expected));
    BOOST_TEST((wal_harness::from_hex("0XDEAD") == expected));
    BOOST_TEST((wal_harness::from_hex("DeAd") == expected));
    BOOST_TEST(wal_harness::from_hex("0x").empty());
}

BOOST_AUTO_TEST_CASE(rejects_invalid_hex) {
    BOOST_CHECK_THROW((void)wal_harness::from_hex("0xzz"), wal_harness::snapshot_format_exception);
    BOOST_CHECK_THROW((void)wal_harness::from_hex("abc"), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(domain_types)

BOOST_AUTO_TEST_CASE(node_fields) {
    wal_harness::node n(wal_harness::address{std::byte{0x0A}, std::byte{0x0B}}, 2, 5);
    auto jv = boost::json::value_from(n);

    const auto& obj = jv.as_object();
    BOOST_TEST(obj.at("address").as_string() == "0x0a0b");
    BOOST_TEST(obj.at("propose_weight").to_number<std::uint32_t>() == 2u);
    BOOST_TEST(obj.at("vote_weight").to_number<std::uint32_t>() == 5u);
    BOOST_TEST((boost::json::value_to<wal_harness::node>(jv) == n));
}

BOOST_AUTO_TEST_CASE(wal_info_without_lock_writes_null) {
    wal_harness::wal_info info;
    info._height = 3;
    info._step = wal_harness::step::brake;
    info._from = wal_harness::precommit_qc{};

    auto jv = boost::json::value_from(info);
    const auto& obj = jv.as_object();

    BOOST_TEST(obj.at("lock").is_null());
    BOOST_TEST(obj.at("step").as_string() == "brake");
    BOOST_TEST(obj.at("from").as_object().contains("precommit_qc"));
    BOOST_TEST((boost::json::value_to<wal_harness::wal_info>(jv) == info));
}

BOOST_AUTO_TEST_CASE(random_wal_infos_survive_json) {
    std::mt19937 rng(31);
    for (int i = 0; i < 50; ++i) {
        auto info = test_utilities::random_wal_info(rng);
        auto text = boost::json::serialize(boost::json::value_from(info));
        BOOST_REQUIRE((boost::json::value_to<wal_harness::wal_info>(boost::json::parse(text)) == info));
    }
}

BOOST_AUTO_TEST_CASE(unknown_step_is_rejected) {
    auto jv = boost::json::value_from(wal_harness::wal_info{});
    jv.as_object()["step"] = "finalize";

    BOOST_CHECK_THROW((void)boost::json::value_to<wal_harness::wal_info>(jv), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_CASE(certificate_must_be_single_known_kind) {
    auto jv = boost::json::value_from(wal_harness::wal_info{});
    jv.as_object()["from"] = boost::json::object{{"commit_qc", nullptr}};
    BOOST_CHECK_THROW((void)boost::json::value_to<wal_harness::wal_info>(jv), wal_harness::snapshot_format_exception);

    jv.as_object()["from"] = boost::json::object{};
    BOOST_CHECK_THROW((void)boost::json::value_to<wal_harness::wal_info>(jv), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_CASE(negative_height_is_rejected) {
    auto jv = boost::json::value_from(wal_harness::block{});
    jv.as_object()["height"] = -1;

    BOOST_CHECK_THROW((void)boost::json::value_to<wal_harness::block>(jv), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_CASE(oversized_weight_is_rejected) {
    auto jv = boost::json::value_from(wal_harness::node(wal_harness::address(20, std::byte{1})));
    jv.as_object()["vote_weight"] = std::uint64_t{1} << 40;

    BOOST_CHECK_THROW((void)boost::json::value_to<wal_harness::node>(jv), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(snapshot_document)

BOOST_AUTO_TEST_CASE(document_has_every_record_field) {
    auto jv = boost::json::value_from(sample_snapshot());
    const auto& obj = jv.as_object();

    for (const char* key : {"node_record", "alive_record", "wal_record", "commit_record", "height_record", "interval"}) {
        BOOST_TEST(obj.contains(key), "missing " << key);
    }
    BOOST_TEST(obj.at("interval").to_number<std::uint64_t>() == 3000u);

    const auto& wal_record = obj.at("wal_record").as_array();
    BOOST_REQUIRE_EQUAL(wal_record.size(), 2u);
    BOOST_TEST(wal_record[0].as_array()[1].is_object());
    BOOST_TEST(wal_record[1].as_array()[1].is_null());

    const auto& commit_record = obj.at("commit_record").as_array();
    BOOST_TEST(commit_record[1].as_array()[0].to_number<std::uint64_t>() == 4u);
}

BOOST_AUTO_TEST_CASE(written_document_reads_back) {
    auto snap = sample_snapshot();
    std::stringstream stream;

    wal_harness::write_snapshot(stream, snap);
    auto restored = wal_harness::read_snapshot(stream);

    BOOST_TEST((restored == snap));
}

BOOST_AUTO_TEST_CASE(rendering_is_indented_and_stable) {
    auto snap = sample_snapshot();
    std::ostringstream first;
    std::ostringstream second;

    wal_harness::write_snapshot(first, snap);
    wal_harness::write_snapshot(second, snap);

    BOOST_TEST(first.str() == second.str());
    BOOST_TEST(first.str().rfind("{\n  \"node_record\": [\n", 0) == 0u);
    BOOST_TEST(first.str().back() == '\n');
}

BOOST_AUTO_TEST_CASE(pretty_printer_layout) {
    boost::json::value jv = {{"a", 1}, {"b", boost::json::array{true, nullptr}}, {"c", boost::json::object{}}};
    std::ostringstream out;

    wal_harness::write_pretty(out, jv);

    BOOST_TEST(out.str() == "{\n  \"a\": 1,\n  \"b\": [\n    true,\n    null\n  ],\n  \"c\": {}\n}\n");
}

BOOST_AUTO_TEST_CASE(malformed_text_is_format_error) {
    std::istringstream stream("{\"node_record\": [");
    BOOST_CHECK_THROW((void)wal_harness::read_snapshot(stream), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_CASE(missing_field_is_format_error) {
    auto jv = boost::json::value_from(sample_snapshot());
    jv.as_object().erase("height_record");
    std::istringstream stream(boost::json::serialize(jv));

    BOOST_CHECK_THROW((void)wal_harness::read_snapshot(stream), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_CASE(wrong_pair_shape_is_format_error) {
    auto jv = boost::json::value_from(sample_snapshot());
    boost::json::array short_pair;
    short_pair.emplace_back(1);
    boost::json::array commit_record;
    commit_record.emplace_back(std::move(short_pair));
    jv.as_object()["commit_record"] = std::move(commit_record);
    std::istringstream stream(boost::json::serialize(jv));

    BOOST_CHECK_THROW((void)wal_harness::read_snapshot(stream), wal_harness::snapshot_format_exception);
}

BOOST_AUTO_TEST_SUITE_END()
