#define BOOST_TEST_MODULE ConsoleLoggerTest
#include <boost/test/unit_test.hpp>

#include <wal_harness/console_logger.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {
    constexpr std::size_t concurrent_writers = 4;
    constexpr std::size_t messages_per_writer = 50;

    // Has the per-level calls but cannot attach fields to them
    struct message_only_logger {
        auto log(wal_harness::log_level, std::string_view) -> void {}
        auto log(wal_harness::log_level, std::string_view, const wal_harness::log_fields&) -> void {}
        auto trace(std::string_view) -> void {}
        auto debug(std::string_view) -> void {}
        auto info(std::string_view) -> void {}
        auto warning(std::string_view) -> void {}
        auto error(std::string_view) -> void {}
        auto critical(std::string_view) -> void {}
    };

    auto count_lines(const std::string& text) -> std::size_t {
        return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
    }
}

static_assert(wal_harness::diagnostic_logger<wal_harness::console_logger>);
static_assert(wal_harness::diagnostic_logger<wal_harness::null_logger>);
static_assert(!wal_harness::diagnostic_logger<message_only_logger>,
    "records attach fields to per-level calls");

BOOST_AUTO_TEST_SUITE(levels)

BOOST_AUTO_TEST_CASE(level_names_round_trip) {
    using wal_harness::log_level;
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warning, log_level::error, log_level::critical}) {
        BOOST_TEST((wal_harness::parse_log_level(wal_harness::to_string(level)) == level));
    }
}

BOOST_AUTO_TEST_CASE(parse_is_case_insensitive) {
    BOOST_TEST((wal_harness::parse_log_level("warning") == wal_harness::log_level::warning));
    BOOST_TEST((wal_harness::parse_log_level("Critical") == wal_harness::log_level::critical));
    BOOST_TEST(!wal_harness::parse_log_level("verbose").has_value());
    BOOST_TEST(!wal_harness::parse_log_level("").has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(output)

BOOST_AUTO_TEST_CASE(structured_fields_follow_message) {
    std::ostringstream out;
    std::ostringstream err;
    wal_harness::console_logger logger(wal_harness::log_level::trace, out, err);

    logger.info("Saved record snapshot", {{"path", "/tmp/x.json"}, {"nodes", "4"}});

    auto line = out.str();
    BOOST_TEST(line.find("INFO: Saved record snapshot [path=/tmp/x.json] [nodes=4]\n") != std::string::npos);
    BOOST_TEST(err.str().empty());
}

BOOST_AUTO_TEST_CASE(errors_go_to_error_stream) {
    std::ostringstream out;
    std::ostringstream err;
    wal_harness::console_logger logger(wal_harness::log_level::trace, out, err);

    logger.warning("slow node");
    logger.error("write failed");
    logger.critical("snapshot rejected");

    BOOST_TEST(count_lines(out.str()) == 1u);
    BOOST_TEST(count_lines(err.str()) == 2u);
    BOOST_TEST(err.str().find("CRITICAL: snapshot rejected") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(messages_below_minimum_are_dropped) {
    std::ostringstream out;
    std::ostringstream err;
    wal_harness::console_logger logger(wal_harness::log_level::info, out, err);

    logger.trace("hidden");
    logger.debug("hidden");
    logger.info("shown");

    BOOST_TEST(count_lines(out.str()) == 1u);
    BOOST_TEST(out.str().find("hidden") == std::string::npos);

    logger.set_min_level(wal_harness::log_level::critical);
    BOOST_TEST((logger.get_min_level() == wal_harness::log_level::critical));
    logger.error("also hidden");
    BOOST_TEST(err.str().empty());
}

BOOST_AUTO_TEST_CASE(concurrent_messages_stay_whole, * boost::unit_test::timeout(30)) {
    std::ostringstream out;
    std::ostringstream err;
    wal_harness::console_logger logger(wal_harness::log_level::trace, out, err);
    folly::CPUThreadPoolExecutor executor(concurrent_writers);

    std::vector<folly::Future<folly::Unit>> writers;
    for (std::size_t w = 0; w < concurrent_writers; ++w) {
        writers.push_back(folly::makeFuture().via(&executor).thenValue([&logger, w](folly::Unit) {
            auto writer = std::to_string(w);
            for (std::size_t i = 0; i < messages_per_writer; ++i) {
                logger.debug("node task tick", {{"writer", writer}});
            }
        }));
    }
    folly::collectAll(std::move(writers)).get();

    std::istringstream lines(out.str());
    std::string line;
    std::size_t total = 0;
    while (std::getline(lines, line)) {
        ++total;
        BOOST_REQUIRE(line.find("DEBUG: node task tick [writer=") != std::string::npos);
    }
    BOOST_TEST(total == concurrent_writers * messages_per_writer);
}

BOOST_AUTO_TEST_CASE(null_logger_accepts_everything) {
    wal_harness::null_logger logger;
    logger.critical("ignored", {{"reason", "none"}});
    logger.log(wal_harness::log_level::info, "ignored");
    BOOST_TEST(true);
}

BOOST_AUTO_TEST_SUITE_END()
