#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "test_writers.hpp"

using namespace tagsink;

namespace
{

logger make_logger(const std::shared_ptr<capture_writer> &default_out)
{
    auto default_handler   = default_handler_config();
    default_handler.target = capture_target(default_out);

    return logger{logger_config{.default_handler = std::move(default_handler), .clock = fixed_clock()}};
}

} // namespace

TEST_CASE("Log lines emit on destruction", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();
    auto log = make_logger(out);

    TLOG(log, "net") << "sent " << 42 << " bytes to " << std::string("peer") << ' ' << 1.5;

    REQUIRE(out->lines() == std::vector<std::string>{"[NET] : sent 42 bytes to peer 1.5\n"});
}

TEST_CASE("Log lines without tags use the default tag", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();
    auto log = make_logger(out);

    TLOG(log) << "plain";
    TLOG(log).format("{} jobs", 3);

    REQUIRE(out->lines() == std::vector<std::string>{"[DEFAULT] : plain\n", "[DEFAULT] : 3 jobs\n"});
}

TEST_CASE("Null strings", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();
    auto log = make_logger(out);

    const char *missing = nullptr;
    TLOG(log) << "value=" << missing;

    REQUIRE(out->last() == "[DEFAULT] : value=nullptr\n");
}

TEST_CASE("endl emits immediately", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();
    auto log = make_logger(out);

    SECTION("Nothing after endl")
    {
        {
            auto line = TLOG(log, "startup");
            line << "config loaded" << endl;
            REQUIRE(out->count() == 1);
        }
        REQUIRE(out->lines() == std::vector<std::string>{"[STARTUP] : config loaded\n"});
    }

    SECTION("Text after endl is a new emission")
    {
        TLOG(log, "startup") << "first" << endl << "second";
        REQUIRE(out->lines() == std::vector<std::string>{"[STARTUP] : first\n", "[STARTUP] : second\n"});
    }
}

TEST_CASE("Log line records its call site and tags", "[log_line]")
{
    auto out  = std::make_shared<capture_writer>();
    auto log  = make_logger(out);
    auto line = TLOG(log, "a", "B");

    REQUIRE(line.tags() == tag_set{"a", "b"});
    REQUIRE(std::string(line.site().file) == "test_log_line.cpp");
    REQUIRE(line.site().line > 0);
    REQUIRE(line.site().function != nullptr);
    line << "x";
    REQUIRE(line.text() == "x");
}

TEST_CASE("Moved-from log lines do not emit", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();
    auto log = make_logger(out);

    {
        auto first  = TLOG(log, "m");
        first << "once";
        auto second = std::move(first);
    }

    REQUIRE(out->count() == 1);
}

TEST_CASE("Malformed tags throw when the line is created", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();
    auto log = make_logger(out);

    REQUIRE_THROWS_AS(TLOG(log, "two words"), invalid_tag_error);
    REQUIRE(out->count() == 0);
}

TEST_CASE("Process-wide logger", "[log_line]")
{
    auto out = std::make_shared<capture_writer>();

    auto default_handler   = default_handler_config();
    default_handler.target = capture_target(out);
    auto &log = logger::init(logger_config{.default_handler = std::move(default_handler), .clock = fixed_clock()});

    REQUIRE(&logger::instance() == &log);
    REQUIRE_THROWS_AS(logger::init(logger_config{}), std::logic_error);

    TLOG_DEFAULT("startup") << "ready";
    TLOG_DEFAULT() << "plain";

    REQUIRE(out->lines() == std::vector<std::string>{"[STARTUP] : ready\n", "[DEFAULT] : plain\n"});
}

TEST_CASE("Version string", "[log_line]") { REQUIRE(std::string(VERSION).size() > 0); }
