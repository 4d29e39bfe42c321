#include <catch2/catch_test_macros.hpp>
#include "tail_log.hpp"
#include <string>
#include <vector>

using namespace watchlogs;

namespace {

struct Captured {
    std::string component;
    std::string message;
    bool is_error;
};

} // namespace

TEST_CASE("TailLog routes through the installed sink", "[log]") {
    std::vector<Captured> captured;
    TailLog::set_sink([&captured](const std::string& component, const std::string& message, bool err) {
        captured.push_back({component, message, err});
    });

    SECTION("Info and error") {
        TailLog::log("FileTailer", "Started tailing: /a");
        TailLog::error("FileTailer", "Error reading file");

        REQUIRE(captured.size() == 2);
        REQUIRE(captured[0].component == "FileTailer");
        REQUIRE(captured[0].message == "Started tailing: /a");
        REQUIRE_FALSE(captured[0].is_error);
        REQUIRE(captured[1].is_error);
    }

    SECTION("Debug only when verbose") {
        TailLog::debug("TailSource", "quiet");
        REQUIRE(captured.empty());

        TailLog::set_verbose(true);
        TailLog::debug("TailSource", "loud");
        TailLog::set_verbose(false);

        REQUIRE(captured.size() == 1);
        REQUIRE(captured[0].message == "loud");
        REQUIRE_FALSE(captured[0].is_error);
    }

    SECTION("Resetting the sink stops delivery to the old one") {
        TailLog::set_sink(nullptr);
        TailLog::log("Main", "to the default stream");
        REQUIRE(captured.empty());
    }

    TailLog::set_sink(nullptr);
}
