#include <catch2/catch_test_macros.hpp>

#include "app/ControlCommand.hpp"

using namespace beamstate::app;

TEST_CASE("Control command parsing", "[ControlCommand]") {
    SECTION("status") {
        auto command = parseControlCommand("status");
        REQUIRE(command.has_value());
        CHECK(command->type == ControlCommand::Type::Status);
    }

    SECTION("check") {
        auto command = parseControlCommand("check 42");
        REQUIRE(command.has_value());
        CHECK(command->type == ControlCommand::Type::Check);
        CHECK(command->nodeId == 42);

        CHECK_FALSE(parseControlCommand("check").has_value());
        CHECK_FALSE(parseControlCommand("check 0").has_value());
        CHECK_FALSE(parseControlCommand("check abc").has_value());
        CHECK_FALSE(parseControlCommand("check 12x").has_value());
    }

    SECTION("maintenance") {
        auto on = parseControlCommand("maintenance on");
        REQUIRE(on.has_value());
        CHECK(on->type == ControlCommand::Type::Maintenance);
        CHECK(on->enabled);

        auto off = parseControlCommand("  maintenance   off \n");
        REQUIRE(off.has_value());
        CHECK_FALSE(off->enabled);

        CHECK_FALSE(parseControlCommand("maintenance yes").has_value());
    }

    SECTION("scan") {
        auto plain = parseControlCommand("scan 10.0.0.0/24");
        REQUIRE(plain.has_value());
        CHECK(plain->type == ControlCommand::Type::Scan);
        CHECK(plain->cidr == "10.0.0.0/24");
        CHECK(plain->groupId == 0);

        auto importing = parseControlCommand("scan 10.0.0.0/24 3");
        REQUIRE(importing.has_value());
        CHECK(importing->groupId == 3);

        CHECK_FALSE(parseControlCommand("scan").has_value());
        CHECK_FALSE(parseControlCommand("scan 10.0.0.0/24 -1").has_value());
    }

    SECTION("trace") {
        auto defaults = parseControlCommand("trace");
        REQUIRE(defaults.has_value());
        CHECK(defaults->limit == 50);

        auto limited = parseControlCommand("trace 10");
        REQUIRE(limited.has_value());
        CHECK(limited->limit == 10);

        CHECK_FALSE(parseControlCommand("trace 0").has_value());
    }

    SECTION("Unknown or empty input") {
        CHECK_FALSE(parseControlCommand("").has_value());
        CHECK_FALSE(parseControlCommand("   ").has_value());
        CHECK_FALSE(parseControlCommand("reboot").has_value());
        CHECK_FALSE(parseControlCommand("status now").has_value());
    }
}

TEST_CASE("Control command text form", "[ControlCommand]") {
    ControlCommand command;
    CHECK(formatControlCommand(command) == "status");

    command.type = ControlCommand::Type::Check;
    command.nodeId = 7;
    CHECK(formatControlCommand(command) == "check 7");

    command.type = ControlCommand::Type::Scan;
    command.cidr = "192.168.1.0/28";
    CHECK(formatControlCommand(command) == "scan 192.168.1.0/28");
    command.groupId = 2;
    CHECK(formatControlCommand(command) == "scan 192.168.1.0/28 2");

    SECTION("Formatted commands parse back") {
        for (const char* text : {"status", "check 9", "maintenance on", "maintenance off",
                                 "scan 10.1.0.0/16 4", "trace 25"}) {
            auto parsed = parseControlCommand(text);
            REQUIRE(parsed.has_value());
            CHECK(formatControlCommand(*parsed) == text);
        }
    }
}
