#include <catch2/catch_test_macros.hpp>

#include "monitor/CidrRange.hpp"

using namespace beamstate::monitor;

TEST_CASE("CidrRange parsing", "[CidrRange]") {
    SECTION("Standard /24") {
        auto range = CidrRange::parse("192.168.1.0/24");
        REQUIRE(range.has_value());
        CHECK(range->prefixLength() == 24);
        CHECK(range->toString() == "192.168.1.0/24");
    }

    SECTION("Host bits are masked off") {
        auto range = CidrRange::parse("10.0.0.77/24");
        REQUIRE(range.has_value());
        CHECK(range->toString() == "10.0.0.0/24");
    }

    SECTION("Bare address is a /32") {
        auto range = CidrRange::parse("10.1.2.3");
        REQUIRE(range.has_value());
        CHECK(range->prefixLength() == 32);
    }

    SECTION("Whitespace is ignored") {
        CHECK(CidrRange::parse(" 10.0.0.0 / 30 ").has_value());
    }

    SECTION("Invalid input") {
        CHECK_FALSE(CidrRange::parse("").has_value());
        CHECK_FALSE(CidrRange::parse("10.0.0.0/33").has_value());
        CHECK_FALSE(CidrRange::parse("300.0.0.0/24").has_value());
        CHECK_FALSE(CidrRange::parse("not-a-range").has_value());
    }
}

TEST_CASE("CidrRange host enumeration", "[CidrRange]") {
    SECTION("/24 excludes network and broadcast") {
        auto range = CidrRange::parse("192.168.1.0/24");
        REQUIRE(range->hostCount() == 254);

        auto hosts = range->hosts(1000);
        REQUIRE(hosts.size() == 254);
        CHECK(hosts.front().to_string() == "192.168.1.1");
        CHECK(hosts.back().to_string() == "192.168.1.254");
    }

    SECTION("/30 has two hosts") {
        auto hosts = CidrRange::parse("10.0.0.0/30")->hosts(10);
        REQUIRE(hosts.size() == 2);
        CHECK(hosts[0].to_string() == "10.0.0.1");
        CHECK(hosts[1].to_string() == "10.0.0.2");
    }

    SECTION("/31 yields both addresses") {
        auto hosts = CidrRange::parse("10.0.0.4/31")->hosts(10);
        REQUIRE(hosts.size() == 2);
        CHECK(hosts[0].to_string() == "10.0.0.4");
        CHECK(hosts[1].to_string() == "10.0.0.5");
    }

    SECTION("/32 yields its address") {
        auto hosts = CidrRange::parse("10.0.0.9/32")->hosts(10);
        REQUIRE(hosts.size() == 1);
        CHECK(hosts[0].to_string() == "10.0.0.9");
    }

    SECTION("Enumeration stops at the limit") {
        auto range = CidrRange::parse("10.0.0.0/16");
        CHECK(range->hostCount() == 65534);
        CHECK(range->hosts(100).size() == 100);
    }
}

TEST_CASE("CidrRange membership", "[CidrRange]") {
    auto range = CidrRange::parse("172.16.0.0/12");
    REQUIRE(range.has_value());

    CHECK(range->contains(asio::ip::make_address_v4("172.20.1.1")));
    CHECK_FALSE(range->contains(asio::ip::make_address_v4("172.32.0.1")));
}

TEST_CASE("IPv4 validation", "[CidrRange]") {
    CHECK(isValidIpv4("192.168.0.1"));
    CHECK(isValidIpv4("0.0.0.0"));
    CHECK_FALSE(isValidIpv4("192.168.0"));
    CHECK_FALSE(isValidIpv4("192.168.0.256"));
    CHECK_FALSE(isValidIpv4("::1"));
    CHECK_FALSE(isValidIpv4("host.example"));
    CHECK_FALSE(isValidIpv4("1.2.3.4; rm -rf /"));
}
