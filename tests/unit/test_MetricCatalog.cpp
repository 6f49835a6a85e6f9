#include <catch2/catch_test_macros.hpp>

#include "monitor/Inventory.hpp"
#include "monitor/MetricCatalog.hpp"

#include <algorithm>
#include <set>

using namespace beamstate;
using namespace beamstate::monitor;

TEST_CASE("Default metric catalog", "[MetricCatalog]") {
    auto catalog = defaultMetricCatalog();

    REQUIRE(catalog.size() == 11);

    SECTION("Every definition is valid") {
        for (const auto& definition : catalog) {
            INFO(definition.name);
            CHECK(definition.isValid());
        }
    }

    SECTION("Names are unique") {
        std::set<std::string> names;
        for (const auto& definition : catalog) {
            names.insert(definition.name);
        }
        CHECK(names.size() == catalog.size());
    }

    SECTION("Interface octet counters") {
        auto it = std::find_if(catalog.begin(), catalog.end(),
                               [](const auto& d) { return d.name == "Interface Bytes In"; });
        REQUIRE(it != catalog.end());
        CHECK(it->kind == core::MetricKind::Counter);
        CHECK(it->unit == "bytes");
        CHECK(it->needsIndex());
        CHECK(it->oid.resolve(2) == "1.3.6.1.2.1.2.2.1.10.2");
    }

    SECTION("Vendor temperature is a fixed gauge") {
        auto it = std::find_if(catalog.begin(), catalog.end(),
                               [](const auto& d) { return d.name == "Temperature"; });
        REQUIRE(it != catalog.end());
        CHECK(it->kind == core::MetricKind::Gauge);
        CHECK_FALSE(it->needsIndex());
    }
}

TEST_CASE("Seeding the metric catalog", "[MetricCatalog]") {
    Inventory inventory;

    SECTION("First seed adds all definitions") {
        CHECK(seedMetricCatalog(inventory) == 11);
        CHECK(inventory.metricDefinitions().size() == 11);
    }

    SECTION("Seeding again adds nothing") {
        seedMetricCatalog(inventory);
        CHECK(seedMetricCatalog(inventory) == 0);
        CHECK(inventory.metricDefinitions().size() == 11);
    }

    SECTION("Existing names are kept untouched") {
        core::MetricDefinition custom;
        custom.name = "Temperature";
        custom.oid = {"1.3.6.1.4.1.9.9.13.1.3.1.3.1", false};
        custom.unit = "celsius";
        auto stored = inventory.addMetricDefinition(custom);

        CHECK(seedMetricCatalog(inventory) == 10);
        auto kept = inventory.metricDefinition(stored.id);
        REQUIRE(kept.has_value());
        CHECK(kept->oid.pattern == "1.3.6.1.4.1.9.9.13.1.3.1.3.1");
    }
}
