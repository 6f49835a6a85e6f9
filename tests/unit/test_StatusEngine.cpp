#include <catch2/catch_test_macros.hpp>

#include "monitor/StatusCache.hpp"
#include "monitor/StatusEngine.hpp"

#include <thread>
#include <vector>

using namespace beamstate::monitor;
using beamstate::core::NodeStatus;
using beamstate::core::StatusRecord;

namespace {

CheckOutcome success(double latencyMs = 5.0) {
    CheckOutcome outcome;
    outcome.success = true;
    outcome.latencyMs = latencyMs;
    outcome.packetLoss = 0.0;
    outcome.timestamp = std::chrono::system_clock::now();
    return outcome;
}

CheckOutcome timeout() {
    CheckOutcome outcome;
    outcome.success = false;
    outcome.timedOut = true;
    outcome.packetLoss = 100.0;
    outcome.detail = "ping timeout";
    outcome.timestamp = std::chrono::system_clock::now();
    return outcome;
}

CheckOutcome refused() {
    CheckOutcome outcome = timeout();
    outcome.timedOut = false;
    outcome.detail = "snmp authentication error";
    return outcome;
}

} // namespace

TEST_CASE("StatusEngine first result", "[StatusEngine]") {
    StatusEngine engine(3);
    StatusRecord record;
    REQUIRE(record.status == NodeStatus::Waiting);

    SECTION("Success goes from WAITING to UP") {
        auto transition = engine.applyResult(record, success(12.5));

        REQUIRE(transition.has_value());
        CHECK(transition->from == NodeStatus::Waiting);
        CHECK(transition->to == NodeStatus::Up);
        CHECK(record.lastLatencyMs == 12.5);
        CHECK(record.lastCheck.has_value());
    }

    SECTION("Failure goes from WAITING to PENDING") {
        auto transition = engine.applyResult(record, timeout());

        REQUIRE(transition.has_value());
        CHECK(transition->to == NodeStatus::Pending);
        CHECK(record.consecutiveFailures == 1);
        CHECK(transition->reason == "ping timeout (retry 1/3)");
    }

    SECTION("Failure goes straight to DOWN with a single retry") {
        StatusEngine strict(1);
        auto transition = strict.applyResult(record, timeout());

        REQUIRE(transition.has_value());
        CHECK(transition->to == NodeStatus::Down);
    }
}

TEST_CASE("StatusEngine retries before declaring DOWN", "[StatusEngine]") {
    StatusEngine engine(3);
    StatusRecord record;

    SECTION("Three timeouts emit exactly two transitions") {
        std::vector<Transition> transitions;
        for (int i = 0; i < 3; ++i) {
            if (auto t = engine.applyResult(record, timeout())) {
                transitions.push_back(*t);
            }
        }

        REQUIRE(transitions.size() == 2);
        CHECK(transitions[0].from == NodeStatus::Waiting);
        CHECK(transitions[0].to == NodeStatus::Pending);
        CHECK(transitions[1].from == NodeStatus::Pending);
        CHECK(transitions[1].to == NodeStatus::Down);
        CHECK(transitions[1].reason == "3 consecutive timeouts");
        CHECK(record.status == NodeStatus::Down);
    }

    SECTION("Mixed failures are reported as failures") {
        engine.applyResult(record, timeout());
        engine.applyResult(record, refused());
        auto down = engine.applyResult(record, timeout());

        REQUIRE(down.has_value());
        CHECK(down->reason == "3 consecutive failures");
    }

    SECTION("Further failures keep DOWN silently") {
        for (int i = 0; i < 3; ++i) {
            engine.applyResult(record, timeout());
        }
        REQUIRE(record.status == NodeStatus::Down);

        CHECK_FALSE(engine.applyResult(record, timeout()).has_value());
        CHECK(record.status == NodeStatus::Down);
        CHECK(record.consecutiveFailures == 4);
    }

    SECTION("Exactly max_retries failures are needed") {
        StatusEngine five(5);
        for (int i = 0; i < 4; ++i) {
            five.applyResult(record, timeout());
        }
        CHECK(record.status == NodeStatus::Pending);
        five.applyResult(record, timeout());
        CHECK(record.status == NodeStatus::Down);
    }
}

TEST_CASE("StatusEngine recovery", "[StatusEngine]") {
    StatusEngine engine(3);
    StatusRecord record;

    SECTION("Success after DOWN returns to UP with counter reset") {
        for (int i = 0; i < 3; ++i) {
            engine.applyResult(record, timeout());
        }

        auto transition = engine.applyResult(record, success());

        REQUIRE(transition.has_value());
        CHECK(transition->from == NodeStatus::Down);
        CHECK(transition->to == NodeStatus::Up);
        CHECK(transition->reason == "responded after outage");
        CHECK(record.consecutiveFailures == 0);
    }

    SECTION("Success while PENDING returns to UP") {
        engine.applyResult(record, success());
        engine.applyResult(record, timeout());
        REQUIRE(record.status == NodeStatus::Pending);

        auto transition = engine.applyResult(record, success());

        REQUIRE(transition.has_value());
        CHECK(transition->to == NodeStatus::Up);
        CHECK(transition->reason == "recovered after 1 failed check");
        CHECK(record.consecutiveFailures == 0);
    }

    SECTION("UP to UP is silent") {
        engine.applyResult(record, success());
        CHECK_FALSE(engine.applyResult(record, success()).has_value());
    }
}

TEST_CASE("StatusEngine pause and resume", "[StatusEngine]") {
    StatusEngine engine(3);
    StatusRecord record;
    engine.applyResult(record, success(7.0));
    engine.applyResult(record, timeout());
    REQUIRE(record.status == NodeStatus::Pending);

    SECTION("Pause keeps cached values and remembers the status") {
        auto lastCheck = record.lastCheck;
        auto transition = engine.applyPause(record, "paused by user");

        REQUIRE(transition.has_value());
        CHECK(transition->from == NodeStatus::Pending);
        CHECK(transition->to == NodeStatus::Paused);
        CHECK(transition->reason == "paused by user");
        CHECK(record.statusBeforePause == NodeStatus::Pending);
        CHECK(record.lastCheck == lastCheck);
    }

    SECTION("Pausing twice emits nothing") {
        engine.applyPause(record, "paused by user");
        CHECK_FALSE(engine.applyPause(record, "paused by user").has_value());
    }

    SECTION("Results are ignored while paused") {
        engine.applyPause(record, "paused by user");
        CHECK_FALSE(engine.applyResult(record, success()).has_value());
        CHECK(record.status == NodeStatus::Paused);
    }

    SECTION("Resume restores the previous status with the counter reset") {
        engine.applyPause(record, "group 'Core' disabled");
        auto transition = engine.applyResume(record, "resumed by user");

        REQUIRE(transition.has_value());
        CHECK(transition->from == NodeStatus::Paused);
        CHECK(transition->to == NodeStatus::Pending);
        CHECK(record.consecutiveFailures == 0);
        CHECK_FALSE(record.statusBeforePause.has_value());
    }

    SECTION("Resume of a node that is not paused does nothing") {
        CHECK_FALSE(engine.applyResume(record, "resumed by user").has_value());
    }
}

TEST_CASE("StatusEngine clamps max retries", "[StatusEngine]") {
    CHECK(StatusEngine(0).maxRetries() == 1);
    CHECK(StatusEngine(-4).maxRetries() == 1);
    CHECK(StatusEngine(7).maxRetries() == 7);
}

TEST_CASE("StatusCache hands out copies", "[StatusCache]") {
    StatusCache cache;

    SECTION("Unknown node has no snapshot") {
        CHECK_FALSE(cache.snapshot(42).has_value());
    }

    SECTION("Update creates the record") {
        cache.update(1, [](StatusRecord& record) { record.status = NodeStatus::Up; });

        auto snapshot = cache.snapshot(1);
        REQUIRE(snapshot.has_value());
        CHECK(snapshot->status == NodeStatus::Up);
        CHECK(cache.size() == 1);
    }

    SECTION("Modifying a snapshot leaves the cache untouched") {
        cache.update(1, [](StatusRecord& record) { record.consecutiveFailures = 2; });
        auto snapshot = cache.snapshot(1);
        snapshot->consecutiveFailures = 99;

        CHECK(cache.snapshot(1)->consecutiveFailures == 2);
    }

    SECTION("Concurrent writers on different nodes") {
        std::vector<std::thread> threads;
        for (int node = 1; node <= 8; ++node) {
            threads.emplace_back([&cache, node]() {
                for (int i = 0; i < 1000; ++i) {
                    cache.update(node, [](StatusRecord& record) { ++record.consecutiveFailures; });
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        auto all = cache.snapshotAll();
        REQUIRE(all.size() == 8);
        for (const auto& [id, record] : all) {
            CHECK(record.consecutiveFailures == 1000);
        }
    }

    SECTION("Remove and clear") {
        cache.update(1, [](StatusRecord&) {});
        cache.update(2, [](StatusRecord&) {});
        cache.remove(1);
        CHECK_FALSE(cache.snapshot(1).has_value());
        cache.clear();
        CHECK(cache.size() == 0);
    }
}
