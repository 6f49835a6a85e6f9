#include <catch2/catch_test_macros.hpp>

#include "infrastructure/notifications/PushoverNotifier.hpp"
#include "support/QtEventLoop.hpp"

#include <QString>

#include <vector>

using namespace beamstate::infra;
using namespace beamstate::test;

TEST_CASE("Pushover message fields", "[PushoverNotifier]") {
    SECTION("Normal priority") {
        auto fields = PushoverNotifier::buildFields("tok", "usr", 0, "sw1 is DOWN", "no reply");
        CHECK(fields.at("token") == "tok");
        CHECK(fields.at("user") == "usr");
        CHECK(fields.at("title") == "sw1 is DOWN");
        CHECK(fields.at("message") == "no reply");
        CHECK(fields.at("priority") == "0");
        CHECK(fields.count("retry") == 0);
        CHECK(fields.count("expire") == 0);
    }

    SECTION("Emergency priority carries retry and expire") {
        auto fields = PushoverNotifier::buildFields("tok", "usr", 2, "t", "m");
        CHECK(fields.at("priority") == "2");
        CHECK(fields.at("retry") == "60");
        CHECK(fields.at("expire") == "3600");
    }

    SECTION("Priority is clamped to the Pushover range") {
        CHECK(PushoverNotifier::buildFields("t", "u", 7, "t", "m").at("priority") == "2");
        CHECK(PushoverNotifier::buildFields("t", "u", -5, "t", "m").at("priority") == "-2");
    }
}

TEST_CASE("Form encoding", "[PushoverNotifier]") {
    CHECK(HttpClient::encodeForm({}).empty());
    CHECK(HttpClient::encodeForm({{"a", "1"}, {"b", "2"}}) == "a=1&b=2");
    CHECK(HttpClient::encodeForm({{"title", "sw1 is DOWN"}}) == "title=sw1%20is%20DOWN");
    CHECK(HttpClient::encodeForm({{"message", "a&b=c"}}) == "message=a%26b%3Dc");
}

TEST_CASE("HttpClient failures", "[PushoverNotifier]") {
    qtApplication();
    HttpClient client("beamstate-test");

    SECTION("Invalid URL fails without a request") {
        bool called = false;
        client.postAsync("not a url", "", {}, 1000, [&](const HttpResponse& response) {
            called = true;
            CHECK_FALSE(response.success);
            CHECK_FALSE(response.retryable);
            CHECK(response.errorMessage == "invalid URL 'not a url'");
        });
        CHECK(called);
        CHECK(client.pendingCount() == 0);
    }

    SECTION("Refused connection is retryable") {
        std::vector<HttpResponse> responses;
        client.postFormAsync("http://127.0.0.1:1/", {{"a", "1"}}, 2000,
                             [&](const HttpResponse& response) { responses.push_back(response); });
        CHECK(client.pendingCount() == 1);

        REQUIRE(processEventsUntil([&]() { return !responses.empty(); }));
        CHECK_FALSE(responses[0].success);
        CHECK(responses[0].retryable);
        CHECK(responses[0].statusCode == 0);
        CHECK(client.pendingCount() == 0);
    }
}

TEST_CASE("Pushover delivery", "[PushoverNotifier]") {
    qtApplication();

    PushoverSettings settings;
    settings.apiUrl = "http://127.0.0.1:1/1/messages.json";
    settings.timeoutMs = 2000;
    settings.maxRetries = 0;
    PushoverNotifier notifier(settings);

    SECTION("Unconfigured notifier drops messages") {
        CHECK_FALSE(notifier.isConfigured());
        notifier.notify(0, "sw1 is DOWN", "no reply");
        CHECK(notifier.failedCount() == 1);
        CHECK(notifier.deliveredCount() == 0);
    }

    SECTION("Connection failures are reported") {
        notifier.configure("tok", "usr");
        REQUIRE(notifier.isConfigured());

        std::vector<QString> failedTitles;
        QObject::connect(&notifier, &PushoverNotifier::deliveryFailed,
                         [&](const QString& title, const QString&) { failedTitles.push_back(title); });
        notifier.notify(1, "sw1 is DOWN", "no reply");

        REQUIRE(processEventsUntil([&]() { return notifier.failedCount() == 1; }));
        CHECK(notifier.deliveredCount() == 0);
        REQUIRE(failedTitles.size() == 1);
        CHECK(failedTitles[0] == "sw1 is DOWN");
    }
}
