#include <catch2/catch_test_macros.hpp>

#include "core/types/Group.hpp"
#include "core/types/Node.hpp"

using namespace beamstate::core;

namespace {

Group makeGroup() {
    Group group;
    group.id = 1;
    group.name = "Core";
    group.intervalSeconds = 30;
    group.packetCount = 2;
    group.snmpCommunity = "group-secret";
    group.snmpPort = 1161;
    group.monitorPing = true;
    group.monitorSnmp = false;
    return group;
}

Node makeNode() {
    Node node;
    node.id = 10;
    node.name = "switch-1";
    node.ip = "10.0.0.1";
    node.groupId = 1;
    return node;
}

} // namespace

TEST_CASE("Node status names", "[Node]") {
    SECTION("statusToString") {
        CHECK(statusToString(NodeStatus::Waiting) == "WAITING");
        CHECK(statusToString(NodeStatus::Pending) == "PENDING");
        CHECK(statusToString(NodeStatus::Up) == "UP");
        CHECK(statusToString(NodeStatus::Down) == "DOWN");
        CHECK(statusToString(NodeStatus::Paused) == "PAUSED");
    }

    SECTION("statusFromString maps unknown names to WAITING") {
        CHECK(statusFromString("DOWN") == NodeStatus::Down);
        CHECK(statusFromString("PAUSED") == NodeStatus::Paused);
        CHECK(statusFromString("bogus") == NodeStatus::Waiting);
    }
}

TEST_CASE("Effective settings resolve against the group", "[Node]") {
    auto group = makeGroup();
    auto node = makeNode();

    SECTION("Unset values inherit from the group") {
        auto effective = resolveEffective(node, group);

        CHECK(effective.intervalSeconds == 30);
        CHECK(effective.packetCount == 2);
        CHECK(effective.snmpCommunity == "group-secret");
        CHECK(effective.snmpPort == 1161);
        CHECK(effective.monitorPing);
        CHECK_FALSE(effective.monitorSnmp);
        CHECK(effective.groupName == "Core");
    }

    SECTION("Node overrides win") {
        node.intervalSeconds = 10;
        node.snmpCommunity = "node-secret";
        node.monitorPing = false;
        node.monitorSnmp = true;

        auto effective = resolveEffective(node, group);

        CHECK(effective.intervalSeconds == 10);
        CHECK(effective.snmpCommunity == "node-secret");
        CHECK_FALSE(effective.monitorPing);
        CHECK(effective.monitorSnmp);
    }

    SECTION("Group changes show through on the next resolve") {
        group.intervalSeconds = 120;
        CHECK(resolveEffective(node, group).intervalSeconds == 120);

        node.intervalSeconds = 15;
        group.intervalSeconds = 300;
        CHECK(resolveEffective(node, group).intervalSeconds == 15);
    }

    SECTION("Enabled requires both node and group") {
        CHECK(resolveEffective(node, group).enabled());

        group.enabled = false;
        CHECK_FALSE(resolveEffective(node, group).enabled());

        group.enabled = true;
        node.enabled = false;
        CHECK_FALSE(resolveEffective(node, group).enabled());
    }

    SECTION("Explicit false is not inheritance") {
        group.monitorSnmp = true;
        node.monitorSnmp = false;
        CHECK_FALSE(resolveEffective(node, group).monitorSnmp);
    }
}

TEST_CASE("Node and group validation", "[Node]") {
    SECTION("Valid defaults") {
        CHECK(makeGroup().isValid());
        CHECK(makeNode().isValid());
    }

    SECTION("Invalid node values") {
        auto node = makeNode();
        node.name.clear();
        CHECK_FALSE(node.isValid());

        node = makeNode();
        node.groupId = 0;
        CHECK_FALSE(node.isValid());

        node = makeNode();
        node.intervalSeconds = 0;
        CHECK_FALSE(node.isValid());

        node = makeNode();
        node.notificationPriority = 3;
        CHECK_FALSE(node.isValid());

        node = makeNode();
        node.notificationPriority = -2;
        CHECK(node.isValid());
    }

    SECTION("Invalid group values") {
        auto group = makeGroup();
        group.intervalSeconds = -1;
        CHECK_FALSE(group.isValid());

        group = makeGroup();
        group.snmpCommunity.clear();
        CHECK_FALSE(group.isValid());
    }
}
