#include "infrastructure/network/CommandProbeTransport.hpp"

#include "monitor/CidrRange.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace beamstate::infra {

namespace {

constexpr int EXIT_NOT_FOUND = 127;

// Extra time granted to the child beyond the probe timeout before it is killed
constexpr std::chrono::milliseconds PROCESS_GRACE{1000};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

int timeoutSeconds(std::chrono::milliseconds timeout) {
    auto seconds = (timeout.count() + 999) / 1000;
    return static_cast<int>(std::max<int64_t>(seconds, 1));
}

} // namespace

CommandProbeTransport::CommandProbeTransport(AsioContext& probePool, CommandProbeConfig config)
    : pool_(probePool), config_(std::move(config)) {}

bool CommandProbeTransport::isValidIpv4(const std::string& ip) {
    return monitor::isValidIpv4(ip);
}

bool CommandProbeTransport::isValidOid(const std::string& oid) {
    static const std::regex pattern(R"(^\.?[0-9]+(\.[0-9]+)*$)");
    return oid.size() <= 512 && std::regex_match(oid, pattern);
}

bool CommandProbeTransport::isValidCommunity(const std::string& community) {
    if (community.empty() || community.size() > 64 || community.front() == '-') {
        return false;
    }
    return std::all_of(community.begin(), community.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isprint(uc) != 0;
    });
}

void CommandProbeTransport::reportMissingTool(const std::string& tool) {
    auto& flag = tool == config_.pingCommand ? pingMissingLogged_ : snmpMissingLogged_;
    if (!flag.exchange(true)) {
        spdlog::error("Probe command '{}' could not be executed; install it or fix PATH", tool);
    }
}

void CommandProbeTransport::pingAsync(const std::string& ip, std::chrono::milliseconds timeout,
                                      int count, PingCallback callback) {
    pool_.post([this, ip, timeout, count, callback = std::move(callback)]() {
        callback(ping(ip, timeout, count));
    });
}

void CommandProbeTransport::snmpGetAsync(const core::SnmpGetRequest& request,
                                         SnmpCallback callback) {
    pool_.post([this, request, callback = std::move(callback)]() { callback(snmpGet(request)); });
}

core::PingResult CommandProbeTransport::ping(const std::string& ip,
                                             std::chrono::milliseconds timeout, int count) {
    if (!isValidIpv4(ip)) {
        core::PingResult result;
        result.outcome = core::PingOutcome::Unreachable;
        result.errorMessage = fmt::format("invalid IPv4 address '{}'", ip);
        return result;
    }

    count = std::clamp(count, 1, 10);
    std::vector<std::string> argv{config_.pingCommand,
                                  "-n",
                                  "-q",
                                  "-c",
                                  std::to_string(count),
                                  "-i",
                                  "0.2",
                                  "-W",
                                  std::to_string(timeoutSeconds(timeout)),
                                  ip};

    auto output = runCommand(argv, timeout * count + PROCESS_GRACE);
    if (!output.started || output.exitCode == EXIT_NOT_FOUND) {
        reportMissingTool(config_.pingCommand);
    }

    auto result = parsePingOutput(output, count);
    spdlog::debug("ping {}: {}{}", ip, core::outcomeToString(result.outcome),
                  result.latencyMs ? fmt::format(" {:.2f}ms", *result.latencyMs) : "");
    return result;
}

core::PingResult CommandProbeTransport::parsePingOutput(const CommandOutput& output, int count) {
    core::PingResult result;

    if (!output.started || output.exitCode == EXIT_NOT_FOUND) {
        result.outcome = core::PingOutcome::Unreachable;
        result.errorMessage = "ping command not available";
        return result;
    }
    if (output.timedOut) {
        result.outcome = core::PingOutcome::Timeout;
        result.errorMessage = "ping did not finish in time";
        return result;
    }

    // "3 packets transmitted, 2 received, 33.3333% packet loss"
    static const std::regex summary(R"((\d+) packets transmitted, (\d+) (?:packets )?received)");
    // "rtt min/avg/max/mdev = 0.045/0.052/0.061/0.007 ms"
    static const std::regex rtt(R"(= [0-9.]+/([0-9.]+)/[0-9.]+)");

    int transmitted = count;
    int received = 0;
    std::smatch match;
    if (std::regex_search(output.output, match, summary)) {
        transmitted = std::stoi(match[1].str());
        received = std::stoi(match[2].str());
    }

    if (transmitted > 0) {
        result.packetLossPercent =
            100.0 * static_cast<double>(transmitted - received) / static_cast<double>(transmitted);
    }

    if (received > 0) {
        result.outcome = core::PingOutcome::Success;
        if (std::regex_search(output.output, match, rtt)) {
            result.latencyMs = std::stod(match[1].str());
        }
        return result;
    }

    if (contains(output.output, "Unreachable") || contains(output.output, "unknown host") ||
        contains(output.output, "Network is unreachable")) {
        result.outcome = core::PingOutcome::Unreachable;
        result.errorMessage = "destination unreachable";
    } else if (output.exitCode == 1 || output.exitCode == 0) {
        result.outcome = core::PingOutcome::Timeout;
        result.errorMessage = "no reply";
    } else {
        result.outcome = core::PingOutcome::Unreachable;
        result.errorMessage = trim(output.output);
    }
    return result;
}

core::SnmpResult CommandProbeTransport::snmpGet(const core::SnmpGetRequest& request) {
    core::SnmpResult result;
    if (!isValidIpv4(request.ip)) {
        result.outcome = core::SnmpOutcome::Unavailable;
        result.errorMessage = fmt::format("invalid IPv4 address '{}'", request.ip);
        return result;
    }
    if (!isValidOid(request.oid)) {
        result.outcome = core::SnmpOutcome::Unavailable;
        result.errorMessage = fmt::format("invalid OID '{}'", request.oid);
        return result;
    }
    if (!isValidCommunity(request.community)) {
        result.outcome = core::SnmpOutcome::AuthError;
        result.errorMessage = "invalid community string";
        return result;
    }

    auto timeoutSec = static_cast<double>(std::max<int64_t>(request.timeout.count(), 100)) / 1000.0;
    std::vector<std::string> argv{config_.snmpGetCommand,
                                  "-v2c",
                                  "-c",
                                  request.community,
                                  "-t",
                                  fmt::format("{:.3f}", timeoutSec),
                                  "-r",
                                  "0",
                                  "-Oqvtn",
                                  fmt::format("udp:{}:{}", request.ip, request.port),
                                  request.oid};

    auto started = std::chrono::steady_clock::now();
    auto output = runCommand(argv, request.timeout + PROCESS_GRACE);
    if (!output.started || output.exitCode == EXIT_NOT_FOUND) {
        reportMissingTool(config_.snmpGetCommand);
    }

    result = parseSnmpOutput(output);
    if (result.success()) {
        result.latencyMs = std::chrono::duration<double, std::milli>(
                               std::chrono::steady_clock::now() - started)
                               .count();
    }
    spdlog::debug("snmpget {} {}: {}", request.ip, request.oid,
                  result.success() ? result.value : core::outcomeToString(result.outcome));
    return result;
}

core::SnmpResult CommandProbeTransport::parseSnmpOutput(const CommandOutput& output) {
    core::SnmpResult result;
    const auto text = trim(output.output);

    if (!output.started || output.exitCode == EXIT_NOT_FOUND) {
        result.outcome = core::SnmpOutcome::Unavailable;
        result.errorMessage = "snmpget command not available";
        return result;
    }
    if (output.timedOut || contains(text, "Timeout") || contains(text, "No Response")) {
        result.outcome = core::SnmpOutcome::Timeout;
        result.errorMessage = "no response";
        return result;
    }
    if (contains(text, "No Such Object") || contains(text, "No Such Instance") ||
        contains(text, "No more variables")) {
        result.outcome = core::SnmpOutcome::NoSuchObject;
        result.errorMessage = text;
        return result;
    }
    if (contains(text, "authorizationError") || contains(text, "Authentication failure") ||
        contains(text, "authenticationFailure")) {
        result.outcome = core::SnmpOutcome::AuthError;
        result.errorMessage = text;
        return result;
    }
    if (output.exitCode != 0) {
        result.outcome = core::SnmpOutcome::Unavailable;
        result.errorMessage = text.empty() ? fmt::format("snmpget exited with {}", output.exitCode)
                                           : text;
        return result;
    }

    std::string value = text;
    // Only the first line carries the value; multi-line strings are cut there
    if (auto newline = value.find('\n'); newline != std::string::npos) {
        value = trim(value.substr(0, newline));
    }
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
    }

    result.outcome = core::SnmpOutcome::Success;
    result.value = value;
    return result;
}

} // namespace beamstate::infra
