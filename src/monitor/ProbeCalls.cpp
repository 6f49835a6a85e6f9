#include "monitor/ProbeCalls.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <future>
#include <memory>

namespace beamstate::monitor {

namespace {

std::atomic<bool> transportFailureLogged{false};

void reportTransportFailure(const char* probe, const std::string& target,
                            const std::exception& e) {
    if (!transportFailureLogged.exchange(true)) {
        spdlog::error("Probe transport unavailable ({} {}): {}", probe, target, e.what());
    } else {
        spdlog::debug("Probe transport still unavailable ({} {}): {}", probe, target, e.what());
    }
}

void reportTransportAnswered() {
    if (transportFailureLogged.exchange(false)) {
        spdlog::info("Probe transport available again");
    }
}

core::PingResult pingFailure(core::PingOutcome outcome, std::string message) {
    core::PingResult result;
    result.outcome = outcome;
    result.packetLossPercent = 100.0;
    result.errorMessage = std::move(message);
    return result;
}

core::SnmpResult snmpFailure(core::SnmpOutcome outcome, std::string message) {
    core::SnmpResult result;
    result.outcome = outcome;
    result.errorMessage = std::move(message);
    return result;
}

std::chrono::milliseconds pingDeadline(std::chrono::milliseconds timeout, int count) {
    return timeout * std::max(1, count) + DEADLINE_GRACE;
}

template <typename Result>
struct PendingCall {
    PendingCall(const Strand& strand, std::function<void(const Result&)> cb)
        : timer(strand), callback(std::move(cb)) {}

    asio::steady_timer timer;
    std::atomic<bool> completed{false};
    std::function<void(const Result&)> callback;
};

template <typename Result>
void complete(const std::shared_ptr<PendingCall<Result>>& call, const Strand& strand,
              Result result) {
    if (call->completed.exchange(true)) {
        spdlog::debug("Discarding probe result that arrived after its deadline");
        return;
    }
    asio::post(strand, [call, result = std::move(result)]() {
        call->timer.cancel();
        call->callback(result);
    });
}

template <typename Result>
void armDeadline(const std::shared_ptr<PendingCall<Result>>& call,
                 std::chrono::milliseconds deadline, Result onTimeout) {
    call->timer.expires_after(deadline);
    call->timer.async_wait([call, onTimeout = std::move(onTimeout)](const asio::error_code& ec) {
        if (ec || call->completed.exchange(true)) {
            return; // Cancelled or already answered
        }
        call->callback(onTimeout);
    });
}

template <typename Result>
struct BlockingCall {
    std::promise<Result> promise;
    std::atomic<bool> completed{false};

    void deliver(const Result& result) {
        if (!completed.exchange(true)) {
            promise.set_value(result);
        }
    }
};

} // namespace

void pingWithDeadline(const Strand& strand, core::IProbeTransport& transport,
                      const std::string& ip, std::chrono::milliseconds timeout, int count,
                      std::function<void(const core::PingResult&)> callback) {
    auto call = std::make_shared<PendingCall<core::PingResult>>(strand, std::move(callback));
    armDeadline(call, pingDeadline(timeout, count),
                pingFailure(core::PingOutcome::Timeout, "deadline exceeded"));

    try {
        transport.pingAsync(ip, timeout, count, [call, strand](const core::PingResult& result) {
            reportTransportAnswered();
            complete(call, strand, result);
        });
    } catch (const std::exception& e) {
        reportTransportFailure("ping", ip, e);
        complete(call, strand, pingFailure(core::PingOutcome::Unreachable, e.what()));
    }
}

void snmpGetWithDeadline(const Strand& strand, core::IProbeTransport& transport,
                         const core::SnmpGetRequest& request,
                         std::function<void(const core::SnmpResult&)> callback) {
    auto call = std::make_shared<PendingCall<core::SnmpResult>>(strand, std::move(callback));
    armDeadline(call, request.timeout + DEADLINE_GRACE,
                snmpFailure(core::SnmpOutcome::Timeout, "deadline exceeded"));

    try {
        transport.snmpGetAsync(request, [call, strand](const core::SnmpResult& result) {
            reportTransportAnswered();
            complete(call, strand, result);
        });
    } catch (const std::exception& e) {
        reportTransportFailure("snmp", request.ip, e);
        complete(call, strand, snmpFailure(core::SnmpOutcome::Unavailable, e.what()));
    }
}

core::PingResult pingBlocking(core::IProbeTransport& transport, const std::string& ip,
                              std::chrono::milliseconds timeout, int count) {
    auto call = std::make_shared<BlockingCall<core::PingResult>>();
    auto future = call->promise.get_future();

    try {
        transport.pingAsync(ip, timeout, count, [call](const core::PingResult& result) {
            reportTransportAnswered();
            call->deliver(result);
        });
    } catch (const std::exception& e) {
        reportTransportFailure("ping", ip, e);
        return pingFailure(core::PingOutcome::Unreachable, e.what());
    }

    if (future.wait_for(pingDeadline(timeout, count)) == std::future_status::ready) {
        return future.get();
    }
    call->completed = true;
    return pingFailure(core::PingOutcome::Timeout, "deadline exceeded");
}

core::SnmpResult snmpGetBlocking(core::IProbeTransport& transport,
                                 const core::SnmpGetRequest& request) {
    auto call = std::make_shared<BlockingCall<core::SnmpResult>>();
    auto future = call->promise.get_future();

    try {
        transport.snmpGetAsync(request, [call](const core::SnmpResult& result) {
            reportTransportAnswered();
            call->deliver(result);
        });
    } catch (const std::exception& e) {
        reportTransportFailure("snmp", request.ip, e);
        return snmpFailure(core::SnmpOutcome::Unavailable, e.what());
    }

    if (future.wait_for(request.timeout + DEADLINE_GRACE) == std::future_status::ready) {
        return future.get();
    }
    call->completed = true;
    return snmpFailure(core::SnmpOutcome::Timeout, "deadline exceeded");
}

} // namespace beamstate::monitor
