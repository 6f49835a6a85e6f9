#pragma once

#include "core/services/IProbeTransport.hpp"

#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace beamstate::test {

/**
 * @brief Scriptable probe transport that answers on the calling thread.
 *
 * Unknown targets time out. Silent targets never answer, so callers have to
 * rely on their own deadline.
 */
class FakeProbeTransport : public core::IProbeTransport {
public:
    static core::PingResult up(double latencyMs = 1.0) {
        core::PingResult result;
        result.outcome = core::PingOutcome::Success;
        result.latencyMs = latencyMs;
        result.packetLossPercent = 0.0;
        return result;
    }

    static core::PingResult timeout() {
        core::PingResult result;
        result.outcome = core::PingOutcome::Timeout;
        result.errorMessage = "no reply";
        return result;
    }

    static core::SnmpResult value(const std::string& text) {
        core::SnmpResult result;
        result.outcome = core::SnmpOutcome::Success;
        result.value = text;
        result.latencyMs = 2.0;
        return result;
    }

    static core::SnmpResult snmpTimeout() {
        core::SnmpResult result;
        result.outcome = core::SnmpOutcome::Timeout;
        result.errorMessage = "no response";
        return result;
    }

    void setPing(const std::string& ip, core::PingResult result) {
        std::lock_guard lock(mutex_);
        pingSequences_[ip] = {std::move(result)};
    }

    /// Results are used in order; the last one repeats.
    void setPingSequence(const std::string& ip, std::vector<core::PingResult> results) {
        std::lock_guard lock(mutex_);
        pingSequences_[ip] = std::move(results);
    }

    void setSnmp(const std::string& ip, const std::string& oid, core::SnmpResult result) {
        std::lock_guard lock(mutex_);
        snmpSequences_[{ip, oid}] = {std::move(result)};
    }

    void setSnmpSequence(const std::string& ip, const std::string& oid,
                         std::vector<core::SnmpResult> results) {
        std::lock_guard lock(mutex_);
        snmpSequences_[{ip, oid}] = std::move(results);
    }

    /// Requests with this community are rejected with AuthError.
    void rejectCommunity(const std::string& community) {
        std::lock_guard lock(mutex_);
        rejectedCommunities_.insert(community);
    }

    void setSilent(const std::string& ip, bool silent = true) {
        std::lock_guard lock(mutex_);
        if (silent) {
            silent_.insert(ip);
        } else {
            silent_.erase(ip);
        }
    }

    void setThrowing(bool throwing) {
        std::lock_guard lock(mutex_);
        throwing_ = throwing;
    }

    void pingAsync(const std::string& ip, std::chrono::milliseconds /*timeout*/, int count,
                   PingCallback callback) override {
        core::PingResult result;
        {
            std::lock_guard lock(mutex_);
            ++pingCounts_[ip];
            lastPingCount_ = count;
            if (throwing_) {
                throw std::runtime_error("transport unavailable");
            }
            if (silent_.count(ip) > 0) {
                return;
            }
            result = next(pingSequences_, ip, timeout());
        }
        callback(result);
    }

    void snmpGetAsync(const core::SnmpGetRequest& request, SnmpCallback callback) override {
        core::SnmpResult result;
        {
            std::lock_guard lock(mutex_);
            ++snmpCounts_[request.ip];
            snmpRequests_.push_back(request);
            if (throwing_) {
                throw std::runtime_error("transport unavailable");
            }
            if (silent_.count(request.ip) > 0) {
                return;
            }
            if (rejectedCommunities_.count(request.community) > 0) {
                result.outcome = core::SnmpOutcome::AuthError;
                result.errorMessage = "bad community";
            } else {
                result = next(snmpSequences_, std::make_pair(request.ip, request.oid),
                              snmpTimeout());
            }
        }
        callback(result);
    }

    int pingCount(const std::string& ip) const {
        std::lock_guard lock(mutex_);
        auto it = pingCounts_.find(ip);
        return it == pingCounts_.end() ? 0 : it->second;
    }

    int snmpCount(const std::string& ip) const {
        std::lock_guard lock(mutex_);
        auto it = snmpCounts_.find(ip);
        return it == snmpCounts_.end() ? 0 : it->second;
    }

    int lastPingCount() const {
        std::lock_guard lock(mutex_);
        return lastPingCount_;
    }

    std::vector<core::SnmpGetRequest> snmpRequests() const {
        std::lock_guard lock(mutex_);
        return snmpRequests_;
    }

private:
    template <typename Map, typename Key, typename Result>
    static Result next(Map& sequences, const Key& key, Result fallback) {
        auto it = sequences.find(key);
        if (it == sequences.end() || it->second.empty()) {
            return fallback;
        }
        auto& sequence = it->second;
        Result result = sequence.front();
        if (sequence.size() > 1) {
            sequence.erase(sequence.begin());
        }
        return result;
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<core::PingResult>> pingSequences_;
    std::map<std::pair<std::string, std::string>, std::vector<core::SnmpResult>> snmpSequences_;
    std::set<std::string> rejectedCommunities_;
    std::set<std::string> silent_;
    std::map<std::string, int> pingCounts_;
    std::map<std::string, int> snmpCounts_;
    std::vector<core::SnmpGetRequest> snmpRequests_;
    int lastPingCount_{0};
    bool throwing_{false};
};

} // namespace beamstate::test
