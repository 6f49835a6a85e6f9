#pragma once

#include <asio.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace beamstate::monitor {

/**
 * @brief An IPv4 range in CIDR notation.
 *
 * Parsing is lenient: host bits are allowed and masked off ("10.0.0.7/24" is
 * 10.0.0.0/24), and a bare address is treated as /32.
 */
class CidrRange {
public:
    /**
     * @brief Parses "a.b.c.d/len" or "a.b.c.d".
     * @return The range, or nullopt if the text is not a valid IPv4 network.
     */
    static std::optional<CidrRange> parse(const std::string& text);

    /**
     * @brief Number of usable host addresses.
     *
     * The network and broadcast addresses are excluded, except that /31
     * yields both of its addresses and /32 yields its single address.
     */
    [[nodiscard]] uint64_t hostCount() const;

    /**
     * @brief Enumerates usable host addresses in ascending order.
     * @param maxHosts Stop after this many addresses.
     */
    [[nodiscard]] std::vector<asio::ip::address_v4> hosts(size_t maxHosts) const;

    [[nodiscard]] bool contains(const asio::ip::address_v4& address) const;

    [[nodiscard]] std::string toString() const { return network_.to_string(); }
    [[nodiscard]] int prefixLength() const { return network_.prefix_length(); }

private:
    explicit CidrRange(asio::ip::network_v4 network) : network_(network) {}

    asio::ip::network_v4 network_;
};

/**
 * @brief Validates a dotted-quad IPv4 address.
 */
[[nodiscard]] bool isValidIpv4(const std::string& text);

} // namespace beamstate::monitor
