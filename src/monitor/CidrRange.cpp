#include "monitor/CidrRange.hpp"

#include <algorithm>
#include <cctype>

namespace beamstate::monitor {

std::optional<CidrRange> CidrRange::parse(const std::string& text) {
    auto normalized = text;
    normalized.erase(std::remove_if(normalized.begin(), normalized.end(),
                                    [](unsigned char c) { return std::isspace(c) != 0; }),
                     normalized.end());
    if (normalized.empty()) {
        return std::nullopt;
    }
    if (normalized.find('/') == std::string::npos) {
        normalized += "/32";
    }

    asio::error_code ec;
    auto network = asio::ip::make_network_v4(normalized, ec);
    if (ec) {
        return std::nullopt;
    }
    return CidrRange(network.canonical());
}

uint64_t CidrRange::hostCount() const {
    const auto prefix = network_.prefix_length();
    if (prefix == 32) {
        return 1;
    }
    if (prefix == 31) {
        return 2;
    }
    return (uint64_t{1} << (32 - prefix)) - 2;
}

std::vector<asio::ip::address_v4> CidrRange::hosts(size_t maxHosts) const {
    std::vector<asio::ip::address_v4> result;
    const auto count = std::min<uint64_t>(hostCount(), maxHosts);
    result.reserve(static_cast<size_t>(count));

    uint64_t first = network_.network().to_uint();
    if (network_.prefix_length() < 31) {
        ++first;
    }
    for (uint64_t i = 0; i < count; ++i) {
        result.emplace_back(static_cast<asio::ip::address_v4::uint_type>(first + i));
    }
    return result;
}

bool CidrRange::contains(const asio::ip::address_v4& address) const {
    const auto mask = network_.netmask().to_uint();
    return (address.to_uint() & mask) == network_.network().to_uint();
}

bool isValidIpv4(const std::string& text) {
    // make_address_v4 accepts shorthand forms on some platforms; require a plain dotted quad.
    if (std::count(text.begin(), text.end(), '.') != 3) {
        return false;
    }
    if (!std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0 || c == '.'; })) {
        return false;
    }
    asio::error_code ec;
    asio::ip::make_address_v4(text, ec);
    return !ec;
}

} // namespace beamstate::monitor
