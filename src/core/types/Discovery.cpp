#include "core/types/Discovery.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <utility>

namespace beamstate::core {

namespace {

std::string toLower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

bool contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

// Enterprise number prefixes under 1.3.6.1.4.1
constexpr std::array<std::pair<const char*, const char*>, 7> ENTERPRISE_VENDORS{{
    {"1.3.6.1.4.1.9.", "Cisco"},
    {"1.3.6.1.4.1.11.", "HP"},
    {"1.3.6.1.4.1.311.", "Windows"},
    {"1.3.6.1.4.1.6574.", "Synology"},
    {"1.3.6.1.4.1.8072.", "Linux"},
    {"1.3.6.1.4.1.14988.", "MikroTik"},
    {"1.3.6.1.4.1.41112.", "Ubiquiti"},
}};

} // namespace

DeviceIdentity identifyDevice(const std::string& sysDescr, const std::string& sysObjectId) {
    DeviceIdentity identity;
    const auto descr = toLower(sysDescr);

    // Later matches win.
    if (contains(descr, "linux"))
        identity.vendor = "Linux";
    if (contains(descr, "windows"))
        identity.vendor = "Windows";
    if (contains(descr, "synology"))
        identity.vendor = "Synology";
    if (contains(descr, "ubiquiti") || contains(descr, "unifi") || contains(descr, "uap"))
        identity.vendor = "Ubiquiti";
    if (contains(descr, "cisco"))
        identity.vendor = "Cisco";
    if (contains(descr, "hp") || contains(descr, "procurve"))
        identity.vendor = "HP";
    if (contains(descr, "mikrotik"))
        identity.vendor = "MikroTik";

    if (identity.vendor == "Unknown") {
        const auto oid = sysObjectId.starts_with('.') ? sysObjectId.substr(1) : sysObjectId;
        for (const auto& [prefix, vendor] : ENTERPRISE_VENDORS) {
            if (oid.starts_with(prefix)) {
                identity.vendor = vendor;
                break;
            }
        }
    }

    if (contains(descr, "linux"))
        identity.deviceType = "Server";
    if (contains(descr, "nas") || contains(descr, "synology"))
        identity.deviceType = "NAS";
    if (contains(descr, "switch"))
        identity.deviceType = "Switch";
    if (contains(descr, "uap") || contains(descr, "access point"))
        identity.deviceType = "Access Point";
    if (contains(descr, "printer"))
        identity.deviceType = "Printer";

    return identity;
}

} // namespace beamstate::core
