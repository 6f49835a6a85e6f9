#include "core/types/Group.hpp"

namespace beamstate::core {

bool Group::isValid() const {
    return !name.empty() && intervalSeconds > 0 && packetCount > 0 && snmpPort > 0 &&
           !snmpCommunity.empty() && snmpCommunity.size() <= 255;
}

} // namespace beamstate::core
