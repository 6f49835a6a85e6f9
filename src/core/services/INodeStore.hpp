#pragma once

#include "core/types/Group.hpp"
#include "core/types/Node.hpp"

#include <optional>
#include <string>

namespace beamstate::core {

/**
 * @brief Store that the discovery import writes nodes into.
 */
class INodeStore {
public:
    virtual ~INodeStore() = default;

    virtual std::optional<Node> findNodeByIp(const std::string& ip) const = 0;
    virtual std::optional<Group> findGroup(int64_t id) const = 0;

    /**
     * @brief Creates a node.
     * @param node Node to create; its id is ignored.
     * @return The stored node with its assigned id.
     * @throws ConfigurationError if the node is invalid.
     */
    virtual Node createNode(const Node& node) = 0;

    /**
     * @brief Replaces an existing node.
     * @throws ConfigurationError if the node is unknown or invalid.
     */
    virtual void updateNode(const Node& node) = 0;
};

} // namespace beamstate::core
