#pragma once

#include "target.hpp"
#include <memory>
#include <string>
#include <vector>

namespace Tempo {

class Scene {
public:
    Scene() = default;
    explicit Scene(std::string name) : m_name(std::move(name)) {}
    virtual ~Scene() = default;

    const std::string& getName() const { return m_name; }

    std::shared_ptr<Node> createNode(const std::string& name);
    void addNode(std::shared_ptr<Node> node);

    // Depth-first search by name over all nodes.
    std::shared_ptr<Node> findNode(const std::string& name) const;

    const std::vector<std::shared_ptr<Node>>& getNodes() const { return m_nodes; }

    // Called once per tick after timers and actions have run.
    virtual void update(float dt) {}

private:
    std::shared_ptr<Node> findNodeInHierarchy(const std::string& name, const std::shared_ptr<Node>& node) const;

    std::string m_name;
    std::vector<std::shared_ptr<Node>> m_nodes;
};

} // namespace Tempo
