#include "Tempo/scene.hpp"

namespace Tempo {

std::shared_ptr<Node> Scene::createNode(const std::string& name) {
    auto node = std::make_shared<Node>(name);
    m_nodes.push_back(node);
    return node;
}

void Scene::addNode(std::shared_ptr<Node> node) {
    if (node) {
        m_nodes.push_back(std::move(node));
    }
}

std::shared_ptr<Node> Scene::findNode(const std::string& name) const {
    for (const auto& node : m_nodes) {
        if (auto found = findNodeInHierarchy(name, node)) {
            return found;
        }
    }
    return nullptr;
}

std::shared_ptr<Node> Scene::findNodeInHierarchy(const std::string& name, const std::shared_ptr<Node>& node) const {
    if (node->getName() == name) {
        return node;
    }
    for (const auto& child : node->getChildren()) {
        if (auto found = findNodeInHierarchy(name, child)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace Tempo
