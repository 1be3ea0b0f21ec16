#include "Tempo/target.hpp"
#include "Tempo/log.hpp"
#include <atomic>

namespace Tempo {

namespace {
    std::atomic<TargetId> s_nextId{ 0 };
}

TargetId nextId() {
    return ++s_nextId;
}

Node::Node(std::string name) : m_id(nextId()), m_name(std::move(name)) {}

void Node::setScale(const glm::vec3& scale) {
    if (scale.x == 0.0f || scale.y == 0.0f || scale.z == 0.0f) {
        log::debug("Node '{}': degenerate scale ({}, {}, {})", m_name, scale.x, scale.y, scale.z);
    }
    m_scale = scale;
}

std::shared_ptr<Node> Node::createChild(const std::string& name) {
    auto child = std::make_shared<Node>(name);
    m_children.push_back(child);
    return child;
}

void Node::addChild(std::shared_ptr<Node> child) {
    if (child) {
        m_children.push_back(std::move(child));
    }
}

} // namespace Tempo
