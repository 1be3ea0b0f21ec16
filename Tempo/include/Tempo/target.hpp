#pragma once

#include <glm/vec3.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Tempo {

using TargetId = std::uint64_t;

// Process-unique ids, starting at 1.
TargetId nextId();

/**
 * Anything an action can animate.
 *
 * Rotation is Euler angles in degrees. The id must stay stable for the
 * lifetime of the object; the ActionManager keys its records by it.
 */
class Target {
public:
    virtual ~Target() = default;

    virtual TargetId getId() const = 0;

    virtual glm::vec3 getPosition() const = 0;
    virtual void setPosition(const glm::vec3& position) = 0;

    virtual glm::vec3 getRotation() const = 0;
    virtual void setRotation(const glm::vec3& rotation) = 0;

    virtual glm::vec3 getScale() const = 0;
    virtual void setScale(const glm::vec3& scale) = 0;
};

/**
 * Plain scene-graph node holding its local transform.
 */
class Node : public Target {
public:
    explicit Node(std::string name = "");

    TargetId getId() const override { return m_id; }
    const std::string& getName() const { return m_name; }

    glm::vec3 getPosition() const override { return m_position; }
    void setPosition(const glm::vec3& position) override { m_position = position; }

    glm::vec3 getRotation() const override { return m_rotation; }
    void setRotation(const glm::vec3& rotation) override { m_rotation = rotation; }

    glm::vec3 getScale() const override { return m_scale; }
    void setScale(const glm::vec3& scale) override;

    void translate(const glm::vec3& offset) { m_position += offset; }

    std::shared_ptr<Node> createChild(const std::string& name);
    void addChild(std::shared_ptr<Node> child);
    const std::vector<std::shared_ptr<Node>>& getChildren() const { return m_children; }

private:
    TargetId m_id;
    std::string m_name;
    glm::vec3 m_position{ 0.0f };
    glm::vec3 m_rotation{ 0.0f };
    glm::vec3 m_scale{ 1.0f };
    std::vector<std::shared_ptr<Node>> m_children;
};

} // namespace Tempo
