#include "Tempo/transform_actions.hpp"
#include "Tempo/errors.hpp"
#include <atomic>
#include <cmath>

namespace Tempo {

namespace {
    std::atomic<bool> g_stackableDefault{ true };

    float bezierAt(float a, float b, float c, float d, float t) {
        float u = 1.0f - t;
        return u * u * u * a + 3.0f * t * u * u * b + 3.0f * t * t * u * c + t * t * t * d;
    }
}

void setStackableActionsDefault(bool stackable) {
    g_stackableDefault.store(stackable);
}

bool getStackableActionsDefault() {
    return g_stackableDefault.load();
}

// ============================================================
// DelayTime
// ============================================================

std::shared_ptr<Action> DelayTime::clone() const {
    auto action = std::make_shared<DelayTime>(m_duration);
    copyDecorationTo(*action);
    return action;
}

std::shared_ptr<Action> DelayTime::reverse() const {
    auto action = std::make_shared<DelayTime>(m_duration);
    reverseDecorationTo(*action);
    return action;
}

// ============================================================
// Move
// ============================================================

MoveBy::MoveBy(float duration, const glm::vec3& delta)
    : ActionInterval(duration), m_delta(delta), m_stackable(getStackableActionsDefault()) {}

std::shared_ptr<Action> MoveBy::clone() const {
    auto action = std::make_shared<MoveBy>(m_duration, m_delta);
    action->m_stackable = m_stackable;
    copyDecorationTo(*action);
    return action;
}

void MoveBy::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_start = target->getPosition();
    m_previous = m_start;
}

std::shared_ptr<Action> MoveBy::reverse() const {
    auto action = std::make_shared<MoveBy>(m_duration, -m_delta);
    action->m_stackable = m_stackable;
    reverseDecorationTo(*action);
    return action;
}

void MoveBy::onUpdate(float t) {
    if (!m_target) {
        return;
    }

    glm::vec3 offset = m_delta * t;
    if (m_stackable) {
        m_start += m_target->getPosition() - m_previous;
        glm::vec3 next = m_start + offset;
        m_previous = next;
        m_target->setPosition(next);
    } else {
        m_target->setPosition(m_start + offset);
    }
}

MoveTo::MoveTo(float duration, const glm::vec3& destination)
    : MoveBy(duration, glm::vec3(0.0f)), m_destination(destination) {}

std::shared_ptr<Action> MoveTo::clone() const {
    auto action = std::make_shared<MoveTo>(m_duration, m_destination);
    action->m_stackable = m_stackable;
    copyDecorationTo(*action);
    return action;
}

void MoveTo::startWithTarget(Target* target) {
    MoveBy::startWithTarget(target);
    m_delta = m_destination - m_start;
}

std::shared_ptr<Action> MoveTo::reverse() const {
    throw NotReversibleError("MoveTo::reverse(): absolute moves have no inverse");
}

// ============================================================
// Rotate
// ============================================================

RotateBy::RotateBy(float duration, const glm::vec3& angle)
    : ActionInterval(duration), m_angle(angle) {}

std::shared_ptr<Action> RotateBy::clone() const {
    auto action = std::make_shared<RotateBy>(m_duration, m_angle);
    copyDecorationTo(*action);
    return action;
}

void RotateBy::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_start = target->getRotation();
}

std::shared_ptr<Action> RotateBy::reverse() const {
    auto action = std::make_shared<RotateBy>(m_duration, -m_angle);
    reverseDecorationTo(*action);
    return action;
}

void RotateBy::onUpdate(float t) {
    if (m_target) {
        m_target->setRotation(m_start + m_angle * t);
    }
}

RotateTo::RotateTo(float duration, const glm::vec3& destination)
    : ActionInterval(duration), m_destination(destination) {}

std::shared_ptr<Action> RotateTo::clone() const {
    auto action = std::make_shared<RotateTo>(m_duration, m_destination);
    copyDecorationTo(*action);
    return action;
}

void RotateTo::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    glm::vec3 current = target->getRotation();
    m_start = glm::vec3(std::fmod(current.x, 360.0f), std::fmod(current.y, 360.0f), std::fmod(current.z, 360.0f));
    m_delta = m_destination - m_start;
}

std::shared_ptr<Action> RotateTo::reverse() const {
    throw NotReversibleError("RotateTo::reverse(): absolute rotations have no inverse");
}

void RotateTo::onUpdate(float t) {
    if (m_target) {
        m_target->setRotation(m_start + m_delta * t);
    }
}

// ============================================================
// Scale
// ============================================================

ScaleTo::ScaleTo(float duration, const glm::vec3& scale)
    : ActionInterval(duration), m_end(scale) {}

std::shared_ptr<Action> ScaleTo::clone() const {
    auto action = std::make_shared<ScaleTo>(m_duration, m_end);
    copyDecorationTo(*action);
    return action;
}

void ScaleTo::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_start = target->getScale();
    m_delta = m_end - m_start;
}

std::shared_ptr<Action> ScaleTo::reverse() const {
    throw NotReversibleError("ScaleTo::reverse(): absolute scales have no inverse");
}

void ScaleTo::onUpdate(float t) {
    if (m_target) {
        m_target->setScale(m_start + m_delta * t);
    }
}

std::shared_ptr<Action> ScaleBy::clone() const {
    auto action = std::make_shared<ScaleBy>(m_duration, m_end);
    copyDecorationTo(*action);
    return action;
}

void ScaleBy::startWithTarget(Target* target) {
    ScaleTo::startWithTarget(target);
    m_delta = m_start * m_end - m_start;
}

bool ScaleBy::canReverse() const {
    return m_end.x != 0.0f && m_end.y != 0.0f && m_end.z != 0.0f;
}

std::shared_ptr<Action> ScaleBy::reverse() const {
    if (!canReverse()) {
        throw NotReversibleError("ScaleBy::reverse(): a zero factor has no inverse");
    }
    auto action = std::make_shared<ScaleBy>(m_duration, 1.0f / m_end);
    reverseDecorationTo(*action);
    return action;
}

// ============================================================
// Bezier
// ============================================================

BezierBy::BezierBy(float duration, const BezierConfig& config)
    : ActionInterval(duration), m_config(config), m_stackable(getStackableActionsDefault()) {}

std::shared_ptr<Action> BezierBy::clone() const {
    auto action = std::make_shared<BezierBy>(m_duration, m_config);
    action->m_stackable = m_stackable;
    copyDecorationTo(*action);
    return action;
}

void BezierBy::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_start = target->getPosition();
    m_previous = m_start;
}

std::shared_ptr<Action> BezierBy::reverse() const {
    BezierConfig reversed = {
        m_config[1] - m_config[2],
        m_config[0] - m_config[2],
        -m_config[2],
    };
    auto action = std::make_shared<BezierBy>(m_duration, reversed);
    action->m_stackable = m_stackable;
    reverseDecorationTo(*action);
    return action;
}

void BezierBy::onUpdate(float t) {
    if (!m_target) {
        return;
    }

    glm::vec3 point(
        bezierAt(0.0f, m_config[0].x, m_config[1].x, m_config[2].x, t),
        bezierAt(0.0f, m_config[0].y, m_config[1].y, m_config[2].y, t),
        bezierAt(0.0f, m_config[0].z, m_config[1].z, m_config[2].z, t));

    if (m_stackable) {
        m_start += m_target->getPosition() - m_previous;
        glm::vec3 next = m_start + point;
        m_previous = next;
        m_target->setPosition(next);
    } else {
        m_target->setPosition(m_start + point);
    }
}

BezierTo::BezierTo(float duration, const BezierConfig& points)
    : BezierBy(duration, BezierConfig{}), m_toConfig(points) {}

std::shared_ptr<Action> BezierTo::clone() const {
    auto action = std::make_shared<BezierTo>(m_duration, m_toConfig);
    action->m_stackable = m_stackable;
    copyDecorationTo(*action);
    return action;
}

void BezierTo::startWithTarget(Target* target) {
    BezierBy::startWithTarget(target);
    for (std::size_t i = 0; i < m_toConfig.size(); i++) {
        m_config[i] = m_toConfig[i] - m_start;
    }
}

std::shared_ptr<Action> BezierTo::reverse() const {
    throw NotReversibleError("BezierTo::reverse(): absolute paths have no inverse");
}

// ============================================================
// CallFunc
// ============================================================

CallFunc::CallFunc(Callback callback, std::any data)
    : m_callback(std::move(callback)), m_data(std::move(data)) {
    if (!m_callback) {
        throw ArgumentError("CallFunc: callback must be non-empty");
    }
}

std::shared_ptr<Action> CallFunc::clone() const {
    return std::make_shared<CallFunc>(m_callback, m_data);
}

void CallFunc::onFire() {
    m_callback(m_target, m_data);
}

} // namespace Tempo
