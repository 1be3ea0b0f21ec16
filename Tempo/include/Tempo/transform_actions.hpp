#pragma once

#include "action.hpp"
#include <any>
#include <array>
#include <functional>

namespace Tempo {

// Default for MoveBy/MoveTo created afterwards. Director applies Config::stackableActions here.
void setStackableActionsDefault(bool stackable);
bool getStackableActionsDefault();

// ============================================================
// DelayTime
// ============================================================

class DelayTime : public ActionInterval {
public:
    explicit DelayTime(float duration) : ActionInterval(duration) {}

    std::shared_ptr<Action> clone() const override;
    bool canReverse() const override { return true; }
    std::shared_ptr<Action> reverse() const override;

protected:
    void onUpdate(float t) override {}
};

// ============================================================
// Move
// ============================================================

/**
 * Moves the target by a relative offset.
 *
 * When stackable, movement applied to the target by anyone else while this
 * action runs is folded into the start point, so two MoveBy actions on the
 * same node add up instead of fighting over the position.
 */
class MoveBy : public ActionInterval {
public:
    MoveBy(float duration, const glm::vec3& delta);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return true; }
    std::shared_ptr<Action> reverse() const override;

    bool isStackable() const { return m_stackable; }
    void setStackable(bool stackable) { m_stackable = stackable; }

    const glm::vec3& getDelta() const { return m_delta; }

protected:
    void onUpdate(float t) override;

    glm::vec3 m_delta;
    glm::vec3 m_start{ 0.0f };
    glm::vec3 m_previous{ 0.0f };
    bool m_stackable;
};

class MoveTo : public MoveBy {
public:
    MoveTo(float duration, const glm::vec3& destination);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return false; }
    std::shared_ptr<Action> reverse() const override;

private:
    glm::vec3 m_destination;
};

// ============================================================
// Rotate
// ============================================================

// Angles are Euler degrees.
class RotateBy : public ActionInterval {
public:
    RotateBy(float duration, const glm::vec3& angle);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return true; }
    std::shared_ptr<Action> reverse() const override;

protected:
    void onUpdate(float t) override;

    glm::vec3 m_angle;
    glm::vec3 m_start{ 0.0f };
};

/**
 * Rotates to an absolute orientation. The start angle is wrapped into
 * (-360, 360) first, so a node spun past a full turn does not unwind.
 */
class RotateTo : public ActionInterval {
public:
    RotateTo(float duration, const glm::vec3& destination);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return false; }
    std::shared_ptr<Action> reverse() const override;

protected:
    void onUpdate(float t) override;

private:
    glm::vec3 m_destination;
    glm::vec3 m_start{ 0.0f };
    glm::vec3 m_delta{ 0.0f };
};

// ============================================================
// Scale
// ============================================================

class ScaleTo : public ActionInterval {
public:
    ScaleTo(float duration, const glm::vec3& scale);
    ScaleTo(float duration, float scale) : ScaleTo(duration, glm::vec3(scale)) {}

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return false; }
    std::shared_ptr<Action> reverse() const override;

protected:
    void onUpdate(float t) override;

    glm::vec3 m_end;
    glm::vec3 m_start{ 1.0f };
    glm::vec3 m_delta{ 0.0f };
};

// Multiplies the current scale. Reversible unless a factor is zero.
class ScaleBy : public ScaleTo {
public:
    ScaleBy(float duration, const glm::vec3& factor) : ScaleTo(duration, factor) {}
    ScaleBy(float duration, float factor) : ScaleTo(duration, factor) {}

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override;
    std::shared_ptr<Action> reverse() const override;
};

// ============================================================
// Bezier
// ============================================================

// Two control points followed by the end point.
using BezierConfig = std::array<glm::vec3, 3>;

/**
 * Cubic bezier path relative to the start position. Stackable like MoveBy.
 */
class BezierBy : public ActionInterval {
public:
    BezierBy(float duration, const BezierConfig& config);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return true; }
    std::shared_ptr<Action> reverse() const override;

    bool isStackable() const { return m_stackable; }
    void setStackable(bool stackable) { m_stackable = stackable; }

protected:
    void onUpdate(float t) override;

    BezierConfig m_config;
    glm::vec3 m_start{ 0.0f };
    glm::vec3 m_previous{ 0.0f };
    bool m_stackable;
};

// Absolute control points, converted to relative ones at bind time.
class BezierTo : public BezierBy {
public:
    BezierTo(float duration, const BezierConfig& points);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;

    bool canReverse() const override { return false; }
    std::shared_ptr<Action> reverse() const override;

private:
    BezierConfig m_toConfig;
};

// ============================================================
// CallFunc
// ============================================================

/**
 * Invokes a callback once, with the bound target and an optional payload.
 */
class CallFunc : public ActionInstant {
public:
    using Callback = std::function<void(Target*, const std::any&)>;

    explicit CallFunc(Callback callback, std::any data = {});

    std::shared_ptr<Action> clone() const override;

    const std::any& getData() const { return m_data; }

protected:
    void onFire() override;

private:
    Callback m_callback;
    std::any m_data;
};

} // namespace Tempo
