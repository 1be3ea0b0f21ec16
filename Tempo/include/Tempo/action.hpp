#pragma once

#include "easing.hpp"
#include "target.hpp"
#include <cfloat>
#include <memory>

namespace Tempo {

// Stand-in duration for zero-length intervals so they still produce one update.
constexpr float kActionEpsilon = FLT_EPSILON;

// ============================================================
// Action Base Class
// ============================================================

/**
 * Base class for everything the ActionManager can run.
 *
 * Lifecycle: startWithTarget() binds the action and captures whatever baseline
 * it needs, step() is called once per tick with the frame delta, isDone() is
 * polled after every step, and stop() releases the target. stop() may come at
 * any point; a stopped action is not resumed, run a clone instead.
 *
 * Composites call update() on their children directly with a normalized time
 * in [0, 1]; step() is only used by the manager and by wrappers that forward
 * raw time (Speed, RepeatForever).
 */
class Action {
public:
    static constexpr int kTagInvalid = -1;

    virtual ~Action() = default;

    // Fresh, unbound copy of the definition, including repeat/speed/easing decoration.
    virtual std::shared_ptr<Action> clone() const = 0;

    virtual bool isDone() const { return true; }

    virtual void startWithTarget(Target* target);
    virtual void stop();

    virtual void step(float dt) {}
    virtual void update(float t) {}

    virtual bool canReverse() const { return false; }

    // Independent action tree playing the inverse effect. Throws NotReversibleError
    // when canReverse() is false.
    virtual std::shared_ptr<Action> reverse() const;

    // Multiplier the ActionManager applies to dt before calling step().
    virtual float getSpeed() const { return 1.0f; }

    int getTag() const { return m_tag; }
    void setTag(int tag) { m_tag = tag; }

    Target* getTarget() const { return m_target; }
    Target* getOriginalTarget() const { return m_originalTarget; }

protected:
    Target* m_originalTarget = nullptr;
    Target* m_target = nullptr;
    int m_tag = kTagInvalid;
};

// ============================================================
// FiniteTimeAction
// ============================================================

class FiniteTimeAction : public Action {
public:
    explicit FiniteTimeAction(float duration = 0.0f) : m_duration(duration) {}

    // Total duration: one cycle times the repeat count.
    float getDuration() const { return m_duration * static_cast<float>(m_times); }
    float getCycleDuration() const { return m_duration; }
    int getTimes() const { return m_times; }

    // clone() and reverse() of a finite action always yield a finite action.
    std::shared_ptr<FiniteTimeAction> cloneFinite() const;
    std::shared_ptr<FiniteTimeAction> reverseFinite() const;

protected:
    float m_duration;
    int m_times = 1;
};

// ============================================================
// ActionInterval
// ============================================================

/**
 * Finite action driven by elapsed / duration.
 *
 * Every update() runs t through the attached easing list before handing it to
 * onUpdate(). The repeat decoration restarts the action on its target when a
 * cycle completes and carries the overshoot into the next cycle.
 */
class ActionInterval : public FiniteTimeAction {
public:
    explicit ActionInterval(float duration);

    void startWithTarget(Target* target) override;
    void step(float dt) override;
    void update(float t) final;
    bool isDone() const override { return m_elapsed >= m_duration; }

    float getSpeed() const override { return m_speed; }
    void setSpeed(float speed) { m_speed = speed; }

    // Time into the current cycle.
    float getElapsed() const { return m_elapsed; }

    // How far the current cycle ran past its end. Zero for zero-length cycles.
    float overshoot() const;

    // Continue a freshly restarted action with time left over from the previous run.
    void continueWith(float carry);

    ActionInterval& easing(EaseList list);
    const EaseList& getEasing() const { return m_easeList; }

    // Multiplies the repeat count. Values below 1 are rejected and logged.
    ActionInterval& repeat(int times);
    ActionInterval& repeatForever();
    bool isForever() const { return m_forever; }

    std::shared_ptr<ActionInterval> cloneInterval() const;
    std::shared_ptr<ActionInterval> reverseInterval() const;

protected:
    // t has already been eased.
    virtual void onUpdate(float t) = 0;

    float computeEaseTime(float t) const { return applyEasing(m_easeList, t); }

    void copyDecorationTo(ActionInterval& other) const;
    void reverseDecorationTo(ActionInterval& other) const;

    float m_elapsed = 0.0f;
    bool m_firstTick = true;
    EaseList m_easeList;
    bool m_forever = false;
    float m_speed = 1.0f;
    int m_cyclesLeft = 1;
};

// ============================================================
// ActionInstant
// ============================================================

/**
 * Zero-duration action. Fires once per binding: the first update() after
 * startWithTarget() runs onFire(), later updates are ignored until the action
 * is started again.
 */
class ActionInstant : public FiniteTimeAction {
public:
    ActionInstant() : FiniteTimeAction(0.0f) {}

    void startWithTarget(Target* target) override;
    bool isDone() const override { return true; }
    void step(float dt) override { update(1.0f); }
    void update(float t) override;

    bool hasFired() const { return m_fired; }

    bool canReverse() const override { return true; }
    std::shared_ptr<Action> reverse() const override { return clone(); }

protected:
    virtual void onFire() {}

private:
    bool m_fired = false;
};

// ============================================================
// Speed
// ============================================================

/**
 * Runs another action faster or slower by scaling the time handed to its step().
 *
 * Example:
 *     auto fast = std::make_shared<Speed>(moveBy(2.0f, {4, 0, 0}), 2.0f); // done in 1s
 */
class Speed : public Action {
public:
    Speed(std::shared_ptr<Action> inner, float multiplier);

    std::shared_ptr<Action> clone() const override;

    void startWithTarget(Target* target) override;
    void stop() override;
    void step(float dt) override;
    bool isDone() const override;

    bool canReverse() const override;
    std::shared_ptr<Action> reverse() const override;

    const std::shared_ptr<Action>& getInnerAction() const { return m_inner; }
    void setInnerAction(std::shared_ptr<Action> inner);

    float getMultiplier() const { return m_multiplier; }
    void setMultiplier(float multiplier) { m_multiplier = multiplier; }

private:
    std::shared_ptr<Action> m_inner;
    float m_multiplier;
};

} // namespace Tempo
