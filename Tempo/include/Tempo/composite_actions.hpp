#pragma once

#include "action.hpp"
#include <array>
#include <vector>

namespace Tempo {

using FiniteActionList = std::vector<std::shared_ptr<FiniteTimeAction>>;

// ============================================================
// Sequence
// ============================================================

/**
 * Runs two actions one after the other.
 *
 * Longer lists are folded into a left-leaning chain of pairs by create().
 * A child that is skipped over by a large tick still gets started, driven to
 * its end and stopped, so its final state is always applied.
 */
class Sequence : public ActionInterval {
public:
    Sequence(std::shared_ptr<FiniteTimeAction> first, std::shared_ptr<FiniteTimeAction> second);

    // Throws ArgumentError on an empty list or a null entry.
    static std::shared_ptr<Sequence> create(const FiniteActionList& actions);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;
    void stop() override;

    bool canReverse() const override;
    std::shared_ptr<Action> reverse() const override;

protected:
    void onUpdate(float t) override;

private:
    std::array<std::shared_ptr<FiniteTimeAction>, 2> m_actions;
    float m_split = 0.0f;
    int m_last = -1;
};

// ============================================================
// Spawn
// ============================================================

/**
 * Runs two actions side by side. The shorter one is padded with a delay so
 * both finish together.
 */
class Spawn : public ActionInterval {
public:
    Spawn(std::shared_ptr<FiniteTimeAction> first, std::shared_ptr<FiniteTimeAction> second);

    // Throws ArgumentError on an empty list or a null entry.
    static std::shared_ptr<Spawn> create(const FiniteActionList& actions);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;
    void stop() override;

    bool canReverse() const override;
    std::shared_ptr<Action> reverse() const override;

protected:
    void onUpdate(float t) override;

private:
    std::shared_ptr<FiniteTimeAction> m_first;
    std::shared_ptr<FiniteTimeAction> m_second;
};

// ============================================================
// Repeat
// ============================================================

/**
 * Plays the inner action `times` times in a row. Every completed cycle is
 * driven to its end and the inner action is restarted from the target's
 * current state.
 */
class Repeat : public ActionInterval {
public:
    Repeat(std::shared_ptr<FiniteTimeAction> inner, int times);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;
    void stop() override;
    bool isDone() const override { return m_total == m_repeatCount; }

    bool canReverse() const override { return m_inner->canReverse(); }
    std::shared_ptr<Action> reverse() const override;

    const std::shared_ptr<FiniteTimeAction>& getInnerAction() const { return m_inner; }
    int getRepeatCount() const { return m_repeatCount; }

protected:
    void onUpdate(float t) override;

private:
    std::shared_ptr<FiniteTimeAction> m_inner;
    int m_repeatCount;
    int m_total = 0;
    float m_nextDt = 0.0f;
    bool m_instant;
};

// ============================================================
// RepeatForever
// ============================================================

// Restarts the inner action whenever it finishes. Never done.
class RepeatForever : public ActionInterval {
public:
    explicit RepeatForever(std::shared_ptr<ActionInterval> inner);

    std::shared_ptr<Action> clone() const override;
    void startWithTarget(Target* target) override;
    void stop() override;
    void step(float dt) override;
    bool isDone() const override { return false; }

    bool canReverse() const override { return m_inner->canReverse(); }
    std::shared_ptr<Action> reverse() const override;

    const std::shared_ptr<ActionInterval>& getInnerAction() const { return m_inner; }

protected:
    void onUpdate(float t) override {}

private:
    std::shared_ptr<ActionInterval> m_inner;
};

} // namespace Tempo
