#include "Tempo/action.hpp"
#include "Tempo/errors.hpp"
#include "Tempo/log.hpp"
#include <algorithm>
#include <cassert>
#include <limits>

namespace Tempo {

// ============================================================
// Action
// ============================================================

void Action::startWithTarget(Target* target) {
    m_originalTarget = target;
    m_target = target;
}

void Action::stop() {
    m_target = nullptr;
}

std::shared_ptr<Action> Action::reverse() const {
    throw NotReversibleError("Action::reverse(): action has no inverse");
}

// ============================================================
// FiniteTimeAction
// ============================================================

std::shared_ptr<FiniteTimeAction> FiniteTimeAction::cloneFinite() const {
    auto copy = std::dynamic_pointer_cast<FiniteTimeAction>(clone());
    assert(copy && "clone() of a finite action must be finite");
    return copy;
}

std::shared_ptr<FiniteTimeAction> FiniteTimeAction::reverseFinite() const {
    auto reversed = std::dynamic_pointer_cast<FiniteTimeAction>(reverse());
    assert(reversed && "reverse() of a finite action must be finite");
    return reversed;
}

// ============================================================
// ActionInterval
// ============================================================

ActionInterval::ActionInterval(float duration)
    : FiniteTimeAction(duration == 0.0f ? kActionEpsilon : duration) {}

void ActionInterval::startWithTarget(Target* target) {
    FiniteTimeAction::startWithTarget(target);
    m_elapsed = 0.0f;
    m_firstTick = true;
    m_cyclesLeft = m_times;
}

void ActionInterval::step(float dt) {
    if (m_firstTick) {
        m_firstTick = false;
        m_elapsed = 0.0f;
    } else {
        m_elapsed += dt;
    }

    while (true) {
        float t = m_elapsed / std::max(m_duration, kActionEpsilon);
        update(std::clamp(t, 0.0f, 1.0f));

        if (!isDone() || !(m_forever || m_cyclesLeft > 1) || m_target == nullptr) {
            break;
        }

        // Next cycle; restarting re-captures the baseline from the target.
        float carry = overshoot();
        int cyclesLeft = m_forever ? m_cyclesLeft : m_cyclesLeft - 1;
        startWithTarget(m_target);
        m_cyclesLeft = cyclesLeft;
        m_firstTick = false;
        m_elapsed = carry;
    }
}

void ActionInterval::update(float t) {
    onUpdate(computeEaseTime(t));
}

float ActionInterval::overshoot() const {
    if (m_duration <= kActionEpsilon) {
        return 0.0f;
    }
    return std::max(0.0f, m_elapsed - m_duration);
}

void ActionInterval::continueWith(float carry) {
    m_firstTick = false;
    m_elapsed = 0.0f;
    step(carry);
}

ActionInterval& ActionInterval::easing(EaseList list) {
    m_easeList = std::move(list);
    return *this;
}

ActionInterval& ActionInterval::repeat(int times) {
    if (times < 1) {
        log::error("ActionInterval::repeat(): repeat count must be at least 1, got {}", times);
        return *this;
    }
    if (m_times > std::numeric_limits<int>::max() / times) {
        log::error("ActionInterval::repeat(): {} x {} cycles is out of range, clamped", m_times, times);
        m_times = std::numeric_limits<int>::max();
    } else {
        m_times *= times;
    }
    m_cyclesLeft = m_times;
    return *this;
}

ActionInterval& ActionInterval::repeatForever() {
    m_forever = true;
    return *this;
}

std::shared_ptr<ActionInterval> ActionInterval::cloneInterval() const {
    auto copy = std::dynamic_pointer_cast<ActionInterval>(clone());
    assert(copy && "clone() of an interval action must be an interval action");
    return copy;
}

std::shared_ptr<ActionInterval> ActionInterval::reverseInterval() const {
    auto reversed = std::dynamic_pointer_cast<ActionInterval>(reverse());
    assert(reversed && "reverse() of an interval action must be an interval action");
    return reversed;
}

void ActionInterval::copyDecorationTo(ActionInterval& other) const {
    other.m_forever = m_forever;
    other.m_speed = m_speed;
    other.m_times = m_times;
    other.m_cyclesLeft = m_times;
    other.m_easeList = m_easeList;
}

void ActionInterval::reverseDecorationTo(ActionInterval& other) const {
    copyDecorationTo(other);
    other.m_easeList = reverseEasing(m_easeList);
}

// ============================================================
// ActionInstant
// ============================================================

void ActionInstant::startWithTarget(Target* target) {
    FiniteTimeAction::startWithTarget(target);
    m_fired = false;
}

void ActionInstant::update(float t) {
    if (m_fired) {
        return;
    }
    m_fired = true;
    onFire();
}

// ============================================================
// Speed
// ============================================================

Speed::Speed(std::shared_ptr<Action> inner, float multiplier)
    : m_inner(std::move(inner)), m_multiplier(multiplier) {
    if (!m_inner) {
        throw ArgumentError("Speed: inner action must be non-null");
    }
}

std::shared_ptr<Action> Speed::clone() const {
    return std::make_shared<Speed>(m_inner->clone(), m_multiplier);
}

void Speed::startWithTarget(Target* target) {
    Action::startWithTarget(target);
    m_inner->startWithTarget(target);
}

void Speed::stop() {
    m_inner->stop();
    Action::stop();
}

void Speed::step(float dt) {
    m_inner->step(dt * m_multiplier);
}

bool Speed::isDone() const {
    return m_inner->isDone();
}

bool Speed::canReverse() const {
    return m_inner->canReverse();
}

std::shared_ptr<Action> Speed::reverse() const {
    return std::make_shared<Speed>(m_inner->reverse(), m_multiplier);
}

void Speed::setInnerAction(std::shared_ptr<Action> inner) {
    if (!inner) {
        throw ArgumentError("Speed::setInnerAction(): inner action must be non-null");
    }
    m_inner = std::move(inner);
}

} // namespace Tempo
