#include "Tempo/composite_actions.hpp"
#include "Tempo/errors.hpp"
#include "Tempo/transform_actions.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>

namespace Tempo {

namespace {
    // Placeholder second half for single-action sequences and spawns.
    class ExtraAction : public ActionInstant {
    public:
        std::shared_ptr<Action> clone() const override { return std::make_shared<ExtraAction>(); }
    };

    // Maps the parent's progress onto a child that carries its own repeat count.
    float cycleProgress(float t, int times) {
        if (times <= 1) {
            return t;
        }
        float scaled = t * static_cast<float>(times);
        if (scaled >= static_cast<float>(times)) {
            return 1.0f;
        }
        return std::fmod(scaled, 1.0f);
    }

    void checkActions(const FiniteActionList& actions, const char* who) {
        if (actions.empty()) {
            throw ArgumentError(fmt::format("{}: action list must not be empty", who));
        }
        for (const auto& action : actions) {
            if (!action) {
                throw ArgumentError(fmt::format("{}: actions must all be non-null", who));
            }
        }
    }
}

// ============================================================
// Sequence
// ============================================================

Sequence::Sequence(std::shared_ptr<FiniteTimeAction> first, std::shared_ptr<FiniteTimeAction> second)
    : ActionInterval(0.0f), m_actions{ std::move(first), std::move(second) } {
    if (!m_actions[0] || !m_actions[1]) {
        throw ArgumentError("Sequence: actions must all be non-null");
    }
    float duration = m_actions[0]->getDuration() + m_actions[1]->getDuration();
    m_duration = duration == 0.0f ? kActionEpsilon : duration;
}

std::shared_ptr<Sequence> Sequence::create(const FiniteActionList& actions) {
    checkActions(actions, "Sequence::create()");
    if (actions.size() == 1) {
        return std::make_shared<Sequence>(actions[0], std::make_shared<ExtraAction>());
    }

    std::shared_ptr<FiniteTimeAction> prev = actions[0];
    for (std::size_t i = 1; i + 1 < actions.size(); i++) {
        prev = std::make_shared<Sequence>(prev, actions[i]);
    }
    return std::make_shared<Sequence>(prev, actions.back());
}

std::shared_ptr<Action> Sequence::clone() const {
    auto action = std::make_shared<Sequence>(m_actions[0]->cloneFinite(), m_actions[1]->cloneFinite());
    copyDecorationTo(*action);
    return action;
}

void Sequence::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_split = m_actions[0]->getDuration() / m_duration;
    m_last = -1;
}

void Sequence::stop() {
    if (m_last != -1) {
        m_actions[m_last]->stop();
    }
    ActionInterval::stop();
}

bool Sequence::canReverse() const {
    return m_actions[0]->canReverse() && m_actions[1]->canReverse();
}

std::shared_ptr<Action> Sequence::reverse() const {
    auto action = std::make_shared<Sequence>(m_actions[1]->reverseFinite(), m_actions[0]->reverseFinite());
    reverseDecorationTo(*action);
    return action;
}

void Sequence::onUpdate(float t) {
    if (!m_target) {
        return;
    }

    int found = 0;
    float newT = 0.0f;

    if (t < m_split) {
        newT = m_split != 0.0f ? t / m_split : 1.0f;

        // Scrubbed back into the first half.
        if (m_last == 1) {
            m_actions[1]->update(0.0f);
            m_actions[1]->stop();
        }
    } else {
        found = 1;
        newT = m_split == 1.0f ? 1.0f : (t - m_split) / (1.0f - m_split);

        if (m_last == -1) {
            // First half was skipped entirely; apply it before moving on.
            m_actions[0]->startWithTarget(m_target);
            m_actions[0]->update(1.0f);
            m_actions[0]->stop();
        } else if (m_last == 0) {
            m_actions[0]->update(1.0f);
            m_actions[0]->stop();
        }
    }

    auto& actionFound = m_actions[found];
    if (m_last == found && actionFound->isDone()) {
        return;
    }

    if (m_last != found) {
        actionFound->startWithTarget(m_target);
    }

    actionFound->update(cycleProgress(newT, actionFound->getTimes()));
    m_last = found;
}

// ============================================================
// Spawn
// ============================================================

Spawn::Spawn(std::shared_ptr<FiniteTimeAction> first, std::shared_ptr<FiniteTimeAction> second)
    : ActionInterval(0.0f), m_first(std::move(first)), m_second(std::move(second)) {
    if (!m_first || !m_second) {
        throw ArgumentError("Spawn: actions must all be non-null");
    }

    float d1 = m_first->getDuration();
    float d2 = m_second->getDuration();
    float duration = std::max(d1, d2);
    m_duration = duration == 0.0f ? kActionEpsilon : duration;

    if (d1 > d2) {
        m_second = std::make_shared<Sequence>(m_second, std::make_shared<DelayTime>(d1 - d2));
    } else if (d1 < d2) {
        m_first = std::make_shared<Sequence>(m_first, std::make_shared<DelayTime>(d2 - d1));
    }
}

std::shared_ptr<Spawn> Spawn::create(const FiniteActionList& actions) {
    checkActions(actions, "Spawn::create()");
    if (actions.size() == 1) {
        return std::make_shared<Spawn>(actions[0], std::make_shared<ExtraAction>());
    }

    std::shared_ptr<FiniteTimeAction> prev = actions[0];
    for (std::size_t i = 1; i + 1 < actions.size(); i++) {
        prev = std::make_shared<Spawn>(prev, actions[i]);
    }
    return std::make_shared<Spawn>(prev, actions.back());
}

std::shared_ptr<Action> Spawn::clone() const {
    auto action = std::make_shared<Spawn>(m_first->cloneFinite(), m_second->cloneFinite());
    copyDecorationTo(*action);
    return action;
}

void Spawn::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_first->startWithTarget(target);
    m_second->startWithTarget(target);
}

void Spawn::stop() {
    m_first->stop();
    m_second->stop();
    ActionInterval::stop();
}

bool Spawn::canReverse() const {
    return m_first->canReverse() && m_second->canReverse();
}

std::shared_ptr<Action> Spawn::reverse() const {
    auto action = std::make_shared<Spawn>(m_first->reverseFinite(), m_second->reverseFinite());
    reverseDecorationTo(*action);
    return action;
}

void Spawn::onUpdate(float t) {
    m_first->update(cycleProgress(t, m_first->getTimes()));
    m_second->update(cycleProgress(t, m_second->getTimes()));
}

// ============================================================
// Repeat
// ============================================================

Repeat::Repeat(std::shared_ptr<FiniteTimeAction> inner, int times)
    : ActionInterval(inner ? inner->getDuration() * static_cast<float>(times) : 0.0f),
      m_inner(std::move(inner)), m_repeatCount(times) {
    if (!m_inner) {
        throw ArgumentError("Repeat: inner action must be non-null");
    }
    if (times < 1) {
        throw ArgumentError(fmt::format("Repeat: repeat count must be at least 1, got {}", times));
    }
    m_instant = dynamic_cast<ActionInstant*>(m_inner.get()) != nullptr;
}

std::shared_ptr<Action> Repeat::clone() const {
    auto action = std::make_shared<Repeat>(m_inner->cloneFinite(), m_repeatCount);
    copyDecorationTo(*action);
    return action;
}

void Repeat::startWithTarget(Target* target) {
    m_total = 0;
    m_nextDt = m_inner->getDuration() / m_duration;
    ActionInterval::startWithTarget(target);
    m_inner->startWithTarget(target);
}

void Repeat::stop() {
    // The last boundary has already stopped the inner action.
    if (m_inner->getTarget()) {
        m_inner->stop();
    }
    ActionInterval::stop();
}

std::shared_ptr<Action> Repeat::reverse() const {
    auto action = std::make_shared<Repeat>(m_inner->reverseFinite(), m_repeatCount);
    reverseDecorationTo(*action);
    return action;
}

void Repeat::onUpdate(float t) {
    if (!m_target) {
        return;
    }

    if (m_instant) {
        // Zero-length cycles: every repetition fires once the whole span is reached.
        if (t < 1.0f) {
            return;
        }
        while (m_total < m_repeatCount) {
            m_inner->update(1.0f);
            m_inner->stop();
            m_total++;
            if (m_total < m_repeatCount) {
                m_inner->startWithTarget(m_target);
            }
        }
        return;
    }

    float cycle = m_inner->getDuration() / m_duration;

    // Accumulated boundaries can land a hair above 1; the end always completes.
    if (t >= m_nextDt || t >= 1.0f) {
        while (t > m_nextDt && m_total < m_repeatCount) {
            m_inner->update(1.0f);
            m_inner->stop();
            m_total++;
            if (m_total < m_repeatCount) {
                m_inner->startWithTarget(m_target);
            }
            m_nextDt += cycle;
        }

        if (t >= 1.0f && m_total < m_repeatCount) {
            m_total++;
        }

        if (m_total == m_repeatCount) {
            // Already stopped when the last boundary was crossed above.
            if (m_inner->getTarget()) {
                m_inner->update(1.0f);
                m_inner->stop();
            }
        } else {
            m_inner->update((t - (m_nextDt - cycle)) / cycle);
        }
    } else {
        m_inner->update(std::fmod(t * static_cast<float>(m_repeatCount), 1.0f));
    }
}

// ============================================================
// RepeatForever
// ============================================================

RepeatForever::RepeatForever(std::shared_ptr<ActionInterval> inner)
    : ActionInterval(0.0f), m_inner(std::move(inner)) {
    if (!m_inner) {
        throw ArgumentError("RepeatForever: inner action must be non-null");
    }
}

std::shared_ptr<Action> RepeatForever::clone() const {
    auto action = std::make_shared<RepeatForever>(m_inner->cloneInterval());
    copyDecorationTo(*action);
    return action;
}

void RepeatForever::startWithTarget(Target* target) {
    ActionInterval::startWithTarget(target);
    m_inner->startWithTarget(target);
}

void RepeatForever::stop() {
    m_inner->stop();
    ActionInterval::stop();
}

void RepeatForever::step(float dt) {
    m_inner->step(dt);
    while (m_inner->isDone() && m_target) {
        float carry = m_inner->overshoot();
        m_inner->startWithTarget(m_target);
        m_inner->continueWith(carry);
        if (carry <= 0.0f) {
            break;
        }
    }
}

std::shared_ptr<Action> RepeatForever::reverse() const {
    auto action = std::make_shared<RepeatForever>(m_inner->reverseInterval());
    reverseDecorationTo(*action);
    return action;
}

} // namespace Tempo
