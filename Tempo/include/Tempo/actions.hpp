#pragma once

#include "action.hpp"
#include "composite_actions.hpp"
#include "transform_actions.hpp"
#include <functional>
#include <vector>

namespace Tempo {

// ============================================================
// Action Factories
// ============================================================
//
// Usage:
//     auto bounce = sequence(
//         moveBy(0.5f, {0, 2, 0}),
//         moveBy(0.5f, {0, -2, 0}),
//         callFunc([] { fmt::print("landed\n"); }));
//     bounce->easing({ easeSineInOut() });
//     actionManager.addAction(bounce, node.get());

std::shared_ptr<MoveBy> moveBy(float duration, const glm::vec3& delta);
std::shared_ptr<MoveTo> moveTo(float duration, const glm::vec3& position);

std::shared_ptr<RotateBy> rotateBy(float duration, const glm::vec3& angle);
std::shared_ptr<RotateTo> rotateTo(float duration, const glm::vec3& angle);

std::shared_ptr<ScaleBy> scaleBy(float duration, const glm::vec3& factor);
std::shared_ptr<ScaleBy> scaleBy(float duration, float factor);
std::shared_ptr<ScaleTo> scaleTo(float duration, const glm::vec3& scale);
std::shared_ptr<ScaleTo> scaleTo(float duration, float scale);

// `points` must hold exactly three points: two controls and the end. ArgumentError otherwise.
std::shared_ptr<BezierBy> bezierBy(float duration, const std::vector<glm::vec3>& points);
std::shared_ptr<BezierTo> bezierTo(float duration, const std::vector<glm::vec3>& points);

std::shared_ptr<DelayTime> delayTime(float duration);

std::shared_ptr<CallFunc> callFunc(std::function<void()> callback);
std::shared_ptr<CallFunc> callFunc(CallFunc::Callback callback, std::any data = {});

std::shared_ptr<Sequence> sequence(const FiniteActionList& actions);
std::shared_ptr<Spawn> spawn(const FiniteActionList& actions);

template<typename... Actions>
std::shared_ptr<Sequence> sequence(std::shared_ptr<FiniteTimeAction> first, Actions&&... rest) {
    return sequence(FiniteActionList{ std::move(first), std::forward<Actions>(rest)... });
}

template<typename... Actions>
std::shared_ptr<Spawn> spawn(std::shared_ptr<FiniteTimeAction> first, Actions&&... rest) {
    return spawn(FiniteActionList{ std::move(first), std::forward<Actions>(rest)... });
}

std::shared_ptr<Repeat> repeat(std::shared_ptr<FiniteTimeAction> action, int times);
std::shared_ptr<RepeatForever> repeatForever(std::shared_ptr<ActionInterval> action);
std::shared_ptr<Speed> speed(std::shared_ptr<Action> action, float multiplier);

} // namespace Tempo
