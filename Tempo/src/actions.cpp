#include "Tempo/actions.hpp"
#include "Tempo/errors.hpp"
#include <fmt/core.h>

namespace Tempo {

namespace {
    BezierConfig toBezierConfig(const std::vector<glm::vec3>& points, const char* who) {
        if (points.size() != 3) {
            throw ArgumentError(fmt::format("{}: expected 3 points, got {}", who, points.size()));
        }
        return BezierConfig{ points[0], points[1], points[2] };
    }
}

std::shared_ptr<MoveBy> moveBy(float duration, const glm::vec3& delta) {
    return std::make_shared<MoveBy>(duration, delta);
}

std::shared_ptr<MoveTo> moveTo(float duration, const glm::vec3& position) {
    return std::make_shared<MoveTo>(duration, position);
}

std::shared_ptr<RotateBy> rotateBy(float duration, const glm::vec3& angle) {
    return std::make_shared<RotateBy>(duration, angle);
}

std::shared_ptr<RotateTo> rotateTo(float duration, const glm::vec3& angle) {
    return std::make_shared<RotateTo>(duration, angle);
}

std::shared_ptr<ScaleBy> scaleBy(float duration, const glm::vec3& factor) {
    return std::make_shared<ScaleBy>(duration, factor);
}

std::shared_ptr<ScaleBy> scaleBy(float duration, float factor) {
    return std::make_shared<ScaleBy>(duration, factor);
}

std::shared_ptr<ScaleTo> scaleTo(float duration, const glm::vec3& scale) {
    return std::make_shared<ScaleTo>(duration, scale);
}

std::shared_ptr<ScaleTo> scaleTo(float duration, float scale) {
    return std::make_shared<ScaleTo>(duration, scale);
}

std::shared_ptr<BezierBy> bezierBy(float duration, const std::vector<glm::vec3>& points) {
    return std::make_shared<BezierBy>(duration, toBezierConfig(points, "bezierBy()"));
}

std::shared_ptr<BezierTo> bezierTo(float duration, const std::vector<glm::vec3>& points) {
    return std::make_shared<BezierTo>(duration, toBezierConfig(points, "bezierTo()"));
}

std::shared_ptr<DelayTime> delayTime(float duration) {
    return std::make_shared<DelayTime>(duration);
}

std::shared_ptr<CallFunc> callFunc(std::function<void()> callback) {
    if (!callback) {
        throw ArgumentError("callFunc(): callback must be non-empty");
    }
    return std::make_shared<CallFunc>([callback = std::move(callback)](Target*, const std::any&) { callback(); });
}

std::shared_ptr<CallFunc> callFunc(CallFunc::Callback callback, std::any data) {
    return std::make_shared<CallFunc>(std::move(callback), std::move(data));
}

std::shared_ptr<Sequence> sequence(const FiniteActionList& actions) {
    return Sequence::create(actions);
}

std::shared_ptr<Spawn> spawn(const FiniteActionList& actions) {
    return Spawn::create(actions);
}

std::shared_ptr<Repeat> repeat(std::shared_ptr<FiniteTimeAction> action, int times) {
    return std::make_shared<Repeat>(std::move(action), times);
}

std::shared_ptr<RepeatForever> repeatForever(std::shared_ptr<ActionInterval> action) {
    return std::make_shared<RepeatForever>(std::move(action));
}

std::shared_ptr<Speed> speed(std::shared_ptr<Action> action, float multiplier) {
    return std::make_shared<Speed>(std::move(action), multiplier);
}

} // namespace Tempo
