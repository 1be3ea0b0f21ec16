#ifdef NDEBUG
#undef NDEBUG
#endif

#include "Tempo/actions.hpp"
#include "Tempo/errors.hpp"
#include "test_support.hpp"
#include <fmt/core.h>
#include <cassert>
#include <limits>
#include <string>
#include <vector>

using namespace Tempo;
using TempoTest::near;

namespace {

// Binds the action and absorbs the first-tick delta.
void prime(Action& action, Node& node) {
    action.startWithTarget(&node);
    action.step(0.0f);
}

template<typename Fn>
bool throwsNotReversible(Fn&& fn) {
    try {
        fn();
    } catch (const NotReversibleError&) {
        return true;
    }
    return false;
}

template<typename Fn>
bool throwsArgumentError(Fn&& fn) {
    try {
        fn();
    } catch (const ArgumentError&) {
        return true;
    }
    return false;
}

std::vector<glm::vec3> trajectory(Action& action, const std::vector<float>& steps) {
    Node node("sample");
    std::vector<glm::vec3> out;
    prime(action, node);
    for (float dt : steps) {
        action.step(dt);
        out.push_back(node.getPosition());
    }
    return out;
}

} // namespace

int main() {
    fmt::print("=== actions test suite ===\n");

    // --- MoveBy ---
    {
        Node node("n");
        node.setPosition({ 1.0f, 0.0f, 0.0f });
        auto move = moveBy(2.0f, { 4.0f, 0.0f, 0.0f });

        move->startWithTarget(&node);
        assert(move->getTarget() == &node);
        assert(move->getOriginalTarget() == &node);

        move->step(0.5f); // first tick is absorbed
        assert(near(node.getPosition(), { 1.0f, 0.0f, 0.0f }));
        assert(!move->isDone());

        move->step(1.0f);
        assert(near(node.getPosition(), { 3.0f, 0.0f, 0.0f }));
        assert(near(move->getElapsed(), 1.0f));

        move->step(1.0f);
        assert(near(node.getPosition(), { 5.0f, 0.0f, 0.0f }));
        assert(move->isDone());

        move->stop();
        assert(move->getTarget() == nullptr);
        assert(move->getOriginalTarget() == &node);
        fmt::print("  [OK] MoveBy\n");
    }

    // --- MoveTo ---
    {
        Node node("n");
        node.setPosition({ 1.0f, 1.0f, 0.0f });
        auto move = moveTo(1.0f, { 3.0f, 1.0f, 0.0f });
        prime(*move, node);
        move->step(0.5f);
        assert(near(node.getPosition(), { 2.0f, 1.0f, 0.0f }));
        move->step(0.5f);
        assert(near(node.getPosition(), { 3.0f, 1.0f, 0.0f }));

        assert(!move->canReverse());
        assert(throwsNotReversible([&] { (void)move->reverse(); }));
        fmt::print("  [OK] MoveTo\n");
    }

    // --- Stackable moves fold in outside movement ---
    {
        Node node("n");
        auto move = moveBy(1.0f, { 2.0f, 0.0f, 0.0f });
        assert(move->isStackable());
        prime(*move, node);
        move->step(0.5f);
        assert(near(node.getPosition(), { 1.0f, 0.0f, 0.0f }));

        node.translate({ 0.0f, 5.0f, 0.0f });
        move->step(0.5f);
        assert(near(node.getPosition(), { 2.0f, 5.0f, 0.0f }));

        Node other("m");
        auto plain = moveBy(1.0f, { 2.0f, 0.0f, 0.0f });
        plain->setStackable(false);
        prime(*plain, other);
        plain->step(0.5f);
        other.translate({ 0.0f, 5.0f, 0.0f });
        plain->step(0.5f);
        assert(near(other.getPosition(), { 2.0f, 0.0f, 0.0f }));

        setStackableActionsDefault(false);
        assert(!moveBy(1.0f, { 1.0f, 0.0f, 0.0f })->isStackable());
        setStackableActionsDefault(true);
        fmt::print("  [OK] Stackable movement\n");
    }

    // --- Rotate ---
    {
        Node node("n");
        auto rotate = rotateBy(1.0f, { 0.0f, 0.0f, 90.0f });
        prime(*rotate, node);
        rotate->step(1.0f);
        assert(near(node.getRotation(), { 0.0f, 0.0f, 90.0f }));

        node.setRotation({ 0.0f, 0.0f, 450.0f });
        auto to = rotateTo(1.0f, { 0.0f, 0.0f, 180.0f });
        prime(*to, node);
        assert(near(node.getRotation(), { 0.0f, 0.0f, 90.0f }));
        to->step(0.5f);
        assert(near(node.getRotation(), { 0.0f, 0.0f, 135.0f }));
        to->step(0.5f);
        assert(near(node.getRotation(), { 0.0f, 0.0f, 180.0f }));
        assert(throwsNotReversible([&] { (void)to->reverse(); }));
        fmt::print("  [OK] RotateBy / RotateTo\n");
    }

    // --- Scale ---
    {
        Node node("n");
        node.setScale(glm::vec3(2.0f));
        auto grow = scaleBy(1.0f, 3.0f);
        prime(*grow, node);
        grow->step(1.0f);
        assert(near(node.getScale(), glm::vec3(6.0f)));

        auto shrink = grow->reverse();
        prime(*shrink, node);
        shrink->step(1.0f);
        assert(near(node.getScale(), glm::vec3(2.0f)));

        auto to = scaleTo(1.0f, 3.0f);
        node.setScale(glm::vec3(1.0f));
        prime(*to, node);
        to->step(0.5f);
        assert(near(node.getScale(), glm::vec3(2.0f)));
        assert(!to->canReverse());
        assert(throwsNotReversible([&] { (void)to->reverse(); }));

        auto flatten = scaleBy(1.0f, { 1.0f, 0.0f, 1.0f });
        assert(!flatten->canReverse());
        assert(throwsNotReversible([&] { (void)flatten->reverse(); }));
        fmt::print("  [OK] ScaleBy / ScaleTo\n");
    }

    // --- Bezier ---
    {
        Node node("n");
        auto arc = bezierBy(1.0f, { { 0.0f, 1.0f, 0.0f }, { 1.0f, 1.0f, 0.0f }, { 1.0f, 0.0f, 0.0f } });
        prime(*arc, node);
        arc->step(0.5f);
        assert(near(node.getPosition(), { 0.5f, 0.75f, 0.0f }));
        arc->step(0.5f);
        assert(near(node.getPosition(), { 1.0f, 0.0f, 0.0f }));

        auto to = bezierTo(1.0f, { { 1.0f, 1.0f, 0.0f }, { 2.0f, 1.0f, 0.0f }, { 2.0f, 0.0f, 0.0f } });
        prime(*to, node);
        to->step(0.5f);
        assert(near(node.getPosition(), { 1.5f, 0.75f, 0.0f }));
        to->step(0.5f);
        assert(near(node.getPosition(), { 2.0f, 0.0f, 0.0f }));
        assert(throwsNotReversible([&] { (void)to->reverse(); }));

        assert(throwsArgumentError([] { bezierBy(1.0f, { { 0.0f, 1.0f, 0.0f }, { 1.0f, 0.0f, 0.0f } }); }));
        assert(throwsArgumentError([] { bezierTo(1.0f, {}); }));
        fmt::print("  [OK] BezierBy / BezierTo\n");
    }

    // --- Reversing twice reproduces the trajectory ---
    {
        std::vector<float> steps = { 0.1f, 0.25f, 0.3f, 0.2f, 0.15f };

        auto move = moveBy(1.0f, { 3.0f, -2.0f, 1.0f });
        move->easing({ easeIn(2.0f), easeSineOut() });
        auto moveTwice = move->reverse()->reverse();
        auto a = trajectory(*move, steps);
        auto b = trajectory(*moveTwice, steps);
        for (std::size_t i = 0; i < a.size(); i++) {
            assert(near(a[i], b[i]));
        }

        auto arc = bezierBy(1.0f, { { 0.0f, 2.0f, 0.0f }, { 3.0f, 2.0f, 1.0f }, { 3.0f, 0.0f, 0.0f } });
        auto arcTwice = arc->reverse()->reverse();
        a = trajectory(*arc, steps);
        b = trajectory(*arcTwice, steps);
        for (std::size_t i = 0; i < a.size(); i++) {
            assert(near(a[i], b[i]));
        }

        // Forward then backward returns to the start.
        Node node("n");
        auto there = moveBy(1.0f, { 3.0f, -2.0f, 1.0f });
        auto back = there->reverse();
        prime(*there, node);
        there->step(1.0f);
        prime(*back, node);
        back->step(1.0f);
        assert(near(node.getPosition(), glm::vec3(0.0f)));
        fmt::print("  [OK] reverse().reverse() trajectories\n");
    }

    // --- Zero-length intervals still land on their end value ---
    {
        Node node("n");
        auto snap = moveBy(0.0f, { 1.0f, 0.0f, 0.0f });
        assert(near(snap->getDuration(), kActionEpsilon, 1e-9f));
        prime(*snap, node);
        assert(!snap->isDone());
        snap->step(1.0f / 60.0f);
        assert(near(node.getPosition(), { 1.0f, 0.0f, 0.0f }));
        assert(snap->isDone());
        fmt::print("  [OK] Zero-duration interval\n");
    }

    // --- Repeat decoration carries overshoot between cycles ---
    {
        Node node("n");
        auto move = moveBy(1.0f, { 1.0f, 0.0f, 0.0f });
        move->repeat(3);
        assert(move->getTimes() == 3);
        assert(near(move->getDuration(), 3.0f));

        prime(*move, node);
        move->step(2.5f);
        assert(near(node.getPosition(), { 2.5f, 0.0f, 0.0f }));
        assert(!move->isDone());
        move->step(0.5f);
        assert(near(node.getPosition(), { 3.0f, 0.0f, 0.0f }));
        assert(move->isDone());

        auto bad = moveBy(1.0f, { 1.0f, 0.0f, 0.0f });
        bad->repeat(0);
        assert(bad->getTimes() == 1);

        auto huge = delayTime(1.0f);
        huge->repeat(65536).repeat(65536);
        assert(huge->getTimes() == std::numeric_limits<int>::max());
        huge->repeat(2);
        assert(huge->getTimes() == std::numeric_limits<int>::max());

        Node spinner("s");
        auto forever = moveBy(1.0f, { 1.0f, 0.0f, 0.0f });
        forever->repeatForever();
        prime(*forever, spinner);
        forever->step(3.25f);
        assert(near(spinner.getPosition(), { 3.25f, 0.0f, 0.0f }));
        assert(!forever->isDone());
        fmt::print("  [OK] Repeat decoration\n");
    }

    // --- clone() copies definition and decoration, not binding ---
    {
        Node node("n");
        auto move = moveBy(1.0f, { 1.0f, 0.0f, 0.0f });
        move->repeat(2);
        move->easing({ easeIn(2.0f) });
        move->setSpeed(2.0f);
        move->setTag(5);
        move->startWithTarget(&node);

        auto copy = std::dynamic_pointer_cast<MoveBy>(move->clone());
        assert(copy);
        assert(copy != move);
        assert(near(copy->getDuration(), 2.0f));
        assert(near(copy->getSpeed(), 2.0f));
        assert(copy->getEasing().size() == 1);
        assert(copy->getTarget() == nullptr);
        assert(copy->getTag() == Action::kTagInvalid);

        auto reversed = std::dynamic_pointer_cast<MoveBy>(move->reverse());
        assert(reversed);
        assert(near(reversed->getDelta(), { -1.0f, 0.0f, 0.0f }));
        assert(near(reversed->getEasing()[0].getParam(), 0.5f));
        assert(reversed->getTimes() == 2);
        fmt::print("  [OK] clone() and reverse() decoration\n");
    }

    // --- Speed ---
    {
        Node node("n");
        auto fast = speed(moveBy(2.0f, { 4.0f, 0.0f, 0.0f }), 2.0f);
        prime(*fast, node);
        fast->step(0.5f);
        assert(near(node.getPosition(), { 2.0f, 0.0f, 0.0f }));
        assert(!fast->isDone());
        fast->step(0.5f);
        assert(near(node.getPosition(), { 4.0f, 0.0f, 0.0f }));
        assert(fast->isDone());

        assert(fast->canReverse());
        auto slow = std::dynamic_pointer_cast<Speed>(fast->reverse());
        assert(slow);
        assert(near(slow->getMultiplier(), 2.0f));
        assert(!speed(moveTo(1.0f, glm::vec3(0.0f)), 2.0f)->canReverse());
        assert(throwsArgumentError([] { speed(nullptr, 1.0f); }));
        fmt::print("  [OK] Speed\n");
    }

    // --- CallFunc ---
    {
        Node node("n");
        int calls = 0;
        Target* seen = nullptr;
        std::string payload;
        auto call = callFunc([&](Target* target, const std::any& data) {
            calls++;
            seen = target;
            payload = std::any_cast<std::string>(data);
        }, std::string("hello"));

        assert(call->isDone());
        call->startWithTarget(&node);
        call->step(0.016f);
        call->update(1.0f);
        assert(calls == 1);
        assert(seen == &node);
        assert(payload == "hello");

        // Rebinding arms it again.
        call->startWithTarget(&node);
        call->step(0.016f);
        assert(calls == 2);

        assert(call->canReverse());
        auto again = call->reverse();
        again->startWithTarget(&node);
        again->step(0.0f);
        assert(calls == 3);

        int plain = 0;
        auto simple = callFunc([&plain] { plain++; });
        simple->startWithTarget(&node);
        simple->step(0.0f);
        assert(plain == 1);

        assert(throwsArgumentError([] { callFunc(std::function<void()>()); }));
        fmt::print("  [OK] CallFunc\n");
    }

    // --- DelayTime ---
    {
        Node node("n");
        auto wait = delayTime(1.0f);
        wait->repeat(2);
        prime(*wait, node);
        wait->step(1.5f);
        assert(!wait->isDone());
        wait->step(0.5f);
        assert(wait->isDone());
        assert(near(node.getPosition(), glm::vec3(0.0f)));

        auto back = std::dynamic_pointer_cast<DelayTime>(wait->reverse());
        assert(back);
        assert(near(back->getDuration(), 2.0f));
        fmt::print("  [OK] DelayTime\n");
    }

    fmt::print("All action tests passed\n");
    return 0;
}
