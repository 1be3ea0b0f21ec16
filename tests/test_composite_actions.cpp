#ifdef NDEBUG
#undef NDEBUG
#endif

#include "Tempo/actions.hpp"
#include "Tempo/errors.hpp"
#include "test_support.hpp"
#include <fmt/core.h>
#include <cassert>
#include <string>

using namespace Tempo;
using TempoTest::near;

namespace {

void prime(Action& action, Node& node) {
    action.startWithTarget(&node);
    action.step(0.0f);
}

// MoveBy that counts how often it is stopped.
class CountingMove : public MoveBy {
public:
    CountingMove(float duration, const glm::vec3& delta, int& stops)
        : MoveBy(duration, delta), m_stops(stops) {}

    void stop() override {
        m_stops++;
        MoveBy::stop();
    }

private:
    int& m_stops;
};

template<typename Fn>
bool throwsArgumentError(Fn&& fn) {
    try {
        fn();
    } catch (const ArgumentError&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    fmt::print("=== composite actions test suite ===\n");

    const glm::vec3 d1(1.0f, 0.0f, 0.0f);
    const glm::vec3 d2(0.0f, 2.0f, 0.0f);

    // --- Sequence runs children back to back ---
    {
        int firstStops = 0;
        int secondStops = 0;
        auto first = std::make_shared<CountingMove>(1.0f, d1, firstStops);
        auto second = std::make_shared<CountingMove>(1.0f, d2, secondStops);
        auto seq = sequence(first, second);
        assert(near(seq->getDuration(), 2.0f));

        Node node("seq");
        prime(*seq, node);
        seq->step(0.5f);
        assert(near(node.getPosition(), glm::vec3(0.5f, 0.0f, 0.0f)));

        seq->step(0.5f);
        assert(near(node.getPosition(), d1));
        assert(firstStops == 1);

        seq->step(0.5f);
        assert(near(node.getPosition(), d1 + d2 * 0.5f));
        seq->step(0.5f);
        assert(near(node.getPosition(), d1 + d2));
        assert(seq->isDone());

        seq->stop();
        assert(firstStops == 1);
        assert(secondStops == 1);
        fmt::print("  [OK] Sequence hand-off\n");
    }

    // --- A child skipped by a large tick is still applied ---
    {
        int firstStops = 0;
        int secondStops = 0;
        auto seq = sequence(std::make_shared<CountingMove>(1.0f, d1, firstStops),
                            std::make_shared<CountingMove>(1.0f, d2, secondStops));

        Node node("skip");
        seq->startWithTarget(&node);
        seq->update(0.75f);
        assert(near(node.getPosition(), d1 + d2 * 0.5f));
        assert(firstStops == 1);

        // Scrubbing back resets and stops the second child.
        seq->update(0.25f);
        assert(secondStops == 1);
        fmt::print("  [OK] Sequence applies skipped children\n");
    }

    // --- Instant children fire once each, in order ---
    {
        std::string order;
        auto seq = sequence(
            callFunc([&order] { order += "a"; }),
            callFunc([&order] { order += "b"; }),
            callFunc([&order] { order += "c"; }));

        Node node("instant");
        prime(*seq, node);
        seq->step(0.1f);
        seq->step(0.1f);
        assert(order == "abc");
        assert(seq->isDone());

        // An instant head must not fire again when the sequence moves on.
        int fired = 0;
        auto mixed = sequence(callFunc([&fired] { fired++; }), moveBy(1.0f, d1));
        Node other("mixed");
        prime(*mixed, other);
        mixed->step(0.5f);
        mixed->step(0.5f);
        assert(fired == 1);
        assert(near(other.getPosition(), d1));
        fmt::print("  [OK] Instant children in sequences\n");
    }

    // --- Single-action lists and bad lists ---
    {
        auto seq = sequence(FiniteActionList{ moveBy(1.0f, d1) });
        assert(near(seq->getDuration(), 1.0f));
        Node node("single");
        prime(*seq, node);
        seq->step(1.0f);
        assert(near(node.getPosition(), d1));
        assert(seq->isDone());

        assert(throwsArgumentError([] { sequence(FiniteActionList{}); }));
        assert(throwsArgumentError([] { spawn(FiniteActionList{}); }));
        assert(throwsArgumentError([&] { sequence(FiniteActionList{ moveBy(1.0f, d1), nullptr }); }));
        fmt::print("  [OK] Single and invalid action lists\n");
    }

    // --- Sequence reverse plays the children backwards ---
    {
        auto seq = sequence(moveBy(1.0f, d1), moveBy(1.0f, d2));
        assert(seq->canReverse());
        auto back = seq->reverseInterval();
        assert(near(back->getDuration(), 2.0f));

        Node node("back");
        node.setPosition(d1 + d2);
        prime(*back, node);
        back->step(1.0f);
        assert(near(node.getPosition(), d1));
        back->step(1.0f);
        assert(near(node.getPosition(), glm::vec3(0.0f)));
        fmt::print("  [OK] Sequence reverse\n");
    }

    // --- Spawn pads the shorter child ---
    {
        auto both = spawn(moveBy(1.0f, glm::vec3(2.0f, 0.0f, 0.0f)),
                          rotateBy(2.0f, glm::vec3(0.0f, 0.0f, 90.0f)));
        assert(near(both->getDuration(), 2.0f));

        Node node("spawn");
        prime(*both, node);
        both->step(1.0f);
        assert(near(node.getPosition(), glm::vec3(2.0f, 0.0f, 0.0f)));
        assert(near(node.getRotation(), glm::vec3(0.0f, 0.0f, 45.0f)));
        both->step(1.0f);
        assert(near(node.getRotation(), glm::vec3(0.0f, 0.0f, 90.0f)));
        assert(both->isDone());

        // Reversed, the padding comes first.
        auto back = both->reverseInterval();
        prime(*back, node);
        back->step(1.0f);
        assert(near(node.getPosition(), glm::vec3(2.0f, 0.0f, 0.0f)));
        assert(near(node.getRotation(), glm::vec3(0.0f, 0.0f, 45.0f)));
        back->step(1.0f);
        assert(near(node.getPosition(), glm::vec3(0.0f)));
        assert(near(node.getRotation(), glm::vec3(0.0f)));
        fmt::print("  [OK] Spawn padding and reverse\n");
    }

    // --- Repeat restarts from the target's current state ---
    {
        auto rep = repeat(moveBy(1.0f, d1), 3);
        assert(near(rep->getDuration(), 3.0f));

        Node node("repeat");
        prime(*rep, node);
        rep->step(2.5f);
        assert(near(node.getPosition(), d1 * 2.5f));
        assert(!rep->isDone());

        rep->step(0.5f);
        assert(near(node.getPosition(), d1 * 3.0f));
        assert(rep->isDone());

        rep->step(0.5f);
        assert(near(node.getPosition(), d1 * 3.0f));

        auto back = rep->reverseInterval();
        prime(*back, node);
        back->step(3.0f);
        assert(near(node.getPosition(), glm::vec3(0.0f)));

        // Finishing and then stopping the repeat stops each cycle exactly once.
        int cycleStops = 0;
        auto counted = repeat(std::make_shared<CountingMove>(1.0f, d1, cycleStops), 2);
        Node stopped("stopped");
        prime(*counted, stopped);
        counted->step(2.0f);
        assert(counted->isDone());
        assert(cycleStops == 2);
        counted->stop();
        assert(cycleStops == 2);

        assert(throwsArgumentError([&] { repeat(moveBy(1.0f, d1), 0); }));
        assert(throwsArgumentError([] { repeat(nullptr, 2); }));
        fmt::print("  [OK] Repeat of an interval action\n");
    }

    // --- Repeat of an instant action fires exactly `times` times ---
    {
        int fired = 0;
        auto rep = repeat(callFunc([&fired] { fired++; }), 3);
        Node node("burst");
        prime(*rep, node);
        rep->step(1.0f / 60.0f);
        assert(fired == 3);
        assert(rep->isDone());
        rep->step(1.0f / 60.0f);
        assert(fired == 3);
        fmt::print("  [OK] Repeat of an instant action\n");
    }

    // --- RepeatForever carries overshoot into the next cycle ---
    {
        auto forever = repeatForever(moveBy(1.0f, d1));
        Node node("forever");
        prime(*forever, node);
        forever->step(2.5f);
        assert(near(node.getPosition(), d1 * 2.5f));
        assert(!forever->isDone());
        forever->step(0.75f);
        assert(near(node.getPosition(), d1 * 3.25f));

        // Zero-length bodies run once per tick, never spin.
        int fired = 0;
        auto pulse = repeatForever(sequence(callFunc([&fired] { fired++; })));
        Node other("pulse");
        prime(*pulse, other);
        assert(fired == 1);
        pulse->step(0.1f);
        pulse->step(0.1f);
        assert(fired == 3);
        fmt::print("  [OK] RepeatForever\n");
    }

    // --- Clones run independently ---
    {
        auto original = sequence(moveBy(1.0f, d1), moveBy(1.0f, d2));
        auto copy = original->cloneInterval();

        Node a("a");
        Node b("b");
        prime(*original, a);
        prime(*copy, b);
        original->step(2.0f);
        copy->step(1.0f);
        assert(near(a.getPosition(), d1 + d2));
        assert(near(b.getPosition(), d1));
        fmt::print("  [OK] Composite clones are independent\n");
    }

    fmt::print("All composite actions tests passed\n");
    return 0;
}
