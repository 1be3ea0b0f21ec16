/**
 * ActionManager Usage Example
 *
 * Drives a few nodes through moves, rotations, sequences and repeats with a
 * fixed time step, without a Director.
 */

#include "Tempo/action_manager.hpp"
#include "Tempo/actions.hpp"
#include <fmt/core.h>
#include <memory>

using namespace Tempo;

namespace {
    void printNode(const Node& node) {
        auto p = node.getPosition();
        auto r = node.getRotation();
        auto s = node.getScale();
        fmt::print("   {:<8} pos ({:6.2f}, {:6.2f}, {:6.2f})  rot {:7.2f}  scale {:4.2f}\n",
                   node.getName(), p.x, p.y, p.z, r.z, s.x);
    }
}

int main() {
    ActionManager actionManager;

    fmt::print("=== ActionManager Example ===\n\n");

    auto walker = std::make_shared<Node>("walker");
    auto spinner = std::make_shared<Node>("spinner");
    auto pulser = std::make_shared<Node>("pulser");

    // 1. Eased move followed by a callback
    fmt::print("1. walker: move right, then report\n");
    auto walk = moveBy(1.0f, { 4.0f, 0.0f, 0.0f });
    walk->easing({ easeSineInOut() });
    actionManager.addAction(sequence(walk, callFunc([] {
        fmt::print("   -> walker arrived\n");
    })), walker.get());

    // 2. Bounce that plays forwards then backwards
    fmt::print("2. walker: hop along a bezier arc and back\n");
    auto hop = bezierBy(0.5f, { { 0.0f, 1.0f, 0.0f }, { 1.0f, 1.0f, 0.0f }, { 1.0f, 0.0f, 0.0f } });
    actionManager.addAction(sequence(delayTime(1.0f), hop, hop->reverseFinite()), walker.get());

    // 3. Endless spin at double speed
    fmt::print("3. spinner: rotate forever, twice as fast\n");
    actionManager.addAction(speed(repeatForever(rotateBy(1.0f, { 0.0f, 0.0f, 90.0f })), 2.0f), spinner.get());

    // 4. Repeated pulse with a counter
    fmt::print("4. pulser: scale up and down three times\n");
    int pulses = 0;
    auto pulse = sequence(scaleTo(0.2f, 1.5f), scaleTo(0.2f, 1.0f), callFunc([&pulses] {
        pulses++;
        fmt::print("   -> pulse #{}\n", pulses);
    }));
    actionManager.addAction(repeat(pulse, 3), pulser.get());

    // Simulate game loop
    fmt::print("\n=== Starting simulation (2.5 seconds) ===\n\n");
    const float dt = 1.0f / 60.0f;
    float totalTime = 0.0f;
    const float maxTime = 2.5f;
    float nextReport = 0.0f;

    while (totalTime < maxTime) {
        actionManager.update(dt);
        totalTime += dt;

        if (totalTime >= nextReport) {
            fmt::print("t = {:.2f}s\n", totalTime);
            printNode(*walker);
            printNode(*spinner);
            printNode(*pulser);
            nextReport += 0.5f;
        }
    }

    fmt::print("\n=== Simulation complete ===\n");
    fmt::print("Targets still running: {}\n", actionManager.getTargetCount());

    actionManager.removeAllActions();

    return 0;
}
