#ifdef NDEBUG
#undef NDEBUG
#endif

#include "Tempo/actions.hpp"
#include "Tempo/director.hpp"
#include "test_support.hpp"
#include <fmt/core.h>
#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

using namespace Tempo;
using TempoTest::ManualClock;
using TempoTest::RecordingRenderer;
using TempoTest::near;

namespace {

class TraceScene : public Scene {
public:
    TraceScene(std::string name, std::vector<std::string>& trace)
        : Scene(std::move(name)), m_trace(trace) {}

    void update(float dt) override { m_trace.push_back("scene"); }

private:
    std::vector<std::string>& m_trace;
};

} // namespace

int main() {
    fmt::print("=== director test suite ===\n");

    // --- One frame runs tickers, timers, actions, scene, then renders ---
    {
        ManualClock clock;
        RecordingRenderer renderer;
        std::vector<std::string> trace;

        Director director(clock);
        assert(Director::Get() == &director);
        director.setRenderer(&renderer);
        auto scene = std::make_shared<TraceScene>("main", trace);
        director.runScene(scene);

        auto node = scene->createNode("hero");
        director.tick(Handler([&trace] { trace.push_back("ticker"); }));
        director.scheduleOnce(Handler([&trace] { trace.push_back("timer"); }), 0.0);
        director.getActionManager().addAction(callFunc([&trace] { trace.push_back("action"); }), node.get());

        clock.advance(1.0 / 60.0);
        director.update();
        assert((trace == std::vector<std::string>{ "ticker", "timer", "action", "scene" }));
        assert((renderer.frames == std::vector<std::string>{ "main" }));
        assert(director.getScheduler().empty());
        fmt::print("  [OK] Frame order\n");
    }
    assert(Director::Get() == nullptr);

    // --- dt is clamped, and a zero dt only renders ---
    {
        ManualClock clock;
        RecordingRenderer renderer;
        std::vector<std::string> trace;
        Director director(clock);
        director.setRenderer(&renderer);
        director.runScene(std::make_shared<TraceScene>("main", trace));

        clock.advance(2.0);
        director.update();
        assert(near(director.getDeltaTime(), 0.25f));
        assert(trace.size() == 1);

        director.update();
        assert(director.getDeltaTime() == 0.0f);
        assert(trace.size() == 1);
        assert(renderer.frames.size() == 2);
        fmt::print("  [OK] Delta clamping and zero-length frames\n");
    }

    // --- Without a scene nothing runs ---
    {
        ManualClock clock;
        RecordingRenderer renderer;
        Director director(clock);
        director.setRenderer(&renderer);
        int ticks = 0;
        director.tick(Handler([&ticks] { ticks++; }));

        clock.advance(0.1);
        director.update();
        assert(ticks == 0);
        assert(renderer.frames.empty());
        assert(director.getRunningScene() == nullptr);
        fmt::print("  [OK] Idle without a running scene\n");
    }

    // --- runScene() replaces the running scene ---
    {
        ManualClock clock;
        RecordingRenderer renderer;
        Director director(clock);
        director.setRenderer(&renderer);
        director.runScene(std::make_shared<Scene>("first"));
        clock.advance(0.1);
        director.update();

        auto second = std::make_shared<Scene>("second");
        director.runScene(second);
        assert(director.getRunningScene() == second);
        clock.advance(0.1);
        director.update();
        assert((renderer.frames == std::vector<std::string>{ "first", "second" }));
        fmt::print("  [OK] Scene replacement\n");
    }

    // --- Interval timers and cancellation ---
    {
        ManualClock clock;
        Director director(clock);
        director.runScene(std::make_shared<Scene>("main"));

        int count = 0;
        TimerId id = director.scheduleInterval(Handler([&count] { count++; }), 0.5);
        for (int i = 0; i < 4; i++) {
            clock.advance(0.25);
            director.update();
        }
        assert(count == 2);

        assert(director.cancel(id));
        assert(!director.cancel(id));
        clock.advance(0.5);
        director.update();
        assert(count == 2);
        fmt::print("  [OK] scheduleInterval() and cancel()\n");
    }

    // --- Actions follow the director's clock ---
    {
        ManualClock clock;
        Director director(clock);
        auto scene = std::make_shared<Scene>("main");
        director.runScene(scene);
        auto node = scene->createNode("mover");
        director.getActionManager().addAction(moveBy(1.0f, glm::vec3(0.0f, 0.0f, 8.0f)), node.get());

        clock.advance(0.25);
        director.update();
        assert(near(node->getPosition(), glm::vec3(0.0f)));
        clock.advance(0.25);
        director.update();
        assert(near(node->getPosition(), glm::vec3(0.0f, 0.0f, 2.0f)));
        fmt::print("  [OK] Actions driven by update()\n");
    }

    // --- Config from the environment ---
    {
        setenv("TEMPO_LOG_LEVEL", "warn", 1);
        setenv("TEMPO_MAX_DELTA_TIME", "0.1", 1);
        setenv("TEMPO_STACKABLE_ACTIONS", "off", 1);
        setenv("TEMPO_TARGET_FPS", "fast", 1);

        Config config = Config::fromEnvironment();
        assert(config.logLevel == LogLevel::Warn);
        assert(near(config.maxDeltaTime, 0.1f));
        assert(!config.stackableActions);
        assert(config.targetFrameRate == 60);

        setenv("TEMPO_MAX_DELTA_TIME", "-3", 1);
        setenv("TEMPO_STACKABLE_ACTIONS", "maybe", 1);
        setenv("TEMPO_TARGET_FPS", "30", 1);
        config = Config::fromEnvironment();
        assert(near(config.maxDeltaTime, 0.25f));
        assert(config.stackableActions);
        assert(config.targetFrameRate == 30);

        config.stackableActions = false;
        ManualClock clock;
        {
            Director director(clock, config);
            assert(!getStackableActionsDefault());
            assert(!moveBy(1.0f, glm::vec3(1.0f))->isStackable());
        }
        setStackableActionsDefault(true);

        unsetenv("TEMPO_LOG_LEVEL");
        unsetenv("TEMPO_MAX_DELTA_TIME");
        unsetenv("TEMPO_STACKABLE_ACTIONS");
        unsetenv("TEMPO_TARGET_FPS");
        config = Config::fromEnvironment();
        assert(config.logLevel == LogLevel::Info);
        assert(near(config.maxDeltaTime, 0.25f));
        fmt::print("  [OK] Config::fromEnvironment()\n");
    }

    fmt::print("All director tests passed\n");
    return 0;
}
