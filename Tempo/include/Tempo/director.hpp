#pragma once

#include "action_manager.hpp"
#include "config.hpp"
#include "handler.hpp"
#include "scene.hpp"
#include "tick_scheduler.hpp"
#include <memory>
#include <vector>

namespace Tempo {

// Monotonic time source in seconds.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

class Renderer {
public:
    virtual ~Renderer() = default;
    virtual void render(const Scene& scene) = 0;
};

// ============================================================
// Director
// ============================================================

/**
 * Owns the frame loop: per-frame tickers, timers, actions, the running scene
 * and the renderer.
 *
 * The host calls update() once per frame. Each call measures dt from the
 * clock and, when a scene is running and time moved forward, runs in order:
 * tickers, due timers, actions, Scene::update(). The renderer then draws the
 * running scene.
 *
 * Example:
 *     SteadyClock clock;
 *     Director director(clock, Config::fromEnvironment());
 *     director.runScene(std::make_shared<Scene>("main"));
 *     director.scheduleOnce(Handler([] { fmt::print("hello\n"); }), 1.0);
 *     while (running) director.update();
 */
class Director {
public:
    explicit Director(Clock& clock, Config config = {});
    ~Director();

    Director(const Director&) = delete;
    Director& operator=(const Director&) = delete;

    // Replaces the running scene.
    void runScene(std::shared_ptr<Scene> scene);
    std::shared_ptr<Scene> getRunningScene() const;

    // Not owned. May be null.
    void setRenderer(Renderer* renderer) { m_renderer = renderer; }

    // Called every frame with dt > 0, before timers.
    void tick(Handler handler);

    TimerId scheduleInterval(Handler handler, double interval);
    TimerId scheduleOnce(Handler handler, double delay);
    bool cancel(TimerId id);

    void update();

    double now() const { return m_clock.now(); }
    float getDeltaTime() const { return m_deltaTime; }

    ActionManager& getActionManager() { return m_actionManager; }
    TickScheduler& getScheduler() { return m_scheduler; }
    const Config& getConfig() const { return m_config; }

    // Most recently constructed live director, if any.
    static Director* Get() { return s_instance; }

private:
    static Director* s_instance;

    Clock& m_clock;
    Config m_config;
    Renderer* m_renderer = nullptr;

    std::vector<std::shared_ptr<Scene>> m_scenes;
    std::vector<Handler> m_tickers;
    TickScheduler m_scheduler;
    ActionManager m_actionManager;

    double m_lastUpdatedAt = 0.0;
    float m_deltaTime = 0.0f;
};

} // namespace Tempo
