/**
 * Director demo host.
 *
 * Uses SDL3's high resolution tick counter as the clock and prints the scene
 * to the console a few times per second. Configuration comes from the
 * TEMPO_* environment variables.
 */

#include "Tempo/actions.hpp"
#include "Tempo/director.hpp"
#include <SDL3/SDL.h>
#include <fmt/core.h>
#include <memory>

using namespace Tempo;

namespace {

class SdlClock : public Clock {
public:
    double now() const override {
        return static_cast<double>(SDL_GetTicksNS()) / 1e9;
    }
};

class ConsoleRenderer : public Renderer {
public:
    explicit ConsoleRenderer(const Clock& clock) : m_clock(clock) {}

    void render(const Scene& scene) override {
        double now = m_clock.now();
        if (now < m_nextPrint) {
            return;
        }
        m_nextPrint = now + 0.5;

        fmt::print("[{}]\n", scene.getName());
        for (const auto& node : scene.getNodes()) {
            printNode(*node, 1);
        }
    }

private:
    void printNode(const Node& node, int depth) {
        auto p = node.getPosition();
        auto r = node.getRotation();
        auto s = node.getScale();
        fmt::print("{:>{}}{}: pos ({:.2f}, {:.2f}, {:.2f}) rot {:.1f} scale {:.2f}\n",
                   "", depth * 2, node.getName(), p.x, p.y, p.z, r.z, s.x);
        for (const auto& child : node.getChildren()) {
            printNode(*child, depth + 1);
        }
    }

    const Clock& m_clock;
    double m_nextPrint = 0.0;
};

class DemoScene : public Scene {
public:
    DemoScene() : Scene("demo") {}

    void update(float dt) override {
        m_frames++;
        m_time += dt;
    }

    int getFrames() const { return m_frames; }
    float getTime() const { return m_time; }

private:
    int m_frames = 0;
    float m_time = 0.0f;
};

} // namespace

int main(int argc, char* argv[]) {
    if (!SDL_Init(0)) {
        fmt::print(stderr, "SDL_Init failed: {}\n", SDL_GetError());
        return 1;
    }

    SdlClock clock;
    ConsoleRenderer renderer(clock);
    Director director(clock, Config::fromEnvironment());
    director.setRenderer(&renderer);

    auto scene = std::make_shared<DemoScene>();
    auto ship = scene->createNode("ship");
    auto turret = ship->createChild("turret");
    auto beacon = scene->createNode("beacon");
    director.runScene(scene);

    auto& actions = director.getActionManager();

    auto patrol = sequence(moveBy(1.0f, { 3.0f, 0.0f, 0.0f }), moveBy(1.0f, { -3.0f, 0.0f, 0.0f }));
    patrol->easing({ easeInOut(2.0f) });
    actions.addAction(repeatForever(patrol), ship.get());

    actions.addAction(repeatForever(rotateBy(1.0f, { 0.0f, 0.0f, 180.0f })), turret.get());

    auto blink = sequence(scaleTo(0.25f, 0.5f), scaleTo(0.25f, 1.0f));
    blink->setTag(7);
    actions.addAction(repeat(blink, 4), beacon.get());

    director.scheduleInterval(Handler([&director] {
        fmt::print("-- {:.1f}s elapsed\n", director.now());
    }), 1.0);

    bool running = true;
    director.scheduleOnce(Handler([&running] { running = false; }), 4.0);

    const Uint64 frameNS = SDL_NS_PER_SECOND / static_cast<Uint64>(director.getConfig().targetFrameRate);
    while (running) {
        Uint64 frameStart = SDL_GetTicksNS();
        director.update();

        Uint64 spent = SDL_GetTicksNS() - frameStart;
        if (spent < frameNS) {
            SDL_DelayNS(frameNS - spent);
        }
    }

    fmt::print("{} frames in {:.2f}s\n", scene->getFrames(), scene->getTime());

    actions.removeAllActions();
    SDL_Quit();
    return 0;
}
