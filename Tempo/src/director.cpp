#include "Tempo/director.hpp"
#include "Tempo/log.hpp"
#include "Tempo/transform_actions.hpp"
#include <tracy/Tracy.hpp>
#include <exception>

namespace Tempo {

Director* Director::s_instance = nullptr;

Director::Director(Clock& clock, Config config) : m_clock(clock), m_config(config) {
    if (s_instance != nullptr) {
        log::warn("Director: multiple instances created");
    }
    s_instance = this;

    log::setLevel(m_config.logLevel);
    setStackableActionsDefault(m_config.stackableActions);

    m_lastUpdatedAt = m_clock.now();
    log::info("Director: started (max dt {}, stackable actions {}, {} fps)",
              m_config.maxDeltaTime, m_config.stackableActions, m_config.targetFrameRate);
}

Director::~Director() {
    if (s_instance == this) {
        s_instance = nullptr;
    }
}

void Director::runScene(std::shared_ptr<Scene> scene) {
    if (!m_scenes.empty()) {
        m_scenes.pop_back();
    }
    m_scenes.push_back(std::move(scene));
}

std::shared_ptr<Scene> Director::getRunningScene() const {
    return m_scenes.empty() ? nullptr : m_scenes.back();
}

void Director::tick(Handler handler) {
    m_tickers.push_back(std::move(handler));
}

TimerId Director::scheduleInterval(Handler handler, double interval) {
    return m_scheduler.schedule(std::move(handler), now(), interval, false);
}

TimerId Director::scheduleOnce(Handler handler, double delay) {
    return m_scheduler.schedule(std::move(handler), now(), delay, true);
}

bool Director::cancel(TimerId id) {
    return m_scheduler.cancel(id);
}

void Director::update() {
    ZoneScoped;

    double current = m_clock.now();
    float dt = static_cast<float>(current - m_lastUpdatedAt);
    if (m_config.maxDeltaTime > 0.0f && dt > m_config.maxDeltaTime) {
        log::debug("Director: clamping dt {} to {}", dt, m_config.maxDeltaTime);
        dt = m_config.maxDeltaTime;
    }
    m_deltaTime = dt;
    m_lastUpdatedAt = current;

    auto scene = getRunningScene();
    if (!scene) {
        return;
    }

    if (dt > 0.0f) {
        // Tickers may register more tickers.
        for (std::size_t i = 0; i < m_tickers.size(); i++) {
            Handler ticker = m_tickers[i];
            try {
                ticker();
            } catch (const std::exception& e) {
                log::error("Director: ticker threw: {}", e.what());
            }
        }

        m_scheduler.advance(current);
        m_actionManager.update(dt);
        scene->update(dt);
    }

    if (m_renderer) {
        m_renderer->render(*scene);
    }
}

} // namespace Tempo
