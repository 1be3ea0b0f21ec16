#pragma once

#include "Tempo/director.hpp"
#include <glm/geometric.hpp>
#include <cmath>
#include <string>
#include <vector>

namespace TempoTest {

inline bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

inline bool near(const glm::vec3& a, const glm::vec3& b, float eps = 1e-4f) {
    return glm::length(a - b) <= eps;
}

class ManualClock : public Tempo::Clock {
public:
    double now() const override { return m_now; }
    void set(double now) { m_now = now; }
    void advance(double dt) { m_now += dt; }

private:
    double m_now = 0.0;
};

class RecordingRenderer : public Tempo::Renderer {
public:
    void render(const Tempo::Scene& scene) override {
        frames.push_back(scene.getName());
    }

    std::vector<std::string> frames;
};

} // namespace TempoTest
