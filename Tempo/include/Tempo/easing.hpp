#pragma once

#include <cmath>
#include <functional>
#include <vector>

namespace Tempo {

// ============================================================
// Easing Functions
// ============================================================

using EasingFunc = std::function<float(float)>;

namespace Easing {
    inline float Linear(float t) { return t; }

    inline float InQuad(float t) { return t * t; }
    inline float OutQuad(float t) { return t * (2.0f - t); }
    inline float InOutQuad(float t) {
        if (t < 0.5f) return 2.0f * t * t;
        return -1.0f + (4.0f - 2.0f * t) * t;
    }

    inline float InCubic(float t) { return t * t * t; }
    inline float OutCubic(float t) {
        float f = t - 1.0f;
        return f * f * f + 1.0f;
    }
    inline float InOutCubic(float t) {
        if (t < 0.5f) return 4.0f * t * t * t;
        float f = (2.0f * t - 2.0f);
        return 0.5f * f * f * f + 1.0f;
    }

    inline float OutBack(float t) {
        const float c1 = 1.70158f;
        const float c3 = c1 + 1.0f;
        float f = t - 1.0f;
        return 1.0f + c3 * f * f * f + c1 * f * f;
    }
}

// ============================================================
// Ease
// ============================================================

/**
 * An immutable easing curve that knows its own mirror image.
 *
 * Values are cheap to copy and hold no per-use state, so one Ease can be
 * attached to any number of actions. reverse() returns the curve a reversed
 * action should use so that playing A then A.reverse() retraces the same path.
 *
 * Example:
 *     auto move = moveBy(1.0f, {10, 0, 0});
 *     move->easing({ easeIn(2.0f), easeSineOut() });
 */
class Ease {
public:
    enum class Kind {
        Linear,
        In,
        Out,
        InOut,
        ExponentialIn,
        ExponentialOut,
        ExponentialInOut,
        SineIn,
        SineOut,
        SineInOut,
        ElasticIn,
        ElasticOut,
        ElasticInOut,
        Custom,
    };

    Ease() = default;
    Ease(Kind kind, float param) : m_kind(kind), m_param(param) {}

    float operator()(float t) const;
    Ease reverse() const;

    Kind getKind() const { return m_kind; }
    float getParam() const { return m_param; }

    // Wraps an arbitrary curve. Without `inverse` the curve is its own reverse.
    static Ease custom(EasingFunc curve, EasingFunc inverse = nullptr);

private:
    Kind m_kind = Kind::Linear;
    float m_param = 0.0f;
    EasingFunc m_curve;
    EasingFunc m_inverse;
};

using EaseList = std::vector<Ease>;

Ease easeLinear();
Ease easeIn(float rate);
Ease easeOut(float rate);
Ease easeInOut(float rate);
Ease easeExponentialIn();
Ease easeExponentialOut();
Ease easeExponentialInOut();
Ease easeSineIn();
Ease easeSineOut();
Ease easeSineInOut();
Ease easeElasticIn(float period = 0.3f);
Ease easeElasticOut(float period = 0.3f);
// A period of 0 selects 0.45.
Ease easeElasticInOut(float period = 0.3f);

// Runs t through every curve in order.
float applyEasing(const EaseList& list, float t);

EaseList reverseEasing(const EaseList& list);

} // namespace Tempo
