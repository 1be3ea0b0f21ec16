#include "Tempo/easing.hpp"
#include <glm/gtc/constants.hpp>

namespace Tempo {

namespace {
    const float kPi = glm::pi<float>();

    float elasticIn(float t, float period) {
        if (t == 0.0f || t == 1.0f) {
            return t;
        }
        t = t - 1.0f;
        return -std::pow(2.0f, 10.0f * t) * std::sin((t - (period / 4.0f)) * kPi * 2.0f / period);
    }

    float elasticOut(float t, float period) {
        if (t == 0.0f || t == 1.0f) {
            return t;
        }
        return std::pow(2.0f, -10.0f * t) * std::sin((t - (period / 4.0f)) * kPi * 2.0f / period) + 1.0f;
    }

    float elasticInOut(float t, float period) {
        if (t == 0.0f || t == 1.0f) {
            return t;
        }
        t = t * 2.0f - 1.0f;
        float s = period / 4.0f;
        if (t < 0.0f) {
            return -0.5f * std::pow(2.0f, 10.0f * t) * std::sin((t - s) * kPi * 2.0f / period);
        }
        return std::pow(2.0f, -10.0f * t) * std::sin((t - s) * kPi * 2.0f / period) * 0.5f + 1.0f;
    }
}

float Ease::operator()(float t) const {
    switch (m_kind) {
        case Kind::Linear:
            return t;
        case Kind::In:
            return std::pow(t, m_param);
        case Kind::Out:
            return std::pow(t, 1.0f / m_param);
        case Kind::InOut:
            t *= 2.0f;
            if (t < 1.0f) {
                return 0.5f * std::pow(t, m_param);
            }
            return 1.0f - 0.5f * std::pow(2.0f - t, m_param);
        case Kind::ExponentialIn:
            return t == 0.0f ? 0.0f : std::pow(2.0f, 10.0f * (t - 1.0f));
        case Kind::ExponentialOut:
            return t == 1.0f ? 1.0f : (-std::pow(2.0f, -10.0f * t) + 1.0f);
        case Kind::ExponentialInOut:
            if (t != 1.0f && t != 0.0f) {
                t *= 2.0f;
                if (t < 1.0f) {
                    return 0.5f * std::pow(2.0f, 10.0f * (t - 1.0f));
                }
                return 0.5f * (-std::pow(2.0f, -10.0f * (t - 1.0f)) + 2.0f);
            }
            return t;
        case Kind::SineIn:
            return (t == 0.0f || t == 1.0f) ? t : -1.0f * std::cos(t * kPi / 2.0f) + 1.0f;
        case Kind::SineOut:
            return (t == 0.0f || t == 1.0f) ? t : std::sin(t * kPi / 2.0f);
        case Kind::SineInOut:
            return (t == 0.0f || t == 1.0f) ? t : -0.5f * (std::cos(kPi * t) - 1.0f);
        case Kind::ElasticIn:
            return elasticIn(t, m_param);
        case Kind::ElasticOut:
            return elasticOut(t, m_param);
        case Kind::ElasticInOut:
            return elasticInOut(t, m_param);
        case Kind::Custom:
            return m_curve ? m_curve(t) : t;
    }
    return t;
}

Ease Ease::reverse() const {
    switch (m_kind) {
        case Kind::In:
            return easeIn(1.0f / m_param);
        case Kind::Out:
            return easeOut(1.0f / m_param);
        case Kind::ExponentialIn:
            return easeExponentialOut();
        case Kind::ExponentialOut:
            return easeExponentialIn();
        case Kind::SineIn:
            return easeSineOut();
        case Kind::SineOut:
            return easeSineIn();
        case Kind::ElasticIn:
            return easeElasticOut(m_param);
        case Kind::ElasticOut:
            return easeElasticIn(m_param);
        case Kind::Custom:
            if (m_inverse) {
                return custom(m_inverse, m_curve);
            }
            return *this;
        default:
            return *this;
    }
}

Ease Ease::custom(EasingFunc curve, EasingFunc inverse) {
    Ease ease(Kind::Custom, 0.0f);
    ease.m_curve = std::move(curve);
    ease.m_inverse = std::move(inverse);
    return ease;
}

Ease easeLinear() { return Ease(Ease::Kind::Linear, 0.0f); }
Ease easeIn(float rate) { return Ease(Ease::Kind::In, rate); }
Ease easeOut(float rate) { return Ease(Ease::Kind::Out, rate); }
Ease easeInOut(float rate) { return Ease(Ease::Kind::InOut, rate); }
Ease easeExponentialIn() { return Ease(Ease::Kind::ExponentialIn, 0.0f); }
Ease easeExponentialOut() { return Ease(Ease::Kind::ExponentialOut, 0.0f); }
Ease easeExponentialInOut() { return Ease(Ease::Kind::ExponentialInOut, 0.0f); }
Ease easeSineIn() { return Ease(Ease::Kind::SineIn, 0.0f); }
Ease easeSineOut() { return Ease(Ease::Kind::SineOut, 0.0f); }
Ease easeSineInOut() { return Ease(Ease::Kind::SineInOut, 0.0f); }

Ease easeElasticIn(float period) {
    return Ease(Ease::Kind::ElasticIn, period > 0.0f ? period : 0.3f);
}

Ease easeElasticOut(float period) {
    return Ease(Ease::Kind::ElasticOut, period > 0.0f ? period : 0.3f);
}

Ease easeElasticInOut(float period) {
    return Ease(Ease::Kind::ElasticInOut, period > 0.0f ? period : 0.3f * 1.5f);
}

float applyEasing(const EaseList& list, float t) {
    for (const auto& ease : list) {
        t = ease(t);
    }
    return t;
}

EaseList reverseEasing(const EaseList& list) {
    EaseList reversed;
    reversed.reserve(list.size());
    for (const auto& ease : list) {
        reversed.push_back(ease.reverse());
    }
    return reversed;
}

} // namespace Tempo
