#include "net_math.h"
#include <algorithm>
#include <cmath>

namespace NetMath {
    float Distance(const sf::Vector3f& a, const sf::Vector3f& b) {
        return (b - a).length();
    }

    sf::Vector3f Lerp(const sf::Vector3f& a, const sf::Vector3f& b, float t) {
        t = std::clamp(t, 0.0f, 1.0f);
        return a + (b - a) * t;
    }

    float Dot(const Quat& a, const Quat& b) {
        return a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w;
    }

    Quat Normalize(const Quat& q) {
        float length = std::sqrt(Dot(q, q));
        if (length <= 0.0f || !std::isfinite(length)) {
            return Quat();
        }
        return Quat(q.x / length, q.y / length, q.z / length, q.w / length);
    }

    /**
     * Interpolates two orientations on the unit sphere.
     * Falls back to a normalized linear blend when the quaternions are nearly parallel,
     * where the sine in the denominator loses precision.
     * @param a Orientation at t = 0.
     * @param b Orientation at t = 1.
     * @param t Blend factor.
     * @return Normalized orientation between a and b.
     */
    Quat Slerp(const Quat& a, const Quat& b, float t) {
        t = std::clamp(t, 0.0f, 1.0f);

        Quat from = Normalize(a);
        Quat to = Normalize(b);
        float cosTheta = Dot(from, to);

        // q and -q are the same rotation; take the short way round
        if (cosTheta < 0.0f) {
            to = Quat(-to.x, -to.y, -to.z, -to.w);
            cosTheta = -cosTheta;
        }

        if (cosTheta > 0.9995f) {
            return Normalize(Quat(
                from.x + (to.x - from.x) * t,
                from.y + (to.y - from.y) * t,
                from.z + (to.z - from.z) * t,
                from.w + (to.w - from.w) * t));
        }

        float theta = std::acos(cosTheta);
        float sinTheta = std::sin(theta);
        float weightFrom = std::sin((1.0f - t) * theta) / sinTheta;
        float weightTo = std::sin(t * theta) / sinTheta;

        return Quat(
            from.x * weightFrom + to.x * weightTo,
            from.y * weightFrom + to.y * weightTo,
            from.z * weightFrom + to.z * weightTo,
            from.w * weightFrom + to.w * weightTo);
    }
}
