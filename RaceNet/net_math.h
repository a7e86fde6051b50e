#pragma once
#include <SFML/System/Vector3.hpp>

// Unit quaternion used for vehicle orientation
struct Quat {
    float x, y, z, w;

    Quat() : x(0.0f), y(0.0f), z(0.0f), w(1.0f) {}
    Quat(float x, float y, float z, float w) : x(x), y(y), z(z), w(w) {}
};

namespace NetMath {
    float Distance(const sf::Vector3f& a, const sf::Vector3f& b);

    // Linear blend, t is clamped to [0, 1]
    sf::Vector3f Lerp(const sf::Vector3f& a, const sf::Vector3f& b, float t);

    float Dot(const Quat& a, const Quat& b);
    Quat Normalize(const Quat& q);

    // Spherical blend along the shortest arc, t is clamped to [0, 1]
    Quat Slerp(const Quat& a, const Quat& b, float t);
}
