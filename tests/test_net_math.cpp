#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "net_math.h"

using Catch::Approx;

TEST_CASE("Lerp clamps the blend factor") {
    sf::Vector3f a(0.0f, 0.0f, 0.0f);
    sf::Vector3f b(10.0f, -4.0f, 2.0f);

    REQUIRE(NetMath::Lerp(a, b, 0.5f).x == Approx(5.0f));
    REQUIRE(NetMath::Lerp(a, b, 2.0f).y == Approx(-4.0f));
    REQUIRE(NetMath::Lerp(a, b, -1.0f).z == Approx(0.0f));
}

TEST_CASE("Distance is the Euclidean length between points") {
    REQUIRE(NetMath::Distance(sf::Vector3f(0.0f, 0.0f, 0.0f), sf::Vector3f(3.0f, 4.0f, 0.0f)) == Approx(5.0f));
}

TEST_CASE("Slerp halfway around Y is a 45 degree yaw") {
    Quat identity;
    float half = std::sqrt(0.5f);
    Quat quarterTurn(0.0f, half, 0.0f, half);

    Quat mid = NetMath::Slerp(identity, quarterTurn, 0.5f);
    float expectedAngle = 3.14159265f / 8.0f;
    REQUIRE(mid.y == Approx(std::sin(expectedAngle)).margin(1e-5));
    REQUIRE(mid.w == Approx(std::cos(expectedAngle)).margin(1e-5));
    REQUIRE(NetMath::Dot(mid, mid) == Approx(1.0f));
}

TEST_CASE("Slerp takes the shortest arc for negated quaternions") {
    Quat identity;
    Quat negated(0.0f, 0.0f, 0.0f, -1.0f);

    Quat mid = NetMath::Slerp(identity, negated, 0.5f);
    REQUIRE(std::abs(mid.w) == Approx(1.0f));
}

TEST_CASE("Normalize falls back to identity for a zero quaternion") {
    Quat q = NetMath::Normalize(Quat(0.0f, 0.0f, 0.0f, 0.0f));
    REQUIRE(q.w == Approx(1.0f));
}
