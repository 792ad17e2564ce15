#include <doctest/doctest.h>

#include <cmath>

#include <magbot/kinematics/chain.hpp>
#include <magbot/kinematics/solver.hpp>

using namespace magbot;
using namespace magbot::kinematics;

namespace {

    dp::Vector<dp::f64> zeros(dp::usize n) {
        dp::Vector<dp::f64> q;
        q.assign(n, 0.0);
        return q;
    }

    void check_within_bounds(const Chain &chain, const dp::Vector<dp::f64> &q) {
        dp::usize i = 0;
        for (const auto &l : chain.links()) {
            if (!l.active()) {
                continue;
            }
            CHECK(q[i] >= l.lower - 1e-12);
            CHECK(q[i] <= l.upper + 1e-12);
            ++i;
        }
    }

} // namespace

TEST_CASE("chain: arm layout") {
    const auto left = Chain::arm(Arm::Left);
    CHECK(left.dof() == 8);
    CHECK(left.links().size() == 9);
    CHECK(left.name() == dp::String("left"));
    CHECK(left.reach() == doctest::Approx(std::sqrt(0.225 * 0.225 + 0.565 * 0.565 + 0.075 * 0.075) + 0.4475));
}

TEST_CASE("chain: neutral pose hangs the magnet below the shoulder") {
    const auto left = Chain::arm(Arm::Left);
    const auto p = left.forward(zeros(8));
    CHECK(p.x() == doctest::Approx(-0.225));
    CHECK(p.y() == doctest::Approx(0.1175));
    CHECK(p.z() == doctest::Approx(0.075));

    const auto right = Chain::arm(Arm::Right);
    CHECK(right.forward(zeros(8)).x() == doctest::Approx(0.225));
}

TEST_CASE("chain: shoulder pitch swings the arm forward") {
    const auto left = Chain::arm(Arm::Left);
    auto q = zeros(8);
    q[1] = geometry::PI / 2.0;
    const auto p = left.forward(q);
    CHECK(p.x() == doctest::Approx(-0.225));
    CHECK(p.y() == doctest::Approx(0.565));
    CHECK(p.z() == doctest::Approx(0.5225));
}

TEST_CASE("chain: torso turns both shoulders clockwise") {
    const auto left = Chain::arm(Arm::Left);
    auto q = zeros(8);
    q[0] = geometry::PI / 2.0;
    const auto p = left.forward(q);
    CHECK(p.x() == doctest::Approx(0.075));
    CHECK(p.y() == doctest::Approx(0.1175));
    CHECK(p.z() == doctest::Approx(0.225));
}

TEST_CASE("chain: clamp respects bounds") {
    const auto left = Chain::arm(Arm::Left);
    auto q = zeros(8);
    q[0] = 10.0;
    q[4] = -1.0;
    const auto c = left.clamp(q);
    CHECK(c[0] == doctest::Approx(geometry::deg2rad(90.0)));
    CHECK(c[4] == doctest::Approx(0.0));
}

TEST_CASE("solver: reachable target converges") {
    for (const Arm arm : {Arm::Left, Arm::Right}) {
        CAPTURE(to_string(arm));
        const auto chain = Chain::arm(arm);
        const dp::f64 side = arm == Arm::Left ? -1.0 : 1.0;
        const Eigen::Vector3d target(side * 0.225, 0.6, 0.45);

        auto res = solve(chain, target, zeros(8));
        REQUIRE(res.is_ok());
        const auto &sol = res.value();

        CHECK(sol.angles.size() == 8);
        CHECK(sol.residual < 0.01);
        CHECK((sol.predicted - target).norm() == doctest::Approx(sol.residual));
        CHECK((chain.forward(sol.angles) - sol.predicted).norm() < 1e-9);
        check_within_bounds(chain, sol.angles);
    }
}

TEST_CASE("solver: unreachable target reports the miss") {
    const auto chain = Chain::arm(Arm::Left);
    const Eigen::Vector3d target(0.0, 0.5, 2.0);

    auto res = solve(chain, target, zeros(8));
    REQUIRE(res.is_ok());
    CHECK(res.value().residual > 0.5);
    CHECK((res.value().predicted - target).norm() > chain.reach() * 0.5);
}

TEST_CASE("solver: already there takes no iterations") {
    const auto chain = Chain::arm(Arm::Left);
    const auto target = chain.forward(zeros(8));
    auto res = solve(chain, target, zeros(8));
    REQUIRE(res.is_ok());
    CHECK(res.value().iterations == 0);
    CHECK(res.value().residual == doctest::Approx(0.0));
}

TEST_CASE("solver: seed size must match the chain") {
    const auto chain = Chain::arm(Arm::Left);
    auto res = solve(chain, Eigen::Vector3d::Zero(), zeros(7));
    CHECK(res.is_err());
}
