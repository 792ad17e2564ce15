#include <doctest/doctest.h>

#include <cmath>

#include "rig.hpp"

using namespace magbot;

namespace {

    // Signed heading of a frame in (-180, 180].
    dp::f64 signed_heading(const Frame &f) {
        dp::f64 h = geometry::heading_of(f.forward());
        if (h > 180.0) {
            h -= 360.0;
        }
        return h;
    }

} // namespace

TEST_CASE("turn: turn_by reaches the requested heading") {
    Rig rig;
    REQUIRE(rig.ctrl.init().is_ok());

    auto r = rig.ctrl.turn_by(45.0);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::Success);
    CHECK(std::fabs(signed_heading(rig.ctrl.state()) - 45.0) < rig.ctrl.config().aligned_at);
    CHECK(rig.sim.heading() == doctest::Approx(45.0));
    CHECK(rig.sim.wheel_batches() == 15);
}

TEST_CASE("turn: zero turn is already aligned") {
    Rig rig;
    REQUIRE(rig.ctrl.init().is_ok());
    auto r = rig.ctrl.turn_by(0.0);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::Success);
    CHECK(rig.sim.wheel_batches() == 0);
}

TEST_CASE("turn: counter-clockwise request") {
    Rig rig;
    REQUIRE(rig.ctrl.init().is_ok());
    auto r = rig.ctrl.turn_by(-30.0);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::Success);
    CHECK(rig.sim.heading() == doctest::Approx(-30.0));
    CHECK(rig.sim.wheel_batches() == 10);
}

TEST_CASE("turn: every angle in [-180, 180] converges") {
    for (dp::f64 angle = -180.0; angle <= 180.0; angle += 15.0) {
        for (const dp::f64 offset : {0.0, 1.3}) {
            const dp::f64 request = angle + offset > 180.0 ? angle : angle + offset;
            CAPTURE(request);

            Rig rig;
            REQUIRE(rig.ctrl.init().is_ok());
            auto r = rig.ctrl.turn_by(request);
            REQUIRE(r.is_ok());
            CHECK(r.value() == ActionStatus::Success);
            CHECK(std::fabs(rig.sim.heading() - request) < rig.ctrl.config().aligned_at);
        }
    }
}

TEST_CASE("turn: turn_to faces an object") {
    Rig rig;
    rig.sim.add_object(100, dp::Point{1.0, 0.0, 1.0});
    REQUIRE(rig.ctrl.init().is_ok());

    auto r = rig.ctrl.turn_to(Target::object(100));
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::Success);
    CHECK(std::fabs(rig.sim.heading() - 45.0) < 3.0);
}

TEST_CASE("turn: turn_to a point behind") {
    Rig rig;
    REQUIRE(rig.ctrl.init().is_ok());
    auto r = rig.ctrl.turn_to(Target::point(-1.0, 0.0, -1.0));
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::Success);
    CHECK(std::fabs(rig.sim.heading() + 135.0) < 3.0);
}

TEST_CASE("turn: malformed targets are request errors") {
    Rig rig;
    REQUIRE(rig.ctrl.init().is_ok());
    CHECK(rig.ctrl.turn_to(Target{}).is_err());
    CHECK(rig.ctrl.turn_to(Target::object(404)).is_err());
    CHECK(rig.ctrl.turn_by(10.0, 0.0, 3.0).is_err());
    CHECK(rig.sim.wheel_batches() == 0);
}

TEST_CASE("turn: a pinned base runs out of attempts") {
    sim::SimConfig sc;
    sc.pinned = true;
    Rig rig(sc);
    REQUIRE(rig.ctrl.init().is_ok());

    // Cap is ceil(5 + 1) * 1 * 50.
    auto r = rig.ctrl.turn_by(5.0, 1.0, 1.0);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::TooManyAttempts);
    CHECK(rig.sim.wheel_batches() == 300);
    CHECK(rig.sim.heading() == doctest::Approx(0.0));
}

TEST_CASE("turn: wheels that never settle leave the robot unaligned") {
    sim::SimConfig sc;
    sc.jitter_wheels = true;
    Config c;
    c.wheel_settle_max_ticks = 20;
    Rig rig(sc, c);
    REQUIRE(rig.ctrl.init().is_ok());

    auto r = rig.ctrl.turn_by(45.0);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::Unaligned);
    CHECK(rig.sim.wheel_batches() == 1);
    CHECK_FALSE(rig.ctrl.session().in_flight());
}

TEST_CASE("turn: wheel direction stays with the requested turn") {
    Config c;
    c.attempts_per_unit = 0.01;
    Rig rig({}, c);
    REQUIRE(rig.ctrl.init().is_ok());

    // 60 wheel degrees is 12 heading degrees per attempt; 5 +- 1 is never hit.
    // Cap is ceil(ceil(5 + 1) * 60 * 0.01) = 4.
    auto r = rig.ctrl.turn_by(5.0, 60.0, 1.0);
    REQUIRE(r.is_ok());
    CHECK(r.value() == ActionStatus::TooManyAttempts);
    CHECK(rig.sim.wheel_batches() == 4);
    CHECK(rig.sim.heading() == doctest::Approx(48.0));
}
