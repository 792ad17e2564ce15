#pragma once

#include <datapod/adapters.hpp>

#include "magbot/kinematics/solver.hpp"

namespace magbot {

    /// Action defaults and loop bounds.
    ///
    /// Speeds are wheel degrees per attempt; tolerances are degrees (aligned_at) or scene
    /// units (arrived_at).
    struct Config {
        dp::f64 turn_speed = 15.0;
        dp::f64 move_speed = 15.0;
        dp::f64 aligned_at = 3.0;
        dp::f64 arrived_at = 0.1;
        dp::f64 reach_arrived_at = 0.125;

        // Attempt cap is ceil(|amount| + 1) * speed * attempts_per_unit.
        dp::f64 attempts_per_unit = 50.0;

        // A joint counts as still moving above this per-tick change (degrees).
        dp::f64 settle_threshold_deg = 0.001;
        dp::u32 wheel_settle_max_ticks = 1000;
        dp::u32 bend_max_ticks = 200;

        bool debug = false;

        kinematics::SolverParams solver;
    };

} // namespace magbot
