#pragma once

#include <magbot/controller.hpp>
#include <magbot/sim/kinematic_sim.hpp>

// Controller wired to a connected in-process simulator.
struct Rig {
    magbot::sim::KinematicSim sim;
    magbot::Controller ctrl;

    explicit Rig(magbot::sim::SimConfig sim_config = {}, magbot::Config config = {})
        : sim(sim_config), ctrl(&sim, config) {
        sim.connect("sim://test");
    }
};
