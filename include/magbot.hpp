#pragma once

// Single-include convenience header for magbot.

#include "magbot/action_status.hpp"
#include "magbot/arm.hpp"
#include "magbot/bridge.hpp"
#include "magbot/config.hpp"
#include "magbot/controller.hpp"
#include "magbot/frame.hpp"
#include "magbot/geometry.hpp"
#include "magbot/kinematics/chain.hpp"
#include "magbot/kinematics/solver.hpp"
#include "magbot/kinematics/translator.hpp"
#include "magbot/robot/layout.hpp"
#include "magbot/session.hpp"
#include "magbot/sim/kinematic_sim.hpp"
#include "magbot/types.hpp"
