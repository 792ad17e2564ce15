#pragma once

#include <string>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "magbot/frame.hpp"
#include "magbot/geometry.hpp"
#include "magbot/robot/layout.hpp"
#include "magbot/types.hpp"

namespace magbot {
    namespace kinematics {

        using CommandList = dp::Vector<types::Command>;

        static inline dp::Error unknown_kind(const robot::JointSlot &slot) {
            return dp::Error::invalid_argument(
                (std::string("joint kind not defined for ") + joint_name(slot.joint)).c_str());
        }

        /// Solved chain angles (radians, chain order) -> one target command per joint.
        ///
        /// Revolute joints consume one angle, spherical joints three. The angle count must match
        /// the slots exactly.
        inline dp::Result<CommandList> to_commands(const dp::Vector<robot::JointSlot> &slots,
                                                   const dp::Vector<dp::f64> &angles_rad) {
            using geometry::rad2deg;

            CommandList out;
            out.reserve(slots.size());

            dp::usize i = 0;
            for (const auto &slot : slots) {
                const dp::usize need = angle_count(slot.kind);
                if (need == 0) {
                    return dp::Result<CommandList>::err(unknown_kind(slot));
                }
                if (i + need > angles_rad.size()) {
                    return dp::Result<CommandList>::err(dp::Error::invalid_argument("too few solved angles"));
                }
                if (slot.kind == types::JointKind::Revolute) {
                    out.push_back(types::Command::set_revolute_target(slot.id, rad2deg(angles_rad[i])));
                } else {
                    out.push_back(types::Command::set_spherical_target(slot.id, rad2deg(angles_rad[i]),
                                                                       rad2deg(angles_rad[i + 1]),
                                                                       rad2deg(angles_rad[i + 2])));
                }
                i += need;
            }
            if (i != angles_rad.size()) {
                return dp::Result<CommandList>::err(dp::Error::invalid_argument("too many solved angles"));
            }

            return dp::Result<CommandList>::ok(out);
        }

        /// Neutral targets: 0 for revolute, {0,0,0} for spherical.
        inline dp::Result<CommandList> reset_commands(const dp::Vector<robot::JointSlot> &slots) {
            CommandList out;
            out.reserve(slots.size());
            for (const auto &slot : slots) {
                switch (slot.kind) {
                case types::JointKind::Revolute:
                    out.push_back(types::Command::set_revolute_target(slot.id, 0.0));
                    break;
                case types::JointKind::Spherical:
                    out.push_back(types::Command::set_spherical_target(slot.id, 0.0, 0.0, 0.0));
                    break;
                default:
                    return dp::Result<CommandList>::err(unknown_kind(slot));
                }
            }
            return dp::Result<CommandList>::ok(out);
        }

        /// Current chain angles (radians, chain order) read from a frame, for seeding a solve.
        inline dp::Result<dp::Vector<dp::f64>> seed_angles(const dp::Vector<robot::JointSlot> &slots,
                                                           const Frame &frame) {
            using geometry::deg2rad;

            dp::Vector<dp::f64> out;
            for (const auto &slot : slots) {
                const dp::usize need = angle_count(slot.kind);
                if (need == 0) {
                    return dp::Result<dp::Vector<dp::f64>>::err(unknown_kind(slot));
                }
                const auto *angles = frame.joint_angles(slot.id);
                if (!angles || angles->size() < need) {
                    return dp::Result<dp::Vector<dp::f64>>::err(dp::Error::invalid_argument(
                        (std::string("frame has no angles for ") + joint_name(slot.joint)).c_str()));
                }
                for (dp::usize k = 0; k < need; ++k) {
                    out.push_back(deg2rad((*angles)[k]));
                }
            }
            return dp::Result<dp::Vector<dp::f64>>::ok(out);
        }

    } // namespace kinematics
} // namespace magbot
