#pragma once

#include <cmath>
#include <vector>

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <datapod/adapters.hpp>

#include "magbot/arm.hpp"
#include "magbot/geometry.hpp"

namespace magbot {
    namespace kinematics {

        /// One rigid link of a serial chain.
        ///
        /// The link frame is placed by `translation` then `rpy` (fixed, relative to the parent
        /// frame), then rotated about `axis` by the joint variable. A zero axis marks a fixed
        /// link that contributes no degree of freedom. Bounds are radians.
        struct Link {
            dp::String name;
            Eigen::Vector3d translation = Eigen::Vector3d::Zero();
            Eigen::Vector3d rpy = Eigen::Vector3d::Zero();
            Eigen::Vector3d axis = Eigen::Vector3d::Zero();
            dp::f64 lower = 0.0;
            dp::f64 upper = 0.0;

            bool active() const { return !axis.isZero(); }
        };

        /// Per-DOF world axis and origin, plus the end-effector point, for one configuration.
        struct ChainState {
            std::vector<Eigen::Vector3d> axes;
            std::vector<Eigen::Vector3d> origins;
            Eigen::Vector3d end = Eigen::Vector3d::Zero();
        };

        // rpy is roll about x, pitch about y, yaw about z, composed as Rz * Ry * Rx.
        inline Eigen::Matrix3d rpy_matrix(const Eigen::Vector3d &rpy) {
            return (Eigen::AngleAxisd(rpy.z(), Eigen::Vector3d::UnitZ()) *
                    Eigen::AngleAxisd(rpy.y(), Eigen::Vector3d::UnitY()) *
                    Eigen::AngleAxisd(rpy.x(), Eigen::Vector3d::UnitX()))
                .toRotationMatrix();
        }

        /// Serial kinematic chain from the robot root to an end-effector.
        ///
        /// Link order is fixed at construction. Joint variables are passed in link order, one
        /// per active link, in radians.
        class Chain {
          public:
            Chain() = default;

            Chain(dp::String name, dp::Vector<Link> links) : name_(std::move(name)), links_(std::move(links)) {
                for (const auto &l : links_) {
                    if (l.active()) {
                        ++dof_;
                    }
                }
            }

            /// The magnet chain of one arm, expressed in the robot-relative frame.
            static Chain arm(Arm which) {
                using geometry::deg2rad;
                const dp::f64 side = which == Arm::Left ? -1.0 : 1.0;

                dp::Vector<Link> links;
                links.reserve(9);

                Link torso;
                torso.name = dp::String("torso");
                torso.axis = Eigen::Vector3d::UnitY();
                torso.lower = deg2rad(-90.0);
                torso.upper = deg2rad(90.0);
                links.push_back(torso);

                // The shoulder frame is rolled so that its -z points down the hanging arm.
                Link shoulder_pitch;
                shoulder_pitch.name = dp::String("shoulder_pitch");
                shoulder_pitch.translation = Eigen::Vector3d(side * 0.225, 0.565, 0.075);
                shoulder_pitch.rpy = Eigen::Vector3d(-geometry::PI / 2.0, 0.0, 0.0);
                shoulder_pitch.axis = -Eigen::Vector3d::UnitX();
                shoulder_pitch.lower = deg2rad(-60.0);
                shoulder_pitch.upper = deg2rad(179.0);
                links.push_back(shoulder_pitch);

                Link shoulder_yaw;
                shoulder_yaw.name = dp::String("shoulder_yaw");
                shoulder_yaw.axis = Eigen::Vector3d::UnitY();
                shoulder_yaw.lower = deg2rad(-90.0);
                shoulder_yaw.upper = deg2rad(90.0);
                links.push_back(shoulder_yaw);

                Link shoulder_roll;
                shoulder_roll.name = dp::String("shoulder_roll");
                shoulder_roll.axis = Eigen::Vector3d::UnitZ();
                shoulder_roll.lower = deg2rad(-45.0);
                shoulder_roll.upper = deg2rad(45.0);
                links.push_back(shoulder_roll);

                Link elbow_pitch;
                elbow_pitch.name = dp::String("elbow_pitch");
                elbow_pitch.translation = Eigen::Vector3d(0.0, 0.0, -0.235);
                elbow_pitch.axis = -Eigen::Vector3d::UnitX();
                elbow_pitch.lower = 0.0;
                elbow_pitch.upper = deg2rad(160.0);
                links.push_back(elbow_pitch);

                Link wrist_pitch;
                wrist_pitch.name = dp::String("wrist_pitch");
                wrist_pitch.translation = Eigen::Vector3d(0.0, 0.0, -0.15);
                wrist_pitch.axis = -Eigen::Vector3d::UnitX();
                wrist_pitch.lower = deg2rad(-90.0);
                wrist_pitch.upper = deg2rad(90.0);
                links.push_back(wrist_pitch);

                Link wrist_yaw;
                wrist_yaw.name = dp::String("wrist_yaw");
                wrist_yaw.axis = Eigen::Vector3d::UnitY();
                wrist_yaw.lower = deg2rad(-90.0);
                wrist_yaw.upper = deg2rad(90.0);
                links.push_back(wrist_yaw);

                Link wrist_roll;
                wrist_roll.name = dp::String("wrist_roll");
                wrist_roll.axis = Eigen::Vector3d::UnitZ();
                wrist_roll.lower = 0.0;
                wrist_roll.upper = deg2rad(90.0);
                links.push_back(wrist_roll);

                Link magnet;
                magnet.name = dp::String("magnet");
                magnet.translation = Eigen::Vector3d(0.0, 0.0, -0.0625);
                links.push_back(magnet);

                return Chain(dp::String(to_string(which)), std::move(links));
            }

            const dp::String &name() const { return name_; }
            const dp::Vector<Link> &links() const { return links_; }
            dp::usize dof() const { return dof_; }

            /// Sum of link offsets: no configuration places the end-effector farther than this
            /// from the chain root.
            dp::f64 reach() const {
                dp::f64 total = 0.0;
                for (const auto &l : links_) {
                    total += l.translation.norm();
                }
                return total;
            }

            /// Clamp each joint variable into its bounds. Extra values are left untouched.
            dp::Vector<dp::f64> clamp(dp::Vector<dp::f64> angles) const {
                dp::usize i = 0;
                for (const auto &l : links_) {
                    if (!l.active()) {
                        continue;
                    }
                    if (i >= angles.size()) {
                        break;
                    }
                    if (angles[i] < l.lower) {
                        angles[i] = l.lower;
                    } else if (angles[i] > l.upper) {
                        angles[i] = l.upper;
                    }
                    ++i;
                }
                return angles;
            }

            /// Walk the chain for one configuration. Missing joint variables read as zero.
            ChainState walk(const dp::Vector<dp::f64> &angles) const {
                ChainState out;
                out.axes.reserve(dof_);
                out.origins.reserve(dof_);

                Eigen::Matrix3d rot = Eigen::Matrix3d::Identity();
                Eigen::Vector3d pos = Eigen::Vector3d::Zero();
                dp::usize i = 0;
                for (const auto &l : links_) {
                    pos += rot * l.translation;
                    rot = rot * rpy_matrix(l.rpy);
                    if (l.active()) {
                        const Eigen::Vector3d axis = l.axis.normalized();
                        out.axes.push_back(rot * axis);
                        out.origins.push_back(pos);
                        const dp::f64 q = i < angles.size() ? angles[i] : 0.0;
                        rot = rot * Eigen::AngleAxisd(q, axis).toRotationMatrix();
                        ++i;
                    }
                }
                out.end = pos;
                return out;
            }

            /// Forward kinematics: end-effector position for one configuration.
            Eigen::Vector3d forward(const dp::Vector<dp::f64> &angles) const { return walk(angles).end; }

          private:
            dp::String name_;
            dp::Vector<Link> links_;
            dp::usize dof_ = 0;
        };

    } // namespace kinematics
} // namespace magbot
