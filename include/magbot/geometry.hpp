#pragma once

// Frame and angle conventions.
//
// World and robot-relative frames share one convention: y up, z forward, x to the right.
// Headings are measured about +y and are positive clockwise seen from above, i.e. a
// positive heading turns the forward vector toward +x.

#include <cmath>

#include <Eigen/Core>
#include <Eigen/Geometry>

#include <datapod/adapters.hpp>
#include <datapod/spatial.hpp>

namespace magbot {
    namespace geometry {

        static constexpr dp::f64 PI = 3.14159265358979323846;

        inline dp::f64 deg2rad(dp::f64 deg) { return deg * PI / 180.0; }
        inline dp::f64 rad2deg(dp::f64 rad) { return rad * 180.0 / PI; }

        inline Eigen::Vector3d to_eigen(const dp::Point &p) { return Eigen::Vector3d(p.x, p.y, p.z); }
        inline dp::Point to_point(const Eigen::Vector3d &v) { return dp::Point{v.x(), v.y(), v.z()}; }

        /// Canonical forward axis of an unrotated robot.
        inline Eigen::Vector3d forward_axis() { return Eigen::Vector3d::UnitZ(); }

        inline Eigen::Vector3d forward_of(const dp::Quaternion &q) {
            Eigen::Quaterniond e(q.w, q.x, q.y, q.z);
            if (e.norm() <= 0.0) {
                return forward_axis();
            }
            return e.normalized() * forward_axis();
        }

        /// Rotation about +y for a heading in degrees.
        inline dp::Quaternion yaw_quaternion(dp::f64 heading_deg) {
            const dp::f64 half = deg2rad(heading_deg) * 0.5;
            dp::Quaternion q;
            q.w = std::cos(half);
            q.x = 0.0;
            q.y = std::sin(half);
            q.z = 0.0;
            return q;
        }

        /// Angle in degrees, in [0, 360), from the xz-direction of `v2` to that of `v1`,
        /// measured counter-clockwise (the inverse of the heading convention).
        inline dp::f64 angle_between(const Eigen::Vector3d &v1, const Eigen::Vector3d &v2) {
            const dp::f64 a1 = std::atan2(v1.z(), v1.x());
            const dp::f64 a2 = std::atan2(v2.z(), v2.x());
            dp::f64 d = std::fmod(a1 - a2, 2.0 * PI);
            if (d < 0.0) {
                d += 2.0 * PI;
            }
            return rad2deg(d);
        }

        /// Heading of a forward vector in [0, 360).
        inline dp::f64 heading_of(const Eigen::Vector3d &forward) { return angle_between(forward_axis(), forward); }

        /// Signed angle in degrees, in (-180, 180], from `forward` to the direction
        /// `origin -> position`, clockwise positive. Zero when the two points coincide in xz.
        inline dp::f64 angle_to(const Eigen::Vector3d &forward, const Eigen::Vector3d &origin,
                                const Eigen::Vector3d &position) {
            const dp::f64 dx = position.x() - origin.x();
            const dp::f64 dz = position.z() - origin.z();
            if (std::hypot(dx, dz) <= 0.0) {
                return 0.0;
            }
            const dp::f64 cross = forward.z() * dx - forward.x() * dz;
            const dp::f64 dot = forward.x() * dx + forward.z() * dz;
            return rad2deg(std::atan2(cross, dot));
        }

        /// Rotate a point about the y axis through the origin, clockwise positive.
        inline Eigen::Vector3d rotate_y(const Eigen::Vector3d &p, dp::f64 angle_deg) {
            const dp::f64 a = deg2rad(angle_deg);
            const dp::f64 c = std::cos(a);
            const dp::f64 s = std::sin(a);
            return Eigen::Vector3d(c * p.x() + s * p.z(), p.y(), -s * p.x() + c * p.z());
        }

        /// World point -> robot-relative point.
        inline Eigen::Vector3d absolute_to_relative(const Eigen::Vector3d &p, const Eigen::Vector3d &robot_position,
                                                    const Eigen::Vector3d &robot_forward) {
            return rotate_y(p - robot_position, -heading_of(robot_forward));
        }

        /// Robot-relative point -> world point.
        inline Eigen::Vector3d relative_to_absolute(const Eigen::Vector3d &p, const Eigen::Vector3d &robot_position,
                                                    const Eigen::Vector3d &robot_forward) {
            return rotate_y(p, heading_of(robot_forward)) + robot_position;
        }

        /// Turn progress since `f0` as compared against a requested turn angle.
        ///
        /// Counter-clockwise requests (negative angle) negate the raw angle; clockwise requests
        /// fold anything past 180 back via 360 - a.
        inline dp::f64 turn_progress(const Eigen::Vector3d &forward, const Eigen::Vector3d &f0, dp::f64 requested_deg) {
            dp::f64 a = angle_between(forward, f0);
            if (requested_deg < 0.0) {
                a *= -1.0;
            } else if (a > 180.0) {
                a = 360.0 - a;
            }
            return a;
        }

    } // namespace geometry
} // namespace magbot
