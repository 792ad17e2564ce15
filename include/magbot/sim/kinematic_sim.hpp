#pragma once

#include <cmath>
#include <string>

#include <Eigen/Core>

#include <datapod/adapters.hpp>
#include <datapod/spatial.hpp>

#include "magbot/arm.hpp"
#include "magbot/bridge.hpp"
#include "magbot/geometry.hpp"
#include "magbot/kinematics/chain.hpp"
#include "magbot/types.hpp"

namespace magbot {
    namespace sim {

        // Joint ids of the simulated robot.
        static constexpr dp::i32 WHEEL_LEFT_FRONT = 1;
        static constexpr dp::i32 WHEEL_LEFT_BACK = 2;
        static constexpr dp::i32 WHEEL_RIGHT_FRONT = 3;
        static constexpr dp::i32 WHEEL_RIGHT_BACK = 4;
        static constexpr dp::i32 TORSO = 10;
        static constexpr dp::i32 SHOULDER_LEFT = 11;
        static constexpr dp::i32 ELBOW_LEFT = 12;
        static constexpr dp::i32 WRIST_LEFT = 13;
        static constexpr dp::i32 SHOULDER_RIGHT = 14;
        static constexpr dp::i32 ELBOW_RIGHT = 15;
        static constexpr dp::i32 WRIST_RIGHT = 16;
        static constexpr dp::i32 MAGNET_LEFT = 20;
        static constexpr dp::i32 MAGNET_RIGHT = 21;

        struct SimConfig {
            dp::f64 wheel_radius = 0.1;
            dp::f64 track_width = 1.0;
            dp::f64 wheel_rate_deg = 5.0; // per tick
            dp::f64 arm_rate_deg = 4.0;   // per tick, per angle component

            // Fault knobs.
            bool pinned = false;        // wheels turn, the base does not move
            bool jitter_wheels = false; // reported wheel angles never settle

            dp::Point start_position{0.0, 0.0, 0.0};
            dp::f64 start_heading = 0.0;
        };

        /// Deterministic in-process backend.
        ///
        /// Differential base driven by the wheel angles, rate-limited joints and magnet positions
        /// from the arm chains' forward kinematics. Every communicate() is exactly one tick.
        class KinematicSim : public Bridge {
          public:
            explicit KinematicSim(SimConfig config = {}) : config_(config) {
                position_ = geometry::to_eigen(config_.start_position);
                heading_ = config_.start_heading;

                add_joint(WHEEL_LEFT_FRONT, "wheel_left_front", types::JointKind::Revolute);
                add_joint(WHEEL_LEFT_BACK, "wheel_left_back", types::JointKind::Revolute);
                add_joint(WHEEL_RIGHT_FRONT, "wheel_right_front", types::JointKind::Revolute);
                add_joint(WHEEL_RIGHT_BACK, "wheel_right_back", types::JointKind::Revolute);

                for (dp::usize i = 0; i < ARM_JOINT_COUNT; ++i) {
                    const auto aj = static_cast<ArmJoint>(i);
                    add_joint(arm_id(aj), joint_name(aj), expected_kind(aj));
                }

                add_joint(MAGNET_LEFT, magnet_name(Arm::Left), types::JointKind::Fixed);
                add_joint(MAGNET_RIGHT, magnet_name(Arm::Right), types::JointKind::Fixed);

                chains_[static_cast<dp::usize>(Arm::Left)] = kinematics::Chain::arm(Arm::Left);
                chains_[static_cast<dp::usize>(Arm::Right)] = kinematics::Chain::arm(Arm::Right);
            }

            bool connect(const std::string &endpoint) override {
                endpoint_ = endpoint;
                connected_ = true;
                return true;
            }

            void disconnect() override { connected_ = false; }

            bool is_connected() const override { return connected_; }

            bool communicate(const types::CommandBatch &batch, types::Response &out) override {
                if (!connected_ || terminated_) {
                    return false;
                }

                bool want_static = false;
                bool want_images = false;
                bool want_matrices = false;
                bool wheel_batch = false;

                for (const auto &c : batch.commands) {
                    switch (c.kind) {
                    case types::CommandKind::SetRevoluteTarget:
                    case types::CommandKind::SetSphericalTarget: {
                        auto *j = find(c.joint_id);
                        if (!j) {
                            return false;
                        }
                        if (c.kind == types::CommandKind::SetRevoluteTarget) {
                            if (j->kind != types::JointKind::Revolute) {
                                return false;
                            }
                            j->target[0] = c.x;
                        } else {
                            if (j->kind != types::JointKind::Spherical) {
                                return false;
                            }
                            j->target[0] = c.x;
                            j->target[1] = c.y;
                            j->target[2] = c.z;
                        }
                        if (is_wheel(c.joint_id)) {
                            wheel_batch = true;
                        } else {
                            ++arm_commands_;
                        }
                        break;
                    }
                    case types::CommandKind::EnableImageSensor:
                        image_sensor_ = c.enable;
                        break;
                    case types::CommandKind::SendImages:
                        want_images = true;
                        break;
                    case types::CommandKind::SendCameraMatrices:
                        want_matrices = true;
                        break;
                    case types::CommandKind::SendStaticRobot:
                        want_static = true;
                        break;
                    case types::CommandKind::Terminate:
                        terminated_ = true;
                        break;
                    default:
                        return false;
                    }
                }
                if (wheel_batch) {
                    ++wheel_batches_;
                }

                step();
                last_batch_ = batch;

                out = types::Response{};
                out.frame = ticks_;

                dp::Pose pose;
                pose.point = geometry::to_point(position_);
                pose.rotation = geometry::yaw_quaternion(heading_);
                out.robot = pose;

                for (const auto &j : joints_) {
                    types::JointSample s;
                    s.id = j.id;
                    s.angles = j.angles;
                    if (config_.jitter_wheels && is_wheel(j.id) && ticks_ % 2 == 1) {
                        s.angles[0] += 0.01;
                    }
                    s.position = geometry::to_point(joint_position(j.id));
                    out.joints.push_back(s);
                }

                for (const auto &o : objects_) {
                    out.objects.push_back(o);
                }

                if (want_static) {
                    for (const auto &j : joints_) {
                        types::StaticJoint s;
                        s.id = j.id;
                        s.name = j.name;
                        s.kind = j.kind;
                        out.static_joints.push_back(s);
                    }
                }

                if (want_images && image_sensor_) {
                    types::ImagePass img;
                    img.pass = dp::String("_img");
                    out.images.push_back(img);
                }

                if (want_matrices) {
                    types::CameraMatrices m;
                    for (dp::usize i = 0; i < 4; ++i) {
                        m.projection[i * 5] = 1.0;
                        m.camera[i * 5] = 1.0;
                    }
                    out.camera_matrices = m;
                }

                return true;
            }

            // --------------------------------------------------------------------------------
            // Scene setup
            // --------------------------------------------------------------------------------

            void add_object(dp::i32 id, const dp::Point &position) {
                types::ObjectSample o;
                o.id = id;
                o.position = position;
                objects_.push_back(o);
            }

            void set_pose(const Eigen::Vector3d &position, dp::f64 heading_deg) {
                position_ = position;
                heading_ = heading_deg;
            }

            /// Place a joint directly, current and target alike.
            bool set_joint_angles(dp::i32 id, const dp::Vector<dp::f64> &angles_deg) {
                auto *j = find(id);
                if (!j || j->angles.size() != angles_deg.size()) {
                    return false;
                }
                j->angles = angles_deg;
                j->target = angles_deg;
                return true;
            }

            // --------------------------------------------------------------------------------
            // Inspection
            // --------------------------------------------------------------------------------

            const Eigen::Vector3d &position() const { return position_; }
            dp::f64 heading() const { return heading_; }
            dp::u64 ticks() const { return ticks_; }
            dp::u64 arm_commands() const { return arm_commands_; }
            dp::u64 wheel_batches() const { return wheel_batches_; }
            bool image_sensor_enabled() const { return image_sensor_; }
            bool terminated() const { return terminated_; }
            const types::CommandBatch &last_batch() const { return last_batch_; }
            const std::string &endpoint() const { return endpoint_; }

            const dp::Vector<dp::f64> *angles(dp::i32 id) const {
                for (const auto &j : joints_) {
                    if (j.id == id) {
                        return &j.angles;
                    }
                }
                return nullptr;
            }

            /// World position of one magnet for the current joint angles.
            Eigen::Vector3d magnet_position(Arm arm) const {
                dp::Vector<dp::f64> q;
                for (const ArmJoint aj : joint_order(arm)) {
                    const auto *a = angles(arm_id(aj));
                    for (const auto v : *a) {
                        q.push_back(geometry::deg2rad(v));
                    }
                }
                const Eigen::Vector3d rel = chains_[static_cast<dp::usize>(arm)].forward(q);
                return geometry::relative_to_absolute(rel, position_, forward());
            }

          private:
            struct SimJoint {
                dp::i32 id = 0;
                dp::String name;
                types::JointKind kind = types::JointKind::Unknown;
                dp::Vector<dp::f64> angles;
                dp::Vector<dp::f64> target;
            };

            SimConfig config_;
            std::string endpoint_;
            bool connected_ = false;
            bool image_sensor_ = true;
            bool terminated_ = false;

            Eigen::Vector3d position_ = Eigen::Vector3d::Zero();
            dp::f64 heading_ = 0.0;

            dp::Vector<SimJoint> joints_;
            dp::Vector<types::ObjectSample> objects_;
            dp::Array<kinematics::Chain, 2> chains_;

            dp::u64 ticks_ = 0;
            dp::u64 arm_commands_ = 0;
            dp::u64 wheel_batches_ = 0;
            types::CommandBatch last_batch_;

            void add_joint(dp::i32 id, const char *name, types::JointKind kind) {
                SimJoint j;
                j.id = id;
                j.name = dp::String(name);
                j.kind = kind;
                j.angles.assign(angle_count(kind), 0.0);
                j.target = j.angles;
                joints_.push_back(j);
            }

            SimJoint *find(dp::i32 id) {
                for (auto &j : joints_) {
                    if (j.id == id) {
                        return &j;
                    }
                }
                return nullptr;
            }

            static bool is_wheel(dp::i32 id) { return id >= WHEEL_LEFT_FRONT && id <= WHEEL_RIGHT_BACK; }
            static bool is_left_wheel(dp::i32 id) { return id == WHEEL_LEFT_FRONT || id == WHEEL_LEFT_BACK; }
            static dp::i32 arm_id(ArmJoint aj) { return TORSO + static_cast<dp::i32>(aj); }

            Eigen::Vector3d forward() const {
                const dp::f64 h = geometry::deg2rad(heading_);
                return Eigen::Vector3d(std::sin(h), 0.0, std::cos(h));
            }

            Eigen::Vector3d joint_position(dp::i32 id) const {
                if (id == MAGNET_LEFT) {
                    return magnet_position(Arm::Left);
                }
                if (id == MAGNET_RIGHT) {
                    return magnet_position(Arm::Right);
                }
                return position_;
            }

            static dp::f64 approach(dp::f64 current, dp::f64 target, dp::f64 rate) {
                const dp::f64 d = target - current;
                if (std::fabs(d) <= rate) {
                    return target;
                }
                return current + (d > 0.0 ? rate : -rate);
            }

            void step() {
                ++ticks_;

                dp::f64 left = 0.0;
                dp::f64 right = 0.0;
                dp::usize n_left = 0;
                dp::usize n_right = 0;
                for (auto &j : joints_) {
                    const dp::f64 rate = is_wheel(j.id) ? config_.wheel_rate_deg : config_.arm_rate_deg;
                    for (dp::usize k = 0; k < j.angles.size(); ++k) {
                        const dp::f64 before = j.angles[k];
                        j.angles[k] = approach(before, j.target[k], rate);
                        if (!is_wheel(j.id)) {
                            continue;
                        }
                        if (is_left_wheel(j.id)) {
                            left += j.angles[k] - before;
                            ++n_left;
                        } else {
                            right += j.angles[k] - before;
                            ++n_right;
                        }
                    }
                }
                if (config_.pinned || n_left == 0 || n_right == 0) {
                    return;
                }

                const dp::f64 dl = geometry::deg2rad(left / static_cast<dp::f64>(n_left));
                const dp::f64 dr = geometry::deg2rad(right / static_cast<dp::f64>(n_right));
                const dp::f64 r = config_.wheel_radius;

                heading_ += geometry::rad2deg(r * (dl - dr) / config_.track_width);
                position_ += r * (dl + dr) * 0.5 * forward();
            }
        };

    } // namespace sim
} // namespace magbot
