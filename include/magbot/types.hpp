#pragma once

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/sequential/bytes.hpp>
#include <datapod/spatial.hpp>

namespace magbot {
    namespace types {

        // =========================================================================================
        // Commands (controller -> simulator)
        // =========================================================================================

        enum class CommandKind : dp::u8 {
            Unknown = 0,
            SetRevoluteTarget = 1,
            SetSphericalTarget = 2,
            EnableImageSensor = 3,
            SendImages = 4,
            SendCameraMatrices = 5,
            SendStaticRobot = 6,
            Terminate = 7,
        };

        /// One typed low-level command.
        ///
        /// Joint targets are in degrees. A revolute target uses `x` only; a spherical target uses
        /// the (x, y, z) per-axis triple. `enable` is read by EnableImageSensor only.
        struct Command {
            CommandKind kind = CommandKind::Unknown;
            dp::i32 joint_id = 0;
            dp::f64 x = 0.0;
            dp::f64 y = 0.0;
            dp::f64 z = 0.0;
            bool enable = false;

            static Command set_revolute_target(dp::i32 joint_id, dp::f64 target_deg) {
                Command c;
                c.kind = CommandKind::SetRevoluteTarget;
                c.joint_id = joint_id;
                c.x = target_deg;
                return c;
            }

            static Command set_spherical_target(dp::i32 joint_id, dp::f64 x_deg, dp::f64 y_deg, dp::f64 z_deg) {
                Command c;
                c.kind = CommandKind::SetSphericalTarget;
                c.joint_id = joint_id;
                c.x = x_deg;
                c.y = y_deg;
                c.z = z_deg;
                return c;
            }

            static Command enable_image_sensor(bool enable) {
                Command c;
                c.kind = CommandKind::EnableImageSensor;
                c.enable = enable;
                return c;
            }

            static Command send_images() {
                Command c;
                c.kind = CommandKind::SendImages;
                return c;
            }

            static Command send_camera_matrices() {
                Command c;
                c.kind = CommandKind::SendCameraMatrices;
                return c;
            }

            static Command send_static_robot() {
                Command c;
                c.kind = CommandKind::SendStaticRobot;
                return c;
            }

            static Command terminate() {
                Command c;
                c.kind = CommandKind::Terminate;
                return c;
            }

            bool is_joint_target() const {
                return kind == CommandKind::SetRevoluteTarget || kind == CommandKind::SetSphericalTarget;
            }
        };

        /// Everything sent to the simulator for one tick.
        struct CommandBatch {
            dp::u64 seq = 0;
            dp::Vector<Command> commands;
        };

        // =========================================================================================
        // Response (simulator -> controller)
        // =========================================================================================

        enum class JointKind : dp::u8 {
            Unknown = 0,
            Revolute = 1,
            Spherical = 2,
            Fixed = 3,
        };

        /// Static joint entry, sent once on request (SendStaticRobot).
        struct StaticJoint {
            dp::i32 id = 0;
            dp::String name;
            JointKind kind = JointKind::Unknown;
        };

        /// Per-joint dynamic state. Angles in degrees, position in world space.
        struct JointSample {
            dp::i32 id = 0;
            dp::Vector<dp::f64> angles;
            dp::Point position{0.0, 0.0, 0.0};
        };

        struct ObjectSample {
            dp::i32 id = 0;
            dp::Point position{0.0, 0.0, 0.0};
        };

        struct ImagePass {
            dp::String pass;
            dp::Bytes data;
        };

        struct CameraMatrices {
            dp::Array<dp::f64, 16> projection{};
            dp::Array<dp::f64, 16> camera{};
        };

        /// Raw output of one tick.
        ///
        /// Blocks are optional because the simulator only sends what it was asked for; Frame
        /// decides which ones are mandatory.
        struct Response {
            dp::u64 frame = 0;
            dp::Optional<dp::Pose> robot;
            dp::Vector<JointSample> joints;
            dp::Vector<ObjectSample> objects;
            dp::Vector<StaticJoint> static_joints;
            dp::Vector<ImagePass> images;
            dp::Optional<CameraMatrices> camera_matrices;
        };

    } // namespace types
} // namespace magbot
