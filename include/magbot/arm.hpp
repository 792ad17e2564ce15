#pragma once

#include <datapod/adapters.hpp>

#include "magbot/types.hpp"

namespace magbot {

    enum class Arm : dp::u8 {
        Left = 0,
        Right = 1,
    };

    /// Articulated arm joints. The torso is shared by both arm chains.
    enum class ArmJoint : dp::u8 {
        Torso = 0,
        ShoulderLeft = 1,
        ElbowLeft = 2,
        WristLeft = 3,
        ShoulderRight = 4,
        ElbowRight = 5,
        WristRight = 6,
    };

    static constexpr dp::usize ARM_JOINT_COUNT = 7;
    static constexpr dp::usize ARM_CHAIN_LENGTH = 4;

    inline const char *to_string(Arm arm) { return arm == Arm::Left ? "left" : "right"; }

    /// Name under which the joint appears in the static robot description.
    inline const char *joint_name(ArmJoint j) {
        switch (j) {
        case ArmJoint::Torso:
            return "torso";
        case ArmJoint::ShoulderLeft:
            return "shoulder_left";
        case ArmJoint::ElbowLeft:
            return "elbow_left";
        case ArmJoint::WristLeft:
            return "wrist_left";
        case ArmJoint::ShoulderRight:
            return "shoulder_right";
        case ArmJoint::ElbowRight:
            return "elbow_right";
        case ArmJoint::WristRight:
            return "wrist_right";
        default:
            return "";
        }
    }

    inline const char *magnet_name(Arm arm) { return arm == Arm::Left ? "magnet_left" : "magnet_right"; }

    /// Articulation every arm joint is expected to have.
    inline types::JointKind expected_kind(ArmJoint j) {
        switch (j) {
        case ArmJoint::Torso:
        case ArmJoint::ElbowLeft:
        case ArmJoint::ElbowRight:
            return types::JointKind::Revolute;
        case ArmJoint::ShoulderLeft:
        case ArmJoint::WristLeft:
        case ArmJoint::ShoulderRight:
        case ArmJoint::WristRight:
            return types::JointKind::Spherical;
        default:
            return types::JointKind::Unknown;
        }
    }

    /// Order in which joint angles are consumed for one arm: torso -> shoulder -> elbow -> wrist.
    inline dp::Array<ArmJoint, ARM_CHAIN_LENGTH> joint_order(Arm arm) {
        if (arm == Arm::Left) {
            return dp::Array<ArmJoint, ARM_CHAIN_LENGTH>{ArmJoint::Torso, ArmJoint::ShoulderLeft, ArmJoint::ElbowLeft,
                                                         ArmJoint::WristLeft};
        }
        return dp::Array<ArmJoint, ARM_CHAIN_LENGTH>{ArmJoint::Torso, ArmJoint::ShoulderRight, ArmJoint::ElbowRight,
                                                     ArmJoint::WristRight};
    }

    /// Number of scalar angles a joint kind consumes (0 for anything not articulated).
    inline dp::usize angle_count(types::JointKind kind) {
        switch (kind) {
        case types::JointKind::Revolute:
            return 1;
        case types::JointKind::Spherical:
            return 3;
        default:
            return 0;
        }
    }

} // namespace magbot
