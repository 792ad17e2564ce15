#pragma once

#include <string>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/result.hpp>

#include "magbot/arm.hpp"
#include "magbot/types.hpp"

namespace magbot {
    namespace robot {

        enum class Side : dp::u8 {
            Left = 0,
            Right = 1,
        };

        struct Wheel {
            dp::i32 id = 0;
            dp::String name;
            Side side = Side::Left;
        };

        /// One entry of an arm's joint order, resolved to a simulator joint id.
        struct JointSlot {
            ArmJoint joint = ArmJoint::Torso;
            types::JointKind kind = types::JointKind::Unknown;
            dp::i32 id = 0;
        };

        /// Joint roles resolved once from the static robot description.
        ///
        /// Immutable after resolve(); the controller keeps one for the session.
        class RobotLayout {
          public:
            RobotLayout() = default;

            static dp::Result<RobotLayout> resolve(const dp::Vector<types::StaticJoint> &joints) {
                RobotLayout out;

                auto find = [&](const char *name) -> const types::StaticJoint * {
                    for (const auto &j : joints) {
                        if (j.name == dp::String(name)) {
                            return &j;
                        }
                    }
                    return nullptr;
                };

                for (const auto &j : joints) {
                    if (j.name.find("wheel") == dp::String::npos) {
                        continue;
                    }
                    Wheel w;
                    w.id = j.id;
                    w.name = j.name;
                    if (j.name.find("left") != dp::String::npos) {
                        w.side = Side::Left;
                    } else if (j.name.find("right") != dp::String::npos) {
                        w.side = Side::Right;
                    } else {
                        return dp::Result<RobotLayout>::err(dp::Error::invalid_argument("wheel without a side"));
                    }
                    out.wheels_.push_back(w);
                }
                if (out.wheels_.empty()) {
                    return dp::Result<RobotLayout>::err(dp::Error::invalid_argument("robot has no wheels"));
                }

                for (dp::usize i = 0; i < ARM_JOINT_COUNT; ++i) {
                    const auto aj = static_cast<ArmJoint>(i);
                    const auto *j = find(joint_name(aj));
                    if (!j) {
                        return dp::Result<RobotLayout>::err(
                            dp::Error::invalid_argument((std::string("missing arm joint: ") + joint_name(aj)).c_str()));
                    }
                    if (j->kind != expected_kind(aj)) {
                        return dp::Result<RobotLayout>::err(dp::Error::invalid_argument(
                            (std::string("unexpected articulation for joint: ") + joint_name(aj)).c_str()));
                    }
                    out.arm_joints_[i] = j->id;
                }

                for (const Arm arm : {Arm::Left, Arm::Right}) {
                    const auto *m = find(magnet_name(arm));
                    if (!m) {
                        return dp::Result<RobotLayout>::err(
                            dp::Error::invalid_argument((std::string("missing magnet: ") + magnet_name(arm)).c_str()));
                    }
                    out.magnets_[static_cast<dp::usize>(arm)] = m->id;

                    auto &slots = out.chains_[static_cast<dp::usize>(arm)];
                    for (const ArmJoint aj : joint_order(arm)) {
                        JointSlot s;
                        s.joint = aj;
                        s.kind = expected_kind(aj);
                        s.id = out.arm_joints_[static_cast<dp::usize>(aj)];
                        slots.push_back(s);
                    }
                }

                return dp::Result<RobotLayout>::ok(out);
            }

            const dp::Vector<Wheel> &wheels() const { return wheels_; }
            const dp::Vector<JointSlot> &chain(Arm arm) const { return chains_[static_cast<dp::usize>(arm)]; }
            dp::i32 magnet(Arm arm) const { return magnets_[static_cast<dp::usize>(arm)]; }
            dp::i32 joint_id(ArmJoint j) const { return arm_joints_[static_cast<dp::usize>(j)]; }
            const dp::Array<dp::i32, ARM_JOINT_COUNT> &arm_joint_ids() const { return arm_joints_; }

          private:
            dp::Vector<Wheel> wheels_;
            dp::Array<dp::i32, ARM_JOINT_COUNT> arm_joints_{};
            dp::Array<dp::i32, 2> magnets_{};
            dp::Array<dp::Vector<JointSlot>, 2> chains_{};
        };

    } // namespace robot
} // namespace magbot
