#include <doctest/doctest.h>

#include <string>

#include <magbot/robot/layout.hpp>
#include <magbot/sim/kinematic_sim.hpp>

using namespace magbot;

namespace {

    dp::Vector<types::StaticJoint> sim_joints() {
        sim::KinematicSim s;
        s.connect("sim://layout");
        types::CommandBatch batch;
        batch.commands.push_back(types::Command::send_static_robot());
        types::Response resp;
        REQUIRE(s.communicate(batch, resp));
        return resp.static_joints;
    }

    dp::Vector<types::StaticJoint> without(const dp::Vector<types::StaticJoint> &joints, const char *name) {
        dp::Vector<types::StaticJoint> out;
        for (const auto &j : joints) {
            if (!(j.name == dp::String(name))) {
                out.push_back(j);
            }
        }
        return out;
    }

    std::string message_of(const dp::Result<robot::RobotLayout> &r) { return r.error().message.c_str(); }

} // namespace

TEST_CASE("layout: resolves wheels, chains and magnets by name") {
    auto res = robot::RobotLayout::resolve(sim_joints());
    REQUIRE(res.is_ok());
    const auto &l = res.value();

    REQUIRE(l.wheels().size() == 4);
    dp::usize left = 0;
    for (const auto &w : l.wheels()) {
        if (w.side == robot::Side::Left) {
            ++left;
        }
    }
    CHECK(left == 2);

    const auto &lc = l.chain(Arm::Left);
    REQUIRE(lc.size() == ARM_CHAIN_LENGTH);
    CHECK(lc[0].id == sim::TORSO);
    CHECK(lc[1].id == sim::SHOULDER_LEFT);
    CHECK(lc[1].kind == types::JointKind::Spherical);
    CHECK(lc[2].id == sim::ELBOW_LEFT);
    CHECK(lc[3].id == sim::WRIST_LEFT);

    const auto &rc = l.chain(Arm::Right);
    REQUIRE(rc.size() == ARM_CHAIN_LENGTH);
    CHECK(rc[0].id == sim::TORSO);
    CHECK(rc[1].id == sim::SHOULDER_RIGHT);
    CHECK(rc[3].id == sim::WRIST_RIGHT);

    CHECK(l.magnet(Arm::Left) == sim::MAGNET_LEFT);
    CHECK(l.magnet(Arm::Right) == sim::MAGNET_RIGHT);
    CHECK(l.joint_id(ArmJoint::ElbowRight) == sim::ELBOW_RIGHT);
}

TEST_CASE("layout: missing arm joint") {
    auto res = robot::RobotLayout::resolve(without(sim_joints(), "elbow_left"));
    REQUIRE(res.is_err());
    CHECK(message_of(res).find("elbow_left") != std::string::npos);
}

TEST_CASE("layout: missing magnet") {
    auto res = robot::RobotLayout::resolve(without(sim_joints(), "magnet_right"));
    REQUIRE(res.is_err());
    CHECK(message_of(res).find("magnet_right") != std::string::npos);
}

TEST_CASE("layout: articulation must match the joint role") {
    auto joints = sim_joints();
    for (auto &j : joints) {
        if (j.name == dp::String("torso")) {
            j.kind = types::JointKind::Spherical;
        }
    }
    auto res = robot::RobotLayout::resolve(joints);
    REQUIRE(res.is_err());
    CHECK(message_of(res).find("torso") != std::string::npos);
}

TEST_CASE("layout: wheels need a side and at least one must exist") {
    auto joints = sim_joints();
    types::StaticJoint odd;
    odd.id = 99;
    odd.name = dp::String("wheel_middle");
    odd.kind = types::JointKind::Revolute;
    joints.push_back(odd);
    CHECK(robot::RobotLayout::resolve(joints).is_err());

    auto no_wheels = without(without(without(without(sim_joints(), "wheel_left_front"), "wheel_left_back"),
                                     "wheel_right_front"),
                             "wheel_right_back");
    CHECK(robot::RobotLayout::resolve(no_wheels).is_err());
}
