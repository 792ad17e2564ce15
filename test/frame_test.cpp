#include <doctest/doctest.h>

#include <string>

#include <magbot/frame.hpp>

using namespace magbot;

namespace {

    types::Response make_response() {
        types::Response r;
        r.frame = 7;

        dp::Pose pose;
        pose.point = dp::Point{1.0, 0.0, 2.0};
        pose.rotation = geometry::yaw_quaternion(90.0);
        r.robot = pose;

        types::JointSample wheel;
        wheel.id = 1;
        wheel.angles.push_back(12.5);
        r.joints.push_back(wheel);

        types::JointSample shoulder;
        shoulder.id = 11;
        shoulder.angles.push_back(10.0);
        shoulder.angles.push_back(20.0);
        shoulder.angles.push_back(30.0);
        shoulder.position = dp::Point{0.5, 0.6, 0.7};
        r.joints.push_back(shoulder);

        types::ObjectSample box;
        box.id = 100;
        box.position = dp::Point{3.0, 0.0, -1.0};
        r.objects.push_back(box);
        return r;
    }

} // namespace

TEST_CASE("frame: built from a complete response") {
    auto res = Frame::from_response(make_response());
    REQUIRE(res.is_ok());
    const auto &f = res.value();

    CHECK(f.frame() == 7);
    CHECK(f.position().x() == doctest::Approx(1.0));
    CHECK(f.position().z() == doctest::Approx(2.0));

    // Heading 90 faces +x.
    CHECK(f.forward().x() == doctest::Approx(1.0));
    CHECK(f.forward().z() == doctest::Approx(0.0).epsilon(1e-9));

    REQUIRE(f.joint_angles(1) != nullptr);
    CHECK((*f.joint_angles(1))[0] == doctest::Approx(12.5));
    REQUIRE(f.joint_angles(11) != nullptr);
    CHECK(f.joint_angles(11)->size() == 3);
    CHECK(f.has_joint(11));
    CHECK_FALSE(f.has_joint(99));
    CHECK(f.joint_angles(99) == nullptr);

    auto jp = f.joint_position(11);
    REQUIRE(jp.has_value());
    CHECK(jp->y() == doctest::Approx(0.6));

    auto obj = f.object_position(100);
    REQUIRE(obj.has_value());
    CHECK(obj->x() == doctest::Approx(3.0));
    CHECK_FALSE(f.object_position(5).has_value());

    CHECK(f.images().empty());
    CHECK_FALSE(f.camera_matrices().has_value());
}

TEST_CASE("frame: missing robot transform is an error") {
    auto r = make_response();
    r.robot.reset();
    auto res = Frame::from_response(r);
    REQUIRE(res.is_err());
    CHECK(std::string(res.error().message.c_str()) == "response missing robot transform");
}

TEST_CASE("frame: missing joint block is an error") {
    auto r = make_response();
    r.joints.clear();
    auto res = Frame::from_response(r);
    REQUIRE(res.is_err());
    CHECK(std::string(res.error().message.c_str()) == "response missing joint data");
}

TEST_CASE("frame: optional image and camera blocks are carried through") {
    auto r = make_response();
    types::ImagePass img;
    img.pass = dp::String("_img");
    r.images.push_back(img);
    r.camera_matrices = types::CameraMatrices{};

    auto res = Frame::from_response(r);
    REQUIRE(res.is_ok());
    CHECK(res.value().images().size() == 1);
    CHECK(res.value().camera_matrices().has_value());
}
