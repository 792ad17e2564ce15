#pragma once

#include <unordered_map>

#include <Eigen/Core>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/adapters/result.hpp>
#include <datapod/spatial.hpp>

#include "magbot/geometry.hpp"
#include "magbot/types.hpp"

namespace magbot {

    /// Immutable view of the simulation after one tick.
    ///
    /// Built from exactly one Response and superseded, never merged, by the next one.
    /// Angles are degrees; positions are world space.
    class Frame {
      public:
        Frame() = default;

        /// Fails when the response lacks the robot transform or the joint block.
        static dp::Result<Frame> from_response(const types::Response &resp) {
            if (!resp.robot.has_value()) {
                return dp::Result<Frame>::err(dp::Error::invalid_argument("response missing robot transform"));
            }
            if (resp.joints.empty()) {
                return dp::Result<Frame>::err(dp::Error::invalid_argument("response missing joint data"));
            }

            Frame f;
            f.frame_ = resp.frame;
            f.pose_ = *resp.robot;
            f.position_ = geometry::to_eigen(f.pose_.point);
            f.forward_ = geometry::forward_of(f.pose_.rotation);

            for (const auto &j : resp.joints) {
                f.joint_angles_[j.id] = j.angles;
                f.joint_positions_[j.id] = geometry::to_eigen(j.position);
            }
            for (const auto &o : resp.objects) {
                f.objects_[o.id] = geometry::to_eigen(o.position);
            }

            f.images_ = resp.images;
            f.camera_matrices_ = resp.camera_matrices;
            return dp::Result<Frame>::ok(f);
        }

        dp::u64 frame() const { return frame_; }
        const dp::Pose &pose() const { return pose_; }
        const Eigen::Vector3d &position() const { return position_; }
        const Eigen::Vector3d &forward() const { return forward_; }

        bool has_joint(dp::i32 id) const { return joint_angles_.find(id) != joint_angles_.end(); }
        bool has_object(dp::i32 id) const { return objects_.find(id) != objects_.end(); }

        /// Angles of one joint, or nullptr if the joint was not in the response.
        const dp::Vector<dp::f64> *joint_angles(dp::i32 id) const {
            auto it = joint_angles_.find(id);
            return it == joint_angles_.end() ? nullptr : &it->second;
        }

        dp::Optional<Eigen::Vector3d> joint_position(dp::i32 id) const {
            auto it = joint_positions_.find(id);
            if (it == joint_positions_.end()) {
                return dp::nullopt;
            }
            return it->second;
        }

        dp::Optional<Eigen::Vector3d> object_position(dp::i32 id) const {
            auto it = objects_.find(id);
            if (it == objects_.end()) {
                return dp::nullopt;
            }
            return it->second;
        }

        const dp::Vector<types::ImagePass> &images() const { return images_; }
        const dp::Optional<types::CameraMatrices> &camera_matrices() const { return camera_matrices_; }

      private:
        dp::u64 frame_ = 0;
        dp::Pose pose_{};
        Eigen::Vector3d position_ = Eigen::Vector3d::Zero();
        Eigen::Vector3d forward_ = geometry::forward_axis();

        std::unordered_map<dp::i32, dp::Vector<dp::f64>> joint_angles_;
        std::unordered_map<dp::i32, Eigen::Vector3d> joint_positions_;
        std::unordered_map<dp::i32, Eigen::Vector3d> objects_;

        dp::Vector<types::ImagePass> images_;
        dp::Optional<types::CameraMatrices> camera_matrices_;
    };

} // namespace magbot
