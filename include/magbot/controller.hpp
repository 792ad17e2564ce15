#pragma once

#include <cmath>
#include <memory>
#include <string>

#include <Eigen/Core>

#include <echo/echo.hpp>

#include <datapod/adapters.hpp>
#include <datapod/pods/adapters/error.hpp>
#include <datapod/pods/adapters/optional.hpp>
#include <datapod/pods/adapters/result.hpp>
#include <datapod/spatial.hpp>

#include "magbot/action_status.hpp"
#include "magbot/arm.hpp"
#include "magbot/bridge.hpp"
#include "magbot/config.hpp"
#include "magbot/frame.hpp"
#include "magbot/geometry.hpp"
#include "magbot/kinematics/chain.hpp"
#include "magbot/kinematics/solver.hpp"
#include "magbot/kinematics/translator.hpp"
#include "magbot/robot/layout.hpp"
#include "magbot/session.hpp"
#include "magbot/types.hpp"

namespace magbot {

    /// Where turn_to / move_to should head: a scene object by id, or an explicit world point.
    struct Target {
        enum class Kind : dp::u8 {
            None = 0,
            Object = 1,
            Position = 2,
        };

        Kind kind = Kind::None;
        dp::i32 object_id = 0;
        dp::Point position{0.0, 0.0, 0.0};

        static Target object(dp::i32 id) {
            Target t;
            t.kind = Kind::Object;
            t.object_id = id;
            return t;
        }

        static Target point(dp::f64 x, dp::f64 y, dp::f64 z) {
            Target t;
            t.kind = Kind::Position;
            t.position = dp::Point{x, y, z};
            return t;
        }
    };

    /// Closed-loop action controller.
    ///
    /// Every public action opens one session bracket, drives the simulator tick by tick through
    /// the bridge until its predicate holds or its bound runs out, and closes the bracket with a
    /// refresh tick whose frame becomes state(). Recoverable outcomes come back as
    /// ok(ActionStatus); err is reserved for integration and request errors.
    class Controller {
      public:
        using Status = dp::Result<ActionStatus>;

        /// The bridge is non-owning and must outlive the Controller.
        explicit Controller(Bridge *bridge, Config config = {}) : config_(config) {
            if (bridge) {
                bridge_ = std::shared_ptr<Bridge>(bridge, [](Bridge *) {
                    // Non-owning: do not delete.
                });
            }
            chains_[static_cast<dp::usize>(Arm::Left)] = kinematics::Chain::arm(Arm::Left);
            chains_[static_cast<dp::usize>(Arm::Right)] = kinematics::Chain::arm(Arm::Right);
        }

        /// Request the static robot description, resolve the joint layout and refresh state().
        dp::Result<Frame> init() {
            if (session_.in_flight()) {
                return dp::Result<Frame>::err(dp::Error::invalid_argument("action already in flight"));
            }

            dp::Vector<types::Command> cmds;
            cmds.push_back(types::Command::send_static_robot());
            auto resp = exchange(cmds);
            if (resp.is_err()) {
                return dp::Result<Frame>::err(resp.error());
            }
            auto layout = robot::RobotLayout::resolve(resp.value().static_joints);
            if (layout.is_err()) {
                return dp::Result<Frame>::err(layout.error());
            }
            layout_ = layout.value();

            wheel_ids_.clear();
            for (const auto &w : layout_->wheels()) {
                wheel_ids_.push_back(w.id);
            }
            arm_ids_.clear();
            for (const auto id : layout_->arm_joint_ids()) {
                arm_ids_.push_back(id);
            }
            echo::trace("layout resolved: ", wheel_ids_.size(), " wheels, ", arm_ids_.size(), " arm joints");

            auto end = refresh();
            if (end.is_err()) {
                return dp::Result<Frame>::err(end.error());
            }
            return dp::Result<Frame>::ok(state_);
        }

        // ------------------------------------------------------------------------------------
        // Turning
        // ------------------------------------------------------------------------------------

        Status turn_by(dp::f64 angle) { return turn_by(angle, config_.turn_speed, config_.aligned_at); }

        /// Turn in place by `angle` degrees, clockwise positive.
        Status turn_by(dp::f64 angle, dp::f64 speed, dp::f64 aligned_at) {
            return run_action("turn_by", [&]() { return turn_by_impl(angle, speed, aligned_at); });
        }

        Status turn_to(const Target &target) { return turn_to(target, config_.turn_speed, config_.aligned_at); }

        /// Turn in place to face `target`.
        Status turn_to(const Target &target, dp::f64 speed, dp::f64 aligned_at) {
            return run_action("turn_to", [&]() { return turn_to_impl(target, speed, aligned_at); });
        }

        // ------------------------------------------------------------------------------------
        // Moving
        // ------------------------------------------------------------------------------------

        Status move_by(dp::f64 distance) { return move_by(distance, config_.move_speed, config_.arrived_at); }

        /// Drive straight by `distance` scene units. Negative drives backwards.
        Status move_by(dp::f64 distance, dp::f64 speed, dp::f64 arrived_at) {
            return run_action("move_by", [&]() { return move_by_impl(distance, speed, arrived_at); });
        }

        Status move_to(const Target &target) {
            return move_to(target, config_.move_speed, config_.arrived_at, config_.turn_speed, config_.aligned_at,
                           false);
        }

        /// Turn to face `target`, then drive the straight-line distance to it.
        ///
        /// A failed turn ends the action with the turn's outcome unless `move_on_turn_fail` is set.
        Status move_to(const Target &target, dp::f64 move_speed, dp::f64 arrived_at, dp::f64 turn_speed,
                       dp::f64 aligned_at, bool move_on_turn_fail) {
            return run_action("move_to", [&]() -> Status {
                auto turned = turn_to_impl(target, turn_speed, aligned_at);
                if (turned.is_err()) {
                    return turned;
                }
                if (turned.value() != ActionStatus::Success && !move_on_turn_fail) {
                    return turned;
                }
                auto p = resolve_target(target);
                if (p.is_err()) {
                    return Status::err(p.error());
                }
                const dp::f64 distance = (last_.position() - p.value()).norm();
                return move_by_impl(distance, move_speed, arrived_at);
            });
        }

        // ------------------------------------------------------------------------------------
        // Arms
        // ------------------------------------------------------------------------------------

        Status reach_for(const dp::Point &target, Arm arm) {
            return reach_for(target, arm, true, false, config_.reach_arrived_at);
        }

        /// Bend one arm so that its magnet ends at `target`.
        ///
        /// `target` is a world point when `absolute`, otherwise robot-relative. With
        /// `check_if_possible` the solved pose is vetted first and nothing is sent if it misses.
        Status reach_for(const dp::Point &target, Arm arm, bool check_if_possible, bool absolute,
                         dp::f64 arrived_at) {
            return run_action("reach_for",
                              [&]() { return reach_for_impl(target, arm, check_if_possible, absolute, arrived_at); });
        }

        /// Return one arm to its neutral pose.
        Status reset_arm(Arm arm) {
            return run_action("reset_arm", [&]() -> Status {
                auto cmds = kinematics::reset_commands(layout_->chain(arm));
                if (cmds.is_err()) {
                    return Status::err(cmds.error());
                }
                return reset_impl(cmds.value());
            });
        }

        /// Return both arms to their neutral pose in one bend.
        Status reset_arms() {
            return run_action("reset_arms", [&]() -> Status {
                dp::Vector<types::Command> all;
                for (const Arm arm : {Arm::Left, Arm::Right}) {
                    auto cmds = kinematics::reset_commands(layout_->chain(arm));
                    if (cmds.is_err()) {
                        return Status::err(cmds.error());
                    }
                    for (const auto &c : cmds.value()) {
                        // The torso is shared by both chains.
                        if (arm == Arm::Right && c.joint_id == layout_->joint_id(ArmJoint::Torso)) {
                            continue;
                        }
                        all.push_back(c);
                    }
                }
                return reset_impl(all);
            });
        }

        /// Terminate the simulation and disconnect the bridge.
        ///
        /// The layout is dropped, so actions fail until the next init().
        dp::Result<Frame> end() {
            if (session_.in_flight()) {
                return dp::Result<Frame>::err(dp::Error::invalid_argument("action already in flight"));
            }
            dp::Vector<types::Command> cmds;
            cmds.push_back(types::Command::terminate());
            auto f = tick(cmds);
            if (bridge_) {
                bridge_->disconnect();
            }
            layout_.reset();
            echo::trace("simulation terminated");
            return f;
        }

        // ------------------------------------------------------------------------------------
        // Accessors
        // ------------------------------------------------------------------------------------

        /// Frame of the refresh tick that closed the last action (or init).
        const Frame &state() const { return state_; }
        const Config &config() const { return config_; }
        Config &config() { return config_; }
        const ActionSession &session() const { return session_; }
        bool initialized() const { return layout_.has_value(); }
        const robot::RobotLayout *layout() const { return layout_ ? &(*layout_) : nullptr; }
        const kinematics::Chain &chain(Arm arm) const { return chains_[static_cast<dp::usize>(arm)]; }

      private:
        struct Motion {
            Frame frame;
            bool settled = false;
        };

        std::shared_ptr<Bridge> bridge_;
        Config config_;
        ActionSession session_;
        dp::Optional<robot::RobotLayout> layout_;
        dp::Array<kinematics::Chain, 2> chains_;

        dp::Vector<dp::i32> wheel_ids_;
        dp::Vector<dp::i32> arm_ids_;

        dp::Vector<types::Command> next_;
        dp::u64 seq_ = 0;

        Frame state_;
        Frame last_;

        // ====================================================================================
        // Ticks
        // ====================================================================================

        /// One round trip: queued commands go out first, then `commands`.
        dp::Result<types::Response> exchange(const dp::Vector<types::Command> &commands) {
            if (!bridge_) {
                return dp::Result<types::Response>::err(dp::Error::invalid_argument("no bridge attached"));
            }

            types::CommandBatch batch;
            batch.seq = ++seq_;
            batch.commands = next_;
            for (const auto &c : commands) {
                batch.commands.push_back(c);
            }
            next_.clear();

            types::Response resp;
            if (!bridge_->communicate(batch, resp)) {
                return dp::Result<types::Response>::err(dp::Error::invalid_argument("bridge round trip failed"));
            }
            return dp::Result<types::Response>::ok(resp);
        }

        dp::Result<Frame> tick(const dp::Vector<types::Command> &commands) {
            auto resp = exchange(commands);
            if (resp.is_err()) {
                return dp::Result<Frame>::err(resp.error());
            }
            auto f = Frame::from_response(resp.value());
            if (f.is_err()) {
                return f;
            }
            last_ = f.value();
            return f;
        }

        dp::Result<Frame> tick() { return tick(dp::Vector<types::Command>{}); }

        dp::Result<Frame> refresh() {
            auto f = tick(ActionSession::end_commands());
            if (f.is_ok()) {
                state_ = f.value();
            }
            return f;
        }

        // ====================================================================================
        // Session bracket
        // ====================================================================================

        template <typename Body> Status run_action(const char *name, Body &&body) {
            if (!layout_) {
                return Status::err(dp::Error::invalid_argument("controller not initialized"));
            }
            if (!session_.begin()) {
                return Status::err(dp::Error::invalid_argument("action already in flight"));
            }
            for (const auto &c : ActionSession::begin_commands()) {
                next_.push_back(c);
            }

            Status out = body();
            if (out.is_err()) {
                echo::trace(name, " failed: ", out.error().message.c_str());
                next_.clear();
                session_.abort();
                return out;
            }

            auto end = refresh();
            if (end.is_err()) {
                session_.abort();
                return Status::err(end.error());
            }
            session_.end();
            echo::trace(name, " -> ", to_string(out.value()));
            return out;
        }

        // ====================================================================================
        // Helpers
        // ====================================================================================

        dp::u64 attempt_cap(dp::f64 amount, dp::f64 speed) const {
            return static_cast<dp::u64>(std::ceil(std::ceil(std::fabs(amount) + 1.0) * speed * config_.attempts_per_unit));
        }

        /// Largest per-component angle change of `ids` between two frames.
        static dp::Result<dp::f64> max_change(const Frame &a, const Frame &b, const dp::Vector<dp::i32> &ids) {
            dp::f64 out = 0.0;
            for (const auto id : ids) {
                const auto *pa = a.joint_angles(id);
                const auto *pb = b.joint_angles(id);
                if (!pa || !pb || pa->size() != pb->size()) {
                    return dp::Result<dp::f64>::err(dp::Error::invalid_argument(
                        (std::string("no angles for joint ") + std::to_string(id)).c_str()));
                }
                for (dp::usize k = 0; k < pa->size(); ++k) {
                    const dp::f64 d = std::fabs((*pa)[k] - (*pb)[k]);
                    if (d > out) {
                        out = d;
                    }
                }
            }
            return dp::Result<dp::f64>::ok(out);
        }

        dp::Result<Eigen::Vector3d> resolve_target(const Target &target) const {
            switch (target.kind) {
            case Target::Kind::Object: {
                auto p = last_.object_position(target.object_id);
                if (!p.has_value()) {
                    return dp::Result<Eigen::Vector3d>::err(dp::Error::invalid_argument(
                        (std::string("unknown object id ") + std::to_string(target.object_id)).c_str()));
                }
                return dp::Result<Eigen::Vector3d>::ok(*p);
            }
            case Target::Kind::Position:
                return dp::Result<Eigen::Vector3d>::ok(geometry::to_eigen(target.position));
            default:
                return dp::Result<Eigen::Vector3d>::err(
                    dp::Error::invalid_argument("target is neither an object id nor a position"));
            }
        }

        /// One wheel batch: left wheels advance by `left`, right wheels by `right` (degrees).
        dp::Result<Frame> drive_wheels(dp::f64 left, dp::f64 right) {
            dp::Vector<types::Command> cmds;
            cmds.reserve(layout_->wheels().size());
            for (const auto &w : layout_->wheels()) {
                const auto *angles = last_.joint_angles(w.id);
                if (!angles || angles->empty()) {
                    return dp::Result<Frame>::err(dp::Error::invalid_argument(
                        (std::string("no angle for wheel ") + w.name.c_str()).c_str()));
                }
                const dp::f64 step = w.side == robot::Side::Left ? left : right;
                cmds.push_back(types::Command::set_revolute_target(w.id, (*angles)[0] + step));
            }
            return tick(cmds);
        }

        /// Tick until no wheel moved more than the settle threshold since the previous tick.
        dp::Result<Motion> settle_wheels(Frame prev) {
            for (dp::u32 t = 0; t < config_.wheel_settle_max_ticks; ++t) {
                auto cur = tick();
                if (cur.is_err()) {
                    return dp::Result<Motion>::err(cur.error());
                }
                auto change = max_change(prev, cur.value(), wheel_ids_);
                if (change.is_err()) {
                    return dp::Result<Motion>::err(change.error());
                }
                if (change.value() <= config_.settle_threshold_deg) {
                    return dp::Result<Motion>::ok(Motion{cur.value(), true});
                }
                prev = cur.value();
            }
            echo::warn("wheels did not settle within ", config_.wheel_settle_max_ticks, " ticks");
            return dp::Result<Motion>::ok(Motion{prev, false});
        }

        /// Send arm joint targets and tick until no arm joint moves.
        dp::Result<Motion> bend(const dp::Vector<types::Command> &cmds) {
            Frame prev = last_;
            auto first = tick(cmds);
            if (first.is_err()) {
                return dp::Result<Motion>::err(first.error());
            }
            Frame cur = first.value();
            for (dp::u32 t = 0;; ++t) {
                auto change = max_change(prev, cur, arm_ids_);
                if (change.is_err()) {
                    return dp::Result<Motion>::err(change.error());
                }
                if (change.value() <= config_.settle_threshold_deg) {
                    return dp::Result<Motion>::ok(Motion{cur, true});
                }
                if (t >= config_.bend_max_ticks) {
                    echo::warn("arm still moving after ", config_.bend_max_ticks, " ticks");
                    return dp::Result<Motion>::ok(Motion{cur, false});
                }
                prev = cur;
                auto next = tick();
                if (next.is_err()) {
                    return dp::Result<Motion>::err(next.error());
                }
                cur = next.value();
            }
        }

        // ====================================================================================
        // Actions
        // ====================================================================================

        Status turn_by_impl(dp::f64 angle, dp::f64 speed, dp::f64 aligned_at) {
            if (speed <= 0.0) {
                return Status::err(dp::Error::invalid_argument("turn speed must be positive"));
            }

            const Eigen::Vector3d f0 = last_.forward();
            const dp::u64 cap = attempt_cap(angle, speed);

            dp::u64 attempts = 0;
            dp::f64 progress = 0.0;
            bool aligned = std::fabs(progress - angle) < aligned_at;
            while (!aligned && attempts < cap) {
                // Wheel direction follows the requested turn for the whole action.
                const dp::f64 s = angle > 0.0 ? speed : -speed;
                auto sent = drive_wheels(s, -s);
                if (sent.is_err()) {
                    return Status::err(sent.error());
                }
                ++attempts;

                auto motion = settle_wheels(sent.value());
                if (motion.is_err()) {
                    return Status::err(motion.error());
                }
                progress = geometry::turn_progress(motion.value().frame.forward(), f0, angle);
                aligned = std::fabs(progress - angle) < aligned_at;
                echo::trace("turn attempt ", attempts, ": ", progress, " of ", angle);
                if (!motion.value().settled) {
                    break;
                }
            }

            if (aligned) {
                return Status::ok(ActionStatus::Success);
            }
            if (attempts >= cap) {
                return Status::ok(ActionStatus::TooManyAttempts);
            }
            return Status::ok(ActionStatus::Unaligned);
        }

        Status turn_to_impl(const Target &target, dp::f64 speed, dp::f64 aligned_at) {
            auto p = resolve_target(target);
            if (p.is_err()) {
                return Status::err(p.error());
            }
            const dp::f64 angle = geometry::angle_to(last_.forward(), last_.position(), p.value());
            echo::trace("turn_to: ", angle, " deg");
            return turn_by_impl(angle, speed, aligned_at);
        }

        Status move_by_impl(dp::f64 distance, dp::f64 speed, dp::f64 arrived_at) {
            if (speed <= 0.0) {
                return Status::err(dp::Error::invalid_argument("move speed must be positive"));
            }

            const Eigen::Vector3d p0 = last_.position();
            const dp::f64 goal = std::fabs(distance);
            const dp::f64 s = distance < 0.0 ? -speed : speed;
            const dp::u64 cap = attempt_cap(distance, speed);

            dp::u64 attempts = 0;
            dp::f64 d = 0.0;
            while (d < goal && attempts < cap) {
                auto sent = drive_wheels(s, s);
                if (sent.is_err()) {
                    return Status::err(sent.error());
                }
                ++attempts;

                auto motion = settle_wheels(sent.value());
                if (motion.is_err()) {
                    return Status::err(motion.error());
                }
                d = (motion.value().frame.position() - p0).norm();
                echo::trace("move attempt ", attempts, ": ", d, " of ", goal);
                if (!motion.value().settled) {
                    break;
                }
            }

            if (std::fabs(goal - d) < arrived_at) {
                return Status::ok(ActionStatus::Success);
            }
            if (attempts >= cap) {
                return Status::ok(ActionStatus::TooManyAttempts);
            }
            return Status::ok(ActionStatus::OvershotMove);
        }

        Status reach_for_impl(const dp::Point &target, Arm arm, bool check_if_possible, bool absolute,
                              dp::f64 arrived_at) {
            const auto &slots = layout_->chain(arm);
            const auto &chain = chains_[static_cast<dp::usize>(arm)];

            Eigen::Vector3d dest = geometry::to_eigen(target);
            if (absolute) {
                dest = geometry::absolute_to_relative(dest, last_.position(), last_.forward());
            }

            auto seed = kinematics::seed_angles(slots, last_);
            if (seed.is_err()) {
                return Status::err(seed.error());
            }
            auto sol = kinematics::solve(chain, dest, seed.value(), config_.solver);
            if (sol.is_err()) {
                return Status::err(sol.error());
            }
            const dp::f64 miss = (sol.value().predicted - dest).norm();
            echo::trace("ik ", to_string(arm), ": residual ", miss, " after ", sol.value().iterations, " iterations");

            if (check_if_possible && miss > arrived_at) {
                if (config_.debug) {
                    echo("Target too far for the ", to_string(arm), " arm: ", miss);
                }
                return Status::ok(ActionStatus::TooFarToReach);
            }

            auto cmds = kinematics::to_commands(slots, sol.value().angles);
            if (cmds.is_err()) {
                return Status::err(cmds.error());
            }
            auto motion = bend(cmds.value());
            if (motion.is_err()) {
                return Status::err(motion.error());
            }

            const auto &frame = motion.value().frame;
            auto magnet = frame.joint_position(layout_->magnet(arm));
            if (!magnet.has_value()) {
                return Status::err(dp::Error::invalid_argument("frame has no magnet position"));
            }
            const Eigen::Vector3d rel = geometry::absolute_to_relative(*magnet, frame.position(), frame.forward());
            const dp::f64 dist = (rel - dest).norm();
            if (dist < arrived_at) {
                return Status::ok(ActionStatus::Success);
            }
            if (config_.debug) {
                echo("Failed to reach with the ", to_string(arm), " arm: ", dist);
            }
            return Status::ok(ActionStatus::FailedToReach);
        }

        Status reset_impl(const dp::Vector<types::Command> &cmds) {
            auto motion = bend(cmds);
            if (motion.is_err()) {
                return Status::err(motion.error());
            }
            return Status::ok(motion.value().settled ? ActionStatus::Success : ActionStatus::TooManyAttempts);
        }
    };

} // namespace magbot
