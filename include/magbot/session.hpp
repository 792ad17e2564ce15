#pragma once

#include <datapod/adapters.hpp>

#include "magbot/types.hpp"

namespace magbot {

    /// Single-action-at-a-time bracket: Idle -> InFlight -> Idle.
    ///
    /// begin() refuses while an action is in flight. The commands that go with each edge are
    /// handed to the caller, which queues them on the next tick.
    class ActionSession {
      public:
        enum class State : dp::u8 {
            Idle = 0,
            InFlight = 1,
        };

        bool begin() {
            if (state_ == State::InFlight) {
                return false;
            }
            state_ = State::InFlight;
            return true;
        }

        /// Close the bracket normally.
        void end() {
            if (state_ == State::InFlight) {
                ++completed_;
            }
            state_ = State::Idle;
        }

        /// Close the bracket after an integration error. Not counted as completed.
        void abort() { state_ = State::Idle; }

        State state() const { return state_; }
        bool in_flight() const { return state_ == State::InFlight; }
        dp::u64 completed() const { return completed_; }

        /// Sent with the first tick of an action: the image sensor stays off while joints converge.
        static dp::Vector<types::Command> begin_commands() {
            dp::Vector<types::Command> out;
            out.push_back(types::Command::enable_image_sensor(false));
            return out;
        }

        /// Sent as the closing tick: its frame becomes the caller-visible state.
        static dp::Vector<types::Command> end_commands() {
            dp::Vector<types::Command> out;
            out.push_back(types::Command::enable_image_sensor(true));
            out.push_back(types::Command::send_images());
            out.push_back(types::Command::send_camera_matrices());
            return out;
        }

      private:
        State state_ = State::Idle;
        dp::u64 completed_ = 0;
    };

} // namespace magbot
