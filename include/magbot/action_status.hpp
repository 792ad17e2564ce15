#pragma once

#include <datapod/adapters.hpp>

namespace magbot {

    /// Terminal outcome of one action. Exactly one per public call.
    enum class ActionStatus : dp::u8 {
        Success = 0,
        TooManyAttempts = 1,
        Unaligned = 2,
        OvershotMove = 3,
        TooFarToReach = 4,
        FailedToReach = 5,
    };

    inline const char *to_string(ActionStatus s) {
        switch (s) {
        case ActionStatus::Success:
            return "success";
        case ActionStatus::TooManyAttempts:
            return "too_many_attempts";
        case ActionStatus::Unaligned:
            return "unaligned";
        case ActionStatus::OvershotMove:
            return "overshot_move";
        case ActionStatus::TooFarToReach:
            return "too_far_to_reach";
        case ActionStatus::FailedToReach:
            return "failed_to_reach";
        default:
            return "unknown";
        }
    }

} // namespace magbot
