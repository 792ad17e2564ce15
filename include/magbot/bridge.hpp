#pragma once

#include <string>

#include "magbot/types.hpp"

namespace magbot {

    /// Abstract bridge to the simulation backend.
    ///
    /// The contract is strict request/reply: every communicate() advances the simulation by
    /// exactly one tick and fills exactly one Response for that tick.
    class Bridge {
      public:
        virtual ~Bridge() = default;

        virtual bool connect(const std::string &endpoint) = 0;
        virtual void disconnect() = 0;
        virtual bool is_connected() const = 0;

        /// Send one batch and block until its response arrives.
        /// Returns false if the round trip failed.
        virtual bool communicate(const types::CommandBatch &batch, types::Response &out) = 0;
    };

} // namespace magbot
