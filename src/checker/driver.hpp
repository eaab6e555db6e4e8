// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_CHECKER_DRIVER_H_
#define TICKETLOCK_SRC_CHECKER_DRIVER_H_

#include "protocol/action.hpp"

#include <cstddef>
#include <optional>

namespace ticketlock::checker {
    /// \brief Interface for advancing one participant by one protocol step.
    ///
    /// Lets the same scheduling code exercise the protocol model and a live
    /// lock. Implementations decide which enabled action to take for the
    /// participant and apply it atomically.
    class driver {
      public:
        virtual ~driver() = default;

        driver() = default;
        driver(const driver&) = delete;
        auto operator=(const driver&) -> driver& = delete;
        driver(driver&&) = delete;
        auto operator=(driver&&) -> driver& = delete;

        /// Applies the next enabled action for the participant.
        /// \param p participant to advance.
        /// \return the applied action, or std::nullopt if the participant
        ///         could not make progress.
        virtual auto step(participant_id p) -> std::optional<protocol::action>
            = 0;

        /// Returns the number of participants the driver manages.
        [[nodiscard]] virtual auto participant_count() const -> size_t = 0;

        /// Returns false once the driver has observed an invariant
        /// violation.
        [[nodiscard]] virtual auto ok() const -> bool = 0;
    };
}

#endif
