// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_PROTOCOL_STATE_H_
#define TICKETLOCK_SRC_PROTOCOL_STATE_H_

#include "dispenser/dispenser.hpp"
#include "registry/registry.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace ticketlock::protocol {
    /// \brief Complete shared protocol state.
    ///
    /// The dispenser counters plus every participant's phase and ticket.
    /// Actions must observe and mutate it atomically; the caller provides
    /// whatever serialization that takes. Value type: copyable, comparable
    /// and hashable so checkers can store visited states.
    struct state {
        /// Initial state: both counters at zero, every participant idle
        /// holding zero.
        /// \param participant_count number of participants.
        explicit state(size_t participant_count);

        /// Builds a state from its parts. Performs no validation.
        state(dispenser disp, registry reg);

        dispenser m_dispenser;
        registry m_registry;

        /// Returns the state with participant records sorted. Equal for
        /// any two states that differ only by a permutation of
        /// participant identities.
        [[nodiscard]] auto canonical() const -> state;

        auto operator==(const state& rhs) const -> bool;
        auto operator!=(const state& rhs) const -> bool;
    };

    /// Returns a one-line representation, for example
    /// "serving=#1 next=#3 [p0:idle#0 p1:critical#1 p2:awaiting#2]".
    auto to_string(const state& s) -> std::string;

    auto operator<<(std::ostream& os, const state& s) -> std::ostream&;

    /// Hash functor for \ref state.
    struct state_hasher {
        auto operator()(const state& s) const noexcept -> size_t;
    };
}

#endif
