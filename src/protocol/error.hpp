// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_PROTOCOL_ERROR_H_
#define TICKETLOCK_SRC_PROTOCOL_ERROR_H_

#include "action.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace ticketlock::protocol {
    /// Precondition that an action found unsatisfied.
    enum class violation_reason : uint8_t {
        /// The participant identity is not registered.
        unknown_participant,
        /// request on a participant that is not idle.
        not_idle,
        /// wait or enter on a participant that is not awaiting.
        not_awaiting,
        /// exit on a participant that is not critical.
        not_critical,
        /// The presented ticket is not the one the participant holds.
        ticket_mismatch,
        /// enter with a ticket that is not being served.
        ticket_not_serving,
        /// wait with the ticket that is being served.
        ticket_serving
    };

    /// \brief Caller error: an action was attempted while its precondition
    ///        did not hold.
    ///
    /// The only error the protocol reports. Never transient, so callers
    /// must not retry the action unchanged. The state is left untouched.
    struct contract_violation {
        /// Kind of the attempted action.
        action_kind m_action{};
        /// Participant named by the attempted action.
        participant_id m_participant{};
        /// Unsatisfied precondition.
        violation_reason m_reason{};

        auto operator==(const contract_violation& rhs) const -> bool;
    };

    auto to_string(violation_reason reason) -> std::string;

    /// Returns a string such as "enter(p1) violated contract:
    /// ticket_not_serving".
    auto to_string(const contract_violation& err) -> std::string;

    auto operator<<(std::ostream& os, const contract_violation& err)
        -> std::ostream&;
}

#endif
