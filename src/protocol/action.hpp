// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_PROTOCOL_ACTION_H_
#define TICKETLOCK_SRC_PROTOCOL_ACTION_H_

#include "registry/registry.hpp"
#include "ticket/ticket.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace ticketlock::protocol {
    /// Draw a ticket. Enabled when the participant is idle.
    struct request_action {
        participant_id m_participant{};

        auto operator==(const request_action& rhs) const -> bool;
    };

    /// Observe that the held ticket is not being served yet. Enabled when
    /// the participant is awaiting and its ticket is not current.
    struct wait_action {
        participant_id m_participant{};
        ticket_type m_ticket{};

        auto operator==(const wait_action& rhs) const -> bool;
    };

    /// Enter the protected region. Enabled when the participant is awaiting
    /// and its ticket is current.
    struct enter_action {
        participant_id m_participant{};
        ticket_type m_ticket{};

        auto operator==(const enter_action& rhs) const -> bool;
    };

    /// Leave the protected region. Enabled when the participant is critical.
    struct exit_action {
        participant_id m_participant{};

        auto operator==(const exit_action& rhs) const -> bool;
    };

    /// One atomic protocol step.
    using action
        = std::variant<request_action, wait_action, enter_action, exit_action>;

    /// Action kinds, in the order of the \ref action alternatives.
    enum class action_kind : uint8_t {
        request,
        wait,
        enter,
        exit
    };

    /// Returns the kind of an action.
    auto kind_of(const action& act) -> action_kind;

    /// Returns the participant named by an action.
    auto participant_of(const action& act) -> participant_id;

    auto to_string(action_kind kind) -> std::string;

    /// Returns a string such as "enter(p1, #3)".
    auto to_string(const action& act) -> std::string;

    auto operator<<(std::ostream& os, const action& act) -> std::ostream&;
}

#endif
