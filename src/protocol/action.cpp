// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "action.hpp"

#include "util/common/variant_overloaded.hpp"

#include <sstream>

namespace ticketlock::protocol {
    auto request_action::operator==(const request_action& rhs) const -> bool {
        return m_participant == rhs.m_participant;
    }

    auto wait_action::operator==(const wait_action& rhs) const -> bool {
        return m_participant == rhs.m_participant && m_ticket == rhs.m_ticket;
    }

    auto enter_action::operator==(const enter_action& rhs) const -> bool {
        return m_participant == rhs.m_participant && m_ticket == rhs.m_ticket;
    }

    auto exit_action::operator==(const exit_action& rhs) const -> bool {
        return m_participant == rhs.m_participant;
    }

    auto kind_of(const action& act) -> action_kind {
        return static_cast<action_kind>(act.index());
    }

    auto participant_of(const action& act) -> participant_id {
        return std::visit(
            [](const auto& a) {
                return a.m_participant;
            },
            act);
    }

    auto to_string(action_kind kind) -> std::string {
        switch(kind) {
            case action_kind::request:
                return "request";
            case action_kind::wait:
                return "wait";
            case action_kind::enter:
                return "enter";
            case action_kind::exit:
                return "exit";
        }
        return "unknown";
    }

    auto to_string(const action& act) -> std::string {
        std::stringstream ss;
        ss << to_string(kind_of(act)) << "(p" << participant_of(act);
        std::visit(overloaded{[&](const wait_action& a) {
                                  ss << ", " << a.m_ticket;
                              },
                              [&](const enter_action& a) {
                                  ss << ", " << a.m_ticket;
                              },
                              [](const auto& /* no ticket argument */) {}},
                   act);
        ss << ")";
        return ss.str();
    }

    auto operator<<(std::ostream& os, const action& act) -> std::ostream& {
        return os << to_string(act);
    }
}
