// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispenser.hpp"

namespace ticketlock {
    dispenser::dispenser(ticket_type serving, ticket_type next_ticket)
        : m_next_ticket(next_ticket),
          m_serving(serving) {}

    auto dispenser::issue() -> std::optional<ticket_type> {
        if(!m_next_ticket.has_successor()) {
            return std::nullopt;
        }
        auto issued = m_next_ticket;
        m_next_ticket = m_next_ticket.successor();
        return issued;
    }

    auto dispenser::advance_serving() -> bool {
        if(!m_serving.has_successor()) {
            return false;
        }
        m_serving = m_serving.successor();
        return true;
    }

    auto dispenser::is_current(ticket_type ticket) const -> bool {
        return ticket == m_serving;
    }

    auto dispenser::next_ticket() const -> ticket_type {
        return m_next_ticket;
    }

    auto dispenser::serving() const -> ticket_type {
        return m_serving;
    }

    auto dispenser::outstanding() const -> ticket_type::rep_type {
        return ticket_type::distance(m_serving, m_next_ticket);
    }

    auto dispenser::operator==(const dispenser& rhs) const -> bool {
        return m_next_ticket == rhs.m_next_ticket
            && m_serving == rhs.m_serving;
    }

    auto dispenser::operator!=(const dispenser& rhs) const -> bool {
        return !(*this == rhs);
    }
}
