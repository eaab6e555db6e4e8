// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_DISPENSER_DISPENSER_H_
#define TICKETLOCK_SRC_DISPENSER_DISPENSER_H_

#include "ticket/ticket.hpp"

#include <optional>

namespace ticketlock {
    /// \brief Global ticket issuance state.
    ///
    /// Tracks the next ticket to hand out and the ticket currently being
    /// served. Both counters start at zero and only move forward by one
    /// successor step. Not thread-safe; callers serialize access to the
    /// protocol state that contains it.
    class dispenser {
      public:
        dispenser() = default;

        /// Restores a dispenser with the given counters. Does not require
        /// serving <= next_ticket, so recorded or hand-built states can be
        /// loaded and checked.
        /// \param serving ticket currently being served.
        /// \param next_ticket next ticket to issue.
        dispenser(ticket_type serving, ticket_type next_ticket);

        /// Returns the current next ticket and advances it to its
        /// successor.
        /// \return the issued ticket, or std::nullopt if the ticket domain
        ///         is exhausted. The dispenser is unchanged in that case.
        auto issue() -> std::optional<ticket_type>;

        /// Advances the serving ticket to its successor.
        /// \return false if the ticket domain is exhausted.
        auto advance_serving() -> bool;

        /// Admission test.
        /// \param ticket ticket to test.
        /// \return true if the ticket is the one being served.
        [[nodiscard]] auto is_current(ticket_type ticket) const -> bool;

        /// Returns the ticket the next call to \ref issue will hand out.
        [[nodiscard]] auto next_ticket() const -> ticket_type;

        /// Returns the ticket currently authorized to enter.
        [[nodiscard]] auto serving() const -> ticket_type;

        /// Returns the number of tickets issued but not yet served.
        [[nodiscard]] auto outstanding() const -> ticket_type::rep_type;

        auto operator==(const dispenser& rhs) const -> bool;
        auto operator!=(const dispenser& rhs) const -> bool;

      private:
        ticket_type m_next_ticket{};
        ticket_type m_serving{};
    };
}

#endif
