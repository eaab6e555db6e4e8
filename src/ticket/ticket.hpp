// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_TICKET_TICKET_H_
#define TICKETLOCK_SRC_TICKET_TICKET_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <ostream>
#include <string>
#include <type_traits>

namespace ticketlock {
    /// \brief Totally ordered ticket value with an immediate successor.
    ///
    /// Models an unbounded ordered domain with a least element \ref zero.
    /// The representation is a finite unsigned integer, so the largest value
    /// has no successor. Callers must check \ref has_successor before
    /// calling \ref successor; running out of tickets is a configuration
    /// error and never wraps.
    /// \tparam Rep unsigned integer representation.
    template<typename Rep>
    class basic_ticket {
        static_assert(std::is_unsigned_v<Rep>,
                      "ticket representation must be unsigned");

      public:
        using rep_type = Rep;

        /// Constructs the zero ticket.
        constexpr basic_ticket() = default;

        /// Constructs a ticket with the given position in the order.
        explicit constexpr basic_ticket(rep_type value) : m_value(value) {}

        /// Returns the least ticket.
        static constexpr auto zero() -> basic_ticket {
            return basic_ticket();
        }

        /// Returns the largest representable ticket.
        static constexpr auto max() -> basic_ticket {
            return basic_ticket(std::numeric_limits<rep_type>::max());
        }

        /// Order relation. Reflexive, transitive, antisymmetric and total.
        [[nodiscard]] static constexpr auto le(basic_ticket a, basic_ticket b)
            -> bool {
            return a.m_value <= b.m_value;
        }

        /// Returns true if this ticket has a successor in the
        /// representation.
        [[nodiscard]] constexpr auto has_successor() const -> bool {
            return m_value != std::numeric_limits<rep_type>::max();
        }

        /// Returns the least ticket strictly greater than this one.
        /// Requires \ref has_successor.
        [[nodiscard]] constexpr auto successor() const -> basic_ticket {
            return basic_ticket(static_cast<rep_type>(m_value + 1));
        }

        /// Returns the number of successor steps from \p from to \p to.
        /// Requires le(from, to).
        [[nodiscard]] static constexpr auto distance(basic_ticket from,
                                                     basic_ticket to)
            -> rep_type {
            return static_cast<rep_type>(to.m_value - from.m_value);
        }

        /// Returns true if this is the zero ticket.
        [[nodiscard]] constexpr auto is_zero() const -> bool {
            return m_value == 0;
        }

        /// Returns the underlying representation.
        [[nodiscard]] constexpr auto value() const -> rep_type {
            return m_value;
        }

        friend constexpr auto operator==(basic_ticket a, basic_ticket b)
            -> bool {
            return a.m_value == b.m_value;
        }

        friend constexpr auto operator!=(basic_ticket a, basic_ticket b)
            -> bool {
            return a.m_value != b.m_value;
        }

        friend constexpr auto operator<(basic_ticket a, basic_ticket b)
            -> bool {
            return !le(b, a);
        }

        friend constexpr auto operator<=(basic_ticket a, basic_ticket b)
            -> bool {
            return le(a, b);
        }

        friend constexpr auto operator>(basic_ticket a, basic_ticket b)
            -> bool {
            return !le(a, b);
        }

        friend constexpr auto operator>=(basic_ticket a, basic_ticket b)
            -> bool {
            return le(b, a);
        }

        friend auto operator<<(std::ostream& os, basic_ticket t)
            -> std::ostream& {
            // Widen so that uint8_t tickets print as numbers.
            return os << "#" << static_cast<uint64_t>(t.m_value);
        }

      private:
        rep_type m_value{};
    };

    /// Ticket type used by the protocol.
    using ticket_type = basic_ticket<uint64_t>;

    /// Returns a string representation of a ticket.
    template<typename Rep>
    auto to_string(basic_ticket<Rep> t) -> std::string {
        return "#" + std::to_string(static_cast<uint64_t>(t.value()));
    }
}

namespace std {
    template<typename Rep>
    struct hash<ticketlock::basic_ticket<Rep>> {
        auto operator()(ticketlock::basic_ticket<Rep> t) const noexcept
            -> size_t {
            return std::hash<Rep>()(t.value());
        }
    };
}

#endif
