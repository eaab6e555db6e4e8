// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_VERIFIER_DOMAIN_AXIOMS_H_
#define TICKETLOCK_SRC_VERIFIER_DOMAIN_AXIOMS_H_

#include "ticket/ticket.hpp"

namespace ticketlock::verifier {
    /// \brief Axioms of the ordered ticket domain.
    ///
    /// Kept apart from the protocol invariants so the domain can be checked
    /// on its own, over arbitrary values, before it is relied on by the
    /// state machine. Each predicate returns true when the axiom holds for
    /// the given instance.
    template<typename Ticket>
    struct domain_axioms {
        /// le(a, a).
        static constexpr auto reflexive(Ticket a) -> bool {
            return Ticket::le(a, a);
        }

        /// le(a, b) and le(b, c) imply le(a, c).
        static constexpr auto transitive(Ticket a, Ticket b, Ticket c)
            -> bool {
            return !(Ticket::le(a, b) && Ticket::le(b, c))
                || Ticket::le(a, c);
        }

        /// le(a, b) and le(b, a) imply a == b.
        static constexpr auto antisymmetric(Ticket a, Ticket b) -> bool {
            return !(Ticket::le(a, b) && Ticket::le(b, a)) || a == b;
        }

        /// le(a, b) or le(b, a).
        static constexpr auto total(Ticket a, Ticket b) -> bool {
            return Ticket::le(a, b) || Ticket::le(b, a);
        }

        /// le(zero, a).
        static constexpr auto zero_is_least(Ticket a) -> bool {
            return Ticket::le(Ticket::zero(), a);
        }

        /// With y = successor(x): y does not precede or equal x, and every
        /// z strictly greater than x satisfies le(y, z). Vacuously true for
        /// a value without a successor.
        static constexpr auto successor_is_immediate(Ticket x, Ticket z)
            -> bool {
            if(!x.has_successor()) {
                return true;
            }
            const auto y = x.successor();
            if(Ticket::le(y, x)) {
                return false;
            }
            return Ticket::le(z, x) || Ticket::le(y, z);
        }

        /// Conjunction of every axiom over the given values.
        static constexpr auto all(Ticket a, Ticket b, Ticket c) -> bool {
            return reflexive(a) && transitive(a, b, c) && antisymmetric(a, b)
                && total(a, b) && zero_is_least(a)
                && successor_is_immediate(a, b);
        }
    };
}

#endif
