// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_VERIFIER_INVARIANTS_H_
#define TICKETLOCK_SRC_VERIFIER_INVARIANTS_H_

#include "protocol/action.hpp"
#include "protocol/state.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ticketlock::verifier {
    /// Properties checked by the verifier.
    enum class invariant : uint8_t {
        /// Every participant is in exactly one of idle, awaiting, critical.
        phase_partition,
        /// Every participant holds exactly one ticket.
        single_ownership,
        /// At most one participant is critical.
        mutual_exclusion,
        /// serving <= next_ticket.
        serving_bound,
        /// No two non-idle participants hold the same ticket.
        unique_tickets,
        /// Idle participants hold zero.
        idle_holds_zero,
        /// Every non-idle participant holds k with serving <= k < next.
        held_in_window,
        /// A critical participant holds the serving ticket.
        critical_holds_serving,
        /// The number of non-idle participants is next - serving.
        window_fully_owned,
        /// request hands out the previous next_ticket, which is strictly
        /// greater than every ticket issued before, and advances
        /// next_ticket by one successor.
        issuance_monotonicity,
        /// A participant becomes critical only through enter, holding the
        /// serving ticket.
        admission_correctness,
        /// Counters never decrease and move by at most one successor, and
        /// only through the action that owns them.
        counter_monotonicity,
        /// The named participant moves along idle -> awaiting -> critical
        /// -> idle as its action dictates.
        lifecycle,
        /// Participants not named by the action are unchanged.
        frame,
        /// A complete request/enter/exit cycle returns the participant to
        /// idle and leaves next - serving unchanged.
        round_trip
    };

    /// Returns the snake_case name of an invariant.
    auto to_string(invariant inv) -> std::string;

    /// One failed invariant instance.
    struct violation {
        invariant m_invariant{};
        /// Human-readable description of the offending values.
        std::string m_detail;
    };

    auto to_string(const violation& v) -> std::string;

    auto operator<<(std::ostream& os, const violation& v) -> std::ostream&;

    /// Checks every state invariant. The state invariants are inductive:
    /// if they hold before any enabled action, they hold after it.
    /// \param s state to check.
    /// \return violations found, empty if the state is safe.
    auto check_state(const protocol::state& s) -> std::vector<violation>;

    /// Checks the transition properties of one applied action.
    /// \param before state before the action.
    /// \param act applied action.
    /// \param after state after the action.
    /// \return violations found, empty if the step is correct.
    auto check_transition(const protocol::state& before,
                          const protocol::action& act,
                          const protocol::state& after)
        -> std::vector<violation>;

    /// Checks the round-trip law for one participant between the state
    /// before its request and the state after its exit, with no other
    /// participant acting in between.
    /// \param before state before the cycle started.
    /// \param p participant that completed the cycle.
    /// \param after state after the cycle finished.
    /// \return violations found, empty if the law holds.
    auto check_round_trip(const protocol::state& before,
                          participant_id p,
                          const protocol::state& after)
        -> std::vector<violation>;

    /// Returns true if any violation concerns the given invariant.
    auto violates(const std::vector<violation>& violations, invariant inv)
        -> bool;
}

#endif
