// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_CHECKER_EXPLORER_H_
#define TICKETLOCK_SRC_CHECKER_EXPLORER_H_

#include "protocol/state_machine.hpp"
#include "trace.hpp"
#include "util/common/logging.hpp"
#include "verifier/invariants.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace ticketlock::checker {
    /// \brief Exhaustive breadth-first exploration of the protocol.
    ///
    /// Visits every state reachable from the initial state through enabled
    /// actions of any participant, in any interleaving, while fewer than
    /// the ticket bound tickets have been issued. Every state is checked
    /// with the state check and every transition with the transition
    /// properties. Exploration stops at the first violation and rebuilds
    /// the shortest action sequence leading to it.
    class explorer {
      public:
        /// Predicate over a single state. Returns the violations found.
        using state_check_type = std::function<std::vector<verifier::violation>(
            const protocol::state&)>;

        /// Exploration parameters.
        struct parameters {
            /// Number of participants in the initial state.
            size_t m_participant_count{0};
            /// No request is explored once next_ticket reaches this value.
            uint64_t m_ticket_bound{0};
            /// Store states up to a permutation of participant identities.
            bool m_symmetry_reduction{false};
            /// Stop after storing this many states. Zero for no limit.
            size_t m_state_limit{0};
        };

        /// Outcome of an exploration.
        struct result {
            /// Distinct states stored.
            size_t m_states{0};
            /// Actions applied, including those leading to known states.
            size_t m_transitions{0};
            /// Largest number of steps from the initial state to a stored
            /// state.
            size_t m_depth{0};
            /// False if the state limit cut the exploration short.
            bool m_complete{true};
            /// Violations found at the first failing state or step.
            std::vector<verifier::violation> m_violations;
            /// Steps from the initial state to the first failure.
            trace m_counterexample;

            /// Returns true if no violation was found.
            [[nodiscard]] auto ok() const -> bool;
        };

        /// Constructor.
        /// \param logger log instance.
        /// \param params exploration parameters.
        /// \param check state check applied to every stored state. Defaults
        ///              to the full invariant battery.
        explicit explorer(std::shared_ptr<logging::log> logger,
                          parameters params,
                          state_check_type check = &verifier::check_state);

        /// Explores from the protocol's initial state.
        auto run() -> result;

        /// Explores from the given state.
        /// \param initial state to start from.
        auto run(const protocol::state& initial) -> result;

      private:
        struct node {
            protocol::state m_state;
            std::optional<size_t> m_parent;
            std::optional<protocol::action> m_via;
            size_t m_depth{0};
        };

        std::shared_ptr<logging::log> m_log;
        protocol::state_machine m_machine;
        parameters m_params;
        state_check_type m_check;

        [[nodiscard]] auto explorable(const protocol::state& s,
                                      const protocol::action& act) const
            -> bool;

        [[nodiscard]] auto normalize(protocol::state s) const
            -> protocol::state;

        static auto path_to(const std::vector<node>& nodes, size_t idx)
            -> trace;
    };
}

#endif
