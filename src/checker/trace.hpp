// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_CHECKER_TRACE_H_
#define TICKETLOCK_SRC_CHECKER_TRACE_H_

#include "protocol/action.hpp"
#include "protocol/state.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace ticketlock::checker {
    /// One applied action with the states around it.
    struct trace_step {
        protocol::state m_before;
        protocol::action m_action;
        protocol::state m_after;
    };

    /// \brief Sequence of protocol steps from an initial state.
    ///
    /// Recorded by the drivers and rebuilt by the explorer to show how a
    /// violating state was reached.
    class trace {
      public:
        trace() = default;

        /// Appends a step.
        void push(trace_step step);

        /// Returns the number of steps.
        [[nodiscard]] auto size() const -> size_t;

        [[nodiscard]] auto empty() const -> bool;

        [[nodiscard]] auto steps() const -> const std::vector<trace_step>&;

        /// Returns the actions in order.
        [[nodiscard]] auto actions() const -> std::vector<protocol::action>;

        /// Removes every step.
        void clear();

      private:
        std::vector<trace_step> m_steps;
    };

    /// Prints one numbered line per step with the resulting state.
    auto operator<<(std::ostream& os, const trace& t) -> std::ostream&;

    auto to_string(const trace& t) -> std::string;
}

#endif
