// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_CHECKER_MODEL_DRIVER_H_
#define TICKETLOCK_SRC_CHECKER_MODEL_DRIVER_H_

#include "driver.hpp"
#include "protocol/state_machine.hpp"
#include "trace.hpp"
#include "util/common/logging.hpp"
#include "verifier/invariants.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace ticketlock::checker {
    /// \brief Drives the protocol model and verifies every step.
    ///
    /// Owns a protocol state. Each step applies the participant's enabled
    /// action, then checks the state invariants, the transition properties
    /// and, for uninterrupted cycles, the round-trip law. The first
    /// violation stops the driver: later steps return std::nullopt.
    class model_driver : public driver {
      public:
        /// Constructor.
        /// \param participant_count number of participants.
        /// \param logger log instance.
        /// \param record_trace true to keep every step for counterexample
        ///                     output.
        model_driver(size_t participant_count,
                     std::shared_ptr<logging::log> logger,
                     bool record_trace = true);

        ~model_driver() override = default;

        model_driver(const model_driver&) = delete;
        auto operator=(const model_driver&) -> model_driver& = delete;
        model_driver(model_driver&&) = delete;
        auto operator=(model_driver&&) -> model_driver& = delete;

        /// Applies the enabled action for the participant and verifies the
        /// result.
        /// \param p participant to advance.
        /// \return the applied action, or std::nullopt for an unknown
        ///         participant or after a violation.
        auto step(participant_id p)
            -> std::optional<protocol::action> override;

        /// Attempts an arbitrary action, enabled or not. A rejected action
        /// must leave the state unchanged; an accepted one is verified like
        /// \ref step.
        /// \param act action to attempt.
        /// \return the contract violation if the action was rejected.
        auto try_apply(const protocol::action& act)
            -> std::optional<protocol::contract_violation>;

        [[nodiscard]] auto participant_count() const -> size_t override;

        /// Returns the current protocol state.
        [[nodiscard]] auto get_state() const -> const protocol::state&;

        /// Returns the violations found so far.
        [[nodiscard]] auto violations() const
            -> const std::vector<verifier::violation>&;

        /// Returns true if no violation was found.
        [[nodiscard]] auto ok() const -> bool override;

        /// Returns the recorded steps.
        [[nodiscard]] auto get_trace() const -> const trace&;

        /// Returns the number of applied actions.
        [[nodiscard]] auto step_count() const -> size_t;

      private:
        struct cycle_start {
            protocol::state m_state;
            size_t m_step{};
        };

        std::shared_ptr<logging::log> m_log;
        protocol::state_machine m_machine;
        protocol::state m_state;
        trace m_trace;
        bool m_record_trace;
        size_t m_steps{0};
        std::vector<verifier::violation> m_violations;
        std::vector<std::optional<cycle_start>> m_cycles;
        std::optional<participant_id> m_last_actor;
        size_t m_run_start{0};

        void verify(const protocol::state& before,
                    const protocol::action& act);

        void fail(std::vector<verifier::violation> found);
    };
}

#endif
