// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_CHECKER_SCHEDULER_H_
#define TICKETLOCK_SRC_CHECKER_SCHEDULER_H_

#include "driver.hpp"
#include "util/common/logging.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <random>

namespace ticketlock::checker {
    /// \brief Randomized interleaving of participant steps.
    ///
    /// Each trial builds a fresh driver and advances a uniformly chosen
    /// participant per step. Trial i is seeded with seed + i, so any
    /// failing trial can be replayed on its own.
    class random_scheduler {
      public:
        /// Builds a fresh driver for one trial.
        using driver_factory_type = std::function<std::unique_ptr<driver>()>;

        /// Outcome of \ref run_trials.
        struct result {
            /// Trials started.
            size_t m_trials{0};
            /// Steps that applied an action, over all trials.
            size_t m_steps{0};
            /// Steps on which the chosen participant could not progress.
            size_t m_stalls{0};
            /// Seed of the first failing trial.
            std::optional<uint64_t> m_failing_seed;
            /// Driver of the first failing trial, in its final state.
            std::unique_ptr<driver> m_failed_driver;

            /// Returns true if every trial passed.
            [[nodiscard]] auto ok() const -> bool;
        };

        /// Constructor.
        /// \param logger log instance.
        /// \param seed base seed.
        random_scheduler(std::shared_ptr<logging::log> logger, uint64_t seed);

        /// Runs one schedule on an existing driver.
        /// \param drv driver to advance.
        /// \param step_count number of participant choices to make.
        /// \param seed seed for the participant choices.
        /// \return number of steps that applied an action. Stops early
        ///         when the driver reports a violation.
        auto run(driver& drv, size_t step_count, uint64_t seed) -> size_t;

        /// Runs independent trials until one fails or all are done.
        /// \param factory builds the driver for each trial.
        /// \param trial_count number of trials.
        /// \param step_count participant choices per trial.
        /// \return aggregated outcome.
        auto run_trials(const driver_factory_type& factory,
                        size_t trial_count,
                        size_t step_count) -> result;

      private:
        std::shared_ptr<logging::log> m_log;
        uint64_t m_seed;
        size_t m_stalls{0};
    };
}

#endif
