// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "scheduler.hpp"

namespace ticketlock::checker {
    auto random_scheduler::result::ok() const -> bool {
        return !m_failing_seed.has_value();
    }

    random_scheduler::random_scheduler(std::shared_ptr<logging::log> logger,
                                       uint64_t seed)
        : m_log(std::move(logger)),
          m_seed(seed) {}

    auto random_scheduler::run(driver& drv, size_t step_count, uint64_t seed)
        -> size_t {
        const auto n = drv.participant_count();
        if(n == 0) {
            return 0;
        }
        auto rng = std::mt19937_64(seed);
        auto pick = std::uniform_int_distribution<participant_id>(0, n - 1);

        size_t applied{0};
        for(size_t i{0}; i < step_count && drv.ok(); i++) {
            auto p = pick(rng);
            auto act = drv.step(p);
            if(act.has_value()) {
                applied++;
            } else {
                m_stalls++;
            }
        }
        return applied;
    }

    auto random_scheduler::run_trials(const driver_factory_type& factory,
                                      size_t trial_count,
                                      size_t step_count) -> result {
        auto ret = result{};
        m_stalls = 0;
        for(size_t trial{0}; trial < trial_count; trial++) {
            const auto seed = m_seed + trial;
            auto drv = factory();
            ret.m_trials++;
            ret.m_steps += run(*drv, step_count, seed);
            if(!drv->ok()) {
                m_log->error("Trial", trial, "with seed", seed, "failed");
                ret.m_failing_seed = seed;
                ret.m_failed_driver = std::move(drv);
                break;
            }
            m_log->debug("Trial", trial, "with seed", seed, "passed");
        }
        ret.m_stalls = m_stalls;
        m_log->info("Random scheduler ran",
                    ret.m_trials,
                    "trials,",
                    ret.m_steps,
                    "steps,",
                    ret.m_stalls,
                    "stalls");
        return ret;
    }
}
