// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "checker/explorer.hpp"
#include "checker/model_driver.hpp"
#include "checker/scheduler.hpp"
#include "lock/ticket_lock.hpp"
#include "util/common/config.hpp"
#include "verifier/invariants.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

namespace {
    using ticketlock::config::options;
    using logger_type = std::shared_ptr<ticketlock::logging::log>;

    auto run_explore(const options& opts, const logger_type& logger)
        -> bool {
        auto params = ticketlock::checker::explorer::parameters{};
        params.m_participant_count = opts.m_participant_count;
        params.m_ticket_bound = opts.m_ticket_bound;
        params.m_symmetry_reduction = opts.m_symmetry_reduction;
        params.m_state_limit = opts.m_state_limit;

        auto exp = ticketlock::checker::explorer(logger, params);
        const auto res = exp.run();
        if(!res.ok()) {
            for(const auto& v : res.m_violations) {
                logger->error(v);
            }
            std::cout << "Counterexample:" << std::endl
                      << res.m_counterexample;
            return false;
        }
        return true;
    }

    auto run_random(const options& opts, const logger_type& logger)
        -> bool {
        auto sched = ticketlock::checker::random_scheduler(logger, opts.m_seed);
        const auto n = opts.m_participant_count;
        auto res = sched.run_trials(
            [&]() {
                return std::make_unique<ticketlock::checker::model_driver>(
                    n,
                    logger);
            },
            opts.m_trial_count,
            opts.m_step_count);
        if(res.ok()) {
            return true;
        }

        logger->error("failing seed", res.m_failing_seed.value());
        const auto* drv = dynamic_cast<ticketlock::checker::model_driver*>(
            res.m_failed_driver.get());
        if(drv != nullptr) {
            for(const auto& v : drv->violations()) {
                logger->error(v);
            }
            std::cout << "Counterexample:" << std::endl << drv->get_trace();
        }
        return false;
    }

    auto run_stress(const options& opts, const logger_type& logger)
        -> bool {
        auto lk = ticketlock::lock::ticket_lock(opts.m_participant_count,
                                                logger);
        std::atomic<size_t> inside{0};
        std::atomic<size_t> overlaps{0};
        std::atomic<size_t> errors{0};
        size_t counter{0};

        auto threads = std::vector<std::thread>();
        threads.reserve(opts.m_stress_thread_count);
        for(size_t p = 0; p < opts.m_stress_thread_count; p++) {
            threads.emplace_back([&, p]() {
                for(size_t i = 0; i < opts.m_stress_iterations; i++) {
                    auto g = ticketlock::lock::guard(lk, p);
                    if(!g.owns_lock()) {
                        errors++;
                        return;
                    }
                    if(inside.fetch_add(1) != 0) {
                        overlaps++;
                    }
                    counter++;
                    inside.fetch_sub(1);
                }
            });
        }
        for(auto& t : threads) {
            t.join();
        }

        const auto expected
            = opts.m_stress_thread_count * opts.m_stress_iterations;
        logger->info(counter,
                     "of",
                     expected,
                     "critical sections,",
                     overlaps.load(),
                     "overlaps");

        auto ok = errors == 0 && overlaps == 0 && counter == expected;
        for(const auto& v : ticketlock::verifier::check_state(lk.snapshot())) {
            logger->error(v);
            ok = false;
        }
        return ok;
    }
}

// LCOV_EXCL_START
auto main(int argc, char** argv) -> int {
    auto args = ticketlock::config::get_args(argc, argv);
    if(args.size() < 2) {
        std::cout << "Usage: " << args[0] << " <config file>" << std::endl;
        return 0;
    }

    auto cfg_or_err = ticketlock::config::load_options(args[1]);
    if(std::holds_alternative<std::string>(cfg_or_err)) {
        std::cerr << "Error loading config file: "
                  << std::get<std::string>(cfg_or_err) << std::endl;
        return -1;
    }
    auto opts = std::get<options>(cfg_or_err);

    auto logger = std::make_shared<ticketlock::logging::log>(opts.m_loglevel);

    auto ok = true;
    if(opts.m_explore) {
        logger->set_tag(ticketlock::config::explore_mode);
        ok = run_explore(opts, logger) && ok;
    }
    if(opts.m_random) {
        logger->set_tag(ticketlock::config::random_mode);
        ok = run_random(opts, logger) && ok;
    }
    if(opts.m_stress) {
        logger->set_tag(ticketlock::config::stress_mode);
        ok = run_stress(opts, logger) && ok;
    }
    logger->set_tag("");

    if(!ok) {
        std::cerr << "Protocol check failed" << std::endl;
        return 1;
    }

    std::cout << "Protocol check passed" << std::endl;
    return 0;
}
// LCOV_EXCL_STOP
