// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "checker/explorer.hpp"
#include "lock/ticket_lock.hpp"
#include "protocol/state_machine.hpp"
#include "verifier/invariants.hpp"

#include <benchmark/benchmark.h>

class protocol_bench : public ::benchmark::Fixture {
  protected:
    void SetUp(const ::benchmark::State&) override {
        m_state = ticketlock::protocol::state(m_participants);
    }

    static constexpr size_t m_participants{8};

    std::shared_ptr<ticketlock::logging::log> m_log{
        std::make_shared<ticketlock::logging::log>(
            ticketlock::logging::log_level::error)};
    ticketlock::protocol::state_machine m_machine{m_log};
    ticketlock::protocol::state m_state{m_participants};
};

// one participant through request, enter and exit
BENCHMARK_F(protocol_bench, full_cycle)(benchmark::State& state) {
    for(auto _ : state) {
        auto res = m_machine.request_ticket(m_state, 0);
        auto ticket = std::get<ticketlock::ticket_type>(res);
        benchmark::DoNotOptimize(m_machine.enter(m_state, 0, ticket));
        benchmark::DoNotOptimize(m_machine.exit(m_state, 0));
    }
}

// invariant battery on a fully contended state
BENCHMARK_F(protocol_bench, check_state)(benchmark::State& state) {
    for(ticketlock::participant_id p{0}; p < m_participants; p++) {
        auto res = m_machine.request_ticket(m_state, p);
        benchmark::DoNotOptimize(res);
    }
    for(auto _ : state) {
        benchmark::DoNotOptimize(ticketlock::verifier::check_state(m_state));
    }
}

// uncontended acquire and release through the guard
BENCHMARK_F(protocol_bench, guard_uncontended)(benchmark::State& state) {
    auto lk = ticketlock::lock::ticket_lock(1, m_log);
    for(auto _ : state) {
        auto g = ticketlock::lock::guard(lk, 0);
        benchmark::DoNotOptimize(g.owns_lock());
    }
}

// exhaustive exploration of three participants
BENCHMARK_F(protocol_bench, explore)(benchmark::State& state) {
    auto params = ticketlock::checker::explorer::parameters{};
    params.m_participant_count = 3;
    params.m_ticket_bound = 5;
    params.m_symmetry_reduction = true;
    for(auto _ : state) {
        auto exp = ticketlock::checker::explorer(m_log, params);
        benchmark::DoNotOptimize(exp.run());
    }
}
