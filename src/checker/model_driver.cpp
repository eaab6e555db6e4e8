// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "model_driver.hpp"

namespace ticketlock::checker {
    model_driver::model_driver(size_t participant_count,
                               std::shared_ptr<logging::log> logger,
                               bool record_trace)
        : m_log(std::move(logger)),
          m_machine(m_log),
          m_state(participant_count),
          m_record_trace(record_trace),
          m_cycles(participant_count) {
        fail(verifier::check_state(m_state));
    }

    auto model_driver::step(participant_id p)
        -> std::optional<protocol::action> {
        if(!ok()) {
            return std::nullopt;
        }
        auto act = protocol::state_machine::enabled_action(m_state, p);
        if(!act.has_value()) {
            return std::nullopt;
        }
        auto before = m_state;
        auto err = m_machine.apply(m_state, act.value());
        if(err.has_value()) {
            m_log->error("Enabled action",
                         act.value(),
                         "was rejected:",
                         err.value());
            fail({verifier::violation{verifier::invariant::lifecycle,
                                      protocol::to_string(err.value())}});
            return std::nullopt;
        }
        verify(before, act.value());
        return act;
    }

    auto model_driver::try_apply(const protocol::action& act)
        -> std::optional<protocol::contract_violation> {
        auto before = m_state;
        auto err = m_machine.apply(m_state, act);
        if(err.has_value()) {
            if(m_state != before) {
                fail({verifier::violation{
                    verifier::invariant::frame,
                    "rejected " + protocol::to_string(act)
                        + " changed the state"}});
            }
            return err;
        }
        verify(before, act);
        return std::nullopt;
    }

    auto model_driver::participant_count() const -> size_t {
        return m_state.m_registry.size();
    }

    auto model_driver::get_state() const -> const protocol::state& {
        return m_state;
    }

    auto model_driver::violations() const
        -> const std::vector<verifier::violation>& {
        return m_violations;
    }

    auto model_driver::ok() const -> bool {
        return m_violations.empty();
    }

    auto model_driver::get_trace() const -> const trace& {
        return m_trace;
    }

    auto model_driver::step_count() const -> size_t {
        return m_steps;
    }

    void model_driver::verify(const protocol::state& before,
                              const protocol::action& act) {
        m_steps++;
        if(m_record_trace) {
            m_trace.push(trace_step{before, act, m_state});
        }

        auto found = verifier::check_state(m_state);
        auto transition = verifier::check_transition(before, act, m_state);
        found.insert(found.end(), transition.begin(), transition.end());

        const auto p = protocol::participant_of(act);
        if(!m_last_actor.has_value() || m_last_actor.value() != p) {
            m_last_actor = p;
            m_run_start = m_steps - 1;
        }
        switch(protocol::kind_of(act)) {
            case protocol::action_kind::request:
                m_cycles[p] = cycle_start{before, m_steps - 1};
                break;
            case protocol::action_kind::exit:
                if(m_cycles[p].has_value()) {
                    const auto& start = m_cycles[p].value();
                    // Only cycles no other participant interrupted keep the
                    // outstanding count fixed.
                    if(m_run_start <= start.m_step) {
                        auto rt = verifier::check_round_trip(start.m_state,
                                                             p,
                                                             m_state);
                        found.insert(found.end(), rt.begin(), rt.end());
                    }
                    m_cycles[p].reset();
                }
                break;
            default:
                break;
        }

        fail(std::move(found));
    }

    void model_driver::fail(std::vector<verifier::violation> found) {
        for(auto& v : found) {
            m_log->error("Invariant violated:", v);
            m_violations.push_back(std::move(v));
        }
    }
}
