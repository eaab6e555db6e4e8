// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "explorer.hpp"

#include <algorithm>
#include <queue>
#include <unordered_map>

namespace ticketlock::checker {
    auto explorer::result::ok() const -> bool {
        return m_violations.empty();
    }

    explorer::explorer(std::shared_ptr<logging::log> logger,
                       parameters params,
                       state_check_type check)
        : m_log(std::move(logger)),
          m_machine(m_log),
          m_params(params),
          m_check(std::move(check)) {}

    auto explorer::run() -> result {
        return run(protocol::state(m_params.m_participant_count));
    }

    auto explorer::run(const protocol::state& initial) -> result {
        auto ret = result{};
        auto nodes = std::vector<node>();
        auto index = std::unordered_map<protocol::state,
                                        size_t,
                                        protocol::state_hasher>();
        auto frontier = std::queue<size_t>();

        auto root = normalize(initial);
        ret.m_violations = m_check(root);
        if(!ret.m_violations.empty()) {
            m_log->error("Initial state violates invariants:", root);
            return ret;
        }
        nodes.push_back(node{root, std::nullopt, std::nullopt, 0});
        index.emplace(root, 0);
        frontier.push(0);

        while(!frontier.empty()) {
            const auto idx = frontier.front();
            frontier.pop();
            // nodes may reallocate below, so work on a copy.
            const auto current = nodes[idx].m_state;
            const auto depth = nodes[idx].m_depth;

            for(participant_id p{0}; p < current.m_registry.size(); p++) {
                auto act = protocol::state_machine::enabled_action(current, p);
                if(!act.has_value() || !explorable(current, act.value())) {
                    continue;
                }

                auto next = current;
                ret.m_transitions++;
                auto found = std::vector<verifier::violation>();
                if(auto err = m_machine.apply(next, act.value())) {
                    found.push_back(verifier::violation{
                        verifier::invariant::lifecycle,
                        "enabled action rejected: "
                            + protocol::to_string(err.value())});
                } else {
                    found = verifier::check_transition(current,
                                                       act.value(),
                                                       next);
                    auto state_found = m_check(next);
                    found.insert(found.end(),
                                 state_found.begin(),
                                 state_found.end());
                }

                if(!found.empty()) {
                    ret.m_violations = std::move(found);
                    ret.m_counterexample = path_to(nodes, idx);
                    ret.m_counterexample.push(
                        trace_step{current, act.value(), next});
                    ret.m_states = nodes.size();
                    m_log->error("Violation after",
                                 ret.m_counterexample.size(),
                                 "steps,",
                                 act.value(),
                                 "->",
                                 next);
                    return ret;
                }

                auto key = normalize(std::move(next));
                if(index.find(key) != index.end()) {
                    continue;
                }

                if(m_params.m_state_limit != 0
                   && nodes.size() >= m_params.m_state_limit) {
                    ret.m_complete = false;
                    continue;
                }

                nodes.push_back(node{key, idx, act, depth + 1});
                index.emplace(std::move(key), nodes.size() - 1);
                frontier.push(nodes.size() - 1);
                ret.m_depth = std::max(ret.m_depth, depth + 1);
            }
        }

        ret.m_states = nodes.size();
        if(!ret.m_complete) {
            m_log->warn("State limit",
                        m_params.m_state_limit,
                        "reached, exploration incomplete");
        }
        m_log->info("Explored",
                    ret.m_states,
                    "states,",
                    ret.m_transitions,
                    "transitions, depth",
                    ret.m_depth);
        return ret;
    }

    auto explorer::explorable(const protocol::state& s,
                              const protocol::action& act) const -> bool {
        if(protocol::kind_of(act) != protocol::action_kind::request) {
            return true;
        }
        return s.m_dispenser.next_ticket().value() < m_params.m_ticket_bound;
    }

    auto explorer::normalize(protocol::state s) const -> protocol::state {
        if(m_params.m_symmetry_reduction) {
            s.m_registry.canonicalize();
        }
        return s;
    }

    auto explorer::path_to(const std::vector<node>& nodes, size_t idx)
        -> trace {
        auto chain = std::vector<size_t>();
        for(auto cur = std::optional<size_t>(idx); cur.has_value();
            cur = nodes[cur.value()].m_parent) {
            chain.push_back(cur.value());
        }
        std::reverse(chain.begin(), chain.end());

        auto ret = trace();
        for(size_t i{1}; i < chain.size(); i++) {
            const auto& child = nodes[chain[i]];
            ret.push(trace_step{nodes[chain[i - 1]].m_state,
                                child.m_via.value(),
                                child.m_state});
        }
        return ret;
    }
}
