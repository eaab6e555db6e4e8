// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "invariants.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <sstream>

namespace ticketlock::verifier {
    namespace {
        template<typename... Targs>
        void report(std::vector<violation>& out,
                    invariant inv,
                    Targs&&... args) {
            std::stringstream ss;
            ((ss << args), ...);
            out.push_back(violation{inv, ss.str()});
        }

        auto is_valid_phase(phase ph) -> bool {
            return ph == phase::idle || ph == phase::awaiting
                || ph == phase::critical;
        }

        // has_ticket(p, k) as a relation: one entry per (participant,
        // ticket) pair the registry records.
        auto ownership(const registry& reg)
            -> std::multimap<participant_id, ticket_type> {
            auto ret = std::multimap<participant_id, ticket_type>();
            for(participant_id p{0}; p < reg.size(); p++) {
                ret.emplace(p, reg.ticket_of(p));
            }
            return ret;
        }

        void check_partition(const registry& reg, std::vector<violation>& out) {
            for(participant_id p{0}; p < reg.size(); p++) {
                auto ph = reg.phase_of(p);
                if(!is_valid_phase(ph)) {
                    report(out,
                           invariant::phase_partition,
                           "p",
                           p,
                           " has no valid phase (",
                           static_cast<unsigned>(ph),
                           ")");
                }
            }
        }

        void check_ownership(const registry& reg,
                             std::vector<violation>& out) {
            const auto owned = ownership(reg);
            for(participant_id p{0}; p < reg.size(); p++) {
                auto [first, last] = owned.equal_range(p);
                auto tickets = std::set<ticket_type>();
                for(auto it = first; it != last; ++it) {
                    tickets.insert(it->second);
                }
                if(tickets.size() != 1) {
                    report(out,
                           invariant::single_ownership,
                           "p",
                           p,
                           " holds ",
                           tickets.size(),
                           " tickets");
                }
            }
        }

        void check_exclusion(const registry& reg,
                             std::vector<violation>& out) {
            auto critical = std::vector<participant_id>();
            for(participant_id p{0}; p < reg.size(); p++) {
                if(reg.phase_of(p) == phase::critical) {
                    critical.push_back(p);
                }
            }
            for(size_t i{1}; i < critical.size(); i++) {
                report(out,
                       invariant::mutual_exclusion,
                       "p",
                       critical[0],
                       " and p",
                       critical[i],
                       " are both critical");
            }
        }

        void check_unique(const registry& reg, std::vector<violation>& out) {
            auto holders = std::map<ticket_type, participant_id>();
            for(participant_id p{0}; p < reg.size(); p++) {
                if(reg.phase_of(p) == phase::idle) {
                    continue;
                }
                auto t = reg.ticket_of(p);
                auto [it, inserted] = holders.emplace(t, p);
                if(!inserted) {
                    report(out,
                           invariant::unique_tickets,
                           "p",
                           it->second,
                           " and p",
                           p,
                           " both hold ",
                           t);
                }
            }
        }

        void check_window(const protocol::state& s,
                          std::vector<violation>& out) {
            const auto& reg = s.m_registry;
            const auto serving = s.m_dispenser.serving();
            const auto next = s.m_dispenser.next_ticket();
            for(participant_id p{0}; p < reg.size(); p++) {
                const auto& part = reg.at(p);
                switch(part.m_phase) {
                    case phase::idle:
                        if(!part.m_ticket.is_zero()) {
                            report(out,
                                   invariant::idle_holds_zero,
                                   "idle p",
                                   p,
                                   " holds ",
                                   part.m_ticket);
                        }
                        break;
                    case phase::critical:
                        if(part.m_ticket != serving) {
                            report(out,
                                   invariant::critical_holds_serving,
                                   "critical p",
                                   p,
                                   " holds ",
                                   part.m_ticket,
                                   " while serving ",
                                   serving);
                        }
                        [[fallthrough]];
                    case phase::awaiting:
                        if(part.m_ticket < serving || !(part.m_ticket < next)) {
                            report(out,
                                   invariant::held_in_window,
                                   "p",
                                   p,
                                   " holds ",
                                   part.m_ticket,
                                   " outside [",
                                   serving,
                                   ", ",
                                   next,
                                   ")");
                        }
                        break;
                }
            }

            if(serving <= next) {
                const auto active = reg.size() - reg.count(phase::idle);
                const auto outstanding = s.m_dispenser.outstanding();
                if(active != outstanding) {
                    report(out,
                           invariant::window_fully_owned,
                           active,
                           " active participants for ",
                           outstanding,
                           " outstanding tickets");
                }
            }
        }

        // Each counter either stays or moves by exactly one successor.
        auto steps_at_most_once(ticket_type before, ticket_type after)
            -> bool {
            return after == before
                || (before.has_successor() && after == before.successor());
        }
    }

    auto to_string(invariant inv) -> std::string {
        switch(inv) {
            case invariant::phase_partition:
                return "phase_partition";
            case invariant::single_ownership:
                return "single_ownership";
            case invariant::mutual_exclusion:
                return "mutual_exclusion";
            case invariant::serving_bound:
                return "serving_bound";
            case invariant::unique_tickets:
                return "unique_tickets";
            case invariant::idle_holds_zero:
                return "idle_holds_zero";
            case invariant::held_in_window:
                return "held_in_window";
            case invariant::critical_holds_serving:
                return "critical_holds_serving";
            case invariant::window_fully_owned:
                return "window_fully_owned";
            case invariant::issuance_monotonicity:
                return "issuance_monotonicity";
            case invariant::admission_correctness:
                return "admission_correctness";
            case invariant::counter_monotonicity:
                return "counter_monotonicity";
            case invariant::lifecycle:
                return "lifecycle";
            case invariant::frame:
                return "frame";
            case invariant::round_trip:
                return "round_trip";
        }
        return "unknown";
    }

    auto to_string(const violation& v) -> std::string {
        return to_string(v.m_invariant) + ": " + v.m_detail;
    }

    auto operator<<(std::ostream& os, const violation& v) -> std::ostream& {
        return os << to_string(v);
    }

    auto check_state(const protocol::state& s) -> std::vector<violation> {
        auto ret = std::vector<violation>();
        const auto& reg = s.m_registry;

        check_partition(reg, ret);
        check_ownership(reg, ret);
        check_exclusion(reg, ret);

        if(!(s.m_dispenser.serving() <= s.m_dispenser.next_ticket())) {
            report(ret,
                   invariant::serving_bound,
                   "serving ",
                   s.m_dispenser.serving(),
                   " exceeds next ",
                   s.m_dispenser.next_ticket());
        }

        check_unique(reg, ret);
        check_window(s, ret);

        return ret;
    }

    auto check_transition(const protocol::state& before,
                          const protocol::action& act,
                          const protocol::state& after)
        -> std::vector<violation> {
        auto ret = std::vector<violation>();
        const auto kind = protocol::kind_of(act);
        const auto p = protocol::participant_of(act);
        const auto& reg_before = before.m_registry;
        const auto& reg_after = after.m_registry;

        if(reg_before.size() != reg_after.size() || !reg_before.contains(p)) {
            report(ret,
                   invariant::frame,
                   "participant set changed or p",
                   p,
                   " unknown");
            return ret;
        }

        for(participant_id q{0}; q < reg_before.size(); q++) {
            if(q != p && reg_before.at(q) != reg_after.at(q)) {
                report(ret,
                       invariant::frame,
                       protocol::to_string(act),
                       " changed p",
                       q);
            }
        }

        const auto next_before = before.m_dispenser.next_ticket();
        const auto next_after = after.m_dispenser.next_ticket();
        const auto serving_before = before.m_dispenser.serving();
        const auto serving_after = after.m_dispenser.serving();

        const bool next_moves = kind == protocol::action_kind::request;
        const bool serving_moves = kind == protocol::action_kind::exit;
        if(!steps_at_most_once(next_before, next_after)
           || (!next_moves && next_after != next_before)) {
            report(ret,
                   invariant::counter_monotonicity,
                   protocol::to_string(act),
                   " moved next from ",
                   next_before,
                   " to ",
                   next_after);
        }
        if(!steps_at_most_once(serving_before, serving_after)
           || (!serving_moves && serving_after != serving_before)) {
            report(ret,
                   invariant::counter_monotonicity,
                   protocol::to_string(act),
                   " moved serving from ",
                   serving_before,
                   " to ",
                   serving_after);
        }

        const auto& part_before = reg_before.at(p);
        const auto& part_after = reg_after.at(p);

        auto expect_phases = [&](phase from, phase to) {
            if(part_before.m_phase != from || part_after.m_phase != to) {
                report(ret,
                       invariant::lifecycle,
                       protocol::to_string(act),
                       " took p",
                       p,
                       " from ",
                       part_before.m_phase,
                       " to ",
                       part_after.m_phase);
            }
        };

        switch(kind) {
            case protocol::action_kind::request: {
                expect_phases(phase::idle, phase::awaiting);
                const auto issued = part_after.m_ticket;
                if(issued != next_before || !next_before.has_successor()
                   || next_after != next_before.successor()) {
                    report(ret,
                           invariant::issuance_monotonicity,
                           "p",
                           p,
                           " drew ",
                           issued,
                           " with next moving from ",
                           next_before,
                           " to ",
                           next_after);
                }
                for(participant_id q{0}; q < reg_before.size(); q++) {
                    const auto& other = reg_before.at(q);
                    if(other.m_phase != phase::idle
                       && !(other.m_ticket < issued)) {
                        report(ret,
                               invariant::issuance_monotonicity,
                               "p",
                               p,
                               " drew ",
                               issued,
                               " not above earlier ticket ",
                               other.m_ticket,
                               " of p",
                               q);
                    }
                }
                break;
            }
            case protocol::action_kind::wait:
                expect_phases(phase::awaiting, phase::awaiting);
                if(part_before != part_after) {
                    report(ret,
                           invariant::lifecycle,
                           "wait changed the ticket of p",
                           p);
                }
                break;
            case protocol::action_kind::enter:
                expect_phases(phase::awaiting, phase::critical);
                if(part_after.m_ticket != part_before.m_ticket) {
                    report(ret,
                           invariant::lifecycle,
                           "enter changed the ticket of p",
                           p);
                }
                break;
            case protocol::action_kind::exit:
                expect_phases(phase::critical, phase::idle);
                break;
        }

        for(participant_id q{0}; q < reg_before.size(); q++) {
            const bool became_critical
                = reg_before.phase_of(q) != phase::critical
               && reg_after.phase_of(q) == phase::critical;
            if(!became_critical) {
                continue;
            }
            if(q != p || kind != protocol::action_kind::enter
               || reg_before.ticket_of(q) != serving_before) {
                report(ret,
                       invariant::admission_correctness,
                       "p",
                       q,
                       " became critical through ",
                       protocol::to_string(act),
                       " holding ",
                       reg_before.ticket_of(q),
                       " while serving ",
                       serving_before);
            }
        }

        return ret;
    }

    auto check_round_trip(const protocol::state& before,
                          participant_id p,
                          const protocol::state& after)
        -> std::vector<violation> {
        auto ret = std::vector<violation>();
        if(!after.m_registry.contains(p)
           || after.m_registry.phase_of(p) != phase::idle) {
            report(ret,
                   invariant::round_trip,
                   "p",
                   p,
                   " is not idle after its cycle");
        }
        if(before.m_dispenser.outstanding()
           != after.m_dispenser.outstanding()) {
            report(ret,
                   invariant::round_trip,
                   "outstanding tickets moved from ",
                   before.m_dispenser.outstanding(),
                   " to ",
                   after.m_dispenser.outstanding());
        }
        return ret;
    }

    auto violates(const std::vector<violation>& violations, invariant inv)
        -> bool {
        return std::any_of(violations.begin(),
                           violations.end(),
                           [&](const violation& v) {
                               return v.m_invariant == inv;
                           });
    }
}
