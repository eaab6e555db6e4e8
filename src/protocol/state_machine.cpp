// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state_machine.hpp"

#include "util/common/variant_overloaded.hpp"

namespace ticketlock::protocol {
    state_machine::state_machine(std::shared_ptr<logging::log> logger)
        : m_log(std::move(logger)) {}

    auto state_machine::request_ticket(state& s, participant_id p)
        -> request_return_type {
        if(!s.m_registry.contains(p)) {
            return reject({action_kind::request,
                           p,
                           violation_reason::unknown_participant});
        }
        if(s.m_registry.phase_of(p) != phase::idle) {
            return reject(
                {action_kind::request, p, violation_reason::not_idle});
        }

        auto ticket = s.m_dispenser.issue();
        if(!ticket.has_value()) {
            m_log->fatal("Ticket domain exhausted at",
                         s.m_dispenser.next_ticket(),
                         "while issuing to participant",
                         p);
        }
        s.m_registry.set_awaiting(p, ticket.value());
        m_log->trace("request: participant",
                     p,
                     "holds",
                     ticket.value(),
                     "next",
                     s.m_dispenser.next_ticket());
        return ticket.value();
    }

    auto state_machine::wait(const state& s,
                             participant_id p,
                             ticket_type ticket)
        -> std::optional<contract_violation> {
        if(auto err = check_awaiting(s, action_kind::wait, p, ticket)) {
            return reject(*err);
        }
        if(s.m_dispenser.is_current(ticket)) {
            return reject(
                {action_kind::wait, p, violation_reason::ticket_serving});
        }
        m_log->trace("wait: participant",
                     p,
                     "holds",
                     ticket,
                     "serving",
                     s.m_dispenser.serving());
        return std::nullopt;
    }

    auto state_machine::enter(state& s, participant_id p, ticket_type ticket)
        -> std::optional<contract_violation> {
        if(auto err = check_awaiting(s, action_kind::enter, p, ticket)) {
            return reject(*err);
        }
        if(!s.m_dispenser.is_current(ticket)) {
            return reject({action_kind::enter,
                           p,
                           violation_reason::ticket_not_serving});
        }
        s.m_registry.set_critical(p);
        m_log->trace("enter: participant", p, "admitted with", ticket);
        return std::nullopt;
    }

    auto state_machine::exit(state& s, participant_id p)
        -> std::optional<contract_violation> {
        if(!s.m_registry.contains(p)) {
            return reject(
                {action_kind::exit, p, violation_reason::unknown_participant});
        }
        if(s.m_registry.phase_of(p) != phase::critical) {
            return reject(
                {action_kind::exit, p, violation_reason::not_critical});
        }
        if(!s.m_dispenser.advance_serving()) {
            m_log->fatal("Ticket domain exhausted at",
                         s.m_dispenser.serving(),
                         "while releasing participant",
                         p);
        }
        s.m_registry.set_idle(p);
        m_log->trace("exit: participant",
                     p,
                     "released, serving",
                     s.m_dispenser.serving());
        return std::nullopt;
    }

    auto state_machine::apply(state& s, const action& act)
        -> std::optional<contract_violation> {
        return std::visit(
            overloaded{[&](const request_action& a)
                           -> std::optional<contract_violation> {
                           auto res = request_ticket(s, a.m_participant);
                           if(auto* err
                              = std::get_if<contract_violation>(&res)) {
                               return *err;
                           }
                           return std::nullopt;
                       },
                       [&](const wait_action& a) {
                           return wait(s, a.m_participant, a.m_ticket);
                       },
                       [&](const enter_action& a) {
                           return enter(s, a.m_participant, a.m_ticket);
                       },
                       [&](const exit_action& a) {
                           return exit(s, a.m_participant);
                       }},
            act);
    }

    auto state_machine::enabled_action(const state& s, participant_id p)
        -> std::optional<action> {
        if(!s.m_registry.contains(p)) {
            return std::nullopt;
        }
        const auto& part = s.m_registry.at(p);
        switch(part.m_phase) {
            case phase::idle:
                return request_action{p};
            case phase::awaiting:
                if(s.m_dispenser.is_current(part.m_ticket)) {
                    return enter_action{p, part.m_ticket};
                }
                return wait_action{p, part.m_ticket};
            case phase::critical:
                return exit_action{p};
        }
        return std::nullopt;
    }

    auto state_machine::is_enabled(const state& s, const action& act) -> bool {
        auto enabled = enabled_action(s, participant_of(act));
        return enabled.has_value() && enabled.value() == act;
    }

    auto state_machine::check_awaiting(const state& s,
                                       action_kind kind,
                                       participant_id p,
                                       ticket_type ticket)
        -> std::optional<contract_violation> {
        if(!s.m_registry.contains(p)) {
            return contract_violation{kind,
                                      p,
                                      violation_reason::unknown_participant};
        }
        const auto& part = s.m_registry.at(p);
        if(part.m_phase != phase::awaiting) {
            return contract_violation{kind, p, violation_reason::not_awaiting};
        }
        if(part.m_ticket != ticket) {
            return contract_violation{kind,
                                      p,
                                      violation_reason::ticket_mismatch};
        }
        return std::nullopt;
    }

    auto state_machine::reject(contract_violation err) -> contract_violation {
        m_log->warn(err);
        return err;
    }
}
