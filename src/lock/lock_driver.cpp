// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "lock_driver.hpp"

#include <algorithm>

namespace ticketlock::lock {
    lock_driver::lock_driver(ticket_lock& lk,
                             std::shared_ptr<logging::log> logger)
        : m_lock(lk),
          m_log(std::move(logger)),
          m_handles(lk.participant_count()) {}

    lock_driver::~lock_driver() {
        // Run every outstanding ticket to completion in ticket order so the
        // lock is left with all participants idle. Tickets held outside this
        // driver are waited out.
        auto pending = std::vector<ticket_handle*>();
        for(auto& h : m_handles) {
            if(h.has_value()) {
                pending.push_back(&h.value());
            }
        }
        std::sort(pending.begin(),
                  pending.end(),
                  [](const ticket_handle* a, const ticket_handle* b) {
                      return a->ticket() < b->ticket();
                  });
        for(auto* h : pending) {
            if(h->entered() || m_lock.wait_turn(*h)) {
                m_lock.release(std::move(*h));
            }
        }
    }

    auto lock_driver::step(participant_id p)
        -> std::optional<protocol::action> {
        if(p >= m_handles.size() || !ok()) {
            return std::nullopt;
        }

        auto& slot = m_handles[p];
        auto ret = std::optional<protocol::action>();
        if(!slot.has_value()) {
            auto res = m_lock.request(p);
            if(auto* err = std::get_if<protocol::contract_violation>(&res)) {
                m_log->error("Request rejected:", *err);
                return std::nullopt;
            }
            slot.emplace(std::get<ticket_handle>(std::move(res)));
            ret = protocol::request_action{p};
        } else if(!slot->entered()) {
            const auto ticket = slot->ticket();
            if(m_lock.try_enter(slot.value())) {
                ret = protocol::enter_action{p, ticket};
            } else {
                ret = protocol::wait_action{p, ticket};
            }
        } else {
            if(!m_lock.release(std::move(slot.value()))) {
                return std::nullopt;
            }
            slot.reset();
            ret = protocol::exit_action{p};
        }

        verify();
        return ret;
    }

    auto lock_driver::participant_count() const -> size_t {
        return m_handles.size();
    }

    auto lock_driver::ok() const -> bool {
        std::unique_lock<std::mutex> l(m_violations_mut);
        return m_violations.empty();
    }

    auto lock_driver::violations() const -> std::vector<verifier::violation> {
        std::unique_lock<std::mutex> l(m_violations_mut);
        return m_violations;
    }

    void lock_driver::verify() {
        auto found = verifier::check_state(m_lock.snapshot());
        if(found.empty()) {
            return;
        }
        std::unique_lock<std::mutex> l(m_violations_mut);
        for(auto& v : found) {
            m_log->error("Invariant violated:", v);
            m_violations.push_back(std::move(v));
        }
    }
}
