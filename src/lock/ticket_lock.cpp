// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "ticket_lock.hpp"

#include <cassert>

namespace ticketlock::lock {
    ticket_handle::ticket_handle(ticket_lock* owner,
                                 participant_id participant,
                                 ticket_type ticket)
        : m_owner(owner),
          m_participant(participant),
          m_ticket(ticket) {}

    ticket_handle::~ticket_handle() {
        if(m_owner != nullptr) {
            m_owner->abandoned(*this);
        }
    }

    ticket_handle::ticket_handle(ticket_handle&& other) noexcept
        : m_owner(other.m_owner),
          m_participant(other.m_participant),
          m_ticket(other.m_ticket),
          m_entered(other.m_entered) {
        other.m_owner = nullptr;
    }

    auto ticket_handle::operator=(ticket_handle&& other) noexcept
        -> ticket_handle& {
        if(this != &other) {
            if(m_owner != nullptr) {
                m_owner->abandoned(*this);
            }
            m_owner = other.m_owner;
            m_participant = other.m_participant;
            m_ticket = other.m_ticket;
            m_entered = other.m_entered;
            other.m_owner = nullptr;
        }
        return *this;
    }

    auto ticket_handle::participant() const -> participant_id {
        return m_participant;
    }

    auto ticket_handle::ticket() const -> ticket_type {
        return m_ticket;
    }

    auto ticket_handle::entered() const -> bool {
        return m_entered;
    }

    auto ticket_handle::valid() const -> bool {
        return m_owner != nullptr;
    }

    ticket_lock::ticket_lock(size_t participant_count,
                             std::shared_ptr<logging::log> logger)
        : m_log(std::move(logger)),
          m_machine(m_log),
          m_state(participant_count) {}

    auto ticket_lock::request(participant_id p) -> request_return_type {
        std::unique_lock<std::mutex> l(m_mut);
        auto res = m_machine.request_ticket(m_state, p);
        if(auto* err = std::get_if<protocol::contract_violation>(&res)) {
            return *err;
        }
        return ticket_handle(this, p, std::get<ticket_type>(res));
    }

    auto ticket_lock::try_enter(ticket_handle& handle) -> bool {
        if(!admissible(handle)) {
            return false;
        }
        std::unique_lock<std::mutex> l(m_mut);
        return poll(handle) == admission::admitted;
    }

    auto ticket_lock::wait_turn(ticket_handle& handle) -> bool {
        if(!admissible(handle)) {
            return false;
        }
        std::unique_lock<std::mutex> l(m_mut);
        auto res = poll(handle);
        while(res == admission::waiting) {
            m_cv.wait(l);
            res = poll(handle);
        }
        return res == admission::admitted;
    }

    auto ticket_lock::release(ticket_handle&& handle) -> bool {
        if(handle.m_owner != this) {
            m_log->error("Release with a handle not held from this lock");
            return false;
        }
        if(!handle.m_entered) {
            m_log->error("Participant",
                         handle.m_participant,
                         "released",
                         handle.m_ticket,
                         "before being admitted");
            return false;
        }
        {
            std::unique_lock<std::mutex> l(m_mut);
            auto err = m_machine.exit(m_state, handle.m_participant);
            if(err.has_value()) {
                m_log->error("Release rejected:", *err);
                return false;
            }
        }
        handle.m_owner = nullptr;
        m_cv.notify_all();
        return true;
    }

    auto ticket_lock::acquire(participant_id p) -> request_return_type {
        auto res = request(p);
        if(auto* handle = std::get_if<ticket_handle>(&res)) {
            wait_turn(*handle);
        }
        return res;
    }

    auto ticket_lock::snapshot() const -> protocol::state {
        std::unique_lock<std::mutex> l(m_mut);
        return m_state;
    }

    auto ticket_lock::participant_count() const -> size_t {
        return m_state.m_registry.size();
    }

    auto ticket_lock::admissible(const ticket_handle& handle) const -> bool {
        if(handle.m_owner != this) {
            m_log->error("Admission with a handle not held from this lock");
            return false;
        }
        if(handle.m_entered) {
            m_log->error("Participant",
                         handle.m_participant,
                         "already entered with",
                         handle.m_ticket);
            return false;
        }
        return true;
    }

    auto ticket_lock::poll(ticket_handle& handle) -> admission {
        const auto p = handle.m_participant;
        const auto k = handle.m_ticket;
        if(m_state.m_dispenser.is_current(k)) {
            auto err = m_machine.enter(m_state, p, k);
            if(err.has_value()) {
                m_log->error("Admission rejected:", *err);
                return admission::rejected;
            }
            handle.m_entered = true;
            return admission::admitted;
        }
        auto err = m_machine.wait(m_state, p, k);
        if(err.has_value()) {
            m_log->error("Admission rejected:", *err);
            return admission::rejected;
        }
        return admission::waiting;
    }

    void ticket_lock::abandoned(const ticket_handle& handle) {
        // Nothing reclaims the ticket: every later ticket stays blocked
        // behind it.
        m_log->error("Participant",
                     handle.m_participant,
                     "dropped",
                     handle.m_ticket,
                     handle.m_entered ? "inside the protected region"
                                      : "before being admitted");
    }

    guard::guard(ticket_lock& lk, participant_id p) : m_lock(lk) {
        auto res = m_lock.acquire(p);
        if(auto* err = std::get_if<protocol::contract_violation>(&res)) {
            m_error = *err;
            return;
        }
        m_handle.emplace(std::get<ticket_handle>(std::move(res)));
    }

    guard::~guard() {
        if(owns_lock()) {
            m_lock.release(std::move(m_handle.value()));
        }
    }

    auto guard::owns_lock() const -> bool {
        return m_handle.has_value() && m_handle->entered();
    }

    auto guard::error() const
        -> const std::optional<protocol::contract_violation>& {
        return m_error;
    }

    auto guard::ticket() const -> ticket_type {
        assert(owns_lock());
        return m_handle->ticket();
    }
}
