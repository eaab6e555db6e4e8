// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "registry.hpp"

#include <algorithm>
#include <cassert>

namespace ticketlock {
    auto to_string(phase p) -> std::string {
        switch(p) {
            case phase::idle:
                return "idle";
            case phase::awaiting:
                return "awaiting";
            case phase::critical:
                return "critical";
        }
        return "invalid";
    }

    auto operator<<(std::ostream& os, phase p) -> std::ostream& {
        return os << to_string(p);
    }

    auto participant_state::operator==(const participant_state& rhs) const
        -> bool {
        return m_phase == rhs.m_phase && m_ticket == rhs.m_ticket;
    }

    auto participant_state::operator!=(const participant_state& rhs) const
        -> bool {
        return !(*this == rhs);
    }

    auto participant_state::operator<(const participant_state& rhs) const
        -> bool {
        if(m_phase != rhs.m_phase) {
            return m_phase < rhs.m_phase;
        }
        return m_ticket < rhs.m_ticket;
    }

    registry::registry(size_t participant_count)
        : m_participants(participant_count) {}

    auto registry::size() const -> size_t {
        return m_participants.size();
    }

    auto registry::contains(participant_id p) const -> bool {
        return p < m_participants.size();
    }

    auto registry::at(participant_id p) const -> const participant_state& {
        assert(contains(p));
        return m_participants[p];
    }

    auto registry::phase_of(participant_id p) const -> phase {
        return at(p).m_phase;
    }

    auto registry::ticket_of(participant_id p) const -> ticket_type {
        return at(p).m_ticket;
    }

    void registry::set_awaiting(participant_id p, ticket_type ticket) {
        assert(contains(p));
        m_participants[p] = participant_state{phase::awaiting, ticket};
    }

    void registry::set_critical(participant_id p) {
        assert(contains(p));
        m_participants[p].m_phase = phase::critical;
    }

    void registry::set_idle(participant_id p) {
        assert(contains(p));
        m_participants[p] = participant_state{};
    }

    auto registry::participants() const
        -> const std::vector<participant_state>& {
        return m_participants;
    }

    auto registry::count(phase ph) const -> size_t {
        return static_cast<size_t>(
            std::count_if(m_participants.begin(),
                          m_participants.end(),
                          [&](const participant_state& s) {
                              return s.m_phase == ph;
                          }));
    }

    void registry::canonicalize() {
        std::sort(m_participants.begin(), m_participants.end());
    }

    auto registry::operator==(const registry& rhs) const -> bool {
        return m_participants == rhs.m_participants;
    }

    auto registry::operator!=(const registry& rhs) const -> bool {
        return !(*this == rhs);
    }
}
