// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

namespace ticketlock::test {
    auto make_logger(logging::log_level level)
        -> std::shared_ptr<logging::log> {
        return std::make_shared<logging::log>(level);
    }

    auto tk(uint64_t value) -> ticket_type {
        return ticket_type(value);
    }

    auto idle() -> participant_state {
        return participant_state{};
    }

    auto awaiting(uint64_t ticket) -> participant_state {
        return participant_state{phase::awaiting, tk(ticket)};
    }

    auto critical(uint64_t ticket) -> participant_state {
        return participant_state{phase::critical, tk(ticket)};
    }

    auto make_state(uint64_t serving,
                    uint64_t next_ticket,
                    const std::vector<participant_state>& parts)
        -> protocol::state {
        auto reg = registry(parts.size());
        for(participant_id p{0}; p < parts.size(); p++) {
            switch(parts[p].m_phase) {
                case phase::idle:
                    break;
                case phase::awaiting:
                    reg.set_awaiting(p, parts[p].m_ticket);
                    break;
                case phase::critical:
                    reg.set_awaiting(p, parts[p].m_ticket);
                    reg.set_critical(p);
                    break;
            }
        }
        return protocol::state(dispenser(tk(serving), tk(next_ticket)),
                               std::move(reg));
    }
}
