// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "error.hpp"

namespace ticketlock::protocol {
    auto contract_violation::operator==(const contract_violation& rhs) const
        -> bool {
        return m_action == rhs.m_action && m_participant == rhs.m_participant
            && m_reason == rhs.m_reason;
    }

    auto to_string(violation_reason reason) -> std::string {
        switch(reason) {
            case violation_reason::unknown_participant:
                return "unknown_participant";
            case violation_reason::not_idle:
                return "not_idle";
            case violation_reason::not_awaiting:
                return "not_awaiting";
            case violation_reason::not_critical:
                return "not_critical";
            case violation_reason::ticket_mismatch:
                return "ticket_mismatch";
            case violation_reason::ticket_not_serving:
                return "ticket_not_serving";
            case violation_reason::ticket_serving:
                return "ticket_serving";
        }
        return "unknown";
    }

    auto to_string(const contract_violation& err) -> std::string {
        return to_string(err.m_action) + "(p"
             + std::to_string(err.m_participant)
             + ") violated contract: " + to_string(err.m_reason);
    }

    auto operator<<(std::ostream& os, const contract_violation& err)
        -> std::ostream& {
        return os << to_string(err);
    }
}
