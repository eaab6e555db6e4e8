// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_TESTS_UTIL_H_
#define TICKETLOCK_TESTS_UTIL_H_

#include "protocol/state.hpp"
#include "registry/registry.hpp"
#include "ticket/ticket.hpp"
#include "util/common/logging.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace ticketlock::test {
    /// Returns a logger for tests. Rejected actions log at warn level, so
    /// the default keeps expected rejections out of the test output.
    auto make_logger(logging::log_level level = logging::log_level::error)
        -> std::shared_ptr<logging::log>;

    /// Shorthand for a ticket with the given value.
    auto tk(uint64_t value) -> ticket_type;

    auto idle() -> participant_state;
    auto awaiting(uint64_t ticket) -> participant_state;
    auto critical(uint64_t ticket) -> participant_state;

    /// Builds a state directly from counters and per-participant records,
    /// bypassing the state machine. Used to construct corrupted states.
    auto make_state(uint64_t serving,
                    uint64_t next_ticket,
                    const std::vector<participant_state>& parts)
        -> protocol::state;
}

#endif // TICKETLOCK_TESTS_UTIL_H_
