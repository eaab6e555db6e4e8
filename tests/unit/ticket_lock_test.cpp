// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "lock/ticket_lock.hpp"
#include "verifier/invariants.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace ticketlock;
using lock::ticket_handle;
using lock::ticket_lock;
using protocol::violation_reason;
using test::tk;

class ticket_lock_test : public ::testing::Test {
  protected:
    auto request(participant_id p) -> ticket_handle {
        auto res = m_lock.request(p);
        EXPECT_TRUE(std::holds_alternative<ticket_handle>(res));
        return std::get<ticket_handle>(std::move(res));
    }

    ticket_lock m_lock{3, test::make_logger()};
};

TEST_F(ticket_lock_test, request_enter_release) {
    auto h = request(0);
    ASSERT_TRUE(h.valid());
    ASSERT_EQ(h.participant(), 0U);
    ASSERT_EQ(h.ticket(), tk(0));
    ASSERT_FALSE(h.entered());

    ASSERT_TRUE(m_lock.try_enter(h));
    ASSERT_TRUE(h.entered());
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.phase_of(0), phase::critical);
    ASSERT_TRUE(verifier::check_state(snap).empty());

    ASSERT_TRUE(m_lock.release(std::move(h)));
    snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.phase_of(0), phase::idle);
    ASSERT_EQ(snap.m_dispenser.serving(), tk(1));
    ASSERT_EQ(snap.m_dispenser.next_ticket(), tk(1));
}

TEST_F(ticket_lock_test, later_ticket_waits_for_release) {
    auto first = request(2);
    ASSERT_TRUE(m_lock.try_enter(first));
    auto second = request(0);
    ASSERT_EQ(second.ticket(), tk(1));
    ASSERT_FALSE(m_lock.try_enter(second));
    ASSERT_FALSE(m_lock.try_enter(second));
    ASSERT_EQ(m_lock.snapshot().m_registry.phase_of(0), phase::awaiting);

    m_lock.release(std::move(first));
    ASSERT_TRUE(m_lock.try_enter(second));
    m_lock.release(std::move(second));
    ASSERT_TRUE(verifier::check_state(m_lock.snapshot()).empty());
}

TEST_F(ticket_lock_test, contract_violations) {
    auto res = m_lock.request(3);
    ASSERT_TRUE(std::holds_alternative<protocol::contract_violation>(res));
    ASSERT_EQ(std::get<protocol::contract_violation>(res).m_reason,
              violation_reason::unknown_participant);

    auto h = request(1);
    res = m_lock.request(1);
    ASSERT_TRUE(std::holds_alternative<protocol::contract_violation>(res));
    ASSERT_EQ(std::get<protocol::contract_violation>(res).m_reason,
              violation_reason::not_idle);

    ASSERT_TRUE(m_lock.try_enter(h));
    m_lock.release(std::move(h));
}

TEST_F(ticket_lock_test, handle_moves) {
    auto h = request(0);
    auto moved = std::move(h);
    ASSERT_FALSE(h.valid()); // NOLINT(bugprone-use-after-move)
    ASSERT_TRUE(moved.valid());
    ASSERT_EQ(moved.ticket(), tk(0));
    ASSERT_TRUE(m_lock.try_enter(moved));
    m_lock.release(std::move(moved));
    ASSERT_FALSE(moved.valid()); // NOLINT(bugprone-use-after-move)
}

TEST_F(ticket_lock_test, guard_holds_for_scope) {
    {
        auto g = lock::guard(m_lock, 1);
        ASSERT_TRUE(g.owns_lock());
        ASSERT_FALSE(g.error().has_value());
        ASSERT_EQ(g.ticket(), tk(0));
        ASSERT_EQ(m_lock.snapshot().m_registry.phase_of(1), phase::critical);
    }
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.phase_of(1), phase::idle);
    ASSERT_EQ(snap.m_dispenser.serving(), tk(1));

    auto bad = lock::guard(m_lock, 9);
    ASSERT_FALSE(bad.owns_lock());
    ASSERT_TRUE(bad.error().has_value());
    ASSERT_EQ(bad.error()->m_reason, violation_reason::unknown_participant);
}

TEST_F(ticket_lock_test, wait_turn_blocks_until_release) {
    auto first = request(0);
    ASSERT_TRUE(m_lock.try_enter(first));

    std::atomic<bool> admitted{false};
    auto t = std::thread([&]() {
        auto res = m_lock.acquire(1);
        auto& h = std::get<ticket_handle>(res);
        admitted = true;
        m_lock.release(std::move(h));
    });

    // Wait until the second participant holds its ticket.
    while(m_lock.snapshot().m_registry.phase_of(1) != phase::awaiting) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    ASSERT_FALSE(admitted.load());

    m_lock.release(std::move(first));
    t.join();
    ASSERT_TRUE(admitted.load());
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_dispenser.serving(), tk(2));
    ASSERT_EQ(snap.m_registry.count(phase::idle), 3U);
}

TEST_F(ticket_lock_test, dropped_ticket_is_not_reclaimed) {
    {
        auto h = request(0);
        ASSERT_EQ(h.ticket(), tk(0));
    }
    // The abandoned ticket still owns the serving slot.
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.phase_of(0), phase::awaiting);
    ASSERT_TRUE(verifier::check_state(snap).empty());

    auto later = request(1);
    ASSERT_FALSE(m_lock.try_enter(later));
    ASSERT_FALSE(m_lock.try_enter(later));
    ASSERT_EQ(m_lock.snapshot().m_dispenser.serving(), tk(0));
}

TEST_F(ticket_lock_test, foreign_handle_is_rejected) {
    auto other = ticket_lock(3, test::make_logger(logging::log_level::fatal));
    auto res = other.request(0);
    auto& foreign = std::get<ticket_handle>(res);
    ASSERT_EQ(foreign.ticket(), tk(0));

    // Participant 0 is idle here and ticket 0 is being served.
    ASSERT_FALSE(m_lock.try_enter(foreign));
    ASSERT_FALSE(m_lock.wait_turn(foreign));
    ASSERT_FALSE(foreign.entered());
    ASSERT_FALSE(m_lock.release(std::move(foreign)));
    ASSERT_TRUE(foreign.valid()); // NOLINT(bugprone-use-after-move)

    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.count(phase::idle), 3U);
    ASSERT_EQ(snap.m_dispenser.next_ticket(), tk(0));
    ASSERT_TRUE(verifier::check_state(snap).empty());

    // The lock stays usable, with a single holder.
    auto h = request(1);
    ASSERT_TRUE(m_lock.try_enter(h));
    snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.count(phase::critical), 1U);
    ASSERT_EQ(snap.m_registry.phase_of(0), phase::idle);
    ASSERT_TRUE(m_lock.release(std::move(h)));

    // The issuing lock still accepts it.
    ASSERT_TRUE(other.try_enter(foreign));
    ASSERT_TRUE(other.release(std::move(foreign)));
}

TEST_F(ticket_lock_test, release_before_entering_is_rejected) {
    auto h = request(0);
    ASSERT_FALSE(m_lock.release(std::move(h)));
    ASSERT_TRUE(h.valid()); // NOLINT(bugprone-use-after-move)
    ASSERT_FALSE(h.entered());
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.phase_of(0), phase::awaiting);
    ASSERT_EQ(snap.m_dispenser.serving(), tk(0));
    ASSERT_EQ(snap.m_dispenser.next_ticket(), tk(1));

    ASSERT_TRUE(m_lock.try_enter(h));
    ASSERT_TRUE(m_lock.release(std::move(h)));
    ASSERT_EQ(m_lock.snapshot().m_dispenser.serving(), tk(1));
}

TEST_F(ticket_lock_test, entered_or_released_handle_is_rejected) {
    auto h = request(2);
    ASSERT_TRUE(m_lock.try_enter(h));
    ASSERT_FALSE(m_lock.try_enter(h));
    ASSERT_FALSE(m_lock.wait_turn(h));
    ASSERT_TRUE(h.entered());
    ASSERT_EQ(m_lock.snapshot().m_registry.phase_of(2), phase::critical);

    auto moved = std::move(h);
    ASSERT_FALSE(m_lock.try_enter(h)); // NOLINT(bugprone-use-after-move)
    ASSERT_FALSE(m_lock.release(std::move(h)));
    ASSERT_EQ(m_lock.snapshot().m_registry.phase_of(2), phase::critical);

    ASSERT_TRUE(m_lock.release(std::move(moved)));
    ASSERT_FALSE(m_lock.release(std::move(moved)));
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.count(phase::idle), 3U);
    ASSERT_EQ(snap.m_dispenser.serving(), tk(1));
}
