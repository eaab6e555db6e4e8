// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "checker/scheduler.hpp"
#include "lock/lock_driver.hpp"
#include "verifier/invariants.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace ticketlock;
using test::tk;

class lock_driver_test : public ::testing::Test {
  protected:
    std::shared_ptr<logging::log> m_log{test::make_logger()};
    lock::ticket_lock m_lock{3, m_log};
};

TEST_F(lock_driver_test, steps_follow_protocol) {
    auto drv = lock::lock_driver(m_lock, m_log);
    ASSERT_EQ(drv.participant_count(), 3U);
    ASSERT_EQ(drv.step(0).value(),
              protocol::action(protocol::request_action{0}));
    ASSERT_EQ(drv.step(1).value(),
              protocol::action(protocol::request_action{1}));
    ASSERT_EQ(drv.step(1).value(),
              protocol::action(protocol::wait_action{1, tk(1)}));
    ASSERT_EQ(drv.step(0).value(),
              protocol::action(protocol::enter_action{0, tk(0)}));
    ASSERT_EQ(drv.step(1).value(),
              protocol::action(protocol::wait_action{1, tk(1)}));
    ASSERT_EQ(drv.step(0).value(), protocol::action(protocol::exit_action{0}));
    ASSERT_EQ(drv.step(1).value(),
              protocol::action(protocol::enter_action{1, tk(1)}));
    ASSERT_FALSE(drv.step(3).has_value());
    ASSERT_TRUE(drv.ok());
    ASSERT_TRUE(drv.violations().empty());
}

TEST_F(lock_driver_test, destructor_drains_outstanding_tickets) {
    {
        auto drv = lock::lock_driver(m_lock, m_log);
        for(participant_id p{0}; p < 3; p++) {
            ASSERT_TRUE(drv.step(p).has_value());
        }
        ASSERT_TRUE(drv.step(0).has_value());
    }
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.count(phase::idle), 3U);
    ASSERT_EQ(snap.m_dispenser.serving(), tk(3));
    ASSERT_EQ(snap.m_dispenser.next_ticket(), tk(3));
}

TEST_F(lock_driver_test, destructor_waits_for_outside_holder) {
    std::atomic<bool> holding{false};
    std::atomic<bool> done{false};
    auto holder = std::thread([&]() {
        auto g = lock::guard(m_lock, 2);
        holding = true;
        while(!done) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });
    while(!holding) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto drv = std::make_unique<lock::lock_driver>(m_lock, m_log);
    EXPECT_TRUE(drv->step(1).has_value());
    EXPECT_TRUE(drv->step(0).has_value());
    EXPECT_EQ(drv->step(1).value(),
              protocol::action(protocol::wait_action{1, tk(1)}));

    std::atomic<bool> drained{false};
    auto drainer = std::thread([&]() {
        drv.reset();
        drained = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_FALSE(drained.load());

    done = true;
    holder.join();
    drainer.join();
    ASSERT_TRUE(drained.load());
    auto snap = m_lock.snapshot();
    ASSERT_EQ(snap.m_registry.count(phase::idle), 3U);
    ASSERT_EQ(snap.m_dispenser.serving(), tk(3));
}

TEST_F(lock_driver_test, random_schedule_holds_invariants) {
    static constexpr size_t steps = 2000;
    {
        auto drv = lock::lock_driver(m_lock, m_log);
        auto sched = checker::random_scheduler(m_log, 3);
        ASSERT_EQ(sched.run(drv, steps, 3), steps);
        ASSERT_TRUE(drv.ok());
    }
    auto snap = m_lock.snapshot();
    ASSERT_TRUE(verifier::check_state(snap).empty());
    ASSERT_EQ(snap.m_dispenser.serving(), snap.m_dispenser.next_ticket());
}
