// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "dispenser/dispenser.hpp"

#include <gtest/gtest.h>

using ticketlock::dispenser;
using ticketlock::ticket_type;

TEST(dispenser_test, starts_at_zero) {
    auto d = dispenser();
    ASSERT_EQ(d.serving(), ticket_type::zero());
    ASSERT_EQ(d.next_ticket(), ticket_type::zero());
    ASSERT_EQ(d.outstanding(), 0U);
    ASSERT_TRUE(d.is_current(ticket_type::zero()));
}

TEST(dispenser_test, issues_consecutive_tickets) {
    auto d = dispenser();
    for(uint64_t i{0}; i < 5; i++) {
        auto t = d.issue();
        ASSERT_TRUE(t.has_value());
        ASSERT_EQ(t.value(), ticket_type(i));
        ASSERT_EQ(d.next_ticket(), ticket_type(i + 1));
    }
    ASSERT_EQ(d.outstanding(), 5U);
    ASSERT_EQ(d.serving(), ticket_type::zero());
}

TEST(dispenser_test, advance_serving) {
    auto d = dispenser();
    ASSERT_TRUE(d.issue().has_value());
    ASSERT_TRUE(d.issue().has_value());
    ASSERT_TRUE(d.advance_serving());
    ASSERT_EQ(d.serving(), ticket_type(1));
    ASSERT_TRUE(d.is_current(ticket_type(1)));
    ASSERT_FALSE(d.is_current(ticket_type(0)));
    ASSERT_EQ(d.outstanding(), 1U);
}

TEST(dispenser_test, exhaustion) {
    auto last = ticket_type(ticket_type::max().value() - 1);
    auto d = dispenser(last, last);
    auto t = d.issue();
    ASSERT_TRUE(t.has_value());
    ASSERT_EQ(t.value(), last);
    ASSERT_EQ(d.next_ticket(), ticket_type::max());

    auto before = d;
    ASSERT_FALSE(d.issue().has_value());
    ASSERT_EQ(d, before);

    ASSERT_TRUE(d.advance_serving());
    ASSERT_EQ(d.serving(), ticket_type::max());
    ASSERT_FALSE(d.advance_serving());
    ASSERT_EQ(d.serving(), ticket_type::max());
}

TEST(dispenser_test, equality) {
    auto a = dispenser(ticket_type(1), ticket_type(3));
    auto b = dispenser(ticket_type(1), ticket_type(3));
    auto c = dispenser(ticket_type(2), ticket_type(3));
    ASSERT_EQ(a, b);
    ASSERT_NE(a, c);
}
