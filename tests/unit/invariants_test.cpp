// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "protocol/state_machine.hpp"
#include "verifier/invariants.hpp"

#include <gtest/gtest.h>

using namespace ticketlock;
using test::awaiting;
using test::critical;
using test::idle;
using test::make_state;
using test::tk;
using verifier::invariant;
using verifier::violates;

TEST(invariants_test, consistent_states) {
    ASSERT_TRUE(verifier::check_state(protocol::state(3)).empty());
    ASSERT_TRUE(
        verifier::check_state(
            make_state(1, 3, {critical(1), awaiting(2), idle()}))
            .empty());
    ASSERT_TRUE(
        verifier::check_state(make_state(4, 6, {awaiting(5), awaiting(4)}))
            .empty());
    ASSERT_TRUE(verifier::check_state(make_state(7, 7, {idle(), idle()}))
                    .empty());
}

TEST(invariants_test, two_critical_participants) {
    auto found
        = verifier::check_state(make_state(0, 2, {critical(0), critical(1)}));
    ASSERT_TRUE(violates(found, invariant::mutual_exclusion));
    ASSERT_TRUE(violates(found, invariant::critical_holds_serving));
    ASSERT_FALSE(violates(found, invariant::unique_tickets));
}

TEST(invariants_test, serving_past_next) {
    auto found = verifier::check_state(make_state(3, 1, {idle(), idle()}));
    ASSERT_TRUE(violates(found, invariant::serving_bound));
}

TEST(invariants_test, duplicate_ticket) {
    auto found
        = verifier::check_state(make_state(0, 2, {awaiting(0), awaiting(0)}));
    ASSERT_TRUE(violates(found, invariant::unique_tickets));
    ASSERT_FALSE(violates(found, invariant::window_fully_owned));
}

TEST(invariants_test, ticket_outside_window) {
    auto found = verifier::check_state(make_state(0, 1, {awaiting(5)}));
    ASSERT_TRUE(violates(found, invariant::held_in_window));

    found = verifier::check_state(make_state(2, 3, {awaiting(1), idle()}));
    ASSERT_TRUE(violates(found, invariant::held_in_window));
}

TEST(invariants_test, unowned_ticket_in_window) {
    auto found = verifier::check_state(make_state(0, 2, {awaiting(0), idle()}));
    ASSERT_TRUE(violates(found, invariant::window_fully_owned));
    ASSERT_EQ(found.size(), 1U);
    ASSERT_EQ(verifier::to_string(found.front()),
              "window_fully_owned: 1 active participants for 2 outstanding "
              "tickets");
}

TEST(invariants_test, valid_transitions) {
    auto m = protocol::state_machine(test::make_logger());
    auto s = protocol::state(2);
    auto acts = std::vector<protocol::action>{protocol::request_action{1},
                                              protocol::request_action{0},
                                              protocol::enter_action{1, tk(0)},
                                              protocol::wait_action{0, tk(1)},
                                              protocol::exit_action{1},
                                              protocol::enter_action{0, tk(1)},
                                              protocol::exit_action{0}};
    for(const auto& act : acts) {
        auto before = s;
        ASSERT_FALSE(m.apply(s, act).has_value()) << act;
        auto found = verifier::check_transition(before, act, s);
        ASSERT_TRUE(found.empty()) << act << " " << found.front();
    }
}

TEST(invariants_test, request_issues_wrong_ticket) {
    auto before = make_state(0, 0, {idle(), idle()});
    auto after = make_state(0, 1, {awaiting(5), idle()});
    auto found = verifier::check_transition(before,
                                            protocol::request_action{0},
                                            after);
    ASSERT_TRUE(violates(found, invariant::issuance_monotonicity));
}

TEST(invariants_test, request_skips_a_ticket) {
    auto before = make_state(0, 1, {awaiting(0), idle()});
    auto after = make_state(0, 3, {awaiting(0), awaiting(1)});
    auto found = verifier::check_transition(before,
                                            protocol::request_action{1},
                                            after);
    ASSERT_TRUE(violates(found, invariant::counter_monotonicity));
    ASSERT_TRUE(violates(found, invariant::issuance_monotonicity));
}

TEST(invariants_test, action_touches_other_participant) {
    auto before = make_state(0, 1, {awaiting(0), idle()});
    auto after = make_state(0, 1, {critical(0), critical(0)});
    auto found = verifier::check_transition(before,
                                            protocol::enter_action{0, tk(0)},
                                            after);
    ASSERT_TRUE(violates(found, invariant::frame));
    ASSERT_TRUE(violates(found, invariant::admission_correctness));
}

TEST(invariants_test, wait_moves_serving) {
    auto before = make_state(0, 2, {critical(0), awaiting(1)});
    auto after = make_state(1, 2, {critical(0), awaiting(1)});
    auto found = verifier::check_transition(before,
                                            protocol::wait_action{1, tk(1)},
                                            after);
    ASSERT_TRUE(violates(found, invariant::counter_monotonicity));
}

TEST(invariants_test, enter_out_of_turn) {
    auto before = make_state(0, 2, {awaiting(1), awaiting(0)});
    auto after = make_state(0, 2, {critical(1), awaiting(0)});
    auto found = verifier::check_transition(before,
                                            protocol::enter_action{0, tk(1)},
                                            after);
    ASSERT_TRUE(violates(found, invariant::admission_correctness));
    ASSERT_FALSE(violates(found, invariant::frame));
}

TEST(invariants_test, exit_keeps_participant_critical) {
    auto before = make_state(0, 1, {critical(0)});
    auto after = make_state(1, 1, {critical(0)});
    auto found
        = verifier::check_transition(before, protocol::exit_action{0}, after);
    ASSERT_TRUE(violates(found, invariant::lifecycle));
}

TEST(invariants_test, round_trip) {
    auto before = make_state(2, 2, {idle()});
    ASSERT_TRUE(
        verifier::check_round_trip(before, 0, make_state(3, 3, {idle()}))
            .empty());

    auto found
        = verifier::check_round_trip(before, 0, make_state(2, 3, {awaiting(2)}));
    ASSERT_TRUE(violates(found, invariant::round_trip));
    ASSERT_EQ(found.size(), 2U);
}
