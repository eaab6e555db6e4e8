// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "../util.hpp"
#include "checker/explorer.hpp"

#include <gtest/gtest.h>

using namespace ticketlock;
using test::tk;

class explorer_test : public ::testing::Test {
  protected:
    static auto params(size_t participants,
                       uint64_t bound,
                       bool symmetry,
                       size_t limit = 0) -> checker::explorer::parameters {
        auto ret = checker::explorer::parameters{};
        ret.m_participant_count = participants;
        ret.m_ticket_bound = bound;
        ret.m_symmetry_reduction = symmetry;
        ret.m_state_limit = limit;
        return ret;
    }

    std::shared_ptr<logging::log> m_log{test::make_logger()};
};

TEST_F(explorer_test, single_participant_state_space) {
    auto exp = checker::explorer(m_log, params(1, 2, false));
    auto res = exp.run();
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(res.m_complete);
    // idle, awaiting, critical for each of two tickets, then idle again.
    ASSERT_EQ(res.m_states, 7U);
    ASSERT_EQ(res.m_transitions, 6U);
    ASSERT_EQ(res.m_depth, 6U);
    ASSERT_TRUE(res.m_counterexample.empty());
}

TEST_F(explorer_test, all_reachable_states_hold_invariants) {
    for(size_t n{1}; n <= 3; n++) {
        auto exp = checker::explorer(m_log, params(n, 5, false));
        auto res = exp.run();
        ASSERT_TRUE(res.ok()) << "participants " << n;
        ASSERT_TRUE(res.m_complete);
        ASSERT_GT(res.m_states, 1U);
    }
}

TEST_F(explorer_test, symmetry_reduction_shrinks_state_space) {
    auto full = checker::explorer(m_log, params(3, 4, false)).run();
    auto reduced = checker::explorer(m_log, params(3, 4, true)).run();
    ASSERT_TRUE(full.ok());
    ASSERT_TRUE(reduced.ok());
    ASSERT_LT(reduced.m_states, full.m_states);
    ASSERT_EQ(reduced.m_depth, full.m_depth);
}

TEST_F(explorer_test, zero_bound_issues_nothing) {
    auto res = checker::explorer(m_log, params(2, 0, false)).run();
    ASSERT_TRUE(res.ok());
    ASSERT_EQ(res.m_states, 1U);
    ASSERT_EQ(res.m_transitions, 0U);
}

TEST_F(explorer_test, finds_shortest_counterexample) {
    // Treat serving reaching two as a violation to check trace
    // reconstruction.
    auto check = [](const protocol::state& s) {
        auto ret = verifier::check_state(s);
        if(s.m_dispenser.serving() == tk(2)) {
            ret.push_back(verifier::violation{verifier::invariant::frame,
                                              "serving reached #2"});
        }
        return ret;
    };
    auto exp = checker::explorer(m_log, params(2, 4, false), check);
    auto res = exp.run();
    ASSERT_FALSE(res.ok());
    ASSERT_EQ(res.m_violations.size(), 1U);
    ASSERT_EQ(res.m_violations.front().m_detail, "serving reached #2");

    const auto& cex = res.m_counterexample;
    ASSERT_EQ(cex.size(), 6U);
    ASSERT_EQ(cex.steps().front().m_before, protocol::state(2));
    ASSERT_EQ(cex.steps().back().m_after.m_dispenser.serving(), tk(2));
    ASSERT_EQ(protocol::kind_of(cex.steps().back().m_action),
              protocol::action_kind::exit);
    for(size_t i{1}; i < cex.size(); i++) {
        ASSERT_EQ(cex.steps()[i].m_before, cex.steps()[i - 1].m_after);
    }

    auto printed = checker::to_string(cex);
    ASSERT_EQ(printed.find("  0: serving=#0 next=#0 [p0:idle#0 p1:idle#0]"),
              0U);
}

TEST_F(explorer_test, rejects_inconsistent_initial_state) {
    auto exp = checker::explorer(m_log, params(2, 4, false));
    auto res = exp.run(test::make_state(0, 2, {test::critical(0), test::idle()}));
    ASSERT_FALSE(res.ok());
    ASSERT_TRUE(verifier::violates(res.m_violations,
                                   verifier::invariant::window_fully_owned));
    ASSERT_TRUE(res.m_counterexample.empty());
}

TEST_F(explorer_test, explores_from_given_state) {
    auto exp = checker::explorer(m_log, params(2, 4, false));
    auto res = exp.run(
        test::make_state(1, 3, {test::awaiting(2), test::critical(1)}));
    ASSERT_TRUE(res.ok());
    ASSERT_TRUE(res.m_complete);
    ASSERT_GT(res.m_states, 1U);
}

TEST_F(explorer_test, state_limit_marks_incomplete) {
    static constexpr size_t limit = 5;
    auto res = checker::explorer(m_log, params(3, 6, false, limit)).run();
    ASSERT_TRUE(res.ok());
    ASSERT_FALSE(res.m_complete);
    ASSERT_EQ(res.m_states, limit);
}
