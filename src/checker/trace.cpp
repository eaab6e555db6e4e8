// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "trace.hpp"

#include <sstream>

namespace ticketlock::checker {
    void trace::push(trace_step step) {
        m_steps.push_back(std::move(step));
    }

    auto trace::size() const -> size_t {
        return m_steps.size();
    }

    auto trace::empty() const -> bool {
        return m_steps.empty();
    }

    auto trace::steps() const -> const std::vector<trace_step>& {
        return m_steps;
    }

    auto trace::actions() const -> std::vector<protocol::action> {
        auto ret = std::vector<protocol::action>();
        ret.reserve(m_steps.size());
        for(const auto& s : m_steps) {
            ret.push_back(s.m_action);
        }
        return ret;
    }

    void trace::clear() {
        m_steps.clear();
    }

    auto operator<<(std::ostream& os, const trace& t) -> std::ostream& {
        if(t.empty()) {
            return os << "  (empty trace)\n";
        }
        os << "  0: " << t.steps().front().m_before << "\n";
        for(size_t i{0}; i < t.size(); i++) {
            const auto& step = t.steps()[i];
            os << "  " << (i + 1) << ": " << step.m_action << " -> "
               << step.m_after << "\n";
        }
        return os;
    }

    auto to_string(const trace& t) -> std::string {
        std::stringstream ss;
        ss << t;
        return ss.str();
    }
}
