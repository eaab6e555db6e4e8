// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "state.hpp"

#include <sstream>

namespace ticketlock::protocol {
    state::state(size_t participant_count)
        : m_registry(participant_count) {}

    state::state(dispenser disp, registry reg)
        : m_dispenser(disp),
          m_registry(std::move(reg)) {}

    auto state::canonical() const -> state {
        auto ret = *this;
        ret.m_registry.canonicalize();
        return ret;
    }

    auto state::operator==(const state& rhs) const -> bool {
        return m_dispenser == rhs.m_dispenser && m_registry == rhs.m_registry;
    }

    auto state::operator!=(const state& rhs) const -> bool {
        return !(*this == rhs);
    }

    auto to_string(const state& s) -> std::string {
        std::stringstream ss;
        ss << s;
        return ss.str();
    }

    auto operator<<(std::ostream& os, const state& s) -> std::ostream& {
        os << "serving=" << s.m_dispenser.serving()
           << " next=" << s.m_dispenser.next_ticket() << " [";
        const auto& parts = s.m_registry.participants();
        for(size_t i{0}; i < parts.size(); i++) {
            if(i != 0) {
                os << " ";
            }
            os << "p" << i << ":" << parts[i].m_phase << parts[i].m_ticket;
        }
        return os << "]";
    }

    auto state_hasher::operator()(const state& s) const noexcept -> size_t {
        // 64-bit golden ratio constant, as in boost::hash_combine.
        static constexpr size_t mix = 0x9e3779b97f4a7c15ULL;
        static constexpr size_t lshift = 6;
        static constexpr size_t rshift = 2;
        size_t seed{0};
        auto combine = [&](size_t v) {
            seed ^= v + mix + (seed << lshift) + (seed >> rshift);
        };
        combine(std::hash<ticket_type>()(s.m_dispenser.serving()));
        combine(std::hash<ticket_type>()(s.m_dispenser.next_ticket()));
        for(const auto& p : s.m_registry.participants()) {
            combine(static_cast<size_t>(p.m_phase));
            combine(std::hash<ticket_type>()(p.m_ticket));
        }
        return seed;
    }
}
