// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_REGISTRY_REGISTRY_H_
#define TICKETLOCK_SRC_REGISTRY_REGISTRY_H_

#include "ticket/ticket.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ticketlock {
    /// Dense participant identity in [0, participant count).
    using participant_id = size_t;

    /// Lifecycle phase of a participant.
    enum class phase : uint8_t {
        /// Not contending. Initial phase and the phase after release.
        idle,
        /// Holds a ticket and waits for it to be served.
        awaiting,
        /// Inside the protected region.
        critical
    };

    /// Returns the lower-case name of a phase.
    auto to_string(phase p) -> std::string;

    auto operator<<(std::ostream& os, phase p) -> std::ostream&;

    /// Phase and held ticket of one participant.
    struct participant_state {
        phase m_phase{phase::idle};
        /// Held ticket. Zero while idle.
        ticket_type m_ticket{};

        auto operator==(const participant_state& rhs) const -> bool;
        auto operator!=(const participant_state& rhs) const -> bool;
        auto operator<(const participant_state& rhs) const -> bool;
    };

    /// \brief Per-participant protocol state.
    ///
    /// Holds exactly one phase and one ticket per participant. The mutators
    /// perform no policy checks; the protocol state machine checks every
    /// precondition before calling them.
    class registry {
      public:
        /// Constructor. Every participant starts idle holding zero.
        /// \param participant_count number of participants.
        explicit registry(size_t participant_count);

        /// Returns the number of participants.
        [[nodiscard]] auto size() const -> size_t;

        /// Returns true if the identity names a registered participant.
        [[nodiscard]] auto contains(participant_id p) const -> bool;

        /// Returns the state of a participant. Requires contains(p).
        [[nodiscard]] auto at(participant_id p) const
            -> const participant_state&;

        /// Returns the phase of a participant. Requires contains(p).
        [[nodiscard]] auto phase_of(participant_id p) const -> phase;

        /// Returns the ticket held by a participant. Requires contains(p).
        [[nodiscard]] auto ticket_of(participant_id p) const -> ticket_type;

        /// Records that a participant holds a ticket and waits for it.
        void set_awaiting(participant_id p, ticket_type ticket);

        /// Records that a participant entered the protected region. The
        /// held ticket is kept.
        void set_critical(participant_id p);

        /// Records that a participant left the protected region. The held
        /// ticket reverts to zero.
        void set_idle(participant_id p);

        /// Returns all participant records, indexed by identity.
        [[nodiscard]] auto participants() const
            -> const std::vector<participant_state>&;

        /// Returns the number of participants in the given phase.
        [[nodiscard]] auto count(phase ph) const -> size_t;

        /// Sorts participant records, forgetting identities. Used for
        /// symmetry reduction, where participants are interchangeable.
        void canonicalize();

        auto operator==(const registry& rhs) const -> bool;
        auto operator!=(const registry& rhs) const -> bool;

      private:
        std::vector<participant_state> m_participants;
    };
}

#endif
