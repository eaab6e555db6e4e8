// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_PROTOCOL_STATE_MACHINE_H_
#define TICKETLOCK_SRC_PROTOCOL_STATE_MACHINE_H_

#include "action.hpp"
#include "error.hpp"
#include "state.hpp"
#include "util/common/logging.hpp"

#include <memory>
#include <optional>
#include <variant>

namespace ticketlock::protocol {
    /// \brief Ticket lock protocol transitions.
    ///
    /// Each participant cycles idle -> awaiting -> critical -> idle.
    /// Tickets are issued in request order and admitted in ticket order, so
    /// at most one participant is critical at any time.
    ///
    /// Every operation takes the shared state explicitly and applies one
    /// atomic step to it. The state machine holds no protocol state of its
    /// own, so one instance can serve any number of states. Callers that
    /// share a state between threads must serialize calls on it.
    ///
    /// Preconditions are contracts. A call whose precondition does not hold
    /// returns a \ref contract_violation and leaves the state unchanged.
    class state_machine {
      public:
        /// Return type of \ref request_ticket. The issued ticket or a
        /// contract violation.
        using request_return_type
            = std::variant<ticket_type, contract_violation>;

        /// Constructor.
        /// \param logger log instance.
        explicit state_machine(std::shared_ptr<logging::log> logger);

        /// Issues the next ticket to an idle participant, which starts
        /// awaiting. The ticket is strictly greater than every ticket
        /// issued before.
        /// \param s protocol state.
        /// \param p requesting participant.
        /// \return the issued ticket, or a violation if p is not idle.
        auto request_ticket(state& s, participant_id p) -> request_return_type;

        /// Checks that an awaiting participant may not enter yet. Has no
        /// effect on the state.
        /// \param s protocol state.
        /// \param p waiting participant.
        /// \param ticket ticket the caller claims p holds.
        /// \return std::nullopt if p is awaiting, holds the ticket and the
        ///         ticket is not being served. A violation otherwise.
        auto wait(const state& s, participant_id p, ticket_type ticket)
            -> std::optional<contract_violation>;

        /// Admits an awaiting participant whose ticket is being served.
        /// \param s protocol state.
        /// \param p entering participant.
        /// \param ticket ticket the caller claims p holds.
        /// \return std::nullopt if p entered the protected region.
        auto enter(state& s, participant_id p, ticket_type ticket)
            -> std::optional<contract_violation>;

        /// Releases the protected region. Serves the next ticket and
        /// returns p to idle holding zero.
        /// \param s protocol state.
        /// \param p critical participant.
        /// \return std::nullopt if p left the protected region.
        auto exit(state& s, participant_id p)
            -> std::optional<contract_violation>;

        /// Applies an action by dispatching to the matching operation.
        /// \param s protocol state.
        /// \param act action to apply.
        /// \return std::nullopt if the action was applied.
        auto apply(state& s, const action& act)
            -> std::optional<contract_violation>;

        /// Returns the single action whose precondition holds for p:
        /// request when idle, wait or enter when awaiting depending on
        /// whether its ticket is served, exit when critical.
        /// \param s protocol state.
        /// \param p participant.
        /// \return enabled action, or std::nullopt for an unknown
        ///         participant.
        [[nodiscard]] static auto enabled_action(const state& s,
                                                 participant_id p)
            -> std::optional<action>;

        /// Returns true if the action's precondition holds in the state.
        [[nodiscard]] static auto is_enabled(const state& s, const action& act)
            -> bool;

      private:
        std::shared_ptr<logging::log> m_log;

        static auto check_awaiting(const state& s,
                                   action_kind kind,
                                   participant_id p,
                                   ticket_type ticket)
            -> std::optional<contract_violation>;

        auto reject(contract_violation err) -> contract_violation;
    };
}

#endif
