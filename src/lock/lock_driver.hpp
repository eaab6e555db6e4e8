// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_LOCK_LOCK_DRIVER_H_
#define TICKETLOCK_SRC_LOCK_LOCK_DRIVER_H_

#include "checker/driver.hpp"
#include "ticket_lock.hpp"
#include "verifier/invariants.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace ticketlock::lock {
    /// \brief Steps participants of a live \ref ticket_lock without
    ///        blocking.
    ///
    /// Each step requests a ticket, polls for admission, or releases,
    /// depending on what the participant holds, then checks the state
    /// invariants against a snapshot of the lock. Different participants
    /// may be stepped from different threads; one participant must only
    /// be stepped from one thread at a time.
    class lock_driver : public checker::driver {
      public:
        /// Constructor.
        /// \param lk lock to drive. Must outlive the driver.
        /// \param logger log instance.
        lock_driver(ticket_lock& lk, std::shared_ptr<logging::log> logger);

        /// Admits and releases every ticket still held, in ticket order.
        /// Blocks while an earlier ticket is held outside the driver, so
        /// that holder must release from another thread.
        ~lock_driver() override;

        lock_driver(const lock_driver&) = delete;
        auto operator=(const lock_driver&) -> lock_driver& = delete;
        lock_driver(lock_driver&&) = delete;
        auto operator=(lock_driver&&) -> lock_driver& = delete;

        /// Advances the participant by one protocol action.
        /// \param p participant.
        /// \return request, wait, enter or exit; std::nullopt for an
        ///         unknown participant or after a violation.
        auto step(participant_id p)
            -> std::optional<protocol::action> override;

        [[nodiscard]] auto participant_count() const -> size_t override;

        [[nodiscard]] auto ok() const -> bool override;

        /// Returns the violations found so far.
        [[nodiscard]] auto violations() const
            -> std::vector<verifier::violation>;

      private:
        ticket_lock& m_lock;
        std::shared_ptr<logging::log> m_log;
        std::vector<std::optional<ticket_handle>> m_handles;

        mutable std::mutex m_violations_mut;
        std::vector<verifier::violation> m_violations;

        void verify();
    };
}

#endif
