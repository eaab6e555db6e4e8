// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_LOCK_TICKET_LOCK_H_
#define TICKETLOCK_SRC_LOCK_TICKET_LOCK_H_

#include "protocol/state_machine.hpp"
#include "util/common/logging.hpp"

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

namespace ticketlock::lock {
    class ticket_lock;

    /// \brief Proof of holding a ticket of a \ref ticket_lock.
    ///
    /// Only the lock creates handles, and every later operation takes the
    /// handle instead of a participant and ticket, so a caller cannot
    /// present a ticket it does not hold. Move-only. A handle must not
    /// outlive its lock.
    class ticket_handle {
      public:
        ~ticket_handle();

        ticket_handle(const ticket_handle&) = delete;
        auto operator=(const ticket_handle&) -> ticket_handle& = delete;
        ticket_handle(ticket_handle&& other) noexcept;
        auto operator=(ticket_handle&& other) noexcept -> ticket_handle&;

        /// Returns the participant the ticket was issued to.
        [[nodiscard]] auto participant() const -> participant_id;

        /// Returns the held ticket.
        [[nodiscard]] auto ticket() const -> ticket_type;

        /// Returns true once the holder has entered the protected region.
        [[nodiscard]] auto entered() const -> bool;

        /// Returns false for a moved-from or released handle.
        [[nodiscard]] auto valid() const -> bool;

      private:
        friend class ticket_lock;

        ticket_handle(ticket_lock* owner,
                      participant_id participant,
                      ticket_type ticket);

        ticket_lock* m_owner{nullptr};
        participant_id m_participant{};
        ticket_type m_ticket{};
        bool m_entered{false};
    };

    /// \brief Fair mutual-exclusion lock for a fixed set of participants.
    ///
    /// Runs the ticket protocol state machine over one shared state guarded
    /// by a single mutex, so every protocol action is atomic. Waiting
    /// participants sleep on a condition variable and re-check admission
    /// each time a holder releases. Participants are admitted strictly in
    /// request order.
    class ticket_lock {
      public:
        /// Return type of \ref request and \ref acquire.
        using request_return_type
            = std::variant<ticket_handle, protocol::contract_violation>;

        /// Constructor.
        /// \param participant_count number of participants that may
        ///                          contend.
        /// \param logger log instance.
        ticket_lock(size_t participant_count,
                    std::shared_ptr<logging::log> logger);

        ~ticket_lock() = default;

        ticket_lock(const ticket_lock&) = delete;
        auto operator=(const ticket_lock&) -> ticket_lock& = delete;
        ticket_lock(ticket_lock&&) = delete;
        auto operator=(ticket_lock&&) -> ticket_lock& = delete;

        /// Draws a ticket for an idle participant.
        /// \param p participant.
        /// \return handle for the issued ticket, or a violation if p is
        ///         unknown or already holds a ticket.
        auto request(participant_id p) -> request_return_type;

        /// Performs one admission poll without blocking.
        /// \param handle handle returned by \ref request.
        /// \return true if the holder entered the protected region. False
        ///         if its ticket is not being served yet, or if the handle
        ///         was not issued by this lock, is released or has already
        ///         entered. The handle is unchanged unless true.
        auto try_enter(ticket_handle& handle) -> bool;

        /// Blocks until the handle's ticket is served, then enters.
        /// \param handle handle returned by \ref request.
        /// \return true once entered. False without blocking for a handle
        ///         \ref try_enter rejects.
        auto wait_turn(ticket_handle& handle) -> bool;

        /// Leaves the protected region and serves the next ticket.
        /// \param handle entered handle issued by this lock.
        /// \return true if released, leaving the handle invalid. False if
        ///         the handle is foreign, released or not entered; the
        ///         handle and the lock are then unchanged.
        auto release(ticket_handle&& handle) -> bool;

        /// Draws a ticket and waits until it is served.
        /// \param p participant.
        /// \return handle for the ticket, entered once admitted, or a
        ///         violation from \ref request.
        auto acquire(participant_id p) -> request_return_type;

        /// Returns a copy of the protocol state.
        [[nodiscard]] auto snapshot() const -> protocol::state;

        /// Returns the number of participants.
        [[nodiscard]] auto participant_count() const -> size_t;

      private:
        friend class ticket_handle;

        mutable std::mutex m_mut;
        std::condition_variable m_cv;
        std::shared_ptr<logging::log> m_log;
        protocol::state_machine m_machine;
        protocol::state m_state;

        enum class admission : uint8_t {
            admitted,
            waiting,
            rejected
        };

        [[nodiscard]] auto admissible(const ticket_handle& handle) const
            -> bool;

        auto poll(ticket_handle& handle) -> admission;

        void abandoned(const ticket_handle& handle);
    };

    /// \brief Scoped ownership of a \ref ticket_lock.
    ///
    /// Acquires for the participant on construction and releases on
    /// destruction.
    class guard {
      public:
        /// Acquires the lock for the participant. Blocks until admitted.
        /// \param lk lock to acquire.
        /// \param p participant.
        guard(ticket_lock& lk, participant_id p);

        ~guard();

        guard(const guard&) = delete;
        auto operator=(const guard&) -> guard& = delete;
        guard(guard&&) = delete;
        auto operator=(guard&&) -> guard& = delete;

        /// Returns true if the guard entered the protected region.
        [[nodiscard]] auto owns_lock() const -> bool;

        /// Returns the violation that prevented acquisition, if any.
        [[nodiscard]] auto error() const
            -> const std::optional<protocol::contract_violation>&;

        /// Returns the ticket the guard was admitted with. Requires
        /// owns_lock().
        [[nodiscard]] auto ticket() const -> ticket_type;

      private:
        ticket_lock& m_lock;
        std::optional<ticket_handle> m_handle;
        std::optional<protocol::contract_violation> m_error;
    };
}

#endif
