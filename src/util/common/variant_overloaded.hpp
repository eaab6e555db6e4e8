// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef TICKETLOCK_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
#define TICKETLOCK_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_

namespace ticketlock {
    /// \brief Builds a std::visit handler from a set of lambdas.
    ///
    /// \code{.cpp}
    ///      std::visit(overloaded{
    ///                     [&](const protocol::request_action&) {...},
    ///                     [&](const protocol::exit_action&) {...}
    ///                 },
    ///                 act);
    /// \endcode
    /// \tparam Ts lambda overloads.
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

#endif // TICKETLOCK_SRC_UTIL_COMMON_VARIANT_OVERLOADED_H_
