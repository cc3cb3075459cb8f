/* 
 * This file is part of the snippetspp distribution (https://github.com/Warpten/snippetspp).
 * Copyright (c) 2021 Warpten.
 * 
 * This program is free software: you can redistribute it and/or modify  
 * it under the terms of the GNU General Public License as published by  
 * the Free Software Foundation, version 3.
 *
 * This program is distributed in the hope that it will be useful, but 
 * WITHOUT ANY WARRANTY; without even the implied warranty of 
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU 
 * General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License 
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef SERGEANT_CONFIG_HEADER_GUARD_HPP__
#define SERGEANT_CONFIG_HEADER_GUARD_HPP__

static_assert(__cplusplus >= 201703L, "Sergeant only supports C++17 and upwards.");

#include <future>
#include <iosfwd>
#include <string>

#include <boost/asio/thread_pool.hpp>

namespace Sergeant {
    //> Separates consecutive nodes of a command. Not configurable: literals, lookahead and
    //> every built-in argument type agree on it.
    inline constexpr char ArgumentSeparator = ' ';

    /// <summary>
    /// Tokens used when rendering usage strings.
    /// </summary>
    struct UsageFormat {
        std::string optionalOpen = "[";
        std::string optionalClose = "]";
        std::string requiredOpen = "(";
        std::string requiredClose = ")";
        std::string alternative = "|";
    };

    /// <summary>
    /// Per-dispatcher settings.
    /// </summary>
    struct DispatcherOptions {
        //> Launch policy of the per-node suggestion tasks. std::launch::async starts one thread
        //> per candidate child on every request; set suggestionPool to bound that.
        std::launch suggestionLaunch = std::launch::async;

        //> When set, suggestion tasks run on this pool instead and suggestionLaunch is ignored.
        //> The pool must outlive every pending suggestion future.
        boost::asio::thread_pool* suggestionPool = nullptr;

        UsageFormat usage { };

        //> Optional diagnostic sink. The dispatcher stays silent when this is null.
        std::ostream* diagnostics = nullptr;
    };
}

#endif // SERGEANT_CONFIG_HEADER_GUARD_HPP__
