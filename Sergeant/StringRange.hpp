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

#ifndef SERGEANT_STRING_RANGE_HEADER_GUARD_HPP__
#define SERGEANT_STRING_RANGE_HEADER_GUARD_HPP__

#include <algorithm>
#include <string_view>

namespace Sergeant {
    /// <summary>
    /// Half-open range [start, end) of positions into a command input.
    /// </summary>
    struct StringRange {
        constexpr StringRange() noexcept : _start(0), _end(0) { }
        constexpr StringRange(int start, int end) noexcept : _start(start), _end(end) { }

        constexpr static StringRange At(int pos) noexcept { return StringRange { pos, pos }; }
        constexpr static StringRange Between(int start, int end) noexcept { return StringRange { start, end }; }

        constexpr static StringRange Encompassing(StringRange const& a, StringRange const& b) noexcept {
            return StringRange { std::min(a._start, b._start), std::max(a._end, b._end) };
        }

        constexpr int start() const noexcept { return _start; }
        constexpr int end() const noexcept { return _end; }
        constexpr int length() const noexcept { return _end - _start; }
        constexpr bool empty() const noexcept { return _start == _end; }

        //> Returns the slice of the given input covered by this range.
        constexpr std::string_view Get(std::string_view input) const noexcept {
            return input.substr(_start, _end - _start);
        }

        constexpr bool operator == (StringRange const& other) const noexcept {
            return _start == other._start && _end == other._end;
        }

        constexpr bool operator != (StringRange const& other) const noexcept { return !(*this == other); }

    private:
        int _start;
        int _end;
    };
}

#endif // SERGEANT_STRING_RANGE_HEADER_GUARD_HPP__
