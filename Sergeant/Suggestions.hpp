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

#ifndef SERGEANT_SUGGESTIONS_HEADER_GUARD_HPP__
#define SERGEANT_SUGGESTIONS_HEADER_GUARD_HPP__

#include <algorithm>
#include <climits>
#include <future>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "StringRange.hpp"

namespace Sergeant {
    namespace Details {
        template <typename T>
        std::future<T> MakeReadyFuture(T value) {
            std::promise<T> promise;
            promise.set_value(std::move(value));
            return promise.get_future();
        }
    }

    /// <summary>
    /// A single completion: the text that should replace the given range of the input.
    /// </summary>
    class Suggestion {
    public:
        Suggestion(StringRange range, std::string text, std::optional<std::string> tooltip = std::nullopt)
            : _range(range), _text(std::move(text)), _tooltip(std::move(tooltip))
        { }

        //> Suggestion produced from an integer value.
        Suggestion(StringRange range, int value, std::optional<std::string> tooltip = std::nullopt)
            : _range(range), _text(std::to_string(value)), _tooltip(std::move(tooltip)), _intValue(value)
        { }

        StringRange const& GetRange() const noexcept { return _range; }
        std::string const& GetText() const noexcept { return _text; }
        std::optional<std::string> const& GetTooltip() const noexcept { return _tooltip; }
        std::optional<int> GetIntValue() const noexcept { return _intValue; }

        //> Returns the input with this suggestion applied.
        std::string Apply(std::string_view input) const {
            if (_range.start() == 0 && _range.end() == static_cast<int>(input.length()))
                return _text;

            std::string result;
            result.reserve(input.length() + _text.length());
            result.append(input.substr(0, _range.start()));
            result.append(_text);
            if (_range.end() < static_cast<int>(input.length()))
                result.append(input.substr(_range.end()));

            return result;
        }

        //> Widens this suggestion to cover range, pulling the uncovered characters from command.
        Suggestion Expand(std::string_view command, StringRange const& range) const {
            if (range == _range)
                return *this;

            std::string result;
            if (range.start() < _range.start())
                result.append(command.substr(range.start(), _range.start() - range.start()));
            result.append(_text);
            if (range.end() > _range.end())
                result.append(command.substr(_range.end(), range.end() - _range.end()));

            Suggestion expanded { range, std::move(result), _tooltip };
            expanded._intValue = _intValue;
            return expanded;
        }

        bool operator == (Suggestion const& other) const noexcept {
            return _range == other._range && _text == other._text && _tooltip == other._tooltip;
        }

    private:
        StringRange _range;
        std::string _text;
        std::optional<std::string> _tooltip;
        std::optional<int> _intValue = std::nullopt;
    };

    /// <summary>
    /// An ordered, deduplicated set of suggestions sharing one replacement range.
    /// </summary>
    class Suggestions {
    public:
        Suggestions() = default;
        Suggestions(StringRange range, std::vector<Suggestion> list) : _range(range), _list(std::move(list)) { }

        StringRange const& GetRange() const noexcept { return _range; }
        std::vector<Suggestion> const& GetList() const noexcept { return _list; }
        bool IsEmpty() const noexcept { return _list.empty(); }

        static Suggestions Empty() { return Suggestions { }; }

        static std::future<Suggestions> EmptyFuture() {
            return Details::MakeReadyFuture(Suggestions { });
        }

        static Suggestions Merge(std::string_view command, std::vector<Suggestions> const& input) {
            if (input.empty())
                return Empty();
            if (input.size() == 1)
                return input.front();

            std::vector<Suggestion> all;
            for (auto const& suggestions : input)
                all.insert(all.end(), suggestions._list.begin(), suggestions._list.end());

            return Create(command, all);
        }

        //> Expands every suggestion to the union of their ranges, drops duplicate texts and
        //> sorts the result case-insensitively.
        static Suggestions Create(std::string_view command, std::vector<Suggestion> const& suggestions) {
            if (suggestions.empty())
                return Empty();

            int start = INT_MAX;
            int end = INT_MIN;
            for (auto const& suggestion : suggestions) {
                start = std::min(suggestion.GetRange().start(), start);
                end = std::max(suggestion.GetRange().end(), end);
            }

            StringRange range { start, end };

            std::unordered_set<std::string> seen;
            std::vector<Suggestion> sorted;
            sorted.reserve(suggestions.size());
            for (auto const& suggestion : suggestions) {
                Suggestion expanded = suggestion.Expand(command, range);
                if (seen.insert(expanded.GetText()).second)
                    sorted.push_back(std::move(expanded));
            }

            std::sort(sorted.begin(), sorted.end(), [](Suggestion const& a, Suggestion const& b) {
                if (boost::algorithm::ilexicographical_compare(a.GetText(), b.GetText()))
                    return true;
                if (boost::algorithm::ilexicographical_compare(b.GetText(), a.GetText()))
                    return false;
                return a.GetText() < b.GetText();
            });

            return Suggestions { range, std::move(sorted) };
        }

    private:
        StringRange _range;
        std::vector<Suggestion> _list;
    };

    /// <summary>
    /// Accumulates suggestions for the token starting at a given position of the input.
    /// </summary>
    class SuggestionsBuilder {
    public:
        SuggestionsBuilder(std::string input, std::string inputLowerCase, int start)
            : _input(std::move(input)),
              _inputLowerCase(std::move(inputLowerCase)),
              _start(start),
              _remaining(_input.substr(start)),
              _remainingLowerCase(_inputLowerCase.substr(start))
        { }

        SuggestionsBuilder(std::string const& input, int start)
            : SuggestionsBuilder(input, boost::algorithm::to_lower_copy(input), start)
        { }

        std::string const& GetInput() const noexcept { return _input; }
        int GetStart() const noexcept { return _start; }
        std::string const& GetRemaining() const noexcept { return _remaining; }
        std::string const& GetRemainingLowerCase() const noexcept { return _remainingLowerCase; }

        Suggestions Build() const { return Suggestions::Create(_input, _result); }
        std::future<Suggestions> BuildFuture() const { return Details::MakeReadyFuture(Build()); }

        //> Suggesting exactly what was already typed is a no-op.
        SuggestionsBuilder& Suggest(std::string text, std::optional<std::string> tooltip = std::nullopt) {
            if (text == _remaining)
                return *this;

            _result.emplace_back(StringRange::Between(_start, static_cast<int>(_input.length())), std::move(text), std::move(tooltip));
            return *this;
        }

        SuggestionsBuilder& Suggest(int value, std::optional<std::string> tooltip = std::nullopt) {
            _result.emplace_back(StringRange::Between(_start, static_cast<int>(_input.length())), value, std::move(tooltip));
            return *this;
        }

        SuggestionsBuilder& Add(SuggestionsBuilder const& other) {
            _result.insert(_result.end(), other._result.begin(), other._result.end());
            return *this;
        }

        SuggestionsBuilder CreateOffset(int start) const {
            return SuggestionsBuilder { _input, _inputLowerCase, start };
        }

        SuggestionsBuilder Restart() const { return CreateOffset(_start); }

    private:
        std::string _input;
        std::string _inputLowerCase;
        int _start;
        std::string _remaining;
        std::string _remainingLowerCase;
        std::vector<Suggestion> _result;
    };
}

#endif // SERGEANT_SUGGESTIONS_HEADER_GUARD_HPP__
