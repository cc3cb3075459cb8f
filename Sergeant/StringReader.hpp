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

#ifndef SERGEANT_STRING_READER_HEADER_GUARD_HPP__
#define SERGEANT_STRING_READER_HEADER_GUARD_HPP__

#include <cctype>
#include <charconv>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

#include "Exceptions.hpp"

namespace Sergeant {
    namespace Details {
        //> Parses the whole of text as a T. Partial matches are rejected.
        template <typename T>
        bool ParseNumber(std::string_view text, T& value) noexcept {
            char const* first = text.data();
            char const* last = text.data() + text.size();

            std::from_chars_result result;
            if constexpr (std::is_floating_point_v<T>)
                result = std::from_chars(first, last, value, std::chars_format::general);
            else
                result = std::from_chars(first, last, value, 10);

            return result.ec == std::errc { } && result.ptr == last;
        }
    }

    /// <summary>
    /// Cursor over a command input. Copies share the underlying string, so taking a copy
    /// before a speculative read and discarding it on failure is cheap.
    /// </summary>
    class StringReader {
    public:
        explicit StringReader(std::string input)
            : _string(std::make_shared<const std::string>(std::move(input))), _cursor(0)
        { }

        StringReader(StringReader const&) = default;
        StringReader(StringReader&&) noexcept = default;
        StringReader& operator = (StringReader const&) = default;
        StringReader& operator = (StringReader&&) noexcept = default;

        std::string const& GetString() const noexcept { return *_string; }
        int GetCursor() const noexcept { return _cursor; }
        void SetCursor(int cursor) noexcept { _cursor = cursor; }

        int GetTotalLength() const noexcept { return static_cast<int>(_string->length()); }
        int GetRemainingLength() const noexcept { return GetTotalLength() - _cursor; }

        std::string_view GetRead() const noexcept { return std::string_view { *_string }.substr(0, _cursor); }
        std::string_view GetRemaining() const noexcept { return std::string_view { *_string }.substr(_cursor); }

        bool CanRead(int length) const noexcept { return _cursor + length <= GetTotalLength(); }
        bool CanRead() const noexcept { return CanRead(1); }

        char Peek() const noexcept { return (*_string)[_cursor]; }
        char Peek(int offset) const noexcept { return (*_string)[_cursor + offset]; }
        char Read() noexcept { return (*_string)[_cursor++]; }
        void Skip() noexcept { ++_cursor; }

        void SkipWhitespace() noexcept {
            while (CanRead() && std::isspace(static_cast<unsigned char>(Peek())))
                Skip();
        }

        constexpr static bool IsAllowedNumber(char c) noexcept {
            return (c >= '0' && c <= '9') || c == '.' || c == '-';
        }

        constexpr static bool IsQuotedStringStart(char c) noexcept {
            return c == '"' || c == '\'';
        }

        constexpr static bool IsAllowedInUnquotedString(char c) noexcept {
            return (c >= '0' && c <= '9')
                || (c >= 'A' && c <= 'Z')
                || (c >= 'a' && c <= 'z')
                || c == '_' || c == '-'
                || c == '.' || c == '+';
        }

        std::int32_t ReadInt() {
            return ReadNumber<std::int32_t>(BuiltInExceptions::ReaderExpectedInt(), BuiltInExceptions::ReaderInvalidInt());
        }

        std::int64_t ReadLong() {
            return ReadNumber<std::int64_t>(BuiltInExceptions::ReaderExpectedLong(), BuiltInExceptions::ReaderInvalidLong());
        }

        float ReadFloat() {
            return ReadNumber<float>(BuiltInExceptions::ReaderExpectedFloat(), BuiltInExceptions::ReaderInvalidFloat());
        }

        double ReadDouble() {
            return ReadNumber<double>(BuiltInExceptions::ReaderExpectedDouble(), BuiltInExceptions::ReaderInvalidDouble());
        }

        std::string ReadUnquotedString() {
            int start = _cursor;
            while (CanRead() && IsAllowedInUnquotedString(Peek()))
                Skip();

            return _string->substr(start, _cursor - start);
        }

        std::string ReadQuotedString() {
            if (!CanRead())
                return { };

            char next = Peek();
            if (!IsQuotedStringStart(next))
                throw BuiltInExceptions::ReaderExpectedStartOfQuote().CreateWithContext(*this);

            Skip();
            return ReadStringUntil(next);
        }

        //> Reads until the terminator, which is consumed but not returned. Backslash escapes
        //> the terminator and itself.
        std::string ReadStringUntil(char terminator) {
            std::string result;
            bool escaped = false;

            while (CanRead()) {
                char c = Read();
                if (escaped) {
                    if (c == terminator || c == '\\') {
                        result.push_back(c);
                        escaped = false;
                    } else {
                        SetCursor(_cursor - 1);
                        throw BuiltInExceptions::ReaderInvalidEscape().CreateWithContext(*this, c);
                    }
                } else if (c == '\\') {
                    escaped = true;
                } else if (c == terminator) {
                    return result;
                } else {
                    result.push_back(c);
                }
            }

            throw BuiltInExceptions::ReaderExpectedEndOfQuote().CreateWithContext(*this);
        }

        std::string ReadString() {
            if (!CanRead())
                return { };

            char next = Peek();
            if (IsQuotedStringStart(next)) {
                Skip();
                return ReadStringUntil(next);
            }

            return ReadUnquotedString();
        }

        bool ReadBoolean() {
            int start = _cursor;
            std::string value = ReadString();
            if (value.empty())
                throw BuiltInExceptions::ReaderExpectedBool().CreateWithContext(*this);

            if (value == "true")
                return true;
            if (value == "false")
                return false;

            _cursor = start;
            throw BuiltInExceptions::ReaderInvalidBool().CreateWithContext(*this, value);
        }

        void Expect(char c) {
            if (!CanRead() || Peek() != c)
                throw BuiltInExceptions::ReaderExpectedSymbol().CreateWithContext(*this, c);

            Skip();
        }

    private:
        template <typename T, typename Invalid>
        T ReadNumber(SimpleCommandExceptionType const& expected, Invalid const& invalid) {
            int start = _cursor;
            while (CanRead() && IsAllowedNumber(Peek()))
                Skip();

            std::string number = _string->substr(start, _cursor - start);
            if (number.empty())
                throw expected.CreateWithContext(*this);

            T value { };
            if (!Details::ParseNumber(number, value)) {
                _cursor = start;
                throw invalid.CreateWithContext(*this, number);
            }

            return value;
        }

        std::shared_ptr<const std::string> _string;
        int _cursor;
    };
}

#endif // SERGEANT_STRING_READER_HEADER_GUARD_HPP__
