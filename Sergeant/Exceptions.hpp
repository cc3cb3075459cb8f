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

#ifndef SERGEANT_EXCEPTIONS_HEADER_GUARD_HPP__
#define SERGEANT_EXCEPTIONS_HEADER_GUARD_HPP__

#include <algorithm>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace Sergeant {
    /// <summary>
    /// Raised when a command tree is assembled in a way that can never be valid,
    /// such as adding a root node as the child of another node.
    /// </summary>
    struct StructuralError : std::logic_error {
        using std::logic_error::logic_error;
    };

    //> Identity of a family of syntax errors. Instances are compared by address.
    struct CommandExceptionType {
        virtual ~CommandExceptionType() = default;
    };

    class CommandSyntaxException : public std::exception {
    public:
        //> Number of input characters shown before the cursor in rendered messages.
        constexpr static const int ContextAmount = 10;

        CommandSyntaxException(CommandExceptionType const* type, std::string message)
            : _type(type), _message(std::move(message)), _input(std::nullopt), _cursor(-1)
        {
            _rendered = Render();
        }

        CommandSyntaxException(CommandExceptionType const* type, std::string message, std::string input, int cursor)
            : _type(type), _message(std::move(message)), _input(std::move(input)), _cursor(cursor)
        {
            _rendered = Render();
        }

        const char* what() const noexcept override { return _rendered.c_str(); }

        CommandExceptionType const* GetType() const noexcept { return _type; }
        std::string const& GetRawMessage() const noexcept { return _message; }
        std::optional<std::string> const& GetInput() const noexcept { return _input; }
        int GetCursor() const noexcept { return _cursor; }

        //> Returns the input leading up to the cursor, or nothing if this error has no position.
        std::optional<std::string> GetContext() const {
            if (!_input.has_value() || _cursor < 0)
                return std::nullopt;

            std::string_view input { *_input };
            int cursor = std::min(static_cast<int>(input.length()), _cursor);
            int from = std::max(0, cursor - ContextAmount);

            return fmt::format("{}{}<--[HERE]",
                cursor > ContextAmount ? "..." : "",
                input.substr(from, cursor - from));
        }

    private:
        std::string Render() const {
            auto context = GetContext();
            if (!context.has_value())
                return _message;

            return fmt::format("{} at position {}: {}", _message, _cursor, *context);
        }

        CommandExceptionType const* _type;
        std::string _message;
        std::optional<std::string> _input;
        int _cursor;
        std::string _rendered;
    };

    /// <summary>
    /// Produces syntax errors carrying a fixed message.
    /// </summary>
    struct SimpleCommandExceptionType final : CommandExceptionType {
        explicit SimpleCommandExceptionType(std::string message) : _message(std::move(message)) { }

        CommandSyntaxException Create() const {
            return CommandSyntaxException { this, _message };
        }

        template <typename Reader>
        CommandSyntaxException CreateWithContext(Reader const& reader) const {
            return CommandSyntaxException { this, _message, std::string { reader.GetString() }, reader.GetCursor() };
        }

    private:
        std::string _message;
    };

    /// <summary>
    /// Produces syntax errors whose message is rendered from a format string and the
    /// parameters given at creation. Positional fields ({0}, {1}) may reorder them.
    /// </summary>
    template <typename... Args>
    struct DynamicCommandExceptionType final : CommandExceptionType {
        explicit DynamicCommandExceptionType(std::string format) : _format(std::move(format)) { }

        CommandSyntaxException Create(Args const&... args) const {
            return CommandSyntaxException { this, fmt::format(fmt::runtime(_format), args...) };
        }

        template <typename Reader>
        CommandSyntaxException CreateWithContext(Reader const& reader, Args const&... args) const {
            return CommandSyntaxException { this,
                fmt::format(fmt::runtime(_format), args...),
                std::string { reader.GetString() },
                reader.GetCursor() };
        }

    private:
        std::string _format;
    };

    /// <summary>
    /// Error families raised by the reader, the built-in argument types and the dispatcher.
    /// Range errors take (found, bound).
    /// </summary>
    struct BuiltInExceptions {
        template <typename T>
        using RangeError = DynamicCommandExceptionType<T, T>;

        static RangeError<double> const& DoubleTooLow() {
            static const RangeError<double> type { "Double must not be less than {1}, found {0}" };
            return type;
        }

        static RangeError<double> const& DoubleTooHigh() {
            static const RangeError<double> type { "Double must not be more than {1}, found {0}" };
            return type;
        }

        static RangeError<float> const& FloatTooLow() {
            static const RangeError<float> type { "Float must not be less than {1}, found {0}" };
            return type;
        }

        static RangeError<float> const& FloatTooHigh() {
            static const RangeError<float> type { "Float must not be more than {1}, found {0}" };
            return type;
        }

        static RangeError<std::int32_t> const& IntegerTooLow() {
            static const RangeError<std::int32_t> type { "Integer must not be less than {1}, found {0}" };
            return type;
        }

        static RangeError<std::int32_t> const& IntegerTooHigh() {
            static const RangeError<std::int32_t> type { "Integer must not be more than {1}, found {0}" };
            return type;
        }

        static RangeError<std::int64_t> const& LongTooLow() {
            static const RangeError<std::int64_t> type { "Long must not be less than {1}, found {0}" };
            return type;
        }

        static RangeError<std::int64_t> const& LongTooHigh() {
            static const RangeError<std::int64_t> type { "Long must not be more than {1}, found {0}" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& LiteralIncorrect() {
            static const DynamicCommandExceptionType<std::string> type { "Expected literal {}" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedStartOfQuote() {
            static const SimpleCommandExceptionType type { "Expected quote to start a string" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedEndOfQuote() {
            static const SimpleCommandExceptionType type { "Unclosed quoted string" };
            return type;
        }

        static DynamicCommandExceptionType<char> const& ReaderInvalidEscape() {
            static const DynamicCommandExceptionType<char> type { "Invalid escape sequence '{}' in quoted string" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& ReaderInvalidBool() {
            static const DynamicCommandExceptionType<std::string> type { "Invalid bool, expected true or false but found '{}'" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& ReaderInvalidInt() {
            static const DynamicCommandExceptionType<std::string> type { "Invalid integer '{}'" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedInt() {
            static const SimpleCommandExceptionType type { "Expected integer" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& ReaderInvalidLong() {
            static const DynamicCommandExceptionType<std::string> type { "Invalid long '{}'" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedLong() {
            static const SimpleCommandExceptionType type { "Expected long" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& ReaderInvalidDouble() {
            static const DynamicCommandExceptionType<std::string> type { "Invalid double '{}'" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedDouble() {
            static const SimpleCommandExceptionType type { "Expected double" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& ReaderInvalidFloat() {
            static const DynamicCommandExceptionType<std::string> type { "Invalid float '{}'" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedFloat() {
            static const SimpleCommandExceptionType type { "Expected float" };
            return type;
        }

        static SimpleCommandExceptionType const& ReaderExpectedBool() {
            static const SimpleCommandExceptionType type { "Expected bool" };
            return type;
        }

        static DynamicCommandExceptionType<char> const& ReaderExpectedSymbol() {
            static const DynamicCommandExceptionType<char> type { "Expected '{}'" };
            return type;
        }

        static SimpleCommandExceptionType const& DispatcherUnknownCommand() {
            static const SimpleCommandExceptionType type { "Unknown command" };
            return type;
        }

        static SimpleCommandExceptionType const& DispatcherUnknownArgument() {
            static const SimpleCommandExceptionType type { "Incorrect argument for command" };
            return type;
        }

        static SimpleCommandExceptionType const& DispatcherExpectedArgumentSeparator() {
            static const SimpleCommandExceptionType type { "Expected whitespace to end one argument, but found trailing data" };
            return type;
        }

        static DynamicCommandExceptionType<std::string> const& DispatcherParseException() {
            static const DynamicCommandExceptionType<std::string> type { "Could not parse command: {}" };
            return type;
        }
    };
}

#endif // SERGEANT_EXCEPTIONS_HEADER_GUARD_HPP__
