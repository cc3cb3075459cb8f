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

#ifndef SERGEANT_ARGUMENT_TYPES_HEADER_GUARD_HPP__
#define SERGEANT_ARGUMENT_TYPES_HEADER_GUARD_HPP__

#include <any>
#include <cstdint>
#include <future>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include "Exceptions.hpp"
#include "StringReader.hpp"
#include "Suggestions.hpp"

namespace Sergeant {
    /// <summary>
    /// Parser of argument values. Implementations throw CommandSyntaxException when the input
    /// at the cursor is not a valid value, leaving the cursor where the error was detected.
    /// </summary>
    class ArgumentType {
    public:
        virtual ~ArgumentType() = default;

        virtual std::any ParseAny(StringReader& reader) const = 0;

        virtual std::future<Suggestions> ListSuggestions(SuggestionsBuilder& /* builder */) const {
            return Suggestions::EmptyFuture();
        }

        //> Sample inputs this type accepts. Used to detect ambiguous siblings.
        virtual std::vector<std::string> GetExamples() const { return { }; }

        virtual std::string ToString() const = 0;
    };

    template <typename T>
    class TypedArgumentType : public ArgumentType {
    public:
        using value_type = T;

        virtual T Parse(StringReader& reader) const = 0;

        std::any ParseAny(StringReader& reader) const final {
            return std::any { Parse(reader) };
        }
    };

    class BoolArgumentType final : public TypedArgumentType<bool> {
    public:
        bool Parse(StringReader& reader) const override { return reader.ReadBoolean(); }

        std::future<Suggestions> ListSuggestions(SuggestionsBuilder& builder) const override {
            if (boost::algorithm::starts_with("true", builder.GetRemainingLowerCase()))
                builder.Suggest("true");
            if (boost::algorithm::starts_with("false", builder.GetRemainingLowerCase()))
                builder.Suggest("false");

            return builder.BuildFuture();
        }

        std::vector<std::string> GetExamples() const override { return { "true", "false" }; }
        std::string ToString() const override { return "bool()"; }
    };

    namespace Details {
        template <typename T> struct NumberTraits;

        template <> struct NumberTraits<std::int32_t> {
            constexpr static const char* Name = "integer";
            static std::int32_t Read(StringReader& reader) { return reader.ReadInt(); }
            static auto const& TooLow() { return BuiltInExceptions::IntegerTooLow(); }
            static auto const& TooHigh() { return BuiltInExceptions::IntegerTooHigh(); }
            static std::vector<std::string> Examples() { return { "0", "123", "-123" }; }
        };

        template <> struct NumberTraits<std::int64_t> {
            constexpr static const char* Name = "longArg";
            static std::int64_t Read(StringReader& reader) { return reader.ReadLong(); }
            static auto const& TooLow() { return BuiltInExceptions::LongTooLow(); }
            static auto const& TooHigh() { return BuiltInExceptions::LongTooHigh(); }
            static std::vector<std::string> Examples() { return { "0", "123", "-123" }; }
        };

        template <> struct NumberTraits<float> {
            constexpr static const char* Name = "float";
            static float Read(StringReader& reader) { return reader.ReadFloat(); }
            static auto const& TooLow() { return BuiltInExceptions::FloatTooLow(); }
            static auto const& TooHigh() { return BuiltInExceptions::FloatTooHigh(); }
            static std::vector<std::string> Examples() { return { "0", "1.2", ".5", "-1", "-.5", "-1234.56" }; }
        };

        template <> struct NumberTraits<double> {
            constexpr static const char* Name = "double";
            static double Read(StringReader& reader) { return reader.ReadDouble(); }
            static auto const& TooLow() { return BuiltInExceptions::DoubleTooLow(); }
            static auto const& TooHigh() { return BuiltInExceptions::DoubleTooHigh(); }
            static std::vector<std::string> Examples() { return { "0", "1.2", ".5", "-1", "-.5", "-1234.56" }; }
        };
    }

    /// <summary>
    /// Numeric argument bounded by an inclusive [minimum, maximum] range.
    /// </summary>
    template <typename T>
    class NumberArgumentType final : public TypedArgumentType<T> {
        using Traits = Details::NumberTraits<T>;

    public:
        explicit NumberArgumentType(T minimum = std::numeric_limits<T>::lowest(), T maximum = std::numeric_limits<T>::max()) noexcept
            : _minimum(minimum), _maximum(maximum)
        { }

        T GetMinimum() const noexcept { return _minimum; }
        T GetMaximum() const noexcept { return _maximum; }

        //> Out-of-range values rewind the cursor to the start of the number before throwing.
        T Parse(StringReader& reader) const override {
            int start = reader.GetCursor();
            T result = Traits::Read(reader);
            if (result < _minimum) {
                reader.SetCursor(start);
                throw Traits::TooLow().CreateWithContext(reader, result, _minimum);
            }
            if (result > _maximum) {
                reader.SetCursor(start);
                throw Traits::TooHigh().CreateWithContext(reader, result, _maximum);
            }
            return result;
        }

        std::vector<std::string> GetExamples() const override { return Traits::Examples(); }

        std::string ToString() const override {
            if (_minimum == std::numeric_limits<T>::lowest() && _maximum == std::numeric_limits<T>::max())
                return fmt::format("{}()", Traits::Name);
            if (_maximum == std::numeric_limits<T>::max())
                return fmt::format("{}({})", Traits::Name, _minimum);
            return fmt::format("{}({}, {})", Traits::Name, _minimum, _maximum);
        }

    private:
        T _minimum;
        T _maximum;
    };

    using IntegerArgumentType = NumberArgumentType<std::int32_t>;
    using LongArgumentType = NumberArgumentType<std::int64_t>;
    using FloatArgumentType = NumberArgumentType<float>;
    using DoubleArgumentType = NumberArgumentType<double>;

    class StringArgumentType final : public TypedArgumentType<std::string> {
    public:
        enum class Kind : std::uint8_t {
            SingleWord,     //> Unquoted characters up to the next separator.
            QuotablePhrase, //> A single word, or a quoted string that may contain separators.
            GreedyPhrase    //> Everything up to the end of the input.
        };

        explicit StringArgumentType(Kind kind) noexcept : _kind(kind) { }

        Kind GetKind() const noexcept { return _kind; }

        std::string Parse(StringReader& reader) const override {
            switch (_kind) {
                case Kind::GreedyPhrase:
                {
                    std::string text { reader.GetRemaining() };
                    reader.SetCursor(reader.GetTotalLength());
                    return text;
                }
                case Kind::SingleWord:
                    return reader.ReadUnquotedString();
                case Kind::QuotablePhrase:
                default:
                    return reader.ReadString();
            }
        }

        std::vector<std::string> GetExamples() const override {
            switch (_kind) {
                case Kind::SingleWord:
                    return { "word", "words_with_underscores" };
                case Kind::GreedyPhrase:
                    return { "word", "words with spaces", "\"and symbols\"" };
                case Kind::QuotablePhrase:
                default:
                    return { "\"quoted phrase\"", "word", "\"\"" };
            }
        }

        std::string ToString() const override {
            switch (_kind) {
                case Kind::SingleWord:
                    return "string(word)";
                case Kind::GreedyPhrase:
                    return "string(greedy)";
                case Kind::QuotablePhrase:
                default:
                    return "string(phrase)";
            }
        }

        //> Quotes input unless every character may appear in an unquoted string.
        static std::string EscapeIfRequired(std::string const& input) {
            for (char c : input) {
                if (!StringReader::IsAllowedInUnquotedString(c))
                    return Escape(input);
            }
            return input;
        }

        static std::string Escape(std::string const& input) {
            std::string result = "\"";
            for (char c : input) {
                if (c == '\\' || c == '"')
                    result.push_back('\\');
                result.push_back(c);
            }
            result.push_back('"');
            return result;
        }

    private:
        Kind _kind;
    };

    inline std::shared_ptr<const BoolArgumentType> Bool() {
        return std::make_shared<const BoolArgumentType>();
    }

    inline std::shared_ptr<const IntegerArgumentType> Integer(std::int32_t minimum = std::numeric_limits<std::int32_t>::lowest(),
        std::int32_t maximum = std::numeric_limits<std::int32_t>::max())
    {
        return std::make_shared<const IntegerArgumentType>(minimum, maximum);
    }

    inline std::shared_ptr<const LongArgumentType> Long(std::int64_t minimum = std::numeric_limits<std::int64_t>::lowest(),
        std::int64_t maximum = std::numeric_limits<std::int64_t>::max())
    {
        return std::make_shared<const LongArgumentType>(minimum, maximum);
    }

    inline std::shared_ptr<const FloatArgumentType> Float(float minimum = std::numeric_limits<float>::lowest(),
        float maximum = std::numeric_limits<float>::max())
    {
        return std::make_shared<const FloatArgumentType>(minimum, maximum);
    }

    inline std::shared_ptr<const DoubleArgumentType> Double(double minimum = std::numeric_limits<double>::lowest(),
        double maximum = std::numeric_limits<double>::max())
    {
        return std::make_shared<const DoubleArgumentType>(minimum, maximum);
    }

    inline std::shared_ptr<const StringArgumentType> Word() {
        return std::make_shared<const StringArgumentType>(StringArgumentType::Kind::SingleWord);
    }

    inline std::shared_ptr<const StringArgumentType> String() {
        return std::make_shared<const StringArgumentType>(StringArgumentType::Kind::QuotablePhrase);
    }

    inline std::shared_ptr<const StringArgumentType> GreedyString() {
        return std::make_shared<const StringArgumentType>(StringArgumentType::Kind::GreedyPhrase);
    }

    // ---- Typed accessors over a CommandContext ----

    template <typename Context>
    bool GetBool(Context const& context, std::string const& name) {
        return context.template GetArgument<bool>(name);
    }

    template <typename Context>
    std::int32_t GetInteger(Context const& context, std::string const& name) {
        return context.template GetArgument<std::int32_t>(name);
    }

    template <typename Context>
    std::int64_t GetLong(Context const& context, std::string const& name) {
        return context.template GetArgument<std::int64_t>(name);
    }

    template <typename Context>
    float GetFloat(Context const& context, std::string const& name) {
        return context.template GetArgument<float>(name);
    }

    template <typename Context>
    double GetDouble(Context const& context, std::string const& name) {
        return context.template GetArgument<double>(name);
    }

    template <typename Context>
    std::string GetString(Context const& context, std::string const& name) {
        return context.template GetArgument<std::string>(name);
    }
}

#endif // SERGEANT_ARGUMENT_TYPES_HEADER_GUARD_HPP__
