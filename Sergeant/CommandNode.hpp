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

#ifndef SERGEANT_COMMAND_NODE_HEADER_GUARD_HPP__
#define SERGEANT_COMMAND_NODE_HEADER_GUARD_HPP__

#include <algorithm>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <boost/algorithm/string.hpp>

#include "ArgumentTypes.hpp"
#include "Config.hpp"
#include "Context.hpp"
#include "Exceptions.hpp"
#include "StringReader.hpp"
#include "Suggestions.hpp"

namespace Sergeant {
    //> Decides whether a source may use a node.
    template <typename S>
    using Predicate = std::function<bool(S const&)>;

    //> Decides whether a node may be attempted given the parse so far and the upcoming input.
    template <typename S>
    using ContextPredicate = std::function<bool(CommandContextBuilder<S> const&, StringReader const&)>;

    //> Replaces the suggestions of an argument node's type.
    template <typename S>
    using SuggestionProvider = std::function<std::future<Suggestions>(CommandContext<S> const&, SuggestionsBuilder&)>;

    //> Receives (parent, child, sibling, inputs) for every pair of siblings that both accept inputs.
    template <typename S>
    using AmbiguityConsumer = std::function<void(CommandNode<S> const&, CommandNode<S> const&, CommandNode<S> const&, std::set<std::string> const&)>;

    namespace Details {
        template <typename T, typename U>
        constexpr static const bool IsKind = std::is_same_v<std::decay_t<T>, U>;
    }

    /// <summary>
    /// A node of a command tree. A node is either the root, a literal keyword or a typed
    /// argument; everything else (children, predicates, redirect) is shared by all three.
    /// Children are owned by their parent. Redirects point into the same tree and are not owned.
    /// </summary>
    /// <typeparam name="S">Type of the command source.</typeparam>
    template <typename S>
    class CommandNode {
    public:
        struct RootKind { };

        struct LiteralKind {
            std::string literal;
            std::string literalLowerCase;
        };

        struct ArgumentKind {
            std::string name;
            std::shared_ptr<const ArgumentType> type;
            SuggestionProvider<S> customSuggestions;
        };

        using Kind = std::variant<RootKind, LiteralKind, ArgumentKind>;

        explicit CommandNode(Kind kind,
            Command<S> command = { },
            Predicate<S> requirement = { },
            ContextPredicate<S> contextRequirement = { },
            CommandNode<S> const* redirect = nullptr,
            RedirectModifier<S> modifier = { },
            bool forks = false)
            : _kind(std::move(kind)),
              _command(std::move(command)),
              _requirement(std::move(requirement)),
              _contextRequirement(std::move(contextRequirement)),
              _redirect(redirect),
              _modifier(std::move(modifier)),
              _forks(forks)
        { }

        CommandNode(CommandNode<S> const&) = delete;
        CommandNode(CommandNode<S>&&) = default;
        CommandNode<S>& operator = (CommandNode<S> const&) = delete;
        CommandNode<S>& operator = (CommandNode<S>&&) = default;

        Kind const& kind() const noexcept { return _kind; }
        bool IsRoot() const noexcept { return std::holds_alternative<RootKind>(_kind); }
        bool IsLiteral() const noexcept { return std::holds_alternative<LiteralKind>(_kind); }
        bool IsArgument() const noexcept { return std::holds_alternative<ArgumentKind>(_kind); }

        Command<S> const& GetCommand() const noexcept { return _command; }
        CommandNode<S> const* GetRedirect() const noexcept { return _redirect; }
        RedirectModifier<S> const& GetRedirectModifier() const noexcept { return _modifier; }
        bool IsFork() const noexcept { return _forks; }

        Predicate<S> const& GetRequirement() const noexcept { return _requirement; }
        ContextPredicate<S> const& GetContextRequirement() const noexcept { return _contextRequirement; }

        std::vector<std::unique_ptr<CommandNode<S>>> const& GetChildren() const noexcept { return _children; }

        CommandNode<S> const* GetChild(std::string const& name) const {
            auto itr = _childrenByName.find(name);
            return itr == _childrenByName.end() ? nullptr : itr->second;
        }

        CommandNode<S>* GetChild(std::string const& name) {
            auto itr = _childrenByName.find(name);
            return itr == _childrenByName.end() ? nullptr : itr->second;
        }

        //> Type of an argument node; null for roots and literals.
        std::shared_ptr<const ArgumentType> GetArgumentType() const {
            if (auto argument = std::get_if<ArgumentKind>(&_kind))
                return argument->type;
            return nullptr;
        }

        bool CanUse(S const& source) const {
            return !_requirement || _requirement(source);
        }

        bool CanUse(CommandContextBuilder<S> const& context, StringReader const& reader) const {
            return !_contextRequirement || _contextRequirement(context, reader);
        }

        /// <summary>
        /// Adds a child. When a child of the same name exists the two are merged instead: the
        /// incoming command replaces the existing one only if it is set, and copies of the
        /// incoming grandchildren are added to the existing child under the same rules.
        /// The incoming node is kept alive, subtree intact, for as long as the child it merged
        /// into, so redirects that already point at it stay valid.
        /// </summary>
        /// <exception cref="StructuralError">A root node was given.</exception>
        void AddChild(std::unique_ptr<CommandNode<S>> node) {
            if (node->IsRoot())
                throw StructuralError("Cannot add a root node as a child to any other node");

            CommandNode<S>* existing = GetChild(node->GetName());
            if (existing == nullptr) {
                Insert(std::move(node));
                return;
            }

            existing->MergeFrom(*node);
            existing->_merged.push_back(std::move(node));
        }

        //> Detaches the child. Redirects into the removed subtree must not be followed afterwards.
        void RemoveChildByName(std::string const& name) {
            auto itr = _childrenByName.find(name);
            if (itr == _childrenByName.end())
                return;

            CommandNode<S>* child = itr->second;
            _childrenByName.erase(itr);
            _arguments.erase(std::remove(_arguments.begin(), _arguments.end(), child), _arguments.end());
            _children.erase(std::find_if(_children.begin(), _children.end(), [child](auto const& owned) {
                return owned.get() == child;
            }));
        }

        //> Deep copy of this node and its children. Redirects keep pointing at the same targets.
        std::unique_ptr<CommandNode<S>> Clone() const {
            std::unique_ptr<CommandNode<S>> result = CopyWithoutChildren();

            std::deque<std::pair<CommandNode<S>*, CommandNode<S> const*>> pending;
            pending.emplace_back(result.get(), this);

            while (!pending.empty()) {
                auto [copy, original] = pending.front();
                pending.pop_front();

                for (auto const& child : original->_children) {
                    std::unique_ptr<CommandNode<S>> childCopy = child->CopyWithoutChildren();
                    pending.emplace_back(childCopy.get(), child.get());
                    copy->Insert(std::move(childCopy));
                }
            }

            return result;
        }

        /// <summary>
        /// Selects the children worth attempting at the reader's position without moving it.
        /// A literal whose text equals the upcoming token comes first, followed by every argument
        /// child. Literals that do not match the token are never returned.
        /// </summary>
        std::vector<CommandNode<S> const*> GetRelevantNodes(StringReader const& input) const {
            std::vector<CommandNode<S> const*> nodes;

            if (_hasLiterals) {
                std::string_view remaining = input.GetRemaining();
                std::string text { remaining.substr(0, remaining.find(ArgumentSeparator)) };

                CommandNode<S> const* literal = GetChild(text);
                if (literal != nullptr && literal->IsLiteral()) {
                    nodes.reserve(_arguments.size() + 1);
                    nodes.push_back(literal); // Literals have priority over arguments
                }
            }

            nodes.insert(nodes.end(), _arguments.begin(), _arguments.end());
            return nodes;
        }

        std::string const& GetName() const {
            return std::visit([](auto const& kind) -> std::string const& {
                if constexpr (Details::IsKind<decltype(kind), LiteralKind>)
                    return kind.literal;
                else if constexpr (Details::IsKind<decltype(kind), ArgumentKind>)
                    return kind.name;
                else
                    return EmptyName();
            }, _kind);
        }

        std::string GetUsageText() const {
            return std::visit([](auto const& kind) -> std::string {
                if constexpr (Details::IsKind<decltype(kind), LiteralKind>)
                    return kind.literal;
                else if constexpr (Details::IsKind<decltype(kind), ArgumentKind>)
                    return "<" + kind.name + ">";
                else
                    return { };
            }, _kind);
        }

        std::vector<std::string> GetExamples() const {
            return std::visit([](auto const& kind) -> std::vector<std::string> {
                if constexpr (Details::IsKind<decltype(kind), LiteralKind>)
                    return { kind.literal };
                else if constexpr (Details::IsKind<decltype(kind), ArgumentKind>)
                    return kind.type->GetExamples();
                else
                    return { };
            }, _kind);
        }

        //> Whether this node alone would accept the whole of input.
        bool IsValidInput(std::string const& input) const {
            return std::visit([&input](auto const& kind) -> bool {
                if constexpr (Details::IsKind<decltype(kind), LiteralKind>) {
                    StringReader reader { input };
                    return ParseLiteral(kind.literal, reader) > -1;
                } else if constexpr (Details::IsKind<decltype(kind), ArgumentKind>) {
                    try {
                        StringReader reader { input };
                        kind.type->ParseAny(reader);
                        return !reader.CanRead() || reader.Peek() == ArgumentSeparator;
                    } catch (CommandSyntaxException const&) {
                        return false;
                    }
                } else {
                    return false;
                }
            }, _kind);
        }

        /// <summary>
        /// Matches this node at the reader's cursor and records the match in the context.
        /// </summary>
        /// <exception cref="CommandSyntaxException">The input does not match this node.</exception>
        void Parse(StringReader& reader, CommandContextBuilder<S>& context) const {
            std::visit([this, &reader, &context](auto const& kind) {
                int start = reader.GetCursor();

                if constexpr (Details::IsKind<decltype(kind), LiteralKind>) {
                    int end = ParseLiteral(kind.literal, reader);
                    if (end < 0)
                        throw BuiltInExceptions::LiteralIncorrect().CreateWithContext(reader, kind.literal);

                    context.WithNode(this, StringRange::Between(start, end));
                } else if constexpr (Details::IsKind<decltype(kind), ArgumentKind>) {
                    ParsedArgument parsed { StringRange { }, kind.type->ParseAny(reader) };
                    parsed.range = StringRange::Between(start, reader.GetCursor());

                    StringRange range = parsed.range;
                    context.WithArgument(kind.name, std::move(parsed));
                    context.WithNode(this, range);
                }
            }, _kind);
        }

        std::future<Suggestions> ListSuggestions(CommandContext<S> const& context, SuggestionsBuilder& builder) const {
            return std::visit([&context, &builder](auto const& kind) -> std::future<Suggestions> {
                if constexpr (Details::IsKind<decltype(kind), LiteralKind>) {
                    if (boost::algorithm::starts_with(kind.literalLowerCase, builder.GetRemainingLowerCase()))
                        return builder.Suggest(kind.literal).BuildFuture();

                    return Suggestions::EmptyFuture();
                } else if constexpr (Details::IsKind<decltype(kind), ArgumentKind>) {
                    if (kind.customSuggestions)
                        return kind.customSuggestions(context, builder);

                    return kind.type->ListSuggestions(builder);
                } else {
                    return Suggestions::EmptyFuture();
                }
            }, _kind);
        }

        /// <summary>
        /// Reports every pair of siblings where one accepts an example of the other, then
        /// searches each child's subtree. Design-time diagnostic; cost is quadratic in the
        /// number of children.
        /// </summary>
        void FindAmbiguities(AmbiguityConsumer<S> const& consumer) const {
            for (auto const& child : _children) {
                for (auto const& sibling : _children) {
                    if (child == sibling)
                        continue;

                    std::set<std::string> matches;
                    for (auto const& input : child->GetExamples()) {
                        if (sibling->IsValidInput(input))
                            matches.insert(input);
                    }

                    if (!matches.empty())
                        consumer(*this, *child, *sibling, matches);
                }

                child->FindAmbiguities(consumer);
            }
        }

        //> Literals sort before arguments, then by literal text or argument name.
        bool operator < (CommandNode<S> const& other) const {
            if (IsLiteral() == other.IsLiteral())
                return GetName() < other.GetName();

            return IsLiteral();
        }

    private:
        static std::string const& EmptyName() {
            static const std::string name;
            return name;
        }

        //> Returns the end of the literal, or -1 when it is not followed by a separator or the end
        //> of input. The cursor only moves on success.
        static int ParseLiteral(std::string const& literal, StringReader& reader) {
            int start = reader.GetCursor();
            if (!reader.CanRead(static_cast<int>(literal.length())))
                return -1;

            int end = start + static_cast<int>(literal.length());
            if (reader.GetString().compare(start, literal.length(), literal) != 0)
                return -1;

            reader.SetCursor(end);
            if (!reader.CanRead() || reader.Peek() == ArgumentSeparator)
                return end;

            reader.SetCursor(start);
            return -1;
        }

        std::unique_ptr<CommandNode<S>> CopyWithoutChildren() const {
            return std::make_unique<CommandNode<S>>(_kind, _command, _requirement, _contextRequirement, _redirect, _modifier, _forks);
        }

        //> Folds source into this node without touching source.
        void MergeFrom(CommandNode<S> const& source) {
            std::deque<std::pair<CommandNode<S>*, CommandNode<S> const*>> pending;
            pending.emplace_back(this, &source);

            while (!pending.empty()) {
                auto [target, incoming] = pending.front();
                pending.pop_front();

                if (incoming->_command)
                    target->_command = incoming->_command;

                for (auto const& child : incoming->_children) {
                    CommandNode<S>* existing = target->GetChild(child->GetName());
                    if (existing == nullptr)
                        target->Insert(child->Clone());
                    else
                        pending.emplace_back(existing, child.get());
                }
            }
        }

        void Insert(std::unique_ptr<CommandNode<S>> node) {
            CommandNode<S>* child = node.get();
            _childrenByName.emplace(child->GetName(), child);
            if (child->IsLiteral())
                _hasLiterals = true;
            else if (child->IsArgument())
                _arguments.push_back(child);

            _children.push_back(std::move(node));
        }

        Kind _kind;

        std::vector<std::unique_ptr<CommandNode<S>>> _children;
        std::unordered_map<std::string, CommandNode<S>*> _childrenByName;
        std::vector<CommandNode<S>*> _arguments;
        bool _hasLiterals = false;

        //> Nodes that were merged into this one. Not part of the tree, only kept alive.
        std::vector<std::unique_ptr<CommandNode<S>>> _merged;

        Command<S> _command;
        Predicate<S> _requirement;
        ContextPredicate<S> _contextRequirement;
        CommandNode<S> const* _redirect;
        RedirectModifier<S> _modifier;
        bool _forks;
    };
}

#endif // SERGEANT_COMMAND_NODE_HEADER_GUARD_HPP__
