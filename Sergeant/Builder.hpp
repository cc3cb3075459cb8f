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

#ifndef SERGEANT_BUILDER_HEADER_GUARD_HPP__
#define SERGEANT_BUILDER_HEADER_GUARD_HPP__

#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/callable_traits/return_type.hpp>

#include "ArgumentTypes.hpp"
#include "CommandNode.hpp"
#include "Context.hpp"
#include "Exceptions.hpp"

namespace Sergeant {
    namespace Details {
        template <typename T> struct IsNodePointerT : std::false_type { };
        template <typename S> struct IsNodePointerT<std::unique_ptr<CommandNode<S>>> : std::true_type { };

        template <typename T>
        constexpr static const bool IsNodePointer = IsNodePointerT<std::decay_t<T>>::value;
    }

    /// <summary>
    /// Fluent construction of a command node and its subtree.
    /// </summary>
    /// <typeparam name="S">Type of the command source.</typeparam>
    /// <typeparam name="Self">Concrete builder, returned by every setter.</typeparam>
    template <typename S, typename Self>
    class ArgumentBuilder {
    public:
        /// <summary>
        /// Adds a child, given either as a builder or as an already built node. Builders are left
        /// untouched and may be reused. Children sharing a name are merged.
        /// </summary>
        /// <exception cref="StructuralError">This node redirects, or the child is a root.</exception>
        template <typename Child>
        Self& Then(Child&& child) {
            if (_target != nullptr)
                throw StructuralError("Cannot add children to a redirected node");

            if constexpr (Details::IsNodePointer<Child>) {
                static_assert(!std::is_lvalue_reference_v<Child>, "Built nodes are taken over; pass them as rvalues.");
                _arguments.AddChild(std::move(child));
            } else
                _arguments.AddChild(child.Build());

            return GetThis();
        }

        //> Sets the command. Callables returning void report a result of 1.
        template <typename Fn>
        Self& Executes(Fn&& fn) {
            using result_type = boost::callable_traits::return_type_t<std::decay_t<Fn>>;

            if constexpr (std::is_void_v<result_type>) {
                _command = [fn = std::forward<Fn>(fn)](CommandContext<S> const& context) mutable -> int {
                    fn(context);
                    return 1;
                };
            } else {
                static_assert(std::is_convertible_v<result_type, int>, "Command handlers must return void or an integer.");
                _command = Command<S> { std::forward<Fn>(fn) };
            }

            return GetThis();
        }

        Self& Requires(Predicate<S> requirement) {
            _requirement = std::move(requirement);
            return GetThis();
        }

        Self& RequiresContext(ContextPredicate<S> requirement) {
            _contextRequirement = std::move(requirement);
            return GetThis();
        }

        Self& Redirect(CommandNode<S> const& target, RedirectModifier<S> modifier = { }) {
            return Forward(&target, std::move(modifier), false);
        }

        Self& Fork(CommandNode<S> const& target, RedirectModifier<S> modifier) {
            return Forward(&target, std::move(modifier), true);
        }

        /// <exception cref="StructuralError">This node already has children.</exception>
        Self& Forward(CommandNode<S> const* target, RedirectModifier<S> modifier, bool fork) {
            if (!_arguments.GetChildren().empty())
                throw StructuralError("Cannot forward a node with children");

            _target = target;
            _modifier = std::move(modifier);
            _forks = fork;
            return GetThis();
        }

        std::vector<std::unique_ptr<CommandNode<S>>> const& GetArguments() const noexcept { return _arguments.GetChildren(); }
        Command<S> const& GetCommand() const noexcept { return _command; }
        Predicate<S> const& GetRequirement() const noexcept { return _requirement; }
        CommandNode<S> const* GetRedirect() const noexcept { return _target; }
        RedirectModifier<S> const& GetRedirectModifier() const noexcept { return _modifier; }
        bool IsFork() const noexcept { return _forks; }

    protected:
        //> Creates the node with copies of the accumulated children.
        std::unique_ptr<CommandNode<S>> BuildNode(typename CommandNode<S>::Kind kind) const {
            auto result = std::make_unique<CommandNode<S>>(std::move(kind),
                _command,
                _requirement,
                _contextRequirement,
                _target,
                _modifier,
                _forks);

            for (auto const& child : _arguments.GetChildren())
                result->AddChild(child->Clone());

            return result;
        }

    private:
        Self& GetThis() noexcept { return static_cast<Self&>(*this); }

        CommandNode<S> _arguments { typename CommandNode<S>::RootKind { } };
        Command<S> _command;
        Predicate<S> _requirement;
        ContextPredicate<S> _contextRequirement;
        CommandNode<S> const* _target = nullptr;
        RedirectModifier<S> _modifier;
        bool _forks = false;
    };

    template <typename S>
    class LiteralArgumentBuilder final : public ArgumentBuilder<S, LiteralArgumentBuilder<S>> {
    public:
        explicit LiteralArgumentBuilder(std::string literal) : _literal(std::move(literal)) { }

        std::string const& GetLiteral() const noexcept { return _literal; }

        std::unique_ptr<CommandNode<S>> Build() const {
            return this->BuildNode(typename CommandNode<S>::LiteralKind {
                _literal,
                boost::algorithm::to_lower_copy(_literal)
            });
        }

    private:
        std::string _literal;
    };

    template <typename S>
    class RequiredArgumentBuilder final : public ArgumentBuilder<S, RequiredArgumentBuilder<S>> {
    public:
        RequiredArgumentBuilder(std::string name, std::shared_ptr<const ArgumentType> type)
            : _name(std::move(name)), _type(std::move(type))
        { }

        //> Replaces the suggestions of the argument type for this node.
        RequiredArgumentBuilder<S>& Suggests(SuggestionProvider<S> provider) {
            _suggestionsProvider = std::move(provider);
            return *this;
        }

        std::string const& GetName() const noexcept { return _name; }
        std::shared_ptr<const ArgumentType> const& GetType() const noexcept { return _type; }
        SuggestionProvider<S> const& GetSuggestionsProvider() const noexcept { return _suggestionsProvider; }

        std::unique_ptr<CommandNode<S>> Build() const {
            return this->BuildNode(typename CommandNode<S>::ArgumentKind { _name, _type, _suggestionsProvider });
        }

    private:
        std::string _name;
        std::shared_ptr<const ArgumentType> _type;
        SuggestionProvider<S> _suggestionsProvider;
    };

    template <typename S>
    LiteralArgumentBuilder<S> Literal(std::string literal) {
        return LiteralArgumentBuilder<S> { std::move(literal) };
    }

    template <typename S>
    RequiredArgumentBuilder<S> Argument(std::string name, std::shared_ptr<const ArgumentType> type) {
        return RequiredArgumentBuilder<S> { std::move(name), std::move(type) };
    }
}

#endif // SERGEANT_BUILDER_HEADER_GUARD_HPP__
