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

#ifndef SERGEANT_CONTEXT_HEADER_GUARD_HPP__
#define SERGEANT_CONTEXT_HEADER_GUARD_HPP__

#include <any>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/core/demangle.hpp>
#include <fmt/format.h>

#include "StringRange.hpp"

namespace Sergeant {
    template <typename S> class CommandNode;
    template <typename S> class CommandContext;

    //> Execution callback. Returns the command's result, throws CommandSyntaxException on failure.
    //> Inside a fork only CommandSyntaxException is recorded per branch; any other exception
    //> propagates and abandons the remaining branches.
    template <typename S>
    using Command = std::function<int(CommandContext<S> const&)>;

    //> Maps the source reaching a redirect to the sources the redirect target runs with.
    //> Failures follow the same rules as Command.
    template <typename S>
    using RedirectModifier = std::function<std::vector<S>(CommandContext<S> const&)>;

    struct ParsedArgument {
        StringRange range;
        std::any result;
    };

    template <typename S>
    struct ParsedCommandNode {
        CommandNode<S> const* node;
        StringRange range;
    };

    template <typename S>
    struct SuggestionContext {
        CommandNode<S> const* parent;
        int startPos;
    };

    /// <summary>
    /// Immutable result of a parse, handed to commands and redirect modifiers.
    /// </summary>
    template <typename S>
    class CommandContext {
    public:
        CommandContext(S source,
            std::string input,
            std::unordered_map<std::string, ParsedArgument> arguments,
            Command<S> command,
            CommandNode<S> const* rootNode,
            std::vector<ParsedCommandNode<S>> nodes,
            StringRange range,
            std::shared_ptr<const CommandContext<S>> child,
            RedirectModifier<S> modifier,
            bool forks)
            : _source(std::move(source)),
              _input(std::move(input)),
              _arguments(std::move(arguments)),
              _command(std::move(command)),
              _rootNode(rootNode),
              _nodes(std::move(nodes)),
              _range(range),
              _child(std::move(child)),
              _modifier(std::move(modifier)),
              _forks(forks)
        { }

        //> Returns a copy of this context running with another source.
        CommandContext<S> CopyFor(S source) const {
            CommandContext<S> copy { *this };
            copy._source = std::move(source);
            return copy;
        }

        CommandContext<S> const* GetChild() const noexcept { return _child.get(); }

        CommandContext<S> const& GetLastChild() const noexcept {
            CommandContext<S> const* result = this;
            while (result->GetChild() != nullptr)
                result = result->GetChild();
            return *result;
        }

        Command<S> const& GetCommand() const noexcept { return _command; }
        S const& GetSource() const noexcept { return _source; }
        RedirectModifier<S> const& GetRedirectModifier() const noexcept { return _modifier; }
        StringRange const& GetRange() const noexcept { return _range; }
        std::string const& GetInput() const noexcept { return _input; }
        CommandNode<S> const* GetRootNode() const noexcept { return _rootNode; }
        std::vector<ParsedCommandNode<S>> const& GetNodes() const noexcept { return _nodes; }
        bool HasNodes() const noexcept { return !_nodes.empty(); }
        bool IsForked() const noexcept { return _forks; }

        bool HasArgument(std::string const& name) const {
            return _arguments.find(name) != _arguments.end();
        }

        /// <summary>
        /// Returns the value bound to the argument node of the given name.
        /// </summary>
        /// <exception cref="std::invalid_argument">No such argument, or it holds another type.</exception>
        template <typename V>
        V const& GetArgument(std::string const& name) const {
            auto itr = _arguments.find(name);
            if (itr == _arguments.end())
                throw std::invalid_argument(fmt::format("No such argument '{}' exists on this command", name));

            V const* value = std::any_cast<V>(&itr->second.result);
            if (value == nullptr) {
                throw std::invalid_argument(fmt::format("Argument '{}' is defined as {}, not {}",
                    name,
                    boost::core::demangle(itr->second.result.type().name()),
                    boost::core::demangle(typeid(V).name())));
            }

            return *value;
        }

    private:
        S _source;
        std::string _input;
        std::unordered_map<std::string, ParsedArgument> _arguments;
        Command<S> _command;
        CommandNode<S> const* _rootNode;
        std::vector<ParsedCommandNode<S>> _nodes;
        StringRange _range;
        std::shared_ptr<const CommandContext<S>> _child;
        RedirectModifier<S> _modifier;
        bool _forks;
    };

    /// <summary>
    /// Mutable context grown while parsing. Copies are cheap enough to take one per
    /// attempted node; a redirect's child context is shared between copies.
    /// </summary>
    template <typename S>
    class CommandContextBuilder {
    public:
        CommandContextBuilder(S source, CommandNode<S> const* rootNode, int start)
            : _source(std::move(source)), _rootNode(rootNode), _range(StringRange::At(start))
        { }

        CommandContextBuilder<S> Copy() const { return *this; }

        CommandContextBuilder<S>& WithSource(S source) {
            _source = std::move(source);
            return *this;
        }

        S const& GetSource() const noexcept { return _source; }
        CommandNode<S> const* GetRootNode() const noexcept { return _rootNode; }

        CommandContextBuilder<S>& WithArgument(std::string const& name, ParsedArgument argument) {
            _arguments[name] = std::move(argument);
            return *this;
        }

        std::unordered_map<std::string, ParsedArgument> const& GetArguments() const noexcept { return _arguments; }

        CommandContextBuilder<S>& WithCommand(Command<S> command) {
            _command = std::move(command);
            return *this;
        }

        //> Appends a matched node. Its redirect modifier and fork flag become the context's.
        CommandContextBuilder<S>& WithNode(CommandNode<S> const* node, StringRange range) {
            _nodes.push_back(ParsedCommandNode<S> { node, range });
            _range = StringRange::Encompassing(_range, range);
            _modifier = node->GetRedirectModifier();
            _forks = node->IsFork();
            return *this;
        }

        CommandContextBuilder<S>& WithChild(CommandContextBuilder<S> child) {
            _child = std::make_shared<const CommandContextBuilder<S>>(std::move(child));
            return *this;
        }

        CommandContextBuilder<S> const* GetChild() const noexcept { return _child.get(); }

        CommandContextBuilder<S> const& GetLastChild() const noexcept {
            CommandContextBuilder<S> const* result = this;
            while (result->GetChild() != nullptr)
                result = result->GetChild();
            return *result;
        }

        Command<S> const& GetCommand() const noexcept { return _command; }
        std::vector<ParsedCommandNode<S>> const& GetNodes() const noexcept { return _nodes; }
        StringRange const& GetRange() const noexcept { return _range; }

        CommandContext<S> Build(std::string const& input) const {
            return CommandContext<S> {
                _source,
                input,
                _arguments,
                _command,
                _rootNode,
                _nodes,
                _range,
                _child == nullptr ? nullptr : std::make_shared<const CommandContext<S>>(_child->Build(input)),
                _modifier,
                _forks
            };
        }

        /// <summary>
        /// Finds the node whose children should be asked for completions at the given cursor,
        /// along with the position the completed token starts at.
        /// </summary>
        SuggestionContext<S> FindSuggestionContext(int cursor) const {
            if (_range.start() > cursor)
                throw std::logic_error("Can't find node before cursor");

            if (_range.end() < cursor) {
                if (_child != nullptr)
                    return _child->FindSuggestionContext(cursor);

                if (!_nodes.empty()) {
                    auto const& last = _nodes.back();
                    return SuggestionContext<S> { last.node, last.range.end() + 1 };
                }

                return SuggestionContext<S> { _rootNode, _range.start() };
            }

            CommandNode<S> const* previous = _rootNode;
            for (auto const& node : _nodes) {
                if (node.range.start() <= cursor && cursor <= node.range.end())
                    return SuggestionContext<S> { previous, node.range.start() };

                previous = node.node;
            }

            if (previous == nullptr)
                throw std::logic_error("Can't find node before cursor");

            return SuggestionContext<S> { previous, _range.start() };
        }

    private:
        S _source;
        CommandNode<S> const* _rootNode;
        std::unordered_map<std::string, ParsedArgument> _arguments;
        std::vector<ParsedCommandNode<S>> _nodes;
        Command<S> _command;
        std::shared_ptr<const CommandContextBuilder<S>> _child;
        StringRange _range;
        RedirectModifier<S> _modifier;
        bool _forks = false;
    };
}

#endif // SERGEANT_CONTEXT_HEADER_GUARD_HPP__
