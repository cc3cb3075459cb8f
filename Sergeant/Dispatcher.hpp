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

#ifndef SERGEANT_DISPATCHER_HEADER_GUARD_HPP__
#define SERGEANT_DISPATCHER_HEADER_GUARD_HPP__

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>

#include "Builder.hpp"
#include "CommandNode.hpp"
#include "Config.hpp"
#include "Context.hpp"
#include "Exceptions.hpp"
#include "StringReader.hpp"
#include "Suggestions.hpp"

namespace Sergeant {
    //> Notified of every command that ran or failed: (context, success, result).
    template <typename S>
    using ResultConsumer = std::function<void(CommandContext<S> const&, bool, int)>;

    /// <summary>
    /// Outcome of a parse: the context built so far, the reader positioned where parsing
    /// stopped, and the error of every node attempted at that position.
    /// </summary>
    template <typename S>
    class ParseResults {
    public:
        using Errors = std::vector<std::pair<CommandNode<S> const*, CommandSyntaxException>>;

        ParseResults(CommandContextBuilder<S> context, StringReader reader, Errors exceptions)
            : _context(std::move(context)), _reader(std::move(reader)), _exceptions(std::move(exceptions))
        { }

        CommandContextBuilder<S> const& GetContext() const noexcept { return _context; }
        StringReader const& GetReader() const noexcept { return _reader; }
        Errors const& GetExceptions() const noexcept { return _exceptions; }

        //> The error that got furthest into the input; the first one recorded on ties.
        CommandSyntaxException const* GetDeepestException() const noexcept {
            CommandSyntaxException const* result = nullptr;
            for (auto const& entry : _exceptions) {
                if (result == nullptr || entry.second.GetCursor() > result->GetCursor())
                    result = &entry.second;
            }
            return result;
        }

    private:
        CommandContextBuilder<S> _context;
        StringReader _reader;
        Errors _exceptions;
    };

    /// <summary>
    /// Outcome of an execution. Without forks, value is the sum of the command results.
    /// With forks, value is the number of successful branches and failures holds the error of
    /// every branch that failed.
    /// </summary>
    struct ExecutionResult {
        int value = 0;
        int successes = 0;
        bool forked = false;
        std::vector<CommandSyntaxException> failures;
    };

    /// <summary>
    /// Owns a command tree and runs the parse, execute and suggestion algorithms over it.
    /// The tree must not be modified while any of those run.
    /// </summary>
    /// <typeparam name="S">Type of the command source.</typeparam>
    template <typename S>
    class CommandDispatcher {
    public:
        explicit CommandDispatcher(DispatcherOptions options = { })
            : _root(std::make_unique<CommandNode<S>>(typename CommandNode<S>::RootKind { })), _options(std::move(options))
        { }

        CommandNode<S>& GetRoot() noexcept { return *_root; }
        CommandNode<S> const& GetRoot() const noexcept { return *_root; }
        DispatcherOptions const& GetOptions() const noexcept { return _options; }

        void SetConsumer(ResultConsumer<S> consumer) { _consumer = std::move(consumer); }

        //> Builds the command and adds it to the root. Returns the registered node, which is the
        //> pre-existing one when the command merged into it.
        template <typename Builder>
        CommandNode<S> const& Register(Builder&& command) {
            auto node = command.Build();
            std::string name = node->GetName();
            _root->AddChild(std::move(node));

            Log("registered command '{}'", name);
            return *_root->GetChild(name);
        }

        ParseResults<S> Parse(std::string command, S source) const {
            return Parse(StringReader { std::move(command) }, std::move(source));
        }

        ParseResults<S> Parse(StringReader const& command, S source) const {
            CommandContextBuilder<S> context { std::move(source), _root.get(), command.GetCursor() };
            ParseResults<S> result = ParseNodes(*_root, command, context);

            if (result.GetReader().CanRead())
                Log("parse of '{}' stopped at position {}", command.GetString(), result.GetReader().GetCursor());

            return result;
        }

        ExecutionResult Execute(std::string input, S source) const {
            return Execute(Parse(std::move(input), std::move(source)));
        }

        ExecutionResult Execute(StringReader const& input, S source) const {
            return Execute(Parse(input, std::move(source)));
        }

        /// <summary>
        /// Runs a parsed command, following redirects and forks.
        /// </summary>
        /// <exception cref="CommandSyntaxException">
        /// Input was left unparsed, no command was reached, or a command or redirect modifier
        /// failed outside of a fork.
        /// </exception>
        ExecutionResult Execute(ParseResults<S> const& parse) const {
            if (parse.GetReader().CanRead()) {
                if (auto deepest = parse.GetDeepestException())
                    throw *deepest;
                if (parse.GetContext().GetRange().empty())
                    throw BuiltInExceptions::DispatcherUnknownCommand().CreateWithContext(parse.GetReader());

                throw BuiltInExceptions::DispatcherUnknownArgument().CreateWithContext(parse.GetReader());
            }

            ExecutionResult result;
            bool foundCommand = false;

            std::string const& command = parse.GetReader().GetString();
            CommandContext<S> original = parse.GetContext().Build(command);

            std::vector<CommandContext<S>> contexts { original };
            std::vector<CommandContext<S>> next;

            while (!contexts.empty()) {
                for (auto const& context : contexts) {
                    CommandContext<S> const* child = context.GetChild();
                    if (child != nullptr) {
                        result.forked |= context.IsForked();
                        if (!child->HasNodes())
                            continue;

                        foundCommand = true;
                        auto const& modifier = context.GetRedirectModifier();
                        if (!modifier) {
                            next.push_back(child->CopyFor(context.GetSource()));
                            continue;
                        }

                        try {
                            for (auto&& source : modifier(context))
                                next.push_back(child->CopyFor(std::move(source)));
                        } catch (CommandSyntaxException const& ex) {
                            Notify(context, false, 0);
                            if (!result.forked)
                                throw;

                            Log("redirect modifier failed in forked branch: {}", ex.what());
                            result.failures.push_back(ex);
                        }
                    } else if (context.GetCommand()) {
                        foundCommand = true;
                        try {
                            int value = context.GetCommand()(context);
                            result.value += value;
                            ++result.successes;
                            Notify(context, true, value);
                        } catch (CommandSyntaxException const& ex) {
                            Notify(context, false, 0);
                            if (!result.forked)
                                throw;

                            Log("command failed in forked branch: {}", ex.what());
                            result.failures.push_back(ex);
                        }
                    }
                }

                contexts = std::move(next);
                next.clear();
            }

            if (!foundCommand) {
                Notify(original, false, 0);
                throw BuiltInExceptions::DispatcherUnknownCommand().CreateWithContext(parse.GetReader());
            }

            if (result.forked)
                result.value = result.successes;

            return result;
        }

        std::future<Suggestions> GetCompletionSuggestions(ParseResults<S> const& parse) const {
            return GetCompletionSuggestions(parse, parse.GetReader().GetTotalLength());
        }

        /// <summary>
        /// Computes the completions at cursor. Every candidate node is asked in its own task,
        /// launched per DispatcherOptions::suggestionLaunch or posted to suggestionPool;
        /// the tasks are joined before their results are merged, so the order of the returned
        /// suggestions does not depend on which task finished first.
        /// </summary>
        std::future<Suggestions> GetCompletionSuggestions(ParseResults<S> const& parse, int cursor) const {
            CommandContextBuilder<S> const& context = parse.GetContext();

            SuggestionContext<S> nodeBeforeCursor = context.FindSuggestionContext(cursor);
            CommandNode<S> const* parent = nodeBeforeCursor.parent;
            int start = std::min(nodeBeforeCursor.startPos, cursor);

            std::string const& fullInput = parse.GetReader().GetString();
            std::string truncatedInput = fullInput.substr(0, cursor);
            std::string truncatedInputLowerCase = boost::algorithm::to_lower_copy(truncatedInput);

            std::vector<std::future<Suggestions>> futures;
            futures.reserve(parent->GetChildren().size());

            for (auto const& node : parent->GetChildren()) {
                if (!node->CanUse(context.GetSource()))
                    continue;

                futures.push_back(Launch(
                    [node = node.get(),
                     nodeContext = context.Build(truncatedInput),
                     builder = SuggestionsBuilder { truncatedInput, truncatedInputLowerCase, start }]() mutable -> Suggestions
                    {
                        try {
                            return node->ListSuggestions(nodeContext, builder).get();
                        } catch (CommandSyntaxException const&) {
                            // A node that cannot suggest at this position contributes nothing.
                            return Suggestions::Empty();
                        }
                    }));
            }

            auto merge = [fullInput, futures = std::move(futures)]() mutable {
                std::vector<Suggestions> suggestions;
                suggestions.reserve(futures.size());
                for (auto& future : futures)
                    suggestions.push_back(future.get());

                return Suggestions::Merge(fullInput, suggestions);
            };

            // With a pool the join runs on the caller's thread, so pool threads never wait on each other.
            if (_options.suggestionPool != nullptr)
                return std::async(std::launch::deferred, std::move(merge));

            return std::async(_options.suggestionLaunch, std::move(merge));
        }

        //> Every executable path under node, one usage string per path.
        std::vector<std::string> GetAllUsage(CommandNode<S> const& node, S const& source, bool restricted) const {
            std::vector<std::string> result;
            GetAllUsage(node, source, result, "", restricted);
            return result;
        }

        //> One compact usage string per child of node that the source can use, in child order.
        std::vector<std::pair<CommandNode<S> const*, std::string>> GetSmartUsage(CommandNode<S> const& node, S const& source) const {
            std::vector<std::pair<CommandNode<S> const*, std::string>> result;

            bool optional = static_cast<bool>(node.GetCommand());
            for (auto const& child : node.GetChildren()) {
                if (auto usage = GetSmartUsage(*child, source, optional, false))
                    result.emplace_back(child.get(), std::move(*usage));
            }

            return result;
        }

        //> Names leading from the root to target, empty if target is not in this tree.
        std::vector<std::string> GetPath(CommandNode<S> const& target) const {
            std::vector<std::string> path;
            if (FindPath(*_root, target, path))
                return path;

            return { };
        }

        CommandNode<S> const* FindNode(std::vector<std::string> const& path) const {
            CommandNode<S> const* node = _root.get();
            for (auto const& name : path) {
                node = node->GetChild(name);
                if (node == nullptr)
                    return nullptr;
            }
            return node;
        }

        void FindAmbiguities(AmbiguityConsumer<S> const& consumer) const {
            _root->FindAmbiguities(consumer);
        }

        //> Writes every ambiguity to the diagnostic sink.
        void FindAmbiguities() const {
            _root->FindAmbiguities([this](CommandNode<S> const& parent, CommandNode<S> const& child, CommandNode<S> const& sibling, std::set<std::string> const& inputs) {
                Log("'{}': {} and {} both accept {}",
                    GetUsageOf(parent), child.GetUsageText(), sibling.GetUsageText(), fmt::join(inputs, ", "));
            });
        }

    private:
        ParseResults<S> ParseNodes(CommandNode<S> const& node, StringReader const& originalReader, CommandContextBuilder<S> const& contextSoFar) const {
            S const& source = contextSoFar.GetSource();
            typename ParseResults<S>::Errors errors;
            std::vector<ParseResults<S>> potentials;

            for (CommandNode<S> const* child : node.GetRelevantNodes(originalReader)) {
                if (!child->CanUse(source))
                    continue;

                // Every attempt works on copies; originalReader never moves.
                CommandContextBuilder<S> context = contextSoFar.Copy();
                StringReader reader { originalReader };

                if (!child->CanUse(context, reader))
                    continue;

                try {
                    try {
                        child->Parse(reader, context);
                    } catch (CommandSyntaxException const&) {
                        throw;
                    } catch (std::exception const& ex) {
                        throw BuiltInExceptions::DispatcherParseException().CreateWithContext(reader, std::string { ex.what() });
                    }

                    if (reader.CanRead() && reader.Peek() != ArgumentSeparator)
                        throw BuiltInExceptions::DispatcherExpectedArgumentSeparator().CreateWithContext(reader);
                } catch (CommandSyntaxException const& ex) {
                    errors.emplace_back(child, ex);
                    continue;
                }

                context.WithCommand(child->GetCommand());

                CommandNode<S> const* redirect = child->GetRedirect();
                if (reader.CanRead(redirect == nullptr ? 2 : 1)) {
                    reader.Skip();

                    if (redirect != nullptr) {
                        CommandContextBuilder<S> childContext { source, redirect, reader.GetCursor() };
                        ParseResults<S> parse = ParseNodes(*redirect, reader, childContext);

                        context.WithChild(parse.GetContext());
                        return ParseResults<S> { std::move(context), parse.GetReader(), parse.GetExceptions() };
                    }

                    potentials.push_back(ParseNodes(*child, reader, context));
                } else {
                    potentials.emplace_back(std::move(context), std::move(reader), typename ParseResults<S>::Errors { });
                }
            }

            if (potentials.empty())
                return ParseResults<S> { contextSoFar, originalReader, std::move(errors) };

            // Fully consumed input beats leftovers, then clean parses beat ones with errors.
            // Ties go to the earliest candidate, which keeps exact literals ahead of arguments.
            auto best = std::min_element(potentials.begin(), potentials.end(), [](ParseResults<S> const& a, ParseResults<S> const& b) {
                bool aDone = !a.GetReader().CanRead();
                bool bDone = !b.GetReader().CanRead();
                if (aDone != bDone)
                    return aDone;

                bool aClean = a.GetExceptions().empty();
                bool bClean = b.GetExceptions().empty();
                if (aClean != bClean)
                    return aClean;

                return false;
            });

            return std::move(*best);
        }

        template <typename Fn>
        std::future<Suggestions> Launch(Fn&& fn) const {
            if (_options.suggestionPool == nullptr)
                return std::async(_options.suggestionLaunch, std::forward<Fn>(fn));

            auto task = std::make_shared<std::packaged_task<Suggestions()>>(std::forward<Fn>(fn));
            std::future<Suggestions> result = task->get_future();
            boost::asio::post(*_options.suggestionPool, [task]() { (*task)(); });
            return result;
        }

        void Notify(CommandContext<S> const& context, bool success, int result) const {
            if (_consumer)
                _consumer(context, success, result);
        }

        template <typename... Args>
        void Log(fmt::format_string<Args...> format, Args&&... args) const {
            if (_options.diagnostics == nullptr)
                return;

            fmt::print(*_options.diagnostics, "[sergeant] {}\n", fmt::format(format, std::forward<Args>(args)...));
        }

        std::string RedirectUsage(CommandNode<S> const& node) const {
            if (node.GetRedirect() == _root.get())
                return "...";

            return "-> " + node.GetRedirect()->GetUsageText();
        }

        std::string GetUsageOf(CommandNode<S> const& node) const {
            std::vector<std::string> path = GetPath(node);
            return path.empty() ? std::string { "<root>" } : fmt::format("{}", fmt::join(path, " "));
        }

        void GetAllUsage(CommandNode<S> const& node, S const& source, std::vector<std::string>& result, std::string const& prefix, bool restricted) const {
            if (restricted && !node.CanUse(source))
                return;

            if (node.GetCommand())
                result.push_back(prefix);

            if (node.GetRedirect() != nullptr) {
                result.push_back(prefix.empty()
                    ? node.GetUsageText() + ArgumentSeparator + RedirectUsage(node)
                    : prefix + ArgumentSeparator + RedirectUsage(node));
                return;
            }

            for (auto const& child : node.GetChildren()) {
                GetAllUsage(*child, source, result,
                    prefix.empty() ? child->GetUsageText() : prefix + ArgumentSeparator + child->GetUsageText(),
                    restricted);
            }
        }

        std::optional<std::string> GetSmartUsage(CommandNode<S> const& node, S const& source, bool optional, bool deep) const {
            if (!node.CanUse(source))
                return std::nullopt;

            UsageFormat const& format = _options.usage;

            std::string self = optional
                ? format.optionalOpen + node.GetUsageText() + format.optionalClose
                : node.GetUsageText();

            if (deep)
                return self;

            if (node.GetRedirect() != nullptr)
                return self + ArgumentSeparator + RedirectUsage(node);

            bool childOptional = static_cast<bool>(node.GetCommand());
            std::string const& open = childOptional ? format.optionalOpen : format.requiredOpen;
            std::string const& close = childOptional ? format.optionalClose : format.requiredClose;

            std::vector<CommandNode<S> const*> children;
            for (auto const& child : node.GetChildren()) {
                if (child->CanUse(source))
                    children.push_back(child.get());
            }

            if (children.size() == 1) {
                if (auto usage = GetSmartUsage(*children.front(), source, childOptional, childOptional))
                    return self + ArgumentSeparator + *usage;
            } else if (children.size() > 1) {
                std::vector<std::string> childUsage;
                for (CommandNode<S> const* child : children) {
                    auto usage = GetSmartUsage(*child, source, childOptional, true);
                    if (usage.has_value() && std::find(childUsage.begin(), childUsage.end(), *usage) == childUsage.end())
                        childUsage.push_back(std::move(*usage));
                }

                if (childUsage.size() == 1) {
                    std::string const& usage = childUsage.front();
                    return self + ArgumentSeparator + (childOptional ? format.optionalOpen + usage + format.optionalClose : usage);
                }

                if (childUsage.size() > 1) {
                    std::string alternatives = open;
                    for (std::size_t i = 0; i < children.size(); ++i) {
                        if (i > 0)
                            alternatives += format.alternative;
                        alternatives += children[i]->GetUsageText();
                    }
                    alternatives += close;
                    return self + ArgumentSeparator + alternatives;
                }
            }

            return self;
        }

        static bool FindPath(CommandNode<S> const& node, CommandNode<S> const& target, std::vector<std::string>& path) {
            if (&node == &target)
                return true;

            for (auto const& child : node.GetChildren()) {
                path.push_back(child->GetName());
                if (FindPath(*child, target, path))
                    return true;
                path.pop_back();
            }

            return false;
        }

        std::unique_ptr<CommandNode<S>> _root;
        DispatcherOptions _options;
        ResultConsumer<S> _consumer;
    };
}

#endif // SERGEANT_DISPATCHER_HEADER_GUARD_HPP__
