#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "Sergeant/Sergeant.hpp"

using namespace Sergeant;

namespace {
    CommandDispatcher<int> MakeDispatcher() {
        CommandDispatcher<int> dispatcher;
        dispatcher.Register(Literal<int>("give")
            .Then(Argument<int>("count", Integer(1, 64))
                .Then(Argument<int>("item", Word())
                    .Executes([](CommandContext<int> const& context) { return GetInteger(context, "count"); }))));
        return dispatcher;
    }
}

TEST(context, arguments_are_typed)
{
    auto dispatcher = MakeDispatcher();
    auto parse = dispatcher.Parse("give 12 apple", 3);
    CommandContext<int> context = parse.GetContext().Build("give 12 apple");

    EXPECT_EQ(context.GetSource(), 3);
    EXPECT_EQ(GetInteger(context, "count"), 12);
    EXPECT_EQ(GetString(context, "item"), "apple");
    EXPECT_TRUE(context.HasArgument("count"));
    EXPECT_FALSE(context.HasArgument("missing"));
}

TEST(context, missing_argument_throws)
{
    auto dispatcher = MakeDispatcher();
    CommandContext<int> context = dispatcher.Parse("give 12 apple", 0).GetContext().Build("give 12 apple");

    EXPECT_THROW(GetInteger(context, "missing"), std::invalid_argument);
}

TEST(context, wrong_argument_type_throws)
{
    auto dispatcher = MakeDispatcher();
    CommandContext<int> context = dispatcher.Parse("give 12 apple", 0).GetContext().Build("give 12 apple");

    try {
        GetString(context, "count");
        FAIL() << "expected std::invalid_argument";
    } catch (std::invalid_argument const& ex) {
        EXPECT_NE(std::string { ex.what() }.find("'count'"), std::string::npos);
    }
}

TEST(context, nodes_and_range)
{
    auto dispatcher = MakeDispatcher();
    CommandContext<int> context = dispatcher.Parse("give 12 apple", 0).GetContext().Build("give 12 apple");

    ASSERT_EQ(context.GetNodes().size(), 3u);
    EXPECT_EQ(context.GetNodes()[0].node->GetName(), "give");
    EXPECT_EQ(context.GetNodes()[1].range, StringRange::Between(5, 7));
    EXPECT_EQ(context.GetNodes()[2].range, StringRange::Between(8, 13));
    EXPECT_EQ(context.GetRange(), StringRange::Between(0, 13));
    EXPECT_EQ(context.GetRange().Get(context.GetInput()), "give 12 apple");
    EXPECT_EQ(context.GetRootNode(), &dispatcher.GetRoot());
    EXPECT_TRUE(context.GetCommand());
    EXPECT_EQ(context.GetChild(), nullptr);
    EXPECT_EQ(&context.GetLastChild(), &context);
}

TEST(context, copy_for_replaces_source)
{
    auto dispatcher = MakeDispatcher();
    CommandContext<int> context = dispatcher.Parse("give 12 apple", 1).GetContext().Build("give 12 apple");
    CommandContext<int> copy = context.CopyFor(9);

    EXPECT_EQ(context.GetSource(), 1);
    EXPECT_EQ(copy.GetSource(), 9);
    EXPECT_EQ(GetInteger(copy, "count"), 12);
}

TEST(context, redirect_builds_child)
{
    CommandDispatcher<int> dispatcher;
    auto const& target = dispatcher.Register(Literal<int>("actual").Then(Literal<int>("run").Executes([](CommandContext<int> const&) { return 1; })));
    dispatcher.Register(Literal<int>("alias").Redirect(target));

    CommandContext<int> context = dispatcher.Parse("alias run", 0).GetContext().Build("alias run");
    ASSERT_NE(context.GetChild(), nullptr);
    EXPECT_EQ(context.GetChild()->GetRootNode(), &target);
    EXPECT_EQ(&context.GetLastChild(), context.GetChild());
    EXPECT_EQ(context.GetLastChild().GetNodes()[0].node->GetName(), "run");
}

TEST(context, suggestion_context_before_start_throws)
{
    CommandNode<int> root { CommandNode<int>::RootKind { } };
    CommandContextBuilder<int> context { 0, &root, 5 };

    EXPECT_THROW(context.FindSuggestionContext(2), std::logic_error);
}

TEST(context, suggestion_context_inside_node)
{
    auto dispatcher = MakeDispatcher();
    auto parse = dispatcher.Parse("give 12 apple", 0);

    auto inCount = parse.GetContext().FindSuggestionContext(6);
    EXPECT_EQ(inCount.parent->GetName(), "give");
    EXPECT_EQ(inCount.startPos, 5);

    auto inLiteral = parse.GetContext().FindSuggestionContext(2);
    EXPECT_EQ(inLiteral.parent, &dispatcher.GetRoot());
    EXPECT_EQ(inLiteral.startPos, 0);
}

TEST(context, suggestion_context_after_last_node)
{
    auto dispatcher = MakeDispatcher();
    auto parse = dispatcher.Parse("give ", 0);

    auto next = parse.GetContext().FindSuggestionContext(5);
    EXPECT_EQ(next.parent->GetName(), "give");
    EXPECT_EQ(next.startPos, 5);
}
