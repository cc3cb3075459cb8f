#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "Sergeant/Sergeant.hpp"

using namespace Sergeant;

namespace {
    using Node = CommandNode<int>;

    Command<int> Returns(int value) {
        return [value](CommandContext<int> const&) { return value; };
    }

    int Run(Node const& node, int source = 0) {
        CommandContext<int> context = CommandContextBuilder<int> { source, nullptr, 0 }.Build("");
        return node.GetCommand()(context);
    }
}

TEST(builder, then_accumulates_children)
{
    auto builder = Literal<int>("foo");
    builder.Then(Literal<int>("bar")).Then(Argument<int>("n", Integer()));

    ASSERT_EQ(builder.GetArguments().size(), 2u);
    EXPECT_TRUE(builder.GetArguments()[0]->IsLiteral());
    EXPECT_TRUE(builder.GetArguments()[1]->IsArgument());
}

TEST(builder, then_accepts_built_nodes)
{
    auto child = Literal<int>("bar").Build();
    auto node = Literal<int>("foo").Then(std::move(child)).Build();

    ASSERT_EQ(node->GetChildren().size(), 1u);
    EXPECT_EQ(node->GetChildren()[0]->GetName(), "bar");
}

TEST(builder, build_keeps_builder_children)
{
    auto builder = Literal<int>("foo");
    builder.Then(Literal<int>("bar")).Then(Literal<int>("baz"));

    auto first = builder.Build();
    auto second = builder.Build();
    EXPECT_EQ(first->GetChildren().size(), 2u);
    EXPECT_EQ(second->GetChildren().size(), 2u);
    EXPECT_NE(first->GetChild("bar"), second->GetChild("bar"));
    EXPECT_EQ(builder.GetArguments().size(), 2u);
}

TEST(builder, shared_subcommand)
{
    auto sub = Literal<int>("sub");
    sub.Then(Literal<int>("x").Executes(Returns(1)));

    CommandDispatcher<int> dispatcher;
    dispatcher.Register(Literal<int>("a").Then(sub));
    dispatcher.Register(Literal<int>("b").Then(sub));

    EXPECT_EQ(dispatcher.Execute("a sub x", 0).value, 1);
    EXPECT_EQ(dispatcher.Execute("b sub x", 0).value, 1);
}

TEST(builder, register_on_two_dispatchers)
{
    auto foo = Literal<int>("foo");
    foo.Then(Literal<int>("bar").Executes(Returns(2)));

    CommandDispatcher<int> first;
    CommandDispatcher<int> second;
    first.Register(foo);
    second.Register(foo);

    EXPECT_EQ(first.Execute("foo bar", 0).value, 2);
    EXPECT_EQ(second.Execute("foo bar", 0).value, 2);
}

TEST(builder, then_after_redirect_throws)
{
    Node target { Node::RootKind { } };
    auto builder = Literal<int>("foo");
    builder.Redirect(target);

    EXPECT_THROW(builder.Then(Literal<int>("bar")), StructuralError);
}

TEST(builder, redirect_after_then_throws)
{
    Node target { Node::RootKind { } };
    auto builder = Literal<int>("foo");
    builder.Then(Literal<int>("bar"));

    EXPECT_THROW(builder.Redirect(target), StructuralError);
    EXPECT_THROW(builder.Fork(target, { }), StructuralError);
}

TEST(builder, then_root_throws)
{
    auto builder = Literal<int>("foo");
    EXPECT_THROW(builder.Then(std::make_unique<Node>(Node::RootKind { })), StructuralError);
}

TEST(builder, executes_integer)
{
    auto node = Literal<int>("foo").Executes([](CommandContext<int> const& context) {
        return context.GetSource() * 2;
    }).Build();

    ASSERT_TRUE(node->GetCommand());
    EXPECT_EQ(::Run(*node, 21), 42);
}

TEST(builder, executes_void_reports_one)
{
    int calls = 0;
    auto node = Literal<int>("foo").Executes([&calls](CommandContext<int> const&) {
        ++calls;
    }).Build();

    EXPECT_EQ(::Run(*node), 1);
    EXPECT_EQ(calls, 1);
}

TEST(builder, redirect)
{
    Node target { Node::RootKind { } };
    auto node = Literal<int>("alias").Redirect(target).Build();

    EXPECT_EQ(node->GetRedirect(), &target);
    EXPECT_FALSE(node->IsFork());
    EXPECT_FALSE(node->GetRedirectModifier());
}

TEST(builder, fork)
{
    Node target { Node::RootKind { } };
    auto node = Literal<int>("each").Fork(target, [](CommandContext<int> const&) {
        return std::vector<int> { 1, 2, 3 };
    }).Build();

    EXPECT_EQ(node->GetRedirect(), &target);
    EXPECT_TRUE(node->IsFork());
    EXPECT_TRUE(node->GetRedirectModifier());
}

TEST(builder, requirement_is_kept)
{
    auto builder = Literal<int>("foo");
    builder.Requires([](int const& source) { return source == 3; });

    ASSERT_TRUE(builder.GetRequirement());
    auto node = builder.Build();
    EXPECT_TRUE(node->CanUse(3));
    EXPECT_FALSE(node->CanUse(4));
}

TEST(builder, argument_getters)
{
    auto type = Integer(0, 10);
    auto builder = Argument<int>("n", type);
    builder.Suggests([](CommandContext<int> const&, SuggestionsBuilder& suggestions) {
        return suggestions.Suggest(5).BuildFuture();
    });

    EXPECT_EQ(builder.GetName(), "n");
    EXPECT_EQ(builder.GetType(), type);
    EXPECT_TRUE(builder.GetSuggestionsProvider());
    EXPECT_EQ(Literal<int>("foo").GetLiteral(), "foo");
}
