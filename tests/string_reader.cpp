#include <gtest/gtest.h>

#include <string>

#include "Sergeant/Exceptions.hpp"
#include "Sergeant/StringReader.hpp"

using namespace Sergeant;

TEST(string_reader, can_read)
{
    StringReader reader { "abc" };
    EXPECT_TRUE(reader.CanRead());
    EXPECT_TRUE(reader.CanRead(3));
    EXPECT_FALSE(reader.CanRead(4));

    reader.Skip();
    reader.Skip();
    reader.Skip();
    EXPECT_FALSE(reader.CanRead());
    EXPECT_EQ(reader.GetRead(), "abc");
    EXPECT_EQ(reader.GetRemaining(), "");
}

TEST(string_reader, copies_do_not_share_cursor)
{
    StringReader reader { "hello world" };
    StringReader copy { reader };
    copy.SetCursor(6);

    EXPECT_EQ(reader.GetCursor(), 0);
    EXPECT_EQ(copy.GetRemaining(), "world");
    EXPECT_EQ(&reader.GetString(), &copy.GetString());
}

TEST(string_reader, read_int)
{
    StringReader reader { "1234 rest" };
    EXPECT_EQ(reader.ReadInt(), 1234);
    EXPECT_EQ(reader.GetCursor(), 4);
    EXPECT_EQ(reader.GetRemaining(), " rest");
}

TEST(string_reader, read_negative_long)
{
    StringReader reader { "-9000000000" };
    EXPECT_EQ(reader.ReadLong(), -9000000000LL);
    EXPECT_FALSE(reader.CanRead());
}

TEST(string_reader, read_int_invalid_restores_cursor)
{
    StringReader reader { "12-3" };
    try {
        reader.ReadInt();
        FAIL() << "expected a syntax error";
    } catch (CommandSyntaxException const& ex) {
        EXPECT_EQ(ex.GetType(), &BuiltInExceptions::ReaderInvalidInt());
        EXPECT_EQ(ex.GetCursor(), 0);
        EXPECT_EQ(ex.GetRawMessage(), "Invalid integer '12-3'");
    }
    EXPECT_EQ(reader.GetCursor(), 0);
}

TEST(string_reader, read_int_expected)
{
    StringReader reader { "abc" };
    try {
        reader.ReadInt();
        FAIL() << "expected a syntax error";
    } catch (CommandSyntaxException const& ex) {
        EXPECT_EQ(ex.GetType(), &BuiltInExceptions::ReaderExpectedInt());
    }
    EXPECT_EQ(reader.GetCursor(), 0);
}

TEST(string_reader, read_double)
{
    StringReader reader { "1.5 .5" };
    EXPECT_DOUBLE_EQ(reader.ReadDouble(), 1.5);
    reader.Skip();
    EXPECT_DOUBLE_EQ(reader.ReadDouble(), 0.5);
}

TEST(string_reader, read_float_invalid)
{
    StringReader reader { "1.2.3" };
    EXPECT_THROW(reader.ReadFloat(), CommandSyntaxException);
    EXPECT_EQ(reader.GetCursor(), 0);
}

TEST(string_reader, read_unquoted_string)
{
    StringReader reader { "hello_world+1 tail" };
    EXPECT_EQ(reader.ReadUnquotedString(), "hello_world+1");
    EXPECT_EQ(reader.GetRemaining(), " tail");
}

TEST(string_reader, read_quoted_string_with_escapes)
{
    StringReader reader { R"("hello \"world\"" tail)" };
    EXPECT_EQ(reader.ReadQuotedString(), R"(hello "world")");
    EXPECT_EQ(reader.GetCursor(), 17);
    EXPECT_EQ(reader.GetRemaining(), " tail");
}

TEST(string_reader, read_quoted_string_single_quotes)
{
    StringReader reader { R"('it''s')" };
    EXPECT_EQ(reader.ReadString(), "it");
}

TEST(string_reader, read_quoted_string_invalid_escape)
{
    StringReader reader { R"("a\b")" };
    try {
        reader.ReadQuotedString();
        FAIL() << "expected a syntax error";
    } catch (CommandSyntaxException const& ex) {
        EXPECT_EQ(ex.GetType(), &BuiltInExceptions::ReaderInvalidEscape());
        EXPECT_EQ(ex.GetCursor(), 3);
    }
}

TEST(string_reader, read_quoted_string_unclosed)
{
    StringReader reader { "\"abc" };
    try {
        reader.ReadQuotedString();
        FAIL() << "expected a syntax error";
    } catch (CommandSyntaxException const& ex) {
        EXPECT_EQ(ex.GetType(), &BuiltInExceptions::ReaderExpectedEndOfQuote());
    }
}

TEST(string_reader, read_quoted_string_requires_quote)
{
    StringReader reader { "abc" };
    EXPECT_THROW(reader.ReadQuotedString(), CommandSyntaxException);
}

TEST(string_reader, read_boolean)
{
    StringReader reader { "true false" };
    EXPECT_TRUE(reader.ReadBoolean());
    reader.Skip();
    EXPECT_FALSE(reader.ReadBoolean());
}

TEST(string_reader, read_boolean_invalid_restores_cursor)
{
    StringReader reader { "maybe" };
    try {
        reader.ReadBoolean();
        FAIL() << "expected a syntax error";
    } catch (CommandSyntaxException const& ex) {
        EXPECT_EQ(ex.GetType(), &BuiltInExceptions::ReaderInvalidBool());
        EXPECT_EQ(ex.GetRawMessage(), "Invalid bool, expected true or false but found 'maybe'");
    }
    EXPECT_EQ(reader.GetCursor(), 0);
}

TEST(string_reader, expect)
{
    StringReader reader { "x" };
    EXPECT_THROW(reader.Expect('y'), CommandSyntaxException);
    EXPECT_EQ(reader.GetCursor(), 0);
    EXPECT_NO_THROW(reader.Expect('x'));
    EXPECT_EQ(reader.GetCursor(), 1);
}

TEST(string_reader, skip_whitespace)
{
    StringReader reader { " \t x" };
    reader.SkipWhitespace();
    EXPECT_EQ(reader.Peek(), 'x');
}

TEST(command_syntax_exception, message_with_short_context)
{
    StringReader reader { "abc def" };
    reader.SetCursor(3);
    auto ex = BuiltInExceptions::DispatcherUnknownCommand().CreateWithContext(reader);

    EXPECT_STREQ(ex.what(), "Unknown command at position 3: abc<--[HERE]");
    ASSERT_TRUE(ex.GetContext().has_value());
    EXPECT_EQ(*ex.GetContext(), "abc<--[HERE]");
}

TEST(command_syntax_exception, message_with_long_context)
{
    StringReader reader { "0123456789abcdef" };
    reader.SetCursor(12);
    auto ex = BuiltInExceptions::DispatcherUnknownCommand().CreateWithContext(reader);

    EXPECT_STREQ(ex.what(), "Unknown command at position 12: ...23456789ab<--[HERE]");
}

TEST(command_syntax_exception, message_without_context)
{
    auto ex = BuiltInExceptions::DispatcherUnknownCommand().Create();
    EXPECT_STREQ(ex.what(), "Unknown command");
    EXPECT_FALSE(ex.GetContext().has_value());
    EXPECT_EQ(ex.GetCursor(), -1);
}
