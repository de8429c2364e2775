#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "parser/delimiter_state.h"
#include "parser/parser.h"
#include "parser/parser_utils.h"
#include "parser/tokenizer.h"

namespace {

std::vector<LexState> feed_all(const std::string& text) {
    DelimiterState delimiters;
    std::vector<LexState> states;
    for (size_t i = 0; i < text.size();) {
        i += delimiters.feed(text, i);
        states.push_back(delimiters.state);
    }
    return states;
}

}  // namespace

// lexer transitions
TEST(DelimiterState, SingleQuoteOpensAndCloses) {
    auto states = feed_all("a'b'c");
    std::vector<LexState> expected = {LexState::Normal, LexState::InSingleQuote,
                                      LexState::InSingleQuote, LexState::Normal,
                                      LexState::Normal};
    EXPECT_EQ(states, expected);
}

TEST(DelimiterState, DoubleQuoteOpensAndCloses) {
    auto states = feed_all("\"x\"");
    std::vector<LexState> expected = {LexState::InDoubleQuote, LexState::InDoubleQuote,
                                      LexState::Normal};
    EXPECT_EQ(states, expected);
}

TEST(DelimiterState, BackslashEscapesOneCharacterInNormal) {
    auto states = feed_all("\\'a");
    std::vector<LexState> expected = {LexState::Escaped, LexState::Normal, LexState::Normal};
    EXPECT_EQ(states, expected);
}

TEST(DelimiterState, BackslashInsideDoubleQuotesReturnsToDoubleQuote) {
    auto states = feed_all("\"\\\"x");
    std::vector<LexState> expected = {LexState::InDoubleQuote, LexState::Escaped,
                                      LexState::InDoubleQuote, LexState::InDoubleQuote};
    EXPECT_EQ(states, expected);
}

TEST(DelimiterState, BackslashIsLiteralInsideSingleQuotes) {
    auto states = feed_all("'\\'");
    std::vector<LexState> expected = {LexState::InSingleQuote, LexState::InSingleQuote,
                                      LexState::Normal};
    EXPECT_EQ(states, expected);
}

TEST(DelimiterState, DoubleQuoteInsideSingleQuotesIsLiteral) {
    DelimiterState delimiters;
    std::string text = "'\"'";
    for (size_t i = 0; i < text.size();) {
        i += delimiters.feed(text, i);
    }
    EXPECT_EQ(delimiters.state, LexState::Normal);
    EXPECT_TRUE(delimiters.at_top_level());
}

TEST(DelimiterState, SubstitutionSavesAndRestoresQuoteState) {
    DelimiterState delimiters;
    std::string text = "\"$(echo \"a\")";
    size_t i = 0;
    i += delimiters.feed(text, i);
    EXPECT_EQ(delimiters.state, LexState::InDoubleQuote);
    EXPECT_EQ(delimiters.feed(text, i), 2u);
    i += 2;
    EXPECT_EQ(delimiters.state, LexState::Normal);
    EXPECT_FALSE(delimiters.at_top_level());
    while (i < text.size()) {
        i += delimiters.feed(text, i);
    }
    EXPECT_EQ(delimiters.state, LexState::InDoubleQuote);
    EXPECT_TRUE(delimiters.subst_stack.empty());
}

TEST(DelimiterState, UnterminatedQuoteIsReported) {
    DelimiterState delimiters;
    std::string text = "echo 'open";
    for (size_t i = 0; i < text.size();) {
        i += delimiters.feed(text, i);
    }
    EXPECT_TRUE(delimiters.unterminated());
    delimiters.reset();
    EXPECT_FALSE(delimiters.unterminated());
}

TEST(DelimiterState, StateNames) {
    EXPECT_STREQ(lex_state_name(LexState::Normal), "Normal");
    EXPECT_STREQ(lex_state_name(LexState::InSingleQuote), "InSingleQuote");
    EXPECT_STREQ(lex_state_name(LexState::InDoubleQuote), "InDoubleQuote");
    EXPECT_STREQ(lex_state_name(LexState::Escaped), "Escaped");
}

// simple tokenize test
TEST(TokenizeCommand, SplitsOnSpaces) {
    auto t = Tokenizer::tokenize_command("echo hello world");
    std::vector<std::string> expected = {"echo", "hello", "world"};
    EXPECT_EQ(t, expected);
}

// quotes and escapes
TEST(TokenizeCommand, HandlesQuotes) {
    auto t = Tokenizer::tokenize_command(R"(say "a b" 'c d')");
    std::vector<std::string> expected = {"say", "a b", "c d"};
    EXPECT_EQ(t, expected);
}

TEST(TokenizeCommand, HandlesEscapedSpaces) {
    auto t = Tokenizer::tokenize_command(R"(arg\ with\ spaces)");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0], "arg with spaces");
}

TEST(TokenizeCommand, ComplexQuotesAndEscapes) {
    auto t = Tokenizer::tokenize_command(R"(echo "He said \"Hello\" and left")");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[1], "He said \"Hello\" and left");
}

TEST(TokenizeCommand, BackslashBeforeOrdinaryCharStaysInDoubleQuotes) {
    auto t = Tokenizer::tokenize_command(R"(echo "a\tb")");
    ASSERT_EQ(t.size(), 2u);
    EXPECT_EQ(t[1], "a\\tb");
}

TEST(TokenizeCommand, KeepsEmptyQuotedWords) {
    auto t = Tokenizer::tokenize_command("cmd '' \"\"");
    std::vector<std::string> expected = {"cmd", "", ""};
    EXPECT_EQ(t, expected);
}

TEST(TokenizeCommand, AdjacentQuotedPartsFormOneWord) {
    auto t = Tokenizer::tokenize_command(R"(pre'mid'"post")");
    ASSERT_EQ(t.size(), 1u);
    EXPECT_EQ(t[0], "premidpost");
}

TEST(TokenizeCommand, UnterminatedQuoteRunsToEnd) {
    auto t = Tokenizer::tokenize_command("echo 'a b");
    std::vector<std::string> expected = {"echo", "a b"};
    EXPECT_EQ(t, expected);
}

TEST(TokenizeCommand, TrailingBackslashIsDropped) {
    auto t = Tokenizer::tokenize_command("echo \\");
    std::vector<std::string> expected = {"echo"};
    EXPECT_EQ(t, expected);
}

TEST(TokenizeWords, MarksOnlyUnquotedGlobs) {
    auto words = Tokenizer::tokenize_words(R"(ls *.txt '*.md' \?x a"*"b)");
    ASSERT_EQ(words.size(), 5u);
    EXPECT_FALSE(words[0].glob_candidate);
    EXPECT_TRUE(words[1].glob_candidate);
    EXPECT_FALSE(words[2].glob_candidate);
    EXPECT_FALSE(words[3].glob_candidate);
    EXPECT_FALSE(words[4].glob_candidate);
}

// statement splitting
TEST(ParseSemicolon, SplitsAndTrims) {
    auto s = Parser::parse_semicolon_commands(" echo a ;echo b;; ");
    std::vector<std::string> expected = {"echo a", "echo b"};
    EXPECT_EQ(s, expected);
}

TEST(ParseSemicolon, IgnoresQuotedAndSubstitutedSemicolons) {
    auto s = Parser::parse_semicolon_commands("echo 'a;b' \"c;d\" $(echo e; echo f); echo g");
    std::vector<std::string> expected = {"echo 'a;b' \"c;d\" $(echo e; echo f)", "echo g"};
    EXPECT_EQ(s, expected);
}

TEST(ParseSemicolon, IgnoresEscapedSemicolon) {
    auto s = Parser::parse_semicolon_commands("echo a\\;b");
    ASSERT_EQ(s.size(), 1u);
}

TEST(ParseLogical, RecordsFollowingOperator) {
    auto parts = Parser::parse_logical_commands("a && b || c");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0].command, "a");
    EXPECT_EQ(parts[0].op, "&&");
    EXPECT_EQ(parts[1].command, "b");
    EXPECT_EQ(parts[1].op, "||");
    EXPECT_EQ(parts[2].command, "c");
    EXPECT_EQ(parts[2].op, "");
}

TEST(ParseLogical, SinglePipeIsNotAnOperator) {
    auto parts = Parser::parse_logical_commands("echo a | grep a");
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0].command, "echo a | grep a");
}

TEST(ParseLogical, QuotedOperatorsStayInPart) {
    auto parts = Parser::parse_logical_commands("echo '&&' \"||\"");
    ASSERT_EQ(parts.size(), 1u);
}

TEST(ParsePipeline, SplitsOnSinglePipes) {
    auto segments = Parser::parse_pipeline("cat f | grep x | wc -l");
    std::vector<std::string> expected = {"cat f", "grep x", "wc -l"};
    EXPECT_EQ(segments, expected);
}

TEST(ParsePipeline, QuotedPipeStays) {
    auto segments = Parser::parse_pipeline("echo 'a|b' | cat");
    std::vector<std::string> expected = {"echo 'a|b'", "cat"};
    EXPECT_EQ(segments, expected);
}

// redirects
TEST(ParseRedirects, ExtractsEveryKind) {
    auto parsed = Parser::parse_redirects("cmd arg < in.txt > out.txt 2>> err.log");
    ASSERT_TRUE(parsed.is_ok());
    const Command& command = parsed.value();
    EXPECT_EQ(command.text, "cmd arg");
    ASSERT_EQ(command.redirects.size(), 3u);
    EXPECT_EQ(command.redirects[0].kind, Redirect::Kind::Input);
    EXPECT_EQ(command.redirects[0].target, "in.txt");
    EXPECT_EQ(command.redirects[1].kind, Redirect::Kind::Output);
    EXPECT_EQ(command.redirects[1].target, "out.txt");
    EXPECT_EQ(command.redirects[2].kind, Redirect::Kind::ErrorAppend);
    EXPECT_EQ(command.redirects[2].target, "err.log");
}

TEST(ParseRedirects, TargetWithoutSpace) {
    auto parsed = Parser::parse_redirects("echo hi >>log.txt");
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_EQ(parsed.value().redirects.size(), 1u);
    EXPECT_EQ(parsed.value().redirects[0].kind, Redirect::Kind::Append);
    EXPECT_TRUE(parsed.value().redirects[0].appends());
    EXPECT_EQ(parsed.value().redirects[0].target, "log.txt");
}

TEST(ParseRedirects, QuotedTargetIsUnquoted) {
    auto parsed = Parser::parse_redirects("echo hi > \"my file\"");
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_EQ(parsed.value().redirects.size(), 1u);
    EXPECT_EQ(parsed.value().redirects[0].target, "my file");
}

TEST(ParseRedirects, QuotedOperatorIsText) {
    auto parsed = Parser::parse_redirects("echo 'a > b'");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().redirects.empty());
    EXPECT_EQ(parsed.value().text, "echo 'a > b'");
}

TEST(ParseRedirects, TwoInsideWordIsNotStderr) {
    auto parsed = Parser::parse_redirects("echo a2>b");
    ASSERT_TRUE(parsed.is_ok());
    ASSERT_EQ(parsed.value().redirects.size(), 1u);
    EXPECT_EQ(parsed.value().redirects[0].kind, Redirect::Kind::Output);
    EXPECT_EQ(parsed.value().text, "echo a2");
}

TEST(ParseRedirects, MissingTargetIsSyntaxError) {
    auto parsed = Parser::parse_redirects("echo hi >");
    ASSERT_TRUE(parsed.is_error());
    EXPECT_EQ(parsed.kind(), vsh_filesystem::ErrorKind::InvalidArgument);
    EXPECT_EQ(parsed.error(), "syntax error near unexpected token 'newline'");
}

TEST(RedirectOperator, Names) {
    EXPECT_STREQ(redirect_operator(Redirect::Kind::Input), "<");
    EXPECT_STREQ(redirect_operator(Redirect::Kind::Output), ">");
    EXPECT_STREQ(redirect_operator(Redirect::Kind::Append), ">>");
    EXPECT_STREQ(redirect_operator(Redirect::Kind::Error), "2>");
    EXPECT_STREQ(redirect_operator(Redirect::Kind::ErrorAppend), "2>>");
}

// helpers
TEST(ParserUtils, Assignments) {
    std::string name;
    std::string value;
    EXPECT_TRUE(split_assignment("FOO=bar=baz", name, value));
    EXPECT_EQ(name, "FOO");
    EXPECT_EQ(value, "bar=baz");
    EXPECT_TRUE(looks_like_assignment("_x1="));
    EXPECT_FALSE(looks_like_assignment("1x=2"));
    EXPECT_FALSE(looks_like_assignment("=x"));
    EXPECT_FALSE(looks_like_assignment("plain"));
}

TEST(ParserUtils, CommentLines) {
    EXPECT_TRUE(is_comment_line("# note"));
    EXPECT_TRUE(is_comment_line("   # indented"));
    EXPECT_FALSE(is_comment_line("echo # not a comment line"));
}
