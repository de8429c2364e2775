#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "interpreter/command_substitution_evaluator.h"
#include "parser/variable_expander.h"
#include "session.h"

namespace {

Session make_session() {
    Session session;
    session.env["HOME"] = "/home/user";
    session.env["USER"] = "user";
    session.env["EMPTY"] = "";
    session.last_exit_code = 3;
    return session;
}

// echoes the command text back as its output, one trailing newline
CommandSubstitutionEvaluator::CommandExecutor echo_executor(std::vector<std::string>& seen) {
    return [&seen](const std::string& command) {
        seen.push_back(command);
        ExecResult result;
        result.stdout_text = "<" + command + ">\n";
        return result;
    };
}

}  // namespace

TEST(VariableExpander, ReplacesNamedReference) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("echo $HOME/test"), "echo /home/user/test");
}

TEST(VariableExpander, BracedReference) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("${USER}name"), "username");
}

TEST(VariableExpander, LastExitCode) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("status=$?"), "status=3");
}

TEST(VariableExpander, UnknownVariableIsEmpty) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("a${MISSING}b $NOPE."), "ab .");
}

TEST(VariableExpander, IdentifierStopsAtNonWordCharacter) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("$USER-x $USER_x"), "user-x ");
}

TEST(VariableExpander, InvalidReferencesStayLiteral) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("cost $5 ${1bad} ${open $"),
              "cost $5 ${1bad} ${open $");
}

TEST(VariableExpander, SingleQuotesSuppressExpansion) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("echo '$HOME' \"$HOME\""),
              "echo '$HOME' \"/home/user\"");
}

TEST(VariableExpander, EscapedDollarIsKept) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("echo \\$HOME"), "echo \\$HOME");
}

TEST(VariableExpander, ExpandsInsideSubstitutionText) {
    Session session = make_session();
    EXPECT_EQ(VariableExpander(session).expand("echo $(echo $USER)"), "echo $(echo user)");
}

TEST(VariableExpander, GetVariableValue) {
    Session session = make_session();
    VariableExpander expander(session);
    EXPECT_EQ(expander.get_variable_value("HOME"), "/home/user");
    EXPECT_EQ(expander.get_variable_value("?"), "3");
    EXPECT_EQ(expander.get_variable_value("EMPTY"), "");
}

// command substitution scanning
TEST(CommandSubstitution, FindMatchingParenHandlesNesting) {
    std::string text = "$(a $(b) (c)) tail";
    auto close = CommandSubstitutionEvaluator::find_matching_paren(text, 1);
    ASSERT_TRUE(close.has_value());
    EXPECT_EQ(*close, text.find(" tail") - 1);
}

TEST(CommandSubstitution, FindMatchingParenSkipsQuotedParens) {
    std::string text = "$(echo ')' \")\")";
    auto close = CommandSubstitutionEvaluator::find_matching_paren(text, 1);
    ASSERT_TRUE(close.has_value());
    EXPECT_EQ(*close, text.size() - 1);
}

TEST(CommandSubstitution, UnmatchedParen) {
    EXPECT_FALSE(CommandSubstitutionEvaluator::find_matching_paren("$(echo", 1).has_value());
    EXPECT_FALSE(CommandSubstitutionEvaluator::find_closing_backtick("`echo", 0).has_value());
}

TEST(CommandSubstitution, ClosingBacktickSkipsEscapes) {
    std::string text = "`a \\` b`";
    auto close = CommandSubstitutionEvaluator::find_closing_backtick(text, 0);
    ASSERT_TRUE(close.has_value());
    EXPECT_EQ(*close, text.size() - 1);
}

TEST(CommandSubstitution, ReplacesDollarParenAndBackticks) {
    std::vector<std::string> seen;
    CommandSubstitutionEvaluator evaluator(echo_executor(seen));
    auto result = evaluator.expand_substitutions("x $(one) `two` y");
    EXPECT_EQ(result.text, "x \\<one\\> \\<two\\> y");
    std::vector<std::string> expected = {"one", "two"};
    EXPECT_EQ(seen, expected);
}

TEST(CommandSubstitution, InsideDoubleQuotesOnlyQuotesAndBackslashesAreEscaped) {
    CommandSubstitutionEvaluator evaluator([](const std::string&) {
        ExecResult result;
        result.stdout_text = "a \"b\" <c>\n\n";
        return result;
    });
    auto result = evaluator.expand_substitutions("\"$(cmd)\"");
    // only one trailing newline is removed
    EXPECT_EQ(result.text, "\"a \\\"b\\\" <c>\n\"");
}

TEST(CommandSubstitution, SingleQuotedTextIsUntouched) {
    std::vector<std::string> seen;
    CommandSubstitutionEvaluator evaluator(echo_executor(seen));
    auto result = evaluator.expand_substitutions("echo '$(no)' '`no`'");
    EXPECT_EQ(result.text, "echo '$(no)' '`no`'");
    EXPECT_TRUE(seen.empty());
}

TEST(CommandSubstitution, UnterminatedIsCopiedLiterally) {
    std::vector<std::string> seen;
    CommandSubstitutionEvaluator evaluator(echo_executor(seen));
    EXPECT_EQ(evaluator.expand_substitutions("echo $(open").text, "echo $(open");
    EXPECT_TRUE(seen.empty());
}

TEST(CommandSubstitution, CollectsStderr) {
    CommandSubstitutionEvaluator evaluator([](const std::string& command) {
        ExecResult result;
        result.stderr_text = command + ": failed\n";
        result.exit_code = 1;
        return result;
    });
    auto result = evaluator.expand_substitutions("echo $(a)$(b)");
    EXPECT_EQ(result.text, "echo ");
    EXPECT_EQ(result.stderr_text, "a: failed\nb: failed\n");
}
