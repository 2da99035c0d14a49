#include <gtest/gtest.h>

#include <algorithm>
#include <string>

#include "script/ast.hpp"
#include "script/errors.hpp"
#include "script/lexer.hpp"
#include "script/parser.hpp"

using namespace codeact::script;

TEST(Lexer, SynthesizesIndentationTokens) {
    const auto tokens = Lexer("if x:\n    y = 1\nz = 2\n").Tokenize();
    int indents = 0;
    int dedents = 0;
    for (const auto& token : tokens) {
        indents += token.type == TokenType::kIndent;
        dedents += token.type == TokenType::kDedent;
    }
    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
    EXPECT_EQ(tokens.back().type, TokenType::kEnd);
}

TEST(Lexer, DecodesStringEscapes) {
    const auto tokens = Lexer("s = 'a\\tb'\n").Tokenize();
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].type, TokenType::kString);
    EXPECT_EQ(tokens[2].text, "a\tb");
}

TEST(Lexer, ClassifiesKeywords) {
    const auto tokens = Lexer("while True:\n    break\nvalue = None\n").Tokenize();
    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].type, TokenType::kKeyword);
    EXPECT_EQ(tokens[0].text, "while");
    EXPECT_EQ(tokens[1].type, TokenType::kKeyword);
    EXPECT_EQ(tokens[1].text, "True");
    const auto it = std::find_if(tokens.begin(), tokens.end(), [](const Token& t) { return t.text == "value"; });
    ASSERT_NE(it, tokens.end());
    EXPECT_EQ(it->type, TokenType::kName);
}

TEST(Lexer, DecodesHexAndUnicodeEscapes) {
    const auto tokens = Lexer("s = '\\x41\\xe9\\u20ac'\n").Tokenize();
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].text, "A\xC3\xA9\xE2\x82\xAC");
    EXPECT_THROW(Lexer("s = '\\x4'\n").Tokenize(), ParseError);
}

TEST(Lexer, TracksLineNumbers) {
    const auto tokens = Lexer("a = 1\n\nb = 2\n").Tokenize();
    const auto it = std::find_if(tokens.begin(), tokens.end(), [](const Token& t) { return t.text == "b"; });
    ASSERT_NE(it, tokens.end());
    EXPECT_EQ(it->line, 3);
}

TEST(Parser, ParsesStatementsInOrder) {
    const Module module = Parse("x = 1\ndef f(a, b=2):\n    return a + b\nclass C:\n    pass\n");
    ASSERT_EQ(module.body.size(), 3u);
    EXPECT_EQ(module.body[0]->kind, StmtKind::kAssign);
    EXPECT_EQ(module.body[1]->kind, StmtKind::kFunctionDef);
    EXPECT_EQ(module.body[2]->kind, StmtKind::kClassDef);
    const auto& def = static_cast<const FunctionDefStmt&>(*module.body[1]);
    EXPECT_EQ(def.name, "f");
    EXPECT_EQ(def.params.size(), 2u);
}

TEST(Parser, ParsesAnnotatedAssignmentAndMatch) {
    const Module module = Parse("x: int = 1\nmatch x:\n    case 1:\n        pass\n    case _:\n        pass\n");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[0]->kind, StmtKind::kAnnAssign);
    EXPECT_EQ(module.body[1]->kind, StmtKind::kMatch);
}

TEST(Parser, MatchRemainsAnOrdinaryName) {
    const Module module = Parse("match = 3\nprint(match)\n");
    ASSERT_EQ(module.body.size(), 2u);
    EXPECT_EQ(module.body[0]->kind, StmtKind::kAssign);
}

TEST(Parser, DecoratorsAttachToDefinitions) {
    const Module module = Parse("@dataclass\nclass P:\n    x: int\n");
    ASSERT_EQ(module.body.size(), 1u);
    const auto& cls = static_cast<const ClassDefStmt&>(*module.body[0]);
    EXPECT_EQ(cls.decorators.size(), 1u);
    EXPECT_EQ(cls.body.size(), 1u);
}

TEST(Parser, ReportsLineOfSyntaxError) {
    try {
        Parse("a = 1\nb = (2 +\n");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_GE(e.line(), 2);
    }
}

TEST(Parser, RejectsBreakOutsideLoop) {
    EXPECT_THROW(Parse("break\n"), ParseError);
    EXPECT_THROW(Parse("return 1\n"), ParseError);
    EXPECT_NO_THROW(Parse("while True:\n    break\n"));
}

TEST(Parser, LimitsNesting) {
    const std::string deep = "x = " + std::string(1000, '(') + "1" + std::string(1000, ')') + "\n";
    try {
        Parse(deep);
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_STREQ(e.what(), "too many nested parentheses");
    }
    EXPECT_THROW(Parse("x = " + std::string(1000, '-') + "1\n"), ParseError);
    EXPECT_NO_THROW(Parse("x = " + std::string(40, '[') + std::string(40, ']') + "\n"));
}

TEST(Parser, RejectsUnsupportedSyntax) {
    EXPECT_THROW(Parse("f = lambda x: x\n"), ParseError);
    EXPECT_THROW(Parse("x = a[1:2]\n"), ParseError);
    EXPECT_THROW(Parse("from . import x\n"), ParseError);
}
