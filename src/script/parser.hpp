#pragma once

#include <string>
#include <vector>

#include "script/ast.hpp"
#include "script/lexer.hpp"

namespace codeact::script {

// Recursive-descent parser for codeact script. Throws ParseError.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    Module ParseModule();
    ExprPtr ParseStandaloneExpression();

private:
    class NestingGuard;

    // Statements
    void ParseStatement(Block& out);
    void ParseSimpleStatements(Block& out);
    StmtPtr ParseSmallStatement();
    StmtPtr ParseExpressionStatement();
    Block ParseBlock();
    StmtPtr ParseIf();
    StmtPtr ParseWhile();
    StmtPtr ParseFor();
    StmtPtr ParseTry();
    StmtPtr ParseDecorated();
    std::shared_ptr<FunctionDefStmt> ParseFunctionDef();
    std::shared_ptr<ClassDefStmt> ParseClassDef();
    StmtPtr ParseImport();
    StmtPtr ParseImportFrom();
    StmtPtr TryParseMatch();
    PatternPtr ParsePattern();
    PatternPtr ParseClosedPattern();

    // Expressions
    ExprPtr ParseTest();
    ExprPtr ParseOrTest();
    ExprPtr ParseAndTest();
    ExprPtr ParseNotTest();
    ExprPtr ParseComparison();
    ExprPtr ParseArith();
    ExprPtr ParseTerm();
    ExprPtr ParseFactor();
    ExprPtr ParsePower();
    ExprPtr ParsePrimary();
    ExprPtr ParseAtom();
    ExprPtr ParseStrings();
    ExprPtr ParseFString(const Token& token, std::shared_ptr<FStringExpr> into);
    ExprPtr ParseTestList();
    ExprPtr ParseTargetList();
    ExprPtr ParseComprehension(ExprPtr element, int line);
    ExprPtr ParseListDisplay(int line);
    ExprPtr ParseDictDisplay(int line);
    ExprPtr ParseParenthesized(int line);
    void ParseCallArguments(CallExpr& call);
    std::string ParseDottedName();
    void CheckAssignable(const ExprPtr& target) const;

    // Token helpers
    const Token& Peek(std::size_t offset = 0) const;
    const Token& Advance();
    bool Check(TokenType type, const std::string& text = "") const;
    bool CheckOperator(const std::string& text) const { return Check(TokenType::kOperator, text); }
    bool CheckKeyword(const std::string& text) const { return Check(TokenType::kKeyword, text); }
    bool Match(TokenType type, const std::string& text = "");
    bool StartsExpression() const;
    const Token& Expect(TokenType type, const std::string& text, const std::string& what);
    [[noreturn]] void Fail(const std::string& message) const;

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    int loop_depth_ = 0;
    int function_depth_ = 0;
    int nesting_depth_ = 0;
};

Module Parse(const std::string& source);

}  // namespace codeact::script
