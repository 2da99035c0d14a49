#include "script/parser.hpp"

#include <stdexcept>
#include <unordered_map>

#include "script/errors.hpp"
#include "utils/common.hpp"

namespace codeact::script {
namespace {

const std::unordered_map<std::string, BinaryOp>& AugmentedOperators() {
    static const std::unordered_map<std::string, BinaryOp> operators = {
        {"+=", BinaryOp::kAdd},
        {"-=", BinaryOp::kSub},
        {"*=", BinaryOp::kMul},
        {"/=", BinaryOp::kDiv},
        {"//=", BinaryOp::kFloorDiv},
        {"%=", BinaryOp::kMod},
        {"**=", BinaryOp::kPow}
    };
    return operators;
}

std::int64_t ParseIntLiteral(const std::string& text, int line) {
    std::string digits;
    for (const char c : text) {
        if (c != '_') {
            digits.push_back(c);
        }
    }
    try {
        if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            return std::stoll(digits.substr(2), nullptr, 16);
        }
        if (digits.size() > 1 && digits[0] == '0' && digits.find_first_not_of('0') != std::string::npos) {
            throw ParseError("leading zeros in decimal integer literals are not permitted", line);
        }
        return std::stoll(digits, nullptr, 10);
    } catch (const std::out_of_range&) {
        throw ParseError("integer literal is too large", line);
    } catch (const std::invalid_argument&) {
        throw ParseError("invalid integer literal '" + text + "'", line);
    }
}

double ParseFloatLiteral(const std::string& text, int line) {
    try {
        return std::stod(text);
    } catch (const std::out_of_range&) {
        throw ParseError("float literal is out of range", line);
    } catch (const std::invalid_argument&) {
        throw ParseError("invalid float literal '" + text + "'", line);
    }
}

constexpr int kMaxNesting = 300;

}  // namespace

// Bounds the recursion depth of the descent so hostile input fails as a
// ParseError instead of exhausting the native stack.
class Parser::NestingGuard {
public:
    NestingGuard(Parser& parser, const char* what) : parser_(parser) {
        if (++parser_.nesting_depth_ > kMaxNesting) {
            --parser_.nesting_depth_;
            parser_.Fail(what);
        }
    }
    ~NestingGuard() { --parser_.nesting_depth_; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    Parser& parser_;
};

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::kEnd) {
        tokens_.push_back(Token{TokenType::kEnd, "", tokens_.empty() ? 1 : tokens_.back().line});
    }
}

Module Parse(const std::string& source) {
    Lexer lexer(source);
    Parser parser(lexer.Tokenize());
    return parser.ParseModule();
}

// ---------------------------------------------------------------------------
// Token helpers

const Token& Parser::Peek(std::size_t offset) const {
    const std::size_t index = pos_ + offset;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::Advance() {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return token;
}

bool Parser::Check(TokenType type, const std::string& text) const {
    const Token& token = Peek();
    return token.type == type && (text.empty() || token.text == text);
}

bool Parser::Match(TokenType type, const std::string& text) {
    if (!Check(type, text)) {
        return false;
    }
    Advance();
    return true;
}

bool Parser::StartsExpression() const {
    const Token& token = Peek();
    switch (token.type) {
        case TokenType::kName:
        case TokenType::kInt:
        case TokenType::kFloat:
        case TokenType::kString:
        case TokenType::kFString:
            return true;
        case TokenType::kKeyword:
            return token.text == "True" || token.text == "False" || token.text == "None" ||
                   token.text == "not" || token.text == "lambda";
        case TokenType::kOperator:
            return token.text == "(" || token.text == "[" || token.text == "{" ||
                   token.text == "-" || token.text == "+" || token.text == "~";
        default:
            return false;
    }
}

const Token& Parser::Expect(TokenType type, const std::string& text, const std::string& what) {
    if (!Check(type, text)) {
        Fail("expected " + what);
    }
    return Advance();
}

void Parser::Fail(const std::string& message) const {
    const Token& token = Peek();
    std::string detail = message;
    if (token.type == TokenType::kEnd) {
        detail += " at end of input";
    } else if (!token.text.empty() && token.type != TokenType::kString && token.type != TokenType::kFString) {
        detail += " near '" + token.text + "'";
    }
    throw ParseError(detail, token.line);
}

// ---------------------------------------------------------------------------
// Statements

Module Parser::ParseModule() {
    Module module;
    while (!Check(TokenType::kEnd)) {
        if (Match(TokenType::kNewline)) {
            continue;
        }
        ParseStatement(module.body);
    }
    return module;
}

ExprPtr Parser::ParseStandaloneExpression() {
    ExprPtr expr = ParseTestList();
    Match(TokenType::kNewline);
    if (!Check(TokenType::kEnd)) {
        Fail("invalid syntax in expression");
    }
    return expr;
}

void Parser::ParseStatement(Block& out) {
    if (Check(TokenType::kIndent)) {
        Fail("unexpected indent");
    }
    if (Check(TokenType::kKeyword)) {
        const std::string& keyword = Peek().text;
        if (keyword == "if") {
            out.push_back(ParseIf());
            return;
        }
        if (keyword == "while") {
            out.push_back(ParseWhile());
            return;
        }
        if (keyword == "for") {
            out.push_back(ParseFor());
            return;
        }
        if (keyword == "try") {
            out.push_back(ParseTry());
            return;
        }
        if (keyword == "def") {
            out.push_back(ParseFunctionDef());
            return;
        }
        if (keyword == "class") {
            out.push_back(ParseClassDef());
            return;
        }
    }
    if (CheckOperator("@")) {
        out.push_back(ParseDecorated());
        return;
    }
    if (Check(TokenType::kName, "match")) {
        if (StmtPtr match = TryParseMatch()) {
            out.push_back(std::move(match));
            return;
        }
    }
    ParseSimpleStatements(out);
}

void Parser::ParseSimpleStatements(Block& out) {
    while (true) {
        out.push_back(ParseSmallStatement());
        if (!Match(TokenType::kOperator, ";")) {
            break;
        }
        if (Check(TokenType::kNewline)) {
            break;
        }
    }
    Expect(TokenType::kNewline, "", "end of statement");
}

StmtPtr Parser::ParseSmallStatement() {
    const int line = Peek().line;
    if (Check(TokenType::kKeyword)) {
        const std::string keyword = Peek().text;
        if (keyword == "pass" || keyword == "break" || keyword == "continue") {
            if (keyword == "break" && loop_depth_ == 0) {
                throw ParseError("'break' outside loop", line);
            }
            if (keyword == "continue" && loop_depth_ == 0) {
                throw ParseError("'continue' not properly in loop", line);
            }
            Advance();
            const StmtKind kind = keyword == "pass" ? StmtKind::kPass
                                : keyword == "break" ? StmtKind::kBreak
                                : StmtKind::kContinue;
            return std::make_shared<SimpleStmt>(kind, line);
        }
        if (keyword == "return") {
            if (function_depth_ == 0) {
                throw ParseError("'return' outside function", line);
            }
            Advance();
            ExprPtr value = StartsExpression() ? ParseTestList() : nullptr;
            return std::make_shared<ReturnStmt>(std::move(value), line);
        }
        if (keyword == "raise") {
            Advance();
            ExprPtr value = StartsExpression() ? ParseTest() : nullptr;
            if (CheckKeyword("from")) {
                Fail("'raise ... from' is not supported");
            }
            return std::make_shared<RaiseStmt>(std::move(value), line);
        }
        if (keyword == "global") {
            Advance();
            auto stmt = std::make_shared<GlobalStmt>(line);
            do {
                stmt->names.push_back(Expect(TokenType::kName, "", "a name").text);
            } while (Match(TokenType::kOperator, ","));
            return stmt;
        }
        if (keyword == "del") {
            Advance();
            auto stmt = std::make_shared<DeleteStmt>(line);
            ExprPtr targets = ParseTargetList();
            if (targets->kind == ExprKind::kTuple) {
                stmt->targets = static_cast<SequenceExpr&>(*targets).elements;
            } else {
                stmt->targets.push_back(targets);
            }
            return stmt;
        }
        if (keyword == "assert") {
            Advance();
            auto stmt = std::make_shared<AssertStmt>(line);
            stmt->test = ParseTest();
            if (Match(TokenType::kOperator, ",")) {
                stmt->message = ParseTest();
            }
            return stmt;
        }
        if (keyword == "import") {
            return ParseImport();
        }
        if (keyword == "from") {
            return ParseImportFrom();
        }
        if (keyword == "lambda" || keyword == "with" || keyword == "yield" || keyword == "async" ||
            keyword == "await" || keyword == "nonlocal") {
            Fail("'" + keyword + "' is not supported");
        }
    }
    return ParseExpressionStatement();
}

StmtPtr Parser::ParseExpressionStatement() {
    const int line = Peek().line;
    ExprPtr first = ParseTestList();

    if (CheckOperator(":")) {
        Advance();
        if (first->kind == ExprKind::kTuple || first->kind == ExprKind::kList) {
            Fail("only single target (not tuple) can be annotated");
        }
        CheckAssignable(first);
        auto stmt = std::make_shared<AnnAssignStmt>(line);
        stmt->target = first;
        stmt->annotation = ParseTest();
        if (Match(TokenType::kOperator, "=")) {
            stmt->value = ParseTestList();
        }
        return stmt;
    }

    if (Check(TokenType::kOperator)) {
        const auto& augmented = AugmentedOperators();
        const auto it = augmented.find(Peek().text);
        if (it != augmented.end()) {
            Advance();
            if (first->kind != ExprKind::kName && first->kind != ExprKind::kAttribute &&
                first->kind != ExprKind::kSubscript) {
                throw ParseError("illegal expression for augmented assignment", line);
            }
            return std::make_shared<AugAssignStmt>(first, it->second, ParseTestList(), line);
        }
    }

    if (CheckOperator("=")) {
        auto stmt = std::make_shared<AssignStmt>(line);
        stmt->targets.push_back(first);
        while (Match(TokenType::kOperator, "=")) {
            ExprPtr next = ParseTestList();
            if (CheckOperator("=")) {
                stmt->targets.push_back(next);
            } else {
                stmt->value = next;
            }
        }
        for (const auto& target : stmt->targets) {
            CheckAssignable(target);
        }
        return stmt;
    }

    return std::make_shared<ExprStmt>(first, line);
}

Block Parser::ParseBlock() {
    NestingGuard guard(*this, "too many statically nested blocks");
    Expect(TokenType::kOperator, ":", "':'");
    Block block;
    if (Match(TokenType::kNewline)) {
        if (!Match(TokenType::kIndent)) {
            Fail("expected an indented block");
        }
        while (!Check(TokenType::kDedent) && !Check(TokenType::kEnd)) {
            if (Match(TokenType::kNewline)) {
                continue;
            }
            ParseStatement(block);
        }
        Match(TokenType::kDedent);
        return block;
    }
    ParseSimpleStatements(block);
    return block;
}

StmtPtr Parser::ParseIf() {
    auto stmt = std::make_shared<IfStmt>(Advance().line);
    stmt->test = ParseTest();
    stmt->body = ParseBlock();
    if (CheckKeyword("elif")) {
        stmt->orelse.push_back(ParseIf());
    } else if (Match(TokenType::kKeyword, "else")) {
        stmt->orelse = ParseBlock();
    }
    return stmt;
}

StmtPtr Parser::ParseWhile() {
    auto stmt = std::make_shared<WhileStmt>(Advance().line);
    stmt->test = ParseTest();
    ++loop_depth_;
    stmt->body = ParseBlock();
    --loop_depth_;
    if (CheckKeyword("else")) {
        Fail("'while ... else' is not supported");
    }
    return stmt;
}

StmtPtr Parser::ParseFor() {
    auto stmt = std::make_shared<ForStmt>(Advance().line);
    stmt->target = ParseTargetList();
    Expect(TokenType::kKeyword, "in", "'in'");
    stmt->iter = ParseTestList();
    ++loop_depth_;
    stmt->body = ParseBlock();
    --loop_depth_;
    if (CheckKeyword("else")) {
        Fail("'for ... else' is not supported");
    }
    return stmt;
}

StmtPtr Parser::ParseTry() {
    auto stmt = std::make_shared<TryStmt>(Advance().line);
    stmt->body = ParseBlock();
    while (CheckKeyword("except")) {
        ExceptHandler handler;
        handler.line = Advance().line;
        if (!CheckOperator(":")) {
            handler.type = ParseTest();
            if (Match(TokenType::kKeyword, "as")) {
                handler.name = Expect(TokenType::kName, "", "a name after 'as'").text;
            }
        }
        handler.body = ParseBlock();
        stmt->handlers.push_back(std::move(handler));
    }
    if (Match(TokenType::kKeyword, "else")) {
        if (stmt->handlers.empty()) {
            Fail("'else' requires at least one 'except' clause");
        }
        stmt->orelse = ParseBlock();
    }
    if (Match(TokenType::kKeyword, "finally")) {
        stmt->finalbody = ParseBlock();
    }
    if (stmt->handlers.empty() && stmt->finalbody.empty()) {
        Fail("expected 'except' or 'finally' block");
    }
    return stmt;
}

StmtPtr Parser::ParseDecorated() {
    std::vector<ExprPtr> decorators;
    while (Match(TokenType::kOperator, "@")) {
        decorators.push_back(ParseTest());
        Expect(TokenType::kNewline, "", "newline after decorator");
    }
    if (CheckKeyword("def")) {
        auto def = ParseFunctionDef();
        def->decorators = std::move(decorators);
        return def;
    }
    if (CheckKeyword("class")) {
        auto cls = ParseClassDef();
        cls->decorators = std::move(decorators);
        return cls;
    }
    Fail("expected 'def' or 'class' after decorator");
}

std::shared_ptr<FunctionDefStmt> Parser::ParseFunctionDef() {
    auto def = std::make_shared<FunctionDefStmt>(Advance().line);
    def->name = Expect(TokenType::kName, "", "a function name").text;
    Expect(TokenType::kOperator, "(", "'('");
    bool seen_default = false;
    while (!CheckOperator(")")) {
        if (CheckOperator("*") || CheckOperator("**")) {
            Fail("variadic parameters are not supported");
        }
        Parameter param;
        param.name = Expect(TokenType::kName, "", "a parameter name").text;
        for (const auto& existing : def->params) {
            if (existing.name == param.name) {
                Fail("duplicate argument '" + param.name + "' in function definition");
            }
        }
        if (Match(TokenType::kOperator, ":")) {
            ParseTest();
        }
        if (Match(TokenType::kOperator, "=")) {
            param.default_value = ParseTest();
            seen_default = true;
        } else if (seen_default) {
            Fail("non-default argument follows default argument");
        }
        def->params.push_back(std::move(param));
        if (!Match(TokenType::kOperator, ",")) {
            break;
        }
    }
    Expect(TokenType::kOperator, ")", "')'");
    if (Match(TokenType::kOperator, "->")) {
        ParseTest();
    }
    const int enclosing_loops = loop_depth_;
    loop_depth_ = 0;
    ++function_depth_;
    def->body = ParseBlock();
    --function_depth_;
    loop_depth_ = enclosing_loops;
    return def;
}

std::shared_ptr<ClassDefStmt> Parser::ParseClassDef() {
    auto cls = std::make_shared<ClassDefStmt>(Advance().line);
    cls->name = Expect(TokenType::kName, "", "a class name").text;
    if (Match(TokenType::kOperator, "(")) {
        while (!CheckOperator(")")) {
            if (Check(TokenType::kName) && Peek(1).type == TokenType::kOperator && Peek(1).text == "=") {
                Fail("class keyword arguments are not supported");
            }
            cls->bases.push_back(ParseTest());
            if (!Match(TokenType::kOperator, ",")) {
                break;
            }
        }
        Expect(TokenType::kOperator, ")", "')'");
    }
    const int enclosing_loops = loop_depth_;
    const int enclosing_functions = function_depth_;
    loop_depth_ = 0;
    function_depth_ = 0;
    cls->body = ParseBlock();
    loop_depth_ = enclosing_loops;
    function_depth_ = enclosing_functions;
    return cls;
}

std::string Parser::ParseDottedName() {
    std::string name = Expect(TokenType::kName, "", "a module name").text;
    while (CheckOperator(".") && Peek(1).type == TokenType::kName) {
        Advance();
        name += "." + Advance().text;
    }
    return name;
}

StmtPtr Parser::ParseImport() {
    auto stmt = std::make_shared<ImportStmt>(Advance().line);
    do {
        Alias alias;
        alias.name = ParseDottedName();
        if (Match(TokenType::kKeyword, "as")) {
            alias.asname = Expect(TokenType::kName, "", "a name after 'as'").text;
        }
        stmt->names.push_back(std::move(alias));
    } while (Match(TokenType::kOperator, ","));
    return stmt;
}

StmtPtr Parser::ParseImportFrom() {
    auto stmt = std::make_shared<ImportFromStmt>(Advance().line);
    if (CheckOperator(".") || CheckOperator("...")) {
        Fail("relative imports are not supported");
    }
    stmt->module = ParseDottedName();
    Expect(TokenType::kKeyword, "import", "'import'");
    if (Match(TokenType::kOperator, "*")) {
        stmt->names.push_back(Alias{"*", ""});
        return stmt;
    }
    const bool parenthesized = Match(TokenType::kOperator, "(");
    do {
        if (parenthesized && CheckOperator(")")) {
            break;
        }
        Alias alias;
        alias.name = Expect(TokenType::kName, "", "a name to import").text;
        if (Match(TokenType::kKeyword, "as")) {
            alias.asname = Expect(TokenType::kName, "", "a name after 'as'").text;
        }
        stmt->names.push_back(std::move(alias));
    } while (Match(TokenType::kOperator, ","));
    if (parenthesized) {
        Expect(TokenType::kOperator, ")", "')'");
    }
    return stmt;
}

// `match` is a soft keyword: only a well-formed header followed by an
// indented `case` commits to a match statement.
StmtPtr Parser::TryParseMatch() {
    const std::size_t saved = pos_;
    auto stmt = std::make_shared<MatchStmt>(Peek().line);
    try {
        Advance();
        stmt->subject = ParseTestList();
        Expect(TokenType::kOperator, ":", "':'");
        Expect(TokenType::kNewline, "", "newline");
        Expect(TokenType::kIndent, "", "an indented block");
        if (!Check(TokenType::kName, "case")) {
            Fail("expected 'case'");
        }
    } catch (const ParseError&) {
        pos_ = saved;
        return nullptr;
    }
    while (Check(TokenType::kName, "case")) {
        Advance();
        MatchCase match_case;
        match_case.pattern = ParsePattern();
        if (Match(TokenType::kKeyword, "if")) {
            match_case.guard = ParseTest();
        }
        match_case.body = ParseBlock();
        stmt->cases.push_back(std::move(match_case));
        while (Match(TokenType::kNewline)) {
        }
    }
    if (!Match(TokenType::kDedent) && !Check(TokenType::kEnd)) {
        Fail("expected 'case'");
    }
    return stmt;
}

PatternPtr Parser::ParsePattern() {
    const int line = Peek().line;
    PatternPtr first = ParseClosedPattern();
    if (!CheckOperator(",")) {
        return first;
    }
    auto sequence = std::make_shared<Pattern>(PatternKind::kSequence, line);
    sequence->elements.push_back(first);
    while (Match(TokenType::kOperator, ",")) {
        if (CheckOperator(":") || CheckKeyword("if")) {
            break;
        }
        sequence->elements.push_back(ParseClosedPattern());
    }
    return sequence;
}

PatternPtr Parser::ParseClosedPattern() {
    const Token& token = Peek();
    const int line = token.line;

    if (CheckOperator("[") || CheckOperator("(")) {
        const std::string close = token.text == "[" ? "]" : ")";
        const bool is_paren = token.text == "(";
        Advance();
        auto sequence = std::make_shared<Pattern>(PatternKind::kSequence, line);
        bool saw_comma = false;
        while (!CheckOperator(close)) {
            sequence->elements.push_back(ParseClosedPattern());
            if (!Match(TokenType::kOperator, ",")) {
                break;
            }
            saw_comma = true;
        }
        Expect(TokenType::kOperator, close, "'" + close + "'");
        if (is_paren && !saw_comma && sequence->elements.size() == 1) {
            return sequence->elements.front();
        }
        return sequence;
    }

    if (token.type == TokenType::kName) {
        if (token.text == "_" && !(Peek(1).type == TokenType::kOperator &&
                                   (Peek(1).text == "." || Peek(1).text == "("))) {
            Advance();
            return std::make_shared<Pattern>(PatternKind::kWildcard, line);
        }
        ExprPtr dotted = std::make_shared<NameExpr>(Advance().text, line);
        bool qualified = false;
        while (Match(TokenType::kOperator, ".")) {
            dotted = std::make_shared<AttributeExpr>(dotted, Expect(TokenType::kName, "", "a name").text, line);
            qualified = true;
        }
        if (Match(TokenType::kOperator, "(")) {
            auto pattern = std::make_shared<Pattern>(PatternKind::kClass, line);
            pattern->cls = dotted;
            while (!CheckOperator(")")) {
                if (Check(TokenType::kName) && Peek(1).type == TokenType::kOperator && Peek(1).text == "=") {
                    std::string name = Advance().text;
                    Advance();
                    pattern->keywords.emplace_back(std::move(name), ParseClosedPattern());
                } else {
                    if (!pattern->keywords.empty()) {
                        Fail("positional patterns follow keyword patterns");
                    }
                    pattern->elements.push_back(ParseClosedPattern());
                }
                if (!Match(TokenType::kOperator, ",")) {
                    break;
                }
            }
            Expect(TokenType::kOperator, ")", "')'");
            return pattern;
        }
        if (qualified) {
            auto pattern = std::make_shared<Pattern>(PatternKind::kValue, line);
            pattern->value = dotted;
            return pattern;
        }
        auto capture = std::make_shared<Pattern>(PatternKind::kCapture, line);
        capture->name = static_cast<NameExpr&>(*dotted).id;
        return capture;
    }

    if (token.type == TokenType::kInt || token.type == TokenType::kFloat ||
        token.type == TokenType::kString || token.type == TokenType::kFString || CheckOperator("-") ||
        CheckKeyword("True") || CheckKeyword("False") || CheckKeyword("None")) {
        auto pattern = std::make_shared<Pattern>(PatternKind::kValue, line);
        pattern->value = ParseArith();
        return pattern;
    }

    Fail("invalid pattern");
}

// ---------------------------------------------------------------------------
// Expressions

ExprPtr Parser::ParseTestList() {
    const int line = Peek().line;
    ExprPtr first = ParseTest();
    if (!CheckOperator(",")) {
        return first;
    }
    auto tuple = std::make_shared<SequenceExpr>(ExprKind::kTuple, line);
    tuple->elements.push_back(first);
    while (Match(TokenType::kOperator, ",")) {
        if (!StartsExpression()) {
            break;
        }
        tuple->elements.push_back(ParseTest());
    }
    return tuple;
}

ExprPtr Parser::ParseTargetList() {
    const int line = Peek().line;
    ExprPtr first = ParseArith();
    ExprPtr result = first;
    if (CheckOperator(",")) {
        auto tuple = std::make_shared<SequenceExpr>(ExprKind::kTuple, line);
        tuple->elements.push_back(first);
        while (Match(TokenType::kOperator, ",")) {
            if (!StartsExpression()) {
                break;
            }
            tuple->elements.push_back(ParseArith());
        }
        result = tuple;
    }
    CheckAssignable(result);
    return result;
}

void Parser::CheckAssignable(const ExprPtr& target) const {
    switch (target->kind) {
        case ExprKind::kName:
        case ExprKind::kAttribute:
        case ExprKind::kSubscript:
            return;
        case ExprKind::kTuple:
        case ExprKind::kList:
            for (const auto& element : static_cast<const SequenceExpr&>(*target).elements) {
                CheckAssignable(element);
            }
            return;
        default:
            throw ParseError(std::string("cannot assign to ") + KindName(target->kind), target->line);
    }
}

ExprPtr Parser::ParseTest() {
    NestingGuard guard(*this, "too many nested parentheses");
    const int line = Peek().line;
    if (CheckKeyword("lambda")) {
        Fail("'lambda' is not supported");
    }
    ExprPtr body = ParseOrTest();
    if (!Match(TokenType::kKeyword, "if")) {
        return body;
    }
    ExprPtr test = ParseOrTest();
    Expect(TokenType::kKeyword, "else", "'else' in conditional expression");
    ExprPtr orelse = ParseTest();
    return std::make_shared<IfExpExpr>(test, body, orelse, line);
}

ExprPtr Parser::ParseOrTest() {
    const int line = Peek().line;
    ExprPtr first = ParseAndTest();
    if (!CheckKeyword("or")) {
        return first;
    }
    auto node = std::make_shared<BoolOpExpr>(BoolOpKind::kOr, line);
    node->values.push_back(first);
    while (Match(TokenType::kKeyword, "or")) {
        node->values.push_back(ParseAndTest());
    }
    return node;
}

ExprPtr Parser::ParseAndTest() {
    const int line = Peek().line;
    ExprPtr first = ParseNotTest();
    if (!CheckKeyword("and")) {
        return first;
    }
    auto node = std::make_shared<BoolOpExpr>(BoolOpKind::kAnd, line);
    node->values.push_back(first);
    while (Match(TokenType::kKeyword, "and")) {
        node->values.push_back(ParseNotTest());
    }
    return node;
}

ExprPtr Parser::ParseNotTest() {
    NestingGuard guard(*this, "too many nested parentheses");
    const int line = Peek().line;
    if (Match(TokenType::kKeyword, "not")) {
        return std::make_shared<UnaryOpExpr>(UnaryOp::kNot, ParseNotTest(), line);
    }
    return ParseComparison();
}

ExprPtr Parser::ParseComparison() {
    const int line = Peek().line;
    ExprPtr left = ParseArith();
    std::shared_ptr<CompareExpr> node;
    while (true) {
        CompareOp op;
        const Token& token = Peek();
        if (token.type == TokenType::kOperator && token.text == "==") {
            op = CompareOp::kEq;
        } else if (token.type == TokenType::kOperator && token.text == "!=") {
            op = CompareOp::kNotEq;
        } else if (token.type == TokenType::kOperator && token.text == "<") {
            op = CompareOp::kLt;
        } else if (token.type == TokenType::kOperator && token.text == "<=") {
            op = CompareOp::kLtE;
        } else if (token.type == TokenType::kOperator && token.text == ">") {
            op = CompareOp::kGt;
        } else if (token.type == TokenType::kOperator && token.text == ">=") {
            op = CompareOp::kGtE;
        } else if (token.type == TokenType::kKeyword && token.text == "in") {
            op = CompareOp::kIn;
        } else if (token.type == TokenType::kKeyword && token.text == "not" &&
                   Peek(1).type == TokenType::kKeyword && Peek(1).text == "in") {
            Advance();
            op = CompareOp::kNotIn;
        } else if (token.type == TokenType::kKeyword && token.text == "is") {
            if (Peek(1).type == TokenType::kKeyword && Peek(1).text == "not") {
                Advance();
                op = CompareOp::kIsNot;
            } else {
                op = CompareOp::kIs;
            }
        } else {
            break;
        }
        Advance();
        if (!node) {
            node = std::make_shared<CompareExpr>(left, line);
        }
        node->ops.push_back(op);
        node->comparators.push_back(ParseArith());
    }
    if (node) {
        return node;
    }
    return left;
}

ExprPtr Parser::ParseArith() {
    ExprPtr left = ParseTerm();
    while (CheckOperator("+") || CheckOperator("-")) {
        const Token& token = Advance();
        const BinaryOp op = token.text == "+" ? BinaryOp::kAdd : BinaryOp::kSub;
        left = std::make_shared<BinOpExpr>(op, left, ParseTerm(), token.line);
    }
    return left;
}

ExprPtr Parser::ParseTerm() {
    ExprPtr left = ParseFactor();
    while (true) {
        BinaryOp op;
        if (CheckOperator("*")) {
            op = BinaryOp::kMul;
        } else if (CheckOperator("/")) {
            op = BinaryOp::kDiv;
        } else if (CheckOperator("//")) {
            op = BinaryOp::kFloorDiv;
        } else if (CheckOperator("%")) {
            op = BinaryOp::kMod;
        } else {
            break;
        }
        const int line = Advance().line;
        left = std::make_shared<BinOpExpr>(op, left, ParseFactor(), line);
    }
    return left;
}

ExprPtr Parser::ParseFactor() {
    NestingGuard guard(*this, "too many nested parentheses");
    const int line = Peek().line;
    if (Match(TokenType::kOperator, "-")) {
        return std::make_shared<UnaryOpExpr>(UnaryOp::kNeg, ParseFactor(), line);
    }
    if (Match(TokenType::kOperator, "+")) {
        return std::make_shared<UnaryOpExpr>(UnaryOp::kPos, ParseFactor(), line);
    }
    if (CheckOperator("~")) {
        Fail("bitwise operators are not supported");
    }
    return ParsePower();
}

ExprPtr Parser::ParsePower() {
    ExprPtr base = ParsePrimary();
    if (CheckOperator("**")) {
        const int line = Advance().line;
        return std::make_shared<BinOpExpr>(BinaryOp::kPow, base, ParseFactor(), line);
    }
    return base;
}

ExprPtr Parser::ParsePrimary() {
    ExprPtr expr = ParseAtom();
    while (true) {
        const int line = Peek().line;
        if (Match(TokenType::kOperator, ".")) {
            const Token& name = Peek();
            if (name.type != TokenType::kName) {
                Fail("expected an attribute name");
            }
            Advance();
            expr = std::make_shared<AttributeExpr>(expr, name.text, line);
        } else if (Match(TokenType::kOperator, "(")) {
            auto call = std::make_shared<CallExpr>(expr, line);
            ParseCallArguments(*call);
            expr = call;
        } else if (Match(TokenType::kOperator, "[")) {
            if (CheckOperator(":")) {
                Fail("slice syntax is not supported");
            }
            ExprPtr index = ParseTestList();
            if (CheckOperator(":")) {
                Fail("slice syntax is not supported");
            }
            Expect(TokenType::kOperator, "]", "']'");
            expr = std::make_shared<SubscriptExpr>(expr, index, line);
        } else {
            break;
        }
    }
    return expr;
}

void Parser::ParseCallArguments(CallExpr& call) {
    while (!CheckOperator(")")) {
        if (CheckOperator("*") || CheckOperator("**")) {
            Fail("argument unpacking is not supported");
        }
        if (Check(TokenType::kName) && Peek(1).type == TokenType::kOperator && Peek(1).text == "=") {
            Keyword keyword;
            keyword.name = Advance().text;
            Advance();
            for (const auto& existing : call.keywords) {
                if (existing.name == keyword.name) {
                    Fail("keyword argument repeated: " + keyword.name);
                }
            }
            keyword.value = ParseTest();
            call.keywords.push_back(std::move(keyword));
        } else {
            if (!call.keywords.empty()) {
                Fail("positional argument follows keyword argument");
            }
            const int line = Peek().line;
            ExprPtr arg = ParseTest();
            if (CheckKeyword("for")) {
                if (!call.args.empty()) {
                    Fail("generator expression must be parenthesized");
                }
                arg = ParseComprehension(arg, line);
            }
            call.args.push_back(std::move(arg));
        }
        if (!Match(TokenType::kOperator, ",")) {
            break;
        }
    }
    Expect(TokenType::kOperator, ")", "')'");
}

ExprPtr Parser::ParseAtom() {
    const Token& token = Peek();
    const int line = token.line;
    switch (token.type) {
        case TokenType::kName:
            Advance();
            return std::make_shared<NameExpr>(token.text, line);
        case TokenType::kInt: {
            Advance();
            return std::make_shared<ConstantExpr>(Value(ParseIntLiteral(token.text, line)), line);
        }
        case TokenType::kFloat: {
            Advance();
            return std::make_shared<ConstantExpr>(Value(ParseFloatLiteral(token.text, line)), line);
        }
        case TokenType::kString:
        case TokenType::kFString:
            return ParseStrings();
        case TokenType::kKeyword:
            if (token.text == "True" || token.text == "False") {
                Advance();
                return std::make_shared<ConstantExpr>(Value(token.text == "True"), line);
            }
            if (token.text == "None") {
                Advance();
                return std::make_shared<ConstantExpr>(Value(), line);
            }
            break;
        case TokenType::kOperator:
            if (token.text == "(") {
                Advance();
                return ParseParenthesized(line);
            }
            if (token.text == "[") {
                Advance();
                return ParseListDisplay(line);
            }
            if (token.text == "{") {
                Advance();
                return ParseDictDisplay(line);
            }
            break;
        default:
            break;
    }
    Fail("invalid syntax");
}

ExprPtr Parser::ParseStrings() {
    const int line = Peek().line;
    std::vector<Token> pieces;
    bool formatted = false;
    while (Check(TokenType::kString) || Check(TokenType::kFString)) {
        formatted = formatted || Peek().type == TokenType::kFString;
        pieces.push_back(Advance());
    }
    if (!formatted) {
        std::string joined;
        for (const auto& piece : pieces) {
            joined += piece.text;
        }
        return std::make_shared<ConstantExpr>(Value(std::move(joined)), line);
    }
    auto fstring = std::make_shared<FStringExpr>(line);
    for (const auto& piece : pieces) {
        if (piece.type == TokenType::kFString) {
            ParseFString(piece, fstring);
        } else if (!piece.text.empty()) {
            FStringPart part;
            part.literal = piece.text;
            fstring->parts.push_back(std::move(part));
        }
    }
    return fstring;
}

ExprPtr Parser::ParseFString(const Token& token, std::shared_ptr<FStringExpr> into) {
    const std::string& text = token.text;
    std::string literal;
    auto flush_literal = [&]() {
        if (!literal.empty()) {
            FStringPart part;
            part.literal = std::move(literal);
            into->parts.push_back(std::move(part));
            literal.clear();
        }
    };

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (c == '{') {
            if (i + 1 < text.size() && text[i + 1] == '{') {
                literal.push_back('{');
                i += 2;
                continue;
            }
            flush_literal();
            std::size_t conversion_pos = std::string::npos;
            std::size_t spec_pos = std::string::npos;
            int depth = 0;
            char quote = 0;
            std::size_t j = i + 1;
            for (; j < text.size(); ++j) {
                const char ch = text[j];
                if (spec_pos != std::string::npos) {
                    if (ch == '}') {
                        break;
                    }
                    continue;
                }
                if (quote != 0) {
                    if (ch == quote) {
                        quote = 0;
                    }
                    continue;
                }
                if (ch == '\'' || ch == '"') {
                    quote = ch;
                } else if (ch == '(' || ch == '[' || ch == '{') {
                    ++depth;
                } else if (ch == ')' || ch == ']' || ch == '}') {
                    if (ch == '}' && depth == 0) {
                        break;
                    }
                    --depth;
                } else if (depth == 0 && ch == '!' && j + 1 < text.size() && text[j + 1] != '=' &&
                           conversion_pos == std::string::npos) {
                    conversion_pos = j;
                } else if (depth == 0 && ch == ':') {
                    spec_pos = j;
                }
            }
            if (j >= text.size()) {
                throw ParseError("f-string: expecting '}'", token.line);
            }
            std::size_t expr_end = j;
            if (conversion_pos != std::string::npos) {
                expr_end = conversion_pos;
            } else if (spec_pos != std::string::npos) {
                expr_end = spec_pos;
            }
            const std::string source = utils::Trim(text.substr(i + 1, expr_end - i - 1));
            if (source.empty()) {
                throw ParseError("f-string: empty expression not allowed", token.line);
            }
            FStringPart part;
            if (conversion_pos != std::string::npos) {
                const std::size_t conversion_end = spec_pos != std::string::npos ? spec_pos : j;
                const std::string conversion =
                    text.substr(conversion_pos + 1, conversion_end - conversion_pos - 1);
                if (conversion != "r" && conversion != "s" && conversion != "a") {
                    throw ParseError("f-string: invalid conversion character", token.line);
                }
                part.conversion = conversion[0];
            }
            if (spec_pos != std::string::npos) {
                part.format_spec = text.substr(spec_pos + 1, j - spec_pos - 1);
            }
            Lexer lexer(source, token.line);
            Parser nested(lexer.Tokenize());
            part.expr = nested.ParseStandaloneExpression();
            into->parts.push_back(std::move(part));
            i = j + 1;
            continue;
        }
        if (c == '}') {
            if (i + 1 < text.size() && text[i + 1] == '}') {
                literal.push_back('}');
                i += 2;
                continue;
            }
            throw ParseError("f-string: single '}' is not allowed", token.line);
        }
        literal.push_back(c);
        ++i;
    }
    flush_literal();
    return into;
}

ExprPtr Parser::ParseComprehension(ExprPtr element, int line) {
    auto comp = std::make_shared<ListCompExpr>(line);
    comp->element = std::move(element);
    Expect(TokenType::kKeyword, "for", "'for'");
    comp->target = ParseTargetList();
    Expect(TokenType::kKeyword, "in", "'in'");
    comp->iter = ParseOrTest();
    while (Match(TokenType::kKeyword, "if")) {
        comp->conditions.push_back(ParseOrTest());
    }
    if (CheckKeyword("for")) {
        Fail("nested comprehension clauses are not supported");
    }
    return comp;
}

ExprPtr Parser::ParseParenthesized(int line) {
    if (Match(TokenType::kOperator, ")")) {
        return std::make_shared<SequenceExpr>(ExprKind::kTuple, line);
    }
    ExprPtr first = ParseTest();
    if (CheckKeyword("for")) {
        ExprPtr comp = ParseComprehension(first, line);
        Expect(TokenType::kOperator, ")", "')'");
        return comp;
    }
    if (!Match(TokenType::kOperator, ",")) {
        Expect(TokenType::kOperator, ")", "')'");
        return first;
    }
    auto tuple = std::make_shared<SequenceExpr>(ExprKind::kTuple, line);
    tuple->elements.push_back(first);
    while (!CheckOperator(")")) {
        tuple->elements.push_back(ParseTest());
        if (!Match(TokenType::kOperator, ",")) {
            break;
        }
    }
    Expect(TokenType::kOperator, ")", "')'");
    return tuple;
}

ExprPtr Parser::ParseListDisplay(int line) {
    auto list = std::make_shared<SequenceExpr>(ExprKind::kList, line);
    if (Match(TokenType::kOperator, "]")) {
        return list;
    }
    ExprPtr first = ParseTest();
    if (CheckKeyword("for")) {
        ExprPtr comp = ParseComprehension(first, line);
        Expect(TokenType::kOperator, "]", "']'");
        return comp;
    }
    list->elements.push_back(first);
    while (Match(TokenType::kOperator, ",")) {
        if (CheckOperator("]")) {
            break;
        }
        list->elements.push_back(ParseTest());
    }
    Expect(TokenType::kOperator, "]", "']'");
    return list;
}

ExprPtr Parser::ParseDictDisplay(int line) {
    auto dict = std::make_shared<DictExpr>(line);
    while (!CheckOperator("}")) {
        if (CheckOperator("**")) {
            Fail("dict unpacking is not supported");
        }
        ExprPtr key = ParseTest();
        if (!CheckOperator(":")) {
            Fail("set displays are not supported");
        }
        Advance();
        dict->keys.push_back(std::move(key));
        dict->values.push_back(ParseTest());
        if (!Match(TokenType::kOperator, ",")) {
            break;
        }
    }
    Expect(TokenType::kOperator, "}", "'}'");
    return dict;
}

}  // namespace codeact::script
