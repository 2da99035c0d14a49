#include "script/lexer.hpp"

#include <cctype>
#include <cstdint>
#include <unordered_set>

#include "script/errors.hpp"
#include "utils/common.hpp"

namespace codeact::script {
namespace {

const std::unordered_set<std::string>& Keywords() {
    static const std::unordered_set<std::string> keywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield"
    };
    return keywords;
}

bool IsIdentStart(char c) {
    return c == '_' || std::isalpha(static_cast<unsigned char>(c));
}

bool IsIdentPart(char c) {
    return c == '_' || std::isalnum(static_cast<unsigned char>(c));
}

bool IsStringPrefix(const std::string& word) {
    static const std::unordered_set<std::string> prefixes = {
        "f", "F", "r", "R", "rf", "fr", "Rf", "fR", "rF", "Fr", "RF", "FR"
    };
    return prefixes.count(word) > 0;
}

}  // namespace

Lexer::Lexer(std::string source, int first_line)
    : source_(std::move(source)), line_(first_line) {}

bool Lexer::IsKeyword(const std::string& word) {
    return Keywords().count(word) > 0;
}

char Lexer::Peek(std::size_t offset) const {
    return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
}

char Lexer::Advance() {
    const char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
    }
    return c;
}

void Lexer::Emit(TokenType type, std::string text) {
    tokens_.push_back(Token{type, std::move(text), line_});
}

std::vector<Token> Lexer::Tokenize() {
    while (true) {
        if (at_line_start_ && bracket_depth_ == 0) {
            HandleIndentation();
            if (AtEnd()) {
                break;
            }
        }
        if (AtEnd()) {
            break;
        }
        const char c = Peek();
        if (c == '\n') {
            Advance();
            if (bracket_depth_ == 0) {
                if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline) {
                    tokens_.push_back(Token{TokenType::kNewline, "", line_ - 1});
                }
                at_line_start_ = true;
            }
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
            Advance();
            continue;
        }
        if (c == '#') {
            while (!AtEnd() && Peek() != '\n') {
                Advance();
            }
            continue;
        }
        if (c == '\\' && Peek(1) == '\n') {
            Advance();
            Advance();
            continue;
        }
        if (IsIdentStart(c)) {
            const std::size_t start = pos_;
            while (!AtEnd() && IsIdentPart(Peek())) {
                Advance();
            }
            std::string word = source_.substr(start, pos_ - start);
            if ((Peek() == '"' || Peek() == '\'') && IsStringPrefix(word)) {
                LexString(word);
                continue;
            }
            const TokenType type = IsKeyword(word) ? TokenType::kKeyword : TokenType::kName;
            Emit(type, std::move(word));
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
            LexNumber();
            continue;
        }
        if (c == '"' || c == '\'') {
            LexString("");
            continue;
        }
        LexOperator();
    }

    if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline) {
        Emit(TokenType::kNewline, "");
    }
    while (indents_.size() > 1) {
        indents_.pop_back();
        Emit(TokenType::kDedent, "");
    }
    Emit(TokenType::kEnd, "");
    return tokens_;
}

void Lexer::HandleIndentation() {
    while (true) {
        int width = 0;
        while (!AtEnd() && (Peek() == ' ' || Peek() == '\t' || Peek() == '\r' || Peek() == '\f')) {
            const char c = Advance();
            if (c == ' ') {
                ++width;
            } else if (c == '\t') {
                width = (width / 8 + 1) * 8;
            }
        }
        if (AtEnd()) {
            return;
        }
        // Blank and comment-only lines do not affect indentation.
        if (Peek() == '\n') {
            Advance();
            continue;
        }
        if (Peek() == '#') {
            while (!AtEnd() && Peek() != '\n') {
                Advance();
            }
            continue;
        }
        at_line_start_ = false;
        if (width > indents_.back()) {
            indents_.push_back(width);
            Emit(TokenType::kIndent, "");
        } else {
            while (width < indents_.back()) {
                indents_.pop_back();
                Emit(TokenType::kDedent, "");
            }
            if (width != indents_.back()) {
                throw ParseError("unindent does not match any outer indentation level", line_);
            }
        }
        return;
    }
}

void Lexer::LexString(const std::string& prefix) {
    bool raw = false;
    bool formatted = false;
    for (const char p : prefix) {
        if (p == 'r' || p == 'R') raw = true;
        if (p == 'f' || p == 'F') formatted = true;
    }
    const int start_line = line_;
    const char quote = Advance();
    bool triple = false;
    if (Peek() == quote && Peek(1) == quote) {
        Advance();
        Advance();
        triple = true;
    }

    std::string value;
    while (true) {
        if (AtEnd()) {
            throw ParseError("unterminated string literal", start_line);
        }
        const char c = Peek();
        if (!triple && c == '\n') {
            throw ParseError("unterminated string literal", start_line);
        }
        if (c == quote) {
            if (!triple) {
                Advance();
                break;
            }
            if (Peek(1) == quote && Peek(2) == quote) {
                Advance();
                Advance();
                Advance();
                break;
            }
        }
        if (c == '\\' && !raw) {
            Advance();
            if (AtEnd()) {
                throw ParseError("unterminated string literal", start_line);
            }
            const char escaped = Advance();
            switch (escaped) {
                case 'n': value.push_back('\n'); break;
                case 't': value.push_back('\t'); break;
                case 'r': value.push_back('\r'); break;
                case '0': value.push_back('\0'); break;
                case '\\': value.push_back('\\'); break;
                case '\'': value.push_back('\''); break;
                case '"': value.push_back('"'); break;
                case '\n': break;
                case 'x':
                    utils::AppendUtf8(value, LexHexEscape(2, start_line));
                    break;
                case 'u':
                    utils::AppendUtf8(value, LexHexEscape(4, start_line));
                    break;
                default:
                    value.push_back('\\');
                    value.push_back(escaped);
                    break;
            }
            continue;
        }
        value.push_back(Advance());
    }

    Token token{formatted ? TokenType::kFString : TokenType::kString, std::move(value), start_line};
    tokens_.push_back(std::move(token));
}

std::uint32_t Lexer::LexHexEscape(int digits, int line) {
    std::uint32_t cp = 0;
    for (int i = 0; i < digits; ++i) {
        if (AtEnd() || !std::isxdigit(static_cast<unsigned char>(Peek()))) {
            throw ParseError("truncated \\xXX escape", line);
        }
        const char h = Advance();
        cp = cp * 16 + static_cast<std::uint32_t>(
            std::isdigit(static_cast<unsigned char>(h)) ? h - '0'
                                                        : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
    }
    return cp;
}

void Lexer::LexNumber() {
    const std::size_t start = pos_;
    bool is_float = false;
    if (Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X')) {
        Advance();
        Advance();
        while (!AtEnd() && (std::isxdigit(static_cast<unsigned char>(Peek())) || Peek() == '_')) {
            Advance();
        }
        Emit(TokenType::kInt, source_.substr(start, pos_ - start));
        return;
    }
    while (!AtEnd() && (std::isdigit(static_cast<unsigned char>(Peek())) || Peek() == '_')) {
        Advance();
    }
    if (Peek() == '.' && std::isdigit(static_cast<unsigned char>(Peek(1)))) {
        is_float = true;
        Advance();
        while (!AtEnd() && (std::isdigit(static_cast<unsigned char>(Peek())) || Peek() == '_')) {
            Advance();
        }
    } else if (Peek() == '.' && !IsIdentStart(Peek(1))) {
        is_float = true;
        Advance();
    }
    if (Peek() == 'e' || Peek() == 'E') {
        const char sign = Peek(1);
        const bool has_sign = sign == '+' || sign == '-';
        if (std::isdigit(static_cast<unsigned char>(Peek(has_sign ? 2 : 1)))) {
            is_float = true;
            Advance();
            if (has_sign) {
                Advance();
            }
            while (!AtEnd() && std::isdigit(static_cast<unsigned char>(Peek()))) {
                Advance();
            }
        }
    }
    std::string text;
    for (std::size_t i = start; i < pos_; ++i) {
        if (source_[i] != '_') {
            text.push_back(source_[i]);
        }
    }
    Emit(is_float ? TokenType::kFloat : TokenType::kInt, std::move(text));
}

void Lexer::LexOperator() {
    static const char* kThree[] = {"**=", "//=", "..."};
    static const char* kTwo[] = {
        "**", "//", "==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "->", ":="
    };
    for (const char* op : kThree) {
        if (source_.compare(pos_, 3, op) == 0) {
            pos_ += 3;
            Emit(TokenType::kOperator, op);
            return;
        }
    }
    for (const char* op : kTwo) {
        if (source_.compare(pos_, 2, op) == 0) {
            pos_ += 2;
            Emit(TokenType::kOperator, op);
            return;
        }
    }
    const char c = Peek();
    static const std::string kSingle = "+-*/%<>=()[]{},:.;@|&^~";
    if (kSingle.find(c) == std::string::npos) {
        throw ParseError(std::string("invalid character '") + c + "' in source", line_);
    }
    if (c == '(' || c == '[' || c == '{') {
        ++bracket_depth_;
    } else if ((c == ')' || c == ']' || c == '}') && bracket_depth_ > 0) {
        --bracket_depth_;
    }
    Advance();
    Emit(TokenType::kOperator, std::string(1, c));
}

}  // namespace codeact::script
