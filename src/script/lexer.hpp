#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace codeact::script {

enum class TokenType {
    kName,
    kKeyword,
    kInt,
    kFloat,
    kString,
    kFString,
    kOperator,
    kNewline,
    kIndent,
    kDedent,
    kEnd
};

struct Token {
    TokenType type = TokenType::kEnd;
    // Identifier, keyword, operator or number spelling; decoded contents
    // for string tokens.
    std::string text;
    int line = 0;
};

// Converts source text into tokens, synthesizing NEWLINE/INDENT/DEDENT from
// the indentation structure. Throws ParseError on malformed input.
class Lexer {
public:
    explicit Lexer(std::string source, int first_line = 1);

    std::vector<Token> Tokenize();

    static bool IsKeyword(const std::string& word);

private:
    void HandleIndentation();
    void LexString(const std::string& prefix);
    void LexNumber();
    std::uint32_t LexHexEscape(int digits, int line);
    void LexOperator();
    void Emit(TokenType type, std::string text);

    char Peek(std::size_t offset = 0) const;
    char Advance();
    bool AtEnd() const { return pos_ >= source_.size(); }

    std::string source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int bracket_depth_ = 0;
    bool at_line_start_ = true;
    std::vector<int> indents_{0};
    std::vector<Token> tokens_;
};

}  // namespace codeact::script
