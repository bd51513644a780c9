#ifndef VALIDATOR_LEXER_HPP
#define VALIDATOR_LEXER_HPP

#include <string>
#include <vector>

namespace validator {

enum class Syntax { PYTHON, JAVASCRIPT };

enum class TokenType { IDENTIFIER, NUMBER, STRING, PUNCTUATION };

struct Token {
  TokenType type = TokenType::PUNCTUATION;
  // Strings and regular expression literals hold their content, without
  // quotes or delimiters.
  std::string text;
  int line = 0;
  int column = 0;
  // Indentation of the line the token is on.
  int indent = 0;
  bool first_on_line = false;
};

// Splits source code into tokens, skipping whitespace and comments. Returns
// false if the code is not well formed (unterminated strings or comments,
// unbalanced brackets), and sets error_msg and error_line; the tokens read
// so far are returned anyway.
bool Tokenize(const std::string& code, Syntax syntax,
              std::vector<Token>* tokens, std::string* error_msg,
              int* error_line);

}  // namespace validator

#endif
