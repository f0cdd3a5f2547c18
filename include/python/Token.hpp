#pragma once
#include <string>

namespace pystyle::python {

enum class TokenKind {
  Name,
  Number,
  String,
  Op,         // operators and delimiters, spelled in Token::text
  Newline,    // end of a logical line
  Indent,
  Dedent,
  EndMarker,
};

struct Token {
  TokenKind   kind = TokenKind::EndMarker;
  std::string text;           // source spelling (empty for Indent/Dedent/EndMarker)
  unsigned    line = 0;       // 1-based
  unsigned    column = 0;     // 1-based, in bytes
  bool        fstring = false; // String only: f-prefixed literal
  bool        bytes = false;   // String only: b-prefixed literal

  bool is(TokenKind k) const { return kind == k; }
  bool isOp(const char* op) const { return kind == TokenKind::Op && text == op; }
  bool isKeyword(const char* kw) const { return kind == TokenKind::Name && text == kw; }
};

// Position-carrying error shared by the lexer and the parser
struct SyntaxError {
  unsigned    line = 0;
  unsigned    column = 0;
  std::string message;
};

} // namespace pystyle::python
