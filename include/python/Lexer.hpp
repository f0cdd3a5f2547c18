#pragma once
#include "python/Token.hpp"
#include "llvm/ADT/StringRef.h"
#include <vector>

namespace pystyle::python {

// Python tokenizer: produces NAME/NUMBER/STRING/OP tokens plus the
// NEWLINE/INDENT/DEDENT structure. Comments and blank lines yield nothing.
// Expects '\n' line endings.
class Lexer {
public:
  explicit Lexer(llvm::StringRef source) : Src(source) {}

  // Returns false and fills *error on the first lexical error.
  bool tokenize(std::vector<Token>& out, SyntaxError* error);

private:
  bool lexIndentation(std::vector<Token>& out, SyntaxError* error);
  bool lexString(size_t prefixStart, llvm::StringRef prefix,
                 std::vector<Token>& out, SyntaxError* error);
  bool skipStringBody(char quote, bool triple, bool fstring, unsigned startLine,
                      unsigned startCol, SyntaxError* error);
  void lexNumber(std::vector<Token>& out);
  bool lexOperator(std::vector<Token>& out, SyntaxError* error);

  void push(std::vector<Token>& out, TokenKind kind, std::string text,
            unsigned line, unsigned column) const;
  unsigned column(size_t at) const { return (unsigned)(at - LineStart + 1); }
  char peek(size_t ahead = 0) const {
    return Pos + ahead < Src.size() ? Src[Pos + ahead] : '\0';
  }
  bool atEnd() const { return Pos >= Src.size(); }
  void newline() { ++Line; LineStart = Pos; }
  bool fail(SyntaxError* error, unsigned line, unsigned col, std::string msg) const;

  struct OpenBracket {
    char     ch;
    unsigned line;
    unsigned column;
  };

  llvm::StringRef Src;
  size_t   Pos = 0;
  size_t   LineStart = 0;
  unsigned Line = 1;
  bool     AtLineStart = true;
  std::vector<unsigned>    Indents{0};
  std::vector<OpenBracket> Brackets;
};

} // namespace pystyle::python
