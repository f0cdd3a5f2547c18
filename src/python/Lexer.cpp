#include "python/Lexer.hpp"
#include "llvm/ADT/StringExtras.h"
#include <cctype>

namespace pystyle::python {

static bool isIdentStart(char c) {
  unsigned char u = (unsigned char)c;
  return std::isalpha(u) || c == '_' || u >= 0x80;
}

static bool isIdentChar(char c) {
  unsigned char u = (unsigned char)c;
  return std::isalnum(u) || c == '_' || u >= 0x80;
}

static bool isStringPrefix(llvm::StringRef word) {
  std::string p = word.lower();
  return p == "r" || p == "u" || p == "b" || p == "f" || p == "br" ||
         p == "rb" || p == "fr" || p == "rf";
}

static char closerFor(char open) {
  switch (open) {
  case '(': return ')';
  case '[': return ']';
  default: return '}';
  }
}

// Longest operators first
static const char* const kOperators[] = {
  "**=", "//=", ">>=", "<<=", "...",
  "**", "//", ">>", "<<", "<=", ">=", "==", "!=", "->", ":=",
  "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
  "+", "-", "*", "/", "%", "@", "&", "|", "^", "~", "<", ">",
  "(", ")", "[", "]", "{", "}", ",", ":", ";", ".", "=",
};

bool Lexer::fail(SyntaxError* error, unsigned line, unsigned col, std::string msg) const {
  if (error) {
    error->line = line;
    error->column = col;
    error->message = std::move(msg);
  }
  return false;
}

void Lexer::push(std::vector<Token>& out, TokenKind kind, std::string text,
                 unsigned line, unsigned column) const {
  Token t;
  t.kind = kind;
  t.text = std::move(text);
  t.line = line;
  t.column = column;
  out.push_back(std::move(t));
}

bool Lexer::lexIndentation(std::vector<Token>& out, SyntaxError* error) {
  unsigned col = 0;
  while (!atEnd()) {
    char c = peek();
    if (c == ' ') ++col;
    else if (c == '\t') col = (col / 8 + 1) * 8;
    else if (c == '\f') col = 0;
    else break;
    ++Pos;
  }

  // Blank and comment-only lines do not take part in indentation
  if (atEnd()) return true;
  if (peek() == '#' || peek() == '\n') return true;

  AtLineStart = false;
  if (col > Indents.back()) {
    Indents.push_back(col);
    push(out, TokenKind::Indent, "", Line, column(Pos));
    return true;
  }
  while (col < Indents.back()) {
    Indents.pop_back();
    push(out, TokenKind::Dedent, "", Line, column(Pos));
  }
  if (col != Indents.back())
    return fail(error, Line, column(Pos),
                "unindent does not match any outer indentation level");
  return true;
}

bool Lexer::skipStringBody(char quote, bool triple, bool fstring, unsigned startLine,
                           unsigned startCol, SyntaxError* error) {
  unsigned depth = 0; // replacement field nesting inside f-strings
  while (true) {
    if (atEnd()) {
      return fail(error, startLine, startCol,
                  triple ? "unterminated triple-quoted string literal"
                         : "unterminated string literal");
    }
    char c = peek();
    if (c == '\\') {
      if (peek(1) == '\n') {
        Pos += 2;
        newline();
      } else if (fstring && (peek(1) == '{' || peek(1) == '}')) {
        // The brace is still a field delimiter or a doubled literal brace
        ++Pos;
      } else {
        Pos += Pos + 1 < Src.size() ? 2 : 1;
      }
      continue;
    }
    if (c == '\n') {
      if (!triple && depth == 0)
        return fail(error, startLine, startCol, "unterminated string literal");
      ++Pos;
      newline();
      continue;
    }
    if (fstring && c == '{') {
      if (depth == 0 && peek(1) == '{') { Pos += 2; continue; }
      ++depth;
      ++Pos;
      continue;
    }
    if (fstring && c == '}') {
      if (depth == 0) {
        Pos += peek(1) == '}' ? 2 : 1;
        continue;
      }
      --depth;
      ++Pos;
      continue;
    }
    if (depth > 0 && (c == '\'' || c == '"')) {
      // Nested literal inside a replacement field
      bool nestedF = Pos > 0 && (Src[Pos - 1] == 'f' || Src[Pos - 1] == 'F');
      bool nestedTriple = peek(1) == c && peek(2) == c;
      unsigned l = Line, col = column(Pos);
      Pos += nestedTriple ? 3 : 1;
      if (!skipStringBody(c, nestedTriple, nestedF, l, col, error)) return false;
      continue;
    }
    if (c == quote) {
      if (!triple) { ++Pos; return true; }
      if (peek(1) == quote && peek(2) == quote) { Pos += 3; return true; }
    }
    ++Pos;
  }
}

bool Lexer::lexString(size_t prefixStart, llvm::StringRef prefix,
                      std::vector<Token>& out, SyntaxError* error) {
  unsigned startLine = Line, startCol = column(prefixStart);
  std::string lower = prefix.lower();
  char quote = peek();
  bool triple = peek(1) == quote && peek(2) == quote;
  Pos += triple ? 3 : 1;

  bool fstring = lower.find('f') != std::string::npos;
  if (!skipStringBody(quote, triple, fstring, startLine, startCol, error))
    return false;

  Token t;
  t.kind = TokenKind::String;
  t.text = Src.slice(prefixStart, Pos).str();
  t.line = startLine;
  t.column = startCol;
  t.fstring = fstring;
  t.bytes = lower.find('b') != std::string::npos;
  out.push_back(std::move(t));
  return true;
}

void Lexer::lexNumber(std::vector<Token>& out) {
  size_t start = Pos;
  bool hex = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');
  while (!atEnd()) {
    char c = peek();
    if (isIdentChar(c) || c == '.') { ++Pos; continue; }
    char prev = Src[Pos - 1];
    if ((c == '+' || c == '-') && !hex && (prev == 'e' || prev == 'E')) { ++Pos; continue; }
    break;
  }
  push(out, TokenKind::Number, Src.slice(start, Pos).str(), Line, column(start));
}

bool Lexer::lexOperator(std::vector<Token>& out, SyntaxError* error) {
  llvm::StringRef rest = Src.drop_front(Pos);
  for (const char* op : kOperators) {
    if (!rest.startswith(op)) continue;
    llvm::StringRef spelled(op);
    unsigned col = column(Pos);
    char c = spelled.front();
    if (spelled.size() == 1 && (c == '(' || c == '[' || c == '{')) {
      Brackets.push_back({c, Line, col});
    } else if (spelled.size() == 1 && (c == ')' || c == ']' || c == '}')) {
      if (Brackets.empty())
        return fail(error, Line, col, std::string("unmatched '") + c + "'");
      OpenBracket open = Brackets.back();
      if (closerFor(open.ch) != c)
        return fail(error, Line, col,
                    std::string("closing parenthesis '") + c +
                    "' does not match opening parenthesis '" + open.ch + "'");
      Brackets.pop_back();
    }
    push(out, TokenKind::Op, spelled.str(), Line, col);
    Pos += spelled.size();
    return true;
  }
  return fail(error, Line, column(Pos),
              std::string("invalid character '") + peek() + "'");
}

bool Lexer::tokenize(std::vector<Token>& out, SyntaxError* error) {
  out.clear();
  // A leading UTF-8 byte order mark is not part of the source
  if (Src.startswith("\xEF\xBB\xBF")) { Pos = 3; LineStart = 3; }

  while (true) {
    if (AtLineStart && Brackets.empty()) {
      if (!lexIndentation(out, error)) return false;
    }
    if (atEnd()) break;

    char c = peek();
    if (c == ' ' || c == '\t' || c == '\f') { ++Pos; continue; }
    if (c == '#') {
      while (!atEnd() && peek() != '\n') ++Pos;
      continue;
    }
    if (c == '\n') {
      bool logicalEnd = Brackets.empty() && !AtLineStart;
      if (logicalEnd) push(out, TokenKind::Newline, "", Line, column(Pos));
      ++Pos;
      newline();
      if (Brackets.empty()) AtLineStart = true;
      continue;
    }
    if (c == '\\') {
      if (peek(1) == '\n') {
        Pos += 2;
        newline();
        continue;
      }
      if (Pos + 1 >= Src.size())
        return fail(error, Line, column(Pos), "unexpected EOF while parsing");
      return fail(error, Line, column(Pos + 1),
                  "unexpected character after line continuation character");
    }
    if (isIdentStart(c)) {
      size_t start = Pos;
      while (!atEnd() && isIdentChar(peek())) ++Pos;
      llvm::StringRef word = Src.slice(start, Pos);
      if ((peek() == '\'' || peek() == '"') && isStringPrefix(word)) {
        if (!lexString(start, word, out, error)) return false;
        continue;
      }
      push(out, TokenKind::Name, word.str(), Line, column(start));
      continue;
    }
    if (llvm::isDigit(c) || (c == '.' && llvm::isDigit(peek(1)))) {
      lexNumber(out);
      continue;
    }
    if (c == '\'' || c == '"') {
      if (!lexString(Pos, "", out, error)) return false;
      continue;
    }
    if (!lexOperator(out, error)) return false;
  }

  if (!Brackets.empty()) {
    const OpenBracket& open = Brackets.back();
    return fail(error, open.line, open.column,
                std::string("'") + open.ch + "' was never closed");
  }
  if (!out.empty() && !out.back().is(TokenKind::Newline) &&
      !out.back().is(TokenKind::Dedent) && !out.back().is(TokenKind::Indent))
    push(out, TokenKind::Newline, "", Line, column(Pos));
  while (Indents.size() > 1) {
    Indents.pop_back();
    push(out, TokenKind::Dedent, "", Line, column(Pos));
  }
  push(out, TokenKind::EndMarker, "", Line, column(Pos));
  return true;
}

} // namespace pystyle::python
