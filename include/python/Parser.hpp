#pragma once
#include "python/Ast.hpp"
#include "python/Token.hpp"
#include "llvm/ADT/StringRef.h"
#include <vector>

namespace pystyle::python {

// Recursive-descent parser over the token stream produced by Lexer.
// Builds the statement tree in Ast.hpp; rejects malformed input with the
// first SyntaxError found.
class Parser {
public:
  explicit Parser(std::vector<Token> tokens);

  bool parseModule(Module& out, SyntaxError* error);

private:
  // statements
  bool parseStatement(NodeList& into);
  bool parseSimpleStatements(NodeList& into);
  bool parseSmallStatement(NodeList& into);
  bool parseExprStatement(NodeList& into);
  bool parseBlock(NodeList& body);
  bool parseIf(NodeList& into);
  bool parseWhile(NodeList& into);
  bool parseFor(NodeList& into, size_t start);
  bool parseTry(NodeList& into);
  bool parseWith(NodeList& into, size_t start);
  bool parseWithItems();
  bool parseDecorated(NodeList& into);
  bool parseFunctionDef(NodeList& into, size_t start);
  bool parseClassDef(NodeList& into, size_t start);
  bool parseMatch(NodeList& into);
  bool parseImport();
  bool parseFromImport();
  bool parseParameters(FunctionDef& fn, const char* closer, bool annotations);
  bool skipBalanced(const char* open, const char* close);
  bool looksLikeMatchStatement() const;

  // expressions
  bool parseStarExpressions(Expr& out);
  bool parseStarExpression(Expr& out);
  bool parseStarNamedExpr(Expr& out);
  bool parseStarTargets(Expr& out);
  bool parseNamedExpr(Expr& out);
  bool parseExpression(Expr& out);
  bool parseLambda(Expr& out);
  bool parseDisjunction(Expr& out);
  bool parseConjunction(Expr& out);
  bool parseInversion(Expr& out);
  bool parseComparison(Expr& out);
  bool parseBinary(Expr& out, unsigned level);
  bool parseFactor(Expr& out);
  bool parsePower(Expr& out);
  bool parsePrimary(Expr& out);
  bool parseAtom(Expr& out);
  bool parseStrings(Expr& out);
  bool parseParenthesized(Expr& out);
  bool parseListDisplay(Expr& out);
  bool parseBraceDisplay(Expr& out);
  bool parseYield(Expr& out);
  bool parseCallArguments();
  bool parseSlices();
  bool parseComprehension();

  // token helpers
  const Token& tok(size_t ahead = 0) const;
  void advance() { if (Cur + 1 < Toks.size()) ++Cur; }
  bool atOp(const char* op) const { return tok().isOp(op); }
  bool atKw(const char* kw) const { return tok().isKeyword(kw); }
  bool acceptOp(const char* op);
  bool acceptKw(const char* kw);
  bool expectOp(const char* op);
  bool expectName(std::string& out);
  bool atNewline() const { return tok().is(TokenKind::Newline); }
  bool fail(const Token& at, std::string message);
  bool failAt(unsigned line, unsigned column, std::string message);

  std::vector<Token> Toks;
  size_t Cur = 0;
  SyntaxError Err;
  bool Failed = false;
};

// Tokenizes and parses a whole module.
bool parseSource(llvm::StringRef source, Module& out, SyntaxError* error);

// True for Python hard keywords ("def", "None", ...)
bool isKeyword(llvm::StringRef word);

} // namespace pystyle::python
