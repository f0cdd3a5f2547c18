#include "python/Parser.hpp"
#include "python/Lexer.hpp"
#include "llvm/ADT/StringSwitch.h"
#include <algorithm>

namespace pystyle::python {

namespace {

Expr makeExpr(ExprKind kind, unsigned line, unsigned column, std::string id = "") {
  Expr e;
  e.kind = kind;
  e.id = std::move(id);
  e.line = line;
  e.column = column;
  return e;
}

const char* const kAugmentedOps[] = {
  "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**=",
};

const char* const kComparisonOps[] = {"<", ">", "==", ">=", "<=", "!="};

// Binary operator precedence, loosest first
const std::vector<std::vector<const char*>> kBinaryLevels = {
  {"|"}, {"^"}, {"&"}, {"<<", ">>"}, {"+", "-"}, {"*", "/", "//", "%", "@"},
};

bool isAugmentedOp(const Token& t) {
  for (const char* op : kAugmentedOps)
    if (t.isOp(op)) return true;
  return false;
}

bool startsExpression(const Token& t) {
  switch (t.kind) {
  case TokenKind::Name:
    return !isKeyword(t.text) || t.text == "None" || t.text == "True" ||
           t.text == "False" || t.text == "lambda" || t.text == "not" ||
           t.text == "await";
  case TokenKind::Number:
  case TokenKind::String:
    return true;
  case TokenKind::Op:
    return llvm::StringSwitch<bool>(t.text)
        .Cases("(", "[", "{", "-", "+", "~", true)
        .Cases("*", "...", true)
        .Default(false);
  default:
    return false;
  }
}

// Message for a target that cannot be bound, empty when it can
std::string assignTargetError(const Expr& target) {
  switch (target.kind) {
  case ExprKind::Name:
  case ExprKind::Attribute:
  case ExprKind::Subscript:
  case ExprKind::Starred:
  case ExprKind::Tuple:
  case ExprKind::List:
    return "";
  case ExprKind::Constant:
    return "cannot assign to literal";
  case ExprKind::Call:
    return "cannot assign to function call";
  default:
    return "cannot assign to expression";
  }
}

bool isSingleTarget(const Expr& target) {
  return target.kind == ExprKind::Name || target.kind == ExprKind::Attribute ||
         target.kind == ExprKind::Subscript;
}

} // namespace

bool isKeyword(llvm::StringRef word) {
  return llvm::StringSwitch<bool>(word)
      .Cases("False", "None", "True", "and", "as", "assert", true)
      .Cases("async", "await", "break", "class", "continue", "def", true)
      .Cases("del", "elif", "else", "except", "finally", "for", true)
      .Cases("from", "global", "if", "import", "in", "is", true)
      .Cases("lambda", "nonlocal", "not", "or", "pass", "raise", true)
      .Cases("return", "try", "while", "with", "yield", true)
      .Default(false);
}

//===--------------------------------------------------------------------===//
// Token helpers
//===--------------------------------------------------------------------===//

const Token& Parser::tok(size_t ahead) const {
  size_t i = std::min(Cur + ahead, Toks.size() - 1);
  return Toks[i];
}

bool Parser::acceptOp(const char* op) {
  if (!atOp(op)) return false;
  advance();
  return true;
}

bool Parser::acceptKw(const char* kw) {
  if (!atKw(kw)) return false;
  advance();
  return true;
}

bool Parser::expectOp(const char* op) {
  if (acceptOp(op)) return true;
  return fail(tok(), std::string("expected '") + op + "'");
}

bool Parser::expectName(std::string& out) {
  const Token& t = tok();
  if (!t.is(TokenKind::Name) || isKeyword(t.text)) return fail(t, "invalid syntax");
  out = t.text;
  advance();
  return true;
}

bool Parser::fail(const Token& at, std::string message) {
  return failAt(at.line, at.column, std::move(message));
}

bool Parser::failAt(unsigned line, unsigned column, std::string message) {
  if (!Failed) {
    Failed = true;
    Err.line = line;
    Err.column = column;
    Err.message = std::move(message);
  }
  return false;
}

bool Parser::skipBalanced(const char* open, const char* close) {
  if (!expectOp(open)) return false;
  unsigned depth = 1;
  while (depth > 0) {
    if (tok().is(TokenKind::EndMarker)) return fail(tok(), "invalid syntax");
    if (atOp(open)) ++depth;
    else if (atOp(close)) --depth;
    advance();
  }
  return true;
}

//===--------------------------------------------------------------------===//
// Statements
//===--------------------------------------------------------------------===//

Parser::Parser(std::vector<Token> tokens) : Toks(std::move(tokens)) {
  if (Toks.empty() || !Toks.back().is(TokenKind::EndMarker)) {
    Token end;
    end.kind = TokenKind::EndMarker;
    end.line = Toks.empty() ? 1 : Toks.back().line;
    Toks.push_back(std::move(end));
  }
}

bool Parser::parseModule(Module& out, SyntaxError* error) {
  Cur = 0;
  Failed = false;
  out.body.clear();
  while (!tok().is(TokenKind::EndMarker)) {
    if (!parseStatement(out.body)) {
      if (error) *error = Err;
      return false;
    }
  }
  return true;
}

bool Parser::parseStatement(NodeList& into) {
  const Token& t = tok();
  if (t.is(TokenKind::Indent)) return fail(t, "unexpected indent");
  if (t.is(TokenKind::Name)) {
    if (t.text == "if") return parseIf(into);
    if (t.text == "while") return parseWhile(into);
    if (t.text == "for") return parseFor(into, Cur);
    if (t.text == "try") return parseTry(into);
    if (t.text == "with") return parseWith(into, Cur);
    if (t.text == "def") return parseFunctionDef(into, Cur);
    if (t.text == "class") return parseClassDef(into, Cur);
    if (t.text == "async") {
      size_t start = Cur;
      const Token& next = tok(1);
      if (next.isKeyword("def")) { advance(); return parseFunctionDef(into, start); }
      if (next.isKeyword("for")) { advance(); return parseFor(into, start); }
      if (next.isKeyword("with")) { advance(); return parseWith(into, start); }
      return fail(next, "invalid syntax");
    }
    if (t.text == "match" && looksLikeMatchStatement()) return parseMatch(into);
  }
  if (t.isOp("@")) return parseDecorated(into);
  return parseSimpleStatements(into);
}

bool Parser::parseBlock(NodeList& body) {
  if (!atNewline()) return parseSimpleStatements(body);
  advance();
  if (!tok().is(TokenKind::Indent)) return fail(tok(), "expected an indented block");
  advance();
  while (!tok().is(TokenKind::Dedent) && !tok().is(TokenKind::EndMarker)) {
    if (!parseStatement(body)) return false;
  }
  if (tok().is(TokenKind::Dedent)) advance();
  return true;
}

bool Parser::parseSimpleStatements(NodeList& into) {
  while (true) {
    if (!parseSmallStatement(into)) return false;
    if (!acceptOp(";")) break;
    if (atNewline()) break;
  }
  if (!atNewline()) return fail(tok(), "invalid syntax");
  advance();
  return true;
}

bool Parser::parseSmallStatement(NodeList& into) {
  const Token& t = tok();
  unsigned line = t.line;
  auto simple = [&](const char* kind) {
    auto node = std::make_unique<Node>();
    node->line = line;
    node->data = OtherStmt{kind, {}};
    into.push_back(std::move(node));
    return true;
  };

  if (t.is(TokenKind::Name)) {
    if (t.text == "pass") { advance(); return simple("Pass"); }
    if (t.text == "break") { advance(); return simple("Break"); }
    if (t.text == "continue") { advance(); return simple("Continue"); }
    if (t.text == "return") {
      advance();
      Expr value;
      if (startsExpression(tok()) && !parseStarExpressions(value)) return false;
      return simple("Return");
    }
    if (t.text == "raise") {
      advance();
      Expr exc, cause;
      if (startsExpression(tok())) {
        if (!parseExpression(exc)) return false;
        if (acceptKw("from") && !parseExpression(cause)) return false;
      }
      return simple("Raise");
    }
    if (t.text == "global" || t.text == "nonlocal") {
      const char* kind = t.text == "global" ? "Global" : "Nonlocal";
      advance();
      do {
        std::string name;
        if (!expectName(name)) return false;
      } while (acceptOp(","));
      return simple(kind);
    }
    if (t.text == "del") {
      advance();
      Expr targets;
      if (!parseStarExpressions(targets)) return false;
      return simple("Delete");
    }
    if (t.text == "assert") {
      advance();
      Expr test, msg;
      if (!parseExpression(test)) return false;
      if (acceptOp(",") && !parseExpression(msg)) return false;
      return simple("Assert");
    }
    if (t.text == "import") {
      if (!parseImport()) return false;
      return simple("Import");
    }
    if (t.text == "from") {
      if (!parseFromImport()) return false;
      return simple("ImportFrom");
    }
    // 'type' is a soft keyword: type X = ... / type X[T] = ...
    if (t.text == "type" && tok(1).is(TokenKind::Name) && !isKeyword(tok(1).text) &&
        (tok(2).isOp("=") || tok(2).isOp("["))) {
      advance();
      std::string name;
      if (!expectName(name)) return false;
      if (atOp("[") && !skipBalanced("[", "]")) return false;
      Expr value;
      if (!expectOp("=") || !parseExpression(value)) return false;
      return simple("TypeAlias");
    }
  }
  return parseExprStatement(into);
}

bool Parser::parseExprStatement(NodeList& into) {
  unsigned line = tok().line;
  auto parseRhs = [&](Expr& e) {
    return atKw("yield") ? parseYield(e) : parseStarExpressions(e);
  };

  Expr first;
  if (!parseRhs(first)) return false;

  auto node = std::make_unique<Node>();
  node->line = line;

  if (atOp("=")) {
    Assign assign;
    assign.targets.push_back(first);
    while (acceptOp("=")) {
      Expr next;
      if (!parseRhs(next)) return false;
      assign.targets.push_back(std::move(next));
    }
    assign.value = assign.targets.back();
    assign.targets.pop_back();
    for (const Expr& target : assign.targets) {
      std::string msg = assignTargetError(target);
      if (!msg.empty()) return failAt(target.line, target.column, msg);
    }
    node->data = std::move(assign);
  } else if (isAugmentedOp(tok())) {
    if (!isSingleTarget(first))
      return failAt(first.line, first.column,
                    "illegal expression for augmented assignment");
    advance();
    Expr value;
    if (!parseRhs(value)) return false;
    node->data = OtherStmt{"AugAssign", {}};
  } else if (atOp(":")) {
    if (!isSingleTarget(first))
      return failAt(first.line, first.column,
                    "only single target (not tuple) can be annotated");
    advance();
    Expr annotation, value;
    if (!parseExpression(annotation)) return false;
    if (acceptOp("=") && !parseRhs(value)) return false;
    node->data = OtherStmt{"AnnAssign", {}};
  } else {
    node->data = OtherStmt{"Expr", {}};
  }
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseIf(NodeList& into) {
  auto node = std::make_unique<Node>();
  node->line = tok().line;
  OtherStmt stmt{"If", {}};
  advance(); // 'if' or 'elif'

  Expr test;
  if (!parseNamedExpr(test) || !expectOp(":") || !parseBlock(stmt.children))
    return false;
  if (atKw("elif")) {
    // elif is an If nested in the orelse branch
    if (!parseIf(stmt.children)) return false;
  } else if (acceptKw("else")) {
    if (!expectOp(":") || !parseBlock(stmt.children)) return false;
  }
  node->data = std::move(stmt);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseWhile(NodeList& into) {
  auto node = std::make_unique<Node>();
  node->line = tok().line;
  OtherStmt stmt{"While", {}};
  advance();

  Expr test;
  if (!parseNamedExpr(test) || !expectOp(":") || !parseBlock(stmt.children))
    return false;
  if (acceptKw("else") && (!expectOp(":") || !parseBlock(stmt.children)))
    return false;
  node->data = std::move(stmt);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseFor(NodeList& into, size_t start) {
  auto node = std::make_unique<Node>();
  node->line = Toks[start].line;
  OtherStmt stmt{Toks[start].isKeyword("async") ? "AsyncFor" : "For", {}};
  advance(); // 'for'

  Expr target, iter;
  if (!parseStarTargets(target)) return false;
  if (!acceptKw("in")) return fail(tok(), "invalid syntax");
  if (!parseStarExpressions(iter) || !expectOp(":") || !parseBlock(stmt.children))
    return false;
  if (acceptKw("else") && (!expectOp(":") || !parseBlock(stmt.children)))
    return false;
  node->data = std::move(stmt);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseTry(NodeList& into) {
  auto node = std::make_unique<Node>();
  node->line = tok().line;
  OtherStmt stmt{"Try", {}};
  advance();
  if (!expectOp(":") || !parseBlock(stmt.children)) return false;

  bool handled = false;
  while (atKw("except")) {
    auto handler = std::make_unique<Node>();
    handler->line = tok().line;
    OtherStmt body{"ExceptHandler", {}};
    advance();
    if (acceptOp("*")) stmt.kind = "TryStar";
    if (!atOp(":")) {
      Expr type;
      if (!parseExpression(type)) return false;
      std::string name;
      if (acceptKw("as") && !expectName(name)) return false;
    }
    if (!expectOp(":") || !parseBlock(body.children)) return false;
    handler->data = std::move(body);
    stmt.children.push_back(std::move(handler));
    handled = true;
  }
  if (handled && acceptKw("else")) {
    if (!expectOp(":") || !parseBlock(stmt.children)) return false;
  }
  if (acceptKw("finally")) {
    if (!expectOp(":") || !parseBlock(stmt.children)) return false;
    handled = true;
  }
  if (!handled) return fail(tok(), "expected 'except' or 'finally' block");

  node->data = std::move(stmt);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseWithItems() {
  auto parseItem = [&]() {
    Expr ctx, target;
    if (!parseExpression(ctx)) return false;
    // single target: the ',' that follows separates items
    if (acceptKw("as") && !parseBinary(target, 0)) return false;
    return true;
  };

  if (atOp("(")) {
    // with (a as b, c as d): is an item list when ':' follows the closing paren
    size_t i = Cur;
    int depth = 0;
    for (; i < Toks.size(); ++i) {
      const Token& t = Toks[i];
      if (t.isOp("(") || t.isOp("[") || t.isOp("{")) ++depth;
      else if (t.isOp(")") || t.isOp("]") || t.isOp("}")) {
        if (--depth == 0) break;
      }
    }
    if (i + 1 < Toks.size() && Toks[i + 1].isOp(":")) {
      advance();
      while (!atOp(")")) {
        if (!parseItem()) return false;
        if (!acceptOp(",")) break;
      }
      return expectOp(")");
    }
  }

  do {
    if (!parseItem()) return false;
  } while (acceptOp(","));
  return true;
}

bool Parser::parseWith(NodeList& into, size_t start) {
  auto node = std::make_unique<Node>();
  node->line = Toks[start].line;
  OtherStmt stmt{Toks[start].isKeyword("async") ? "AsyncWith" : "With", {}};
  advance(); // 'with'
  if (!parseWithItems() || !expectOp(":") || !parseBlock(stmt.children))
    return false;
  node->data = std::move(stmt);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseDecorated(NodeList& into) {
  while (acceptOp("@")) {
    Expr decorator;
    if (!parseNamedExpr(decorator)) return false;
    if (!atNewline()) return fail(tok(), "invalid syntax");
    advance();
  }
  size_t start = Cur;
  if (atKw("def")) return parseFunctionDef(into, start);
  if (atKw("class")) return parseClassDef(into, start);
  if (atKw("async") && tok(1).isKeyword("def")) {
    advance();
    return parseFunctionDef(into, start);
  }
  return fail(tok(), "invalid syntax");
}

bool Parser::parseParameters(FunctionDef& fn, const char* closer, bool annotations) {
  bool kwOnly = false;
  bool seenDefault = false;
  auto annotation = [&](bool starred) {
    if (!annotations || !acceptOp(":")) return true;
    Expr ann;
    return starred ? parseStarExpression(ann) : parseExpression(ann);
  };

  while (!atOp(closer)) {
    const Token& t = tok();
    if (atOp("/")) {
      if (kwOnly || !fn.posOnlyArgs.empty() || fn.args.empty())
        return fail(t, "invalid syntax");
      advance();
      fn.posOnlyArgs = std::move(fn.args);
      fn.args.clear();
    } else if (atOp("*")) {
      if (kwOnly) return fail(t, "* argument may appear only once");
      advance();
      kwOnly = true;
      if (tok().is(TokenKind::Name)) {
        if (!expectName(fn.varArg) || !annotation(true)) return false;
      }
    } else if (atOp("**")) {
      advance();
      if (!expectName(fn.kwArg) || !annotation(false)) return false;
      acceptOp(",");
      if (!atOp(closer)) return fail(tok(), "arguments cannot follow var-keyword argument");
      return true;
    } else {
      std::string name;
      if (!expectName(name) || !annotation(false)) return false;
      if (acceptOp("=")) {
        Expr value;
        if (!parseExpression(value)) return false;
        if (!kwOnly) {
          fn.defaults.push_back(std::move(value));
          seenDefault = true;
        }
      } else if (!kwOnly && seenDefault) {
        return fail(t, "parameter without a default follows parameter with a default");
      }
      (kwOnly ? fn.kwOnlyArgs : fn.args).push_back(std::move(name));
    }
    if (!acceptOp(",")) break;
  }
  return true;
}

bool Parser::parseFunctionDef(NodeList& into, size_t start) {
  auto node = std::make_unique<Node>();
  node->line = Toks[start].line;
  FunctionDef fn;
  fn.isAsync = Toks[start].isKeyword("async");
  advance(); // 'def'

  if (!expectName(fn.name)) return false;
  if (atOp("[") && !skipBalanced("[", "]")) return false;
  if (!expectOp("(") || !parseParameters(fn, ")", true) || !expectOp(")"))
    return false;
  if (acceptOp("->")) {
    Expr returns;
    if (!parseExpression(returns)) return false;
  }
  if (!expectOp(":") || !parseBlock(fn.body)) return false;

  node->data = std::move(fn);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseClassDef(NodeList& into, size_t start) {
  auto node = std::make_unique<Node>();
  node->line = Toks[start].line;
  ClassDef cls;
  advance(); // 'class'

  if (!expectName(cls.name)) return false;
  if (atOp("[") && !skipBalanced("[", "]")) return false;
  if (atOp("(") && !parseCallArguments()) return false;
  if (!expectOp(":") || !parseBlock(cls.body)) return false;

  node->data = std::move(cls);
  into.push_back(std::move(node));
  return true;
}

bool Parser::looksLikeMatchStatement() const {
  // 'match' is a soft keyword: a match statement is a logical line ending
  // in ':' that opens an indented block.
  const Token& next = tok(1);
  if (next.is(TokenKind::Newline) || next.isOp("=") || next.isOp(":")) return false;
  size_t i = Cur + 1;
  while (i < Toks.size() && !Toks[i].is(TokenKind::Newline) &&
         !Toks[i].is(TokenKind::EndMarker))
    ++i;
  return i + 1 < Toks.size() && Toks[i].is(TokenKind::Newline) &&
         Toks[i - 1].isOp(":") && Toks[i + 1].is(TokenKind::Indent);
}

bool Parser::parseMatch(NodeList& into) {
  auto node = std::make_unique<Node>();
  node->line = tok().line;
  OtherStmt stmt{"Match", {}};
  advance(); // 'match'

  Expr subject;
  if (!parseStarExpressions(subject) || !expectOp(":")) return false;
  if (!atNewline()) return fail(tok(), "invalid syntax");
  advance();
  if (!tok().is(TokenKind::Indent)) return fail(tok(), "expected an indented block");
  advance();

  while (tok().isKeyword("case")) {
    auto caseNode = std::make_unique<Node>();
    caseNode->line = tok().line;
    OtherStmt body{"MatchCase", {}};
    advance();

    // Patterns and guards are not inspected; skip to the block colon
    int depth = 0;
    bool any = false;
    while (true) {
      const Token& t = tok();
      if (t.is(TokenKind::Newline) || t.is(TokenKind::EndMarker))
        return fail(t, "expected ':'");
      if (depth == 0 && t.isOp(":")) break;
      if (t.isOp("(") || t.isOp("[") || t.isOp("{")) ++depth;
      else if (t.isOp(")") || t.isOp("]") || t.isOp("}")) --depth;
      advance();
      any = true;
    }
    if (!any) return fail(tok(), "invalid syntax");
    advance(); // ':'
    if (!parseBlock(body.children)) return false;
    caseNode->data = std::move(body);
    stmt.children.push_back(std::move(caseNode));
  }
  if (stmt.children.empty()) return fail(tok(), "expected 'case' block");
  if (!tok().is(TokenKind::Dedent)) return fail(tok(), "invalid syntax");
  advance();

  node->data = std::move(stmt);
  into.push_back(std::move(node));
  return true;
}

bool Parser::parseImport() {
  advance(); // 'import'
  do {
    std::string part;
    if (!expectName(part)) return false;
    while (acceptOp(".")) {
      if (!expectName(part)) return false;
    }
    if (acceptKw("as") && !expectName(part)) return false;
  } while (acceptOp(","));
  return true;
}

bool Parser::parseFromImport() {
  advance(); // 'from'
  bool relative = false;
  while (atOp(".") || atOp("...")) {
    advance();
    relative = true;
  }
  std::string part;
  if (!atKw("import")) {
    if (!expectName(part)) return false;
    while (acceptOp(".")) {
      if (!expectName(part)) return false;
    }
  } else if (!relative) {
    return fail(tok(), "invalid syntax");
  }
  if (!acceptKw("import")) return fail(tok(), "invalid syntax");
  if (acceptOp("*")) return true;

  bool paren = acceptOp("(");
  do {
    if (paren && atOp(")")) break;
    if (!expectName(part)) return false;
    if (acceptKw("as") && !expectName(part)) return false;
  } while (acceptOp(","));
  return !paren || expectOp(")");
}

//===--------------------------------------------------------------------===//
// Expressions
//===--------------------------------------------------------------------===//

bool Parser::parseStarExpressions(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  if (!parseStarExpression(out)) return false;
  if (!atOp(",")) return true;
  while (acceptOp(",")) {
    if (!startsExpression(tok())) break;
    Expr next;
    if (!parseStarExpression(next)) return false;
  }
  out = makeExpr(ExprKind::Tuple, line, column);
  return true;
}

bool Parser::parseStarExpression(Expr& out) {
  if (!atOp("*")) return parseExpression(out);
  unsigned line = tok().line, column = tok().column;
  advance();
  Expr inner;
  if (!parseBinary(inner, 0)) return false;
  out = makeExpr(ExprKind::Starred, line, column);
  return true;
}

bool Parser::parseStarNamedExpr(Expr& out) {
  if (!atOp("*")) return parseNamedExpr(out);
  return parseStarExpression(out);
}

bool Parser::parseStarTargets(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  auto one = [&](Expr& e) {
    if (!atOp("*")) return parseBinary(e, 0);
    return parseStarExpression(e);
  };
  if (!one(out)) return false;
  if (!atOp(",")) return true;
  while (acceptOp(",")) {
    if (atKw("in") || atOp("=") || atOp(":") || atOp(")")) break;
    Expr next;
    if (!one(next)) return false;
  }
  out = makeExpr(ExprKind::Tuple, line, column);
  return true;
}

bool Parser::parseNamedExpr(Expr& out) {
  if (!(tok().is(TokenKind::Name) && tok(1).isOp(":=")))
    return parseExpression(out);
  unsigned line = tok().line, column = tok().column;
  std::string name;
  if (!expectName(name)) return false;
  advance(); // ':='
  Expr value;
  if (!parseExpression(value)) return false;
  out = makeExpr(ExprKind::Other, line, column);
  return true;
}

bool Parser::parseExpression(Expr& out) {
  if (atKw("lambda")) return parseLambda(out);
  unsigned line = tok().line, column = tok().column;
  if (!parseDisjunction(out)) return false;
  if (!atKw("if")) return true;

  advance();
  Expr test, orelse;
  if (!parseDisjunction(test)) return false;
  if (!acceptKw("else")) return fail(tok(), "expected 'else' after 'if' expression");
  if (!parseExpression(orelse)) return false;
  out = makeExpr(ExprKind::Other, line, column);
  return true;
}

bool Parser::parseLambda(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  advance(); // 'lambda'
  FunctionDef params;
  Expr body;
  if (!parseParameters(params, ":", false) || !expectOp(":") || !parseExpression(body))
    return false;
  out = makeExpr(ExprKind::Other, line, column);
  return true;
}

bool Parser::parseDisjunction(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  if (!parseConjunction(out)) return false;
  while (acceptKw("or")) {
    Expr rhs;
    if (!parseConjunction(rhs)) return false;
    out = makeExpr(ExprKind::Other, line, column);
  }
  return true;
}

bool Parser::parseConjunction(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  if (!parseInversion(out)) return false;
  while (acceptKw("and")) {
    Expr rhs;
    if (!parseInversion(rhs)) return false;
    out = makeExpr(ExprKind::Other, line, column);
  }
  return true;
}

bool Parser::parseInversion(Expr& out) {
  if (!atKw("not")) return parseComparison(out);
  unsigned line = tok().line, column = tok().column;
  advance();
  Expr operand;
  if (!parseInversion(operand)) return false;
  out = makeExpr(ExprKind::Other, line, column);
  return true;
}

bool Parser::parseComparison(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  if (!parseBinary(out, 0)) return false;
  while (true) {
    bool matched = false;
    for (const char* op : kComparisonOps) {
      if (atOp(op)) { matched = true; break; }
    }
    if (matched || atKw("in")) {
      advance();
    } else if (atKw("not") && tok(1).isKeyword("in")) {
      advance();
      advance();
    } else if (atKw("is")) {
      advance();
      acceptKw("not");
    } else {
      return true;
    }
    Expr rhs;
    if (!parseBinary(rhs, 0)) return false;
    out = makeExpr(ExprKind::Other, line, column);
  }
}

bool Parser::parseBinary(Expr& out, unsigned level) {
  if (level == kBinaryLevels.size()) return parseFactor(out);
  unsigned line = tok().line, column = tok().column;
  if (!parseBinary(out, level + 1)) return false;
  while (true) {
    bool matched = false;
    for (const char* op : kBinaryLevels[level]) {
      if (atOp(op)) { matched = true; break; }
    }
    if (!matched) return true;
    advance();
    Expr rhs;
    if (!parseBinary(rhs, level + 1)) return false;
    out = makeExpr(ExprKind::Other, line, column);
  }
}

bool Parser::parseFactor(Expr& out) {
  if (!atOp("-") && !atOp("+") && !atOp("~")) return parsePower(out);
  unsigned line = tok().line, column = tok().column;
  advance();
  Expr operand;
  if (!parseFactor(operand)) return false;
  out = makeExpr(ExprKind::Other, line, column);
  return true;
}

bool Parser::parsePower(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  bool awaited = acceptKw("await");
  if (!parsePrimary(out)) return false;
  if (awaited) out = makeExpr(ExprKind::Other, line, column);
  if (acceptOp("**")) {
    Expr exponent;
    if (!parseFactor(exponent)) return false;
    out = makeExpr(ExprKind::Other, line, column);
  }
  return true;
}

bool Parser::parsePrimary(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  if (!parseAtom(out)) return false;
  while (true) {
    if (acceptOp(".")) {
      std::string attr;
      if (!expectName(attr)) return false;
      out = makeExpr(ExprKind::Attribute, line, column);
    } else if (atOp("(")) {
      if (!parseCallArguments()) return false;
      out = makeExpr(ExprKind::Call, line, column);
    } else if (acceptOp("[")) {
      if (!parseSlices() || !expectOp("]")) return false;
      out = makeExpr(ExprKind::Subscript, line, column);
    } else {
      return true;
    }
  }
}

bool Parser::parseAtom(Expr& out) {
  const Token& t = tok();
  switch (t.kind) {
  case TokenKind::Name:
    if (t.text == "None" || t.text == "True" || t.text == "False") {
      out = makeExpr(ExprKind::Constant, t.line, t.column);
      advance();
      return true;
    }
    if (isKeyword(t.text)) return fail(t, "invalid syntax");
    out = makeExpr(ExprKind::Name, t.line, t.column, t.text);
    advance();
    return true;
  case TokenKind::Number:
    out = makeExpr(ExprKind::Constant, t.line, t.column);
    advance();
    return true;
  case TokenKind::String:
    return parseStrings(out);
  case TokenKind::Op:
    if (t.text == "(") return parseParenthesized(out);
    if (t.text == "[") return parseListDisplay(out);
    if (t.text == "{") return parseBraceDisplay(out);
    if (t.text == "...") {
      out = makeExpr(ExprKind::Constant, t.line, t.column);
      advance();
      return true;
    }
    return fail(t, "invalid syntax");
  default:
    return fail(t, "invalid syntax");
  }
}

bool Parser::parseStrings(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  bool formatted = false, sawBytes = false, sawText = false;
  while (tok().is(TokenKind::String)) {
    formatted |= tok().fstring;
    (tok().bytes ? sawBytes : sawText) = true;
    advance();
  }
  if (sawBytes && sawText) return failAt(line, column, "cannot mix bytes and nonbytes literals");
  // f-strings are JoinedStr nodes, not constants
  out = makeExpr(formatted ? ExprKind::Other : ExprKind::Constant, line, column);
  return true;
}

bool Parser::parseYield(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  advance(); // 'yield'
  Expr value;
  if (acceptKw("from")) {
    if (!parseExpression(value)) return false;
  } else if (startsExpression(tok())) {
    if (!parseStarExpressions(value)) return false;
  }
  out = makeExpr(ExprKind::Other, line, column);
  return true;
}

bool Parser::parseParenthesized(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  advance(); // '('
  if (acceptOp(")")) {
    out = makeExpr(ExprKind::Tuple, line, column);
    return true;
  }
  if (atKw("yield")) {
    Expr value;
    if (!parseYield(value) || !expectOp(")")) return false;
    out = makeExpr(ExprKind::Other, line, column);
    return true;
  }

  Expr first;
  if (!parseStarNamedExpr(first)) return false;
  if (atKw("for") || atKw("async")) {
    if (!parseComprehension() || !expectOp(")")) return false;
    out = makeExpr(ExprKind::Other, line, column);
    return true;
  }
  if (atOp(",")) {
    while (acceptOp(",")) {
      if (atOp(")")) break;
      Expr next;
      if (!parseStarNamedExpr(next)) return false;
    }
    if (!expectOp(")")) return false;
    out = makeExpr(ExprKind::Tuple, line, column);
    return true;
  }
  if (!expectOp(")")) return false;
  // A parenthesized expression keeps its own kind: (x) is still a Name
  out = std::move(first);
  return true;
}

bool Parser::parseListDisplay(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  advance(); // '['
  if (acceptOp("]")) {
    out = makeExpr(ExprKind::List, line, column);
    return true;
  }
  Expr first;
  if (!parseStarNamedExpr(first)) return false;
  if (atKw("for") || atKw("async")) {
    if (!parseComprehension() || !expectOp("]")) return false;
    out = makeExpr(ExprKind::Other, line, column);
    return true;
  }
  while (acceptOp(",")) {
    if (atOp("]")) break;
    Expr next;
    if (!parseStarNamedExpr(next)) return false;
  }
  if (!expectOp("]")) return false;
  out = makeExpr(ExprKind::List, line, column);
  return true;
}

bool Parser::parseBraceDisplay(Expr& out) {
  unsigned line = tok().line, column = tok().column;
  advance(); // '{'
  if (acceptOp("}")) {
    out = makeExpr(ExprKind::Dict, line, column);
    return true;
  }

  auto dictItem = [&]() {
    Expr key, value;
    if (acceptOp("**")) return parseBinary(value, 0);
    return parseExpression(key) && expectOp(":") && parseExpression(value);
  };
  auto restOfDict = [&]() {
    while (acceptOp(",")) {
      if (atOp("}")) break;
      if (!dictItem()) return false;
    }
    if (!expectOp("}")) return false;
    out = makeExpr(ExprKind::Dict, line, column);
    return true;
  };

  if (atOp("**")) {
    if (!dictItem()) return false;
    return restOfDict();
  }

  Expr first;
  if (!parseStarNamedExpr(first)) return false;
  if (acceptOp(":")) {
    Expr value;
    if (!parseExpression(value)) return false;
    if (atKw("for") || atKw("async")) {
      if (!parseComprehension() || !expectOp("}")) return false;
      out = makeExpr(ExprKind::Other, line, column);
      return true;
    }
    return restOfDict();
  }

  if (atKw("for") || atKw("async")) {
    if (!parseComprehension() || !expectOp("}")) return false;
    out = makeExpr(ExprKind::Other, line, column);
    return true;
  }
  while (acceptOp(",")) {
    if (atOp("}")) break;
    Expr next;
    if (!parseStarNamedExpr(next)) return false;
  }
  if (!expectOp("}")) return false;
  out = makeExpr(ExprKind::Set, line, column);
  return true;
}

bool Parser::parseComprehension() {
  bool any = false;
  while (atKw("for") || (atKw("async") && tok(1).isKeyword("for"))) {
    acceptKw("async");
    advance(); // 'for'
    Expr target, iter;
    if (!parseStarTargets(target)) return false;
    if (!acceptKw("in")) return fail(tok(), "invalid syntax");
    if (!parseDisjunction(iter)) return false;
    while (acceptKw("if")) {
      Expr cond;
      if (!parseDisjunction(cond)) return false;
    }
    any = true;
  }
  if (!any) return fail(tok(), "invalid syntax");
  return true;
}

bool Parser::parseCallArguments() {
  if (!expectOp("(")) return false;
  while (!atOp(")")) {
    Expr arg;
    if (acceptOp("*") || acceptOp("**")) {
      if (!parseExpression(arg)) return false;
    } else if (tok().is(TokenKind::Name) && tok(1).isOp("=")) {
      advance();
      advance();
      if (!parseExpression(arg)) return false;
    } else {
      if (!parseNamedExpr(arg)) return false;
      if ((atKw("for") || atKw("async")) && !parseComprehension()) return false;
    }
    if (!acceptOp(",")) break;
  }
  return expectOp(")");
}

bool Parser::parseSlices() {
  if (atOp("]")) return fail(tok(), "invalid syntax");
  while (true) {
    Expr part;
    if (atOp("*")) {
      if (!parseStarExpression(part)) return false;
    } else {
      if (!atOp(":") && !parseNamedExpr(part)) return false;
      if (acceptOp(":")) {
        if (!atOp(":") && !atOp("]") && !atOp(",") && !parseExpression(part))
          return false;
        if (acceptOp(":") && !atOp("]") && !atOp(",") && !parseExpression(part))
          return false;
      }
    }
    if (!acceptOp(",")) break;
    if (atOp("]")) break;
  }
  return true;
}

bool parseSource(llvm::StringRef source, Module& out, SyntaxError* error) {
  std::vector<Token> tokens;
  Lexer lexer(source);
  if (!lexer.tokenize(tokens, error)) return false;
  Parser parser(std::move(tokens));
  return parser.parseModule(out, error);
}

} // namespace pystyle::python
