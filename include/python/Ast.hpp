#pragma once
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pystyle::python {

// Expressions are kept only as far as the style rules need to see them:
// their outermost kind, and the identifier for bare names.
enum class ExprKind {
  Constant,   // number, str/bytes literal, True/False/None, ...
  Name,
  Attribute,
  Subscript,
  Starred,
  Tuple,
  List,
  Dict,
  Set,
  Call,
  Other,      // operators, comprehensions, lambda, f-strings, ...
};

struct Expr {
  ExprKind    kind = ExprKind::Other;
  std::string id;             // Name only
  unsigned    line = 0;
  unsigned    column = 0;
};

struct Node;
using NodePtr  = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

struct FunctionDef {
  std::string name;
  bool isAsync = false;
  std::vector<std::string> posOnlyArgs;  // before '/'
  std::vector<std::string> args;         // regular positional-or-keyword
  std::vector<std::string> kwOnlyArgs;   // after '*' or '*args'
  std::string varArg;                    // *args, empty if absent
  std::string kwArg;                     // **kwargs, empty if absent
  std::vector<Expr> defaults;            // defaults of posOnlyArgs + args, in order
  NodeList body;
};

struct ClassDef {
  std::string name;
  NodeList body;
};

// Plain '=' assignment; chained targets keep source order
struct Assign {
  std::vector<Expr> targets;
  Expr value;
};

// Every other statement, plus the intermediate blocks that own statements
// (ExceptHandler, MatchCase). Children are statement nodes in field order,
// eg. an If holds its body then its orelse, where an elif is a nested If.
struct OtherStmt {
  std::string kind;           // "If", "For", "Try", "ExceptHandler", "Return", ...
  NodeList children;
};

struct Node {
  unsigned line = 0;
  std::variant<FunctionDef, ClassDef, Assign, OtherStmt> data;
};

struct Module {
  NodeList body;
};

} // namespace pystyle::python
