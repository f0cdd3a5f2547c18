#include "analyzers/TreeRules.hpp"
#include "python/Parser.hpp"
#include "llvm/ADT/STLExtras.h"
#include <deque>

namespace pystyle {

using namespace python;

namespace {

struct Pending {
  const Node* node;
  bool inFunction;    // nearest enclosing scope is a def body
};

struct NodeVisitor {
  const SyntaxTreeRuleSet& Rules;
  const Pending& Cur;
  std::deque<Pending>& Queue;
  FindingList& Out;

  void enqueue(const NodeList& children, bool inFunction) {
    for (const auto& child : children) Queue.push_back({child.get(), inFunction});
  }

  void operator()(const FunctionDef& fn) {
    Rules.checkFunction(fn, Cur.node->line, Out);
    enqueue(fn.body, true);
  }
  void operator()(const ClassDef& cls) { enqueue(cls.body, false); }
  void operator()(const Assign& assign) {
    if (Cur.inFunction) Rules.checkAssign(assign, Cur.node->line, Out);
  }
  void operator()(const OtherStmt& stmt) { enqueue(stmt.children, Cur.inFunction); }
};

} // namespace

bool hasUppercase(llvm::StringRef name) {
  return llvm::any_of(name, [](char c) { return c >= 'A' && c <= 'Z'; });
}

void SyntaxTreeRuleSet::checkFunction(const FunctionDef& fn, unsigned line,
                                      FindingList& out) const {
  // async def is a separate node kind and is not inspected
  if (fn.isAsync) return;

  for (const auto& arg : fn.args)
    if (hasUppercase(arg)) out.push_back({line, RuleCode::S010});

  if (fn.defaults.empty()) return;
  auto mutableDefault = [](const Expr& e) { return e.kind != ExprKind::Constant; };
  bool flagged = CheckAllDefaults ? llvm::any_of(fn.defaults, mutableDefault)
                                  : mutableDefault(fn.defaults.front());
  if (flagged) out.push_back({line, RuleCode::S012});
}

void SyntaxTreeRuleSet::checkAssign(const Assign& assign, unsigned line,
                                    FindingList& out) const {
  for (const auto& target : assign.targets) {
    if (target.kind != ExprKind::Name) continue;
    if (hasUppercase(target.id)) out.push_back({line, RuleCode::S011});
  }
}

void SyntaxTreeRuleSet::walk(const Module& module, FindingList& out) const {
  std::deque<Pending> queue;
  for (const auto& stmt : module.body) queue.push_back({stmt.get(), false});

  while (!queue.empty()) {
    Pending cur = queue.front();
    queue.pop_front();
    std::visit(NodeVisitor{*this, cur, queue, out}, cur.node->data);
  }
}

bool SyntaxTreeRuleSet::check(llvm::StringRef source, FindingList& out,
                              SyntaxError* error) const {
  Module module;
  if (!parseSource(source, module, error)) return false;
  walk(module, out);
  return true;
}

} // namespace pystyle
