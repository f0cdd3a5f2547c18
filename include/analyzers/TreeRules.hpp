#pragma once
#include "analyzers/Issue.hpp"
#include "python/Ast.hpp"
#include "python/Token.hpp"
#include "llvm/ADT/StringRef.h"

namespace pystyle {

// Checks S010..S012 on the syntax tree of a whole module.
//
// Nodes are visited breadth-first, so findings come out in the same order
// as a level-by-level walk of the tree, not in line order. Only names bound
// in function scope are policed: module and class body assignments are
// exempt.
class SyntaxTreeRuleSet {
public:
  // With checkAllDefaults every positional default is inspected for S012,
  // otherwise only the first one is.
  explicit SyntaxTreeRuleSet(bool checkAllDefaults = false)
    : CheckAllDefaults(checkAllDefaults) {}

  // Parses source and appends its findings. Returns false and fills *error
  // when the source does not parse; nothing is appended in that case.
  bool check(llvm::StringRef source, FindingList& out,
             python::SyntaxError* error) const;

  void walk(const python::Module& module, FindingList& out) const;

  void checkFunction(const python::FunctionDef& fn, unsigned line, FindingList& out) const;
  void checkAssign(const python::Assign& assign, unsigned line, FindingList& out) const;

private:
  bool CheckAllDefaults;
};

// True when the name has an ASCII uppercase letter anywhere
bool hasUppercase(llvm::StringRef name);

} // namespace pystyle
