#pragma once
#include "analyzers/Issue.hpp"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Regex.h"

namespace pystyle {

// Counts consecutive blank lines within one file (S006).
class BlankRunTracker {
public:
  // Feeds one physical line. Returns true when it is a code line preceded
  // by more than two blank lines.
  bool feed(llvm::StringRef line);
  void reset() { Count = 0; }
  unsigned count() const { return Count; }

private:
  unsigned Count = 0;
};

// Checks S001..S009 on single physical lines. Lines are passed with their
// trailing '\n' when they have one. Holds blank-run state, so call reset()
// before each new file.
class LineRuleSet {
public:
  explicit LineRuleSet(unsigned maxLineLength = 79);

  void reset() { Blanks.reset(); }

  // Runs every check in catalog order and appends the findings
  void check(llvm::StringRef line, unsigned lineNumber, FindingList& out);

  bool tooLong(llvm::StringRef line) const;                 // S001
  static bool badIndentation(llvm::StringRef line);         // S002
  static bool trailingSemicolon(llvm::StringRef line);      // S003
  static bool missingCommentSpacing(llvm::StringRef line);  // S004
  static bool todoInComment(llvm::StringRef line);          // S005
  bool constructionSpacing(llvm::StringRef line) const;     // S007
  bool badClassName(llvm::StringRef line) const;            // S008
  bool badFunctionName(llvm::StringRef line) const;         // S009

private:
  unsigned MaxLineLength;
  BlankRunTracker Blanks;
  llvm::Regex DefSpacing;
  llvm::Regex ClassSpacing;
  llvm::Regex ClassLowercase;
  llvm::Regex ClassUnderscore;
  llvm::Regex FunctionCase;
};

} // namespace pystyle
