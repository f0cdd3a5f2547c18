#pragma once
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>

namespace pystyle {

enum class RuleCode {
  S001, // line too long
  S002, // indentation not a multiple of four
  S003, // trailing semicolon
  S004, // less than two spaces before inline comment
  S005, // TODO in comment
  S006, // more than two blank lines
  S007, // too many spaces after def/class
  S008, // class name not CamelCase
  S009, // function name not snake_case
  S010, // argument name not snake_case
  S011, // variable name not snake_case
  S012, // mutable default argument
};

constexpr unsigned kNumRuleCodes = 12;

// Fixed catalog, eg. ruleId(S001) == "S001", ruleDescription(S001) == "Too long"
llvm::StringRef ruleId(RuleCode code);
llvm::StringRef ruleDescription(RuleCode code);

struct Finding {
  unsigned line = 0;          // 1-based
  RuleCode code = RuleCode::S001;

  bool operator==(const Finding& o) const { return line == o.line && code == o.code; }
  bool operator!=(const Finding& o) const { return !(*this == o); }
};

using FindingList = std::vector<Finding>;

} // namespace pystyle
