#include "analyzers/LineRules.hpp"

namespace pystyle {

// Anchored patterns; llvm::Regex searches, so each one starts with '^'
// S007 patterns also apply after one leading non-'#' character, see
// constructionSpacing()
static const char kDefSpacing[]      = "^ *_?_?def {2,}";
static const char kClassSpacing[]    = "^ *class {2,}";
static const char kClassLowercase[]  = "^ *class +[a-z]";
static const char kClassUnderscore[] = "^ *class +[a-zA-Z_]+_";
static const char kFunctionCase[]    = "^ *def +[a-z0-9_]*[A-Z]";

static llvm::StringRef stripNewline(llvm::StringRef line) {
  return line.rtrim('\n');
}

// Code before the first '#', the whole line when there is none
static llvm::StringRef codePart(llvm::StringRef line) {
  return line.split('#').first;
}

static size_t countCodePoints(llvm::StringRef text) {
  size_t n = 0;
  for (char c : text)
    if (((unsigned char)c & 0xC0) != 0x80) ++n;
  return n;
}

bool BlankRunTracker::feed(llvm::StringRef line) {
  if (stripNewline(line).empty()) {
    ++Count;
    return false;
  }
  bool flagged = Count > 2;
  Count = 0;
  return flagged;
}

LineRuleSet::LineRuleSet(unsigned maxLineLength)
  : MaxLineLength(maxLineLength),
    DefSpacing(kDefSpacing),
    ClassSpacing(kClassSpacing),
    ClassLowercase(kClassLowercase),
    ClassUnderscore(kClassUnderscore),
    FunctionCase(kFunctionCase) {}

bool LineRuleSet::tooLong(llvm::StringRef line) const {
  return countCodePoints(stripNewline(line)) > MaxLineLength;
}

bool LineRuleSet::badIndentation(llvm::StringRef line) {
  size_t spaces = line.find_first_not_of(' ');
  if (spaces == llvm::StringRef::npos) spaces = line.size();
  return spaces > 0 && spaces % 4 != 0;
}

bool LineRuleSet::trailingSemicolon(llvm::StringRef line) {
  llvm::StringRef code = codePart(line).rtrim();
  return !code.empty() && code.back() == ';';
}

bool LineRuleSet::missingCommentSpacing(llvm::StringRef line) {
  if (line.startswith("#")) return false;
  size_t hash = line.find('#');
  if (hash == llvm::StringRef::npos) return false;
  return !line.take_front(hash).endswith("  ");
}

bool LineRuleSet::todoInComment(llvm::StringRef line) {
  size_t hash = line.find('#');
  if (hash == llvm::StringRef::npos) return false;
  return line.drop_front(hash + 1).contains_insensitive("todo");
}

// Byte length of the UTF-8 sequence starting the text
static size_t firstCodePointLength(llvm::StringRef text) {
  size_t n = 1;
  while (n < text.size() && ((unsigned char)text[n] & 0xC0) == 0x80) ++n;
  return n;
}

bool LineRuleSet::constructionSpacing(llvm::StringRef line) const {
  auto matches = [this](llvm::StringRef s) {
    return DefSpacing.match(s) || ClassSpacing.match(s);
  };
  if (matches(line)) return true;
  if (line.empty() || line.front() == '#') return false;
  return matches(line.drop_front(firstCodePointLength(line)));
}

bool LineRuleSet::badClassName(llvm::StringRef line) const {
  return ClassLowercase.match(line) || ClassUnderscore.match(line);
}

bool LineRuleSet::badFunctionName(llvm::StringRef line) const {
  return FunctionCase.match(line);
}

void LineRuleSet::check(llvm::StringRef line, unsigned lineNumber, FindingList& out) {
  auto report = [&](RuleCode code) { out.push_back({lineNumber, code}); };

  if (tooLong(line)) report(RuleCode::S001);
  if (badIndentation(line)) report(RuleCode::S002);
  if (trailingSemicolon(line)) report(RuleCode::S003);
  if (missingCommentSpacing(line)) report(RuleCode::S004);
  if (todoInComment(line)) report(RuleCode::S005);
  if (Blanks.feed(line)) report(RuleCode::S006);
  if (constructionSpacing(line)) report(RuleCode::S007);
  if (badClassName(line)) report(RuleCode::S008);
  if (badFunctionName(line)) report(RuleCode::S009);
}

} // namespace pystyle
