#pragma once
#include "analyzers/Issue.hpp"
#include "llvm/Support/raw_ostream.h"
#include <map>
#include <string>
#include <vector>

namespace pystyle {

// Findings of one run, grouped by file. Within a file findings keep the
// order they were added in; files read out sorted by path.
class FindingsStore {
public:
  void add(const std::string& file, Finding finding);
  void append(const std::string& file, const FindingList& findings);

  // Empty list for files without findings
  const FindingList& findingsFor(const std::string& file) const;
  std::vector<std::string> files() const;

  size_t size() const;
  bool empty() const { return ByFile.empty(); }

  // One "<file>: Line <n>: <code> <description>" line per finding
  void print(llvm::raw_ostream& os) const;

private:
  std::map<std::string, FindingList> ByFile;
};

} // namespace pystyle
