#pragma once
#include "analyzers/FindingsStore.hpp"
#include "llvm/ADT/StringRef.h"
#include <string>
#include <vector>
#include <memory>

namespace pystyle {

struct AnalyzeOptions {
  unsigned maxLineLength = 79;     // S001 threshold
  std::string extension = ".py";   // directory scan suffix
  bool checkAllDefaults = false;   // S012 on any default, not just the first
  bool keepGoing = false;          // continue after a file fails
  bool verbose = false;            // progress to stderr
};

class Analyzer {
public:
  virtual ~Analyzer() = default;

  // Checks one file's text. Line findings are committed to out even when
  // the source fails to parse; in that case false is returned with *error.
  virtual bool analyzeSource(const std::string& path,
                             llvm::StringRef source,
                             const AnalyzeOptions& opts,
                             FindingsStore& out,
                             std::string* error) = 0;

  // Reads and checks each file in turn, reporting failures on stderr.
  virtual bool analyzePaths(const std::vector<std::string>& paths,
                            const AnalyzeOptions& opts,
                            FindingsStore& out) = 0;
};

std::unique_ptr<Analyzer> makePythonAnalyzer();

} // namespace pystyle
