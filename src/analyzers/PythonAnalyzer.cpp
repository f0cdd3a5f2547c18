#include "analyzers/Analyzer.hpp"
#include "analyzers/LineRules.hpp"
#include "analyzers/TreeRules.hpp"
#include "io/SourceFile.hpp"

#include "llvm/Support/raw_ostream.h"

namespace pystyle {

class PythonAnalyzerImpl : public Analyzer {
public:
  bool analyzeSource(const std::string& path,
                     llvm::StringRef source,
                     const AnalyzeOptions& opts,
                     FindingsStore& out,
                     std::string* error) override
  {
    // Line pass
    LineRuleSet lineRules(opts.maxLineLength);
    FindingList findings;
    unsigned lineNumber = 1;
    for (llvm::StringRef line : splitLines(source))
      lineRules.check(line, lineNumber++, findings);

    // Committed before the tree pass so a syntax error keeps them
    out.append(path, findings);
    findings.clear();

    // Tree pass
    SyntaxTreeRuleSet treeRules(opts.checkAllDefaults);
    python::SyntaxError syntax;
    if (!treeRules.check(source, findings, &syntax)) {
      if (error) {
        *error = path + ":" + std::to_string(syntax.line) + ":" +
                 std::to_string(syntax.column) + ": syntax error: " + syntax.message;
      }
      return false;
    }
    out.append(path, findings);
    return true;
  }

  bool analyzePaths(const std::vector<std::string>& paths,
                    const AnalyzeOptions& opts,
                    FindingsStore& out) override
  {
    bool ok = true;
    for (const auto& path : paths) {
      if (opts.verbose) llvm::errs() << "pystyle: checking " << path << "\n";

      std::string source, err;
      size_t before = out.findingsFor(path).size();
      bool fileOk = readSourceFile(path, source, &err) &&
                    analyzeSource(path, source, opts, out, &err);

      if (opts.verbose) {
        llvm::errs() << "pystyle: " << path << ": "
                     << (out.findingsFor(path).size() - before) << " finding(s)\n";
      }
      if (fileOk) continue;

      llvm::errs() << err << "\n";
      ok = false;
      if (!opts.keepGoing) break;
    }
    return ok;
  }
};

std::unique_ptr<Analyzer> makePythonAnalyzer() {
  return std::make_unique<PythonAnalyzerImpl>();
}

} // namespace pystyle
