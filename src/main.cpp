#include "analyzers/Analyzer.hpp"
#include "io/SourceFile.hpp"

#include "llvm/Support/CommandLine.h"
#include "llvm/Support/raw_ostream.h"
#include <memory>

using namespace pystyle;

static llvm::cl::OptionCategory ToolCat("pystyle options");

static llvm::cl::opt<std::string> InputPath(
  llvm::cl::Positional, llvm::cl::desc("<file or directory>"),
  llvm::cl::Required, llvm::cl::cat(ToolCat));

static llvm::cl::opt<unsigned> MaxLineLength(
  "max-line-length", llvm::cl::desc("Longest line allowed before S001 (characters)"),
  llvm::cl::init(79), llvm::cl::cat(ToolCat));

static llvm::cl::opt<std::string> Extension(
  "ext", llvm::cl::desc("File name suffix picked up when scanning a directory"),
  llvm::cl::init(".py"), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> CheckAllDefaults(
  "check-all-defaults",
  llvm::cl::desc("Report S012 when any default is mutable, not only the first"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> KeepGoing(
  "keep-going", llvm::cl::desc("Continue with the next file after an error"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

static llvm::cl::opt<bool> Verbose(
  "verbose", llvm::cl::desc("Log progress to stderr"),
  llvm::cl::init(false), llvm::cl::cat(ToolCat));

int main(int argc, const char** argv) {
  llvm::cl::HideUnrelatedOptions(ToolCat);
  llvm::cl::ParseCommandLineOptions(argc, argv, "PEP8 style checker for Python sources\n");

  AnalyzeOptions opts;
  opts.maxLineLength = MaxLineLength;
  opts.extension = Extension;
  opts.checkAllDefaults = CheckAllDefaults;
  opts.keepGoing = KeepGoing;
  opts.verbose = Verbose;

  std::vector<std::string> files;
  std::string err;
  if (!collectInputs(InputPath, opts.extension, files, &err)) {
    llvm::errs() << "pystyle: " << err << "\n";
    return 1;
  }
  if (opts.verbose)
    llvm::errs() << "pystyle: " << files.size() << " file(s) to check\n";

  auto analyzer = makePythonAnalyzer();
  FindingsStore findings;
  bool ok = analyzer->analyzePaths(files, opts, findings);

  findings.print(llvm::outs());
  llvm::outs().flush();
  return ok ? 0 : 1;
}
