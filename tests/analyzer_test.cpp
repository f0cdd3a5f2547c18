#include "analyzers/Analyzer.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

using namespace pystyle;
namespace fs = std::filesystem;

class AnalyzerTest : public ::testing::Test {
protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    Dir = fs::temp_directory_path() / (std::string("pystyle_analyzer_") + info->name());
    fs::remove_all(Dir);
    fs::create_directories(Dir);
    Impl = makePythonAnalyzer();
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(Dir, ec);
  }

  std::string write(const std::string& name, const std::string& content) {
    fs::path p = Dir / name;
    std::ofstream ofs(p, std::ios::binary);
    ofs << content;
    return p.lexically_normal().string();
  }

  fs::path Dir;
  std::unique_ptr<Analyzer> Impl;
  AnalyzeOptions Opts;
};

TEST_F(AnalyzerTest, LineFindingsPrecedeTreeFindings) {
  FindingsStore store;
  std::string err;
  ASSERT_TRUE(Impl->analyzeSource("t.py", "def   foo():\n    BadVar = 1\n", Opts, store, &err))
      << err;
  FindingList expected = {{1, RuleCode::S007}, {2, RuleCode::S011}};
  EXPECT_EQ(store.findingsFor("t.py"), expected);
}

TEST_F(AnalyzerTest, CleanSourceHasNoEntry) {
  FindingsStore store;
  std::string err;
  ASSERT_TRUE(Impl->analyzeSource("ok.py", "def foo(a, b=None):\n    return a\n", Opts, store, &err));
  EXPECT_TRUE(store.empty());
}

TEST_F(AnalyzerTest, SyntaxErrorKeepsLineFindings) {
  FindingsStore store;
  std::string err;
  EXPECT_FALSE(Impl->analyzeSource("bad.py", "x = 1;\ny = (\n", Opts, store, &err));
  FindingList expected = {{1, RuleCode::S003}};
  EXPECT_EQ(store.findingsFor("bad.py"), expected);
  EXPECT_EQ(err, "bad.py:2:5: syntax error: '(' was never closed");
}

TEST_F(AnalyzerTest, MaxLineLengthOption) {
  Opts.maxLineLength = 10;
  FindingsStore store;
  std::string err;
  ASSERT_TRUE(Impl->analyzeSource("t.py", "value = 12345\n", Opts, store, &err));
  FindingList expected = {{1, RuleCode::S001}};
  EXPECT_EQ(store.findingsFor("t.py"), expected);
}

TEST_F(AnalyzerTest, CheckAllDefaultsOption) {
  std::string code = "def f(a=1, b=[]):\n    pass\n";
  FindingsStore store;
  std::string err;
  ASSERT_TRUE(Impl->analyzeSource("t.py", code, Opts, store, &err));
  EXPECT_TRUE(store.empty());

  Opts.checkAllDefaults = true;
  ASSERT_TRUE(Impl->analyzeSource("t.py", code, Opts, store, &err));
  FindingList expected = {{1, RuleCode::S012}};
  EXPECT_EQ(store.findingsFor("t.py"), expected);
}

TEST_F(AnalyzerTest, AnalyzePathsPrintsSortedReport) {
  std::string b = write("b.py", "class user:\n    pass\n");
  std::string a = write("a.py", "x = 1  # todo: fix\n");

  FindingsStore store;
  ASSERT_TRUE(Impl->analyzePaths({b, a}, Opts, store));

  std::string text;
  llvm::raw_string_ostream os(text);
  store.print(os);
  os.flush();
  EXPECT_EQ(text,
            a + ": Line 1: S005 TODO found\n" +
            b + ": Line 1: S008 Class name class_name should be written in CamelCase\n");
}

TEST_F(AnalyzerTest, StopsAtFirstFailingFile) {
  std::string bad = write("a_bad.py", "def f(:\n");
  std::string good = write("b_good.py", "def f():\n    Var = 1\n");

  FindingsStore store;
  EXPECT_FALSE(Impl->analyzePaths({bad, good}, Opts, store));
  EXPECT_TRUE(store.findingsFor(good).empty());
}

TEST_F(AnalyzerTest, KeepGoingChecksRemainingFiles) {
  std::string bad = write("a_bad.py", "def f(:\n");
  std::string good = write("b_good.py", "def f():\n    Var = 1\n");

  Opts.keepGoing = true;
  FindingsStore store;
  EXPECT_FALSE(Impl->analyzePaths({bad, good}, Opts, store));
  FindingList expected = {{2, RuleCode::S011}};
  EXPECT_EQ(store.findingsFor(good), expected);
}

TEST_F(AnalyzerTest, UnreadableFileFails) {
  FindingsStore store;
  EXPECT_FALSE(Impl->analyzePaths({(Dir / "missing.py").string()}, Opts, store));
  EXPECT_TRUE(store.empty());
}
