#include "analyzers/FindingsStore.hpp"

#include <gtest/gtest.h>

using namespace pystyle;

TEST(FindingsStoreTest, EmptyStore) {
  FindingsStore store;
  EXPECT_TRUE(store.empty());
  EXPECT_EQ(store.size(), 0u);
  EXPECT_TRUE(store.findingsFor("a.py").empty());
  EXPECT_TRUE(store.files().empty());
}

TEST(FindingsStoreTest, KeepsInsertionOrderWithinFile) {
  FindingsStore store;
  store.add("a.py", {3, RuleCode::S002});
  store.add("a.py", {1, RuleCode::S001});
  store.append("a.py", {{2, RuleCode::S011}, {2, RuleCode::S010}});

  FindingList expected = {{3, RuleCode::S002}, {1, RuleCode::S001},
                          {2, RuleCode::S011}, {2, RuleCode::S010}};
  EXPECT_EQ(store.findingsFor("a.py"), expected);
  EXPECT_EQ(store.size(), 4u);
}

TEST(FindingsStoreTest, FilesAreSorted) {
  FindingsStore store;
  store.add("b.py", {1, RuleCode::S003});
  store.add("a.py", {1, RuleCode::S003});
  store.add("dir/c.py", {1, RuleCode::S003});

  std::vector<std::string> expected = {"a.py", "b.py", "dir/c.py"};
  EXPECT_EQ(store.files(), expected);
}

TEST(FindingsStoreTest, AppendingNothingCreatesNoEntry) {
  FindingsStore store;
  store.append("clean.py", {});
  EXPECT_TRUE(store.empty());
  EXPECT_TRUE(store.files().empty());
}

TEST(FindingsStoreTest, PrintFormat) {
  FindingsStore store;
  store.add("b.py", {4, RuleCode::S008});
  store.add("a.py", {2, RuleCode::S001});
  store.add("a.py", {1, RuleCode::S005});

  std::string text;
  llvm::raw_string_ostream os(text);
  store.print(os);
  os.flush();

  EXPECT_EQ(text,
            "a.py: Line 2: S001 Too long\n"
            "a.py: Line 1: S005 TODO found\n"
            "b.py: Line 4: S008 Class name class_name should be written in CamelCase\n");
}
