#include "analyzers/Issue.hpp"

#include <gtest/gtest.h>

using namespace pystyle;

TEST(RuleCatalogTest, IdsAreSequential) {
  EXPECT_EQ(ruleId(RuleCode::S001), "S001");
  EXPECT_EQ(ruleId(RuleCode::S006), "S006");
  EXPECT_EQ(ruleId(RuleCode::S010), "S010");
  EXPECT_EQ(ruleId(RuleCode::S012), "S012");
}

TEST(RuleCatalogTest, DescriptionsAreVerbatim) {
  EXPECT_EQ(ruleDescription(RuleCode::S001), "Too long");
  EXPECT_EQ(ruleDescription(RuleCode::S002), "Indentation is not a multiple of four");
  EXPECT_EQ(ruleDescription(RuleCode::S003), "Unnecessary semicolon after a statement");
  EXPECT_EQ(ruleDescription(RuleCode::S004), "Less than two spaces before inline comments");
  EXPECT_EQ(ruleDescription(RuleCode::S005), "TODO found");
  EXPECT_EQ(ruleDescription(RuleCode::S006), "More than two blank lines preceding a code line");
  EXPECT_EQ(ruleDescription(RuleCode::S007),
            "Too many spaces after construction_name (def or class)");
  EXPECT_EQ(ruleDescription(RuleCode::S008),
            "Class name class_name should be written in CamelCase");
  EXPECT_EQ(ruleDescription(RuleCode::S009),
            "Function name function_name should be written in snake_case");
  EXPECT_EQ(ruleDescription(RuleCode::S010),
            "Argument name arg_name should be written in snake_case");
  EXPECT_EQ(ruleDescription(RuleCode::S011), "Variable var_name should be written in snake_case");
  EXPECT_EQ(ruleDescription(RuleCode::S012), "The default argument value is mutable");
}
