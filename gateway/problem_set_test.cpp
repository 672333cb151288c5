#include "gateway/problem_set.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::SizeIs;

using namespace gateway;

// NOLINTNEXTLINE
TEST(ProblemSet, Load) {
  util::TempDir dir("/tmp");
  std::string path = util::File::JoinPath(dir.Path(), "test.csv");
  util::File::Write(path,
                    "id,problem\n"
                    "000aaa,\"Let $f(x) = x^2$, find $f(3)$.\"\n"
                    "111bbb,\"A \"\"quoted\"\" word\nand a second line\"\n");
  std::vector<Problem> problems = LoadProblems(path);
  ASSERT_THAT(problems, SizeIs(2));
  EXPECT_EQ(problems[0].id, "000aaa");
  EXPECT_EQ(problems[0].statement, "Let $f(x) = x^2$, find $f(3)$.");
  EXPECT_EQ(problems[1].statement,
            "A \"quoted\" word\nand a second line");
}

// NOLINTNEXTLINE
TEST(ProblemSet, ColumnOrderDoesNotMatter) {
  std::vector<Problem> problems =
      ParseProblems(util::ParseCsv("problem,id\n1+1,x\n"));
  ASSERT_THAT(problems, SizeIs(1));
  EXPECT_EQ(problems[0].id, "x");
  EXPECT_EQ(problems[0].statement, "1+1");
}

// NOLINTNEXTLINE
TEST(ProblemSet, DuplicateId) {
  EXPECT_THROW(ParseProblems(util::ParseCsv("id,problem\na,1\na,2\n")),
               util::csv_error);
}

// NOLINTNEXTLINE
TEST(ProblemSet, MissingColumn) {
  EXPECT_THROW(ParseProblems(util::ParseCsv("id,question\na,1\n")),
               util::csv_error);
}

// NOLINTNEXTLINE
TEST(ProblemSet, MissingFile) {
  EXPECT_THROW(LoadProblems("/nonexistent/test.csv"), util::file_not_found);
}

// NOLINTNEXTLINE
TEST(ProblemSet, ValidateResults) {
  std::vector<Problem> problems = {{"a", ""}, {"b", ""}};
  EXPECT_NO_THROW(ValidateResults(problems, {{"a", 0}, {"b", 99999}}));
  EXPECT_THROW(ValidateResults(problems, {{"a", 0}}), invalid_results);
  EXPECT_THROW(ValidateResults(problems, {{"b", 0}, {"a", 0}}),
               invalid_results);
  try {
    ValidateResults(problems, {{"a", -1}, {"b", 100000}});
    FAIL() << "out of range answer accepted";
  } catch (const invalid_results& e) {
    EXPECT_THAT(e.what(), HasSubstr("-1"));
  }
}

// NOLINTNEXTLINE
TEST(ProblemSet, FormatResults) {
  EXPECT_EQ(FormatResults({{"a", 1}, {"b,c", 22}}),
            "id,answer\na,1\n\"b,c\",22\n");
  EXPECT_EQ(FormatResults({}), "id,answer\n");
}

}  // namespace
