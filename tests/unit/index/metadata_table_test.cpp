#include <gtest/gtest.h>

#include "common/utilities_test.hpp"
#include "docqa_core/errors.hpp"
#include "docqa_core/index/metadata_table.hpp"

namespace docqa_tests {

using docqa_core::MetadataTable;
using docqa_core::RetrievalFilter;

class MetadataTableTest : public ::testing::Test {
 protected:
  MetadataTableTest()
      : table_({TestUtilities::create_test_chunk("a", "policy.txt", 1, std::string("1.1")),
                TestUtilities::create_test_chunk("b", "policy.txt", 2, std::string("2.3")),
                TestUtilities::create_test_chunk("c", "annex.txt", 2),
                TestUtilities::create_test_chunk("d", "annex.txt"),
                TestUtilities::create_test_chunk("e", "policy.txt", 5, std::string(" 2.3 "))}) {}

  MetadataTable table_;
};

TEST_F(MetadataTableTest, AtReturnsRowOrThrows) {
  EXPECT_EQ(table_.size(), 5u);
  EXPECT_EQ(table_.at(2).text, "c");
  EXPECT_THROW(table_.at(5), docqa_core::NotFoundError);
  EXPECT_THROW(table_.at(-1), docqa_core::NotFoundError);
}

TEST_F(MetadataTableTest, EmptyFilterAllowsEveryRow) {
  EXPECT_EQ(table_.allowed_ids({}), (std::vector<int64_t>{0, 1, 2, 3, 4}));
}

TEST_F(MetadataTableTest, FiltersBySource) {
  RetrievalFilter filter;
  filter.source = "annex.txt";
  EXPECT_EQ(table_.allowed_ids(filter), (std::vector<int64_t>{2, 3}));

  filter.source = "missing.txt";
  EXPECT_TRUE(table_.allowed_ids(filter).empty());
}

TEST_F(MetadataTableTest, PageRangeIsInclusiveAndSkipsPagelessRows) {
  RetrievalFilter filter;
  filter.page_from = 2;
  filter.page_to = 5;
  EXPECT_EQ(table_.allowed_ids(filter), (std::vector<int64_t>{1, 2, 4}));

  RetrievalFilter open_ended;
  open_ended.page_to = 1;
  EXPECT_EQ(table_.allowed_ids(open_ended), (std::vector<int64_t>{0}));
  EXPECT_FALSE(table_.matches(3, open_ended));
}

TEST_F(MetadataTableTest, InvertedPageRangeMatchesNothing) {
  RetrievalFilter filter;
  filter.page_from = 5;
  filter.page_to = 1;
  EXPECT_TRUE(table_.allowed_ids(filter).empty());
}

TEST_F(MetadataTableTest, ClauseComparisonIgnoresSurroundingWhitespace) {
  RetrievalFilter filter;
  filter.clause_number = "2.3";
  EXPECT_EQ(table_.allowed_ids(filter), (std::vector<int64_t>{1, 4}));
  EXPECT_TRUE(table_.matches(4, filter));
}

TEST_F(MetadataTableTest, FieldsCombineWithAnd) {
  RetrievalFilter filter;
  filter.source = "policy.txt";
  filter.clause_number = "2.3";
  filter.page_to = 3;
  EXPECT_EQ(table_.allowed_ids(filter), (std::vector<int64_t>{1}));

  for (int64_t id = 0; id < 5; ++id) {
    EXPECT_EQ(table_.matches(id, filter), id == 1) << "row " << id;
  }
}

}  // namespace docqa_tests
