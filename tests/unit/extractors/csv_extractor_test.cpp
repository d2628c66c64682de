#include <gtest/gtest.h>

#include <string>

#include "docsage_core/extractors/csv_extractor.hpp"

namespace docsage_core {

class CsvExtractorTest : public ::testing::Test {
 protected:
  CsvExtractor extractor_;
};

TEST_F(CsvExtractorTest, CanHandle_DelimitedFiles) {
  EXPECT_TRUE(extractor_.can_handle("people.csv"));
  EXPECT_TRUE(extractor_.can_handle("/data/export.tsv"));
  EXPECT_FALSE(extractor_.can_handle("sheet.xlsx"));
}

TEST_F(CsvExtractorTest, Extract_RecordsUseHeaderNames) {
  const std::string csv =
      "name,role\n"
      "Ada,engineer\n"
      "\"Hopper, Grace\",\"said \"\"hi\"\"\"\n";

  auto result = extractor_.extract(csv, "people.csv");

  EXPECT_EQ(result.text,
            "name: Ada\nrole: engineer\n\n"
            "name: Hopper, Grace\nrole: said \"hi\"");
  EXPECT_EQ(result.metadata["columns"], nlohmann::json::array({"name", "role"}));
  EXPECT_EQ(result.metadata["record_count"], 2);
}

TEST_F(CsvExtractorTest, Extract_TabSeparated) {
  auto result = extractor_.extract("a\tb\n1\t2", "table.tsv");
  EXPECT_EQ(result.text, "a: 1\nb: 2");
}

TEST_F(CsvExtractorTest, Extract_MissingHeaderNamesAreNumbered) {
  auto result = extractor_.extract("id,,note\n1,x,y\n", "gaps.csv");
  EXPECT_EQ(result.text, "id: 1\ncolumn_2: x\nnote: y");
}

TEST_F(CsvExtractorTest, Extract_QuotedFieldMayContainNewline) {
  auto result = extractor_.extract("q\n\"line1\nline2\"\n", "multi.csv");
  EXPECT_EQ(result.text, "q: line1\nline2");
  EXPECT_EQ(result.metadata["record_count"], 1);
}

TEST_F(CsvExtractorTest, Extract_CrlfAndBlankLines) {
  auto result = extractor_.extract("a,b\r\n\r\n1,2\r\n", "crlf.csv");
  EXPECT_EQ(result.text, "a: 1\nb: 2");
  EXPECT_EQ(result.metadata["record_count"], 1);
}

TEST_F(CsvExtractorTest, Extract_EmptyContent) {
  auto result = extractor_.extract("", "empty.csv");
  EXPECT_TRUE(result.text.empty());
  EXPECT_EQ(result.metadata["record_count"], 0);
}

TEST_F(CsvExtractorTest, Extract_UnterminatedQuoteThrows) {
  EXPECT_THROW(extractor_.extract("a\n\"never closed\n", "bad.csv"), SourceError);
}

TEST_F(CsvExtractorTest, FileType) {
  EXPECT_EQ(extractor_.get_file_type(), FileType::Csv);
}

}  // namespace docsage_core
