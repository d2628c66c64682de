#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <string>

#include "docsage_core/extractors/html_extractor.hpp"

namespace docsage_core {

class HtmlExtractorTest : public ::testing::Test {
 protected:
  HtmlExtractor extractor_;
};

TEST_F(HtmlExtractorTest, CanHandle_HtmlFiles) {
  EXPECT_TRUE(extractor_.can_handle("index.html"));
  EXPECT_TRUE(extractor_.can_handle("/site/page.htm"));
  EXPECT_FALSE(extractor_.can_handle("page.xhtml"));
  EXPECT_FALSE(extractor_.can_handle("notes.txt"));
}

TEST_F(HtmlExtractorTest, Extract_FlattensPageAndReadsTitle) {
  const std::string html =
      "<html><head><title>Install &amp; Setup</title><style>body{color:red}</style></head>\n"
      "<body><h1>Guide</h1><p>Run the <b>installer</b>.</p>"
      "<script>alert('x')</script><!-- hidden note -->"
      "<p>Use &lt;tab&gt; &#65;&#x42; here</p></body></html>";

  auto result = extractor_.extract(html, "guide.html");

  EXPECT_EQ(result.metadata["title"], "Install & Setup");
  EXPECT_EQ(result.text, "Guide\n\nRun the installer.\n\nUse <tab> AB here");
}

TEST_F(HtmlExtractorTest, Extract_DropsScriptsStylesAndComments) {
  const std::string html =
      "<div>visible</div>"
      "<SCRIPT type=\"text/javascript\">var hidden = 1;</SCRIPT>"
      "<style>.x { display: none }</style>"
      "<!-- <p>commented out</p> -->";

  auto result = extractor_.extract(html, "page.html");

  EXPECT_EQ(result.text, "visible");
  EXPECT_THAT(result.text, ::testing::Not(::testing::HasSubstr("hidden")));
  EXPECT_FALSE(result.metadata.contains("title"));
}

TEST_F(HtmlExtractorTest, Extract_CollapsesInlineWhitespace) {
  auto result = extractor_.extract("<p>  many    spaces\tand tabs  </p>", "ws.html");
  EXPECT_EQ(result.text, "many spaces and tabs");
}

TEST_F(HtmlExtractorTest, Extract_ListItemsBecomeLines) {
  auto result = extractor_.extract("<ul><li>one</li><li>two</li></ul>", "list.html");
  EXPECT_EQ(result.text, "one\n\ntwo");
}

TEST_F(HtmlExtractorTest, DecodeEntities_KnownAndUnknown) {
  EXPECT_EQ(HtmlExtractor::decode_entities("a &amp; b"), "a & b");
  EXPECT_EQ(HtmlExtractor::decode_entities("&quot;q&quot; &#39;s&#39;"), "\"q\" 's'");
  EXPECT_EQ(HtmlExtractor::decode_entities("&#233;"), "\xC3\xA9");
  EXPECT_EQ(HtmlExtractor::decode_entities("&unknown; & alone"), "&unknown; & alone");
}

TEST_F(HtmlExtractorTest, Extract_VeryLongTagIsStripped) {
  // Inline images can carry a data URI hundreds of kilobytes long inside one tag
  const std::string html = "<p>Intro</p><img src=\"data:image/png;base64," +
                           std::string(200000, 'A') + "\"><p>After image</p>";
  auto result = extractor_.extract(html, "inline.html");
  EXPECT_EQ(result.text, "Intro\n\nAfter image");
}

TEST_F(HtmlExtractorTest, Extract_UnclosedAngleBracketStaysText) {
  auto result = extractor_.extract("<b>bold</b> claim: 3 < 4", "cmp.html");
  EXPECT_EQ(result.text, "bold claim: 3 < 4");
}

TEST_F(HtmlExtractorTest, CanHandle_UppercaseExtensions) {
  EXPECT_TRUE(extractor_.can_handle("Page.HTML"));
  EXPECT_TRUE(extractor_.can_handle("index.Htm"));
}

TEST_F(HtmlExtractorTest, FileType) {
  EXPECT_EQ(extractor_.get_file_type(), FileType::Html);
}

}  // namespace docsage_core
