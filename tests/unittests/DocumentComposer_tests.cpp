#include "controller/DocumentComposer.h"
#include "exceptions.h"
#include "testhelper.h"

#include <fmt/format.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace hwpmcp::tests
{
    using json = nlohmann::json;
    using ::testing::_;
    using ::testing::ElementsAre;
    using ::testing::NiceMock;

    class DocumentComposerTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            ON_CALL(m_hwp, setCharShape(_))
              .WillByDefault(
                [this](automation::CharShape const & shape)
                {
                    m_calls.push_back(fmt::format("font {}{}{}",
                                                  shape.sizePt.value_or(0),
                                                  shape.bold ? " bold" : "",
                                                  shape.italic ? " italic" : ""));
                });
            ON_CALL(m_hwp, insertText(_))
              .WillByDefault([this](std::string const & text)
                             { m_calls.push_back("text " + text); });
            ON_CALL(m_hwp, breakParagraph())
              .WillByDefault([this]() { m_calls.push_back("para"); });
            ON_CALL(m_hwp, createTable(_, _))
              .WillByDefault([this](int rows, int columns)
                             { m_calls.push_back(fmt::format("table {}x{}", rows, columns)); });
            ON_CALL(m_hwp, setCellText(_, _, _, _))
              .WillByDefault(
                [this](int row, int column, std::string const & text, bool)
                { m_calls.push_back(fmt::format("cell {},{} {}", row, column, text)); });
            ON_CALL(m_hwp, leaveTable())
              .WillByDefault([this]() { m_calls.push_back("leave"); });
        }

        DocumentComposer composer()
        {
            return DocumentComposer(m_hwp, "2024-05-01");
        }

        NiceMock<MockHwpAutomation> m_hwp;
        std::vector<std::string> m_calls;
    };

    TEST(SplitIntoBlocksTest, SplitIntoBlocks_BlankLines_SeparateBlocks)
    {
        // Act
        auto const blocks = splitIntoBlocks(splitLines("a\nb\n\n  \nc\n\n"));

        // Assert
        ASSERT_EQ(blocks.size(), 2u);
        EXPECT_THAT(blocks[0], ElementsAre("a", "b"));
        EXPECT_THAT(blocks[1], ElementsAre("c"));
    }

    TEST(SplitIntoBlocksTest, SplitLines_MixedLineEndings_SplitsAtEveryKind)
    {
        // Act
        auto const lines = splitLines("a\r\nb\rc\\nd");

        // Assert
        EXPECT_THAT(lines, ElementsAre("a", "b", "c", "d"));
    }

    TEST_F(DocumentComposerTest, WriteText_NoTitle_UsesFirstLineAsBoldTitle)
    {
        // Act
        CompositionSummary const summary =
          composer().writeText("Weekly notes\nAll done", TextDocumentOptions{});

        // Assert
        EXPECT_EQ(summary.title, "Weekly notes");
        EXPECT_EQ(summary.blocks, 1u);
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text Weekly notes",
                                "para",
                                "para",
                                "font 11",
                                "text All done",
                                "para",
                                "para"));
    }

    TEST_F(DocumentComposerTest, WriteText_HeadingLevels_ShrinkDownToElevenPoints)
    {
        // Arrange
        TextDocumentOptions options;
        options.title = "T";

        // Act
        composer().writeText("## Second\n\n####### Deep", options);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text T",
                                "para",
                                "para",
                                "font 15 bold",
                                "text Second",
                                "para",
                                "para",
                                "font 11 bold",
                                "text Deep",
                                "para",
                                "para"));
    }

    TEST_F(DocumentComposerTest, WriteText_BulletBlock_WritesUnifiedBullets)
    {
        // Arrange
        TextDocumentOptions options;
        options.title = "List";

        // Act
        composer().writeText("- first\n*  second\n\xE2\x80\xA2 third", options);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text List",
                                "para",
                                "para",
                                "font 11",
                                "text \xE2\x80\xA2 first",
                                "para",
                                "text \xE2\x80\xA2 second",
                                "para",
                                "text \xE2\x80\xA2 third",
                                "para",
                                "para"));
    }

    TEST_F(DocumentComposerTest, WriteText_LinebreaksNotPreserved_WritesBlockAsOneRun)
    {
        // Arrange
        TextDocumentOptions options;
        options.title = "T";
        options.preserveLinebreaks = false;

        // Act
        CompositionSummary const summary = composer().writeText("one\ntwo", options);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text T",
                                "para",
                                "para",
                                "font 11",
                                "text one\ntwo",
                                "para",
                                "para"));
        EXPECT_EQ(summary.paragraphs, 4u);
    }

    TEST_F(DocumentComposerTest, WriteText_FormattingDisabled_WritesLinesAndBlankLines)
    {
        // Arrange
        TextDocumentOptions options;
        options.formatContent = false;

        // Act
        composer().writeText("Title\n# not a heading\n\nend", options);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text Title",
                                "para",
                                "para",
                                "font 11",
                                "text # not a heading",
                                "para",
                                "para",
                                "text end",
                                "para"));
    }

    TEST_F(DocumentComposerTest, WriteDocument_Elements_WritesInOrder)
    {
        // Arrange
        CompleteDocument const document = parseCompleteDocument(
          {{"elements",
            json::array({{{"type", "heading"}, {"content", "Intro"}},
                         {{"type", "text"},
                          {"content", "Body"},
                          {"properties", {{"font_size", 12}, {"italic", true}}}},
                         {{"type", "paragraph"}},
                         {{"type", "table"},
                          {"properties",
                           {{"rows", 2},
                            {"cols", 2},
                            {"data", json::array({json::array({"a", 1})})}}}}})}});

        // Act
        CompositionSummary const summary = composer().writeDocument(document);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text Intro",
                                "para",
                                "font 12 italic",
                                "text Body",
                                "para",
                                "table 2x2",
                                "cell 0,0 a",
                                "cell 0,1 1",
                                "leave"));
        EXPECT_EQ(summary.blocks, 4u);
    }

    TEST_F(DocumentComposerTest, WriteDocument_Report_UsesTodayWithoutDate)
    {
        // Arrange
        CompleteDocument const document = parseCompleteDocument(
          {{"special_type",
            {{"type", "report"},
             {"params",
              {{"title", "Q2"},
               {"author", "Kim"},
               {"sections", json::array({{{"title", "Sales"}, {"content", "Up"}}})}}}}}});

        // Act
        composer().writeDocument(document);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 22 bold",
                                "text Q2",
                                "para",
                                "para",
                                "font 14",
                                "text Author: Kim",
                                "para",
                                "text Date: 2024-05-01",
                                "para",
                                "para",
                                "font 16 bold",
                                "text Sales",
                                "para",
                                "font 12",
                                "text Up",
                                "para",
                                "para"));
    }

    TEST_F(DocumentComposerTest, WriteDocument_Letter_IndentsDateAndSender)
    {
        // Arrange
        CompleteDocument const document = parseCompleteDocument(
          {{"special_type",
            {{"type", "letter"},
             {"params",
              {{"recipient", "Lee"},
               {"content", "Thanks"},
               {"sender", "Park"},
               {"date", "2024-01-02"}}}}}});
        std::string const indent(40, ' ');

        // Act
        composer().writeDocument(document);

        // Assert
        EXPECT_THAT(m_calls,
                    ElementsAre("font 16 bold",
                                "text Untitled",
                                "para",
                                "para",
                                "font 12",
                                "text To: Lee",
                                "para",
                                "para",
                                "text Thanks",
                                "para",
                                "para",
                                "text " + indent + "2024-01-02",
                                "para",
                                "font 12 bold",
                                "text " + indent + "Park"));
    }

    TEST(ParseCompleteDocumentTest, ParseCompleteDocument_Defaults_FilenameFollowsBody)
    {
        // Act
        CompleteDocument const elements = parseCompleteDocument({{"elements", json::array()}});
        CompleteDocument const letter =
          parseCompleteDocument({{"special_type", {{"type", "letter"}}}});

        // Assert
        EXPECT_EQ(elements.filename, "generated_document.hwp");
        EXPECT_FALSE(elements.save);
        EXPECT_EQ(letter.filename, "letter.hwp");
    }

    TEST(ParseCompleteDocumentTest, ParseCompleteDocument_NeitherElementsNorTemplate_Throws)
    {
        EXPECT_THROW(static_cast<void>(parseCompleteDocument({{"save", true}})),
                     InvalidArgumentError);
        EXPECT_THROW(static_cast<void>(parseCompleteDocument(json::array())),
                     InvalidArgumentError);
    }

    TEST(ParseCompleteDocumentTest, ParseCompleteDocument_TableDataLargerThanTable_Throws)
    {
        // Arrange
        json const document = {
          {"elements",
           json::array({{{"type", "table"},
                         {"properties",
                          {{"rows", 1},
                           {"cols", 1},
                           {"data", json::array({json::array({"a", "b"})})}}}}})}};

        // Act, Assert
        EXPECT_THROW(static_cast<void>(parseCompleteDocument(document)), InvalidArgumentError);
    }

    TEST(ParseCompleteDocumentTest, ParseCompleteDocument_MistypedFontSize_Throws)
    {
        // Arrange
        json const document = {
          {"elements",
           json::array({{{"type", "heading"}, {"properties", {{"font_size", "large"}}}}})}};

        // Act, Assert
        EXPECT_THROW(static_cast<void>(parseCompleteDocument(document)), InvalidArgumentError);
    }
}
