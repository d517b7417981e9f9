#pragma once

#include "../automation/HwpAutomation.h"
#include "TableData.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hwpmcp
{
    /// Splits at CR LF, LF, CR and the escaped sequence backslash n
    [[nodiscard]] std::vector<std::string> splitLines(std::string const & text);

    /// Groups lines into blocks separated by lines that are empty or only whitespace
    [[nodiscard]] std::vector<std::vector<std::string>>
    splitIntoBlocks(std::vector<std::string> const & lines);

    struct TextDocumentOptions
    {
        /// Taken from the first line of the content if not given
        std::optional<std::string> title;
        /// Detects headings ('#') and bullet lists ('-', '*', U+2022) per block
        bool formatContent{true};
        /// Writes every line of a plain block as its own paragraph
        bool preserveLinebreaks{true};
    };

    enum class ElementType
    {
        Heading,
        Text,
        Paragraph,
        Table
    };

    struct DocumentElement
    {
        ElementType type{ElementType::Text};
        std::string content;
        int fontSize{10};
        bool bold{false};
        bool italic{false};
        int rows{0};
        int columns{0};
        std::optional<TableData> data;
    };

    struct ReportSection
    {
        std::string title;
        std::string content;
    };

    struct Report
    {
        std::string title{"Report"};
        std::string author{"Author"};
        std::optional<std::string> date;
        std::vector<ReportSection> sections;
    };

    struct Letter
    {
        std::string title{"Untitled"};
        std::string recipient{"Recipient"};
        std::string content;
        std::string sender{"Sender"};
        std::optional<std::string> date;
    };

    /**
     * @brief Declarative description of a whole document
     *
     * Either a list of elements or one of the templates (report, letter).
     */
    struct CompleteDocument
    {
        std::variant<std::vector<DocumentElement>, Report, Letter> body;
        bool save{false};
        /// Target when saving, defaults depend on the body
        std::string filename;
        /// Element types that are not known and were left out
        std::vector<std::string> skippedElements;
    };

    /**
     * @brief Reads and checks a document description
     *
     * Elements of unknown type are skipped and listed in skippedElements.
     * @throws InvalidArgumentError if the description is not an object, has neither
     * "elements" nor "special_type", names an unknown template, or contains members of the
     * wrong type
     */
    [[nodiscard]] CompleteDocument parseCompleteDocument(nlohmann::json const & document);

    /// Counts of what a composer wrote
    struct CompositionSummary
    {
        std::optional<std::string> title;
        size_t blocks{0};
        size_t paragraphs{0};
    };

    /**
     * @brief Writes formatted content at the caret of the active document
     *
     * Every text run is preceded by the character shape it is written in.
     */
    class DocumentComposer
    {
      public:
        /// @param today Date written by templates that are not given one
        DocumentComposer(automation::HwpAutomation & hwp, std::string today);

        CompositionSummary writeText(std::string const & content,
                                     TextDocumentOptions const & options);

        CompositionSummary writeDocument(CompleteDocument const & document);

      private:
        void writeElements(std::vector<DocumentElement> const & elements);
        void writeReport(Report const & report);
        void writeLetter(Letter const & letter);

        void writeFormattedBlock(std::vector<std::string> const & block, bool preserveLinebreaks);

        void font(int sizePt, bool bold, bool italic = false);
        void text(std::string const & text);
        void paragraph(int count = 1);

        automation::HwpAutomation & m_hwp;
        std::string m_today;
        CompositionSummary m_summary;
    };
}
