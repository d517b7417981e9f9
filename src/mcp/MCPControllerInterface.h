/**
 * @file MCPControllerInterface.h
 * @brief Minimal interface for the MCP server to drive the word processor
 */

#pragma once

#include "../automation/HwpAutomation.h"
#include "../controller/ToolResult.h"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace hwpmcp
{
    /**
     * @brief Document operations the MCP server can invoke
     *
     * Every operation returns a ToolResult and never throws for errors of the operation
     * itself; failures are reported with the kind of the exception that caused them.
     */
    class MCPControllerInterface
    {
      public:
        virtual ~MCPControllerInterface() = default;

        // Session state
        virtual bool isAttached() const = 0;
        virtual bool hasActiveDocument() const = 0;
        virtual std::optional<std::filesystem::path> activeDocumentPath() const = 0;

        // Document lifecycle operations
        virtual ToolResult createDocument() = 0;
        virtual ToolResult openDocument(std::string const & path) = 0;
        virtual ToolResult saveDocument(std::optional<std::string> const & path) = 0;
        virtual ToolResult closeSession(bool save) = 0;

        // Content operations
        /**
         * @param position Optional object with non-negative integer members list, para, pos
         * @param preserveLinebreaks Splits the text into paragraphs at line breaks; the
         * two-character sequence backslash n counts as a line break
         */
        virtual ToolResult insertText(std::string const & text,
                                      std::optional<nlohmann::json> const & position,
                                      bool preserveLinebreaks) = 0;
        virtual ToolResult insertParagraph(int count) = 0;
        virtual ToolResult setFont(automation::CharShape const & shape) = 0;
        virtual ToolResult getText() = 0;

        // Table operations
        virtual ToolResult insertTable(int rows, int columns) = 0;
        virtual ToolResult createTableWithData(nlohmann::json const & data, bool hasHeader) = 0;
        /// Writes data into the table at the caret, starting at the 1-based cell
        virtual ToolResult fillTableWithData(nlohmann::json const & data,
                                             int startRow,
                                             int startColumn,
                                             bool hasHeader) = 0;
        /// Writes start..end into a column of the table at the caret, one number per row
        virtual ToolResult
        fillColumnNumbers(int start, int end, int column, bool fromFirstCell) = 0;

        // Composed documents, both create a new active document
        /**
         * @param title Written as heading; the first line of the content is used if omitted
         * @param formatContent Turns '#' lines into headings and '-', '*' lines into bullets
         * @param saveFilename Saves the result there when given
         */
        virtual ToolResult createDocumentFromText(std::string const & content,
                                                  std::optional<std::string> const & title,
                                                  bool formatContent,
                                                  std::optional<std::string> const & saveFilename,
                                                  bool preserveLinebreaks) = 0;
        /// Builds a document from a list of elements or from the report or letter template
        virtual ToolResult createCompleteDocument(nlohmann::json const & document) = 0;

        /// Liveness probe, does not touch the word processor
        virtual ToolResult ping(std::string const & message) = 0;
    };
}
