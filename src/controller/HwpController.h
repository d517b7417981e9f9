#pragma once

#include "../EventLogger.h"
#include "../automation/HwpAutomation.h"
#include "../mcp/MCPControllerInterface.h"
#include "TableData.h"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace hwpmcp
{
    class ConfigManager;

    /// Attach behavior and defaults of the controller, read from the "automation" and
    /// "document" sections of the configuration
    struct ControllerSettings
    {
        bool visible{true};
        bool registerSecurityModule{true};
        std::string securityModuleName{"FilePathCheckerModuleExample"};
        std::filesystem::path securityModulePath;
        std::string defaultSaveName{"temp_document.hwp"};

        static ControllerSettings fromConfig(ConfigManager const & config);
    };

    /// Document the word processor currently has open; no path until it is saved or opened
    struct ActiveDocument
    {
        std::optional<std::filesystem::path> path;
    };

    /**
     * @brief Drives the word processor through a single automation session
     *
     * The session is attached on the first operation that needs the application and lives
     * until closeSession() or destruction. Exceptions of the operations are converted to
     * error results here; nothing propagates to the caller.
     */
    class HwpController : public MCPControllerInterface
    {
      public:
        HwpController(automation::AutomationFactory factory,
                      ControllerSettings settings,
                      events::SharedLogger logger);
        ~HwpController() override;

        HwpController(HwpController const &) = delete;
        HwpController & operator=(HwpController const &) = delete;

        bool isAttached() const override;
        bool hasActiveDocument() const override;
        std::optional<std::filesystem::path> activeDocumentPath() const override;

        ToolResult createDocument() override;
        ToolResult openDocument(std::string const & path) override;
        ToolResult saveDocument(std::optional<std::string> const & path) override;
        ToolResult closeSession(bool save) override;

        ToolResult insertText(std::string const & text,
                              std::optional<nlohmann::json> const & position,
                              bool preserveLinebreaks) override;
        ToolResult insertParagraph(int count) override;
        ToolResult setFont(automation::CharShape const & shape) override;
        ToolResult getText() override;

        ToolResult insertTable(int rows, int columns) override;
        ToolResult createTableWithData(nlohmann::json const & data, bool hasHeader) override;
        ToolResult fillTableWithData(nlohmann::json const & data,
                                     int startRow,
                                     int startColumn,
                                     bool hasHeader) override;
        ToolResult fillColumnNumbers(int start, int end, int column, bool fromFirstCell) override;

        ToolResult createDocumentFromText(std::string const & content,
                                          std::optional<std::string> const & title,
                                          bool formatContent,
                                          std::optional<std::string> const & saveFilename,
                                          bool preserveLinebreaks) override;
        ToolResult createCompleteDocument(nlohmann::json const & document) override;

        ToolResult ping(std::string const & message) override;

      private:
        /// Runs operation and converts every exception into an error result
        template <typename Operation>
        ToolResult guarded(std::string const & operationName, Operation && operation);

        /// Attaches to the application if not done yet
        automation::HwpAutomation & session();

        /// @throws AutomationError if no document is active
        automation::HwpAutomation & activeSession();

        /// Saves the active document under path and makes it the document path
        std::filesystem::path saveActiveAs(automation::HwpAutomation & hwp,
                                           std::string const & path);

        void writeCells(automation::HwpAutomation & hwp,
                        TableData const & table,
                        int rowOffset,
                        int columnOffset,
                        bool hasHeader);

        void logInfo(std::string const & message) const;
        void logWarning(std::string const & message) const;
        void logError(std::string const & message) const;

        automation::AutomationFactory m_factory;
        ControllerSettings m_settings;
        events::SharedLogger m_logger;
        std::unique_ptr<automation::HwpAutomation> m_automation;
        std::optional<ActiveDocument> m_activeDocument;
    };
}
