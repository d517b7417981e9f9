#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace hwpmcp
{
    class ConfigManager;
}

namespace hwpmcp::automation
{
    /// Native caret address of the word processor (GetPos/SetPos)
    struct CursorPosition
    {
        int list{0};
        int para{0};
        int pos{0};
    };

    /// Character formatting applied at the caret
    struct CharShape
    {
        std::optional<std::string> faceName;
        std::optional<int> sizePt;
        bool bold{false};
        bool italic{false};
        bool underline{false};
    };

    enum class SaveFormat
    {
        Hwp,
        Hwpx,
        Text,
        Html,
        Pdf
    };

    /// Format name understood by SaveAs, e.g. "HWP"
    [[nodiscard]] std::string formatName(SaveFormat format);

    /// Chooses the save format from the file extension (case insensitive), HWP if unknown
    [[nodiscard]] SaveFormat formatFromExtension(std::filesystem::path const & path);

    /**
     * @brief Thin abstraction of the word processor's automation object
     *
     * Construction attaches to (or starts) the application. Every method either succeeds or
     * throws an exception from exceptions.h, usually AutomationError or BlockedByUIError.
     */
    class HwpAutomation
    {
      public:
        virtual ~HwpAutomation() = default;

        /// Registers the module that suppresses the file access confirmation dialog
        virtual void registerSecurityModule(std::string const & moduleName,
                                            std::filesystem::path const & modulePath) = 0;

        virtual void setVisible(bool visible) = 0;

        /// Runs FileNew, the new document becomes the active one
        virtual void newDocument() = 0;

        virtual void open(std::filesystem::path const & path) = 0;

        /// Saves the active document in place
        virtual void save() = 0;

        virtual void saveAs(std::filesystem::path const & path, SaveFormat format) = 0;

        /// Inserts text at the caret as it is
        virtual void insertText(std::string const & text) = 0;

        virtual void breakParagraph() = 0;

        virtual void setPosition(CursorPosition const & position) = 0;

        /// Creates a table at the caret; the caret ends up in the first cell
        virtual void createTable(int rows, int columns) = 0;

        /**
         * @brief Replaces the content of a cell of the table containing the caret
         * @param row Zero based row, relative to the first cell of the table
         * @param column Zero based column
         * @param bold Writes the text in bold and resets the style afterwards
         */
        virtual void setCellText(int row, int column, std::string const & text, bool bold) = 0;

        /// Moves the caret below the table it is in
        virtual void leaveTable() = 0;

        virtual void setCharShape(CharShape const & shape) = 0;

        /// Full text of the active document
        [[nodiscard]] virtual std::string text() = 0;
    };

    using AutomationFactory = std::function<std::unique_ptr<HwpAutomation>()>;

    /**
     * @brief Factory for the platform backend configured by the settings
     *
     * The returned factory throws AutomationError when invoked on a platform without COM.
     */
    [[nodiscard]] AutomationFactory makeDefaultFactory(ConfigManager const & config);
}
