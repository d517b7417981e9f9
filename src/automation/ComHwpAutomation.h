#pragma once

#ifdef _WIN32

#include "ComDispatch.h"
#include "HwpAutomation.h"

namespace hwpmcp::automation
{
    /**
     * @brief HwpAutomation backed by the HWPFrame.HwpObject automation server
     *
     * Must be created and used on one thread; the constructor enters a single-threaded apartment.
     */
    class ComHwpAutomation : public HwpAutomation
    {
      public:
        explicit ComHwpAutomation(std::string const & progId);
        ~ComHwpAutomation() override = default;

        void registerSecurityModule(std::string const & moduleName,
                                    std::filesystem::path const & modulePath) override;
        void setVisible(bool visible) override;
        void newDocument() override;
        void open(std::filesystem::path const & path) override;
        void save() override;
        void saveAs(std::filesystem::path const & path, SaveFormat format) override;
        void insertText(std::string const & text) override;
        void breakParagraph() override;
        void setPosition(CursorPosition const & position) override;
        void createTable(int rows, int columns) override;
        void setCellText(int row, int column, std::string const & text, bool bold) override;
        void leaveTable() override;
        void setCharShape(CharShape const & shape) override;
        std::string text() override;

      private:
        /// Runs an action by id and reports whether the application accepted it
        [[nodiscard]] bool run(std::string const & action);

        /// Runs an action that has to succeed
        void require(std::string const & action);

        /// GetDefault, fill the parameter set, Execute
        template <typename Fill>
        void executeAction(std::string const & action, std::string const & parameterSet, Fill && fill);

        void moveToFirstCell();

        // Declaration order matters: the object is released before the apartment is left
        com::ApartmentScope m_apartment;
        com::DispatchObject m_hwp;
    };
}

#endif
