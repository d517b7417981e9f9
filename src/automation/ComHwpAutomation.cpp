#ifdef _WIN32

#include "ComHwpAutomation.h"
#include "../exceptions.h"

#include <fmt/format.h>

namespace hwpmcp::automation
{
    namespace
    {
        // Key HWP reads external automation modules from
        constexpr wchar_t const * ModuleRegistryKey = L"Software\\HNC\\HwpAutomation\\Modules";

        // Cell height of new tables in HWPUNIT
        constexpr int DefaultRowHeight = 1000;
    }

    ComHwpAutomation::ComHwpAutomation(std::string const & progId)
        : m_hwp(com::DispatchObject::create(progId))
    {
    }

    void ComHwpAutomation::registerSecurityModule(std::string const & moduleName,
                                                  std::filesystem::path const & modulePath)
    {
        if (!modulePath.empty())
        {
            std::wstring const valueName = com::toWide(moduleName);
            std::wstring const data = modulePath.wstring();
            LSTATUS const status =
              RegSetKeyValueW(HKEY_CURRENT_USER,
                              ModuleRegistryKey,
                              valueName.c_str(),
                              REG_SZ,
                              data.c_str(),
                              static_cast<DWORD>((data.size() + 1) * sizeof(wchar_t)));
            if (status != ERROR_SUCCESS)
            {
                throw AutomationError(
                  fmt::format("Could not register security module '{}' at {} (error {})",
                              moduleName,
                              modulePath.string(),
                              status));
            }
        }

        bool const registered =
          m_hwp
            .call("RegisterModule",
                  {com::Variant(std::string{"FilePathCheckDLL"}), com::Variant(moduleName)})
            .toBool();
        if (!registered)
        {
            throw AutomationError(
              fmt::format("The word processor refused the security module '{}'", moduleName));
        }
    }

    void ComHwpAutomation::setVisible(bool visible)
    {
        com::DispatchObject windows = m_hwp.object("XHwpWindows");
        com::DispatchObject window = windows.call("Item", {com::Variant(0)}).toObject();
        window.setProperty("Visible", com::Variant(visible));
    }

    void ComHwpAutomation::newDocument()
    {
        require("FileNew");
    }

    void ComHwpAutomation::open(std::filesystem::path const & path)
    {
        bool const opened = m_hwp
                              .call("Open",
                                    {com::Variant(path.wstring()),
                                     com::Variant(std::string{}),
                                     com::Variant(std::string{"forceopen:true"})})
                              .toBool();
        if (!opened)
        {
            throw AutomationError(
              fmt::format("The word processor could not open {}", path.string()));
        }
    }

    void ComHwpAutomation::save()
    {
        bool const saved = m_hwp.call("Save", {com::Variant(true)}).toBool();
        if (!saved)
        {
            throw AutomationError("The word processor could not save the document");
        }
    }

    void ComHwpAutomation::saveAs(std::filesystem::path const & path, SaveFormat format)
    {
        bool const saved = m_hwp
                             .call("SaveAs",
                                   {com::Variant(path.wstring()),
                                    com::Variant(formatName(format)),
                                    com::Variant(std::string{})})
                             .toBool();
        if (!saved)
        {
            throw AutomationError(
              fmt::format("The word processor could not save the document as {}", path.string()));
        }
    }

    void ComHwpAutomation::insertText(std::string const & text)
    {
        if (text.empty())
        {
            return;
        }
        executeAction("InsertText",
                      "HInsertText",
                      [&](com::DispatchObject const & set)
                      { set.setProperty("Text", com::Variant(text)); });
    }

    void ComHwpAutomation::breakParagraph()
    {
        require("BreakPara");
    }

    void ComHwpAutomation::setPosition(CursorPosition const & position)
    {
        bool const moved = m_hwp
                             .call("SetPos",
                                   {com::Variant(position.list),
                                    com::Variant(position.para),
                                    com::Variant(position.pos)})
                             .toBool();
        if (!moved)
        {
            throw AutomationError(fmt::format("Invalid caret position (list {}, para {}, pos {})",
                                              position.list,
                                              position.para,
                                              position.pos));
        }
    }

    void ComHwpAutomation::createTable(int rows, int columns)
    {
        executeAction("TableCreate",
                      "HTableCreation",
                      [&](com::DispatchObject const & set)
                      {
                          set.setProperty("Rows", com::Variant(rows));
                          set.setProperty("Cols", com::Variant(columns));
                          set.setProperty("WidthType", com::Variant(0));
                          set.setProperty("HeightType", com::Variant(1));
                          set.setProperty("WidthValue", com::Variant(0));
                          set.setProperty("HeightValue", com::Variant(DefaultRowHeight));
                      });
    }

    void ComHwpAutomation::setCellText(int row, int column, std::string const & text, bool bold)
    {
        moveToFirstCell();
        for (int i = 0; i < row; ++i)
        {
            if (!run("TableLowerCell"))
            {
                throw AutomationError(fmt::format("Table has no row {}", row + 1));
            }
        }
        for (int i = 0; i < column; ++i)
        {
            if (!run("TableRightCell"))
            {
                throw AutomationError(fmt::format("Table has no column {}", column + 1));
            }
        }

        require("TableSelCell");
        require("Delete");

        if (!bold)
        {
            insertText(text);
            return;
        }

        CharShape shape;
        shape.bold = true;
        setCharShape(shape);
        insertText(text);
        shape.bold = false;
        setCharShape(shape);
    }

    void ComHwpAutomation::leaveTable()
    {
        require("TableColPageDown");
        if (!run("MoveDown"))
        {
            throw AutomationError("Could not move the caret below the table");
        }
    }

    void ComHwpAutomation::setCharShape(CharShape const & shape)
    {
        executeAction("CharShape",
                      "HCharShape",
                      [&](com::DispatchObject const & set)
                      {
                          if (shape.faceName)
                          {
                              for (char const * property : {"FaceNameHangul",
                                                            "FaceNameLatin",
                                                            "FaceNameHanja",
                                                            "FaceNameJapanese",
                                                            "FaceNameOther",
                                                            "FaceNameSymbol",
                                                            "FaceNameUser"})
                              {
                                  set.setProperty(property, com::Variant(*shape.faceName));
                              }
                          }
                          if (shape.sizePt)
                          {
                              // Height is given in 1/100 pt
                              set.setProperty("Height", com::Variant(*shape.sizePt * 100));
                          }
                          set.setProperty("Bold", com::Variant(shape.bold));
                          set.setProperty("Italic", com::Variant(shape.italic));
                          set.setProperty("UnderlineType", com::Variant(shape.underline ? 1 : 0));
                      });
    }

    std::string ComHwpAutomation::text()
    {
        return m_hwp.call("GetTextFile", {com::Variant(std::string{"TEXT"}), com::Variant(std::string{})})
          .toString();
    }

    bool ComHwpAutomation::run(std::string const & action)
    {
        return m_hwp.call("Run", {com::Variant(action)}).toBool();
    }

    void ComHwpAutomation::require(std::string const & action)
    {
        if (!run(action))
        {
            throw AutomationError(fmt::format("The word processor rejected action '{}'", action));
        }
    }

    template <typename Fill>
    void ComHwpAutomation::executeAction(std::string const & action,
                                         std::string const & parameterSet,
                                         Fill && fill)
    {
        com::DispatchObject actions = m_hwp.object("HAction");
        com::DispatchObject set = m_hwp.object("HParameterSet").object(parameterSet);
        com::DispatchObject hset = set.object("HSet");

        actions.call("GetDefault", {com::Variant(action), com::Variant(hset)});
        fill(set);
        bool const executed =
          actions.call("Execute", {com::Variant(action), com::Variant(hset)}).toBool();
        if (!executed)
        {
            throw AutomationError(fmt::format("The word processor rejected action '{}'", action));
        }
    }

    void ComHwpAutomation::moveToFirstCell()
    {
        // Selecting the current cell fails outside of a table
        require("TableSelCell");
        require("Cancel");

        // Both report false when the caret already is in the first column or row
        static_cast<void>(run("TableColBegin"));
        static_cast<void>(run("TableColPageUp"));
    }
}

#endif
