#include "HwpController.h"
#include "../ConfigManager.h"
#include "../exceptions.h"
#include "DocumentComposer.h"
#include "TableData.h"

#include <cstdint>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <limits>

namespace hwpmcp
{
    namespace
    {
        automation::CursorPosition parsePosition(nlohmann::json const & position)
        {
            if (!position.is_object())
            {
                throw InvalidArgumentError(
                  "position must be an object with the members list, para and pos");
            }

            auto member = [&position](char const * name)
            {
                auto const it = position.find(name);
                if (it == position.end() || !it->is_number_integer())
                {
                    throw InvalidArgumentError(
                      fmt::format("position.{} must be a non-negative integer", name));
                }
                auto const value = it->get<std::int64_t>();
                if (value < 0 || value > std::numeric_limits<int>::max())
                {
                    throw InvalidArgumentError(
                      fmt::format("position.{} must be a non-negative integer, got {}", name, value));
                }
                return static_cast<int>(value);
            };

            automation::CursorPosition result;
            result.list = member("list");
            result.para = member("para");
            result.pos = member("pos");
            return result;
        }

        /// Number of UTF-8 code points
        size_t characterCount(std::string const & text)
        {
            size_t count = 0;
            for (unsigned char const c : text)
            {
                if ((c & 0xC0u) != 0x80u)
                {
                    ++count;
                }
            }
            return count;
        }

        nlohmann::json pathJson(std::optional<std::filesystem::path> const & path)
        {
            return path ? nlohmann::json(path->string()) : nlohmann::json(nullptr);
        }

        std::string today()
        {
            return fmt::format("{:%Y-%m-%d}", fmt::localtime(std::time(nullptr)));
        }

        bool isBlank(std::string const & text)
        {
            return text.find_first_not_of(" \t\r\n\f\v") == std::string::npos;
        }

        /// Whether first + count - 1 still fits into int
        bool lastIndexFits(std::int64_t first, std::int64_t count)
        {
            return first + count - 1 <= std::numeric_limits<int>::max();
        }
    }

    template <typename Operation>
    ToolResult HwpController::guarded(std::string const & operationName, Operation && operation)
    {
        try
        {
            return operation();
        }
        catch (HwpMcpException const & e)
        {
            logError(fmt::format("{} failed with {}: {}", operationName, e.kind(), e.what()));
            return ToolResult::failure(e);
        }
        catch (std::exception const & e)
        {
            logError(fmt::format("{} failed: {}", operationName, e.what()));
            return ToolResult::failure(AutomationError(e.what()));
        }
    }

    ControllerSettings ControllerSettings::fromConfig(ConfigManager const & config)
    {
        ControllerSettings settings;
        settings.visible = config.getValue<bool>("automation", "visible", settings.visible);
        settings.registerSecurityModule = config.getValue<bool>(
          "automation", "register_security_module", settings.registerSecurityModule);
        settings.securityModuleName = config.getValue<std::string>(
          "automation", "security_module_name", settings.securityModuleName);
        settings.securityModulePath = config.getValue<std::string>(
          "automation", "security_module_path", settings.securityModulePath.string());
        settings.defaultSaveName =
          config.getValue<std::string>("document", "default_save_name", settings.defaultSaveName);
        return settings;
    }

    HwpController::HwpController(automation::AutomationFactory factory,
                                 ControllerSettings settings,
                                 events::SharedLogger logger)
        : m_factory(std::move(factory))
        , m_settings(std::move(settings))
        , m_logger(std::move(logger))
    {
    }

    HwpController::~HwpController() = default;

    bool HwpController::isAttached() const
    {
        return m_automation != nullptr;
    }

    bool HwpController::hasActiveDocument() const
    {
        return m_activeDocument.has_value();
    }

    std::optional<std::filesystem::path> HwpController::activeDocumentPath() const
    {
        if (!m_activeDocument)
        {
            return std::nullopt;
        }
        return m_activeDocument->path;
    }

    ToolResult HwpController::createDocument()
    {
        return guarded("create_document",
                       [&]
                       {
                           session().newDocument();
                           m_activeDocument = ActiveDocument{};
                           logInfo("Created a new document");
                           return ToolResult::success({{"path", nullptr}});
                       });
    }

    ToolResult HwpController::openDocument(std::string const & path)
    {
        return guarded(
          "open_document",
          [&]
          {
              std::error_code ec;
              std::filesystem::path const absolutePath = std::filesystem::absolute(path, ec);
              if (path.empty() || ec || !std::filesystem::is_regular_file(absolutePath, ec))
              {
                  throw NotFoundError(fmt::format("File not found: {}", path));
              }

              session().open(absolutePath);
              m_activeDocument = ActiveDocument{absolutePath};
              logInfo(fmt::format("Opened {}", absolutePath.string()));
              return ToolResult::success({{"path", absolutePath.string()}});
          });
    }

    ToolResult HwpController::saveDocument(std::optional<std::string> const & path)
    {
        return guarded("save_document",
                       [&]
                       {
                           automation::HwpAutomation & hwp = activeSession();

                           if (path && !path->empty())
                           {
                               std::filesystem::path const target = saveActiveAs(hwp, *path);
                               return ToolResult::success({{"path", target.string()}});
                           }

                           std::filesystem::path target;
                           if (m_activeDocument->path)
                           {
                               target = *m_activeDocument->path;
                               hwp.save();
                           }
                           else
                           {
                               target = std::filesystem::current_path() / m_settings.defaultSaveName;
                               logWarning(fmt::format(
                                 "Document was never saved, saving it as {}", target.string()));
                               hwp.saveAs(target, automation::formatFromExtension(target));
                           }

                           m_activeDocument->path = target;
                           logInfo(fmt::format("Saved {}", target.string()));
                           return ToolResult::success({{"path", target.string()}});
                       });
    }

    ToolResult HwpController::closeSession(bool save)
    {
        return guarded(
          "close",
          [&]
          {
              if (!m_automation)
              {
                  return ToolResult::success({{"closed", false}, {"path", nullptr}});
              }

              std::optional<std::filesystem::path> savedPath;
              if (m_activeDocument)
              {
                  if (save)
                  {
                      ToolResult saved = saveDocument(std::nullopt);
                      if (!saved.ok())
                      {
                          // Keep the session so the caller can retry or save elsewhere
                          return saved;
                      }
                      savedPath = m_activeDocument->path;
                  }
              }

              // The document stays open in the application window
              m_activeDocument.reset();
              m_automation.reset();
              logInfo("Released the automation session");
              return ToolResult::success({{"closed", true}, {"path", pathJson(savedPath)}});
          });
    }

    ToolResult HwpController::insertText(std::string const & text,
                                         std::optional<nlohmann::json> const & position,
                                         bool preserveLinebreaks)
    {
        return guarded("insert_text",
                       [&]
                       {
                           automation::HwpAutomation & hwp = activeSession();

                           if (position)
                           {
                               hwp.setPosition(parsePosition(*position));
                           }

                           if (!preserveLinebreaks)
                           {
                               hwp.insertText(text);
                               return ToolResult::success(
                                 {{"characters", characterCount(text)}, {"paragraphs", 1}});
                           }

                           std::vector<std::string> const lines = splitLines(text);
                           size_t characters = 0;
                           for (size_t i = 0; i < lines.size(); ++i)
                           {
                               if (i > 0)
                               {
                                   hwp.breakParagraph();
                               }
                               if (!lines[i].empty())
                               {
                                   hwp.insertText(lines[i]);
                                   characters += characterCount(lines[i]);
                               }
                           }
                           return ToolResult::success(
                             {{"characters", characters}, {"paragraphs", lines.size()}});
                       });
    }

    ToolResult HwpController::insertParagraph(int count)
    {
        return guarded("insert_paragraph",
                       [&]
                       {
                           if (count <= 0)
                           {
                               throw InvalidArgumentError(
                                 fmt::format("count must be positive, got {}", count));
                           }

                           automation::HwpAutomation & hwp = activeSession();
                           for (int i = 0; i < count; ++i)
                           {
                               hwp.breakParagraph();
                           }
                           return ToolResult::success({{"paragraphs", count}});
                       });
    }

    ToolResult HwpController::setFont(automation::CharShape const & shape)
    {
        return guarded("set_font",
                       [&]
                       {
                           if (shape.sizePt && *shape.sizePt <= 0)
                           {
                               throw InvalidArgumentError(
                                 fmt::format("size must be positive, got {}", *shape.sizePt));
                           }

                           activeSession().setCharShape(shape);

                           nlohmann::json payload{{"bold", shape.bold},
                                                  {"italic", shape.italic},
                                                  {"underline", shape.underline}};
                           payload["name"] = shape.faceName ? nlohmann::json(*shape.faceName)
                                                            : nlohmann::json(nullptr);
                           payload["size"] =
                             shape.sizePt ? nlohmann::json(*shape.sizePt) : nlohmann::json(nullptr);
                           return ToolResult::success(std::move(payload));
                       });
    }

    ToolResult HwpController::getText()
    {
        return guarded("get_text",
                       [&] { return ToolResult::success({{"text", activeSession().text()}}); });
    }

    ToolResult HwpController::insertTable(int rows, int columns)
    {
        return guarded("insert_table",
                       [&]
                       {
                           if (rows <= 0 || columns <= 0)
                           {
                               throw InvalidArgumentError(fmt::format(
                                 "Table dimensions must be positive, got {} x {}", rows, columns));
                           }

                           activeSession().createTable(rows, columns);
                           logInfo(fmt::format("Inserted a {} x {} table", rows, columns));
                           return ToolResult::success({{"rows", rows}, {"columns", columns}});
                       });
    }

    ToolResult HwpController::createTableWithData(nlohmann::json const & data, bool hasHeader)
    {
        return guarded("create_table_with_data",
                       [&]
                       {
                           TableData const table = parseTableData(data);
                           auto const rows = static_cast<int>(table.size());
                           auto const columns = static_cast<int>(table.front().size());

                           automation::HwpAutomation & hwp = activeSession();
                           hwp.createTable(rows, columns);
                           writeCells(hwp, table, 0, 0, hasHeader);
                           hwp.leaveTable();

                           logInfo(fmt::format("Created a {} x {} table with data", rows, columns));
                           return ToolResult::success({{"rows", rows}, {"columns", columns}});
                       });
    }

    ToolResult HwpController::fillTableWithData(nlohmann::json const & data,
                                                int startRow,
                                                int startColumn,
                                                bool hasHeader)
    {
        return guarded("fill_table_with_data",
                       [&]
                       {
                           if (startRow < 1 || startColumn < 1)
                           {
                               throw InvalidArgumentError(
                                 fmt::format("start_row and start_col are 1-based, got {}, {}",
                                             startRow,
                                             startColumn));
                           }
                           TableData const table = parseTableData(data);
                           if (!lastIndexFits(startRow - 1, static_cast<std::int64_t>(table.size())) ||
                               !lastIndexFits(startColumn - 1,
                                              static_cast<std::int64_t>(table.front().size())))
                           {
                               throw InvalidArgumentError(fmt::format(
                                 "A {} x {} block starting at row {}, column {} exceeds the table "
                                 "index range",
                                 table.size(),
                                 table.front().size(),
                                 startRow,
                                 startColumn));
                           }

                           automation::HwpAutomation & hwp = activeSession();
                           writeCells(hwp, table, startRow - 1, startColumn - 1, hasHeader);
                           hwp.leaveTable();

                           return ToolResult::success({{"rows", table.size()},
                                                       {"columns", table.front().size()},
                                                       {"start_row", startRow},
                                                       {"start_col", startColumn}});
                       });
    }

    ToolResult HwpController::fillColumnNumbers(int start, int end, int column, bool fromFirstCell)
    {
        return guarded(
          "fill_column_numbers",
          [&]
          {
              if (column < 1)
              {
                  throw InvalidArgumentError(
                    fmt::format("column is 1-based, got {}", column));
              }
              if (end < start)
              {
                  throw InvalidArgumentError(
                    fmt::format("end must not be less than start, got {} to {}", start, end));
              }

              std::int64_t const firstRow = fromFirstCell ? 0 : 1;
              std::int64_t const count = static_cast<std::int64_t>(end) - start + 1;
              if (!lastIndexFits(firstRow, count))
              {
                  throw InvalidArgumentError(
                    fmt::format("{} numbers exceed the table index range", count));
              }

              automation::HwpAutomation & hwp = activeSession();
              for (std::int64_t i = 0; i < count; ++i)
              {
                  hwp.setCellText(static_cast<int>(firstRow + i),
                                  column - 1,
                                  std::to_string(start + i),
                                  false);
              }
              hwp.leaveTable();

              logInfo(fmt::format("Numbered column {} from {} to {}", column, start, end));
              return ToolResult::success(
                {{"column", column}, {"start", start}, {"end", end}, {"cells", count}});
          });
    }

    ToolResult HwpController::createDocumentFromText(std::string const & content,
                                                     std::optional<std::string> const & title,
                                                     bool formatContent,
                                                     std::optional<std::string> const & saveFilename,
                                                     bool preserveLinebreaks)
    {
        return guarded(
          "create_document_from_text",
          [&]
          {
              if (isBlank(content))
              {
                  throw InvalidArgumentError("content must not be empty");
              }

              automation::HwpAutomation & hwp = session();
              hwp.newDocument();
              m_activeDocument = ActiveDocument{};

              TextDocumentOptions options;
              options.title = title;
              options.formatContent = formatContent;
              options.preserveLinebreaks = preserveLinebreaks;
              CompositionSummary const summary =
                DocumentComposer(hwp, today()).writeText(content, options);

              nlohmann::json payload{{"blocks", summary.blocks},
                                     {"paragraphs", summary.paragraphs},
                                     {"path", nullptr}};
              payload["title"] =
                summary.title ? nlohmann::json(*summary.title) : nlohmann::json(nullptr);
              if (saveFilename && !saveFilename->empty())
              {
                  payload["path"] = saveActiveAs(hwp, *saveFilename).string();
              }

              logInfo(fmt::format("Created a document from text with {} blocks", summary.blocks));
              return ToolResult::success(std::move(payload));
          });
    }

    ToolResult HwpController::createCompleteDocument(nlohmann::json const & document)
    {
        return guarded(
          "create_complete_document",
          [&]
          {
              CompleteDocument const parsed = parseCompleteDocument(document);
              for (std::string const & type : parsed.skippedElements)
              {
                  logWarning(fmt::format("Skipped a document element of unknown type '{}'", type));
              }

              automation::HwpAutomation & hwp = session();
              hwp.newDocument();
              m_activeDocument = ActiveDocument{};

              CompositionSummary const summary = DocumentComposer(hwp, today()).writeDocument(parsed);

              std::string type = "elements";
              if (std::holds_alternative<Report>(parsed.body))
              {
                  type = "report";
              }
              else if (std::holds_alternative<Letter>(parsed.body))
              {
                  type = "letter";
              }

              nlohmann::json payload{{"type", type},
                                     {"paragraphs", summary.paragraphs},
                                     {"skipped", parsed.skippedElements},
                                     {"path", nullptr}};
              if (parsed.save)
              {
                  payload["path"] = saveActiveAs(hwp, parsed.filename).string();
              }

              logInfo(fmt::format("Created a complete document of type {}", type));
              return ToolResult::success(std::move(payload));
          });
    }

    ToolResult HwpController::ping(std::string const & message)
    {
        return guarded("ping",
                       [&]
                       {
                           std::string response;
                           if (message == "ping")
                           {
                               response = "pong";
                           }
                           else if (message == "pong")
                           {
                               response = "ping";
                           }
                           else
                           {
                               response = fmt::format(
                                 "Unknown message: {} (send ping or pong)", message);
                           }

                           std::string const timestamp = fmt::format(
                             "{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::time(nullptr)));
                           return ToolResult::success({{"response", response},
                                                       {"original_message", message},
                                                       {"timestamp", timestamp}});
                       });
    }

    automation::HwpAutomation & HwpController::session()
    {
        if (m_automation)
        {
            return *m_automation;
        }

        if (!m_factory)
        {
            throw AutomationError("No automation backend configured");
        }

        std::unique_ptr<automation::HwpAutomation> automation = m_factory();
        if (!automation)
        {
            throw AutomationError("Could not connect to the word processor");
        }

        if (m_settings.registerSecurityModule && !m_settings.securityModulePath.empty())
        {
            try
            {
                automation->registerSecurityModule(m_settings.securityModuleName,
                                                   m_settings.securityModulePath);
            }
            catch (AutomationError const & e)
            {
                // File access confirmations will show up, everything else still works
                logWarning(fmt::format("Security module was not registered: {}", e.what()));
            }
        }

        automation->setVisible(m_settings.visible);

        m_automation = std::move(automation);
        logInfo("Attached to the word processor");
        return *m_automation;
    }

    automation::HwpAutomation & HwpController::activeSession()
    {
        if (!m_activeDocument || !m_automation)
        {
            throw AutomationError("No active document, create or open a document first");
        }
        return *m_automation;
    }

    std::filesystem::path HwpController::saveActiveAs(automation::HwpAutomation & hwp,
                                                      std::string const & path)
    {
        std::filesystem::path const target = std::filesystem::absolute(path);
        hwp.saveAs(target, automation::formatFromExtension(target));
        m_activeDocument->path = target;
        logInfo(fmt::format("Saved {}", target.string()));
        return target;
    }

    void HwpController::writeCells(automation::HwpAutomation & hwp,
                                   TableData const & table,
                                   int rowOffset,
                                   int columnOffset,
                                   bool hasHeader)
    {
        for (size_t row = 0; row < table.size(); ++row)
        {
            for (size_t column = 0; column < table[row].size(); ++column)
            {
                hwp.setCellText(rowOffset + static_cast<int>(row),
                                columnOffset + static_cast<int>(column),
                                table[row][column],
                                hasHeader && row == 0);
            }
        }
    }

    void HwpController::logInfo(std::string const & message) const
    {
        if (m_logger)
        {
            m_logger->logInfo(message);
        }
    }

    void HwpController::logWarning(std::string const & message) const
    {
        if (m_logger)
        {
            m_logger->logWarning(message);
        }
    }

    void HwpController::logError(std::string const & message) const
    {
        if (m_logger)
        {
            m_logger->logError(message);
        }
    }
}
