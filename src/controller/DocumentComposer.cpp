#include "DocumentComposer.h"
#include "../exceptions.h"

#include <algorithm>
#include <cstdint>
#include <fmt/format.h>
#include <limits>

namespace hwpmcp
{
    namespace
    {
        constexpr char const * Whitespace = " \t\r\n\f\v";
        constexpr char const * Bullet = "\xE2\x80\xA2";

        // Width of the blank run that pushes date and sender of a letter to the right
        constexpr size_t LetterIndent = 40;

        std::string trim(std::string const & text)
        {
            auto const first = text.find_first_not_of(Whitespace);
            if (first == std::string::npos)
            {
                return {};
            }
            auto const last = text.find_last_not_of(Whitespace);
            return text.substr(first, last - first + 1);
        }

        bool isBlank(std::string const & line)
        {
            return line.find_first_not_of(Whitespace) == std::string::npos;
        }

        /// Length of a leading bullet marker, 0 if there is none
        size_t bulletPrefixLength(std::string const & line)
        {
            if (line.starts_with('-') || line.starts_with('*'))
            {
                return 1;
            }
            if (line.starts_with(Bullet))
            {
                return std::char_traits<char>::length(Bullet);
            }
            return 0;
        }

        nlohmann::json const * member(nlohmann::json const & object, char const * key)
        {
            auto const it = object.find(key);
            if (it == object.end() || it->is_null())
            {
                return nullptr;
            }
            return &*it;
        }

        std::string stringMember(nlohmann::json const & object,
                                 char const * key,
                                 std::string fallback,
                                 std::string const & context)
        {
            nlohmann::json const * value = member(object, key);
            if (!value)
            {
                return fallback;
            }
            if (!value->is_string())
            {
                throw InvalidArgumentError(fmt::format("{}.{} must be a string", context, key));
            }
            return value->get<std::string>();
        }

        std::optional<std::string>
        optionalStringMember(nlohmann::json const & object, char const * key, std::string const & context)
        {
            if (!member(object, key))
            {
                return std::nullopt;
            }
            return stringMember(object, key, {}, context);
        }

        bool boolMember(nlohmann::json const & object,
                        char const * key,
                        bool fallback,
                        std::string const & context)
        {
            nlohmann::json const * value = member(object, key);
            if (!value)
            {
                return fallback;
            }
            if (!value->is_boolean())
            {
                throw InvalidArgumentError(fmt::format("{}.{} must be a boolean", context, key));
            }
            return value->get<bool>();
        }

        int intMember(nlohmann::json const & object,
                      char const * key,
                      int fallback,
                      std::string const & context)
        {
            nlohmann::json const * value = member(object, key);
            if (!value)
            {
                return fallback;
            }
            if (!value->is_number_integer() ||
                value->get<std::int64_t>() < std::numeric_limits<int>::min() ||
                value->get<std::int64_t>() > std::numeric_limits<int>::max())
            {
                throw InvalidArgumentError(fmt::format("{}.{} must be an integer", context, key));
            }
            return value->get<int>();
        }

        nlohmann::json objectMember(nlohmann::json const & object,
                                    char const * key,
                                    std::string const & context)
        {
            nlohmann::json const * value = member(object, key);
            if (!value)
            {
                return nlohmann::json::object();
            }
            if (!value->is_object())
            {
                throw InvalidArgumentError(fmt::format("{}.{} must be an object", context, key));
            }
            return *value;
        }

        DocumentElement parseTable(nlohmann::json const & properties, std::string const & context)
        {
            DocumentElement element;
            element.type = ElementType::Table;

            size_t dataRows = 0;
            size_t dataColumns = 0;
            if (nlohmann::json const * data = member(properties, "data"))
            {
                element.data = parseTableData(*data);
                dataRows = element.data->size();
                dataColumns = element.data->front().size();
            }

            element.rows = intMember(properties, "rows", static_cast<int>(dataRows), context);
            element.columns = intMember(properties, "cols", static_cast<int>(dataColumns), context);
            if (element.rows <= 0 || element.columns <= 0)
            {
                throw InvalidArgumentError(
                  fmt::format("{} needs positive rows and cols, got {} x {}",
                              context,
                              element.rows,
                              element.columns));
            }
            if (dataRows > static_cast<size_t>(element.rows) ||
                dataColumns > static_cast<size_t>(element.columns))
            {
                throw InvalidArgumentError(
                  fmt::format("{} has {} x {} cells of data for a {} x {} table",
                              context,
                              dataRows,
                              dataColumns,
                              element.rows,
                              element.columns));
            }
            return element;
        }

        std::vector<DocumentElement> parseElements(nlohmann::json const & elements,
                                                   std::vector<std::string> & skipped)
        {
            if (!elements.is_array())
            {
                throw InvalidArgumentError("document.elements must be an array");
            }

            std::vector<DocumentElement> result;
            for (size_t index = 0; index < elements.size(); ++index)
            {
                std::string const context = fmt::format("elements[{}]", index);
                nlohmann::json const & entry = elements[index];
                if (!entry.is_object())
                {
                    throw InvalidArgumentError(fmt::format("{} must be an object", context));
                }

                std::string const type = stringMember(entry, "type", {}, context);
                nlohmann::json const properties = objectMember(entry, "properties", context);
                std::string const propertiesContext = context + ".properties";

                DocumentElement element;
                element.content = stringMember(entry, "content", {}, context);
                if (type == "heading")
                {
                    element.type = ElementType::Heading;
                    element.fontSize = intMember(properties, "font_size", 16, propertiesContext);
                    element.bold = boolMember(properties, "bold", true, propertiesContext);
                }
                else if (type == "text")
                {
                    element.type = ElementType::Text;
                    element.fontSize = intMember(properties, "font_size", 10, propertiesContext);
                    element.bold = boolMember(properties, "bold", false, propertiesContext);
                    element.italic = boolMember(properties, "italic", false, propertiesContext);
                }
                else if (type == "paragraph")
                {
                    element.type = ElementType::Paragraph;
                }
                else if (type == "table")
                {
                    element = parseTable(properties, propertiesContext);
                }
                else
                {
                    skipped.push_back(type);
                    continue;
                }

                if (element.fontSize <= 0)
                {
                    throw InvalidArgumentError(
                      fmt::format("{}.font_size must be positive", propertiesContext));
                }
                result.push_back(std::move(element));
            }
            return result;
        }

        Report parseReport(nlohmann::json const & params)
        {
            Report report;
            report.title = stringMember(params, "title", report.title, "params");
            report.author = stringMember(params, "author", report.author, "params");
            report.date = optionalStringMember(params, "date", "params");

            nlohmann::json const * sections = member(params, "sections");
            if (!sections)
            {
                report.sections.push_back({"Section title", "Section content"});
                return report;
            }
            if (!sections->is_array())
            {
                throw InvalidArgumentError("params.sections must be an array");
            }
            for (size_t index = 0; index < sections->size(); ++index)
            {
                std::string const context = fmt::format("params.sections[{}]", index);
                nlohmann::json const & section = (*sections)[index];
                if (!section.is_object())
                {
                    throw InvalidArgumentError(fmt::format("{} must be an object", context));
                }
                report.sections.push_back({stringMember(section, "title", {}, context),
                                           stringMember(section, "content", {}, context)});
            }
            return report;
        }

        Letter parseLetter(nlohmann::json const & params)
        {
            Letter letter;
            letter.title = stringMember(params, "title", letter.title, "params");
            letter.recipient = stringMember(params, "recipient", letter.recipient, "params");
            letter.content = stringMember(params, "content", letter.content, "params");
            letter.sender = stringMember(params, "sender", letter.sender, "params");
            letter.date = optionalStringMember(params, "date", "params");
            return letter;
        }
    }

    std::vector<std::string> splitLines(std::string const & text)
    {
        std::vector<std::string> lines(1);
        for (size_t i = 0; i < text.size(); ++i)
        {
            char const c = text[i];
            if (c == '\r')
            {
                if (i + 1 < text.size() && text[i + 1] == '\n')
                {
                    ++i;
                }
                lines.emplace_back();
            }
            else if (c == '\n')
            {
                lines.emplace_back();
            }
            else if (c == '\\' && i + 1 < text.size() && text[i + 1] == 'n')
            {
                ++i;
                lines.emplace_back();
            }
            else
            {
                lines.back().push_back(c);
            }
        }
        return lines;
    }

    std::vector<std::vector<std::string>> splitIntoBlocks(std::vector<std::string> const & lines)
    {
        std::vector<std::vector<std::string>> blocks;
        std::vector<std::string> current;
        for (std::string const & line : lines)
        {
            if (!isBlank(line))
            {
                current.push_back(line);
            }
            else if (!current.empty())
            {
                blocks.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty())
        {
            blocks.push_back(std::move(current));
        }
        return blocks;
    }

    CompleteDocument parseCompleteDocument(nlohmann::json const & document)
    {
        if (!document.is_object())
        {
            throw InvalidArgumentError("The document description must be an object");
        }

        CompleteDocument result;
        result.save = boolMember(document, "save", false, "document");

        std::string defaultFilename;
        if (nlohmann::json const * special = member(document, "special_type"))
        {
            if (!special->is_object())
            {
                throw InvalidArgumentError("document.special_type must be an object");
            }
            std::string const type = stringMember(*special, "type", {}, "special_type");
            nlohmann::json const params = objectMember(*special, "params", "special_type");

            if (type == "report")
            {
                result.body = parseReport(params);
                defaultFilename = "report.hwp";
            }
            else if (type == "letter")
            {
                result.body = parseLetter(params);
                defaultFilename = "letter.hwp";
            }
            else
            {
                throw InvalidArgumentError(fmt::format(
                  "Unknown document template '{}', expected report or letter", type));
            }
        }
        else if (nlohmann::json const * elements = member(document, "elements"))
        {
            result.body = parseElements(*elements, result.skippedElements);
            defaultFilename = "generated_document.hwp";
        }
        else
        {
            throw InvalidArgumentError("The document needs either 'elements' or 'special_type'");
        }

        result.filename = stringMember(document, "filename", defaultFilename, "document");
        if (result.filename.empty())
        {
            result.filename = defaultFilename;
        }
        return result;
    }

    DocumentComposer::DocumentComposer(automation::HwpAutomation & hwp, std::string today)
        : m_hwp(hwp)
        , m_today(std::move(today))
    {
    }

    CompositionSummary DocumentComposer::writeText(std::string const & content,
                                                   TextDocumentOptions const & options)
    {
        m_summary = CompositionSummary{};

        std::vector<std::string> const lines = splitLines(content);
        std::vector<std::vector<std::string>> blocks = splitIntoBlocks(lines);

        std::optional<std::string> title = options.title;
        std::optional<size_t> titleLine;
        if ((!title || title->empty()) && !blocks.empty())
        {
            title = trim(blocks.front().front());
            blocks.front().erase(blocks.front().begin());
            if (blocks.front().empty())
            {
                blocks.erase(blocks.begin());
            }
            auto const firstLine = std::find_if(lines.begin(),
                                                lines.end(),
                                                [](std::string const & line)
                                                { return !isBlank(line); });
            titleLine = static_cast<size_t>(firstLine - lines.begin());
        }

        if (title && !title->empty())
        {
            font(16, true);
            text(*title);
            paragraph(2);
            m_summary.title = title;
        }

        if (options.formatContent)
        {
            for (auto const & block : blocks)
            {
                writeFormattedBlock(block, options.preserveLinebreaks);
                paragraph();
            }
        }
        else
        {
            font(11, false);
            for (size_t index = 0; index < lines.size(); ++index)
            {
                if (titleLine && index == *titleLine)
                {
                    continue;
                }
                if (!isBlank(lines[index]))
                {
                    text(lines[index]);
                }
                paragraph();
            }
        }

        m_summary.blocks = blocks.size();
        return m_summary;
    }

    CompositionSummary DocumentComposer::writeDocument(CompleteDocument const & document)
    {
        m_summary = CompositionSummary{};

        if (auto const * elements = std::get_if<std::vector<DocumentElement>>(&document.body))
        {
            writeElements(*elements);
            m_summary.blocks = elements->size();
        }
        else if (auto const * report = std::get_if<Report>(&document.body))
        {
            writeReport(*report);
            m_summary.title = report->title;
            m_summary.blocks = report->sections.size();
        }
        else if (auto const * letter = std::get_if<Letter>(&document.body))
        {
            writeLetter(*letter);
            m_summary.title = letter->title;
            m_summary.blocks = 1;
        }
        return m_summary;
    }

    void DocumentComposer::writeElements(std::vector<DocumentElement> const & elements)
    {
        for (DocumentElement const & element : elements)
        {
            switch (element.type)
            {
            case ElementType::Heading:
                font(element.fontSize, element.bold);
                text(element.content);
                paragraph();
                break;
            case ElementType::Text:
                font(element.fontSize, element.bold, element.italic);
                text(element.content);
                break;
            case ElementType::Paragraph:
                paragraph();
                break;
            case ElementType::Table:
                m_hwp.createTable(element.rows, element.columns);
                if (element.data)
                {
                    TableData const & data = *element.data;
                    for (size_t row = 0; row < data.size(); ++row)
                    {
                        for (size_t column = 0; column < data[row].size(); ++column)
                        {
                            m_hwp.setCellText(static_cast<int>(row),
                                              static_cast<int>(column),
                                              data[row][column],
                                              false);
                        }
                    }
                }
                m_hwp.leaveTable();
                break;
            }
        }
    }

    void DocumentComposer::writeReport(Report const & report)
    {
        font(22, true);
        text(report.title);
        paragraph(2);

        font(14, false);
        text("Author: " + report.author);
        paragraph();
        text("Date: " + report.date.value_or(m_today));
        paragraph(2);

        for (ReportSection const & section : report.sections)
        {
            font(16, true);
            text(section.title);
            paragraph();

            font(12, false);
            text(section.content);
            paragraph(2);
        }
    }

    void DocumentComposer::writeLetter(Letter const & letter)
    {
        font(16, true);
        text(letter.title);
        paragraph(2);

        font(12, false);
        text("To: " + letter.recipient);
        paragraph(2);

        text(letter.content);
        paragraph(2);

        text(std::string(LetterIndent, ' ') + letter.date.value_or(m_today));
        paragraph();

        font(12, true);
        text(std::string(LetterIndent, ' ') + letter.sender);
    }

    void DocumentComposer::writeFormattedBlock(std::vector<std::string> const & block,
                                               bool preserveLinebreaks)
    {
        std::string const firstLine = trim(block.front());

        if (firstLine.starts_with('#'))
        {
            size_t const level = std::min(firstLine.find_first_not_of('#'), firstLine.size());
            // '#' is 16pt, every further level one point less, never below 11pt
            int const size = level >= 6 ? 11 : 17 - static_cast<int>(level);

            font(size, true);
            text(trim(firstLine.substr(level)));
            paragraph();

            if (block.size() > 1)
            {
                font(11, false);
                for (size_t index = 1; index < block.size(); ++index)
                {
                    text(block[index]);
                    paragraph();
                }
            }
        }
        else if (bulletPrefixLength(firstLine) > 0)
        {
            font(11, false);
            for (std::string const & line : block)
            {
                std::string const stripped = trim(line);
                size_t const prefix = bulletPrefixLength(stripped);
                if (prefix > 0)
                {
                    text(fmt::format("{} {}", Bullet, trim(stripped.substr(prefix))));
                }
                else
                {
                    text(stripped);
                }
                paragraph();
            }
        }
        else if (preserveLinebreaks)
        {
            font(11, false);
            for (std::string const & line : block)
            {
                text(line);
                paragraph();
            }
        }
        else
        {
            std::string joined;
            for (size_t index = 0; index < block.size(); ++index)
            {
                if (index > 0)
                {
                    joined += '\n';
                }
                joined += block[index];
            }

            font(11, false);
            text(joined);
            paragraph();
        }
    }

    void DocumentComposer::font(int sizePt, bool bold, bool italic)
    {
        automation::CharShape shape;
        shape.sizePt = sizePt;
        shape.bold = bold;
        shape.italic = italic;
        m_hwp.setCharShape(shape);
    }

    void DocumentComposer::text(std::string const & text)
    {
        if (!text.empty())
        {
            m_hwp.insertText(text);
        }
    }

    void DocumentComposer::paragraph(int count)
    {
        for (int i = 0; i < count; ++i)
        {
            m_hwp.breakParagraph();
            ++m_summary.paragraphs;
        }
    }
}
