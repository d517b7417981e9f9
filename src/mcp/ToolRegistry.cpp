#include "ToolRegistry.h"
#include "../exceptions.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fmt/format.h>
#include <limits>
#include <set>
#include <stdexcept>

namespace hwpmcp::mcp
{
    namespace
    {
        constexpr auto ToolCount = static_cast<size_t>(ToolId::Count);

        size_t indexOf(ToolId id)
        {
            return static_cast<size_t>(id);
        }

        bool matchesType(nlohmann::json const & value, ParamType type)
        {
            switch (type)
            {
            case ParamType::String:
                return value.is_string();
            case ParamType::Integer:
                if (value.is_number_unsigned())
                {
                    return value.get<std::uint64_t>() <=
                           static_cast<std::uint64_t>(std::numeric_limits<int>::max());
                }
                if (value.is_number_integer())
                {
                    auto const number = value.get<std::int64_t>();
                    return number >= std::numeric_limits<int>::min() &&
                           number <= std::numeric_limits<int>::max();
                }
                return false;
            case ParamType::Boolean:
                return value.is_boolean();
            case ParamType::Object:
                return value.is_object();
            case ParamType::Array:
                return value.is_array();
            }
            return false;
        }

        ParamSpec param(std::string name,
                        ParamType type,
                        bool required,
                        std::string description)
        {
            return ParamSpec{std::move(name), type, required, std::move(description)};
        }
    }

    std::string_view typeName(ParamType type)
    {
        switch (type)
        {
        case ParamType::String:
            return "string";
        case ParamType::Integer:
            return "integer";
        case ParamType::Boolean:
            return "boolean";
        case ParamType::Object:
            return "object";
        case ParamType::Array:
            return "array";
        }
        return "string";
    }

    std::vector<ToolSpec> builtinToolSpecs()
    {
        std::vector<ToolSpec> specs;
        specs.push_back({ToolId::Create,
                         "hwp_create",
                         "create",
                         "Create a new document in the word processor; it becomes the active "
                         "document",
                         {}});
        specs.push_back({ToolId::Open,
                         "hwp_open",
                         "open",
                         "Open an existing document; it becomes the active document",
                         {param("path", ParamType::String, true, "Path of the document to open")}});
        specs.push_back(
          {ToolId::Save,
           "hwp_save",
           "save",
           "Save the active document. The format follows the extension (.hwp, .hwpx, .txt, "
           ".html, .pdf). Without a path the document is saved in place",
           {param("path", ParamType::String, false, "Target path, saves in place when omitted")}});
        specs.push_back(
          {ToolId::InsertText,
           "hwp_insert_text",
           "insert_text",
           "Insert text at the caret or at the given position of the active document",
           {param("text", ParamType::String, true, "Text to insert"),
            param("position",
                  ParamType::Object,
                  false,
                  "Caret position {list, para, pos} to insert at, non-negative integers"),
            param("preserve_linebreaks",
                  ParamType::Boolean,
                  false,
                  "Turn line breaks into paragraph breaks (default true)")}});
        specs.push_back({ToolId::InsertTable,
                         "hwp_insert_table",
                         "insert_table",
                         "Insert an empty table at the caret",
                         {param("rows", ParamType::Integer, true, "Number of rows, at least 1"),
                          param("columns", ParamType::Integer, true, "Number of columns, at least 1")}});
        specs.push_back(
          {ToolId::CreateTableWithData,
           "hwp_create_table_with_data",
           "create_table_with_data",
           "Create a table sized to the data and fill every cell",
           {param("data",
                  ParamType::Array,
                  true,
                  "Rows of cell values (string, number or null), all rows of equal length"),
            param("has_header", ParamType::Boolean, false, "Write the first row in bold")}});
        specs.push_back({ToolId::InsertParagraph,
                         "hwp_insert_paragraph",
                         "insert_paragraph",
                         "Insert paragraph breaks at the caret",
                         {param("count", ParamType::Integer, false, "Number of breaks (default 1)")}});
        specs.push_back({ToolId::SetFont,
                         "hwp_set_font",
                         "set_font",
                         "Set the character shape used for text inserted at the caret",
                         {param("name", ParamType::String, false, "Font face name"),
                          param("size", ParamType::Integer, false, "Font size in points"),
                          param("bold", ParamType::Boolean, false, "Bold"),
                          param("italic", ParamType::Boolean, false, "Italic"),
                          param("underline", ParamType::Boolean, false, "Underline")}});
        specs.push_back({ToolId::GetText,
                         "hwp_get_text",
                         "get_text",
                         "Return the full text of the active document",
                         {}});
        specs.push_back(
          {ToolId::FillTableWithData,
           "hwp_fill_table_with_data",
           "fill_table_with_data",
           "Fill the table at the caret with data, starting at a 1-based cell",
           {param("data", ParamType::Array, true, "Rows of cell values, all rows of equal length"),
            param("start_row", ParamType::Integer, false, "First row to write (default 1)"),
            param("start_col", ParamType::Integer, false, "First column to write (default 1)"),
            param("has_header", ParamType::Boolean, false, "Write the first row in bold")}});
        specs.push_back(
          {ToolId::Close,
           "hwp_close",
           "close",
           "Release the connection to the word processor. The document stays open in its "
           "window",
           {param("save", ParamType::Boolean, false, "Save the document in place first (default true)")}});
        specs.push_back(
          {ToolId::FillColumnNumbers,
           "hwp_fill_column_numbers",
           "fill_column_numbers",
           "Write the numbers start to end into one column of the table at the caret, one per row",
           {param("start", ParamType::Integer, false, "First number (default 1)"),
            param("end", ParamType::Integer, false, "Last number (default 10)"),
            param("column", ParamType::Integer, false, "1-based column (default 1)"),
            param("from_first_cell",
                  ParamType::Boolean,
                  false,
                  "Start in the first row, otherwise below it (default true)")}});
        specs.push_back(
          {ToolId::CreateDocumentFromText,
           "hwp_create_document_from_text",
           "create_document_from_text",
           "Create a new document from plain text. Blocks are separated by empty lines, lines "
           "starting with # become headings and lines starting with - or * become bullets",
           {param("content", ParamType::String, true, "Text of the document"),
            param("title", ParamType::String, false, "Title, the first line is used when omitted"),
            param("format_content",
                  ParamType::Boolean,
                  false,
                  "Detect headings and bullet lists (default true)"),
            param("save_filename", ParamType::String, false, "Save the document there"),
            param("preserve_linebreaks",
                  ParamType::Boolean,
                  false,
                  "Write every line of a block as its own paragraph (default true)")}});
        specs.push_back(
          {ToolId::CreateCompleteDocument,
           "hwp_create_complete_document",
           "create_complete_document",
           "Create a new document from a description: {elements: [{type: heading|text|paragraph|"
           "table, content, properties}]} or {special_type: {type: report|letter, params}}, "
           "optionally with save and filename",
           {param("document", ParamType::Object, true, "Description of the document")}});
        specs.push_back({ToolId::PingPong,
                         "hwp_ping_pong",
                         "",
                         "Connectivity test: answers pong to ping and ping to pong",
                         {param("message", ParamType::String, false, "ping or pong (default ping)")}});
        specs.push_back(
          {ToolId::BatchOperations,
           "hwp_batch_operations",
           "",
           "Run several operations in order. Each entry is {operation, params} where operation "
           "is one of create, open, save, insert_text, insert_table, create_table_with_data, "
           "insert_paragraph, set_font, get_text, fill_table_with_data, close, "
           "fill_column_numbers, create_document_from_text, create_complete_document",
           {param("operations", ParamType::Array, true, "Operations to run")}});
        return specs;
    }

    ToolRegistry::ToolRegistry()
        : ToolRegistry(builtinToolSpecs())
    {
    }

    ToolRegistry::ToolRegistry(std::vector<ToolSpec> specs)
        : m_specs(std::move(specs))
    {
        validateTable();
        std::sort(m_specs.begin(),
                  m_specs.end(),
                  [](ToolSpec const & lhs, ToolSpec const & rhs)
                  { return indexOf(lhs.id) < indexOf(rhs.id); });
    }

    void ToolRegistry::validateTable() const
    {
        std::array<size_t, ToolCount> specsPerTool{};
        std::set<std::string> names;
        std::set<std::string> batchNames;

        for (ToolSpec const & toolSpec : m_specs)
        {
            if (indexOf(toolSpec.id) >= ToolCount)
            {
                throw std::logic_error(
                  fmt::format("Tool '{}' has an invalid id {}", toolSpec.name, indexOf(toolSpec.id)));
            }
            ++specsPerTool[indexOf(toolSpec.id)];

            if (toolSpec.name.empty() || !names.insert(toolSpec.name).second)
            {
                throw std::logic_error(
                  fmt::format("Tool name '{}' is empty or registered twice", toolSpec.name));
            }
            if (!toolSpec.batchName.empty() && !batchNames.insert(toolSpec.batchName).second)
            {
                throw std::logic_error(
                  fmt::format("Batch operation '{}' is registered twice", toolSpec.batchName));
            }

            std::set<std::string> paramNames;
            for (ParamSpec const & paramSpec : toolSpec.params)
            {
                if (!paramNames.insert(paramSpec.name).second)
                {
                    throw std::logic_error(fmt::format(
                      "Tool '{}' declares parameter '{}' twice", toolSpec.name, paramSpec.name));
                }
            }
        }

        for (size_t index = 0; index < ToolCount; ++index)
        {
            if (specsPerTool[index] != 1)
            {
                throw std::logic_error(fmt::format(
                  "Tool id {} has {} specs, expected exactly one", index, specsPerTool[index]));
            }
        }
    }

    std::optional<ToolId> ToolRegistry::resolve(std::string_view name) const
    {
        auto const it = std::find_if(m_specs.begin(),
                                     m_specs.end(),
                                     [name](ToolSpec const & toolSpec)
                                     { return toolSpec.name == name; });
        if (it == m_specs.end())
        {
            return std::nullopt;
        }
        return it->id;
    }

    std::optional<ToolId> ToolRegistry::resolveBatchName(std::string_view batchName) const
    {
        if (batchName.empty())
        {
            return std::nullopt;
        }
        auto const it = std::find_if(m_specs.begin(),
                                     m_specs.end(),
                                     [batchName](ToolSpec const & toolSpec)
                                     { return toolSpec.batchName == batchName; });
        if (it == m_specs.end())
        {
            return std::nullopt;
        }
        return it->id;
    }

    ToolSpec const & ToolRegistry::spec(ToolId id) const
    {
        return m_specs.at(indexOf(id));
    }

    void ToolRegistry::validateArguments(ToolId id, nlohmann::json const & arguments) const
    {
        ToolSpec const & toolSpec = spec(id);

        if (arguments.is_null())
        {
            validateArguments(id, nlohmann::json::object());
            return;
        }
        if (!arguments.is_object())
        {
            throw SchemaValidationError(
              fmt::format("Arguments of {} must be an object", toolSpec.name));
        }

        for (auto const & [key, value] : arguments.items())
        {
            bool const declared = std::any_of(toolSpec.params.begin(),
                                              toolSpec.params.end(),
                                              [&key](ParamSpec const & paramSpec)
                                              { return paramSpec.name == key; });
            if (!declared)
            {
                throw SchemaValidationError(
                  fmt::format("{} does not accept the argument '{}'", toolSpec.name, key));
            }
        }

        for (ParamSpec const & paramSpec : toolSpec.params)
        {
            auto const it = arguments.find(paramSpec.name);
            bool const present = it != arguments.end() && !it->is_null();
            if (!present)
            {
                if (paramSpec.required)
                {
                    throw SchemaValidationError(fmt::format(
                      "{} requires the argument '{}'", toolSpec.name, paramSpec.name));
                }
                continue;
            }

            if (!matchesType(*it, paramSpec.type))
            {
                throw SchemaValidationError(fmt::format("Argument '{}' of {} must be of type {}",
                                                        paramSpec.name,
                                                        toolSpec.name,
                                                        typeName(paramSpec.type)));
            }
        }
    }

    nlohmann::json ToolRegistry::inputSchema(ToolId id) const
    {
        ToolSpec const & toolSpec = spec(id);

        nlohmann::json properties = nlohmann::json::object();
        nlohmann::json required = nlohmann::json::array();
        for (ParamSpec const & paramSpec : toolSpec.params)
        {
            properties[paramSpec.name] = {{"type", std::string(typeName(paramSpec.type))},
                                          {"description", paramSpec.description}};
            if (paramSpec.required)
            {
                required.push_back(paramSpec.name);
            }
        }

        return {{"type", "object"},
                {"properties", properties},
                {"required", required},
                {"additionalProperties", false}};
    }

    nlohmann::json ToolRegistry::toolList() const
    {
        nlohmann::json tools = nlohmann::json::array();
        for (ToolSpec const & toolSpec : m_specs)
        {
            tools.push_back({{"name", toolSpec.name},
                             {"description", toolSpec.description},
                             {"inputSchema", inputSchema(toolSpec.id)}});
        }
        return tools;
    }
}
