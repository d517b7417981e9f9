/**
 * @file MCPServer.cpp
 * @brief Implementation of the stdio MCP server
 */

#include "MCPServer.h"
#include "../exceptions.h"
#include "MCPControllerInterface.h"

#include <fmt/format.h>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace hwpmcp::mcp
{
    namespace
    {
        constexpr int ParseError = -32700;
        constexpr int InvalidRequest = -32600;
        constexpr int MethodNotFound = -32601;
        constexpr int InvalidParams = -32602;
        constexpr int InternalError = -32603;

        constexpr char const * ProtocolVersion = "2024-11-05";
        constexpr char const * ServerName = "hwpmcp";
        constexpr char const * ServerVersion = "1.0.0";

        /// Value of an optional argument, null counts as absent
        template <typename T>
        T argumentOr(json const & arguments, char const * name, T fallback)
        {
            auto const it = arguments.find(name);
            if (it == arguments.end() || it->is_null())
            {
                return fallback;
            }
            return it->get<T>();
        }

        std::optional<json> optionalArgument(json const & arguments, char const * name)
        {
            auto const it = arguments.find(name);
            if (it == arguments.end() || it->is_null())
            {
                return std::nullopt;
            }
            return *it;
        }

        std::optional<std::string> optionalString(json const & arguments, char const * name)
        {
            if (auto value = optionalArgument(arguments, name))
            {
                return value->get<std::string>();
            }
            return std::nullopt;
        }

        json requestId(json const & request)
        {
            return request.contains("id") ? request["id"] : json(nullptr);
        }

        bool isBlank(std::string const & line)
        {
            return line.find_first_not_of(" \t\r\n") == std::string::npos;
        }

        /// Restores Idle when a message has been handled, whichever way it left
        class StateGuard
        {
          public:
            explicit StateGuard(ServerState & state)
                : m_state(state)
            {
                m_state = ServerState::Dispatching;
            }

            ~StateGuard()
            {
                m_state = ServerState::Idle;
            }

            StateGuard(StateGuard const &) = delete;
            StateGuard & operator=(StateGuard const &) = delete;

          private:
            ServerState & m_state;
        };
    }

    MCPServer::MCPServer(MCPControllerInterface & controller,
                         events::SharedLogger logger,
                         ToolRegistry registry)
        : m_controller(controller)
        , m_logger(std::move(logger))
        , m_registry(std::move(registry))
    {
        for (ToolSpec const & toolSpec : m_registry.specs())
        {
            if (!hasHandler(toolSpec.id))
            {
                throw std::logic_error(fmt::format("Tool '{}' has no handler", toolSpec.name));
            }
        }
    }

    void MCPServer::runStdioLoop()
    {
        runStdioLoop(std::cin, std::cout);
    }

    void MCPServer::runStdioLoop(std::istream & input, std::ostream & output)
    {
        m_running = true;
        logInfo("MCP server listening on stdio");

        std::string line;
        while (m_running && std::getline(input, line))
        {
            if (isBlank(line))
            {
                continue;
            }

            std::optional<json> response = handleMessage(line);
            if (response)
            {
                sendStdioResponse(output, *response);
            }
            if (!output)
            {
                logError("Output stream failed, stopping");
                break;
            }
        }

        m_running = false;
        logInfo("MCP server stopped");
    }

    void MCPServer::stop()
    {
        m_running = false;
    }

    std::optional<json> MCPServer::handleMessage(std::string const & line)
    {
        StateGuard guard(m_state);

        json request;
        try
        {
            request = json::parse(line);
        }
        catch (json::parse_error const & e)
        {
            logError(fmt::format("Discarding malformed message: {}", e.what()));
            return createErrorResponse(nullptr, ParseError, fmt::format("Parse error: {}", e.what()));
        }

        json response = processJSONRPCRequest(request);
        m_state = ServerState::Responding;
        if (response.is_null())
        {
            return std::nullopt;
        }
        return response;
    }

    json MCPServer::processJSONRPCRequest(json const & request)
    {
        if (!request.is_object() || !request.contains("jsonrpc") || request["jsonrpc"] != "2.0")
        {
            return createErrorResponse(request.is_object() ? requestId(request) : json(nullptr),
                                       InvalidRequest,
                                       "Invalid Request - missing or invalid jsonrpc");
        }

        json const id = requestId(request);
        if (!request.contains("method") || !request["method"].is_string())
        {
            return createErrorResponse(id, InvalidRequest, "Invalid Request - missing method");
        }

        std::string const method = request["method"].get<std::string>();
        try
        {
            if (method.rfind("notifications/", 0) == 0)
            {
                return nullptr;
            }
            if (method == "initialize")
            {
                return handleInitialize(request);
            }
            if (method == "tools/list")
            {
                return handleListTools(request);
            }
            if (method == "tools/call")
            {
                return handleCallTool(request);
            }
            if (method == "ping")
            {
                return {{"jsonrpc", "2.0"}, {"id", id}, {"result", json::object()}};
            }
            return createErrorResponse(id, MethodNotFound, "Method not found: " + method);
        }
        catch (std::exception const & e)
        {
            logError(fmt::format("{} failed: {}", method, e.what()));
            return createErrorResponse(id, InternalError, fmt::format("Internal error: {}", e.what()));
        }
    }

    ToolResult MCPServer::callTool(std::string const & name, json const & arguments)
    {
        std::optional<ToolId> const id = m_registry.resolve(name);
        if (!id)
        {
            logError(fmt::format("Unknown tool {}", name));
            return ToolResult::failure(UnknownToolError(name));
        }

        try
        {
            m_registry.validateArguments(*id, arguments);
        }
        catch (SchemaValidationError const & e)
        {
            logError(e.what());
            return ToolResult::failure(e);
        }

        logInfo(fmt::format("Calling {}", name));
        return dispatch(*id, arguments.is_null() ? json::object() : arguments);
    }

    bool MCPServer::hasHandler(ToolId id)
    {
        switch (id)
        {
        case ToolId::Create:
        case ToolId::Open:
        case ToolId::Save:
        case ToolId::InsertText:
        case ToolId::InsertTable:
        case ToolId::CreateTableWithData:
        case ToolId::InsertParagraph:
        case ToolId::SetFont:
        case ToolId::GetText:
        case ToolId::FillTableWithData:
        case ToolId::Close:
        case ToolId::FillColumnNumbers:
        case ToolId::CreateDocumentFromText:
        case ToolId::CreateCompleteDocument:
        case ToolId::PingPong:
        case ToolId::BatchOperations:
            return true;
        case ToolId::Count:
            return false;
        }
        return false;
    }

    json MCPServer::handleInitialize(json const & request) const
    {
        return {{"jsonrpc", "2.0"},
                {"id", requestId(request)},
                {"result",
                 {{"protocolVersion", ProtocolVersion},
                  {"capabilities", {{"tools", json::object()}}},
                  {"serverInfo", {{"name", ServerName}, {"version", ServerVersion}}}}}};
    }

    json MCPServer::handleListTools(json const & request) const
    {
        return {{"jsonrpc", "2.0"},
                {"id", requestId(request)},
                {"result", {{"tools", m_registry.toolList()}}}};
    }

    json MCPServer::handleCallTool(json const & request)
    {
        json const id = requestId(request);
        if (!request.contains("params") || !request["params"].is_object() ||
            !request["params"].contains("name") || !request["params"]["name"].is_string())
        {
            return createErrorResponse(id, InvalidParams, "Invalid params - missing tool name");
        }

        json const & params = request["params"];
        json const arguments = params.value("arguments", json::object());

        ToolResult const result = callTool(params["name"].get<std::string>(), arguments);

        m_state = ServerState::Responding;
        json content = json::array();
        content.push_back(
          {{"type", "text"},
           {"text", result.toJson().dump(-1, ' ', false, json::error_handler_t::replace)}});
        return {{"jsonrpc", "2.0"},
                {"id", id},
                {"result", {{"content", content}, {"isError", !result.ok()}}}};
    }

    ToolResult MCPServer::dispatch(ToolId id, json const & arguments)
    {
        m_state = ServerState::Executing;

        switch (id)
        {
        case ToolId::Create:
            return m_controller.createDocument();
        case ToolId::Open:
            return m_controller.openDocument(arguments.at("path").get<std::string>());
        case ToolId::Save:
            return m_controller.saveDocument(optionalString(arguments, "path"));
        case ToolId::InsertText:
            return m_controller.insertText(arguments.at("text").get<std::string>(),
                                           optionalArgument(arguments, "position"),
                                           argumentOr(arguments, "preserve_linebreaks", true));
        case ToolId::InsertTable:
            return m_controller.insertTable(arguments.at("rows").get<int>(),
                                            arguments.at("columns").get<int>());
        case ToolId::CreateTableWithData:
            return m_controller.createTableWithData(arguments.at("data"),
                                                    argumentOr(arguments, "has_header", false));
        case ToolId::InsertParagraph:
            return m_controller.insertParagraph(argumentOr(arguments, "count", 1));
        case ToolId::SetFont:
        {
            automation::CharShape shape;
            if (auto name = optionalArgument(arguments, "name"))
            {
                shape.faceName = name->get<std::string>();
            }
            if (auto size = optionalArgument(arguments, "size"))
            {
                shape.sizePt = size->get<int>();
            }
            shape.bold = argumentOr(arguments, "bold", false);
            shape.italic = argumentOr(arguments, "italic", false);
            shape.underline = argumentOr(arguments, "underline", false);
            return m_controller.setFont(shape);
        }
        case ToolId::GetText:
            return m_controller.getText();
        case ToolId::FillTableWithData:
            return m_controller.fillTableWithData(arguments.at("data"),
                                                  argumentOr(arguments, "start_row", 1),
                                                  argumentOr(arguments, "start_col", 1),
                                                  argumentOr(arguments, "has_header", false));
        case ToolId::Close:
            return m_controller.closeSession(argumentOr(arguments, "save", true));
        case ToolId::FillColumnNumbers:
            return m_controller.fillColumnNumbers(argumentOr(arguments, "start", 1),
                                                  argumentOr(arguments, "end", 10),
                                                  argumentOr(arguments, "column", 1),
                                                  argumentOr(arguments, "from_first_cell", true));
        case ToolId::CreateDocumentFromText:
            return m_controller.createDocumentFromText(
              arguments.at("content").get<std::string>(),
              optionalString(arguments, "title"),
              argumentOr(arguments, "format_content", true),
              optionalString(arguments, "save_filename"),
              argumentOr(arguments, "preserve_linebreaks", true));
        case ToolId::CreateCompleteDocument:
            return m_controller.createCompleteDocument(arguments.at("document"));
        case ToolId::PingPong:
            return m_controller.ping(argumentOr<std::string>(arguments, "message", "ping"));
        case ToolId::BatchOperations:
            return executeBatch(arguments.at("operations"));
        case ToolId::Count:
            break;
        }
        return ToolResult::failure(UnknownToolError(fmt::format("#{}", static_cast<int>(id))));
    }

    ToolResult MCPServer::executeBatch(json const & operations)
    {
        // The whole list is checked before anything runs
        for (size_t index = 0; index < operations.size(); ++index)
        {
            json const & entry = operations[index];
            if (!entry.is_object() || !entry.contains("operation") ||
                !entry["operation"].is_string())
            {
                return ToolResult::failure(SchemaValidationError(fmt::format(
                  "Batch entry {} must be an object with a string member 'operation'", index)));
            }
            if (entry.contains("params") && !entry["params"].is_null() &&
                !entry["params"].is_object())
            {
                return ToolResult::failure(SchemaValidationError(
                  fmt::format("params of batch entry {} must be an object", index)));
            }
        }

        json results = json::array();
        size_t failed = 0;
        for (json const & entry : operations)
        {
            std::string const operation = entry["operation"].get<std::string>();
            json const params = entry.value("params", json::object());

            ToolResult result;
            std::optional<ToolId> const id = m_registry.resolveBatchName(operation);
            if (!id)
            {
                result = ToolResult::failure(UnknownToolError(operation));
            }
            else
            {
                try
                {
                    m_registry.validateArguments(*id, params);
                    result = dispatch(*id, params.is_null() ? json::object() : params);
                }
                catch (SchemaValidationError const & e)
                {
                    result = ToolResult::failure(e);
                }
            }

            if (!result.ok())
            {
                ++failed;
            }
            json entryResult = result.toJson();
            entryResult["operation"] = operation;
            results.push_back(std::move(entryResult));
        }

        logInfo(fmt::format(
          "Batch of {} operations finished, {} failed", operations.size(), failed));
        return ToolResult::success({{"results", results},
                                    {"succeeded", operations.size() - failed},
                                    {"failed", failed}});
    }

    json MCPServer::createErrorResponse(json const & id,
                                        int code,
                                        std::string const & message) const
    {
        return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
    }

    void MCPServer::sendStdioResponse(std::ostream & output, json const & response)
    {
        // Invalid UTF-8 coming back from the application must not break the channel
        output << response.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
        output.flush();
    }

    void MCPServer::logInfo(std::string const & message) const
    {
        if (m_logger)
        {
            m_logger->logInfo(message);
        }
    }

    void MCPServer::logError(std::string const & message) const
    {
        if (m_logger)
        {
            m_logger->logError(message);
        }
    }
}
