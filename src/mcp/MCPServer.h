/**
 * @file MCPServer.h
 * @brief Model Context Protocol server exposing the word processor tools over stdio
 */

#pragma once

#include "../EventLogger.h"
#include "../controller/ToolResult.h"
#include "ToolRegistry.h"

#include <atomic>
#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace hwpmcp
{
    class MCPControllerInterface;
}

namespace hwpmcp::mcp
{
    /// Processing stage of the request currently handled
    enum class ServerState
    {
        Idle,
        Dispatching, ///< Decoding and routing the message
        Executing,   ///< The controller runs a tool
        Responding   ///< Writing the response
    };

    /**
     * @brief MCP server speaking newline-delimited JSON-RPC 2.0 over stdin/stdout
     *
     * Requests are handled strictly one after another on the thread that runs the loop. Tool
     * calls are routed by ToolId to the controller and answered with the normalized
     * ToolResult, wrapped into the MCP content shape.
     */
    class MCPServer
    {
      public:
        /**
         * @brief Constructor
         * @param controller Receives the tool calls, must outlive the server
         * @param logger May be null
         * @param registry Tool table; throws std::logic_error if a tool has no handler
         */
        MCPServer(MCPControllerInterface & controller,
                  events::SharedLogger logger,
                  ToolRegistry registry = ToolRegistry{});

        /**
         * @brief Run the message loop until EOF, a stream error or stop() (blocking)
         */
        void runStdioLoop(std::istream & input, std::ostream & output);

        /// Runs the loop on std::cin and std::cout
        void runStdioLoop();

        /// Ends the loop after the message currently handled; only stores a flag, so a signal
        /// handler may call it
        void stop();

        [[nodiscard]] bool isRunning() const
        {
            return m_running;
        }

        [[nodiscard]] ServerState state() const
        {
            return m_state;
        }

        [[nodiscard]] ToolRegistry const & registry() const
        {
            return m_registry;
        }

        /**
         * @brief Parse and process one line of the transport
         * @return The response, empty for notifications
         */
        std::optional<nlohmann::json> handleMessage(std::string const & line);

        /**
         * @brief Process a decoded JSON-RPC message
         * @return The response, null for notifications
         */
        nlohmann::json processJSONRPCRequest(nlohmann::json const & request);

        /**
         * @brief Resolve, validate and run a tool
         *
         * Unknown names and schema violations are reported as error results.
         */
        ToolResult callTool(std::string const & name, nlohmann::json const & arguments);

        /// True if dispatch() knows how to run the tool
        static bool hasHandler(ToolId id);

      private:
        nlohmann::json handleInitialize(nlohmann::json const & request) const;
        nlohmann::json handleListTools(nlohmann::json const & request) const;
        nlohmann::json handleCallTool(nlohmann::json const & request);

        /// Runs an already validated tool call
        ToolResult dispatch(ToolId id, nlohmann::json const & arguments);

        ToolResult executeBatch(nlohmann::json const & operations);

        nlohmann::json createErrorResponse(nlohmann::json const & id,
                                           int code,
                                           std::string const & message) const;

        void sendStdioResponse(std::ostream & output, nlohmann::json const & response);

        void logInfo(std::string const & message) const;
        void logError(std::string const & message) const;

        MCPControllerInterface & m_controller;
        events::SharedLogger m_logger;
        ToolRegistry m_registry;
        std::atomic<bool> m_running{false};
        ServerState m_state{ServerState::Idle};
    };
}
