#include "exceptions.h"
#include "mcp/MCPServer.h"
#include "testhelper.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace hwpmcp::tests
{
    using json = nlohmann::json;
    using mcp::MCPServer;
    using mcp::ServerState;
    using mcp::ToolId;
    using ::testing::_;
    using ::testing::Field;
    using ::testing::InSequence;
    using ::testing::Invoke;
    using ::testing::NiceMock;
    using ::testing::Return;

    class MCPServerTest : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            m_logger = std::make_shared<events::Logger>(events::OutputMode::Silent);
            m_logger->setFileLoggingEnabled(false);
            m_server = std::make_unique<MCPServer>(m_controller, m_logger);
        }

        json call(std::string const & name, json arguments)
        {
            return m_server->processJSONRPCRequest(
              helper::toolsCall(++m_nextId, name, std::move(arguments)));
        }

        NiceMock<MockController> m_controller;
        events::SharedLogger m_logger;
        std::unique_ptr<MCPServer> m_server;
        int m_nextId{0};
    };

    TEST_F(MCPServerTest, ToolsList_ListsEveryToolWithSchema)
    {
        // Arrange
        json request = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}};

        // Act
        json response = m_server->processJSONRPCRequest(request);

        // Assert
        ASSERT_TRUE(response.contains("result"));
        auto const & tools = response["result"]["tools"];
        ASSERT_EQ(tools.size(), static_cast<size_t>(ToolId::Count));

        std::set<std::string> names;
        for (auto const & tool : tools)
        {
            names.insert(tool["name"].get<std::string>());
            EXPECT_EQ(tool["inputSchema"]["type"], "object");
            EXPECT_FALSE(tool["description"].get<std::string>().empty());
        }
        EXPECT_EQ(names.count("hwp_create"), 1u);
        EXPECT_EQ(names.count("hwp_batch_operations"), 1u);
        EXPECT_EQ(names.count("hwp_ping_pong"), 1u);
        EXPECT_EQ(names.count("hwp_fill_column_numbers"), 1u);
        EXPECT_EQ(names.count("hwp_create_document_from_text"), 1u);
        EXPECT_EQ(names.count("hwp_create_complete_document"), 1u);
    }

    TEST_F(MCPServerTest, CallTool_Create_WrapsControllerResultAsTextContent)
    {
        // Arrange
        EXPECT_CALL(m_controller, createDocument())
          .WillOnce(Return(ToolResult::success({{"path", nullptr}})));

        // Act
        json response = call("hwp_create", json::object());

        // Assert
        ASSERT_TRUE(response.contains("result"));
        EXPECT_EQ(response["result"]["isError"], false);
        EXPECT_EQ(response["result"]["content"][0]["type"], "text");
        json toolResult = helper::toolResultOf(response);
        EXPECT_EQ(toolResult["status"], "success");
        EXPECT_TRUE(toolResult["result"]["path"].is_null());
        EXPECT_FALSE(toolResult.contains("error"));
    }

    TEST_F(MCPServerTest, CallTool_ControllerFailure_SetsIsErrorAndErrorKind)
    {
        // Arrange
        EXPECT_CALL(m_controller, getText())
          .WillOnce(Return(ToolResult::failure(AutomationError("No active document"))));

        // Act
        json response = call("hwp_get_text", json::object());

        // Assert
        EXPECT_EQ(response["result"]["isError"], true);
        json toolResult = helper::toolResultOf(response);
        EXPECT_EQ(toolResult["status"], "error");
        EXPECT_EQ(toolResult["error"]["kind"], "AutomationError");
        EXPECT_EQ(toolResult["error"]["message"], "No active document");
    }

    TEST_F(MCPServerTest, CallTool_UnknownTool_ReturnsUnknownToolErrorResult)
    {
        // Act
        json response = call("hwp_does_not_exist", json::object());

        // Assert
        ASSERT_TRUE(response.contains("result"));
        json toolResult = helper::toolResultOf(response);
        EXPECT_EQ(toolResult["error"]["kind"], "UnknownToolError");
        EXPECT_EQ(toolResult["error"]["message"], "Tool not found: hwp_does_not_exist");
    }

    TEST_F(MCPServerTest, CallTool_MissingRequiredArgument_RejectedWithoutControllerCall)
    {
        // Arrange
        EXPECT_CALL(m_controller, openDocument(_)).Times(0);

        // Act
        json response = call("hwp_open", json::object());

        // Assert
        json toolResult = helper::toolResultOf(response);
        EXPECT_EQ(toolResult["error"]["kind"], "SchemaValidationError");
        EXPECT_THAT(toolResult["error"]["message"].get<std::string>(),
                    ::testing::HasSubstr("'path'"));
    }

    TEST_F(MCPServerTest, CallTool_WrongArgumentType_RejectedWithoutControllerCall)
    {
        // Arrange
        EXPECT_CALL(m_controller, insertTable(_, _)).Times(0);

        // Act
        json response = call("hwp_insert_table", {{"rows", "3"}, {"columns", 2}});

        // Assert
        EXPECT_EQ(helper::toolResultOf(response)["error"]["kind"], "SchemaValidationError");
    }

    TEST_F(MCPServerTest, CallTool_UndeclaredArgument_RejectedWithoutControllerCall)
    {
        // Arrange
        EXPECT_CALL(m_controller, getText()).Times(0);

        // Act
        json response = call("hwp_get_text", {{"format", "plain"}});

        // Assert
        EXPECT_EQ(helper::toolResultOf(response)["error"]["kind"], "SchemaValidationError");
    }

    TEST_F(MCPServerTest, CallTool_OptionalArgumentsOmitted_UsesDefaults)
    {
        // Arrange
        EXPECT_CALL(m_controller, insertText(std::string{"Hello"}, std::optional<json>{}, true))
          .WillOnce(Return(ToolResult::success()));
        EXPECT_CALL(m_controller, insertParagraph(1)).WillOnce(Return(ToolResult::success()));
        EXPECT_CALL(m_controller, closeSession(true)).WillOnce(Return(ToolResult::success()));
        EXPECT_CALL(m_controller, ping(std::string{"ping"})).WillOnce(Return(ToolResult::success()));
        EXPECT_CALL(m_controller, fillTableWithData(_, 1, 1, false))
          .WillOnce(Return(ToolResult::success()));

        // Act
        call("hwp_insert_text", {{"text", "Hello"}});
        call("hwp_insert_paragraph", json::object());
        call("hwp_close", json::object());
        call("hwp_ping_pong", json::object());
        call("hwp_fill_table_with_data", {{"data", json::array({json::array({"a"})})}});
    }

    TEST_F(MCPServerTest, CallTool_FillColumnNumbersWithoutArguments_UsesDefaults)
    {
        // Arrange
        EXPECT_CALL(m_controller, fillColumnNumbers(1, 10, 1, true))
          .WillOnce(Return(ToolResult::success()));

        // Act
        json response = call("hwp_fill_column_numbers", json::object());

        // Assert
        EXPECT_EQ(response["result"]["isError"], false);
    }

    TEST_F(MCPServerTest, CallTool_CreateDocumentFromText_PassesOptions)
    {
        // Arrange
        EXPECT_CALL(m_controller,
                    createDocumentFromText(std::string{"# Plan"},
                                           std::optional<std::string>{},
                                           false,
                                           std::optional<std::string>{"plan.hwp"},
                                           true))
          .WillOnce(Return(ToolResult::success()));

        // Act
        json response = call("hwp_create_document_from_text",
                             {{"content", "# Plan"},
                              {"format_content", false},
                              {"save_filename", "plan.hwp"}});

        // Assert
        EXPECT_EQ(response["result"]["isError"], false);
    }

    TEST_F(MCPServerTest, CallTool_CreateCompleteDocumentWithoutObject_RejectedBySchema)
    {
        // Arrange
        EXPECT_CALL(m_controller, createCompleteDocument(_)).Times(0);

        // Act
        json response = call("hwp_create_complete_document", {{"document", "report"}});

        // Assert
        EXPECT_EQ(response["result"]["isError"], true);
        EXPECT_EQ(helper::toolResultOf(response)["error"]["kind"], "SchemaValidationError");
    }

    TEST_F(MCPServerTest, BatchOperations_ComposedDocumentThenNumbers_RunsBoth)
    {
        // Arrange
        json const document = {{"elements", json::array({{{"type", "paragraph"}}})}};
        {
            InSequence sequence;
            EXPECT_CALL(m_controller, createCompleteDocument(document))
              .WillOnce(Return(ToolResult::success()));
            EXPECT_CALL(m_controller, fillColumnNumbers(1, 3, 2, false))
              .WillOnce(Return(ToolResult::success()));
        }
        json operations = json::array(
          {{{"operation", "create_complete_document"}, {"params", {{"document", document}}}},
           {{"operation", "fill_column_numbers"},
            {"params", {{"end", 3}, {"column", 2}, {"from_first_cell", false}}}}});

        // Act
        json response = call("hwp_batch_operations", {{"operations", operations}});

        // Assert
        EXPECT_EQ(helper::toolResultOf(response)["result"]["succeeded"], 2);
    }

    TEST_F(MCPServerTest, CallTool_NullOptionalArgument_TreatedAsAbsent)
    {
        // Arrange
        EXPECT_CALL(m_controller, saveDocument(std::optional<std::string>{}))
          .WillOnce(Return(ToolResult::success()));

        // Act
        json response = call("hwp_save", {{"path", nullptr}});

        // Assert
        EXPECT_EQ(response["result"]["isError"], false);
    }

    TEST_F(MCPServerTest, CallTool_SetFont_BuildsCharShape)
    {
        // Arrange
        EXPECT_CALL(m_controller,
                    setFont(::testing::AllOf(
                      Field(&automation::CharShape::faceName, std::optional<std::string>{"Dotum"}),
                      Field(&automation::CharShape::sizePt, std::optional<int>{}),
                      Field(&automation::CharShape::italic, true),
                      Field(&automation::CharShape::bold, false))))
          .WillOnce(Return(ToolResult::success()));

        // Act
        json response = call("hwp_set_font", {{"name", "Dotum"}, {"italic", true}});

        // Assert
        EXPECT_EQ(response["result"]["isError"], false);
    }

    TEST_F(MCPServerTest, CallTool_WhileControllerRuns_StateIsExecuting)
    {
        // Arrange
        ServerState observed = ServerState::Idle;
        EXPECT_CALL(m_controller, getText())
          .WillOnce(Invoke(
            [&]()
            {
                observed = m_server->state();
                return ToolResult::success({{"text", ""}});
            }));

        // Act
        m_server->handleMessage(helper::toolsCall(1, "hwp_get_text", json::object()).dump());

        // Assert
        EXPECT_EQ(observed, ServerState::Executing);
        EXPECT_EQ(m_server->state(), ServerState::Idle);
    }

    TEST_F(MCPServerTest, BatchOperations_RunsEntriesInOrderAndCollectsResults)
    {
        // Arrange
        {
            InSequence sequence;
            EXPECT_CALL(m_controller, createDocument()).WillOnce(Return(ToolResult::success()));
            EXPECT_CALL(m_controller, insertText(std::string{"Title"}, _, true))
              .WillOnce(Return(ToolResult::success({{"characters", 5}})));
            EXPECT_CALL(m_controller, saveDocument(std::optional<std::string>{"out.hwp"}))
              .WillOnce(Return(ToolResult::success({{"path", "out.hwp"}})));
        }
        json operations = json::array({{{"operation", "create"}},
                                       {{"operation", "insert_text"}, {"params", {{"text", "Title"}}}},
                                       {{"operation", "save"}, {"params", {{"path", "out.hwp"}}}}});

        // Act
        json response = call("hwp_batch_operations", {{"operations", operations}});

        // Assert
        json toolResult = helper::toolResultOf(response);
        ASSERT_EQ(toolResult["status"], "success");
        auto const & results = toolResult["result"]["results"];
        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0]["operation"], "create");
        EXPECT_EQ(results[1]["result"]["characters"], 5);
        EXPECT_EQ(results[2]["status"], "success");
        EXPECT_EQ(toolResult["result"]["succeeded"], 3);
        EXPECT_EQ(toolResult["result"]["failed"], 0);
    }

    TEST_F(MCPServerTest, BatchOperations_FailingEntry_ContinuesWithTheRest)
    {
        // Arrange
        EXPECT_CALL(m_controller, openDocument(std::string{"missing.hwp"}))
          .WillOnce(Return(ToolResult::failure(NotFoundError("File not found: missing.hwp"))));
        EXPECT_CALL(m_controller, getText()).WillOnce(Return(ToolResult::success({{"text", ""}})));
        json operations =
          json::array({{{"operation", "open"}, {"params", {{"path", "missing.hwp"}}}},
                       {{"operation", "get_text"}}});

        // Act
        json response = call("hwp_batch_operations", {{"operations", operations}});

        // Assert
        json toolResult = helper::toolResultOf(response);
        auto const & results = toolResult["result"]["results"];
        ASSERT_EQ(results.size(), 2u);
        EXPECT_EQ(results[0]["error"]["kind"], "NotFoundError");
        EXPECT_EQ(results[1]["status"], "success");
        EXPECT_EQ(toolResult["result"]["failed"], 1);
    }

    TEST_F(MCPServerTest, BatchOperations_UnknownOrInvalidEntry_ReportedPerEntry)
    {
        // Arrange
        EXPECT_CALL(m_controller, insertTable(_, _)).Times(0);
        json operations =
          json::array({{{"operation", "explode"}},
                       {{"operation", "insert_table"}, {"params", {{"rows", 2}}}},
                       {{"operation", "ping_pong"}}});

        // Act
        json response = call("hwp_batch_operations", {{"operations", operations}});

        // Assert
        auto const & results = helper::toolResultOf(response)["result"]["results"];
        ASSERT_EQ(results.size(), 3u);
        EXPECT_EQ(results[0]["error"]["kind"], "UnknownToolError");
        EXPECT_EQ(results[1]["error"]["kind"], "SchemaValidationError");
        EXPECT_EQ(results[2]["error"]["kind"], "UnknownToolError");
    }

    TEST_F(MCPServerTest, BatchOperations_MalformedEntry_RejectsWholeBatch)
    {
        // Arrange
        EXPECT_CALL(m_controller, createDocument()).Times(0);
        json operations = json::array({{{"operation", "create"}}, {{"params", json::object()}}});

        // Act
        json response = call("hwp_batch_operations", {{"operations", operations}});

        // Assert
        json toolResult = helper::toolResultOf(response);
        EXPECT_EQ(toolResult["status"], "error");
        EXPECT_EQ(toolResult["error"]["kind"], "SchemaValidationError");
    }

    TEST_F(MCPServerTest, Constructor_InconsistentToolTable_ThrowsLogicError)
    {
        // Arrange
        std::vector<mcp::ToolSpec> specs = mcp::builtinToolSpecs();
        specs.push_back({ToolId::Count, "hwp_extra", "", "Not handled", {}});

        // Act & Assert
        EXPECT_THROW(
          {
              MCPServer server(m_controller, m_logger, mcp::ToolRegistry(specs));
          },
          std::logic_error);
    }

    TEST(MCPServerHandlers, HasHandler_EveryBuiltinTool_ReturnsTrue)
    {
        for (mcp::ToolSpec const & spec : mcp::builtinToolSpecs())
        {
            EXPECT_TRUE(MCPServer::hasHandler(spec.id)) << spec.name;
        }
        EXPECT_FALSE(MCPServer::hasHandler(ToolId::Count));
    }
}
