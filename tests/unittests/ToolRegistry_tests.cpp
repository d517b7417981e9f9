#include "exceptions.h"
#include "mcp/ToolRegistry.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace hwpmcp::mcp::tests
{
    using json = nlohmann::json;

    class ToolRegistryTest : public ::testing::Test
    {
      protected:
        ToolRegistry m_registry;
    };

    TEST_F(ToolRegistryTest, Resolve_KnownName_ReturnsToolId)
    {
        EXPECT_EQ(m_registry.resolve("hwp_insert_table"), ToolId::InsertTable);
        EXPECT_EQ(m_registry.resolve("hwp_batch_operations"), ToolId::BatchOperations);
    }

    TEST_F(ToolRegistryTest, Resolve_UnknownName_ReturnsNothing)
    {
        EXPECT_FALSE(m_registry.resolve("hwp_format_disk").has_value());
        EXPECT_FALSE(m_registry.resolve("").has_value());
    }

    TEST_F(ToolRegistryTest, ResolveBatchName_BatchableTool_ReturnsToolId)
    {
        EXPECT_EQ(m_registry.resolveBatchName("create_table_with_data"),
                  ToolId::CreateTableWithData);
        EXPECT_EQ(m_registry.resolveBatchName("close"), ToolId::Close);
        EXPECT_EQ(m_registry.resolveBatchName("create_document_from_text"),
                  ToolId::CreateDocumentFromText);
        EXPECT_EQ(m_registry.resolveBatchName("fill_column_numbers"), ToolId::FillColumnNumbers);
    }

    TEST_F(ToolRegistryTest, ResolveBatchName_NotBatchable_ReturnsNothing)
    {
        EXPECT_FALSE(m_registry.resolveBatchName("batch_operations").has_value());
        EXPECT_FALSE(m_registry.resolveBatchName("ping_pong").has_value());
        EXPECT_FALSE(m_registry.resolveBatchName("").has_value());
    }

    TEST_F(ToolRegistryTest, Spec_EveryId_MatchesItsPosition)
    {
        for (size_t index = 0; index < static_cast<size_t>(ToolId::Count); ++index)
        {
            auto const id = static_cast<ToolId>(index);
            EXPECT_EQ(m_registry.spec(id).id, id);
        }
    }

    TEST_F(ToolRegistryTest, InputSchema_InsertTable_ListsRequiredIntegers)
    {
        // Act
        json schema = m_registry.inputSchema(ToolId::InsertTable);

        // Assert
        EXPECT_EQ(schema["type"], "object");
        EXPECT_EQ(schema["properties"]["rows"]["type"], "integer");
        EXPECT_EQ(schema["properties"]["columns"]["type"], "integer");
        EXPECT_EQ(schema["required"], json::array({"rows", "columns"}));
        EXPECT_EQ(schema["additionalProperties"], false);
    }

    TEST_F(ToolRegistryTest, InputSchema_ToolWithoutParams_HasEmptyProperties)
    {
        // Act
        json schema = m_registry.inputSchema(ToolId::GetText);

        // Assert
        EXPECT_TRUE(schema["properties"].empty());
        EXPECT_TRUE(schema["required"].empty());
    }

    TEST_F(ToolRegistryTest, ValidateArguments_ValidCall_DoesNotThrow)
    {
        EXPECT_NO_THROW(m_registry.validateArguments(
          ToolId::InsertText,
          {{"text", "Hi"}, {"position", {{"list", 0}, {"para", 0}, {"pos", 0}}}}));
        EXPECT_NO_THROW(m_registry.validateArguments(ToolId::Create, nullptr));
        EXPECT_NO_THROW(m_registry.validateArguments(ToolId::Save, {{"path", nullptr}}));
    }

    TEST_F(ToolRegistryTest, ValidateArguments_MissingRequired_Throws)
    {
        EXPECT_THROW(m_registry.validateArguments(ToolId::InsertTable, {{"rows", 2}}),
                     SchemaValidationError);
        EXPECT_THROW(m_registry.validateArguments(ToolId::Open, {{"path", nullptr}}),
                     SchemaValidationError);
    }

    TEST_F(ToolRegistryTest, ValidateArguments_WrongType_ThrowsWithTypeName)
    {
        try
        {
            m_registry.validateArguments(ToolId::InsertParagraph, {{"count", 2.5}});
            FAIL() << "Expected SchemaValidationError";
        }
        catch (SchemaValidationError const & e)
        {
            EXPECT_STREQ(e.what(), "Argument 'count' of hwp_insert_paragraph must be of type integer");
        }
    }

    TEST_F(ToolRegistryTest, ValidateArguments_IntegerOutOfRange_Throws)
    {
        EXPECT_THROW(m_registry.validateArguments(
                       ToolId::InsertTable, {{"rows", 4294967296LL}, {"columns", 1}}),
                     SchemaValidationError);
    }

    TEST_F(ToolRegistryTest, ValidateArguments_UndeclaredArgument_Throws)
    {
        EXPECT_THROW(m_registry.validateArguments(ToolId::Close, {{"force", true}}),
                     SchemaValidationError);
    }

    TEST_F(ToolRegistryTest, ValidateArguments_NotAnObject_Throws)
    {
        EXPECT_THROW(m_registry.validateArguments(ToolId::Create, json::array()),
                     SchemaValidationError);
    }

    TEST(ToolRegistryTable, Constructor_MissingTool_ThrowsLogicError)
    {
        // Arrange
        std::vector<ToolSpec> specs = builtinToolSpecs();
        specs.pop_back();

        // Act & Assert
        EXPECT_THROW(ToolRegistry{specs}, std::logic_error);
    }

    TEST(ToolRegistryTable, Constructor_DuplicateName_ThrowsLogicError)
    {
        // Arrange
        std::vector<ToolSpec> specs = builtinToolSpecs();
        specs[1].name = specs[0].name;

        // Act & Assert
        EXPECT_THROW(ToolRegistry{specs}, std::logic_error);
    }

    TEST(ToolRegistryTable, Constructor_DuplicateParameter_ThrowsLogicError)
    {
        // Arrange
        std::vector<ToolSpec> specs = builtinToolSpecs();
        specs[0].params.push_back({"x", ParamType::String, false, ""});
        specs[0].params.push_back({"x", ParamType::Integer, false, ""});

        // Act & Assert
        EXPECT_THROW(ToolRegistry{specs}, std::logic_error);
    }

    TEST(ToolRegistryTable, Constructor_UnorderedTable_IsIndexedById)
    {
        // Arrange
        std::vector<ToolSpec> specs = builtinToolSpecs();
        std::reverse(specs.begin(), specs.end());

        // Act
        ToolRegistry registry(specs);

        // Assert
        EXPECT_EQ(registry.spec(ToolId::Create).name, "hwp_create");
        EXPECT_EQ(registry.spec(ToolId::BatchOperations).name, "hwp_batch_operations");
    }
}
