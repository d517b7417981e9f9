/**
 * @file ToolRegistry.h
 * @brief Static table of the tools the server exposes and their argument schemas
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hwpmcp::mcp
{
    enum class ToolId
    {
        Create,
        Open,
        Save,
        InsertText,
        InsertTable,
        CreateTableWithData,
        InsertParagraph,
        SetFont,
        GetText,
        FillTableWithData,
        Close,
        FillColumnNumbers,
        CreateDocumentFromText,
        CreateCompleteDocument,
        PingPong,
        BatchOperations,
        Count ///< Number of tools, not a tool
    };

    enum class ParamType
    {
        String,
        Integer,
        Boolean,
        Object,
        Array
    };

    /// JSON schema type name, e.g. "integer"
    [[nodiscard]] std::string_view typeName(ParamType type);

    struct ParamSpec
    {
        std::string name;
        ParamType type;
        bool required;
        std::string description;
    };

    struct ToolSpec
    {
        ToolId id;
        std::string name;
        /// Name used inside hwp_batch_operations, empty if the tool cannot be batched
        std::string batchName;
        std::string description;
        std::vector<ParamSpec> params;
    };

    /// The tools of the server
    [[nodiscard]] std::vector<ToolSpec> builtinToolSpecs();

    /**
     * @brief Resolves tool names to ToolId and checks arguments against the declared params
     *
     * The constructor rejects tables that are inconsistent: every ToolId needs exactly one
     * spec and names must be unique. It throws std::logic_error in that case.
     */
    class ToolRegistry
    {
      public:
        ToolRegistry();
        explicit ToolRegistry(std::vector<ToolSpec> specs);

        [[nodiscard]] std::optional<ToolId> resolve(std::string_view name) const;

        [[nodiscard]] std::optional<ToolId> resolveBatchName(std::string_view batchName) const;

        [[nodiscard]] ToolSpec const & spec(ToolId id) const;

        [[nodiscard]] std::vector<ToolSpec> const & specs() const
        {
            return m_specs;
        }

        /**
         * @brief Checks presence and types of the arguments of a call
         * @param arguments Object of arguments, null is treated as an empty object. Null
         * values of optional params count as absent.
         * @throws SchemaValidationError for missing required, mistyped or undeclared arguments
         */
        void validateArguments(ToolId id, nlohmann::json const & arguments) const;

        /// JSON schema of the arguments, as reported by tools/list
        [[nodiscard]] nlohmann::json inputSchema(ToolId id) const;

        /// Payload of tools/list
        [[nodiscard]] nlohmann::json toolList() const;

      private:
        void validateTable() const;

        std::vector<ToolSpec> m_specs; ///< Indexed by ToolId
    };
}
