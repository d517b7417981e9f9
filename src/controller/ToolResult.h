#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace hwpmcp
{
    class HwpMcpException;

    enum class ToolStatus
    {
        Success,
        Error
    };

    struct ToolError
    {
        std::string kind;
        std::string message;
    };

    /**
     * @brief Normalized outcome of a tool invocation
     *
     * Serialized as {"status": "success"|"error", "result": ..., "error": {"kind", "message"}}.
     * "error" is only present for failures, "result" is null for them.
     */
    struct ToolResult
    {
        ToolStatus status{ToolStatus::Success};
        nlohmann::json payload;
        std::optional<ToolError> error;

        static ToolResult success(nlohmann::json payload = nlohmann::json::object());
        static ToolResult failure(HwpMcpException const & exception);
        static ToolResult failure(std::string kind, std::string message);

        [[nodiscard]] bool ok() const
        {
            return status == ToolStatus::Success;
        }

        [[nodiscard]] nlohmann::json toJson() const;
    };
}
