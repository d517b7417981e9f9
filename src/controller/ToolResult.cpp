#include "ToolResult.h"
#include "../exceptions.h"

namespace hwpmcp
{
    ToolResult ToolResult::success(nlohmann::json payload)
    {
        ToolResult result;
        result.status = ToolStatus::Success;
        result.payload = std::move(payload);
        return result;
    }

    ToolResult ToolResult::failure(HwpMcpException const & exception)
    {
        return failure(exception.kind(), exception.what());
    }

    ToolResult ToolResult::failure(std::string kind, std::string message)
    {
        ToolResult result;
        result.status = ToolStatus::Error;
        result.error = ToolError{std::move(kind), std::move(message)};
        return result;
    }

    nlohmann::json ToolResult::toJson() const
    {
        nlohmann::json json;
        json["status"] = ok() ? "success" : "error";
        json["result"] = ok() ? payload : nlohmann::json(nullptr);
        if (error)
        {
            json["error"] = {{"kind", error->kind}, {"message", error->message}};
        }
        return json;
    }
}
