#include "exceptions.h"
#include <cstdint>
#include <fmt/format.h>

namespace hwpmcp
{
    namespace
    {
        // RPC_E_CALL_REJECTED and RPC_E_SERVERCALL_RETRYLATER from winerror.h
        constexpr std::uint32_t CallRejected = 0x80010001u;
        constexpr std::uint32_t ServerCallRetryLater = 0x8001010Au;

        std::string formatHResult(long hresult)
        {
            return fmt::format("0x{:08X}", static_cast<std::uint32_t>(hresult));
        }
    }

    HwpMcpException::HwpMcpException(std::string msg)
        : std::runtime_error(msg)
    {
    }

    UnknownToolError::UnknownToolError(std::string const & toolName)
        : HwpMcpException(fmt::format("Tool not found: {}", toolName))
    {
    }

    AutomationError::AutomationError(std::string const & operation, long hresult)
        : HwpMcpException(
            fmt::format("Automation call '{}' failed (HRESULT {})", operation, formatHResult(hresult)))
    {
    }

    BlockedByUIError::BlockedByUIError(std::string const & operation, long hresult)
        : AutomationError(fmt::format("Automation call '{}' was rejected (HRESULT {}): the word "
                                      "processor is showing a dialog that needs user attention",
                                      operation,
                                      formatHResult(hresult)))
    {
    }

    bool isBlockedByUI(long hresult)
    {
        auto const code = static_cast<std::uint32_t>(hresult);
        return code == CallRejected || code == ServerCallRetryLater;
    }

    void throwAutomationFailure(std::string const & operation, long hresult)
    {
        if (isBlockedByUI(hresult))
        {
            throw BlockedByUIError(operation, hresult);
        }
        throw AutomationError(operation, hresult);
    }
}
