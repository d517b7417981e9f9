#pragma once

#include <stdexcept>
#include <string>

namespace hwpmcp
{
    /// Base of all errors that can be reported back to the client as a tool result
    class HwpMcpException : public std::runtime_error
    {
      public:
        explicit HwpMcpException(std::string msg);

        /// Stable identifier of the error class, e.g. "NotFoundError"
        [[nodiscard]] virtual std::string kind() const = 0;
    };

    /// Referenced file or document does not exist
    class NotFoundError : public HwpMcpException
    {
      public:
        explicit NotFoundError(std::string const & message)
            : HwpMcpException(message)
        {
        }

        [[nodiscard]] std::string kind() const override
        {
            return "NotFoundError";
        }
    };

    /// Caller supplied arguments fail structural validation (bad dimensions, ragged data)
    class InvalidArgumentError : public HwpMcpException
    {
      public:
        explicit InvalidArgumentError(std::string const & message)
            : HwpMcpException(message)
        {
        }

        [[nodiscard]] std::string kind() const override
        {
            return "InvalidArgumentError";
        }
    };

    /// Request does not match the declared tool schema
    class SchemaValidationError : public HwpMcpException
    {
      public:
        explicit SchemaValidationError(std::string const & message)
            : HwpMcpException(message)
        {
        }

        [[nodiscard]] std::string kind() const override
        {
            return "SchemaValidationError";
        }
    };

    class UnknownToolError : public HwpMcpException
    {
      public:
        explicit UnknownToolError(std::string const & toolName);

        [[nodiscard]] std::string kind() const override
        {
            return "UnknownToolError";
        }
    };

    /// The word processor rejected or failed to execute a command
    class AutomationError : public HwpMcpException
    {
      public:
        explicit AutomationError(std::string const & message)
            : HwpMcpException(message)
        {
        }

        /// @param hresult Failing HRESULT of the automation call, rendered in hex
        AutomationError(std::string const & operation, long hresult);

        [[nodiscard]] std::string kind() const override
        {
            return "AutomationError";
        }
    };

    /// @brief The automation server refused the call because a modal dialog is open
    ///
    /// The dialog is left alone; the user has to resolve it before retrying.
    class BlockedByUIError : public AutomationError
    {
      public:
        BlockedByUIError(std::string const & operation, long hresult);

        [[nodiscard]] std::string kind() const override
        {
            return "BlockedByUIError";
        }
    };

    class FileIOError : public HwpMcpException
    {
      public:
        explicit FileIOError(std::string const & message)
            : HwpMcpException("File I/O error: " + message)
        {
        }

        [[nodiscard]] std::string kind() const override
        {
            return "FileIOError";
        }
    };

    /// Raises the exception matching a failed automation HRESULT
    [[noreturn]] void throwAutomationFailure(std::string const & operation, long hresult);

    /// True for the RPC rejection codes COM servers return while a modal dialog is shown
    [[nodiscard]] bool isBlockedByUI(long hresult);
}
