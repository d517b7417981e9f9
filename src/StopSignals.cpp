#include "StopSignals.h"
#include "mcp/MCPServer.h"

#include <atomic>
#include <cerrno>
#include <fmt/format.h>
#include <stdexcept>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#endif

namespace hwpmcp
{
    namespace
    {
        std::atomic<mcp::MCPServer *> stoppedServer{nullptr};

#ifdef _WIN32
        std::atomic<HANDLE> loopThread{nullptr};

        BOOL WINAPI onConsoleControl(DWORD event)
        {
            switch (event)
            {
            case CTRL_C_EVENT:
            case CTRL_BREAK_EVENT:
            case CTRL_CLOSE_EVENT:
                if (auto * server = stoppedServer.load())
                {
                    server->stop();
                    if (HANDLE thread = loopThread.load())
                    {
                        // Fails with ERROR_NOT_FOUND when the loop is not reading
                        CancelSynchronousIo(thread);
                    }
                    return TRUE;
                }
                return FALSE;
            default:
                return FALSE;
            }
        }
#else
        void onStopSignal(int)
        {
            if (auto * server = stoppedServer.load())
            {
                server->stop();
            }
        }

        void installHandler(int signalNumber, struct sigaction & previous)
        {
            struct sigaction action{};
            action.sa_handler = onStopSignal;
            sigemptyset(&action.sa_mask);
            // No SA_RESTART: a read blocked in the loop returns with EINTR
            action.sa_flags = 0;
            if (sigaction(signalNumber, &action, &previous) != 0)
            {
                throw std::system_error(
                  errno,
                  std::generic_category(),
                  fmt::format("Could not install the handler for signal {}", signalNumber));
            }
        }
#endif
    }

    StopSignalScope::StopSignalScope(mcp::MCPServer & server)
    {
        mcp::MCPServer * expected = nullptr;
        if (!stoppedServer.compare_exchange_strong(expected, &server))
        {
            throw std::logic_error("Another stop signal scope is active");
        }

#ifdef _WIN32
        HANDLE thread = nullptr;
        if (!DuplicateHandle(GetCurrentProcess(),
                             GetCurrentThread(),
                             GetCurrentProcess(),
                             &thread,
                             0,
                             FALSE,
                             DUPLICATE_SAME_ACCESS))
        {
            stoppedServer = nullptr;
            throw std::system_error(static_cast<int>(GetLastError()),
                                    std::system_category(),
                                    "Could not duplicate the loop thread handle");
        }
        m_loopThread = thread;
        loopThread = thread;

        if (!SetConsoleCtrlHandler(onConsoleControl, TRUE))
        {
            auto const error = static_cast<int>(GetLastError());
            loopThread = nullptr;
            CloseHandle(thread);
            stoppedServer = nullptr;
            throw std::system_error(
              error, std::system_category(), "Could not install the console control handler");
        }
#else
        try
        {
            installHandler(SIGINT, m_previousInterrupt);
        }
        catch (std::system_error const &)
        {
            stoppedServer = nullptr;
            throw;
        }

        try
        {
            installHandler(SIGTERM, m_previousTerminate);
        }
        catch (std::system_error const &)
        {
            sigaction(SIGINT, &m_previousInterrupt, nullptr);
            stoppedServer = nullptr;
            throw;
        }
#endif
    }

    StopSignalScope::~StopSignalScope()
    {
#ifdef _WIN32
        SetConsoleCtrlHandler(onConsoleControl, FALSE);
        loopThread = nullptr;
        CloseHandle(static_cast<HANDLE>(m_loopThread));
#else
        sigaction(SIGTERM, &m_previousTerminate, nullptr);
        sigaction(SIGINT, &m_previousInterrupt, nullptr);
#endif
        stoppedServer = nullptr;
    }
}
