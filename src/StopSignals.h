#pragma once

#ifndef _WIN32
#include <signal.h>
#endif

namespace hwpmcp
{
    namespace mcp
    {
        class MCPServer;
    }

    /**
     * @brief Stops a server on SIGINT and SIGTERM, on Windows on console control events
     *
     * A read the message loop is blocked in is interrupted, so the loop returns without
     * waiting for another message or EOF. The previous handlers are restored on
     * destruction. Create it on the thread that runs the loop; only one scope may exist at
     * a time.
     */
    class StopSignalScope
    {
      public:
        /// @throws std::system_error if the handlers cannot be installed
        /// @throws std::logic_error if another scope is active
        explicit StopSignalScope(mcp::MCPServer & server);
        ~StopSignalScope();

        StopSignalScope(StopSignalScope const &) = delete;
        StopSignalScope & operator=(StopSignalScope const &) = delete;

      private:
#ifdef _WIN32
        void * m_loopThread{nullptr};
#else
        struct sigaction m_previousInterrupt{};
        struct sigaction m_previousTerminate{};
#endif
    };
}
