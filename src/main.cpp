#include "ConfigManager.h"
#include "EventLogger.h"
#include "StopSignals.h"
#include "automation/HwpAutomation.h"
#include "controller/HwpController.h"
#include "exceptions.h"
#include "mcp/MCPServer.h"

#include <iostream>
#include <memory>
#include <string>

namespace
{
    void printUsage()
    {
        std::cerr << "Usage: hwpmcp [options]\n";
        std::cerr << "Serves word processor automation as MCP tools on stdin/stdout.\n";
        std::cerr << "Options:\n";
        std::cerr << "  --hidden              Keep the word processor window hidden\n";
        std::cerr << "  --no-security-module  Do not register the file path security module\n";
        std::cerr << "  --no-file-log         Do not write a log file\n";
        std::cerr << "  --help                Show this help message\n";
    }
}

int main(int argc, char ** argv)
{
    bool hidden = false;
    bool noSecurityModule = false;
    bool noFileLog = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string const arg = argv[i];

        if (arg == "--hidden")
        {
            hidden = true;
        }
        else if (arg == "--no-security-module")
        {
            noSecurityModule = true;
        }
        else if (arg == "--no-file-log")
        {
            noFileLog = true;
        }
        else if (arg == "--help")
        {
            printUsage();
            return 0;
        }
        else
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage();
            return 1;
        }
    }

    // stdout belongs to the protocol, anything printed during setup goes to stderr
    std::streambuf * protocolOut = std::cout.rdbuf();
    std::cout.rdbuf(std::cerr.rdbuf());

    try
    {
        hwpmcp::ConfigManager config;

        auto logger = std::make_shared<hwpmcp::events::Logger>(hwpmcp::events::OutputMode::Silent);
        logger->setFileLoggingEnabled(!noFileLog &&
                                      config.getValue<bool>("logging", "file_logging", true));

        hwpmcp::ControllerSettings settings = hwpmcp::ControllerSettings::fromConfig(config);
        if (hidden)
        {
            settings.visible = false;
        }
        if (noSecurityModule)
        {
            settings.registerSecurityModule = false;
        }

        hwpmcp::HwpController controller(
          hwpmcp::automation::makeDefaultFactory(config), settings, logger);
        hwpmcp::mcp::MCPServer server(controller, logger);

        if (logger->isFileLoggingEnabled())
        {
            std::cerr << "hwpmcp: logging to " << logger->getLogFilePath().string() << std::endl;
        }

        hwpmcp::StopSignalScope stopSignals(server);

        std::cout.rdbuf(protocolOut);
        server.runStdioLoop();

        logger->flush();
    }
    catch (hwpmcp::HwpMcpException const & e)
    {
        std::cout.rdbuf(protocolOut);
        std::cerr << "hwpmcp: " << e.kind() << ": " << e.what() << std::endl;
        return 1;
    }
    catch (std::exception const & e)
    {
        std::cout.rdbuf(protocolOut);
        std::cerr << "hwpmcp: startup failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
