#include "HwpAutomation.h"
#include "../ConfigManager.h"
#include "../exceptions.h"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

#ifdef _WIN32
#include "ComHwpAutomation.h"
#endif

namespace hwpmcp::automation
{
    std::string formatName(SaveFormat format)
    {
        switch (format)
        {
        case SaveFormat::Hwp:
            return "HWP";
        case SaveFormat::Hwpx:
            return "HWPX";
        case SaveFormat::Text:
            return "TEXT";
        case SaveFormat::Html:
            return "HTML";
        case SaveFormat::Pdf:
            return "PDF";
        }
        return "HWP";
    }

    SaveFormat formatFromExtension(std::filesystem::path const & path)
    {
        std::string extension = path.extension().string();
        std::transform(extension.begin(),
                       extension.end(),
                       extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (extension == ".hwpx")
        {
            return SaveFormat::Hwpx;
        }
        if (extension == ".txt")
        {
            return SaveFormat::Text;
        }
        if (extension == ".html" || extension == ".htm")
        {
            return SaveFormat::Html;
        }
        if (extension == ".pdf")
        {
            return SaveFormat::Pdf;
        }
        return SaveFormat::Hwp;
    }

    AutomationFactory makeDefaultFactory(ConfigManager const & config)
    {
        std::string const progId =
          config.getValue<std::string>("automation", "prog_id", "HWPFrame.HwpObject");

#ifdef _WIN32
        return [progId]() -> std::unique_ptr<HwpAutomation>
        { return std::make_unique<ComHwpAutomation>(progId); };
#else
        return [progId]() -> std::unique_ptr<HwpAutomation>
        {
            throw AutomationError(fmt::format(
              "COM automation of '{}' is only available on Windows; the word processor cannot be "
              "reached",
              progId));
        };
#endif
    }
}
