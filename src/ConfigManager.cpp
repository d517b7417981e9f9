#include "ConfigManager.h"
#include "exceptions.h"

#include <fmt/format.h>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sago/platform_folders.h>

namespace hwpmcp
{
    ConfigManager::ConfigManager()
        : ConfigManager(std::filesystem::path{sago::getConfigHome()} / "hwpmcp" / "settings.json")
    {
    }

    ConfigManager::ConfigManager(std::filesystem::path configFilePath)
        : m_configDir(configFilePath.parent_path())
        , m_configFilePath(std::move(configFilePath))
        , m_config(nlohmann::json::object())
    {
        init();
        load();
    }

    ConfigManager::~ConfigManager()
    {
        try
        {
            save();
        }
        catch (std::exception const & e)
        {
            std::cerr << "Failed to save configuration: " << e.what() << std::endl;
        }
    }

    void ConfigManager::init()
    {
        if (m_configDir.empty() || std::filesystem::is_directory(m_configDir))
        {
            return;
        }

        std::error_code ec;
        std::filesystem::create_directories(m_configDir, ec);
        if (ec)
        {
            throw FileIOError(fmt::format("Failed to create configuration directory: {}, error: {}",
                                          m_configDir.string(),
                                          ec.message()));
        }
    }

    void ConfigManager::load()
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!std::filesystem::exists(m_configFilePath))
        {
            m_config = nlohmann::json::object();
            return;
        }

        try
        {
            std::ifstream configFile(m_configFilePath);
            if (!configFile.is_open())
            {
                throw FileIOError(
                  fmt::format("Failed to open configuration file: {}", m_configFilePath.string()));
            }

            configFile >> m_config;
            if (!m_config.is_object())
            {
                std::cerr << "Configuration file " << m_configFilePath
                          << " does not contain an object, using defaults" << std::endl;
                m_config = nlohmann::json::object();
            }
        }
        catch (nlohmann::json::exception const & e)
        {
            std::cerr << "Error loading configuration file: " << e.what() << std::endl;
            m_config = nlohmann::json::object();
        }
        catch (FileIOError const & e)
        {
            std::cerr << e.what() << std::endl;
            m_config = nlohmann::json::object();
        }
    }

    void ConfigManager::save()
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        std::ofstream configFile(m_configFilePath);
        if (!configFile.is_open())
        {
            throw FileIOError(
              fmt::format("Failed to open configuration file for writing: {}", m_configFilePath.string()));
        }

        configFile << std::setw(4) << m_config << std::endl;
        if (!configFile)
        {
            throw FileIOError(fmt::format("Failed to write configuration file: {}", m_configFilePath.string()));
        }
    }

    void ConfigManager::reload()
    {
        load();
    }
}
