#pragma once

#include <filesystem>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace hwpmcp
{
    /**
     * @brief Settings of the bridge, persisted as JSON
     *
     * The default location is <config home>/hwpmcp/settings.json. Missing keys and values of
     * the wrong type fall back to the default passed to getValue().
     */
    class ConfigManager
    {
      public:
        /**
         * @brief Uses the settings file in the user's configuration directory
         */
        ConfigManager();

        /**
         * @brief Uses the given settings file, its parent directory is created if needed
         * @param configFilePath Path of the JSON settings file
         */
        explicit ConfigManager(std::filesystem::path configFilePath);

        /**
         * @brief Saves the configuration, failures are reported on stderr
         */
        ~ConfigManager();

        /**
         * @brief Get a value from the configuration
         * @tparam T Type of the value to retrieve
         * @param section Section name in the configuration
         * @param key Key name within the section
         * @param defaultValue Default value to return if the key doesn't exist
         * @return The value from the configuration or the default value
         */
        template <typename T>
        T getValue(std::string const & section,
                   std::string const & key,
                   T const & defaultValue) const;

        /**
         * @brief Set a value in the configuration
         */
        template <typename T>
        void setValue(std::string const & section, std::string const & key, T const & value);

        /**
         * @brief Save the current configuration to the file
         * @throws FileIOError if the file cannot be written
         */
        void save();

        void reload();

        std::filesystem::path const & getConfigDir() const
        {
            return m_configDir;
        }

        std::filesystem::path const & getConfigFilePath() const
        {
            return m_configFilePath;
        }

      private:
        /// Creates the configuration directory if it doesn't exist
        void init();

        void load();

        std::filesystem::path m_configDir;
        std::filesystem::path m_configFilePath;
        nlohmann::json m_config;
        mutable std::mutex m_mutex;

        ConfigManager(ConfigManager const &) = delete;
        ConfigManager & operator=(ConfigManager const &) = delete;
        ConfigManager(ConfigManager &&) = delete;
        ConfigManager & operator=(ConfigManager &&) = delete;
    };

    template <typename T>
    T ConfigManager::getValue(std::string const & section,
                              std::string const & key,
                              T const & defaultValue) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        auto const sectionIt = m_config.find(section);
        if (sectionIt == m_config.end() || !sectionIt->is_object())
        {
            return defaultValue;
        }

        auto const valueIt = sectionIt->find(key);
        if (valueIt == sectionIt->end())
        {
            return defaultValue;
        }

        try
        {
            return valueIt->template get<T>();
        }
        catch (nlohmann::json::type_error const &)
        {
            // Type mismatch, e.g. a string where a bool is expected
            return defaultValue;
        }
    }

    template <typename T>
    void
    ConfigManager::setValue(std::string const & section, std::string const & key, T const & value)
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config[section][key] = value;
    }
}
