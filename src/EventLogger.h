#pragma once

#include <atomic>
#include <chrono>
#include <coro/coro.hpp>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hwpmcp::events
{
    enum class Severity
    {
        Info,
        Warning,
        Error,
        FatalError
    };

    enum class OutputMode
    {
        Console, ///< Errors are echoed to stderr
        Silent   ///< Nothing is echoed (stdio transport owns the terminal)
    };

    class Event
    {
      public:
        Event(std::string msg, Severity severity = Severity::Warning);

        [[nodiscard]] std::chrono::system_clock::time_point getTimeStamp() const;

        [[nodiscard]] std::string getMessage() const;

        [[nodiscard]] Severity getSeverity() const;

      private:
        std::chrono::system_clock::time_point m_timestamp;
        std::string m_msg;
        Severity m_severity;
    };

    using Events = std::vector<Event>;

    /**
     * @brief Collects events of the bridge and mirrors them into a log file
     *
     * Non-fatal events are batched and written by a single worker of a coro::thread_pool,
     * fatal errors are written synchronously. The request loop never waits on the file.
     */
    class Logger
    {
      public:
        Logger() = default;
        explicit Logger(OutputMode mode)
            : m_outputMode(mode)
        {
        }

        /// Creates the log directory, picks the file name and starts the writer pool
        void initialize();

        ~Logger();

        virtual void addEvent(Event const & event);

        void clear();

        void setOutputMode(OutputMode mode)
        {
            m_outputMode = mode;
        }

        OutputMode getOutputMode() const
        {
            return m_outputMode;
        }

        void logInfo(const std::string & message);
        void logWarning(const std::string & message);
        void logError(const std::string & message);
        void logFatalError(const std::string & message);

        [[nodiscard]] std::filesystem::path getLogFilePath() const;

        /// Overrides the default <temp>/hwpmcp/logs directory; must be called before initialize()
        void setLogDirectory(std::filesystem::path directory);

        void setFileLoggingEnabled(bool enabled);

        [[nodiscard]] bool isFileLoggingEnabled() const
        {
            return m_fileLoggingEnabled;
        }

        /// Writes pending events on the calling thread
        coro::task<void> flushToFile();

        /// Blocks until all pending events are on disk
        void flush();

        [[nodiscard]] Events snapshot() const;

        [[nodiscard]] size_t size() const;

        [[nodiscard]] size_t getErrorCount() const;

        [[nodiscard]] size_t getWarningCount() const;

      private:
        void ensureLogDirectoryExists();

        std::string generateLogFilename() const;

        std::string formatEventForFile(Event const & event) const;

        /// Expects m_initMutex to be held
        void initializeLocked();

        /// Serialized by m_writeMutex, fatal events write from the logging thread
        void appendToFile(std::vector<Event> const & events);

        coro::task<void> writeEventsToFile();

        void scheduleAsyncWrite();

        bool shouldFlushByTime() const;

        Events m_events;
        size_t m_countErrors{};
        size_t m_countWarnings{};
        OutputMode m_outputMode{OutputMode::Console};

        std::atomic<bool> m_fileLoggingEnabled{true};
        std::filesystem::path m_logDirectory;
        std::filesystem::path m_logFilePath;
        std::vector<Event> m_pendingFileEvents;
        std::atomic<bool> m_initialized{false};
        std::shared_ptr<coro::thread_pool> m_fileWritePool;
        std::chrono::steady_clock::time_point m_lastFlushTime{std::chrono::steady_clock::now()};
        static constexpr std::chrono::seconds FLUSH_INTERVAL{1};
        static constexpr size_t FLUSH_BATCH_SIZE{10};

        mutable std::mutex m_eventsMutex;
        mutable std::mutex m_fileMutex;
        std::mutex m_writeMutex;
        std::mutex m_initMutex;
    };

    using SharedLogger = std::shared_ptr<Logger>;
}
