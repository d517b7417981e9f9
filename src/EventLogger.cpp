#include "EventLogger.h"

#include <coro/coro.hpp>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace hwpmcp::events
{
    namespace
    {
        std::tm toLocalTime(std::chrono::system_clock::time_point timePoint)
        {
            auto time_t_val = std::chrono::system_clock::to_time_t(timePoint);

            std::tm tm_result{};
#ifdef _WIN32
            localtime_s(&tm_result, &time_t_val);
#else
            localtime_r(&time_t_val, &tm_result);
#endif
            return tm_result;
        }
    }

    Event::Event(std::string msg, Severity severity)
        : m_timestamp(std::chrono::system_clock::now())
        , m_msg(std::move(msg))
        , m_severity(severity)
    {
    }

    std::chrono::system_clock::time_point Event::getTimeStamp() const
    {
        return m_timestamp;
    }

    std::string Event::getMessage() const
    {
        return m_msg;
    }

    Severity Event::getSeverity() const
    {
        return m_severity;
    }

    void Logger::initialize()
    {
        std::lock_guard<std::mutex> initLock(m_initMutex);
        initializeLocked();
    }

    void Logger::initializeLocked()
    {
        if (m_initialized)
        {
            return;
        }

        if (m_logDirectory.empty())
        {
            m_logDirectory = std::filesystem::temp_directory_path() / "hwpmcp" / "logs";
        }
        ensureLogDirectoryExists();

        m_logFilePath = m_logDirectory / generateLogFilename();

        if (m_fileLoggingEnabled)
        {
            // One writer thread keeps the file appends ordered
            m_fileWritePool = coro::thread_pool::make_shared(coro::thread_pool::options{
              .thread_count = 1,
              .on_thread_start_functor = [](std::size_t) {},
              .on_thread_stop_functor = [](std::size_t) {}});
        }

        m_initialized = true;
    }

    Logger::~Logger()
    {
        // Let the writer finish what it already picked up, then write the rest here
        if (m_fileWritePool)
        {
            m_fileWritePool->shutdown();
        }

        if (!m_fileLoggingEnabled || !m_initialized)
        {
            return;
        }

        std::vector<Event> eventsToWrite;
        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            eventsToWrite.swap(m_pendingFileEvents);
        }

        try
        {
            appendToFile(eventsToWrite);
        }
        catch (std::exception const & e)
        {
            std::cerr << "hwpmcp: could not write log file " << m_logFilePath << ": " << e.what()
                      << "\n";
        }
    }

    void Logger::addEvent(Event const & event)
    {
        {
            std::lock_guard<std::mutex> initLock(m_initMutex);
            if (m_fileLoggingEnabled && !m_initialized)
            {
                initializeLocked();
            }
        }

        {
            std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
            if (event.getSeverity() == Severity::Error ||
                event.getSeverity() == Severity::FatalError)
            {
                m_countErrors++;
            }
            else if (event.getSeverity() == Severity::Warning)
            {
                m_countWarnings++;
            }
            m_events.push_back(event);
        }

        if (m_fileLoggingEnabled && m_initialized)
        {
            if (event.getSeverity() == Severity::FatalError)
            {
                try
                {
                    appendToFile({event});
                    std::lock_guard<std::mutex> fileLock(m_fileMutex);
                    m_lastFlushTime = std::chrono::steady_clock::now();
                }
                catch (std::exception const &)
                {
                    m_fileLoggingEnabled = false;
                }
            }
            else
            {
                bool shouldScheduleWrite = false;
                {
                    std::lock_guard<std::mutex> fileLock(m_fileMutex);
                    m_pendingFileEvents.push_back(event);

                    shouldScheduleWrite = m_pendingFileEvents.size() >= FLUSH_BATCH_SIZE ||
                                          event.getSeverity() == Severity::Error ||
                                          shouldFlushByTime();
                }

                if (shouldScheduleWrite)
                {
                    scheduleAsyncWrite();
                }
            }
        }

        if (m_outputMode == OutputMode::Console)
        {
            if (event.getSeverity() == Severity::Error ||
                event.getSeverity() == Severity::FatalError)
            {
                std::cerr << event.getMessage() << "\n";
            }
        }
    }

    void Logger::logInfo(const std::string & message)
    {
        addEvent(Event(message, Severity::Info));
    }

    void Logger::logWarning(const std::string & message)
    {
        addEvent(Event(message, Severity::Warning));
    }

    void Logger::logError(const std::string & message)
    {
        addEvent(Event(message, Severity::Error));
    }

    void Logger::logFatalError(const std::string & message)
    {
        addEvent(Event(message, Severity::FatalError));
    }

    void Logger::clear()
    {
        flush();

        {
            std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
            m_events.clear();
            m_countErrors = 0;
            m_countWarnings = 0;
        }

        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            m_pendingFileEvents.clear();
        }
    }

    void Logger::flush()
    {
        bool hasEvents = false;
        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            hasEvents = !m_pendingFileEvents.empty();
        }

        if (!m_fileLoggingEnabled || !hasEvents)
        {
            return;
        }

        if (m_fileWritePool)
        {
            coro::sync_wait(writeEventsToFile());
        }
        else
        {
            coro::sync_wait(flushToFile());
        }
    }

    Events Logger::snapshot() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_events;
    }

    size_t Logger::size() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_events.size();
    }

    size_t Logger::getErrorCount() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_countErrors;
    }

    size_t Logger::getWarningCount() const
    {
        std::lock_guard<std::mutex> eventsLock(m_eventsMutex);
        return m_countWarnings;
    }

    std::filesystem::path Logger::getLogFilePath() const
    {
        return m_logFilePath;
    }

    void Logger::setLogDirectory(std::filesystem::path directory)
    {
        m_logDirectory = std::move(directory);
    }

    void Logger::setFileLoggingEnabled(bool enabled)
    {
        std::lock_guard<std::mutex> initLock(m_initMutex);
        m_fileLoggingEnabled = enabled;
        if (enabled && !m_initialized)
        {
            initializeLocked();
        }
    }

    coro::task<void> Logger::flushToFile()
    {
        std::vector<Event> eventsToWrite;
        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            if (m_pendingFileEvents.empty())
            {
                co_return;
            }
            eventsToWrite.swap(m_pendingFileEvents);
        }

        try
        {
            appendToFile(eventsToWrite);
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            m_lastFlushTime = std::chrono::steady_clock::now();
        }
        catch (std::exception const &)
        {
            m_fileLoggingEnabled = false;
        }
    }

    void Logger::ensureLogDirectoryExists()
    {
        std::error_code ec;
        if (!std::filesystem::exists(m_logDirectory, ec))
        {
            std::filesystem::create_directories(m_logDirectory, ec);
        }
        if (ec)
        {
            // Without a directory there is nowhere to write; keep the in-memory events only
            m_fileLoggingEnabled = false;
        }
    }

    std::string Logger::generateLogFilename() const
    {
        std::tm tm_result = toLocalTime(std::chrono::system_clock::now());

        std::ostringstream oss;
        oss << "hwpmcp_" << std::put_time(&tm_result, "%Y%m%d_%H%M%S") << ".log";
        return oss.str();
    }

    std::string Logger::formatEventForFile(Event const & event) const
    {
        std::tm tm_result = toLocalTime(event.getTimeStamp());

        std::ostringstream oss;
        oss << "[" << std::put_time(&tm_result, "%Y-%m-%d %H:%M:%S") << "] ";

        switch (event.getSeverity())
        {
        case Severity::Info:
            oss << "[INFO] ";
            break;
        case Severity::Warning:
            oss << "[WARN] ";
            break;
        case Severity::Error:
            oss << "[ERROR] ";
            break;
        case Severity::FatalError:
            oss << "[FATAL] ";
            break;
        }

        oss << event.getMessage();
        return oss.str();
    }

    void Logger::appendToFile(std::vector<Event> const & events)
    {
        if (events.empty())
        {
            return;
        }

        std::lock_guard<std::mutex> writeLock(m_writeMutex);
        std::ofstream logFile(m_logFilePath, std::ios::app);
        if (!logFile.is_open())
        {
            m_fileLoggingEnabled = false;
            return;
        }

        for (Event const & event : events)
        {
            logFile << formatEventForFile(event) << "\n";
        }
        logFile.flush();
    }

    coro::task<void> Logger::writeEventsToFile()
    {
        std::vector<Event> eventsToWrite;
        {
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            if (m_pendingFileEvents.empty())
            {
                co_return;
            }
            eventsToWrite.swap(m_pendingFileEvents);
        }

        co_await m_fileWritePool->schedule();

        try
        {
            appendToFile(eventsToWrite);
            std::lock_guard<std::mutex> fileLock(m_fileMutex);
            m_lastFlushTime = std::chrono::steady_clock::now();
        }
        catch (std::exception const &)
        {
            m_fileLoggingEnabled = false;
        }
    }

    void Logger::scheduleAsyncWrite()
    {
        if (!m_fileWritePool)
        {
            return;
        }

        if (!m_fileWritePool->spawn(writeEventsToFile()))
        {
            // Pool is shutting down
            coro::sync_wait(flushToFile());
        }
    }

    bool Logger::shouldFlushByTime() const
    {
        auto now = std::chrono::steady_clock::now();
        return (now - m_lastFlushTime) >= FLUSH_INTERVAL;
    }
}
