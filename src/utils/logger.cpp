#include "utils/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/common.h>
#include <memory>
#include <iostream>

namespace llink
{

    Logger &Logger::getInstance()
    {
        static Logger instance;
        return instance;
    }

    Logger::~Logger()
    {
        // shutdown() is left to the owner, static destruction order is not reliable here
        if (m_initialized && m_logger)
        {
            m_initialized = false;
            try
            {
                m_logger->flush();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Logger flush failed during destruction: " << e.what() << std::endl;
            }
        }
    }

    bool Logger::initialize(const LogConfig &config)
    {
        try
        {
            if (m_initialized)
            {
                setLevel(config.level);
                return true;
            }

            m_config = config;
            std::vector<spdlog::sink_ptr> sinks;

            if (config.enableConsole)
            {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_pattern(config.pattern);
                sinks.push_back(console_sink);
            }

            if (config.enableFile && !config.fileName.empty())
            {
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.fileName, config.maxFileSize, config.maxFiles);
                file_sink->set_pattern(config.pattern);
                sinks.push_back(file_sink);
            }

            if (sinks.empty())
            {
                // If no output is configured, default to console
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_pattern(config.pattern);
                sinks.push_back(console_sink);
            }

            m_logger = std::make_shared<spdlog::logger>("label_link", sinks.begin(), sinks.end());
            m_logger->set_level(toSpdlogLevel(config.level));
            m_logger->flush_on(spdlog::level::warn);

            m_initialized = true;
            return true;
        }
        catch (const spdlog::spdlog_ex &e)
        {
            std::cerr << "Failed to initialize logger: " << e.what() << std::endl;
            return false;
        }
    }

    void Logger::setLevel(LogLevel level)
    {
        if (m_logger)
        {
            m_config.level = level;
            m_logger->set_level(toSpdlogLevel(level));
        }
    }

    LogLevel Logger::getLevel() const
    {
        return m_config.level;
    }

    void Logger::addCallback(const LogCallback &callback)
    {
        if (callback)
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            m_callbacks.push_back(callback);
        }
    }

    void Logger::clearCallbacks()
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        m_callbacks.clear();
    }

    void Logger::notifyCallbacks(LogLevel level, const std::string &message)
    {
        std::vector<LogCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(m_callbackMutex);
            callbacks = m_callbacks;
        }
        for (const auto &callback : callbacks)
        {
            try
            {
                callback(level, message);
            }
            catch (const std::exception &e)
            {
                std::cerr << "Log callback error: " << e.what() << std::endl;
            }
        }
    }

    void Logger::flush()
    {
        if (m_logger)
        {
            m_logger->flush();
        }
    }

    void Logger::setFlushInterval(int seconds)
    {
        if (seconds <= 0)
        {
            if (m_logger)
            {
                m_logger->flush_on(spdlog::level::trace);
            }
        }
        else
        {
            spdlog::flush_every(std::chrono::seconds(seconds));
        }
    }

    bool Logger::isEnabled(LogLevel level) const
    {
        if (!m_logger)
        {
            return false;
        }
        return m_logger->should_log(toSpdlogLevel(level));
    }

    void Logger::shutdown()
    {
        if (m_initialized)
        {
            try
            {
                flush();
                clearCallbacks();
                m_logger.reset();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Error during logger shutdown: " << e.what() << std::endl;
            }

            m_initialized = false;
        }
    }

    void Logger::safeShutdown()
    {
        try
        {
            Logger &instance = getInstance();
            instance.shutdown();
            spdlog::shutdown();
        }
        catch (const std::exception &e)
        {
            std::cerr << "Error during safe shutdown: " << e.what() << std::endl;
        }
    }

    LogLevel Logger::levelFromInt(int level)
    {
        if (level <= static_cast<int>(LogLevel::TRACE))
        {
            return LogLevel::TRACE;
        }
        if (level >= static_cast<int>(LogLevel::OFF))
        {
            return LogLevel::OFF;
        }
        return static_cast<LogLevel>(level);
    }

    spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) const
    {
        switch (level)
        {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERROR_LEVEL:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
        }
    }

} // namespace llink
