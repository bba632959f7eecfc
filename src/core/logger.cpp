#include "core/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>

namespace humibridge
{
    namespace core
    {

        namespace
        {
            std::string current_timestamp()
            {
                auto now = std::chrono::system_clock::now();
                auto time_t = std::chrono::system_clock::to_time_t(now);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              now.time_since_epoch()) %
                          1000;

                std::tm local_tm{};
                localtime_r(&time_t, &local_tm);

                std::stringstream ss;
                ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
                ss << "." << std::setfill('0') << std::setw(3) << ms.count();
                return ss.str();
            }
        } // namespace

        std::string LogContext::format() const
        {
            std::stringstream ss;
            bool first = true;
            for (const auto &[key, value] : context_)
            {
                if (!first)
                {
                    ss << " ";
                }
                ss << key << "=" << value;
                first = false;
            }
            return ss.str();
        }

        Logger::Logger(const std::string &name, LogLevel level)
            : name_(name), level_(level), console_output_(true), console_target_(ConsoleTarget::SPLIT)
        {
        }

        Logger::~Logger()
        {
            if (file_output_)
            {
                file_output_->close();
            }
        }

        void Logger::set_output_file(const std::string &filename)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (file_output_)
            {
                file_output_->close();
                file_output_.reset();
            }

            if (filename.empty())
            {
                return;
            }

            file_output_ = std::make_unique<std::ofstream>(filename, std::ios::app);
            if (!file_output_->is_open())
            {
                std::cerr << "Failed to open log file: " << filename << std::endl;
                file_output_.reset();
            }
        }

        void Logger::debug(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::DEBUG))
                log(LogLevel::DEBUG, message, context);
        }

        void Logger::info(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::INFO))
                log(LogLevel::INFO, message, context);
        }

        void Logger::warning(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::WARNING))
                log(LogLevel::WARNING, message, context);
        }

        void Logger::error(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::ERROR))
                log(LogLevel::ERROR, message, context);
        }

        void Logger::critical(const std::string &message, const LogContext &context)
        {
            if (is_enabled(LogLevel::CRITICAL))
                log(LogLevel::CRITICAL, message, context);
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            std::string line = format_message(level, message, context);

            if (console_output_)
            {
                if (console_target_ == ConsoleTarget::STDERR_ONLY || level >= LogLevel::ERROR)
                {
                    std::cerr << line << std::endl;
                }
                else
                {
                    std::cout << line << std::endl;
                }
            }

            if (file_output_ && file_output_->is_open())
            {
                *file_output_ << line << std::endl;
                file_output_->flush();
            }
        }

        std::string Logger::format_message(LogLevel level, const std::string &message, const LogContext &context) const
        {
            std::stringstream ss;
            ss << current_timestamp() << " ";
            ss << "[" << LoggerManager::level_to_string(level) << "] ";
            ss << name_ << ": " << message;

            if (!context.empty())
            {
                ss << " " << context.format();
            }

            return ss.str();
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager instance;
            return instance;
        }

        void LoggerManager::apply(Logger &logger) const
        {
            logger.set_level(options_.level);
            logger.set_console_output(options_.console_output);
            logger.set_console_target(options_.console_target);
            logger.set_output_file(options_.log_file);
        }

        void LoggerManager::setup_logging(const LoggingOptions &options)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            options_ = options;
            for (auto &[name, logger] : loggers_)
            {
                apply(*logger);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = loggers_.find(name);
            if (it != loggers_.end())
            {
                return it->second;
            }

            auto logger = std::make_shared<Logger>(name, options_.level);
            apply(*logger);

            loggers_[name] = logger;
            return logger;
        }

        LogLevel LoggerManager::string_to_level(const std::string &level_str)
        {
            std::string upper_level = level_str;
            std::transform(upper_level.begin(), upper_level.end(), upper_level.begin(), ::toupper);

            if (upper_level == "DEBUG")
                return LogLevel::DEBUG;
            if (upper_level == "INFO")
                return LogLevel::INFO;
            if (upper_level == "WARNING" || upper_level == "WARN")
                return LogLevel::WARNING;
            if (upper_level == "ERROR")
                return LogLevel::ERROR;
            if (upper_level == "CRITICAL" || upper_level == "CRIT")
                return LogLevel::CRITICAL;

            return LogLevel::INFO;
        }

        std::string LoggerManager::level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "UNKNOWN";
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(const LoggingOptions &options)
        {
            LoggerManager::instance().setup_logging(options);
        }

    } // namespace core
} // namespace humibridge
