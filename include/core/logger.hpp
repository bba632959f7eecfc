#ifndef HUMIBRIDGE_CORE_LOGGER_HPP
#define HUMIBRIDGE_CORE_LOGGER_HPP

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <sstream>
#include <map>
#include <optional>

namespace humibridge
{
    namespace core
    {

        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Where console output goes. In stdio RPC mode stdout carries responses,
         * so every console line must go to stderr.
         */
        enum class ConsoleTarget
        {
            SPLIT,
            STDERR_ONLY
        };

        /**
         * Structured key-value pairs appended to a log line
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::stringstream ss;
                ss << value;
                context_[key] = ss.str();
                return *this;
            }

            template <typename T>
            LogContext &add(const std::string &key, const std::optional<T> &value)
            {
                if (value.has_value())
                {
                    return add(key, *value);
                }
                context_[key] = "none";
                return *this;
            }

            LogContext &add(const std::string &key, bool value)
            {
                context_[key] = value ? "true" : "false";
                return *this;
            }

            std::string format() const;
            bool empty() const { return context_.empty(); }

        private:
            std::map<std::string, std::string> context_;
        };

        /**
         * Thread-safe named logger
         */
        class Logger
        {
        public:
            Logger(const std::string &name, LogLevel level = LogLevel::INFO);
            ~Logger();

            void set_level(LogLevel level) { level_ = level; }
            void set_output_file(const std::string &filename);
            void set_console_output(bool enabled) { console_output_ = enabled; }
            void set_console_target(ConsoleTarget target) { console_target_ = target; }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            bool is_enabled(LogLevel level) const { return level >= level_; }

            const std::string &name() const { return name_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);
            std::string format_message(LogLevel level, const std::string &message, const LogContext &context) const;

            std::string name_;
            LogLevel level_;
            bool console_output_;
            ConsoleTarget console_target_;
            std::unique_ptr<std::ofstream> file_output_;
            mutable std::mutex mutex_;
        };

        struct LoggingOptions
        {
            LogLevel level = LogLevel::INFO;
            std::string log_file;
            bool console_output = true;
            ConsoleTarget console_target = ConsoleTarget::SPLIT;
        };

        /**
         * Registry handing out one logger per component name
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(const LoggingOptions &options);

            std::shared_ptr<Logger> get_logger(const std::string &name);

            static LogLevel string_to_level(const std::string &level_str);
            static std::string level_to_string(LogLevel level);

        private:
            LoggerManager() = default;

            void apply(Logger &logger) const;

            LoggingOptions options_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(const LoggingOptions &options);

    } // namespace core
} // namespace humibridge

#endif // HUMIBRIDGE_CORE_LOGGER_HPP
