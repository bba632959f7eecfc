#include "core/config.hpp"
#include <fstream>
#include <stdexcept>

namespace humibridge
{
    namespace core
    {

        void BLEConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("adapter_index"))
                adapter_index = j["adapter_index"];
            if (j.contains("device_name"))
                device_name = j["device_name"];
            if (j.contains("scan_timeout_s"))
                scan_timeout_s = j["scan_timeout_s"];
            if (j.contains("connect_timeout_ms"))
                connect_timeout_ms = j["connect_timeout_ms"];
            if (j.contains("busy_backoff_ms"))
                busy_backoff_ms = j["busy_backoff_ms"];
            if (j.contains("max_attempts"))
                max_attempts = j["max_attempts"];
            if (j.contains("auto_connect"))
                auto_connect = j["auto_connect"];
            if (j.contains("anchor_max_disconnect_s"))
                anchor_max_disconnect_s = j["anchor_max_disconnect_s"];
        }

        nlohmann::json BLEConfig::to_json() const
        {
            return nlohmann::json{
                {"adapter_index", adapter_index},
                {"device_name", device_name},
                {"scan_timeout_s", scan_timeout_s},
                {"connect_timeout_ms", connect_timeout_ms},
                {"busy_backoff_ms", busy_backoff_ms},
                {"max_attempts", max_attempts},
                {"auto_connect", auto_connect},
                {"anchor_max_disconnect_s", anchor_max_disconnect_s}};
        }

        void LoggerDownloadConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("page_timeout_ms"))
                page_timeout_ms = j["page_timeout_ms"];
            if (j.contains("stall_repeats"))
                stall_repeats = j["stall_repeats"];
            if (j.contains("run_number_offset"))
                run_number_offset = j["run_number_offset"];
            if (j.contains("min_interval_ms"))
                min_interval_ms = j["min_interval_ms"];
            if (j.contains("max_interval_ms"))
                max_interval_ms = j["max_interval_ms"];
        }

        nlohmann::json LoggerDownloadConfig::to_json() const
        {
            return nlohmann::json{
                {"page_timeout_ms", page_timeout_ms},
                {"stall_repeats", stall_repeats},
                {"run_number_offset", run_number_offset},
                {"min_interval_ms", min_interval_ms},
                {"max_interval_ms", max_interval_ms}};
        }

        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        std::unique_ptr<BridgeConfig> BridgeConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<BridgeConfig> BridgeConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("configuration must be a JSON object");
            }

            auto config = std::make_unique<BridgeConfig>();

            try
            {
                if (j.contains("ble"))
                    config->ble.from_json(j["ble"]);
                if (j.contains("logger"))
                    config->logger.from_json(j["logger"]);
                if (j.contains("logging"))
                    config->logging.from_json(j["logging"]);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw std::invalid_argument("Wrong value type in configuration: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<BridgeConfig> BridgeConfig::create_default()
        {
            return std::make_unique<BridgeConfig>();
        }

        nlohmann::json BridgeConfig::to_json() const
        {
            return nlohmann::json{
                {"ble", ble.to_json()},
                {"logger", logger.to_json()},
                {"logging", logging.to_json()}};
        }

        void BridgeConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        std::string BridgeConfig::validate() const
        {
            if (ble.adapter_index < 0)
                return "ble.adapter_index must not be negative";
            if (ble.device_name.empty())
                return "ble.device_name cannot be empty";
            if (ble.scan_timeout_s <= 0)
                return "ble.scan_timeout_s must be positive";
            if (ble.connect_timeout_ms <= 0)
                return "ble.connect_timeout_ms must be positive";
            if (ble.busy_backoff_ms < 0)
                return "ble.busy_backoff_ms must not be negative";
            if (ble.max_attempts < 1)
                return "ble.max_attempts must be at least 1";
            if (ble.anchor_max_disconnect_s <= 0)
                return "ble.anchor_max_disconnect_s must be positive";

            if (logger.page_timeout_ms <= 0)
                return "logger.page_timeout_ms must be positive";
            if (logger.stall_repeats < 0)
                return "logger.stall_repeats must not be negative";
            if (logger.run_number_offset < 0)
                return "logger.run_number_offset must not be negative";
            if (logger.min_interval_ms == 0 || logger.min_interval_ms > logger.max_interval_ms)
                return "logger.min_interval_ms must be positive and not above logger.max_interval_ms";

            return "";
        }

    } // namespace core
} // namespace humibridge
