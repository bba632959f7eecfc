#ifndef HUMIBRIDGE_CORE_CONFIG_HPP
#define HUMIBRIDGE_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace humibridge
{
    namespace core
    {

        /**
         * BLE adapter and connection settings
         */
        struct BLEConfig
        {
            int adapter_index = 0;
            std::string device_name = "Smart Humigadget";
            double scan_timeout_s = 10.0;
            int connect_timeout_ms = 10000;
            int busy_backoff_ms = 250;
            int max_attempts = 5;
            bool auto_connect = true;
            int anchor_max_disconnect_s = 3600;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * On-device data logger download settings
         */
        struct LoggerDownloadConfig
        {
            int page_timeout_ms = 5000;
            int stall_repeats = 5;
            int run_number_offset = 1;
            uint32_t min_interval_ms = 1000;
            uint32_t max_interval_ms = 3600000;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete bridge configuration
         */
        class BridgeConfig
        {
        public:
            BLEConfig ble;
            LoggerDownloadConfig logger;
            LoggingConfig logging;

        public:
            BridgeConfig() = default;

            static std::unique_ptr<BridgeConfig> from_file(const std::string &config_path);
            static std::unique_ptr<BridgeConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<BridgeConfig> create_default();

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Returns an empty string when valid, otherwise the first problem found
            std::string validate() const;
        };

    } // namespace core
} // namespace humibridge

#endif // HUMIBRIDGE_CORE_CONFIG_HPP
