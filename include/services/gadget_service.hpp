#ifndef HUMIBRIDGE_SERVICES_GADGET_SERVICE_HPP
#define HUMIBRIDGE_SERVICES_GADGET_SERVICE_HPP

#include "ble/ble_backend.hpp"
#include "core/config.hpp"
#include "core/host_system.hpp"
#include "core/logger.hpp"
#include "gadget/clock_synchronizer.hpp"
#include "gadget/connection_manager.hpp"
#include "gadget/logged_data_fetcher.hpp"
#include "gadget/notification_dispatcher.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace humibridge
{
    namespace services
    {

        /**
         * Everything the gadget reports in one round trip
         */
        struct GadgetInfo
        {
            std::string mac_address;
            std::string device_name;
            gadget::DeviceInfo device;
            int battery = 0;
            float temperature = 0.0f;
            float humidity = 0.0f;
            double dewpoint = 0.0;
            uint32_t logger_interval_ms = 0;
            uint64_t oldest_timestamp_ms = 0;
            uint64_t newest_timestamp_ms = 0;
            std::optional<int> rssi;

            nlohmann::json to_json() const;
        };

        /**
         * Composition point of the gadget engine, one method per call-in operation
         */
        class GadgetService
        {
        public:
            GadgetService(ble::IBLEBackend &backend, core::IHostClock &clock, const core::BridgeConfig &config);
            ~GadgetService();

            GadgetService(const GadgetService &) = delete;
            GadgetService &operator=(const GadgetService &) = delete;

            // Connections
            std::vector<std::string> scan(double timeout_s = 10.0, bool passive = false);
            bool connect_gadget(const std::string &mac_address, bool strict = true);
            gadget::BulkConnectResult connect_gadgets(const std::vector<std::string> &mac_addresses, bool strict = true);
            std::vector<std::string> connected_gadgets() const;
            void disconnect_gadget(const std::string &mac_address);
            void disconnect_gadgets();
            int max_attempts() const;
            void set_max_attempts(int max_attempts);
            void restart_bluetooth();

            // Polled reads
            int battery(const std::string &mac_address);
            GadgetInfo info(const std::string &mac_address);
            std::optional<int> rssi(const std::string &mac_address);
            float temperature(const std::string &mac_address);
            float humidity(const std::string &mac_address);
            std::pair<float, float> temperature_humidity(const std::string &mac_address);
            double dewpoint(const std::string &mac_address, std::optional<double> temperature = std::nullopt,
                            std::optional<double> humidity = std::nullopt);
            std::tuple<float, float, double> temperature_humidity_dewpoint(const std::string &mac_address);

            // Notifications
            void enable_temperature_notifications(const std::string &mac_address);
            void disable_temperature_notifications(const std::string &mac_address);
            bool temperature_notifications_enabled(const std::string &mac_address) const;
            void enable_humidity_notifications(const std::string &mac_address);
            void disable_humidity_notifications(const std::string &mac_address);
            bool humidity_notifications_enabled(const std::string &mac_address) const;

            // Logger
            gadget::LoggedData fetch_logged_data(const std::string &mac_address, const gadget::FetchRequest &request);
            bool cancel_fetch(const std::string &mac_address);
            bool fetch_in_progress(const std::string &mac_address) const;
            uint64_t oldest_timestamp(const std::string &mac_address);
            uint64_t newest_timestamp(const std::string &mac_address);
            void set_oldest_timestamp(const std::string &mac_address, int64_t timestamp_ms);
            void set_newest_timestamp(const std::string &mac_address, int64_t timestamp_ms);
            uint32_t logger_interval(const std::string &mac_address);
            void set_logger_interval(const std::string &mac_address, int64_t milliseconds);

            // Clocks
            std::string rpi_date() const;
            void set_rpi_date(int64_t milliseconds);
            int64_t set_sync_time(const std::string &mac_address, std::optional<int64_t> timestamp_ms = std::nullopt);
            std::optional<gadget::SyncAnchor> sync_anchor(const std::string &mac_address) const;

            void shutdown_service();
            bool is_shut_down() const { return shut_down_.load(); }

            void set_notification_observer(gadget::NotificationObserver observer);
            void set_connection_observer(gadget::ConnectionObserver observer);

        private:
            static float read_measurement(gadget::GadgetHandle &handle, gadget::MeasurementKind kind);
            gadget::DeviceInfo load_device_info(gadget::GadgetHandle &handle);

            const core::BridgeConfig config_;

            gadget::ConnectionManager connections_;
            gadget::NotificationDispatcher notifications_;
            gadget::ClockSynchronizer clock_;
            gadget::LoggedDataFetcher fetcher_;

            std::mutex observer_mutex_;
            gadget::ConnectionObserver connection_observer_;
            std::atomic<bool> shut_down_;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace humibridge

#endif // HUMIBRIDGE_SERVICES_GADGET_SERVICE_HPP
