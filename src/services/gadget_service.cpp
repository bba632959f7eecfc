#include "services/gadget_service.hpp"
#include "ble/gatt_profile.hpp"
#include "core/dewpoint.hpp"

namespace humibridge
{
    namespace services
    {

        nlohmann::json GadgetInfo::to_json() const
        {
            nlohmann::json j = device.to_json();
            j["mac_address"] = mac_address;
            j["device_name"] = device_name;
            j["battery"] = battery;
            j["temperature"] = temperature;
            j["humidity"] = humidity;
            j["dewpoint"] = dewpoint;
            j["logger_interval_ms"] = logger_interval_ms;
            j["oldest_timestamp_ms"] = oldest_timestamp_ms;
            j["newest_timestamp_ms"] = newest_timestamp_ms;
            j["rssi"] = rssi.has_value() ? nlohmann::json(*rssi) : nlohmann::json(nullptr);
            return j;
        }

        GadgetService::GadgetService(ble::IBLEBackend &backend, core::IHostClock &clock, const core::BridgeConfig &config)
            : config_(config),
              connections_(backend, config_),
              notifications_(connections_, clock),
              clock_(connections_, clock, config_),
              fetcher_(connections_, notifications_, clock_, config_),
              shut_down_(false),
              logger_(core::get_logger("GadgetService"))
        {
            connections_.set_connection_observer([this](const gadget::ConnectionEvent &event)
                                                 {
                                                     notifications_.on_connection_event(event);
                                                     clock_.on_connection_event(event);

                                                     gadget::ConnectionObserver observer;
                                                     {
                                                         std::lock_guard<std::mutex> lock(observer_mutex_);
                                                         observer = connection_observer_;
                                                     }
                                                     if (observer)
                                                         observer(event); });
        }

        GadgetService::~GadgetService()
        {
            shutdown_service();
            connections_.set_connection_observer(nullptr);
        }

        std::vector<std::string> GadgetService::scan(double timeout_s, bool passive)
        {
            if (timeout_s <= 0.0)
            {
                throw core::InvalidArgumentError("", "scan", "timeout must be positive");
            }
            return connections_.scan(timeout_s, passive);
        }

        bool GadgetService::connect_gadget(const std::string &mac_address, bool strict)
        {
            return connections_.connect_gadget(mac_address, strict);
        }

        gadget::BulkConnectResult GadgetService::connect_gadgets(const std::vector<std::string> &mac_addresses, bool strict)
        {
            return connections_.connect_gadgets(mac_addresses, strict);
        }

        std::vector<std::string> GadgetService::connected_gadgets() const
        {
            return connections_.connected_gadgets();
        }

        void GadgetService::disconnect_gadget(const std::string &mac_address)
        {
            connections_.disconnect_gadget(mac_address);
        }

        void GadgetService::disconnect_gadgets()
        {
            connections_.disconnect_gadgets();
        }

        int GadgetService::max_attempts() const
        {
            return connections_.max_attempts();
        }

        void GadgetService::set_max_attempts(int max_attempts)
        {
            connections_.set_max_attempts(max_attempts);
        }

        void GadgetService::restart_bluetooth()
        {
            connections_.restart_bluetooth();
        }

        float GadgetService::read_measurement(gadget::GadgetHandle &handle, gadget::MeasurementKind kind)
        {
            return ble::decode_f32(handle.session()->read(gadget::characteristic_for(kind)));
        }

        gadget::DeviceInfo GadgetService::load_device_info(gadget::GadgetHandle &handle)
        {
            auto cached = handle.device_info();
            if (cached.loaded())
                return cached;

            auto *session = handle.session();
            gadget::DeviceInfo info;
            info.manufacturer = ble::decode_string(session->read(ble::Characteristic::ManufacturerName));
            info.model_number = ble::decode_string(session->read(ble::Characteristic::ModelNumber));
            info.serial_number = ble::decode_string(session->read(ble::Characteristic::SerialNumber));
            info.firmware_revision = ble::decode_string(session->read(ble::Characteristic::FirmwareRevision));
            info.hardware_revision = ble::decode_string(session->read(ble::Characteristic::HardwareRevision));
            info.software_revision = ble::decode_string(session->read(ble::Characteristic::SoftwareRevision));
            info.system_id = ble::decode_u64(session->read(ble::Characteristic::SystemId));

            handle.set_device_info(info);
            return info;
        }

        int GadgetService::battery(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "battery", [](gadget::GadgetHandle &handle)
                                             {
                                                 int level = ble::decode_u8(handle.session()->read(ble::Characteristic::BatteryLevel));
                                                 handle.set_battery_level(level);
                                                 return level; });
        }

        GadgetInfo GadgetService::info(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "info", [this](gadget::GadgetHandle &handle)
                                             {
                                                 auto *session = handle.session();

                                                 GadgetInfo info;
                                                 info.mac_address = handle.mac_address();
                                                 info.device_name = config_.ble.device_name;
                                                 info.device = load_device_info(handle);
                                                 info.battery = ble::decode_u8(session->read(ble::Characteristic::BatteryLevel));
                                                 handle.set_battery_level(info.battery);
                                                 info.temperature = read_measurement(handle, gadget::MeasurementKind::Temperature);
                                                 info.humidity = read_measurement(handle, gadget::MeasurementKind::Humidity);
                                                 info.dewpoint = dewpoint(handle.mac_address(), info.temperature, info.humidity);
                                                 info.logger_interval_ms = ble::decode_u32(session->read(ble::Characteristic::LoggerInterval));
                                                 info.oldest_timestamp_ms = ble::decode_u64(session->read(ble::Characteristic::OldestTimestamp));
                                                 info.newest_timestamp_ms = ble::decode_u64(session->read(ble::Characteristic::NewestTimestamp));
                                                 info.rssi = session->rssi();
                                                 if (!info.rssi.has_value())
                                                     info.rssi = handle.last_seen_rssi();
                                                 return info; });
        }

        std::optional<int> GadgetService::rssi(const std::string &mac_address)
        {
            auto handle = connections_.find(gadget::ConnectionManager::normalize_mac(mac_address, "rssi"));
            if (!handle)
                return std::nullopt;

            std::lock_guard<std::mutex> lock(handle->operation_mutex());
            if (handle->is_connected())
            {
                auto live = handle->session()->rssi();
                if (live.has_value())
                {
                    handle->set_last_seen_rssi(live);
                    return live;
                }
            }
            return handle->last_seen_rssi();
        }

        float GadgetService::temperature(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "temperature", [](gadget::GadgetHandle &handle)
                                             { return read_measurement(handle, gadget::MeasurementKind::Temperature); });
        }

        float GadgetService::humidity(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "humidity", [](gadget::GadgetHandle &handle)
                                             { return read_measurement(handle, gadget::MeasurementKind::Humidity); });
        }

        std::pair<float, float> GadgetService::temperature_humidity(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "temperature_humidity", [](gadget::GadgetHandle &handle)
                                             { return std::make_pair(read_measurement(handle, gadget::MeasurementKind::Temperature),
                                                                     read_measurement(handle, gadget::MeasurementKind::Humidity)); });
        }

        double GadgetService::dewpoint(const std::string &mac_address, std::optional<double> temperature,
                                       std::optional<double> humidity)
        {
            double t = 0.0;
            double h = 0.0;
            if (!temperature.has_value() && !humidity.has_value())
            {
                std::tie(t, h) = temperature_humidity(mac_address);
            }
            else
            {
                t = temperature.has_value() ? *temperature : static_cast<double>(this->temperature(mac_address));
                h = humidity.has_value() ? *humidity : static_cast<double>(this->humidity(mac_address));
            }

            try
            {
                return core::dewpoint(t, h);
            }
            catch (const std::invalid_argument &e)
            {
                throw core::InvalidArgumentError(mac_address, "dewpoint", e.what());
            }
        }

        std::tuple<float, float, double> GadgetService::temperature_humidity_dewpoint(const std::string &mac_address)
        {
            auto [t, h] = temperature_humidity(mac_address);
            return std::make_tuple(t, h, dewpoint(mac_address, t, h));
        }

        void GadgetService::enable_temperature_notifications(const std::string &mac_address)
        {
            notifications_.enable_temperature_notifications(mac_address);
        }

        void GadgetService::disable_temperature_notifications(const std::string &mac_address)
        {
            notifications_.disable_temperature_notifications(mac_address);
        }

        bool GadgetService::temperature_notifications_enabled(const std::string &mac_address) const
        {
            return notifications_.temperature_notifications_enabled(mac_address);
        }

        void GadgetService::enable_humidity_notifications(const std::string &mac_address)
        {
            notifications_.enable_humidity_notifications(mac_address);
        }

        void GadgetService::disable_humidity_notifications(const std::string &mac_address)
        {
            notifications_.disable_humidity_notifications(mac_address);
        }

        bool GadgetService::humidity_notifications_enabled(const std::string &mac_address) const
        {
            return notifications_.humidity_notifications_enabled(mac_address);
        }

        gadget::LoggedData GadgetService::fetch_logged_data(const std::string &mac_address, const gadget::FetchRequest &request)
        {
            return fetcher_.fetch_logged_data(mac_address, request);
        }

        bool GadgetService::cancel_fetch(const std::string &mac_address)
        {
            return fetcher_.cancel_fetch(mac_address);
        }

        bool GadgetService::fetch_in_progress(const std::string &mac_address) const
        {
            return notifications_.download_active(gadget::ConnectionManager::normalize_mac(mac_address, "fetch_in_progress"));
        }

        uint64_t GadgetService::oldest_timestamp(const std::string &mac_address)
        {
            return fetcher_.oldest_timestamp(mac_address);
        }

        uint64_t GadgetService::newest_timestamp(const std::string &mac_address)
        {
            return fetcher_.newest_timestamp(mac_address);
        }

        void GadgetService::set_oldest_timestamp(const std::string &mac_address, int64_t timestamp_ms)
        {
            fetcher_.set_oldest_timestamp(mac_address, timestamp_ms);
        }

        void GadgetService::set_newest_timestamp(const std::string &mac_address, int64_t timestamp_ms)
        {
            fetcher_.set_newest_timestamp(mac_address, timestamp_ms);
        }

        uint32_t GadgetService::logger_interval(const std::string &mac_address)
        {
            return fetcher_.logger_interval(mac_address);
        }

        void GadgetService::set_logger_interval(const std::string &mac_address, int64_t milliseconds)
        {
            fetcher_.set_logger_interval(mac_address, milliseconds);
        }

        std::string GadgetService::rpi_date() const
        {
            return clock_.rpi_date();
        }

        void GadgetService::set_rpi_date(int64_t milliseconds)
        {
            clock_.set_rpi_date(milliseconds);
        }

        int64_t GadgetService::set_sync_time(const std::string &mac_address, std::optional<int64_t> timestamp_ms)
        {
            return clock_.set_sync_time(mac_address, timestamp_ms);
        }

        std::optional<gadget::SyncAnchor> GadgetService::sync_anchor(const std::string &mac_address) const
        {
            return clock_.anchor(gadget::ConnectionManager::normalize_mac(mac_address, "sync_anchor"));
        }

        void GadgetService::shutdown_service()
        {
            if (shut_down_.exchange(true))
                return;

            logger_->info("Shutting down the gadget service");
            connections_.shutdown();
        }

        void GadgetService::set_notification_observer(gadget::NotificationObserver observer)
        {
            notifications_.set_observer(std::move(observer));
        }

        void GadgetService::set_connection_observer(gadget::ConnectionObserver observer)
        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            connection_observer_ = std::move(observer);
        }

    } // namespace services
} // namespace humibridge
