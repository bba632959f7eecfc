#include "gadget/gadget_handle.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

namespace humibridge
{
    namespace gadget
    {

        const char *to_string(ConnectionState state)
        {
            switch (state)
            {
            case ConnectionState::Disconnected:
                return "disconnected";
            case ConnectionState::Connecting:
                return "connecting";
            case ConnectionState::Connected:
                return "connected";
            case ConnectionState::Disconnecting:
                return "disconnecting";
            }
            return "unknown";
        }

        const char *to_string(MeasurementKind kind)
        {
            return kind == MeasurementKind::Temperature ? "temperature" : "humidity";
        }

        ble::Characteristic characteristic_for(MeasurementKind kind)
        {
            return kind == MeasurementKind::Temperature ? ble::Characteristic::Temperature
                                                        : ble::Characteristic::Humidity;
        }

        nlohmann::json DeviceInfo::to_json() const
        {
            nlohmann::json j;
            j["manufacturer"] = manufacturer;
            j["model_number"] = model_number;
            j["serial_number"] = serial_number;
            j["firmware_revision"] = firmware_revision;
            j["hardware_revision"] = hardware_revision;
            j["software_revision"] = software_revision;
            j["system_id"] = system_id.has_value() ? nlohmann::json(*system_id) : nlohmann::json(nullptr);
            return j;
        }

        GadgetHandle::GadgetHandle(const std::string &mac_address)
            : mac_address_(mac_address),
              state_(ConnectionState::Disconnected),
              link_lost_(false),
              attempt_counter_(0),
              explicitly_requested_(false),
              notifications_enabled_{false, false},
              subscribed_{false, false},
              logger_(core::get_logger("GadgetHandle"))
        {
        }

        GadgetHandle::~GadgetHandle()
        {
            release_session();
        }

        void GadgetHandle::set_state(ConnectionState state)
        {
            ConnectionState previous = state_.exchange(state);
            if (previous == ConnectionState::Connected && state != ConnectionState::Connected)
            {
                std::lock_guard<std::mutex> lock(metadata_mutex_);
                left_connected_at_ = std::chrono::steady_clock::now();
            }
        }

        void GadgetHandle::attach_session(std::unique_ptr<ble::IGadgetSession> session)
        {
            session_ = std::move(session);
            link_lost_.store(false);
            if (session_)
            {
                auto rssi = session_->rssi();
                if (rssi.has_value())
                    set_last_seen_rssi(rssi);
            }
        }

        void GadgetHandle::release_session()
        {
            if (session_)
            {
                session_->set_on_disconnected(nullptr);
                if (!link_lost_.load())
                {
                    try
                    {
                        session_->disconnect();
                    }
                    catch (const core::ConnectionError &e)
                    {
                        logger_->warning("Disconnect reported an error, dropping session anyway",
                                         core::LogContext{}.add("mac_address", mac_address_).add("error", e.what()));
                    }
                }
                session_.reset();
            }

            for (size_t i = 0; i < 2; ++i)
            {
                notifications_enabled_[i].store(false);
                subscribed_[i].store(false);
            }
            link_lost_.store(false);
            set_state(ConnectionState::Disconnected);
        }

        std::optional<int> GadgetHandle::last_seen_rssi() const
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            return last_seen_rssi_;
        }

        void GadgetHandle::set_last_seen_rssi(std::optional<int> rssi)
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            last_seen_rssi_ = rssi;
        }

        std::optional<int> GadgetHandle::battery_level() const
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            return battery_level_;
        }

        void GadgetHandle::set_battery_level(int level)
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            battery_level_ = level;
        }

        bool GadgetHandle::notifications_enabled(MeasurementKind kind) const
        {
            return notifications_enabled_[index(kind)].load();
        }

        void GadgetHandle::set_notifications_enabled(MeasurementKind kind, bool enabled)
        {
            notifications_enabled_[index(kind)].store(enabled);
        }

        bool GadgetHandle::subscribed(MeasurementKind kind) const
        {
            return subscribed_[index(kind)].load();
        }

        void GadgetHandle::set_subscribed(MeasurementKind kind, bool subscribed)
        {
            subscribed_[index(kind)].store(subscribed);
        }

        DeviceInfo GadgetHandle::device_info() const
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            return device_info_;
        }

        void GadgetHandle::set_device_info(const DeviceInfo &info)
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            device_info_ = info;
        }

        std::optional<std::chrono::milliseconds> GadgetHandle::offline_for() const
        {
            std::lock_guard<std::mutex> lock(metadata_mutex_);
            if (!left_connected_at_.has_value())
                return std::nullopt;
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - *left_connected_at_);
        }

    } // namespace gadget
} // namespace humibridge
