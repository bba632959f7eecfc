#ifndef HUMIBRIDGE_GADGET_GADGET_HANDLE_HPP
#define HUMIBRIDGE_GADGET_GADGET_HANDLE_HPP

#include "ble/ble_backend.hpp"

#include <atomic>
#include <cstdint>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace humibridge
{
    namespace core
    {
        class Logger;
    }

    namespace gadget
    {

        enum class ConnectionState
        {
            Disconnected,
            Connecting,
            Connected,
            Disconnecting
        };

        enum class MeasurementKind
        {
            Temperature,
            Humidity
        };

        const char *to_string(ConnectionState state);
        const char *to_string(MeasurementKind kind);
        ble::Characteristic characteristic_for(MeasurementKind kind);

        /**
         * Static identification strings, read once per handle and cached
         */
        struct DeviceInfo
        {
            std::string manufacturer;
            std::string model_number;
            std::string serial_number;
            std::string firmware_revision;
            std::string hardware_revision;
            std::string software_revision;
            std::optional<uint64_t> system_id;

            bool loaded() const { return system_id.has_value(); }
            nlohmann::json to_json() const;
        };

        /**
         * In-process representation of one gadget.
         *
         * Created and destroyed only by ConnectionManager. The operation mutex serialises
         * everything that talks to the device; the session pointer may only be used while
         * it is held. State and cached metadata are safe to read without it.
         */
        class GadgetHandle
        {
        public:
            explicit GadgetHandle(const std::string &mac_address);
            ~GadgetHandle();

            GadgetHandle(const GadgetHandle &) = delete;
            GadgetHandle &operator=(const GadgetHandle &) = delete;

            const std::string &mac_address() const { return mac_address_; }
            std::mutex &operation_mutex() { return operation_mutex_; }

            ConnectionState state() const { return state_.load(); }
            void set_state(ConnectionState state);
            bool is_connected() const { return state_.load() == ConnectionState::Connected && !link_lost_.load(); }

            ble::IGadgetSession *session() const { return session_.get(); }
            bool has_session() const { return session_ != nullptr; }
            void attach_session(std::unique_ptr<ble::IGadgetSession> session);

            /**
             * Drops the BLE session on every exit path. Notification state is cleared and
             * the handle ends Disconnected. Errors from the radio are logged, not raised.
             */
            void release_session();

            void mark_link_lost() { link_lost_.store(true); }
            bool link_lost() const { return link_lost_.load(); }

            std::optional<int> last_seen_rssi() const;
            void set_last_seen_rssi(std::optional<int> rssi);

            std::optional<int> battery_level() const;
            void set_battery_level(int level);

            // Caller-visible state, reported by *_notifications_enabled
            bool notifications_enabled(MeasurementKind kind) const;
            void set_notifications_enabled(MeasurementKind kind, bool enabled);

            // Whether the characteristic is subscribed on the radio (the logger download subscribes too)
            bool subscribed(MeasurementKind kind) const;
            void set_subscribed(MeasurementKind kind, bool subscribed);

            int attempt_counter() const { return attempt_counter_.load(); }
            int increment_attempts() { return ++attempt_counter_; }
            void reset_attempts() { attempt_counter_.store(0); }

            DeviceInfo device_info() const;
            void set_device_info(const DeviceInfo &info);

            bool explicitly_requested() const { return explicitly_requested_.load(); }
            void set_explicitly_requested(bool requested) { explicitly_requested_.store(requested); }

            // How long the handle has been away from Connected; nullopt if it never was connected
            std::optional<std::chrono::milliseconds> offline_for() const;

        private:
            static size_t index(MeasurementKind kind) { return kind == MeasurementKind::Temperature ? 0 : 1; }

            const std::string mac_address_;
            std::mutex operation_mutex_;

            std::atomic<ConnectionState> state_;
            std::atomic<bool> link_lost_;
            std::atomic<int> attempt_counter_;
            std::atomic<bool> explicitly_requested_;
            std::atomic<bool> notifications_enabled_[2];
            std::atomic<bool> subscribed_[2];

            std::unique_ptr<ble::IGadgetSession> session_;

            mutable std::mutex metadata_mutex_;
            std::optional<int> last_seen_rssi_;
            std::optional<int> battery_level_;
            DeviceInfo device_info_;
            std::optional<std::chrono::steady_clock::time_point> left_connected_at_;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_GADGET_HANDLE_HPP
