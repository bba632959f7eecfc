#ifndef HUMIBRIDGE_GADGET_NOTIFICATION_DISPATCHER_HPP
#define HUMIBRIDGE_GADGET_NOTIFICATION_DISPATCHER_HPP

#include "ble/gatt_profile.hpp"
#include "core/host_system.hpp"
#include "core/logger.hpp"
#include "gadget/connection_manager.hpp"
#include "gadget/gadget_handle.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace humibridge
{
    namespace gadget
    {

        struct NotificationEvent
        {
            std::string mac_address;
            MeasurementKind kind;
            float value;
            int64_t host_ms;
        };

        using NotificationObserver = std::function<void(const NotificationEvent &)>;

        /**
         * Receives the pushes of one running logger download
         */
        class IDownloadSink
        {
        public:
            virtual ~IDownloadSink() = default;

            virtual void on_chunk(MeasurementKind kind, uint32_t run_number, const std::vector<float> &values) = 0;
            virtual void on_live_value(MeasurementKind kind, float value) = 0;
            virtual void interrupt(const std::string &reason) = 0;
        };

        /**
         * Turns push notifications on and off and routes what arrives.
         *
         * Pushes are handled on the BLE stack's thread without taking any handle lock:
         * live values go to the observer in arrival order, logger chunks go to the
         * download sink attached for that gadget.
         */
        class NotificationDispatcher
        {
        public:
            NotificationDispatcher(ConnectionManager &connections, core::IHostClock &clock);

            NotificationDispatcher(const NotificationDispatcher &) = delete;
            NotificationDispatcher &operator=(const NotificationDispatcher &) = delete;

            // Requires Connected, otherwise InvalidStateError
            void enable_notifications(const std::string &mac_address, MeasurementKind kind);
            // Idempotent, also on a disconnected or unknown gadget
            void disable_notifications(const std::string &mac_address, MeasurementKind kind);
            bool notifications_enabled(const std::string &mac_address, MeasurementKind kind) const;

            void enable_temperature_notifications(const std::string &mac_address) { enable_notifications(mac_address, MeasurementKind::Temperature); }
            void disable_temperature_notifications(const std::string &mac_address) { disable_notifications(mac_address, MeasurementKind::Temperature); }
            bool temperature_notifications_enabled(const std::string &mac_address) const { return notifications_enabled(mac_address, MeasurementKind::Temperature); }
            void enable_humidity_notifications(const std::string &mac_address) { enable_notifications(mac_address, MeasurementKind::Humidity); }
            void disable_humidity_notifications(const std::string &mac_address) { disable_notifications(mac_address, MeasurementKind::Humidity); }
            bool humidity_notifications_enabled(const std::string &mac_address) const { return notifications_enabled(mac_address, MeasurementKind::Humidity); }

            void set_observer(NotificationObserver observer);

            // Radio subscription, the caller holds the handle lock
            void subscribe_locked(GadgetHandle &handle, MeasurementKind kind);
            void unsubscribe_locked(GadgetHandle &handle, MeasurementKind kind);

            void attach_download(const std::string &mac_address, std::shared_ptr<IDownloadSink> sink);
            void detach_download(const std::string &mac_address);
            bool download_active(const std::string &mac_address) const;
            bool interrupt_download(const std::string &mac_address, const std::string &reason);

            // Link loss and adapter resets interrupt a running download
            void on_connection_event(const ConnectionEvent &event);

        private:
            void on_payload(const std::string &mac_address, MeasurementKind kind, const ble::ByteArray &data);
            std::shared_ptr<IDownloadSink> sink_for(const std::string &mac_address) const;

            ConnectionManager &connections_;
            core::IHostClock &clock_;

            mutable std::mutex mutex_;
            std::map<std::string, std::shared_ptr<IDownloadSink>> downloads_;
            NotificationObserver observer_;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_NOTIFICATION_DISPATCHER_HPP
