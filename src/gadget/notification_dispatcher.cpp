#include "gadget/notification_dispatcher.hpp"

namespace humibridge
{
    namespace gadget
    {

        NotificationDispatcher::NotificationDispatcher(ConnectionManager &connections, core::IHostClock &clock)
            : connections_(connections), clock_(clock), logger_(core::get_logger("NotificationDispatcher"))
        {
        }

        void NotificationDispatcher::enable_notifications(const std::string &mac_address, MeasurementKind kind)
        {
            const std::string operation = std::string("enable_") + to_string(kind) + "_notifications";
            connections_.with_connected(mac_address, operation, [&](GadgetHandle &handle)
                                        {
                                            if (!handle.subscribed(kind))
                                                subscribe_locked(handle, kind);
                                            handle.set_notifications_enabled(kind, true);
                                            logger_->info("Notifications enabled",
                                                          core::LogContext{}.add("mac_address", handle.mac_address()).add("kind", to_string(kind))); });
        }

        void NotificationDispatcher::disable_notifications(const std::string &mac_address, MeasurementKind kind)
        {
            const std::string operation = std::string("disable_") + to_string(kind) + "_notifications";
            auto handle = connections_.find(ConnectionManager::normalize_mac(mac_address, operation));
            if (!handle)
                return;

            std::lock_guard<std::mutex> lock(handle->operation_mutex());
            handle->set_notifications_enabled(kind, false);
            if (!handle->is_connected() || !handle->subscribed(kind))
                return;

            try
            {
                unsubscribe_locked(*handle, kind);
            }
            catch (const core::ConnectionError &e)
            {
                // the subscription goes away with the session
                handle->mark_link_lost();
                logger_->warning("Unsubscribe failed, link marked lost",
                                 core::LogContext{}.add("mac_address", handle->mac_address()).add("error", e.what()));
            }
        }

        bool NotificationDispatcher::notifications_enabled(const std::string &mac_address, MeasurementKind kind) const
        {
            const std::string operation = std::string(to_string(kind)) + "_notifications_enabled";
            auto handle = connections_.find(ConnectionManager::normalize_mac(mac_address, operation));
            return handle && handle->is_connected() && handle->notifications_enabled(kind);
        }

        void NotificationDispatcher::set_observer(NotificationObserver observer)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            observer_ = std::move(observer);
        }

        void NotificationDispatcher::subscribe_locked(GadgetHandle &handle, MeasurementKind kind)
        {
            const std::string mac = handle.mac_address();
            handle.session()->subscribe(characteristic_for(kind), [this, mac, kind](const ble::ByteArray &data)
                                        { on_payload(mac, kind, data); });
            handle.set_subscribed(kind, true);
        }

        void NotificationDispatcher::unsubscribe_locked(GadgetHandle &handle, MeasurementKind kind)
        {
            handle.set_subscribed(kind, false);
            handle.session()->unsubscribe(characteristic_for(kind));
        }

        void NotificationDispatcher::attach_download(const std::string &mac_address, std::shared_ptr<IDownloadSink> sink)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            downloads_[mac_address] = std::move(sink);
        }

        void NotificationDispatcher::detach_download(const std::string &mac_address)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            downloads_.erase(mac_address);
        }

        bool NotificationDispatcher::download_active(const std::string &mac_address) const
        {
            return sink_for(mac_address) != nullptr;
        }

        bool NotificationDispatcher::interrupt_download(const std::string &mac_address, const std::string &reason)
        {
            auto sink = sink_for(mac_address);
            if (!sink)
                return false;

            logger_->info("Interrupting logger download", core::LogContext{}.add("mac_address", mac_address).add("reason", reason));
            sink->interrupt(reason);
            return true;
        }

        void NotificationDispatcher::on_connection_event(const ConnectionEvent &event)
        {
            if (event.kind == ConnectionEventKind::LinkLost)
                interrupt_download(event.mac_address, "connection lost");
            else if (event.kind == ConnectionEventKind::AdapterReset)
                interrupt_download(event.mac_address, "adapter reset");
        }

        std::shared_ptr<IDownloadSink> NotificationDispatcher::sink_for(const std::string &mac_address) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = downloads_.find(mac_address);
            return it != downloads_.end() ? it->second : nullptr;
        }

        void NotificationDispatcher::on_payload(const std::string &mac_address, MeasurementKind kind, const ble::ByteArray &data)
        {
            if (data.size() == 4)
            {
                float value = ble::decode_f32(data);

                if (auto sink = sink_for(mac_address))
                    sink->on_live_value(kind, value);

                auto handle = connections_.find(mac_address);
                if (!handle || !handle->notifications_enabled(kind))
                    return;

                NotificationObserver observer;
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    observer = observer_;
                }
                if (observer)
                    observer(NotificationEvent{mac_address, kind, value, clock_.now_ms()});
                return;
            }

            // logger chunk: uint32 run number followed by float values
            if (data.size() < 8 || data.size() % 4 != 0)
            {
                logger_->warning("Ignoring malformed notification",
                                 core::LogContext{}.add("mac_address", mac_address).add("kind", to_string(kind)).add("bytes", data.size()));
                return;
            }

            auto sink = sink_for(mac_address);
            if (!sink)
            {
                logger_->debug("Logger chunk without a running download", core::LogContext{}.add("mac_address", mac_address));
                return;
            }

            uint32_t run_number = ble::decode_u32(data);
            std::vector<float> values;
            values.reserve((data.size() - 4) / 4);
            for (size_t offset = 4; offset + 4 <= data.size(); offset += 4)
            {
                values.push_back(ble::decode_f32(data, offset));
            }
            sink->on_chunk(kind, run_number, values);
        }

    } // namespace gadget
} // namespace humibridge
