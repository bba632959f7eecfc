#include "gadget/clock_synchronizer.hpp"
#include "ble/gatt_profile.hpp"
#include "core/time_utils.hpp"

namespace humibridge
{
    namespace gadget
    {

        ClockSynchronizer::ClockSynchronizer(ConnectionManager &connections, core::IHostClock &clock,
                                             const core::BridgeConfig &config)
            : connections_(connections), clock_(clock), config_(config), logger_(core::get_logger("ClockSynchronizer"))
        {
        }

        std::string ClockSynchronizer::rpi_date() const
        {
            return core::format_iso8601(clock_.now_ms(), 6);
        }

        void ClockSynchronizer::set_rpi_date(int64_t milliseconds)
        {
            clock_.set_time_ms(milliseconds);
        }

        int64_t ClockSynchronizer::set_sync_time(const std::string &mac_address, std::optional<int64_t> timestamp_ms)
        {
            return connections_.with_session(mac_address, "set_sync_time", [&](GadgetHandle &handle)
                                             { return sync_locked(handle, timestamp_ms); });
        }

        int64_t ClockSynchronizer::sync_locked(GadgetHandle &handle, std::optional<int64_t> timestamp_ms)
        {
            const int64_t host_ms = clock_.now_ms();
            const int64_t device_ms = timestamp_ms.value_or(host_ms);
            if (device_ms < 0)
            {
                throw core::InvalidArgumentError(handle.mac_address(), "set_sync_time", "timestamp must not be negative");
            }

            handle.session()->write(ble::Characteristic::SyncTime, ble::encode_u64(static_cast<uint64_t>(device_ms)), true);

            {
                std::lock_guard<std::mutex> lock(mutex_);
                // An explicit timestamp defines the frame itself, so the anchor is the identity
                anchors_[handle.mac_address()] = SyncAnchor{device_ms, timestamp_ms.has_value() ? device_ms : host_ms};
            }

            logger_->info("Gadget clock synchronised",
                          core::LogContext{}.add("mac_address", handle.mac_address()).add("device_ms", device_ms).add("host_ms", host_ms));
            return device_ms;
        }

        std::optional<SyncAnchor> ClockSynchronizer::anchor(const std::string &mac_address) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = anchors_.find(mac_address);
            if (it == anchors_.end())
                return std::nullopt;
            return it->second;
        }

        void ClockSynchronizer::invalidate_anchor(const std::string &mac_address, const std::string &reason)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (anchors_.erase(mac_address) > 0)
            {
                logger_->info("Sync anchor dropped", core::LogContext{}.add("mac_address", mac_address).add("reason", reason));
            }
        }

        void ClockSynchronizer::on_connection_event(const ConnectionEvent &event)
        {
            if (event.kind == ConnectionEventKind::AdapterReset)
            {
                invalidate_anchor(event.mac_address, "adapter reset");
                return;
            }

            if (event.kind == ConnectionEventKind::Connected && event.offline_for.has_value() &&
                *event.offline_for > std::chrono::seconds(config_.ble.anchor_max_disconnect_s))
            {
                invalidate_anchor(event.mac_address, "reconnected after a long disconnection");
            }
        }

    } // namespace gadget
} // namespace humibridge
