#ifndef HUMIBRIDGE_GADGET_CLOCK_SYNCHRONIZER_HPP
#define HUMIBRIDGE_GADGET_CLOCK_SYNCHRONIZER_HPP

#include "core/config.hpp"
#include "core/host_system.hpp"
#include "core/logger.hpp"
#include "gadget/connection_manager.hpp"
#include "gadget/gadget_handle.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace humibridge
{
    namespace gadget
    {

        /**
         * Correspondence between a gadget's clock and the absolute frame, taken when the
         * sync time was written. host_ms is the host time at the write, or device_ms
         * itself when the caller supplied the timestamp.
         */
        struct SyncAnchor
        {
            int64_t device_ms = 0;
            int64_t host_ms = 0;

            int64_t to_absolute(int64_t device_timestamp_ms) const { return device_timestamp_ms + (host_ms - device_ms); }
            int64_t to_device(int64_t absolute_timestamp_ms) const { return absolute_timestamp_ms - (host_ms - device_ms); }
        };

        class ClockSynchronizer
        {
        public:
            ClockSynchronizer(ConnectionManager &connections, core::IHostClock &clock, const core::BridgeConfig &config);

            ClockSynchronizer(const ClockSynchronizer &) = delete;
            ClockSynchronizer &operator=(const ClockSynchronizer &) = delete;

            // Host clock as "YYYY-MM-DD HH:MM:SS.ffffff" local time
            std::string rpi_date() const;
            void set_rpi_date(int64_t milliseconds);

            /**
             * Writes the host time, or the given timestamp, into the gadget's sync-time
             * characteristic and records the anchor. Returns the value written.
             */
            int64_t set_sync_time(const std::string &mac_address, std::optional<int64_t> timestamp_ms = std::nullopt);
            int64_t sync_locked(GadgetHandle &handle, std::optional<int64_t> timestamp_ms);

            std::optional<SyncAnchor> anchor(const std::string &mac_address) const;
            void invalidate_anchor(const std::string &mac_address, const std::string &reason);

            // Drops anchors after an adapter reset or a long disconnection
            void on_connection_event(const ConnectionEvent &event);

        private:
            ConnectionManager &connections_;
            core::IHostClock &clock_;
            const core::BridgeConfig &config_;

            mutable std::mutex mutex_;
            std::map<std::string, SyncAnchor> anchors_;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_CLOCK_SYNCHRONIZER_HPP
