#ifndef HUMIBRIDGE_GADGET_LOGGED_DATA_FETCHER_HPP
#define HUMIBRIDGE_GADGET_LOGGED_DATA_FETCHER_HPP

#include "core/config.hpp"
#include "core/logger.hpp"
#include "gadget/clock_synchronizer.hpp"
#include "gadget/connection_manager.hpp"
#include "gadget/logged_record.hpp"
#include "gadget/notification_dispatcher.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace humibridge
{
    namespace gadget
    {

        struct FetchRequest
        {
            bool enable_temperature = true;
            bool enable_humidity = true;
            // Re-anchor before reading; sync_timestamp_ms replaces the host time when set
            bool sync = false;
            std::optional<int64_t> sync_timestamp_ms;
            // Absolute when an anchor exists, device time otherwise
            std::optional<int64_t> oldest_ms;
            std::optional<int64_t> newest_ms;
            bool as_datetime = false;
            int num_iterations = 1;
        };

        /**
         * Reads the gadget's on-board logger.
         *
         * The logger is a ring buffer addressed by run number counted back from the newest
         * sample; one page is one start/stop download cycle. Further iterations request
         * only the range that still has holes.
         */
        class LoggedDataFetcher
        {
        public:
            LoggedDataFetcher(ConnectionManager &connections, NotificationDispatcher &dispatcher,
                              ClockSynchronizer &clock, const core::BridgeConfig &config);

            LoggedDataFetcher(const LoggedDataFetcher &) = delete;
            LoggedDataFetcher &operator=(const LoggedDataFetcher &) = delete;

            /**
             * Requires Connected (InvalidStateError). A dropped link, a silent page or
             * cancel_fetch() raise FetchInterruptedError carrying the completed pages.
             */
            LoggedData fetch_logged_data(const std::string &mac_address, const FetchRequest &request);

            // Returns false when no download is running for the gadget
            bool cancel_fetch(const std::string &mac_address);

            uint64_t oldest_timestamp(const std::string &mac_address);
            uint64_t newest_timestamp(const std::string &mac_address);
            void set_oldest_timestamp(const std::string &mac_address, int64_t timestamp_ms);
            void set_newest_timestamp(const std::string &mac_address, int64_t timestamp_ms);

            uint32_t logger_interval(const std::string &mac_address);
            // Clears the gadget's log, so the sync anchor is dropped as well
            void set_logger_interval(const std::string &mac_address, int64_t milliseconds);

        private:
            using Samples = std::map<int64_t, float>;

            struct Page
            {
                int64_t interval = 0;
                int64_t oldest = 0;
                int64_t newest = 0;
                Samples samples[2];
                std::optional<std::string> interruption;
            };

            LoggedData run_fetch(GadgetHandle &handle, const FetchRequest &request);
            Page read_page(GadgetHandle &handle, const std::vector<MeasurementKind> &kinds, int64_t oldest,
                           std::optional<int64_t> newest, bool check_clock, std::optional<SyncAnchor> &anchor);
            void stop_download(GadgetHandle &handle, const std::vector<MeasurementKind> &subscribed_here);
            void write_marker(const std::string &mac_address, const std::string &operation,
                              ble::Characteristic characteristic, int64_t timestamp_ms);

            ConnectionManager &connections_;
            NotificationDispatcher &dispatcher_;
            ClockSynchronizer &clock_;
            const core::BridgeConfig &config_;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_LOGGED_DATA_FETCHER_HPP
