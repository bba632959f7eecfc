#include "gadget/logged_data_fetcher.hpp"
#include "ble/gatt_profile.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace humibridge
{
    namespace gadget
    {
        namespace
        {
            constexpr const char *FETCH = "fetch_logged_data";
            constexpr const char *CANCELLED = "cancelled";
            constexpr const char *PAGE_TIMEOUT = "page timeout";

            size_t slot(MeasurementKind kind)
            {
                return kind == MeasurementKind::Temperature ? 0 : 1;
            }

            /**
             * Collects one page. Finished per kind once the deepest run number reaches the
             * oldest marker, or when the run number has not moved for more than
             * stall_repeats live values.
             */
            class PageCollector : public IDownloadSink
            {
            public:
                PageCollector(const std::vector<MeasurementKind> &kinds, int64_t interval, int64_t oldest,
                              int64_t newest, int run_number_offset, int stall_repeats)
                    : interval_(interval),
                      oldest_(oldest),
                      newest_(newest),
                      run_number_offset_(run_number_offset),
                      stall_repeats_(stall_repeats),
                      last_activity_(std::chrono::steady_clock::now())
                {
                    for (auto kind : kinds)
                    {
                        progress_[slot(kind)].tracked = true;
                    }
                }

                void on_chunk(MeasurementKind kind, uint32_t run_number, const std::vector<float> &values) override
                {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        auto &p = progress_[slot(kind)];
                        last_activity_ = std::chrono::steady_clock::now();
                        if (!p.tracked || p.finished)
                            return;

                        int64_t index = static_cast<int64_t>(run_number) - run_number_offset_;
                        for (float value : values)
                        {
                            if (index >= 0)
                            {
                                p.samples.emplace(newest_ - index * interval_, value);
                                p.deepest = std::max(p.deepest, index);
                            }
                            ++index;
                        }
                        check_coverage(p);
                    }
                    cv_.notify_all();
                }

                void on_live_value(MeasurementKind kind, float) override
                {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        auto &p = progress_[slot(kind)];
                        last_activity_ = std::chrono::steady_clock::now();
                        if (!p.tracked || p.finished)
                            return;

                        check_coverage(p);
                        if (p.previous == p.deepest)
                            ++p.repeats;
                        else
                            p.repeats = 0;
                        p.previous = p.deepest;

                        if (p.repeats > stall_repeats_)
                            p.finished = true;
                    }
                    cv_.notify_all();
                }

                void interrupt(const std::string &reason) override
                {
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        if (!interruption_.has_value())
                            interruption_ = reason;
                    }
                    cv_.notify_all();
                }

                // Returns the interruption reason, nullopt when the page completed
                std::optional<std::string> wait(std::chrono::milliseconds page_timeout)
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    while (true)
                    {
                        if (interruption_.has_value())
                            return interruption_;
                        if (all_finished())
                            return std::nullopt;

                        auto deadline = last_activity_ + page_timeout;
                        if (cv_.wait_until(lock, deadline) == std::cv_status::timeout &&
                            std::chrono::steady_clock::now() >= last_activity_ + page_timeout &&
                            !interruption_.has_value() && !all_finished())
                        {
                            interruption_ = PAGE_TIMEOUT;
                        }
                    }
                }

                std::map<int64_t, float> samples(MeasurementKind kind) const
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    return progress_[slot(kind)].samples;
                }

            private:
                struct Progress
                {
                    bool tracked = false;
                    bool finished = false;
                    std::map<int64_t, float> samples;
                    int64_t deepest = -1;
                    int64_t previous = -2;
                    int repeats = 0;
                };

                void check_coverage(Progress &p)
                {
                    if (p.deepest >= 0 && newest_ - (p.deepest + 1) * interval_ <= oldest_)
                        p.finished = true;
                }

                bool all_finished() const
                {
                    for (const auto &p : progress_)
                    {
                        if (p.tracked && !p.finished)
                            return false;
                    }
                    return true;
                }

                const int64_t interval_;
                const int64_t oldest_;
                const int64_t newest_;
                const int run_number_offset_;
                const int stall_repeats_;

                mutable std::mutex mutex_;
                std::condition_variable cv_;
                Progress progress_[2];
                std::optional<std::string> interruption_;
                std::chrono::steady_clock::time_point last_activity_;
            };

            struct DownloadRegistration
            {
                DownloadRegistration(NotificationDispatcher &dispatcher, const std::string &mac_address,
                                     std::shared_ptr<IDownloadSink> sink)
                    : dispatcher_(dispatcher), mac_address_(mac_address)
                {
                    dispatcher_.attach_download(mac_address_, std::move(sink));
                }

                ~DownloadRegistration()
                {
                    dispatcher_.detach_download(mac_address_);
                }

                NotificationDispatcher &dispatcher_;
                std::string mac_address_;
            };

            // Grid points between the oldest and newest sample that never arrived
            std::vector<int64_t> find_gaps(const std::map<int64_t, float> &samples, int64_t interval)
            {
                std::vector<int64_t> gaps;
                if (samples.empty())
                    return gaps;

                const int64_t lowest = samples.begin()->first;
                for (int64_t ts = samples.rbegin()->first; ts >= lowest; ts -= interval)
                {
                    if (samples.find(ts) == samples.end())
                        gaps.push_back(ts);
                }
                return gaps;
            }
        } // namespace

        LoggedDataFetcher::LoggedDataFetcher(ConnectionManager &connections, NotificationDispatcher &dispatcher,
                                             ClockSynchronizer &clock, const core::BridgeConfig &config)
            : connections_(connections),
              dispatcher_(dispatcher),
              clock_(clock),
              config_(config),
              logger_(core::get_logger("LoggedDataFetcher"))
        {
        }

        LoggedData LoggedDataFetcher::fetch_logged_data(const std::string &mac_address, const FetchRequest &request)
        {
            auto mac = ConnectionManager::normalize_mac(mac_address, FETCH);
            if (request.num_iterations < 1)
            {
                throw core::InvalidArgumentError(mac, FETCH, "num_iterations must be at least 1");
            }

            return connections_.with_connected(mac, FETCH, [&](GadgetHandle &handle)
                                               {
                                                   if (!request.enable_temperature && !request.enable_humidity)
                                                       return LoggedData{};
                                                   return run_fetch(handle, request); });
        }

        LoggedData LoggedDataFetcher::run_fetch(GadgetHandle &handle, const FetchRequest &request)
        {
            const std::string mac = handle.mac_address();

            std::vector<MeasurementKind> kinds;
            if (request.enable_temperature)
                kinds.push_back(MeasurementKind::Temperature);
            if (request.enable_humidity)
                kinds.push_back(MeasurementKind::Humidity);

            Samples accumulated[2];
            int64_t grid_newest = 0;
            int64_t interval = 0;
            int64_t last_index = -1;
            std::optional<SyncAnchor> anchor;
            std::vector<MeasurementKind> subscribed_here;

            // Completed fetches keep a slot for every grid point, with no value where the
            // sample never arrived. Partial results only carry what was downloaded.
            auto build = [&](bool mark_missing)
            {
                LoggedData data;
                data.last_index = last_index;
                for (auto kind : {MeasurementKind::Temperature, MeasurementKind::Humidity})
                {
                    std::map<int64_t, std::optional<float>> slots(accumulated[slot(kind)].begin(),
                                                                 accumulated[slot(kind)].end());
                    if (mark_missing && interval > 0)
                    {
                        for (int64_t ts : find_gaps(accumulated[slot(kind)], interval))
                            slots.emplace(ts, std::nullopt);
                    }

                    auto &out = kind == MeasurementKind::Temperature ? data.temperatures : data.humidities;
                    out.reserve(slots.size());
                    for (const auto &[ts, value] : slots)
                    {
                        LoggedRecord record;
                        record.timestamp_ms = anchor ? anchor->to_absolute(ts) : ts;
                        record.absolute = anchor.has_value();
                        if (kind == MeasurementKind::Temperature)
                            record.temperature = value;
                        else
                            record.humidity = value;
                        out.push_back(record);
                    }
                }
                return data;
            };

            try
            {
                if (request.sync)
                    clock_.sync_locked(handle, request.sync_timestamp_ms);
                anchor = clock_.anchor(mac);

                auto to_device = [&](int64_t ts)
                { return anchor ? anchor->to_device(ts) : ts; };

                int64_t oldest = request.oldest_ms ? std::max<int64_t>(0, to_device(*request.oldest_ms)) : 0;
                std::optional<int64_t> newest;
                if (request.newest_ms)
                    newest = std::max<int64_t>(0, to_device(*request.newest_ms));

                for (auto kind : kinds)
                {
                    if (!handle.subscribed(kind))
                    {
                        dispatcher_.subscribe_locked(handle, kind);
                        subscribed_here.push_back(kind);
                    }
                }

                std::vector<MeasurementKind> pending = kinds;
                for (int iteration = 1; iteration <= request.num_iterations && !pending.empty(); ++iteration)
                {
                    auto started = std::chrono::steady_clock::now();
                    Page page = read_page(handle, pending, oldest, newest, iteration == 1 && !request.newest_ms, anchor);

                    if (page.interruption.has_value())
                    {
                        logger_->warning("Logger download interrupted, discarding the current page",
                                         core::LogContext{}.add("mac_address", mac).add("iteration", iteration).add("reason", *page.interruption));
                        if (*page.interruption == CANCELLED)
                            stop_download(handle, subscribed_here);
                        else
                            handle.mark_link_lost();
                        throw FetchInterruptedError(mac, FETCH, *page.interruption, build(false));
                    }

                    if (iteration == 1)
                    {
                        grid_newest = page.newest;
                        interval = page.interval;
                    }
                    else if (page.interval != interval)
                    {
                        stop_download(handle, subscribed_here);
                        throw FetchInterruptedError(mac, FETCH, "logger interval changed during the fetch", build(false));
                    }

                    std::vector<MeasurementKind> still_missing;
                    int64_t first_gap = 0;
                    int64_t last_gap = 0;
                    for (auto kind : pending)
                    {
                        auto &acc = accumulated[slot(kind)];
                        size_t before = acc.size();
                        for (const auto &[ts, value] : page.samples[slot(kind)])
                        {
                            acc.emplace(ts, value);
                        }

                        auto gaps = find_gaps(acc, interval);
                        logger_->debug("Logger page read",
                                       core::LogContext{}
                                           .add("mac_address", mac)
                                           .add("iteration", iteration)
                                           .add("num_iterations", request.num_iterations)
                                           .add("kind", to_string(kind))
                                           .add("new_values", acc.size() - before)
                                           .add("missing", gaps.size())
                                           .add("elapsed_ms", std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started).count()));

                        if (!acc.empty())
                            last_index = std::max(last_index, (grid_newest - acc.begin()->first) / interval);

                        if (!gaps.empty())
                        {
                            // gaps are listed newest first
                            first_gap = still_missing.empty() ? gaps.back() : std::min(first_gap, gaps.back());
                            last_gap = still_missing.empty() ? gaps.front() : std::max(last_gap, gaps.front());
                            still_missing.push_back(kind);
                        }
                    }

                    pending = still_missing;
                    oldest = std::max<int64_t>(0, first_gap - 2 * interval);
                    newest = std::min(grid_newest, last_gap + 2 * interval);
                }

                stop_download(handle, subscribed_here);
            }
            catch (const core::ConnectionError &e)
            {
                handle.mark_link_lost();
                throw FetchInterruptedError(mac, FETCH, std::string("connection lost: ") + e.what(), build(false));
            }
            catch (const core::InvalidStateError &)
            {
                stop_download(handle, subscribed_here);
                throw;
            }

            LoggedData data = build(true);
            logger_->info("Logged data fetched",
                          core::LogContext{}.add("mac_address", mac).add("temperatures", data.temperatures.size()).add("humidities", data.humidities.size()).add("absolute", anchor.has_value()));
            return data;
        }

        LoggedDataFetcher::Page LoggedDataFetcher::read_page(GadgetHandle &handle, const std::vector<MeasurementKind> &kinds,
                                                             int64_t oldest, std::optional<int64_t> newest, bool check_clock,
                                                             std::optional<SyncAnchor> &anchor)
        {
            const std::string &mac = handle.mac_address();
            auto *session = handle.session();

            session->write(ble::Characteristic::OldestTimestamp, ble::encode_u64(static_cast<uint64_t>(oldest)), true);
            if (newest.has_value())
                session->write(ble::Characteristic::NewestTimestamp, ble::encode_u64(static_cast<uint64_t>(*newest)), true);

            Page page;
            page.interval = ble::decode_u32(session->read(ble::Characteristic::LoggerInterval));
            page.oldest = static_cast<int64_t>(ble::decode_u64(session->read(ble::Characteristic::OldestTimestamp)));
            page.newest = static_cast<int64_t>(ble::decode_u64(session->read(ble::Characteristic::NewestTimestamp)));

            if (page.interval == 0)
            {
                throw core::InvalidStateError(mac, FETCH, "gadget reports a logger interval of 0 ms");
            }

            // the newest sample may predate the sync point by up to one interval
            if (check_clock && anchor.has_value() && page.newest + page.interval < anchor->device_ms)
            {
                clock_.invalidate_anchor(mac, "gadget clock went backwards");
                anchor.reset();
            }

            logger_->debug("Starting logger download",
                           core::LogContext{}.add("mac_address", mac).add("interval_ms", page.interval).add("oldest_ms", page.oldest).add("newest_ms", page.newest));

            auto collector = std::make_shared<PageCollector>(kinds, page.interval, page.oldest, page.newest,
                                                             config_.logger.run_number_offset, config_.logger.stall_repeats);
            {
                DownloadRegistration registration(dispatcher_, mac, collector);
                session->write(ble::Characteristic::StartLoggerDownload, ble::encode_u8(1), true);
                page.interruption = collector->wait(std::chrono::milliseconds(config_.logger.page_timeout_ms));
            }

            if (page.interruption.has_value())
                return page;

            session->write(ble::Characteristic::StartLoggerDownload, ble::encode_u8(0), true);
            for (auto kind : kinds)
            {
                page.samples[slot(kind)] = collector->samples(kind);
            }
            return page;
        }

        void LoggedDataFetcher::stop_download(GadgetHandle &handle, const std::vector<MeasurementKind> &subscribed_here)
        {
            if (!handle.is_connected())
                return;

            auto *session = handle.session();
            session->write(ble::Characteristic::StartLoggerDownload, ble::encode_u8(0), true);
            for (auto kind : subscribed_here)
            {
                if (handle.subscribed(kind) && !handle.notifications_enabled(kind))
                    dispatcher_.unsubscribe_locked(handle, kind);
            }
        }

        bool LoggedDataFetcher::cancel_fetch(const std::string &mac_address)
        {
            auto mac = ConnectionManager::normalize_mac(mac_address, "cancel_fetch");
            if (dispatcher_.interrupt_download(mac, CANCELLED))
                return true;

            logger_->info("No logger download to cancel", core::LogContext{}.add("mac_address", mac));
            return false;
        }

        uint64_t LoggedDataFetcher::oldest_timestamp(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "oldest_timestamp", [](GadgetHandle &handle)
                                             { return ble::decode_u64(handle.session()->read(ble::Characteristic::OldestTimestamp)); });
        }

        uint64_t LoggedDataFetcher::newest_timestamp(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "newest_timestamp", [](GadgetHandle &handle)
                                             { return ble::decode_u64(handle.session()->read(ble::Characteristic::NewestTimestamp)); });
        }

        void LoggedDataFetcher::set_oldest_timestamp(const std::string &mac_address, int64_t timestamp_ms)
        {
            write_marker(mac_address, "set_oldest_timestamp", ble::Characteristic::OldestTimestamp, timestamp_ms);
        }

        void LoggedDataFetcher::set_newest_timestamp(const std::string &mac_address, int64_t timestamp_ms)
        {
            write_marker(mac_address, "set_newest_timestamp", ble::Characteristic::NewestTimestamp, timestamp_ms);
        }

        void LoggedDataFetcher::write_marker(const std::string &mac_address, const std::string &operation,
                                             ble::Characteristic characteristic, int64_t timestamp_ms)
        {
            if (timestamp_ms < 0)
            {
                throw core::InvalidArgumentError(mac_address, operation, "timestamp must not be negative");
            }

            connections_.with_session(mac_address, operation, [&](GadgetHandle &handle)
                                      { handle.session()->write(characteristic, ble::encode_u64(static_cast<uint64_t>(timestamp_ms)), true); });
        }

        uint32_t LoggedDataFetcher::logger_interval(const std::string &mac_address)
        {
            return connections_.with_session(mac_address, "logger_interval", [](GadgetHandle &handle)
                                             { return ble::decode_u32(handle.session()->read(ble::Characteristic::LoggerInterval)); });
        }

        void LoggedDataFetcher::set_logger_interval(const std::string &mac_address, int64_t milliseconds)
        {
            const auto &limits = config_.logger;
            if (milliseconds < static_cast<int64_t>(limits.min_interval_ms) ||
                milliseconds > static_cast<int64_t>(limits.max_interval_ms))
            {
                throw core::InvalidArgumentError(mac_address, "set_logger_interval",
                                                 "interval " + std::to_string(milliseconds) + " ms is outside " +
                                                     std::to_string(limits.min_interval_ms) + ".." +
                                                     std::to_string(limits.max_interval_ms) + " ms");
            }

            connections_.with_session(mac_address, "set_logger_interval", [&](GadgetHandle &handle)
                                      {
                                          handle.session()->write(ble::Characteristic::LoggerInterval,
                                                                  ble::encode_u32(static_cast<uint32_t>(milliseconds)), true);
                                          clock_.invalidate_anchor(handle.mac_address(), "logger interval rewritten");
                                          logger_->info("Logger interval set, gadget log cleared",
                                                        core::LogContext{}.add("mac_address", handle.mac_address()).add("interval_ms", milliseconds)); });
        }

    } // namespace gadget
} // namespace humibridge
