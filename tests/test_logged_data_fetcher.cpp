#include "fake_backend.hpp"
#include "services/gadget_service.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace humibridge
{
    namespace gadget
    {
        namespace
        {
            using ::testing::ElementsAre;
            using ::testing::HasSubstr;
            using ::testing::StartsWith;
            using testing::FakeGadget;
            using testing::GADGET_A;

            constexpr int64_t LOG_NEWEST = 5000000;

            class LoggedDataFetcherTest : public ::testing::Test
            {
            protected:
                void SetUp() override
                {
                    gadget_ = backend_.add_gadget(GADGET_A);
                }

                void start(const core::BridgeConfig &config = testing::test_config())
                {
                    service_ = std::make_unique<services::GadgetService>(backend_, clock_, config);
                    ASSERT_TRUE(service_->connect_gadget(GADGET_A));
                }

                // Runs a fetch that is expected to be interrupted, returning the error
                std::optional<FetchInterruptedError> interrupted_fetch(const FetchRequest &request)
                {
                    try
                    {
                        service_->fetch_logged_data(GADGET_A, request);
                    }
                    catch (const FetchInterruptedError &e)
                    {
                        return e;
                    }
                    return std::nullopt;
                }

                // Starts a fetch on a silent gadget in the background and waits until it is collecting
                std::thread start_stalled_fetch(std::optional<FetchInterruptedError> &result)
                {
                    gadget_->silent_download = true;
                    std::thread worker([this, &result]()
                                       { result = interrupted_fetch(FetchRequest{}); });

                    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                    while (!service_->fetch_in_progress(GADGET_A) && std::chrono::steady_clock::now() < deadline)
                    {
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    }
                    return worker;
                }

                static void expect_sample_values(const std::vector<LoggedRecord> &records)
                {
                    int64_t previous = -1;
                    for (const auto &record : records)
                    {
                        EXPECT_GT(record.timestamp_ms, previous);
                        previous = record.timestamp_ms;
                        int k = static_cast<int>((LOG_NEWEST - record.timestamp_ms) / 1000);
                        ASSERT_TRUE(record.temperature.has_value());
                        EXPECT_FLOAT_EQ(*record.temperature, FakeGadget::temperature_at(k));
                    }
                }

                testing::FakeBackend backend_;
                testing::FakeHostClock clock_;
                std::shared_ptr<FakeGadget> gadget_;
                std::unique_ptr<services::GadgetService> service_;
            };

            TEST_F(LoggedDataFetcherTest, RequiresAConnectedGadget)
            {
                service_ = std::make_unique<services::GadgetService>(backend_, clock_, testing::test_config());

                EXPECT_THROW(service_->fetch_logged_data(GADGET_A, FetchRequest{}), core::InvalidStateError);
                EXPECT_EQ(gadget_->connects, 0);
            }

            TEST_F(LoggedDataFetcherTest, ReadsTheWholeLog)
            {
                start();

                auto data = service_->fetch_logged_data(GADGET_A, FetchRequest{});

                ASSERT_EQ(data.temperatures.size(), 20u);
                ASSERT_EQ(data.humidities.size(), 20u);
                EXPECT_EQ(data.temperatures.front().timestamp_ms, LOG_NEWEST - 19000);
                EXPECT_EQ(data.temperatures.back().timestamp_ms, LOG_NEWEST);
                EXPECT_FALSE(data.temperatures.front().absolute);
                EXPECT_FLOAT_EQ(*data.humidities.front().humidity, FakeGadget::humidity_at(19));
                EXPECT_EQ(data.last_index, 19);
                expect_sample_values(data.temperatures);

                // the download is stopped and the subscriptions it made are gone
                EXPECT_GE(gadget_->download_stops, 1);
                EXPECT_TRUE(gadget_->subscriptions.empty());
                EXPECT_FALSE(service_->fetch_in_progress(GADGET_A));
            }

            TEST_F(LoggedDataFetcherTest, KeepsSubscriptionsTheCallerEnabled)
            {
                start();
                service_->enable_temperature_notifications(GADGET_A);

                service_->fetch_logged_data(GADGET_A, FetchRequest{});

                EXPECT_TRUE(service_->temperature_notifications_enabled(GADGET_A));
                EXPECT_EQ(gadget_->subscriptions.count(ble::Characteristic::Temperature), 1u);
                EXPECT_EQ(gadget_->subscriptions.count(ble::Characteristic::Humidity), 0u);
            }

            TEST_F(LoggedDataFetcherTest, NothingRequestedReadsNothing)
            {
                start();
                FetchRequest request;
                request.enable_temperature = false;
                request.enable_humidity = false;

                auto data = service_->fetch_logged_data(GADGET_A, request);

                EXPECT_TRUE(data.empty());
                EXPECT_EQ(gadget_->pages_started, 0);
            }

            TEST_F(LoggedDataFetcherTest, TemperatureOnly)
            {
                start();
                FetchRequest request;
                request.enable_humidity = false;

                auto data = service_->fetch_logged_data(GADGET_A, request);

                EXPECT_EQ(data.temperatures.size(), 20u);
                EXPECT_TRUE(data.humidities.empty());
            }

            TEST_F(LoggedDataFetcherTest, OldestAndNewestLimitTheRange)
            {
                start();
                FetchRequest request;
                request.oldest_ms = LOG_NEWEST - 5000;
                request.newest_ms = LOG_NEWEST - 2000;

                auto data = service_->fetch_logged_data(GADGET_A, request);

                ASSERT_EQ(data.temperatures.size(), 4u);
                EXPECT_EQ(data.temperatures.front().timestamp_ms, LOG_NEWEST - 5000);
                EXPECT_EQ(data.temperatures.back().timestamp_ms, LOG_NEWEST - 2000);
                expect_sample_values(data.temperatures);
            }

            TEST_F(LoggedDataFetcherTest, LostChunksLeaveGapsWithOneIteration)
            {
                start();
                gadget_->lost_chunks[1] = {1};

                auto data = service_->fetch_logged_data(GADGET_A, FetchRequest{});

                ASSERT_EQ(data.temperatures.size(), 20u);
                ASSERT_EQ(data.humidities.size(), 20u);

                std::vector<int64_t> missing;
                std::vector<LoggedRecord> received;
                for (const auto &record : data.temperatures)
                {
                    if (record.temperature.has_value())
                        received.push_back(record);
                    else
                        missing.push_back(record.timestamp_ms);
                }
                EXPECT_THAT(missing, ElementsAre(LOG_NEWEST - 7000, LOG_NEWEST - 6000, LOG_NEWEST - 5000, LOG_NEWEST - 4000));
                EXPECT_EQ(received.size(), 16u);
                expect_sample_values(received);

                auto missing_humidities = std::count_if(data.humidities.begin(), data.humidities.end(),
                                                        [](const LoggedRecord &record)
                                                        { return !record.humidity.has_value(); });
                EXPECT_EQ(missing_humidities, 4);
            }

            TEST_F(LoggedDataFetcherTest, MissingSamplesSerialiseAsNull)
            {
                start();
                gadget_->lost_chunks[1] = {1};

                auto json = service_->fetch_logged_data(GADGET_A, FetchRequest{}).to_json(false);

                ASSERT_EQ(json[0].size(), 20u);
                int nulls = 0;
                for (const auto &entry : json[0])
                {
                    if (entry[1].is_null())
                        ++nulls;
                }
                EXPECT_EQ(nulls, 4);
            }

            TEST_F(LoggedDataFetcherTest, LaterIterationsFillTheGaps)
            {
                start();
                gadget_->lost_chunks[1] = {1};
                FetchRequest request;
                request.num_iterations = 3;

                auto data = service_->fetch_logged_data(GADGET_A, request);

                EXPECT_EQ(gadget_->pages_started, 2);
                ASSERT_EQ(data.temperatures.size(), 20u);
                ASSERT_EQ(data.humidities.size(), 20u);
                expect_sample_values(data.temperatures);
            }

            TEST_F(LoggedDataFetcherTest, DropInSecondIterationKeepsTheFirst)
            {
                start();
                gadget_->lost_chunks[1] = {1};
                gadget_->drop_on_page = 2;
                gadget_->drop_after_chunks = 0;
                FetchRequest request;
                request.num_iterations = 3;

                auto error = interrupted_fetch(request);

                ASSERT_TRUE(error.has_value());
                EXPECT_THAT(error->detail(), StartsWith("connection lost"));
                EXPECT_EQ(error->mac_address(), GADGET_A);
                const auto &partial = error->partial();
                EXPECT_EQ(partial.temperatures.size(), 16u);
                EXPECT_EQ(partial.humidities.size(), 16u);
                expect_sample_values(partial.temperatures);
                EXPECT_TRUE(service_->connected_gadgets().empty());
            }

            TEST_F(LoggedDataFetcherTest, DropInFirstIterationReturnsNothing)
            {
                start();
                gadget_->drop_on_page = 1;
                gadget_->drop_after_chunks = 2;

                auto error = interrupted_fetch(FetchRequest{});

                ASSERT_TRUE(error.has_value());
                EXPECT_TRUE(error->partial().empty());
                EXPECT_EQ(error->partial().last_index, -1);
            }

            TEST_F(LoggedDataFetcherTest, SyncGivesAbsoluteNonDecreasingTimestamps)
            {
                start();
                FetchRequest request;
                request.sync = true;
                request.sync_timestamp_ms = 1000000;

                auto data = service_->fetch_logged_data(GADGET_A, request);

                ASSERT_EQ(data.temperatures.size(), 20u);
                EXPECT_THAT(gadget_->sync_writes, ElementsAre(1000000));
                int64_t previous = 0;
                for (const auto &record : data.temperatures)
                {
                    EXPECT_TRUE(record.absolute);
                    EXPECT_GE(record.timestamp_ms, previous);
                    previous = record.timestamp_ms;
                }
                EXPECT_EQ(data.temperatures.back().timestamp_ms, 1000000);
                EXPECT_EQ(data.temperatures.front().timestamp_ms, 1000000 - 19000);
                EXPECT_EQ(static_cast<int64_t>(service_->newest_timestamp(GADGET_A)), data.temperatures.back().timestamp_ms);
            }

            TEST_F(LoggedDataFetcherTest, SetSyncTimeThenFetchIsAbsolute)
            {
                start();

                int64_t written = service_->set_sync_time(GADGET_A);
                auto data = service_->fetch_logged_data(GADGET_A, FetchRequest{});

                EXPECT_EQ(written, clock_.now_ms());
                ASSERT_FALSE(data.humidities.empty());
                EXPECT_TRUE(data.humidities.back().absolute);
                EXPECT_EQ(data.humidities.back().timestamp_ms, clock_.now_ms());
            }

            TEST_F(LoggedDataFetcherTest, CancelStopsTheDownloadAndKeepsTheConnection)
            {
                auto config = testing::test_config();
                config.logger.page_timeout_ms = 5000;
                start(config);

                std::optional<FetchInterruptedError> result;
                auto worker = start_stalled_fetch(result);
                EXPECT_TRUE(service_->cancel_fetch(GADGET_A));
                worker.join();

                ASSERT_TRUE(result.has_value());
                EXPECT_EQ(result->detail(), "cancelled");
                EXPECT_THAT(service_->connected_gadgets(), ElementsAre(GADGET_A));
                EXPECT_EQ(gadget_->download_stops, 1);
                EXPECT_TRUE(gadget_->subscriptions.empty());
                EXPECT_FALSE(service_->cancel_fetch(GADGET_A));
            }

            TEST_F(LoggedDataFetcherTest, DisconnectWaitsForTheRunningFetch)
            {
                auto config = testing::test_config();
                config.logger.page_timeout_ms = 5000;
                start(config);

                std::optional<FetchInterruptedError> result;
                auto worker = start_stalled_fetch(result);
                ASSERT_TRUE(service_->fetch_in_progress(GADGET_A));

                std::atomic<bool> disconnected(false);
                std::thread disconnector([this, &disconnected]()
                                         {
                                             service_->disconnect_gadget(GADGET_A);
                                             disconnected = true; });

                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                EXPECT_FALSE(disconnected.load());
                EXPECT_TRUE(service_->fetch_in_progress(GADGET_A));
                EXPECT_THAT(service_->connected_gadgets(), ElementsAre(GADGET_A));

                EXPECT_TRUE(service_->cancel_fetch(GADGET_A));
                worker.join();
                disconnector.join();

                ASSERT_TRUE(result.has_value());
                EXPECT_EQ(result->detail(), "cancelled");
                EXPECT_TRUE(result->partial().empty());
                EXPECT_EQ(result->partial().last_index, -1);
                // the download was stopped on a live link before the disconnect ran
                EXPECT_EQ(gadget_->download_stops, 1);
                EXPECT_TRUE(disconnected.load());
                EXPECT_TRUE(service_->connected_gadgets().empty());
            }

            TEST_F(LoggedDataFetcherTest, SilentGadgetTimesOutAndIsDisconnected)
            {
                start();
                gadget_->silent_download = true;

                auto error = interrupted_fetch(FetchRequest{});

                ASSERT_TRUE(error.has_value());
                EXPECT_EQ(error->detail(), "page timeout");
                EXPECT_TRUE(service_->connected_gadgets().empty());
            }

            TEST_F(LoggedDataFetcherTest, AdapterResetInterruptsTheFetch)
            {
                auto config = testing::test_config();
                config.logger.page_timeout_ms = 5000;
                start(config);

                std::optional<FetchInterruptedError> result;
                auto worker = start_stalled_fetch(result);
                service_->restart_bluetooth();
                worker.join();

                ASSERT_TRUE(result.has_value());
                EXPECT_EQ(result->detail(), "adapter reset");
                EXPECT_EQ(backend_.resets, 1);
                EXPECT_TRUE(service_->connected_gadgets().empty());
            }

            TEST_F(LoggedDataFetcherTest, IterationsMustBePositive)
            {
                start();
                FetchRequest request;
                request.num_iterations = 0;

                EXPECT_THROW(service_->fetch_logged_data(GADGET_A, request), core::InvalidArgumentError);
            }

            TEST_F(LoggedDataFetcherTest, LoggerIntervalRoundTrips)
            {
                start();

                service_->set_logger_interval(GADGET_A, 5000);

                EXPECT_EQ(service_->logger_interval(GADGET_A), 5000u);
                // the gadget clears its log when the interval changes
                EXPECT_TRUE(service_->fetch_logged_data(GADGET_A, FetchRequest{}).empty());
            }

            TEST_F(LoggedDataFetcherTest, LoggerIntervalOutsideLimitsIsRejected)
            {
                start();

                EXPECT_THROW(service_->set_logger_interval(GADGET_A, 10), core::InvalidArgumentError);
                EXPECT_THROW(service_->set_logger_interval(GADGET_A, 24 * 3600 * 1000), core::InvalidArgumentError);
                EXPECT_EQ(service_->logger_interval(GADGET_A), 1000u);
            }

            TEST_F(LoggedDataFetcherTest, MarkersAreWrittenAndReadBack)
            {
                start();

                service_->set_newest_timestamp(GADGET_A, LOG_NEWEST - 3500);
                service_->set_oldest_timestamp(GADGET_A, LOG_NEWEST - 7500);

                EXPECT_EQ(service_->newest_timestamp(GADGET_A), static_cast<uint64_t>(LOG_NEWEST - 4000));
                EXPECT_EQ(service_->oldest_timestamp(GADGET_A), static_cast<uint64_t>(LOG_NEWEST - 7000));
                EXPECT_THROW(service_->set_oldest_timestamp(GADGET_A, -1), core::InvalidArgumentError);
            }

            TEST_F(LoggedDataFetcherTest, InterruptedErrorNamesTheReason)
            {
                start();
                gadget_->silent_download = true;

                auto error = interrupted_fetch(FetchRequest{});

                ASSERT_TRUE(error.has_value());
                EXPECT_THAT(error->what(), HasSubstr("fetch_logged_data"));
                EXPECT_THAT(error->what(), HasSubstr(GADGET_A));
                EXPECT_STREQ(error->type_name(), "FetchInterruptedError");
            }

        } // namespace
    } // namespace gadget
} // namespace humibridge
