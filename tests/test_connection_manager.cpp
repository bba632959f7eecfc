#include "fake_backend.hpp"
#include "gadget/connection_manager.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace humibridge
{
    namespace gadget
    {
        namespace
        {
            using ::testing::ElementsAre;
            using ::testing::UnorderedElementsAre;
            using testing::GADGET_A;
            using testing::GADGET_B;
            using testing::GADGET_C;

            class ConnectionManagerTest : public ::testing::Test
            {
            protected:
                ConnectionManagerTest()
                    : config_(testing::test_config()), manager_(backend_, config_)
                {
                    backend_.add_gadget(GADGET_A);
                    backend_.add_gadget(GADGET_B);
                    backend_.add_gadget(GADGET_C);
                    manager_.set_connection_observer([this](const ConnectionEvent &event)
                                                     {
                                                         std::lock_guard<std::mutex> lock(events_mutex_);
                                                         events_.push_back(event); });
                }

                std::vector<ConnectionEventKind> event_kinds(const std::string &mac)
                {
                    std::lock_guard<std::mutex> lock(events_mutex_);
                    std::vector<ConnectionEventKind> kinds;
                    for (const auto &event : events_)
                    {
                        if (event.mac_address == mac)
                            kinds.push_back(event.kind);
                    }
                    return kinds;
                }

                std::mutex events_mutex_;
                std::vector<ConnectionEvent> events_;

                testing::FakeBackend backend_;
                core::BridgeConfig config_;
                ConnectionManager manager_;
            };

            TEST_F(ConnectionManagerTest, ScanKeepsOnlyGadgetsAndNormalisesAddresses)
            {
                auto found = manager_.scan(1.0, false);

                EXPECT_THAT(found, UnorderedElementsAre(GADGET_A, GADGET_B, GADGET_C));
                ASSERT_NE(manager_.find(GADGET_A), nullptr);
                EXPECT_EQ(manager_.find(GADGET_A)->last_seen_rssi(), -60);
                EXPECT_EQ(manager_.find("11:22:33:44:55:66"), nullptr);
            }

            TEST_F(ConnectionManagerTest, StrictConnectThrowsAfterMaxAttempts)
            {
                backend_.gadget(GADGET_A)->connect_failures = 100;

                EXPECT_THROW(manager_.connect_gadget(GADGET_A), core::ConnectionError);
                EXPECT_EQ(backend_.connect_calls, config_.ble.max_attempts);
                EXPECT_EQ(manager_.find(GADGET_A)->state(), ConnectionState::Disconnected);
                EXPECT_FALSE(manager_.find(GADGET_A)->has_session());
            }

            TEST_F(ConnectionManagerTest, NonStrictConnectReturnsFalse)
            {
                backend_.gadget(GADGET_A)->connect_failures = 100;

                EXPECT_FALSE(manager_.connect_gadget(GADGET_A, false));
                EXPECT_EQ(manager_.find(GADGET_A)->state(), ConnectionState::Disconnected);
                EXPECT_TRUE(manager_.connected_gadgets().empty());
            }

            TEST_F(ConnectionManagerTest, PerCallAttemptsOverrideTheDefault)
            {
                backend_.gadget(GADGET_A)->connect_failures = 4;

                EXPECT_TRUE(manager_.connect_gadget(GADGET_A, true, 5));
                EXPECT_EQ(backend_.connect_calls, 5);
                EXPECT_EQ(manager_.find(GADGET_A)->attempt_counter(), 0);
            }

            TEST_F(ConnectionManagerTest, BulkConnectListsFailuresSeparately)
            {
                backend_.gadget(GADGET_B)->connect_failures = 100;

                auto result = manager_.connect_gadgets({GADGET_A, GADGET_B, GADGET_C});

                EXPECT_THAT(result.connected, ElementsAre(GADGET_A, GADGET_C));
                EXPECT_THAT(result.failed, ElementsAre(GADGET_B));
                EXPECT_THAT(manager_.connected_gadgets(), UnorderedElementsAre(GADGET_A, GADGET_C));
            }

            TEST_F(ConnectionManagerTest, OneNegotiationInFlightAcrossThreads)
            {
                backend_.connect_delay = std::chrono::milliseconds(10);
                backend_.add_gadget("aa:bb:cc:dd:ee:04");

                std::thread first([this]()
                                  { manager_.connect_gadgets({GADGET_A, GADGET_B}); });
                std::thread second([this]()
                                   { manager_.connect_gadgets({GADGET_C, "aa:bb:cc:dd:ee:04"}); });
                first.join();
                second.join();

                EXPECT_EQ(backend_.max_in_flight, 1);
                EXPECT_EQ(manager_.connected_gadgets().size(), 4u);
            }

            TEST_F(ConnectionManagerTest, DisconnectTwiceIsHarmless)
            {
                ASSERT_TRUE(manager_.connect_gadget(GADGET_A));

                manager_.disconnect_gadget(GADGET_A);
                auto state = manager_.find(GADGET_A)->state();
                EXPECT_NO_THROW(manager_.disconnect_gadget(GADGET_A));

                EXPECT_EQ(state, ConnectionState::Disconnected);
                EXPECT_EQ(manager_.find(GADGET_A)->state(), state);
                EXPECT_THAT(event_kinds(GADGET_A), ElementsAre(ConnectionEventKind::Connected, ConnectionEventKind::Disconnected));
                EXPECT_NO_THROW(manager_.disconnect_gadget("aa:bb:cc:dd:ee:99"));
            }

            TEST_F(ConnectionManagerTest, BusyAdapterIsRetriedWithoutSurfacing)
            {
                backend_.gadget(GADGET_A)->busy_results = 2;

                EXPECT_TRUE(manager_.connect_gadget(GADGET_A));
                EXPECT_EQ(backend_.connect_calls, 3);
                EXPECT_EQ(manager_.find(GADGET_A)->attempt_counter(), 0);
            }

            TEST_F(ConnectionManagerTest, MalformedAddressesAreRejected)
            {
                EXPECT_THROW(manager_.connect_gadget("not-a-mac"), core::InvalidArgumentError);
                EXPECT_THROW(manager_.connect_gadget("aa:bb:cc:dd:ee"), core::InvalidArgumentError);
                EXPECT_THROW(manager_.connect_gadgets({GADGET_A, "zz:zz"}), core::InvalidArgumentError);
                EXPECT_EQ(backend_.connect_calls, 0);

                auto result = manager_.connect_gadgets({GADGET_A, "zz:zz"}, false);
                EXPECT_THAT(result.connected, ElementsAre(GADGET_A));
                EXPECT_THAT(result.failed, ElementsAre("zz:zz"));
            }

            TEST_F(ConnectionManagerTest, AddressesAreNormalised)
            {
                EXPECT_EQ(ConnectionManager::normalize_mac("AA-BB-CC-DD-EE-01", "test"), GADGET_A);
                ASSERT_TRUE(manager_.connect_gadget("AA:BB:CC:DD:EE:01"));
                EXPECT_THAT(manager_.connected_gadgets(), ElementsAre(GADGET_A));
            }

            TEST_F(ConnectionManagerTest, MaxAttemptsMustBePositive)
            {
                EXPECT_THROW(manager_.set_max_attempts(0), core::InvalidArgumentError);
                manager_.set_max_attempts(2);
                EXPECT_EQ(manager_.max_attempts(), 2);
            }

            TEST_F(ConnectionManagerTest, LinkLossIsReportedAndReaped)
            {
                ASSERT_TRUE(manager_.connect_gadget(GADGET_A));

                backend_.drop_link(GADGET_A);

                EXPECT_THAT(event_kinds(GADGET_A), ElementsAre(ConnectionEventKind::Connected, ConnectionEventKind::LinkLost));
                EXPECT_TRUE(manager_.connected_gadgets().empty());

                // the explicit connection is re-established on the next call
                int battery = manager_.with_session(GADGET_A, "battery", [](GadgetHandle &handle)
                                                    { return static_cast<int>(ble::decode_u8(handle.session()->read(ble::Characteristic::BatteryLevel))); });
                EXPECT_EQ(battery, 87);
                EXPECT_EQ(backend_.gadget(GADGET_A)->connects, 2);
                EXPECT_THAT(manager_.connected_gadgets(), ElementsAre(GADGET_A));
            }

            TEST_F(ConnectionManagerTest, OnDemandConnectionIsClosedAfterTheCall)
            {
                manager_.with_session(GADGET_B, "temperature", [](GadgetHandle &handle)
                                      { handle.session()->read(ble::Characteristic::Temperature); });

                EXPECT_EQ(backend_.gadget(GADGET_B)->connects, 1);
                EXPECT_EQ(manager_.find(GADGET_B)->state(), ConnectionState::Disconnected);
                EXPECT_TRUE(manager_.connected_gadgets().empty());
            }

            TEST_F(ConnectionManagerTest, WithSessionRefusesWhenAutoConnectIsOff)
            {
                config_.ble.auto_connect = false;

                EXPECT_THROW(manager_.with_session(GADGET_B, "temperature", [](GadgetHandle &)
                                                   { return 0; }),
                             core::InvalidStateError);
                EXPECT_EQ(backend_.connect_calls, 0);
            }

            TEST_F(ConnectionManagerTest, FailedOperationReconnectsWithinTheBudget)
            {
                ASSERT_TRUE(manager_.connect_gadget(GADGET_A));
                int calls = 0;

                int result = manager_.with_session(GADGET_A, "temperature", [&](GadgetHandle &handle)
                                                   {
                                                       if (++calls == 1)
                                                           throw core::ConnectionError(handle.mac_address(), "read temperature", "timed out");
                                                       return 42; });

                EXPECT_EQ(result, 42);
                EXPECT_EQ(calls, 2);
                EXPECT_EQ(backend_.gadget(GADGET_A)->connects, 2);
            }

            TEST_F(ConnectionManagerTest, FailedOperationGivesUpWhenTheBudgetIsSpent)
            {
                ASSERT_TRUE(manager_.connect_gadget(GADGET_A));
                int calls = 0;

                EXPECT_THROW(manager_.with_session(GADGET_A, "temperature", [&](GadgetHandle &handle) -> int
                                                   {
                                                       ++calls;
                                                       throw core::ConnectionError(handle.mac_address(), "read temperature", "timed out"); }),
                             core::ConnectionError);
                // the first call runs on the existing session, every retry costs one connect attempt
                EXPECT_EQ(calls, config_.ble.max_attempts + 1);
            }

            TEST_F(ConnectionManagerTest, ReconnectFailureReportsTheAttemptsMade)
            {
                auto gadget = backend_.gadget(GADGET_A);
                gadget->connect_failures = 1;

                try
                {
                    // on-demand connect needs two attempts, the reconnect gets the last one
                    manager_.with_session(GADGET_A, "temperature", [&](GadgetHandle &handle) -> int
                                          {
                                              gadget->connect_failures = 100;
                                              throw core::ConnectionError(handle.mac_address(), "read temperature", "timed out"); });
                    FAIL() << "expected a ConnectionError";
                }
                catch (const core::ConnectionError &e)
                {
                    EXPECT_THAT(e.what(), ::testing::HasSubstr("no connection after 3 attempts"));
                }
                EXPECT_EQ(backend_.connect_calls, 3);
            }

            TEST_F(ConnectionManagerTest, ConnectAfterShutdownReportsNoAttempts)
            {
                manager_.shutdown();

                try
                {
                    manager_.connect_gadget(GADGET_A);
                    FAIL() << "expected a ConnectionError";
                }
                catch (const core::ConnectionError &e)
                {
                    EXPECT_THAT(e.what(), ::testing::HasSubstr("no connection after 0 attempts"));
                }
                EXPECT_EQ(backend_.connect_calls, 0);
            }

            TEST_F(ConnectionManagerTest, EveryAttemptIsBoundedByTheConnectTimeout)
            {
                backend_.gadget(GADGET_A)->answer_delay = std::chrono::milliseconds(10000);

                auto started = std::chrono::steady_clock::now();
                EXPECT_FALSE(manager_.connect_gadget(GADGET_A, false));
                auto elapsed = std::chrono::steady_clock::now() - started;

                ASSERT_EQ(backend_.connect_timeouts.size(), static_cast<size_t>(config_.ble.max_attempts));
                for (auto timeout : backend_.connect_timeouts)
                {
                    EXPECT_EQ(timeout, std::chrono::milliseconds(config_.ble.connect_timeout_ms));
                }
                EXPECT_LT(elapsed, std::chrono::seconds(5));
                EXPECT_EQ(manager_.find(GADGET_A)->state(), ConnectionState::Disconnected);
            }

            TEST_F(ConnectionManagerTest, RestartBluetoothInvalidatesEveryHandle)
            {
                ASSERT_TRUE(manager_.connect_gadget(GADGET_A));
                ASSERT_TRUE(manager_.connect_gadget(GADGET_B));

                manager_.restart_bluetooth();

                EXPECT_EQ(backend_.resets, 1);
                EXPECT_TRUE(manager_.connected_gadgets().empty());
                EXPECT_EQ(manager_.find(GADGET_A)->state(), ConnectionState::Disconnected);
                EXPECT_THAT(event_kinds(GADGET_A), ElementsAre(ConnectionEventKind::Connected, ConnectionEventKind::AdapterReset));
                EXPECT_THAT(event_kinds(GADGET_B), ElementsAre(ConnectionEventKind::Connected, ConnectionEventKind::AdapterReset));
            }

            TEST_F(ConnectionManagerTest, ShutdownDisconnectsAndRefusesNewConnections)
            {
                ASSERT_TRUE(manager_.connect_gadget(GADGET_A));

                manager_.shutdown();

                EXPECT_TRUE(manager_.connected_gadgets().empty());
                EXPECT_FALSE(manager_.connect_gadget(GADGET_A, false));
            }

        } // namespace
    } // namespace gadget
} // namespace humibridge
