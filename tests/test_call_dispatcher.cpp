#include "fake_backend.hpp"
#include "services/call_dispatcher.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>

namespace humibridge
{
    namespace services
    {
        namespace
        {
            using nlohmann::json;
            using testing::GADGET_A;
            using testing::GADGET_B;

            class CallDispatcherTest : public ::testing::Test
            {
            protected:
                CallDispatcherTest()
                    : service_(backend_, clock_, testing::test_config()), dispatcher_(service_)
                {
                    backend_.add_gadget(GADGET_A);
                }

                json call(const std::string &method, const json &params = nullptr)
                {
                    return dispatcher_.handle_request(json{{"id", 7}, {"method", method}, {"params", params}});
                }

                testing::FakeBackend backend_;
                testing::FakeHostClock clock_;
                GadgetService service_;
                CallDispatcher dispatcher_;
            };

            TEST(CallDispatcherNamesTest, CamelCaseBecomesSnakeCase)
            {
                EXPECT_EQ(CallDispatcher::to_snake_case("connectGadget"), "connect_gadget");
                EXPECT_EQ(CallDispatcher::to_snake_case("temperatureHumidityDewpoint"), "temperature_humidity_dewpoint");
                EXPECT_EQ(CallDispatcher::to_snake_case("rpiDate"), "rpi_date");
                EXPECT_EQ(CallDispatcher::to_snake_case("connect_gadget"), "connect_gadget");
            }

            TEST_F(CallDispatcherTest, EveryCallInOperationIsRegistered)
            {
                auto methods = dispatcher_.methods();
                for (const char *name : {"scan", "connect_gadget", "connect_gadgets", "connected_gadgets",
                                         "disconnect_gadget", "disconnect_gadgets", "battery", "info", "rssi",
                                         "temperature", "humidity", "temperature_humidity", "dewpoint",
                                         "temperature_humidity_dewpoint", "enable_temperature_notifications",
                                         "disable_temperature_notifications", "temperature_notifications_enabled",
                                         "enable_humidity_notifications", "disable_humidity_notifications",
                                         "humidity_notifications_enabled", "fetch_logged_data", "cancel_fetch",
                                         "oldest_timestamp", "newest_timestamp", "set_oldest_timestamp",
                                         "set_newest_timestamp", "logger_interval", "set_logger_interval",
                                         "max_attempts", "set_max_attempts", "rpi_date", "set_rpi_date",
                                         "set_sync_time", "restart_bluetooth", "shutdown_service"})
                {
                    EXPECT_NE(std::find(methods.begin(), methods.end(), name), methods.end()) << name;
                }
            }

            TEST_F(CallDispatcherTest, ConnectsAndReadsThroughJson)
            {
                auto response = call("connectGadget", {{"macAddress", GADGET_A}});
                EXPECT_EQ(response["id"], 7);
                EXPECT_EQ(response["result"], true);

                response = call("temperatureHumidity", json::array({GADGET_A}));
                ASSERT_TRUE(response.contains("result")) << response.dump();
                EXPECT_FLOAT_EQ(response["result"][0].get<float>(), 21.5f);
                EXPECT_FLOAT_EQ(response["result"][1].get<float>(), 45.25f);

                EXPECT_EQ(call("connectedGadgets")["result"], json::array({GADGET_A}));
                EXPECT_EQ(call("battery", {{"mac", GADGET_A}})["result"], 87);
            }

            TEST_F(CallDispatcherTest, InfoCarriesEveryField)
            {
                auto result = call("info", {{"mac_address", GADGET_A}})["result"];

                for (const char *key : {"battery", "device_name", "dewpoint", "firmware_revision", "hardware_revision",
                                        "humidity", "logger_interval_ms", "mac_address", "manufacturer", "model_number",
                                        "newest_timestamp_ms", "oldest_timestamp_ms", "rssi", "serial_number",
                                        "software_revision", "system_id", "temperature"})
                {
                    EXPECT_TRUE(result.contains(key)) << key;
                }
                EXPECT_EQ(result["manufacturer"], "Sensirion AG");
                EXPECT_EQ(result["logger_interval_ms"], 1000);
            }

            TEST_F(CallDispatcherTest, BulkConnectReturnsBothLists)
            {
                backend_.add_gadget(GADGET_B)->connect_failures = 100;

                auto result = call("connectGadgets", {{"macAddresses", {GADGET_A, GADGET_B}}})["result"];

                EXPECT_EQ(result, json::array({json::array({GADGET_A}), json::array({GADGET_B})}));
            }

            TEST_F(CallDispatcherTest, ConnectionFailureBecomesATypedError)
            {
                backend_.gadget(GADGET_A)->connect_failures = 100;

                auto error = call("connectGadget", {{"mac_address", GADGET_A}})["error"];

                EXPECT_EQ(error["type"], "ConnectionError");
                EXPECT_EQ(error["mac_address"], GADGET_A);
                EXPECT_EQ(error["operation"], "connect_gadget");
                EXPECT_NE(error["message"].get<std::string>().find(GADGET_A), std::string::npos);
            }

            TEST_F(CallDispatcherTest, StateAndArgumentErrorsAreTyped)
            {
                EXPECT_EQ(call("enableTemperatureNotifications", {{"mac_address", GADGET_A}})["error"]["type"], "InvalidStateError");
                EXPECT_EQ(call("setMaxAttempts", {{"max_attempts", 0}})["error"]["type"], "InvalidArgumentError");
                EXPECT_EQ(call("battery")["error"]["type"], "InvalidArgumentError");
                EXPECT_EQ(call("battery", {{"mac_address", 5}})["error"]["type"], "InvalidArgumentError");
                EXPECT_EQ(call("battery", {{"mac_address", "bogus"}})["error"]["type"], "InvalidArgumentError");
                EXPECT_EQ(call("battery", json::array({GADGET_A, 1, 2}))["error"]["type"], "InvalidArgumentError");
                EXPECT_EQ(call("dewpoint", {{"mac_address", GADGET_A}, {"temperature", 500}, {"humidity", 50}})["error"]["type"],
                          "InvalidArgumentError");
            }

            TEST_F(CallDispatcherTest, UnknownMethodAndMalformedLines)
            {
                auto response = call("makeCoffee");
                EXPECT_EQ(response["id"], 7);
                EXPECT_EQ(response["error"]["type"], "MethodNotFound");

                response = dispatcher_.handle_line("{not json");
                EXPECT_TRUE(response["id"].is_null());
                EXPECT_EQ(response["error"]["type"], "InvalidArgumentError");

                response = dispatcher_.handle_line(R"({"id": "x"})");
                EXPECT_EQ(response["id"], "x");
                EXPECT_EQ(response["error"]["type"], "InvalidArgumentError");
            }

            TEST_F(CallDispatcherTest, DewpointFromGivenValues)
            {
                auto response = call("dewpoint", {{"mac_address", GADGET_A}, {"temperature", 20.0}, {"humidity", 50.0}});

                EXPECT_NEAR(response["result"].get<double>(), 9.271526922716848, 1e-9);
                EXPECT_EQ(backend_.gadget(GADGET_A)->connects, 0);
            }

            TEST_F(CallDispatcherTest, FetchWithSyncTimestampAndDatetimes)
            {
                call("connectGadget", {{"mac_address", GADGET_A}});

                auto response = call("fetchLoggedData", {{"mac_address", GADGET_A}, {"sync", 1000000}, {"asDatetime", true}, {"enableHumidity", false}});

                ASSERT_TRUE(response.contains("result")) << response.dump();
                const auto &temperatures = response["result"][0];
                ASSERT_EQ(temperatures.size(), 20u);
                EXPECT_TRUE(temperatures[0][0].is_string());
                EXPECT_TRUE(response["result"][1].empty());
                EXPECT_EQ(backend_.gadget(GADGET_A)->sync_writes.back(), 1000000);
            }

            TEST_F(CallDispatcherTest, InterruptedFetchCarriesThePartialData)
            {
                call("connectGadget", {{"mac_address", GADGET_A}});
                backend_.gadget(GADGET_A)->silent_download = true;

                auto error = call("fetchLoggedData", {{"mac_address", GADGET_A}})["error"];

                EXPECT_EQ(error["type"], "FetchInterruptedError");
                ASSERT_TRUE(error.contains("partial"));
                EXPECT_EQ(error["partial"], json::array({json::array(), json::array()}));
            }

            TEST_F(CallDispatcherTest, MaxAttemptsRoundTrips)
            {
                EXPECT_EQ(call("maxAttempts")["result"], 3);
                EXPECT_TRUE(call("setMaxAttempts", json::array({4}))["result"].is_null());
                EXPECT_EQ(call("maxAttempts")["result"], 4);
            }

            TEST_F(CallDispatcherTest, ShutdownServiceIsRemembered)
            {
                EXPECT_FALSE(dispatcher_.shutdown_requested());
                call("shutdownService");
                EXPECT_TRUE(dispatcher_.shutdown_requested());
                EXPECT_TRUE(service_.is_shut_down());
            }

            TEST(CallDispatcherEventsTest, EventsAreSerialised)
            {
                auto notification = CallDispatcher::notification_event(
                    gadget::NotificationEvent{GADGET_A, gadget::MeasurementKind::Humidity, 48.5f, 1700000000000LL});
                EXPECT_EQ(notification["event"], "notification");
                EXPECT_EQ(notification["kind"], "humidity");
                EXPECT_EQ(notification["timestamp"], 1700000000000LL);

                auto connection = CallDispatcher::connection_event(
                    gadget::ConnectionEvent{GADGET_A, gadget::ConnectionEventKind::Connected, std::chrono::milliseconds(1500)});
                EXPECT_EQ(connection["event"], "connection");
                EXPECT_EQ(connection["kind"], "connected");
                EXPECT_EQ(connection["offline_for_ms"], 1500);
            }

        } // namespace
    } // namespace services
} // namespace humibridge
