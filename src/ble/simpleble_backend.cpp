#include "ble/ble_backend.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/host_system.hpp"
#include "core/logger.hpp"

#include <simpleble/Adapter.h>
#include <simpleble/Peripheral.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <memory>
#include <optional>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace humibridge
{
    namespace ble
    {
        namespace
        {
            std::string lower(std::string text)
            {
                std::transform(text.begin(), text.end(), text.begin(),
                               [](unsigned char c)
                               { return static_cast<char>(std::tolower(c)); });
                return text;
            }

            // BlueZ reports a negotiation already running on the adapter as InProgress/Busy
            bool is_busy_error(const std::string &message)
            {
                return message.find("InProgress") != std::string::npos ||
                       message.find("Busy") != std::string::npos;
            }
        } // namespace

        class SimpleBleSession : public IGadgetSession
        {
        public:
            SimpleBleSession(SimpleBLE::Peripheral peripheral, const std::string &address)
                : peripheral_(std::move(peripheral)), address_(address), logger_(core::get_logger("SimpleBLE"))
            {
            }

            ~SimpleBleSession() override
            {
                peripheral_.set_callback_on_disconnected([]() {});
            }

            const std::string &address() const override { return address_; }

            bool is_connected() const override
            {
                try
                {
                    return peripheral_.is_connected();
                }
                catch (const std::exception &e)
                {
                    logger_->warning("is_connected failed", core::LogContext{}.add("address", address_).add("error", e.what()));
                    return false;
                }
            }

            std::optional<int> rssi() const override
            {
                try
                {
                    return static_cast<int>(peripheral_.rssi());
                }
                catch (const std::exception &e)
                {
                    logger_->debug("rssi unavailable", core::LogContext{}.add("address", address_).add("error", e.what()));
                    return std::nullopt;
                }
            }

            ByteArray read(Characteristic characteristic) override
            {
                const auto &gatt = gatt_address(characteristic);
                try
                {
                    auto bytes = peripheral_.read(gatt.service_uuid, gatt.characteristic_uuid);
                    return ByteArray(bytes.begin(), bytes.end());
                }
                catch (const std::exception &e)
                {
                    throw core::ConnectionError(address_, std::string("read ") + to_string(characteristic), e.what());
                }
            }

            void write(Characteristic characteristic, const ByteArray &data, bool with_response) override
            {
                const auto &gatt = gatt_address(characteristic);
                try
                {
                    if (with_response)
                        peripheral_.write_request(gatt.service_uuid, gatt.characteristic_uuid, data);
                    else
                        peripheral_.write_command(gatt.service_uuid, gatt.characteristic_uuid, data);
                }
                catch (const std::exception &e)
                {
                    throw core::ConnectionError(address_, std::string("write ") + to_string(characteristic), e.what());
                }
            }

            void subscribe(Characteristic characteristic, NotifyCallback callback) override
            {
                const auto &gatt = gatt_address(characteristic);
                try
                {
                    peripheral_.notify(gatt.service_uuid, gatt.characteristic_uuid,
                                       [callback](SimpleBLE::ByteArray bytes)
                                       {
                                           if (callback)
                                               callback(ByteArray(bytes.begin(), bytes.end()));
                                       });
                    logger_->debug("Notifications enabled", core::LogContext{}.add("address", address_).add("characteristic", to_string(characteristic)));
                }
                catch (const std::exception &e)
                {
                    throw core::ConnectionError(address_, std::string("subscribe ") + to_string(characteristic), e.what());
                }
            }

            void unsubscribe(Characteristic characteristic) override
            {
                const auto &gatt = gatt_address(characteristic);
                try
                {
                    peripheral_.unsubscribe(gatt.service_uuid, gatt.characteristic_uuid);
                }
                catch (const std::exception &e)
                {
                    throw core::ConnectionError(address_, std::string("unsubscribe ") + to_string(characteristic), e.what());
                }
            }

            void disconnect() override
            {
                try
                {
                    if (peripheral_.is_connected())
                        peripheral_.disconnect();
                }
                catch (const std::exception &e)
                {
                    throw core::ConnectionError(address_, "disconnect", e.what());
                }
            }

            void set_on_disconnected(std::function<void()> callback) override
            {
                peripheral_.set_callback_on_disconnected([callback]()
                                                         {
                                                             if (callback)
                                                                 callback();
                                                         });
            }

        private:
            mutable SimpleBLE::Peripheral peripheral_;
            std::string address_;
            std::shared_ptr<core::Logger> logger_;
        };

        struct ConnectAttempt
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            std::optional<std::string> error;
        };

        class SimpleBleBackend : public IBLEBackend
        {
        public:
            explicit SimpleBleBackend(const core::BridgeConfig &config)
                : config_(config), logger_(core::get_logger("SimpleBLE")) {}

            bool initialize()
            {
                try
                {
                    auto adapters = SimpleBLE::Adapter::get_adapters();
                    if (adapters.empty())
                    {
                        logger_->error("No BLE adapters found");
                        return false;
                    }

                    size_t index = static_cast<size_t>(config_.ble.adapter_index);
                    if (index >= adapters.size())
                    {
                        logger_->error("BLE adapter index out of range", core::LogContext{}.add("adapter_index", index).add("adapters", adapters.size()));
                        return false;
                    }
                    adapter_ = adapters[index];

                    if (!adapter_.initialized())
                    {
                        logger_->error("BLE adapter failed to initialize");
                        return false;
                    }

                    logger_->info("Using BLE adapter", core::LogContext{}.add("identifier", adapter_.identifier()).add("address", adapter_.address()));
                    return true;
                }
                catch (const std::exception &e)
                {
                    logger_->error("initialize failed", core::LogContext{}.add("error", e.what()));
                    return false;
                }
            }

            std::vector<Advertisement> scan(std::chrono::milliseconds timeout, bool passive) override
            {
                std::vector<Advertisement> out;
                if (passive)
                {
                    // SimpleBLE has no passive scan mode; BlueZ decides the scan type
                    logger_->debug("Passive scan requested, running the adapter's default scan");
                }

                try
                {
                    adapter_.scan_for(static_cast<int>(timeout.count()));
                    auto results = adapter_.scan_get_results();

                    std::lock_guard<std::mutex> lock(mutex_);
                    for (auto &p : results)
                    {
                        Advertisement adv;
                        adv.address = lower(p.address());
                        adv.name = p.identifier();
                        adv.rssi = static_cast<int>(p.rssi());
                        adv.connectable = p.is_connectable();
                        out.push_back(adv);

                        peripherals_[adv.address] = p;
                    }
                    logger_->debug("SimpleBLE scan results", core::LogContext{}.add("devices_found", results.size()));
                }
                catch (const std::exception &e)
                {
                    if (is_busy_error(e.what()))
                        throw core::AdapterBusyError("", "scan", e.what());
                    throw core::ConnectionError("", "scan", e.what());
                }
                return out;
            }

            std::unique_ptr<IGadgetSession> connect(const std::string &address, std::chrono::milliseconds timeout) override
            {
                auto peripheral = find_peripheral(address, timeout);
                if (!peripheral.has_value())
                {
                    throw core::ConnectionError(address, "connect", "device not found in scan results");
                }

                // Peripheral::connect has no timeout of its own, so it runs on a detached
                // thread and the attempt is abandoned once the deadline passes
                auto attempt = std::make_shared<ConnectAttempt>();
                std::thread([attempt, target = *peripheral]() mutable
                            {
                                std::optional<std::string> error;
                                try
                                {
                                    if (!target.is_connected())
                                        target.connect();
                                    (void)target.services();
                                }
                                catch (const std::exception &e)
                                {
                                    error = e.what();
                                }

                                {
                                    std::lock_guard<std::mutex> lock(attempt->mutex);
                                    attempt->error = error;
                                    attempt->done = true;
                                }
                                attempt->cv.notify_all(); })
                    .detach();

                std::unique_lock<std::mutex> lock(attempt->mutex);
                if (!attempt->cv.wait_for(lock, timeout, [&attempt]
                                          { return attempt->done; }))
                {
                    lock.unlock();
                    logger_->warning("Connect attempt timed out", core::LogContext{}.add("address", address).add("timeout_ms", timeout.count()));
                    try
                    {
                        peripheral->disconnect();
                    }
                    catch (const std::exception &e)
                    {
                        logger_->debug("Disconnect after timeout failed", core::LogContext{}.add("address", address).add("error", e.what()));
                    }
                    throw core::ConnectionError(address, "connect",
                                                "no connection within " + std::to_string(timeout.count()) + " ms");
                }

                if (attempt->error.has_value())
                {
                    if (is_busy_error(*attempt->error))
                        throw core::AdapterBusyError(address, "connect", *attempt->error);
                    throw core::ConnectionError(address, "connect", *attempt->error);
                }

                return std::make_unique<SimpleBleSession>(*peripheral, address);
            }

            void reset_adapter() override
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    peripherals_.clear();
                }

                if (!core::run_command("sudo systemctl restart bluetooth", logger_))
                {
                    throw core::ConnectionError("", "restart_bluetooth", "systemctl restart bluetooth failed");
                }

                // bluetoothd needs a moment before the adapter accepts commands again
                std::this_thread::sleep_for(std::chrono::seconds(2));

                if (!initialize())
                {
                    throw core::ConnectionError("", "restart_bluetooth", "adapter did not come back after restart");
                }
            }

        private:
            std::optional<SimpleBLE::Peripheral> find_peripheral(const std::string &address, std::chrono::milliseconds timeout)
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    auto it = peripherals_.find(address);
                    if (it != peripherals_.end())
                        return it->second;
                }

                logger_->debug("Peripheral not cached, scanning", core::LogContext{}.add("address", address));
                for (const auto &adv : scan(timeout, false))
                {
                    if (adv.address == address)
                    {
                        std::lock_guard<std::mutex> lock(mutex_);
                        return peripherals_[address];
                    }
                }
                return std::nullopt;
            }

            const core::BridgeConfig &config_;
            SimpleBLE::Adapter adapter_;
            std::unordered_map<std::string, SimpleBLE::Peripheral> peripherals_;
            std::mutex mutex_;
            std::shared_ptr<core::Logger> logger_;
        };

        std::unique_ptr<IBLEBackend> create_simpleble_backend(const core::BridgeConfig &config)
        {
            auto backend = std::make_unique<SimpleBleBackend>(config);
            if (!backend->initialize())
                return nullptr;
            return backend;
        }

    } // namespace ble
} // namespace humibridge
