#ifndef HUMIBRIDGE_BLE_BACKEND_HPP
#define HUMIBRIDGE_BLE_BACKEND_HPP

#include "ble/gatt_profile.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace humibridge
{
    namespace core
    {
        class BridgeConfig;
    }

    namespace ble
    {

        struct Advertisement
        {
            std::string address;
            std::string name;
            std::optional<int> rssi;
            bool connectable = true;
        };

        using NotifyCallback = std::function<void(const ByteArray &)>;

        /**
         * One live GATT connection to a gadget.
         * Reads and writes throw core::ConnectionError when the link fails.
         */
        class IGadgetSession
        {
        public:
            virtual ~IGadgetSession() = default;

            virtual const std::string &address() const = 0;
            virtual bool is_connected() const = 0;
            virtual std::optional<int> rssi() const = 0;

            virtual ByteArray read(Characteristic characteristic) = 0;
            virtual void write(Characteristic characteristic, const ByteArray &data, bool with_response) = 0;
            virtual void subscribe(Characteristic characteristic, NotifyCallback callback) = 0;
            virtual void unsubscribe(Characteristic characteristic) = 0;
            virtual void disconnect() = 0;

            // Invoked from the BLE stack's thread when the link goes away
            virtual void set_on_disconnected(std::function<void()> callback) = 0;
        };

        class IBLEBackend
        {
        public:
            virtual ~IBLEBackend() = default;

            // An empty result is not an error
            virtual std::vector<Advertisement> scan(std::chrono::milliseconds timeout, bool passive) = 0;

            // Throws core::AdapterBusyError when the adapter is negotiating, core::ConnectionError otherwise
            virtual std::unique_ptr<IGadgetSession> connect(const std::string &address,
                                                            std::chrono::milliseconds timeout) = 0;

            virtual void reset_adapter() = 0;
        };

        std::unique_ptr<IBLEBackend> create_simpleble_backend(const core::BridgeConfig &config);

    } // namespace ble
} // namespace humibridge

#endif // HUMIBRIDGE_BLE_BACKEND_HPP
