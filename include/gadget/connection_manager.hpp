#ifndef HUMIBRIDGE_GADGET_CONNECTION_MANAGER_HPP
#define HUMIBRIDGE_GADGET_CONNECTION_MANAGER_HPP

#include "ble/ble_backend.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "gadget/adapter_lock.hpp"
#include "gadget/gadget_handle.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace humibridge
{
    namespace gadget
    {

        enum class ConnectionEventKind
        {
            Connected,
            Disconnected,
            LinkLost,
            AdapterReset
        };

        const char *to_string(ConnectionEventKind kind);

        struct ConnectionEvent
        {
            std::string mac_address;
            ConnectionEventKind kind;
            // Time spent away from Connected before a Connected event
            std::optional<std::chrono::milliseconds> offline_for;
        };

        using ConnectionObserver = std::function<void(const ConnectionEvent &)>;

        struct BulkConnectResult
        {
            std::vector<std::string> connected;
            std::vector<std::string> failed;
        };

        /**
         * Owns the handle table and the BLE adapter.
         *
         * Lock order is always handle operation mutex, then adapter lock. Observers are
         * called without either lock held, except for link loss which arrives on the BLE
         * stack's thread.
         */
        class ConnectionManager
        {
        public:
            ConnectionManager(ble::IBLEBackend &backend, const core::BridgeConfig &config);
            ~ConnectionManager();

            ConnectionManager(const ConnectionManager &) = delete;
            ConnectionManager &operator=(const ConnectionManager &) = delete;

            std::vector<std::string> scan(double timeout_s, bool passive);

            bool connect_gadget(const std::string &mac_address, bool strict = true,
                                std::optional<int> max_attempts = std::nullopt);
            BulkConnectResult connect_gadgets(const std::vector<std::string> &mac_addresses, bool strict = true);

            void disconnect_gadget(const std::string &mac_address);
            void disconnect_gadgets();

            std::vector<std::string> connected_gadgets() const;

            void restart_bluetooth();

            void set_max_attempts(int max_attempts);
            int max_attempts() const { return max_attempts_.load(); }

            void shutdown();

            void set_connection_observer(ConnectionObserver observer);

            // nullptr for a MAC address that was never seen
            std::shared_ptr<GadgetHandle> find(const std::string &mac_address) const;

            /**
             * Runs fn(handle) with the handle lock held on a live session.
             *
             * A gadget that is not connected is connected on demand (when ble.auto_connect
             * is set) and disconnected again afterwards unless the connection was requested
             * explicitly. A ConnectionError raised by fn tears the session down and
             * reconnects, sharing the max_attempts budget with the connect attempts.
             */
            template <typename Fn>
            auto with_session(const std::string &mac_address, const std::string &operation, Fn &&fn)
                -> decltype(fn(std::declval<GadgetHandle &>()));

            /**
             * Runs fn(handle) with the handle lock held. The gadget must already be
             * Connected, otherwise InvalidStateError.
             */
            template <typename Fn>
            auto with_connected(const std::string &mac_address, const std::string &operation, Fn &&fn)
                -> decltype(fn(std::declval<GadgetHandle &>()));

            /**
             * Lower-case aa:bb:cc:dd:ee:ff form. Throws InvalidArgumentError for anything
             * that is not six colon or dash separated hex octets.
             */
            static std::string normalize_mac(const std::string &mac_address, const std::string &operation);

        private:
            std::shared_ptr<GadgetHandle> get_or_create(const std::string &mac_address);
            std::vector<std::shared_ptr<GadgetHandle>> all_handles() const;

            // Handle lock held. Returns the number of attempts used, or nullopt when every attempt failed.
            // attempts_made counts the negotiations actually started, successful or not.
            std::optional<int> connect_locked(GadgetHandle &handle, int attempts, const std::string &operation,
                                              std::string &last_error, int &attempts_made);
            void teardown_locked(GadgetHandle &handle, bool report);
            void reap_link_loss_locked(GadgetHandle &handle);
            void release_on_demand_locked(GadgetHandle &handle, bool on_demand);
            void on_link_lost(const std::weak_ptr<GadgetHandle> &weak_handle);
            void notify(const ConnectionEvent &event);

            ble::IBLEBackend &backend_;
            const core::BridgeConfig &config_;

            mutable std::shared_mutex mutex_;
            std::map<std::string, std::shared_ptr<GadgetHandle>> handles_;

            AdapterLock adapter_lock_;
            std::atomic<int> max_attempts_;
            std::atomic<bool> shut_down_;

            std::mutex observer_mutex_;
            ConnectionObserver observer_;

            std::shared_ptr<core::Logger> logger_;
        };

        template <typename Fn>
        auto ConnectionManager::with_session(const std::string &mac_address, const std::string &operation, Fn &&fn)
            -> decltype(fn(std::declval<GadgetHandle &>()))
        {
            using Result = decltype(fn(std::declval<GadgetHandle &>()));

            auto handle = get_or_create(normalize_mac(mac_address, operation));
            std::lock_guard<std::mutex> lock(handle->operation_mutex());
            reap_link_loss_locked(*handle);

            const bool on_demand = !handle->is_connected();
            if (on_demand && !config_.ble.auto_connect)
            {
                throw core::InvalidStateError(handle->mac_address(), operation, "gadget is not connected");
            }

            int budget = max_attempts();
            int attempts_made = 0;
            std::string last_error;
            while (true)
            {
                if (!handle->is_connected())
                {
                    auto used = connect_locked(*handle, budget, operation, last_error, attempts_made);
                    if (!used.has_value())
                    {
                        throw core::ConnectionError(handle->mac_address(), operation,
                                                    "no connection after " + std::to_string(attempts_made) +
                                                        " attempts: " + last_error);
                    }
                    budget -= *used;
                }

                try
                {
                    if constexpr (std::is_void_v<Result>)
                    {
                        fn(*handle);
                        release_on_demand_locked(*handle, on_demand);
                        return;
                    }
                    else
                    {
                        Result result = fn(*handle);
                        release_on_demand_locked(*handle, on_demand);
                        return result;
                    }
                }
                catch (const core::ConnectionError &e)
                {
                    handle->mark_link_lost();
                    reap_link_loss_locked(*handle);
                    if (budget < 1)
                    {
                        logger_->error("Operation failed, no attempts left",
                                       core::LogContext{}.add("mac_address", handle->mac_address()).add("operation", operation).add("error", e.what()));
                        throw;
                    }
                    logger_->warning("Operation failed, reconnecting",
                                     core::LogContext{}.add("mac_address", handle->mac_address()).add("operation", operation).add("attempts_left", budget).add("error", e.what()));
                    last_error = e.what();
                }
                catch (const std::exception &)
                {
                    reap_link_loss_locked(*handle);
                    release_on_demand_locked(*handle, on_demand);
                    throw;
                }
            }
        }

        template <typename Fn>
        auto ConnectionManager::with_connected(const std::string &mac_address, const std::string &operation, Fn &&fn)
            -> decltype(fn(std::declval<GadgetHandle &>()))
        {
            auto mac = normalize_mac(mac_address, operation);
            auto handle = find(mac);
            if (!handle)
            {
                throw core::InvalidStateError(mac, operation, "gadget is not connected");
            }

            std::lock_guard<std::mutex> lock(handle->operation_mutex());
            reap_link_loss_locked(*handle);
            if (!handle->is_connected())
            {
                throw core::InvalidStateError(mac, operation, "gadget is not connected");
            }

            try
            {
                return fn(*handle);
            }
            catch (const core::ConnectionError &)
            {
                handle->mark_link_lost();
                reap_link_loss_locked(*handle);
                throw;
            }
            catch (const std::exception &)
            {
                reap_link_loss_locked(*handle);
                throw;
            }
        }

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_CONNECTION_MANAGER_HPP
