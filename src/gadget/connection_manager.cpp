#include "gadget/connection_manager.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>

namespace humibridge
{
    namespace gadget
    {

        const char *to_string(ConnectionEventKind kind)
        {
            switch (kind)
            {
            case ConnectionEventKind::Connected:
                return "connected";
            case ConnectionEventKind::Disconnected:
                return "disconnected";
            case ConnectionEventKind::LinkLost:
                return "link_lost";
            case ConnectionEventKind::AdapterReset:
                return "adapter_reset";
            }
            return "unknown";
        }

        ConnectionManager::ConnectionManager(ble::IBLEBackend &backend, const core::BridgeConfig &config)
            : backend_(backend),
              config_(config),
              max_attempts_(config.ble.max_attempts),
              shut_down_(false),
              logger_(core::get_logger("ConnectionManager"))
        {
        }

        ConnectionManager::~ConnectionManager()
        {
            shutdown();
        }

        std::string ConnectionManager::normalize_mac(const std::string &mac_address, const std::string &operation)
        {
            std::string out;
            out.reserve(17);
            int digits = 0;
            int octets = 0;

            for (char c : mac_address)
            {
                if (std::isxdigit(static_cast<unsigned char>(c)))
                {
                    if (digits == 2)
                        throw core::InvalidArgumentError(mac_address, operation, "malformed MAC address");
                    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
                    ++digits;
                }
                else if (c == ':' || c == '-')
                {
                    if (digits != 2)
                        throw core::InvalidArgumentError(mac_address, operation, "malformed MAC address");
                    out.push_back(':');
                    digits = 0;
                    ++octets;
                }
                else
                {
                    throw core::InvalidArgumentError(mac_address, operation, "malformed MAC address");
                }
            }

            if (digits != 2 || octets != 5)
            {
                throw core::InvalidArgumentError(mac_address, operation, "malformed MAC address");
            }
            return out;
        }

        std::shared_ptr<GadgetHandle> ConnectionManager::find(const std::string &mac_address) const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);

            auto it = handles_.find(mac_address);
            if (it != handles_.end())
            {
                return it->second;
            }
            return nullptr;
        }

        std::shared_ptr<GadgetHandle> ConnectionManager::get_or_create(const std::string &mac_address)
        {
            {
                std::shared_lock<std::shared_mutex> lock(mutex_);
                auto it = handles_.find(mac_address);
                if (it != handles_.end())
                    return it->second;
            }

            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto &slot = handles_[mac_address];
            if (!slot)
            {
                slot = std::make_shared<GadgetHandle>(mac_address);
                logger_->debug("Created gadget handle", core::LogContext{}.add("mac_address", mac_address));
            }
            return slot;
        }

        std::vector<std::shared_ptr<GadgetHandle>> ConnectionManager::all_handles() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);

            std::vector<std::shared_ptr<GadgetHandle>> result;
            result.reserve(handles_.size());
            for (const auto &[mac, handle] : handles_)
            {
                result.push_back(handle);
            }
            return result;
        }

        std::vector<std::string> ConnectionManager::scan(double timeout_s, bool passive)
        {
            auto timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_s * 1000.0));
            logger_->info("Scanning for gadgets",
                          core::LogContext{}.add("device_name", config_.ble.device_name).add("timeout_s", timeout_s).add("passive", passive));

            std::vector<ble::Advertisement> advertisements;
            {
                std::lock_guard<AdapterLock> adapter(adapter_lock_);
                advertisements = backend_.scan(timeout, passive);
            }

            std::vector<std::string> found;
            for (const auto &adv : advertisements)
            {
                if (adv.name != config_.ble.device_name)
                    continue;

                std::string mac;
                try
                {
                    mac = normalize_mac(adv.address, "scan");
                }
                catch (const core::InvalidArgumentError &)
                {
                    logger_->warning("Ignoring advertisement with unusable address", core::LogContext{}.add("address", adv.address));
                    continue;
                }

                if (std::find(found.begin(), found.end(), mac) != found.end())
                    continue;

                get_or_create(mac)->set_last_seen_rssi(adv.rssi);
                found.push_back(mac);
            }

            logger_->info("Scan finished", core::LogContext{}.add("found", found.size()));
            return found;
        }

        std::optional<int> ConnectionManager::connect_locked(GadgetHandle &handle, int attempts,
                                                             const std::string &operation, std::string &last_error,
                                                             int &attempts_made)
        {
            reap_link_loss_locked(handle);
            if (handle.is_connected())
                return 0;

            if (shut_down_.load())
            {
                last_error = "service is shutting down";
                return std::nullopt;
            }

            const auto timeout = std::chrono::milliseconds(config_.ble.connect_timeout_ms);
            int busy_streak = 0;

            for (int attempt = 1; attempt <= attempts; ++attempt)
            {
                ++attempts_made;
                handle.set_state(ConnectionState::Connecting);
                logger_->info(handle.explicitly_requested() ? "Re-connecting to gadget" : "Connecting to gadget",
                              core::LogContext{}.add("mac_address", handle.mac_address()).add("attempt", attempt).add("max_attempts", attempts).add("operation", operation));

                try
                {
                    std::unique_ptr<ble::IGadgetSession> session;
                    {
                        std::lock_guard<AdapterLock> adapter(adapter_lock_);
                        session = backend_.connect(handle.mac_address(), timeout);
                    }

                    std::weak_ptr<GadgetHandle> weak = find(handle.mac_address());
                    session->set_on_disconnected([this, weak]()
                                                 { on_link_lost(weak); });

                    auto offline = handle.offline_for();
                    handle.attach_session(std::move(session));
                    handle.set_state(ConnectionState::Connected);
                    handle.reset_attempts();

                    logger_->info("Connected to gadget", core::LogContext{}.add("mac_address", handle.mac_address()).add("attempt", attempt));
                    notify(ConnectionEvent{handle.mac_address(), ConnectionEventKind::Connected, offline});
                    return attempt;
                }
                catch (const core::AdapterBusyError &e)
                {
                    handle.increment_attempts();
                    handle.set_state(ConnectionState::Disconnected);
                    last_error = e.what();

                    if (attempt < attempts)
                    {
                        int factor = 1 << std::min(busy_streak, 3);
                        auto backoff = std::chrono::milliseconds(config_.ble.busy_backoff_ms * factor);
                        logger_->warning("Adapter busy, backing off",
                                         core::LogContext{}.add("mac_address", handle.mac_address()).add("backoff_ms", backoff.count()).add("attempts_left", attempts - attempt));
                        std::this_thread::sleep_for(backoff);
                    }
                    ++busy_streak;
                }
                catch (const core::ConnectionError &e)
                {
                    handle.increment_attempts();
                    handle.set_state(ConnectionState::Disconnected);
                    last_error = e.what();
                    busy_streak = 0;

                    logger_->warning("Connection attempt failed",
                                     core::LogContext{}.add("mac_address", handle.mac_address()).add("attempts_left", attempts - attempt).add("error", e.what()));
                }
            }

            return std::nullopt;
        }

        bool ConnectionManager::connect_gadget(const std::string &mac_address, bool strict, std::optional<int> max_attempts)
        {
            auto mac = normalize_mac(mac_address, "connect_gadget");
            if (max_attempts.has_value() && *max_attempts < 1)
            {
                throw core::InvalidArgumentError(mac, "connect_gadget", "max_attempts must be positive");
            }

            auto handle = get_or_create(mac);
            std::lock_guard<std::mutex> lock(handle->operation_mutex());

            std::string last_error;
            int attempts = max_attempts.value_or(this->max_attempts());
            int attempts_made = 0;
            if (connect_locked(*handle, attempts, "connect_gadget", last_error, attempts_made).has_value())
            {
                handle->set_explicitly_requested(true);
                return true;
            }

            logger_->error("Could not connect to gadget",
                           core::LogContext{}.add("mac_address", mac).add("attempts", attempts_made).add("strict", strict).add("error", last_error));
            if (strict)
            {
                throw core::ConnectionError(mac, "connect_gadget",
                                            "no connection after " + std::to_string(attempts_made) + " attempts: " + last_error);
            }
            return false;
        }

        BulkConnectResult ConnectionManager::connect_gadgets(const std::vector<std::string> &mac_addresses, bool strict)
        {
            BulkConnectResult result;

            std::vector<std::pair<std::string, bool>> plan;
            plan.reserve(mac_addresses.size());
            for (const auto &mac : mac_addresses)
            {
                try
                {
                    plan.emplace_back(normalize_mac(mac, "connect_gadgets"), true);
                }
                catch (const core::InvalidArgumentError &)
                {
                    if (strict)
                        throw;
                    plan.emplace_back(mac, false);
                }
            }

            for (const auto &[mac, valid] : plan)
            {
                if (!valid)
                {
                    result.failed.push_back(mac);
                    continue;
                }

                if (connect_gadget(mac, false))
                    result.connected.push_back(mac);
                else
                    result.failed.push_back(mac);
            }

            logger_->info("Bulk connect finished",
                          core::LogContext{}.add("connected", result.connected.size()).add("failed", result.failed.size()));
            return result;
        }

        void ConnectionManager::disconnect_gadget(const std::string &mac_address)
        {
            auto handle = find(normalize_mac(mac_address, "disconnect_gadget"));
            if (!handle)
                return;

            std::lock_guard<std::mutex> lock(handle->operation_mutex());
            handle->set_explicitly_requested(false);
            reap_link_loss_locked(*handle);
            if (!handle->has_session() && handle->state() == ConnectionState::Disconnected)
                return;

            logger_->info("Disconnecting from gadget", core::LogContext{}.add("mac_address", handle->mac_address()));
            teardown_locked(*handle, true);
        }

        void ConnectionManager::disconnect_gadgets()
        {
            for (const auto &handle : all_handles())
            {
                disconnect_gadget(handle->mac_address());
            }
        }

        std::vector<std::string> ConnectionManager::connected_gadgets() const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);

            std::vector<std::string> result;
            for (const auto &[mac, handle] : handles_)
            {
                if (handle->is_connected())
                    result.push_back(mac);
            }
            return result;
        }

        void ConnectionManager::restart_bluetooth()
        {
            logger_->info("Restarting Bluetooth");
            auto handles = all_handles();

            // Running fetches see the reset through the observer and let go of their handle locks
            std::vector<std::shared_ptr<GadgetHandle>> affected;
            for (const auto &handle : handles)
            {
                if (handle->state() != ConnectionState::Disconnected || handle->has_session())
                {
                    handle->mark_link_lost();
                    affected.push_back(handle);
                    notify(ConnectionEvent{handle->mac_address(), ConnectionEventKind::AdapterReset, std::nullopt});
                }
            }

            for (const auto &handle : affected)
            {
                std::lock_guard<std::mutex> lock(handle->operation_mutex());
                teardown_locked(*handle, false);
            }

            std::lock_guard<AdapterLock> adapter(adapter_lock_);
            backend_.reset_adapter();
            logger_->info("Bluetooth restarted", core::LogContext{}.add("invalidated_handles", affected.size()));
        }

        void ConnectionManager::set_max_attempts(int max_attempts)
        {
            if (max_attempts < 1)
            {
                throw core::InvalidArgumentError("", "set_max_attempts",
                                                 "max_attempts must be positive, got " + std::to_string(max_attempts));
            }
            max_attempts_.store(max_attempts);
            logger_->debug("Maximum attempts updated", core::LogContext{}.add("max_attempts", max_attempts));
        }

        void ConnectionManager::shutdown()
        {
            if (shut_down_.exchange(true))
                return;

            logger_->info("Shutting down, disconnecting every gadget");
            for (const auto &handle : all_handles())
            {
                std::lock_guard<std::mutex> lock(handle->operation_mutex());
                handle->set_explicitly_requested(false);
                if (handle->has_session() || handle->state() != ConnectionState::Disconnected)
                    teardown_locked(*handle, true);
            }
        }

        void ConnectionManager::set_connection_observer(ConnectionObserver observer)
        {
            std::lock_guard<std::mutex> lock(observer_mutex_);
            observer_ = std::move(observer);
        }

        void ConnectionManager::teardown_locked(GadgetHandle &handle, bool report)
        {
            bool was_lost = handle.link_lost();
            handle.set_state(ConnectionState::Disconnecting);
            {
                std::lock_guard<AdapterLock> adapter(adapter_lock_);
                handle.release_session();
            }

            if (report)
            {
                notify(ConnectionEvent{handle.mac_address(),
                                       was_lost ? ConnectionEventKind::LinkLost : ConnectionEventKind::Disconnected,
                                       std::nullopt});
            }
        }

        void ConnectionManager::reap_link_loss_locked(GadgetHandle &handle)
        {
            if (!handle.link_lost())
                return;

            logger_->warning("Connection lost, dropping session", core::LogContext{}.add("mac_address", handle.mac_address()));
            teardown_locked(handle, false);
        }

        void ConnectionManager::release_on_demand_locked(GadgetHandle &handle, bool on_demand)
        {
            if (on_demand && !handle.explicitly_requested() && handle.has_session())
            {
                logger_->debug("Closing on-demand connection", core::LogContext{}.add("mac_address", handle.mac_address()));
                teardown_locked(handle, true);
            }
        }

        void ConnectionManager::on_link_lost(const std::weak_ptr<GadgetHandle> &weak_handle)
        {
            auto handle = weak_handle.lock();
            if (!handle || handle->state() != ConnectionState::Connected || handle->link_lost())
                return;

            handle->mark_link_lost();
            logger_->warning("Gadget dropped the connection", core::LogContext{}.add("mac_address", handle->mac_address()));
            notify(ConnectionEvent{handle->mac_address(), ConnectionEventKind::LinkLost, std::nullopt});
        }

        void ConnectionManager::notify(const ConnectionEvent &event)
        {
            ConnectionObserver observer;
            {
                std::lock_guard<std::mutex> lock(observer_mutex_);
                observer = observer_;
            }
            if (observer)
                observer(event);
        }

    } // namespace gadget
} // namespace humibridge
