#ifndef HUMIBRIDGE_GADGET_ADAPTER_LOCK_HPP
#define HUMIBRIDGE_GADGET_ADAPTER_LOCK_HPP

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace humibridge
{
    namespace gadget
    {

        /**
         * Exclusive lock on the BLE adapter, granted in request order.
         * Held for exactly one connect, disconnect, scan or reset negotiation.
         * Satisfies BasicLockable so it works with std::lock_guard.
         */
        class AdapterLock
        {
        public:
            AdapterLock() = default;

            AdapterLock(const AdapterLock &) = delete;
            AdapterLock &operator=(const AdapterLock &) = delete;

            void lock();
            void unlock();

            // Requests waiting or holding the lock
            uint64_t queued() const;

        private:
            mutable std::mutex mutex_;
            std::condition_variable cv_;
            uint64_t next_ticket_ = 0;
            uint64_t now_serving_ = 0;
        };

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_ADAPTER_LOCK_HPP
