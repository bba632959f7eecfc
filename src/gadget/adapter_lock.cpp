#include "gadget/adapter_lock.hpp"

namespace humibridge
{
    namespace gadget
    {

        void AdapterLock::lock()
        {
            std::unique_lock<std::mutex> lock(mutex_);
            const uint64_t ticket = next_ticket_++;
            cv_.wait(lock, [this, ticket]
                     { return now_serving_ == ticket; });
        }

        void AdapterLock::unlock()
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++now_serving_;
            }
            cv_.notify_all();
        }

        uint64_t AdapterLock::queued() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return next_ticket_ - now_serving_;
        }

    } // namespace gadget
} // namespace humibridge
