#ifndef HUMIBRIDGE_SERVICES_REQUEST_RUNNER_HPP
#define HUMIBRIDGE_SERVICES_REQUEST_RUNNER_HPP

#include "core/logger.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

namespace humibridge
{
    namespace services
    {

        /**
         * Runs each request on its own thread so a long call (fetchLoggedData) never
         * blocks the ones behind it. Finished threads are joined on the next submit.
         */
        class RequestRunner
        {
        public:
            RequestRunner();
            ~RequestRunner();

            RequestRunner(const RequestRunner &) = delete;
            RequestRunner &operator=(const RequestRunner &) = delete;

            void submit(std::function<void()> job);

            // Threads still running after finished ones are joined
            size_t active();

            void join_all();

        private:
            struct Worker
            {
                std::thread thread;
                std::shared_ptr<std::atomic<bool>> done;
            };

            void reap_locked();

            std::mutex mutex_;
            std::list<Worker> workers_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace humibridge

#endif // HUMIBRIDGE_SERVICES_REQUEST_RUNNER_HPP
