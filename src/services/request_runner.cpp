#include "services/request_runner.hpp"

#include <exception>

namespace humibridge
{
    namespace services
    {

        RequestRunner::RequestRunner()
            : logger_(core::get_logger("RequestRunner"))
        {
        }

        RequestRunner::~RequestRunner()
        {
            join_all();
        }

        void RequestRunner::submit(std::function<void()> job)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reap_locked();

            auto done = std::make_shared<std::atomic<bool>>(false);
            auto logger = logger_;
            std::thread thread([job = std::move(job), done, logger]()
                               {
                                   try
                                   {
                                       job();
                                   }
                                   catch (const std::exception &e)
                                   {
                                       logger->error("Request thread failed", core::LogContext{}.add("error", e.what()));
                                   }
                                   done->store(true); });
            workers_.push_back(Worker{std::move(thread), done});
        }

        size_t RequestRunner::active()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            reap_locked();
            return workers_.size();
        }

        void RequestRunner::join_all()
        {
            std::list<Worker> workers;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                workers.swap(workers_);
            }

            for (auto &worker : workers)
            {
                if (worker.thread.joinable())
                    worker.thread.join();
            }
        }

        void RequestRunner::reap_locked()
        {
            for (auto it = workers_.begin(); it != workers_.end();)
            {
                if (it->done->load())
                {
                    it->thread.join();
                    it = workers_.erase(it);
                }
                else
                {
                    ++it;
                }
            }
        }

    } // namespace services
} // namespace humibridge
