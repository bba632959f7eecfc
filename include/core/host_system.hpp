#ifndef HUMIBRIDGE_CORE_HOST_SYSTEM_HPP
#define HUMIBRIDGE_CORE_HOST_SYSTEM_HPP

#include <cstdint>
#include <memory>
#include <string>

namespace humibridge
{
    namespace core
    {
        class Logger;

        /**
         * Runs a shell command and logs a non-zero exit status.
         * Returns true when the command exited with status 0.
         */
        bool run_command(const std::string &cmd, const std::shared_ptr<Logger> &logger);

        /**
         * The host clock used as the time reference for every gadget
         */
        class IHostClock
        {
        public:
            virtual ~IHostClock() = default;

            virtual int64_t now_ms() const = 0;
            virtual void set_time_ms(int64_t milliseconds) = 0;
        };

        class SystemHostClock : public IHostClock
        {
        public:
            SystemHostClock();

            int64_t now_ms() const override;

            // Throws std::runtime_error when `date -s` fails
            void set_time_ms(int64_t milliseconds) override;

        private:
            std::shared_ptr<Logger> logger_;
        };

    } // namespace core
} // namespace humibridge

#endif // HUMIBRIDGE_CORE_HOST_SYSTEM_HPP
