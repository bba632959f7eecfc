#include "core/host_system.hpp"
#include "core/logger.hpp"
#include "core/time_utils.hpp"

#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace humibridge
{
    namespace core
    {

        bool run_command(const std::string &cmd, const std::shared_ptr<Logger> &logger)
        {
            logger->debug("exec", LogContext().add("cmd", cmd));
            int rc = std::system(cmd.c_str());
            if (rc == -1)
            {
                logger->error("could not spawn shell", LogContext().add("cmd", cmd));
                return false;
            }

            int status = WIFEXITED(rc) ? WEXITSTATUS(rc) : rc;
            if (status != 0)
            {
                logger->warning("non-zero exit", LogContext().add("rc", status).add("cmd", cmd));
            }
            return status == 0;
        }

        SystemHostClock::SystemHostClock()
            : logger_(get_logger("HostClock"))
        {
        }

        int64_t SystemHostClock::now_ms() const
        {
            return system_now_ms();
        }

        void SystemHostClock::set_time_ms(int64_t milliseconds)
        {
            std::ostringstream cmd;
            cmd << "sudo date -s @" << milliseconds / 1000 << "." << std::setfill('0') << std::setw(3)
                << milliseconds % 1000 << " > /dev/null";

            logger_->info("Setting host date", LogContext().add("date", format_iso8601(milliseconds)));
            if (!run_command(cmd.str(), logger_))
            {
                throw std::runtime_error("could not set the host date to " + format_iso8601(milliseconds));
            }
        }

    } // namespace core
} // namespace humibridge
