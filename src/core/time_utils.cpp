#include "core/time_utils.hpp"

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace humibridge
{
    namespace core
    {

        int64_t system_now_ms()
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }

        int64_t parse_iso8601_ms(const std::string &text)
        {
            std::string normalized = text;
            auto t_pos = normalized.find('T');
            if (t_pos != std::string::npos)
            {
                normalized[t_pos] = ' ';
            }

            std::string fraction;
            auto dot = normalized.find('.');
            if (dot != std::string::npos)
            {
                fraction = normalized.substr(dot + 1);
                normalized = normalized.substr(0, dot);
            }

            std::tm tm{};
            std::istringstream ss(normalized);
            ss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
            if (ss.fail() || !(ss >> std::ws).eof())
            {
                throw std::invalid_argument("not an ISO-8601 timestamp: '" + text + "'");
            }

            int64_t millis = 0;
            if (!fraction.empty())
            {
                if (fraction.find_first_not_of("0123456789") != std::string::npos)
                {
                    throw std::invalid_argument("not an ISO-8601 timestamp: '" + text + "'");
                }
                // microseconds are rounded to the nearest millisecond
                fraction.resize(6, '0');
                millis = (std::stoll(fraction) + 500) / 1000;
            }

            tm.tm_isdst = -1;
            std::time_t seconds = std::mktime(&tm);
            if (seconds == static_cast<std::time_t>(-1))
            {
                throw std::invalid_argument("timestamp out of range: '" + text + "'");
            }

            return static_cast<int64_t>(seconds) * 1000 + millis;
        }

        std::string format_iso8601(int64_t milliseconds, int fraction_digits)
        {
            int64_t seconds = milliseconds / 1000;
            int64_t remainder = milliseconds % 1000;
            if (remainder < 0)
            {
                remainder += 1000;
                seconds -= 1;
            }

            std::time_t time = static_cast<std::time_t>(seconds);
            std::tm local_tm{};
            localtime_r(&time, &local_tm);

            std::ostringstream ss;
            ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
            if (fraction_digits == 3)
            {
                ss << "." << std::setfill('0') << std::setw(3) << remainder;
            }
            else if (fraction_digits == 6)
            {
                ss << "." << std::setfill('0') << std::setw(6) << remainder * 1000;
            }
            return ss.str();
        }

        int64_t to_milliseconds(const nlohmann::json &value)
        {
            if (value.is_number_integer())
            {
                return value.get<int64_t>();
            }
            if (value.is_number_float())
            {
                return static_cast<int64_t>(std::llround(value.get<double>() * 1e3));
            }
            if (value.is_string())
            {
                return parse_iso8601_ms(value.get<std::string>());
            }
            throw std::invalid_argument("timestamp must be milliseconds, seconds or an ISO-8601 string, got " +
                                        value.dump());
        }

    } // namespace core
} // namespace humibridge
