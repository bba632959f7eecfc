#ifndef HUMIBRIDGE_CORE_TIME_UTILS_HPP
#define HUMIBRIDGE_CORE_TIME_UTILS_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace humibridge
{
    namespace core
    {

        int64_t system_now_ms();

        /**
         * Parse "YYYY-MM-DD HH:MM:SS[.ffffff]" (a 'T' separator is accepted) as host local time.
         * Throws std::invalid_argument on malformed input.
         */
        int64_t parse_iso8601_ms(const std::string &text);

        // Host local time, "YYYY-MM-DD HH:MM:SS" followed by fraction_digits (0, 3 or 6) digits
        std::string format_iso8601(int64_t milliseconds, int fraction_digits = 3);

        /**
         * Timestamp argument as accepted on the call-in surface:
         * integer = milliseconds, floating point = seconds, string = ISO-8601.
         */
        int64_t to_milliseconds(const nlohmann::json &value);

    } // namespace core
} // namespace humibridge

#endif // HUMIBRIDGE_CORE_TIME_UTILS_HPP
