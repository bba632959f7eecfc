#ifndef HUMIBRIDGE_GADGET_LOGGED_RECORD_HPP
#define HUMIBRIDGE_GADGET_LOGGED_RECORD_HPP

#include "core/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace humibridge
{
    namespace gadget
    {

        /**
         * One sample from the device's logger. The timestamp is host time when `absolute`
         * is set, device time otherwise.
         */
        struct LoggedRecord
        {
            int64_t timestamp_ms = 0;
            bool absolute = false;
            std::optional<float> temperature;
            std::optional<float> humidity;
        };

        struct LoggedData
        {
            std::vector<LoggedRecord> temperatures;
            std::vector<LoggedRecord> humidities;
            // Deepest sequence index covered by completed pages, -1 when none completed
            int64_t last_index = -1;

            bool empty() const { return temperatures.empty() && humidities.empty(); }

            // [[temperature records], [humidity records]], each record a [timestamp, value] pair
            nlohmann::json to_json(bool as_datetime) const;
        };

        /**
         * A logger download stopped before the requested range was read.
         * Records of pages that completed before the interruption are attached.
         */
        class FetchInterruptedError : public core::GadgetError
        {
        public:
            FetchInterruptedError(const std::string &mac_address,
                                  const std::string &operation,
                                  const std::string &detail,
                                  LoggedData partial);

            const char *type_name() const override { return "FetchInterruptedError"; }
            const LoggedData &partial() const { return partial_; }

        private:
            LoggedData partial_;
        };

    } // namespace gadget
} // namespace humibridge

#endif // HUMIBRIDGE_GADGET_LOGGED_RECORD_HPP
