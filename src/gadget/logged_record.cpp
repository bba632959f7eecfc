#include "gadget/logged_record.hpp"
#include "core/time_utils.hpp"

namespace humibridge
{
    namespace gadget
    {
        namespace
        {
            nlohmann::json records_to_json(const std::vector<LoggedRecord> &records, bool as_datetime)
            {
                nlohmann::json out = nlohmann::json::array();
                for (const auto &record : records)
                {
                    nlohmann::json timestamp = as_datetime ? nlohmann::json(core::format_iso8601(record.timestamp_ms))
                                                           : nlohmann::json(record.timestamp_ms);
                    std::optional<float> value = record.temperature.has_value() ? record.temperature : record.humidity;
                    out.push_back(nlohmann::json::array({timestamp, value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr)}));
                }
                return out;
            }
        } // namespace

        nlohmann::json LoggedData::to_json(bool as_datetime) const
        {
            return nlohmann::json::array({records_to_json(temperatures, as_datetime),
                                          records_to_json(humidities, as_datetime)});
        }

        FetchInterruptedError::FetchInterruptedError(const std::string &mac_address,
                                                     const std::string &operation,
                                                     const std::string &detail,
                                                     LoggedData partial)
            : core::GadgetError(mac_address, operation, detail), partial_(std::move(partial))
        {
        }

    } // namespace gadget
} // namespace humibridge
