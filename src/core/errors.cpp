#include "core/errors.hpp"

namespace humibridge
{
    namespace core
    {

        namespace
        {
            std::string compose(const std::string &mac_address,
                                const std::string &operation,
                                const std::string &detail)
            {
                std::string message = operation + " failed";
                if (!mac_address.empty())
                {
                    message += " for " + mac_address;
                }
                if (!detail.empty())
                {
                    message += ": " + detail;
                }
                return message;
            }
        } // namespace

        GadgetError::GadgetError(const std::string &mac_address,
                                 const std::string &operation,
                                 const std::string &detail)
            : std::runtime_error(compose(mac_address, operation, detail)),
              mac_address_(mac_address),
              operation_(operation),
              detail_(detail)
        {
        }

    } // namespace core
} // namespace humibridge
