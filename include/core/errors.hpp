#ifndef HUMIBRIDGE_CORE_ERRORS_HPP
#define HUMIBRIDGE_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace humibridge
{
    namespace core
    {

        /**
         * Base of every failure reported for a gadget operation.
         * The message always names the operation and, when known, the MAC address.
         */
        class GadgetError : public std::runtime_error
        {
        public:
            GadgetError(const std::string &mac_address,
                        const std::string &operation,
                        const std::string &detail);

            const std::string &mac_address() const { return mac_address_; }
            const std::string &operation() const { return operation_; }
            const std::string &detail() const { return detail_; }

            virtual const char *type_name() const = 0;

        private:
            std::string mac_address_;
            std::string operation_;
            std::string detail_;
        };

        // Adapter or link failure, or the retry budget ran out
        class ConnectionError : public GadgetError
        {
        public:
            using GadgetError::GadgetError;
            const char *type_name() const override { return "ConnectionError"; }
        };

        // The handle is not in the state the operation needs
        class InvalidStateError : public GadgetError
        {
        public:
            using GadgetError::GadgetError;
            const char *type_name() const override { return "InvalidStateError"; }
        };

        class InvalidArgumentError : public GadgetError
        {
        public:
            using GadgetError::GadgetError;
            const char *type_name() const override { return "InvalidArgumentError"; }
        };

        // Transient: the adapter is negotiating something else. Retried internally.
        class AdapterBusyError : public GadgetError
        {
        public:
            using GadgetError::GadgetError;
            const char *type_name() const override { return "AdapterBusyError"; }
        };

    } // namespace core
} // namespace humibridge

#endif // HUMIBRIDGE_CORE_ERRORS_HPP
