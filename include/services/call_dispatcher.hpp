#ifndef HUMIBRIDGE_SERVICES_CALL_DISPATCHER_HPP
#define HUMIBRIDGE_SERVICES_CALL_DISPATCHER_HPP

#include "core/logger.hpp"
#include "gadget/connection_manager.hpp"
#include "gadget/notification_dispatcher.hpp"
#include "services/gadget_service.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace humibridge
{
    namespace services
    {

        /**
         * Named parameters of one call, keys already in snake_case
         */
        class CallParams
        {
        public:
            CallParams(std::string method, nlohmann::json values)
                : method_(std::move(method)), values_(std::move(values)) {}

            bool has(const std::string &name) const;
            const nlohmann::json &at(const std::string &name) const;

            template <typename T>
            T get(const std::string &name) const
            {
                return at(name).get<T>();
            }

            template <typename T>
            T get_or(const std::string &name, T fallback) const
            {
                return has(name) ? at(name).get<T>() : fallback;
            }

            std::string mac() const { return get<std::string>("mac"); }

            // int milliseconds, float seconds or an ISO-8601 string
            int64_t timestamp(const std::string &name) const;
            std::optional<int64_t> optional_timestamp(const std::string &name) const;

        private:
            std::string method_;
            nlohmann::json values_;
        };

        /**
         * JSON method-name dispatch onto GadgetService.
         *
         * Requests look like {"id": ..., "method": "connectGadget", "params": {...}}. Method
         * and parameter names may be camelCase or snake_case; params may also be a
         * positional array. Every exception becomes an error response.
         */
        class CallDispatcher
        {
        public:
            explicit CallDispatcher(GadgetService &service);

            nlohmann::json handle_request(const nlohmann::json &request);
            // Same as handle_request for one line of text; a parse error becomes an error response
            nlohmann::json handle_line(const std::string &line);

            bool shutdown_requested() const { return shutdown_requested_.load(); }
            std::vector<std::string> methods() const;

            static std::string to_snake_case(const std::string &name);

            static nlohmann::json notification_event(const gadget::NotificationEvent &event);
            static nlohmann::json connection_event(const gadget::ConnectionEvent &event);

        private:
            using Handler = std::function<nlohmann::json(const CallParams &)>;

            struct Method
            {
                std::vector<std::string> params;
                Handler handler;
            };

            void register_methods();
            void add(const std::string &name, std::vector<std::string> params, Handler handler);
            CallParams make_params(const std::string &method, const Method &entry, const nlohmann::json &params) const;

            static nlohmann::json error_response(const nlohmann::json &id, const std::string &type,
                                                 const std::string &message, const std::string &mac_address,
                                                 const std::string &operation);

            GadgetService &service_;
            std::map<std::string, Method> methods_;
            std::atomic<bool> shutdown_requested_;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace humibridge

#endif // HUMIBRIDGE_SERVICES_CALL_DISPATCHER_HPP
