#include "services/call_dispatcher.hpp"
#include "core/errors.hpp"
#include "core/time_utils.hpp"
#include "gadget/logged_record.hpp"

#include <cctype>
#include <stdexcept>

namespace humibridge
{
    namespace services
    {

        bool CallParams::has(const std::string &name) const
        {
            auto it = values_.find(name);
            return it != values_.end() && !it->is_null();
        }

        const nlohmann::json &CallParams::at(const std::string &name) const
        {
            if (name == "mac_address" && !has(name) && has("mac"))
            {
                return values_.at("mac");
            }
            if (!has(name))
            {
                throw core::InvalidArgumentError("", method_, "missing parameter '" + name + "'");
            }
            return values_.at(name);
        }

        int64_t CallParams::timestamp(const std::string &name) const
        {
            try
            {
                return core::to_milliseconds(at(name));
            }
            catch (const std::invalid_argument &e)
            {
                throw core::InvalidArgumentError("", method_, "parameter '" + name + "': " + e.what());
            }
        }

        std::optional<int64_t> CallParams::optional_timestamp(const std::string &name) const
        {
            if (!has(name))
                return std::nullopt;
            return timestamp(name);
        }

        CallDispatcher::CallDispatcher(GadgetService &service)
            : service_(service),
              shutdown_requested_(false),
              logger_(core::get_logger("CallDispatcher"))
        {
            register_methods();
        }

        std::string CallDispatcher::to_snake_case(const std::string &name)
        {
            std::string result;
            result.reserve(name.size() + 8);
            for (char c : name)
            {
                if (std::isupper(static_cast<unsigned char>(c)))
                {
                    if (!result.empty())
                        result += '_';
                    result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                }
                else
                {
                    result += c;
                }
            }
            return result;
        }

        void CallDispatcher::add(const std::string &name, std::vector<std::string> params, Handler handler)
        {
            methods_[name] = Method{std::move(params), std::move(handler)};
        }

        std::vector<std::string> CallDispatcher::methods() const
        {
            std::vector<std::string> names;
            names.reserve(methods_.size());
            for (const auto &[name, method] : methods_)
            {
                names.push_back(name);
            }
            return names;
        }

        void CallDispatcher::register_methods()
        {
            using nlohmann::json;
            const std::vector<std::string> mac_only = {"mac_address"};

            // Connections
            add("scan", {"timeout", "passive"}, [this](const CallParams &p)
                { return json(service_.scan(p.get_or<double>("timeout", 10.0), p.get_or<bool>("passive", false))); });
            add("connect_gadget", {"mac_address", "strict"}, [this](const CallParams &p)
                { return json(service_.connect_gadget(p.mac(), p.get_or<bool>("strict", true))); });
            add("connect_gadgets", {"mac_addresses", "strict"}, [this](const CallParams &p)
                {
                    auto result = service_.connect_gadgets(p.get<std::vector<std::string>>("mac_addresses"),
                                                           p.get_or<bool>("strict", true));
                    return json::array({result.connected, result.failed}); });
            add("connected_gadgets", {}, [this](const CallParams &)
                { return json(service_.connected_gadgets()); });
            add("disconnect_gadget", mac_only, [this](const CallParams &p)
                {
                    service_.disconnect_gadget(p.mac());
                    return json(nullptr); });
            add("disconnect_gadgets", {}, [this](const CallParams &)
                {
                    service_.disconnect_gadgets();
                    return json(nullptr); });
            add("max_attempts", {}, [this](const CallParams &)
                { return json(service_.max_attempts()); });
            add("set_max_attempts", {"max_attempts"}, [this](const CallParams &p)
                {
                    service_.set_max_attempts(p.get<int>("max_attempts"));
                    return json(nullptr); });
            add("restart_bluetooth", {}, [this](const CallParams &)
                {
                    service_.restart_bluetooth();
                    return json(nullptr); });

            // Polled reads
            add("battery", mac_only, [this](const CallParams &p)
                { return json(service_.battery(p.mac())); });
            add("info", mac_only, [this](const CallParams &p)
                { return service_.info(p.mac()).to_json(); });
            add("rssi", mac_only, [this](const CallParams &p)
                {
                    auto rssi = service_.rssi(p.mac());
                    return rssi.has_value() ? json(*rssi) : json(nullptr); });
            add("temperature", mac_only, [this](const CallParams &p)
                { return json(service_.temperature(p.mac())); });
            add("humidity", mac_only, [this](const CallParams &p)
                { return json(service_.humidity(p.mac())); });
            add("temperature_humidity", mac_only, [this](const CallParams &p)
                {
                    auto [t, h] = service_.temperature_humidity(p.mac());
                    return json::array({t, h}); });
            add("dewpoint", {"mac_address", "temperature", "humidity"}, [this](const CallParams &p)
                {
                    std::optional<double> t;
                    std::optional<double> h;
                    if (p.has("temperature"))
                        t = p.get<double>("temperature");
                    if (p.has("humidity"))
                        h = p.get<double>("humidity");
                    return json(service_.dewpoint(p.mac(), t, h)); });
            add("temperature_humidity_dewpoint", mac_only, [this](const CallParams &p)
                {
                    auto [t, h, dp] = service_.temperature_humidity_dewpoint(p.mac());
                    return json::array({t, h, dp}); });

            // Notifications
            add("enable_temperature_notifications", mac_only, [this](const CallParams &p)
                {
                    service_.enable_temperature_notifications(p.mac());
                    return json(nullptr); });
            add("disable_temperature_notifications", mac_only, [this](const CallParams &p)
                {
                    service_.disable_temperature_notifications(p.mac());
                    return json(nullptr); });
            add("temperature_notifications_enabled", mac_only, [this](const CallParams &p)
                { return json(service_.temperature_notifications_enabled(p.mac())); });
            add("enable_humidity_notifications", mac_only, [this](const CallParams &p)
                {
                    service_.enable_humidity_notifications(p.mac());
                    return json(nullptr); });
            add("disable_humidity_notifications", mac_only, [this](const CallParams &p)
                {
                    service_.disable_humidity_notifications(p.mac());
                    return json(nullptr); });
            add("humidity_notifications_enabled", mac_only, [this](const CallParams &p)
                { return json(service_.humidity_notifications_enabled(p.mac())); });

            // Logger
            add("fetch_logged_data",
                {"mac_address", "enable_temperature", "enable_humidity", "sync", "oldest", "newest", "as_datetime", "num_iterations"},
                [this](const CallParams &p)
                {
                    gadget::FetchRequest request;
                    request.enable_temperature = p.get_or<bool>("enable_temperature", true);
                    request.enable_humidity = p.get_or<bool>("enable_humidity", true);
                    if (p.has("sync"))
                    {
                        const auto &sync = p.at("sync");
                        if (sync.is_boolean())
                        {
                            request.sync = sync.get<bool>();
                        }
                        else if (sync.is_string() && sync.get<std::string>() == "now")
                        {
                            request.sync = true;
                        }
                        else
                        {
                            request.sync = true;
                            request.sync_timestamp_ms = p.timestamp("sync");
                        }
                    }
                    request.oldest_ms = p.optional_timestamp("oldest");
                    request.newest_ms = p.optional_timestamp("newest");
                    request.as_datetime = p.get_or<bool>("as_datetime", false);
                    request.num_iterations = p.get_or<int>("num_iterations", 1);
                    return service_.fetch_logged_data(p.mac(), request).to_json(request.as_datetime);
                });
            add("cancel_fetch", mac_only, [this](const CallParams &p)
                { return json(service_.cancel_fetch(p.mac())); });
            add("fetch_in_progress", mac_only, [this](const CallParams &p)
                { return json(service_.fetch_in_progress(p.mac())); });
            add("oldest_timestamp", mac_only, [this](const CallParams &p)
                { return json(service_.oldest_timestamp(p.mac())); });
            add("newest_timestamp", mac_only, [this](const CallParams &p)
                { return json(service_.newest_timestamp(p.mac())); });
            add("set_oldest_timestamp", {"mac_address", "timestamp"}, [this](const CallParams &p)
                {
                    service_.set_oldest_timestamp(p.mac(), p.timestamp("timestamp"));
                    return json(nullptr); });
            add("set_newest_timestamp", {"mac_address", "timestamp"}, [this](const CallParams &p)
                {
                    service_.set_newest_timestamp(p.mac(), p.timestamp("timestamp"));
                    return json(nullptr); });
            add("logger_interval", mac_only, [this](const CallParams &p)
                { return json(service_.logger_interval(p.mac())); });
            add("set_logger_interval", {"mac_address", "milliseconds"}, [this](const CallParams &p)
                {
                    service_.set_logger_interval(p.mac(), p.get<int64_t>("milliseconds"));
                    return json(nullptr); });

            // Clocks
            add("rpi_date", {}, [this](const CallParams &)
                { return json(service_.rpi_date()); });
            add("set_rpi_date", {"date"}, [this](const CallParams &p)
                {
                    service_.set_rpi_date(p.timestamp("date"));
                    return json(nullptr); });
            add("set_sync_time", {"mac_address", "timestamp"}, [this](const CallParams &p)
                { return json(service_.set_sync_time(p.mac(), p.optional_timestamp("timestamp"))); });

            add("shutdown_service", {}, [this](const CallParams &)
                {
                    service_.shutdown_service();
                    shutdown_requested_.store(true);
                    return json(nullptr); });
        }

        CallParams CallDispatcher::make_params(const std::string &method, const Method &entry,
                                               const nlohmann::json &params) const
        {
            nlohmann::json named = nlohmann::json::object();

            if (params.is_null())
            {
                return CallParams(method, named);
            }

            if (params.is_array())
            {
                if (params.size() > entry.params.size())
                {
                    throw core::InvalidArgumentError("", method,
                                                     "takes " + std::to_string(entry.params.size()) +
                                                         " parameters, " + std::to_string(params.size()) + " given");
                }
                for (size_t i = 0; i < params.size(); ++i)
                {
                    named[entry.params[i]] = params[i];
                }
                return CallParams(method, named);
            }

            if (!params.is_object())
            {
                throw core::InvalidArgumentError("", method, "params must be an object or an array");
            }

            for (auto it = params.begin(); it != params.end(); ++it)
            {
                named[to_snake_case(it.key())] = it.value();
            }
            return CallParams(method, named);
        }

        nlohmann::json CallDispatcher::error_response(const nlohmann::json &id, const std::string &type,
                                                      const std::string &message, const std::string &mac_address,
                                                      const std::string &operation)
        {
            nlohmann::json error = {
                {"type", type},
                {"message", message},
                {"mac_address", mac_address.empty() ? nlohmann::json(nullptr) : nlohmann::json(mac_address)},
                {"operation", operation}};
            return {{"id", id}, {"error", error}};
        }

        nlohmann::json CallDispatcher::handle_request(const nlohmann::json &request)
        {
            nlohmann::json id = nullptr;
            std::string method;
            bool as_datetime = false;

            try
            {
                if (!request.is_object())
                {
                    throw core::InvalidArgumentError("", "request", "request must be a JSON object");
                }
                if (request.contains("id"))
                {
                    id = request.at("id");
                }
                if (!request.contains("method") || !request.at("method").is_string())
                {
                    throw core::InvalidArgumentError("", "request", "missing method name");
                }

                method = to_snake_case(request.at("method").get<std::string>());
                auto entry = methods_.find(method);
                if (entry == methods_.end())
                {
                    logger_->warning("Unknown method", core::LogContext{}.add("method", method));
                    return error_response(id, "MethodNotFound", "no method named '" + method + "'", "", method);
                }

                auto params = make_params(method, entry->second, request.value("params", nlohmann::json()));
                if (params.has("as_datetime") && params.at("as_datetime").is_boolean())
                {
                    as_datetime = params.get<bool>("as_datetime");
                }

                logger_->debug("Dispatching call", core::LogContext{}.add("method", method));
                auto result = entry->second.handler(params);
                return {{"id", id}, {"result", result}};
            }
            catch (const gadget::FetchInterruptedError &e)
            {
                logger_->warning("Fetch interrupted",
                                 core::LogContext{}.add("mac_address", e.mac_address()).add("reason", e.detail()));
                auto response = error_response(id, e.type_name(), e.what(), e.mac_address(), e.operation());
                response["error"]["partial"] = e.partial().to_json(as_datetime);
                return response;
            }
            catch (const core::GadgetError &e)
            {
                logger_->debug("Call failed",
                               core::LogContext{}.add("method", method).add("type", e.type_name()).add("error", e.what()));
                return error_response(id, e.type_name(), e.what(), e.mac_address(), e.operation());
            }
            catch (const nlohmann::json::exception &e)
            {
                return error_response(id, "InvalidArgumentError", e.what(), "", method);
            }
            catch (const std::invalid_argument &e)
            {
                return error_response(id, "InvalidArgumentError", e.what(), "", method);
            }
            catch (const std::exception &e)
            {
                logger_->error("Call raised an unexpected error",
                               core::LogContext{}.add("method", method).add("error", e.what()));
                return error_response(id, "Error", e.what(), "", method);
            }
        }

        nlohmann::json CallDispatcher::handle_line(const std::string &line)
        {
            nlohmann::json request;
            try
            {
                request = nlohmann::json::parse(line);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                return error_response(nullptr, "InvalidArgumentError", std::string("malformed request: ") + e.what(),
                                      "", "request");
            }
            return handle_request(request);
        }

        nlohmann::json CallDispatcher::notification_event(const gadget::NotificationEvent &event)
        {
            return {
                {"event", "notification"},
                {"mac_address", event.mac_address},
                {"kind", gadget::to_string(event.kind)},
                {"value", event.value},
                {"timestamp", event.host_ms}};
        }

        nlohmann::json CallDispatcher::connection_event(const gadget::ConnectionEvent &event)
        {
            nlohmann::json j = {
                {"event", "connection"},
                {"mac_address", event.mac_address},
                {"kind", gadget::to_string(event.kind)}};
            if (event.offline_for.has_value())
            {
                j["offline_for_ms"] = event.offline_for->count();
            }
            return j;
        }

    } // namespace services
} // namespace humibridge
