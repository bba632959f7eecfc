#include "ble/gatt_profile.hpp"

#include <cstring>
#include <stdexcept>

namespace humibridge
{
    namespace ble
    {
        namespace
        {
            constexpr const char *GENERIC_ACCESS_SERVICE = "00001800-0000-1000-8000-00805f9b34fb";
            constexpr const char *BATTERY_SERVICE = "0000180f-0000-1000-8000-00805f9b34fb";
            constexpr const char *DEVICE_INFORMATION_SERVICE = "0000180a-0000-1000-8000-00805f9b34fb";

            // Sensirion services share the base UUID xxxxxxxx-b38d-4985-720e-0f993a68ee41
            constexpr const char *LOGGER_SERVICE = "0000f234-b38d-4985-720e-0f993a68ee41";
            constexpr const char *HUMIDITY_SERVICE = "00001234-b38d-4985-720e-0f993a68ee41";
            constexpr const char *TEMPERATURE_SERVICE = "00002234-b38d-4985-720e-0f993a68ee41";

            void require_size(const ByteArray &data, size_t needed)
            {
                if (data.size() < needed)
                {
                    throw std::length_error("payload has " + std::to_string(data.size()) +
                                            " bytes, expected at least " + std::to_string(needed));
                }
            }

            template <typename T>
            ByteArray encode_le(T value)
            {
                ByteArray out(sizeof(T));
                for (size_t i = 0; i < sizeof(T); ++i)
                {
                    out[i] = static_cast<uint8_t>((static_cast<uint64_t>(value) >> (8 * i)) & 0xFF);
                }
                return out;
            }

            template <typename T>
            T decode_le(const ByteArray &data, size_t offset)
            {
                require_size(data, offset + sizeof(T));
                uint64_t value = 0;
                for (size_t i = 0; i < sizeof(T); ++i)
                {
                    value |= static_cast<uint64_t>(data[offset + i]) << (8 * i);
                }
                return static_cast<T>(value);
            }
        } // namespace

        const GattAddress &gatt_address(Characteristic characteristic)
        {
            static const GattAddress device_name{GENERIC_ACCESS_SERVICE, "00002a00-0000-1000-8000-00805f9b34fb"};
            static const GattAddress battery{BATTERY_SERVICE, "00002a19-0000-1000-8000-00805f9b34fb"};
            static const GattAddress system_id{DEVICE_INFORMATION_SERVICE, "00002a23-0000-1000-8000-00805f9b34fb"};
            static const GattAddress model{DEVICE_INFORMATION_SERVICE, "00002a24-0000-1000-8000-00805f9b34fb"};
            static const GattAddress serial{DEVICE_INFORMATION_SERVICE, "00002a25-0000-1000-8000-00805f9b34fb"};
            static const GattAddress firmware{DEVICE_INFORMATION_SERVICE, "00002a26-0000-1000-8000-00805f9b34fb"};
            static const GattAddress hardware{DEVICE_INFORMATION_SERVICE, "00002a27-0000-1000-8000-00805f9b34fb"};
            static const GattAddress software{DEVICE_INFORMATION_SERVICE, "00002a28-0000-1000-8000-00805f9b34fb"};
            static const GattAddress manufacturer{DEVICE_INFORMATION_SERVICE, "00002a29-0000-1000-8000-00805f9b34fb"};
            static const GattAddress temperature{TEMPERATURE_SERVICE, "00002235-b38d-4985-720e-0f993a68ee41"};
            static const GattAddress humidity{HUMIDITY_SERVICE, "00001235-b38d-4985-720e-0f993a68ee41"};
            static const GattAddress sync_time{LOGGER_SERVICE, "0000f235-b38d-4985-720e-0f993a68ee41"};
            static const GattAddress oldest{LOGGER_SERVICE, "0000f236-b38d-4985-720e-0f993a68ee41"};
            static const GattAddress newest{LOGGER_SERVICE, "0000f237-b38d-4985-720e-0f993a68ee41"};
            static const GattAddress start_download{LOGGER_SERVICE, "0000f238-b38d-4985-720e-0f993a68ee41"};
            static const GattAddress interval{LOGGER_SERVICE, "0000f239-b38d-4985-720e-0f993a68ee41"};

            switch (characteristic)
            {
            case Characteristic::DeviceName:
                return device_name;
            case Characteristic::BatteryLevel:
                return battery;
            case Characteristic::SystemId:
                return system_id;
            case Characteristic::ModelNumber:
                return model;
            case Characteristic::SerialNumber:
                return serial;
            case Characteristic::FirmwareRevision:
                return firmware;
            case Characteristic::HardwareRevision:
                return hardware;
            case Characteristic::SoftwareRevision:
                return software;
            case Characteristic::ManufacturerName:
                return manufacturer;
            case Characteristic::Temperature:
                return temperature;
            case Characteristic::Humidity:
                return humidity;
            case Characteristic::SyncTime:
                return sync_time;
            case Characteristic::OldestTimestamp:
                return oldest;
            case Characteristic::NewestTimestamp:
                return newest;
            case Characteristic::StartLoggerDownload:
                return start_download;
            case Characteristic::LoggerInterval:
                return interval;
            }
            throw std::invalid_argument("unknown characteristic");
        }

        const char *to_string(Characteristic characteristic)
        {
            switch (characteristic)
            {
            case Characteristic::DeviceName:
                return "device_name";
            case Characteristic::BatteryLevel:
                return "battery_level";
            case Characteristic::SystemId:
                return "system_id";
            case Characteristic::ModelNumber:
                return "model_number";
            case Characteristic::SerialNumber:
                return "serial_number";
            case Characteristic::FirmwareRevision:
                return "firmware_revision";
            case Characteristic::HardwareRevision:
                return "hardware_revision";
            case Characteristic::SoftwareRevision:
                return "software_revision";
            case Characteristic::ManufacturerName:
                return "manufacturer_name";
            case Characteristic::Temperature:
                return "temperature";
            case Characteristic::Humidity:
                return "humidity";
            case Characteristic::SyncTime:
                return "sync_time_ms";
            case Characteristic::OldestTimestamp:
                return "oldest_timestamp_ms";
            case Characteristic::NewestTimestamp:
                return "newest_timestamp_ms";
            case Characteristic::StartLoggerDownload:
                return "start_logger_download";
            case Characteristic::LoggerInterval:
                return "logger_interval_ms";
            }
            return "unknown";
        }

        ByteArray encode_u8(uint8_t value)
        {
            return ByteArray{value};
        }

        ByteArray encode_u32(uint32_t value)
        {
            return encode_le<uint32_t>(value);
        }

        ByteArray encode_u64(uint64_t value)
        {
            return encode_le<uint64_t>(value);
        }

        uint8_t decode_u8(const ByteArray &data)
        {
            require_size(data, 1);
            return data[0];
        }

        uint32_t decode_u32(const ByteArray &data, size_t offset)
        {
            return decode_le<uint32_t>(data, offset);
        }

        uint64_t decode_u64(const ByteArray &data)
        {
            return decode_le<uint64_t>(data, 0);
        }

        float decode_f32(const ByteArray &data, size_t offset)
        {
            uint32_t bits = decode_le<uint32_t>(data, offset);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }

        ByteArray encode_f32(float value)
        {
            uint32_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            return encode_le<uint32_t>(bits);
        }

        std::string decode_string(const ByteArray &data)
        {
            std::string out(data.begin(), data.end());
            auto end = out.find('\0');
            if (end != std::string::npos)
            {
                out.resize(end);
            }
            return out;
        }

    } // namespace ble
} // namespace humibridge
