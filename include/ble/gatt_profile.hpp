#ifndef HUMIBRIDGE_BLE_GATT_PROFILE_HPP
#define HUMIBRIDGE_BLE_GATT_PROFILE_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace humibridge
{
    namespace ble
    {

        using ByteArray = std::vector<uint8_t>;

        /**
         * Logical names of the Smart Humigadget (SHT3x profile) characteristics
         */
        enum class Characteristic
        {
            DeviceName,
            BatteryLevel,
            SystemId,
            ModelNumber,
            SerialNumber,
            FirmwareRevision,
            HardwareRevision,
            SoftwareRevision,
            ManufacturerName,
            Temperature,
            Humidity,
            SyncTime,
            OldestTimestamp,
            NewestTimestamp,
            StartLoggerDownload,
            LoggerInterval
        };

        struct GattAddress
        {
            const char *service_uuid;
            const char *characteristic_uuid;
        };

        const GattAddress &gatt_address(Characteristic characteristic);
        const char *to_string(Characteristic characteristic);

        // Little-endian field codecs. Decoders throw std::length_error on a short payload.
        ByteArray encode_u8(uint8_t value);
        ByteArray encode_u32(uint32_t value);
        ByteArray encode_u64(uint64_t value);
        ByteArray encode_f32(float value);

        uint8_t decode_u8(const ByteArray &data);
        uint32_t decode_u32(const ByteArray &data, size_t offset = 0);
        uint64_t decode_u64(const ByteArray &data);
        float decode_f32(const ByteArray &data, size_t offset = 0);
        std::string decode_string(const ByteArray &data);

    } // namespace ble
} // namespace humibridge

#endif // HUMIBRIDGE_BLE_GATT_PROFILE_HPP
