#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"
#include <esp_log.h>

namespace greeir
{

    // 4-bit sum of the low nibbles of bytes 0..3, the high nibbles of bytes
    // 4..6 and a constant 0x0A. Byte 7 carries the result in its high nibble.
    uint8_t computeChecksum(const std::vector<uint8_t> &bytes)
    {
        if (bytes.size() != proto_const::kStandardPayloadBytes)
            return 0;
        uint32_t sum = proto_const::kChecksumSeed;
        for (size_t i = 0; i < 4; ++i)
            sum += bytes[i] & 0x0F;
        for (size_t i = 4; i < 7; ++i)
            sum += (bytes[i] & 0xF0) >> 4;
        return static_cast<uint8_t>(sum & 0x0F);
    }

    bool matchChecksum(const std::vector<uint8_t> &bytes, uint8_t &received, uint8_t &calculated)
    {
        received = 0;
        calculated = 0;
        if (bytes.size() != proto_const::kStandardPayloadBytes)
        {
            ESP_LOGW(kTag, "checksum requested for %u-byte payload", static_cast<unsigned>(bytes.size()));
            return false;
        }
        received = static_cast<uint8_t>((bytes[7] & 0xF0) >> 4);
        calculated = computeChecksum(bytes);
        return received == calculated;
    }

    bool applyChecksum(std::vector<uint8_t> &bytes)
    {
        if (bytes.size() != proto_const::kStandardPayloadBytes)
            return false;
        bytes[7] = static_cast<uint8_t>((bytes[7] & 0x0F) | (computeChecksum(bytes) << 4));
        return true;
    }

} // namespace greeir
