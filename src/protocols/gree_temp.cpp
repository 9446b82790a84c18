#include "GreeIRDecoder.h"
#include "field_utils.h"

namespace greeir
{

    // I FEEL room temperature report (short frame)
    bool decodeTemp(const std::vector<uint8_t> &bytes, greeir::payload::Temp &out, std::vector<greeir::Warning> &warnings)
    {
        out = {};
        if (bytes.size() != proto_const::kShortPayloadBytes)
            return false;
        // fixed magic instead of a checksum
        if (bytes[1] != proto_const::kTempMagic)
        {
            ESP_LOGW(kTag, "invalid magic byte 0x%02X", static_cast<unsigned>(bytes[1]));
            pushWarning(warnings, greeir::WarningKind::MAGIC_MISMATCH, 1, 0xFF, bytes[1], proto_const::kTempMagic);
        }
        out.temp = bytes[0];
        return true;
    }

} // namespace greeir
