#include "GreeIRDecoder.h"
#include "field_utils.h"

namespace greeir
{

    bool decodeTimer(const std::vector<uint8_t> &bytes, greeir::payload::Timer &out, std::vector<greeir::Warning> &warnings)
    {
        out = {};
        if (!decodeCommon(bytes, out.common, warnings))
            return false;

        expectSet(bytes, 5, 0x08, "on-lead", warnings);
        expectZero(bytes, 7, 0x0C, "control-unused", warnings);

        // Minutes from now: on = 5[2:0]:4[7:0], off = 6[7:0]:5[6:4]
        out.onMins = static_cast<uint16_t>((field(bytes[5], 0x07, 0) << 8) | bytes[4]);
        // Set when the remote pushed the off time to keep 15 minutes from the on time
        out.overlap = bit(bytes[5], 0x80);
        out.offMins = static_cast<uint16_t>((bytes[6] << 4) | field(bytes[5], 0x70, 4));

        out.onSet = bit(bytes[7], 0x02);
        out.offSet = bit(bytes[7], 0x01);
        return true;
    }

} // namespace greeir
