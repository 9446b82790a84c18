#include "GreeIRDecoder.h"
#include "field_utils.h"

namespace greeir
{

    bool decodeBasic(const std::vector<uint8_t> &bytes, greeir::payload::Basic &out, std::vector<greeir::Warning> &warnings)
    {
        out = {};
        if (!decodeCommon(bytes, out.common, warnings))
            return false;

        expectSet(bytes, 5, 0x80, "func3-lead", warnings);
        expectZero(bytes, 5, 0x38, "func3-unused", warnings);
        expectZero(bytes, 6, 0xFF, "unused", warnings);
        expectZero(bytes, 7, 0x0B, "control-unused", warnings);

        // Byte 4: air guides
        uint8_t h = field(bytes[4], 0xF0, 4);
        uint8_t v = field(bytes[4], 0x0F, 0);
        if (!hGuideFromBits(h, out.hGuide))
        {
            ESP_LOGE(kTag, "h_guide bits 0x%02X out of range", static_cast<unsigned>(h));
            return false;
        }
        if (!vGuideFromBits(v, out.vGuide))
        {
            ESP_LOGE(kTag, "v_guide bits 0x%02X out of range", static_cast<unsigned>(v));
            return false;
        }

        // Byte 5
        out.wifi = bit(bytes[5], 0x40);
        out.ifeel = bit(bytes[5], 0x04);
        if (!tempDisplayFromBits(field(bytes[5], 0x03, 0), out.tempDisplay))
            return false;

        // Byte 7: energy saving in Cool, absence in Heat
        out.energySave = bit(bytes[7], 0x04);

        // The byte 0 swing flag repeats what the guides already say
        bool guidesSwing = isSwinging(out.hGuide) || isSwinging(out.vGuide);
        if (out.common.swing.value_or(false) == guidesSwing)
        {
            out.common.swing.reset();
        }
        else
        {
            ESP_LOGW(kTag, "swing flag %d disagrees with guides %s/%s", out.common.swing.value_or(false) ? 1 : 0,
                     toString(out.hGuide), toString(out.vGuide));
            pushWarning(warnings, greeir::WarningKind::SWING_MISMATCH, 0, 0x40,
                        out.common.swing.value_or(false) ? 1u : 0u, guidesSwing ? 1u : 0u);
        }
        return true;
    }

} // namespace greeir
