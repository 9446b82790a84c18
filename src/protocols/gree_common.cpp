#include "GreeIRDecoder.h"
#include "field_utils.h"

namespace greeir
{

    bool modeFromBits(uint8_t raw, greeir::Mode &out)
    {
        switch (raw)
        {
        case 0:
            out = greeir::Mode::Auto;
            return true;
        case 1:
            out = greeir::Mode::Cool;
            return true;
        case 2:
            out = greeir::Mode::Dry;
            return true;
        case 3:
            out = greeir::Mode::Fan;
            return true;
        case 4:
            out = greeir::Mode::Heat;
            return true;
        default:
            return false;
        }
    }

    bool fanFromBits(uint8_t raw, greeir::Fan &out)
    {
        if (raw > 3)
            return false;
        out = static_cast<greeir::Fan>(raw);
        return true;
    }

    bool hGuideFromBits(uint8_t raw, greeir::HGuide &out)
    {
        switch (raw)
        {
        case 0:
        case 1:
        case 2:
        case 3:
        case 4:
        case 5:
        case 6:
        case 12:
        case 13:
            out = static_cast<greeir::HGuide>(raw);
            return true;
        default:
            return false;
        }
    }

    bool vGuideFromBits(uint8_t raw, greeir::VGuide &out)
    {
        switch (raw)
        {
        case 0:
        case 1:
        case 2:
        case 3:
        case 4:
        case 5:
        case 6:
        case 7:
        case 9:
        case 11:
            out = static_cast<greeir::VGuide>(raw);
            return true;
        default:
            return false;
        }
    }

    bool tempDisplayFromBits(uint8_t raw, greeir::TempDisplay &out)
    {
        if (raw > 3)
            return false;
        out = static_cast<greeir::TempDisplay>(raw);
        return true;
    }

    bool isSwinging(greeir::HGuide guide)
    {
        return guide == greeir::HGuide::SwingLeftRight || guide == greeir::HGuide::SwingInOut;
    }

    bool isSwinging(greeir::VGuide guide)
    {
        switch (guide)
        {
        case greeir::VGuide::SwingUpDown:
        case greeir::VGuide::SwingDown:
        case greeir::VGuide::SwingMid:
        case greeir::VGuide::SwingUp:
            return true;
        default:
            return false;
        }
    }

    bool decodeCommon(const std::vector<uint8_t> &bytes, greeir::payload::Common &out, std::vector<greeir::Warning> &warnings)
    {
        out = {};
        if (bytes.size() != proto_const::kStandardPayloadBytes)
            return false;

        // Byte 0: basic functions
        out.sleep = bit(bytes[0], 0x80);
        out.swing = bit(bytes[0], 0x40);
        uint8_t fan = field(bytes[0], 0x30, 4);
        if (!fanFromBits(fan, out.fan))
        {
            ESP_LOGE(kTag, "fan bits 0x%02X out of range", static_cast<unsigned>(fan));
            return false;
        }
        out.on = bit(bytes[0], 0x08);
        uint8_t mode = field(bytes[0], 0x07, 0);
        if (!modeFromBits(mode, out.mode))
        {
            ESP_LOGE(kTag, "mode bits 0x%02X out of range", static_cast<unsigned>(mode));
            return false;
        }

        // Byte 1: target temperature and coarse timer (hours to the nearest event)
        out.timer = bit(bytes[1], 0x80);
        out.timerHours = field(bytes[1], 0x60, 5) * 10.0 + field(bytes[2], 0x0F, 0) * 1.0 + field(bytes[1], 0x10, 4) * 0.5;
        // Half-degree steps are only reachable with the Fahrenheit scale
        out.temp = field(bytes[1], 0x0F, 0) + (bit(bytes[3], 0x04) ? 16.5 : 16.0);

        // Byte 2: functions
        out.xFan = bit(bytes[2], 0x80);
        out.health = bit(bytes[2], 0x40);
        out.light = bit(bytes[2], 0x20);
        out.turbo = bit(bytes[2], 0x10);

        // Byte 3: more functions, frame type in the high nibble
        out.fahrenheit = bit(bytes[3], 0x08);
        out.freshAir = bit(bytes[3], 0x01);
        expectZero(bytes, 3, 0x02, "func2-unused", warnings);
        return true;
    }

} // namespace greeir
