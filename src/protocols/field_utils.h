#pragma once

#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"
#include <esp_log.h>
#include <vector>

namespace greeir
{
    inline bool bit(uint8_t b, uint8_t mask)
    {
        return (b & mask) != 0;
    }

    // Masked value shifted down to bit 0
    inline uint8_t field(uint8_t b, uint8_t mask, uint8_t shift)
    {
        return static_cast<uint8_t>((b & mask) >> shift);
    }

    inline void expectZero(const std::vector<uint8_t> &bytes, uint8_t idx, uint8_t mask, const char *what,
                           std::vector<greeir::Warning> &warnings)
    {
        uint8_t v = static_cast<uint8_t>(bytes[idx] & mask);
        if (v != 0)
        {
            ESP_LOGW(kTag, "nonzero %u[0x%02X] %s 0x%02X", static_cast<unsigned>(idx), static_cast<unsigned>(mask), what, static_cast<unsigned>(v));
            pushWarning(warnings, greeir::WarningKind::RESERVED_BITS, idx, mask, v, 0);
        }
    }

    inline void expectSet(const std::vector<uint8_t> &bytes, uint8_t idx, uint8_t mask, const char *what,
                          std::vector<greeir::Warning> &warnings)
    {
        uint8_t v = static_cast<uint8_t>(bytes[idx] & mask);
        if (v != mask)
        {
            ESP_LOGW(kTag, "zero %u[0x%02X] %s 0x%02X", static_cast<unsigned>(idx), static_cast<unsigned>(mask), what, static_cast<unsigned>(v));
            pushWarning(warnings, greeir::WarningKind::LEAD_BIT_MISSING, idx, mask, v, mask);
        }
    }
} // namespace greeir
