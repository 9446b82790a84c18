#pragma once

#include "GreeIRDecoder.h"
#include <vector>

namespace greeir
{
    constexpr const char *kTag = "GreeIRDecoder";

    // Exclusive window check: lo < v < hi
    inline bool inWindow(int32_t v, int32_t lo, int32_t hi)
    {
        return v > lo && v < hi;
    }

    inline void pushWarning(std::vector<greeir::Warning> &out, greeir::WarningKind kind, uint8_t byteIndex, uint8_t mask,
                            uint32_t value, uint32_t expected)
    {
        out.push_back(greeir::Warning{kind, byteIndex, mask, value, expected});
    }
} // namespace greeir
