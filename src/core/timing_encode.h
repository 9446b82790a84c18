#pragma once

#include <stddef.h>
#include <stdint.h>
#include <vector>

namespace greeir
{
    namespace timing_encode
    {
        // Marks are positive, spaces negative
        inline void appendPulse(std::vector<int32_t> &seq, bool mark, int32_t durationUs)
        {
            if (durationUs <= 0)
            {
                return;
            }
            seq.push_back(mark ? durationUs : -durationUs);
        }

        inline void appendBit(std::vector<int32_t> &seq, bool one, int32_t bitMarkUs, int32_t zeroSpaceUs, int32_t oneSpaceUs)
        {
            appendPulse(seq, true, bitMarkUs);
            appendPulse(seq, false, one ? oneSpaceUs : zeroSpaceUs);
        }

        // LSB-first per byte
        inline void appendBytes(std::vector<int32_t> &seq, const uint8_t *bytes, size_t count,
                                int32_t bitMarkUs, int32_t zeroSpaceUs, int32_t oneSpaceUs)
        {
            for (size_t bit = 0; bit < count * 8; ++bit)
            {
                appendBit(seq, (bytes[bit / 8] >> (bit % 8)) & 0x1, bitMarkUs, zeroSpaceUs, oneSpaceUs);
            }
        }
    } // namespace timing_encode
} // namespace greeir
