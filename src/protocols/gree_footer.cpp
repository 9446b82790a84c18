#include "GreeIRDecoder.h"
#include "field_utils.h"

namespace greeir
{

    // Terminates a command sequence; carries nothing but the type and checksum
    bool decodeFooter(const std::vector<uint8_t> &bytes, greeir::payload::Footer &out, std::vector<greeir::Warning> &warnings)
    {
        out = {};
        if (bytes.size() != proto_const::kStandardPayloadBytes)
            return false;
        static const uint8_t kUnusedBytes[] = {0, 1, 2, 4, 5, 6};
        for (uint8_t idx : kUnusedBytes)
        {
            expectZero(bytes, idx, 0xFF, "footer-unused", warnings);
        }
        expectZero(bytes, 3, 0x0F, "footer-unused", warnings);
        expectZero(bytes, 7, 0x0F, "footer-unused", warnings);
        return true;
    }

} // namespace greeir
