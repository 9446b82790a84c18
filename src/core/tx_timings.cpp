#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"
#include "core/timing_encode.h"
#include <esp_log.h>

namespace greeir
{

    namespace
    {
        using namespace proto_const;

        void appendMark(std::vector<int32_t> &seq, int32_t us)
        {
            timing_encode::appendPulse(seq, true, us);
        }
        void appendSpace(std::vector<int32_t> &seq, int32_t us)
        {
            timing_encode::appendPulse(seq, false, us);
        }
        void appendBytes(std::vector<int32_t> &seq, const uint8_t *bytes, size_t count)
        {
            timing_encode::appendBytes(seq, bytes, count, kBitMarkUs, kZeroSpaceUs, kOneSpaceUs);
        }
    } // namespace

    bool buildTimings(const std::vector<uint8_t> &bytes, std::vector<int32_t> &out)
    {
        using namespace proto_const;
        out.clear();
        if (bytes.size() == kStandardPayloadBytes)
        {
            out.reserve(kStandardFrameDurations);
            appendMark(out, kStandardHdrMarkUs);
            appendSpace(out, kStandardHdrSpaceUs);
            appendBytes(out, bytes.data(), 4);
            // sync 0 1 0 followed by the long intra-frame space
            timing_encode::appendBit(out, false, kBitMarkUs, kZeroSpaceUs, kOneSpaceUs);
            timing_encode::appendBit(out, true, kBitMarkUs, kZeroSpaceUs, kOneSpaceUs);
            timing_encode::appendBit(out, false, kBitMarkUs, kZeroSpaceUs, kOneSpaceUs);
            appendMark(out, kBitMarkUs);
            appendSpace(out, kSyncSpaceUs);
            appendBytes(out, bytes.data() + 4, 4);
            appendMark(out, kBitMarkUs); // stop
            return true;
        }
        if (bytes.size() == kShortPayloadBytes)
        {
            out.reserve(kShortFrameDurations);
            appendMark(out, kShortHdrMarkUs);
            appendSpace(out, kShortHdrSpaceUs);
            appendBytes(out, bytes.data(), 2);
            appendMark(out, kBitMarkUs);
            return true;
        }
        ESP_LOGE(kTag, "buildTimings: unsupported payload length %u", static_cast<unsigned>(bytes.size()));
        return false;
    }

} // namespace greeir
