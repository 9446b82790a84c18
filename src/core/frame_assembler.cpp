#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"
#include <cstddef>
#include <esp_log.h>

namespace greeir
{

    FrameAssembler::FrameAssembler(const greeir::Timing &timing)
    {
        // an invalid timing leaves the defaults in place
        if (!setTiming(timing))
        {
            ESP_LOGW(kTag, "assembler constructed with default timing");
        }
    }

    bool FrameAssembler::setTiming(const greeir::Timing &timing)
    {
        if (!validTiming(timing))
        {
            ESP_LOGW(kTag, "assembler timing rejected: empty classifier window");
            return false;
        }
        timing_ = timing;
        return true;
    }

    void FrameAssembler::clear() { buffer_.clear(); }

    bool FrameAssembler::feed(const std::vector<int32_t> &durations, bool isFrameStart,
                              std::vector<int32_t> &frameOut, std::vector<greeir::Warning> &warnings)
    {
        frameOut.clear();
        if (isFrameStart)
        {
            if (!buffer_.empty())
            {
                // previous frame never completed
                ESP_LOGW(kTag, "extra bits: %u durations discarded", static_cast<unsigned>(buffer_.size()));
                pushWarning(warnings, greeir::WarningKind::EXTRA_BITS, 0, 0, static_cast<uint32_t>(buffer_.size()), 0);
            }
            buffer_ = durations;
        }
        else
        {
            buffer_.insert(buffer_.end(), durations.begin(), durations.end());
        }

        if (buffer_.size() < 2)
            return false;
        if (isStartStandard(buffer_[0], buffer_[1], timing_) && buffer_.size() >= proto_const::kStandardFrameDurations)
            return cutFrame(proto_const::kStandardFrameDurations, frameOut);
        if (isStartShort(buffer_[0], buffer_[1], timing_) && buffer_.size() >= proto_const::kShortFrameDurations)
            return cutFrame(proto_const::kShortFrameDurations, frameOut);
        return false;
    }

    bool FrameAssembler::cutFrame(size_t length, std::vector<int32_t> &frameOut)
    {
        if (buffer_.size() > length)
        {
            ESP_LOGD(kTag, "frame cut at %u, %u trailing durations dropped",
                     static_cast<unsigned>(length), static_cast<unsigned>(buffer_.size() - length));
        }
        frameOut.assign(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(length));
        buffer_.clear();
        return true;
    }

} // namespace greeir
