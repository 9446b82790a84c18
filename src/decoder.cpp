#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"
#include <esp_log.h>

namespace greeir
{

    Decoder::Decoder() = default;
    Decoder::Decoder(const greeir::Timing &timing)
    {
        if (!setTiming(timing))
        {
            ESP_LOGW(kTag, "decoder timing rejected, defaults kept");
        }
    }

    bool Decoder::setTiming(const greeir::Timing &timing)
    {
        if (!assembler_.setTiming(timing))
            return false;
        timing_ = timing;
        return true;
    }

    void Decoder::onWarning(WarningCallback callback) { warningCallback_ = std::move(callback); }

    void Decoder::reset()
    {
        assembler_.clear();
        lastDiscard_.reset();
    }

    void Decoder::emit(const greeir::Warning &w) const
    {
        if (warningCallback_)
            warningCallback_(w);
    }

    bool Decoder::feed(const std::vector<int32_t> &durations, bool isFrameStart, greeir::DecodeResult &out)
    {
        std::vector<int32_t> frame;
        std::vector<greeir::Warning> warnings;
        bool complete = assembler_.feed(durations, isFrameStart, frame, warnings);
        for (const auto &w : warnings)
        {
            emit(w);
            if (w.kind == greeir::WarningKind::EXTRA_BITS)
                lastDiscard_ = w;
        }
        if (!complete)
            return false;

        ESP_LOGD(kTag, "frame complete: %u durations", static_cast<unsigned>(frame.size()));
        decodeFrame(frame, out);
        // the discard warning precedes the ones raised while decoding
        if (lastDiscard_)
        {
            out.warnings.insert(out.warnings.begin(), *lastDiscard_);
            lastDiscard_.reset();
        }
        return true;
    }

    greeir::DecodeStatus Decoder::decodeFrame(const std::vector<int32_t> &frame, greeir::DecodeResult &out) const
    {
        out = greeir::DecodeResult{};
        out.raw = frame;

        greeir::DecodeStatus status = greeir::DecodeStatus::DECODED;
        if (!encodeCode(frame, out.code, status, timing_))
        {
            out.status = status;
            return out.status;
        }
        if (!extractPayload(out.code, out.bytes))
        {
            out.status = greeir::DecodeStatus::BAD_BIT_COUNT;
            return out.status;
        }

        std::vector<greeir::Warning> warnings;
        if (out.bytes.size() == proto_const::kStandardPayloadBytes)
        {
            // advisory only: a mismatch never stops decoding
            uint8_t received = 0;
            uint8_t calculated = 0;
            if (!matchChecksum(out.bytes, received, calculated))
            {
                ESP_LOGW(kTag, "checksum mismatch 0x%02X != 0x%02X", static_cast<unsigned>(received), static_cast<unsigned>(calculated));
                pushWarning(warnings, greeir::WarningKind::CHECKSUM_MISMATCH, 7, 0xF0, received, calculated);
            }
        }

        out.status = decodeFields(out.bytes, out.record, warnings);
        for (const auto &w : warnings)
        {
            emit(w);
        }
        out.warnings = std::move(warnings);
        if (out.status == greeir::DecodeStatus::LAYOUT_VIOLATION)
        {
            ESP_LOGE(kTag, "frame bits do not fit the field layout: %s", codeToString(out.code).c_str());
        }
        else if (out.status == greeir::DecodeStatus::DECODED)
        {
            ESP_LOGD(kTag, "%s", toString(out.record).c_str());
        }
        return out.status;
    }

} // namespace greeir
