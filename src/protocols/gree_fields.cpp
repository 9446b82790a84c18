#include "GreeIRDecoder.h"
#include "field_utils.h"

namespace greeir
{

    namespace
    {
        template <typename T>
        greeir::DecodeStatus decodeInto(bool (*fn)(const std::vector<uint8_t> &, T &, std::vector<greeir::Warning> &),
                                        const std::vector<uint8_t> &bytes, greeir::Record &out,
                                        std::vector<greeir::Warning> &warnings)
        {
            T frame{};
            if (!fn(bytes, frame, warnings))
            {
                return greeir::DecodeStatus::LAYOUT_VIOLATION;
            }
            out = frame;
            return greeir::DecodeStatus::DECODED;
        }
    } // namespace

    greeir::DecodeStatus decodeFields(const std::vector<uint8_t> &bytes, greeir::Record &out, std::vector<greeir::Warning> &warnings)
    {
        if (bytes.size() == proto_const::kStandardPayloadBytes)
        {
            uint8_t type = field(bytes[3], 0xF0, 4);
            switch (type)
            {
            case proto_const::kTypeBasic:
                return decodeInto<greeir::payload::Basic>(decodeBasic, bytes, out, warnings);
            case proto_const::kTypeTimer:
                return decodeInto<greeir::payload::Timer>(decodeTimer, bytes, out, warnings);
            case proto_const::kTypeFooter:
                return decodeInto<greeir::payload::Footer>(decodeFooter, bytes, out, warnings);
            default:
                ESP_LOGW(kTag, "unknown code type 0x%X", static_cast<unsigned>(type));
                return greeir::DecodeStatus::UNKNOWN_TYPE;
            }
        }
        if (bytes.size() == proto_const::kShortPayloadBytes)
        {
            return decodeInto<greeir::payload::Temp>(decodeTemp, bytes, out, warnings);
        }
        ESP_LOGW(kTag, "unsupported payload length %u", static_cast<unsigned>(bytes.size()));
        return greeir::DecodeStatus::UNSUPPORTED_LENGTH;
    }

} // namespace greeir
