#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"
#include <algorithm>
#include <iterator>
#include <esp_log.h>

namespace greeir
{

    namespace
    {
        char symbolChar(greeir::Symbol s)
        {
            switch (s)
            {
            case greeir::Symbol::StartStandard:
                return 'S';
            case greeir::Symbol::StartShort:
                return 's';
            case greeir::Symbol::Zero:
                return '0';
            case greeir::Symbol::One:
                return '1';
            case greeir::Symbol::Space:
                return '_';
            case greeir::Symbol::Stop:
                return '$';
            default:
                return 'x';
            }
        }

        bool isBitSymbol(greeir::Symbol s)
        {
            return s == greeir::Symbol::Zero || s == greeir::Symbol::One;
        }
    } // namespace

    std::string codeToString(const std::vector<greeir::Symbol> &code)
    {
        std::string s;
        s.reserve(code.size());
        for (auto sym : code)
        {
            s.push_back(symbolChar(sym));
        }
        return s;
    }

    bool codeShape(const std::vector<greeir::Symbol> &code, greeir::FrameShape &shape)
    {
        if (code.empty() || code.back() != greeir::Symbol::Stop)
            return false;
        size_t spaces = static_cast<size_t>(std::count(code.begin(), code.end(), greeir::Symbol::Space));
        if (code.front() == greeir::Symbol::StartStandard && spaces == 1 && code.size() == proto_const::kStandardCodeSymbols)
        {
            shape = greeir::FrameShape::Standard;
            return true;
        }
        if (code.front() == greeir::Symbol::StartShort && spaces == 0 && code.size() == proto_const::kShortCodeSymbols)
        {
            shape = greeir::FrameShape::Short;
            return true;
        }
        return false;
    }

    bool encodeCode(const std::vector<int32_t> &frame, std::vector<greeir::Symbol> &code,
                    greeir::DecodeStatus &status, const greeir::Timing &timing)
    {
        code.clear();
        // N pairs plus the closing mark that bounds the last space
        if (frame.size() % 2 == 0)
        {
            ESP_LOGW(kTag, "even bits: frame has %u durations", static_cast<unsigned>(frame.size()));
            status = greeir::DecodeStatus::EVEN_LENGTH;
            return false;
        }
        code.reserve(frame.size() / 2 + 1);
        for (size_t i = 0; i + 1 < frame.size(); i += 2)
        {
            code.push_back(classifyPair(frame[i], frame[i + 1], timing));
        }
        code.push_back(isBitLead(frame.back(), timing) ? greeir::Symbol::Stop : greeir::Symbol::Invalid);

        if (std::find(code.begin(), code.end(), greeir::Symbol::Invalid) != code.end())
        {
            ESP_LOGW(kTag, "invalid bit: %s", codeToString(code).c_str());
            status = greeir::DecodeStatus::INVALID_SYMBOL;
            return false;
        }
        greeir::FrameShape shape;
        if (!codeShape(code, shape))
        {
            ESP_LOGW(kTag, "invalid code structure (%u durations): %s",
                     static_cast<unsigned>(frame.size()), codeToString(code).c_str());
            status = greeir::DecodeStatus::BAD_STRUCTURE;
            return false;
        }
        ESP_LOGD(kTag, "code %s", codeToString(code).c_str());
        status = greeir::DecodeStatus::DECODED;
        return true;
    }

    bool extractPayload(const std::vector<greeir::Symbol> &code, std::vector<uint8_t> &out)
    {
        out.clear();
        if (code.size() < 2)
            return false;
        std::vector<greeir::Symbol> bits(code.begin() + 1, code.end() - 1);

        // Drop the Zero-One-Zero-Space sync run between the two 4-byte halves
        static const greeir::Symbol kSync[proto_const::kSyncSymbols] = {
            greeir::Symbol::Zero, greeir::Symbol::One, greeir::Symbol::Zero, greeir::Symbol::Space};
        auto it = std::search(bits.begin(), bits.end(), std::begin(kSync), std::end(kSync));
        if (it != bits.end())
        {
            bits.erase(it, it + proto_const::kSyncSymbols);
        }

        if (bits.size() % 8 != 0 || !std::all_of(bits.begin(), bits.end(), isBitSymbol))
        {
            ESP_LOGW(kTag, "invalid code length: %u bits in %s",
                     static_cast<unsigned>(bits.size()), codeToString(code).c_str());
            return false;
        }
        out.reserve(bits.size() / 8);
        for (size_t i = 0; i < bits.size(); i += 8)
        {
            uint8_t b = 0;
            for (size_t j = 0; j < 8; ++j)
            {
                if (bits[i + j] == greeir::Symbol::One)
                    b |= static_cast<uint8_t>(1u << j); // LSB first
            }
            out.push_back(b);
        }
        return true;
    }

} // namespace greeir
