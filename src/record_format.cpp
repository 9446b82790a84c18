#include "GreeIRDecoder.h"
#include <cstdio>

namespace greeir
{

    namespace
    {
        std::string boolText(bool v) { return v ? "true" : "false"; }

        std::string fixedText(double v)
        {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f", v);
            return buf;
        }

        void describeCommon(const greeir::payload::Common &c, greeir::FieldList &out)
        {
            out.emplace_back("sleep", boolText(c.sleep));
            if (c.swing)
                out.emplace_back("swing", boolText(*c.swing));
            out.emplace_back("fan", toString(c.fan));
            out.emplace_back("on", boolText(c.on));
            out.emplace_back("mode", toString(c.mode));
            out.emplace_back("timer", boolText(c.timer));
            out.emplace_back("timer_hours", fixedText(c.timerHours));
            out.emplace_back("temp", fixedText(c.temp));
            out.emplace_back("x_fan", boolText(c.xFan));
            out.emplace_back("health", boolText(c.health));
            out.emplace_back("light", boolText(c.light));
            out.emplace_back("turbo", boolText(c.turbo));
            out.emplace_back("fahrenheit", boolText(c.fahrenheit));
            out.emplace_back("fresh_air", boolText(c.freshAir));
        }

        struct Describer
        {
            greeir::FieldList &out;

            void operator()(const greeir::payload::Basic &b) const
            {
                describeCommon(b.common, out);
                out.emplace_back("h_guide", toString(b.hGuide));
                out.emplace_back("v_guide", toString(b.vGuide));
                out.emplace_back("wifi", boolText(b.wifi));
                out.emplace_back("ifeel", boolText(b.ifeel));
                out.emplace_back("temp_display", toString(b.tempDisplay));
                out.emplace_back("energy_save", boolText(b.energySave));
            }
            void operator()(const greeir::payload::Timer &t) const
            {
                describeCommon(t.common, out);
                out.emplace_back("on_mins", std::to_string(t.onMins));
                out.emplace_back("overlap", boolText(t.overlap));
                out.emplace_back("off_mins", std::to_string(t.offMins));
                out.emplace_back("on_set", boolText(t.onSet));
                out.emplace_back("off_set", boolText(t.offSet));
            }
            void operator()(const greeir::payload::Footer &) const {}
            void operator()(const greeir::payload::Temp &t) const
            {
                out.emplace_back("temp", std::to_string(t.temp));
            }
        };
    } // namespace

    const char *toString(greeir::Symbol symbol)
    {
        switch (symbol)
        {
        case greeir::Symbol::StartStandard:
            return "StartStandard";
        case greeir::Symbol::StartShort:
            return "StartShort";
        case greeir::Symbol::Zero:
            return "Zero";
        case greeir::Symbol::One:
            return "One";
        case greeir::Symbol::Space:
            return "Space";
        case greeir::Symbol::Stop:
            return "Stop";
        case greeir::Symbol::Invalid:
            return "Invalid";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::DecodeStatus status)
    {
        switch (status)
        {
        case greeir::DecodeStatus::DECODED:
            return "DECODED";
        case greeir::DecodeStatus::EVEN_LENGTH:
            return "EVEN_LENGTH";
        case greeir::DecodeStatus::INVALID_SYMBOL:
            return "INVALID_SYMBOL";
        case greeir::DecodeStatus::BAD_STRUCTURE:
            return "BAD_STRUCTURE";
        case greeir::DecodeStatus::BAD_BIT_COUNT:
            return "BAD_BIT_COUNT";
        case greeir::DecodeStatus::UNKNOWN_TYPE:
            return "UNKNOWN_TYPE";
        case greeir::DecodeStatus::UNSUPPORTED_LENGTH:
            return "UNSUPPORTED_LENGTH";
        case greeir::DecodeStatus::LAYOUT_VIOLATION:
            return "LAYOUT_VIOLATION";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::WarningKind kind)
    {
        switch (kind)
        {
        case greeir::WarningKind::EXTRA_BITS:
            return "EXTRA_BITS";
        case greeir::WarningKind::CHECKSUM_MISMATCH:
            return "CHECKSUM_MISMATCH";
        case greeir::WarningKind::RESERVED_BITS:
            return "RESERVED_BITS";
        case greeir::WarningKind::LEAD_BIT_MISSING:
            return "LEAD_BIT_MISSING";
        case greeir::WarningKind::MAGIC_MISMATCH:
            return "MAGIC_MISMATCH";
        case greeir::WarningKind::SWING_MISMATCH:
            return "SWING_MISMATCH";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::Mode mode)
    {
        switch (mode)
        {
        case greeir::Mode::Auto:
            return "Auto";
        case greeir::Mode::Cool:
            return "Cool";
        case greeir::Mode::Dry:
            return "Dry";
        case greeir::Mode::Fan:
            return "Fan";
        case greeir::Mode::Heat:
            return "Heat";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::Fan fan)
    {
        switch (fan)
        {
        case greeir::Fan::Auto:
            return "Auto";
        case greeir::Fan::Low:
            return "Low";
        case greeir::Fan::Med:
            return "Med";
        case greeir::Fan::High:
            return "High";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::HGuide guide)
    {
        switch (guide)
        {
        case greeir::HGuide::Closed:
            return "Closed";
        case greeir::HGuide::SwingLeftRight:
            return "SwingLeftRight";
        case greeir::HGuide::Left:
            return "Left";
        case greeir::HGuide::MidLeft:
            return "MidLeft";
        case greeir::HGuide::Mid:
            return "Mid";
        case greeir::HGuide::MidRight:
            return "MidRight";
        case greeir::HGuide::Right:
            return "Right";
        case greeir::HGuide::Out:
            return "Out";
        case greeir::HGuide::SwingInOut:
            return "SwingInOut";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::VGuide guide)
    {
        switch (guide)
        {
        case greeir::VGuide::Closed:
            return "Closed";
        case greeir::VGuide::SwingUpDown:
            return "SwingUpDown";
        case greeir::VGuide::Up:
            return "Up";
        case greeir::VGuide::MidUp:
            return "MidUp";
        case greeir::VGuide::Mid:
            return "Mid";
        case greeir::VGuide::MidDown:
            return "MidDown";
        case greeir::VGuide::Down:
            return "Down";
        case greeir::VGuide::SwingDown:
            return "SwingDown";
        case greeir::VGuide::SwingMid:
            return "SwingMid";
        case greeir::VGuide::SwingUp:
            return "SwingUp";
        }
        return "UNKNOWN";
    }

    const char *toString(greeir::TempDisplay display)
    {
        switch (display)
        {
        case greeir::TempDisplay::Default:
            return "Default";
        case greeir::TempDisplay::Set:
            return "Set";
        case greeir::TempDisplay::Room:
            return "Room";
        case greeir::TempDisplay::Outdoor:
            return "Outdoor";
        }
        return "UNKNOWN";
    }

    const char *recordType(const greeir::Record &record)
    {
        switch (record.index())
        {
        case 0:
            return "basic";
        case 1:
            return "timer";
        case 2:
            return "footer";
        case 3:
            return "temp";
        default:
            return "unknown";
        }
    }

    greeir::FieldList describeRecord(const greeir::Record &record)
    {
        greeir::FieldList out;
        out.emplace_back("type", recordType(record));
        std::visit(Describer{out}, record);
        return out;
    }

    std::string toString(const greeir::Record &record)
    {
        std::string s = "{";
        bool first = true;
        for (const auto &kv : describeRecord(record))
        {
            if (!first)
                s += ", ";
            first = false;
            s += kv.first;
            s += " = ";
            s += kv.second;
        }
        s += "}";
        return s;
    }

} // namespace greeir
