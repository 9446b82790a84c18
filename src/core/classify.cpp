#include "GreeIRDecoder.h"
#include "core/pulse_utils.h"

namespace greeir
{

    bool validTiming(const greeir::Timing &t)
    {
        if (t.startStandardMarkMinUs <= 0 || t.startStandardSpaceMinUs <= 0 || t.syncSpaceMinUs <= 0)
            return false;
        // lower bounds are negated against low durations; keep them positive
        if (t.startShortMarkMinUs <= 0 || t.startShortSpaceMinUs <= 0 || t.bitMarkMinUs <= 0)
            return false;
        if (t.zeroSpaceMinUs <= 0 || t.oneSpaceMinUs <= 0)
            return false;
        if (t.startShortMarkMinUs >= t.startShortMarkMaxUs || t.startShortSpaceMinUs >= t.startShortSpaceMaxUs)
            return false;
        if (t.bitMarkMinUs >= t.bitMarkMaxUs)
            return false;
        if (t.zeroSpaceMinUs >= t.zeroSpaceMaxUs || t.oneSpaceMinUs >= t.oneSpaceMaxUs)
            return false;
        return true;
    }

    bool isStartStandard(int32_t hi, int32_t lo, const greeir::Timing &t)
    {
        // 9ms mark, 4.5ms space
        return hi > t.startStandardMarkMinUs && lo < -t.startStandardSpaceMinUs;
    }

    bool isStartShort(int32_t hi, int32_t lo, const greeir::Timing &t)
    {
        // 6ms mark, 3ms space
        return inWindow(hi, t.startShortMarkMinUs, t.startShortMarkMaxUs) &&
               inWindow(lo, -t.startShortSpaceMaxUs, -t.startShortSpaceMinUs);
    }

    bool isBitLead(int32_t hi, const greeir::Timing &t)
    {
        // NEC nominal is 560us; the GREE remote sits around 700us
        return inWindow(hi, t.bitMarkMinUs, t.bitMarkMaxUs);
    }

    bool isZero(int32_t hi, int32_t lo, const greeir::Timing &t)
    {
        return isBitLead(hi, t) && inWindow(lo, -t.zeroSpaceMaxUs, -t.zeroSpaceMinUs);
    }

    bool isOne(int32_t hi, int32_t lo, const greeir::Timing &t)
    {
        return isBitLead(hi, t) && inWindow(lo, -t.oneSpaceMaxUs, -t.oneSpaceMinUs);
    }

    bool isSpace(int32_t hi, int32_t lo, const greeir::Timing &t)
    {
        // intra-frame space, ~19.8ms
        return isBitLead(hi, t) && lo < -t.syncSpaceMinUs;
    }

    greeir::Symbol classifyPair(int32_t hi, int32_t lo, const greeir::Timing &t)
    {
        if (isStartStandard(hi, lo, t))
            return greeir::Symbol::StartStandard;
        if (isStartShort(hi, lo, t))
            return greeir::Symbol::StartShort;
        if (isZero(hi, lo, t))
            return greeir::Symbol::Zero;
        if (isOne(hi, lo, t))
            return greeir::Symbol::One;
        if (isSpace(hi, lo, t))
            return greeir::Symbol::Space;
        return greeir::Symbol::Invalid;
    }

} // namespace greeir
