#include <gtest/gtest.h>

#include "GreeIRDecoder.h"
#include "test_frames.h"

using namespace greeir_test;
using greeir::DecodeStatus;
using greeir::WarningKind;

TEST(Decoder, BasicCoolMedOn)
{
    greeir::Decoder decoder;
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(timings(basicBytes()), true, result));
    ASSERT_EQ(DecodeStatus::DECODED, result.status);
    ASSERT_TRUE(std::holds_alternative<greeir::payload::Basic>(result.record));
    const auto &b = std::get<greeir::payload::Basic>(result.record);
    EXPECT_EQ(greeir::Mode::Cool, b.common.mode);
    EXPECT_EQ(greeir::Fan::Med, b.common.fan);
    EXPECT_TRUE(b.common.on);
    EXPECT_EQ(basicBytes(), result.bytes);
    EXPECT_EQ(greeir::proto_const::kStandardCodeSymbols, result.code.size());
    EXPECT_TRUE(result.warnings.empty());
}

TEST(Decoder, FooterHasNoWarnings)
{
    greeir::Decoder decoder;
    size_t callbackCount = 0;
    decoder.onWarning([&](const greeir::Warning &) { ++callbackCount; });
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(timings(footerBytes()), true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    EXPECT_TRUE(std::holds_alternative<greeir::payload::Footer>(result.record));
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(0u, callbackCount);
}

TEST(Decoder, TempMagicMismatchStillDecodes)
{
    greeir::Decoder decoder;
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(timings({25, 0x00}), true, result));
    ASSERT_EQ(DecodeStatus::DECODED, result.status);
    ASSERT_TRUE(std::holds_alternative<greeir::payload::Temp>(result.record));
    EXPECT_EQ(25, std::get<greeir::payload::Temp>(result.record).temp);
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_EQ(WarningKind::MAGIC_MISMATCH, result.warnings[0].kind);
}

TEST(Decoder, ChecksumMismatchIsAdvisory)
{
    auto bytes = basicBytes();
    bytes[7] = 0x90;
    greeir::Decoder decoder;
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(timings(bytes), true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_EQ(WarningKind::CHECKSUM_MISMATCH, result.warnings[0].kind);
    EXPECT_EQ(0x9u, result.warnings[0].value);
    EXPECT_EQ(0x3u, result.warnings[0].expected);
}

TEST(Decoder, SplitAcrossChunks)
{
    auto durations = timings(timerBytes());
    std::vector<int32_t> a(durations.begin(), durations.begin() + 50);
    std::vector<int32_t> b(durations.begin() + 50, durations.begin() + 100);
    std::vector<int32_t> c(durations.begin() + 100, durations.end());

    greeir::Decoder decoder;
    greeir::DecodeResult result;
    EXPECT_FALSE(decoder.feed(a, true, result));
    EXPECT_FALSE(decoder.feed(b, false, result));
    EXPECT_EQ(100u, decoder.pending());
    ASSERT_TRUE(decoder.feed(c, false, result));
    EXPECT_EQ(0u, decoder.pending());
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    EXPECT_TRUE(std::holds_alternative<greeir::payload::Timer>(result.record));
}

TEST(Decoder, AbandonedFrameWarningIsCarried)
{
    auto first = timings(basicBytes());
    std::vector<int32_t> partial(first.begin(), first.begin() + 70);

    greeir::Decoder decoder;
    std::vector<greeir::Warning> seen;
    decoder.onWarning([&](const greeir::Warning &w) { seen.push_back(w); });

    greeir::DecodeResult result;
    EXPECT_FALSE(decoder.feed(partial, true, result));
    std::vector<int32_t> secondHead = timings(footerBytes());
    std::vector<int32_t> secondTail(secondHead.begin() + 10, secondHead.end());
    secondHead.resize(10);
    EXPECT_FALSE(decoder.feed(secondHead, true, result));
    ASSERT_EQ(1u, seen.size());
    EXPECT_EQ(WarningKind::EXTRA_BITS, seen[0].kind);

    ASSERT_TRUE(decoder.feed(secondTail, false, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_EQ(WarningKind::EXTRA_BITS, result.warnings[0].kind);
    EXPECT_EQ(70u, result.warnings[0].value);
    EXPECT_EQ(1u, seen.size());
}

TEST(Decoder, OnlyLatestDiscardIsCarried)
{
    // NEC-style bursts start a frame that never reaches 139 durations
    const std::vector<int32_t> burst{9000, -4500, 560, -560, 560};
    greeir::Decoder decoder;
    size_t callbackCount = 0;
    decoder.onWarning([&](const greeir::Warning &) { ++callbackCount; });

    greeir::DecodeResult result;
    for (int i = 0; i < 1000; ++i)
    {
        EXPECT_FALSE(decoder.feed(burst, true, result));
    }
    EXPECT_EQ(999u, callbackCount);

    ASSERT_TRUE(decoder.feed(timings(footerBytes()), true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    ASSERT_EQ(1u, result.warnings.size());
    EXPECT_EQ(WarningKind::EXTRA_BITS, result.warnings[0].kind);
    EXPECT_EQ(5u, result.warnings[0].value);
    EXPECT_EQ(1000u, callbackCount);

    ASSERT_TRUE(decoder.feed(timings(footerBytes()), true, result));
    EXPECT_TRUE(result.warnings.empty());
}

TEST(Decoder, InvalidConstructorTimingKeepsDefaults)
{
    greeir::Timing t;
    t.zeroSpaceMinUs = t.zeroSpaceMaxUs;
    greeir::Decoder decoder(t);
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(timings(basicBytes()), true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
}

TEST(Decoder, RejectedFrameDoesNotStopTheStream)
{
    auto bad = timings(basicBytes());
    bad[20] = -3000;

    greeir::Decoder decoder;
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(bad, true, result));
    EXPECT_EQ(DecodeStatus::INVALID_SYMBOL, result.status);
    EXPECT_EQ(bad, result.raw);
    EXPECT_TRUE(result.bytes.empty());

    ASSERT_TRUE(decoder.feed(timings(footerBytes()), true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    EXPECT_TRUE(result.warnings.empty());
}

TEST(Decoder, UnknownTypeAndLayoutViolation)
{
    greeir::Decoder decoder;
    greeir::DecodeResult result;

    auto unknown = withChecksum({0x00, 0x00, 0x00, 0x30, 0x00, 0x00, 0x00, 0x00});
    ASSERT_TRUE(decoder.feed(timings(unknown), true, result));
    EXPECT_EQ(DecodeStatus::UNKNOWN_TYPE, result.status);
    EXPECT_EQ(unknown, result.bytes);

    auto layout = basicBytes();
    layout[4] = 0x0F;
    layout = withChecksum(layout);
    ASSERT_TRUE(decoder.feed(timings(layout), true, result));
    EXPECT_EQ(DecodeStatus::LAYOUT_VIOLATION, result.status);
}

TEST(Decoder, DecodeFrameIsStateless)
{
    greeir::Decoder decoder;
    greeir::DecodeResult first;
    greeir::DecodeResult second;
    auto durations = timings(timerBytes());
    EXPECT_EQ(DecodeStatus::DECODED, decoder.decodeFrame(durations, first));
    EXPECT_EQ(DecodeStatus::DECODED, decoder.decodeFrame(durations, second));
    EXPECT_EQ(first.bytes, second.bytes);
    EXPECT_EQ(0u, decoder.pending());

    durations.pop_back();
    EXPECT_EQ(DecodeStatus::EVEN_LENGTH, decoder.decodeFrame(durations, first));
}

TEST(Decoder, ResetDropsPartialFrame)
{
    auto durations = timings(basicBytes());
    std::vector<int32_t> partial(durations.begin(), durations.begin() + 40);
    greeir::Decoder decoder;
    size_t callbackCount = 0;
    decoder.onWarning([&](const greeir::Warning &) { ++callbackCount; });
    greeir::DecodeResult result;
    EXPECT_FALSE(decoder.feed(partial, true, result));
    decoder.reset();
    EXPECT_EQ(0u, decoder.pending());
    ASSERT_TRUE(decoder.feed(durations, true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);
    EXPECT_EQ(0u, callbackCount);
}

TEST(Decoder, CustomTiming)
{
    // a remote with NEC-like 560us marks
    greeir::Timing t;
    t.bitMarkMinUs = 450;
    t.bitMarkMaxUs = 650;
    greeir::Decoder decoder;
    ASSERT_TRUE(decoder.setTiming(t));

    auto durations = timings(footerBytes());
    for (auto &d : durations)
    {
        if (d == greeir::proto_const::kBitMarkUs)
            d = 560;
    }
    greeir::DecodeResult result;
    ASSERT_TRUE(decoder.feed(durations, true, result));
    EXPECT_EQ(DecodeStatus::DECODED, result.status);

    t.oneSpaceMaxUs = t.oneSpaceMinUs;
    EXPECT_FALSE(decoder.setTiming(t));
}
