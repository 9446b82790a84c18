#include <gtest/gtest.h>

#include "GreeIRDecoder.h"
#include <algorithm>
#include "test_frames.h"

using namespace greeir_test;

TEST(FrameAssembler, TwoChunksMakeOneStandardFrame)
{
    auto durations = timings(basicBytes());
    ASSERT_EQ(greeir::proto_const::kStandardFrameDurations, durations.size());
    std::vector<int32_t> head(durations.begin(), durations.begin() + 70);
    std::vector<int32_t> tail(durations.begin() + 70, durations.end());

    greeir::FrameAssembler assembler;
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    EXPECT_FALSE(assembler.feed(head, true, frame, warnings));
    EXPECT_EQ(70u, assembler.pending());
    EXPECT_TRUE(frame.empty());

    EXPECT_TRUE(assembler.feed(tail, false, frame, warnings));
    EXPECT_EQ(durations, frame);
    EXPECT_EQ(0u, assembler.pending());
    EXPECT_TRUE(warnings.empty());
}

TEST(FrameAssembler, ShortFrameInOneChunk)
{
    auto durations = timings({23, 0xA5});
    ASSERT_EQ(greeir::proto_const::kShortFrameDurations, durations.size());

    greeir::FrameAssembler assembler;
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    EXPECT_TRUE(assembler.feed(durations, true, frame, warnings));
    EXPECT_EQ(durations, frame);
    EXPECT_EQ(0u, assembler.pending());
}

TEST(FrameAssembler, ManySmallChunks)
{
    auto durations = timings(footerBytes());
    greeir::FrameAssembler assembler;
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    size_t completed = 0;
    for (size_t i = 0; i < durations.size(); i += 16)
    {
        size_t end = std::min(durations.size(), i + 16);
        std::vector<int32_t> chunk(durations.begin() + i, durations.begin() + end);
        if (assembler.feed(chunk, i == 0, frame, warnings))
            ++completed;
    }
    EXPECT_EQ(1u, completed);
    EXPECT_EQ(durations, frame);
}

TEST(FrameAssembler, AbandonedFrameIsDiscardedWithOneWarning)
{
    auto first = timings(basicBytes());
    auto second = timings(footerBytes());
    std::vector<int32_t> partial(first.begin(), first.begin() + 70);

    greeir::FrameAssembler assembler;
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    EXPECT_FALSE(assembler.feed(partial, true, frame, warnings));
    EXPECT_TRUE(assembler.feed(second, true, frame, warnings));

    ASSERT_EQ(1u, warnings.size());
    EXPECT_EQ(greeir::WarningKind::EXTRA_BITS, warnings[0].kind);
    EXPECT_EQ(70u, warnings[0].value);
    EXPECT_EQ(second, frame);
    EXPECT_EQ(0u, assembler.pending());
}

TEST(FrameAssembler, ExcessDurationsAreCut)
{
    auto durations = timings(basicBytes());
    durations.push_back(-30000);
    durations.push_back(700);

    greeir::FrameAssembler assembler;
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    EXPECT_TRUE(assembler.feed(durations, true, frame, warnings));
    EXPECT_EQ(greeir::proto_const::kStandardFrameDurations, frame.size());
    EXPECT_EQ(0u, assembler.pending());
}

TEST(FrameAssembler, NoStartPairKeepsBuffering)
{
    greeir::FrameAssembler assembler;
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    std::vector<int32_t> noise(200, 700);
    EXPECT_FALSE(assembler.feed(noise, false, frame, warnings));
    EXPECT_EQ(200u, assembler.pending());

    EXPECT_FALSE(assembler.feed({9000}, true, frame, warnings));
    ASSERT_EQ(1u, warnings.size());
    EXPECT_EQ(200u, warnings[0].value);
    EXPECT_EQ(1u, assembler.pending());

    assembler.clear();
    EXPECT_EQ(0u, assembler.pending());
}

TEST(FrameAssembler, RejectsInvalidTiming)
{
    greeir::FrameAssembler assembler;
    greeir::Timing t;
    t.bitMarkMinUs = t.bitMarkMaxUs;
    EXPECT_FALSE(assembler.setTiming(t));
    EXPECT_TRUE(assembler.setTiming(greeir::Timing{}));
}

TEST(FrameAssembler, InvalidConstructorTimingKeepsDefaults)
{
    greeir::Timing t;
    t.startStandardMarkMinUs = 0;
    greeir::FrameAssembler assembler(t);
    std::vector<int32_t> frame;
    std::vector<greeir::Warning> warnings;
    // a 700us header mark only counts as a start with the zero threshold
    auto durations = timings(footerBytes());
    durations[0] = 700;
    durations[1] = -5000;
    EXPECT_FALSE(assembler.feed(durations, true, frame, warnings));
    EXPECT_TRUE(assembler.feed(timings(footerBytes()), true, frame, warnings));
    EXPECT_EQ(greeir::proto_const::kStandardFrameDurations, frame.size());
}
