#ifndef GREEIRDECODER_H
#define GREEIRDECODER_H

#include <stddef.h>
#include <stdint.h>

#include "greeirdecoder_version.h"
#include <vector>
#include <string>
#include <optional>
#include <variant>
#include <functional>
#include <utility>

namespace greeir
{

  // Code elements produced per pulse pair (Stop comes from the trailing mark)
  enum class Symbol : uint8_t
  {
    StartStandard = 0,
    StartShort,
    Zero,
    One,
    Space,
    Stop,
    Invalid,
  };

  enum class FrameShape : uint8_t
  {
    Standard = 0,
    Short,
  };

  // Decode status
  enum class DecodeStatus : uint8_t
  {
    DECODED = 0,
    EVEN_LENGTH,
    INVALID_SYMBOL,
    BAD_STRUCTURE,
    BAD_BIT_COUNT,
    UNKNOWN_TYPE,
    UNSUPPORTED_LENGTH,
    LAYOUT_VIOLATION,
  };

  enum class WarningKind : uint8_t
  {
    EXTRA_BITS = 0,
    CHECKSUM_MISMATCH,
    RESERVED_BITS,
    LEAD_BIT_MISSING,
    MAGIC_MISMATCH,
    SWING_MISMATCH,
  };

  // Non-fatal anomaly. byteIndex/mask locate the bits in the payload; for
  // EXTRA_BITS value is the number of discarded durations.
  // SWING_MISMATCH is raised for a Basic frame whose byte-0 swing flag
  // disagrees with the swing state implied by the guide positions; a flag
  // that merely repeats the guides is dropped from the record silently.
  struct Warning
  {
    greeir::WarningKind kind;
    uint8_t byteIndex;
    uint8_t mask;
    uint32_t value;
    uint32_t expected;
  };

  // Classifier thresholds in microseconds. Spaces are magnitudes of the
  // (negative) low durations. All windows are exclusive.
  struct Timing
  {
    int32_t startStandardMarkMinUs{8000};
    int32_t startStandardSpaceMinUs{4000};
    int32_t startShortMarkMinUs{5000};
    int32_t startShortMarkMaxUs{7000};
    int32_t startShortSpaceMinUs{2500};
    int32_t startShortSpaceMaxUs{3500};
    int32_t bitMarkMinUs{600};
    int32_t bitMarkMaxUs{800};
    int32_t zeroSpaceMinUs{400};
    int32_t zeroSpaceMaxUs{600};
    int32_t oneSpaceMinUs{1500};
    int32_t oneSpaceMaxUs{1700};
    int32_t syncSpaceMinUs{19000};
  };

  bool validTiming(const greeir::Timing &timing);

  namespace proto_const
  {
    constexpr size_t kStandardFrameDurations = 139;
    constexpr size_t kShortFrameDurations = 35;
    constexpr size_t kStandardCodeSymbols = 70;
    constexpr size_t kShortCodeSymbols = 18;
    constexpr size_t kStandardPayloadBytes = 8;
    constexpr size_t kShortPayloadBytes = 2;
    constexpr size_t kSyncSymbols = 4;

    constexpr uint8_t kChecksumSeed = 0x0A;
    constexpr uint8_t kTempMagic = 0xA5;

    // High nibble of byte 3
    constexpr uint8_t kTypeBasic = 0x5;
    constexpr uint8_t kTypeTimer = 0x6;
    constexpr uint8_t kTypeFooter = 0xA;

    // Nominal widths used when building frames
    constexpr int32_t kStandardHdrMarkUs = 9000;
    constexpr int32_t kStandardHdrSpaceUs = 4500;
    constexpr int32_t kShortHdrMarkUs = 6000;
    constexpr int32_t kShortHdrSpaceUs = 3000;
    constexpr int32_t kBitMarkUs = 700;
    constexpr int32_t kZeroSpaceUs = 500;
    constexpr int32_t kOneSpaceUs = 1600;
    constexpr int32_t kSyncSpaceUs = 19800;
  } // namespace proto_const

  // Pulse classifier
  bool isStartStandard(int32_t hi, int32_t lo, const greeir::Timing &timing = greeir::Timing{});
  bool isStartShort(int32_t hi, int32_t lo, const greeir::Timing &timing = greeir::Timing{});
  bool isBitLead(int32_t hi, const greeir::Timing &timing = greeir::Timing{});
  bool isZero(int32_t hi, int32_t lo, const greeir::Timing &timing = greeir::Timing{});
  bool isOne(int32_t hi, int32_t lo, const greeir::Timing &timing = greeir::Timing{});
  bool isSpace(int32_t hi, int32_t lo, const greeir::Timing &timing = greeir::Timing{});
  greeir::Symbol classifyPair(int32_t hi, int32_t lo, const greeir::Timing &timing = greeir::Timing{});

  // Accumulates durations across input chunks until a complete frame is seen
  class FrameAssembler
  {
  public:
    FrameAssembler() = default;
    explicit FrameAssembler(const greeir::Timing &timing);

    bool setTiming(const greeir::Timing &timing);

    bool feed(const std::vector<int32_t> &durations, bool isFrameStart,
              std::vector<int32_t> &frameOut, std::vector<greeir::Warning> &warnings);
    void clear();

    size_t pending() const { return buffer_.size(); }
    const std::vector<int32_t> &buffer() const { return buffer_; }

  private:
    bool cutFrame(size_t length, std::vector<int32_t> &frameOut);

    greeir::Timing timing_{};
    std::vector<int32_t> buffer_;
  };

  // Code encoder / payload extractor
  bool encodeCode(const std::vector<int32_t> &frame, std::vector<greeir::Symbol> &code,
                  greeir::DecodeStatus &status, const greeir::Timing &timing = greeir::Timing{});
  bool codeShape(const std::vector<greeir::Symbol> &code, greeir::FrameShape &shape);
  bool extractPayload(const std::vector<greeir::Symbol> &code, std::vector<uint8_t> &out);
  std::string codeToString(const std::vector<greeir::Symbol> &code);

  // Checksum (8-byte payloads only)
  uint8_t computeChecksum(const std::vector<uint8_t> &bytes);
  bool matchChecksum(const std::vector<uint8_t> &bytes, uint8_t &received, uint8_t &calculated);
  bool applyChecksum(std::vector<uint8_t> &bytes);

  // Frame builder (bytes -> durations)
  bool buildTimings(const std::vector<uint8_t> &bytes, std::vector<int32_t> &out);

  enum class Mode : uint8_t
  {
    Auto = 0,
    Cool = 1,
    Dry = 2,
    Fan = 3,
    Heat = 4,
  };

  enum class Fan : uint8_t
  {
    Auto = 0,
    Low = 1,
    Med = 2,
    High = 3,
  };

  // Horizontal (left-right) louver
  enum class HGuide : uint8_t
  {
    Closed = 0,
    SwingLeftRight = 1,
    Left = 2,
    MidLeft = 3,
    Mid = 4,
    MidRight = 5,
    Right = 6,
    Out = 12,
    SwingInOut = 13,
  };

  // Vertical (up-down) louver
  enum class VGuide : uint8_t
  {
    Closed = 0,
    SwingUpDown = 1,
    Up = 2,
    MidUp = 3,
    Mid = 4,
    MidDown = 5,
    Down = 6,
    SwingDown = 7,
    SwingMid = 9,
    SwingUp = 11,
  };

  // Value shown on the indoor unit display
  enum class TempDisplay : uint8_t
  {
    Default = 0,
    Set = 1,
    Room = 2,
    Outdoor = 3,
  };

  bool modeFromBits(uint8_t raw, greeir::Mode &out);
  bool fanFromBits(uint8_t raw, greeir::Fan &out);
  bool hGuideFromBits(uint8_t raw, greeir::HGuide &out);
  bool vGuideFromBits(uint8_t raw, greeir::VGuide &out);
  bool tempDisplayFromBits(uint8_t raw, greeir::TempDisplay &out);
  bool isSwinging(greeir::HGuide guide);
  bool isSwinging(greeir::VGuide guide);

  namespace payload
  {
    // Bytes 0..3 of every standard frame
    struct Common
    {
      bool sleep;
      // Absent in a Basic record when the guide positions already imply it
      std::optional<bool> swing;
      greeir::Fan fan;
      bool on;
      greeir::Mode mode;
      bool timer;
      double timerHours;
      double temp;
      bool xFan;
      bool health;
      bool light;
      bool turbo;
      bool fahrenheit;
      bool freshAir;
    };

    struct Basic
    {
      greeir::payload::Common common;
      greeir::HGuide hGuide;
      greeir::VGuide vGuide;
      bool wifi;
      bool ifeel;
      greeir::TempDisplay tempDisplay;
      bool energySave;
    };

    struct Timer
    {
      greeir::payload::Common common;
      uint16_t onMins;
      bool overlap;
      uint16_t offMins;
      bool onSet;
      bool offSet;
    };

    struct Footer
    {
    };

    struct Temp
    {
      uint8_t temp;
    };

  } // namespace payload

  using Record = std::variant<greeir::payload::Basic, greeir::payload::Timer, greeir::payload::Footer, greeir::payload::Temp>;
  using FieldList = std::vector<std::pair<std::string, std::string>>;

  // Field decoder
  bool decodeCommon(const std::vector<uint8_t> &bytes, greeir::payload::Common &out, std::vector<greeir::Warning> &warnings);
  bool decodeBasic(const std::vector<uint8_t> &bytes, greeir::payload::Basic &out, std::vector<greeir::Warning> &warnings);
  bool decodeTimer(const std::vector<uint8_t> &bytes, greeir::payload::Timer &out, std::vector<greeir::Warning> &warnings);
  bool decodeFooter(const std::vector<uint8_t> &bytes, greeir::payload::Footer &out, std::vector<greeir::Warning> &warnings);
  bool decodeTemp(const std::vector<uint8_t> &bytes, greeir::payload::Temp &out, std::vector<greeir::Warning> &warnings);
  greeir::DecodeStatus decodeFields(const std::vector<uint8_t> &bytes, greeir::Record &out, std::vector<greeir::Warning> &warnings);

  // Rendering
  const char *toString(greeir::Symbol symbol);
  const char *toString(greeir::DecodeStatus status);
  const char *toString(greeir::WarningKind kind);
  const char *toString(greeir::Mode mode);
  const char *toString(greeir::Fan fan);
  const char *toString(greeir::HGuide guide);
  const char *toString(greeir::VGuide guide);
  const char *toString(greeir::TempDisplay display);
  const char *recordType(const greeir::Record &record);
  greeir::FieldList describeRecord(const greeir::Record &record);
  std::string toString(const greeir::Record &record);

  struct DecodeResult
  {
    greeir::DecodeStatus status{greeir::DecodeStatus::DECODED};
    greeir::Record record;
    std::vector<int32_t> raw;
    std::vector<greeir::Symbol> code;
    std::vector<uint8_t> bytes;
    std::vector<greeir::Warning> warnings;
  };

  // Pipeline driver: assembler + encoder + extractor + checksum + fields
  class Decoder
  {
  public:
    using WarningCallback = std::function<void(const greeir::Warning &)>;

    Decoder();
    explicit Decoder(const greeir::Timing &timing);

    bool setTiming(const greeir::Timing &timing);
    void onWarning(WarningCallback callback);

    bool feed(const std::vector<int32_t> &durations, bool isFrameStart, greeir::DecodeResult &out);
    greeir::DecodeStatus decodeFrame(const std::vector<int32_t> &frame, greeir::DecodeResult &out) const;
    void reset();

    size_t pending() const { return assembler_.pending(); }

  private:
    void emit(const greeir::Warning &w) const;

    greeir::Timing timing_{};
    greeir::FrameAssembler assembler_;
    WarningCallback warningCallback_;
    // EXTRA_BITS from the most recent discard, attached to the next frame
    std::optional<greeir::Warning> lastDiscard_;
  };

} // namespace greeir

#endif // GREEIRDECODER_H
