
#include "segment.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "base/logging.h"
#include "bitbuffer.h"
#include "types.h"

namespace fastqr {

static constexpr const char ALPHANUMERIC_CHARSET[] =
  "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ $%*+-./:";

static constexpr std::array<int8_t, 128> MakeAlphanumericTable() {
  std::array<int8_t, 128> table = {};
  for (int8_t &v : table) v = -1;
  for (int i = 0; i < 45; i++) table[(int)ALPHANUMERIC_CHARSET[i]] = i;
  return table;
}

static constexpr std::array<int8_t, 128> ALPHANUMERIC_VALUE =
  MakeAlphanumericTable();

int AlphanumericValue(uint8_t c) {
  if (c >= 128) return -1;
  return ALPHANUMERIC_VALUE[c];
}

// Shift JIS value of the pair, or -1 if it is not in the kanji ranges.
static int KanjiValue(uint8_t hi, uint8_t lo) {
  if (lo < 0x40 || lo > 0xFC || lo == 0x7F) return -1;
  const int w = (hi << 8) | lo;
  if (w >= 0x8140 && w <= 0x9FFC) return w - 0x8140;
  if (w >= 0xE040 && w <= 0xEBBF) return w - 0xC140;
  return -1;
}

static std::optional<size_t> FirstNonNumeric(std::span<const uint8_t> s) {
  for (size_t i = 0; i < s.size(); i++)
    if (!IsDigit(s[i])) return {i};
  return std::nullopt;
}

static std::optional<size_t> FirstNonAlphanumeric(std::span<const uint8_t> s) {
  for (size_t i = 0; i < s.size(); i++)
    if (AlphanumericValue(s[i]) < 0) return {i};
  return std::nullopt;
}

static std::optional<size_t> FirstNonByte(std::span<const uint8_t> s) {
  return std::nullopt;
}

static std::optional<size_t> FirstNonKanji(std::span<const uint8_t> s) {
  for (size_t i = 0; i < s.size(); i += 2) {
    if (i + 1 >= s.size()) return {i};
    if (KanjiValue(s[i], s[i + 1]) < 0) return {i};
  }
  return std::nullopt;
}

static int CountBytes(std::span<const uint8_t> s) { return (int)s.size(); }
static int CountPairs(std::span<const uint8_t> s) { return (int)s.size() / 2; }

static void PackNumeric(std::span<const uint8_t> s, BitBuffer *bb) {
  // Groups of three digits in 10 bits; a final two in 7, one in 4.
  size_t i = 0;
  for (; i + 3 <= s.size(); i += 3) {
    bb->WriteBits(10, (s[i] - '0') * 100 + (s[i + 1] - '0') * 10 +
                  (s[i + 2] - '0'));
  }
  if (s.size() - i == 2) {
    bb->WriteBits(7, (s[i] - '0') * 10 + (s[i + 1] - '0'));
  } else if (s.size() - i == 1) {
    bb->WriteBits(4, s[i] - '0');
  }
}

static void PackAlphanumeric(std::span<const uint8_t> s, BitBuffer *bb) {
  size_t i = 0;
  for (; i + 2 <= s.size(); i += 2) {
    bb->WriteBits(11, AlphanumericValue(s[i]) * 45 +
                  AlphanumericValue(s[i + 1]));
  }
  if (i < s.size()) bb->WriteBits(6, AlphanumericValue(s[i]));
}

static void PackBytes(std::span<const uint8_t> s, BitBuffer *bb) {
  for (uint8_t b : s) bb->WriteBits(8, b);
}

static void PackKanji(std::span<const uint8_t> s, BitBuffer *bb) {
  for (size_t i = 0; i + 1 < s.size(); i += 2) {
    const int w = KanjiValue(s[i], s[i + 1]);
    bb->WriteBits(13, (w >> 8) * 0xC0 + (w & 0xFF));
  }
}

static constexpr ModeInfo NUMERIC_INFO = {
  Mode::NUMERIC, {10, 12, 14}, &FirstNonNumeric, &CountBytes, &PackNumeric,
};
static constexpr ModeInfo ALPHANUMERIC_INFO = {
  Mode::ALPHANUMERIC, {9, 11, 13},
  &FirstNonAlphanumeric, &CountBytes, &PackAlphanumeric,
};
static constexpr ModeInfo BYTE_INFO = {
  Mode::BYTE, {8, 16, 16}, &FirstNonByte, &CountBytes, &PackBytes,
};
static constexpr ModeInfo KANJI_INFO = {
  Mode::KANJI, {8, 10, 12}, &FirstNonKanji, &CountPairs, &PackKanji,
};

const ModeInfo &GetModeInfo(Mode mode) {
  switch (mode) {
  case Mode::NUMERIC: return NUMERIC_INFO;
  case Mode::ALPHANUMERIC: return ALPHANUMERIC_INFO;
  case Mode::BYTE: return BYTE_INFO;
  case Mode::KANJI: return KANJI_INFO;
  }
  LOG(FATAL) << "Bad mode " << (int)mode;
}

int VersionBand(int version) {
  CHECK(ValidVersion(version)) << version;
  if (version <= 9) return 0;
  if (version <= 26) return 1;
  return 2;
}

int BandMinVersion(int band) {
  static constexpr std::array<int, 3> MIN = {1, 10, 27};
  CHECK(band >= 0 && band < 3) << band;
  return MIN[band];
}

int CharCountBits(Mode mode, int version) {
  return GetModeInfo(mode).count_bits[VersionBand(version)];
}

bool IsNumeric(std::span<const uint8_t> content) {
  return !FirstNonNumeric(content).has_value();
}

bool IsAlphanumeric(std::span<const uint8_t> content) {
  return !FirstNonAlphanumeric(content).has_value();
}

bool IsKanji(std::span<const uint8_t> content) {
  return !content.empty() && !FirstNonKanji(content).has_value();
}

Segment MakeSegment(Mode mode, std::span<const uint8_t> content) {
  const ModeInfo &info = GetModeInfo(mode);
  const std::optional<size_t> bad = info.first_unsupported(content);
  CHECK(!bad.has_value()) << "Byte " << (int)content[*bad] << " at offset "
                          << *bad << " can't be encoded in "
                          << ModeName(mode) << " mode";
  Segment seg;
  seg.mode = mode;
  seg.num_chars = info.num_chars(content);
  info.pack(content, &seg.bits);
  return seg;
}

Segment MakeNumeric(std::span<const uint8_t> digits) {
  return MakeSegment(Mode::NUMERIC, digits);
}

Segment MakeAlphanumeric(std::span<const uint8_t> text) {
  return MakeSegment(Mode::ALPHANUMERIC, text);
}

Segment MakeBytes(std::span<const uint8_t> data) {
  return MakeSegment(Mode::BYTE, data);
}

Segment MakeKanji(std::span<const uint8_t> sjis) {
  return MakeSegment(Mode::KANJI, sjis);
}

Mode BestSingleMode(std::span<const uint8_t> content) {
  if (IsNumeric(content)) return Mode::NUMERIC;
  if (IsAlphanumeric(content)) return Mode::ALPHANUMERIC;
  return Mode::BYTE;
}

// Costs below are in sixths of a bit, so that numeric (10/3 bits per
// digit) and alphanumeric (11/2 bits per character) are exact.
namespace {
enum AutoMode { AUTO_BYTE = 0, AUTO_ALPHANUMERIC, AUTO_NUMERIC, NUM_AUTO };
static constexpr std::array<Mode, NUM_AUTO> AUTO_MODES = {
  Mode::BYTE, Mode::ALPHANUMERIC, Mode::NUMERIC,
};
static constexpr int64_t UNREACHABLE = INT64_MAX / 4;
}  // namespace

std::vector<Segment> MakeOptimalSegments(std::span<const uint8_t> content,
                                         int version) {
  const size_t n = content.size();
  if (n == 0) return {};

  std::array<int64_t, NUM_AUTO> head_cost;
  for (int m = 0; m < NUM_AUTO; m++)
    head_cost[m] = (4 + CharCountBits(AUTO_MODES[m], version)) * 6;

  // from[i][m] is the mode that character i was encoded in, on the
  // cheapest path that is in mode m after character i. -1 if there
  // is no such path.
  std::vector<std::array<int8_t, NUM_AUTO>> from(n);
  // Cheapest cost of being in each mode, having encoded a prefix.
  // Before anything, we pay the header to start a segment.
  std::array<int64_t, NUM_AUTO> prev = head_cost;

  for (size_t i = 0; i < n; i++) {
    const uint8_t c = content[i];
    std::array<int64_t, NUM_AUTO> cur;
    cur.fill(UNREACHABLE);
    from[i].fill(-1);

    // Extend the current segment.
    cur[AUTO_BYTE] = prev[AUTO_BYTE] + 8 * 6;
    from[i][AUTO_BYTE] = AUTO_BYTE;
    if (AlphanumericValue(c) >= 0) {
      cur[AUTO_ALPHANUMERIC] = prev[AUTO_ALPHANUMERIC] + 33;
      from[i][AUTO_ALPHANUMERIC] = AUTO_ALPHANUMERIC;
    }
    if (IsDigit(c)) {
      cur[AUTO_NUMERIC] = prev[AUTO_NUMERIC] + 20;
      from[i][AUTO_NUMERIC] = AUTO_NUMERIC;
    }

    // Or end the segment here (rounding up to whole bits) and
    // start a new one in another mode.
    const std::array<int64_t, NUM_AUTO> ended = cur;
    for (int to = 0; to < NUM_AUTO; to++) {
      for (int fm = 0; fm < NUM_AUTO; fm++) {
        if (fm == to || from[i][fm] < 0) continue;
        const int64_t cost = (ended[fm] + 5) / 6 * 6 + head_cost[to];
        if (cost < cur[to]) {
          cur[to] = cost;
          from[i][to] = from[i][fm];
        }
      }
    }
    prev = cur;
  }

  int state = 0;
  for (int m = 1; m < NUM_AUTO; m++)
    if (prev[m] < prev[state]) state = m;

  // Trace back the mode of each character.
  std::vector<int8_t> char_mode(n);
  for (size_t i = n; i-- > 0;) {
    const int8_t m = from[i][state];
    CHECK(m >= 0);
    char_mode[i] = m;
    state = m;
  }

  std::vector<Segment> segs;
  size_t start = 0;
  for (size_t i = 1; i <= n; i++) {
    if (i == n || char_mode[i] != char_mode[start]) {
      segs.push_back(MakeSegment(AUTO_MODES[char_mode[start]],
                                 content.subspan(start, i - start)));
      start = i;
    }
  }

  // The sixth-bit costs are exact per character but the rounding of
  // segment ends is approximate, so never do worse than one segment.
  std::vector<Segment> single;
  single.push_back(MakeSegment(BestSingleMode(content), content));
  const std::optional<int64_t> mixed_bits = TotalBits(segs, version);
  const std::optional<int64_t> single_bits = TotalBits(single, version);
  if (single_bits.has_value() &&
      (!mixed_bits.has_value() || *single_bits <= *mixed_bits))
    return single;
  return segs;
}

std::optional<int64_t> TotalBits(const std::vector<Segment> &segs,
                                 int version) {
  int64_t total = 0;
  for (const Segment &seg : segs) {
    const int ccbits = CharCountBits(seg.mode, version);
    if (seg.num_chars >= (1 << ccbits)) return std::nullopt;
    total += 4 + ccbits + seg.bits.NumBits();
  }
  return {total};
}

}  // namespace fastqr
