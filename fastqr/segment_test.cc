
#include "segment.h"

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "base/logging.h"
#include "bitbuffer.h"
#include "types.h"

using namespace fastqr;

static std::span<const uint8_t> Bytes(std::string_view s) {
  return std::span<const uint8_t>((const uint8_t *)s.data(), s.size());
}

// Bits of the buffer as a string of 0 and 1.
static std::string BitString(const BitBuffer &bb) {
  std::string out;
  for (int64_t i = 0; i < bb.NumBits(); i++) out += bb.Bit(i) ? '1' : '0';
  return out;
}

static void TestCharacterClasses() {
  CHECK(IsNumeric(Bytes("0123456789")));
  CHECK(!IsNumeric(Bytes("12a")));
  CHECK(IsNumeric(Bytes("")));
  CHECK(IsAlphanumeric(Bytes("HELLO WORLD $%*+-./:09")));
  CHECK(!IsAlphanumeric(Bytes("Hello")));
  CHECK_EQ(AlphanumericValue('0'), 0);
  CHECK_EQ(AlphanumericValue('A'), 10);
  CHECK_EQ(AlphanumericValue(' '), 36);
  CHECK_EQ(AlphanumericValue(':'), 44);
  CHECK_EQ(AlphanumericValue('a'), -1);
  CHECK_EQ(AlphanumericValue(0xC0), -1);

  const uint8_t kanji[] = {0x93, 0x5F, 0xE4, 0xAA};
  CHECK(IsKanji(kanji));
  // Odd length.
  CHECK(!IsKanji(std::span<const uint8_t>(kanji, 3)));
  // Trail byte out of range.
  const uint8_t bad_trail[] = {0x93, 0x7F};
  CHECK(!IsKanji(bad_trail));
  // Lead byte outside both ranges.
  const uint8_t bad_lead[] = {0xA0, 0x40};
  CHECK(!IsKanji(bad_lead));
  CHECK(!IsKanji({}));
}

static void TestCountBits() {
  CHECK_EQ(CharCountBits(Mode::NUMERIC, 1), 10);
  CHECK_EQ(CharCountBits(Mode::NUMERIC, 9), 10);
  CHECK_EQ(CharCountBits(Mode::NUMERIC, 10), 12);
  CHECK_EQ(CharCountBits(Mode::NUMERIC, 27), 14);
  CHECK_EQ(CharCountBits(Mode::ALPHANUMERIC, 1), 9);
  CHECK_EQ(CharCountBits(Mode::ALPHANUMERIC, 26), 11);
  CHECK_EQ(CharCountBits(Mode::ALPHANUMERIC, 40), 13);
  CHECK_EQ(CharCountBits(Mode::BYTE, 9), 8);
  CHECK_EQ(CharCountBits(Mode::BYTE, 10), 16);
  CHECK_EQ(CharCountBits(Mode::BYTE, 40), 16);
  CHECK_EQ(CharCountBits(Mode::KANJI, 1), 8);
  CHECK_EQ(CharCountBits(Mode::KANJI, 10), 10);
  CHECK_EQ(CharCountBits(Mode::KANJI, 27), 12);

  for (int band = 0; band < 3; band++) {
    CHECK_EQ(VersionBand(BandMinVersion(band)), band);
    if (band > 0) CHECK_EQ(VersionBand(BandMinVersion(band) - 1), band - 1);
  }
}

static void TestPacking() {
  Segment num = MakeNumeric(Bytes("01234567"));
  CHECK(num.mode == Mode::NUMERIC);
  CHECK_EQ(num.num_chars, 8);
  CHECK_EQ(BitString(num.bits), "0000001100" "0101011001" "1000011");

  Segment alnum = MakeAlphanumeric(Bytes("AC-42"));
  CHECK(alnum.mode == Mode::ALPHANUMERIC);
  CHECK_EQ(alnum.num_chars, 5);
  CHECK_EQ(BitString(alnum.bits), "00111001110" "11100111001" "000010");

  Segment bytes = MakeBytes(Bytes("a\xff"));
  CHECK(bytes.mode == Mode::BYTE);
  CHECK_EQ(bytes.num_chars, 2);
  CHECK_EQ(BitString(bytes.bits), "01100001" "11111111");

  const uint8_t sjis[] = {0x93, 0x5F, 0xE4, 0xAA};
  Segment kanji = MakeKanji(sjis);
  CHECK(kanji.mode == Mode::KANJI);
  CHECK_EQ(kanji.num_chars, 2);
  // 0x0D9F and 0x1AAA.
  CHECK_EQ(BitString(kanji.bits), "0110110011111" "1101010101010");

  Segment empty = MakeSegment(Mode::NUMERIC, {});
  CHECK_EQ(empty.num_chars, 0);
  CHECK_EQ(empty.bits.NumBits(), 0);
}

static void TestSingleMode() {
  CHECK(BestSingleMode(Bytes("12345")) == Mode::NUMERIC);
  CHECK(BestSingleMode(Bytes("HELLO WORLD")) == Mode::ALPHANUMERIC);
  CHECK(BestSingleMode(Bytes("Hello")) == Mode::BYTE);
}

static void TestOptimalSegments() {
  CHECK(MakeOptimalSegments({}, 1).empty());

  {
    std::vector<Segment> segs = MakeOptimalSegments(Bytes("12345"), 1);
    CHECK_EQ((int)segs.size(), 1);
    CHECK(segs[0].mode == Mode::NUMERIC);
    CHECK_EQ(segs[0].num_chars, 5);
  }

  {
    std::vector<Segment> segs = MakeOptimalSegments(Bytes("HELLO WORLD"), 1);
    CHECK_EQ((int)segs.size(), 1);
    CHECK(segs[0].mode == Mode::ALPHANUMERIC);
  }

  // A lone digit isn't worth a mode switch.
  {
    std::vector<Segment> segs = MakeOptimalSegments(Bytes("a1b"), 1);
    CHECK_EQ((int)segs.size(), 1);
    CHECK(segs[0].mode == Mode::BYTE);
    CHECK_EQ(segs[0].num_chars, 3);
  }

  // But a long run of digits is.
  {
    std::vector<Segment> segs =
      MakeOptimalSegments(Bytes("abcdef0123456789012345"), 1);
    CHECK_EQ((int)segs.size(), 2);
    CHECK(segs[0].mode == Mode::BYTE);
    CHECK_EQ(segs[0].num_chars, 6);
    CHECK(segs[1].mode == Mode::NUMERIC);
    CHECK_EQ(segs[1].num_chars, 16);
    // 4 + 8 + 48, then 4 + 10 + 54.
    CHECK_EQ(TotalBits(segs, 1).value(), 128);
  }

  // Never worse than any single mode, and covers the content exactly.
  for (std::string_view s : {"0", "A1", "HELLO 12345678901234567890",
                             "https://example.com/0123456789",
                             "ABCDEFGHabcdefgh12345678ABCDEFGH",
                             "\x01\x02\x03\x04 9999999999999999"}) {
    for (int version : {1, 10, 27}) {
      std::vector<Segment> segs = MakeOptimalSegments(Bytes(s), version);
      std::vector<Segment> single;
      single.push_back(MakeSegment(BestSingleMode(Bytes(s)), Bytes(s)));
      CHECK(TotalBits(segs, version).value() <=
            TotalBits(single, version).value()) << s;
      int chars = 0;
      for (const Segment &seg : segs) {
        CHECK(seg.mode != Mode::KANJI);
        CHECK(seg.num_chars > 0);
        chars += seg.num_chars;
      }
      CHECK_EQ(chars, (int)s.size()) << s;
    }
  }
}

static void TestTotalBits() {
  std::vector<Segment> segs;
  segs.push_back(MakeBytes(Bytes(std::string(256, 'x'))));
  // The byte count field is 8 bits below version 10.
  CHECK(!TotalBits(segs, 9).has_value());
  CHECK_EQ(TotalBits(segs, 10).value(), 4 + 16 + 256 * 8);

  segs.clear();
  segs.push_back(MakeNumeric(Bytes("1")));
  segs.push_back(MakeAlphanumeric(Bytes("AB")));
  CHECK_EQ(TotalBits(segs, 1).value(), (4 + 10 + 4) + (4 + 9 + 11));
  CHECK(TotalBits({}, 1).value() == 0);
}

int main(int argc, char **argv) {
  TestCharacterClasses();
  TestCountBits();
  TestPacking();
  TestSingleMode();
  TestOptimalSegments();
  TestTotalBits();

  printf("OK\n");
  return 0;
}
