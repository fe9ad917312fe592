// Segments: runs of content encoded in a single mode, and the
// choice of segments for some content.

#ifndef FASTQR_SEGMENT_H_
#define FASTQR_SEGMENT_H_

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "bitbuffer.h"
#include "types.h"

namespace fastqr {

struct Segment {
  Mode mode = Mode::BYTE;
  // Characters for numeric/alphanumeric/kanji, bytes for byte mode.
  // This is what goes in the character count field.
  int num_chars = 0;
  // Packed data bits, without the mode indicator or count.
  BitBuffer bits;
};

// Per-mode character set and packing rule. GetModeInfo switches over
// the closed set of modes.
struct ModeInfo {
  Mode mode;
  // Character count field width for versions 1-9, 10-26, 27-40.
  std::array<int, 3> count_bits;
  // Byte offset of the first character that this mode cannot encode,
  // or nullopt if all of the content is encodable.
  std::optional<size_t> (*first_unsupported)(std::span<const uint8_t>);
  // Number of characters in content, which must be encodable.
  int (*num_chars)(std::span<const uint8_t>);
  // Appends the packed content, which must be encodable.
  void (*pack)(std::span<const uint8_t>, BitBuffer *);
};

const ModeInfo &GetModeInfo(Mode mode);

// 0 for versions 1-9, 1 for 10-26, 2 for 27-40.
int VersionBand(int version);
// Lowest version in the band.
int BandMinVersion(int band);

// Width of the character count field.
int CharCountBits(Mode mode, int version);

// Value in the alphanumeric character set (0-44), or -1.
int AlphanumericValue(uint8_t c);
inline bool IsDigit(uint8_t c) { return c >= '0' && c <= '9'; }

bool IsNumeric(std::span<const uint8_t> content);
bool IsAlphanumeric(std::span<const uint8_t> content);
// True if content is a nonempty sequence of Shift JIS double-byte
// characters in the QR kanji ranges (0x8140-0x9FFC, 0xE040-0xEBBF).
bool IsKanji(std::span<const uint8_t> content);

// Single segments. The content must be encodable in the mode; this
// is CHECKed.
Segment MakeNumeric(std::span<const uint8_t> digits);
Segment MakeAlphanumeric(std::span<const uint8_t> text);
Segment MakeBytes(std::span<const uint8_t> data);
Segment MakeKanji(std::span<const uint8_t> sjis);
Segment MakeSegment(Mode mode, std::span<const uint8_t> content);

// Segments for the content using the mixture of numeric,
// alphanumeric and byte modes with the fewest total bits, for the
// count field widths of the given version's band. Kanji is never
// chosen automatically. Empty content gives no segments.
std::vector<Segment> MakeOptimalSegments(std::span<const uint8_t> content,
                                         int version);

// The single most compact of numeric, alphanumeric, byte.
Mode BestSingleMode(std::span<const uint8_t> content);

// Total bits including mode indicators and count fields at the
// version, or nullopt if some segment's count doesn't fit its field.
std::optional<int64_t> TotalBits(const std::vector<Segment> &segs,
                                 int version);

}  // namespace fastqr

#endif
