
#include "version-selector.h"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "base/stringprintf.h"
#include "segment.h"
#include "tables.h"
#include "types.h"

namespace fastqr {

static void SetError(EncodeError *error, ErrorCode code, std::string msg) {
  if (error != nullptr) {
    error->code = code;
    error->message = std::move(msg);
  }
}

bool SegmentsFit(const std::vector<Segment> &segs, int version, ECL ecl) {
  const std::optional<int64_t> bits = TotalBits(segs, version);
  return bits.has_value() && *bits <= DataCapacityBits(version, ecl);
}

std::optional<VersionChoice>
SelectVersion(std::span<const uint8_t> content,
              ECL ecl,
              std::optional<Mode> forced_mode,
              std::optional<int> forced_version,
              EncodeError *error) {
  if (!ValidECL(ecl)) {
    SetError(error, ErrorCode::INVALID_ERROR_CORRECTION_LEVEL,
             StringPrintf("Error correction level %d is not one of L, M, Q, H",
                          (int)ecl));
    return std::nullopt;
  }

  if (forced_version.has_value() && !ValidVersion(*forced_version)) {
    SetError(error, ErrorCode::INVALID_VERSION,
             StringPrintf("Version %d is not in [%d, %d]",
                          *forced_version, MIN_VERSION, MAX_VERSION));
    return std::nullopt;
  }

  if (forced_mode.has_value() && !ValidMode(*forced_mode)) {
    SetError(error, ErrorCode::INVALID_MODE,
             StringPrintf("Mode %d is not numeric, alphanumeric, byte "
                          "or kanji", (int)*forced_mode));
    return std::nullopt;
  }

  // With a forced mode, the segment doesn't depend on the version.
  std::optional<Segment> forced_segment;
  if (forced_mode.has_value()) {
    const ModeInfo &info = GetModeInfo(*forced_mode);
    if (const std::optional<size_t> bad = info.first_unsupported(content)) {
      SetError(error, ErrorCode::UNSUPPORTED_CHARACTER,
               StringPrintf("Byte 0x%02x at offset %zu can't be encoded "
                            "in %s mode",
                            content[*bad], *bad, ModeName(*forced_mode)));
      return std::nullopt;
    }
  }

  if (content.size() > MAX_CONTENT_BYTES) {
    SetError(error, ErrorCode::CONTENT_TOO_LONG,
             StringPrintf("Content is %zu bytes; no QR code holds more "
                          "than %zu", content.size(), MAX_CONTENT_BYTES));
    return std::nullopt;
  }

  if (forced_mode.has_value())
    forced_segment = MakeSegment(*forced_mode, content);

  // Optimal segmentations, computed lazily per band.
  std::array<std::optional<std::vector<Segment>>, 3> by_band;
  auto SegmentsFor = [&](int version) -> const std::vector<Segment> & {
      std::optional<std::vector<Segment>> &segs = by_band[VersionBand(version)];
      if (!segs.has_value()) {
        if (forced_segment.has_value()) {
          segs.emplace();
          segs->push_back(*forced_segment);
        } else {
          segs = MakeOptimalSegments(content, version);
        }
      }
      return *segs;
    };

  const int lo = forced_version.value_or(MIN_VERSION);
  const int hi = forced_version.value_or(MAX_VERSION);
  std::optional<int64_t> last_bits;
  for (int version = lo; version <= hi; version++) {
    const std::vector<Segment> &segs = SegmentsFor(version);
    const std::optional<int64_t> bits = TotalBits(segs, version);
    last_bits = bits;
    if (bits.has_value() && *bits <= DataCapacityBits(version, ecl)) {
      VersionChoice choice;
      choice.version = version;
      choice.segments = segs;
      choice.data_bits = *bits;
      return {std::move(choice)};
    }
  }

  std::string msg;
  if (last_bits.has_value()) {
    msg = StringPrintf("Content needs %lld bits but version %d-%s holds "
                       "only %d",
                       (long long)*last_bits, hi, ECLName(ecl),
                       DataCapacityBits(hi, ecl));
  } else {
    msg = StringPrintf("Segment too long for its count field at "
                       "version %d", hi);
  }
  SetError(error, ErrorCode::CONTENT_TOO_LONG, std::move(msg));
  return std::nullopt;
}

}  // namespace fastqr
