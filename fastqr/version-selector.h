
#ifndef FASTQR_VERSION_SELECTOR_H_
#define FASTQR_VERSION_SELECTOR_H_

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "segment.h"
#include "types.h"

namespace fastqr {

// No version holds more characters than this (numeric, 40-L).
static constexpr size_t MAX_CONTENT_BYTES = 7089;

struct VersionChoice {
  int version = 0;
  // The segments to encode at that version.
  std::vector<Segment> segments;
  // Their total size, including headers. At most the version's data
  // capacity.
  int64_t data_bits = 0;
};

// Finds the smallest version whose data capacity at the ECL holds the
// content, or checks the forced version if given. Segments are
// recomputed for each version band, since the count field widths
// affect both the size and the best segmentation. With a forced mode
// the content is encoded as a single segment in that mode.
//
// Fails with CONTENT_TOO_LONG, UNSUPPORTED_CHARACTER, INVALID_VERSION,
// INVALID_MODE or INVALID_ERROR_CORRECTION_LEVEL. The error is filled
// in if non-null.
std::optional<VersionChoice>
SelectVersion(std::span<const uint8_t> content,
              ECL ecl,
              std::optional<Mode> forced_mode,
              std::optional<int> forced_version,
              EncodeError *error = nullptr);

// True if the segments fit in the data capacity of the version.
bool SegmentsFit(const std::vector<Segment> &segs, int version, ECL ecl);

}  // namespace fastqr

#endif
