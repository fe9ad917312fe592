
#include "qr-code.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "base/logging.h"
#include "base/stringprintf.h"
#include "bitstream.h"
#include "function-layout.h"
#include "interleave.h"
#include "mask.h"
#include "placement.h"
#include "tables.h"
#include "types.h"
#include "version-selector.h"

namespace fastqr {

static std::string DescribeSegments(const std::vector<Segment> &segs) {
  std::string out;
  for (const Segment &seg : segs) {
    if (!out.empty()) out += " ";
    StringAppendF(&out, "%s:%d", ModeName(seg.mode), seg.num_chars);
  }
  return out;
}

std::optional<QRCode> Encode(const EncodeOptions &options,
                             std::span<const uint8_t> content,
                             EncodeError *error) {
  if (options.mask.has_value() &&
      (*options.mask < 0 || *options.mask >= NUM_MASKS)) {
    if (error != nullptr) {
      error->code = ErrorCode::INVALID_MASK;
      error->message = StringPrintf("Mask %d is not in [0, %d]",
                                    *options.mask, NUM_MASKS - 1);
    }
    return std::nullopt;
  }

  std::optional<VersionChoice> choice =
    SelectVersion(content, options.ecl, options.mode, options.version, error);
  if (!choice.has_value()) return std::nullopt;

  const int version = choice->version;
  const ECL ecl = options.ecl;

  std::vector<uint8_t> data =
    BuildDataCodewords(choice->segments, version, ecl);
  std::vector<uint8_t> codewords = AddEccAndInterleave(data, version, ecl);

  const FunctionLayout &layout = FunctionLayout::Get(version);
  ModuleGrid placed = PlaceCodewords(layout, codewords);

  int mask = 0;
  if (options.mask.has_value()) {
    mask = *options.mask;
  } else {
    MaskChoice mc = ChooseMask(layout, placed, ecl, options.max_concurrency);
    mask = mc.mask;
    if (options.verbose) {
      std::string scores;
      for (int m = 0; m < NUM_MASKS; m++)
        StringAppendF(&scores, " %lld", (long long)mc.penalties[m]);
      LOG(INFO) << "Mask penalties:" << scores;
    }
  }

  if (options.verbose) {
    LOG(INFO) << StringPrintf("Version %d-%s (%dx%d), %lld/%d data bits, "
                              "mask %d. Segments: ",
                              version, ECLName(ecl),
                              layout.size, layout.size,
                              (long long)choice->data_bits,
                              DataCapacityBits(version, ecl),
                              mask)
              << DescribeSegments(choice->segments);
  }

  return QRCode(version, ecl, mask,
                MaskedCandidate(layout, placed, ecl, mask));
}

std::optional<QRCode> EncodeText(const EncodeOptions &options,
                                 std::string_view text,
                                 EncodeError *error) {
  return Encode(options,
                std::span<const uint8_t>((const uint8_t *)text.data(),
                                         text.size()),
                error);
}

}  // namespace fastqr
