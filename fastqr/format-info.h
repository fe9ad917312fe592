// Format information (ECL and mask, BCH(15,5) protected) and version
// information (BCH(18,6) protected, version 7 and up).

#ifndef FASTQR_FORMAT_INFO_H_
#define FASTQR_FORMAT_INFO_H_

#include <cstdint>

#include "function-layout.h"
#include "types.h"

namespace fastqr {

// Two-bit ECL indicator: L=01, M=00, Q=11, H=10.
int FormatEclBits(ECL ecl);

// The 15-bit format word for the ECL and mask (0-7), including the
// BCH code and the 0x5412 XOR mask.
uint32_t FormatBits(ECL ecl, int mask);

// The 18-bit version word: 6 version bits and 12 BCH bits.
// Version must be in [7, 40].
uint32_t VersionBits(int version);

// Writes both copies of the format word into the grid's reserved
// format cells.
void WriteFormatInfo(ECL ecl, int mask, int version, ModuleGrid *grid);

// Writes both copies of the version word. Nothing for version < 7.
void WriteVersionInfo(int version, ModuleGrid *grid);

}  // namespace fastqr

#endif
