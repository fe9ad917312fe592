
#include "types.h"

#include <cstdio>
#include <cstring>
#include <optional>

#include "base/logging.h"

using namespace fastqr;

static void TestNames() {
  for (ECL ecl : {ECL::L, ECL::M, ECL::Q, ECL::H}) {
    const char *name = ECLName(ecl);
    CHECK_EQ(strlen(name), 1u);
    CHECK(ParseECL(name[0]) == std::optional<ECL>(ecl));
    CHECK(ParseECL(name[0] - 'A' + 'a') == std::optional<ECL>(ecl));
    CHECK(ValidECL(ecl));
  }
  CHECK(!ParseECL('x').has_value());
  CHECK(!ValidECL((ECL)4));

  CHECK(ValidMode(Mode::NUMERIC));
  CHECK(ValidMode(Mode::KANJI));
  CHECK(!ValidMode((Mode)0));
  CHECK(!ValidMode((Mode)3));
  CHECK(0 == strcmp(ModeName(Mode::KANJI), "kanji"));
  CHECK(0 == strcmp(ErrorCodeName(ErrorCode::INVALID_MODE),
                    "InvalidMode"));
  CHECK(0 == strcmp(ErrorCodeName(ErrorCode::CONTENT_TOO_LONG),
                    "ContentTooLong"));
  CHECK(0 == strcmp(ErrorCodeName(ErrorCode::INVALID_MASK), "InvalidMask"));
}

static void TestVersions() {
  CHECK(!ValidVersion(0));
  CHECK(ValidVersion(1));
  CHECK(ValidVersion(40));
  CHECK(!ValidVersion(41));
  static_assert(SideLength(1) == 21);
  static_assert(SideLength(40) == 177);
}

int main(int argc, char **argv) {
  TestNames();
  TestVersions();

  printf("OK\n");
  return 0;
}
