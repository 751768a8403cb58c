#include "cBuild/build.h"

using namespace cBuild;

uint32_t Build<uint32_t>::build() { return 31; }

uint64_t Build<uint64_t>::build() { return 63; }
