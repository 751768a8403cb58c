// Both overloads accept a Buildable type.
#include "cBuild/produce.h"

#include <cstdint>

static int take(uint32_t) { return 32; }
static int take(uint64_t) { return 64; }

int main() { return take(cBuild::produce()); }
