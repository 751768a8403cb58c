// Deferred result can not be stored and converted later.
#include "cBuild/produce.h"

#include <cstdint>

int main() {
  auto Deferred = cBuild::produce();
  uint32_t const Value = Deferred;
  return Value == 31 ? 0 : 1;
}
